#pragma once

#include "gravsim/view_state.hpp"
#include <glm/glm.hpp>

namespace gravsim {

// Orthographic camera over the simulation plane. World y grows downwards on
// screen, matching pixel rows.
class Camera2D {
public:
    Camera2D(const glm::dvec2& center, double zoom, int width, int height);
    Camera2D(const ViewState& view, int width, int height);

    // Screen space: pixels from the top-left corner
    glm::dvec2 worldToScreen(const glm::dvec2& world) const;
    glm::dvec2 screenToWorld(const glm::dvec2& screen) const;

    // Visible world rectangle
    glm::dvec2 getMinBounds() const { return center_ - halfExtent(); }
    glm::dvec2 getMaxBounds() const { return center_ + halfExtent(); }

    // True if any part of the circle's bounding square is on screen
    bool isCircleVisible(const glm::dvec2& center, double radius) const;

    glm::dvec2 getCenter() const { return center_; }
    double getZoom() const { return zoom_; }
    int getWidth() const { return width_; }
    int getHeight() const { return height_; }

private:
    glm::dvec2 center_;
    double zoom_;
    int width_;
    int height_;

    glm::dvec2 halfExtent() const;
};

} // namespace gravsim
