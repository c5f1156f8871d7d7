#include "gravsim/camera.hpp"

namespace gravsim {

Camera2D::Camera2D(const glm::dvec2& center, double zoom, int width, int height)
    : center_(center), zoom_(zoom), width_(width), height_(height) {}

Camera2D::Camera2D(const ViewState& view, int width, int height)
    : center_(view.getCenter().x, view.getCenter().y), zoom_(view.getZoomScale()),
      width_(width), height_(height) {}

glm::dvec2 Camera2D::halfExtent() const {
    return glm::dvec2(width_, height_) * (zoom_ / 2.0);
}

glm::dvec2 Camera2D::worldToScreen(const glm::dvec2& world) const {
    return (world - center_) / zoom_ + glm::dvec2(width_, height_) / 2.0;
}

glm::dvec2 Camera2D::screenToWorld(const glm::dvec2& screen) const {
    return (screen - glm::dvec2(width_, height_) / 2.0) * zoom_ + center_;
}

bool Camera2D::isCircleVisible(const glm::dvec2& center, double radius) const {
    glm::dvec2 lo = getMinBounds();
    glm::dvec2 hi = getMaxBounds();
    return !(center.x + radius < lo.x || center.x - radius > hi.x ||
             center.y + radius < lo.y || center.y - radius > hi.y);
}

} // namespace gravsim
