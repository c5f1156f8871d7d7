#pragma once

#include "gravsim/types.hpp"
#include <iosfwd>

namespace gravsim {

// Runtime controls shared by the input layer, the stepper and the renderer.
// One instance per running simulation, owned by the application.
class ViewState {
public:
    static constexpr double kTimescaleFactor = 1.1;
    static constexpr double kZoomFactor = 1.2;
    static constexpr double kMoveStep = 1.0;

    explicit ViewState(double timescale = 0.25);

    // Simulation control
    bool isPaused() const { return paused_; }
    void pause() { paused_ = true; }
    void resume() { paused_ = false; }
    void togglePause() { paused_ = !paused_; }

    bool trailsEnabled() const { return trails_; }
    void toggleTrails() { trails_ = !trails_; }

    double getTimescale() const { return timescale_; }
    void setTimescale(double timescale);
    void speedUp() { timescale_ *= kTimescaleFactor; }
    void slowDown() { timescale_ /= kTimescaleFactor; }

    // Camera
    double getZoomScale() const { return zoom_scale_; }
    void zoomOut() { zoom_scale_ *= kZoomFactor; }
    void zoomIn() { zoom_scale_ /= kZoomFactor; }

    double getMoveScale() const { return move_scale_; }
    void increaseMoveScale() { move_scale_ += kMoveStep; }
    void decreaseMoveScale();

    Vec2 getCenter() const { return center_; }
    void setCenter(const Vec2& center) { center_ = center; }

    // Move the camera by (dx, dy) steps of moveScale * zoomScale world units
    void pan(double dx, double dy);

    // Restore camera defaults, leaving timescale and pause state alone
    void resetCamera();

private:
    double timescale_;
    double zoom_scale_;
    double move_scale_;
    Vec2 center_;
    bool paused_;
    bool trails_;
};

// Settings table printed by the print-state control
void printConfiguration(std::ostream& out, const ViewState& view, const RenderConfig& render);

} // namespace gravsim
