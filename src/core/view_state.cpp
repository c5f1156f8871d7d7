#include "gravsim/view_state.hpp"
#include "gravsim/error_handling.hpp"
#include <iomanip>
#include <ostream>

namespace gravsim {

namespace {
constexpr double kDefaultZoomScale = 1.0;
constexpr double kDefaultMoveScale = 25.0;
}

ViewState::ViewState(double timescale)
    : timescale_(timescale), zoom_scale_(kDefaultZoomScale),
      move_scale_(kDefaultMoveScale), center_(0, 0),
      paused_(true), trails_(false) {}

void ViewState::setTimescale(double timescale) {
    validateTimescale(timescale);
    timescale_ = timescale;
}

void ViewState::decreaseMoveScale() {
    if (move_scale_ > 0) {
        move_scale_ -= kMoveStep;
    }
}

void ViewState::pan(double dx, double dy) {
    double step = move_scale_ * zoom_scale_;
    center_ += Vec2(dx * step, dy * step);
}

void ViewState::resetCamera() {
    zoom_scale_ = kDefaultZoomScale;
    move_scale_ = kDefaultMoveScale;
    center_ = Vec2(0, 0);
}

void printConfiguration(std::ostream& out, const ViewState& view, const RenderConfig& render) {
    Vec2 center = view.getCenter();
    double zoom = view.getZoomScale();

    out << std::string(80, '-') << "\n";
    out << std::left << std::fixed << std::setprecision(2);
    out << std::setw(18) << "PAUSED" << (view.isPaused() ? "true" : "false") << "\n";
    out << std::setw(18) << "TIMESCALE" << view.getTimescale() << "\n";
    out << std::setw(18) << "ZOOMSCALE" << zoom << "\n";
    out << std::setw(18) << "MOVESCALE" << view.getMoveScale() << "\n";
    out << std::setw(18) << "SCREEN CENTER" << "(" << center.x << ", " << center.y << ")\n";
    out << std::setw(18) << "SCREEN LIMITS"
        << "X: " << static_cast<long>(center.x - zoom * render.window_width / 2)
        << " - " << static_cast<long>(center.x + zoom * render.window_width / 2)
        << ",  Y: " << static_cast<long>(center.y - zoom * render.window_height / 2)
        << " - " << static_cast<long>(center.y + zoom * render.window_height / 2) << "\n";
    out << std::right << std::defaultfloat;
}

} // namespace gravsim
