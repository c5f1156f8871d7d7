#include "gravsim/framebuffer.hpp"
#include "gravsim/error_handling.hpp"
#include <algorithm>
#include <cmath>

namespace gravsim {

namespace {

struct SampleRange {
    double first;  // Index k of the first sample -r + k*step
    long count;
};

// Samples -r + k*step (k >= 0) that fall inside both the disc's diameter and
// the visible interval [lo, hi), capped at one per pixel plus slack.
SampleRange visibleSamples(double center, double radius, double step,
                           double lo, double hi, int pixels) {
    double first = std::max(0.0, std::ceil((lo - center + radius) / step));
    double last = std::ceil(std::min(2 * radius, hi - center + radius) / step);
    double count = std::min(last - first, pixels + 2.0);
    return {first, count > 0 ? static_cast<long>(count) : 0};
}

} // namespace

Framebuffer::Framebuffer(int width, int height)
    : width_(width), height_(height) {
    if (width <= 0 || height <= 0) {
        throw ValidationException("Framebuffer dimensions must be positive");
    }
    pixels_.assign(static_cast<size_t>(width) * height * 4, 0);
    clear();
}

void Framebuffer::clear(const Color& color) {
    for (size_t i = 0; i < pixels_.size(); i += 4) {
        pixels_[i] = color.r;
        pixels_[i + 1] = color.g;
        pixels_[i + 2] = color.b;
        pixels_[i + 3] = 255;
    }
}

void Framebuffer::setPixel(int x, int y, const Color& color) {
    if (!inBounds(x, y)) return;
    size_t i = index(x, y);
    pixels_[i] = color.r;
    pixels_[i + 1] = color.g;
    pixels_[i + 2] = color.b;
}

Color Framebuffer::getPixel(int x, int y) const {
    if (!inBounds(x, y)) return Color();
    size_t i = index(x, y);
    return Color(pixels_[i], pixels_[i + 1], pixels_[i + 2]);
}

void Framebuffer::decay(int rate) {
    for (size_t i = 0; i < pixels_.size(); i += 4) {
        for (size_t c = 0; c < 3; c++) {
            uint8_t& channel = pixels_[i + c];
            channel = channel < rate ? 0 : static_cast<uint8_t>(channel - rate);
        }
    }
}

void Framebuffer::drawBody(const Body& body, const Camera2D& camera) {
    glm::dvec2 center(body.position.x, body.position.y);
    double radius = body.radius;
    double step = camera.getZoom();

    if (step <= 0 || !(radius > 0) || !std::isfinite(radius)) return;
    if (!camera.isCircleVisible(center, radius)) return;

    glm::dvec2 lo = camera.getMinBounds();
    glm::dvec2 hi = camera.getMaxBounds();

    SampleRange rows = visibleSamples(center.y, radius, step, lo.y, hi.y, height_);
    SampleRange cols = visibleSamples(center.x, radius, step, lo.x, hi.x, width_);

    for (long j = 0; j < rows.count; j++) {
        double dy = -radius + (rows.first + j) * step;
        double wy = center.y + dy;
        if (wy < lo.y || wy >= hi.y) continue;

        for (long i = 0; i < cols.count; i++) {
            double dx = -radius + (cols.first + i) * step;
            double wx = center.x + dx;
            if (wx < lo.x || wx >= hi.x) continue;

            if (dx * dx + dy * dy < radius * radius) {
                glm::dvec2 screen = camera.worldToScreen(glm::dvec2(wx, wy));
                setPixel(static_cast<int>(screen.x), static_cast<int>(screen.y), body.color);
            }
        }
    }
}

void Framebuffer::drawBodies(const BodyBuffer& bodies, const Camera2D& camera) {
    for (const auto& slot : bodies) {
        if (slot) drawBody(*slot, camera);
    }
}

void composeFrame(Framebuffer& framebuffer, const BodyBuffer& bodies,
                  const ViewState& view, int decay_rate) {
    if (view.trailsEnabled()) {
        if (!view.isPaused()) {
            framebuffer.decay(decay_rate);
        }
    } else {
        framebuffer.clear();
    }

    Camera2D camera(view, framebuffer.getWidth(), framebuffer.getHeight());
    framebuffer.drawBodies(bodies, camera);
}

} // namespace gravsim
