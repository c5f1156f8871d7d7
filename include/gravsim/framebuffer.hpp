#pragma once

#include "gravsim/types.hpp"
#include "gravsim/body.hpp"
#include "gravsim/camera.hpp"
#include <cstdint>
#include <vector>

namespace gravsim {

// CPU-side RGBA8 pixel buffer, row 0 at the top. Alpha is always 255.
class Framebuffer {
public:
    Framebuffer(int width, int height);

    void clear(const Color& color = Color());

    // Out-of-range coordinates are ignored
    void setPixel(int x, int y, const Color& color);
    Color getPixel(int x, int y) const;

    // Subtract rate from every RGB channel, flooring at zero
    void decay(int rate);

    // Fill the body's disc, sampling every zoom world units
    void drawBody(const Body& body, const Camera2D& camera);
    void drawBodies(const BodyBuffer& bodies, const Camera2D& camera);

    const uint8_t* data() const { return pixels_.data(); }
    int getWidth() const { return width_; }
    int getHeight() const { return height_; }

private:
    int width_;
    int height_;
    std::vector<uint8_t> pixels_;

    bool inBounds(int x, int y) const { return x >= 0 && x < width_ && y >= 0 && y < height_; }
    size_t index(int x, int y) const { return (static_cast<size_t>(y) * width_ + x) * 4; }
};

// Prepare one frame: with trails on the previous image fades (only while
// running), otherwise it is cleared; then the live bodies are drawn.
void composeFrame(Framebuffer& framebuffer, const BodyBuffer& bodies,
                  const ViewState& view, int decay_rate);

} // namespace gravsim
