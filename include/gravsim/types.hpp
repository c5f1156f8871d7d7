#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>

namespace gravsim {

// Forward declarations
struct Body;
class ForceCalculator;
class Integrator;
class CollisionResolver;
class BodyBuffers;
class Simulation;
class ViewState;
class Camera2D;
class Framebuffer;
class Renderer;

// Vector type for the simulation plane
struct Vec2 {
    double x, y;

    Vec2() : x(0), y(0) {}
    Vec2(double x_, double y_) : x(x_), y(y_) {}

    Vec2 operator+(const Vec2& v) const { return Vec2(x + v.x, y + v.y); }
    Vec2 operator-(const Vec2& v) const { return Vec2(x - v.x, y - v.y); }
    Vec2 operator*(double s) const { return Vec2(x * s, y * s); }
    Vec2 operator/(double s) const { return Vec2(x / s, y / s); }
    Vec2& operator+=(const Vec2& v) { x += v.x; y += v.y; return *this; }
    Vec2& operator-=(const Vec2& v) { x -= v.x; y -= v.y; return *this; }

    double dot(const Vec2& v) const { return x * v.x + y * v.y; }
    double length2() const { return dot(*this); }
    double length() const { return std::sqrt(length2()); }
};

inline Vec2 operator*(double s, const Vec2& v) { return v * s; }

// RGB color, alpha is always opaque when drawn
struct Color {
    uint8_t r, g, b;

    Color() : r(0), g(0), b(0) {}
    Color(uint8_t r_, uint8_t g_, uint8_t b_) : r(r_), g(g_), b(b_) {}

    bool operator==(const Color& c) const { return r == c.r && g == c.g && b == c.b; }
    bool operator!=(const Color& c) const { return !(*this == c); }
};

// Simulation configuration, fixed for the lifetime of a run
struct SimulationConfig {
    size_t body_count = 5;
    std::string load_path;            // Empty: seed bodies randomly
    std::string save_path = "save.csv";
    double world_half_width = 600.0;  // Bounds random initial placement
    double world_half_height = 400.0;
    double G = 100.0;
    double initial_timescale = 0.25;
    double mass_limit = 10.0;
    double velocity_limit = 1.0;
    int frame_delay_ms = 16;
    int pixel_decay_rate = 2;
    unsigned int seed = 0;
    bool use_fixed_seed = false;
};

// Window configuration for the viewer
struct RenderConfig {
    int window_width = 1200;
    int window_height = 800;
};

} // namespace gravsim
