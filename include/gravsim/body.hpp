#pragma once

#include "gravsim/types.hpp"
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace gravsim {

// A single gravitating body
struct Body {
    Vec2 position;
    Vec2 velocity;
    double mass = 1.0;
    double radius = 1.0;
    Color color;
};

// A buffer slot: present while the body is live, empty once absorbed
using BodySlot = std::optional<Body>;

// Fixed-length sequence of slots, never compacted
using BodyBuffer = std::vector<BodySlot>;

// Radius of a body of the given mass
inline double massToRadius(double mass) { return std::sqrt(mass); }

inline double distanceSquared(const Vec2& a, const Vec2& b) {
    return (a - b).length2();
}

inline double distanceSquared(const Body& a, const Body& b) {
    return distanceSquared(a.position, b.position);
}

// Number of present slots
size_t countLiveBodies(const BodyBuffer& buffer);

// Body construction
class BodyFactory {
public:
    // Minimum record length: x, y, xVel, yVel, mass
    static constexpr size_t kMinFields = 5;
    // Full record length: adds radius, red, green, blue
    static constexpr size_t kFullFields = 9;

    // Build a body from numeric fields. Five to eight fields derive the radius
    // and randomize the color; nine or more are taken literally.
    // Throws ParseException if fewer than five fields are supplied.
    static Body fromFields(const std::vector<double>& fields, std::mt19937& rng);

    // Parse every field as a real number, then defer to fromFields.
    static Body fromStrings(const std::vector<std::string>& fields, std::mt19937& rng);

    // Random body inside the configured world extent
    static Body random(const SimulationConfig& config, std::mt19937& rng);

    static Color randomColor(std::mt19937& rng);

    static std::mt19937 createRNG(const SimulationConfig& config);
};

} // namespace gravsim
