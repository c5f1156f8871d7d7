#include "gravsim/force_calculator.hpp"
#include "gravsim/collision.hpp"
#include <functional>

namespace gravsim {

ForceResult DirectForceCalculator::evaluate(const Body& body, const Body& advanced,
                                            const BodyBuffer& current) const {
    ForceResult result;

    for (const auto& slot : current) {
        if (!slot) continue;
        const Body& other = *slot;
        if (&other == &body) continue;

        // Overlap and cutoff tests use the positions at the start of the step
        double d2 = distanceSquared(body, other);
        if (d2 < kMinDistanceSquared) {
            continue;
        }

        double contact = body.radius + other.radius;
        if (d2 < contact * contact) {
            bool body_first = std::less<const Body*>()(&body, &other);
            result.collided = true;
            result.merged = CollisionResolver::resolve(advanced, other, body_first);
            result.acceleration = Vec2();
            return result;
        }

        result.acceleration += computeGravitationalAcceleration(
            advanced.position, other.position, other.mass, d2, G_);
    }

    return result;
}

std::unique_ptr<ForceCalculator> createForceCalculator(const SimulationConfig& config) {
    return std::make_unique<DirectForceCalculator>(config.G);
}

Vec2 computeGravitationalAcceleration(const Vec2& p1, const Vec2& p2,
                                      double m2, double d2, double G) {
    double magnitude = -G * m2 / d2;
    double angle = std::atan2(p1.y - p2.y, p1.x - p2.x);
    return Vec2(magnitude * std::cos(angle), magnitude * std::sin(angle));
}

} // namespace gravsim
