#include "gravsim/collision.hpp"

namespace gravsim {

BodySlot CollisionResolver::resolve(const Body& body, const Body& other, bool body_first) {
    if (isAbsorbed(body.mass, other.mass, body_first)) {
        return std::nullopt;
    }
    return merge(body, other);
}

bool CollisionResolver::isAbsorbed(double mass, double other_mass, bool body_first) {
    if (mass < other_mass) return true;
    return mass == other_mass && body_first;
}

Body CollisionResolver::merge(const Body& body, const Body& other) {
    double total = body.mass + other.mass;

    Body merged = body;
    merged.position = (body.position * body.mass + other.position * other.mass) / total;
    merged.velocity = (body.velocity * body.mass + other.velocity * other.mass) / total;
    merged.mass = total;
    merged.radius = massToRadius(total);
    return merged;
}

} // namespace gravsim
