#include "gravsim/integrator.hpp"
#include "gravsim/force_calculator.hpp"

namespace gravsim {

BodySlot Integrator::update(const BodySlot& slot, const BodyBuffer& current,
                            const ForceCalculator& force_calc, double timescale) const {
    if (!slot) {
        return std::nullopt;
    }

    Body next = advancePosition(*slot, timescale);

    ForceResult result = force_calc.evaluate(*slot, next, current);
    if (result.collided) {
        return result.merged;
    }

    applyAcceleration(next, result.acceleration, timescale);
    return next;
}

Body Integrator::advancePosition(const Body& body, double timescale) {
    Body next = body;
    next.position += body.velocity * timescale;
    return next;
}

void Integrator::applyAcceleration(Body& body, const Vec2& acceleration, double timescale) {
    body.velocity += acceleration * timescale;
}

double Integrator::computeTotalMass(const BodyBuffer& bodies) {
    double total = 0.0;
    for (const auto& slot : bodies) {
        if (slot) total += slot->mass;
    }
    return total;
}

Vec2 Integrator::computeMomentum(const BodyBuffer& bodies) {
    Vec2 momentum;
    for (const auto& slot : bodies) {
        if (slot) momentum += slot->velocity * slot->mass;
    }
    return momentum;
}

double Integrator::computeKineticEnergy(const BodyBuffer& bodies) {
    double energy = 0.0;
    for (const auto& slot : bodies) {
        if (slot) energy += 0.5 * slot->mass * slot->velocity.length2();
    }
    return energy;
}

double Integrator::computePotentialEnergy(const BodyBuffer& bodies, double G) {
    double energy = 0.0;
    for (size_t i = 0; i < bodies.size(); i++) {
        if (!bodies[i]) continue;
        for (size_t j = i + 1; j < bodies.size(); j++) {
            if (!bodies[j]) continue;
            double d2 = distanceSquared(*bodies[i], *bodies[j]);
            if (d2 < ForceCalculator::kMinDistanceSquared) continue;
            energy -= G * bodies[i]->mass * bodies[j]->mass / std::sqrt(d2);
        }
    }
    return energy;
}

double Integrator::computeTotalEnergy(const BodyBuffer& bodies, double G) {
    return computeKineticEnergy(bodies) + computePotentialEnergy(bodies, G);
}

} // namespace gravsim
