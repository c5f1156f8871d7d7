#pragma once

#include "gravsim/types.hpp"
#include "gravsim/body.hpp"
#include <memory>

namespace gravsim {

// Outcome of evaluating one body against the live set
struct ForceResult {
    bool collided = false;
    BodySlot merged;     // Next-frame slot when collided (empty if absorbed)
    Vec2 acceleration;   // Summed acceleration when not collided
};

// Abstract base class for force calculators
class ForceCalculator {
public:
    virtual ~ForceCalculator() = default;

    // Evaluate body (a present slot of current) against every other live slot
    // of current. advanced is body after this step's position update.
    virtual ForceResult evaluate(const Body& body, const Body& advanced,
                                 const BodyBuffer& current) const = 0;

    void setGravitationalConstant(double G) { G_ = G; }
    double getGravitationalConstant() const { return G_; }

    // Separations below this (squared) contribute nothing
    static constexpr double kMinDistanceSquared = 1.0;

protected:
    double G_ = 100.0;
};

// Direct O(N²) pairwise summation with inelastic merging on overlap
class DirectForceCalculator : public ForceCalculator {
public:
    explicit DirectForceCalculator(double G = 100.0) { G_ = G; }

    ForceResult evaluate(const Body& body, const Body& advanced,
                         const BodyBuffer& current) const override;
};

// Factory function to create force calculator
std::unique_ptr<ForceCalculator> createForceCalculator(const SimulationConfig& config);

// Acceleration of a body at p1 due to a mass m2 at p2, taking d2 as the
// squared separation. Points from p1 toward p2.
Vec2 computeGravitationalAcceleration(const Vec2& p1, const Vec2& p2,
                                      double m2, double d2, double G);

} // namespace gravsim
