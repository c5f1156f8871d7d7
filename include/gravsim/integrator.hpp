#pragma once

#include "gravsim/types.hpp"
#include "gravsim/body.hpp"

namespace gravsim {

// Semi-implicit Euler integrator: position first, then velocity from the
// accelerations felt at the new position. Not energy conserving.
class Integrator {
public:
    // Next-frame slot for one body. slot must be an element of current.
    // Absorbed slots stay absorbed; a collision replaces the kinematic update.
    BodySlot update(const BodySlot& slot, const BodyBuffer& current,
                    const ForceCalculator& force_calc, double timescale) const;

    // Advance position by velocity * timescale
    static Body advancePosition(const Body& body, double timescale);

    // Advance velocity by acceleration * timescale
    static void applyAcceleration(Body& body, const Vec2& acceleration, double timescale);

    // Diagnostics over the live bodies of a buffer
    static double computeTotalMass(const BodyBuffer& bodies);
    static Vec2 computeMomentum(const BodyBuffer& bodies);
    static double computeKineticEnergy(const BodyBuffer& bodies);

    // Pairs closer than the force cutoff are skipped, as in the force sum
    static double computePotentialEnergy(const BodyBuffer& bodies, double G);

    static double computeTotalEnergy(const BodyBuffer& bodies, double G);
};

} // namespace gravsim
