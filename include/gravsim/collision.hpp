#pragma once

#include "gravsim/body.hpp"

namespace gravsim {

// Perfectly inelastic, mass-weighted merging of overlapping bodies.
//
// Each body resolves its own collision independently: the lighter side returns
// an empty slot and the heavier side returns the merged body. Equal masses are
// broken by buffer order, the earlier slot being absorbed. Overlaps of three
// or more bodies can take several steps to fully merge.
class CollisionResolver {
public:
    // body: the slot being updated, already advanced for this step
    // other: the body it overlaps, as read from the current buffer
    // body_first: body's slot precedes other's in the buffer
    static BodySlot resolve(const Body& body, const Body& other, bool body_first);

    // True if body is swallowed by other
    static bool isAbsorbed(double mass, double other_mass, bool body_first);

    // Combined body; keeps the color of body
    static Body merge(const Body& body, const Body& other);
};

} // namespace gravsim
