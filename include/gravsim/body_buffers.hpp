#pragma once

#include "gravsim/body.hpp"
#include <array>

namespace gravsim {

// Pair of equally sized body buffers. A step reads current() and writes
// scratch(); swap() then publishes scratch as the new current. Capacity is
// fixed by reset() and absorbed bodies stay as empty slots.
class BodyBuffers {
public:
    BodyBuffers() : current_index_(0) {}

    // Take ownership of the initial bodies and size the scratch buffer to match
    void reset(BodyBuffer initial);

    const BodyBuffer& current() const { return buffers_[current_index_]; }
    BodyBuffer& scratch() { return buffers_[1 - current_index_]; }

    // Flip roles; the old current becomes the next write target
    void swap() { current_index_ = 1 - current_index_; }

    size_t capacity() const { return buffers_[current_index_].size(); }

private:
    std::array<BodyBuffer, 2> buffers_;
    size_t current_index_;
};

} // namespace gravsim
