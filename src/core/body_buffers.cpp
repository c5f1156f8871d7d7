#include "gravsim/body_buffers.hpp"

namespace gravsim {

void BodyBuffers::reset(BodyBuffer initial) {
    current_index_ = 0;
    size_t capacity = initial.size();
    buffers_[0] = std::move(initial);
    buffers_[1].assign(capacity, std::nullopt);
}

} // namespace gravsim
