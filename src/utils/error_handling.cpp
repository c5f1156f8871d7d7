#include "gravsim/error_handling.hpp"
#include "gravsim/types.hpp"
#include <cmath>

namespace gravsim {

void validateSimulationConfig(const SimulationConfig& config) {
    // A load file decides the body count itself
    if (config.load_path.empty()) {
        validateBodyCount(config.body_count);
    }
    validateTimescale(config.initial_timescale);
    validateGravitationalConstant(config.G);
    validateWorldExtent(config.world_half_width, config.world_half_height);

    if (!std::isfinite(config.mass_limit) || config.mass_limit < 0) {
        throw ValidationException("Mass limit must be a non-negative finite number");
    }

    if (!std::isfinite(config.velocity_limit) || config.velocity_limit < 0) {
        throw ValidationException("Velocity limit must be a non-negative finite number");
    }

    if (config.frame_delay_ms < 0) {
        throw ValidationException("Frame delay must be non-negative");
    }

    if (config.pixel_decay_rate < 0 || config.pixel_decay_rate > 255) {
        throw ValidationException("Pixel decay rate must be between 0 and 255");
    }

    if (config.save_path.empty()) {
        throw ValidationException("Save path must not be empty");
    }
}

void validateBodyCount(size_t count) {
    if (count == 0) {
        throw ValidationException("Body count must be greater than 0");
    }

    if (count > 100000) {
        throw ValidationException("Body count exceeds maximum supported (100000)");
    }
}

void validateTimescale(double timescale) {
    if (std::isnan(timescale) || std::isinf(timescale)) {
        throw ValidationException("Timescale must be a finite number");
    }

    if (timescale <= 0) {
        throw ValidationException("Timescale must be positive");
    }
}

void validateGravitationalConstant(double G) {
    if (std::isnan(G) || std::isinf(G)) {
        throw ValidationException("Gravitational constant must be a finite number");
    }

    if (G <= 0) {
        throw ValidationException("Gravitational constant must be positive");
    }
}

void validateWorldExtent(double half_width, double half_height) {
    if (!std::isfinite(half_width) || !std::isfinite(half_height)) {
        throw ValidationException("World extent must be finite");
    }

    if (half_width <= 0 || half_height <= 0) {
        throw ValidationException("World extent must be positive");
    }
}

} // namespace gravsim
