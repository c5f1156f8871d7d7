#include "gravsim/body.hpp"
#include "gravsim/error_handling.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>

namespace gravsim {

namespace {

uint8_t toChannel(double value) {
    if (std::isnan(value)) return 0;
    double clamped = std::clamp(std::trunc(value), 0.0, 255.0);
    return static_cast<uint8_t>(clamped);
}

double parseReal(const std::string& text) {
    const char* begin = text.c_str();
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(begin, &end);

    if (end == begin || *end != '\0') {
        throw ParseException("cannot convert '" + text + "' to a real number");
    }
    if (errno == ERANGE && std::isinf(value)) {
        throw ParseException("value '" + text + "' is out of range");
    }
    return value;
}

} // namespace

size_t countLiveBodies(const BodyBuffer& buffer) {
    return static_cast<size_t>(std::count_if(buffer.begin(), buffer.end(),
        [](const BodySlot& slot) { return slot.has_value(); }));
}

Body BodyFactory::fromFields(const std::vector<double>& fields, std::mt19937& rng) {
    if (fields.size() < kMinFields) {
        throw ParseException("not enough fields to create a body (need at least 5, got " +
                             std::to_string(fields.size()) + ")");
    }

    Body body;
    body.position = Vec2(fields[0], fields[1]);
    body.velocity = Vec2(fields[2], fields[3]);
    body.mass = fields[4];

    if (fields.size() >= kFullFields) {
        body.radius = fields[5];
        body.color = Color(toChannel(fields[6]), toChannel(fields[7]), toChannel(fields[8]));
    } else {
        body.radius = massToRadius(body.mass);
        body.color = randomColor(rng);
    }

    return body;
}

Body BodyFactory::fromStrings(const std::vector<std::string>& fields, std::mt19937& rng) {
    std::vector<double> values;
    values.reserve(fields.size());
    for (const auto& field : fields) {
        values.push_back(parseReal(field));
    }
    return fromFields(values, rng);
}

Body BodyFactory::random(const SimulationConfig& config, std::mt19937& rng) {
    std::uniform_real_distribution<double> x_dist(-config.world_half_width, config.world_half_width);
    std::uniform_real_distribution<double> y_dist(-config.world_half_height, config.world_half_height);
    std::uniform_real_distribution<double> vel_dist(-config.velocity_limit / 2, config.velocity_limit / 2);
    std::uniform_real_distribution<double> mass_dist(1.0, config.mass_limit + 1.0);

    Body body;
    body.position = Vec2(x_dist(rng), y_dist(rng));
    body.velocity = Vec2(vel_dist(rng), vel_dist(rng));
    body.mass = mass_dist(rng);
    body.radius = massToRadius(body.mass);
    body.color = randomColor(rng);
    return body;
}

Color BodyFactory::randomColor(std::mt19937& rng) {
    std::uniform_int_distribution<int> channel(0, 255);
    return Color(static_cast<uint8_t>(channel(rng)),
                 static_cast<uint8_t>(channel(rng)),
                 static_cast<uint8_t>(channel(rng)));
}

std::mt19937 BodyFactory::createRNG(const SimulationConfig& config) {
    if (config.use_fixed_seed) {
        return std::mt19937(config.seed);
    }
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::mt19937(static_cast<unsigned int>(
        std::chrono::duration_cast<std::chrono::microseconds>(now).count()));
}

} // namespace gravsim
