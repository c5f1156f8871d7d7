#include "gravsim/simulation.hpp"
#include "gravsim/serialization.hpp"
#include "gravsim/error_handling.hpp"
#include <iomanip>
#include <iostream>

namespace gravsim {

Simulation::Simulation()
    : G_(100.0), step_count_(0), rng_(BodyFactory::createRNG(config_)) {
    createForceCalculator();
}

void Simulation::initialize(const SimulationConfig& config) {
    validateSimulationConfig(config);

    config_ = config;
    G_ = config.G;
    rng_ = BodyFactory::createRNG(config);
    createForceCalculator();

    if (!config.load_path.empty()) {
        std::cout << "LOADING FROM FILE " << config.load_path << std::endl;
        loadState(config.load_path);
        return;
    }

    std::cout << "NO LOAD FILE" << std::endl;
    std::cout << "USING NUMBODIES = " << config.body_count << std::endl;

    std::vector<Body> bodies;
    bodies.reserve(config.body_count);
    for (size_t i = 0; i < config.body_count; i++) {
        bodies.push_back(BodyFactory::random(config, rng_));
    }
    setBodies(bodies);
}

void Simulation::setBodies(const std::vector<Body>& bodies) {
    BodyBuffer initial(bodies.begin(), bodies.end());
    buffers_.reset(std::move(initial));
    step_count_ = 0;
}

void Simulation::createForceCalculator() {
    force_calculator_ = gravsim::createForceCalculator(config_);
    force_calculator_->setGravitationalConstant(G_);
}

void Simulation::step(double timescale) {
    const BodyBuffer& current = buffers_.current();
    BodyBuffer& scratch = buffers_.scratch();

    for (size_t i = 0; i < current.size(); i++) {
        scratch[i] = integrator_.update(current[i], current, *force_calculator_, timescale);
    }

    buffers_.swap();
    step_count_++;
}

void Simulation::update(const ViewState& view) {
    if (view.isPaused()) return;
    step(view.getTimescale());
}

void Simulation::setGravitationalConstant(double G) {
    validateGravitationalConstant(G);
    G_ = G;
    config_.G = G;
    if (force_calculator_) {
        force_calculator_->setGravitationalConstant(G);
    }
}

bool Simulation::saveState(const std::string& filename) const {
    try {
        Serializer::save(filename, buffers_.current());
    } catch (const IOException& e) {
        std::cerr << "Cannot save state: " << e.what() << std::endl;
        return false;
    }
    return true;
}

void Simulation::loadState(const std::string& filename) {
    setBodies(Serializer::load(filename, rng_));
}

void Simulation::printBodies(std::ostream& out) const {
    const BodyBuffer& bodies = buffers_.current();

    out << std::string(80, '-') << "\n";
    out << std::left
        << std::setw(12) << "Body Index" << std::setw(10) << "x" << std::setw(10) << "y"
        << std::setw(10) << "xVel" << std::setw(10) << "yVel" << std::setw(10) << "mass"
        << std::setw(10) << "radius" << "color\n";

    out << std::fixed << std::setprecision(2);
    for (size_t i = 0; i < bodies.size(); i++) {
        if (!bodies[i]) continue;
        const Body& b = *bodies[i];
        out << std::setw(12) << ("BODY " + std::to_string(i))
            << std::setw(10) << b.position.x << std::setw(10) << b.position.y
            << std::setw(10) << b.velocity.x << std::setw(10) << b.velocity.y
            << std::setw(10) << b.mass << std::setw(10) << b.radius
            << "{" << static_cast<int>(b.color.r) << " " << static_cast<int>(b.color.g)
            << " " << static_cast<int>(b.color.b) << " 255}\n";
    }

    Vec2 momentum = computeMomentum();
    out << "TOTAL MASS " << computeTotalMass()
        << "  MOMENTUM (" << momentum.x << ", " << momentum.y << ")"
        << "  ENERGY " << computeTotalEnergy()
        << " (kinetic " << computeKineticEnergy()
        << ", potential " << computePotentialEnergy() << ")\n";
    out << std::right << std::defaultfloat;
}

double Simulation::computeTotalMass() const {
    return Integrator::computeTotalMass(buffers_.current());
}

Vec2 Simulation::computeMomentum() const {
    return Integrator::computeMomentum(buffers_.current());
}

double Simulation::computeKineticEnergy() const {
    return Integrator::computeKineticEnergy(buffers_.current());
}

double Simulation::computePotentialEnergy() const {
    return Integrator::computePotentialEnergy(buffers_.current(), G_);
}

double Simulation::computeTotalEnergy() const {
    return computeKineticEnergy() + computePotentialEnergy();
}

} // namespace gravsim
