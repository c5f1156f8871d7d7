#pragma once

#include "gravsim/types.hpp"
#include "gravsim/body.hpp"
#include "gravsim/body_buffers.hpp"
#include "gravsim/force_calculator.hpp"
#include "gravsim/integrator.hpp"
#include "gravsim/view_state.hpp"
#include <iosfwd>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace gravsim {

// Owns the body buffers and advances them one timestep at a time
class Simulation {
public:
    Simulation();

    // Validate config, then load bodies from config.load_path or seed
    // config.body_count random bodies. Capacity is fixed from here on.
    void initialize(const SimulationConfig& config);

    // Replace the bodies, fixing capacity to bodies.size()
    void setBodies(const std::vector<Body>& bodies);

    // One timestep: every slot of current is integrated into scratch, then the
    // buffers swap. Runs regardless of pause state.
    void step(double timescale);

    // One timestep at the view's timescale unless the view is paused
    void update(const ViewState& view);

    // Parameter adjustment
    void setGravitationalConstant(double G);
    double getGravitationalConstant() const { return G_; }

    // Read-only view of the current frame
    const BodyBuffer& getBodies() const { return buffers_.current(); }
    size_t getCapacity() const { return buffers_.capacity(); }
    size_t getLiveCount() const { return countLiveBodies(buffers_.current()); }
    size_t getStepCount() const { return step_count_; }
    const SimulationConfig& getConfig() const { return config_; }

    // State management. A failed save is reported and otherwise ignored.
    bool saveState(const std::string& filename) const;
    bool saveState() const { return saveState(config_.save_path); }
    void loadState(const std::string& filename);

    // Table of live bodies for the print-state control, closed by a totals
    // line (mass, momentum, energy)
    void printBodies(std::ostream& out) const;

    // Diagnostics
    double computeTotalMass() const;
    Vec2 computeMomentum() const;
    double computeKineticEnergy() const;
    double computePotentialEnergy() const;
    double computeTotalEnergy() const;

private:
    BodyBuffers buffers_;

    // Components
    std::unique_ptr<ForceCalculator> force_calculator_;
    Integrator integrator_;

    // Simulation parameters
    double G_;
    size_t step_count_;

    SimulationConfig config_;
    std::mt19937 rng_;

    void createForceCalculator();
};

} // namespace gravsim
