#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>
#include "gravsim/simulation.hpp"
#include "gravsim/body_buffers.hpp"
#include "gravsim/error_handling.hpp"
#include "gravsim/view_state.hpp"
#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>

using namespace gravsim;

namespace {

Body makeBody(Vec2 position, Vec2 velocity, double mass) {
    Body body;
    body.position = position;
    body.velocity = velocity;
    body.mass = mass;
    body.radius = massToRadius(mass);
    body.color = Color(1, 2, 3);
    return body;
}

SimulationConfig seededConfig(size_t count) {
    SimulationConfig config;
    config.body_count = count;
    config.seed = 1234;
    config.use_fixed_seed = true;
    return config;
}

} // namespace

// Unit Tests

TEST(BodyBuffersTest, ResetSizesBothBuffers) {
    BodyBuffers buffers;
    buffers.reset({makeBody(Vec2(0, 0), Vec2(0, 0), 1.0), std::nullopt,
                   makeBody(Vec2(5, 5), Vec2(0, 0), 2.0)});

    EXPECT_EQ(buffers.capacity(), 3u);
    EXPECT_EQ(buffers.scratch().size(), 3u);
    EXPECT_FALSE(buffers.current()[1].has_value());
}

TEST(BodyBuffersTest, SwapPublishesScratch) {
    BodyBuffers buffers;
    buffers.reset({makeBody(Vec2(0, 0), Vec2(0, 0), 1.0)});

    buffers.scratch()[0] = makeBody(Vec2(9, 9), Vec2(0, 0), 4.0);
    EXPECT_DOUBLE_EQ(buffers.current()[0]->mass, 1.0);

    buffers.swap();
    EXPECT_DOUBLE_EQ(buffers.current()[0]->mass, 4.0);
    EXPECT_DOUBLE_EQ(buffers.scratch()[0]->mass, 1.0);

    buffers.swap();
    EXPECT_DOUBLE_EQ(buffers.current()[0]->mass, 1.0);
}

TEST(SimulationTest, InitializeSeedsRandomBodies) {
    Simulation sim;
    sim.initialize(seededConfig(12));

    EXPECT_EQ(sim.getCapacity(), 12u);
    EXPECT_EQ(sim.getLiveCount(), 12u);
    EXPECT_EQ(sim.getStepCount(), 0u);
    for (const auto& slot : sim.getBodies()) {
        ASSERT_TRUE(slot.has_value());
        EXPECT_DOUBLE_EQ(slot->radius, massToRadius(slot->mass));
    }
}

TEST(SimulationTest, InitializeRejectsInvalidConfig) {
    Simulation sim;
    SimulationConfig config = seededConfig(0);
    EXPECT_THROW(sim.initialize(config), ValidationException);

    config = seededConfig(5);
    config.G = -1.0;
    EXPECT_THROW(sim.initialize(config), ValidationException);
}

TEST(SimulationTest, InitializeFromMissingFileThrows) {
    Simulation sim;
    SimulationConfig config = seededConfig(5);
    config.load_path = "/nonexistent/gravsim/bodies.csv";
    EXPECT_THROW(sim.initialize(config), IOException);
}

TEST(SimulationTest, InitializeFromFile) {
    const std::string path = "gravsim_test_initialize.csv";
    {
        std::ofstream out(path);
        out << "#x, y, xVel, yVel, mass, radius, red, green, blue\n"
            << "1,2,0,0,4\n"
            << "100,0,0,0,9,5,10,20,30\n\n";
    }

    Simulation sim;
    SimulationConfig config = seededConfig(50);
    config.load_path = path;
    sim.initialize(config);

    // File decides the capacity, not body_count
    ASSERT_EQ(sim.getCapacity(), 2u);
    EXPECT_DOUBLE_EQ(sim.getBodies()[0]->radius, 2.0);
    EXPECT_DOUBLE_EQ(sim.getBodies()[1]->radius, 5.0);
    EXPECT_EQ(sim.getBodies()[1]->color, Color(10, 20, 30));

    std::remove(path.c_str());
}

TEST(SimulationTest, MalformedFileIsFatal) {
    const std::string path = "gravsim_test_malformed.csv";
    {
        std::ofstream out(path);
        out << "1,2,3,4,5\n1,2,3\n";
    }

    Simulation sim;
    SimulationConfig config = seededConfig(5);
    config.load_path = path;

    try {
        sim.initialize(config);
        FAIL() << "Expected ParseException";
    } catch (const ParseException& e) {
        EXPECT_EQ(e.getLine(), 2u);
    }

    std::remove(path.c_str());
}

TEST(SimulationTest, IsolatedBodyStep) {
    Simulation sim;
    sim.setBodies({makeBody(Vec2(10, -10), Vec2(4, 2), 7.0)});

    sim.step(0.25);

    const BodySlot& slot = sim.getBodies()[0];
    ASSERT_TRUE(slot.has_value());
    EXPECT_DOUBLE_EQ(slot->position.x, 11.0);
    EXPECT_DOUBLE_EQ(slot->position.y, -9.5);
    EXPECT_DOUBLE_EQ(slot->velocity.x, 4.0);
    EXPECT_DOUBLE_EQ(slot->velocity.y, 2.0);
    EXPECT_DOUBLE_EQ(slot->mass, 7.0);
    EXPECT_DOUBLE_EQ(slot->radius, massToRadius(7.0));
    EXPECT_EQ(slot->color, Color(1, 2, 3));
    EXPECT_EQ(sim.getStepCount(), 1u);
}

TEST(SimulationTest, EqualMassOverlapMergesIntoLaterSlot) {
    Simulation sim;
    // Radii 2 and 2, separation 3
    sim.setBodies({makeBody(Vec2(0, 0), Vec2(0, 0), 4.0),
                   makeBody(Vec2(3, 0), Vec2(0, 0), 4.0)});

    sim.step(0.25);

    const BodyBuffer& bodies = sim.getBodies();
    ASSERT_EQ(bodies.size(), 2u);
    EXPECT_FALSE(bodies[0].has_value());
    ASSERT_TRUE(bodies[1].has_value());
    EXPECT_DOUBLE_EQ(bodies[1]->mass, 8.0);
    EXPECT_DOUBLE_EQ(bodies[1]->position.x, 1.5);
    EXPECT_DOUBLE_EQ(bodies[1]->radius, massToRadius(8.0));
    EXPECT_EQ(sim.getLiveCount(), 1u);
}

TEST(SimulationTest, UnequalMassOverlapKeepsHeavierSlot) {
    Simulation sim;
    sim.setBodies({makeBody(Vec2(0, 0), Vec2(0, 0), 25.0),
                   makeBody(Vec2(4, 0), Vec2(0, 0), 1.0)});

    sim.step(0.25);

    const BodyBuffer& bodies = sim.getBodies();
    ASSERT_TRUE(bodies[0].has_value());
    EXPECT_FALSE(bodies[1].has_value());
    EXPECT_DOUBLE_EQ(bodies[0]->mass, 26.0);
}

TEST(SimulationTest, CapacityFixedAfterMerges) {
    Simulation sim;
    sim.setBodies({makeBody(Vec2(0, 0), Vec2(0, 0), 25.0),
                   makeBody(Vec2(4, 0), Vec2(0, 0), 1.0),
                   makeBody(Vec2(400, 0), Vec2(0, 0), 1.0)});

    for (int i = 0; i < 10; i++) {
        sim.step(0.25);
        EXPECT_EQ(sim.getCapacity(), 3u);
    }
    EXPECT_FALSE(sim.getBodies()[1].has_value());
}

TEST(SimulationTest, AbsorbedSlotNeverResurrects) {
    Simulation sim;
    sim.setBodies({makeBody(Vec2(0, 0), Vec2(0, 0), 25.0),
                   makeBody(Vec2(4, 0), Vec2(0, 0), 1.0)});

    for (int i = 0; i < 20; i++) {
        sim.step(0.25);
        EXPECT_FALSE(sim.getBodies()[1].has_value());
    }
}

TEST(SimulationTest, StepReadsOnlyPreviousFrame) {
    Simulation sim;
    sim.setBodies({makeBody(Vec2(-50, 0), Vec2(0, 1), 10.0),
                   makeBody(Vec2(50, 0), Vec2(0, -1), 10.0),
                   makeBody(Vec2(0, 80), Vec2(1, 0), 5.0)});

    // Every slot computed against the same snapshot
    BodyBuffer snapshot = sim.getBodies();
    DirectForceCalculator calc(sim.getGravitationalConstant());
    Integrator integrator;
    BodyBuffer expected;
    for (const auto& slot : snapshot) {
        expected.push_back(integrator.update(slot, snapshot, calc, 0.25));
    }

    sim.step(0.25);

    const BodyBuffer& actual = sim.getBodies();
    ASSERT_EQ(actual.size(), expected.size());
    for (size_t i = 0; i < actual.size(); i++) {
        ASSERT_EQ(actual[i].has_value(), expected[i].has_value());
        if (!actual[i]) continue;
        EXPECT_DOUBLE_EQ(actual[i]->position.x, expected[i]->position.x);
        EXPECT_DOUBLE_EQ(actual[i]->position.y, expected[i]->position.y);
        EXPECT_DOUBLE_EQ(actual[i]->velocity.x, expected[i]->velocity.x);
        EXPECT_DOUBLE_EQ(actual[i]->velocity.y, expected[i]->velocity.y);
    }
}

TEST(SimulationTest, PausedUpdateDoesNotStep) {
    Simulation sim;
    sim.setBodies({makeBody(Vec2(0, 0), Vec2(1, 0), 1.0)});

    ViewState view;
    ASSERT_TRUE(view.isPaused());

    sim.update(view);
    EXPECT_EQ(sim.getStepCount(), 0u);
    EXPECT_DOUBLE_EQ(sim.getBodies()[0]->position.x, 0.0);

    // Manual single step works while paused and leaves the state alone
    sim.step(view.getTimescale());
    EXPECT_EQ(sim.getStepCount(), 1u);
    EXPECT_TRUE(view.isPaused());

    view.resume();
    sim.update(view);
    EXPECT_EQ(sim.getStepCount(), 2u);
    EXPECT_DOUBLE_EQ(sim.getBodies()[0]->position.x, 2 * view.getTimescale());
}

TEST(SimulationTest, SetGravitationalConstant) {
    Simulation sim;
    sim.setGravitationalConstant(2.5);
    EXPECT_DOUBLE_EQ(sim.getGravitationalConstant(), 2.5);
    EXPECT_THROW(sim.setGravitationalConstant(0.0), ValidationException);
}

TEST(SimulationTest, SaveAndLoadState) {
    const std::string path = "gravsim_test_state.csv";

    Simulation sim;
    sim.setBodies({makeBody(Vec2(0, 0), Vec2(0, 0), 25.0),
                   makeBody(Vec2(4, 0), Vec2(0, 0), 1.0),
                   makeBody(Vec2(300, 7), Vec2(0.5, 0), 2.0)});
    sim.step(0.25);  // Absorbs slot 1

    ASSERT_TRUE(sim.saveState(path));

    Simulation loaded;
    loaded.loadState(path);

    // Only live bodies are written, so the loaded buffer is compact
    ASSERT_EQ(loaded.getCapacity(), 2u);
    EXPECT_DOUBLE_EQ(loaded.getBodies()[0]->mass, sim.getBodies()[0]->mass);
    EXPECT_DOUBLE_EQ(loaded.getBodies()[1]->position.x, sim.getBodies()[2]->position.x);
    EXPECT_DOUBLE_EQ(loaded.getBodies()[1]->velocity.x, sim.getBodies()[2]->velocity.x);

    std::remove(path.c_str());
}

TEST(SimulationTest, FailedSaveIsNotFatal) {
    Simulation sim;
    sim.setBodies({makeBody(Vec2(0, 0), Vec2(1, 0), 1.0)});

    EXPECT_FALSE(sim.saveState("/nonexistent/gravsim/save.csv"));

    // Simulation carries on
    sim.step(1.0);
    EXPECT_DOUBLE_EQ(sim.getBodies()[0]->position.x, 1.0);
}

TEST(SimulationTest, PrintBodiesSkipsAbsentSlots) {
    Simulation sim;
    sim.setBodies({makeBody(Vec2(0, 0), Vec2(0, 0), 25.0),
                   makeBody(Vec2(4, 0), Vec2(0, 0), 1.0)});
    sim.step(0.25);

    std::ostringstream out;
    sim.printBodies(out);
    std::string text = out.str();

    EXPECT_NE(text.find("Body Index"), std::string::npos);
    EXPECT_NE(text.find("BODY 0"), std::string::npos);
    EXPECT_EQ(text.find("BODY 1"), std::string::npos);
    EXPECT_NE(text.find("26.00"), std::string::npos);

    // Totals line closes the table
    EXPECT_NE(text.find("TOTAL MASS 26.00"), std::string::npos);
    EXPECT_NE(text.find("MOMENTUM (0.00, 0.00)"), std::string::npos);
    EXPECT_NE(text.find("ENERGY 0.00"), std::string::npos);
}

TEST(SimulationTest, Diagnostics) {
    Simulation sim;
    sim.setBodies({makeBody(Vec2(0, 0), Vec2(1, 0), 1.0),
                   makeBody(Vec2(10, 0), Vec2(0, 2), 2.0)});

    Vec2 momentum = sim.computeMomentum();
    EXPECT_DOUBLE_EQ(momentum.x, 1.0);
    EXPECT_DOUBLE_EQ(momentum.y, 4.0);
    EXPECT_NEAR(sim.computeKineticEnergy(), 4.5, 1e-12);
    // -G * 1 * 2 / 10 with G = 100
    EXPECT_NEAR(sim.computePotentialEnergy(), -20.0, 1e-12);
    EXPECT_NEAR(sim.computeTotalEnergy(), -15.5, 1e-12);

    std::ostringstream out;
    sim.printBodies(out);
    EXPECT_NE(out.str().find("MOMENTUM (1.00, 4.00)"), std::string::npos);
    EXPECT_NE(out.str().find("ENERGY -15.50 (kinetic 4.50, potential -20.00)"), std::string::npos);
}

TEST(SimulationTest, ThreeWayOverlapResolvesAgainstFirstContact) {
    Simulation sim;
    // Radii 1, 2, 3; every pair overlaps with d2 of 4 or 5
    sim.setBodies({makeBody(Vec2(0, 0), Vec2(0, 0), 1.0),
                   makeBody(Vec2(2, 0), Vec2(0, 0), 4.0),
                   makeBody(Vec2(1, 2), Vec2(0, 0), 9.0)});
    ASSERT_DOUBLE_EQ(sim.computeTotalMass(), 14.0);

    sim.step(0.25);

    // Slot 0 meets slot 1 first and is absorbed. Slots 1 and 2 both meet
    // slot 0 first, so each swallows it.
    const BodyBuffer& bodies = sim.getBodies();
    EXPECT_FALSE(bodies[0].has_value());
    ASSERT_TRUE(bodies[1].has_value());
    ASSERT_TRUE(bodies[2].has_value());
    EXPECT_DOUBLE_EQ(bodies[1]->mass, 5.0);
    EXPECT_DOUBLE_EQ(bodies[1]->position.x, 1.6);
    EXPECT_DOUBLE_EQ(bodies[1]->position.y, 0.0);
    EXPECT_DOUBLE_EQ(bodies[2]->mass, 10.0);
    EXPECT_DOUBLE_EQ(bodies[2]->position.x, 0.9);
    EXPECT_DOUBLE_EQ(bodies[2]->position.y, 1.8);

    // The lightest body was counted twice
    EXPECT_DOUBLE_EQ(sim.computeTotalMass(), 15.0);
    EXPECT_EQ(sim.getLiveCount(), 2u);

    // Survivors still overlap, so later steps finish the merge
    for (int i = 0; i < 10 && sim.getLiveCount() > 1; i++) {
        sim.step(0.25);
    }
    EXPECT_EQ(sim.getLiveCount(), 1u);
    EXPECT_EQ(sim.getStepCount(), 2u);
    EXPECT_FALSE(sim.getBodies()[1].has_value());
    ASSERT_TRUE(sim.getBodies()[2].has_value());
    EXPECT_DOUBLE_EQ(sim.getBodies()[2]->mass, 15.0);
    EXPECT_EQ(sim.getCapacity(), 3u);
}

// Property-Based Tests

RC_GTEST_PROP(Simulation, PairwiseMergesConserveMass, ()) {
    // Pairs far apart from each other, members of a pair possibly touching
    const auto pairs = *rc::gen::inRange(1, 6);
    std::vector<Body> bodies;
    for (int p = 0; p < pairs; p++) {
        double base = p * 1.0e6;
        bodies.push_back(makeBody(Vec2(base, 0), Vec2(0, 0), *rc::gen::inRange(1, 50) + 0.0));
        bodies.push_back(makeBody(Vec2(base + *rc::gen::inRange(1, 30), *rc::gen::inRange(-10, 10)),
                                  Vec2(0, 0), *rc::gen::inRange(1, 50) + 0.0));
    }

    Simulation sim;
    sim.setBodies(bodies);
    const double mass_before = sim.computeTotalMass();
    const size_t capacity = sim.getCapacity();

    const int steps = *rc::gen::inRange(1, 20);
    for (int i = 0; i < steps; i++) {
        sim.step(0.25);
    }

    // Property: total mass survives merging, and slots are never compacted
    RC_ASSERT(std::abs(sim.computeTotalMass() - mass_before) < 1e-9 * mass_before);
    RC_ASSERT(sim.getCapacity() == capacity);
}

RC_GTEST_PROP(Simulation, LiveCountNeverIncreases, (unsigned int seed)) {
    SimulationConfig config;
    config.body_count = *rc::gen::inRange<size_t>(1, 30);
    config.world_half_width = 60.0;  // Crowded, so merges happen
    config.world_half_height = 40.0;
    config.seed = seed;
    config.use_fixed_seed = true;

    Simulation sim;
    sim.initialize(config);

    size_t live = sim.getLiveCount();
    for (int i = 0; i < 30; i++) {
        sim.step(0.25);
        size_t now = sim.getLiveCount();
        RC_ASSERT(now <= live);
        RC_ASSERT(now >= 1u);
        live = now;
    }
}
