#include <doctest/doctest.h>

#include "factoryq/core/environment.hpp"
#include "factoryq/core/encoder.hpp"
#include "test_support.hpp"

using namespace factoryq::core;
using factoryq::test::SingleMachineConfig;
using factoryq::test::SmallFloorConfig;

namespace {

    // Binding consistency, status consistency and state ranges
    void CheckFloorInvariants(const FactoryEnv& env, const TDecisionState& state)
    {
        const auto& machines = env.getMachines();
        const auto& operators = env.getOperators();

        for (const auto& m : machines) {
            if (m.status == MachineStatus::BUSY) {
                REQUIRE(m.operatorId >= 0);
                CHECK(operators[m.operatorId].machineId == m.id);
            }
            else {
                CHECK(m.operatorId == -1);
            }
        }

        for (const auto& o : operators) {
            if (o.machineId >= 0) {
                CHECK(machines[o.machineId].operatorId == o.id);
                CHECK(machines[o.machineId].status == MachineStatus::BUSY);
            }
        }

        if (env.getAwaitingMachine() >= 0) {
            CHECK(machines[env.getAwaitingMachine()].status == MachineStatus::IDLE);
        }

        CHECK(state.machineId >= 0);
        CHECK(state.machineId <= (int)machines.size());
        CHECK(state.timeBucket >= 0);
        CHECK(state.timeBucket < TIME_BUCKETS);
        CHECK(state.shortfallBucket >= 0);
        CHECK(state.shortfallBucket < SHORTFALL_BUCKETS);
        for (auto b : state.skillBuckets) CHECK(b < SKILL_BUCKETS);
        for (auto c : state.machineStatus) CHECK(c <= 3);
    }

} // namespace

TEST_CASE("Reset starts an empty day and is idempotent")
{
    FactoryEnv env(SmallFloorConfig(), 11);

    TDecisionState first = env.reset();
    TDecisionState second = env.reset();

    CHECK(first == second);
    CHECK(env.getTime() == 0.0);
    CHECK(env.getProduction().good == 0);
    CHECK(env.getProduction().defective == 0);
    CHECK_FALSE(env.isTerminal());

    // the high priority lathe is offered first
    CHECK(env.getAwaitingMachine() == 1);
    CHECK(first.machineId == 1);
    CHECK(first.priority == 2);
    CHECK(first.shift == 0);
    CHECK(first.timeBucket == 3);
    CHECK(first.shortfallBucket == 3);
    CHECK(first.available == std::vector<std::uint8_t>{1, 1, 1});

    // stepping and resetting again gives the same initial state
    env.step(0);
    env.step(3);
    CHECK(env.reset() == first);
    CHECK(env.getTime() == 0.0);
}

TEST_CASE("Unit time and defect probability follow the operator skill")
{
    FactoryEnv env(SmallFloorConfig(), 1);

    CHECK(env.processMinutes(0, 0) == doctest::Approx(6.0 / 0.9));
    CHECK(env.processMinutes(0, 1) == doctest::Approx(40.0));
    CHECK(env.processMinutes(2, 0) == doctest::Approx(60.0));
    CHECK(env.processMinutes(1, 1) == doctest::Approx(10.0));

    CHECK(env.defectProbability(0, 0) == doctest::Approx(0.0));
    CHECK(env.defectProbability(1, 0) == doctest::Approx(0.0));
    CHECK(env.defectProbability(2, 0) == doctest::Approx(0.4));
    CHECK(env.defectProbability(0, 1) == doctest::Approx(0.3));
}

TEST_CASE("Several machines are staffed at the same instant")
{
    FactoryEnv env(SmallFloorConfig(), 3);
    env.reset();

    TStepResult r = env.step(0);
    CHECK_FALSE(r.terminal);
    CHECK_FALSE(r.info.illegal);
    CHECK(r.info.assignedOperator == 0);
    CHECK(r.info.time == 0.0);
    CHECK(r.reward == doctest::Approx(0.5));
    CHECK(env.getMachines()[1].status == MachineStatus::BUSY);
    CHECK(env.getMachines()[1].remaining == doctest::Approx(40.0));

    // the press is next, and operator 0 is no longer available
    CHECK(r.state.machineId == 0);
    CHECK(r.state.available == std::vector<std::uint8_t>{0, 1, 1});
}

TEST_CASE("A busy operator is an illegal choice and time moves on")
{
    FactoryEnv env(SmallFloorConfig(), 3);
    env.reset();
    env.step(0);

    TStepResult r = env.step(0);
    CHECK(r.info.illegal);
    CHECK(r.info.illegalReason == IllegalReason::OPERATOR_BUSY);
    CHECK(r.info.assignedOperator == -1);
    CHECK(r.info.reward.illegal == doctest::Approx(-8.0));
    CHECK(r.info.reward.idle == doctest::Approx(-1.0));

    // the lathe finishes its 40-minute unit, which is the next decision
    CHECK(r.info.completions == 1);
    CHECK(r.info.time == doctest::Approx(40.0));
    CHECK(env.getMachines()[1].status == MachineStatus::IDLE);
}

TEST_CASE("Out of range actions are substituted by idle")
{
    FactoryEnv env(SmallFloorConfig(), 5);
    const int numActions = env.getNumActions();
    REQUIRE(numActions == 4);

    for (int action : {numActions, numActions + 7, -1, -100}) {
        env.reset();
        TStepResult r;
        CHECK_NOTHROW(r = env.step(action));
        CHECK(r.info.illegal);
        CHECK(r.info.illegalReason == IllegalReason::OUT_OF_RANGE);
        CHECK(r.reward == doctest::Approx(-9.0));
        CHECK(r.info.time == doctest::Approx(1.0));
        CHECK_FALSE(r.terminal);
    }
}

TEST_CASE("The explicit idle action costs the idle penalty only")
{
    FactoryEnv env(SmallFloorConfig(), 5);
    env.reset();

    TStepResult r = env.step(3);
    CHECK_FALSE(r.info.illegal);
    CHECK(r.reward == doctest::Approx(-1.0));
    CHECK(r.info.time == doctest::Approx(1.0));
}

TEST_CASE("A unit finishing at the end of the day is not counted")
{
    FactoryEnv env(SingleMachineConfig(), 9);
    env.reset();

    TStepResult first = env.step(0);
    CHECK(first.info.completions == 1);
    CHECK(first.info.goodParts == 1);
    CHECK(first.info.time == doctest::Approx(5.0));
    CHECK_FALSE(first.terminal);

    TStepResult second = env.step(0);
    CHECK(second.terminal);
    CHECK(second.info.completions == 0);
    CHECK(second.info.goodParts == 1);
    CHECK(second.info.time == doctest::Approx(10.0));
    CHECK(second.info.reward.terminal == doctest::Approx(80.0));
    CHECK(second.state.machineId == 1);
    CHECK(env.getOperators()[0].isFree());
}

TEST_CASE("Stepping a finished day changes nothing")
{
    FactoryEnv env(SingleMachineConfig(), 9);
    env.reset();
    env.step(0);
    TStepResult last = env.step(0);
    REQUIRE(last.terminal);

    TStepResult after = env.step(0);
    CHECK(after.terminal);
    CHECK(after.reward == 0.0);
    CHECK(after.info.afterTerminal);
    CHECK(after.state == last.state);
    CHECK(after.info.goodParts == 1);
    CHECK(env.getTime() == doctest::Approx(10.0));
}

TEST_CASE("A failure sends the machine through repair and maintenance")
{
    TFactoryConfig config = SingleMachineConfig();
    config.dayLengthMinutes = 100.0;
    config.operators[0].shiftCapacity = {100.0};
    config.breakdownRatePerMinute = 1.0;
    config.repairMinutes = {20.0, 20.0};
    config.maintenanceMinutes = {10.0, 10.0};

    FactoryEnv env(config, 21);
    env.reset();

    TStepResult r = env.step(0);
    CHECK(r.info.completions == 1);
    CHECK(r.info.breakdowns == 1);
    CHECK(r.info.goodParts == 1);

    // broken from 5 to 25, maintenance from 25 to 35, then idle again
    CHECK(r.info.time == doctest::Approx(35.0));
    CHECK(env.getMachines()[0].status == MachineStatus::IDLE);
    CHECK(env.getAwaitingMachine() == 0);
}

TEST_CASE("A failure on a busy machine scraps the unit and frees the operator")
{
    TFactoryConfig config = SingleMachineConfig();
    config.machineTypes[0] = {"press", 15.0, 15.0};
    config.dayLengthMinutes = 20.0;
    config.numShifts = 2;
    config.operators[0].shiftCapacity = {10.0, 10.0};
    config.breakdownRatePerMinute = 1.0;
    config.repairMinutes = {20.0, 20.0};

    FactoryEnv env(config, 4);
    env.reset();

    // the shift boundary at 10 is the first event; the machine fails there
    TStepResult r = env.step(0);
    CHECK(r.info.breakdowns == 1);
    CHECK(r.terminal);
    CHECK(r.info.goodParts == 0);
    CHECK(r.info.defectiveParts == 0);
    CHECK(env.getMachines()[0].status == MachineStatus::BROKEN);
    CHECK(env.getMachines()[0].operatorId == -1);
    CHECK(env.getOperators()[0].isFree());
}

TEST_CASE("Preventive maintenance after a unit")
{
    TFactoryConfig config = SingleMachineConfig();
    config.dayLengthMinutes = 100.0;
    config.operators[0].shiftCapacity = {100.0};
    config.maintenanceProbability = 1.0;
    config.maintenanceMinutes = {10.0, 10.0};

    FactoryEnv env(config, 2);
    env.reset();

    TStepResult r = env.step(0);
    CHECK(r.info.completions == 1);
    CHECK(r.info.maintenances == 1);
    CHECK(r.info.breakdowns == 0);
    CHECK(r.info.time == doctest::Approx(15.0));
    CHECK(env.getMachines()[0].status == MachineStatus::IDLE);
}

TEST_CASE("Shift capacity limits who can be assigned")
{
    TFactoryConfig config = SingleMachineConfig();
    config.dayLengthMinutes = 20.0;
    config.numShifts = 2;
    config.operators = {
        {"O0", {1.0}, {5.0, 10.0}},
        {"O1", {1.0}, {10.0, 10.0}}
    };

    FactoryEnv env(config, 8);
    env.reset();

    TStepResult r = env.step(0);
    REQUIRE(r.info.time == doctest::Approx(5.0));
    CHECK_FALSE(env.isEligible(0));
    CHECK(env.isEligible(1));
    CHECK(r.state.available == std::vector<std::uint8_t>{0, 1});

    r = env.step(0);
    CHECK(r.info.illegal);
    CHECK(r.info.illegalReason == IllegalReason::OVER_CAPACITY);
    REQUIRE(r.info.time == doctest::Approx(6.0));

    // busy minutes are booked to the shift in which they were spent
    r = env.step(1);
    CHECK(r.info.time == doctest::Approx(11.0));
    CHECK(r.info.shift == 1);
    CHECK(env.getOperators()[1].busyMinutes[0] == doctest::Approx(4.0));
    CHECK(env.getOperators()[1].busyMinutes[1] == doctest::Approx(1.0));
    CHECK(env.isEligible(0));
}

TEST_CASE("Fatigue is charged when an operator works past the threshold")
{
    TFactoryConfig config = SingleMachineConfig();
    config.fatigueThreshold = 0.4;

    FactoryEnv env(config, 1);
    env.reset();

    TStepResult r = env.step(0);
    CHECK(env.getOperators()[0].fatigue == doctest::Approx(1.0 / 6.0));
    CHECK(r.info.reward.fatigue == doctest::Approx(-0.5 / 6.0));
}

TEST_CASE("Completions are rewarded by skill match and charged for capacity overruns")
{
    TFactoryConfig config = SingleMachineConfig();
    config.weights.skillScale = 0.5;
    config.weights.lowSkill = 1.0;
    config.weights.slowProduction = 8.0;
    config.weights.overCapacity = 1.0;

    SUBCASE("an operator below capacity at assignment can still run past it") {
        config.operators[0].shiftCapacity = {3.0};
        FactoryEnv env(config, 1);
        env.reset();

        TStepResult r = env.step(0);
        CHECK(r.terminal);
        CHECK(env.getOperators()[0].busyMinutes[0] == doctest::Approx(5.0));
        CHECK(r.info.reward.overCapacity == doctest::Approx(-2.0 / 3.0));
        CHECK(r.info.reward.skillMatch == 0.0);
    }
    SUBCASE("low skill") {
        config.dayLengthMinutes = 40.0;
        config.operators[0] = {"O0", {0.2}, {40.0}};
        FactoryEnv env(config, 1);
        env.reset();

        TStepResult r = env.step(0);
        REQUIRE(r.info.time == doctest::Approx(25.0));
        CHECK(r.info.reward.skillMatch == doctest::Approx(-9.0));
        CHECK(r.info.reward.overCapacity == 0.0);
    }
    SUBCASE("medium skill") {
        config.dayLengthMinutes = 40.0;
        config.operators[0] = {"O0", {0.5}, {40.0}};
        FactoryEnv env(config, 1);
        env.reset();

        TStepResult r = env.step(0);
        REQUIRE(r.info.time == doctest::Approx(10.0));
        CHECK(r.info.reward.skillMatch == doctest::Approx(0.25));
    }
}

TEST_CASE("Putting a different operator on a machine is penalised")
{
    TFactoryConfig config = SingleMachineConfig();
    config.dayLengthMinutes = 20.0;
    config.operators = {
        {"O0", {1.0}, {20.0}},
        {"O1", {1.0}, {20.0}}
    };

    FactoryEnv env(config, 1);
    env.reset();

    TStepResult first = env.step(0);
    CHECK(first.info.reward.switching == 0.0);

    TStepResult second = env.step(1);
    CHECK(second.info.reward.switching == doctest::Approx(-0.5));

    TStepResult third = env.step(1);
    CHECK(third.info.reward.switching == 0.0);
}

TEST_CASE("Random action sequences never break the floor invariants")
{
    TFactoryConfig config = SmallFloorConfig();
    config.breakdownRatePerMinute = 0.01;
    config.maintenanceProbability = 0.1;
    config.repairMinutes = {5.0, 15.0};
    config.maintenanceMinutes = {3.0, 8.0};

    std::mt19937 pick(2024);
    std::uniform_int_distribution<int> anyAction(-1, config.numActions());

    for (unsigned int seed = 0; seed < 20; seed++)
    {
        FactoryEnv env(config, seed);
        TDecisionState state = env.reset();
        CheckFloorInvariants(env, state);

        double lastTime = 0.0;
        bool terminal = false;
        int steps = 0;
        while (!terminal && steps < 100000)
        {
            TStepResult r = env.step(anyAction(pick));
            steps++;

            CHECK(r.info.time >= lastTime);
            CHECK(r.info.time <= config.dayLengthMinutes);
            CHECK(r.terminal == (r.info.time >= config.dayLengthMinutes));
            CheckFloorInvariants(env, r.state);

            lastTime = r.info.time;
            terminal = r.terminal;
        }
        CHECK(terminal);
    }
}

TEST_CASE("Same seed and same actions give the same day")
{
    TFactoryConfig config = SmallFloorConfig();
    config.breakdownRatePerMinute = 0.02;
    config.maintenanceProbability = 0.2;

    auto play = [](FactoryEnv& env) {
        std::vector<double> rewards;
        env.reset();
        bool terminal = false;
        int t = 0;
        while (!terminal) {
            TStepResult r = env.step(t++ % 4);
            rewards.push_back(r.reward);
            terminal = r.terminal;
        }
        return rewards;
    };

    FactoryEnv a(config, 77);
    FactoryEnv b(config, 77);
    std::vector<double> first = play(a);
    CHECK(first == play(b));

    a.reseed(77);
    CHECK(play(a) == first);
}

TEST_CASE("History records assignments, completions and the terminal frame")
{
    FactoryEnv env(SmallFloorConfig(), 6);
    env.reset(true);

    bool terminal = false;
    int t = 0;
    while (!terminal) terminal = env.step(t++ % 3).terminal;

    const auto& history = env.getHistory();
    REQUIRE(history.size() > 2);
    CHECK(history.front().time == 0.0);
    CHECK(history.back().time == doctest::Approx(100.0));
    for (size_t i = 1; i < history.size(); i++) {
        CHECK(history[i].time >= history[i - 1].time);
        CHECK(history[i].machineStatus.size() == 2);
    }

    // no recording unless asked
    env.reset();
    CHECK(env.getHistory().empty());
}

TEST_CASE("The factory function validates the configuration")
{
    TFactoryConfig config = SmallFloorConfig();
    std::unique_ptr<IEnvironment> env = createEnvironment(config, 1);
    CHECK(env->getNumActions() == 4);

    config.machines.clear();
    CHECK_THROWS_AS(createEnvironment(config, 1), std::invalid_argument);
}
