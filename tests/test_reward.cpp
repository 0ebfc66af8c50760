#include <doctest/doctest.h>

#include "factoryq/core/reward.hpp"

using namespace factoryq::core;

namespace {

    TTransition Quiet()
    {
        TTransition t;
        t.dailyTarget = 10;
        return t;
    }

} // namespace

TEST_CASE("A high skill assignment that completes a good part")
{
    TRewardWeights w;
    TTransition t = Quiet();
    t.assigned = true;
    t.assignedSkillBucket = 2;
    t.goodParts = 1;

    TRewardBreakdown r = ComputeReward(t, w);
    CHECK(r.goodParts == doctest::Approx(2.0));
    CHECK(r.assign == doctest::Approx(0.5));
    CHECK(r.highSkill == doctest::Approx(1.0));
    CHECK(r.total() == doctest::Approx(3.5));
}

TEST_CASE("A medium skill assignment earns no skill bonus")
{
    TTransition t = Quiet();
    t.assigned = true;
    t.assignedSkillBucket = 1;

    TRewardBreakdown r = ComputeReward(t, TRewardWeights{});
    CHECK(r.highSkill == 0.0);
    CHECK(r.total() == doctest::Approx(0.5));
}

TEST_CASE("Idling with an eligible operator free is penalised")
{
    TTransition t = Quiet();
    t.idleWithEligible = true;

    CHECK(ComputeReward(t, TRewardWeights{}).total() == doctest::Approx(-1.0));

    // idling with nobody available costs nothing
    CHECK(ComputeReward(Quiet(), TRewardWeights{}).total() == doctest::Approx(0.0));
}

TEST_CASE("An illegal action pays the illegal penalty on top of the idle penalty")
{
    TTransition t = Quiet();
    t.illegal = true;
    t.idleWithEligible = true;

    TRewardBreakdown r = ComputeReward(t, TRewardWeights{});
    CHECK(r.illegal == doctest::Approx(-8.0));
    CHECK(r.idle == doctest::Approx(-1.0));
    CHECK(r.total() == doctest::Approx(-9.0));
}

TEST_CASE("Defective parts are penalised per part")
{
    TTransition t = Quiet();
    t.goodParts = 2;
    t.defectiveParts = 3;

    CHECK(ComputeReward(t, TRewardWeights{}).total() == doctest::Approx(2.0 * 2 - 5.0 * 3));
}

TEST_CASE("Terminal bonus scales with the share of the target reached")
{
    TRewardWeights w;

    TTransition met = Quiet();
    met.terminal = true;
    met.totalGood = 12;
    CHECK(ComputeReward(met, w).terminal == doctest::Approx(80.0));

    TTransition half = Quiet();
    half.terminal = true;
    half.totalGood = 5;
    CHECK(ComputeReward(half, w).terminal == doctest::Approx(80.0 * 0.5 - 0.3 * 5));

    TTransition none = Quiet();
    none.terminal = true;
    CHECK(ComputeReward(none, w).terminal == doctest::Approx(-0.3 * 10));

    // no terminal component before the end of the day
    TTransition running = Quiet();
    running.totalGood = 10;
    CHECK(ComputeReward(running, w).terminal == 0.0);
}

TEST_CASE("Fatigue, operator switch and milestones")
{
    TTransition t = Quiet();
    t.assigned = true;
    t.assignedSkillBucket = 0;
    t.switchedOperator = true;
    t.fatigue = 0.4;
    t.reached50 = true;
    t.reached80 = true;

    TRewardBreakdown r = ComputeReward(t, TRewardWeights{});
    CHECK(r.switching == doctest::Approx(-0.5));
    CHECK(r.fatigue == doctest::Approx(-0.2));
    CHECK(r.milestones == doctest::Approx(30.0));
}

TEST_CASE("Skill match and capacity overrun terms")
{
    TRewardWeights w;
    w.skillScale = 0.5;
    w.lowSkill = 1.0;
    w.slowProduction = 8.0;
    w.overCapacity = 1.0;

    TTransition t = Quiet();
    t.mediumSkill = 0.5 + 0.6;
    t.lowSkillUnits = 1;
    t.overCapacity = 0.25;

    TRewardBreakdown r = ComputeReward(t, w);
    CHECK(r.skillMatch == doctest::Approx(0.55 - 9.0));
    CHECK(r.overCapacity == doctest::Approx(-0.25));
    CHECK(r.total() == doctest::Approx(0.55 - 9.0 - 0.25));

    // the default weights leave these terms out
    CHECK(ComputeReward(t, TRewardWeights{}).total() == doctest::Approx(0.0));
}

TEST_CASE("The reward is a pure function of its inputs")
{
    TTransition t = Quiet();
    t.assigned = true;
    t.assignedSkillBucket = 2;
    t.goodParts = 4;
    t.defectiveParts = 1;
    t.terminal = true;
    t.totalGood = 7;

    TRewardWeights w;
    w.goodPart = 3.0;

    CHECK(ComputeReward(t, w).total() == ComputeReward(t, w).total());
}
