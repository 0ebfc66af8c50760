#include <doctest/doctest.h>

#include "factoryq/core/encoder.hpp"

using namespace factoryq::core;

TEST_CASE("Time remaining buckets put a value on a cutoff in the lower bucket")
{
    TEncoderConfig enc;
    const double day = 1440.0;

    CHECK(TimeBucket(0.0, day, enc) == 0);
    CHECK(TimeBucket(0.25 * day, day, enc) == 0);
    CHECK(TimeBucket(0.25 * day + 1.0, day, enc) == 1);
    CHECK(TimeBucket(0.50 * day, day, enc) == 1);
    CHECK(TimeBucket(0.75 * day, day, enc) == 2);
    CHECK(TimeBucket(0.75 * day + 1.0, day, enc) == 3);
    CHECK(TimeBucket(day, day, enc) == 3);

    // out of range values clamp
    CHECK(TimeBucket(-10.0, day, enc) == 0);
    CHECK(TimeBucket(2.0 * day, day, enc) == 3);
}

TEST_CASE("Shortfall buckets follow fractions of the daily target")
{
    TEncoderConfig enc;

    CHECK(ShortfallBucket(0, 90, enc) == 0);
    CHECK(ShortfallBucket(22, 90, enc) == 0);
    CHECK(ShortfallBucket(23, 90, enc) == 1);
    CHECK(ShortfallBucket(45, 90, enc) == 1);
    CHECK(ShortfallBucket(60, 90, enc) == 2);
    CHECK(ShortfallBucket(90, 90, enc) == 3);
    CHECK(ShortfallBucket(1, 1, enc) == 3);
}

TEST_CASE("Skill buckets are low, medium and high")
{
    TEncoderConfig enc;

    CHECK(SkillBucket(0.0, enc) == 0);
    CHECK(SkillBucket(0.3, enc) == 0);
    CHECK(SkillBucket(0.31, enc) == 1);
    CHECK(SkillBucket(0.7, enc) == 1);
    CHECK(SkillBucket(0.71, enc) == 2);
    CHECK(SkillBucket(1.0, enc) == 2);
    CHECK(SkillBucket(1.5, enc) == 2);
}

TEST_CASE("Custom cutoffs change the bucket edges")
{
    TEncoderConfig enc;
    enc.skillCutoffs = {0.5, 0.9};

    CHECK(SkillBucket(0.45, enc) == 0);
    CHECK(SkillBucket(0.6, enc) == 1);
    CHECK(SkillBucket(0.95, enc) == 2);
}

TEST_CASE("EncodeState fills every field from the observation")
{
    TObservation obs;
    obs.awaitingMachine = 1;
    obs.awaitingPriority = 2;
    obs.shiftIndex = 1;
    obs.timeRemaining = 900.0;
    obs.shortfall = 50;
    obs.eligible = {true, false, true};
    obs.skillOnAwaiting = {0.9, 0.5, 0.1};
    obs.machineStatus = {MachineStatus::BUSY, MachineStatus::IDLE, MachineStatus::BROKEN, MachineStatus::MAINTENANCE};

    TDecisionState s = EncodeState(obs, TEncoderConfig{}, 1440.0, 90);

    CHECK(s.machineId == 1);
    CHECK(s.priority == 2);
    CHECK(s.shift == 1);
    CHECK(s.timeBucket == 2);
    CHECK(s.shortfallBucket == 2);
    CHECK(s.available == std::vector<std::uint8_t>{1, 0, 1});
    CHECK(s.skillBuckets == std::vector<std::uint8_t>{2, 1, 0});
    CHECK(s.machineStatus == std::vector<std::uint8_t>{1, 0, 2, 3});
}

TEST_CASE("EncodeState uses the sentinel machine id when nothing awaits")
{
    TObservation obs;
    obs.awaitingMachine = -1;
    obs.awaitingPriority = 2;
    obs.timeRemaining = 0.0;
    obs.eligible = {true, true};
    obs.skillOnAwaiting = {0.9, 0.9};
    obs.machineStatus = {MachineStatus::BUSY, MachineStatus::BUSY, MachineStatus::BUSY};

    TDecisionState s = EncodeState(obs, TEncoderConfig{}, 1440.0, 90);

    CHECK(s.machineId == 3);
    CHECK(s.priority == 0);
    CHECK(s.skillBuckets == std::vector<std::uint8_t>{0, 0});
    CHECK(s.timeBucket == 0);
}

TEST_CASE("Equal observations give equal keys and equal hashes")
{
    TObservation obs;
    obs.awaitingMachine = 0;
    obs.timeRemaining = 100.0;
    obs.eligible = {true};
    obs.skillOnAwaiting = {0.5};
    obs.machineStatus = {MachineStatus::IDLE};

    TDecisionState a = EncodeState(obs, TEncoderConfig{}, 1440.0, 90);
    TDecisionState b = EncodeState(obs, TEncoderConfig{}, 1440.0, 90);

    CHECK(a == b);
    CHECK(TDecisionStateHash{}(a) == TDecisionStateHash{}(b));

    obs.eligible = {false};
    TDecisionState c = EncodeState(obs, TEncoderConfig{}, 1440.0, 90);
    CHECK_FALSE(a == c);
}

TEST_CASE("Decision state text form is parsed back")
{
    TDecisionState s;
    s.machineId = 2;
    s.priority = 1;
    s.shift = 0;
    s.timeBucket = 3;
    s.shortfallBucket = 1;
    s.available = {1, 0};
    s.skillBuckets = {2, 0};
    s.machineStatus = {0, 1, 3};

    const std::string text = ToString(s);
    CHECK(text == "2,1,0,3,1;10;20;013");

    std::optional<TDecisionState> parsed = ParseDecisionState(text);
    REQUIRE(parsed.has_value());
    CHECK(*parsed == s);
}

TEST_CASE("Malformed decision state text is rejected")
{
    CHECK_FALSE(ParseDecisionState("").has_value());
    CHECK_FALSE(ParseDecisionState("1,0,0,0;1;1;0").has_value());      // missing field
    CHECK_FALSE(ParseDecisionState("1,0,0,4,0;1;1;0").has_value());    // time bucket out of range
    CHECK_FALSE(ParseDecisionState("1,0,0,0,0;12;1;0").has_value());   // availability is a bit
    CHECK_FALSE(ParseDecisionState("1,0,0,0,0;1;10;0").has_value());   // width mismatch
    CHECK_FALSE(ParseDecisionState("1,0,0,0,0;1;1;4").has_value());    // unknown status
    CHECK_FALSE(ParseDecisionState("a,0,0,0,0;1;1;0").has_value());
    CHECK_FALSE(ParseDecisionState("99999999999,0,0,0,0;1;2;0").has_value()); // does not fit an int
    CHECK_FALSE(ParseDecisionState("1,0,0,0,0;1;\xc3\xa9;0").has_value());
    CHECK_FALSE(ParseDecisionState("\xc3\xa9,0,0,0,0;1;1;0").has_value());
}
