#include "factoryq/core/reward.hpp"
#include "factoryq/core/encoder.hpp" // SKILL_BUCKETS

namespace factoryq::core {

    TRewardBreakdown ComputeReward(const TTransition& t, const TRewardWeights& w)
    {
        TRewardBreakdown r;

        // production of the elapsed interval
        r.goodParts = w.goodPart * t.goodParts;
        r.defects = -w.defect * t.defectiveParts;
        r.fatigue = -w.fatigue * t.fatigue;
        r.skillMatch = w.skillScale * t.mediumSkill - (w.lowSkill + w.slowProduction) * t.lowSkillUnits;
        r.overCapacity = -w.overCapacity * t.overCapacity;

        // decision taken at the start of the step
        if (t.assigned) {
            r.assign = w.assign;
            if (t.assignedSkillBucket == SKILL_BUCKETS - 1) r.highSkill = w.highSkill;
            if (t.switchedOperator) r.switching = -w.switchOperator;
        }
        if (t.idleWithEligible) r.idle = -w.idle;
        if (t.illegal) r.illegal = -w.illegal;

        if (t.reached50) r.milestones += w.milestone50;
        if (t.reached80) r.milestones += w.milestone80;

        // end of day: scaled bonus and per-part shortfall penalty
        if (t.terminal) {
            double ratio = std::min(1.0, static_cast<double>(t.totalGood) / t.dailyTarget);
            int shortfall = std::max(0, t.dailyTarget - t.totalGood);
            r.terminal = w.goalBonus * ratio - w.shortfall * shortfall;
        }

        return r;
    }

} // namespace factoryq::core
