#pragma once

#include "factoryq/core/data.hpp"
#include "factoryq/core/config.hpp"

namespace factoryq::core {

    //--------------------------------------------------------------------------
    // Struct: TTransition
    // Description: Everything the reward model needs to know about one step
    //--------------------------------------------------------------------------
    struct TTransition
    {
        bool assigned = false;              // a legal assignment was made
        int assignedSkillBucket = -1;       // skill bucket of the assigned operator (-1 = none)
        bool idleWithEligible = false;      // machine left idle while an eligible operator was free
        bool illegal = false;               // action replaced by the idle action
        bool switchedOperator = false;      // machine got a different operator than last time

        int goodParts = 0;                  // good parts completed during the step
        int defectiveParts = 0;             // defective parts completed during the step
        double fatigue = 0.0;               // summed fatigue of the operators that completed a unit
        bool reached50 = false;             // 50% milestone crossed during the step
        bool reached80 = false;             // 80% milestone crossed during the step
        double mediumSkill = 0.0;           // summed skill of medium skill completions
        int lowSkillUnits = 0;              // completions by a low skill operator
        double overCapacity = 0.0;          // summed shift overrun ratio at completion

        bool terminal = false;              // the step ended the day
        int totalGood = 0;                  // good parts of the whole episode so far
        int dailyTarget = 1;
    };

    /**
     * Method: ComputeReward
     * Description: Pure additive reward of a transition; no randomness involved.
     */
    TRewardBreakdown ComputeReward(const TTransition& t, const TRewardWeights& w);

} // namespace factoryq::core
