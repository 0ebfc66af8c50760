#pragma once

#include "factoryq/core/data.hpp"
#include "factoryq/core/config.hpp"

namespace factoryq::core {

    static constexpr int TIME_BUCKETS = 4;
    static constexpr int SHORTFALL_BUCKETS = 4;
    static constexpr int SKILL_BUCKETS = 3;

    /**
     * Method: Bucketize
     * Description: Number of cutoffs strictly below value. A value equal to a cutoff
     * stays in the lower bucket; the result is always in [0, cutoffs.size()].
     */
    template <std::size_t N>
    int Bucketize(double value, const std::array<double, N>& cutoffs)
    {
        int bucket = 0;
        for (double c : cutoffs) {
            if (value > c) bucket++;
        }
        return bucket;
    }

    int TimeBucket(double timeRemaining, double dayLength, const TEncoderConfig& encoder);
    int ShortfallBucket(int shortfall, int dailyTarget, const TEncoderConfig& encoder);
    int SkillBucket(double skill, const TEncoderConfig& encoder);

    /**
     * Method: EncodeState
     * Description: Map a raw observation of the floor into the discrete table key.
     * Pure and deterministic.
     */
    TDecisionState EncodeState(const TObservation& obs, const TEncoderConfig& encoder,
                               double dayLength, int dailyTarget);

    /**
     * Method: ToString
     * Description: Compact text form "m,p,s,t,g;avail;skills;status" of a decision state
     */
    std::string ToString(const TDecisionState& state);

    /**
     * Method: ParseDecisionState
     * Description: Inverse of ToString; std::nullopt on malformed input
     */
    std::optional<TDecisionState> ParseDecisionState(const std::string& text);

} // namespace factoryq::core
