#pragma once

#include "factoryq/core/data.hpp"
#include "factoryq/core/ienvironment.hpp"
#include "factoryq/core/qlearning.hpp"

namespace factoryq::core {

    /**
     * Method: TrainEpisode
     * Description: One epsilon-greedy episode with a Q-update after every step.
     * The schedules are moved to `episode` before the first action.
     */
    TEpisodeStats TrainEpisode(IEnvironment& env, QLearningAgent& agent, int episode,
                               int maxSteps, bool recordHistory = false);

    /**
     * Method: GreedyEpisode
     * Description: One episode following the greedy policy; the table is not touched.
     * Stops after maxSteps steps if the day has not ended.
     */
    TEpisodeStats GreedyEpisode(IEnvironment& env, const QLearningAgent& agent,
                                int maxSteps, bool recordHistory = false);

    /**
     * Method: EvaluateGreedy
     * Description: Runs `episodes` greedy episodes in parallel. Episode i uses its own
     * environment seeded with seed + i, so results do not depend on the thread count.
     */
    std::vector<TEpisodeStats> EvaluateGreedy(const TFactoryConfig& config, const QLearningAgent& agent,
                                              int episodes, unsigned int seed, int maxSteps);

} // namespace factoryq::core
