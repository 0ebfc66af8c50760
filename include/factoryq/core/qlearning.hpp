#pragma once

#include "factoryq/core/data.hpp"
#include "factoryq/core/config.hpp"

namespace factoryq::core {

    /**
     * Method: ScheduleValue
     * Description: Value of a decay schedule at a given episode. Non-increasing in the
     * episode index, equal to start at episode 0 and holding the floor from the horizon on.
     */
    double ScheduleValue(const TScheduleConfig& schedule, int episode);

    /**
     * Method: ArgMax
     * Description: Index of the largest value; ties go to the lowest index
     */
    int ArgMax(const std::vector<double>& values);

    /**
     * Method: PrintPolicy
     * Description: Print the greedy action and the action-values of up to maxRows states
     */
    void PrintPolicy(const TValueTable& table, int maxRows);

    /**
     * @brief Tabular Q-learning with epsilon-greedy exploration.
     *
     * The value table grows lazily: a row is created (all zeros) the first time
     * update() touches a state. Greedy selection never inserts rows.
     */
    class QLearningAgent {
        public:
            explicit QLearningAgent(const TAgentConfig& config);

            // Epsilon-greedy unless greedy is set
            int selectAction(const TDecisionState& state, bool greedy = false);

            // Argmax of the row of a state (action 0 for unseen states); safe to share between threads
            int greedyAction(const TDecisionState& state) const;

            // Q(s,a) <- Q(s,a) + alpha (r + gamma max Q(s',.) (1 - terminal) - Q(s,a))
            void update(const TDecisionState& state, int action, double reward,
                        const TDecisionState& nextState, bool terminal);

            // Set epsilon and alpha for the given episode index
            void beginEpisode(int episode);

            double epsilon() const { return epsilon_; }
            double alpha() const { return alpha_; }
            double gamma() const { return config_.gamma; }
            int numActions() const { return config_.numActions; }

            const TValueTable& valueTable() const { return table_; }
            void restoreValueTable(TValueTable table);

            double maxValue(const TDecisionState& state) const;

            void reseed(unsigned int seed) { rng_.seed(seed); }

        private:
            std::vector<double>& getOrInsert(const TDecisionState& state);

            TAgentConfig config_;
            TValueTable table_;
            double epsilon_ = 1.0;
            double alpha_ = 0.1;
            std::mt19937 rng_;
        };

} // namespace factoryq::core
