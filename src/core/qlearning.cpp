#include "factoryq/core/qlearning.hpp"
#include "factoryq/core/encoder.hpp" // ToString(TDecisionState)
#include "factoryq/core/method.hpp"  // randomico() and irandomico()

namespace factoryq::core {

    double ScheduleValue(const TScheduleConfig& s, int episode)
    {
        static const double PI = 3.14159265358979323846;

        if (episode <= 0) return s.start;
        if (episode >= s.horizon) return s.end;

        double x = static_cast<double>(episode) / s.horizon;
        double value = s.start;

        switch (s.type)
        {
            case DecayType::LINEAR:
                value = s.start + (s.end - s.start) * x;
                break;

            case DecayType::TWO_PHASE:
                // fast drop to mid during the exploration phase, then a slow drop to the floor
                if (x < s.split) value = s.start + (s.mid - s.start) * (x / s.split);
                else value = s.mid + (s.end - s.mid) * ((x - s.split) / (1.0 - s.split));
                break;

            case DecayType::COSINE:
                value = s.end + 0.5 * (s.start - s.end) * (1.0 + std::cos(PI * x));
                break;
        }

        return std::clamp(value, s.end, s.start);
    }

    int ArgMax(const std::vector<double>& values)
    {
        int best = 0;
        for (int a = 1; a < (int)values.size(); a++) {
            if (values[a] > values[best]) best = a;
        }
        return best;
    }

    void PrintPolicy(const TValueTable& table, int maxRows)
    {
        std::cout << std::format("\nPolicy ({} states):", table.size()) << std::endl;

        int row = 0;
        for (const auto& [state, values] : table)
        {
            if (row++ >= maxRows) {
                std::cout << "  ..." << std::endl;
                break;
            }

            std::cout << std::format("  {} \t-> {} \t", ToString(state), ArgMax(values));
            for (double q : values) {
                std::cout << std::format("{:.2f} ", q);
            }
            std::cout << std::endl;
        }
    }

    // -----------------------------------------------------------------------------
    // QLearningAgent
    // -----------------------------------------------------------------------------

    QLearningAgent::QLearningAgent(const TAgentConfig& config)
        : config_(config), rng_(config.seed)
    {
        ValidateAgentConfig(config_);
        beginEpisode(0);
    }

    void QLearningAgent::beginEpisode(int episode)
    {
        epsilon_ = ScheduleValue(config_.epsilon, episode);
        alpha_ = ScheduleValue(config_.alpha, episode);
    }

    int QLearningAgent::selectAction(const TDecisionState& state, bool greedy)
    {
        if (!greedy && randomico(rng_, 0.0, 1.0) < epsilon_) {
            return irandomico(rng_, 0, config_.numActions - 1);
        }
        return greedyAction(state);
    }

    int QLearningAgent::greedyAction(const TDecisionState& state) const
    {
        auto it = table_.find(state);
        if (it == table_.end()) return 0;
        return ArgMax(it->second);
    }

    void QLearningAgent::update(const TDecisionState& state, int action, double reward,
                                const TDecisionState& nextState, bool terminal)
    {
        if (action < 0 || action >= config_.numActions) {
            throw std::out_of_range("action " + std::to_string(action) + " outside [0, " +
                                    std::to_string(config_.numActions) + ")");
        }

        double future = terminal ? 0.0 : maxValue(nextState);
        std::vector<double>& q = getOrInsert(state);
        q[action] += alpha_ * (reward + config_.gamma * future - q[action]);
    }

    std::vector<double>& QLearningAgent::getOrInsert(const TDecisionState& state)
    {
        auto it = table_.find(state);
        if (it == table_.end()) {
            it = table_.emplace(state, std::vector<double>(config_.numActions, 0.0)).first;
        }
        return it->second;
    }

    double QLearningAgent::maxValue(const TDecisionState& state) const
    {
        auto it = table_.find(state);
        if (it == table_.end()) return 0.0;
        return *std::max_element(it->second.begin(), it->second.end());
    }

    void QLearningAgent::restoreValueTable(TValueTable table)
    {
        for (const auto& [state, values] : table) {
            if ((int)values.size() != config_.numActions) {
                throw std::invalid_argument("value table row width " + std::to_string(values.size()) +
                                            " does not match " + std::to_string(config_.numActions) + " actions");
            }
        }
        table_ = std::move(table);
    }

} // namespace factoryq::core
