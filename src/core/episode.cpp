#include "factoryq/core/episode.hpp"

namespace factoryq::core {

    namespace {

        void CloseStats(const IEnvironment& env, TEpisodeStats& stats)
        {
            stats.goodParts = env.getProduction().good;
            stats.defectiveParts = env.getProduction().defective;
            stats.finalTime = env.getTime();
        }

    } // namespace

    TEpisodeStats TrainEpisode(IEnvironment& env, QLearningAgent& agent, int episode,
                               int maxSteps, bool recordHistory)
    {
        TEpisodeStats stats;
        agent.beginEpisode(episode);

        TDecisionState state = env.reset(recordHistory);
        bool terminal = false;

        while (!terminal && stats.steps < maxSteps)
        {
            int action = agent.selectAction(state);
            TStepResult result = env.step(action);

            agent.update(state, action, result.reward, result.state, result.terminal);

            stats.totalReturn += result.reward;
            stats.steps++;
            state = result.state;
            terminal = result.terminal;
        }

        CloseStats(env, stats);
        return stats;
    }

    TEpisodeStats GreedyEpisode(IEnvironment& env, const QLearningAgent& agent,
                                int maxSteps, bool recordHistory)
    {
        TEpisodeStats stats;

        TDecisionState state = env.reset(recordHistory);
        bool terminal = false;

        while (!terminal && stats.steps < maxSteps)
        {
            TStepResult result = env.step(agent.greedyAction(state));
            stats.totalReturn += result.reward;
            stats.steps++;
            state = result.state;
            terminal = result.terminal;
        }

        CloseStats(env, stats);
        return stats;
    }

    std::vector<TEpisodeStats> EvaluateGreedy(const TFactoryConfig& config, const QLearningAgent& agent,
                                              int episodes, unsigned int seed, int maxSteps)
    {
        // reject a bad configuration here, not inside the parallel region
        ValidateFactoryConfig(config);

        std::vector<TEpisodeStats> results(std::max(0, episodes));

        // the agent is only read through greedyAction(), so the table needs no lock
        #pragma omp parallel for schedule(dynamic)
        for (int i = 0; i < episodes; i++)
        {
            std::unique_ptr<IEnvironment> env = createEnvironment(config, seed + i);
            results[i] = GreedyEpisode(*env, agent, maxSteps);
        }

        return results;
    }

} // namespace factoryq::core
