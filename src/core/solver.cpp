#include "factoryq/core/solver.hpp"
#include "factoryq/core/environment.hpp"
#include "factoryq/core/episode.hpp"
#include "factoryq/core/qlearning.hpp"
#include "factoryq/utils/io.hpp"

// CLI11 e OpenMP
#include <CLI/CLI.hpp>
#include <omp.h>

namespace factoryq {

    int FactoryQSolver::init(int argc, char* argv[]) {
        CLI::App app{"FactoryQ - Q-learning operator assignment on a simulated factory floor"};
        app.require_subcommand(1);

        CLI::App* train = app.add_subcommand("train", "Train the agent and save its value table");
        CLI::App* eval = app.add_subcommand("eval", "Greedy evaluation of a saved value table");
        CLI::App* test = app.add_subcommand("test", "Evaluation with median and performance categories");

        for (CLI::App* sub : {train, eval, test}) {
            sub->add_option("-c,--config", configPath_, "Path to scenario file (YAML)")->required()->check(CLI::ExistingFile);
            sub->add_option("-e,--episodes", episodesArg_, "Training episodes (overrides run.episodes)")->check(CLI::PositiveNumber);
            sub->add_option("-s,--seed", seedArg_, "Base seed (overrides run.seed)")->check(CLI::NonNegativeNumber);
            sub->add_option("-q,--qtable", tablePath_, "Value table file (default: <outdir>/qtable.txt)");
            sub->add_option("-o,--outdir", outputDir_, "Output folder")->check(CLI::ExistingDirectory);
            sub->add_flag("--debug", debug_, "Print per-episode details");
        }

        try {
            app.parse(argc, argv);
            mode_ = app.get_subcommands().front()->get_name();

            scenario_ = core::LoadScenarioYaml(configPath_);
            applyOverrides();
            return 0;
        } catch (const CLI::ParseError &e) {
            int code = app.exit(e);
            return (code == 0) ? -1 : code;
        } catch (const std::exception &e) {
            std::cerr << "Initialization Error: " << e.what() << std::endl;
            return 1;
        }
    }

    void FactoryQSolver::applyOverrides() {
        core::TRunData& runData = scenario_.run;
        core::TAgentConfig& agent = scenario_.agent;

        if (episodesArg_ > 0) {
            // horizons that followed the run length keep following it
            int oldHorizon = std::max(1, runData.episodes - 1);
            int newHorizon = std::max(1, episodesArg_ - 1);
            if (agent.epsilon.horizon == oldHorizon) agent.epsilon.horizon = newHorizon;
            if (agent.alpha.horizon == oldHorizon) agent.alpha.horizon = newHorizon;
            runData.episodes = episodesArg_;
        }

        if (seedArg_ >= 0) {
            runData.seed = (unsigned int)seedArg_;
            agent.seed = (unsigned int)seedArg_;
        }

        if (debug_) runData.debug = 1;
        if (tablePath_.empty()) tablePath_ = outputPath("qtable.txt");
    }

    std::string FactoryQSolver::outputPath(const std::string& file) const {
        return outputDir_ + "/" + file;
    }

    int FactoryQSolver::run() {
        try {
            if (mode_ == "train") train();
            else evaluate(mode_ == "test");
            return 0;
        } catch (const std::exception &e) {
            std::cerr << "\nError: " << e.what() << std::endl;
            return 1;
        }
    }

    // -----------------------------------------------------------------------------
    // Training
    // -----------------------------------------------------------------------------

    void FactoryQSolver::train() {
        const core::TRunData& runData = scenario_.run;
        const core::TFactoryConfig& factory = scenario_.factory;

        std::unique_ptr<core::IEnvironment> env = core::createEnvironment(factory, runData.seed);
        core::QLearningAgent agent(scenario_.agent);

        std::cout << "Scenario: " << configPath_
                  << "\nMachines: " << factory.numMachines()
                  << " | Operators: " << factory.numOperators()
                  << " | Target: " << factory.dailyTarget
                  << " | Episodes: " << runData.episodes << "\n" << std::endl;

        std::vector<double> returns;
        std::vector<int> productions;
        std::vector<core::TSnapshot> bestHistory;
        int bestGood = -1;
        int bestEpisode = 0;

        double start_time = core::get_time_in_seconds();

        for (int ep = 0; ep < runData.episodes; ep++)
        {
            bool record = runData.historyEvery > 0 && (ep + 1) % runData.historyEvery == 0;
            core::TEpisodeStats stats = core::TrainEpisode(*env, agent, ep, runData.maxSteps, record);

            returns.push_back(stats.totalReturn);
            productions.push_back(stats.goodParts);

            // keep the most productive recorded day
            if (record && stats.goodParts > bestGood) {
                bestGood = stats.goodParts;
                bestEpisode = ep + 1;
                bestHistory = env->getHistory();
                for (auto& snap : bestHistory) snap.episode = bestEpisode;
            }

            if (runData.debug) {
                std::cout << std::format("Episode {}: return {:.2f}, good {}, defective {}, steps {}",
                                         ep + 1, stats.totalReturn, stats.goodParts,
                                         stats.defectiveParts, stats.steps) << std::endl;
            }

            if ((ep + 1) % 100 == 0) {
                int from = std::max(0, ep + 1 - 100);
                std::vector<double> lastReturns(returns.begin() + from, returns.end());
                std::vector<double> lastGood(productions.begin() + from, productions.end());

                std::cout << std::format("Episode {:6} | return {:8.1f} | good {:4} | avg return {:8.1f}"
                                         " | avg good {:6.1f} | eps {:.3f} | states {}",
                                         ep + 1, stats.totalReturn, stats.goodParts, core::Mean(lastReturns),
                                         core::Mean(lastGood), agent.epsilon(), agent.valueTable().size())
                          << std::endl;
            }
        }

        double end_time = core::get_time_in_seconds();

        utils::SaveValueTable(tablePath_, agent.valueTable(), agent.numActions());
        utils::WriteTrainingCurves(outputPath("returns.csv"), returns, productions);
        if (!bestHistory.empty()) {
            utils::WriteTimeline(outputPath("best_episode.csv"), bestHistory, factory);
        }

        std::cout << "\n=== TRAINING FINISHED ===\n";
        std::cout << "States visited: " << agent.valueTable().size() << "\n";
        std::cout << std::format("Final epsilon: {:.3f}\n", agent.epsilon());
        if (bestEpisode > 0) {
            std::cout << "Best recorded episode: " << bestEpisode << " (" << bestGood << " good parts)\n";
        }
        std::cout << "Value table: " << tablePath_ << "\n";
        std::cout << std::format("Total time: {:.3f}", end_time - start_time) << std::endl;

        if (runData.debug) core::PrintPolicy(agent.valueTable(), 20);
    }

    // -----------------------------------------------------------------------------
    // Evaluation / test
    // -----------------------------------------------------------------------------

    void FactoryQSolver::evaluate(bool testMode) {
        const core::TRunData& runData = scenario_.run;
        const core::TFactoryConfig& factory = scenario_.factory;

        core::QLearningAgent agent(scenario_.agent);
        agent.restoreValueTable(utils::LoadValueTable(tablePath_, factory.numMachines(), factory.numOperators()));

        std::cout << "Value table: " << tablePath_ << " (" << agent.valueTable().size() << " states)"
                  << "\nThreads: " << omp_get_max_threads() << std::endl;

        // test mode caps runaway episodes; eval relies on the day ending
        int maxSteps = testMode ? runData.maxSteps : std::numeric_limits<int>::max();

        double start_time = core::get_time_in_seconds();
        std::vector<core::TEpisodeStats> stats =
            core::EvaluateGreedy(factory, agent, runData.evalEpisodes, runData.seed, maxSteps);
        double end_time = core::get_time_in_seconds();

        if (runData.debug) {
            for (int i = 0; i < (int)stats.size(); i++) {
                std::cout << std::format("Episode {}: return {:.2f}, good {}, steps {}",
                                         i + 1, stats[i].totalReturn, stats[i].goodParts, stats[i].steps)
                          << std::endl;
            }
        }

        core::TEvalSummary summary = utils::Summarize(stats, factory.dailyTarget);
        utils::WriteEvaluationScreen(testMode ? "Test" : "Evaluation", summary, testMode,
                                     (float)(end_time - start_time));

        // timeline of the first evaluation day
        core::FactoryEnv env(factory, runData.seed);
        core::GreedyEpisode(env, agent, maxSteps, true);
        std::vector<core::TSnapshot> history = env.getHistory();
        for (auto& snap : history) snap.episode = 1;
        utils::WriteTimeline(outputPath(testMode ? "test_timeline.csv" : "eval_timeline.csv"), history, factory);
    }

} // namespace factoryq
