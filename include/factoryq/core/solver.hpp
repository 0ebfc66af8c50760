/**
 * FactoryQ - Command line driver
 * Training, evaluation and test runs of the operator assignment agent
 */

#pragma once

#include "factoryq/core/data.hpp"
#include "factoryq/core/config.hpp"
#include "factoryq/core/method.hpp"


namespace factoryq {

    /**
    * @brief Main driver class - parses the command line, loads the scenario and runs a mode
    */
    class FactoryQSolver {
    public:
        // -------------------------------------------------------------------------
        // PUBLIC INTERFACE
        // -------------------------------------------------------------------------

        // 0 = ready to run, > 0 = exit code of a parse or load failure, -1 = help printed
        int init(int argc, char* argv[]);
        int run();

        // -------------------------------------------------------------------------
        // ACCESSORS
        // -------------------------------------------------------------------------
        const core::TScenario& getScenario() const { return scenario_; }
        const std::string& getMode() const { return mode_; }

    private:
        void applyOverrides();
        void train();
        void evaluate(bool testMode);
        std::string outputPath(const std::string& file) const;

        // -------------------------------------------------------------------------
        // MEMBER VARIABLES
        // -------------------------------------------------------------------------
        std::string mode_;
        std::string configPath_;
        std::string tablePath_;
        std::string outputDir_ = ".";
        int episodesArg_ = 0;           // 0 = keep the scenario value
        long seedArg_ = -1;             // -1 = keep the scenario value
        bool debug_ = false;

        core::TScenario scenario_;
    };

} // namespace factoryq
