#pragma once
#include "factoryq/core/data.hpp"
#include "factoryq/core/config.hpp"

namespace factoryq::core {

    // Abstract episodic environment driven by the episode loop
    class IEnvironment {
        public:
            virtual ~IEnvironment() = default;

            // Start a new episode; returns the initial decision state
            virtual TDecisionState reset(bool recordHistory = false) = 0;

            // Apply an action index in [0, getNumActions()); never throws for bad actions
            virtual TStepResult step(int action) = 0;

            virtual int getNumActions() const = 0;

            virtual const TProductionTarget& getProduction() const = 0;

            virtual double getTime() const = 0;

            virtual const std::vector<TSnapshot>& getHistory() const = 0;
        };

    // Factory of the simulated factory floor; throws std::invalid_argument on a bad config
    std::unique_ptr<IEnvironment> createEnvironment(const TFactoryConfig& config, unsigned int seed);

}
