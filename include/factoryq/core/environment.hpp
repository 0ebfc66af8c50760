#pragma once

#include "factoryq/core/ienvironment.hpp"
#include "factoryq/core/reward.hpp"

namespace factoryq::core {

    /**
     * @brief Event-driven simulation of one production day.
     *
     * Owns simulated time, machine and operator status and production outcomes.
     * Every random draw (failures, down-phase durations, preventive maintenance,
     * defects) comes from the engine of the instance.
     */
    class FactoryEnv : public IEnvironment {
        public:
            FactoryEnv(const TFactoryConfig& config, unsigned int seed);

            TDecisionState reset(bool recordHistory = false) override;
            TStepResult step(int action) override;

            int getNumActions() const override { return config_.numActions(); }
            const TProductionTarget& getProduction() const override { return target_; }
            double getTime() const override { return clock_.elapsed; }
            const std::vector<TSnapshot>& getHistory() const override { return history_; }

            void reseed(unsigned int seed) { rng_.seed(seed); }

            // Raw view of the floor and its encoded key
            TObservation observe() const;
            TDecisionState state() const;

            const TFactoryConfig& getConfig() const { return config_; }
            const std::vector<TMachine>& getMachines() const { return machines_; }
            const std::vector<TOperator>& getOperators() const { return operators_; }
            const TShiftClock& getClock() const { return clock_; }
            int getAwaitingMachine() const { return awaitingMachine_; }
            bool isTerminal() const { return terminal_; }

            // Free and below its capacity for the current shift
            bool isEligible(int op) const;

            double processMinutes(int op, int machine) const;
            double defectProbability(int op, int machine) const;

        private:
            int selectAwaitingMachine() const;
            bool hasEligibleOperator() const;
            bool decisionAvailable() const;
            IllegalReason checkAssignment(int op) const;

            void bind(int op, int machine);
            void release(int machine);

            double nextEventDelta() const;
            void advanceOneEvent(TTransition& tr, TStepInfo& info);
            void completeUnit(int machine, int shift, TTransition& tr, TStepInfo& info);
            void injectFailures(const std::vector<int>& upMachines, double dt, TStepInfo& info);
            void progressDownPhases();
            double drawDuration(const TDurationRange& range);
            double computeFatigue(int op, int shift) const;

            void recordSnapshot();

            TFactoryConfig config_;
            std::mt19937 rng_;

            std::vector<TMachine> machines_;
            std::vector<TOperator> operators_;
            TShiftClock clock_;
            TProductionTarget target_;

            int awaitingMachine_ = -1;
            bool terminal_ = false;

            bool recordHistory_ = false;
            double lastSnapshotTime_ = 0.0;
            std::vector<TSnapshot> history_;
        };

} // namespace factoryq::core
