#pragma once

#include "factoryq/core/common.hpp"

namespace factoryq::core {

    //--------------------------------------------------------------------------
    // Enum: MachineStatus
    // Description: Status of a machine; the numeric value is the code used in the decision state
    //--------------------------------------------------------------------------
    enum class MachineStatus : std::uint8_t
    {
        IDLE = 0,
        BUSY = 1,
        BROKEN = 2,
        MAINTENANCE = 3
    };

    inline const char* ToString(MachineStatus status)
    {
        switch (status)
        {
            case MachineStatus::IDLE:        return "idle";
            case MachineStatus::BUSY:        return "busy";
            case MachineStatus::BROKEN:      return "broken";
            case MachineStatus::MAINTENANCE: return "maintenance";
        }
        return "unknown";
    }

    //--------------------------------------------------------------------------
    // Enum: IllegalReason
    // Description: Why an action was replaced by the idle action
    //--------------------------------------------------------------------------
    enum class IllegalReason
    {
        NONE = 0,
        OUT_OF_RANGE,       // action index outside [0, numOperators]
        NO_MACHINE,         // no machine is awaiting assignment
        MACHINE_NOT_IDLE,   // awaiting machine is busy, broken or under maintenance
        OPERATOR_BUSY,      // operator already bound to a machine
        OVER_CAPACITY       // operator has no capacity left in the current shift
    };

    inline const char* ToString(IllegalReason reason)
    {
        switch (reason)
        {
            case IllegalReason::NONE:             return "none";
            case IllegalReason::OUT_OF_RANGE:     return "out_of_range";
            case IllegalReason::NO_MACHINE:       return "no_machine";
            case IllegalReason::MACHINE_NOT_IDLE: return "machine_not_idle";
            case IllegalReason::OPERATOR_BUSY:    return "operator_busy";
            case IllegalReason::OVER_CAPACITY:    return "over_capacity";
        }
        return "unknown";
    }

    //--------------------------------------------------------------------------
    // Struct: TMachine
    // Description: A machine on the floor and its production/down-time status
    //--------------------------------------------------------------------------
    struct TMachine
    {
        int id = 0;                                 // index in the fixed machine set
        std::string name;                           // display name
        int type = 0;                               // index into the machine types
        int priority = 0;                           // 0 = low, 1 = medium, 2 = high
        MachineStatus status = MachineStatus::IDLE;
        int operatorId = -1;                        // bound operator (-1 = none)
        double remaining = 0.0;                     // minutes left on the unit in production
        double downUntil = 0.0;                     // end of the current broken/maintenance phase
        int lastOperatorId = -1;                    // last operator that worked this machine

        bool isUp() const { return status == MachineStatus::IDLE || status == MachineStatus::BUSY; }
    };

    //--------------------------------------------------------------------------
    // Struct: TOperator
    // Description: An operator, its binding and its busy time per shift
    //--------------------------------------------------------------------------
    struct TOperator
    {
        int id = 0;                                 // index in the fixed operator set
        std::string name;                           // display name
        int machineId = -1;                         // bound machine (-1 = free)
        std::vector<double> busyMinutes;            // accumulated busy minutes per shift
        double fatigue = 0.0;                       // last computed fatigue level in [0,1]

        bool isFree() const { return machineId < 0; }
    };

    //--------------------------------------------------------------------------
    // Struct: TShiftClock
    // Description: Single source of simulated time within a day
    //--------------------------------------------------------------------------
    struct TShiftClock
    {
        double elapsed = 0.0;       // minutes since the start of the day
        double dayLength = 0.0;     // fixed day length in minutes
        int numShifts = 1;          // shifts per day

        double shiftLength() const { return dayLength / numShifts; }

        int shiftIndex() const
        {
            int idx = static_cast<int>(std::floor(elapsed / shiftLength()));
            return std::clamp(idx, 0, numShifts - 1);
        }

        double remaining() const { return std::max(0.0, dayLength - elapsed); }

        bool dayOver() const { return elapsed >= dayLength; }

        void reset() { elapsed = 0.0; }
    };

    //--------------------------------------------------------------------------
    // Struct: TProductionTarget
    // Description: Daily goal and the running totals of the episode
    //--------------------------------------------------------------------------
    struct TProductionTarget
    {
        int daily = 0;              // good parts expected per day
        int good = 0;               // good parts produced so far
        int defective = 0;          // defective parts produced so far
        bool reached50 = false;     // 50% milestone already paid
        bool reached80 = false;     // 80% milestone already paid

        int shortfall() const { return std::max(0, daily - good); }

        void reset()
        {
            good = 0;
            defective = 0;
            reached50 = false;
            reached80 = false;
        }
    };

    //--------------------------------------------------------------------------
    // Struct: TObservation
    // Description: Raw (continuous) view of the floor handed to the state encoder
    //--------------------------------------------------------------------------
    struct TObservation
    {
        int awaitingMachine = -1;                   // -1 when no machine awaits assignment
        int awaitingPriority = 0;
        int shiftIndex = 0;
        double timeRemaining = 0.0;                 // minutes left in the day
        int shortfall = 0;                          // good parts still missing
        std::vector<bool> eligible;                 // operator free and below capacity
        std::vector<double> skillOnAwaiting;        // skill of each operator on the awaiting machine
        std::vector<MachineStatus> machineStatus;
    };

    //--------------------------------------------------------------------------
    // Struct: TDecisionState
    // Description: Discretized key of the value table
    //--------------------------------------------------------------------------
    struct TDecisionState
    {
        int machineId = 0;                          // awaiting machine (numMachines = none)
        int priority = 0;                           // priority class of the awaiting machine
        int shift = 0;                              // shift index
        int timeBucket = 0;                         // time remaining bucket (0..3)
        int shortfallBucket = 0;                    // production shortfall bucket (0..3)
        std::vector<std::uint8_t> available;        // per-operator availability bit
        std::vector<std::uint8_t> skillBuckets;     // per-operator skill bucket for the awaiting machine
        std::vector<std::uint8_t> machineStatus;    // per-machine status code

        bool operator==(const TDecisionState& other) const = default;
    };

    struct TDecisionStateHash
    {
        std::size_t operator()(const TDecisionState& s) const
        {
            std::size_t seed = 0;
            auto combine = [&seed](std::size_t v) {
                seed ^= v + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
            };

            combine(std::hash<int>{}(s.machineId));
            combine(std::hash<int>{}(s.priority));
            combine(std::hash<int>{}(s.shift));
            combine(std::hash<int>{}(s.timeBucket));
            combine(std::hash<int>{}(s.shortfallBucket));
            for (auto v : s.available)     combine(v);
            for (auto v : s.skillBuckets)  combine(v + 0x10);
            for (auto v : s.machineStatus) combine(v + 0x20);
            return seed;
        }
    };

    // state -> one value per action
    using TValueTable = std::unordered_map<TDecisionState, std::vector<double>, TDecisionStateHash>;

    //--------------------------------------------------------------------------
    // Struct: TRewardBreakdown
    // Description: Additive components of the reward of one step
    //--------------------------------------------------------------------------
    struct TRewardBreakdown
    {
        double goodParts = 0.0;     // +w1 per good part
        double highSkill = 0.0;     // +w2 high skill assignment
        double assign = 0.0;        // +w3 assignment instead of idle
        double idle = 0.0;          // -w4 idle with an eligible operator free
        double defects = 0.0;       // -w5 per defective part
        double illegal = 0.0;       // -w6 illegal action substituted
        double terminal = 0.0;      // +w7 scaled bonus / -w8 per missing part
        double fatigue = 0.0;       // fatigue penalty
        double switching = 0.0;     // operator switch penalty
        double milestones = 0.0;    // 50% / 80% milestone bonuses
        double skillMatch = 0.0;    // medium skill bonus / low skill penalties at completion
        double overCapacity = 0.0;  // shift capacity overrun penalty

        double total() const
        {
            return goodParts + highSkill + assign + idle + defects + illegal
                 + terminal + fatigue + switching + milestones + skillMatch + overCapacity;
        }
    };

    //--------------------------------------------------------------------------
    // Struct: TStepInfo
    // Description: Auxiliary data returned by step() for logging
    //--------------------------------------------------------------------------
    struct TStepInfo
    {
        int goodParts = 0;                          // running total of good parts
        int defectiveParts = 0;                     // running total of defective parts
        double time = 0.0;                          // elapsed minutes after the step
        int shift = 0;                              // shift index after the step
        bool illegal = false;                       // action replaced by idle
        IllegalReason illegalReason = IllegalReason::NONE;
        int assignedOperator = -1;                  // operator bound by this step (-1 = none)
        int completions = 0;                        // units finished in this step
        int breakdowns = 0;                         // failures injected in this step
        int maintenances = 0;                       // preventive maintenances started in this step
        bool afterTerminal = false;                 // step() called on a finished episode
        TRewardBreakdown reward;
    };

    //--------------------------------------------------------------------------
    // Struct: TStepResult
    // Description: Outcome of environment.step(action)
    //--------------------------------------------------------------------------
    struct TStepResult
    {
        TDecisionState state;
        double reward = 0.0;
        bool terminal = false;
        TStepInfo info;
    };

    //--------------------------------------------------------------------------
    // Struct: TSnapshot
    // Description: One frame of the recorded episode history
    //--------------------------------------------------------------------------
    struct TSnapshot
    {
        double time = 0.0;
        int shift = 0;
        std::vector<int> machineOperator;           // bound operator per machine (-1 = none)
        std::vector<double> operatorSkill;          // skill of the bound operator (-1 = none)
        std::vector<MachineStatus> machineStatus;
        int goodParts = 0;
        int episode = 0;                            // filled by the driver (1-based)
    };

    //--------------------------------------------------------------------------
    // Struct: TEpisodeStats
    // Description: Summary of one finished episode
    //--------------------------------------------------------------------------
    struct TEpisodeStats
    {
        double totalReturn = 0.0;
        int goodParts = 0;
        int defectiveParts = 0;
        int steps = 0;
        double finalTime = 0.0;
    };

    //--------------------------------------------------------------------------
    // Struct: TEvalSummary
    // Description: Aggregate of a batch of greedy episodes
    //--------------------------------------------------------------------------
    struct TEvalSummary
    {
        int episodes = 0;
        int dailyTarget = 0;
        double meanReturn = 0.0;
        double stdReturn = 0.0;
        double medianReturn = 0.0;
        double meanGood = 0.0;
        double stdGood = 0.0;
        double medianGood = 0.0;
        int minGood = 0;
        int maxGood = 0;
        double targetRate = 0.0;                    // share of episodes with good >= target
        std::array<int, 4> categories{};            // excellent, good, acceptable, poor
    };

    //--------------------------------------------------------------------------
    // Struct: TRunData
    // Description: Configuration variables of the training / evaluation process
    //--------------------------------------------------------------------------
    struct TRunData
    {
        int episodes = 10000;                       // training episodes
        int evalEpisodes = 100;                     // greedy episodes for eval/test
        int historyEvery = 100;                     // record history every k-th training episode (0 = never)
        int maxSteps = 10000;                       // safety cap on steps per test episode
        int debug = 0;                              // 1 - print per-episode details
        unsigned int seed = 42;                     // base seed of environments and agent
    };

} // namespace factoryq::core
