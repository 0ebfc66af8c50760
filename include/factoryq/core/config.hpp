#pragma once

#include "factoryq/core/data.hpp"

namespace factoryq::core {

    //--------------------------------------------------------------------------
    // Factory description
    //--------------------------------------------------------------------------
    struct TMachineType
    {
        std::string name;
        double baseMinutes = 6.0;   // minutes per unit at skill 1.0 (time = base / skill)
        double minMinutes = 1.0;    // physical lower bound of the unit time
    };

    struct TMachineSpec
    {
        std::string name;
        int type = 0;               // index into machineTypes
        int priority = 0;           // 0 = low, 1 = medium, 2 = high
    };

    struct TOperatorSpec
    {
        std::string name;
        std::vector<double> skills;         // skill in [0,1] per machine type
        std::vector<double> shiftCapacity;  // maximum busy minutes per shift
    };

    struct TDurationRange
    {
        double min = 0.0;           // minutes
        double max = 0.0;           // minutes (uniform in [min, max])
    };

    //--------------------------------------------------------------------------
    // Struct: TEncoderConfig
    // Description: Bucket cutoffs of the state encoder
    //--------------------------------------------------------------------------
    struct TEncoderConfig
    {
        std::array<double, 3> timeCutoffs{0.25, 0.50, 0.75};        // fractions of the day length
        std::array<double, 3> shortfallCutoffs{0.25, 0.50, 0.75};   // fractions of the daily target
        std::array<double, 2> skillCutoffs{0.3, 0.7};               // absolute skill values
    };

    //--------------------------------------------------------------------------
    // Struct: TRewardWeights
    // Description: Fixed weights of the reward model (all non-negative)
    //--------------------------------------------------------------------------
    struct TRewardWeights
    {
        double goodPart = 2.0;          // w1
        double highSkill = 1.0;         // w2
        double assign = 0.5;            // w3
        double idle = 1.0;              // w4
        double defect = 5.0;            // w5
        double illegal = 8.0;           // w6 (must exceed w5)
        double goalBonus = 80.0;        // w7
        double shortfall = 0.3;         // w8 per missing part
        double fatigue = 0.5;           // per unit of fatigue at completion
        double switchOperator = 0.5;    // new operator on a machine
        double milestone50 = 10.0;      // 50% of the target reached
        double milestone80 = 20.0;      // 80% of the target reached
        double skillScale = 0.0;        // medium skill completion, times the skill
        double lowSkill = 0.0;          // low skill completion, mismatch
        double slowProduction = 0.0;    // low skill completion, slow unit
        double overCapacity = 0.0;      // per unit of shift capacity overrun ratio
    };

    //--------------------------------------------------------------------------
    // Struct: TFactoryConfig
    // Description: Static configuration consumed by the environment
    //--------------------------------------------------------------------------
    struct TFactoryConfig
    {
        std::vector<TMachineType> machineTypes;
        std::vector<TMachineSpec> machines;
        std::vector<TOperatorSpec> operators;

        double dayLengthMinutes = 1440.0;
        int numShifts = 3;
        double minTickMinutes = 1.0;                // time advance when nothing is produced
        int dailyTarget = 90;

        double breakdownRatePerMinute = 0.001;      // failure hazard of an up machine
        double maintenanceProbability = 0.01;       // preventive maintenance per completed unit
        TDurationRange repairMinutes{60.0, 240.0};
        TDurationRange maintenanceMinutes{30.0, 90.0};

        double defectSkillOffset = 0.5;             // P(defect) = clamp(offset - skill, 0, 1)
        double fatigueThreshold = 0.8;              // share of capacity where fatigue starts
        double historyIntervalMinutes = 0.5;        // minimum spacing of periodic snapshots

        TEncoderConfig encoder;
        TRewardWeights weights;

        int numMachines() const { return static_cast<int>(machines.size()); }
        int numOperators() const { return static_cast<int>(operators.size()); }
        int numActions() const { return numOperators() + 1; }

        double skill(int op, int machine) const
        {
            return operators[op].skills[machines[machine].type];
        }

        double capacity(int op, int shift) const
        {
            return operators[op].shiftCapacity[shift];
        }
    };

    //--------------------------------------------------------------------------
    // Schedules
    //--------------------------------------------------------------------------
    enum class DecayType
    {
        LINEAR = 0,     // start -> floor
        TWO_PHASE = 1,  // start -> mid over the first split of the horizon, then mid -> floor
        COSINE = 2      // floor + 0.5 (start - floor)(1 + cos(pi i / horizon))
    };

    static const std::map<std::string, DecayType> DecayTable = {
        {"linear",    DecayType::LINEAR},
        {"two_phase", DecayType::TWO_PHASE},
        {"cosine",    DecayType::COSINE}
    };

    struct TScheduleConfig
    {
        DecayType type = DecayType::LINEAR;
        double start = 1.0;             // value at episode 0
        double end = 0.05;              // floor reached at the horizon
        int horizon = 500;              // episodes until the floor
        double mid = 0.3;               // TWO_PHASE: value at the split point
        double split = 0.3;             // TWO_PHASE: share of the horizon of the first phase
    };

    //--------------------------------------------------------------------------
    // Struct: TAgentConfig
    // Description: Static configuration consumed by the Q-learning agent
    //--------------------------------------------------------------------------
    struct TAgentConfig
    {
        int numActions = 0;             // numOperators + 1
        double gamma = 0.99;            // discount factor
        TScheduleConfig epsilon{DecayType::TWO_PHASE, 1.0, 0.05, 9999, 0.3, 0.3};
        TScheduleConfig alpha{DecayType::LINEAR, 0.1, 0.01, 9999, 0.0, 0.0};
        unsigned int seed = 0;          // exploration random engine
    };

    //--------------------------------------------------------------------------
    // Struct: TScenario
    // Description: Everything read from a scenario file
    //--------------------------------------------------------------------------
    struct TScenario
    {
        TFactoryConfig factory;
        TAgentConfig agent;
        TRunData run;
    };

    /**
     * Method: ValidateFactoryConfig
     * Description: Throw std::invalid_argument if the factory configuration is unusable
     */
    void ValidateFactoryConfig(const TFactoryConfig& config);

    /**
     * Method: ValidateAgentConfig
     * Description: Throw std::invalid_argument if the agent configuration is unusable
     */
    void ValidateAgentConfig(const TAgentConfig& config);

    /**
     * Method: DemoFactoryConfig
     * Description: 4 machines, 6 operators, 3 shifts of 480 minutes, target 90 parts
     */
    TFactoryConfig DemoFactoryConfig();

    /**
     * Method: LoadScenarioYaml
     * Description: Read a scenario (factory, agent and run sections) from a YAML file.
     * Missing keys keep their defaults; the result is validated before returning.
     */
    TScenario LoadScenarioYaml(const std::string& path);

} // namespace factoryq::core
