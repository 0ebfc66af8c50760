#include "factoryq/core/config.hpp"

#include <yaml-cpp/yaml.h>

namespace factoryq::core {

    namespace {

        void Require(bool condition, const std::string& message)
        {
            if (!condition) throw std::invalid_argument(message);
        }

        bool InUnitRange(double v) { return v >= 0.0 && v <= 1.0; }

        template <std::size_t N>
        bool StrictlyIncreasing(const std::array<double, N>& values)
        {
            for (std::size_t i = 1; i < N; i++) {
                if (!(values[i - 1] < values[i])) return false;
            }
            return true;
        }

        void ValidateSchedule(const TScheduleConfig& s, const std::string& name)
        {
            Require(s.end >= 0.0, name + ": floor must be non-negative");
            Require(s.start >= s.end, name + ": start must not be below the floor");
            Require(s.start <= 1.0, name + ": start must be at most 1");
            Require(s.horizon >= 1, name + ": decay horizon must be at least one episode");
            if (s.type == DecayType::TWO_PHASE) {
                Require(s.split > 0.0 && s.split < 1.0, name + ": split must be in (0,1)");
                Require(s.mid >= s.end && s.mid <= s.start, name + ": mid value must lie between floor and start");
            }
        }

        // ---------------------------------------------------------------------
        // YAML helpers
        // ---------------------------------------------------------------------
        template <typename T>
        void ReadIf(const YAML::Node& node, const char* key, T& out)
        {
            if (node && node[key]) out = node[key].as<T>();
        }

        template <std::size_t N>
        void ReadArrayIf(const YAML::Node& node, const char* key, std::array<double, N>& out)
        {
            if (!node || !node[key]) return;
            std::vector<double> values = node[key].as<std::vector<double>>();
            if (values.size() != N) {
                throw std::invalid_argument(std::string(key) + ": expected " + std::to_string(N) + " values");
            }
            std::copy(values.begin(), values.end(), out.begin());
        }

        void ReadRangeIf(const YAML::Node& node, const char* key, TDurationRange& out)
        {
            if (!node || !node[key]) return;
            std::vector<double> values = node[key].as<std::vector<double>>();
            if (values.size() != 2) {
                throw std::invalid_argument(std::string(key) + ": expected [min, max]");
            }
            out.min = values[0];
            out.max = values[1];
        }

        int ResolveMachineType(const YAML::Node& node, const std::vector<TMachineType>& types)
        {
            std::string token = node.as<std::string>();
            bool numeric = !token.empty() &&
                std::all_of(token.begin(), token.end(), [](unsigned char c) { return std::isdigit(c); });
            if (numeric) {
                int type = 0;
                const char* last = token.data() + token.size();
                auto [ptr, ec] = std::from_chars(token.data(), last, type);
                if (ec != std::errc() || ptr != last) {
                    throw std::invalid_argument("machine type index '" + token + "' out of range");
                }
                return type;
            }

            for (int t = 0; t < (int)types.size(); t++) {
                if (types[t].name == token) return t;
            }
            throw std::invalid_argument("unknown machine type '" + token + "'");
        }

        void ReadSchedule(const YAML::Node& node, TScheduleConfig& s, bool& hasHorizon)
        {
            if (!node) return;

            if (node["decay"]) {
                std::string decay = node["decay"].as<std::string>();
                auto it = DecayTable.find(decay);
                if (it == DecayTable.end()) {
                    throw std::invalid_argument("unknown decay type '" + decay + "'");
                }
                s.type = it->second;
            }
            ReadIf(node, "start", s.start);
            ReadIf(node, "end", s.end);
            ReadIf(node, "mid", s.mid);
            ReadIf(node, "split", s.split);
            if (node["horizon"]) {
                s.horizon = node["horizon"].as<int>();
                hasHorizon = true;
            }
        }

        void ReadFactory(const YAML::Node& node, TFactoryConfig& f)
        {
            if (!node) return;

            ReadIf(node, "day_length_minutes", f.dayLengthMinutes);
            ReadIf(node, "num_shifts", f.numShifts);
            ReadIf(node, "min_tick_minutes", f.minTickMinutes);
            ReadIf(node, "daily_target", f.dailyTarget);

            if (node["machine_types"]) {
                f.machineTypes.clear();
                for (const auto& t : node["machine_types"]) {
                    TMachineType type;
                    ReadIf(t, "name", type.name);
                    ReadIf(t, "base_minutes", type.baseMinutes);
                    ReadIf(t, "min_minutes", type.minMinutes);
                    f.machineTypes.push_back(type);
                }
            }

            if (node["machines"]) {
                f.machines.clear();
                for (const auto& m : node["machines"]) {
                    TMachineSpec machine;
                    ReadIf(m, "name", machine.name);
                    if (m["type"]) machine.type = ResolveMachineType(m["type"], f.machineTypes);
                    ReadIf(m, "priority", machine.priority);
                    if (machine.name.empty()) machine.name = "M" + std::to_string(f.machines.size());
                    f.machines.push_back(machine);
                }
            }

            if (node["operators"]) {
                f.operators.clear();
                for (const auto& o : node["operators"]) {
                    TOperatorSpec op;
                    ReadIf(o, "name", op.name);
                    ReadIf(o, "skills", op.skills);
                    ReadIf(o, "shift_capacity_minutes", op.shiftCapacity);
                    if (op.name.empty()) op.name = "O" + std::to_string(f.operators.size());
                    f.operators.push_back(op);
                }
            }

            const YAML::Node& dyn = node["dynamics"];
            ReadIf(dyn, "breakdown_rate_per_minute", f.breakdownRatePerMinute);
            ReadIf(dyn, "maintenance_probability", f.maintenanceProbability);
            ReadRangeIf(dyn, "repair_minutes", f.repairMinutes);
            ReadRangeIf(dyn, "maintenance_minutes", f.maintenanceMinutes);
            ReadIf(dyn, "defect_skill_offset", f.defectSkillOffset);
            ReadIf(dyn, "fatigue_threshold", f.fatigueThreshold);
            ReadIf(dyn, "history_interval_minutes", f.historyIntervalMinutes);

            const YAML::Node& enc = node["encoder"];
            ReadArrayIf(enc, "time_cutoffs", f.encoder.timeCutoffs);
            ReadArrayIf(enc, "shortfall_cutoffs", f.encoder.shortfallCutoffs);
            ReadArrayIf(enc, "skill_cutoffs", f.encoder.skillCutoffs);

            const YAML::Node& w = node["reward"];
            ReadIf(w, "good_part", f.weights.goodPart);
            ReadIf(w, "high_skill", f.weights.highSkill);
            ReadIf(w, "assign", f.weights.assign);
            ReadIf(w, "idle", f.weights.idle);
            ReadIf(w, "defect", f.weights.defect);
            ReadIf(w, "illegal", f.weights.illegal);
            ReadIf(w, "goal_bonus", f.weights.goalBonus);
            ReadIf(w, "shortfall", f.weights.shortfall);
            ReadIf(w, "fatigue", f.weights.fatigue);
            ReadIf(w, "switch_operator", f.weights.switchOperator);
            ReadIf(w, "milestone_50", f.weights.milestone50);
            ReadIf(w, "milestone_80", f.weights.milestone80);
            ReadIf(w, "skill_scale", f.weights.skillScale);
            ReadIf(w, "low_skill", f.weights.lowSkill);
            ReadIf(w, "slow_production", f.weights.slowProduction);
            ReadIf(w, "over_capacity", f.weights.overCapacity);
        }

        void ReadRun(const YAML::Node& node, TRunData& run)
        {
            if (!node) return;
            ReadIf(node, "episodes", run.episodes);
            ReadIf(node, "eval_episodes", run.evalEpisodes);
            ReadIf(node, "history_every", run.historyEvery);
            ReadIf(node, "max_steps", run.maxSteps);
            ReadIf(node, "debug", run.debug);
            ReadIf(node, "seed", run.seed);
        }

    } // namespace

    // -----------------------------------------------------------------------------
    // Validation
    // -----------------------------------------------------------------------------

    void ValidateFactoryConfig(const TFactoryConfig& f)
    {
        Require(!f.machineTypes.empty(), "at least one machine type is required");
        Require(!f.machines.empty(), "at least one machine is required");
        Require(!f.operators.empty(), "at least one operator is required");
        Require(f.dayLengthMinutes > 0.0, "day length must be positive");
        Require(f.numShifts >= 1, "shift count must be at least 1");
        Require(f.minTickMinutes > 0.0, "minimum tick must be positive");
        Require(f.dailyTarget >= 1, "daily target must be at least one part");

        for (const auto& t : f.machineTypes) {
            Require(t.baseMinutes > 0.0, "machine type '" + t.name + "': base minutes must be positive");
            Require(t.minMinutes >= 0.0, "machine type '" + t.name + "': minimum minutes must be non-negative");
        }

        for (const auto& m : f.machines) {
            Require(m.type >= 0 && m.type < (int)f.machineTypes.size(),
                    "machine '" + m.name + "': type index out of range");
            Require(m.priority >= 0 && m.priority <= 2, "machine '" + m.name + "': priority must be 0, 1 or 2");
        }

        for (const auto& o : f.operators) {
            Require(o.skills.size() == f.machineTypes.size(),
                    "operator '" + o.name + "': one skill per machine type is required");
            Require(std::all_of(o.skills.begin(), o.skills.end(), InUnitRange),
                    "operator '" + o.name + "': skills must be in [0,1]");
            Require((int)o.shiftCapacity.size() == f.numShifts,
                    "operator '" + o.name + "': one capacity per shift is required");
            Require(std::all_of(o.shiftCapacity.begin(), o.shiftCapacity.end(), [](double c) { return c >= 0.0; }),
                    "operator '" + o.name + "': capacities must be non-negative");
        }

        Require(InUnitRange(f.breakdownRatePerMinute), "breakdown rate must be in [0,1]");
        Require(InUnitRange(f.maintenanceProbability), "maintenance probability must be in [0,1]");
        Require(f.repairMinutes.min >= 0.0 && f.repairMinutes.min <= f.repairMinutes.max,
                "repair duration range must satisfy 0 <= min <= max");
        Require(f.maintenanceMinutes.min >= 0.0 && f.maintenanceMinutes.min <= f.maintenanceMinutes.max,
                "maintenance duration range must satisfy 0 <= min <= max");
        Require(InUnitRange(f.defectSkillOffset), "defect skill offset must be in [0,1]");
        Require(f.fatigueThreshold >= 0.0 && f.fatigueThreshold < 1.0, "fatigue threshold must be in [0,1)");
        Require(f.historyIntervalMinutes > 0.0, "history interval must be positive");

        Require(StrictlyIncreasing(f.encoder.timeCutoffs), "time cutoffs must be strictly increasing");
        Require(StrictlyIncreasing(f.encoder.shortfallCutoffs), "shortfall cutoffs must be strictly increasing");
        Require(StrictlyIncreasing(f.encoder.skillCutoffs), "skill cutoffs must be strictly increasing");
        Require(std::all_of(f.encoder.timeCutoffs.begin(), f.encoder.timeCutoffs.end(), InUnitRange),
                "time cutoffs must be fractions in [0,1]");
        Require(std::all_of(f.encoder.shortfallCutoffs.begin(), f.encoder.shortfallCutoffs.end(), InUnitRange),
                "shortfall cutoffs must be fractions in [0,1]");
        Require(std::all_of(f.encoder.skillCutoffs.begin(), f.encoder.skillCutoffs.end(), InUnitRange),
                "skill cutoffs must be in [0,1]");

        const TRewardWeights& w = f.weights;
        const std::array<double, 16> all = {w.goodPart, w.highSkill, w.assign, w.idle, w.defect, w.illegal,
                                            w.goalBonus, w.shortfall, w.fatigue, w.switchOperator,
                                            w.milestone50, w.milestone80, w.skillScale, w.lowSkill,
                                            w.slowProduction, w.overCapacity};
        Require(std::all_of(all.begin(), all.end(), [](double v) { return v >= 0.0; }),
                "reward weights must be non-negative");
        Require(w.illegal > w.defect, "illegal action penalty must exceed the defect penalty");
    }

    void ValidateAgentConfig(const TAgentConfig& a)
    {
        Require(a.numActions >= 1, "agent needs at least one action");
        Require(InUnitRange(a.gamma), "discount factor must be in [0,1]");
        ValidateSchedule(a.epsilon, "epsilon schedule");
        ValidateSchedule(a.alpha, "learning rate schedule");
    }

    // -----------------------------------------------------------------------------
    // Built-in scenario
    // -----------------------------------------------------------------------------

    TFactoryConfig DemoFactoryConfig()
    {
        TFactoryConfig f;
        f.dayLengthMinutes = 1440.0;
        f.numShifts = 3;
        f.dailyTarget = 90;

        f.machineTypes = {
            {"press",   6.0, 10.0},
            {"lathe",   7.0, 45.0},
            {"welding", 9.0, 75.0},
            {"packing", 5.0, 25.0}
        };

        f.machines = {
            {"press",   0, 1},
            {"lathe",   1, 2},
            {"welding", 2, 1},
            {"packing", 3, 0}
        };

        // skills: press, lathe, welding, packing
        f.operators = {
            {"O0", {0.95, 0.35, 0.15, 0.20}, {480, 460, 480}},
            {"O1", {0.25, 0.90, 0.65, 0.55}, {460, 480, 460}},
            {"O2", {0.55, 0.30, 0.95, 0.85}, {440, 420, 440}},
            {"O3", {0.45, 0.50, 0.48, 0.52}, {460, 460, 460}},
            {"O4", {0.70, 0.65, 0.55, 0.92}, {480, 440, 480}},
            {"O5", {0.88, 0.58, 0.42, 0.68}, {470, 450, 470}}
        };

        f.weights.skillScale = 0.5;
        f.weights.lowSkill = 1.0;
        f.weights.slowProduction = 8.0;
        f.weights.overCapacity = 1.0;

        return f;
    }

    // -----------------------------------------------------------------------------
    // YAML loading
    // -----------------------------------------------------------------------------

    TScenario LoadScenarioYaml(const std::string& path)
    {
        TScenario scenario;
        scenario.factory = DemoFactoryConfig();

        try {
            YAML::Node root = YAML::LoadFile(path);

            ReadFactory(root["factory"], scenario.factory);
            ReadRun(root["run"], scenario.run);

            bool epsilonHorizon = false;
            bool alphaHorizon = false;
            const YAML::Node& agent = root["agent"];
            ReadIf(agent, "gamma", scenario.agent.gamma);
            ReadIf(agent, "seed", scenario.agent.seed);
            if (agent) {
                ReadSchedule(agent["epsilon"], scenario.agent.epsilon, epsilonHorizon);
                ReadSchedule(agent["alpha"], scenario.agent.alpha, alphaHorizon);
            }

            // decay until the last training episode unless told otherwise
            int horizon = std::max(1, scenario.run.episodes - 1);
            if (!epsilonHorizon) scenario.agent.epsilon.horizon = horizon;
            if (!alphaHorizon) scenario.agent.alpha.horizon = horizon;
            if (!agent || !agent["seed"]) scenario.agent.seed = scenario.run.seed;

        } catch (const YAML::BadFile&) {
            throw std::runtime_error("cannot open scenario file " + path);
        } catch (const YAML::Exception& e) {
            throw std::runtime_error("invalid scenario file " + path + ": " + e.what());
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error("invalid scenario file " + path + ": " + e.what());
        }

        scenario.agent.numActions = scenario.factory.numActions();

        ValidateFactoryConfig(scenario.factory);
        ValidateAgentConfig(scenario.agent);
        return scenario;
    }

} // namespace factoryq::core
