#include "factoryq/core/environment.hpp"
#include "factoryq/core/encoder.hpp"
#include "factoryq/core/method.hpp"

namespace factoryq::core {

    std::unique_ptr<IEnvironment> createEnvironment(const TFactoryConfig& config, unsigned int seed)
    {
        return std::make_unique<FactoryEnv>(config, seed);
    }

    FactoryEnv::FactoryEnv(const TFactoryConfig& config, unsigned int seed)
        : config_(config), rng_(seed)
    {
        ValidateFactoryConfig(config_);
        reset();
    }

    // -----------------------------------------------------------------------------
    // Episode control
    // -----------------------------------------------------------------------------

    TDecisionState FactoryEnv::reset(bool recordHistory)
    {
        machines_.clear();
        for (int m = 0; m < config_.numMachines(); m++) {
            TMachine machine;
            machine.id = m;
            machine.name = config_.machines[m].name;
            machine.type = config_.machines[m].type;
            machine.priority = config_.machines[m].priority;
            machines_.push_back(machine);
        }

        operators_.clear();
        for (int o = 0; o < config_.numOperators(); o++) {
            TOperator op;
            op.id = o;
            op.name = config_.operators[o].name;
            op.busyMinutes.assign(config_.numShifts, 0.0);
            operators_.push_back(op);
        }

        clock_.dayLength = config_.dayLengthMinutes;
        clock_.numShifts = config_.numShifts;
        clock_.reset();

        target_.daily = config_.dailyTarget;
        target_.reset();

        terminal_ = false;
        recordHistory_ = recordHistory;
        lastSnapshotTime_ = 0.0;
        history_.clear();

        awaitingMachine_ = selectAwaitingMachine();
        if (recordHistory_) recordSnapshot();

        return state();
    }

    TStepResult FactoryEnv::step(int action)
    {
        TStepResult result;
        TStepInfo& info = result.info;

        if (terminal_) {
            result.state = state();
            result.terminal = true;
            info.afterTerminal = true;
            info.goodParts = target_.good;
            info.defectiveParts = target_.defective;
            info.time = clock_.elapsed;
            info.shift = clock_.shiftIndex();
            return result;
        }

        TTransition tr;
        tr.dailyTarget = config_.dailyTarget;

        const int idleAction = config_.numOperators();
        const bool eligibleBefore = awaitingMachine_ >= 0 && hasEligibleOperator();

        // 1. resolve the action against the awaiting machine
        IllegalReason reason = IllegalReason::NONE;
        if (action < 0 || action > idleAction) {
            reason = IllegalReason::OUT_OF_RANGE;
        }
        else if (action < idleAction) {
            reason = checkAssignment(action);
        }

        bool assigned = false;
        if (action >= 0 && action < idleAction && reason == IllegalReason::NONE) {
            // 2. bind and start one unit
            int m = awaitingMachine_;
            tr.assigned = true;
            tr.assignedSkillBucket = SkillBucket(config_.skill(action, m), config_.encoder);
            tr.switchedOperator = machines_[m].lastOperatorId >= 0 && machines_[m].lastOperatorId != action;
            bind(action, m);
            info.assignedOperator = action;
            assigned = true;

            if (recordHistory_) recordSnapshot();
        }

        if (reason != IllegalReason::NONE) {
            tr.illegal = true;
            info.illegal = true;
            info.illegalReason = reason;
        }
        if (!assigned && eligibleBefore) tr.idleWithEligible = true;

        // 3. time advance; several machines can be staffed at the same instant
        if (!(assigned && decisionAvailable())) {
            do {
                advanceOneEvent(tr, info);
            } while (!clock_.dayOver() && !decisionAvailable());
        }

        terminal_ = clock_.dayOver();
        awaitingMachine_ = terminal_ ? -1 : selectAwaitingMachine();

        // 5. reward
        tr.terminal = terminal_;
        tr.totalGood = target_.good;
        info.reward = ComputeReward(tr, config_.weights);

        if (recordHistory_ &&
            (terminal_ || clock_.elapsed - lastSnapshotTime_ >= config_.historyIntervalMinutes)) {
            recordSnapshot();
        }

        // 6. outcome
        info.goodParts = target_.good;
        info.defectiveParts = target_.defective;
        info.time = clock_.elapsed;
        info.shift = clock_.shiftIndex();

        result.state = state();
        result.reward = info.reward.total();
        result.terminal = terminal_;
        return result;
    }

    // -----------------------------------------------------------------------------
    // Observation
    // -----------------------------------------------------------------------------

    TObservation FactoryEnv::observe() const
    {
        TObservation obs;
        obs.awaitingMachine = awaitingMachine_;
        obs.awaitingPriority = awaitingMachine_ >= 0 ? machines_[awaitingMachine_].priority : 0;
        obs.shiftIndex = clock_.shiftIndex();
        obs.timeRemaining = clock_.remaining();
        obs.shortfall = target_.shortfall();

        for (int o = 0; o < config_.numOperators(); o++) {
            obs.eligible.push_back(isEligible(o));
            if (awaitingMachine_ >= 0) obs.skillOnAwaiting.push_back(config_.skill(o, awaitingMachine_));
        }
        for (const auto& machine : machines_) obs.machineStatus.push_back(machine.status);

        return obs;
    }

    TDecisionState FactoryEnv::state() const
    {
        return EncodeState(observe(), config_.encoder, config_.dayLengthMinutes, config_.dailyTarget);
    }

    bool FactoryEnv::isEligible(int op) const
    {
        const TOperator& o = operators_[op];
        int shift = clock_.shiftIndex();
        return o.isFree() && o.busyMinutes[shift] < config_.capacity(op, shift);
    }

    double FactoryEnv::processMinutes(int op, int machine) const
    {
        const TMachineType& type = config_.machineTypes[machines_[machine].type];
        double skill = std::max(config_.skill(op, machine), 0.1);
        return std::max(type.baseMinutes / skill, type.minMinutes);
    }

    double FactoryEnv::defectProbability(int op, int machine) const
    {
        return std::clamp(config_.defectSkillOffset - config_.skill(op, machine), 0.0, 1.0);
    }

    // highest priority first, then lowest index
    int FactoryEnv::selectAwaitingMachine() const
    {
        int best = -1;
        for (const auto& machine : machines_) {
            if (machine.status != MachineStatus::IDLE) continue;
            if (best < 0 || machine.priority > machines_[best].priority) best = machine.id;
        }
        return best;
    }

    bool FactoryEnv::hasEligibleOperator() const
    {
        for (int o = 0; o < config_.numOperators(); o++) {
            if (isEligible(o)) return true;
        }
        return false;
    }

    bool FactoryEnv::decisionAvailable() const
    {
        return selectAwaitingMachine() >= 0 && hasEligibleOperator();
    }

    IllegalReason FactoryEnv::checkAssignment(int op) const
    {
        if (awaitingMachine_ < 0) return IllegalReason::NO_MACHINE;
        if (machines_[awaitingMachine_].status != MachineStatus::IDLE) return IllegalReason::MACHINE_NOT_IDLE;
        if (!operators_[op].isFree()) return IllegalReason::OPERATOR_BUSY;
        if (!isEligible(op)) return IllegalReason::OVER_CAPACITY;
        return IllegalReason::NONE;
    }

    // -----------------------------------------------------------------------------
    // Binding
    // -----------------------------------------------------------------------------

    void FactoryEnv::bind(int op, int machine)
    {
        TMachine& m = machines_[machine];
        m.status = MachineStatus::BUSY;
        m.operatorId = op;
        m.remaining = processMinutes(op, machine);
        operators_[op].machineId = machine;
    }

    void FactoryEnv::release(int machine)
    {
        TMachine& m = machines_[machine];
        if (m.operatorId >= 0) operators_[m.operatorId].machineId = -1;
        m.operatorId = -1;
        m.remaining = 0.0;
        m.status = MachineStatus::IDLE;
    }

    // -----------------------------------------------------------------------------
    // Dynamics
    // -----------------------------------------------------------------------------

    double FactoryEnv::nextEventDelta() const
    {
        double dt = clock_.remaining();
        bool anyBusy = false;

        for (const auto& m : machines_) {
            if (m.status == MachineStatus::BUSY) {
                dt = std::min(dt, m.remaining);
                anyBusy = true;
            }
            else if (!m.isUp()) {
                dt = std::min(dt, m.downUntil - clock_.elapsed);
            }
        }

        int shift = clock_.shiftIndex();
        if (shift + 1 < clock_.numShifts) {
            dt = std::min(dt, (shift + 1) * clock_.shiftLength() - clock_.elapsed);
        }

        if (!anyBusy) dt = std::min(dt, config_.minTickMinutes);

        // rounding can leave a boundary a hair behind the clock
        if (dt <= 0.0) dt = std::min(config_.minTickMinutes, clock_.remaining());
        return dt;
    }

    void FactoryEnv::advanceOneEvent(TTransition& tr, TStepInfo& info)
    {
        double dt = nextEventDelta();
        int shift = clock_.shiftIndex();

        std::vector<int> upMachines;
        for (auto& m : machines_) {
            if (m.isUp()) upMachines.push_back(m.id);
            if (m.status == MachineStatus::BUSY) {
                operators_[m.operatorId].busyMinutes[shift] += dt;
                m.remaining -= dt;
            }
        }

        if (dt >= clock_.remaining()) clock_.elapsed = clock_.dayLength;
        else clock_.elapsed += dt;

        for (auto& m : machines_) {
            if (m.status != MachineStatus::BUSY || m.remaining > FACTORYQ_EPS) continue;

            // the day closed before the unit left the machine
            if (clock_.dayOver()) release(m.id);
            else completeUnit(m.id, shift, tr, info);
        }

        if (clock_.dayOver()) return;

        injectFailures(upMachines, dt, info);
        progressDownPhases();
    }

    void FactoryEnv::completeUnit(int machine, int shift, TTransition& tr, TStepInfo& info)
    {
        TMachine& m = machines_[machine];
        int op = m.operatorId;

        bool defective = randomico(rng_, 0.0, 1.0) < defectProbability(op, machine);
        if (defective) {
            target_.defective++;
            tr.defectiveParts++;
        }
        else {
            target_.good++;
            tr.goodParts++;
        }

        if (!target_.reached50 && 2 * target_.good >= target_.daily) {
            target_.reached50 = true;
            tr.reached50 = true;
        }
        if (!target_.reached80 && 5 * target_.good >= 4 * target_.daily) {
            target_.reached80 = true;
            tr.reached80 = true;
        }

        double fatigue = computeFatigue(op, shift);
        operators_[op].fatigue = fatigue;
        tr.fatigue += fatigue;

        int bucket = SkillBucket(config_.skill(op, machine), config_.encoder);
        if (bucket == 0) tr.lowSkillUnits++;
        else if (bucket < SKILL_BUCKETS - 1) tr.mediumSkill += config_.skill(op, machine);

        // work beyond the shift capacity, relative to it (capacity floored at one minute)
        double cap = config_.capacity(op, shift);
        double overrun = operators_[op].busyMinutes[shift] - cap;
        if (overrun > FACTORYQ_EPS) tr.overCapacity += overrun / std::max(cap, 1.0);

        m.lastOperatorId = op;
        if (recordHistory_) recordSnapshot();
        release(machine);
        info.completions++;

        // preventive maintenance after the unit
        if (config_.maintenanceProbability > 0.0 &&
            randomico(rng_, 0.0, 1.0) < config_.maintenanceProbability) {
            m.status = MachineStatus::MAINTENANCE;
            m.downUntil = clock_.elapsed + drawDuration(config_.maintenanceMinutes);
            info.maintenances++;
        }
    }

    void FactoryEnv::injectFailures(const std::vector<int>& upMachines, double dt, TStepInfo& info)
    {
        double rate = config_.breakdownRatePerMinute;
        if (rate <= 0.0) return;

        double p = 1.0 - std::pow(1.0 - rate, dt);
        for (int id : upMachines) {
            TMachine& m = machines_[id];
            if (!m.isUp()) continue;
            if (randomico(rng_, 0.0, 1.0) >= p) continue;

            // the unit in progress is scrapped
            if (m.status == MachineStatus::BUSY) release(id);
            m.status = MachineStatus::BROKEN;
            m.downUntil = clock_.elapsed + drawDuration(config_.repairMinutes);
            info.breakdowns++;
        }
    }

    void FactoryEnv::progressDownPhases()
    {
        for (auto& m : machines_) {
            while (!m.isUp() && m.downUntil <= clock_.elapsed + FACTORYQ_EPS) {
                if (m.status == MachineStatus::BROKEN) {
                    // repaired, then serviced before going back to production
                    m.status = MachineStatus::MAINTENANCE;
                    m.downUntil += drawDuration(config_.maintenanceMinutes);
                }
                else {
                    m.status = MachineStatus::IDLE;
                }
            }
        }
    }

    double FactoryEnv::drawDuration(const TDurationRange& range)
    {
        if (range.max <= range.min) return range.min;
        return randomico(rng_, range.min, range.max);
    }

    double FactoryEnv::computeFatigue(int op, int shift) const
    {
        double cap = config_.capacity(op, shift);
        if (cap <= 0.0) return 0.0;

        double usage = operators_[op].busyMinutes[shift] / cap;
        if (usage < config_.fatigueThreshold) return 0.0;
        return std::min(1.0, (usage - config_.fatigueThreshold) / (1.0 - config_.fatigueThreshold));
    }

    // -----------------------------------------------------------------------------
    // History
    // -----------------------------------------------------------------------------

    void FactoryEnv::recordSnapshot()
    {
        TSnapshot snap;
        snap.time = clock_.elapsed;
        snap.shift = clock_.shiftIndex();
        snap.goodParts = target_.good;

        for (const auto& m : machines_) {
            snap.machineOperator.push_back(m.operatorId);
            snap.operatorSkill.push_back(m.operatorId >= 0 ? config_.skill(m.operatorId, m.id) : -1.0);
            snap.machineStatus.push_back(m.status);
        }

        history_.push_back(snap);
        lastSnapshotTime_ = clock_.elapsed;
    }

} // namespace factoryq::core
