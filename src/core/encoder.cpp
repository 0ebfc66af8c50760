#include "factoryq/core/encoder.hpp"

namespace factoryq::core {

    int TimeBucket(double timeRemaining, double dayLength, const TEncoderConfig& encoder)
    {
        double fraction = std::clamp(timeRemaining / dayLength, 0.0, 1.0);
        return Bucketize(fraction, encoder.timeCutoffs);
    }

    int ShortfallBucket(int shortfall, int dailyTarget, const TEncoderConfig& encoder)
    {
        double fraction = std::clamp(static_cast<double>(shortfall) / dailyTarget, 0.0, 1.0);
        return Bucketize(fraction, encoder.shortfallCutoffs);
    }

    int SkillBucket(double skill, const TEncoderConfig& encoder)
    {
        return Bucketize(std::clamp(skill, 0.0, 1.0), encoder.skillCutoffs);
    }

    TDecisionState EncodeState(const TObservation& obs, const TEncoderConfig& encoder,
                               double dayLength, int dailyTarget)
    {
        TDecisionState s;
        const int numMachines = static_cast<int>(obs.machineStatus.size());
        const int numOperators = static_cast<int>(obs.eligible.size());
        const bool awaiting = obs.awaitingMachine >= 0 && obs.awaitingMachine < numMachines;

        // the sentinel numMachines marks "no machine awaiting assignment"
        s.machineId = awaiting ? obs.awaitingMachine : numMachines;
        s.priority = awaiting ? std::clamp(obs.awaitingPriority, 0, 2) : 0;
        s.shift = std::max(0, obs.shiftIndex);
        s.timeBucket = TimeBucket(obs.timeRemaining, dayLength, encoder);
        s.shortfallBucket = ShortfallBucket(obs.shortfall, dailyTarget, encoder);

        s.available.resize(numOperators);
        s.skillBuckets.assign(numOperators, 0);
        for (int i = 0; i < numOperators; i++) {
            s.available[i] = obs.eligible[i] ? 1 : 0;
            if (awaiting && i < (int)obs.skillOnAwaiting.size()) {
                s.skillBuckets[i] = static_cast<std::uint8_t>(SkillBucket(obs.skillOnAwaiting[i], encoder));
            }
        }

        s.machineStatus.resize(numMachines);
        for (int m = 0; m < numMachines; m++) {
            s.machineStatus[m] = static_cast<std::uint8_t>(obs.machineStatus[m]);
        }

        return s;
    }

    // -----------------------------------------------------------------------------
    // Text form (used by the value table files)
    // -----------------------------------------------------------------------------

    std::string ToString(const TDecisionState& s)
    {
        std::ostringstream out;
        out << s.machineId << ',' << s.priority << ',' << s.shift << ','
            << s.timeBucket << ',' << s.shortfallBucket << ';';
        for (auto v : s.available) out << static_cast<int>(v);
        out << ';';
        for (auto v : s.skillBuckets) out << static_cast<int>(v);
        out << ';';
        for (auto v : s.machineStatus) out << static_cast<int>(v);
        return out.str();
    }

    namespace {

        bool ParseDigits(const std::string& field, int maxDigit, std::vector<std::uint8_t>& out)
        {
            out.clear();
            for (char c : field) {
                if (c < '0' || c - '0' > maxDigit) return false;
                out.push_back(static_cast<std::uint8_t>(c - '0'));
            }
            return true;
        }

    } // namespace

    std::optional<TDecisionState> ParseDecisionState(const std::string& text)
    {
        std::vector<std::string> parts;
        std::stringstream ss(text);
        std::string part;
        while (std::getline(ss, part, ';')) parts.push_back(part);
        if (parts.size() != 4) return std::nullopt;

        TDecisionState s;
        std::array<int, 5> scalars{};
        std::stringstream head(parts[0]);
        for (int i = 0; i < 5; i++) {
            std::string token;
            if (!std::getline(head, token, ',') || token.empty()) return std::nullopt;
            if (!std::all_of(token.begin(), token.end(), [](unsigned char c) { return std::isdigit(c); })) {
                return std::nullopt;
            }
            const char* last = token.data() + token.size();
            auto [ptr, ec] = std::from_chars(token.data(), last, scalars[i]);
            if (ec != std::errc() || ptr != last) return std::nullopt;
        }
        std::string extra;
        if (std::getline(head, extra, ',')) return std::nullopt;

        s.machineId = scalars[0];
        s.priority = scalars[1];
        s.shift = scalars[2];
        s.timeBucket = scalars[3];
        s.shortfallBucket = scalars[4];
        if (s.priority > 2 || s.timeBucket >= TIME_BUCKETS || s.shortfallBucket >= SHORTFALL_BUCKETS) {
            return std::nullopt;
        }

        if (!ParseDigits(parts[1], 1, s.available)) return std::nullopt;
        if (!ParseDigits(parts[2], SKILL_BUCKETS - 1, s.skillBuckets)) return std::nullopt;
        if (!ParseDigits(parts[3], 3, s.machineStatus)) return std::nullopt;
        if (s.available.size() != s.skillBuckets.size()) return std::nullopt;

        return s;
    }

} // namespace factoryq::core
