#include "factoryq/utils/io.hpp"
#include "factoryq/core/encoder.hpp"
#include "factoryq/core/method.hpp"

#include <cstdio>

namespace factoryq::utils {

    using namespace factoryq::core;

    namespace {

        FILE* OpenOrThrow(const std::string& path, const char* mode)
        {
            FILE* file = fopen(path.c_str(), mode);
            if (!file) {
                throw std::runtime_error("cannot open " + path + " (does the output folder exist?)");
            }
            return file;
        }

        [[noreturn]] void BadTable(const std::string& path, int line, const std::string& what)
        {
            throw std::runtime_error("value table " + path + ", line " + std::to_string(line) + ": " + what);
        }

    } // namespace

    // -----------------------------------------------------------------------------
    // Value table
    // -----------------------------------------------------------------------------

    void SaveValueTable(const std::string& path, const TValueTable& table, int numActions)
    {
        std::vector<std::pair<std::string, const std::vector<double>*>> rows;
        rows.reserve(table.size());
        for (const auto& [state, values] : table) rows.emplace_back(ToString(state), &values);
        std::sort(rows.begin(), rows.end(),
                  [](const auto& a, const auto& b) { return a.first < b.first; });

        FILE *file = OpenOrThrow(path, "w");

        fprintf(file, "# factoryq value table %d %d\n", (int)rows.size(), numActions);
        for (const auto& [key, values] : rows) {
            fprintf(file, "%s\t", key.c_str());
            for (int a = 0; a < (int)values->size(); a++) {
                fprintf(file, a == 0 ? "%.17g" : " %.17g", (*values)[a]);
            }
            fprintf(file, "\n");
        }

        fclose(file);
    }

    TValueTable LoadValueTable(const std::string& path, int numMachines, int numOperators)
    {
        const int numActions = numOperators + 1;

        std::ifstream in(path);
        if (!in) throw std::runtime_error("cannot open value table " + path);

        std::string line;
        if (!std::getline(in, line)) BadTable(path, 1, "empty file");

        std::istringstream header(line);
        std::string hash, name, w1, w2;
        int numStates = -1;
        int width = -1;
        header >> hash >> name >> w1 >> w2 >> numStates >> width;
        if (header.fail() || hash != "#" || name != "factoryq" || w1 != "value" || w2 != "table" || numStates < 0) {
            BadTable(path, 1, "bad header");
        }
        if (width != numActions) {
            BadTable(path, 1, "table has " + std::to_string(width) + " actions, expected " + std::to_string(numActions));
        }

        TValueTable table;
        int lineNo = 1;
        while (std::getline(in, line)) {
            lineNo++;
            if (line.empty()) continue;

            size_t tab = line.find('\t');
            if (tab == std::string::npos) BadTable(path, lineNo, "missing tab separator");

            std::optional<TDecisionState> state = ParseDecisionState(line.substr(0, tab));
            if (!state) BadTable(path, lineNo, "malformed state key");
            if ((int)state->available.size() != numOperators || (int)state->machineStatus.size() != numMachines ||
                state->machineId > numMachines) {
                BadTable(path, lineNo, "state key does not fit a floor of " + std::to_string(numMachines) +
                                       " machines and " + std::to_string(numOperators) + " operators");
            }

            std::istringstream valuesIn(line.substr(tab + 1));
            std::vector<double> values;
            double v;
            while (valuesIn >> v) values.push_back(v);
            if (!valuesIn.eof()) BadTable(path, lineNo, "malformed action value");
            if ((int)values.size() != numActions) BadTable(path, lineNo, "wrong number of action values");

            if (!table.emplace(*state, std::move(values)).second) BadTable(path, lineNo, "duplicate state");
        }

        if ((int)table.size() != numStates) {
            BadTable(path, lineNo, "expected " + std::to_string(numStates) + " states, read " + std::to_string(table.size()));
        }
        return table;
    }

    // -----------------------------------------------------------------------------
    // CSV reports
    // -----------------------------------------------------------------------------

    void WriteTrainingCurves(const std::string& path, const std::vector<double>& returns,
                             const std::vector<int>& productions, int window)
    {
        std::vector<double> produced(productions.begin(), productions.end());
        std::vector<double> avgReturn = MovingAverage(returns, window);
        std::vector<double> avgProduced = MovingAverage(produced, window);

        FILE *file = OpenOrThrow(path, "w");

        fprintf(file, "episode,return,good_parts,return_avg,good_parts_avg\n");
        for (size_t i = 0; i < returns.size() && i < produced.size(); i++) {
            fprintf(file, "%d,%.4f,%d,%.4f,%.4f\n", (int)i + 1, returns[i], productions[i],
                    avgReturn[i], avgProduced[i]);
        }

        fclose(file);
    }

    void WriteTimeline(const std::string& path, const std::vector<TSnapshot>& history,
                       const TFactoryConfig& config)
    {
        FILE *file = OpenOrThrow(path, "w");

        fprintf(file, "episode,time,shift,machine,status,operator,skill,good_parts\n");
        for (const auto& snap : history) {
            for (int m = 0; m < (int)snap.machineStatus.size(); m++) {
                int op = snap.machineOperator[m];
                fprintf(file, "%d,%.3f,%d,%s,%s,%s,%.2f,%d\n",
                        snap.episode, snap.time, snap.shift + 1,
                        config.machines[m].name.c_str(),
                        ToString(snap.machineStatus[m]),
                        op >= 0 ? config.operators[op].name.c_str() : "",
                        snap.operatorSkill[m] >= 0.0 ? snap.operatorSkill[m] : 0.0,
                        snap.goodParts);
            }
        }

        fclose(file);
    }

    // -----------------------------------------------------------------------------
    // Evaluation summary
    // -----------------------------------------------------------------------------

    int PerformanceCategory(int goodParts, int dailyTarget)
    {
        double ratio = static_cast<double>(goodParts) / dailyTarget;
        if (ratio >= 1.2) return 0;
        if (ratio >= 1.0) return 1;
        if (ratio >= 0.8) return 2;
        return 3;
    }

    TEvalSummary Summarize(const std::vector<TEpisodeStats>& stats, int dailyTarget)
    {
        TEvalSummary s;
        s.episodes = (int)stats.size();
        s.dailyTarget = dailyTarget;
        if (stats.empty()) return s;

        std::vector<double> returns;
        std::vector<double> good;
        int reached = 0;
        for (const auto& e : stats) {
            returns.push_back(e.totalReturn);
            good.push_back(e.goodParts);
            if (e.goodParts >= dailyTarget) reached++;
            s.categories[PerformanceCategory(e.goodParts, dailyTarget)]++;
        }

        s.meanReturn = Mean(returns);
        s.stdReturn = StdDev(returns);
        s.medianReturn = Median(returns);
        s.meanGood = Mean(good);
        s.stdGood = StdDev(good);
        s.medianGood = Median(good);
        s.minGood = (int)*std::min_element(good.begin(), good.end());
        s.maxGood = (int)*std::max_element(good.begin(), good.end());
        s.targetRate = static_cast<double>(reached) / stats.size();
        return s;
    }

    void WriteEvaluationScreen(const std::string& mode, const TEvalSummary& s,
                               bool showCategories, float timeTotal)
    {
        printf("\n\n%s: %d greedy episodes", mode.c_str(), s.episodes);
        printf("\nReturn: %.2f +- %.2f", s.meanReturn, s.stdReturn);
        printf("\nGood parts: %.2f +- %.2f (target %d)", s.meanGood, s.stdGood, s.dailyTarget);
        printf("\nMin / max good parts: %d / %d", s.minGood, s.maxGood);
        printf("\nTarget reached: %.1f%%", 100.0 * s.targetRate);

        if (showCategories) {
            static const char *names[] = {"Excellent (>=120%)", "Good (100-120%)",
                                          "Acceptable (80-100%)", "Poor (<80%)"};
            printf("\nMedian return: %.2f", s.medianReturn);
            printf("\nMedian good parts: %.1f", s.medianGood);
            printf("\n\nPerformance categories:");
            for (int c = 0; c < 4; c++) {
                double share = s.episodes > 0 ? 100.0 * s.categories[c] / s.episodes : 0.0;
                printf("\n  %-22s %4d (%.1f%%)", names[c], s.categories[c], share);
            }
        }

        printf("\nTotal time: %.3f\n\n", timeTotal);
    }

} // namespace factoryq::utils
