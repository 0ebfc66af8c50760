#pragma once

#include "factoryq/core/data.hpp"
#include "factoryq/core/config.hpp"

namespace factoryq::utils {

    /**
     * Writes the value table as text: a header line
     * "# factoryq value table <numStates> <numActions>" and one line per state with
     * the key, a tab and the action-values. Rows are sorted by key.
     */
    void SaveValueTable(const std::string& path, const factoryq::core::TValueTable& table, int numActions);

    /**
     * Reads a table written by SaveValueTable for a floor of numMachines machines and
     * numOperators operators (numOperators + 1 actions).
     * Throws std::runtime_error if the file is missing, the header or a row is malformed,
     * or a key or row does not fit the floor.
     */
    factoryq::core::TValueTable LoadValueTable(const std::string& path, int numMachines, int numOperators);

    /**
     * Outputs per-episode return and good parts with their moving averages in a csv file.
     */
    void WriteTrainingCurves(const std::string& path, const std::vector<double>& returns,
                             const std::vector<int>& productions, int window = 200);

    /**
     * Outputs an episode history in a csv file, one row per snapshot and machine.
     */
    void WriteTimeline(const std::string& path, const std::vector<factoryq::core::TSnapshot>& history,
                       const factoryq::core::TFactoryConfig& config);

    // Performance class of a day: 0 excellent (>= 120%), 1 good (>= 100%), 2 acceptable (>= 80%), 3 poor
    int PerformanceCategory(int goodParts, int dailyTarget);

    factoryq::core::TEvalSummary Summarize(const std::vector<factoryq::core::TEpisodeStats>& stats, int dailyTarget);

    /**
     * Outputs an evaluation summary to the screen.
     */
    void WriteEvaluationScreen(const std::string& mode, const factoryq::core::TEvalSummary& summary,
                               bool showCategories, float timeTotal);

} // namespace factoryq::utils
