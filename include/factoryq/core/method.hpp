#pragma once

#include "factoryq/core/data.hpp"

namespace factoryq::core {

    // -----------------------------------------------------------------------------
    // Random numbers
    // Every caller owns its engine; nothing here touches a process-wide generator.
    // -----------------------------------------------------------------------------
    double randomico(std::mt19937 &rng, double min, double max);
    int irandomico(std::mt19937 &rng, int min, int max);

    // -----------------------------------------------------------------------------
    // General Utilities
    // -----------------------------------------------------------------------------
    double get_time_in_seconds();

    double Mean(const std::vector<double> &values);
    double StdDev(const std::vector<double> &values);
    double Median(std::vector<double> values);

    /**
     * Method: MovingAverage
     * Description: Trailing average over at most `window` values ending at each index
     */
    std::vector<double> MovingAverage(const std::vector<double> &values, int window);

} // namespace factoryq::core
