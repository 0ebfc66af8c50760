#include "factoryq/core/method.hpp"

namespace factoryq::core {

    // -----------------------------------------------------------------------------
    // Random numbers
    // -----------------------------------------------------------------------------

    double randomico(std::mt19937 &rng, double min, double max)
    {
        return std::uniform_real_distribution<double>(min, max)(rng);
    }

    int irandomico(std::mt19937 &rng, int min, int max)
    {
        return std::uniform_int_distribution<int>(min, max)(rng);
    }

    // -----------------------------------------------------------------------------
    // General Utilities
    // -----------------------------------------------------------------------------

    double get_time_in_seconds() {
        #if defined(_WIN32) || defined(_WIN64)
            LARGE_INTEGER frequency;
            LARGE_INTEGER timeCur;
            QueryPerformanceFrequency(&frequency);
            QueryPerformanceCounter(&timeCur);
            return static_cast<double>(timeCur.QuadPart) / frequency.QuadPart;
        #else
            struct timespec timeCur;
            clock_gettime(CLOCK_MONOTONIC, &timeCur);
            return timeCur.tv_sec + timeCur.tv_nsec / 1e9;
        #endif
    }

    double Mean(const std::vector<double> &values)
    {
        if (values.empty()) return 0.0;
        return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
    }

    double StdDev(const std::vector<double> &values)
    {
        if (values.empty()) return 0.0;
        double mean = Mean(values);
        double sum = 0.0;
        for (double v : values) sum += (v - mean) * (v - mean);
        return std::sqrt(sum / values.size()); // population deviation
    }

    double Median(std::vector<double> values)
    {
        if (values.empty()) return 0.0;
        std::sort(values.begin(), values.end());
        size_t n = values.size();
        return (n % 2 == 1) ? values[n / 2] : 0.5 * (values[n / 2 - 1] + values[n / 2]);
    }

    std::vector<double> MovingAverage(const std::vector<double> &values, int window)
    {
        std::vector<double> avg(values.size(), 0.0);
        if (window < 1) window = 1;

        double sum = 0.0;
        for (size_t i = 0; i < values.size(); i++) {
            sum += values[i];
            if (i >= (size_t)window) sum -= values[i - window];
            size_t count = std::min(i + 1, (size_t)window);
            avg[i] = sum / count;
        }
        return avg;
    }

} // namespace factoryq::core
