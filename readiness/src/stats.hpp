#pragma once

#include <vector>
#include <optional>
#include <cstddef>

namespace stats {
    constexpr double kEpsilon = 1e-9;

    double mean(const std::vector<double>& values);

    // n-1 denominator; 0 for fewer than two values
    double sample_stddev(const std::vector<double>& values);

    // n denominator; 0 for an empty window
    double population_stddev(const std::vector<double>& values);

    // Never lets a degenerate window act as a divisor
    double floored(double stddev, double floor = kEpsilon);

    double z_score(double value, double mean, double stddev, double floor = kEpsilon);

    // Nearest-rank percentile, pct in [0, 100]
    double percentile(std::vector<double> values, double pct);

    // Trailing mean over up to `window` values ending at each index
    std::vector<double> moving_average(const std::vector<double>& values, size_t window);

    // alpha = 2 / (period + 1), seeded with the first value
    std::vector<double> ema(const std::vector<double>& values, size_t period);
    std::vector<double> ema_alpha(const std::vector<double>& values, double alpha);

    struct BollingerBands {
        std::vector<double> upper;
        std::vector<double> middle;
        std::vector<double> lower;
    };

    BollingerBands bollinger_bands(const std::vector<double>& values,
                                   size_t period, double multiplier);

    struct Envelope {
        double upper;
        double middle;
        double lower;
        double stddev;
    };

    // Envelope of the last `period` values; nullopt when fewer are available
    std::optional<Envelope> trailing_envelope(const std::vector<double>& values,
                                              size_t period, double multiplier);

    // Throws std::invalid_argument for empty or mismatched series
    double pearson(const std::vector<double>& x, const std::vector<double>& y);
}
