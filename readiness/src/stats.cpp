#include "stats.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace stats {

double mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double sample_stddev(const std::vector<double>& values) {
    if (values.size() < 2) return 0.0;

    double m = mean(values);
    double sum_sq = 0.0;
    for (double v : values) {
        sum_sq += (v - m) * (v - m);
    }
    return std::sqrt(sum_sq / (values.size() - 1));
}

double population_stddev(const std::vector<double>& values) {
    if (values.empty()) return 0.0;

    double m = mean(values);
    double sum_sq = 0.0;
    for (double v : values) {
        sum_sq += (v - m) * (v - m);
    }
    return std::sqrt(sum_sq / values.size());
}

double floored(double stddev, double floor) {
    if (!std::isfinite(stddev)) return floor;
    return std::max(stddev, floor);
}

double z_score(double value, double mean, double stddev, double floor) {
    return (value - mean) / floored(stddev, floor);
}

double percentile(std::vector<double> values, double pct) {
    if (values.empty()) return 0.0;

    std::sort(values.begin(), values.end());
    pct = std::clamp(pct, 0.0, 100.0);

    auto rank = static_cast<long>(std::ceil(pct / 100.0 * values.size())) - 1;
    rank = std::clamp(rank, 0L, static_cast<long>(values.size()) - 1);
    return values[static_cast<size_t>(rank)];
}

std::vector<double> moving_average(const std::vector<double>& values, size_t window) {
    std::vector<double> result;
    result.reserve(values.size());
    if (window == 0) window = 1;

    double running = 0.0;
    for (size_t i = 0; i < values.size(); i++) {
        running += values[i];
        if (i >= window) running -= values[i - window];
        size_t count = std::min(i + 1, window);
        result.push_back(running / count);
    }
    return result;
}

std::vector<double> ema(const std::vector<double>& values, size_t period) {
    return ema_alpha(values, 2.0 / (static_cast<double>(period) + 1.0));
}

std::vector<double> ema_alpha(const std::vector<double>& values, double alpha) {
    std::vector<double> result;
    if (values.empty()) return result;

    result.reserve(values.size());
    result.push_back(values[0]);
    for (size_t i = 1; i < values.size(); i++) {
        result.push_back(alpha * values[i] + (1.0 - alpha) * result.back());
    }
    return result;
}

BollingerBands bollinger_bands(const std::vector<double>& values,
                               size_t period, double multiplier) {
    BollingerBands bands;
    if (period == 0) period = 1;

    bands.middle = moving_average(values, period);
    bands.upper.reserve(values.size());
    bands.lower.reserve(values.size());

    for (size_t i = 0; i < values.size(); i++) {
        size_t start = i + 1 >= period ? i + 1 - period : 0;
        std::vector<double> window(values.begin() + start, values.begin() + i + 1);

        double sd = window.size() >= 2 ? population_stddev(window) : 0.0;
        bands.upper.push_back(bands.middle[i] + sd * multiplier);
        bands.lower.push_back(bands.middle[i] - sd * multiplier);
    }
    return bands;
}

std::optional<Envelope> trailing_envelope(const std::vector<double>& values,
                                          size_t period, double multiplier) {
    if (period == 0 || values.size() < period) return std::nullopt;

    std::vector<double> window(values.end() - period, values.end());
    Envelope env;
    env.middle = mean(window);
    env.stddev = population_stddev(window);
    env.upper = env.middle + env.stddev * multiplier;
    env.lower = env.middle - env.stddev * multiplier;
    return env;
}

double pearson(const std::vector<double>& x, const std::vector<double>& y) {
    if (x.size() != y.size() || x.empty()) {
        throw std::invalid_argument("pearson requires two non-empty series of equal length");
    }

    double mx = mean(x);
    double my = mean(y);

    double num = 0.0, den_x = 0.0, den_y = 0.0;
    for (size_t i = 0; i < x.size(); i++) {
        double dx = x[i] - mx;
        double dy = y[i] - my;
        num += dx * dy;
        den_x += dx * dx;
        den_y += dy * dy;
    }

    double den = std::sqrt(den_x * den_y);
    if (den == 0.0) return 0.0;
    return num / den;
}

} // namespace stats
