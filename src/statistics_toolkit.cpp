#include "statistics_toolkit.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

/**
 * @brief Gini coefficient over ascending-sorted values
 *
 * G = (2 * sum(i * x_i)) / (n * sum(x)) - (n + 1) / n with 1-based i.
 * The result is clamped to [0, 1] to absorb rounding on near-equal inputs.
 */
double gini(std::vector<double> values) {
    if (values.empty()) {
        return 0.0;
    }

    for (auto& v : values) {
        if (!std::isfinite(v) || v < 0.0) {
            v = 0.0;
        }
    }
    std::sort(values.begin(), values.end());

    const double n = static_cast<double>(values.size());
    double total = 0.0;
    double weighted = 0.0;
    for (size_t i = 0; i < values.size(); ++i) {
        total += values[i];
        weighted += static_cast<double>(i + 1) * values[i];
    }

    if (total <= 0.0) {
        return 0.0;
    }

    double g = (2.0 * weighted) / (n * total) - (n + 1.0) / n;
    return clamp01(g);
}

double shannonEntropy(const std::vector<double>& counts) {
    double total = 0.0;
    for (double c : counts) {
        if (c > 0.0) {
            total += c;
        }
    }
    if (total <= 0.0) {
        return 0.0;
    }

    double entropy = 0.0;
    for (double c : counts) {
        if (c <= 0.0) {
            continue;
        }
        double p = c / total;
        entropy -= p * std::log2(p);
    }
    // A single category gives -1 * log2(1) = -0.0
    return std::max(0.0, entropy);
}

std::optional<double> coefficientOfVariation(const std::vector<double>& values) {
    if (values.empty()) {
        return std::nullopt;
    }
    double mu = mean(values);
    if (mu == 0.0) {
        return std::nullopt;
    }

    double variance = 0.0;
    for (double v : values) {
        variance += (v - mu) * (v - mu);
    }
    variance /= static_cast<double>(values.size());
    return std::sqrt(variance) / std::fabs(mu);
}

double mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double median(std::vector<double> values) {
    if (values.empty()) {
        return 0.0;
    }
    std::sort(values.begin(), values.end());
    size_t mid = values.size() / 2;
    if (values.size() % 2 == 1) {
        return values[mid];
    }
    return (values[mid - 1] + values[mid]) / 2.0;
}

double linearSlope(const std::vector<double>& values) {
    const size_t n = values.size();
    if (n < 2) {
        return 0.0;
    }

    double xMean = static_cast<double>(n - 1) / 2.0;
    double yMean = mean(values);
    double num = 0.0;
    double den = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double dx = static_cast<double>(i) - xMean;
        num += dx * (values[i] - yMean);
        den += dx * dx;
    }
    return den > 0.0 ? num / den : 0.0;
}

double clamp01(double value) {
    if (std::isnan(value)) {
        return 0.0;
    }
    return std::min(1.0, std::max(0.0, value));
}

PercentileTable::PercentileTable(std::vector<double> values)
    : sorted_(std::move(values)) {
    std::sort(sorted_.begin(), sorted_.end());
}

double PercentileTable::rank(double value) const {
    if (sorted_.empty()) {
        return 0.0;
    }
    auto below = std::lower_bound(sorted_.begin(), sorted_.end(), value) - sorted_.begin();
    return static_cast<double>(below) / static_cast<double>(sorted_.size());
}
