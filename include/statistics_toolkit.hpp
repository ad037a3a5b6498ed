#pragma once

#include <vector>
#include <optional>
#include <cstddef>

// Population statistics used across the analyzers and the fusion stages.
// Every function has a documented identity result for degenerate input
// instead of raising.

// Gini coefficient, 0 for empty, constant or all-zero input. Negative values are clamped to 0.
double gini(std::vector<double> values);

// Shannon entropy in bits of the distribution proportional to counts. 0 when the total is 0.
double shannonEntropy(const std::vector<double>& counts);

// Population coefficient of variation sigma/mu. Null when the list is empty or mu is 0.
std::optional<double> coefficientOfVariation(const std::vector<double>& values);

double mean(const std::vector<double>& values);
double median(std::vector<double> values);

// Least-squares slope of values against their index, 0 for fewer than two points
double linearSlope(const std::vector<double>& values);

// Clamp to [0, 1], mapping NaN to 0
double clamp01(double value);

// Sorted snapshot of one signal's population, built once and queried many times
class PercentileTable {
public:
    PercentileTable() = default;
    explicit PercentileTable(std::vector<double> values);

    // Fraction of the population strictly less than value, 0 for an empty population
    double rank(double value) const;

    size_t size() const { return sorted_.size(); }
    bool empty() const { return sorted_.empty(); }

private:
    std::vector<double> sorted_;
};
