#pragma once

#include <string>
#include <vector>
#include <map>
#include <thread>
#include <stdexcept>
#include <nlohmann/json.hpp>

// Raised when a configuration file is malformed or carries a value of the wrong type
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

// Graph algorithm tunables
struct GraphConfig {
    double damping = 0.85;                 // PageRank damping factor
    double pagerankTolerance = 1e-6;       // Max per-node delta for convergence
    int pagerankMaxIterations = 100;       // Hard cap, result flagged approximate when hit

    int louvainMaxPasses = 20;             // Local-moving passes per level
    int louvainMaxLevels = 10;             // Aggregation levels

    double eigenTolerance = 1e-10;         // Residual tolerance of the sparse eigensolver
    int eigenMaxIterations = 2000;         // Hard cap of the sparse eigensolver
    size_t denseEigenLimit = 1000;         // Use a dense solver up to this many nodes
    double zeroEigenvalueEpsilon = 1e-9;   // Eigenvalues this close to 0 are exactly 0
};

// Population boundaries of the normalization tiers
struct TierConfig {
    size_t bayesianMinFiles = 15;          // Below this: ABSOLUTE
    size_t fullMinFiles = 50;              // At or above this: FULL
};

struct NormalizationConfig {
    // Raw value below which a signal's percentile is forced to 0
    std::map<std::string, double> floors = {
        {"pagerank", 0.005},
        {"blast_radius_size", 5.0},
        {"cognitive_load", 3.0},
        {"lines", 100.0}
    };

    // ABSOLUTE-tier scaling thresholds; raw / threshold stands in for a percentile.
    // Entries here override the thresholds declared in the signal registry.
    std::map<std::string, double> absoluteThresholds = {
        {"pagerank", 0.15},
        {"blast_radius_size", 10.0},
        {"cognitive_load", 15.0}
    };
};

struct TemporalConfig {
    int windowWeeks = 4;                   // Width of a churn window
    double slopeThreshold = 0.1;           // |slope| above this is a trend
    double cvThreshold = 0.5;              // CV above this is erratic

    std::vector<std::string> fixKeywords = {
        "fix", "bug", "patch", "hotfix", "bugfix", "repair", "issue"
    };
    std::vector<std::string> refactorKeywords = {
        "refactor", "cleanup", "clean up", "reorganize", "restructure", "rename"
    };
};

struct ExecutionConfig {
    unsigned int numThreads = std::thread::hardware_concurrency();
    bool verbose = false;
};

// Complete configuration of one fusion run
struct FusionConfig {
    GraphConfig graph;
    TierConfig tiers;
    NormalizationConfig normalization;
    TemporalConfig temporal;
    ExecutionConfig execution;

    // Overlay the keys present in json onto a default configuration.
    // Unknown keys are ignored; a value of the wrong type throws ConfigError.
    static FusionConfig fromJson(const nlohmann::json& json);
    static FusionConfig fromFile(const std::string& path);

    nlohmann::json toJson() const;

    // Throws ConfigError when a value is out of its meaningful range
    void validate() const;
};
