#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>
#include "measurements.hpp"
#include "fusion_config.hpp"

// Churn and authorship measurements of one file
struct FileTemporalMetrics {
    int64_t totalChanges = 0;
    std::vector<double> windowCounts;   // changes per window over the snapshot-wide span
    ChurnTrajectory trajectory = ChurnTrajectory::Dormant;
    double churnSlope = 0.0;
    std::optional<double> churnCv;      // null when the windows average 0
    double authorEntropy = 0.0;
    double busFactor = 1.0;
    double fixRatio = 0.0;
    double refactorRatio = 0.0;
    double changeEntropy = 0.0;
};

struct TemporalAnalysis {
    std::map<std::string, FileTemporalMetrics> files;
    int64_t teamSize = 1;        // distinct authors, at least 1
    double spanWeeks = 0.0;      // first to last commit
    int64_t firstTimestamp = 0;
    int64_t lastTimestamp = 0;
    size_t windowCount = 0;
};

// Windowed change history, trajectory classification and author entropy
class TemporalAnalyzer {
public:
    explicit TemporalAnalyzer(const TemporalConfig& config);

    TemporalAnalysis analyze(const CodebaseSnapshot& snapshot) const;

    ChurnTrajectory classify(int64_t total, double slope, std::optional<double> cv) const;

    // Case-insensitive substring match of any keyword
    static bool matchesAny(const std::string& message, const std::vector<std::string>& keywords);

private:
    TemporalConfig config_;
};
