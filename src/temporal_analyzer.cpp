#include "temporal_analyzer.hpp"
#include "statistics_toolkit.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <set>

namespace {

constexpr int64_t SECONDS_PER_WEEK = 7 * 86400;

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Commits of a file with duplicate ids removed
std::vector<const CommitRecord*> distinctCommits(const TemporalRecord& record) {
    std::vector<const CommitRecord*> result;
    std::set<std::string> seen;
    for (const auto& commit : record.commits) {
        if (!commit.id.empty() && !seen.insert(commit.id).second) {
            continue;
        }
        result.push_back(&commit);
    }
    return result;
}

} // namespace

TemporalAnalyzer::TemporalAnalyzer(const TemporalConfig& config)
    : config_(config) {}

bool TemporalAnalyzer::matchesAny(const std::string& message, const std::vector<std::string>& keywords) {
    std::string lower = toLower(message);
    for (const auto& keyword : keywords) {
        if (!keyword.empty() && lower.find(toLower(keyword)) != std::string::npos) {
            return true;
        }
    }
    return false;
}

ChurnTrajectory TemporalAnalyzer::classify(int64_t total, double slope, std::optional<double> cv) const {
    if (total <= 1) {
        return ChurnTrajectory::Dormant;
    }
    if (!cv) {
        // Changes without timestamps: no evidence of a trend either way
        return ChurnTrajectory::Stable;
    }
    if (*cv == 0.0) {
        return ChurnTrajectory::Dormant;
    }
    if (slope < -config_.slopeThreshold && *cv < config_.cvThreshold) {
        return ChurnTrajectory::Stabilizing;
    }
    if (slope > config_.slopeThreshold && *cv > config_.cvThreshold) {
        return ChurnTrajectory::Spiking;
    }
    if (*cv > config_.cvThreshold) {
        return ChurnTrajectory::Churning;
    }
    return ChurnTrajectory::Stable;
}

TemporalAnalysis TemporalAnalyzer::analyze(const CodebaseSnapshot& snapshot) const {
    TemporalAnalysis analysis;

    // Snapshot-wide time span so every file shares the same windows
    int64_t first = std::numeric_limits<int64_t>::max();
    int64_t last = std::numeric_limits<int64_t>::min();
    std::set<std::string> authors;
    for (const auto& [path, measurements] : snapshot.files) {
        for (const auto& commit : measurements.temporal.commits) {
            first = std::min(first, commit.timestamp);
            last = std::max(last, commit.timestamp);
        }
        for (const auto& [author, count] : measurements.temporal.authorCommits) {
            if (count > 0) {
                authors.insert(author);
            }
        }
    }

    const bool hasTimeline = first <= last;
    const int64_t windowSeconds = static_cast<int64_t>(config_.windowWeeks) * SECONDS_PER_WEEK;
    if (hasTimeline) {
        analysis.firstTimestamp = first;
        analysis.lastTimestamp = last;
        analysis.spanWeeks = static_cast<double>(last - first) / static_cast<double>(SECONDS_PER_WEEK);
        analysis.windowCount = static_cast<size_t>((last - first) / windowSeconds) + 1;
    }
    analysis.teamSize = std::max<int64_t>(1, static_cast<int64_t>(authors.size()));

    for (const auto& [path, measurements] : snapshot.files) {
        const TemporalRecord& record = measurements.temporal;
        FileTemporalMetrics metrics;
        metrics.totalChanges = record.totalChanges;

        std::vector<const CommitRecord*> commits = distinctCommits(record);
        if (hasTimeline && !commits.empty()) {
            metrics.windowCounts.assign(analysis.windowCount, 0.0);
            size_t fixes = 0;
            size_t refactors = 0;
            for (const auto* commit : commits) {
                auto index = static_cast<size_t>((commit->timestamp - first) / windowSeconds);
                metrics.windowCounts[std::min(index, analysis.windowCount - 1)] += 1.0;
                if (matchesAny(commit->message, config_.fixKeywords)) {
                    fixes++;
                }
                if (matchesAny(commit->message, config_.refactorKeywords)) {
                    refactors++;
                }
            }
            metrics.fixRatio = static_cast<double>(fixes) / static_cast<double>(commits.size());
            metrics.refactorRatio = static_cast<double>(refactors) / static_cast<double>(commits.size());
            metrics.churnSlope = linearSlope(metrics.windowCounts);
            metrics.churnCv = coefficientOfVariation(metrics.windowCounts);
            metrics.changeEntropy = shannonEntropy(metrics.windowCounts);
        }

        metrics.trajectory = classify(metrics.totalChanges, metrics.churnSlope, metrics.churnCv);

        std::vector<double> shares;
        for (const auto& [author, count] : record.authorCommits) {
            shares.push_back(static_cast<double>(count));
        }
        metrics.authorEntropy = shannonEntropy(shares);
        metrics.busFactor = std::pow(2.0, metrics.authorEntropy);

        analysis.files.emplace(path, std::move(metrics));
    }

    return analysis;
}
