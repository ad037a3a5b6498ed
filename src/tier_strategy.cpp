#include "tier_strategy.hpp"

TierStrategy::TierStrategy(Tier tier, const NormalizationConfig& config, const SignalRegistry& registry)
    : tier_(tier), config_(config), registry_(registry) {}

Tier TierStrategy::selectTier(size_t fileCount, const TierConfig& config) {
    if (fileCount < config.bayesianMinFiles) {
        return Tier::Absolute;
    }
    if (fileCount < config.fullMinFiles) {
        return Tier::Bayesian;
    }
    return Tier::Full;
}

std::optional<double> TierStrategy::floorFor(const std::string& signal) const {
    auto it = config_.floors.find(signal);
    if (it == config_.floors.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<double> TierStrategy::absoluteThreshold(const std::string& signal) const {
    auto it = config_.absoluteThresholds.find(signal);
    if (it != config_.absoluteThresholds.end()) {
        return it->second;
    }
    if (const SignalMeta* meta = registry_.find(SignalScope::File, signal)) {
        return meta->absoluteThreshold;
    }
    return std::nullopt;
}

std::optional<double> TierStrategy::percentile(const std::string& signal, double value,
                                               const PercentileTable& table) const {
    if (!usesPercentiles()) {
        return std::nullopt;
    }
    if (auto floor = floorFor(signal); floor && value < *floor) {
        return 0.0;
    }
    return table.rank(value);
}

std::optional<double> TierStrategy::scaled(const std::string& signal, std::optional<double> raw,
                                           std::optional<double> percentile) const {
    if (usesPercentiles()) {
        return percentile;
    }
    if (!raw) {
        return std::nullopt;
    }
    auto threshold = absoluteThreshold(signal);
    if (!threshold || *threshold <= 0.0) {
        // A zero threshold means any non-zero value is fully bad
        return *raw > 0.0 ? 1.0 : 0.0;
    }
    return clamp01(*raw / *threshold);
}
