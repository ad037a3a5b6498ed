#pragma once

#include <string>
#include <optional>
#include "fusion_config.hpp"
#include "signal_registry.hpp"
#include "statistics_toolkit.hpp"

// Chooses the normalization tier once per run and turns raw values into the
// scaled 0-1 quantities the composites consume.
class TierStrategy {
public:
    TierStrategy(Tier tier, const NormalizationConfig& config, const SignalRegistry& registry);

    static Tier selectTier(size_t fileCount, const TierConfig& config);

    Tier tier() const { return tier_; }
    bool usesPercentiles() const { return tier_ != Tier::Absolute; }

    // Percentile of value in table, forced to 0 below the signal's floor.
    // Null in the ABSOLUTE tier.
    std::optional<double> percentile(const std::string& signal, double value,
                                     const PercentileTable& table) const;

    std::optional<double> floorFor(const std::string& signal) const;
    std::optional<double> absoluteThreshold(const std::string& signal) const;

    // Percentile in BAYESIAN/FULL, clamp01(raw / threshold) in ABSOLUTE.
    // Null when the needed input is missing.
    std::optional<double> scaled(const std::string& signal, std::optional<double> raw,
                                 std::optional<double> percentile) const;

private:
    Tier tier_;
    const NormalizationConfig& config_;
    const SignalRegistry& registry_;
};
