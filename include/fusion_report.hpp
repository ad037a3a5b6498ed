#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "fusion_pipeline.hpp"

// JSON view of a fusion run: provenance, the four signal tiers, per-file
// percentiles, communities, health bands and the top-N rankings.
class FusionReport {
public:
    FusionReport(const FusionResult& result, size_t topN = 10);

    nlohmann::json toJson() const;

    // Pretty-printed with 2-space indentation
    std::string dump() const;

    // Files ordered by descending value of a file signal, nulls left out.
    // Ties are broken by path.
    std::vector<std::pair<std::string, double>> topFiles(const std::string& signal) const;

    static nlohmann::json valueToJson(const SignalValue& value);

private:
    const FusionResult& result_;
    size_t topN_;

    nlohmann::json provenanceJson() const;
    nlohmann::json tierJson(SignalScope scope) const;
    nlohmann::json percentilesJson() const;
    nlohmann::json bandsJson() const;
    nlohmann::json rankingJson(const std::string& signal) const;
};
