#pragma once

#include <map>
#include <optional>
#include <string>
#include "graph_model.hpp"

// Discrete local-outlier operator over the dependency graph:
// delta_h(f) = raw_risk(f) - mean(raw_risk(n) for n in neighbors(f)).
// Neighbors are undirected and exclude f itself. Files without neighbors get 0.
// A file whose own raw risk is null gets null; neighbors with a null raw risk
// are left out of the mean, and if none remain the result is null.
std::map<std::string, std::optional<double>> healthLaplacian(
    const GraphModel& graph,
    const std::map<std::string, std::optional<double>>& rawRisk);
