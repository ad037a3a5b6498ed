#include "fusion_config.hpp"
#include <fstream>

using json = nlohmann::json;

namespace {

template <typename T>
void readField(const json& section, const char* key, T& target) {
    auto it = section.find(key);
    if (it == section.end() || it->is_null()) {
        return;
    }
    try {
        target = it->get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

const json* section(const json& root, const char* key) {
    auto it = root.find(key);
    if (it == root.end()) {
        return nullptr;
    }
    if (!it->is_object()) {
        throw ConfigError(std::string("Config section '") + key + "' must be an object");
    }
    return &*it;
}

// Merge a name -> value table without dropping entries the file does not mention
void readTable(const json& section, const char* key, std::map<std::string, double>& target) {
    std::map<std::string, double> overrides;
    readField(section, key, overrides);
    for (const auto& [name, value] : overrides) {
        target[name] = value;
    }
}

} // namespace

FusionConfig FusionConfig::fromJson(const json& root) {
    if (!root.is_object()) {
        throw ConfigError("Config root must be a JSON object");
    }

    FusionConfig config;

    if (const json* g = section(root, "graph")) {
        readField(*g, "damping", config.graph.damping);
        readField(*g, "pagerankTolerance", config.graph.pagerankTolerance);
        readField(*g, "pagerankMaxIterations", config.graph.pagerankMaxIterations);
        readField(*g, "louvainMaxPasses", config.graph.louvainMaxPasses);
        readField(*g, "louvainMaxLevels", config.graph.louvainMaxLevels);
        readField(*g, "eigenTolerance", config.graph.eigenTolerance);
        readField(*g, "eigenMaxIterations", config.graph.eigenMaxIterations);
        readField(*g, "denseEigenLimit", config.graph.denseEigenLimit);
        readField(*g, "zeroEigenvalueEpsilon", config.graph.zeroEigenvalueEpsilon);
    }

    if (const json* t = section(root, "tiers")) {
        readField(*t, "bayesianMinFiles", config.tiers.bayesianMinFiles);
        readField(*t, "fullMinFiles", config.tiers.fullMinFiles);
    }

    if (const json* n = section(root, "normalization")) {
        readTable(*n, "floors", config.normalization.floors);
        readTable(*n, "absoluteThresholds", config.normalization.absoluteThresholds);
    }

    if (const json* t = section(root, "temporal")) {
        readField(*t, "windowWeeks", config.temporal.windowWeeks);
        readField(*t, "slopeThreshold", config.temporal.slopeThreshold);
        readField(*t, "cvThreshold", config.temporal.cvThreshold);
        readField(*t, "fixKeywords", config.temporal.fixKeywords);
        readField(*t, "refactorKeywords", config.temporal.refactorKeywords);
    }

    if (const json* e = section(root, "execution")) {
        readField(*e, "numThreads", config.execution.numThreads);
        readField(*e, "verbose", config.execution.verbose);
    }

    config.validate();
    return config;
}

FusionConfig FusionConfig::fromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Cannot open config file: " + path);
    }

    json root;
    try {
        file >> root;
    } catch (const json::parse_error& e) {
        throw ConfigError("Malformed config file " + path + ": " + e.what());
    }
    return fromJson(root);
}

json FusionConfig::toJson() const {
    json root;

    root["graph"] = {
        {"damping", graph.damping},
        {"pagerankTolerance", graph.pagerankTolerance},
        {"pagerankMaxIterations", graph.pagerankMaxIterations},
        {"louvainMaxPasses", graph.louvainMaxPasses},
        {"louvainMaxLevels", graph.louvainMaxLevels},
        {"eigenTolerance", graph.eigenTolerance},
        {"eigenMaxIterations", graph.eigenMaxIterations},
        {"denseEigenLimit", graph.denseEigenLimit},
        {"zeroEigenvalueEpsilon", graph.zeroEigenvalueEpsilon}
    };

    root["tiers"] = {
        {"bayesianMinFiles", tiers.bayesianMinFiles},
        {"fullMinFiles", tiers.fullMinFiles}
    };

    root["normalization"] = {
        {"floors", normalization.floors},
        {"absoluteThresholds", normalization.absoluteThresholds}
    };

    root["temporal"] = {
        {"windowWeeks", temporal.windowWeeks},
        {"slopeThreshold", temporal.slopeThreshold},
        {"cvThreshold", temporal.cvThreshold},
        {"fixKeywords", temporal.fixKeywords},
        {"refactorKeywords", temporal.refactorKeywords}
    };

    root["execution"] = {
        {"numThreads", execution.numThreads},
        {"verbose", execution.verbose}
    };

    return root;
}

void FusionConfig::validate() const {
    if (graph.damping <= 0.0 || graph.damping >= 1.0) {
        throw ConfigError("graph.damping must lie in (0, 1)");
    }
    if (graph.pagerankTolerance <= 0.0 || graph.eigenTolerance <= 0.0) {
        throw ConfigError("Convergence tolerances must be positive");
    }
    if (graph.pagerankMaxIterations < 1 || graph.eigenMaxIterations < 1 ||
        graph.louvainMaxPasses < 1 || graph.louvainMaxLevels < 1) {
        throw ConfigError("Iteration caps must be at least 1");
    }
    if (tiers.bayesianMinFiles > tiers.fullMinFiles) {
        throw ConfigError("tiers.bayesianMinFiles must not exceed tiers.fullMinFiles");
    }
    for (const auto& [name, floor] : normalization.floors) {
        if (floor < 0.0) {
            throw ConfigError("Floor for " + name + " must be non-negative");
        }
    }
    for (const auto& [name, threshold] : normalization.absoluteThresholds) {
        if (threshold <= 0.0) {
            throw ConfigError("Absolute threshold for " + name + " must be positive");
        }
    }
    if (temporal.windowWeeks < 1) {
        throw ConfigError("temporal.windowWeeks must be at least 1");
    }
}
