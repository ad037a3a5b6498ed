#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>
#include "graph_analyzer.hpp"
#include "measurements.hpp"

enum class ViolationType {
    Backward,   // lower layer imports a higher one
    Skip        // import jumps over at least one layer
};

struct LayerViolation {
    std::string sourceModule;
    std::string targetModule;
    int sourceLayer = 0;
    int targetLayer = 0;
    ViolationType type = ViolationType::Backward;
    int64_t edgeCount = 0;
};

// Martin metrics and boundary measurements of one module
struct ModuleMetrics {
    std::vector<std::string> files;
    int64_t internalEdges = 0;
    int64_t externalEdges = 0;     // outgoing edges into other modules
    double cohesion = 0.0;
    double coupling = 0.0;
    int64_t afferentCoupling = 0;
    int64_t efferentCoupling = 0;
    std::optional<double> instability;        // null when the module is isolated
    double abstractness = 0.0;
    std::optional<double> mainSeqDistance;    // null when instability is null
    double boundaryAlignment = 0.0;
    double roleConsistency = 0.0;
    FileRole dominantRole = FileRole::Unknown;
    int layer = 0;
    int64_t layerViolationCount = 0;
    double meanCognitiveLoad = 0.0;
};

struct ArchitectureAnalysis {
    std::map<std::string, ModuleMetrics> modules;
    std::map<std::string, std::map<std::string, int64_t>> moduleGraph;   // source -> target -> file edges
    std::vector<LayerViolation> violations;
    double violationRate = 0.0;
    double conwayAlignment = 1.0;
    int maxLayer = 0;
};

// Groups files into modules and measures how the module boundaries behave
class ArchitectureAnalyzer {
public:
    ArchitectureAnalyzer() = default;

    ArchitectureAnalysis analyze(const CodebaseSnapshot& snapshot, const GraphAnalysis& graph) const;

    // 1 - sum(min) / sum(max) over the union of authors, 0 for two empty vectors
    static double weightedJaccardDistance(const std::map<std::string, double>& a,
                                          const std::map<std::string, double>& b);

private:
    void assignLayers(ArchitectureAnalysis& analysis) const;
    void detectViolations(ArchitectureAnalysis& analysis) const;
    double conwayAlignment(const CodebaseSnapshot& snapshot, const ArchitectureAnalysis& analysis) const;
};

std::string violationTypeToString(ViolationType type);
