#pragma once

#include <string>
#include <vector>
#include <map>
#include <cstdint>
#include "graph_model.hpp"
#include "centrality_engine.hpp"
#include "community_detector.hpp"
#include "spectral_analyzer.hpp"
#include "measurements.hpp"
#include "fusion_config.hpp"

// Per-file graph and complexity measurements
struct FileGraphMetrics {
    double pagerank = 0.0;
    double betweenness = 0.0;
    int64_t inDegree = 0;
    int64_t outDegree = 0;
    int64_t blastRadiusSize = 0;
    int64_t depth = -1;
    bool isOrphan = false;
    int64_t phantomImportCount = 0;
    int community = 0;
    double implGini = 0.0;
    double cognitiveLoad = 0.0;
};

struct GraphAnalysis {
    GraphModel graph;
    std::map<std::string, FileGraphMetrics> files;

    CommunityResult communities;
    std::vector<std::vector<std::string>> communityMembers;
    std::vector<std::vector<std::string>> cycles;   // SCCs with more than one file
    SpectralResult spectral;
    PageRankResult pagerankInfo;

    double centralityGini = 0.0;
    std::vector<std::string> entryPoints;
    std::string entryPointSource;   // "role", "root_importers" or "none"

    // Degradations worth surfacing in provenance
    std::vector<std::string> approximations;
};

// Runs the graph algorithms over a snapshot before the fusion pipeline starts
class GraphAnalyzer {
public:
    explicit GraphAnalyzer(const GraphConfig& config);

    // Declare every snapshot file, then add edges. Undeclared targets become phantoms.
    static GraphModel buildGraph(const CodebaseSnapshot& snapshot);

    GraphAnalysis analyze(const CodebaseSnapshot& snapshot) const;

    // Gini of function sizes, 0 with fewer than two functions
    static double implementationGini(const StructuralRecord& structural);

    // log2(lines + 1) * (1 + complexity / 10) * (1 + nesting / 5) * (1 + impl_gini)
    static double cognitiveLoad(const StructuralRecord& structural);

private:
    GraphConfig config_;

    std::vector<std::string> findEntryPoints(const CodebaseSnapshot& snapshot,
                                             const GraphModel& graph, std::string& source) const;
};
