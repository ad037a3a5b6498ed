#include "graph_analyzer.hpp"
#include "statistics_toolkit.hpp"
#include <cmath>
#include <set>

GraphAnalyzer::GraphAnalyzer(const GraphConfig& config)
    : config_(config) {}

GraphModel GraphAnalyzer::buildGraph(const CodebaseSnapshot& snapshot) {
    GraphModel graph;
    for (const auto& [path, measurements] : snapshot.files) {
        graph.addNode(path);
    }
    for (const auto& edge : snapshot.edges) {
        graph.addEdge(edge.source, edge.target, edge.referenceCount);
    }
    return graph;
}

double GraphAnalyzer::implementationGini(const StructuralRecord& structural) {
    if (structural.functionSizes.size() < 2) {
        return 0.0;
    }
    return gini(structural.functionSizes);
}

double GraphAnalyzer::cognitiveLoad(const StructuralRecord& structural) {
    double size = std::log2(static_cast<double>(structural.lines) + 1.0);
    double complexity = 1.0 + structural.meanComplexity / 10.0;
    double nesting = 1.0 + static_cast<double>(structural.maxNesting) / 5.0;
    double concentration = 1.0 + implementationGini(structural);
    return size * complexity * nesting * concentration;
}

std::vector<std::string> GraphAnalyzer::findEntryPoints(const CodebaseSnapshot& snapshot,
                                                        const GraphModel& graph,
                                                        std::string& source) const {
    std::vector<std::string> entries;
    for (const auto& [path, measurements] : snapshot.files) {
        if (measurements.semantic && measurements.semantic->role == FileRole::EntryPoint) {
            entries.push_back(path);
        }
    }
    if (!entries.empty()) {
        source = "role";
        return entries;
    }

    // Files nobody imports but which import something look like program roots
    for (const auto& path : graph.nodes()) {
        if (graph.inDegree(path) == 0 && graph.outDegree(path) > 0) {
            entries.push_back(path);
        }
    }
    source = entries.empty() ? "none" : "root_importers";
    return entries;
}

GraphAnalysis GraphAnalyzer::analyze(const CodebaseSnapshot& snapshot) const {
    GraphAnalysis analysis;
    analysis.graph = buildGraph(snapshot);
    const GraphModel& graph = analysis.graph;
    CompactGraph compact = graph.compact();

    CentralityEngine centrality(config_);
    analysis.pagerankInfo = centrality.pageRank(compact);
    std::vector<double> betweenness = centrality.betweenness(compact);
    if (!analysis.pagerankInfo.converged) {
        analysis.approximations.push_back("pagerank did not converge in " +
                                          std::to_string(analysis.pagerankInfo.iterations) + " iterations");
    }

    CommunityDetector detector(config_);
    analysis.communities = detector.detect(compact);
    analysis.communityMembers = analysis.communities.communities(compact);
    if (!analysis.communities.converged) {
        analysis.approximations.push_back("louvain stopped at its pass or level cap");
    }

    SpectralAnalyzer spectral(config_);
    analysis.spectral = spectral.analyze(compact);
    if (analysis.spectral.approximate) {
        analysis.approximations.push_back("eigensolver did not converge in " +
                                          std::to_string(analysis.spectral.iterations) + " iterations");
    }

    for (auto& component : graph.stronglyConnectedComponents()) {
        if (component.size() > 1) {
            analysis.cycles.push_back(std::move(component));
        }
    }

    analysis.entryPoints = findEntryPoints(snapshot, graph, analysis.entryPointSource);
    std::map<std::string, int> depth = graph.depthFromEntryPoints(
        std::set<std::string>(analysis.entryPoints.begin(), analysis.entryPoints.end()));

    for (size_t i = 0; i < compact.size(); ++i) {
        const std::string& path = compact.names[i];
        const FileMeasurements& measurements = snapshot.files.at(path);

        FileGraphMetrics metrics;
        metrics.pagerank = analysis.pagerankInfo.scores[i];
        metrics.betweenness = betweenness[i];
        metrics.inDegree = static_cast<int64_t>(graph.inDegree(path));
        metrics.outDegree = static_cast<int64_t>(graph.outDegree(path));
        metrics.blastRadiusSize = static_cast<int64_t>(graph.blastRadius(path).size());
        metrics.depth = depth.at(path);
        metrics.phantomImportCount = graph.phantomImportCount(path);
        metrics.community = analysis.communities.membership[i];

        FileRole role = measurements.semantic ? measurements.semantic->role : FileRole::Unknown;
        metrics.isOrphan = metrics.inDegree == 0 && !isOrphanExempt(role);

        if (measurements.structural) {
            metrics.implGini = implementationGini(*measurements.structural);
            metrics.cognitiveLoad = cognitiveLoad(*measurements.structural);
        }

        analysis.files.emplace(path, metrics);
    }

    analysis.centralityGini = gini(analysis.pagerankInfo.scores);
    return analysis;
}
