#pragma once

#include <vector>
#include "graph_model.hpp"
#include "fusion_config.hpp"

struct PageRankResult {
    std::vector<double> scores;   // indexed by CompactGraph node id, sums to 1
    bool converged = true;
    int iterations = 0;
};

// PageRank and betweenness over the compact graph. Self-loops never contribute.
class CentralityEngine {
public:
    explicit CentralityEngine(const GraphConfig& config);

    // Power iteration. Dangling mass is spread uniformly over all nodes.
    // Stops when the largest per-node change drops below the tolerance or at the
    // iteration cap, in which case converged is false.
    PageRankResult pageRank(const CompactGraph& graph) const;

    // Brandes' algorithm on the unweighted directed graph, normalized by (N-1)(N-2)
    std::vector<double> betweenness(const CompactGraph& graph) const;

private:
    GraphConfig config_;
};
