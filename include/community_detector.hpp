#pragma once

#include <vector>
#include <string>
#include "graph_model.hpp"
#include "fusion_config.hpp"

struct CommunityResult {
    std::vector<int> membership;   // community id per CompactGraph node id
    int communityCount = 0;
    double modularity = 0.0;       // Q of the final partition on the original graph
    int levels = 0;
    bool converged = true;         // false when a pass or level cap stopped the search

    // Member paths of each community, communities ordered by id
    std::vector<std::vector<std::string>> communities(const CompactGraph& graph) const;
};

// Louvain modularity optimization on the undirected weighted view of the graph.
// Node visitation order is the node id order, so a fixed edge set always yields
// the same partition. A different valid order may legitimately give a different
// partition of similar modularity.
class CommunityDetector {
public:
    explicit CommunityDetector(const GraphConfig& config);

    CommunityResult detect(const CompactGraph& graph) const;

    // Q = sum over communities of (in_c / m - (tot_c / 2m)^2), 0 when the graph has no edges
    static double modularity(const CompactGraph& graph, const std::vector<int>& membership);

private:
    GraphConfig config_;
};
