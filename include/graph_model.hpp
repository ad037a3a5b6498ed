#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <cstdint>
#include "signal_types.hpp"

// Dense, index-based view of a GraphModel used by the numeric algorithms.
// Node ids follow the lexicographic order of the paths, so every algorithm that
// iterates ids breaks ties by node identity.
struct CompactGraph {
    struct Arc {
        size_t target;
        double weight;
    };

    std::vector<std::string> names;
    std::vector<std::vector<Arc>> out;   // self-loops excluded, sorted by target id
    std::vector<std::vector<Arc>> in;    // self-loops excluded, sorted by source id
    std::vector<double> selfLoopWeight;

    size_t size() const { return names.size(); }
};

// Directed multigraph of files (importer -> imported). Parallel edges between the
// same pair collapse into one logical edge whose weight is the summed reference count.
class GraphModel {
public:
    struct Edge {
        std::string source;
        std::string target;
        int64_t weight = 0;
    };

    GraphModel() = default;

    // Declare a node. Returns false if the path was already declared.
    bool addNode(const std::string& path);

    // Add a dependency reference. An edge whose target was never declared is
    // dropped and counted as a phantom import on the source.
    void addEdge(const std::string& from, const std::string& to, int64_t weight = 1);

    bool hasNode(const std::string& path) const;
    size_t nodeCount() const { return nodes_.size(); }

    // Number of logical edges, self-loops included
    size_t edgeCount() const;

    // All node paths in lexicographic order
    std::vector<std::string> nodes() const;

    // All logical edges ordered by (source, target)
    std::vector<Edge> edges() const;

    // Summed reference count of the logical edge, 0 if absent
    int64_t edgeWeight(const std::string& from, const std::string& to) const;

    // Distinct neighbors in lexicographic order. Self-loops are never reported.
    std::vector<std::string> neighbors(const std::string& path, Direction direction) const;

    size_t inDegree(const std::string& path) const;
    size_t outDegree(const std::string& path) const;
    bool hasSelfLoop(const std::string& path) const;

    int64_t phantomImportCount(const std::string& path) const;
    std::vector<std::string> phantomTargets(const std::string& path) const;

    // Edges whose source was never declared (no node to charge the phantom to)
    size_t droppedEdgeCount() const { return droppedEdges_; }

    // Everything transitively depending on path: closure over predecessors, path excluded
    std::set<std::string> blastRadius(const std::string& path) const;

    // Tarjan's algorithm. Components are returned in discovery order,
    // members sorted lexicographically.
    std::vector<std::vector<std::string>> stronglyConnectedComponents() const;

    // BFS hop distance along import edges from the nearest entry point, -1 if unreachable
    std::map<std::string, int> depthFromEntryPoints(const std::set<std::string>& entrySet) const;

    // Connected components of the undirected view, sorted by their smallest member
    std::vector<std::vector<std::string>> weaklyConnectedComponents() const;

    CompactGraph compact() const;

private:
    struct Node {
        std::map<std::string, int64_t> out;
        std::map<std::string, int64_t> in;
        std::map<std::string, int64_t> phantoms;   // unresolved target -> reference count
    };

    std::map<std::string, Node> nodes_;
    size_t droppedEdges_ = 0;

    const Node* find(const std::string& path) const;
};
