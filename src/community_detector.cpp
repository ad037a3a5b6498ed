#include "community_detector.hpp"
#include <map>
#include <algorithm>

namespace {

constexpr double GAIN_EPSILON = 1e-12;

// Undirected weighted graph of one Louvain level. A super-node's internal weight
// is kept as a self-loop that contributes twice to its degree.
struct LevelGraph {
    std::vector<std::map<size_t, double>> adj;   // neighbor -> weight, no self entries
    std::vector<double> selfLoop;

    size_t size() const { return adj.size(); }

    double degree(size_t i) const {
        double k = 2.0 * selfLoop[i];
        for (const auto& [j, w] : adj[i]) {
            k += w;
        }
        return k;
    }
};

LevelGraph undirectedView(const CompactGraph& graph) {
    LevelGraph level;
    level.adj.resize(graph.size());
    level.selfLoop.assign(graph.size(), 0.0);
    for (size_t i = 0; i < graph.size(); ++i) {
        for (const auto& arc : graph.out[i]) {
            level.adj[i][arc.target] += arc.weight;
            level.adj[arc.target][i] += arc.weight;
        }
    }
    return level;
}

// Renumber communities 0..k-1 in order of their lowest member
int compactLabels(std::vector<int>& labels) {
    std::map<int, int> remap;
    for (auto& label : labels) {
        auto it = remap.find(label);
        if (it == remap.end()) {
            it = remap.emplace(label, static_cast<int>(remap.size())).first;
        }
        label = it->second;
    }
    return static_cast<int>(remap.size());
}

struct LocalMoveResult {
    bool moved = false;
    bool exhausted = false;   // stopped by the pass cap while still improving
};

LocalMoveResult moveNodes(const LevelGraph& level, double twoM, int maxPasses, std::vector<int>& community) {
    const size_t n = level.size();
    std::vector<double> degree(n);
    std::vector<double> total(n, 0.0);
    for (size_t i = 0; i < n; ++i) {
        degree[i] = level.degree(i);
        total[community[i]] += degree[i];
    }

    LocalMoveResult result;
    for (int pass = 0; pass < maxPasses; ++pass) {
        bool improved = false;

        for (size_t i = 0; i < n; ++i) {
            if (degree[i] == 0.0) {
                continue;
            }
            const int current = community[i];

            std::map<int, double> linkWeight;
            linkWeight[current] = 0.0;
            for (const auto& [j, w] : level.adj[i]) {
                linkWeight[community[j]] += w;
            }

            total[current] -= degree[i];

            auto gain = [&](int c) {
                return linkWeight[c] - total[c] * degree[i] / twoM;
            };

            int best = current;
            double bestGain = gain(current);
            for (const auto& [c, w] : linkWeight) {
                if (c == current) {
                    continue;
                }
                double g = gain(c);
                if (g > bestGain + GAIN_EPSILON) {
                    best = c;
                    bestGain = g;
                }
            }

            total[best] += degree[i];
            if (best != current) {
                community[i] = best;
                improved = true;
                result.moved = true;
            }
        }

        if (!improved) {
            return result;
        }
    }

    result.exhausted = true;
    return result;
}

LevelGraph aggregate(const LevelGraph& level, const std::vector<int>& community, int count) {
    LevelGraph next;
    next.adj.resize(count);
    next.selfLoop.assign(count, 0.0);

    for (size_t i = 0; i < level.size(); ++i) {
        size_t ci = static_cast<size_t>(community[i]);
        next.selfLoop[ci] += level.selfLoop[i];
        for (const auto& [j, w] : level.adj[i]) {
            size_t cj = static_cast<size_t>(community[j]);
            if (ci == cj) {
                // Each undirected internal edge is seen from both ends
                next.selfLoop[ci] += w / 2.0;
            } else {
                next.adj[ci][cj] += w;
            }
        }
    }
    return next;
}

} // namespace

std::vector<std::vector<std::string>> CommunityResult::communities(const CompactGraph& graph) const {
    std::vector<std::vector<std::string>> result(static_cast<size_t>(communityCount));
    for (size_t i = 0; i < membership.size() && i < graph.size(); ++i) {
        result[static_cast<size_t>(membership[i])].push_back(graph.names[i]);
    }
    return result;
}

CommunityDetector::CommunityDetector(const GraphConfig& config)
    : config_(config) {}

CommunityResult CommunityDetector::detect(const CompactGraph& graph) const {
    CommunityResult result;
    const size_t n = graph.size();
    result.membership.resize(n);
    for (size_t i = 0; i < n; ++i) {
        result.membership[i] = static_cast<int>(i);
    }
    result.communityCount = static_cast<int>(n);
    if (n == 0) {
        return result;
    }

    LevelGraph level = undirectedView(graph);
    double twoM = 0.0;
    for (size_t i = 0; i < level.size(); ++i) {
        twoM += level.degree(i);
    }
    if (twoM == 0.0) {
        // No edges: every file is its own community and Q = 0
        return result;
    }

    for (int lvl = 0; lvl < config_.louvainMaxLevels; ++lvl) {
        std::vector<int> community(level.size());
        for (size_t i = 0; i < level.size(); ++i) {
            community[i] = static_cast<int>(i);
        }

        LocalMoveResult moves = moveNodes(level, twoM, config_.louvainMaxPasses, community);
        if (moves.exhausted) {
            result.converged = false;
        }
        if (!moves.moved) {
            break;
        }

        int count = compactLabels(community);
        for (auto& label : result.membership) {
            label = community[static_cast<size_t>(label)];
        }
        result.levels = lvl + 1;

        if (lvl + 1 == config_.louvainMaxLevels) {
            result.converged = false;
            break;
        }
        level = aggregate(level, community, count);
    }

    result.communityCount = compactLabels(result.membership);
    result.modularity = modularity(graph, result.membership);
    return result;
}

double CommunityDetector::modularity(const CompactGraph& graph, const std::vector<int>& membership) {
    double m = 0.0;
    std::map<int, double> internal;
    std::map<int, double> total;

    for (size_t i = 0; i < graph.size(); ++i) {
        for (const auto& arc : graph.out[i]) {
            m += arc.weight;
            total[membership[i]] += arc.weight;
            total[membership[arc.target]] += arc.weight;
            if (membership[i] == membership[arc.target]) {
                internal[membership[i]] += arc.weight;
            }
        }
    }
    if (m == 0.0) {
        return 0.0;
    }

    double q = 0.0;
    for (const auto& [c, tot] : total) {
        double in = internal.count(c) ? internal.at(c) : 0.0;
        double share = tot / (2.0 * m);
        q += in / m - share * share;
    }
    return q;
}
