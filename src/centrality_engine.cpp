#include "centrality_engine.hpp"
#include <algorithm>
#include <cmath>
#include <deque>

CentralityEngine::CentralityEngine(const GraphConfig& config)
    : config_(config) {}

/**
 * @brief Compute PageRank by power iteration
 *
 * PR(v) = (1 - d) / N + d * (sum over u -> v of PR(u) / outdeg(u) + dangling / N)
 *
 * Nodes are visited in id order, so the result depends only on the edge set.
 * A final renormalization removes floating-point drift from the unit sum.
 */
PageRankResult CentralityEngine::pageRank(const CompactGraph& graph) const {
    PageRankResult result;
    const size_t n = graph.size();
    if (n == 0) {
        return result;
    }

    const double d = config_.damping;
    const double uniform = 1.0 / static_cast<double>(n);
    std::vector<double> rank(n, uniform);
    std::vector<double> next(n, 0.0);

    result.converged = false;
    for (int iter = 1; iter <= config_.pagerankMaxIterations; ++iter) {
        double dangling = 0.0;
        for (size_t u = 0; u < n; ++u) {
            if (graph.out[u].empty()) {
                dangling += rank[u];
            }
        }

        const double base = (1.0 - d) * uniform + d * dangling * uniform;
        std::fill(next.begin(), next.end(), base);
        for (size_t u = 0; u < n; ++u) {
            const auto& arcs = graph.out[u];
            if (arcs.empty()) {
                continue;
            }
            double share = d * rank[u] / static_cast<double>(arcs.size());
            for (const auto& arc : arcs) {
                next[arc.target] += share;
            }
        }

        double maxDelta = 0.0;
        for (size_t v = 0; v < n; ++v) {
            maxDelta = std::max(maxDelta, std::fabs(next[v] - rank[v]));
        }
        rank.swap(next);
        result.iterations = iter;

        if (maxDelta < config_.pagerankTolerance) {
            result.converged = true;
            break;
        }
    }

    double total = 0.0;
    for (double r : rank) {
        total += r;
    }
    if (total > 0.0) {
        for (auto& r : rank) {
            r /= total;
        }
    }

    result.scores = std::move(rank);
    return result;
}

/**
 * @brief Brandes' betweenness centrality for a directed, unweighted graph
 *
 * One BFS per source accumulates shortest-path counts (sigma), then dependencies
 * (delta) are back-propagated in reverse BFS order.
 */
std::vector<double> CentralityEngine::betweenness(const CompactGraph& graph) const {
    const size_t n = graph.size();
    std::vector<double> centrality(n, 0.0);
    if (n < 3) {
        return centrality;
    }

    std::vector<std::vector<size_t>> predecessors(n);
    std::vector<double> sigma(n);
    std::vector<int> dist(n);
    std::vector<double> delta(n);
    std::vector<size_t> order;
    order.reserve(n);

    for (size_t s = 0; s < n; ++s) {
        for (auto& p : predecessors) {
            p.clear();
        }
        std::fill(sigma.begin(), sigma.end(), 0.0);
        std::fill(dist.begin(), dist.end(), -1);
        std::fill(delta.begin(), delta.end(), 0.0);
        order.clear();

        sigma[s] = 1.0;
        dist[s] = 0;
        std::deque<size_t> queue{s};

        while (!queue.empty()) {
            size_t v = queue.front();
            queue.pop_front();
            order.push_back(v);
            for (const auto& arc : graph.out[v]) {
                size_t w = arc.target;
                if (dist[w] < 0) {
                    dist[w] = dist[v] + 1;
                    queue.push_back(w);
                }
                if (dist[w] == dist[v] + 1) {
                    sigma[w] += sigma[v];
                    predecessors[w].push_back(v);
                }
            }
        }

        for (auto it = order.rbegin(); it != order.rend(); ++it) {
            size_t w = *it;
            for (size_t v : predecessors[w]) {
                delta[v] += (sigma[v] / sigma[w]) * (1.0 + delta[w]);
            }
            if (w != s) {
                centrality[w] += delta[w];
            }
        }
    }

    const double scale = 1.0 / (static_cast<double>(n - 1) * static_cast<double>(n - 2));
    for (auto& c : centrality) {
        c = std::min(1.0, c * scale);
    }
    return centrality;
}
