#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "centrality_engine.hpp"
#include "graph_model.hpp"
#include <numeric>
#include <random>

using Catch::Matchers::WithinAbs;

namespace {

GraphModel chain(const std::vector<std::string>& paths) {
    GraphModel graph;
    for (const auto& path : paths) {
        graph.addNode(path);
    }
    for (size_t i = 0; i + 1 < paths.size(); ++i) {
        graph.addEdge(paths[i], paths[i + 1]);
    }
    return graph;
}

double sum(const std::vector<double>& values) {
    return std::accumulate(values.begin(), values.end(), 0.0);
}

} // namespace

TEST_CASE("PageRank sums to one", "[CentralityEngine]") {
    GraphConfig config;
    CentralityEngine engine(config);

    SECTION("Chain with a dangling sink") {
        auto result = engine.pageRank(chain({"a", "b", "c", "d"}).compact());
        REQUIRE(result.converged);
        REQUIRE_THAT(sum(result.scores), WithinAbs(1.0, 1e-6));
        REQUIRE(result.scores[3] > result.scores[0]);
    }

    SECTION("Graph without edges is uniform") {
        GraphModel graph;
        graph.addNode("x");
        graph.addNode("y");
        auto result = engine.pageRank(graph.compact());
        REQUIRE_THAT(result.scores[0], WithinAbs(0.5, 1e-9));
        REQUIRE_THAT(result.scores[1], WithinAbs(0.5, 1e-9));
    }

    SECTION("Random graphs with many dangling nodes") {
        std::mt19937 rng(7);
        for (int trial = 0; trial < 20; ++trial) {
            GraphModel graph;
            const int n = 5 + trial;
            for (int i = 0; i < n; ++i) {
                graph.addNode("f" + std::to_string(i));
            }
            std::uniform_int_distribution<int> pick(0, n - 1);
            for (int e = 0; e < n; ++e) {
                // Only the first half of the nodes ever import, the rest dangle
                int from = pick(rng) / 2;
                graph.addEdge("f" + std::to_string(from), "f" + std::to_string(pick(rng)));
            }
            auto result = engine.pageRank(graph.compact());
            REQUIRE_THAT(sum(result.scores), WithinAbs(1.0, 1e-6));
        }
    }

    SECTION("Empty graph") {
        GraphModel graph;
        REQUIRE(engine.pageRank(graph.compact()).scores.empty());
    }
}

TEST_CASE("PageRank reports hitting the iteration cap", "[CentralityEngine]") {
    GraphConfig config;
    config.pagerankMaxIterations = 1;
    CentralityEngine engine(config);

    auto result = engine.pageRank(chain({"a", "b", "c"}).compact());
    REQUIRE_FALSE(result.converged);
    REQUIRE(result.iterations == 1);
    REQUIRE_THAT(sum(result.scores), WithinAbs(1.0, 1e-6));
}

TEST_CASE("Betweenness is normalized by (N-1)(N-2)", "[CentralityEngine]") {
    GraphConfig config;
    CentralityEngine engine(config);

    SECTION("Middle of a three-node path") {
        auto scores = engine.betweenness(chain({"a", "b", "c"}).compact());
        // Arcs are directed: only a -> c passes through b, c -> a does not exist
        REQUIRE_THAT(scores[0], WithinAbs(0.0, 1e-12));
        REQUIRE_THAT(scores[1], WithinAbs(0.5, 1e-12));
        REQUIRE_THAT(scores[2], WithinAbs(0.0, 1e-12));
    }

    SECTION("Fewer than three nodes give zeros") {
        auto scores = engine.betweenness(chain({"a", "b"}).compact());
        REQUIRE(scores == std::vector<double>{0.0, 0.0});
    }

    SECTION("Scores stay in [0, 1]") {
        auto scores = engine.betweenness(chain({"a", "b", "c", "d", "e"}).compact());
        for (double s : scores) {
            REQUIRE(s >= 0.0);
            REQUIRE(s <= 1.0);
        }
        REQUIRE(scores[2] > scores[1]);
    }
}
