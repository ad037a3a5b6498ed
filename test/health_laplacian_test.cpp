#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "health_laplacian.hpp"

using Catch::Matchers::WithinAbs;

namespace {

// hub.py is imported by a.py and b.py; lonely.py has no edges
GraphModel starWithOrphan() {
    GraphModel graph;
    for (const char* path : {"a.py", "b.py", "hub.py", "lonely.py"}) {
        graph.addNode(path);
    }
    graph.addEdge("a.py", "hub.py");
    graph.addEdge("b.py", "hub.py");
    return graph;
}

} // namespace

TEST_CASE("Health laplacian compares a file with its neighbors", "[HealthLaplacian]") {
    GraphModel graph = starWithOrphan();
    std::map<std::string, std::optional<double>> risk = {
        {"a.py", 0.2},
        {"b.py", 0.4},
        {"hub.py", 0.9},
        {"lonely.py", 0.7}
    };

    auto delta = healthLaplacian(graph, risk);

    REQUIRE(delta.size() == 4);
    REQUIRE_THAT(*delta["hub.py"], WithinAbs(0.9 - 0.3, 1e-12));
    REQUIRE_THAT(*delta["a.py"], WithinAbs(0.2 - 0.9, 1e-12));
    REQUIRE_THAT(*delta["b.py"], WithinAbs(0.4 - 0.9, 1e-12));

    SECTION("A file without neighbors is exactly zero") {
        REQUIRE(delta["lonely.py"] == 0.0);
    }

    SECTION("Outliers stand out against a calm neighborhood") {
        REQUIRE(*delta["hub.py"] > 0.0);
        REQUIRE(*delta["a.py"] < 0.0);
        REQUIRE(*delta["hub.py"] != -*delta["a.py"]);
    }
}

TEST_CASE("Health laplacian propagates missing raw risk", "[HealthLaplacian]") {
    GraphModel graph = starWithOrphan();

    SECTION("Own raw risk missing gives null") {
        std::map<std::string, std::optional<double>> risk = {
            {"a.py", 0.2}, {"b.py", 0.4}, {"hub.py", std::nullopt}
        };
        auto delta = healthLaplacian(graph, risk);
        REQUIRE_FALSE(delta["hub.py"].has_value());
        REQUIRE_FALSE(delta["a.py"].has_value());
        REQUIRE(delta["lonely.py"] == 0.0);
    }

    SECTION("Null neighbors are left out of the mean") {
        std::map<std::string, std::optional<double>> risk = {
            {"a.py", 0.2}, {"b.py", std::nullopt}, {"hub.py", 0.5}
        };
        auto delta = healthLaplacian(graph, risk);
        REQUIRE_THAT(*delta["hub.py"], WithinAbs(0.3, 1e-12));
    }
}
