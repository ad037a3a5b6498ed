#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "graph_analyzer.hpp"
#include "test_snapshots.hpp"

using Catch::Matchers::WithinAbs;

TEST_CASE("Cognitive load grows with size, complexity and nesting", "[GraphAnalyzer]") {
    StructuralRecord structural;
    structural.lines = 7;
    REQUIRE_THAT(GraphAnalyzer::cognitiveLoad(structural), WithinAbs(3.0, 1e-12));

    structural.meanComplexity = 10.0;
    REQUIRE_THAT(GraphAnalyzer::cognitiveLoad(structural), WithinAbs(6.0, 1e-12));

    structural.maxNesting = 5;
    REQUIRE_THAT(GraphAnalyzer::cognitiveLoad(structural), WithinAbs(12.0, 1e-12));

    SECTION("Uneven function sizes add concentration") {
        structural.functionSizes = {10.0};
        REQUIRE(GraphAnalyzer::implementationGini(structural) == 0.0);

        structural.functionSizes = {0.0, 0.0, 0.0, 10.0};
        REQUIRE_THAT(GraphAnalyzer::implementationGini(structural), WithinAbs(0.75, 1e-12));
        REQUIRE_THAT(GraphAnalyzer::cognitiveLoad(structural), WithinAbs(12.0 * 1.75, 1e-9));
    }
}

TEST_CASE("GraphAnalyzer measures a triangle with an isolated file", "[GraphAnalyzer]") {
    CodebaseSnapshot snapshot;
    addFile(snapshot, "a.py", 100);
    addFile(snapshot, "b.py", 100);
    addFile(snapshot, "c.py", 100);
    addFile(snapshot, "d.py", 100);
    addEdge(snapshot, "a.py", "b.py");
    addEdge(snapshot, "b.py", "c.py");
    addEdge(snapshot, "c.py", "a.py");
    addEdge(snapshot, "a.py", "vendor/missing.py");

    GraphAnalysis analysis = GraphAnalyzer(GraphConfig{}).analyze(snapshot);

    REQUIRE(analysis.files.size() == 4);
    REQUIRE(analysis.cycles.size() == 1);
    REQUIRE(analysis.cycles.front() == std::vector<std::string>{"a.py", "b.py", "c.py"});
    REQUIRE(analysis.communityMembers.size() == 2);
    REQUIRE(analysis.spectral.fiedlerValue == 0.0);

    const FileGraphMetrics& a = analysis.files.at("a.py");
    REQUIRE(a.inDegree == 1);
    REQUIRE(a.outDegree == 1);
    REQUIRE(a.blastRadiusSize == 2);
    REQUIRE(a.phantomImportCount == 1);
    REQUIRE_FALSE(a.isOrphan);

    const FileGraphMetrics& d = analysis.files.at("d.py");
    REQUIRE(d.isOrphan);
    REQUIRE(d.blastRadiusSize == 0);
    REQUIRE(d.community != a.community);

    double total = 0.0;
    for (const auto& [path, metrics] : analysis.files) {
        total += metrics.pagerank;
    }
    REQUIRE_THAT(total, WithinAbs(1.0, 1e-6));

    SECTION("No entry point role and no root importer") {
        REQUIRE(analysis.entryPoints.empty());
        REQUIRE(analysis.entryPointSource == "none");
        REQUIRE(d.depth == -1);
    }
}

TEST_CASE("GraphAnalyzer finds entry points", "[GraphAnalyzer]") {
    CodebaseSnapshot snapshot;
    addFile(snapshot, "main.py", 50);
    addFile(snapshot, "lib.py", 50);
    addFile(snapshot, "cli.py", 50, FileRole::EntryPoint);
    addEdge(snapshot, "main.py", "lib.py");

    SECTION("By role") {
        GraphAnalysis analysis = GraphAnalyzer(GraphConfig{}).analyze(snapshot);
        REQUIRE(analysis.entryPointSource == "role");
        REQUIRE(analysis.entryPoints == std::vector<std::string>{"cli.py"});
        REQUIRE_FALSE(analysis.files.at("cli.py").isOrphan);
        REQUIRE(analysis.files.at("main.py").isOrphan);
    }

    SECTION("By importing without being imported") {
        snapshot.files["cli.py"].semantic->role = FileRole::Unknown;
        GraphAnalysis analysis = GraphAnalyzer(GraphConfig{}).analyze(snapshot);
        REQUIRE(analysis.entryPointSource == "root_importers");
        REQUIRE(analysis.entryPoints == std::vector<std::string>{"main.py"});
        REQUIRE(analysis.files.at("main.py").depth == 0);
        REQUIRE(analysis.files.at("lib.py").depth == 1);
    }
}
