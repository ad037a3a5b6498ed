#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "fusion_pipeline.hpp"
#include "test_snapshots.hpp"
#include <cmath>

using Catch::Matchers::WithinAbs;

namespace {

FusionResult fuse(const CodebaseSnapshot& snapshot, unsigned int threads = 2,
                  const CancellationToken* cancel = nullptr) {
    FusionConfig config;
    GraphAnalysis graph = GraphAnalyzer(config.graph).analyze(snapshot);
    TemporalAnalysis temporal = TemporalAnalyzer(config.temporal).analyze(snapshot);
    ArchitectureAnalysis architecture = ArchitectureAnalyzer().analyze(snapshot, graph);

    StageExecutor executor(threads);
    FusionPipeline pipeline(config, executor);
    return pipeline.run({snapshot, graph, temporal, architecture}, cancel);
}

std::string chainPath(size_t i) {
    return "src/f" + std::to_string(100 + i) + ".py";
}

// src/f100.py -> src/f101.py -> ...; file i has i commits
CodebaseSnapshot chainSnapshot(size_t n) {
    CodebaseSnapshot snapshot;
    for (size_t i = 0; i < n; ++i) {
        std::string path = chainPath(i);
        addFile(snapshot, path, 100 + 10 * static_cast<int64_t>(i));
        for (size_t j = 0; j < i; ++j) {
            addCommit(snapshot, path, path + "#" + std::to_string(j), "dev" + std::to_string(j % 3),
                      kEpoch + static_cast<int64_t>(j) * kWeek, j % 2 ? "fix typo" : "add feature");
        }
        if (i > 0) {
            addEdge(snapshot, chainPath(i - 1), path);
        }
    }
    snapshot.reconcileTemporal();
    return snapshot;
}

} // namespace

TEST_CASE("Pipeline runs every stage in order", "[FusionPipeline]") {
    FusionResult result = fuse(chainSnapshot(20));
    const Provenance& p = result.provenance;

    REQUIRE_FALSE(p.cancelled);
    REQUIRE(p.stagesCompleted == std::vector<Stage>{
        Stage::Collect, Stage::RawRisk, Stage::Normalize,
        Stage::ModuleTemporal, Stage::Composites, Stage::HealthLaplacian});
    REQUIRE(p.stageDurations.size() == 6);
    REQUIRE(p.tier == Tier::Bayesian);

    const SignalField& field = result.field;
    for (size_t i = 0; i < 20; ++i) {
        std::string path = chainPath(i);
        REQUIRE(field.has(SignalScope::File, path, "raw_risk"));
        REQUIRE(field.has(SignalScope::File, path, "risk_score_display"));
        REQUIRE(field.has(SignalScope::File, path, "delta_h"));
        REQUIRE(field.text(SignalScope::File, path, "parent_dir") == "src");
    }
    REQUIRE(field.text(SignalScope::Global, GLOBAL_ENTITY, "tier") == "BAYESIAN");
    REQUIRE(field.globalNumber("file_count") == 20.0);
    REQUIRE(field.number(SignalScope::Directory, "src", "file_count") == 20.0);
    REQUIRE(field.has(SignalScope::Module, "src", "health_score"));
    REQUIRE(field.has(SignalScope::Module, "src", "velocity"));
}

TEST_CASE("Percentiles depend on the population tier", "[FusionPipeline]") {
    SECTION("14 files: ABSOLUTE, no percentiles") {
        FusionResult result = fuse(chainSnapshot(14));
        REQUIRE(result.provenance.tier == Tier::Absolute);
        for (size_t i = 0; i < 14; ++i) {
            REQUIRE(result.field.hasPercentile(chainPath(i), "pagerank"));
            REQUIRE_FALSE(result.field.percentile(chainPath(i), "pagerank").has_value());
            REQUIRE_FALSE(result.field.percentile(chainPath(i), "lines").has_value());
        }
    }

    SECTION("15 files: BAYESIAN, percentiles in [0, 1]") {
        FusionResult result = fuse(chainSnapshot(15));
        REQUIRE(result.provenance.tier == Tier::Bayesian);
        for (size_t i = 0; i < 15; ++i) {
            auto pct = result.field.percentile(chainPath(i), "lines");
            REQUIRE(pct.has_value());
            REQUIRE(*pct >= 0.0);
            REQUIRE(*pct <= 1.0);
            REQUIRE(result.field.percentile(chainPath(i), "depth").has_value());
        }
        // lines grow along the chain, so the first file ranks lowest
        REQUIRE(result.field.percentile(chainPath(0), "lines") == 0.0);
        REQUIRE_THAT(*result.field.percentile(chainPath(14), "lines"), WithinAbs(14.0 / 15.0, 1e-12));
    }

    SECTION("50 files: FULL") {
        REQUIRE(fuse(chainSnapshot(50)).provenance.tier == Tier::Full);
    }
}

TEST_CASE("Pipeline output does not depend on the thread count", "[FusionPipeline]") {
    CodebaseSnapshot snapshot = chainSnapshot(30);
    FusionResult single = fuse(snapshot, 1);
    FusionResult parallel = fuse(snapshot, 8);

    for (SignalScope scope : {SignalScope::File, SignalScope::Directory, SignalScope::Module, SignalScope::Global}) {
        REQUIRE(single.field.entities(scope) == parallel.field.entities(scope));
    }
    REQUIRE(single.field.percentiles() == parallel.field.percentiles());
    REQUIRE(single.deltaH == parallel.deltaH);
    REQUIRE(single.communities == parallel.communities);
}

TEST_CASE("Triangle with an isolated file", "[FusionPipeline]") {
    CodebaseSnapshot snapshot;
    addFile(snapshot, "a.py", 100);
    addFile(snapshot, "b.py", 100);
    addFile(snapshot, "c.py", 100);
    addFile(snapshot, "d.py", 100);
    addEdge(snapshot, "a.py", "b.py");
    addEdge(snapshot, "b.py", "c.py");
    addEdge(snapshot, "c.py", "a.py");

    FusionResult result = fuse(snapshot);
    const SignalField& field = result.field;

    REQUIRE(result.provenance.tier == Tier::Absolute);
    REQUIRE(result.communities.size() == 2);
    REQUIRE(field.globalNumber("community_count") == 2.0);
    REQUIRE(field.globalNumber("component_count") == 2.0);
    REQUIRE(field.globalNumber("fiedler_value") == 0.0);
    REQUIRE(field.globalNumber("cycle_count") == 1.0);
    REQUIRE_THAT(*field.globalNumber("orphan_ratio"), WithinAbs(0.25, 1e-12));

    REQUIRE(field.fileNumber("d.py", "is_orphan") == 1.0);
    REQUIRE(field.fileNumber("a.py", "is_orphan") == 0.0);
    REQUIRE(field.fileNumber("d.py", "delta_h") == 0.0);
    REQUIRE(field.number(SignalScope::Directory, ".", "file_count") == 4.0);

    SECTION("Files that never changed carry no risk") {
        for (const char* path : {"a.py", "b.py", "c.py", "d.py"}) {
            REQUIRE(field.fileNumber(path, "risk_score") == 0.0);
            REQUIRE(field.fileNumber(path, "risk_score_display") == 1.0);
        }
    }

    SECTION("Symmetric files share their raw risk") {
        REQUIRE_THAT(*field.fileNumber("a.py", "delta_h"), WithinAbs(0.0, 1e-9));
    }

    SECTION("Missing entry points are reported") {
        REQUIRE_FALSE(result.provenance.warnings.empty());
    }
}

TEST_CASE("Single unchanged file still gets a codebase health", "[FusionPipeline]") {
    CodebaseSnapshot snapshot;
    addFile(snapshot, "main.py", 50);

    FusionResult result = fuse(snapshot);
    const SignalField& field = result.field;

    REQUIRE(field.fileNumber("main.py", "risk_score") == 0.0);

    auto health = field.globalNumber("codebase_health");
    REQUIRE(health.has_value());
    REQUIRE(std::isfinite(*health));
    // 0.5 * wiring (1 - 0.25 orphan - 0.20 glue) + 0.5 * bus factor ratio 1
    REQUIRE_THAT(*health, WithinAbs(0.775, 1e-9));
    REQUIRE_THAT(*field.globalNumber("codebase_health_display"), WithinAbs(8.0, 1e-9));

    REQUIRE(field.globalNumber("architecture_health").has_value());
    REQUIRE(field.globalNumber("team_size") == 1.0);
}

TEST_CASE("Small snapshots on a large pool report no thread fallback", "[FusionPipeline]") {
    CodebaseSnapshot snapshot;
    addFile(snapshot, "main.py", 50);

    for (unsigned int threads : {1u, 8u}) {
        FusionResult result = fuse(snapshot, threads);
        for (const auto& warning : result.provenance.warnings) {
            REQUIRE(warning.find("worker threads") == std::string::npos);
        }
    }
}

TEST_CASE("One author per file makes every bus factor one", "[FusionPipeline]") {
    CodebaseSnapshot snapshot;
    for (int pkg = 0; pkg < 10; ++pkg) {
        for (int f = 0; f < 10; ++f) {
            int index = pkg * 10 + f;
            std::string path = "pkg" + std::to_string(pkg) + "/f" + std::to_string(f) + ".py";
            addFile(snapshot, path, 120);
            addCommit(snapshot, path, "c" + std::to_string(index), "author" + std::to_string(index),
                      kEpoch + index * 3600, "add module");
            if (f > 0) {
                addEdge(snapshot, "pkg" + std::to_string(pkg) + "/f" + std::to_string(f - 1) + ".py", path);
            }
        }
    }
    snapshot.reconcileTemporal();

    FusionResult result = fuse(snapshot, 4);
    const SignalField& field = result.field;

    REQUIRE(result.provenance.tier == Tier::Full);
    REQUIRE(field.globalNumber("team_size") == 100.0);
    for (const auto& [path, signals] : field.entities(SignalScope::File)) {
        REQUIRE(field.fileNumber(path, "bus_factor") == 1.0);
    }

    // Ten authors over ten commits in every module, no cross-module edges
    REQUIRE(field.moduleNumber("pkg0", "coordination_cost") == 1.0);
    REQUIRE(field.moduleNumber("pkg0", "knowledge_gini") == 0.0);
    REQUIRE(field.moduleNumber("pkg0", "module_bus_factor") == 1.0);

    auto teamRisk = field.globalNumber("team_risk");
    REQUIRE(*teamRisk >= 0.2);
    REQUIRE_THAT(*teamRisk, WithinAbs(0.25, 1e-9));
}

TEST_CASE("Cancelled pipeline returns what it finished", "[FusionPipeline]") {
    CancellationToken token;
    token.cancel();

    FusionResult result = fuse(chainSnapshot(20), 2, &token);

    REQUIRE(result.provenance.cancelled);
    REQUIRE(result.provenance.stagesCompleted.empty());
    REQUIRE(result.field.valueCount() == 0);
    REQUIRE_FALSE(result.communities.empty());
}
