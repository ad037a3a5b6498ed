#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "temporal_analyzer.hpp"
#include "test_snapshots.hpp"

using Catch::Matchers::WithinAbs;

TEST_CASE("Trajectory classification", "[TemporalAnalyzer]") {
    TemporalAnalyzer analyzer(TemporalConfig{});

    REQUIRE(analyzer.classify(0, 0.0, std::nullopt) == ChurnTrajectory::Dormant);
    REQUIRE(analyzer.classify(1, 2.0, 3.0) == ChurnTrajectory::Dormant);
    REQUIRE(analyzer.classify(5, 0.0, std::nullopt) == ChurnTrajectory::Stable);
    REQUIRE(analyzer.classify(5, 0.0, 0.0) == ChurnTrajectory::Dormant);
    REQUIRE(analyzer.classify(5, -0.5, 0.3) == ChurnTrajectory::Stabilizing);
    REQUIRE(analyzer.classify(5, 0.5, 0.8) == ChurnTrajectory::Spiking);
    REQUIRE(analyzer.classify(5, 0.0, 0.8) == ChurnTrajectory::Churning);
    REQUIRE(analyzer.classify(5, -0.5, 0.8) == ChurnTrajectory::Churning);
    REQUIRE(analyzer.classify(5, 0.05, 0.2) == ChurnTrajectory::Stable);
}

TEST_CASE("Commit message keywords", "[TemporalAnalyzer]") {
    TemporalConfig config;
    REQUIRE(TemporalAnalyzer::matchesAny("Fix crash on empty input", config.fixKeywords));
    REQUIRE(TemporalAnalyzer::matchesAny("HOTFIX: null pointer", config.fixKeywords));
    REQUIRE_FALSE(TemporalAnalyzer::matchesAny("Add export command", config.fixKeywords));
    REQUIRE(TemporalAnalyzer::matchesAny("Clean up the parser", config.refactorKeywords));
    REQUIRE_FALSE(TemporalAnalyzer::matchesAny("anything", {}));
}

TEST_CASE("TemporalAnalyzer windows the shared history", "[TemporalAnalyzer]") {
    CodebaseSnapshot snapshot;
    addFile(snapshot, "a.py", 100);
    addFile(snapshot, "b.py", 100);
    addFile(snapshot, "c.py", 100);

    // a.py changes four times in the first window, b.py once two windows later
    addCommit(snapshot, "a.py", "c1", "alice", kEpoch, "fix bug in loader");
    addCommit(snapshot, "a.py", "c2", "bob", kEpoch + kWeek, "add feature");
    addCommit(snapshot, "a.py", "c3", "alice", kEpoch + 2 * kWeek, "refactor parser");
    addCommit(snapshot, "a.py", "c4", "bob", kEpoch + 3 * kWeek, "docs");
    addCommit(snapshot, "a.py", "c4", "bob", kEpoch + 3 * kWeek, "docs");
    addCommit(snapshot, "b.py", "c5", "carol", kEpoch + 8 * kWeek, "initial");
    snapshot.reconcileTemporal();

    TemporalAnalyzer analyzer(TemporalConfig{});
    TemporalAnalysis analysis = analyzer.analyze(snapshot);

    REQUIRE(analysis.teamSize == 3);
    REQUIRE(analysis.windowCount == 3);
    REQUIRE_THAT(analysis.spanWeeks, WithinAbs(8.0, 1e-12));
    REQUIRE(analysis.firstTimestamp == kEpoch);

    const FileTemporalMetrics& a = analysis.files.at("a.py");
    REQUIRE(a.totalChanges == 4);
    REQUIRE(a.windowCounts == std::vector<double>{4.0, 0.0, 0.0});
    REQUIRE_THAT(a.churnSlope, WithinAbs(-2.0, 1e-12));
    REQUIRE(a.churnCv.has_value());
    REQUIRE(*a.churnCv > 0.5);
    REQUIRE(a.trajectory == ChurnTrajectory::Churning);
    REQUIRE_THAT(a.fixRatio, WithinAbs(0.25, 1e-12));
    REQUIRE_THAT(a.refactorRatio, WithinAbs(0.25, 1e-12));
    REQUIRE_THAT(a.authorEntropy, WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(a.busFactor, WithinAbs(2.0, 1e-12));

    const FileTemporalMetrics& b = analysis.files.at("b.py");
    REQUIRE(b.totalChanges == 1);
    REQUIRE(b.trajectory == ChurnTrajectory::Dormant);
    REQUIRE_THAT(b.busFactor, WithinAbs(1.0, 1e-12));

    SECTION("A file without history is dormant with a bus factor of one") {
        const FileTemporalMetrics& c = analysis.files.at("c.py");
        REQUIRE(c.totalChanges == 0);
        REQUIRE(c.windowCounts.empty());
        REQUIRE_FALSE(c.churnCv.has_value());
        REQUIRE(c.trajectory == ChurnTrajectory::Dormant);
        REQUIRE(c.busFactor == 1.0);
    }
}

TEST_CASE("TemporalAnalyzer without any history", "[TemporalAnalyzer]") {
    CodebaseSnapshot snapshot;
    addFile(snapshot, "a.py", 10);

    TemporalAnalysis analysis = TemporalAnalyzer(TemporalConfig{}).analyze(snapshot);
    REQUIRE(analysis.teamSize == 1);
    REQUIRE(analysis.windowCount == 0);
    REQUIRE(analysis.spanWeeks == 0.0);
}
