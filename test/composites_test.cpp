#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "composites.hpp"

using Catch::Matchers::WithinAbs;

TEST_CASE("Weight sets sum to one", "[Composites]") {
    using namespace weights;
    REQUIRE_THAT(RAW_PAGERANK + RAW_BLAST_RADIUS + RAW_COGNITIVE_LOAD + RAW_INSTABILITY + RAW_BUS_FACTOR,
                 WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(FILE_RISK + FILE_WIRING + FILE_COGNITIVE_LOAD + FILE_STUB + FILE_ORPHAN,
                 WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(MODULE_COHESION + MODULE_COUPLING + MODULE_MAIN_SEQ + MODULE_BOUNDARY +
                 MODULE_ROLES + MODULE_STUB, WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(WIRING_ORPHAN + WIRING_PHANTOM + WIRING_GLUE + WIRING_STUB + WIRING_CLONE,
                 WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(ARCH_VIOLATIONS + ARCH_COHESION + ARCH_COUPLING + ARCH_MAIN_SEQ + ARCH_BOUNDARY,
                 WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(TEAM_BUS_FACTOR + TEAM_KNOWLEDGE + TEAM_COORDINATION + TEAM_CONWAY,
                 WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(CODEBASE_ARCHITECTURE + CODEBASE_WIRING + CODEBASE_BUS_FACTOR + CODEBASE_MODULARITY,
                 WithinAbs(1.0, 1e-12));
}

TEST_CASE("weightedMean renormalizes over present terms", "[Composites]") {
    REQUIRE_FALSE(weightedMean({{0.5, std::nullopt}}).has_value());
    REQUIRE_THAT(*weightedMean({{0.5, 1.0}, {0.5, 0.0}}), WithinAbs(0.5, 1e-12));
    REQUIRE_THAT(*weightedMean({{0.2, 1.0}, {0.8, std::nullopt}}), WithinAbs(1.0, 1e-12));
}

TEST_CASE("Raw risk mixes normalized structure and churn", "[Composites]") {
    RawRiskInputs inputs;
    inputs.pagerankNorm = 1.0;
    inputs.blastRadiusNorm = 1.0;
    inputs.cognitiveLoadNorm = 1.0;
    inputs.trajectory = ChurnTrajectory::Spiking;
    inputs.busFactorNorm = 0.0;
    REQUIRE_THAT(rawRisk(inputs), WithinAbs(1.0, 1e-12));

    inputs.trajectory = ChurnTrajectory::Stable;
    inputs.busFactorNorm = 1.0;
    REQUIRE_THAT(rawRisk(inputs), WithinAbs(0.65 + 0.20 * 0.3, 1e-12));

    REQUIRE(normMax(3.0, 0.0) == 0.0);
    REQUIRE(normMax(3.0, 6.0) == 0.5);
}

TEST_CASE("Risk score of an unchanged file is zero", "[Composites]") {
    RiskInputs inputs;
    inputs.pagerankScaled = 1.0;
    inputs.blastRadiusScaled = 1.0;
    inputs.cognitiveLoadScaled = 1.0;
    inputs.trajectory = ChurnTrajectory::Spiking;
    inputs.busFactor = 1.0;
    inputs.totalChanges = 0;
    REQUIRE(riskScore(inputs) == 0.0);

    SECTION("Even when every other input is missing") {
        RiskInputs bare;
        REQUIRE(riskScore(bare) == 0.0);
    }

    SECTION("A changed file multiplies the factors") {
        inputs.totalChanges = 10;
        inputs.pagerankScaled = 0.8;
        inputs.blastRadiusScaled = 0.5;
        inputs.cognitiveLoadScaled = 0.5;
        inputs.trajectory = ChurnTrajectory::Stable;
        inputs.busFactor = 2.0;
        REQUIRE_THAT(*riskScore(inputs), WithinAbs(0.8 * 0.5 * 0.6 * 0.5, 1e-12));
    }

    SECTION("A changed file with a missing input is null") {
        inputs.totalChanges = 3;
        inputs.cognitiveLoadScaled = std::nullopt;
        REQUIRE_FALSE(riskScore(inputs).has_value());
    }
}

TEST_CASE("Churn factors by trajectory", "[Composites]") {
    REQUIRE(churnFactor(ChurnTrajectory::Spiking) == 1.0);
    REQUIRE(churnFactor(ChurnTrajectory::Churning) == 1.0);
    REQUIRE(churnFactor(ChurnTrajectory::Stable) == 0.6);
    REQUIRE(churnFactor(ChurnTrajectory::Stabilizing) == 0.4);
    REQUIRE(churnFactor(ChurnTrajectory::Dormant) == 0.3);
    REQUIRE(instabilityFactor(ChurnTrajectory::Churning) == 1.0);
    REQUIRE(instabilityFactor(ChurnTrajectory::Stable) == 0.3);
}

TEST_CASE("Wiring and file health", "[Composites]") {
    REQUIRE(wiringQuality(false, 0.0, 0.0, 0.0) == 1.0);
    REQUIRE(wiringQuality(true, 0.2, 0.0, 0.0) == 0.0);
    REQUIRE_THAT(wiringQuality(false, 0.25, 0.25, 0.0), WithinAbs(0.5, 1e-12));

    auto healthy = fileHealthScore(0.0, 1.0, 0.0, 0.0, false);
    REQUIRE(healthy == 1.0);

    auto sick = fileHealthScore(1.0, 0.0, 1.0, 1.0, true);
    REQUIRE_THAT(*sick, WithinAbs(0.0, 1e-12));

    REQUIRE_FALSE(fileHealthScore(std::nullopt, 1.0, 0.0, 0.0, false).has_value());
}

TEST_CASE("Module health rescales without main sequence distance", "[Composites]") {
    ModuleHealthInputs inputs;
    inputs.cohesion = 1.0;
    inputs.coupling = 0.0;
    inputs.boundaryAlignment = 1.0;
    inputs.roleConsistency = 1.0;
    inputs.meanStubRatio = 0.0;

    inputs.mainSeqDistance = 0.0;
    REQUIRE_THAT(moduleHealthScore(inputs), WithinAbs(1.0, 1e-12));

    inputs.mainSeqDistance = std::nullopt;
    REQUIRE_THAT(moduleHealthScore(inputs), WithinAbs(1.0, 1e-12));

    inputs.cohesion = 0.0;
    // Cohesion weight 0.20 scaled by 1.25 is 0.25
    REQUIRE_THAT(moduleHealthScore(inputs), WithinAbs(0.75, 1e-12));
}

TEST_CASE("Global composites", "[Composites]") {
    SECTION("Wiring score") {
        WiringInputs clean;
        REQUIRE(wiringScore(clean) == 1.0);

        WiringInputs broken;
        broken.orphanRatio = 1.0;
        broken.phantomRatio = 1.0;
        broken.glueDeficit = 1.0;
        broken.meanStubRatio = 1.0;
        broken.cloneRatio = 1.0;
        REQUIRE_THAT(wiringScore(broken), WithinAbs(0.0, 1e-12));
    }

    SECTION("Architecture health from violations alone") {
        ArchitectureInputs inputs;
        inputs.violationRate = 0.5;
        REQUIRE_THAT(*architectureHealth(inputs), WithinAbs(0.5, 1e-12));
    }

    SECTION("Team risk is high with a single critical author") {
        TeamInputs team;
        team.criticalBusFactor = 1.0;
        team.maxKnowledgeGini = 0.0;
        team.meanCoordinationCost = 1.0;
        team.conwayAlignment = 1.0;
        // 1 - (0.30/3 + 0.25 + 0.25 * 0.8 + 0.20)
        REQUIRE_THAT(teamRisk(team), WithinAbs(0.25, 1e-12));
        REQUIRE(teamRisk(team) >= 0.2);
    }

    SECTION("Bus factor ratio") {
        REQUIRE(busFactorRatio(1.0, 1) == 1.0);
        REQUIRE(busFactorRatio(1.0, 0) == 1.0);
        REQUIRE_THAT(busFactorRatio(1.0, 4), WithinAbs(0.25, 1e-12));
        REQUIRE(busFactorRatio(10.0, 4) == 1.0);
    }

    SECTION("Codebase health") {
        CodebaseInputs inputs;
        inputs.architectureHealth = 1.0;
        inputs.wiringScore = 1.0;
        inputs.criticalBusFactor = 2.0;
        inputs.teamSize = 2;
        inputs.modularity = -0.2;
        REQUIRE_THAT(codebaseHealth(inputs), WithinAbs(0.8, 1e-12));

        inputs.architectureHealth = std::nullopt;
        REQUIRE_THAT(codebaseHealth(inputs), WithinAbs(0.5 / 0.7, 1e-12));

        REQUIRE_THAT(absoluteCodebaseHealth(0.6, 1.0), WithinAbs(0.8, 1e-12));
    }
}
