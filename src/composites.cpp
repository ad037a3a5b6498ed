#include "composites.hpp"
#include "statistics_toolkit.hpp"
#include <algorithm>

std::optional<double> weightedMean(const std::vector<std::pair<double, std::optional<double>>>& terms) {
    double weightSum = 0.0;
    double total = 0.0;
    for (const auto& [weight, value] : terms) {
        if (!value) {
            continue;
        }
        weightSum += weight;
        total += weight * *value;
    }
    if (weightSum <= 0.0) {
        return std::nullopt;
    }
    return total / weightSum;
}

double normMax(double value, double max) {
    return max > 0.0 ? value / max : 0.0;
}

double instabilityFactor(ChurnTrajectory trajectory) {
    return isUnstableTrajectory(trajectory) ? 1.0 : 0.3;
}

double churnFactor(ChurnTrajectory trajectory) {
    switch (trajectory) {
        case ChurnTrajectory::Spiking:
        case ChurnTrajectory::Churning:
            return 1.0;
        case ChurnTrajectory::Stable:
            return 0.6;
        case ChurnTrajectory::Stabilizing:
            return 0.4;
        case ChurnTrajectory::Dormant:
        default:
            return 0.3;
    }
}

double rawRisk(const RawRiskInputs& inputs) {
    return weights::RAW_PAGERANK * inputs.pagerankNorm +
           weights::RAW_BLAST_RADIUS * inputs.blastRadiusNorm +
           weights::RAW_COGNITIVE_LOAD * inputs.cognitiveLoadNorm +
           weights::RAW_INSTABILITY * instabilityFactor(inputs.trajectory) +
           weights::RAW_BUS_FACTOR * (1.0 - inputs.busFactorNorm);
}

std::optional<double> riskScore(const RiskInputs& inputs) {
    if (inputs.totalChanges == 0) {
        return 0.0;
    }
    if (!inputs.pagerankScaled || !inputs.blastRadiusScaled ||
        !inputs.cognitiveLoadScaled || !inputs.busFactor) {
        return std::nullopt;
    }

    double structural = std::max(*inputs.pagerankScaled, *inputs.blastRadiusScaled);
    double complexity = *inputs.cognitiveLoadScaled;
    double busPenalty = 1.0 / std::max(1.0, *inputs.busFactor);
    return clamp01(structural * complexity * churnFactor(inputs.trajectory) * busPenalty);
}

double wiringQuality(bool orphan, double stubRatio, double phantomRatio, double brokenCallRatio) {
    double defects = (orphan ? 1.0 : 0.0) + stubRatio + phantomRatio + brokenCallRatio;
    return clamp01(1.0 - defects);
}

std::optional<double> fileHealthScore(std::optional<double> risk, std::optional<double> wiring,
                                      std::optional<double> cognitiveLoadScaled,
                                      double stubRatio, bool orphan) {
    if (!risk || !wiring || !cognitiveLoadScaled) {
        return std::nullopt;
    }
    double burden = weights::FILE_RISK * *risk +
                    weights::FILE_WIRING * (1.0 - *wiring) +
                    weights::FILE_COGNITIVE_LOAD * *cognitiveLoadScaled +
                    weights::FILE_STUB * stubRatio +
                    weights::FILE_ORPHAN * (orphan ? 1.0 : 0.0);
    return clamp01(1.0 - burden);
}

double moduleHealthScore(const ModuleHealthInputs& inputs) {
    std::optional<double> mainSeq;
    if (inputs.mainSeqDistance) {
        mainSeq = 1.0 - *inputs.mainSeqDistance;
    }
    auto score = weightedMean({
        {weights::MODULE_COHESION, inputs.cohesion},
        {weights::MODULE_COUPLING, 1.0 - inputs.coupling},
        {weights::MODULE_MAIN_SEQ, mainSeq},
        {weights::MODULE_BOUNDARY, inputs.boundaryAlignment},
        {weights::MODULE_ROLES, inputs.roleConsistency},
        {weights::MODULE_STUB, 1.0 - inputs.meanStubRatio}
    });
    return clamp01(score.value_or(0.0));
}

double wiringScore(const WiringInputs& inputs) {
    double defects = weights::WIRING_ORPHAN * inputs.orphanRatio +
                     weights::WIRING_PHANTOM * inputs.phantomRatio +
                     weights::WIRING_GLUE * inputs.glueDeficit +
                     weights::WIRING_STUB * inputs.meanStubRatio +
                     weights::WIRING_CLONE * inputs.cloneRatio;
    return clamp01(1.0 - defects);
}

std::optional<double> architectureHealth(const ArchitectureInputs& inputs) {
    auto invert = [](std::optional<double> v) -> std::optional<double> {
        if (!v) {
            return std::nullopt;
        }
        return 1.0 - *v;
    };
    auto score = weightedMean({
        {weights::ARCH_VIOLATIONS, 1.0 - inputs.violationRate},
        {weights::ARCH_COHESION, inputs.meanCohesion},
        {weights::ARCH_COUPLING, invert(inputs.meanCoupling)},
        {weights::ARCH_MAIN_SEQ, invert(inputs.meanMainSeqDistance)},
        {weights::ARCH_BOUNDARY, inputs.meanBoundaryAlignment}
    });
    if (!score) {
        return std::nullopt;
    }
    return clamp01(*score);
}

double teamRisk(const TeamInputs& inputs) {
    std::optional<double> knowledge;
    if (inputs.maxKnowledgeGini) {
        knowledge = 1.0 - *inputs.maxKnowledgeGini;
    }
    std::optional<double> coordination;
    if (inputs.meanCoordinationCost) {
        coordination = 1.0 - std::min(*inputs.meanCoordinationCost, 5.0) / 5.0;
    }

    auto resilience = weightedMean({
        {weights::TEAM_BUS_FACTOR, std::min(inputs.criticalBusFactor, 3.0) / 3.0},
        {weights::TEAM_KNOWLEDGE, knowledge},
        {weights::TEAM_COORDINATION, coordination},
        {weights::TEAM_CONWAY, inputs.conwayAlignment}
    });
    return clamp01(1.0 - resilience.value_or(0.0));
}

double busFactorRatio(double criticalBusFactor, int64_t teamSize) {
    if (teamSize <= 1) {
        return 1.0;
    }
    double team = static_cast<double>(teamSize);
    return clamp01(std::min(criticalBusFactor, team) / team);
}

double codebaseHealth(const CodebaseInputs& inputs) {
    auto score = weightedMean({
        {weights::CODEBASE_ARCHITECTURE, inputs.architectureHealth},
        {weights::CODEBASE_WIRING, inputs.wiringScore},
        {weights::CODEBASE_BUS_FACTOR, busFactorRatio(inputs.criticalBusFactor, inputs.teamSize)},
        {weights::CODEBASE_MODULARITY, std::max(inputs.modularity, 0.0)}
    });
    return clamp01(score.value_or(0.0));
}

double absoluteCodebaseHealth(double wiringScore, double busFactorRatio) {
    return clamp01(0.5 * wiringScore + 0.5 * busFactorRatio);
}
