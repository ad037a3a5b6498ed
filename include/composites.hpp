#pragma once

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>
#include "signal_types.hpp"

// Composite scoring formulas. Each weight set sums to 1.0. Inputs that are null
// are dropped and the remaining weights rescaled, unless noted otherwise.

namespace weights {

// raw_risk
constexpr double RAW_PAGERANK = 0.25;
constexpr double RAW_BLAST_RADIUS = 0.20;
constexpr double RAW_COGNITIVE_LOAD = 0.20;
constexpr double RAW_INSTABILITY = 0.20;
constexpr double RAW_BUS_FACTOR = 0.15;

// file_health_score
constexpr double FILE_RISK = 0.25;
constexpr double FILE_WIRING = 0.25;
constexpr double FILE_COGNITIVE_LOAD = 0.20;
constexpr double FILE_STUB = 0.15;
constexpr double FILE_ORPHAN = 0.15;

// module health_score
constexpr double MODULE_COHESION = 0.20;
constexpr double MODULE_COUPLING = 0.15;
constexpr double MODULE_MAIN_SEQ = 0.20;
constexpr double MODULE_BOUNDARY = 0.15;
constexpr double MODULE_ROLES = 0.15;
constexpr double MODULE_STUB = 0.15;

// wiring_score
constexpr double WIRING_ORPHAN = 0.25;
constexpr double WIRING_PHANTOM = 0.25;
constexpr double WIRING_GLUE = 0.20;
constexpr double WIRING_STUB = 0.15;
constexpr double WIRING_CLONE = 0.15;

// architecture_health
constexpr double ARCH_VIOLATIONS = 0.25;
constexpr double ARCH_COHESION = 0.20;
constexpr double ARCH_COUPLING = 0.20;
constexpr double ARCH_MAIN_SEQ = 0.20;
constexpr double ARCH_BOUNDARY = 0.15;

// team_risk
constexpr double TEAM_BUS_FACTOR = 0.30;
constexpr double TEAM_KNOWLEDGE = 0.25;
constexpr double TEAM_COORDINATION = 0.25;
constexpr double TEAM_CONWAY = 0.20;

// codebase_health
constexpr double CODEBASE_ARCHITECTURE = 0.30;
constexpr double CODEBASE_WIRING = 0.30;
constexpr double CODEBASE_BUS_FACTOR = 0.20;
constexpr double CODEBASE_MODULARITY = 0.20;

} // namespace weights

// Weighted mean over the non-null terms; null when every term is null
std::optional<double> weightedMean(const std::vector<std::pair<double, std::optional<double>>>& terms);

// x / max, 0 when max is not positive
double normMax(double value, double max);

// 1.0 for CHURNING and SPIKING, else 0.3
double instabilityFactor(ChurnTrajectory trajectory);

// SPIKING/CHURNING 1.0, STABLE 0.6, STABILIZING 0.4, DORMANT 0.3
double churnFactor(ChurnTrajectory trajectory);

struct RawRiskInputs {
    double pagerankNorm = 0.0;
    double blastRadiusNorm = 0.0;
    double cognitiveLoadNorm = 0.0;
    ChurnTrajectory trajectory = ChurnTrajectory::Dormant;
    double busFactorNorm = 0.0;
};

double rawRisk(const RawRiskInputs& inputs);

struct RiskInputs {
    std::optional<double> pagerankScaled;
    std::optional<double> blastRadiusScaled;
    std::optional<double> cognitiveLoadScaled;
    ChurnTrajectory trajectory = ChurnTrajectory::Dormant;
    std::optional<double> busFactor;
    int64_t totalChanges = 0;
};

// structural_risk x complexity x churn_factor x 1/bus_factor, clamped to [0, 1].
// Always 0 for a file that never changed; null when another input is missing.
std::optional<double> riskScore(const RiskInputs& inputs);

// clamp01(1 - (orphan + stub + phantom_ratio + broken_call_ratio))
double wiringQuality(bool orphan, double stubRatio, double phantomRatio, double brokenCallRatio);

std::optional<double> fileHealthScore(std::optional<double> risk, std::optional<double> wiring,
                                      std::optional<double> cognitiveLoadScaled,
                                      double stubRatio, bool orphan);

struct ModuleHealthInputs {
    double cohesion = 0.0;
    double coupling = 0.0;
    std::optional<double> mainSeqDistance;   // when null the other weights scale by 1.25
    double boundaryAlignment = 0.0;
    double roleConsistency = 0.0;
    double meanStubRatio = 0.0;
};

double moduleHealthScore(const ModuleHealthInputs& inputs);

struct WiringInputs {
    double orphanRatio = 0.0;
    double phantomRatio = 0.0;
    double glueDeficit = 0.0;
    double meanStubRatio = 0.0;
    double cloneRatio = 0.0;
};

double wiringScore(const WiringInputs& inputs);

struct ArchitectureInputs {
    double violationRate = 0.0;
    std::optional<double> meanCohesion;
    std::optional<double> meanCoupling;
    std::optional<double> meanMainSeqDistance;
    std::optional<double> meanBoundaryAlignment;
};

std::optional<double> architectureHealth(const ArchitectureInputs& inputs);

struct TeamInputs {
    double criticalBusFactor = 1.0;
    std::optional<double> maxKnowledgeGini;
    std::optional<double> meanCoordinationCost;
    double conwayAlignment = 1.0;
};

double teamRisk(const TeamInputs& inputs);

struct CodebaseInputs {
    std::optional<double> architectureHealth;
    double wiringScore = 0.0;
    double criticalBusFactor = 1.0;
    int64_t teamSize = 1;
    double modularity = 0.0;
};

// min(bus factor, team size) / team size, 1 for a team of one
double busFactorRatio(double criticalBusFactor, int64_t teamSize);

double codebaseHealth(const CodebaseInputs& inputs);

// Fallback for an ABSOLUTE-tier snapshot without edges, where modularity and
// cohesion carry no information: 0.5 * wiring + 0.5 * bus factor ratio
double absoluteCodebaseHealth(double wiringScore, double busFactorRatio);
