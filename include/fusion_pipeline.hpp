#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "architecture_analyzer.hpp"
#include "fusion_config.hpp"
#include "graph_analyzer.hpp"
#include "measurements.hpp"
#include "signal_field.hpp"
#include "stage_executor.hpp"
#include "temporal_analyzer.hpp"

// How a run was produced and how far it can be trusted
struct Provenance {
    Tier tier = Tier::Absolute;
    bool approximate = false;
    std::vector<std::string> reasons;        // why the run is approximate
    std::vector<std::string> warnings;       // degradations that did not affect exactness
    std::vector<Stage> stagesCompleted;
    std::vector<std::pair<Stage, std::chrono::milliseconds>> stageDurations;
    bool cancelled = false;

    void markApproximate(const std::string& reason);
    void warn(const std::string& message);
};

// Read-only inputs of the pipeline, produced before it starts
struct FusionInputs {
    const CodebaseSnapshot& snapshot;
    const GraphAnalysis& graph;
    const TemporalAnalysis& temporal;
    const ArchitectureAnalysis& architecture;
};

struct FusionResult {
    SignalField field;
    Provenance provenance;
    std::vector<std::vector<std::string>> communities;
    double modularity = 0.0;
    std::map<std::string, std::optional<double>> deltaH;
};

// Runs the six fusion stages in fixed order over one snapshot:
// Collect -> RawRisk -> Normalize -> ModuleTemporal -> Composites -> HealthLaplacian.
// Stages only add signals. Per-entity work inside a stage runs on the executor and
// is merged into the field on the calling thread once the stage's tasks finish.
class FusionPipeline {
public:
    FusionPipeline(const FusionConfig& config, StageExecutor& executor);

    // Cancellation is honoured between stages; a cancelled run returns the
    // stages completed so far with provenance.cancelled set.
    FusionResult run(const FusionInputs& inputs, const CancellationToken* cancel = nullptr) const;

private:
    struct RunState;

    const FusionConfig& config_;
    StageExecutor& executor_;

    void collect(RunState& state) const;
    void collectFiles(RunState& state) const;
    void collectDirectories(RunState& state) const;
    void collectModules(RunState& state) const;
    void collectGlobals(RunState& state) const;

    void computeRawRisk(RunState& state) const;
    void normalize(RunState& state) const;
    void computeModuleTemporal(RunState& state) const;

    void computeComposites(RunState& state) const;
    void computeFileComposites(RunState& state) const;
    void computeDirectoryComposites(RunState& state) const;
    void computeModuleComposites(RunState& state) const;
    void computeGlobalComposites(RunState& state) const;

    void computeHealthLaplacian(RunState& state) const;

    double criticalBusFactor(const RunState& state) const;
};
