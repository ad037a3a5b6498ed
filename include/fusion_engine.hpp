#pragma once

#include <string>
#include <memory>
#include <chrono>
#include <filesystem>
#include <optional>
#include "fusion_config.hpp"
#include "fusion_pipeline.hpp"
#include "stage_executor.hpp"

namespace fs = std::filesystem;

struct FusionEngineOptions {
    fs::path inputFile;                  // snapshot JSON
    fs::path outputFile;                 // report path, empty = none
    bool showTiming = false;
    size_t topN = 10;                    // entries in each top-N ranking
    FusionConfig config;
};

// Loads a snapshot, runs the analyzers and the fusion pipeline, and writes the report
class FusionEngine {
public:
    explicit FusionEngine(const FusionEngineOptions& options);

    // Run the whole process. Throws SnapshotError or ConfigError on fatal input.
    bool run();

    // Run on an already-loaded snapshot
    bool run(CodebaseSnapshot snapshot);

    std::string getSummary() const;
    std::string getTimingInfo() const;

    // Report JSON of the last run
    std::string getReport() const;

    const FusionResult* result() const { return result_.get(); }

    void cancel() { cancellation_.cancel(); }

private:
    FusionEngineOptions options_;
    std::unique_ptr<StageExecutor> executor_;
    CancellationToken cancellation_;

    std::optional<CodebaseSnapshot> snapshot_;
    std::unique_ptr<GraphAnalysis> graph_;
    std::unique_ptr<TemporalAnalysis> temporal_;
    std::unique_ptr<ArchitectureAnalysis> architecture_;
    std::unique_ptr<FusionResult> result_;
    std::string reportContent_;

    // Statistics
    size_t totalFiles_ = 0;
    size_t totalEdges_ = 0;
    int64_t phantomImports_ = 0;
    size_t droppedEdges_ = 0;

    // Timing info
    std::chrono::steady_clock::time_point startTime_;
    std::chrono::milliseconds duration_{0};
    std::chrono::milliseconds loadDuration_{0};
    std::chrono::milliseconds analysisDuration_{0};
    std::chrono::milliseconds fusionDuration_{0};
    std::chrono::milliseconds outputDuration_{0};

    bool process(CodebaseSnapshot snapshot);
    void analyze();
    void writeOutput();
};
