#include "fusion_engine.hpp"
#include "architecture_analyzer.hpp"
#include "fusion_report.hpp"
#include "graph_analyzer.hpp"
#include "snapshot_loader.hpp"
#include "temporal_analyzer.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>

namespace {

std::chrono::milliseconds since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

long long percentOf(std::chrono::milliseconds part, std::chrono::milliseconds total) {
    return part.count() * 100 / (total.count() ? total.count() : 1);
}

} // namespace

FusionEngine::FusionEngine(const FusionEngineOptions& options)
    : options_(options) {
    options_.config.validate();
    executor_ = std::make_unique<StageExecutor>(options_.config.execution.numThreads);
}

bool FusionEngine::run() {
    startTime_ = std::chrono::steady_clock::now();

    if (options_.config.execution.verbose) {
        std::cout << "Loading snapshot: " << options_.inputFile << std::endl;
    }

    auto loadStart = std::chrono::steady_clock::now();
    CodebaseSnapshot snapshot = SnapshotLoader::loadFile(options_.inputFile);
    loadDuration_ = since(loadStart);

    return process(std::move(snapshot));
}

bool FusionEngine::run(CodebaseSnapshot snapshot) {
    startTime_ = std::chrono::steady_clock::now();
    loadDuration_ = std::chrono::milliseconds{0};
    return process(std::move(snapshot));
}

bool FusionEngine::process(CodebaseSnapshot snapshot) {
    snapshot.validate();
    snapshot_ = std::move(snapshot);
    totalFiles_ = snapshot_->files.size();

    if (options_.config.execution.verbose) {
        std::cout << "Snapshot holds " << totalFiles_ << " files and "
                  << snapshot_->edges.size() << " edges" << std::endl;
    }

    auto analysisStart = std::chrono::steady_clock::now();
    analyze();
    analysisDuration_ = since(analysisStart);

    auto fusionStart = std::chrono::steady_clock::now();
    FusionPipeline pipeline(options_.config, *executor_);
    FusionInputs inputs{*snapshot_, *graph_, *temporal_, *architecture_};
    result_ = std::make_unique<FusionResult>(pipeline.run(inputs, &cancellation_));
    fusionDuration_ = since(fusionStart);

    if (options_.config.execution.verbose) {
        std::cout << "Fusion completed in " << fusionDuration_.count() << " ms" << std::endl;
    }

    auto outputStart = std::chrono::steady_clock::now();
    reportContent_ = FusionReport(*result_, options_.topN).dump();
    writeOutput();
    outputDuration_ = since(outputStart);

    duration_ = since(startTime_);
    return !result_->provenance.cancelled;
}

void FusionEngine::analyze() {
    const FusionConfig& config = options_.config;

    GraphAnalyzer graphAnalyzer(config.graph);
    graph_ = std::make_unique<GraphAnalysis>(graphAnalyzer.analyze(*snapshot_));

    TemporalAnalyzer temporalAnalyzer(config.temporal);
    temporal_ = std::make_unique<TemporalAnalysis>(temporalAnalyzer.analyze(*snapshot_));

    ArchitectureAnalyzer architectureAnalyzer;
    architecture_ = std::make_unique<ArchitectureAnalysis>(
        architectureAnalyzer.analyze(*snapshot_, *graph_));

    totalEdges_ = graph_->graph.edgeCount();
    droppedEdges_ = graph_->graph.droppedEdgeCount();
    phantomImports_ = 0;
    for (const auto& [path, metrics] : graph_->files) {
        phantomImports_ += metrics.phantomImportCount;
    }

    if (config.execution.verbose) {
        std::cout << "Graph: " << graph_->graph.nodeCount() << " files, " << totalEdges_
                  << " edges, " << graph_->communities.communityCount << " communities" << std::endl;
        if (droppedEdges_ > 0) {
            std::cerr << "Warning: " << droppedEdges_
                      << " edges from undeclared files were dropped" << std::endl;
        }
    }
}

void FusionEngine::writeOutput() {
    if (options_.outputFile.empty()) {
        return;
    }

    std::ofstream outFile(options_.outputFile);
    if (!outFile) {
        std::cerr << "Error: Could not open output file: " << options_.outputFile << std::endl;
        return;
    }
    outFile << reportContent_;
    if (options_.config.execution.verbose) {
        std::cout << "Report written to " << options_.outputFile << std::endl;
    }
}

std::string FusionEngine::getReport() const {
    return reportContent_;
}

std::string FusionEngine::getSummary() const {
    std::stringstream ss;
    ss << "Fusion summary:" << std::endl;
    ss << "  Total files: " << totalFiles_ << std::endl;
    ss << "  Dependency edges: " << totalEdges_ << std::endl;
    ss << "  Phantom imports: " << phantomImports_ << std::endl;

    if (result_) {
        const Provenance& p = result_->provenance;
        const SignalField& field = result_->field;
        ss << "  Tier: " << tierToString(p.tier) << std::endl;
        ss << "  Communities: " << result_->communities.size()
           << " (Q = " << std::fixed << std::setprecision(3) << result_->modularity << ")" << std::endl;

        if (auto health = field.globalNumber("codebase_health_display")) {
            ss << "  Codebase health: " << std::fixed << std::setprecision(1) << *health << " / 10" << std::endl;
        }
        if (auto risk = field.globalNumber("team_risk")) {
            ss << "  Team risk: " << std::fixed << std::setprecision(2) << *risk << std::endl;
        }
        if (p.approximate) {
            ss << "  Approximate: yes" << std::endl;
            for (const auto& reason : p.reasons) {
                ss << "    - " << reason << std::endl;
            }
        }
        if (p.cancelled) {
            ss << "  Cancelled after " << p.stagesCompleted.size() << " stages" << std::endl;
        }
    }

    if (options_.showTiming) {
        ss << "  Total time: " << duration_.count() << " ms" << std::endl;
    }

    return ss.str();
}

std::string FusionEngine::getTimingInfo() const {
    std::stringstream ss;
    ss << "Timing Information:" << std::endl;
    ss << "- Total time: " << duration_.count() << "ms" << std::endl;
    ss << "- Snapshot loading time: " << loadDuration_.count() << "ms ("
       << percentOf(loadDuration_, duration_) << "%)" << std::endl;
    ss << "- Analysis time: " << analysisDuration_.count() << "ms ("
       << percentOf(analysisDuration_, duration_) << "%)" << std::endl;
    ss << "- Fusion time: " << fusionDuration_.count() << "ms ("
       << percentOf(fusionDuration_, duration_) << "%)" << std::endl;

    if (result_) {
        for (const auto& [stage, elapsed] : result_->provenance.stageDurations) {
            ss << "  * " << stageToString(stage) << ": " << elapsed.count() << "ms" << std::endl;
        }
    }

    ss << "- Output generation time: " << outputDuration_.count() << "ms ("
       << percentOf(outputDuration_, duration_) << "%)" << std::endl;

    if (fusionDuration_.count() > 0) {
        double filesPerSecond = static_cast<double>(totalFiles_) / (fusionDuration_.count() / 1000.0);
        ss << "- Performance:" << std::endl;
        ss << "  * " << std::fixed << std::setprecision(2) << filesPerSecond << " files/second" << std::endl;
        ss << "  * " << executor_->threadCount() << " worker threads" << std::endl;
    }

    return ss.str();
}
