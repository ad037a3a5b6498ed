#include "fusion_pipeline.hpp"
#include "composites.hpp"
#include "display_scale.hpp"
#include "health_laplacian.hpp"
#include "statistics_toolkit.hpp"
#include "tier_strategy.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>
#include <set>

namespace {

using SignalWrites = std::vector<std::pair<std::string, SignalValue>>;

constexpr double CRITICAL_PERCENTILE = 0.75;
constexpr double HIGH_RISK = 0.7;

SignalValue optionalNumber(std::optional<double> value) {
    if (!value) {
        return std::monostate{};
    }
    return SignalValue(*value);
}

SignalValue integer(int64_t value) {
    return SignalValue(value);
}

// Upper median: sorted[n / 2], 0 for an empty list
double upperMedian(std::vector<double> values) {
    if (values.empty()) {
        return 0.0;
    }
    std::sort(values.begin(), values.end());
    return values[values.size() / 2];
}

// Most frequent key, ties broken by the smallest key
template <typename Key>
Key dominant(const std::map<Key, int64_t>& counts, Key fallback) {
    Key best = fallback;
    int64_t bestCount = -1;
    for (const auto& [key, count] : counts) {
        if (count > bestCount) {
            best = key;
            bestCount = count;
        }
    }
    return best;
}

std::optional<double> meanOf(const std::vector<double>& values) {
    if (values.empty()) {
        return std::nullopt;
    }
    return mean(values);
}

int64_t pathDepth(const std::string& path) {
    return static_cast<int64_t>(std::count(path.begin(), path.end(), '/'));
}

void writeComposite(SignalField& field, SignalScope scope, const std::string& entity,
                    const std::string& name, std::optional<double> value) {
    field.set(scope, entity, name, optionalNumber(value));
    std::optional<double> display;
    if (value) {
        display = displayScore(*value);
    }
    field.set(scope, entity, name + "_display", optionalNumber(display));
}

} // namespace

void Provenance::markApproximate(const std::string& reason) {
    approximate = true;
    reasons.push_back(reason);
}

void Provenance::warn(const std::string& message) {
    warnings.push_back(message);
}

struct FusionPipeline::RunState {
    explicit RunState(const FusionInputs& in) : inputs(in) {}

    const FusionInputs& inputs;
    FusionResult result;
    std::unique_ptr<TierStrategy> tier;
    std::vector<std::string> paths;
    std::map<std::string, std::vector<std::string>> directories;   // parent dir -> member paths

    SignalField& field() { return result.field; }
    const SignalField& field() const { return result.field; }
    const CodebaseSnapshot& snapshot() const { return inputs.snapshot; }
};

FusionPipeline::FusionPipeline(const FusionConfig& config, StageExecutor& executor)
    : config_(config), executor_(executor) {}

FusionResult FusionPipeline::run(const FusionInputs& inputs, const CancellationToken* cancel) const {
    inputs.snapshot.validate();
    executor_.clearFallback();

    RunState state(inputs);
    Provenance& provenance = state.result.provenance;

    for (const auto& [path, measurements] : inputs.snapshot.files) {
        state.paths.push_back(path);
        state.directories[parentDirectory(path)].push_back(path);
    }

    Tier tier = TierStrategy::selectTier(state.paths.size(), config_.tiers);
    state.tier = std::make_unique<TierStrategy>(tier, config_.normalization, state.field().registry());
    provenance.tier = tier;

    for (const auto& reason : inputs.graph.approximations) {
        provenance.markApproximate(reason);
    }
    if (inputs.graph.entryPointSource == "none" && !state.paths.empty()) {
        provenance.warn("no entry points found, every depth is -1");
    }

    using StageFn = void (FusionPipeline::*)(RunState&) const;
    const std::vector<std::pair<Stage, StageFn>> stages = {
        {Stage::Collect, &FusionPipeline::collect},
        {Stage::RawRisk, &FusionPipeline::computeRawRisk},
        {Stage::Normalize, &FusionPipeline::normalize},
        {Stage::ModuleTemporal, &FusionPipeline::computeModuleTemporal},
        {Stage::Composites, &FusionPipeline::computeComposites},
        {Stage::HealthLaplacian, &FusionPipeline::computeHealthLaplacian}
    };

    for (const auto& [stage, fn] : stages) {
        if (cancel && cancel->cancelled()) {
            provenance.cancelled = true;
            if (config_.execution.verbose) {
                std::cout << "Run cancelled before stage " << stageToString(stage) << std::endl;
            }
            break;
        }

        if (config_.execution.verbose) {
            std::cout << "Running stage " << static_cast<int>(stage) << ": "
                      << stageToString(stage) << std::endl;
        }

        auto start = std::chrono::steady_clock::now();
        state.field().beginStage(stage);
        (this->*fn)(state);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        provenance.stagesCompleted.push_back(stage);
        provenance.stageDurations.emplace_back(stage, elapsed);
    }

    if (executor_.ranSequentially()) {
        provenance.warn("worker threads unavailable, stages ran single-threaded");
    }

    if (config_.execution.verbose) {
        for (const auto& warning : provenance.warnings) {
            std::cerr << "Warning: " << warning << std::endl;
        }
    }

    state.result.communities = inputs.graph.communityMembers;
    state.result.modularity = inputs.graph.communities.modularity;
    return std::move(state.result);
}

// ---------------------------------------------------------------------------
// Stage 1: Collect

void FusionPipeline::collect(RunState& state) const {
    collectFiles(state);
    collectDirectories(state);
    collectModules(state);
    collectGlobals(state);
}

void FusionPipeline::collectFiles(RunState& state) const {
    const auto& snapshot = state.snapshot();
    const auto& graph = state.inputs.graph;
    const auto& temporal = state.inputs.temporal;

    auto writes = executor_.map<SignalWrites>(state.paths, [&](const std::string& path) {
        SignalWrites w;
        const auto& measurements = snapshot.files.at(path);
        const auto& s = *measurements.structural;
        const auto& sem = *measurements.semantic;

        w.emplace_back("lines", integer(s.lines));
        w.emplace_back("function_count", integer(s.functionCount));
        w.emplace_back("class_count", integer(s.classCount));
        w.emplace_back("max_nesting", integer(s.maxNesting));
        w.emplace_back("stub_ratio", SignalValue(s.stubRatio));
        w.emplace_back("import_count", integer(s.importCount));
        w.emplace_back("broken_call_count", integer(s.brokenCallCount));

        w.emplace_back("role", SignalValue(roleToString(sem.role)));
        w.emplace_back("concept_count", integer(sem.conceptCount));
        w.emplace_back("concept_entropy", optionalNumber(sem.conceptEntropy));
        w.emplace_back("naming_drift", SignalValue(sem.namingDrift));
        w.emplace_back("todo_density", SignalValue(sem.todoDensity));
        w.emplace_back("docstring_coverage", optionalNumber(sem.docstringCoverage));
        w.emplace_back("compression_ratio", optionalNumber(sem.compressionRatio));

        auto g = graph.files.find(path);
        if (g != graph.files.end()) {
            const FileGraphMetrics& m = g->second;
            w.emplace_back("impl_gini", SignalValue(m.implGini));
            w.emplace_back("pagerank", SignalValue(m.pagerank));
            w.emplace_back("betweenness", SignalValue(m.betweenness));
            w.emplace_back("in_degree", integer(m.inDegree));
            w.emplace_back("out_degree", integer(m.outDegree));
            w.emplace_back("blast_radius_size", integer(m.blastRadiusSize));
            w.emplace_back("depth", integer(m.depth));
            w.emplace_back("is_orphan", SignalValue(m.isOrphan));
            w.emplace_back("phantom_import_count", integer(m.phantomImportCount));
            w.emplace_back("community", integer(static_cast<int64_t>(m.community)));
            w.emplace_back("cognitive_load", SignalValue(m.cognitiveLoad));
        }

        auto t = temporal.files.find(path);
        if (t != temporal.files.end()) {
            const FileTemporalMetrics& m = t->second;
            w.emplace_back("total_changes", integer(m.totalChanges));
            w.emplace_back("churn_trajectory", SignalValue(trajectoryToString(m.trajectory)));
            w.emplace_back("churn_slope", SignalValue(m.churnSlope));
            w.emplace_back("churn_cv", optionalNumber(m.churnCv));
            w.emplace_back("bus_factor", SignalValue(m.busFactor));
            w.emplace_back("author_entropy", SignalValue(m.authorEntropy));
            w.emplace_back("fix_ratio", SignalValue(m.fixRatio));
            w.emplace_back("refactor_ratio", SignalValue(m.refactorRatio));
            w.emplace_back("change_entropy", SignalValue(m.changeEntropy));
        }

        std::string dir = parentDirectory(path);
        w.emplace_back("parent_dir", SignalValue(dir));
        w.emplace_back("module_path", SignalValue(snapshot.moduleFor(path)));
        w.emplace_back("dir_depth", integer(pathDepth(path)));
        w.emplace_back("siblings_count",
                       integer(static_cast<int64_t>(state.directories.at(dir).size()) - 1));
        return w;
    });

    for (size_t i = 0; i < state.paths.size(); i++) {
        for (auto& [name, value] : writes[i]) {
            state.field().setFile(state.paths[i], name, std::move(value));
        }
    }
}

void FusionPipeline::collectDirectories(RunState& state) const {
    const auto& snapshot = state.snapshot();
    SignalField& field = state.field();

    std::vector<double> allChanges;
    for (const auto& path : state.paths) {
        allChanges.push_back(field.fileNumber(path, "total_changes").value_or(0.0));
    }
    double hotspotCut = upperMedian(allChanges);

    std::map<std::string, int64_t> importsOut;
    std::map<std::string, int64_t> importsInternal;
    for (const auto& edge : state.inputs.graph.graph.edges()) {
        if (edge.source == edge.target) {
            continue;
        }
        std::string dir = parentDirectory(edge.source);
        importsOut[dir]++;
        if (parentDirectory(edge.target) == dir) {
            importsInternal[dir]++;
        }
    }

    for (const auto& [dir, members] : state.directories) {
        int64_t totalLines = 0;
        int64_t totalFunctions = 0;
        std::vector<double> loads;
        std::vector<double> churn;
        int64_t hotspots = 0;
        std::map<std::string, int64_t> roles;
        std::map<std::string, int64_t> trajectories;
        std::map<std::string, int64_t> modules;

        for (const auto& path : members) {
            const auto& s = *snapshot.files.at(path).structural;
            totalLines += s.lines;
            totalFunctions += s.functionCount;
            loads.push_back(field.fileNumber(path, "cognitive_load").value_or(0.0));

            double changes = field.fileNumber(path, "total_changes").value_or(0.0);
            churn.push_back(changes);
            if (changes > hotspotCut) {
                hotspots++;
            }

            roles[field.text(SignalScope::File, path, "role").value_or("UNKNOWN")]++;
            trajectories[field.text(SignalScope::File, path, "churn_trajectory").value_or("DORMANT")]++;
            modules[snapshot.moduleFor(path)]++;
        }

        double internalRatio = 0.0;
        auto out = importsOut.find(dir);
        if (out != importsOut.end() && out->second > 0) {
            internalRatio = static_cast<double>(importsInternal[dir]) / static_cast<double>(out->second);
        }

        field.setDirectory(dir, "file_count", integer(static_cast<int64_t>(members.size())));
        field.setDirectory(dir, "total_lines", integer(totalLines));
        field.setDirectory(dir, "total_functions", integer(totalFunctions));
        field.setDirectory(dir, "avg_complexity", SignalValue(mean(loads)));
        field.setDirectory(dir, "avg_churn", SignalValue(mean(churn)));
        field.setDirectory(dir, "internal_import_ratio", SignalValue(internalRatio));
        field.setDirectory(dir, "dominant_role", SignalValue(dominant<std::string>(roles, "UNKNOWN")));
        field.setDirectory(dir, "dominant_trajectory",
                           SignalValue(dominant<std::string>(trajectories, "DORMANT")));
        field.setDirectory(dir, "hotspot_file_count", integer(hotspots));
        field.setDirectory(dir, "module_path", SignalValue(dominant<std::string>(modules, dir)));
    }
}

void FusionPipeline::collectModules(RunState& state) const {
    SignalField& field = state.field();
    for (const auto& [module, m] : state.inputs.architecture.modules) {
        field.setModule(module, "file_count", integer(static_cast<int64_t>(m.files.size())));
        field.setModule(module, "cohesion", SignalValue(m.cohesion));
        field.setModule(module, "coupling", SignalValue(m.coupling));
        field.setModule(module, "afferent_coupling", integer(m.afferentCoupling));
        field.setModule(module, "efferent_coupling", integer(m.efferentCoupling));
        field.setModule(module, "instability", optionalNumber(m.instability));
        field.setModule(module, "abstractness", SignalValue(m.abstractness));
        field.setModule(module, "main_seq_distance", optionalNumber(m.mainSeqDistance));
        field.setModule(module, "boundary_alignment", SignalValue(m.boundaryAlignment));
        field.setModule(module, "role_consistency", SignalValue(m.roleConsistency));
        field.setModule(module, "layer", integer(static_cast<int64_t>(m.layer)));
        field.setModule(module, "layer_violation_count", integer(m.layerViolationCount));
        field.setModule(module, "mean_cognitive_load", SignalValue(m.meanCognitiveLoad));
    }
}

void FusionPipeline::collectGlobals(RunState& state) const {
    const auto& snapshot = state.snapshot();
    const auto& graph = state.inputs.graph;
    const auto& architecture = state.inputs.architecture;
    SignalField& field = state.field();

    double fileCount = static_cast<double>(state.paths.size());
    int64_t orphans = 0;
    int64_t phantomFiles = 0;
    std::vector<double> betweenness;
    std::vector<double> outDegrees;
    for (const auto& [path, m] : graph.files) {
        if (m.isOrphan) {
            orphans++;
        }
        if (m.phantomImportCount > 0) {
            phantomFiles++;
        }
        betweenness.push_back(m.betweenness);
        outDegrees.push_back(static_cast<double>(m.outDegree));
    }

    double betweennessCut = upperMedian(betweenness);
    double outDegreeCut = upperMedian(outDegrees);
    int64_t glueFiles = 0;
    for (const auto& [path, m] : graph.files) {
        if (m.betweenness > betweennessCut && static_cast<double>(m.outDegree) > outDegreeCut) {
            glueFiles++;
        }
    }
    double expectedGlue = std::max(std::sqrt(static_cast<double>(architecture.modules.size())), 1.0);
    double glueDeficit = clamp01(1.0 - static_cast<double>(glueFiles) / expectedGlue);

    std::set<std::string> clonedFiles;
    for (const auto& pair : snapshot.clonePairs) {
        if (snapshot.files.count(pair.fileA)) {
            clonedFiles.insert(pair.fileA);
        }
        if (snapshot.files.count(pair.fileB)) {
            clonedFiles.insert(pair.fileB);
        }
    }

    auto ratio = [fileCount](double count) {
        return fileCount > 0.0 ? count / fileCount : 0.0;
    };

    field.setGlobal("tier", SignalValue(tierToString(state.tier->tier())));
    field.setGlobal("file_count", integer(static_cast<int64_t>(state.paths.size())));
    field.setGlobal("modularity", SignalValue(graph.communities.modularity));
    field.setGlobal("community_count", integer(static_cast<int64_t>(graph.communities.communityCount)));
    field.setGlobal("fiedler_value", SignalValue(graph.spectral.fiedlerValue));
    field.setGlobal("spectral_gap", SignalValue(graph.spectral.spectralGap));
    field.setGlobal("component_count", integer(static_cast<int64_t>(graph.spectral.componentCount)));
    field.setGlobal("cycle_count", integer(static_cast<int64_t>(graph.cycles.size())));
    field.setGlobal("centrality_gini", SignalValue(graph.centralityGini));
    field.setGlobal("orphan_ratio", SignalValue(ratio(static_cast<double>(orphans))));
    field.setGlobal("phantom_ratio", SignalValue(ratio(static_cast<double>(phantomFiles))));
    field.setGlobal("glue_deficit", SignalValue(glueDeficit));
    field.setGlobal("clone_ratio", SignalValue(ratio(static_cast<double>(clonedFiles.size()))));
    field.setGlobal("violation_rate", SignalValue(architecture.violationRate));
    field.setGlobal("conway_alignment", SignalValue(architecture.conwayAlignment));
    field.setGlobal("team_size", integer(state.inputs.temporal.teamSize));
}

// ---------------------------------------------------------------------------
// Stage 2: RawRisk

void FusionPipeline::computeRawRisk(RunState& state) const {
    SignalField& field = state.field();

    double maxPagerank = 0.0;
    double maxBlast = 0.0;
    double maxLoad = 0.0;
    double maxBus = 0.0;
    for (const auto& path : state.paths) {
        maxPagerank = std::max(maxPagerank, field.fileNumber(path, "pagerank").value_or(0.0));
        maxBlast = std::max(maxBlast, field.fileNumber(path, "blast_radius_size").value_or(0.0));
        maxLoad = std::max(maxLoad, field.fileNumber(path, "cognitive_load").value_or(0.0));
        maxBus = std::max(maxBus, field.fileNumber(path, "bus_factor").value_or(0.0));
    }

    auto risks = executor_.map<std::optional<double>>(state.paths, [&](const std::string& path)
                                                       -> std::optional<double> {
        auto pagerank = field.fileNumber(path, "pagerank");
        auto blast = field.fileNumber(path, "blast_radius_size");
        auto load = field.fileNumber(path, "cognitive_load");
        auto bus = field.fileNumber(path, "bus_factor");
        auto trajectory = field.text(SignalScope::File, path, "churn_trajectory");
        if (!pagerank || !blast || !load || !bus || !trajectory) {
            return std::nullopt;
        }

        RawRiskInputs inputs;
        inputs.pagerankNorm = normMax(*pagerank, maxPagerank);
        inputs.blastRadiusNorm = normMax(*blast, maxBlast);
        inputs.cognitiveLoadNorm = normMax(*load, maxLoad);
        inputs.trajectory = trajectoryFromString(*trajectory);
        inputs.busFactorNorm = normMax(*bus, maxBus);
        return rawRisk(inputs);
    });

    for (size_t i = 0; i < state.paths.size(); i++) {
        field.setFile(state.paths[i], "raw_risk", optionalNumber(risks[i]));
    }
}

// ---------------------------------------------------------------------------
// Stage 3: Normalize

void FusionPipeline::normalize(RunState& state) const {
    SignalField& field = state.field();
    const TierStrategy& tier = *state.tier;
    std::vector<const SignalMeta*> signals = field.registry().percentileableFileSignals();

    std::map<std::string, PercentileTable> tables;
    if (tier.usesPercentiles()) {
        for (const SignalMeta* meta : signals) {
            std::vector<double> population;
            for (const auto& path : state.paths) {
                if (auto value = field.fileNumber(path, meta->name)) {
                    population.push_back(*value);
                }
            }
            tables.emplace(meta->name, PercentileTable(std::move(population)));
        }
    }

    using PercentileRow = std::vector<std::optional<double>>;
    auto rows = executor_.map<PercentileRow>(state.paths, [&](const std::string& path) {
        PercentileRow row;
        row.reserve(signals.size());
        for (const SignalMeta* meta : signals) {
            auto value = field.fileNumber(path, meta->name);
            if (!value || !tier.usesPercentiles()) {
                row.push_back(std::nullopt);
                continue;
            }
            row.push_back(tier.percentile(meta->name, *value, tables.at(meta->name)));
        }
        return row;
    });

    for (size_t i = 0; i < state.paths.size(); i++) {
        for (size_t s = 0; s < signals.size(); s++) {
            field.setPercentile(state.paths[i], signals[s]->name, rows[i][s]);
        }
    }
}

// ---------------------------------------------------------------------------
// Stage 4: ModuleTemporal

void FusionPipeline::computeModuleTemporal(RunState& state) const {
    const auto& snapshot = state.snapshot();
    const auto& architecture = state.inputs.architecture;
    SignalField& field = state.field();
    double weeks = std::max(state.inputs.temporal.spanWeeks, 1.0);

    std::vector<std::string> modules;
    for (const auto& [module, metrics] : architecture.modules) {
        modules.push_back(module);
    }

    struct ModuleTemporal {
        double velocity = 0.0;
        std::optional<double> coordinationCost;
        double knowledgeGini = 0.0;
        std::optional<double> busFactor;
    };

    auto results = executor_.map<ModuleTemporal>(modules, [&](const std::string& module) {
        const ModuleMetrics& metrics = architecture.modules.at(module);
        ModuleTemporal out;

        // Commits without an id are distinct by author, time and message
        std::map<std::string, std::string> commitAuthor;
        std::map<std::string, double> historyAuthors;
        for (const auto& path : metrics.files) {
            const TemporalRecord& history = snapshot.files.at(path).temporal;
            for (const auto& commit : history.commits) {
                std::string key = commit.id.empty()
                    ? commit.author + "@" + std::to_string(commit.timestamp) + ":" + commit.message
                    : commit.id;
                commitAuthor.emplace(key, commit.author);
            }
            for (const auto& [author, count] : history.authorCommits) {
                historyAuthors[author] += static_cast<double>(count);
            }
        }

        std::map<std::string, double> authorCounts;
        for (const auto& [key, author] : commitAuthor) {
            authorCounts[author] += 1.0;
        }
        if (authorCounts.empty()) {
            authorCounts = historyAuthors;
        }

        double commits = static_cast<double>(commitAuthor.size());
        out.velocity = commits / weeks;
        if (commits > 0.0) {
            std::set<std::string> authors;
            for (const auto& [key, author] : commitAuthor) {
                authors.insert(author);
            }
            out.coordinationCost = static_cast<double>(authors.size()) / commits;
        }

        std::vector<double> counts;
        for (const auto& [author, count] : authorCounts) {
            counts.push_back(count);
        }
        out.knowledgeGini = gini(counts);

        std::vector<double> critical;
        std::vector<double> all;
        for (const auto& path : metrics.files) {
            auto bus = field.fileNumber(path, "bus_factor");
            if (!bus) {
                continue;
            }
            all.push_back(*bus);
            auto pct = field.percentile(path, "pagerank");
            if (pct && *pct >= CRITICAL_PERCENTILE) {
                critical.push_back(*bus);
            }
        }
        if (!critical.empty()) {
            out.busFactor = *std::min_element(critical.begin(), critical.end());
        } else {
            out.busFactor = meanOf(all);
        }
        return out;
    });

    for (size_t i = 0; i < modules.size(); i++) {
        const ModuleTemporal& r = results[i];
        field.setModule(modules[i], "velocity", SignalValue(r.velocity));
        field.setModule(modules[i], "coordination_cost", optionalNumber(r.coordinationCost));
        field.setModule(modules[i], "knowledge_gini", SignalValue(r.knowledgeGini));
        field.setModule(modules[i], "module_bus_factor", optionalNumber(r.busFactor));
    }
}

// ---------------------------------------------------------------------------
// Stage 5: Composites

void FusionPipeline::computeComposites(RunState& state) const {
    computeFileComposites(state);
    computeDirectoryComposites(state);
    computeModuleComposites(state);
    computeGlobalComposites(state);
}

void FusionPipeline::computeFileComposites(RunState& state) const {
    SignalField& field = state.field();
    const TierStrategy& tier = *state.tier;

    struct FileComposites {
        std::optional<double> risk;
        std::optional<double> wiring;
        std::optional<double> health;
    };

    auto scaled = [&](const std::string& path, const std::string& signal) {
        return tier.scaled(signal, field.fileNumber(path, signal), field.percentile(path, signal));
    };

    auto results = executor_.map<FileComposites>(state.paths, [&](const std::string& path) {
        FileComposites out;

        RiskInputs risk;
        risk.pagerankScaled = scaled(path, "pagerank");
        risk.blastRadiusScaled = scaled(path, "blast_radius_size");
        risk.cognitiveLoadScaled = scaled(path, "cognitive_load");
        risk.trajectory = trajectoryFromString(
            field.text(SignalScope::File, path, "churn_trajectory").value_or("DORMANT"));
        risk.busFactor = field.fileNumber(path, "bus_factor");
        risk.totalChanges = static_cast<int64_t>(field.fileNumber(path, "total_changes").value_or(0.0));
        out.risk = riskScore(risk);

        bool orphan = field.fileNumber(path, "is_orphan").value_or(0.0) > 0.0;
        double stub = field.fileNumber(path, "stub_ratio").value_or(0.0);
        double imports = field.fileNumber(path, "import_count").value_or(0.0);
        double phantoms = field.fileNumber(path, "phantom_import_count").value_or(0.0);
        double broken = field.fileNumber(path, "broken_call_count").value_or(0.0);
        double degree = field.fileNumber(path, "in_degree").value_or(0.0) +
                        field.fileNumber(path, "out_degree").value_or(0.0);

        out.wiring = wiringQuality(orphan, stub, phantoms / std::max(imports, 1.0),
                                   broken / std::max(degree, 1.0));
        out.health = fileHealthScore(out.risk, out.wiring, risk.cognitiveLoadScaled, stub, orphan);
        return out;
    });

    for (size_t i = 0; i < state.paths.size(); i++) {
        const auto& path = state.paths[i];
        writeComposite(field, SignalScope::File, path, "risk_score", results[i].risk);
        writeComposite(field, SignalScope::File, path, "wiring_quality", results[i].wiring);
        writeComposite(field, SignalScope::File, path, "file_health_score", results[i].health);
    }
}

void FusionPipeline::computeDirectoryComposites(RunState& state) const {
    SignalField& field = state.field();
    for (const auto& [dir, members] : state.directories) {
        std::vector<double> risks;
        int64_t highRisk = 0;
        for (const auto& path : members) {
            if (auto risk = field.fileNumber(path, "risk_score")) {
                risks.push_back(*risk);
                if (*risk > HIGH_RISK) {
                    highRisk++;
                }
            }
        }
        field.setDirectory(dir, "avg_risk", optionalNumber(meanOf(risks)));
        field.setDirectory(dir, "high_risk_file_count", integer(highRisk));
    }
}

void FusionPipeline::computeModuleComposites(RunState& state) const {
    SignalField& field = state.field();
    for (const auto& [module, m] : state.inputs.architecture.modules) {
        std::vector<double> stubs;
        for (const auto& path : m.files) {
            stubs.push_back(field.fileNumber(path, "stub_ratio").value_or(0.0));
        }

        ModuleHealthInputs inputs;
        inputs.cohesion = m.cohesion;
        inputs.coupling = m.coupling;
        inputs.mainSeqDistance = m.mainSeqDistance;
        inputs.boundaryAlignment = m.boundaryAlignment;
        inputs.roleConsistency = m.roleConsistency;
        inputs.meanStubRatio = meanOf(stubs).value_or(0.0);
        writeComposite(field, SignalScope::Module, module, "health_score", moduleHealthScore(inputs));
    }
}

double FusionPipeline::criticalBusFactor(const RunState& state) const {
    const SignalField& field = state.field();
    std::optional<double> critical;
    std::optional<double> overall;

    for (const auto& path : state.paths) {
        auto bus = field.fileNumber(path, "bus_factor");
        if (!bus) {
            continue;
        }
        overall = overall ? std::min(*overall, *bus) : *bus;
        auto pct = field.percentile(path, "pagerank");
        if (state.tier->usesPercentiles() && pct && *pct >= CRITICAL_PERCENTILE) {
            critical = critical ? std::min(*critical, *bus) : *bus;
        }
    }

    if (critical) {
        return *critical;
    }
    return overall.value_or(1.0);
}

void FusionPipeline::computeGlobalComposites(RunState& state) const {
    SignalField& field = state.field();
    const auto& modules = state.inputs.architecture.modules;
    auto global = [&field](const std::string& name) {
        return field.globalNumber(name).value_or(0.0);
    };

    std::vector<double> stubs;
    for (const auto& path : state.paths) {
        stubs.push_back(field.fileNumber(path, "stub_ratio").value_or(0.0));
    }

    WiringInputs wiring;
    wiring.orphanRatio = global("orphan_ratio");
    wiring.phantomRatio = global("phantom_ratio");
    wiring.glueDeficit = global("glue_deficit");
    wiring.meanStubRatio = meanOf(stubs).value_or(0.0);
    wiring.cloneRatio = global("clone_ratio");
    double wiringValue = wiringScore(wiring);

    std::vector<double> cohesion;
    std::vector<double> coupling;
    std::vector<double> mainSeq;
    std::vector<double> boundary;
    std::vector<double> knowledge;
    std::vector<double> coordination;
    for (const auto& [module, m] : modules) {
        cohesion.push_back(m.cohesion);
        coupling.push_back(m.coupling);
        if (m.mainSeqDistance) {
            mainSeq.push_back(*m.mainSeqDistance);
        }
        boundary.push_back(m.boundaryAlignment);
        if (auto g = field.moduleNumber(module, "knowledge_gini")) {
            knowledge.push_back(*g);
        }
        if (auto c = field.moduleNumber(module, "coordination_cost")) {
            coordination.push_back(*c);
        }
    }

    std::optional<double> architecture;
    if (!modules.empty()) {
        ArchitectureInputs inputs;
        inputs.violationRate = global("violation_rate");
        inputs.meanCohesion = meanOf(cohesion);
        inputs.meanCoupling = meanOf(coupling);
        inputs.meanMainSeqDistance = meanOf(mainSeq);
        inputs.meanBoundaryAlignment = meanOf(boundary);
        architecture = architectureHealth(inputs);
    }

    double busFactor = criticalBusFactor(state);
    int64_t teamSize = state.inputs.temporal.teamSize;

    TeamInputs team;
    team.criticalBusFactor = busFactor;
    if (!knowledge.empty()) {
        team.maxKnowledgeGini = *std::max_element(knowledge.begin(), knowledge.end());
    }
    team.meanCoordinationCost = meanOf(coordination);
    team.conwayAlignment = global("conway_alignment");

    double health;
    if (state.tier->tier() == Tier::Absolute && state.inputs.graph.graph.edgeCount() == 0) {
        health = absoluteCodebaseHealth(wiringValue, busFactorRatio(busFactor, teamSize));
    } else {
        CodebaseInputs inputs;
        inputs.architectureHealth = architecture;
        inputs.wiringScore = wiringValue;
        inputs.criticalBusFactor = busFactor;
        inputs.teamSize = teamSize;
        inputs.modularity = global("modularity");
        health = codebaseHealth(inputs);
    }

    writeComposite(field, SignalScope::Global, GLOBAL_ENTITY, "wiring_score", wiringValue);
    writeComposite(field, SignalScope::Global, GLOBAL_ENTITY, "architecture_health", architecture);
    writeComposite(field, SignalScope::Global, GLOBAL_ENTITY, "team_risk", teamRisk(team));
    writeComposite(field, SignalScope::Global, GLOBAL_ENTITY, "codebase_health", health);
}

// ---------------------------------------------------------------------------
// Stage 6: HealthLaplacian

void FusionPipeline::computeHealthLaplacian(RunState& state) const {
    SignalField& field = state.field();
    std::map<std::string, std::optional<double>> raw;
    for (const auto& path : state.paths) {
        raw[path] = field.fileNumber(path, "raw_risk");
    }

    state.result.deltaH = healthLaplacian(state.inputs.graph.graph, raw);
    for (const auto& path : state.paths) {
        auto it = state.result.deltaH.find(path);
        std::optional<double> value;
        if (it != state.result.deltaH.end()) {
            value = it->second;
        }
        field.setFile(path, "delta_h", optionalNumber(value));
    }
}
