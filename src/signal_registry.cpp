#include "signal_registry.hpp"

namespace {

constexpr auto Int = SignalType::Int;
constexpr auto Float = SignalType::Float;
constexpr auto Bool = SignalType::Bool;
constexpr auto Text = SignalType::Text;

constexpr auto Bad = Polarity::HighIsBad;
constexpr auto Good = Polarity::HighIsGood;
constexpr auto Neutral = Polarity::Neutral;

SignalMeta meta(const std::string& name, SignalScope scope, SignalType type, Polarity polarity,
                bool percentileable, std::optional<double> threshold, Stage stage,
                const std::string& description) {
    SignalMeta m;
    m.name = name;
    m.scope = scope;
    m.type = type;
    m.polarity = polarity;
    m.percentileable = percentileable;
    m.absoluteThreshold = threshold;
    m.stage = stage;
    m.description = description;
    return m;
}

void declareFileSignals(SignalRegistry& registry) {
    const auto F = SignalScope::File;
    const auto none = std::nullopt;

    // Structural measurements
    registry.declare(meta("lines", F, Int, Bad, true, 500.0, Stage::Collect, "Lines of code"));
    registry.declare(meta("function_count", F, Int, Bad, true, 30.0, Stage::Collect, "Number of functions"));
    registry.declare(meta("class_count", F, Int, Neutral, true, none, Stage::Collect, "Number of classes"));
    registry.declare(meta("max_nesting", F, Int, Bad, true, 4.0, Stage::Collect, "Deepest block nesting"));
    registry.declare(meta("impl_gini", F, Float, Bad, true, 0.6, Stage::Collect, "Inequality of function sizes"));
    registry.declare(meta("stub_ratio", F, Float, Bad, true, 0.5, Stage::Collect, "Fraction of trivial functions"));
    registry.declare(meta("import_count", F, Int, Neutral, true, none, Stage::Collect, "Declared imports"));
    registry.declare(meta("broken_call_count", F, Int, Bad, true, 0.0, Stage::Collect, "Calls to unresolved symbols"));

    // Semantic measurements
    registry.declare(meta("role", F, Text, Neutral, false, none, Stage::Collect, "Semantic role"));
    registry.declare(meta("concept_count", F, Int, Bad, true, none, Stage::Collect, "Distinct concepts"));
    registry.declare(meta("concept_entropy", F, Float, Bad, true, 1.5, Stage::Collect, "Entropy of concept weights"));
    registry.declare(meta("naming_drift", F, Float, Bad, true, 0.7, Stage::Collect, "Filename vs content mismatch"));
    registry.declare(meta("todo_density", F, Float, Bad, true, 0.05, Stage::Collect, "TODO markers per line"));
    registry.declare(meta("docstring_coverage", F, Float, Good, true, none, Stage::Collect, "Documented public symbols"));
    registry.declare(meta("compression_ratio", F, Float, Neutral, true, none, Stage::Collect, "Compressed / raw size"));

    // Graph measurements
    registry.declare(meta("pagerank", F, Float, Bad, true, none, Stage::Collect, "PageRank centrality"));
    registry.declare(meta("betweenness", F, Float, Bad, true, none, Stage::Collect, "Normalized betweenness"));
    registry.declare(meta("in_degree", F, Int, Neutral, true, none, Stage::Collect, "Distinct importers"));
    registry.declare(meta("out_degree", F, Int, Neutral, true, none, Stage::Collect, "Distinct imports"));
    registry.declare(meta("blast_radius_size", F, Int, Bad, true, none, Stage::Collect, "Transitive dependents"));
    registry.declare(meta("depth", F, Int, Neutral, true, none, Stage::Collect, "Hops from nearest entry point, -1 if unreachable"));
    registry.declare(meta("is_orphan", F, Bool, Bad, false, none, Stage::Collect, "No importers and not exempt by role"));
    registry.declare(meta("phantom_import_count", F, Int, Bad, true, 0.0, Stage::Collect, "Imports of undeclared files"));
    registry.declare(meta("community", F, Int, Neutral, false, none, Stage::Collect, "Louvain community id"));
    registry.declare(meta("cognitive_load", F, Float, Bad, true, none, Stage::Collect, "Size, complexity and nesting load"));

    // Temporal measurements
    registry.declare(meta("total_changes", F, Int, Bad, true, none, Stage::Collect, "Commits touching the file"));
    registry.declare(meta("churn_trajectory", F, Text, Neutral, false, none, Stage::Collect, "Shape of change history"));
    registry.declare(meta("churn_slope", F, Float, Bad, true, none, Stage::Collect, "Trend of windowed change counts"));
    registry.declare(meta("churn_cv", F, Float, Bad, true, 1.0, Stage::Collect, "Variation of windowed change counts"));
    registry.declare(meta("bus_factor", F, Float, Good, true, 1.0, Stage::Collect, "Effective number of authors"));
    registry.declare(meta("author_entropy", F, Float, Good, true, none, Stage::Collect, "Entropy of author shares"));
    registry.declare(meta("fix_ratio", F, Float, Bad, true, 0.4, Stage::Collect, "Fraction of fix commits"));
    registry.declare(meta("refactor_ratio", F, Float, Good, true, none, Stage::Collect, "Fraction of refactor commits"));
    registry.declare(meta("change_entropy", F, Float, Bad, true, none, Stage::Collect, "Entropy of changes over windows"));

    // Hierarchy context
    registry.declare(meta("parent_dir", F, Text, Neutral, false, none, Stage::Collect, "Containing directory"));
    registry.declare(meta("module_path", F, Text, Neutral, false, none, Stage::Collect, "Owning module"));
    registry.declare(meta("dir_depth", F, Int, Neutral, false, none, Stage::Collect, "Path separators in the path"));
    registry.declare(meta("siblings_count", F, Int, Neutral, false, none, Stage::Collect, "Other files in the directory"));

    registry.declare(meta("raw_risk", F, Float, Bad, false, none, Stage::RawRisk, "Pre-percentile weighted risk"));

    registry.declareComposite(meta("risk_score", F, Float, Bad, false, none, Stage::Composites, "Structural risk x complexity x churn x bus factor"));
    registry.declareComposite(meta("wiring_quality", F, Float, Good, false, none, Stage::Composites, "Absence of orphan, stub and phantom defects"));
    registry.declareComposite(meta("file_health_score", F, Float, Good, false, none, Stage::Composites, "Per-file health"));

    registry.declare(meta("delta_h", F, Float, Bad, false, none, Stage::HealthLaplacian, "Raw risk above the neighborhood mean"));
}

void declareDirectorySignals(SignalRegistry& registry) {
    const auto D = SignalScope::Directory;
    const auto none = std::nullopt;

    registry.declare(meta("file_count", D, Int, Neutral, false, none, Stage::Collect, "Files in the directory"));
    registry.declare(meta("total_lines", D, Int, Neutral, false, none, Stage::Collect, "Summed lines"));
    registry.declare(meta("total_functions", D, Int, Neutral, false, none, Stage::Collect, "Summed functions"));
    registry.declare(meta("avg_complexity", D, Float, Bad, false, none, Stage::Collect, "Mean cognitive load"));
    registry.declare(meta("avg_churn", D, Float, Bad, false, none, Stage::Collect, "Mean total changes"));
    registry.declare(meta("internal_import_ratio", D, Float, Good, false, none, Stage::Collect, "Imports staying in the directory"));
    registry.declare(meta("dominant_role", D, Text, Neutral, false, none, Stage::Collect, "Most common role"));
    registry.declare(meta("dominant_trajectory", D, Text, Neutral, false, none, Stage::Collect, "Most common churn trajectory"));
    registry.declare(meta("hotspot_file_count", D, Int, Bad, false, none, Stage::Collect, "Files changing more than the median"));
    registry.declare(meta("module_path", D, Text, Neutral, false, none, Stage::Collect, "Most common owning module"));

    registry.declare(meta("avg_risk", D, Float, Bad, false, none, Stage::Composites, "Mean risk score"));
    registry.declare(meta("high_risk_file_count", D, Int, Bad, false, none, Stage::Composites, "Files with risk above 0.7"));
}

void declareModuleSignals(SignalRegistry& registry) {
    const auto M = SignalScope::Module;
    const auto none = std::nullopt;

    registry.declare(meta("file_count", M, Int, Neutral, false, none, Stage::Collect, "Member files"));
    registry.declare(meta("cohesion", M, Float, Good, false, none, Stage::Collect, "Internal edge density"));
    registry.declare(meta("coupling", M, Float, Bad, false, none, Stage::Collect, "External share of outgoing edges"));
    registry.declare(meta("afferent_coupling", M, Int, Neutral, false, none, Stage::Collect, "Modules depending on this one"));
    registry.declare(meta("efferent_coupling", M, Int, Neutral, false, none, Stage::Collect, "Modules this one depends on"));
    registry.declare(meta("instability", M, Float, Neutral, false, none, Stage::Collect, "Ce / (Ca + Ce)"));
    registry.declare(meta("abstractness", M, Float, Neutral, false, none, Stage::Collect, "Abstract share of classes"));
    registry.declare(meta("main_seq_distance", M, Float, Bad, false, none, Stage::Collect, "|A + I - 1|"));
    registry.declare(meta("boundary_alignment", M, Float, Good, false, none, Stage::Collect, "Members sharing the dominant community"));
    registry.declare(meta("role_consistency", M, Float, Good, false, none, Stage::Collect, "Members sharing the dominant role"));
    registry.declare(meta("layer", M, Int, Neutral, false, none, Stage::Collect, "Inferred architectural layer"));
    registry.declare(meta("layer_violation_count", M, Int, Bad, false, none, Stage::Collect, "Backward and skip edges from this module"));
    registry.declare(meta("mean_cognitive_load", M, Float, Bad, false, none, Stage::Collect, "Mean member cognitive load"));

    registry.declare(meta("velocity", M, Float, Neutral, false, none, Stage::ModuleTemporal, "Commits per week"));
    registry.declare(meta("coordination_cost", M, Float, Bad, false, none, Stage::ModuleTemporal, "Distinct authors per commit"));
    registry.declare(meta("knowledge_gini", M, Float, Bad, false, none, Stage::ModuleTemporal, "Inequality of author commits"));
    registry.declare(meta("module_bus_factor", M, Float, Good, false, none, Stage::ModuleTemporal, "Bus factor of the critical members"));

    registry.declareComposite(meta("health_score", M, Float, Good, false, none, Stage::Composites, "Module health"));
}

void declareGlobalSignals(SignalRegistry& registry) {
    const auto G = SignalScope::Global;
    const auto none = std::nullopt;

    registry.declare(meta("tier", G, Text, Neutral, false, none, Stage::Collect, "Normalization tier"));
    registry.declare(meta("file_count", G, Int, Neutral, false, none, Stage::Collect, "Files in the snapshot"));
    registry.declare(meta("modularity", G, Float, Good, false, none, Stage::Collect, "Louvain modularity Q"));
    registry.declare(meta("community_count", G, Int, Neutral, false, none, Stage::Collect, "Louvain communities"));
    registry.declare(meta("fiedler_value", G, Float, Good, false, none, Stage::Collect, "Algebraic connectivity"));
    registry.declare(meta("spectral_gap", G, Float, Good, false, none, Stage::Collect, "Second minus smallest Laplacian eigenvalue"));
    registry.declare(meta("component_count", G, Int, Neutral, false, none, Stage::Collect, "Connected components of the undirected graph"));
    registry.declare(meta("cycle_count", G, Int, Bad, false, none, Stage::Collect, "Strongly connected components with more than one file"));
    registry.declare(meta("centrality_gini", G, Float, Bad, false, none, Stage::Collect, "Inequality of PageRank"));
    registry.declare(meta("orphan_ratio", G, Float, Bad, false, none, Stage::Collect, "Orphan share of files"));
    registry.declare(meta("phantom_ratio", G, Float, Bad, false, none, Stage::Collect, "Share of files importing undeclared targets"));
    registry.declare(meta("glue_deficit", G, Float, Bad, false, none, Stage::Collect, "Missing connector files"));
    registry.declare(meta("clone_ratio", G, Float, Bad, false, none, Stage::Collect, "Files in a clone pair"));
    registry.declare(meta("violation_rate", G, Float, Bad, false, none, Stage::Collect, "Layer-violating share of cross-module edges"));
    registry.declare(meta("conway_alignment", G, Float, Good, false, none, Stage::Collect, "Author overlap of coupled modules"));
    registry.declare(meta("team_size", G, Int, Neutral, false, none, Stage::Collect, "Distinct authors"));

    registry.declareComposite(meta("wiring_score", G, Float, Good, false, none, Stage::Composites, "Codebase wiring"));
    registry.declareComposite(meta("architecture_health", G, Float, Good, false, none, Stage::Composites, "Layering and modularity"));
    registry.declareComposite(meta("team_risk", G, Float, Bad, false, none, Stage::Composites, "Knowledge concentration risk"));
    registry.declareComposite(meta("codebase_health", G, Float, Good, false, none, Stage::Composites, "Overall health"));
}

} // namespace

SignalRegistry SignalRegistry::createDefault() {
    SignalRegistry registry;
    declareFileSignals(registry);
    declareDirectorySignals(registry);
    declareModuleSignals(registry);
    declareGlobalSignals(registry);
    return registry;
}

void SignalRegistry::declare(SignalMeta meta) {
    auto key = std::make_pair(meta.scope, meta.name);
    if (signals_.count(key)) {
        throw SignalFieldError("Signal " + meta.name + " already declared at " +
                               scopeToString(meta.scope) + " scope");
    }
    signals_.emplace(std::move(key), std::move(meta));
}

void SignalRegistry::declareComposite(SignalMeta meta) {
    SignalMeta display = meta;
    display.name = meta.name + "_display";
    display.polarity = meta.polarity;
    display.percentileable = false;
    display.absoluteThreshold.reset();
    display.description = "1-10 display of " + meta.name;

    declare(std::move(meta));
    declare(std::move(display));
}

const SignalMeta* SignalRegistry::find(SignalScope scope, const std::string& name) const {
    auto it = signals_.find(std::make_pair(scope, name));
    return it == signals_.end() ? nullptr : &it->second;
}

std::vector<const SignalMeta*> SignalRegistry::signals(SignalScope scope) const {
    std::vector<const SignalMeta*> result;
    for (const auto& [key, meta] : signals_) {
        if (key.first == scope) {
            result.push_back(&meta);
        }
    }
    return result;
}

std::vector<const SignalMeta*> SignalRegistry::percentileableFileSignals() const {
    std::vector<const SignalMeta*> result;
    for (const auto* meta : signals(SignalScope::File)) {
        if (meta->percentileable) {
            result.push_back(meta);
        }
    }
    return result;
}
