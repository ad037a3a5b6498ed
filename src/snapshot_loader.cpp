#include "snapshot_loader.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

template <typename T>
void readOptional(const std::string& path, const json& node, const char* key, T& target) {
    auto it = node.find(key);
    if (it == node.end() || it->is_null()) {
        return;
    }
    try {
        target = it->get<T>();
    } catch (const json::exception& e) {
        throw SnapshotError("File " + path + ": invalid '" + key + "': " + e.what());
    }
}

template <typename T>
void readRequired(const std::string& path, const json& node, const char* key, T& target) {
    if (!node.contains(key) || node.at(key).is_null()) {
        throw SnapshotError("File " + path + ": missing '" + key + "'");
    }
    readOptional(path, node, key, target);
}

// Nullable float: absent and null both stay nullopt
void readNullable(const std::string& path, const json& node, const char* key,
                  std::optional<double>& target) {
    auto it = node.find(key);
    if (it == node.end() || it->is_null()) {
        target = std::nullopt;
        return;
    }
    if (!it->is_number()) {
        throw SnapshotError("File " + path + ": '" + key + "' must be a number or null");
    }
    target = it->get<double>();
}

} // namespace

CodebaseSnapshot SnapshotLoader::loadFile(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw SnapshotError("Could not open snapshot file: " + path.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return loadString(buffer.str());
}

CodebaseSnapshot SnapshotLoader::loadString(const std::string& content) {
    json root;
    try {
        root = json::parse(content);
    } catch (const json::parse_error& e) {
        throw SnapshotError(std::string("Malformed snapshot JSON: ") + e.what());
    }
    return fromJson(root);
}

CodebaseSnapshot SnapshotLoader::fromJson(const json& root) {
    if (!root.is_object()) {
        throw SnapshotError("Snapshot root must be a JSON object");
    }

    CodebaseSnapshot snapshot;

    auto files = root.find("files");
    if (files == root.end() || !files->is_object()) {
        throw SnapshotError("Snapshot must contain a 'files' object");
    }
    for (const auto& [path, entry] : files->items()) {
        if (!entry.is_object()) {
            throw SnapshotError("File " + path + ": entry must be an object");
        }

        FileMeasurements measurements;
        if (entry.contains("structural") && !entry.at("structural").is_null()) {
            measurements.structural = parseStructural(path, entry.at("structural"));
        }
        if (entry.contains("semantic") && !entry.at("semantic").is_null()) {
            measurements.semantic = parseSemantic(path, entry.at("semantic"));
        }
        if (entry.contains("temporal") && !entry.at("temporal").is_null()) {
            measurements.temporal = parseTemporal(path, entry.at("temporal"));
        }
        snapshot.files.emplace(path, std::move(measurements));
    }

    if (root.contains("edges")) {
        const json& edges = root.at("edges");
        if (!edges.is_array()) {
            throw SnapshotError("'edges' must be an array");
        }
        for (const auto& node : edges) {
            RawEdge edge;
            try {
                edge.source = node.at("source").get<std::string>();
                edge.target = node.at("target").get<std::string>();
                edge.referenceCount = node.value("reference_count", static_cast<int64_t>(1));
            } catch (const json::exception& e) {
                throw SnapshotError(std::string("Malformed edge: ") + e.what());
            }
            if (edge.referenceCount < 1) {
                throw SnapshotError("Edge " + edge.source + " -> " + edge.target +
                                    ": reference_count must be positive");
            }
            snapshot.edges.push_back(std::move(edge));
        }
    }

    if (root.contains("module_of")) {
        try {
            snapshot.moduleOf = root.at("module_of").get<std::map<std::string, std::string>>();
        } catch (const json::exception& e) {
            throw SnapshotError(std::string("Malformed module_of: ") + e.what());
        }
    }

    if (root.contains("clone_pairs")) {
        const json& pairs = root.at("clone_pairs");
        if (!pairs.is_array()) {
            throw SnapshotError("'clone_pairs' must be an array");
        }
        for (const auto& node : pairs) {
            try {
                snapshot.clonePairs.push_back({node.at("file_a").get<std::string>(),
                                               node.at("file_b").get<std::string>()});
            } catch (const json::exception& e) {
                throw SnapshotError(std::string("Malformed clone pair: ") + e.what());
            }
        }
    }

    snapshot.reconcileTemporal();
    snapshot.validate();
    return snapshot;
}

StructuralRecord SnapshotLoader::parseStructural(const std::string& path, const json& node) {
    if (!node.is_object()) {
        throw SnapshotError("File " + path + ": structural record must be an object");
    }
    StructuralRecord s;
    readRequired(path, node, "lines", s.lines);
    readRequired(path, node, "function_count", s.functionCount);
    readOptional(path, node, "class_count", s.classCount);
    readOptional(path, node, "max_nesting", s.maxNesting);
    readOptional(path, node, "stub_ratio", s.stubRatio);
    readOptional(path, node, "import_count", s.importCount);
    readOptional(path, node, "function_sizes", s.functionSizes);
    readOptional(path, node, "abstract_class_count", s.abstractClassCount);
    readOptional(path, node, "broken_call_count", s.brokenCallCount);
    readOptional(path, node, "mean_complexity", s.meanComplexity);
    return s;
}

SemanticRecord SnapshotLoader::parseSemantic(const std::string& path, const json& node) {
    if (!node.is_object()) {
        throw SnapshotError("File " + path + ": semantic record must be an object");
    }
    SemanticRecord sem;

    std::string role = "UNKNOWN";
    readOptional(path, node, "role", role);
    try {
        sem.role = roleFromString(role);
    } catch (const std::invalid_argument& e) {
        throw SnapshotError("File " + path + ": " + e.what());
    }

    readOptional(path, node, "concept_count", sem.conceptCount);
    readOptional(path, node, "naming_drift", sem.namingDrift);
    readOptional(path, node, "todo_density", sem.todoDensity);
    readNullable(path, node, "docstring_coverage", sem.docstringCoverage);
    readNullable(path, node, "concept_entropy", sem.conceptEntropy);
    readNullable(path, node, "compression_ratio", sem.compressionRatio);
    return sem;
}

TemporalRecord SnapshotLoader::parseTemporal(const std::string& path, const json& node) {
    if (!node.is_object()) {
        throw SnapshotError("File " + path + ": temporal record must be an object");
    }
    TemporalRecord t;
    readOptional(path, node, "total_changes", t.totalChanges);
    readOptional(path, node, "author_commits", t.authorCommits);

    auto commits = node.find("commits");
    if (commits != node.end() && !commits->is_null()) {
        if (!commits->is_array()) {
            throw SnapshotError("File " + path + ": 'commits' must be an array");
        }
        for (const auto& c : *commits) {
            CommitRecord commit;
            try {
                commit.id = c.value("id", std::string());
                commit.author = c.at("author").get<std::string>();
                // A defaulted timestamp would stretch the change-window span back to 1970
                commit.timestamp = c.at("timestamp").get<int64_t>();
                commit.message = c.value("message", std::string());
            } catch (const json::exception& e) {
                throw SnapshotError("File " + path + ": malformed commit: " + e.what());
            }
            t.commits.push_back(std::move(commit));
        }
    }
    return t;
}
