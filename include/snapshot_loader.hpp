#pragma once

#include <string>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "measurements.hpp"

namespace fs = std::filesystem;

// Reads a CodebaseSnapshot from the JSON document written by the external
// scanners. Keys are snake_case:
//
//   {
//     "files": { "<path>": { "structural": {...}, "semantic": {...}, "temporal": {...} } },
//     "edges": [ { "source": "...", "target": "...", "reference_count": 1 } ],
//     "module_of": { "<path>": "<module>" },
//     "clone_pairs": [ { "file_a": "...", "file_b": "..." } ]
//   }
//
// Any parse or type problem is reported as SnapshotError. The returned snapshot
// has its temporal records reconciled and has passed validate().
class SnapshotLoader {
public:
    static CodebaseSnapshot loadFile(const fs::path& path);
    static CodebaseSnapshot loadString(const std::string& content);
    static CodebaseSnapshot fromJson(const nlohmann::json& root);

private:
    static StructuralRecord parseStructural(const std::string& path, const nlohmann::json& node);
    static SemanticRecord parseSemantic(const std::string& path, const nlohmann::json& node);
    static TemporalRecord parseTemporal(const std::string& path, const nlohmann::json& node);
};
