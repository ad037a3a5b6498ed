#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <stdexcept>
#include <cstdint>
#include "signal_types.hpp"

// Raised when a required raw-input record is missing or malformed.
// This is the only fatal condition of a run and is checked before the pipeline starts.
class SnapshotError : public std::runtime_error {
public:
    explicit SnapshotError(const std::string& message)
        : std::runtime_error(message) {}
};

// Structural measurements produced by the external source scanner
struct StructuralRecord {
    int64_t lines = 0;
    int64_t functionCount = 0;
    int64_t classCount = 0;
    int64_t maxNesting = 0;
    double stubRatio = 0.0;                  // fraction of functions with trivial bodies
    int64_t importCount = 0;
    std::vector<double> functionSizes;       // lines per function

    int64_t abstractClassCount = 0;          // abstract classes / interfaces / protocols
    int64_t brokenCallCount = 0;             // calls to symbols that do not resolve
    double meanComplexity = 0.0;             // average cyclomatic complexity per function
};

// Semantic measurements produced by the external classifier
struct SemanticRecord {
    FileRole role = FileRole::Unknown;
    int64_t conceptCount = 1;
    double namingDrift = 0.0;
    double todoDensity = 0.0;
    std::optional<double> docstringCoverage;  // null when the language has no docstrings
    std::optional<double> conceptEntropy;
    std::optional<double> compressionRatio;
};

// One commit touching a file
struct CommitRecord {
    std::string id;
    std::string author;
    int64_t timestamp = 0;   // unix seconds
    std::string message;     // subject line, used for fix/refactor classification
};

// Version-control measurements for a file
struct TemporalRecord {
    int64_t totalChanges = 0;
    std::map<std::string, int64_t> authorCommits;  // author -> commit count
    std::vector<CommitRecord> commits;
};

struct FileMeasurements {
    std::optional<StructuralRecord> structural;
    std::optional<SemanticRecord> semantic;
    TemporalRecord temporal;   // an empty history is legal
};

// Dependency reference importer -> imported, weight = reference count
struct RawEdge {
    std::string source;
    std::string target;
    int64_t referenceCount = 1;
};

struct ClonePair {
    std::string fileA;
    std::string fileB;
};

// One immutable snapshot of a codebase, populated by external collaborators
struct CodebaseSnapshot {
    std::map<std::string, FileMeasurements> files;
    std::vector<RawEdge> edges;
    std::map<std::string, std::string> moduleOf;   // path -> module id
    std::vector<ClonePair> clonePairs;

    // Check every file for structurally malformed or absent required records.
    // Throws SnapshotError on the first problem found.
    void validate() const;

    // Derive per-author counts and total changes from the commit lists where present
    void reconcileTemporal();

    // Module id for a file, falling back to its parent directory
    std::string moduleFor(const std::string& path) const;
};

// Parent directory of a slash-separated path, "." for top-level files
std::string parentDirectory(const std::string& path);
