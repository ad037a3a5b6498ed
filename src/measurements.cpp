#include "measurements.hpp"
#include <cmath>
#include <set>

namespace {

bool isRatio(double value) {
    return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

void requireNonNegative(const std::string& path, const char* field, int64_t value) {
    if (value < 0) {
        throw SnapshotError("File " + path + ": " + field + " must be non-negative");
    }
}

void requireRatio(const std::string& path, const char* field, double value) {
    if (!isRatio(value)) {
        throw SnapshotError("File " + path + ": " + field + " must lie in [0, 1]");
    }
}

} // namespace

std::string parentDirectory(const std::string& path) {
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos || pos == 0) {
        return ".";
    }
    return path.substr(0, pos);
}

void CodebaseSnapshot::validate() const {
    for (const auto& [path, measurements] : files) {
        if (path.empty()) {
            throw SnapshotError("File with empty path in snapshot");
        }
        if (!measurements.structural) {
            throw SnapshotError("File " + path + ": missing structural record");
        }
        if (!measurements.semantic) {
            throw SnapshotError("File " + path + ": missing semantic record");
        }

        const auto& s = *measurements.structural;
        requireNonNegative(path, "lines", s.lines);
        requireNonNegative(path, "function_count", s.functionCount);
        requireNonNegative(path, "class_count", s.classCount);
        requireNonNegative(path, "max_nesting", s.maxNesting);
        requireNonNegative(path, "import_count", s.importCount);
        requireNonNegative(path, "abstract_class_count", s.abstractClassCount);
        requireNonNegative(path, "broken_call_count", s.brokenCallCount);
        requireRatio(path, "stub_ratio", s.stubRatio);
        for (double size : s.functionSizes) {
            if (!std::isfinite(size) || size < 0.0) {
                throw SnapshotError("File " + path + ": function sizes must be non-negative");
            }
        }
        if (!std::isfinite(s.meanComplexity) || s.meanComplexity < 0.0) {
            throw SnapshotError("File " + path + ": mean_complexity must be non-negative");
        }

        const auto& sem = *measurements.semantic;
        requireNonNegative(path, "concept_count", sem.conceptCount);
        if (!std::isfinite(sem.namingDrift) || sem.namingDrift < 0.0) {
            throw SnapshotError("File " + path + ": naming_drift must be non-negative");
        }
        if (!std::isfinite(sem.todoDensity) || sem.todoDensity < 0.0) {
            throw SnapshotError("File " + path + ": todo_density must be non-negative");
        }
        if (sem.docstringCoverage) {
            requireRatio(path, "docstring_coverage", *sem.docstringCoverage);
        }

        const auto& t = measurements.temporal;
        requireNonNegative(path, "total_changes", t.totalChanges);
        for (const auto& [author, count] : t.authorCommits) {
            if (author.empty()) {
                throw SnapshotError("File " + path + ": author with empty name");
            }
            requireNonNegative(path, "author commit count", count);
        }
        for (const auto& commit : t.commits) {
            if (commit.author.empty()) {
                throw SnapshotError("File " + path + ": commit without author");
            }
        }
    }

    for (const auto& edge : edges) {
        if (edge.referenceCount <= 0) {
            throw SnapshotError("Edge " + edge.source + " -> " + edge.target +
                                ": reference count must be positive");
        }
    }
}

void CodebaseSnapshot::reconcileTemporal() {
    for (auto& [path, measurements] : files) {
        auto& t = measurements.temporal;
        if (t.commits.empty()) {
            if (t.totalChanges == 0 && !t.authorCommits.empty()) {
                for (const auto& [author, count] : t.authorCommits) {
                    t.totalChanges += count;
                }
            }
            continue;
        }

        // The commit list is authoritative when present
        std::map<std::string, int64_t> counts;
        std::set<std::string> seen;
        int64_t total = 0;
        for (const auto& commit : t.commits) {
            if (!commit.id.empty() && !seen.insert(commit.id).second) {
                continue;
            }
            counts[commit.author]++;
            total++;
        }
        t.authorCommits = std::move(counts);
        t.totalChanges = total;
    }
}

std::string CodebaseSnapshot::moduleFor(const std::string& path) const {
    auto it = moduleOf.find(path);
    if (it != moduleOf.end() && !it->second.empty()) {
        return it->second;
    }
    return parentDirectory(path);
}
