#include "architecture_analyzer.hpp"
#include <algorithm>
#include <cmath>
#include <deque>
#include <set>

namespace {

// Largest count in a tally, ties resolved towards the smallest key
template <typename Key>
std::pair<Key, size_t> dominant(const std::map<Key, size_t>& tally) {
    std::pair<Key, size_t> best{};
    for (const auto& [key, count] : tally) {
        if (count > best.second) {
            best = {key, count};
        }
    }
    return best;
}

} // namespace

std::string violationTypeToString(ViolationType type) {
    return type == ViolationType::Backward ? "BACKWARD" : "SKIP";
}

ArchitectureAnalysis ArchitectureAnalyzer::analyze(const CodebaseSnapshot& snapshot,
                                                   const GraphAnalysis& graph) const {
    ArchitectureAnalysis analysis;

    std::map<std::string, std::string> moduleOf;
    for (const auto& [path, measurements] : snapshot.files) {
        std::string module = snapshot.moduleFor(path);
        moduleOf[path] = module;
        analysis.modules[module].files.push_back(path);
    }

    // Contract file edges into module edges
    for (const auto& edge : graph.graph.edges()) {
        if (edge.source == edge.target) {
            continue;
        }
        const std::string& from = moduleOf.at(edge.source);
        const std::string& to = moduleOf.at(edge.target);
        if (from == to) {
            analysis.modules[from].internalEdges++;
        } else {
            analysis.modules[from].externalEdges++;
            analysis.modules[from].efferentCoupling++;
            analysis.modules[to].afferentCoupling++;
            analysis.moduleGraph[from][to]++;
        }
    }

    for (auto& [name, module] : analysis.modules) {
        const auto n = static_cast<double>(module.files.size());
        module.cohesion = n > 1.0 ? static_cast<double>(module.internalEdges) / (n * (n - 1.0)) : 0.0;

        int64_t outgoing = module.internalEdges + module.externalEdges;
        module.coupling = outgoing > 0
            ? static_cast<double>(module.externalEdges) / static_cast<double>(outgoing)
            : 0.0;

        int64_t coupled = module.afferentCoupling + module.efferentCoupling;
        if (coupled > 0) {
            module.instability = static_cast<double>(module.efferentCoupling) / static_cast<double>(coupled);
        }

        int64_t classes = 0;
        int64_t abstractClasses = 0;
        double cognitive = 0.0;
        std::map<int, size_t> communities;
        std::map<FileRole, size_t> roles;
        for (const auto& path : module.files) {
            const FileMeasurements& measurements = snapshot.files.at(path);
            if (measurements.structural) {
                classes += measurements.structural->classCount;
                abstractClasses += measurements.structural->abstractClassCount;
            }
            roles[measurements.semantic ? measurements.semantic->role : FileRole::Unknown]++;

            const FileGraphMetrics& metrics = graph.files.at(path);
            communities[metrics.community]++;
            cognitive += metrics.cognitiveLoad;
        }

        module.abstractness = classes > 0
            ? std::min(1.0, static_cast<double>(abstractClasses) / static_cast<double>(classes))
            : 0.0;
        if (module.instability) {
            module.mainSeqDistance = std::fabs(module.abstractness + *module.instability - 1.0);
        }

        if (!module.files.empty()) {
            module.boundaryAlignment = static_cast<double>(dominant(communities).second) / n;
            auto role = dominant(roles);
            module.dominantRole = role.first;
            module.roleConsistency = static_cast<double>(role.second) / n;
            module.meanCognitiveLoad = cognitive / n;
        }
    }

    assignLayers(analysis);
    detectViolations(analysis);

    int64_t crossEdges = 0;
    int64_t violatingEdges = 0;
    for (const auto& [name, module] : analysis.modules) {
        crossEdges += module.externalEdges;
    }
    for (const auto& violation : analysis.violations) {
        violatingEdges += violation.edgeCount;
        analysis.modules[violation.sourceModule].layerViolationCount++;
    }
    analysis.violationRate = crossEdges > 0
        ? static_cast<double>(violatingEdges) / static_cast<double>(crossEdges)
        : 0.0;

    analysis.conwayAlignment = conwayAlignment(snapshot, analysis);
    return analysis;
}

/**
 * @brief Assign layers by walking up from foundation modules
 *
 * Modules importing no other module sit at layer 0. Each importer of a module at
 * layer k sits at least at k + 1. Cycles would push layers up forever, so a layer
 * never exceeds the module count.
 */
void ArchitectureAnalyzer::assignLayers(ArchitectureAnalysis& analysis) const {
    std::map<std::string, std::set<std::string>> importers;
    for (const auto& [source, targets] : analysis.moduleGraph) {
        for (const auto& [target, count] : targets) {
            importers[target].insert(source);
        }
    }

    const int cap = static_cast<int>(analysis.modules.size());
    std::map<std::string, int> layer;
    std::deque<std::string> queue;
    for (const auto& [name, module] : analysis.modules) {
        auto it = analysis.moduleGraph.find(name);
        if (it == analysis.moduleGraph.end() || it->second.empty()) {
            layer[name] = 0;
            queue.push_back(name);
        }
    }

    while (!queue.empty()) {
        std::string current = queue.front();
        queue.pop_front();
        int next = layer[current] + 1;
        if (next > cap) {
            continue;
        }
        for (const auto& importer : importers[current]) {
            auto it = layer.find(importer);
            if (it == layer.end() || it->second < next) {
                layer[importer] = next;
                queue.push_back(importer);
            }
        }
    }

    analysis.maxLayer = 0;
    for (auto& [name, module] : analysis.modules) {
        auto it = layer.find(name);
        // Modules only reachable through a cycle stay at the bottom
        module.layer = it == layer.end() ? 0 : it->second;
        analysis.maxLayer = std::max(analysis.maxLayer, module.layer);
    }
}

void ArchitectureAnalyzer::detectViolations(ArchitectureAnalysis& analysis) const {
    for (const auto& [source, targets] : analysis.moduleGraph) {
        int sourceLayer = analysis.modules.at(source).layer;
        for (const auto& [target, count] : targets) {
            int targetLayer = analysis.modules.at(target).layer;

            LayerViolation violation;
            violation.sourceModule = source;
            violation.targetModule = target;
            violation.sourceLayer = sourceLayer;
            violation.targetLayer = targetLayer;
            violation.edgeCount = count;

            if (sourceLayer < targetLayer) {
                violation.type = ViolationType::Backward;
                analysis.violations.push_back(violation);
            } else if (sourceLayer - targetLayer > 1) {
                violation.type = ViolationType::Skip;
                analysis.violations.push_back(violation);
            }
        }
    }
}

double ArchitectureAnalyzer::weightedJaccardDistance(const std::map<std::string, double>& a,
                                                     const std::map<std::string, double>& b) {
    std::set<std::string> authors;
    for (const auto& [author, weight] : a) {
        authors.insert(author);
    }
    for (const auto& [author, weight] : b) {
        authors.insert(author);
    }

    double minSum = 0.0;
    double maxSum = 0.0;
    for (const auto& author : authors) {
        auto ia = a.find(author);
        auto ib = b.find(author);
        double wa = ia == a.end() ? 0.0 : ia->second;
        double wb = ib == b.end() ? 0.0 : ib->second;
        minSum += std::min(wa, wb);
        maxSum += std::max(wa, wb);
    }
    return maxSum > 0.0 ? 1.0 - minSum / maxSum : 0.0;
}

double ArchitectureAnalyzer::conwayAlignment(const CodebaseSnapshot& snapshot,
                                             const ArchitectureAnalysis& analysis) const {
    std::set<std::string> allAuthors;
    std::map<std::string, std::map<std::string, double>> moduleAuthors;
    for (const auto& [name, module] : analysis.modules) {
        auto& authors = moduleAuthors[name];
        for (const auto& path : module.files) {
            for (const auto& [author, count] : snapshot.files.at(path).temporal.authorCommits) {
                authors[author] += static_cast<double>(count);
                allAuthors.insert(author);
            }
        }
    }
    if (allAuthors.size() < 2) {
        return 1.0;
    }

    std::set<std::pair<std::string, std::string>> pairs;
    for (const auto& [source, targets] : analysis.moduleGraph) {
        for (const auto& [target, count] : targets) {
            pairs.insert(std::minmax(source, target));
        }
    }

    std::vector<double> distances;
    for (const auto& [a, b] : pairs) {
        const auto& authorsA = moduleAuthors[a];
        const auto& authorsB = moduleAuthors[b];
        if (authorsA.empty() || authorsB.empty()) {
            continue;
        }
        distances.push_back(weightedJaccardDistance(authorsA, authorsB));
    }
    if (distances.empty()) {
        return 1.0;
    }

    double total = 0.0;
    for (double d : distances) {
        total += d;
    }
    return std::max(0.0, 1.0 - total / static_cast<double>(distances.size()));
}
