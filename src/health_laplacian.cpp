#include "health_laplacian.hpp"

std::map<std::string, std::optional<double>> healthLaplacian(
    const GraphModel& graph,
    const std::map<std::string, std::optional<double>>& rawRisk) {
    std::map<std::string, std::optional<double>> delta;

    for (const auto& path : graph.nodes()) {
        std::vector<std::string> neighbors = graph.neighbors(path, Direction::Both);
        if (neighbors.empty()) {
            delta[path] = 0.0;
            continue;
        }

        auto own = rawRisk.find(path);
        if (own == rawRisk.end() || !own->second) {
            delta[path] = std::nullopt;
            continue;
        }

        double sum = 0.0;
        size_t count = 0;
        for (const auto& neighbor : neighbors) {
            auto it = rawRisk.find(neighbor);
            if (it != rawRisk.end() && it->second) {
                sum += *it->second;
                count++;
            }
        }

        if (count == 0) {
            delta[path] = std::nullopt;
        } else {
            delta[path] = *own->second - sum / static_cast<double>(count);
        }
    }

    return delta;
}
