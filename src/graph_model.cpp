#include "graph_model.hpp"
#include <algorithm>
#include <deque>
#include <unordered_map>

bool GraphModel::addNode(const std::string& path) {
    return nodes_.emplace(path, Node{}).second;
}

void GraphModel::addEdge(const std::string& from, const std::string& to, int64_t weight) {
    auto source = nodes_.find(from);
    if (source == nodes_.end()) {
        droppedEdges_++;
        return;
    }

    auto target = nodes_.find(to);
    if (target == nodes_.end()) {
        source->second.phantoms[to] += weight;
        return;
    }

    source->second.out[to] += weight;
    target->second.in[from] += weight;
}

const GraphModel::Node* GraphModel::find(const std::string& path) const {
    auto it = nodes_.find(path);
    return it == nodes_.end() ? nullptr : &it->second;
}

bool GraphModel::hasNode(const std::string& path) const {
    return find(path) != nullptr;
}

size_t GraphModel::edgeCount() const {
    size_t count = 0;
    for (const auto& [path, node] : nodes_) {
        count += node.out.size();
    }
    return count;
}

std::vector<std::string> GraphModel::nodes() const {
    std::vector<std::string> result;
    result.reserve(nodes_.size());
    for (const auto& [path, node] : nodes_) {
        result.push_back(path);
    }
    return result;
}

std::vector<GraphModel::Edge> GraphModel::edges() const {
    std::vector<Edge> result;
    for (const auto& [path, node] : nodes_) {
        for (const auto& [target, weight] : node.out) {
            result.push_back(Edge{path, target, weight});
        }
    }
    return result;
}

int64_t GraphModel::edgeWeight(const std::string& from, const std::string& to) const {
    const Node* node = find(from);
    if (!node) {
        return 0;
    }
    auto it = node->out.find(to);
    return it == node->out.end() ? 0 : it->second;
}

std::vector<std::string> GraphModel::neighbors(const std::string& path, Direction direction) const {
    const Node* node = find(path);
    if (!node) {
        return {};
    }

    std::set<std::string> result;
    if (direction == Direction::Out || direction == Direction::Both) {
        for (const auto& [target, weight] : node->out) {
            result.insert(target);
        }
    }
    if (direction == Direction::In || direction == Direction::Both) {
        for (const auto& [source, weight] : node->in) {
            result.insert(source);
        }
    }
    result.erase(path);
    return std::vector<std::string>(result.begin(), result.end());
}

size_t GraphModel::inDegree(const std::string& path) const {
    const Node* node = find(path);
    if (!node) {
        return 0;
    }
    return node->in.size() - (node->in.count(path) ? 1 : 0);
}

size_t GraphModel::outDegree(const std::string& path) const {
    const Node* node = find(path);
    if (!node) {
        return 0;
    }
    return node->out.size() - (node->out.count(path) ? 1 : 0);
}

bool GraphModel::hasSelfLoop(const std::string& path) const {
    const Node* node = find(path);
    return node && node->out.count(path) > 0;
}

int64_t GraphModel::phantomImportCount(const std::string& path) const {
    const Node* node = find(path);
    return node ? static_cast<int64_t>(node->phantoms.size()) : 0;
}

std::vector<std::string> GraphModel::phantomTargets(const std::string& path) const {
    std::vector<std::string> result;
    if (const Node* node = find(path)) {
        for (const auto& [target, weight] : node->phantoms) {
            result.push_back(target);
        }
    }
    return result;
}

std::set<std::string> GraphModel::blastRadius(const std::string& path) const {
    std::set<std::string> visited;
    const Node* start = find(path);
    if (!start) {
        return visited;
    }

    std::deque<const std::string*> queue;
    for (const auto& [importer, weight] : start->in) {
        queue.push_back(&importer);
    }

    while (!queue.empty()) {
        const std::string& current = *queue.front();
        queue.pop_front();
        if (!visited.insert(current).second) {
            continue;
        }
        for (const auto& [importer, weight] : nodes_.at(current).in) {
            if (!visited.count(importer)) {
                queue.push_back(&importer);
            }
        }
    }

    visited.erase(path);
    return visited;
}

std::vector<std::vector<std::string>> GraphModel::stronglyConnectedComponents() const {
    CompactGraph graph = compact();
    const size_t n = graph.size();

    constexpr int unvisited = -1;
    std::vector<int> index(n, unvisited);
    std::vector<int> lowlink(n, 0);
    std::vector<bool> onStack(n, false);
    std::vector<size_t> stack;
    std::vector<std::vector<std::string>> result;
    int counter = 0;

    // Explicit call stack of (node, next arc position) to survive deep import chains
    std::vector<std::pair<size_t, size_t>> callStack;

    for (size_t root = 0; root < n; ++root) {
        if (index[root] != unvisited) {
            continue;
        }

        index[root] = lowlink[root] = counter++;
        stack.push_back(root);
        onStack[root] = true;
        callStack.emplace_back(root, 0);

        while (!callStack.empty()) {
            auto& [v, next] = callStack.back();
            const auto& arcs = graph.out[v];

            if (next < arcs.size()) {
                size_t w = arcs[next].target;
                ++next;
                if (index[w] == unvisited) {
                    index[w] = lowlink[w] = counter++;
                    stack.push_back(w);
                    onStack[w] = true;
                    callStack.emplace_back(w, 0);
                } else if (onStack[w]) {
                    lowlink[v] = std::min(lowlink[v], index[w]);
                }
                continue;
            }

            size_t finished = v;
            callStack.pop_back();
            if (!callStack.empty()) {
                size_t caller = callStack.back().first;
                lowlink[caller] = std::min(lowlink[caller], lowlink[finished]);
            }

            if (lowlink[finished] == index[finished]) {
                std::vector<std::string> component;
                size_t w;
                do {
                    w = stack.back();
                    stack.pop_back();
                    onStack[w] = false;
                    component.push_back(graph.names[w]);
                } while (w != finished);
                std::sort(component.begin(), component.end());
                result.push_back(std::move(component));
            }
        }
    }

    return result;
}

std::map<std::string, int> GraphModel::depthFromEntryPoints(const std::set<std::string>& entrySet) const {
    std::map<std::string, int> depth;
    for (const auto& [path, node] : nodes_) {
        depth[path] = -1;
    }

    std::deque<std::string> queue;
    for (const auto& entry : entrySet) {
        auto it = depth.find(entry);
        if (it != depth.end() && it->second == -1) {
            it->second = 0;
            queue.push_back(entry);
        }
    }

    while (!queue.empty()) {
        std::string current = queue.front();
        queue.pop_front();
        int next = depth[current] + 1;
        for (const auto& [target, weight] : nodes_.at(current).out) {
            int& d = depth[target];
            if (d == -1) {
                d = next;
                queue.push_back(target);
            }
        }
    }

    return depth;
}

std::vector<std::vector<std::string>> GraphModel::weaklyConnectedComponents() const {
    std::vector<std::vector<std::string>> result;
    std::set<std::string> seen;

    for (const auto& [root, rootNode] : nodes_) {
        if (seen.count(root)) {
            continue;
        }
        std::vector<std::string> component;
        std::deque<std::string> queue{root};
        seen.insert(root);
        while (!queue.empty()) {
            std::string current = queue.front();
            queue.pop_front();
            component.push_back(current);
            for (const auto& next : neighbors(current, Direction::Both)) {
                if (seen.insert(next).second) {
                    queue.push_back(next);
                }
            }
        }
        std::sort(component.begin(), component.end());
        result.push_back(std::move(component));
    }

    return result;
}

CompactGraph GraphModel::compact() const {
    CompactGraph graph;
    graph.names = nodes();
    const size_t n = graph.names.size();
    graph.out.resize(n);
    graph.in.resize(n);
    graph.selfLoopWeight.assign(n, 0.0);

    std::unordered_map<std::string, size_t> ids;
    ids.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        ids[graph.names[i]] = i;
    }

    // std::map iteration keeps both arc lists sorted by id
    size_t i = 0;
    for (const auto& [path, node] : nodes_) {
        for (const auto& [target, weight] : node.out) {
            size_t j = ids.at(target);
            if (j == i) {
                graph.selfLoopWeight[i] += static_cast<double>(weight);
                continue;
            }
            graph.out[i].push_back({j, static_cast<double>(weight)});
        }
        for (const auto& [source, weight] : node.in) {
            size_t j = ids.at(source);
            if (j != i) {
                graph.in[i].push_back({j, static_cast<double>(weight)});
            }
        }
        ++i;
    }

    return graph;
}
