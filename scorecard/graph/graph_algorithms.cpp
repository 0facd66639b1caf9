#include "graph/graph_algorithms.hpp"
#include <algorithm>
#include <cstddef>
#include <limits>
#include <unordered_map>

namespace scorecard::graph {

namespace {

void sort_canonically(std::vector<std::vector<std::string>>& components) {
    for (auto& component : components) {
        std::sort(component.begin(), component.end());
    }
    // Components are disjoint, so their smallest members never tie
    std::sort(components.begin(), components.end(),
              [](const auto& lhs, const auto& rhs) { return lhs.front() < rhs.front(); });
}

} // namespace

std::vector<std::vector<std::string>> strongly_connected_components(const DependencyGraph& graph) {
    constexpr std::size_t unvisited = std::numeric_limits<std::size_t>::max();

    const std::vector<std::string> ids = graph.module_ids();
    const std::size_t count = ids.size();

    std::unordered_map<std::string, std::size_t> position;
    position.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        position.emplace(ids[i], i);
    }

    std::vector<std::vector<std::size_t>> adjacency(count);
    for (std::size_t i = 0; i < count; ++i) {
        for (const auto& target : graph.dependencies(ids[i])) {
            adjacency[i].push_back(position.at(target));
        }
    }

    std::vector<std::size_t> index(count, unvisited);
    std::vector<std::size_t> lowlink(count, 0);
    std::vector<bool> on_stack(count, false);
    std::vector<std::size_t> component_stack;
    std::vector<std::vector<std::string>> components;

    struct Frame {
        std::size_t node;
        std::size_t next_edge;
    };
    std::vector<Frame> call_stack;
    std::size_t counter = 0;

    auto discover = [&](std::size_t node) {
        index[node] = counter;
        lowlink[node] = counter;
        ++counter;
        component_stack.push_back(node);
        on_stack[node] = true;
        call_stack.push_back({node, 0});
    };

    for (std::size_t root = 0; root < count; ++root) {
        if (index[root] != unvisited) {
            continue;
        }

        discover(root);
        while (!call_stack.empty()) {
            const std::size_t node = call_stack.back().node;

            if (call_stack.back().next_edge < adjacency[node].size()) {
                const std::size_t next = adjacency[node][call_stack.back().next_edge++];
                if (index[next] == unvisited) {
                    discover(next);
                } else if (on_stack[next]) {
                    lowlink[node] = std::min(lowlink[node], index[next]);
                }
                continue;
            }

            if (lowlink[node] == index[node]) {
                std::vector<std::string> component;
                std::size_t member;
                do {
                    member = component_stack.back();
                    component_stack.pop_back();
                    on_stack[member] = false;
                    component.push_back(ids[member]);
                } while (member != node);
                components.push_back(std::move(component));
            }

            call_stack.pop_back();
            if (!call_stack.empty()) {
                const std::size_t parent = call_stack.back().node;
                lowlink[parent] = std::min(lowlink[parent], lowlink[node]);
            }
        }
    }

    sort_canonically(components);
    return components;
}

std::vector<Cycle> find_cycles(const DependencyGraph& graph) {
    std::vector<Cycle> cycles;

    for (auto& component : strongly_connected_components(graph)) {
        if (component.size() > 1 || graph.has_edge(component.front(), component.front())) {
            cycles.push_back(std::move(component));
        }
    }

    // Already canonical: filtering keeps the sorted order
    return cycles;
}

bool has_cycle(const DependencyGraph& graph) {
    return !find_cycles(graph).empty();
}

} // namespace scorecard::graph
