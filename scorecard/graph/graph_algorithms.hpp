#ifndef SCORECARD_GRAPH_GRAPH_ALGORITHMS_HPP
#define SCORECARD_GRAPH_GRAPH_ALGORITHMS_HPP

#pragma once

#include "graph/dependency_graph.hpp"
#include <string>
#include <vector>

namespace scorecard::graph {

/**
 * Computes every strongly connected component, singletons included.
 *
 * Iterative Tarjan: linear in modules + edges and independent of the
 * recursion limit. Members are sorted within a component and components are
 * sorted by their smallest member.
 */
std::vector<std::vector<std::string>> strongly_connected_components(const DependencyGraph& graph);

/**
 * Reports circular dependencies: each component with more than one member,
 * plus each module importing itself. Output order is canonical, so an
 * unchanged graph always yields an identical list.
 */
std::vector<Cycle> find_cycles(const DependencyGraph& graph);

bool has_cycle(const DependencyGraph& graph);

} // namespace scorecard::graph

#endif // SCORECARD_GRAPH_GRAPH_ALGORITHMS_HPP
