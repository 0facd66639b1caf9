#ifndef SCORECARD_GRAPH_DEPENDENCY_GRAPH_HPP
#define SCORECARD_GRAPH_DEPENDENCY_GRAPH_HPP

#pragma once

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace scorecard::graph {

struct ModuleNode {
    std::string id;
    std::string source_file;
    std::set<std::string> imports;
    // Distinct other modules importing this one
    std::size_t inbound_degree{0};
};

// Sorted members of a strongly connected component, or the single member of a self-loop
using Cycle = std::vector<std::string>;

/**
 * Directed module graph keyed by canonical module id.
 *
 * Edges may only connect modules already present, so the graph never
 * carries a dangling edge. Iteration order is lexicographic by id.
 */
class DependencyGraph {
public:
    /**
     * Adds a module node.
     *
     * @return false if a module with the same id already exists.
     */
    bool add_module(const std::string& id, const std::string& source_file);

    /**
     * Adds an import edge. Repeated edges between the same pair are collapsed.
     *
     * @throws std::invalid_argument if either endpoint is unknown.
     * @return true if the edge is new.
     */
    bool add_edge(const std::string& from, const std::string& to);

    bool has_module(const std::string& id) const;
    bool has_edge(const std::string& from, const std::string& to) const;
    const ModuleNode* find(const std::string& id) const;

    const std::set<std::string>& dependencies(const std::string& id) const;
    std::size_t inbound_degree(const std::string& id) const;

    const std::map<std::string, ModuleNode>& modules() const { return modules_; }
    std::vector<std::string> module_ids() const;

    std::size_t module_count() const { return modules_.size(); }
    std::size_t edge_count() const { return edge_count_; }
    bool empty() const { return modules_.empty(); }

private:
    const ModuleNode& require(const std::string& id) const;

    std::map<std::string, ModuleNode> modules_;
    std::size_t edge_count_{0};
};

} // namespace scorecard::graph

#endif // SCORECARD_GRAPH_DEPENDENCY_GRAPH_HPP
