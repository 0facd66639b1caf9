#include "graph/dependency_graph.hpp"
#include <stdexcept>

namespace scorecard::graph {

bool DependencyGraph::add_module(const std::string& id, const std::string& source_file) {
    ModuleNode node;
    node.id = id;
    node.source_file = source_file;
    return modules_.emplace(id, std::move(node)).second;
}

bool DependencyGraph::add_edge(const std::string& from, const std::string& to) {
    auto source = modules_.find(from);
    auto target = modules_.find(to);
    if (source == modules_.end() || target == modules_.end()) {
        throw std::invalid_argument("edge " + from + " -> " + to + " references an unknown module");
    }

    if (!source->second.imports.insert(to).second) {
        return false;
    }

    ++edge_count_;
    if (from != to) {
        ++target->second.inbound_degree;
    }
    return true;
}

bool DependencyGraph::has_module(const std::string& id) const {
    return modules_.count(id) > 0;
}

bool DependencyGraph::has_edge(const std::string& from, const std::string& to) const {
    const ModuleNode* node = find(from);
    return node && node->imports.count(to) > 0;
}

const ModuleNode* DependencyGraph::find(const std::string& id) const {
    auto it = modules_.find(id);
    return it == modules_.end() ? nullptr : &it->second;
}

const std::set<std::string>& DependencyGraph::dependencies(const std::string& id) const {
    return require(id).imports;
}

std::size_t DependencyGraph::inbound_degree(const std::string& id) const {
    return require(id).inbound_degree;
}

std::vector<std::string> DependencyGraph::module_ids() const {
    std::vector<std::string> ids;
    ids.reserve(modules_.size());
    for (const auto& [id, _] : modules_) {
        ids.push_back(id);
    }
    return ids;
}

const ModuleNode& DependencyGraph::require(const std::string& id) const {
    auto it = modules_.find(id);
    if (it == modules_.end()) {
        throw std::invalid_argument("unknown module: " + id);
    }
    return it->second;
}

} // namespace scorecard::graph
