#ifndef SCORECARD_GRAPH_GRAPH_BUILDER_HPP
#define SCORECARD_GRAPH_GRAPH_BUILDER_HPP

#pragma once

#include "graph/dependency_graph.hpp"
#include "parser/syntax_tree.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace scorecard::graph {

// Import facts of one project file, as produced by a per-file worker
struct ModuleSource {
    std::string relative_path;
    std::vector<parser::ImportPayload> imports;
    // False when the file failed to parse; it still becomes a node, without outbound edges
    bool parsed{true};
};

struct GodModule {
    std::string module;
    std::size_t inbound_degree{0};
};

struct DirectoryTally {
    std::string directory;
    std::size_t file_count{0};
};

inline bool operator==(const GodModule& lhs, const GodModule& rhs) {
    return lhs.module == rhs.module && lhs.inbound_degree == rhs.inbound_degree;
}

inline bool operator==(const DirectoryTally& lhs, const DirectoryTally& rhs) {
    return lhs.directory == rhs.directory && lhs.file_count == rhs.file_count;
}

class GraphBuilder {
public:
    explicit GraphBuilder(std::vector<std::string> source_roots);
    GraphBuilder();

    // Single aggregation step over all per-file results
    DependencyGraph build(const std::vector<ModuleSource>& sources) const;

private:
    std::vector<std::string> source_roots_;
};

// Modules whose inbound degree exceeds the limit, ordered by id
std::vector<GodModule> find_god_modules(const DependencyGraph& graph, std::size_t inbound_limit);

// Files per directory ("." for the root), ordered by directory
std::vector<DirectoryTally> tally_directories(const std::vector<std::string>& relative_files);

std::vector<DirectoryTally> crowded_directories(const std::vector<DirectoryTally>& tallies,
                                                std::size_t file_limit);

} // namespace scorecard::graph

#endif // SCORECARD_GRAPH_GRAPH_BUILDER_HPP
