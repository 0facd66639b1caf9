#ifndef SCORECARD_GRAPH_IMPORT_RESOLVER_HPP
#define SCORECARD_GRAPH_IMPORT_RESOLVER_HPP

#pragma once

#include "parser/syntax_tree.hpp"
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace scorecard::graph {

// Canonical module id of a project-relative path:
// "pkg/mod.py" -> "pkg.mod", "pkg/__init__.py" -> "pkg", "__init__.py" -> "__init__"
std::string module_name_for_path(const std::string& relative_path);

/**
 * Maps import statements to in-project module ids.
 *
 * Each file is importable under its path relative to every source root that
 * contains it; on a name collision the earlier root wins. Imports that match
 * no project file are external and resolve to nothing.
 */
class ImportResolver {
public:
    explicit ImportResolver(const std::vector<std::string>& relative_files,
                            const std::vector<std::string>& source_roots = default_source_roots());

    static std::vector<std::string> default_source_roots();

    /**
     * Module ids referenced by one import statement of importer_file.
     * Results are sorted and unique; unresolvable targets are omitted.
     */
    std::vector<std::string> resolve(const std::string& importer_file,
                                     const parser::ImportPayload& import) const;

    // Longest dotted prefix of an absolute import name that names a project module
    std::optional<std::string> resolve_absolute(const std::string& dotted_name) const;

    bool has_module(const std::string& id) const { return module_ids_.count(id) > 0; }

private:
    // Package the relative import is anchored at, as a module-id prefix; nullopt above the root
    std::optional<std::string> relative_base(const std::string& importer_file, std::size_t level) const;

    std::set<std::string> module_ids_;
    std::unordered_map<std::string, std::string> import_names_;
};

} // namespace scorecard::graph

#endif // SCORECARD_GRAPH_IMPORT_RESOLVER_HPP
