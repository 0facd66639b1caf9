#include "graph/import_resolver.hpp"
#include "utils/strings.hpp"
#include <algorithm>
#include <filesystem>
#include <spdlog/spdlog.h>

namespace scorecard::graph {

namespace fs = std::filesystem;

namespace {

std::vector<std::string> path_parts(const fs::path& path) {
    std::vector<std::string> parts;
    for (const auto& part : path) {
        std::string text = part.generic_string();
        if (!text.empty() && text != ".") {
            parts.push_back(text);
        }
    }
    return parts;
}

std::string append_dotted(const std::string& prefix, const std::string& name) {
    if (prefix.empty()) {
        return name;
    }
    if (name.empty()) {
        return prefix;
    }
    return prefix + "." + name;
}

// "a.b.c" -> {"a.b.c", "a.b", "a"}
std::vector<std::string> dotted_prefixes(const std::string& dotted_name) {
    std::vector<std::string> prefixes;
    std::string current = dotted_name;
    while (!current.empty()) {
        prefixes.push_back(current);
        auto dot = current.rfind('.');
        if (dot == std::string::npos) {
            break;
        }
        current.erase(dot);
    }
    return prefixes;
}

} // namespace

std::string module_name_for_path(const std::string& relative_path) {
    fs::path path = fs::path(relative_path).lexically_normal();
    std::vector<std::string> parts = path_parts(path.parent_path());

    std::string stem = path.stem().string();
    if (stem != "__init__" || parts.empty()) {
        parts.push_back(stem);
    }
    return utils::join(parts, ".");
}

ImportResolver::ImportResolver(const std::vector<std::string>& relative_files,
                               const std::vector<std::string>& source_roots) {
    std::vector<std::string> files = relative_files;
    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        module_ids_.insert(module_name_for_path(file));
    }

    for (const auto& root : source_roots) {
        const fs::path root_path = fs::path(root).lexically_normal();

        for (const auto& file : files) {
            fs::path relative = fs::path(file).lexically_normal();
            if (!root.empty()) {
                relative = relative.lexically_relative(root_path);
                if (relative.empty() || *relative.begin() == "..") {
                    continue;
                }
            }
            import_names_.emplace(module_name_for_path(relative.generic_string()),
                                  module_name_for_path(file));
        }
    }

    spdlog::debug("Import resolver: {} modules, {} importable names",
                  module_ids_.size(), import_names_.size());
}

std::vector<std::string> ImportResolver::default_source_roots() {
    return {"", "src"};
}

std::vector<std::string> ImportResolver::resolve(const std::string& importer_file,
                                                 const parser::ImportPayload& import) const {
    std::set<std::string> targets;
    const std::string importer_id = module_name_for_path(importer_file);

    // A missing submodule of the importer's own package is external, not a self-import
    auto add = [&](const std::string& dotted_name) {
        auto target = resolve_absolute(dotted_name);
        if (target && (*target != importer_id || import_names_.count(dotted_name) > 0)) {
            targets.insert(*target);
        }
    };

    if (!import.from_import) {
        for (const auto& name : import.names) {
            add(name);
        }
        return {targets.begin(), targets.end()};
    }

    if (import.level == 0) {
        for (const auto& name : import.names) {
            // "from pkg import sub" may name a submodule rather than an attribute
            const std::string submodule = append_dotted(import.module, name);
            if (name != "*" && import_names_.count(submodule) > 0) {
                add(submodule);
                continue;
            }
            add(import.module);
        }
        return {targets.begin(), targets.end()};
    }

    auto base = relative_base(importer_file, import.level);
    if (!base) {
        spdlog::debug("{}: relative import climbs above the project root", importer_file);
        return {};
    }
    const std::string module = append_dotted(*base, import.module);

    // Relative targets must name a project module exactly. A missing submodule
    // (extension module, generated file) is external and never falls back to
    // the enclosing package.
    for (const auto& name : import.names) {
        if (name != "*") {
            std::string submodule = append_dotted(module, name);
            if (has_module(submodule)) {
                targets.insert(submodule);
                continue;
            }
        }
        if (has_module(module) && module != importer_id) {
            targets.insert(module);
        }
    }

    return {targets.begin(), targets.end()};
}

std::optional<std::string> ImportResolver::resolve_absolute(const std::string& dotted_name) const {
    for (const auto& prefix : dotted_prefixes(dotted_name)) {
        auto it = import_names_.find(prefix);
        if (it != import_names_.end()) {
            return it->second;
        }
    }
    return std::nullopt;
}

std::optional<std::string> ImportResolver::relative_base(const std::string& importer_file,
                                                         std::size_t level) const {
    std::vector<std::string> parts =
        path_parts(fs::path(importer_file).lexically_normal().parent_path());

    // One dot is the importer's own package; each further dot climbs one directory
    const std::size_t climb = level - 1;
    if (climb > parts.size()) {
        return std::nullopt;
    }
    parts.resize(parts.size() - climb);
    return utils::join(parts, ".");
}

} // namespace scorecard::graph
