#include "graph/graph_builder.hpp"
#include "graph/import_resolver.hpp"
#include <algorithm>
#include <filesystem>
#include <iterator>
#include <map>
#include <spdlog/spdlog.h>

namespace scorecard::graph {

namespace {

std::string describe(const parser::ImportPayload& import) {
    std::string text;
    if (import.from_import) {
        text = std::string(import.level, '.') + import.module + " import ";
    }
    for (std::size_t i = 0; i < import.names.size(); ++i) {
        text += (i ? ", " : "") + import.names[i];
    }
    return text;
}

} // namespace

GraphBuilder::GraphBuilder(std::vector<std::string> source_roots)
    : source_roots_(std::move(source_roots)) {}

GraphBuilder::GraphBuilder()
    : GraphBuilder(ImportResolver::default_source_roots()) {}

DependencyGraph GraphBuilder::build(const std::vector<ModuleSource>& sources) const {
    std::vector<const ModuleSource*> ordered;
    ordered.reserve(sources.size());
    for (const auto& source : sources) {
        ordered.push_back(&source);
    }
    std::sort(ordered.begin(), ordered.end(),
              [](const ModuleSource* lhs, const ModuleSource* rhs) {
                  return lhs->relative_path < rhs->relative_path;
              });

    DependencyGraph graph;
    std::vector<std::string> files;
    std::vector<const ModuleSource*> owners;

    for (const ModuleSource* source : ordered) {
        const std::string id = module_name_for_path(source->relative_path);
        if (!graph.add_module(id, source->relative_path)) {
            spdlog::warn("Module {} from {} shadowed by {}", id, source->relative_path,
                         graph.find(id)->source_file);
            continue;
        }
        files.push_back(source->relative_path);
        owners.push_back(source);
    }

    ImportResolver resolver(files, source_roots_);

    for (const ModuleSource* source : owners) {
        if (!source->parsed) {
            continue;
        }

        const std::string id = module_name_for_path(source->relative_path);
        for (const auto& import : source->imports) {
            auto targets = resolver.resolve(source->relative_path, import);
            if (targets.empty()) {
                spdlog::debug("{}: external import '{}' dropped", source->relative_path, describe(import));
                continue;
            }
            for (const auto& target : targets) {
                graph.add_edge(id, target);
            }
        }
    }

    spdlog::info("Dependency graph: {} modules, {} edges", graph.module_count(), graph.edge_count());
    return graph;
}

std::vector<GodModule> find_god_modules(const DependencyGraph& graph, std::size_t inbound_limit) {
    std::vector<GodModule> modules;
    for (const auto& [id, node] : graph.modules()) {
        if (node.inbound_degree > inbound_limit) {
            modules.push_back({id, node.inbound_degree});
        }
    }
    return modules;
}

std::vector<DirectoryTally> tally_directories(const std::vector<std::string>& relative_files) {
    std::map<std::string, std::size_t> counts;
    for (const auto& file : relative_files) {
        std::string directory = std::filesystem::path(file).lexically_normal().parent_path().generic_string();
        if (directory.empty()) {
            directory = ".";
        }
        ++counts[directory];
    }

    std::vector<DirectoryTally> tallies;
    tallies.reserve(counts.size());
    for (const auto& [directory, count] : counts) {
        tallies.push_back({directory, count});
    }
    return tallies;
}

std::vector<DirectoryTally> crowded_directories(const std::vector<DirectoryTally>& tallies,
                                                std::size_t file_limit) {
    std::vector<DirectoryTally> crowded;
    std::copy_if(tallies.begin(), tallies.end(), std::back_inserter(crowded),
                 [file_limit](const DirectoryTally& tally) { return tally.file_count > file_limit; });
    return crowded;
}

} // namespace scorecard::graph
