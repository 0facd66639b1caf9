#include "analyzer.hpp"
#include "graph/graph_builder.hpp"
#include "graph/import_resolver.hpp"
#include "metrics/context_tokens.hpp"
#include "metrics/logical_lines.hpp"
#include "metrics/metric_extractor.hpp"
#include "parser/parser_factory.hpp"
#include "parser/languages/python_parser.hpp"
#include "scoring/scoring_engine.hpp"
#include "utils/filesystem.hpp"
#include "utils/strings.hpp"
#include "utils/parallel.hpp"
#include <filesystem>
#include <optional>
#include <set>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace scorecard::analysis {

namespace fs = std::filesystem;

namespace {

// Project-relative form of a changed path; nullopt outside the root
std::optional<std::string> scope_path(const std::string& root, const std::string& file) {
    std::string relative = fs::path(file).is_absolute()
        ? utils::get_relative_path(root, file)
        : utils::normalize_path(file);
    if (relative.empty() || relative == "." || *fs::path(relative).begin() == "..") {
        return std::nullopt;
    }
    return relative;
}

std::size_t context_document_characters(const std::string& root, const std::vector<std::string>& root_entries) {
    std::size_t characters = 0;
    for (const auto& entry : root_entries) {
        const std::string name = utils::to_lower(entry);
        if (name != "readme.md" && name != "agents.md") {
            continue;
        }
        try {
            characters += utils::read_file_content((fs::path(root) / entry).string()).size();
        } catch (const std::runtime_error& e) {
            spdlog::warn("Skipping {} in the context estimate: {}", entry, e.what());
        }
    }
    return characters;
}

} // namespace

Analyzer::Analyzer() {
    try {
        auto& factory = parser::ParserFactory::instance();
        if (!factory.supports_file("module.py")) {
            factory.register_parser<parser::languages::PythonParser>();
            spdlog::debug("Registered Python parser");
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize parsers: {}", e.what());
        throw;
    }
}

bool Analyzer::cancelled() const {
    return cancelled_ != nullptr && cancelled_->load();
}

FileAnalysis Analyzer::analyze_file(const std::string& root, const std::string& relative_path) const {
    FileAnalysis analysis;
    analysis.relative_path = relative_path;

    auto parser = parser::ParserFactory::instance().create_parser_for_file(relative_path);
    if (!parser) {
        analysis.error = "No parser found for file: " + relative_path;
        spdlog::warn("{}", *analysis.error);
        return analysis;
    }

    try {
        const std::string path = (fs::path(root) / relative_path).string();
        parser::ParserContext context{utils::read_file_content(path), relative_path};

        parser::SyntaxTree tree = parser->parse(context);
        const auto lines = metrics::LogicalLineIndex::from_source(context.file_content);

        metrics::MetricExtractor extractor;
        analysis.summary = extractor.extract(
            tree, lines, {relative_path, graph::module_name_for_path(relative_path)});
        analysis.summary->tokens = metrics::estimate_tokens(context.file_content.size());
        analysis.summary->signature_characters =
            metrics::extract_signatures(context.file_content, tree.root).size();
        analysis.imports = parser::collect_imports(tree.root);

        spdlog::debug("Analyzed {}: {} functions, {} logical lines, {} imports",
                      relative_path, analysis.summary->functions.size(),
                      analysis.summary->logical_lines, analysis.imports.size());
    } catch (const parser::ParseError& e) {
        spdlog::warn("Skipping {}: {}", relative_path, e.what());
        analysis.error = e.what();
    } catch (const std::runtime_error& e) {
        spdlog::warn("Skipping {}: {}", relative_path, e.what());
        analysis.error = e.what();
    }

    return analysis;
}

std::optional<scoring::ScoreReport> Analyzer::analyze_project(const AnalysisOptions& options) const {
    const auto all_files = utils::list_project_files(options.root, options.ignore_patterns);

    std::vector<std::string> python_files;
    const auto& factory = parser::ParserFactory::instance();
    for (const auto& file : all_files) {
        if (factory.supports_file(file)) {
            python_files.push_back(file);
        }
    }
    spdlog::info("Discovered {} files, {} Python modules under {}",
                 all_files.size(), python_files.size(), options.root);

    if (cancelled()) {
        return std::nullopt;
    }

    auto results = utils::parallel_map(python_files,
        [this, &options](const std::string& file) -> std::optional<FileAnalysis> {
            if (cancelled()) {
                return std::nullopt;
            }
            return analyze_file(options.root, file);
        },
        options.jobs);

    if (cancelled()) {
        spdlog::warn("Analysis cancelled");
        return std::nullopt;
    }

    scoring::ScoringInput input;
    std::vector<graph::ModuleSource> sources;
    sources.reserve(results.size());
    for (auto& result : results) {
        if (!result) {
            // Cancelled between the last task and the check above
            return std::nullopt;
        }

        graph::ModuleSource source;
        source.relative_path = result->relative_path;
        source.parsed = result->summary.has_value();
        source.imports = std::move(result->imports);
        sources.push_back(std::move(source));

        if (result->summary) {
            input.files.push_back(std::move(*result->summary));
        } else {
            input.warnings.push_back({"parse-error", result->relative_path,
                                      result->error.value_or("unknown error")});
        }
    }

    input.graph = graph::GraphBuilder().build(sources);
    input.directories = graph::tally_directories(all_files);
    input.project.root_entries = utils::list_root_entries(options.root);
    input.project.pyproject_declares_linter = options.declares_linter;
    input.project.context_document_characters =
        context_document_characters(options.root, input.project.root_entries);
    input.config_issue = options.config_issue;

    if (options.changed_files) {
        std::set<std::string> scope;
        for (const auto& file : *options.changed_files) {
            auto relative = scope_path(options.root, file);
            if (relative) {
                scope.insert(std::move(*relative));
            } else {
                spdlog::debug("Changed file {} is outside {}", file, options.root);
            }
        }
        spdlog::info("Diff mode: {} changed files in scope", scope.size());
        input.scope = std::move(scope);
    }

    return scoring::ScoringEngine(options.thresholds).score(input);
}

} // namespace scorecard::analysis
