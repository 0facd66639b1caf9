#include "scoring/scoring_engine.hpp"
#include "graph/graph_algorithms.hpp"
#include "metrics/context_tokens.hpp"
#include "utils/strings.hpp"
#include <algorithm>
#include <map>
#include <utility>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace scorecard::scoring {

ScoringEngine::ScoringEngine(Thresholds thresholds)
    : thresholds_(std::move(thresholds)) {}

double ScoringEngine::bloat_points(std::size_t logical_lines) const {
    if (logical_lines <= thresholds_.bloat_line_limit) {
        return 0.0;
    }
    const std::size_t steps = (logical_lines - thresholds_.bloat_line_limit) / kBloatStepLines;
    return kBloatPointsPerStep * static_cast<double>(steps);
}

double ScoringEngine::cognitive_load_points(double acl) const {
    if (acl >= thresholds_.acl_red) {
        return kRedLoadPoints;
    }
    if (acl >= thresholds_.acl_yellow) {
        return kYellowLoadPoints;
    }
    return 0.0;
}

bool ScoringEngine::lacks_types(const metrics::FileSummary& file) const {
    return file.type_coverage * 100.0 < thresholds_.type_safety_minimum;
}

ScoreReport ScoringEngine::score(const ScoringInput& input) const {
    ScoreReport report;
    report.diff_mode = input.scope.has_value();
    report.warnings = input.warnings;
    report.environment = environment_health(input);
    report.files_analyzed = input.files.size();
    for (const auto& file : input.files) {
        report.functions_analyzed += file.functions.size();
    }

    if (input.config_issue) {
        report.warnings.push_back({"config-invalid", "configuration", *input.config_issue});
    }

    if (input.files.empty() && input.graph.empty()) {
        spdlog::info("No Python modules found; reporting the baseline score");
        return report;
    }

    const auto files = files_in_scope(input);
    std::map<std::string, double> file_points;

    auto charge = [&report](PenaltyCategory category, TargetKind kind, const std::string& target,
                            double points, std::string reason) {
        report.penalties.push_back({category, kind, target, points, std::move(reason)});
    };

    for (const auto* file : files) {
        double points = bloat_points(file->logical_lines);
        if (points < 0.0) {
            charge(PenaltyCategory::BloatedFile, TargetKind::File, file->file_path, points,
                   fmt::format("{} logical lines > {}", file->logical_lines, thresholds_.bloat_line_limit));
            file_points[file->file_path] += points;
        }
    }

    for (const auto* file : files) {
        for (const auto& function : file->functions) {
            const double acl = function.acl();
            const double points = cognitive_load_points(acl);
            if (points == 0.0) {
                continue;
            }

            const bool red = points == kRedLoadPoints;
            charge(PenaltyCategory::CognitiveLoad, TargetKind::Function, function.qualified_name, points,
                   fmt::format("ACL {:.2f} >= {} ({})", acl,
                               red ? thresholds_.acl_red : thresholds_.acl_yellow,
                               red ? "red" : "yellow"));
            file_points[file->file_path] += points;
        }
    }

    for (const auto* file : files) {
        if (lacks_types(*file)) {
            charge(PenaltyCategory::MissingTypes, TargetKind::File, file->file_path, kMissingTypesPoints,
                   fmt::format("type coverage {:.0f}% < {}%", file->type_coverage * 100.0,
                               thresholds_.type_safety_minimum));
            file_points[file->file_path] += kMissingTypesPoints;
        }
    }

    std::set<std::string> present;
    for (const auto& entry : input.project.root_entries) {
        present.insert(utils::to_lower(entry));
    }
    for (const auto& required : unique_context_files(thresholds_.required_context_files)) {
        if (present.count(utils::to_lower(required)) == 0) {
            report.missing_context_files.push_back(required);
            charge(PenaltyCategory::MissingContext, TargetKind::Project, required, kMissingContextPoints,
                   "required context file missing from the project root");
        }
    }
    if (input.config_issue) {
        charge(PenaltyCategory::MissingContext, TargetKind::Project, "configuration", kMissingContextPoints,
               "invalid configuration: " + *input.config_issue);
    }

    // Graph-wide checks always see the whole project, whatever the scope
    report.god_modules = graph::find_god_modules(input.graph, thresholds_.god_module_inbound_limit);
    for (const auto& god : report.god_modules) {
        charge(PenaltyCategory::GodModule, TargetKind::Module, god.module, kGodModulePoints,
               fmt::format("imported by {} modules > {}", god.inbound_degree,
                           thresholds_.god_module_inbound_limit));
    }

    report.crowded_directories = graph::crowded_directories(input.directories, thresholds_.directory_entropy_limit);
    for (const auto& directory : report.crowded_directories) {
        charge(PenaltyCategory::HighEntropy, TargetKind::Directory, directory.directory, kHighEntropyPoints,
               fmt::format("{} files > {}", directory.file_count, thresholds_.directory_entropy_limit));
    }

    report.cycles = graph::find_cycles(input.graph);
    for (const auto& cycle : report.cycles) {
        charge(PenaltyCategory::CircularDependency, TargetKind::Module, utils::join(cycle, ", "), kCyclePoints,
               cycle.size() == 1 ? std::string("module imports itself")
                                 : fmt::format("{} modules import each other", cycle.size()));
    }

    double total = kBaseline;
    for (const auto& penalty : report.penalties) {
        total += penalty.points;
    }
    report.overall_score = std::max(0.0, total);

    for (const auto* file : files) {
        FileScore entry;
        entry.file_path = file->file_path;
        entry.score = std::max(0.0, kBaseline + file_points[file->file_path]);
        entry.logical_lines = file->logical_lines;
        entry.function_count = file->functions.size();
        entry.type_coverage = file->type_coverage;
        entry.tokens = file->tokens;
        report.file_scores.push_back(std::move(entry));
    }
    std::stable_sort(report.file_scores.begin(), report.file_scores.end(),
                     [](const FileScore& lhs, const FileScore& rhs) {
                         if (lhs.score != rhs.score) {
                             return lhs.score < rhs.score;
                         }
                         return lhs.file_path < rhs.file_path;
                     });

    report.top_offenders = rank_offenders(files);

    spdlog::info("Score {:.1f} ({} penalties, {} files in scope)",
                 report.overall_score, report.penalties.size(), files.size());
    return report;
}

EnvironmentHealth ScoringEngine::environment_health(const ScoringInput& input) const {
    EnvironmentHealth health = assess_environment(input.project);

    std::size_t total_files = 0;
    for (const auto& directory : input.directories) {
        total_files += directory.file_count;
        health.max_files_per_directory = std::max(health.max_files_per_directory, directory.file_count);
    }
    if (!input.directories.empty()) {
        health.average_files_per_directory =
            static_cast<double>(total_files) / static_cast<double>(input.directories.size());
    }
    health.entropy_warning = health.average_files_per_directory > kAverageFilesPerDirectoryWarning ||
                             health.max_files_per_directory > thresholds_.directory_entropy_limit;

    std::size_t characters = input.project.context_document_characters;
    for (const auto& file : input.files) {
        characters += file.signature_characters;
    }
    health.critical_context_tokens = metrics::estimate_tokens(characters);
    health.token_alert = health.critical_context_tokens > kCriticalContextTokenAlert;
    return health;
}

std::vector<const metrics::FileSummary*> ScoringEngine::files_in_scope(const ScoringInput& input) const {
    std::vector<const metrics::FileSummary*> files;
    for (const auto& file : input.files) {
        if (!input.scope || input.scope->count(file.file_path) > 0) {
            files.push_back(&file);
        }
    }
    std::sort(files.begin(), files.end(),
              [](const metrics::FileSummary* lhs, const metrics::FileSummary* rhs) {
                  return lhs->file_path < rhs->file_path;
              });
    return files;
}

std::vector<FunctionOffender> ScoringEngine::rank_offenders(
    const std::vector<const metrics::FileSummary*>& files) const {
    std::vector<FunctionOffender> offenders;
    for (const auto* file : files) {
        for (const auto& function : file->functions) {
            offenders.push_back({function.qualified_name, function.file_path, function.start_line,
                                 function.complexity, function.logical_lines, function.acl()});
        }
    }

    std::sort(offenders.begin(), offenders.end(),
              [](const FunctionOffender& lhs, const FunctionOffender& rhs) {
                  if (lhs.acl != rhs.acl) {
                      return lhs.acl > rhs.acl;
                  }
                  if (lhs.file_path != rhs.file_path) {
                      return lhs.file_path < rhs.file_path;
                  }
                  if (lhs.qualified_name != rhs.qualified_name) {
                      return lhs.qualified_name < rhs.qualified_name;
                  }
                  return lhs.start_line < rhs.start_line;
              });

    if (offenders.size() > thresholds_.top_offenders) {
        offenders.resize(thresholds_.top_offenders);
    }
    return offenders;
}

EnvironmentHealth assess_environment(const ProjectContext& project) {
    static const std::set<std::string> linter_files = {"ruff.toml", ".flake8", ".eslintrc"};
    static const std::set<std::string> lock_files = {"package-lock.json", "poetry.lock", "uv.lock"};

    EnvironmentHealth health;
    health.linter_config = project.pyproject_declares_linter;
    for (const auto& entry : project.root_entries) {
        health.agents_md = health.agents_md || utils::to_lower(entry) == "agents.md";
        health.linter_config = health.linter_config || linter_files.count(entry) > 0;
        health.lock_file = health.lock_file || lock_files.count(entry) > 0;
    }
    return health;
}

} // namespace scorecard::scoring
