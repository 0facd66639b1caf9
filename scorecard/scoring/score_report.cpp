#include "scoring/score_report.hpp"
#include <tuple>

namespace scorecard::scoring {

std::string_view category_tag(PenaltyCategory category) {
    switch (category) {
        case PenaltyCategory::BloatedFile: return "bloated-file";
        case PenaltyCategory::CognitiveLoad: return "cognitive-load";
        case PenaltyCategory::MissingTypes: return "missing-types";
        case PenaltyCategory::MissingContext: return "missing-context";
        case PenaltyCategory::GodModule: return "god-module";
        case PenaltyCategory::HighEntropy: return "high-entropy";
        case PenaltyCategory::CircularDependency: return "circular-dependency";
    }
    return "unknown";
}

std::string_view target_kind_name(TargetKind kind) {
    switch (kind) {
        case TargetKind::Function: return "function";
        case TargetKind::File: return "file";
        case TargetKind::Module: return "module";
        case TargetKind::Directory: return "directory";
        case TargetKind::Project: return "project";
    }
    return "unknown";
}

bool operator==(const PenaltyRecord& lhs, const PenaltyRecord& rhs) {
    return std::tie(lhs.category, lhs.target_kind, lhs.target, lhs.points, lhs.reason) ==
           std::tie(rhs.category, rhs.target_kind, rhs.target, rhs.points, rhs.reason);
}

bool operator==(const AnalysisWarning& lhs, const AnalysisWarning& rhs) {
    return std::tie(lhs.category, lhs.target, lhs.message) ==
           std::tie(rhs.category, rhs.target, rhs.message);
}

bool operator==(const FunctionOffender& lhs, const FunctionOffender& rhs) {
    return std::tie(lhs.qualified_name, lhs.file_path, lhs.start_line, lhs.complexity,
                    lhs.logical_lines, lhs.acl) ==
           std::tie(rhs.qualified_name, rhs.file_path, rhs.start_line, rhs.complexity,
                    rhs.logical_lines, rhs.acl);
}

bool operator==(const FileScore& lhs, const FileScore& rhs) {
    return std::tie(lhs.file_path, lhs.score, lhs.logical_lines, lhs.function_count,
                    lhs.type_coverage, lhs.tokens) ==
           std::tie(rhs.file_path, rhs.score, rhs.logical_lines, rhs.function_count,
                    rhs.type_coverage, rhs.tokens);
}

bool operator==(const EnvironmentHealth& lhs, const EnvironmentHealth& rhs) {
    return std::tie(lhs.agents_md, lhs.linter_config, lhs.lock_file,
                    lhs.average_files_per_directory, lhs.max_files_per_directory, lhs.entropy_warning,
                    lhs.critical_context_tokens, lhs.token_alert) ==
           std::tie(rhs.agents_md, rhs.linter_config, rhs.lock_file,
                    rhs.average_files_per_directory, rhs.max_files_per_directory, rhs.entropy_warning,
                    rhs.critical_context_tokens, rhs.token_alert);
}

bool operator==(const ScoreReport& lhs, const ScoreReport& rhs) {
    return lhs.overall_score == rhs.overall_score &&
           lhs.penalties == rhs.penalties &&
           lhs.top_offenders == rhs.top_offenders &&
           lhs.file_scores == rhs.file_scores &&
           lhs.cycles == rhs.cycles &&
           lhs.god_modules == rhs.god_modules &&
           lhs.crowded_directories == rhs.crowded_directories &&
           lhs.missing_context_files == rhs.missing_context_files &&
           lhs.warnings == rhs.warnings &&
           lhs.environment == rhs.environment &&
           lhs.files_analyzed == rhs.files_analyzed &&
           lhs.functions_analyzed == rhs.functions_analyzed &&
           lhs.diff_mode == rhs.diff_mode;
}

} // namespace scorecard::scoring
