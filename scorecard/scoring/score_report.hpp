#ifndef SCORECARD_SCORING_SCORE_REPORT_HPP
#define SCORECARD_SCORING_SCORE_REPORT_HPP

#pragma once

#include "graph/dependency_graph.hpp"
#include "graph/graph_builder.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace scorecard::scoring {

// Declaration order is the order penalties appear in a report
enum class PenaltyCategory {
    BloatedFile,
    CognitiveLoad,
    MissingTypes,
    MissingContext,
    GodModule,
    HighEntropy,
    CircularDependency
};

enum class TargetKind {
    Function,
    File,
    Module,
    Directory,
    Project
};

std::string_view category_tag(PenaltyCategory category);
std::string_view target_kind_name(TargetKind kind);

struct PenaltyRecord {
    PenaltyCategory category;
    TargetKind target_kind;
    std::string target;
    // Signed delta applied to the 100-point baseline; never positive
    double points;
    std::string reason;
};

// Not scored; explains why something was left out of the analysis
struct AnalysisWarning {
    std::string category;
    std::string target;
    std::string message;
};

struct FunctionOffender {
    std::string qualified_name;
    std::string file_path;
    std::size_t start_line{0};
    std::size_t complexity{1};
    std::size_t logical_lines{0};
    double acl{0.0};
};

struct FileScore {
    std::string file_path;
    double score{100.0};
    std::size_t logical_lines{0};
    std::size_t function_count{0};
    double type_coverage{1.0};
    std::size_t tokens{0};
};

// Informational; none of these fields affects the score
struct EnvironmentHealth {
    bool agents_md{false};
    bool linter_config{false};
    bool lock_file{false};
    // Over directories holding at least one discovered file
    double average_files_per_directory{0.0};
    std::size_t max_files_per_directory{0};
    bool entropy_warning{false};
    // README.md, AGENTS.md and the Python class and function headers
    std::size_t critical_context_tokens{0};
    bool token_alert{false};
};

struct ScoreReport {
    double overall_score{100.0};
    std::vector<PenaltyRecord> penalties;
    std::vector<FunctionOffender> top_offenders;
    std::vector<FileScore> file_scores;
    std::vector<graph::Cycle> cycles;
    std::vector<graph::GodModule> god_modules;
    std::vector<graph::DirectoryTally> crowded_directories;
    std::vector<std::string> missing_context_files;
    std::vector<AnalysisWarning> warnings;
    EnvironmentHealth environment;
    std::size_t files_analyzed{0};
    std::size_t functions_analyzed{0};
    bool diff_mode{false};
};

bool operator==(const PenaltyRecord& lhs, const PenaltyRecord& rhs);
bool operator==(const AnalysisWarning& lhs, const AnalysisWarning& rhs);
bool operator==(const FunctionOffender& lhs, const FunctionOffender& rhs);
bool operator==(const FileScore& lhs, const FileScore& rhs);
bool operator==(const EnvironmentHealth& lhs, const EnvironmentHealth& rhs);
bool operator==(const ScoreReport& lhs, const ScoreReport& rhs);

} // namespace scorecard::scoring

#endif // SCORECARD_SCORING_SCORE_REPORT_HPP
