#ifndef SCORECARD_SCORING_SCORING_ENGINE_HPP
#define SCORECARD_SCORING_SCORING_ENGINE_HPP

#pragma once

#include "graph/dependency_graph.hpp"
#include "graph/graph_builder.hpp"
#include "metrics/function_record.hpp"
#include "scoring/score_report.hpp"
#include "scoring/thresholds.hpp"
#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace scorecard::scoring {

struct ProjectContext {
    // Names of the entries in the project root directory
    std::vector<std::string> root_entries;
    // pyproject.toml carries a [tool.ruff] table
    bool pyproject_declares_linter{false};
    // Combined length of README.md and AGENTS.md in the project root
    std::size_t context_document_characters{0};
};

struct ScoringInput {
    std::vector<metrics::FileSummary> files;
    graph::DependencyGraph graph;
    std::vector<graph::DirectoryTally> directories;
    ProjectContext project;
    // Diff mode: only these project-relative files receive file and function penalties
    std::optional<std::set<std::string>> scope;
    std::optional<std::string> config_issue;
    std::vector<AnalysisWarning> warnings;
};

class ScoringEngine {
public:
    static constexpr double kBaseline = 100.0;
    static constexpr double kBloatPointsPerStep = -1.0;
    static constexpr std::size_t kBloatStepLines = 10;
    static constexpr double kRedLoadPoints = -15.0;
    static constexpr double kYellowLoadPoints = -5.0;
    static constexpr double kMissingTypesPoints = -20.0;
    static constexpr double kMissingContextPoints = -15.0;
    static constexpr double kGodModulePoints = -10.0;
    static constexpr double kHighEntropyPoints = -5.0;
    static constexpr double kCyclePoints = -5.0;

    // Environment health alerts; reported only
    static constexpr double kAverageFilesPerDirectoryWarning = 15.0;
    static constexpr std::size_t kCriticalContextTokenAlert = 32000;

    explicit ScoringEngine(Thresholds thresholds);

    // Deterministic: equal inputs give equal reports, field by field and in order
    ScoreReport score(const ScoringInput& input) const;

    const Thresholds& thresholds() const { return thresholds_; }

    double bloat_points(std::size_t logical_lines) const;
    // Red supersedes yellow; 0 below the yellow threshold
    double cognitive_load_points(double acl) const;
    bool lacks_types(const metrics::FileSummary& file) const;

    // Root files plus directory spread and critical context size; always project-wide
    EnvironmentHealth environment_health(const ScoringInput& input) const;

private:
    std::vector<const metrics::FileSummary*> files_in_scope(const ScoringInput& input) const;
    std::vector<FunctionOffender> rank_offenders(const std::vector<const metrics::FileSummary*>& files) const;

    Thresholds thresholds_;
};

EnvironmentHealth assess_environment(const ProjectContext& project);

} // namespace scorecard::scoring

#endif // SCORECARD_SCORING_SCORING_ENGINE_HPP
