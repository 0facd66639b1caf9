// analyzer.hpp
#ifndef SCORECARD_ANALYSIS_ANALYZER_HPP
#define SCORECARD_ANALYSIS_ANALYZER_HPP

#pragma once

#include "metrics/function_record.hpp"
#include "parser/syntax_tree.hpp"
#include "scoring/score_report.hpp"
#include "scoring/thresholds.hpp"
#include <atomic>
#include <optional>
#include <string>
#include <vector>

namespace scorecard::analysis {

struct AnalysisOptions {
    std::string root;
    scoring::Thresholds thresholds;
    std::vector<std::string> ignore_patterns;
    // Diff mode: paths relative to root, or absolute paths under it
    std::optional<std::vector<std::string>> changed_files;
    // Worker threads, 0 for the hardware concurrency
    unsigned int jobs{0};
    std::optional<std::string> config_issue;
    bool declares_linter{false};
};

// Result of one per-file task
struct FileAnalysis {
    std::string relative_path;
    std::optional<metrics::FileSummary> summary;
    std::vector<parser::ImportPayload> imports;
    // Parse or read failure; summary is empty when set
    std::optional<std::string> error;
};

class Analyzer {
public:
    Analyzer();

    FileAnalysis analyze_file(const std::string &root, const std::string &relative_path) const;

    // Runs discovery, per-file extraction, graph assembly and scoring.
    // Returns std::nullopt when the cancellation flag was raised.
    std::optional<scoring::ScoreReport> analyze_project(const AnalysisOptions &options) const;

    // The flag is polled before each file; it must outlive the analysis
    void set_cancellation_flag(const std::atomic<bool> *flag) { cancelled_ = flag; }

private:
    bool cancelled() const;

    const std::atomic<bool> *cancelled_{nullptr};
};

} // namespace scorecard::analysis

#endif // SCORECARD_ANALYSIS_ANALYZER_HPP
