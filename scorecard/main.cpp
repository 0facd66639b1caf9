#include "analysis/analyzer.hpp"
#include "config/config_loader.hpp"
#include "scoring/thresholds.hpp"
#include "utils/git.hpp"
#include <llvm/Support/CommandLine.h>
#include <llvm/Support/InitLLVM.h>
#include <llvm/Support/raw_ostream.h>
#include <llvm/Support/Format.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <csignal>
#include <filesystem>
#include <optional>

using namespace llvm;

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitBelowThreshold = 2;
constexpr int kExitInterrupted = 130;

std::atomic<bool> interrupted{false};

void handle_interrupt(int) {
    interrupted.store(true);
}

} // namespace

// Command line options
static cl::OptionCategory ScorecardCategory("Agent Scorecard Options");

static cl::opt<std::string> InputPath(
    cl::Positional,
    cl::desc("<project path>"),
    cl::Required,
    cl::cat(ScorecardCategory));

static cl::opt<std::string> Profile(
    "profile",
    cl::desc("Threshold profile (generic, relaxed, jules, copilot)"),
    cl::value_desc("name"),
    cl::cat(ScorecardCategory));

static cl::opt<std::string> ConfigPath(
    "config",
    cl::desc("Configuration file (default: <project path>/pyproject.toml)"),
    cl::value_desc("file"),
    cl::cat(ScorecardCategory));

static cl::list<std::string> ChangedFiles(
    "changed",
    cl::desc("Score only these files, relative to the project path (can be specified multiple times)"),
    cl::value_desc("file"),
    cl::cat(ScorecardCategory));

static cl::opt<std::string> DiffBase(
    "diff-base",
    cl::desc("Score only files changed against this git ref, plus untracked files"),
    cl::value_desc("ref"),
    cl::cat(ScorecardCategory));

static cl::opt<std::string> OutputFormat(
    "format",
    cl::desc("Output format (text, json)"),
    cl::init("text"),
    cl::cat(ScorecardCategory));

static cl::opt<unsigned> TopOffenders(
    "top",
    cl::desc("Number of top offending functions to report (default: 10)"),
    cl::value_desc("n"),
    cl::cat(ScorecardCategory));

static cl::opt<unsigned> Jobs(
    "jobs",
    cl::desc("Worker threads (default: hardware concurrency)"),
    cl::init(0),
    cl::value_desc("n"),
    cl::cat(ScorecardCategory));

static cl::opt<double> FailUnder(
    "fail-under",
    cl::desc("Exit with status 2 when the score is below this value"),
    cl::value_desc("score"),
    cl::cat(ScorecardCategory));

static cl::list<std::string> IgnorePatterns(
    "ignore",
    cl::desc("Patterns to ignore (can be specified multiple times)"),
    cl::cat(ScorecardCategory));

static cl::opt<bool> Verbose(
    "verbose",
    cl::desc("Enable verbose output"),
    cl::init(false),
    cl::cat(ScorecardCategory));

namespace {

std::string json_escape(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (unsigned char c : text) {
        switch (c) {
        case '"': escaped += "\\\""; break;
        case '\\': escaped += "\\\\"; break;
        case '\n': escaped += "\\n"; break;
        case '\r': escaped += "\\r"; break;
        case '\t': escaped += "\\t"; break;
        default:
            if (c < 0x20) {
                static const char* digits = "0123456789abcdef";
                escaped += "\\u00";
                escaped += digits[c >> 4];
                escaped += digits[c & 0xF];
            } else {
                escaped += static_cast<char>(c);
            }
        }
    }
    return escaped;
}

void output_string_array(const std::vector<std::string>& values) {
    outs() << "[";
    for (size_t i = 0; i < values.size(); ++i) {
        outs() << (i ? ", " : "") << "\"" << json_escape(values[i]) << "\"";
    }
    outs() << "]";
}

void output_report_json(const scorecard::scoring::ScoreReport& report,
                        const scorecard::config::ScorecardConfig& config) {
    outs() << "{\n"
           << "  \"score\": " << format("%.2f", report.overall_score) << ",\n"
           << "  \"profile\": \"" << json_escape(config.profile) << "\",\n"
           << "  \"diff_mode\": " << (report.diff_mode ? "true" : "false") << ",\n"
           << "  \"files_analyzed\": " << report.files_analyzed << ",\n"
           << "  \"functions_analyzed\": " << report.functions_analyzed << ",\n";

    outs() << "  \"penalties\": [\n";
    for (size_t i = 0; i < report.penalties.size(); ++i) {
        const auto& penalty = report.penalties[i];
        outs() << "    {\n"
               << "      \"category\": \"" << scorecard::scoring::category_tag(penalty.category) << "\",\n"
               << "      \"target_kind\": \"" << scorecard::scoring::target_kind_name(penalty.target_kind) << "\",\n"
               << "      \"target\": \"" << json_escape(penalty.target) << "\",\n"
               << "      \"points\": " << format("%.2f", penalty.points) << ",\n"
               << "      \"reason\": \"" << json_escape(penalty.reason) << "\"\n"
               << "    }" << (i + 1 < report.penalties.size() ? "," : "") << "\n";
    }
    outs() << "  ],\n";

    outs() << "  \"top_offenders\": [\n";
    for (size_t i = 0; i < report.top_offenders.size(); ++i) {
        const auto& offender = report.top_offenders[i];
        outs() << "    {\n"
               << "      \"function\": \"" << json_escape(offender.qualified_name) << "\",\n"
               << "      \"file\": \"" << json_escape(offender.file_path) << "\",\n"
               << "      \"start_line\": " << offender.start_line << ",\n"
               << "      \"complexity\": " << offender.complexity << ",\n"
               << "      \"logical_lines\": " << offender.logical_lines << ",\n"
               << "      \"acl\": " << format("%.2f", offender.acl) << "\n"
               << "    }" << (i + 1 < report.top_offenders.size() ? "," : "") << "\n";
    }
    outs() << "  ],\n";

    outs() << "  \"files\": [\n";
    for (size_t i = 0; i < report.file_scores.size(); ++i) {
        const auto& file = report.file_scores[i];
        outs() << "    {\n"
               << "      \"file\": \"" << json_escape(file.file_path) << "\",\n"
               << "      \"score\": " << format("%.2f", file.score) << ",\n"
               << "      \"logical_lines\": " << file.logical_lines << ",\n"
               << "      \"functions\": " << file.function_count << ",\n"
               << "      \"type_coverage\": " << format("%.4f", file.type_coverage) << ",\n"
               << "      \"tokens\": " << file.tokens << "\n"
               << "    }" << (i + 1 < report.file_scores.size() ? "," : "") << "\n";
    }
    outs() << "  ],\n";

    outs() << "  \"cycles\": [";
    for (size_t i = 0; i < report.cycles.size(); ++i) {
        outs() << (i ? ", " : "");
        output_string_array(report.cycles[i]);
    }
    outs() << "],\n";

    outs() << "  \"god_modules\": [";
    for (size_t i = 0; i < report.god_modules.size(); ++i) {
        outs() << (i ? ", " : "") << "{\"module\": \"" << json_escape(report.god_modules[i].module)
               << "\", \"inbound_degree\": " << report.god_modules[i].inbound_degree << "}";
    }
    outs() << "],\n";

    outs() << "  \"crowded_directories\": [";
    for (size_t i = 0; i < report.crowded_directories.size(); ++i) {
        outs() << (i ? ", " : "") << "{\"directory\": \"" << json_escape(report.crowded_directories[i].directory)
               << "\", \"file_count\": " << report.crowded_directories[i].file_count << "}";
    }
    outs() << "],\n";

    outs() << "  \"missing_context_files\": ";
    output_string_array(report.missing_context_files);
    outs() << ",\n";

    outs() << "  \"environment\": {"
           << "\"agents_md\": " << (report.environment.agents_md ? "true" : "false")
           << ", \"linter_config\": " << (report.environment.linter_config ? "true" : "false")
           << ", \"lock_file\": " << (report.environment.lock_file ? "true" : "false")
           << ", \"average_files_per_directory\": "
           << format("%.2f", report.environment.average_files_per_directory)
           << ", \"max_files_per_directory\": " << report.environment.max_files_per_directory
           << ", \"entropy_warning\": " << (report.environment.entropy_warning ? "true" : "false")
           << ", \"critical_context_tokens\": " << report.environment.critical_context_tokens
           << ", \"token_alert\": " << (report.environment.token_alert ? "true" : "false") << "},\n";

    outs() << "  \"warnings\": [\n";
    for (size_t i = 0; i < report.warnings.size(); ++i) {
        const auto& warning = report.warnings[i];
        outs() << "    {\"category\": \"" << json_escape(warning.category)
               << "\", \"target\": \"" << json_escape(warning.target)
               << "\", \"message\": \"" << json_escape(warning.message) << "\"}"
               << (i + 1 < report.warnings.size() ? "," : "") << "\n";
    }
    outs() << "  ]\n}\n";
}

void output_report_text(const scorecard::scoring::ScoreReport& report,
                        const scorecard::config::ScorecardConfig& config) {
    const bool detailed = config.verbosity == scorecard::config::Verbosity::Detailed;

    outs() << "Agent readiness score: " << format("%.1f", report.overall_score) << "/100"
           << " (profile: " << config.profile << (report.diff_mode ? ", diff mode" : "") << ")\n"
           << "Files analyzed: " << report.files_analyzed
           << ", functions analyzed: " << report.functions_analyzed << "\n";

    if (!report.penalties.empty()) {
        outs() << "\nPenalties:\n";
        for (const auto& penalty : report.penalties) {
            outs() << "  " << format("%6.1f", penalty.points) << "  ["
                   << scorecard::scoring::category_tag(penalty.category) << "] " << penalty.target;
            if (detailed) {
                outs() << ": " << penalty.reason;
            }
            outs() << "\n";
        }
    }

    if (!report.top_offenders.empty()) {
        outs() << "\nTop offenders (ACL):\n";
        for (const auto& offender : report.top_offenders) {
            outs() << "  " << format("%6.2f", offender.acl) << "  " << offender.qualified_name
                   << " (" << offender.file_path << ":" << offender.start_line
                   << ", complexity " << offender.complexity
                   << ", " << offender.logical_lines << " lines)\n";
        }
    }

    if (!report.file_scores.empty()) {
        outs() << "\nFile scores:\n";
        for (const auto& file : report.file_scores) {
            outs() << "  " << format("%5.1f", file.score) << "  " << file.file_path;
            if (detailed) {
                outs() << " (" << file.logical_lines << " lines, " << file.function_count
                       << " functions, " << format("%.0f", file.type_coverage * 100.0) << "% typed, ~"
                       << file.tokens << " tokens)";
            }
            outs() << "\n";
        }
    }

    if (!report.cycles.empty()) {
        outs() << "\nCircular dependencies:\n";
        for (const auto& cycle : report.cycles) {
            outs() << "  ";
            for (size_t i = 0; i < cycle.size(); ++i) {
                outs() << (i ? " <-> " : "") << cycle[i];
            }
            outs() << "\n";
        }
    }

    if (!report.god_modules.empty()) {
        outs() << "\nGod modules:\n";
        for (const auto& god : report.god_modules) {
            outs() << "  " << god.module << " (imported by " << god.inbound_degree << ")\n";
        }
    }

    if (!report.crowded_directories.empty()) {
        outs() << "\nCrowded directories:\n";
        for (const auto& directory : report.crowded_directories) {
            outs() << "  " << directory.directory << " (" << directory.file_count << " files)\n";
        }
    }

    if (detailed) {
        outs() << "\nEnvironment:\n"
               << "  AGENTS.md: " << (report.environment.agents_md ? "yes" : "no") << "\n"
               << "  Linter config: " << (report.environment.linter_config ? "yes" : "no") << "\n"
               << "  Lock file: " << (report.environment.lock_file ? "yes" : "no") << "\n"
               << "  Directory entropy: " << format("%.1f", report.environment.average_files_per_directory)
               << " files/dir, max " << report.environment.max_files_per_directory
               << (report.environment.entropy_warning ? " (warning)" : "") << "\n"
               << "  Critical context: ~" << report.environment.critical_context_tokens << " tokens"
               << (report.environment.token_alert ? " (alert)" : "") << "\n";
    }

    if (!report.warnings.empty()) {
        outs() << "\nWarnings:\n";
        for (const auto& warning : report.warnings) {
            outs() << "  [" << warning.category << "] " << warning.target << ": " << warning.message << "\n";
        }
    }
}

} // namespace

int main(int argc, char **argv) {
    InitLLVM X(argc, argv);

    // Parse command line options
    cl::HideUnrelatedOptions(ScorecardCategory);
    cl::ParseCommandLineOptions(argc, argv, "Agent Scorecard - agent-readiness analysis for Python projects\n");

    // Configure spdlog
    spdlog::set_level(Verbose ? spdlog::level::debug : spdlog::level::warn);

    if (OutputFormat != "text" && OutputFormat != "json") {
        spdlog::error("Unsupported output format: {}", OutputFormat.getValue());
        return kExitFailure;
    }

    std::optional<std::string> profile;
    if (!Profile.empty()) {
        if (!scorecard::scoring::profile_thresholds(Profile)) {
            spdlog::error("Unknown profile: {}", Profile.getValue());
            return kExitFailure;
        }
        profile = Profile.getValue();
    }

    try {
        std::filesystem::path input_path(InputPath.getValue());
        if (!std::filesystem::is_directory(input_path)) {
            spdlog::error("Invalid input path: {}", input_path.string());
            return kExitFailure;
        }

        const std::string config_path = ConfigPath.empty()
            ? (input_path / "pyproject.toml").string()
            : ConfigPath.getValue();
        auto config = scorecard::config::load_config_file(config_path, profile);

        if (TopOffenders.getNumOccurrences() > 0) {
            config.thresholds.top_offenders = TopOffenders;
        }

        scorecard::analysis::AnalysisOptions options;
        options.root = input_path.string();
        options.thresholds = config.thresholds;
        options.ignore_patterns.assign(IgnorePatterns.begin(), IgnorePatterns.end());
        options.jobs = Jobs;
        options.config_issue = config.issue;
        options.declares_linter = config.declares_linter;

        if (!ChangedFiles.empty()) {
            options.changed_files = std::vector<std::string>(ChangedFiles.begin(), ChangedFiles.end());
            if (!DiffBase.empty()) {
                spdlog::warn("--changed given; ignoring --diff-base {}", DiffBase.getValue());
            }
        } else if (!DiffBase.empty()) {
            options.changed_files = scorecard::utils::list_changed_files(options.root, DiffBase);
        }

        scorecard::analysis::Analyzer analyzer;
        analyzer.set_cancellation_flag(&interrupted);
        std::signal(SIGINT, handle_interrupt);

        auto report = analyzer.analyze_project(options);
        if (!report) {
            spdlog::error("Interrupted");
            return kExitInterrupted;
        }

        if (OutputFormat == "json") {
            output_report_json(*report, config);
        } else {
            output_report_text(*report, config);
        }

        if (FailUnder.getNumOccurrences() > 0 && report->overall_score < FailUnder) {
            spdlog::error("Score {:.1f} is below the required {:.1f}", report->overall_score, FailUnder.getValue());
            return kExitBelowThreshold;
        }
    } catch (const std::exception& e) {
        spdlog::error("An error occurred: {}", e.what());
        return kExitFailure;
    }

    return kExitSuccess;
}
