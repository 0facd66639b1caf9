#include <gtest/gtest.h>
#include "scoring/scoring_engine.hpp"

using namespace scorecard;
using scoring::PenaltyCategory;
using scoring::ScoringEngine;
using scoring::ScoringInput;
using scoring::Thresholds;

namespace {

metrics::FunctionRecord make_function(const std::string& file, const std::string& name, std::size_t line,
                                      std::size_t complexity, std::size_t lines, double coverage = 1.0) {
    metrics::FunctionRecord record;
    record.qualified_name = name;
    record.file_path = file;
    record.start_line = line;
    record.end_line = line + lines;
    record.complexity = complexity;
    record.logical_lines = lines;
    record.type_coverage = coverage;
    return record;
}

metrics::FileSummary make_file(const std::string& path, std::size_t lines,
                               std::vector<metrics::FunctionRecord> functions = {}) {
    metrics::FileSummary file;
    file.file_path = path;
    file.logical_lines = lines;
    file.functions = std::move(functions);
    file.type_coverage = metrics::aggregate_type_coverage(file.functions);
    return file;
}

ScoringInput with_context() {
    ScoringInput input;
    input.project.root_entries = {"AGENTS.md", "readme.md", "pkg"};
    return input;
}

graph::DependencyGraph cycle_graph(const std::vector<std::string>& ring) {
    graph::DependencyGraph graph;
    for (const auto& module : ring) {
        graph.add_module(module, module + ".py");
    }
    for (std::size_t i = 0; i < ring.size(); ++i) {
        graph.add_edge(ring[i], ring[(i + 1) % ring.size()]);
    }
    return graph;
}

std::size_t count_category(const scoring::ScoreReport& report, PenaltyCategory category) {
    std::size_t count = 0;
    for (const auto& penalty : report.penalties) {
        if (penalty.category == category) {
            ++count;
        }
    }
    return count;
}

} // namespace

TEST(ScoringEngineTest, BloatedComplexUntypedFileScoresSixty) {
    auto input = with_context();
    input.files.push_back(make_file("pkg/big.py", 250, {make_function("pkg/big.py", "pkg.big.run", 1, 14, 250, 0.0)}));

    auto report = ScoringEngine(Thresholds{}).score(input);

    ASSERT_EQ(report.penalties.size(), 3u);
    EXPECT_EQ(report.penalties[0].category, PenaltyCategory::BloatedFile);
    EXPECT_DOUBLE_EQ(report.penalties[0].points, -5.0);
    EXPECT_EQ(report.penalties[0].target, "pkg/big.py");
    EXPECT_EQ(report.penalties[1].category, PenaltyCategory::CognitiveLoad);
    EXPECT_DOUBLE_EQ(report.penalties[1].points, -15.0);
    EXPECT_EQ(report.penalties[1].target, "pkg.big.run");
    EXPECT_EQ(report.penalties[2].category, PenaltyCategory::MissingTypes);
    EXPECT_DOUBLE_EQ(report.penalties[2].points, -20.0);

    ASSERT_EQ(report.file_scores.size(), 1u);
    EXPECT_DOUBLE_EQ(report.file_scores[0].score, 60.0);
    EXPECT_DOUBLE_EQ(report.overall_score, 60.0);

    ASSERT_EQ(report.top_offenders.size(), 1u);
    EXPECT_DOUBLE_EQ(report.top_offenders[0].acl, 26.5);
}

TEST(ScoringEngineTest, CognitiveLoadUsesUnroundedAcl) {
    ScoringEngine engine{Thresholds{}};

    EXPECT_DOUBLE_EQ(engine.cognitive_load_points(metrics::calculate_acl(15, 0)), -15.0);
    EXPECT_DOUBLE_EQ(engine.cognitive_load_points(metrics::calculate_acl(14, 19)), -5.0);
    EXPECT_DOUBLE_EQ(engine.cognitive_load_points(metrics::calculate_acl(10, 0)), -5.0);
    EXPECT_DOUBLE_EQ(engine.cognitive_load_points(metrics::calculate_acl(9, 20)), -5.0);
    EXPECT_DOUBLE_EQ(engine.cognitive_load_points(metrics::calculate_acl(9, 19)), 0.0);
}

TEST(ScoringEngineTest, BloatChargesFullStepsOnly) {
    ScoringEngine engine{Thresholds{}};

    EXPECT_DOUBLE_EQ(engine.bloat_points(200), 0.0);
    EXPECT_DOUBLE_EQ(engine.bloat_points(209), 0.0);
    EXPECT_DOUBLE_EQ(engine.bloat_points(210), -1.0);
    EXPECT_DOUBLE_EQ(engine.bloat_points(1234), -103.0);

    auto input = with_context();
    input.files.push_back(make_file("slightly_long.py", 205));
    auto report = engine.score(input);
    EXPECT_TRUE(report.penalties.empty());
    EXPECT_DOUBLE_EQ(report.overall_score, 100.0);
}

TEST(ScoringEngineTest, FileWithoutFunctionsNeedsNoTypes) {
    auto input = with_context();
    input.files.push_back(make_file("constants.py", 10));

    auto report = ScoringEngine(Thresholds{}).score(input);
    EXPECT_EQ(count_category(report, PenaltyCategory::MissingTypes), 0u);
    EXPECT_DOUBLE_EQ(report.overall_score, 100.0);
}

TEST(ScoringEngineTest, TypeMinimumFollowsProfile) {
    auto input = with_context();
    input.files.push_back(make_file("half.py", 10, {
        make_function("half.py", "half.a", 1, 1, 2, 1.0),
        make_function("half.py", "half.b", 4, 1, 2, 0.0)}));

    auto generic = ScoringEngine(Thresholds{}).score(input);
    EXPECT_EQ(count_category(generic, PenaltyCategory::MissingTypes), 1u);

    auto relaxed = *scoring::profile_thresholds("relaxed");
    input.project.root_entries = {"README.md"};
    auto report = ScoringEngine(relaxed).score(input);
    EXPECT_EQ(count_category(report, PenaltyCategory::MissingTypes), 0u);
    EXPECT_DOUBLE_EQ(report.overall_score, 100.0);
}

TEST(ScoringEngineTest, MissingContextFilesArePenalized) {
    ScoringInput input;
    input.project.root_entries = {"Agents.MD", "setup.py"};
    input.files.push_back(make_file("setup.py", 5));

    auto report = ScoringEngine(Thresholds{}).score(input);
    ASSERT_EQ(report.penalties.size(), 1u);
    EXPECT_EQ(report.penalties[0].category, PenaltyCategory::MissingContext);
    EXPECT_EQ(report.penalties[0].target, "README.md");
    EXPECT_EQ(report.missing_context_files, std::vector<std::string>{"README.md"});
    EXPECT_DOUBLE_EQ(report.overall_score, 85.0);
}

TEST(ScoringEngineTest, InvalidConfigurationCostsFifteen) {
    auto input = with_context();
    input.files.push_back(make_file("a.py", 5));
    input.config_issue = "unknown profile 'fast'";

    auto report = ScoringEngine(Thresholds{}).score(input);
    ASSERT_EQ(report.penalties.size(), 1u);
    EXPECT_EQ(report.penalties[0].category, PenaltyCategory::MissingContext);
    EXPECT_DOUBLE_EQ(report.overall_score, 85.0);
    ASSERT_EQ(report.warnings.size(), 1u);
    EXPECT_EQ(report.warnings[0].category, "config-invalid");
}

TEST(ScoringEngineTest, ThreeModuleCycleCostsFiveOnce) {
    auto input = with_context();
    input.graph = cycle_graph({"A", "B", "C"});
    for (const auto& name : {"A", "B", "C"}) {
        input.files.push_back(make_file(std::string(name) + ".py", 3));
    }

    auto report = ScoringEngine(Thresholds{}).score(input);
    ASSERT_EQ(report.cycles.size(), 1u);
    EXPECT_EQ(report.cycles[0], (graph::Cycle{"A", "B", "C"}));
    ASSERT_EQ(report.penalties.size(), 1u);
    EXPECT_EQ(report.penalties[0].category, PenaltyCategory::CircularDependency);
    EXPECT_DOUBLE_EQ(report.penalties[0].points, -5.0);
    EXPECT_DOUBLE_EQ(report.overall_score, 95.0);

    input.scope = std::set<std::string>{"A.py"};
    auto scoped = ScoringEngine(Thresholds{}).score(input);
    EXPECT_EQ(count_category(scoped, PenaltyCategory::CircularDependency), 1u);
    EXPECT_DOUBLE_EQ(scoped.overall_score, 95.0);
}

TEST(ScoringEngineTest, DiffScopeLimitsFilePenaltiesOnly) {
    auto input = with_context();
    input.graph = cycle_graph({"a", "b"});
    input.files.push_back(make_file("a.py", 230, {make_function("a.py", "a.f", 1, 12, 10)}));
    input.files.push_back(make_file("b.py", 230, {make_function("b.py", "b.g", 1, 20, 10)}));
    input.scope = std::set<std::string>{"a.py"};

    auto report = ScoringEngine(Thresholds{}).score(input);
    EXPECT_TRUE(report.diff_mode);

    ASSERT_EQ(report.penalties.size(), 3u);
    EXPECT_EQ(report.penalties[0].category, PenaltyCategory::BloatedFile);
    EXPECT_EQ(report.penalties[0].target, "a.py");
    EXPECT_EQ(report.penalties[1].category, PenaltyCategory::CognitiveLoad);
    EXPECT_EQ(report.penalties[1].target, "a.f");
    EXPECT_EQ(report.penalties[2].category, PenaltyCategory::CircularDependency);

    ASSERT_EQ(report.file_scores.size(), 1u);
    EXPECT_EQ(report.file_scores[0].file_path, "a.py");
    EXPECT_DOUBLE_EQ(report.file_scores[0].score, 92.0);
    ASSERT_EQ(report.top_offenders.size(), 1u);
    EXPECT_EQ(report.top_offenders[0].qualified_name, "a.f");
    EXPECT_DOUBLE_EQ(report.overall_score, 87.0);
    EXPECT_EQ(report.files_analyzed, 2u);
}

TEST(ScoringEngineTest, GraphWideChecksUseLimits) {
    Thresholds thresholds;
    thresholds.god_module_inbound_limit = 1;
    thresholds.directory_entropy_limit = 2;

    auto input = with_context();
    input.graph.add_module("core", "core.py");
    input.graph.add_module("x", "x.py");
    input.graph.add_module("y", "y.py");
    input.graph.add_edge("x", "core");
    input.graph.add_edge("y", "core");
    input.directories = {{".", 3}, {"pkg", 2}};

    auto report = ScoringEngine(thresholds).score(input);
    ASSERT_EQ(report.god_modules.size(), 1u);
    EXPECT_EQ(report.god_modules[0].module, "core");
    ASSERT_EQ(report.crowded_directories.size(), 1u);
    EXPECT_EQ(report.crowded_directories[0].directory, ".");

    ASSERT_EQ(report.penalties.size(), 2u);
    EXPECT_EQ(report.penalties[0].category, PenaltyCategory::GodModule);
    EXPECT_DOUBLE_EQ(report.penalties[0].points, -10.0);
    EXPECT_EQ(report.penalties[1].category, PenaltyCategory::HighEntropy);
    EXPECT_DOUBLE_EQ(report.penalties[1].points, -5.0);
    EXPECT_DOUBLE_EQ(report.overall_score, 85.0);
}

TEST(ScoringEngineTest, ScoreIsClampedAtZero) {
    auto input = with_context();
    std::vector<metrics::FunctionRecord> functions;
    for (std::size_t i = 0; i < 10; ++i) {
        functions.push_back(make_function("worst.py", "worst.f" + std::to_string(i), i * 10 + 1, 30, 5));
    }
    input.files.push_back(make_file("worst.py", 100, functions));

    auto report = ScoringEngine(Thresholds{}).score(input);
    EXPECT_EQ(count_category(report, PenaltyCategory::CognitiveLoad), 10u);
    EXPECT_DOUBLE_EQ(report.overall_score, 0.0);
    EXPECT_DOUBLE_EQ(report.file_scores[0].score, 0.0);
}

TEST(ScoringEngineTest, OrdersOffendersAndFileScores) {
    Thresholds thresholds;
    thresholds.top_offenders = 3;

    auto input = with_context();
    input.files.push_back(make_file("b.py", 20, {
        make_function("b.py", "b.low", 1, 2, 0),
        make_function("b.py", "b.tie", 5, 5, 0)}));
    input.files.push_back(make_file("a.py", 20, {
        make_function("a.py", "a.tie", 1, 5, 0),
        make_function("a.py", "a.high", 5, 11, 0)}));
    input.files.push_back(make_file("c.py", 20));

    auto report = ScoringEngine(thresholds).score(input);

    ASSERT_EQ(report.top_offenders.size(), 3u);
    EXPECT_EQ(report.top_offenders[0].qualified_name, "a.high");
    EXPECT_EQ(report.top_offenders[1].qualified_name, "a.tie");
    EXPECT_EQ(report.top_offenders[2].qualified_name, "b.tie");

    ASSERT_EQ(report.file_scores.size(), 3u);
    EXPECT_EQ(report.file_scores[0].file_path, "a.py");
    EXPECT_DOUBLE_EQ(report.file_scores[0].score, 95.0);
    EXPECT_EQ(report.file_scores[1].file_path, "b.py");
    EXPECT_EQ(report.file_scores[2].file_path, "c.py");
}

TEST(ScoringEngineTest, EmptyProjectIsPerfect) {
    ScoringInput input;
    auto report = ScoringEngine(Thresholds{}).score(input);

    EXPECT_DOUBLE_EQ(report.overall_score, 100.0);
    EXPECT_TRUE(report.penalties.empty());
    EXPECT_TRUE(report.missing_context_files.empty());
}

TEST(ScoringEngineTest, ScoringIsIdempotent) {
    auto input = with_context();
    input.graph = cycle_graph({"m", "n"});
    input.files.push_back(make_file("m.py", 320, {make_function("m.py", "m.f", 1, 16, 40, 0.0)}));
    input.files.push_back(make_file("n.py", 12, {make_function("n.py", "n.g", 1, 3, 12, 0.5)}));
    input.warnings.push_back({"parse-error", "broken.py", "syntax error"});

    ScoringEngine engine{Thresholds{}};
    auto first = engine.score(input);
    auto second = engine.score(input);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first.warnings.size(), 1u);
}

TEST(ScoringEngineTest, ReportsEnvironmentHealth) {
    scoring::ProjectContext project;
    project.root_entries = {"agents.md", "ruff.toml", "poetry.lock"};
    auto health = scoring::assess_environment(project);
    EXPECT_TRUE(health.agents_md);
    EXPECT_TRUE(health.linter_config);
    EXPECT_TRUE(health.lock_file);

    project.root_entries = {"README.md"};
    project.pyproject_declares_linter = true;
    health = scoring::assess_environment(project);
    EXPECT_FALSE(health.agents_md);
    EXPECT_TRUE(health.linter_config);
    EXPECT_FALSE(health.lock_file);
}

TEST(ScoringEngineTest, ReportsDirectoryEntropy) {
    ScoringInput input = with_context();
    input.files = {make_file("a.py", 10)};
    input.directories = {{".", 20}, {"pkg", 12}};

    ScoringEngine engine{Thresholds{}};
    auto report = engine.score(input);
    EXPECT_DOUBLE_EQ(report.environment.average_files_per_directory, 16.0);
    EXPECT_EQ(report.environment.max_files_per_directory, 20u);
    EXPECT_TRUE(report.environment.entropy_warning);
    EXPECT_DOUBLE_EQ(report.overall_score, 100.0);

    // A single crowded directory warns even when the average is low
    input.directories = {{"big", 51}};
    for (int i = 0; i < 9; ++i) {
        input.directories.push_back({"dir" + std::to_string(i), 1});
    }
    report = engine.score(input);
    EXPECT_DOUBLE_EQ(report.environment.average_files_per_directory, 6.0);
    EXPECT_EQ(report.environment.max_files_per_directory, 51u);
    EXPECT_TRUE(report.environment.entropy_warning);

    input.directories = {{".", 3}, {"pkg", 4}};
    report = engine.score(input);
    EXPECT_FALSE(report.environment.entropy_warning);
}

TEST(ScoringEngineTest, ReportsCriticalContextTokens) {
    ScoringInput input = with_context();
    input.project.context_document_characters = 100000;
    auto file = make_file("a.py", 10);
    file.signature_characters = 28000;
    file.tokens = 1234;
    input.files = {file};

    ScoringEngine engine{Thresholds{}};
    auto report = engine.score(input);
    EXPECT_EQ(report.environment.critical_context_tokens, 32000u);
    EXPECT_FALSE(report.environment.token_alert);
    ASSERT_EQ(report.file_scores.size(), 1u);
    EXPECT_EQ(report.file_scores[0].tokens, 1234u);

    input.files[0].signature_characters += 4;
    report = engine.score(input);
    EXPECT_EQ(report.environment.critical_context_tokens, 32001u);
    EXPECT_TRUE(report.environment.token_alert);
    EXPECT_DOUBLE_EQ(report.overall_score, 100.0);
}
