#ifndef SCORECARD_METRICS_METRIC_EXTRACTOR_HPP
#define SCORECARD_METRICS_METRIC_EXTRACTOR_HPP

#pragma once

#include "metrics/function_record.hpp"
#include "metrics/logical_lines.hpp"
#include "parser/syntax_tree.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace scorecard::metrics {

struct ExtractionContext {
    std::string file_path;
    // Dotted module name used as the prefix of qualified function names
    std::string module_name;
};

class MetricExtractor {
public:
    FileSummary extract(const parser::SyntaxTree& tree,
                        const LogicalLineIndex& lines,
                        const ExtractionContext& context) const;

    // Complexity contributed by a single node of the given kind
    static std::size_t decision_weight(parser::NodeKind kind);

    // 1 + decision points in the function's own body; nested functions are excluded
    static std::size_t cyclomatic_complexity(const parser::SyntaxNode& function);

    static double annotation_coverage(const parser::FunctionPayload& function, bool skip_receiver);
    static bool has_docstring(const parser::SyntaxNode& function);
    static bool is_static_method(const parser::SyntaxNode& function);

private:
    void visit(const parser::SyntaxNode& node,
               std::vector<std::string>& scope,
               bool in_class_body,
               const LogicalLineIndex& lines,
               const ExtractionContext& context,
               std::vector<FunctionRecord>& records) const;

    FunctionRecord make_record(const parser::SyntaxNode& function,
                               const std::vector<std::string>& scope,
                               bool in_class_body,
                               const LogicalLineIndex& lines,
                               const ExtractionContext& context) const;
};

} // namespace scorecard::metrics

#endif // SCORECARD_METRICS_METRIC_EXTRACTOR_HPP
