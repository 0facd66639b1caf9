#include "metric_extractor.hpp"
#include <stack>
#include <spdlog/spdlog.h>

namespace scorecard::metrics {

using parser::NodeKind;
using parser::SyntaxNode;

double aggregate_type_coverage(const std::vector<FunctionRecord>& functions) {
    if (functions.empty()) {
        return 1.0;
    }

    std::size_t typed = 0;
    for (const auto& function : functions) {
        if (function.is_typed()) {
            ++typed;
        }
    }
    return static_cast<double>(typed) / static_cast<double>(functions.size());
}

FileSummary MetricExtractor::extract(const parser::SyntaxTree& tree,
                                     const LogicalLineIndex& lines,
                                     const ExtractionContext& context) const {
    FileSummary summary;
    summary.file_path = context.file_path;
    summary.module_name = context.module_name;
    summary.logical_lines = lines.total();

    std::vector<std::string> scope;
    visit(tree.root, scope, false, lines, context, summary.functions);

    summary.type_coverage = aggregate_type_coverage(summary.functions);

    spdlog::debug("{}: {} logical lines, {} functions, type coverage {:.2f}",
                  context.file_path, summary.logical_lines,
                  summary.functions.size(), summary.type_coverage);
    return summary;
}

std::size_t MetricExtractor::decision_weight(NodeKind kind) {
    switch (kind) {
        case NodeKind::If:
        case NodeKind::Elif:
        case NodeKind::For:
        case NodeKind::While:
        case NodeKind::Except:
        case NodeKind::BooleanOp:
        case NodeKind::Conditional:
        case NodeKind::ComprehensionFilter:
            return 1;
        default:
            return 0;
    }
}

std::size_t MetricExtractor::cyclomatic_complexity(const SyntaxNode& function) {
    std::size_t complexity = 1;

    std::stack<const SyntaxNode*> nodes;
    for (const auto& child : function.children) {
        nodes.push(&child);
    }

    while (!nodes.empty()) {
        const SyntaxNode* current = nodes.top();
        nodes.pop();

        // Nested definitions are scored on their own
        if (current->kind == NodeKind::FunctionDef || current->kind == NodeKind::Decorator) {
            continue;
        }

        complexity += decision_weight(current->kind);
        for (const auto& child : current->children) {
            nodes.push(&child);
        }
    }

    return complexity;
}

double MetricExtractor::annotation_coverage(const parser::FunctionPayload& function, bool skip_receiver) {
    std::size_t slots = 1;
    std::size_t annotated = function.has_return_annotation ? 1 : 0;

    for (std::size_t i = 0; i < function.parameters.size(); ++i) {
        const auto& parameter = function.parameters[i];
        if (i == 0 && skip_receiver && parameter.style == parser::ParameterStyle::Regular) {
            continue;
        }
        ++slots;
        if (parameter.annotated) {
            ++annotated;
        }
    }

    return static_cast<double>(annotated) / static_cast<double>(slots);
}

bool MetricExtractor::has_docstring(const SyntaxNode& function) {
    for (const auto& child : function.children) {
        if (child.kind == NodeKind::Decorator) {
            continue;
        }
        return child.kind == NodeKind::StringStatement;
    }
    return false;
}

bool MetricExtractor::is_static_method(const SyntaxNode& function) {
    for (const auto& child : function.children) {
        const auto* decorator = child.decorator();
        if (!decorator) {
            continue;
        }

        const std::string& name = decorator->name;
        const std::string suffix = ".staticmethod";
        if (name == "staticmethod" ||
            (name.size() > suffix.size() &&
             name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0)) {
            return true;
        }
    }
    return false;
}

void MetricExtractor::visit(const SyntaxNode& node,
                            std::vector<std::string>& scope,
                            bool in_class_body,
                            const LogicalLineIndex& lines,
                            const ExtractionContext& context,
                            std::vector<FunctionRecord>& records) const {
    for (const auto& child : node.children) {
        if (const auto* function = child.function()) {
            records.push_back(make_record(child, scope, in_class_body, lines, context));

            scope.push_back(function->name);
            visit(child, scope, false, lines, context, records);
            scope.pop_back();
        }
        else if (const auto* klass = child.class_def()) {
            scope.push_back(klass->name);
            visit(child, scope, true, lines, context, records);
            scope.pop_back();
        }
        else {
            visit(child, scope, in_class_body, lines, context, records);
        }
    }
}

FunctionRecord MetricExtractor::make_record(const SyntaxNode& function,
                                            const std::vector<std::string>& scope,
                                            bool in_class_body,
                                            const LogicalLineIndex& lines,
                                            const ExtractionContext& context) const {
    const auto& payload = *function.function();

    FunctionRecord record;
    record.qualified_name = context.module_name;
    for (const auto& part : scope) {
        record.qualified_name += (record.qualified_name.empty() ? "" : ".") + part;
    }
    record.qualified_name += (record.qualified_name.empty() ? "" : ".") + payload.name;

    record.file_path = context.file_path;
    record.start_line = function.start_line;
    record.end_line = function.end_line;
    record.complexity = cyclomatic_complexity(function);
    record.logical_lines = lines.count(function.start_line, function.end_line);
    record.is_method = in_class_body;
    record.type_coverage = annotation_coverage(payload, in_class_body && !is_static_method(function));
    record.has_docstring = has_docstring(function);
    record.is_async = payload.is_async;

    spdlog::debug("Function {} (lines {}-{}): complexity {}, {} logical lines, ACL {:.2f}",
                  record.qualified_name, record.start_line, record.end_line,
                  record.complexity, record.logical_lines, record.acl());
    return record;
}

} // namespace scorecard::metrics
