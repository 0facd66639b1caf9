#include "metrics/context_tokens.hpp"
#include <algorithm>
#include <stack>
#include <vector>

namespace scorecard::metrics {

namespace {

std::vector<std::string_view> split_physical_lines(std::string_view source) {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start < source.size()) {
        std::size_t end = source.find('\n', start);
        if (end == std::string_view::npos) {
            end = source.size();
        }
        lines.push_back(source.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

std::string_view trim_right(std::string_view text) {
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r')) {
        text.remove_suffix(1);
    }
    return text;
}

// "def f(x):" or "class A(Base):  # note"
bool closes_header(std::string_view line) {
    std::string_view code = trim_right(line);
    if (!code.empty() && code.back() == ':') {
        return true;
    }
    auto comment = line.find('#');
    if (comment == std::string_view::npos) {
        return false;
    }
    code = trim_right(line.substr(0, comment));
    return !code.empty() && code.back() == ':';
}

} // namespace

std::string extract_signatures(std::string_view source, const parser::SyntaxNode& root) {
    std::vector<const parser::SyntaxNode*> definitions;
    std::stack<const parser::SyntaxNode*> nodes;
    nodes.push(&root);
    while (!nodes.empty()) {
        const parser::SyntaxNode* current = nodes.top();
        nodes.pop();
        if (current->kind == parser::NodeKind::FunctionDef || current->kind == parser::NodeKind::ClassDef) {
            definitions.push_back(current);
        }
        for (const auto& child : current->children) {
            nodes.push(&child);
        }
    }
    std::sort(definitions.begin(), definitions.end(),
              [](const parser::SyntaxNode* lhs, const parser::SyntaxNode* rhs) {
                  return lhs->start_line < rhs->start_line;
              });

    const auto lines = split_physical_lines(source);
    std::string signatures;
    for (const auto* definition : definitions) {
        if (definition->start_line == 0 || definition->start_line > lines.size()) {
            continue;
        }
        const std::size_t last = std::min(std::max(definition->end_line, definition->start_line), lines.size());
        for (std::size_t line = definition->start_line; line <= last; ++line) {
            std::string_view text = trim_right(lines[line - 1]);
            signatures.append(text.data(), text.size());
            signatures += '\n';
            if (closes_header(text)) {
                break;
            }
        }
    }
    return signatures;
}

} // namespace scorecard::metrics
