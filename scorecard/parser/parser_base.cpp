#include "parser/parser_base.hpp"
#include <cstdint>
#include <cstring>
#include <limits>
#include <stack>
#include <spdlog/spdlog.h>

namespace scorecard::parser {

ParserBase::TreePtr ParserBase::parse_tree(const ParserContext &context) {
    if (!parser_) {
        throw ParseError(context.file_path, "parser not initialized");
    }

    if (context.file_content.length() > std::numeric_limits<uint32_t>::max()) {
        throw ParseError(context.file_path, "file too large for tree-sitter");
    }

    TreePtr tree(
        ts_parser_parse_string(
            parser_.get(),
            nullptr,
            context.file_content.c_str(),
            static_cast<uint32_t>(context.file_content.length())),
        ts_tree_delete);

    if (!tree) {
        throw ParseError(context.file_path, "tree-sitter returned no tree");
    }

    TSNode root = ts_tree_root_node(tree.get());
    if (ts_node_has_error(root)) {
        std::size_t line = first_error_line(root);
        throw ParseError(context.file_path, "syntax error", line);
    }

    spdlog::debug("Parsed {} (root: {}, {} children)",
                  context.file_path, ts_node_type(root), ts_node_child_count(root));
    return tree;
}

std::string ParserBase::extract_node_text(const TSNode &node, const std::string &source_code) {
    if (ts_node_is_null(node)) {
        return "";
    }

    uint32_t start_byte = ts_node_start_byte(node);
    uint32_t end_byte = ts_node_end_byte(node);
    
    if (start_byte > end_byte || end_byte > source_code.length()) {
        return "";
    }
    
    return source_code.substr(start_byte, end_byte - start_byte);
}

TSNode ParserBase::child_by_field(const TSNode &node, const char *field) {
    return ts_node_child_by_field_name(node, field, static_cast<uint32_t>(strlen(field)));
}

std::size_t ParserBase::start_line(const TSNode &node) {
    return static_cast<std::size_t>(ts_node_start_point(node).row) + 1;
}

std::size_t ParserBase::end_line(const TSNode &node) {
    TSPoint end = ts_node_end_point(node);
    // A node that swallowed its trailing newline ends on the previous line
    if (end.column == 0 && end.row > ts_node_start_point(node).row) {
        return static_cast<std::size_t>(end.row);
    }
    return static_cast<std::size_t>(end.row) + 1;
}

std::size_t ParserBase::first_error_line(const TSNode &node) {
    std::stack<TSNode> nodes;
    nodes.push(node);

    while (!nodes.empty()) {
        TSNode current = nodes.top();
        nodes.pop();

        if (strcmp(ts_node_type(current), "ERROR") == 0 || ts_node_is_missing(current)) {
            return start_line(current);
        }
        if (!ts_node_has_error(current)) {
            continue;
        }

        uint32_t child_count = ts_node_child_count(current);
        for (uint32_t i = child_count; i > 0; --i) {
            nodes.push(ts_node_child(current, i - 1));
        }
    }

    return start_line(node);
}

} // namespace scorecard::parser
