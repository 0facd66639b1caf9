#ifndef SCORECARD_PARSER_BASE_HPP
#define SCORECARD_PARSER_BASE_HPP

#pragma once

#include "parser/syntax_tree.hpp"
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <tree_sitter/api.h>

namespace scorecard::parser {

// Raised when a source file cannot be turned into a usable syntax tree
class ParseError : public std::runtime_error {
public:
    ParseError(const std::string& file_path, const std::string& message, std::size_t line = 0)
        : std::runtime_error(file_path + (line ? ":" + std::to_string(line) : std::string()) + ": " + message),
          file_path_(file_path),
          line_(line) {}

    const std::string& file_path() const noexcept { return file_path_; }
    std::size_t line() const noexcept { return line_; }

private:
    std::string file_path_;
    std::size_t line_;
};

struct ParserContext {
    std::string file_content;
    std::string file_path;
};

class ParserBase {
public:
    // Non-copyable but movable
    ParserBase() : parser_(ts_parser_new(), ts_parser_delete) {}
    ParserBase(const ParserBase&) = delete;
    ParserBase& operator=(const ParserBase&) = delete;
    ParserBase(ParserBase&&) = default;
    ParserBase& operator=(ParserBase&&) = default;
    virtual ~ParserBase() = default;

    // Create a fresh parser of the same language; tree-sitter parsers are not shared between threads
    virtual std::unique_ptr<ParserBase> clone() const = 0;

    virtual bool initialize() = 0;
    virtual SyntaxTree parse(const ParserContext &context) = 0;
    virtual std::vector<std::string> get_extensions() const = 0;
    virtual std::string get_language_name() const = 0;

protected:
    using TreePtr = std::unique_ptr<TSTree, void(*)(TSTree*)>;

    // Parses the whole buffer, throwing ParseError when tree-sitter gives up or reports errors
    TreePtr parse_tree(const ParserContext &context);

    // Helper functions for tree-sitter operations
    static std::string extract_node_text(const TSNode &node, const std::string &source_code);
    static TSNode child_by_field(const TSNode &node, const char *field);
    static std::size_t start_line(const TSNode &node);
    static std::size_t end_line(const TSNode &node);
    static std::size_t first_error_line(const TSNode &node);

    std::unique_ptr<TSParser, void(*)(TSParser*)> parser_;
};

} // namespace scorecard::parser

#endif // SCORECARD_PARSER_BASE_HPP
