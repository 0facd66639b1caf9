#ifndef SCORECARD_PARSER_PYTHON_PARSER_HPP
#define SCORECARD_PARSER_PYTHON_PARSER_HPP

#pragma once

#include "parser/parser_base.hpp"
#include <optional>
#include <string>
#include <vector>
#include <memory>

extern "C" {
    const TSLanguage* tree_sitter_python();
}

namespace scorecard::parser::languages {

class PythonParser : public ParserBase {
public:
    PythonParser() = default;
    
    PythonParser(const PythonParser&) = delete;
    PythonParser& operator=(const PythonParser&) = delete;
    PythonParser(PythonParser&&) = default;
    PythonParser& operator=(PythonParser&&) = default;

    ~PythonParser() override = default;

    std::unique_ptr<ParserBase> clone() const override;
    bool initialize() override;
    SyntaxTree parse(const ParserContext& context) override;
    std::vector<std::string> get_extensions() const override;
    std::string get_language_name() const override;

private:
    void convert_node(TSNode node, const std::string& source, std::vector<SyntaxNode>& out);
    void convert_children(TSNode node, const std::string& source, std::vector<SyntaxNode>& out);
    SyntaxNode convert_statement(TSNode node, const std::string& source);
    std::optional<SyntaxNode> convert_structural(TSNode node, const std::string& source);

    SyntaxNode convert_function(TSNode node, const std::string& source, std::vector<SyntaxNode> decorators);
    SyntaxNode convert_class(TSNode node, const std::string& source, std::vector<SyntaxNode> decorators);
    SyntaxNode convert_decorated(TSNode node, const std::string& source);
    SyntaxNode convert_import(TSNode node, const std::string& source);

    void collect_parameters(TSNode parameter_list, const std::string& source, std::vector<Parameter>& parameters);
    std::string decorator_name(TSNode decorator, const std::string& source);
    static bool is_string_statement(TSNode node);

    std::string current_file_;
};

} // namespace scorecard::parser::languages

#endif // SCORECARD_PARSER_PYTHON_PARSER_HPP
