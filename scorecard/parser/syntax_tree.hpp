#ifndef SCORECARD_PARSER_SYNTAX_TREE_HPP
#define SCORECARD_PARSER_SYNTAX_TREE_HPP

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace scorecard::parser {

enum class NodeKind {
    Module,
    ClassDef,
    FunctionDef,
    Decorator,
    Import,
    If,
    Elif,
    Else,
    For,
    While,
    Try,
    Except,
    Finally,
    With,
    BooleanOp,
    Conditional,
    Comprehension,
    ComprehensionFilter,
    Lambda,
    StringStatement,
    Statement
};

enum class ParameterStyle {
    Regular,
    VarPositional,  // *args
    VarKeyword      // **kwargs
};

struct Parameter {
    std::string name;
    bool annotated{false};
    ParameterStyle style{ParameterStyle::Regular};
};

struct FunctionPayload {
    std::string name;
    bool is_async{false};
    std::vector<Parameter> parameters;
    bool has_return_annotation{false};
};

struct ClassPayload {
    std::string name;
};

struct DecoratorPayload {
    // Dotted callee name, e.g. "staticmethod" or "functools.lru_cache"
    std::string name;
};

struct ImportPayload {
    bool from_import{false};
    // Number of leading dots of a relative import
    std::size_t level{0};
    // Module after "from"; empty for plain imports and for "from . import x"
    std::string module;
    // Imported names; for plain imports these are the dotted module names
    std::vector<std::string> names;
};

using NodePayload = std::variant<std::monostate, FunctionPayload, ClassPayload,
                                 DecoratorPayload, ImportPayload>;

struct SyntaxNode {
    NodeKind kind{NodeKind::Statement};
    std::size_t start_line{0};
    std::size_t end_line{0};
    NodePayload payload;
    std::vector<SyntaxNode> children;

    const FunctionPayload* function() const { return std::get_if<FunctionPayload>(&payload); }
    const ClassPayload* class_def() const { return std::get_if<ClassPayload>(&payload); }
    const DecoratorPayload* decorator() const { return std::get_if<DecoratorPayload>(&payload); }
    const ImportPayload* import() const { return std::get_if<ImportPayload>(&payload); }
};

struct SyntaxTree {
    std::string file_path;
    SyntaxNode root;
};

// Collects the payload of every Import node, in source order
std::vector<ImportPayload> collect_imports(const SyntaxNode& root);

} // namespace scorecard::parser

#endif // SCORECARD_PARSER_SYNTAX_TREE_HPP
