#include "python_parser.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <unordered_map>
#include <spdlog/spdlog.h>

namespace scorecard::parser::languages {

namespace {

const std::unordered_map<std::string, NodeKind>& structural_kinds() {
    static const std::unordered_map<std::string, NodeKind> kinds = {
        {"if_statement", NodeKind::If},
        {"elif_clause", NodeKind::Elif},
        {"else_clause", NodeKind::Else},
        {"for_statement", NodeKind::For},
        {"while_statement", NodeKind::While},
        {"try_statement", NodeKind::Try},
        {"except_clause", NodeKind::Except},
        {"except_group_clause", NodeKind::Except},
        {"finally_clause", NodeKind::Finally},
        {"with_statement", NodeKind::With},
        {"boolean_operator", NodeKind::BooleanOp},
        {"conditional_expression", NodeKind::Conditional},
        {"list_comprehension", NodeKind::Comprehension},
        {"set_comprehension", NodeKind::Comprehension},
        {"dictionary_comprehension", NodeKind::Comprehension},
        {"generator_expression", NodeKind::Comprehension},
        {"if_clause", NodeKind::ComprehensionFilter},
        {"lambda", NodeKind::Lambda}
    };
    return kinds;
}

bool is_type(TSNode node, const char* type) {
    return strcmp(ts_node_type(node), type) == 0;
}

std::string strip_whitespace(std::string text) {
    text.erase(std::remove_if(text.begin(), text.end(),
                              [](unsigned char c) { return std::isspace(c); }),
               text.end());
    return text;
}

} // namespace

std::unique_ptr<ParserBase> PythonParser::clone() const {
    return std::make_unique<PythonParser>();
}

bool PythonParser::initialize() {
    if (!parser_) {
        spdlog::error("Parser not initialized");
        return false;
    }
    
    spdlog::debug("Setting up Python parser with tree-sitter");
    return ts_parser_set_language(parser_.get(), tree_sitter_python());
}

SyntaxTree PythonParser::parse(const ParserContext& context) {
    auto tree = parse_tree(context);
    TSNode root = ts_tree_root_node(tree.get());

    current_file_ = context.file_path;

    SyntaxTree result;
    result.file_path = context.file_path;
    result.root.kind = NodeKind::Module;
    result.root.start_line = 1;
    result.root.end_line = end_line(root);

    uint32_t child_count = ts_node_named_child_count(root);
    for (uint32_t i = 0; i < child_count; i++) {
        TSNode child = ts_node_named_child(root, i);
        if (is_type(child, "comment")) {
            continue;
        }
        result.root.children.push_back(convert_statement(child, context.file_content));
    }

    spdlog::debug("Converted {} top-level statements in {}",
                  result.root.children.size(), context.file_path);
    return result;
}

std::vector<std::string> PythonParser::get_extensions() const {
    return {"py"};
}

std::string PythonParser::get_language_name() const {
    return "python";
}

void PythonParser::convert_node(TSNode node, const std::string& source, std::vector<SyntaxNode>& out) {
    if (is_type(node, "comment")) {
        return;
    }

    if (is_type(node, "block")) {
        uint32_t child_count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < child_count; i++) {
            TSNode child = ts_node_named_child(node, i);
            if (!is_type(child, "comment")) {
                out.push_back(convert_statement(child, source));
            }
        }
        return;
    }

    if (auto converted = convert_structural(node, source)) {
        out.push_back(std::move(*converted));
        return;
    }

    // Not interesting by itself; splice whatever its subtree contains
    convert_children(node, source, out);
}

void PythonParser::convert_children(TSNode node, const std::string& source, std::vector<SyntaxNode>& out) {
    uint32_t child_count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < child_count; i++) {
        convert_node(ts_node_named_child(node, i), source, out);
    }
}

SyntaxNode PythonParser::convert_statement(TSNode node, const std::string& source) {
    if (auto converted = convert_structural(node, source)) {
        return std::move(*converted);
    }

    SyntaxNode statement;
    statement.start_line = start_line(node);
    statement.end_line = end_line(node);

    if (is_string_statement(node)) {
        statement.kind = NodeKind::StringStatement;
        return statement;
    }

    statement.kind = NodeKind::Statement;
    convert_children(node, source, statement.children);
    return statement;
}

std::optional<SyntaxNode> PythonParser::convert_structural(TSNode node, const std::string& source) {
    const char* type = ts_node_type(node);

    if (strcmp(type, "function_definition") == 0) {
        return convert_function(node, source, {});
    }
    if (strcmp(type, "class_definition") == 0) {
        return convert_class(node, source, {});
    }
    if (strcmp(type, "decorated_definition") == 0) {
        return convert_decorated(node, source);
    }
    if (strcmp(type, "import_statement") == 0 || strcmp(type, "import_from_statement") == 0) {
        return convert_import(node, source);
    }

    const auto& kinds = structural_kinds();
    auto it = kinds.find(type);
    if (it == kinds.end()) {
        return std::nullopt;
    }

    SyntaxNode converted;
    converted.kind = it->second;
    converted.start_line = start_line(node);
    converted.end_line = end_line(node);
    convert_children(node, source, converted.children);
    return converted;
}

SyntaxNode PythonParser::convert_function(TSNode node, const std::string& source,
                                          std::vector<SyntaxNode> decorators) {
    SyntaxNode function;
    function.kind = NodeKind::FunctionDef;
    function.start_line = start_line(node);
    function.end_line = end_line(node);

    FunctionPayload payload;
    payload.name = extract_node_text(child_by_field(node, "name"), source);

    // "async def" keeps the keyword as an anonymous leading child
    uint32_t child_count = ts_node_child_count(node);
    for (uint32_t i = 0; i < child_count; i++) {
        TSNode child = ts_node_child(node, i);
        if (!ts_node_is_named(child) && is_type(child, "async")) {
            payload.is_async = true;
            break;
        }
    }

    TSNode parameters = child_by_field(node, "parameters");
    if (!ts_node_is_null(parameters)) {
        collect_parameters(parameters, source, payload.parameters);
    }
    payload.has_return_annotation = !ts_node_is_null(child_by_field(node, "return_type"));

    spdlog::debug("Found Python function {} (lines {}-{}, {} parameters{})",
                  payload.name, function.start_line, function.end_line,
                  payload.parameters.size(), payload.is_async ? ", async" : "");

    function.children = std::move(decorators);
    TSNode body = child_by_field(node, "body");
    if (!ts_node_is_null(body)) {
        convert_node(body, source, function.children);
    }

    function.payload = std::move(payload);
    return function;
}

SyntaxNode PythonParser::convert_class(TSNode node, const std::string& source,
                                       std::vector<SyntaxNode> decorators) {
    SyntaxNode klass;
    klass.kind = NodeKind::ClassDef;
    klass.start_line = start_line(node);
    klass.end_line = end_line(node);
    klass.payload = ClassPayload{extract_node_text(child_by_field(node, "name"), source)};

    klass.children = std::move(decorators);
    TSNode body = child_by_field(node, "body");
    if (!ts_node_is_null(body)) {
        convert_node(body, source, klass.children);
    }
    return klass;
}

SyntaxNode PythonParser::convert_decorated(TSNode node, const std::string& source) {
    std::vector<SyntaxNode> decorators;

    uint32_t child_count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < child_count; i++) {
        TSNode child = ts_node_named_child(node, i);
        if (!is_type(child, "decorator")) {
            continue;
        }

        SyntaxNode decorator;
        decorator.kind = NodeKind::Decorator;
        decorator.start_line = start_line(child);
        decorator.end_line = end_line(child);
        decorator.payload = DecoratorPayload{decorator_name(child, source)};
        decorators.push_back(std::move(decorator));
    }

    TSNode definition = child_by_field(node, "definition");
    if (ts_node_is_null(definition)) {
        throw ParseError(current_file_, "decorated definition without a definition", start_line(node));
    }

    if (is_type(definition, "class_definition")) {
        return convert_class(definition, source, std::move(decorators));
    }
    return convert_function(definition, source, std::move(decorators));
}

SyntaxNode PythonParser::convert_import(TSNode node, const std::string& source) {
    SyntaxNode import;
    import.kind = NodeKind::Import;
    import.start_line = start_line(node);
    import.end_line = end_line(node);

    ImportPayload payload;
    payload.from_import = is_type(node, "import_from_statement");

    TSNode module_name = payload.from_import ? child_by_field(node, "module_name") : TSNode{};
    if (!ts_node_is_null(module_name)) {
        if (is_type(module_name, "relative_import")) {
            uint32_t count = ts_node_named_child_count(module_name);
            for (uint32_t i = 0; i < count; i++) {
                TSNode part = ts_node_named_child(module_name, i);
                if (is_type(part, "import_prefix")) {
                    std::string dots = extract_node_text(part, source);
                    payload.level = static_cast<std::size_t>(std::count(dots.begin(), dots.end(), '.'));
                } else if (is_type(part, "dotted_name")) {
                    payload.module = strip_whitespace(extract_node_text(part, source));
                }
            }
        } else {
            payload.module = strip_whitespace(extract_node_text(module_name, source));
        }
    }

    uint32_t child_count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < child_count; i++) {
        TSNode child = ts_node_named_child(node, i);
        if (!ts_node_is_null(module_name) && ts_node_eq(child, module_name)) {
            continue;
        }

        if (is_type(child, "dotted_name")) {
            payload.names.push_back(strip_whitespace(extract_node_text(child, source)));
        } else if (is_type(child, "aliased_import")) {
            payload.names.push_back(strip_whitespace(extract_node_text(child_by_field(child, "name"), source)));
        } else if (is_type(child, "wildcard_import")) {
            payload.names.emplace_back("*");
        }
    }

    spdlog::debug("Import at line {}: level {} module '{}' ({} names)",
                  import.start_line, payload.level, payload.module, payload.names.size());

    import.payload = std::move(payload);
    return import;
}

void PythonParser::collect_parameters(TSNode parameter_list, const std::string& source,
                                      std::vector<Parameter>& parameters) {
    auto splat_style = [](TSNode node) {
        if (is_type(node, "list_splat_pattern")) {
            return ParameterStyle::VarPositional;
        }
        if (is_type(node, "dictionary_splat_pattern")) {
            return ParameterStyle::VarKeyword;
        }
        return ParameterStyle::Regular;
    };
    auto splat_name = [&source](TSNode node) {
        if (ts_node_named_child_count(node) == 0) {
            return std::string();
        }
        return extract_node_text(ts_node_named_child(node, 0), source);
    };

    uint32_t child_count = ts_node_named_child_count(parameter_list);
    spdlog::debug("Found {} parameter nodes", child_count);

    for (uint32_t i = 0; i < child_count; i++) {
        TSNode param = ts_node_named_child(parameter_list, i);
        const char* param_type = ts_node_type(param);

        if (strcmp(param_type, "identifier") == 0) {
            parameters.push_back({extract_node_text(param, source), false, ParameterStyle::Regular});
        }
        else if (strcmp(param_type, "list_splat_pattern") == 0 ||
                 strcmp(param_type, "dictionary_splat_pattern") == 0) {
            std::string name = splat_name(param);
            // A bare "*" only separates keyword-only parameters
            if (!name.empty()) {
                parameters.push_back({name, false, splat_style(param)});
            }
        }
        else if (strcmp(param_type, "typed_parameter") == 0) {
            if (ts_node_named_child_count(param) == 0) {
                continue;
            }
            TSNode target = ts_node_named_child(param, 0);
            ParameterStyle style = splat_style(target);
            std::string name = style == ParameterStyle::Regular
                ? extract_node_text(target, source)
                : splat_name(target);
            parameters.push_back({name, true, style});
        }
        else if (strcmp(param_type, "default_parameter") == 0 ||
                 strcmp(param_type, "typed_default_parameter") == 0) {
            parameters.push_back({
                extract_node_text(child_by_field(param, "name"), source),
                !ts_node_is_null(child_by_field(param, "type")),
                ParameterStyle::Regular
            });
        }
    }
}

std::string PythonParser::decorator_name(TSNode decorator, const std::string& source) {
    if (ts_node_named_child_count(decorator) == 0) {
        return "";
    }

    TSNode expression = ts_node_named_child(decorator, 0);
    if (is_type(expression, "call")) {
        expression = child_by_field(expression, "function");
    }
    return strip_whitespace(extract_node_text(expression, source));
}

bool PythonParser::is_string_statement(TSNode node) {
    if (!is_type(node, "expression_statement") || ts_node_named_child_count(node) != 1) {
        return false;
    }

    TSNode expression = ts_node_named_child(node, 0);
    return is_type(expression, "string") || is_type(expression, "concatenated_string");
}

} // namespace scorecard::parser::languages
