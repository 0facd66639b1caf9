#include "parser/syntax_tree.hpp"
#include <stack>

namespace scorecard::parser {

std::vector<ImportPayload> collect_imports(const SyntaxNode& root) {
    std::vector<ImportPayload> imports;
    std::stack<const SyntaxNode*> nodes;
    nodes.push(&root);

    while (!nodes.empty()) {
        const SyntaxNode* current = nodes.top();
        nodes.pop();

        if (const auto* payload = current->import()) {
            imports.push_back(*payload);
        }

        // Push in reverse so children pop in source order
        for (auto it = current->children.rbegin(); it != current->children.rend(); ++it) {
            nodes.push(&*it);
        }
    }

    return imports;
}

} // namespace scorecard::parser
