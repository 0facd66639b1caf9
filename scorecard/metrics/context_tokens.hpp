#ifndef SCORECARD_METRICS_CONTEXT_TOKENS_HPP
#define SCORECARD_METRICS_CONTEXT_TOKENS_HPP

#pragma once

#include "parser/syntax_tree.hpp"
#include <cstddef>
#include <string>
#include <string_view>

namespace scorecard::metrics {

// Rough tokenizer-free estimate: one token per four characters
constexpr std::size_t kCharactersPerToken = 4;

inline std::size_t estimate_tokens(std::size_t characters) {
    return characters / kCharactersPerToken;
}

/**
 * Header lines of every class and function definition in source order,
 * decorators included and bodies left out. Every line ends in a newline.
 */
std::string extract_signatures(std::string_view source, const parser::SyntaxNode& root);

} // namespace scorecard::metrics

#endif // SCORECARD_METRICS_CONTEXT_TOKENS_HPP
