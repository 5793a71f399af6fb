#pragma once

#include <codegate/diag/finding.h>
#include <codegate/lexer/token.h>
#include <cstddef>
#include <string_view>
#include <variant>
#include <vector>

/**
 * @file lexer.h
 * @brief Python tokenizer: produces tokens with layout (NEWLINE/INDENT/DEDENT) or a finding.
 */

namespace codegate::lexer
{

/** @brief Token vector on success, a finding describing the first lexical error otherwise. */
using LexResult = std::variant<std::vector<Token>, codegate::diag::Finding>;

/**
 * @brief Tokenize a whole module.
 *
 * Emits NEWLINE at the end of each logical line, INDENT/DEDENT from the
 * indentation stack, and a terminal Eof token. Inside brackets and after a
 * backslash continuation lines are joined.
 */
[[nodiscard]] LexResult lex(std::string_view input);

/**
 * @brief Tokenize a single expression that starts at `base_offset` in the enclosing text.
 *
 * Used for f-string replacement fields: no layout tokens are produced and
 * spans are shifted by `base_offset`.
 */
[[nodiscard]] LexResult lex_expression(std::string_view input, std::size_t base_offset);

} // namespace codegate::lexer
