#pragma once

#include <codegate/diag/finding.h>
#include <codegate/lexer/token.h>
#include <codegate/parser/ast.h>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

/**
 * @file parser.h
 * @brief Public parser API returning a Module or the syntax errors found.
 */

namespace codegate::parser
{

/** @brief Result of parsing: a Module, or findings describing the syntax error. */
using ParseResult = std::variant<Module, std::vector<codegate::diag::Finding>>;

/** @brief Parse a token sequence produced by lexer::lex into a Module. */
[[nodiscard]] ParseResult parse(std::span<const codegate::lexer::Token> tokens);

/** @brief Lex and parse `text`. The AST refers into `text`, which must outlive it. */
[[nodiscard]] ParseResult parse_source(std::string_view text);

/** @brief Dump a Module as an s-expression tree (for debugging/tests). */
[[nodiscard]] std::string dump(const Module& module);
/** @brief Dump a single expression as an s-expression. */
[[nodiscard]] std::string dump(const Expr& expr);

} // namespace codegate::parser
