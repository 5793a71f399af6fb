#pragma once

#include <codegate/parser/ast.h>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <z3++.h>

/**
 * @file condition_lowering.h
 * @brief Lower Python conditions over numbers and booleans into Z3 expressions.
 *
 * Supported: bool and numeric literals, names, `not`/`and`/`or`, unary minus,
 * `+ - *` (linear), `/` by a literal, `//` and `%` on ints by a positive
 * literal, comparison chains and conditional expressions. Anything else
 * (calls, attributes, subscripts, strings, `in`, `is`) makes the condition
 * unsupported and it is skipped.
 *
 * Names without a declared sort are modelled as reals when used as numbers
 * and as booleans otherwise. Reals over-approximate ints, so a condition
 * proved unsatisfiable over reals is unsatisfiable for ints too.
 */

namespace codegate::analysis
{

enum class Sort
{
    Bool,
    Int,
    Real,
};

/** @brief Names and their sorts, shared by the conditions of one scope. */
struct LoweringContext
{
    explicit LoweringContext(z3::context& context) : ctx(context) {}

    z3::context& ctx;
    /** Sorts known from annotations and `for i in range(...)` loops. */
    std::map<std::string_view, Sort, std::less<>> declared;
    /** Constants created so far. */
    std::map<std::string, z3::expr, std::less<>> vars;
};

/** @brief Boolean Z3 formula, or the reason the condition is unsupported. */
using LoweringResult = std::variant<z3::expr, std::string>;

/** @brief Lower `expr` as a condition (Python truthiness of its value). */
[[nodiscard]] LoweringResult lower_condition(const codegate::parser::Expr& expr,
                                             LoweringContext& ctx);

/** @brief Sort named by an annotation (`int`, `float`, `bool`), if any. */
[[nodiscard]] std::optional<Sort> sort_of_annotation(const codegate::parser::Expr& annotation);

} // namespace codegate::analysis
