#pragma once

#include <codegate/parser/ast.h>
#include <functional>

/**
 * @file walk.h
 * @brief Generic traversal over the direct children of AST nodes.
 */

namespace codegate::parser
{

using ExprVisitor = std::function<void(const Expr&)>;
using StmtVisitor = std::function<void(const Stmt&)>;

/** @brief Call `on_expr` for every direct child expression of `expr`, in source order. */
void for_each_child(const Expr& expr, const ExprVisitor& on_expr);

/**
 * @brief Call `on_expr`/`on_stmt` for the direct children of `stmt`, in source order.
 *
 * Nested blocks (bodies of if/while/for/try/with/def/class) are reported
 * through `on_stmt`; conditions, targets, decorators, default values and
 * annotations through `on_expr`.
 */
void for_each_child(const Stmt& stmt, const ExprVisitor& on_expr, const StmtVisitor& on_stmt);

/** @brief Visit every expression reachable from `stmt`, recursively, including nested statements. */
void walk_exprs(const Stmt& stmt, const ExprVisitor& on_expr);

/** @brief Visit `stmt` and every statement nested in it, pre-order. */
void walk_stmts(const Stmt& stmt, const StmtVisitor& on_stmt);

} // namespace codegate::parser
