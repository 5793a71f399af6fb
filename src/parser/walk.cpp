#include <codegate/parser/walk.h>
#include <type_traits>

namespace codegate::parser
{
namespace
{

void visit_opt(const ExprPtr& e, const ExprVisitor& on_expr)
{
    if (e != nullptr)
    {
        on_expr(*e);
    }
}

void visit_params(const Parameters& params, const ExprVisitor& on_expr)
{
    auto one = [&](const Param& p)
    {
        visit_opt(p.annotation, on_expr);
        visit_opt(p.default_value, on_expr);
    };
    for (const auto& p : params.positional)
    {
        one(p);
    }
    if (params.vararg.has_value())
    {
        one(*params.vararg);
    }
    for (const auto& p : params.kwonly)
    {
        one(p);
    }
    if (params.kwarg.has_value())
    {
        one(*params.kwarg);
    }
}

void visit_block(const std::vector<Stmt>& body, const StmtVisitor& on_stmt)
{
    for (const auto& s : body)
    {
        on_stmt(s);
    }
}

} // namespace

void for_each_child(const Expr& expr, const ExprVisitor& on_expr)
{
    std::visit(
        [&](const auto& node)
        {
            using Node = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<Node, FStringExpr>)
            {
                for (const auto& part : node.parts)
                {
                    visit_opt(part.value, on_expr);
                    visit_opt(part.format_spec, on_expr);
                }
            }
            else if constexpr (std::is_same_v<Node, UnaryExpr>)
            {
                on_expr(*node.operand);
            }
            else if constexpr (std::is_same_v<Node, BinaryExpr>)
            {
                on_expr(*node.lhs);
                on_expr(*node.rhs);
            }
            else if constexpr (std::is_same_v<Node, BoolOpExpr>)
            {
                for (const auto& v : node.values)
                {
                    on_expr(v);
                }
            }
            else if constexpr (std::is_same_v<Node, CompareExpr>)
            {
                on_expr(*node.left);
                for (const auto& c : node.comparators)
                {
                    on_expr(c);
                }
            }
            else if constexpr (std::is_same_v<Node, CallExpr>)
            {
                on_expr(*node.callee);
                for (const auto& a : node.args)
                {
                    on_expr(*a.value);
                }
            }
            else if constexpr (std::is_same_v<Node, AttributeExpr>)
            {
                on_expr(*node.value);
            }
            else if constexpr (std::is_same_v<Node, SubscriptExpr>)
            {
                on_expr(*node.value);
                on_expr(*node.index);
            }
            else if constexpr (std::is_same_v<Node, SliceExpr>)
            {
                visit_opt(node.lower, on_expr);
                visit_opt(node.upper, on_expr);
                visit_opt(node.step, on_expr);
            }
            else if constexpr (std::is_same_v<Node, ListExpr> || std::is_same_v<Node, TupleExpr> ||
                               std::is_same_v<Node, SetExpr>)
            {
                for (const auto& e : node.elts)
                {
                    on_expr(e);
                }
            }
            else if constexpr (std::is_same_v<Node, DictExpr>)
            {
                for (const auto& item : node.items)
                {
                    visit_opt(item.key, on_expr);
                    on_expr(*item.value);
                }
            }
            else if constexpr (std::is_same_v<Node, ComprehensionExpr>)
            {
                for (const auto& gen : node.generators)
                {
                    on_expr(*gen.iter);
                    on_expr(*gen.target);
                    for (const auto& cond : gen.ifs)
                    {
                        on_expr(cond);
                    }
                }
                on_expr(*node.elt);
                visit_opt(node.value, on_expr);
            }
            else if constexpr (std::is_same_v<Node, LambdaExpr>)
            {
                visit_params(*node.params, on_expr);
                on_expr(*node.body);
            }
            else if constexpr (std::is_same_v<Node, IfExpr>)
            {
                on_expr(*node.test);
                on_expr(*node.body);
                on_expr(*node.orelse);
            }
            else if constexpr (std::is_same_v<Node, StarredExpr> || std::is_same_v<Node, NamedExpr> ||
                               std::is_same_v<Node, AwaitExpr>)
            {
                on_expr(*node.value);
            }
            else if constexpr (std::is_same_v<Node, YieldExpr>)
            {
                visit_opt(node.value, on_expr);
            }
        },
        expr.node);
}

void for_each_child(const Stmt& stmt, const ExprVisitor& on_expr, const StmtVisitor& on_stmt)
{
    std::visit(
        [&](const auto& node)
        {
            using Node = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<Node, ExprStmt>)
            {
                on_expr(node.value);
            }
            else if constexpr (std::is_same_v<Node, AssignStmt>)
            {
                on_expr(node.value);
                for (const auto& t : node.targets)
                {
                    on_expr(t);
                }
            }
            else if constexpr (std::is_same_v<Node, AugAssignStmt>)
            {
                on_expr(node.target);
                on_expr(node.value);
            }
            else if constexpr (std::is_same_v<Node, AnnAssignStmt>)
            {
                on_expr(node.annotation);
                if (node.value.has_value())
                {
                    on_expr(*node.value);
                }
                on_expr(node.target);
            }
            else if constexpr (std::is_same_v<Node, ReturnStmt>)
            {
                if (node.value.has_value())
                {
                    on_expr(*node.value);
                }
            }
            else if constexpr (std::is_same_v<Node, RaiseStmt>)
            {
                if (node.exc.has_value())
                {
                    on_expr(*node.exc);
                }
                if (node.cause.has_value())
                {
                    on_expr(*node.cause);
                }
            }
            else if constexpr (std::is_same_v<Node, DelStmt>)
            {
                for (const auto& t : node.targets)
                {
                    on_expr(t);
                }
            }
            else if constexpr (std::is_same_v<Node, AssertStmt>)
            {
                on_expr(node.test);
                if (node.msg.has_value())
                {
                    on_expr(*node.msg);
                }
            }
            else if constexpr (std::is_same_v<Node, IfStmt> || std::is_same_v<Node, WhileStmt>)
            {
                on_expr(node.test);
                visit_block(node.body, on_stmt);
                visit_block(node.orelse, on_stmt);
            }
            else if constexpr (std::is_same_v<Node, ForStmt>)
            {
                on_expr(node.iter);
                on_expr(node.target);
                visit_block(node.body, on_stmt);
                visit_block(node.orelse, on_stmt);
            }
            else if constexpr (std::is_same_v<Node, TryStmt>)
            {
                visit_block(node.body, on_stmt);
                for (const auto& h : node.handlers)
                {
                    if (h.type.has_value())
                    {
                        on_expr(*h.type);
                    }
                    visit_block(h.body, on_stmt);
                }
                visit_block(node.orelse, on_stmt);
                visit_block(node.finalbody, on_stmt);
            }
            else if constexpr (std::is_same_v<Node, WithStmt>)
            {
                for (const auto& item : node.items)
                {
                    on_expr(item.context);
                    if (item.target.has_value())
                    {
                        on_expr(*item.target);
                    }
                }
                visit_block(node.body, on_stmt);
            }
            else if constexpr (std::is_same_v<Node, FunctionDef>)
            {
                for (const auto& d : node.decorators)
                {
                    on_expr(d);
                }
                visit_params(*node.params, on_expr);
                if (node.returns.has_value())
                {
                    on_expr(*node.returns);
                }
                visit_block(*node.body, on_stmt);
            }
            else if constexpr (std::is_same_v<Node, ClassDef>)
            {
                for (const auto& d : node.decorators)
                {
                    on_expr(d);
                }
                for (const auto& b : node.bases)
                {
                    on_expr(*b.value);
                }
                visit_block(node.body, on_stmt);
            }
        },
        stmt.node);
}

void walk_exprs(const Stmt& stmt, const ExprVisitor& on_expr)
{
    ExprVisitor deep = [&](const Expr& e)
    {
        on_expr(e);
        for_each_child(e, deep);
    };
    StmtVisitor nested = [&](const Stmt& s) { for_each_child(s, deep, nested); };
    nested(stmt);
}

void walk_stmts(const Stmt& stmt, const StmtVisitor& on_stmt)
{
    StmtVisitor nested = [&](const Stmt& s)
    {
        on_stmt(s);
        for_each_child(
            s, [](const Expr&) {}, nested);
    };
    nested(stmt);
}

} // namespace codegate::parser
