#include <codegate/interp/objects.h>
#include <codegate/parser/walk.h>
#include <type_traits>
#include <variant>

namespace codegate::interp
{

using namespace codegate::parser;

namespace
{

void scan_expr(const Expr& expr, ScopeInfo& info)
{
    if (std::holds_alternative<LambdaExpr>(expr.node))
    {
        return;
    }
    if (const auto* named = std::get_if<NamedExpr>(&expr.node))
    {
        info.locals.emplace(named->target);
    }
    if (std::holds_alternative<YieldExpr>(expr.node))
    {
        info.is_generator = true;
    }
    for_each_child(expr, [&](const Expr& child) { scan_expr(child, info); });
}

void collect_target(const Expr& target, ScopeInfo& info)
{
    if (const auto* name = std::get_if<NameExpr>(&target.node))
    {
        info.locals.emplace(name->name);
    }
    else if (const auto* tuple = std::get_if<TupleExpr>(&target.node))
    {
        for (const auto& elt : tuple->elts)
        {
            collect_target(elt, info);
        }
    }
    else if (const auto* list = std::get_if<ListExpr>(&target.node))
    {
        for (const auto& elt : list->elts)
        {
            collect_target(elt, info);
        }
    }
    else if (const auto* starred = std::get_if<StarredExpr>(&target.node))
    {
        collect_target(*starred->value, info);
    }
}

void collect_stmt(const Stmt& stmt, ScopeInfo& info)
{
    bool nested_scope = false;
    std::visit(
        [&](const auto& node)
        {
            using Node = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<Node, AssignStmt>)
            {
                for (const auto& t : node.targets)
                {
                    collect_target(t, info);
                }
            }
            else if constexpr (std::is_same_v<Node, AugAssignStmt> ||
                               std::is_same_v<Node, AnnAssignStmt>)
            {
                collect_target(node.target, info);
            }
            else if constexpr (std::is_same_v<Node, ForStmt>)
            {
                collect_target(node.target, info);
            }
            else if constexpr (std::is_same_v<Node, WithStmt>)
            {
                for (const auto& item : node.items)
                {
                    if (item.target.has_value())
                    {
                        collect_target(*item.target, info);
                    }
                }
            }
            else if constexpr (std::is_same_v<Node, TryStmt>)
            {
                for (const auto& handler : node.handlers)
                {
                    if (handler.name.has_value())
                    {
                        info.locals.emplace(*handler.name);
                    }
                }
            }
            else if constexpr (std::is_same_v<Node, FunctionDef> || std::is_same_v<Node, ClassDef>)
            {
                info.locals.emplace(node.name);
                nested_scope = true;
            }
            else if constexpr (std::is_same_v<Node, ImportStmt>)
            {
                for (const auto& alias : node.names)
                {
                    if (alias.asname.has_value())
                    {
                        info.locals.emplace(*alias.asname);
                    }
                    else
                    {
                        info.locals.emplace(alias.name.substr(0, alias.name.find('.')));
                    }
                }
            }
            else if constexpr (std::is_same_v<Node, ImportFromStmt>)
            {
                for (const auto& alias : node.names)
                {
                    if (alias.name != "*")
                    {
                        info.locals.emplace(alias.asname.has_value() ? std::string(*alias.asname)
                                                                     : alias.name);
                    }
                }
            }
            else if constexpr (std::is_same_v<Node, DelStmt>)
            {
                for (const auto& t : node.targets)
                {
                    collect_target(t, info);
                }
            }
            else if constexpr (std::is_same_v<Node, GlobalStmt>)
            {
                for (const auto name : node.names)
                {
                    info.globals.emplace(name);
                }
            }
            else if constexpr (std::is_same_v<Node, NonlocalStmt>)
            {
                for (const auto name : node.names)
                {
                    info.nonlocals.emplace(name);
                }
            }
        },
        stmt.node);

    // Bodies of nested def/class statements are separate scopes; their
    // decorators and defaults still evaluate here.
    for_each_child(
        stmt, [&](const Expr& e) { scan_expr(e, info); },
        [&](const Stmt& child)
        {
            if (!nested_scope)
            {
                collect_stmt(child, info);
            }
        });
}

void add_params(const Parameters& params, ScopeInfo& info)
{
    for (const auto& p : params.positional)
    {
        info.locals.emplace(p.name);
    }
    if (params.vararg.has_value())
    {
        info.locals.emplace(params.vararg->name);
    }
    for (const auto& p : params.kwonly)
    {
        info.locals.emplace(p.name);
    }
    if (params.kwarg.has_value())
    {
        info.locals.emplace(params.kwarg->name);
    }
}

} // namespace

std::shared_ptr<const ScopeInfo> analyze_scope(const Parameters& params,
                                               const std::vector<Stmt>& body)
{
    auto info = std::make_shared<ScopeInfo>();
    for (const auto& stmt : body)
    {
        collect_stmt(stmt, *info);
    }
    for (const auto& name : info->globals)
    {
        info->locals.erase(name);
    }
    for (const auto& name : info->nonlocals)
    {
        info->locals.erase(name);
    }
    add_params(params, *info);
    return info;
}

std::shared_ptr<const ScopeInfo> analyze_lambda_scope(const Parameters& params, const Expr& body)
{
    auto info = std::make_shared<ScopeInfo>();
    scan_expr(body, *info);
    add_params(params, *info);
    return info;
}

} // namespace codegate::interp
