#include <algorithm>
#include <chrono>
#include <codegate/analysis/condition_analyzer.h>
#include <codegate/analysis/condition_lowering.h>
#include <codegate/analysis/solver.h>
#include <codegate/diag/render.h>
#include <codegate/parser/parser.h>
#include <codegate/parser/walk.h>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace codegate::analysis
{
namespace
{

using namespace codegate::parser;
using codegate::diag::Finding;
using codegate::diag::Severity;
using Clock = std::chrono::steady_clock;

bool debug_enabled()
{
    return std::getenv("CODEGATE_DEBUG") != nullptr;
}

bool is_exit_call(const Expr& e)
{
    const auto* call = std::get_if<CallExpr>(&e.node);
    if (call == nullptr)
    {
        return false;
    }
    if (const auto* name = std::get_if<NameExpr>(&call->callee->node))
    {
        return name->name == "exit" || name->name == "quit";
    }
    if (const auto* attr = std::get_if<AttributeExpr>(&call->callee->node))
    {
        const auto* base = std::get_if<NameExpr>(&attr->value->node);
        return base != nullptr && ((base->name == "sys" && attr->attr == "exit") ||
                                   (base->name == "os" && attr->attr == "_exit"));
    }
    return false;
}

bool contains_yield(const Stmt& stmt)
{
    bool found = false;
    walk_exprs(stmt,
               [&found](const Expr& e)
               {
                   if (std::holds_alternative<YieldExpr>(e.node))
                   {
                       found = true;
                   }
               });
    return found;
}

/**
 * True when `body` can leave the loop it belongs to. `own_level` is false
 * inside nested loops, where `break` only leaves the inner loop.
 */
bool can_leave(const std::vector<Stmt>& body, bool own_level)
{
    for (const auto& stmt : body)
    {
        if (std::holds_alternative<FunctionDef>(stmt.node) ||
            std::holds_alternative<ClassDef>(stmt.node))
        {
            continue;
        }
        if (std::holds_alternative<ReturnStmt>(stmt.node) ||
            std::holds_alternative<RaiseStmt>(stmt.node))
        {
            return true;
        }
        if (std::holds_alternative<BreakStmt>(stmt.node) && own_level)
        {
            return true;
        }
        if (const auto* expr = std::get_if<ExprStmt>(&stmt.node); expr != nullptr && is_exit_call(expr->value))
        {
            return true;
        }
        if (const auto* loop = std::get_if<WhileStmt>(&stmt.node))
        {
            if (can_leave(loop->body, false) || can_leave(loop->orelse, own_level))
            {
                return true;
            }
            continue;
        }
        if (const auto* loop = std::get_if<ForStmt>(&stmt.node))
        {
            if (can_leave(loop->body, false) || can_leave(loop->orelse, own_level))
            {
                return true;
            }
            continue;
        }
        if (contains_yield(stmt))
        {
            return true;
        }
        if (const auto* s = std::get_if<IfStmt>(&stmt.node))
        {
            if (can_leave(s->body, own_level) || can_leave(s->orelse, own_level))
            {
                return true;
            }
        }
        else if (const auto* s = std::get_if<TryStmt>(&stmt.node))
        {
            if (can_leave(s->body, own_level) || can_leave(s->orelse, own_level) ||
                can_leave(s->finalbody, own_level))
            {
                return true;
            }
            for (const auto& handler : s->handlers)
            {
                if (can_leave(handler.body, own_level))
                {
                    return true;
                }
            }
        }
        else if (const auto* s = std::get_if<WithStmt>(&stmt.node))
        {
            if (can_leave(s->body, own_level))
            {
                return true;
            }
        }
    }
    return false;
}

bool is_literal_false(const Expr& e)
{
    if (const auto* c = std::get_if<ConstantExpr>(&e.node))
    {
        return c->kind == ConstantExpr::Kind::False;
    }
    if (const auto* n = std::get_if<NumberExpr>(&e.node))
    {
        return n->lexeme == "0";
    }
    return false;
}

class ConditionWalker
{
  public:
    ConditionWalker(const codegate::source::SourceUnit& unit, unsigned query_timeout_ms,
                    Clock::time_point deadline)
        : unit_(unit), query_timeout_ms_(query_timeout_ms), deadline_(deadline)
    {
    }

    void check(const Module& module)
    {
        LoweringContext scope(solver_.context());
        visit_block(module.body, scope);
    }

    std::vector<Finding> take_findings() { return std::move(findings_); }
    [[nodiscard]] bool out_of_time() const { return out_of_time_; }

  private:
    const codegate::source::SourceUnit& unit_;
    unsigned query_timeout_ms_;
    Clock::time_point deadline_;
    Solver solver_;
    std::vector<Finding> findings_;
    bool out_of_time_ = false;

    void report(Severity severity, std::string code, std::string message,
                codegate::source::Span span)
    {
        Finding f;
        f.severity = severity;
        f.code = std::move(code);
        f.message = std::move(message);
        f.span = span;
        f.origin = "conditions";
        codegate::diag::locate(f, unit_);
        findings_.push_back(std::move(f));
    }

    std::optional<z3::expr> lower(const Expr& e, LoweringContext& scope)
    {
        try
        {
            auto lowered = lower_condition(e, scope);
            if (auto* formula = std::get_if<z3::expr>(&lowered))
            {
                return *formula;
            }
            return std::nullopt;
        }
        catch (const z3::exception& ex)
        {
            if (debug_enabled())
            {
                std::cerr << "[conditions] lowering failed: " << ex.msg() << "\n";
            }
            return std::nullopt;
        }
    }

    /** Satisfiability of the conjunction of `facts`. */
    CheckResult query(const std::vector<z3::expr>& facts)
    {
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - Clock::now()).count();
        if (remaining <= 0)
        {
            out_of_time_ = true;
            return CheckResult::Unknown;
        }
        try
        {
            solver_.set_timeout(
                static_cast<unsigned>(std::min<long long>(query_timeout_ms_, remaining)));
            solver_.push();
        }
        catch (const z3::exception& ex)
        {
            if (debug_enabled())
            {
                std::cerr << "[conditions] solver error: " << ex.msg() << "\n";
            }
            return CheckResult::Unknown;
        }
        CheckResult result = CheckResult::Unknown;
        try
        {
            for (const auto& fact : facts)
            {
                solver_.add(fact);
            }
            result = solver_.check();
            if (result == CheckResult::Unknown && debug_enabled())
            {
                std::cerr << "[conditions] unknown: "
                          << solver_.last_unknown_reason().value_or("no reason") << "\n";
            }
        }
        catch (const z3::exception& ex)
        {
            if (debug_enabled())
            {
                std::cerr << "[conditions] solver error: " << ex.msg() << "\n";
            }
        }
        solver_.pop();
        return result;
    }

    void visit_block(const std::vector<Stmt>& body, LoweringContext& scope)
    {
        for (const auto& stmt : body)
        {
            visit_stmt(stmt, scope);
        }
    }

    void visit_stmt(const Stmt& stmt, LoweringContext& scope)
    {
        if (const auto* s = std::get_if<IfStmt>(&stmt.node))
        {
            visit_if(*s, scope, {});
            return;
        }
        if (const auto* s = std::get_if<WhileStmt>(&stmt.node))
        {
            visit_while(*s, scope);
            return;
        }
        if (const auto* s = std::get_if<AssertStmt>(&stmt.node))
        {
            visit_assert(*s, scope);
            return;
        }
        if (const auto* s = std::get_if<FunctionDef>(&stmt.node))
        {
            visit_function(*s, scope);
            return;
        }
        if (const auto* s = std::get_if<AnnAssignStmt>(&stmt.node))
        {
            if (const auto* name = std::get_if<NameExpr>(&s->target.node))
            {
                if (const auto sort = sort_of_annotation(s->annotation))
                {
                    scope.declared.insert_or_assign(name->name, *sort);
                }
            }
            return;
        }
        if (const auto* s = std::get_if<ForStmt>(&stmt.node))
        {
            const auto* target = std::get_if<NameExpr>(&s->target.node);
            const auto* call = std::get_if<CallExpr>(&s->iter.node);
            const auto* callee = call != nullptr ? std::get_if<NameExpr>(&call->callee->node) : nullptr;
            if (target != nullptr && callee != nullptr && callee->name == "range")
            {
                scope.declared.insert_or_assign(target->name, Sort::Int);
            }
        }
        for_each_child(
            stmt, [](const Expr&) {}, [&](const Stmt& child) { visit_stmt(child, scope); });
    }

    void visit_if(const IfStmt& s, LoweringContext& scope, std::vector<z3::expr> earlier)
    {
        const auto cond = lower(s.test, scope);
        bool else_dead = false;
        if (cond.has_value())
        {
            auto facts = earlier;
            facts.push_back(*cond);
            if (query(facts) == CheckResult::Unsat)
            {
                report(Severity::Warning, "CG101",
                       earlier.empty()
                           ? "condition is always false; this branch never runs"
                           : "condition can never be true after the earlier conditions of this "
                             "chain; this branch never runs",
                       s.test.span);
            }
            else if (!s.orelse.empty())
            {
                facts.back() = !*cond;
                if (query(facts) == CheckResult::Unsat)
                {
                    report(Severity::Warning, "CG102",
                           "condition is always true; the else branch never runs", s.test.span);
                    else_dead = true;
                }
            }
        }
        visit_block(s.body, scope);

        if (s.orelse.size() == 1 && !else_dead)
        {
            if (const auto* elif = std::get_if<IfStmt>(&s.orelse.front().node))
            {
                if (cond.has_value())
                {
                    earlier.push_back(!*cond);
                }
                visit_if(*elif, scope, std::move(earlier));
                return;
            }
        }
        if (else_dead)
        {
            // The else branch is unreachable; still look at it for nested definitions,
            // without the contradictory chain context.
            for (const auto& stmt : s.orelse)
            {
                if (std::holds_alternative<FunctionDef>(stmt.node) ||
                    std::holds_alternative<ClassDef>(stmt.node))
                {
                    visit_stmt(stmt, scope);
                }
            }
            return;
        }
        visit_block(s.orelse, scope);
    }

    void visit_while(const WhileStmt& s, LoweringContext& scope)
    {
        if (const auto cond = lower(s.test, scope))
        {
            if (query({*cond}) == CheckResult::Unsat)
            {
                report(Severity::Warning, "CG101",
                       "loop condition is always false; the body never runs", s.test.span);
            }
            else if (query({!*cond}) == CheckResult::Unsat && !can_leave(s.body, true))
            {
                report(Severity::Error, "CG103",
                       "loop condition is always true and the body has no break, return or "
                       "raise; the loop never terminates",
                       s.test.span);
            }
        }
        visit_block(s.body, scope);
        visit_block(s.orelse, scope);
    }

    void visit_assert(const AssertStmt& s, LoweringContext& scope)
    {
        if (is_literal_false(s.test))
        {
            return;
        }
        if (const auto cond = lower(s.test, scope))
        {
            if (query({*cond}) == CheckResult::Unsat)
            {
                report(Severity::Error, "CG104", "assertion can never hold", s.test.span);
            }
        }
    }

    void visit_function(const FunctionDef& def, const LoweringContext& outer)
    {
        LoweringContext scope(solver_.context());
        scope.declared = outer.declared;
        auto declare = [&scope](const Param& p)
        {
            const auto sort =
                p.annotation != nullptr ? sort_of_annotation(*p.annotation) : std::nullopt;
            if (sort.has_value())
            {
                scope.declared.insert_or_assign(p.name, *sort);
            }
            else
            {
                scope.declared.erase(p.name);
            }
        };
        for (const auto& p : def.params->positional)
        {
            declare(p);
        }
        for (const auto& p : def.params->kwonly)
        {
            declare(p);
        }
        if (def.params->vararg.has_value())
        {
            scope.declared.erase(def.params->vararg->name);
        }
        if (def.params->kwarg.has_value())
        {
            scope.declared.erase(def.params->kwarg->name);
        }
        visit_block(*def.body, scope);
    }
};

} // namespace

AnalyzerReport ConditionAnalyzer::run(const codegate::source::SourceUnit& source,
                                      double timeout_seconds)
{
    AnalyzerReport report;
    report.analyzer = name();
    const auto start = Clock::now();

    auto parsed = parse_source(source.text());
    if (std::holds_alternative<std::vector<Finding>>(parsed))
    {
        report.detail = "source does not parse";
        return report;
    }
    const auto deadline =
        start + std::chrono::duration_cast<Clock::duration>(
                    std::chrono::duration<double>(std::max(0.0, timeout_seconds)));
    ConditionWalker walker(source, query_timeout_ms_, deadline);
    walker.check(std::get<Module>(parsed));
    report.findings = walker.take_findings();
    if (walker.out_of_time())
    {
        report.outcome = AnalyzerOutcome::TimedOut;
        report.detail = "condition checks ran out of time";
    }
    report.elapsed_ms =
        std::chrono::duration<double, std::milli>(Clock::now() - start).count();
    return report;
}

} // namespace codegate::analysis
