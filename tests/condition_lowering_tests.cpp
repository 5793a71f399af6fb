#include <codegate/analysis/condition_lowering.h>
#include <codegate/analysis/solver.h>
#include <codegate/parser/parser.h>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <variant>

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

// Keeps the text alive for the views in the tree.
struct ParsedExpr
{
    std::string text;
    codegate::parser::Module module;

    const codegate::parser::Expr& expr() const
    {
        return std::get<codegate::parser::ExprStmt>(module.body.front().node).value;
    }
};

static std::unique_ptr<ParsedExpr> parse_expr(const std::string& src)
{
    auto out = std::make_unique<ParsedExpr>();
    out->text = src + "\n";
    auto parsed = codegate::parser::parse_source(out->text);
    auto* module = std::get_if<codegate::parser::Module>(&parsed);
    if (module == nullptr || module->body.size() != 1 ||
        !std::holds_alternative<codegate::parser::ExprStmt>(module->body.front().node))
    {
        fail("expected a single expression: " + src);
    }
    out->module = std::move(*module);
    return out;
}

static codegate::analysis::CheckResult satisfiable(const std::string& src,
                                                   codegate::analysis::Solver& solver,
                                                   codegate::analysis::LoweringContext& ctx)
{
    const auto parsed = parse_expr(src);
    auto lowered = codegate::analysis::lower_condition(parsed->expr(), ctx);
    if (const auto* err = std::get_if<std::string>(&lowered))
    {
        fail("expected " + src + " to lower: " + *err);
    }
    solver.push();
    solver.add(std::get<z3::expr>(lowered));
    const auto res = solver.check();
    solver.pop();
    return res;
}

static std::string unsupported(const std::string& src, codegate::analysis::LoweringContext& ctx)
{
    const auto parsed = parse_expr(src);
    auto lowered = codegate::analysis::lower_condition(parsed->expr(), ctx);
    const auto* err = std::get_if<std::string>(&lowered);
    if (err == nullptr)
    {
        fail("expected " + src + " to be unsupported");
    }
    return *err;
}

int main()
{
    using namespace codegate::analysis;

    Solver solver;

    {
        LoweringContext ctx(solver.context());
        if (satisfiable("x > 0 and x < 1", solver, ctx) != CheckResult::Sat)
        {
            fail("undeclared numbers are reals");
        }
        if (satisfiable("x > 3 and x < 2", solver, ctx) != CheckResult::Unsat)
        {
            fail("expected a contradiction over reals");
        }
        if (satisfiable("1 < x < 2 and x == 5", solver, ctx) != CheckResult::Unsat)
        {
            fail("expected chained comparisons to conjoin");
        }
        if (satisfiable("flag and not flag", solver, ctx) != CheckResult::Unsat)
        {
            fail("bare names in truth position are booleans");
        }
        if (satisfiable("x / 2 > 1 and x < 2", solver, ctx) != CheckResult::Unsat)
        {
            fail("expected division by a literal");
        }
        if (satisfiable("(x if y > 0 else -x) < 0 and x == 0", solver, ctx) != CheckResult::Unsat)
        {
            fail("expected conditional expressions to lower");
        }
        if (satisfiable("0x10 == 16 and 1_000 > 999 and 2.5e1 == 25", solver, ctx) != CheckResult::Sat)
        {
            fail("expected literal forms to lower exactly");
        }
        if (satisfiable("0", solver, ctx) != CheckResult::Unsat ||
            satisfiable("True or False", solver, ctx) != CheckResult::Sat)
        {
            fail("expected literal truthiness");
        }
        if (ctx.vars.find("x!r") == ctx.vars.end() || ctx.vars.find("flag!b") == ctx.vars.end())
        {
            fail("expected constants to be cached per name and sort");
        }
    }

    {
        LoweringContext ctx(solver.context());
        ctx.declared.emplace("n", Sort::Int);
        if (satisfiable("n > 0 and n < 1", solver, ctx) != CheckResult::Unsat)
        {
            fail("declared ints leave no room between 0 and 1");
        }
        if (satisfiable("n % 2 == 1 and n // 2 == 3 and n != 7", solver, ctx) != CheckResult::Unsat)
        {
            fail("expected floor division and modulo by positive literals");
        }
        if (unsupported("n // 0 > 1", ctx) != "'//' and '%' need a positive divisor")
        {
            fail("expected division by zero to be unsupported");
        }
    }

    {
        LoweringContext ctx(solver.context());
        if (unsupported("f(x) > 0", ctx) != "unsupported expression")
        {
            fail("calls are unsupported");
        }
        if (unsupported("x in y", ctx) != "membership and identity tests are not supported")
        {
            fail("membership is unsupported");
        }
        if (unsupported("a * b > 0", ctx) != "non-linear multiplication is not supported")
        {
            fail("non-linear terms are unsupported");
        }
        if (unsupported("a / b > 0", ctx) != "division by a non-literal is not supported")
        {
            fail("division by a variable is unsupported");
        }
        if (unsupported("x > 1.5 and x // 2 == 0", ctx) !=
            "'//' and '%' need int operands and a literal divisor")
        {
            fail("floor division on reals is unsupported");
        }
        if (unsupported("x is None", ctx) != "None and ... are not supported")
        {
            fail("None is unsupported");
        }
        (void)unsupported("s == 'a'", ctx);
        (void)unsupported("xs[0] > 1", ctx);
    }

    {
        auto as_annotation = [](const std::string& src) { return parse_expr(src); };
        const auto i = as_annotation("int");
        const auto f = as_annotation("float");
        const auto b = as_annotation("bool");
        const auto s = as_annotation("str");
        const auto l = as_annotation("list[int]");
        if (sort_of_annotation(i->expr()) != Sort::Int || sort_of_annotation(f->expr()) != Sort::Real ||
            sort_of_annotation(b->expr()) != Sort::Bool || sort_of_annotation(s->expr()).has_value() ||
            sort_of_annotation(l->expr()).has_value())
        {
            fail("unexpected annotation sorts");
        }
    }

    std::cout << "OK\n";
    return 0;
}
