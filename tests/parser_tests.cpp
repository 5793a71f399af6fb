#include <codegate/parser/parser.h>
#include <codegate/parser/walk.h>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static void expect_dump(const std::string& src, const std::string& expected)
{
    const auto res = codegate::parser::parse_source(src);
    if (const auto* errs = std::get_if<std::vector<codegate::diag::Finding>>(&res))
    {
        fail("expected parse success for: " + src + " (" +
             (errs->empty() ? std::string("?") : errs->front().message) + ")");
    }
    const auto got = codegate::parser::dump(std::get<codegate::parser::Module>(res));
    if (got != expected)
    {
        fail("dump mismatch for: " + src + "\n  got:      " + got + "\n  expected: " + expected);
    }
}

static codegate::diag::Finding expect_error(const std::string& src)
{
    const auto res = codegate::parser::parse_source(src);
    const auto* errs = std::get_if<std::vector<codegate::diag::Finding>>(&res);
    if (errs == nullptr || errs->empty())
    {
        fail("expected parse error for: " + src);
    }
    return errs->front();
}

int main()
{
    using namespace codegate::parser;

    expect_dump("x = 1 + 2 * 3", "(= x (+ 1 (* 2 3)))");
    expect_dump("x = (1 + 2) * 3", "(= x (* (+ 1 2) 3))");
    expect_dump("x += 1", "(+= x 1)");
    expect_dump("a < b < c", "(cmp a < b < c)");
    expect_dump("not a and b", "(and (not a) b)");
    expect_dump("os.system('ls')", "(call (. os system) \"ls\")");
    expect_dump("f(1, *xs, key=2, **kw)", "(call f 1 *xs key=2 **kw)");
    expect_dump("xs[1:2]", "([] xs (slice 1 2 _))");
    expect_dump("[x * x for x in xs if x > 0]",
                "(listcomp (* x x) (for x xs (if (cmp x > 0))))");
    expect_dump("d = {'a': 1, **e}", "(= d (dict \"a\":1 **e))");
    expect_dump("import os as o\nfrom os.path import join\n",
                "(import os as o) (from os.path import join)");
    expect_dump("def f(a, b):\n    return a if b else None\n",
                "(def f (a b) (body (return (ifexp b a None))))");
    expect_dump("if x:\n    pass\nelse:\n    y = 2\n", "(if x (then (pass)) (else (= y 2)))");
    expect_dump("while n > 0:\n    n -= 1\n", "(while (cmp n > 0) (do (-= n 1)))");
    expect_dump("for i in range(3):\n    break\n", "(for i (call range 3) (do (break)))");
    expect_dump("try:\n    pass\nexcept ValueError as e:\n    pass\nfinally:\n    pass\n",
                "(try (body (pass)) (except ValueError as e) (finally (pass)))");
    expect_dump("class A:\n    x = 1\n", "(class A (body (= x 1)))");
    expect_dump("f = lambda a, b: a", "(= f (lambda (a b) a))");
    expect_dump("s = f'{x!r:>4}'", "(= s (fstr {x!r:(fstr \">4\")}))");

    {
        // Annotations and defaults are kept on the parameters.
        const std::string src = "def g(x: int, y: str = 'a') -> list[int]:\n    return [x]\n";
        const auto res = parse_source(src);
        const auto* module = std::get_if<Module>(&res);
        if (module == nullptr || module->body.size() != 1)
        {
            fail("expected one statement for annotated def");
        }
        const auto* def = std::get_if<FunctionDef>(&module->body[0].node);
        if (def == nullptr || def->name != "g" || def->params->positional.size() != 2)
        {
            fail("expected def g with two parameters");
        }
        if (def->params->positional[0].annotation == nullptr ||
            def->params->positional[0].default_value != nullptr ||
            def->params->positional[1].default_value == nullptr || !def->returns.has_value())
        {
            fail("expected annotations, a default and a return annotation");
        }
    }

    {
        // walk_exprs reaches calls nested in function bodies.
        const std::string src = "def h():\n    if True:\n        eval('1')\n";
        const auto res = parse_source(src);
        const auto& module = std::get<Module>(res);
        int calls = 0;
        walk_exprs(module.body[0],
                   [&](const Expr& e)
                   {
                       if (std::holds_alternative<CallExpr>(e.node))
                       {
                           ++calls;
                       }
                   });
        if (calls != 1)
        {
            fail("expected walk_exprs to find one call");
        }
        int stmts = 0;
        walk_stmts(module.body[0], [&](const Stmt&) { ++stmts; });
        if (stmts != 3)
        {
            fail("expected def, if and expression statement from walk_stmts");
        }
    }

    {
        const auto err = expect_error("if x\n    y = 1\n");
        if (err.message.rfind("expected ':'", 0) != 0)
        {
            fail("expected missing colon error, got: " + err.message);
        }
        if (!err.span.has_value() || err.severity != codegate::diag::Severity::Error)
        {
            fail("expected a located error finding");
        }
    }

    {
        const auto err = expect_error("def f():\nreturn 1\n");
        if (err.message.find("expected an indented block") == std::string::npos)
        {
            fail("expected indented block error, got: " + err.message);
        }
    }

    {
        const std::string deep = "x = " + std::string(300, '(') + "1" + std::string(300, ')');
        const auto err = expect_error(deep);
        if (err.message.find("too many nested blocks or expressions") == std::string::npos)
        {
            fail("expected nesting limit error, got: " + err.message);
        }
    }

    {
        // Lexer errors come back as parse findings.
        const auto err = expect_error("x = 'open");
        if (err.message != "unterminated string literal")
        {
            fail("expected lexer error through parse_source");
        }
    }

    std::cout << "OK\n";
    return 0;
}
