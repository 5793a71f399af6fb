#include <atomic>
#include <codegate/interp/interpreter.h>
#include <codegate/parser/parser.h>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

struct RunResult
{
    codegate::interp::Outcome::Kind kind;
    std::string exception_type;
    std::string message;
    std::string output;
    bool truncated = false;
};

static RunResult run_src(const std::string& src, codegate::interp::Limits limits = {},
                         const std::atomic<bool>* cancel = nullptr)
{
    auto parsed = codegate::parser::parse_source(src);
    const auto* module = std::get_if<codegate::parser::Module>(&parsed);
    if (module == nullptr)
    {
        fail("expected test program to parse: " + src);
    }
    codegate::interp::Interpreter interp(nullptr, limits, cancel);
    const auto out = interp.run(*module);
    return RunResult{.kind = out.kind,
                     .exception_type = out.exception_type,
                     .message = out.message,
                     .output = interp.output(),
                     .truncated = interp.output_truncated()};
}

static void expect_output(const std::string& src, const std::string& expected)
{
    const auto res = run_src(src);
    if (res.kind != codegate::interp::Outcome::Kind::Ok)
    {
        fail("expected program to complete: " + res.exception_type + ": " + res.message);
    }
    if (res.output != expected)
    {
        fail("output mismatch\n  got:      " + res.output + "\n  expected: " + expected);
    }
}

int main()
{
    using codegate::interp::Interpreter;
    using codegate::interp::Limits;
    using Kind = codegate::interp::Outcome::Kind;
    using codegate::runtime::Value;

    expect_output("def fib(n):\n"
                  "    a, b = 0, 1\n"
                  "    for _ in range(n):\n"
                  "        a, b = b, a + b\n"
                  "    return a\n"
                  "print(fib(10), [x * x for x in range(4)], {'k': 1})\n",
                  "55 [0, 1, 4, 9] {'k': 1}\n");

    expect_output("print(f\"{3.5:.1f}|{'ab':>4}|{7:03d}\", sep='', end='!\\n')\n", "3.5|  ab|007!\n");

    expect_output("class Acc:\n"
                  "    def __init__(self):\n"
                  "        self.total = 0\n"
                  "    def add(self, n):\n"
                  "        self.total += n\n"
                  "        return self\n"
                  "a = Acc().add(2).add(3)\n"
                  "try:\n"
                  "    1 // 0\n"
                  "except ZeroDivisionError:\n"
                  "    print('caught')\n"
                  "finally:\n"
                  "    print('done')\n"
                  "print(a.total, sorted([3, 1, 2], reverse=True), ','.join(['a', 'b']))\n",
                  "caught\ndone\n5 [3, 2, 1] a,b\n");

    expect_output("def gen(n):\n"
                  "    for i in range(n):\n"
                  "        if i % 2 == 0:\n"
                  "            yield i\n"
                  "print(list(gen(7)), sum(gen(7)), 'a-b'.upper())\n",
                  "[0, 2, 4, 6] 12 A-B\n");

    expect_output("import math\n"
                  "from functools import reduce\n"
                  "print(math.sqrt(16.0), reduce(lambda a, b: a * b, [1, 2, 3, 4]))\n"
                  "d = {}\n"
                  "for w in 'a b a c a'.split():\n"
                  "    d[w] = d.get(w, 0) + 1\n"
                  "print(d, max(d, key=d.get), (1, 2) < (1, 3), None is None)\n",
                  "4.0 24\n{'a': 3, 'b': 1, 'c': 1} a True True\n");

    expect_output("import random\n"
                  "random.seed(5)\n"
                  "a = [random.randint(0, 100) for _ in range(5)]\n"
                  "random.seed(5)\n"
                  "b = [random.randint(0, 100) for _ in range(5)]\n"
                  "print(a == b)\n",
                  "True\n");

    {
        auto parsed = codegate::parser::parse_source("def add(a, b):\n    return a + b\n"
                                                     "x = 41 + 1\n");
        const auto& module = std::get<codegate::parser::Module>(parsed);
        Interpreter interp(nullptr, Limits{}, nullptr);
        if (interp.run(module).kind != Kind::Ok)
        {
            fail("expected definitions to run");
        }
        if (!interp.has_callable("add") || interp.has_callable("x") || interp.has_callable("nope"))
        {
            fail("unexpected has_callable results");
        }
        const auto x = interp.global("x");
        if (!x.has_value() || !x->is_int() || x->as_int() != 42)
        {
            fail("expected global x == 42");
        }
        const auto sum = interp.call("add", {Value::integer(2), Value::integer(3)});
        if (sum.kind != Kind::Ok || !sum.value.is_int() || sum.value.as_int() != 5)
        {
            fail("expected add(2, 3) == 5");
        }
        const auto bad = interp.call("add", {Value::integer(1)});
        if (bad.kind != Kind::Raised || bad.exception_type != "TypeError")
        {
            fail("expected TypeError for a missing argument");
        }
        // The interpreter is usable after an exception.
        const auto again = interp.call("add", {Value::str("a"), Value::str("b")});
        if (again.kind != Kind::Ok || again.value.as_str() != "ab")
        {
            fail("expected string concatenation after a failed call");
        }
    }

    {
        const auto res = run_src("def f(x):\n    return x[5]\nf([1])\n");
        if (res.kind != Kind::Raised || res.exception_type != "IndexError")
        {
            fail("expected IndexError, got " + res.exception_type);
        }
    }

    {
        const auto res = run_src("import os\n");
        if (res.kind != Kind::Forbidden || res.message != "forbidden import: os")
        {
            fail("expected forbidden import, got " + res.message);
        }
    }

    {
        // Forbidden attributes cannot be caught.
        const auto res = run_src("try:\n    x = (1).__class__\nexcept Exception:\n    print('no')\n");
        if (res.kind != Kind::Forbidden || !res.output.empty())
        {
            fail("expected uncatchable forbidden attribute access");
        }
    }

    {
        const auto res = run_src("eval('1 + 1')\n");
        if (res.kind != Kind::Raised || res.exception_type != "NameError" ||
            res.message != "name 'eval' is not defined")
        {
            fail("expected eval to be absent from builtins");
        }
    }

    {
        Limits limits;
        limits.max_recursion_depth = 30;
        const auto res = run_src("def r(n):\n    return r(n + 1)\nr(0)\n", limits);
        if (res.kind != Kind::Raised || res.exception_type != "RecursionError")
        {
            fail("expected RecursionError");
        }
    }

    {
        const std::atomic<bool> cancel{true};
        const auto res = run_src("while True:\n    pass\n", Limits{}, &cancel);
        if (res.kind != Kind::Timeout)
        {
            fail("expected cancellation to stop an infinite loop");
        }
    }

    {
        Limits limits;
        limits.max_output_bytes = 10;
        const auto res = run_src("print('x' * 100)\n", limits);
        if (res.kind != Kind::Ok || res.output != std::string(10, 'x') || !res.truncated)
        {
            fail("expected output to be capped at 10 bytes");
        }
    }

    {
        Limits limits;
        limits.max_memory_bytes = 1024 * 1024;
        const auto res = run_src("try:\n    xs = [0] * 100000000\nexcept MemoryError:\n    pass\n",
                                 limits);
        if (res.kind != Kind::MemoryExceeded || res.exception_type != "MemoryError")
        {
            fail("expected uncatchable memory limit");
        }
    }

    {
        const auto res = run_src("x = 2 ** 70\n");
        if (res.kind != Kind::Raised || res.exception_type != "OverflowError")
        {
            fail("expected OverflowError outside 64-bit integers");
        }
    }

    {
        const auto res = run_src("raise ValueError('bad input')\n");
        if (res.kind != Kind::Raised || res.exception_type != "ValueError" ||
            res.message != "bad input")
        {
            fail("expected ValueError with its message");
        }
    }

    std::cout << "OK\n";
    return 0;
}
