#include <codegate/proptest/generator.h>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

using namespace codegate::proptest;
using codegate::runtime::Value;
using Kind = TypeSpec::Kind;

static std::string reprs(const std::vector<Value>& values)
{
    std::string out;
    for (const auto& v : values)
    {
        out += (out.empty() ? "" : " ") + codegate::runtime::repr(v);
    }
    return out;
}

static std::string render_all(const std::vector<Inputs>& rows)
{
    std::string out;
    for (const auto& row : rows)
    {
        out += render_call("f", row) + ";";
    }
    return out;
}

static TypeSpec list_of(TypeSpec inner)
{
    return TypeSpec{.kind = Kind::List, .args = {std::move(inner)}, .variadic = false};
}

int main()
{
    const std::vector<Parameter> params{
        Parameter{.name = "n", .type = TypeSpec::of(Kind::Int)},
        Parameter{.name = "s", .type = TypeSpec::of(Kind::Str)},
        Parameter{.name = "xs", .type = list_of(TypeSpec::of(Kind::Float))},
    };

    {
        Generator a(42, GeneratorLimits{});
        Generator b(42, GeneratorLimits{});
        Generator c(43, GeneratorLimits{});
        const auto ra = a.inputs(params, 60);
        const auto rb = b.inputs(params, 60);
        const auto rc = c.inputs(params, 60);
        if (ra.size() != 60 || render_all(ra) != render_all(rb))
        {
            fail("expected the same seed to give the same inputs");
        }
        if (render_all(ra) == render_all(rc))
        {
            fail("expected a different seed to give different inputs");
        }
    }

    {
        // Edge values come first, walked in lockstep.
        Generator gen(1, GeneratorLimits{});
        const auto rows = gen.inputs(params, 8);
        const std::vector<std::string> expected{
            "f(0, '', [])",    "f(1, 'a', [0.0])", "f(-1, '', [])",
            "f(-1000, 'a', [0.0])", "f(1000, '', [])",
        };
        for (std::size_t i = 0; i < expected.size(); ++i)
        {
            if (render_call("f", rows[i]) != expected[i])
            {
                fail("edge row " + std::to_string(i) + ": got " + render_call("f", rows[i]));
            }
        }
        const auto few = gen.inputs(params, 2);
        if (few.size() != 2 || render_call("f", few[1]) != "f(1, 'a', [0.0])")
        {
            fail("expected the count to cap the edge rows");
        }
        if (!gen.inputs({}, 3).front().empty())
        {
            fail("expected empty argument lists for a function without parameters");
        }
    }

    {
        GeneratorLimits limits;
        limits.int_min = -5;
        limits.int_max = 5;
        limits.max_string_length = 3;
        limits.max_collection_size = 4;
        Generator gen(7, limits);
        const auto rows = gen.inputs(params, 300);
        for (const auto& row : rows)
        {
            for (std::size_t i = 0; i < params.size(); ++i)
            {
                if (!conforms(row[i], params[i].type))
                {
                    fail("generated value does not conform: " + render_call("f", row));
                }
            }
            if (row[0].as_int() < -5 || row[0].as_int() > 5 || row[1].as_str().size() > 3 ||
                row[2].as_list()->items.size() > 4)
            {
                fail("generated value outside the limits: " + render_call("f", row));
            }
        }
    }

    {
        Generator gen(3, GeneratorLimits{});
        const TypeSpec nested{.kind = Kind::Dict,
                              .args = {TypeSpec::of(Kind::Str), list_of(list_of(TypeSpec::of(Kind::Int)))},
                              .variadic = false};
        const TypeSpec opt{.kind = Kind::Optional, .args = {TypeSpec::of(Kind::Bool)}, .variadic = false};
        const TypeSpec pair{.kind = Kind::Tuple,
                            .args = {TypeSpec::of(Kind::Bytes), TypeSpec::of(Kind::Int)},
                            .variadic = false};
        bool saw_none = false;
        for (int i = 0; i < 200; ++i)
        {
            if (!conforms(gen.value(nested), nested) || !conforms(gen.value(pair), pair))
            {
                fail("nested values must conform");
            }
            const auto o = gen.value(opt);
            saw_none = saw_none || o.is_none();
            if (!conforms(o, opt))
            {
                fail("optional values must conform");
            }
        }
        if (!saw_none)
        {
            fail("expected optional parameters to produce None sometimes");
        }
    }

    {
        GeneratorLimits limits;
        limits.int_min = 5;
        limits.int_max = 10;
        if (reprs(edge_values(TypeSpec::of(Kind::Int), limits)) != "5 10")
        {
            fail("expected edges clipped to the range");
        }
        const TypeSpec opt{.kind = Kind::Optional, .args = {TypeSpec::of(Kind::Bool)}, .variadic = false};
        if (reprs(edge_values(opt, GeneratorLimits{})) != "None False True")
        {
            fail("unexpected optional edges");
        }
        const TypeSpec pair{.kind = Kind::Tuple,
                            .args = {TypeSpec::of(Kind::Int), TypeSpec::of(Kind::Str)},
                            .variadic = false};
        if (reprs(edge_values(pair, GeneratorLimits{})) != "(0, '')")
        {
            fail("unexpected tuple edges");
        }
    }

    {
        const std::vector<Parameter> one_int{Parameter{.name = "n", .type = TypeSpec::of(Kind::Int)}};
        if (render_all(shrink_candidates({Value::integer(10)}, one_int)) != "f(0);f(5);f(9);")
        {
            fail("unexpected int shrinks: " + render_all(shrink_candidates({Value::integer(10)}, one_int)));
        }
        if (render_all(shrink_candidates({Value::integer(-4)}, one_int)) != "f(0);f(4);f(-2);f(-3);")
        {
            fail("unexpected negative int shrinks");
        }
        if (!shrink_candidates({Value::integer(0)}, one_int).empty())
        {
            fail("zero is minimal");
        }

        const std::vector<Parameter> one_str{Parameter{.name = "s", .type = TypeSpec::of(Kind::Str)}};
        if (render_all(shrink_candidates({Value::str("abc")}, one_str)) !=
            "f('');f('a');f('bc');f('ab');f('aaa');")
        {
            fail("unexpected string shrinks");
        }

        const std::vector<Parameter> one_float{Parameter{.name = "x", .type = TypeSpec::of(Kind::Float)}};
        if (render_all(shrink_candidates({Value::floating(2.5)}, one_float)) != "f(0.0);f(2.0);")
        {
            fail("unexpected float shrinks");
        }

        const std::vector<Parameter> one_list{Parameter{.name = "xs", .type = list_of(TypeSpec::of(Kind::Int))}};
        const auto shrunk = shrink_candidates({Value::list({Value::integer(3), Value::integer(0)})}, one_list);
        if (shrunk.size() < 4 || render_call("f", shrunk[0]) != "f([3])" ||
            render_call("f", shrunk[2]) != "f([0])" || render_call("f", shrunk[4]) != "f([0, 0])")
        {
            fail("unexpected list shrinks: " + render_all(shrunk));
        }

        // Only the changed parameter differs.
        const auto two = shrink_candidates({Value::integer(3), Value::boolean(true)},
                                           {Parameter{.name = "n", .type = TypeSpec::of(Kind::Int)},
                                            Parameter{.name = "b", .type = TypeSpec::of(Kind::Bool)}});
        if (render_all(two) != "f(0, True);f(1, True);f(2, True);f(3, False);")
        {
            fail("unexpected multi-parameter shrinks: " + render_all(two));
        }
    }

    if (render_call("check", {Value::integer(1), Value::str("a"), Value::none()}) != "check(1, 'a', None)")
    {
        fail("unexpected call rendering");
    }

    std::cout << "OK\n";
    return 0;
}
