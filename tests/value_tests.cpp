#include <codegate/runtime/value.h>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <memory>
#include <string>

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static void expect_repr(const codegate::runtime::Value& v, const std::string& expected)
{
    const auto got = codegate::runtime::repr(v);
    if (got != expected)
    {
        fail("repr mismatch: got " + got + " expected " + expected);
    }
}

int main()
{
    using namespace codegate::runtime;

    expect_repr(Value::none(), "None");
    expect_repr(Value::boolean(true), "True");
    expect_repr(Value::integer(-7), "-7");
    expect_repr(Value::floating(2.0), "2.0");
    expect_repr(Value::floating(0.1), "0.1");
    expect_repr(Value::floating(1e20), "1e+20");
    expect_repr(Value::floating(std::numeric_limits<double>::infinity()), "inf");
    expect_repr(Value::str("it's"), "\"it's\"");
    expect_repr(Value::str("a'b\"c\n"), "'a\\'b\"c\\n'");
    expect_repr(Value::bytes("ab"), "b'ab'");
    expect_repr(Value::list({Value::integer(1), Value::str("x")}), "[1, 'x']");
    expect_repr(Value::tuple({Value::integer(1)}), "(1,)");
    expect_repr(Value::tuple({}), "()");
    expect_repr(Value::dict({{Value::str("k"), Value::none()}}), "{'k': None}");
    expect_repr(Value::set({}), "set()");
    expect_repr(Value::set({Value::integer(3)}), "{3}");

    if (str(Value::str("plain")) != "plain" || str(Value::integer(4)) != "4")
    {
        fail("str() leaves strings unquoted");
    }
    if (type_name(Value::boolean(false)) != "bool" || type_name(Value::dict({})) != "dict" ||
        type_name(Value::none()) != "NoneType")
    {
        fail("unexpected type names");
    }

    {
        // Numbers compare across int, bool and float.
        if (!equals(Value::integer(1), Value::floating(1.0)) ||
            !equals(Value::boolean(true), Value::integer(1)) ||
            equals(Value::integer(1), Value::str("1")))
        {
            fail("unexpected numeric equality");
        }
        const double nan = std::nan("");
        if (equals(Value::floating(nan), Value::floating(nan)))
        {
            fail("nan is never equal to itself");
        }
        if (!equals(Value::list({Value::integer(1), Value::integer(2)}),
                    Value::list({Value::floating(1.0), Value::integer(2)})))
        {
            fail("lists compare element-wise");
        }
        if (equals(Value::list({}), Value::tuple({})))
        {
            fail("list and tuple are never equal");
        }
        if (!equals(Value::dict({{Value::str("a"), Value::integer(1)}, {Value::str("b"), Value::integer(2)}}),
                    Value::dict({{Value::str("b"), Value::integer(2)}, {Value::str("a"), Value::integer(1)}})))
        {
            fail("dict equality ignores insertion order");
        }
    }

    {
        if (compare(Value::integer(1), Value::floating(1.5)) != -1 ||
            compare(Value::str("b"), Value::str("a")) != 1 ||
            compare(Value::tuple({Value::integer(1), Value::integer(2)}),
                    Value::tuple({Value::integer(1), Value::integer(2)})) != 0)
        {
            fail("unexpected ordering");
        }
        if (compare(Value::integer(1), Value::str("a")).has_value())
        {
            fail("int and str are not orderable");
        }
        if (compare(Value::floating(std::nan("")), Value::integer(0)) != 2)
        {
            fail("nan comparisons are unordered");
        }
    }

    {
        if (!hashable(Value::tuple({Value::integer(1), Value::str("a")})) ||
            hashable(Value::tuple({Value::list({})})) || hashable(Value::dict({})))
        {
            fail("unexpected hashability");
        }
        if (truthy(Value::list({})) || !truthy(Value::str("x")) || truthy(Value::floating(0.0)) ||
            truthy(Value::none()))
        {
            fail("unexpected truthiness");
        }
    }

    {
        // Copies alias containers; deep_copy does not.
        const Value inner = Value::list({Value::integer(1)});
        const Value outer = Value::list({inner});
        const Value alias = outer;
        const Value copy = deep_copy(outer);
        inner.as_list()->items.push_back(Value::integer(2));
        if (!equals(alias, outer) || !identical(alias, outer))
        {
            fail("expected copies to alias the same list");
        }
        if (equals(copy, outer) || repr(copy) != "[[1]]")
        {
            fail("expected deep_copy to be independent: " + repr(copy));
        }
    }

    {
        DictData d;
        d.set(Value::str("a"), Value::integer(1));
        d.set(Value::str("b"), Value::integer(2));
        d.set(Value::str("a"), Value::integer(3));
        if (d.items.size() != 2 || d.items[0].second.as_int() != 3 || d.find(Value::str("c")) != nullptr)
        {
            fail("dict set keeps position and overwrites");
        }
        if (!d.erase(Value::str("a")) || d.erase(Value::str("a")) || d.items.size() != 1)
        {
            fail("dict erase");
        }
        SetData s;
        if (!s.add(Value::integer(1)) || s.add(Value::floating(1.0)) || !s.contains(Value::boolean(true)))
        {
            fail("set membership follows numeric equality");
        }
    }

    {
        const auto a = std::make_shared<OpaqueObject>("Decimal", "Decimal('1.5')");
        const auto b = std::make_shared<OpaqueObject>("Decimal", "Decimal('1.5')");
        if (!equals(Value::object(a), Value::object(b)) || repr(Value::object(a)) != "Decimal('1.5')" ||
            type_name(Value::object(a)) != "Decimal")
        {
            fail("opaque values compare by type and repr");
        }
    }

    if (format_float(1.5) != "1.5" || format_float(-0.0) != "-0.0" || format_float(1e16) != "1e+16" ||
        format_float(123456789.0) != "123456789.0")
    {
        fail("unexpected float formatting");
    }

    std::cout << "OK\n";
    return 0;
}
