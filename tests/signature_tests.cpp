#include <codegate/parser/parser.h>
#include <codegate/proptest/signature.h>
#include <cstdlib>
#include <iostream>
#include <string>
#include <variant>

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static std::variant<codegate::proptest::Signature, codegate::proptest::SignatureError> sig_of(
    const std::string& src, const std::string& name)
{
    // Parameter names in the tree are views into the text.
    static std::string text;
    text = src;
    auto parsed = codegate::parser::parse_source(text);
    const auto* module = std::get_if<codegate::parser::Module>(&parsed);
    if (module == nullptr)
    {
        fail("expected test source to parse: " + src);
    }
    return codegate::proptest::signature_of(*module, name);
}

static std::string param_type(const std::string& annotation)
{
    const auto res = sig_of("def f(x: " + annotation + "):\n    pass\n", "f");
    const auto* sig = std::get_if<codegate::proptest::Signature>(&res);
    if (sig == nullptr || sig->params.size() != 1)
    {
        fail("expected one parameter for annotation " + annotation);
    }
    return codegate::proptest::to_string(sig->params.front().type);
}

static void expect_type(const std::string& annotation, const std::string& expected)
{
    const auto got = param_type(annotation);
    if (got != expected)
    {
        fail("annotation " + annotation + ": got " + got + " expected " + expected);
    }
}

int main()
{
    using namespace codegate::proptest;
    using codegate::runtime::Value;

    expect_type("int", "int");
    expect_type("float", "float");
    expect_type("str", "str");
    expect_type("bytes", "bytes");
    expect_type("list[int]", "list[int]");
    expect_type("List[str]", "list[str]");
    expect_type("list", "list[int]");
    expect_type("dict", "dict[str, int]");
    expect_type("Dict[str, list[float]]", "dict[str, list[float]]");
    expect_type("tuple[int, str]", "tuple[int, str]");
    expect_type("tuple[int, ...]", "tuple[int, ...]");
    expect_type("set[bool]", "set[bool]");
    expect_type("Optional[int]", "int | None");
    expect_type("int | None", "int | None");
    expect_type("None | str", "str | None");
    expect_type("Union[str, None]", "str | None");
    expect_type("Union[int, str]", "int");
    expect_type("typing.List[int]", "list[int]");
    expect_type("'list[int]'", "list[int]");
    expect_type("MyClass", "Any");
    expect_type("Callable[[int], int]", "Any");

    {
        const auto res = sig_of("def f(a, b: float, c=3, *args, d=4, **kw) -> list[int]:\n"
                                "    return [a]\n",
                                "f");
        const auto* sig = std::get_if<Signature>(&res);
        if (sig == nullptr || sig->name != "f" || sig->params.size() != 2)
        {
            fail("expected the two parameters without defaults");
        }
        if (sig->params[0].name != "a" || sig->params[0].type != TypeSpec::of(TypeSpec::Kind::Int) ||
            sig->params[1].name != "b" || sig->params[1].type != TypeSpec::of(TypeSpec::Kind::Float))
        {
            fail("expected an unannotated int and a float");
        }
        if (!sig->returns.has_value() || to_string(*sig->returns) != "list[int]")
        {
            fail("expected the return annotation");
        }
    }

    {
        // The last definition wins.
        const auto res = sig_of("def g(a):\n    pass\ndef g(a: str, b: str):\n    pass\n", "g");
        const auto* sig = std::get_if<Signature>(&res);
        if (sig == nullptr || sig->params.size() != 2 || sig->returns.has_value())
        {
            fail("expected the second definition of g");
        }
    }

    {
        const auto missing = sig_of("def g():\n    pass\n", "h");
        const auto* err = std::get_if<SignatureError>(&missing);
        if (err == nullptr || err->message != "no top-level function named 'h'")
        {
            fail("expected a missing function error");
        }
        const auto nested = sig_of("class A:\n    def m(self):\n        pass\n", "m");
        if (!std::holds_alternative<SignatureError>(nested))
        {
            fail("methods are not top-level functions");
        }
        const auto kwonly = sig_of("def k(a, *, flag):\n    pass\n", "k");
        const auto* kerr = std::get_if<SignatureError>(&kwonly);
        if (kerr == nullptr || kerr->message != "keyword-only parameter 'flag' has no default")
        {
            fail("expected required keyword-only parameters to be rejected");
        }
    }

    {
        const auto list_int = TypeSpec{.kind = TypeSpec::Kind::List,
                                       .args = {TypeSpec::of(TypeSpec::Kind::Int)},
                                       .variadic = false};
        if (!conforms(Value::list({Value::integer(1)}), list_int) ||
            conforms(Value::list({Value::str("x")}), list_int) ||
            conforms(Value::tuple({Value::integer(1)}), list_int))
        {
            fail("unexpected list conformance");
        }
        if (!conforms(Value::integer(2), TypeSpec::of(TypeSpec::Kind::Float)) ||
            conforms(Value::boolean(true), TypeSpec::of(TypeSpec::Kind::Int)) ||
            !conforms(Value::str("x"), TypeSpec::of(TypeSpec::Kind::Any)))
        {
            fail("unexpected scalar conformance");
        }
        const auto opt = TypeSpec{.kind = TypeSpec::Kind::Optional,
                                  .args = {TypeSpec::of(TypeSpec::Kind::Str)},
                                  .variadic = false};
        if (!conforms(Value::none(), opt) || !conforms(Value::str("a"), opt) ||
            conforms(Value::integer(1), opt))
        {
            fail("unexpected optional conformance");
        }
        const auto pair = TypeSpec{.kind = TypeSpec::Kind::Tuple,
                                   .args = {TypeSpec::of(TypeSpec::Kind::Int),
                                            TypeSpec::of(TypeSpec::Kind::Str)},
                                   .variadic = false};
        if (!conforms(Value::tuple({Value::integer(1), Value::str("a")}), pair) ||
            conforms(Value::tuple({Value::integer(1)}), pair))
        {
            fail("unexpected fixed tuple conformance");
        }
        const auto dict = TypeSpec{.kind = TypeSpec::Kind::Dict,
                                   .args = {TypeSpec::of(TypeSpec::Kind::Str),
                                            TypeSpec::of(TypeSpec::Kind::Int)},
                                   .variadic = false};
        if (!conforms(Value::dict({{Value::str("a"), Value::integer(1)}}), dict) ||
            conforms(Value::dict({{Value::integer(1), Value::integer(1)}}), dict))
        {
            fail("unexpected dict conformance");
        }
    }

    std::cout << "OK\n";
    return 0;
}
