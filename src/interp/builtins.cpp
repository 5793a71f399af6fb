#include <algorithm>
#include <charconv>
#include <cmath>
#include <codegate/interp/args.h>
#include <codegate/interp/interpreter.h>
#include <codegate/interp/library.h>
#include <cstdlib>
#include <limits>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace codegate::interp
{

namespace rt = codegate::runtime;
using codegate::lexer::TokenKind;

namespace
{

std::string trim_ascii(std::string_view s)
{
    const auto first = s.find_first_not_of(" \t\n\r\f\v");
    if (first == std::string_view::npos)
    {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\n\r\f\v");
    return std::string(s.substr(first, last - first + 1));
}

std::string lower_ascii(std::string s)
{
    for (auto& c : s)
    {
        if (c >= 'A' && c <= 'Z')
        {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return s;
}

std::string encode_utf8(std::uint32_t cp)
{
    std::string out;
    if (cp < 0x80)
    {
        out.push_back(static_cast<char>(cp));
    }
    else if (cp < 0x800)
    {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp < 0x10000)
    {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    return out;
}

// Decodes `s` when it holds exactly one UTF-8 code point.
std::optional<std::uint32_t> single_code_point(std::string_view s)
{
    if (s.empty())
    {
        return std::nullopt;
    }
    const auto b0 = static_cast<unsigned char>(s[0]);
    std::size_t len = 1;
    std::uint32_t cp = b0;
    if (b0 >= 0xF0)
    {
        len = 4;
        cp = b0 & 0x07;
    }
    else if (b0 >= 0xE0)
    {
        len = 3;
        cp = b0 & 0x0F;
    }
    else if (b0 >= 0xC0)
    {
        len = 2;
        cp = b0 & 0x1F;
    }
    if (s.size() != len)
    {
        return std::nullopt;
    }
    for (std::size_t i = 1; i < len; ++i)
    {
        cp = (cp << 6) | (static_cast<unsigned char>(s[i]) & 0x3F);
    }
    return cp;
}

// Parses the text accepted by int(str, base). `overflow` is set when the
// digits are valid but do not fit in 64 bits.
std::optional<std::int64_t> parse_int_text(std::string_view raw, int base, bool& overflow)
{
    overflow = false;
    std::string text = trim_ascii(raw);
    bool negative = false;
    std::size_t pos = 0;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-'))
    {
        negative = text[pos] == '-';
        ++pos;
    }
    if (text.size() - pos > 1 && text[pos] == '0')
    {
        const char p = static_cast<char>(text[pos + 1] | 0x20);
        const int prefixed = p == 'x' ? 16 : p == 'o' ? 8 : p == 'b' ? 2 : 0;
        if (prefixed != 0 && (base == 0 || base == prefixed))
        {
            base = prefixed;
            pos += 2;
        }
    }
    if (base == 0)
    {
        base = 10;
    }

    std::string digits;
    for (std::size_t i = pos; i < text.size(); ++i)
    {
        if (text[i] == '_')
        {
            if (digits.empty() || i + 1 == text.size() || text[i + 1] == '_')
            {
                return std::nullopt;
            }
            continue;
        }
        digits.push_back(text[i]);
    }
    if (digits.empty())
    {
        return std::nullopt;
    }
    if (negative)
    {
        digits.insert(digits.begin(), '-');
    }
    std::int64_t value = 0;
    const auto res = std::from_chars(digits.data(), digits.data() + digits.size(), value, base);
    if (res.ptr != digits.data() + digits.size())
    {
        return std::nullopt;
    }
    if (res.ec == std::errc::result_out_of_range)
    {
        overflow = true;
        return std::nullopt;
    }
    if (res.ec != std::errc())
    {
        return std::nullopt;
    }
    return value;
}

std::string to_base(std::int64_t v, int base, std::string_view prefix)
{
    const bool negative = v < 0;
    std::uint64_t u = negative ? 0 - static_cast<std::uint64_t>(v) : static_cast<std::uint64_t>(v);
    std::string digits;
    do
    {
        const auto d = static_cast<int>(u % static_cast<std::uint64_t>(base));
        digits.push_back(static_cast<char>(d < 10 ? '0' + d : 'a' + d - 10));
        u /= static_cast<std::uint64_t>(base);
    } while (u != 0);
    std::reverse(digits.begin(), digits.end());
    return (negative ? "-" : "") + std::string(prefix) + digits;
}

EvalResult float_to_int(Interpreter& in, double d)
{
    if (std::isnan(d))
    {
        return in.raise("ValueError", "cannot convert float NaN to integer");
    }
    if (std::isinf(d))
    {
        return in.raise("OverflowError", "cannot convert float infinity to integer");
    }
    const double t = std::trunc(d);
    if (t >= 9223372036854775808.0 || t < -9223372036854775808.0)
    {
        return in.raise("OverflowError", "integer overflow");
    }
    return Value::integer(static_cast<std::int64_t>(t));
}

std::optional<std::vector<Value>> iterable_arg(Interpreter& in, const Args& args,
                                               std::size_t index)
{
    if (index >= args.size())
    {
        return std::vector<Value>{};
    }
    return in.iterate(args[index]);
}

Value iterator(std::string kind, std::vector<Value> items)
{
    return Value::object(std::make_shared<IteratorObject>(std::move(kind), std::move(items)));
}

EvalResult builtin_print(Interpreter& in, Args& args, Kwargs& kwargs)
{
    if (!only_kwargs(in, "print", kwargs, {"sep", "end", "file", "flush"}))
    {
        return std::nullopt;
    }
    std::string sep = " ";
    std::string end = "\n";
    if (const Value* v = find_kwarg(kwargs, "sep"); v != nullptr && !v->is_none())
    {
        const auto* s = str_arg(in, "print", *v);
        if (s == nullptr)
        {
            return std::nullopt;
        }
        sep = *s;
    }
    if (const Value* v = find_kwarg(kwargs, "end"); v != nullptr && !v->is_none())
    {
        const auto* s = str_arg(in, "print", *v);
        if (s == nullptr)
        {
            return std::nullopt;
        }
        end = *s;
    }
    if (const Value* v = find_kwarg(kwargs, "file"); v != nullptr && !v->is_none())
    {
        return in.raise("TypeError", "print() file argument is not supported");
    }
    std::string line;
    for (std::size_t i = 0; i < args.size(); ++i)
    {
        if (i > 0)
        {
            line += sep;
        }
        auto s = in.to_str(args[i]);
        if (!s.has_value())
        {
            return std::nullopt;
        }
        line += *s;
    }
    line += end;
    in.write_output(line);
    return Value::none();
}

EvalResult builtin_range(Interpreter& in, Args& args, Kwargs& kwargs)
{
    if (!no_kwargs(in, "range", kwargs) || !check_arity(in, "range", args, 1, 3))
    {
        return std::nullopt;
    }
    std::int64_t parts[3] = {0, 0, 1};
    for (std::size_t i = 0; i < args.size(); ++i)
    {
        if (!args[i].is_integral())
        {
            return in.raise("TypeError", "'" + rt::type_name(args[i]) +
                                             "' object cannot be interpreted as an integer");
        }
    }
    if (args.size() == 1)
    {
        parts[1] = args[0].as_int();
    }
    else
    {
        parts[0] = args[0].as_int();
        parts[1] = args[1].as_int();
        if (args.size() == 3)
        {
            parts[2] = args[2].as_int();
        }
    }
    if (parts[2] == 0)
    {
        return in.raise("ValueError", "range() arg 3 must not be zero");
    }
    return Value::object(std::make_shared<RangeObject>(parts[0], parts[1], parts[2]));
}

EvalResult builtin_abs(Interpreter& in, Args& args, Kwargs& kwargs)
{
    if (!no_kwargs(in, "abs", kwargs) || !check_arity(in, "abs", args, 1, 1))
    {
        return std::nullopt;
    }
    const Value& v = args[0];
    if (v.is_integral())
    {
        const std::int64_t x = v.as_int();
        if (x == std::numeric_limits<std::int64_t>::min())
        {
            return in.raise("OverflowError", "integer overflow");
        }
        return Value::integer(x < 0 ? -x : x);
    }
    if (v.is_float())
    {
        return Value::floating(std::fabs(v.as_double()));
    }
    return in.raise("TypeError", "bad operand type for abs(): '" + rt::type_name(v) + "'");
}

EvalResult min_max(Interpreter& in, Args& args, Kwargs& kwargs, bool is_max)
{
    const std::string fname = is_max ? "max" : "min";
    if (!only_kwargs(in, fname, kwargs, {"key", "default"}))
    {
        return std::nullopt;
    }
    if (args.empty())
    {
        return in.raise("TypeError", fname + " expected at least 1 argument, got 0");
    }
    std::vector<Value> items;
    if (args.size() == 1)
    {
        auto it = in.iterate(args[0]);
        if (!it.has_value())
        {
            return std::nullopt;
        }
        items = std::move(*it);
    }
    else
    {
        items = args;
    }
    const Value* key = find_kwarg(kwargs, "key");
    if (items.empty())
    {
        if (const Value* d = find_kwarg(kwargs, "default"))
        {
            return *d;
        }
        return in.raise("ValueError", fname + "() iterable argument is empty");
    }

    std::size_t best = 0;
    Value best_key = items[0];
    if (key != nullptr && !key->is_none())
    {
        auto k = in.call_value(*key, {items[0]});
        if (!k.has_value())
        {
            return std::nullopt;
        }
        best_key = std::move(*k);
    }
    for (std::size_t i = 1; i < items.size(); ++i)
    {
        Value k = items[i];
        if (key != nullptr && !key->is_none())
        {
            auto r = in.call_value(*key, {items[i]});
            if (!r.has_value())
            {
                return std::nullopt;
            }
            k = std::move(*r);
        }
        const auto c = is_max ? in.order(best_key, k, "<") : in.order(k, best_key, "<");
        if (!c.has_value())
        {
            return std::nullopt;
        }
        if (*c == -1)
        {
            best = i;
            best_key = std::move(k);
        }
    }
    return items[best];
}

EvalResult builtin_sum(Interpreter& in, Args& args, Kwargs& kwargs)
{
    if (!only_kwargs(in, "sum", kwargs, {"start"}) || !check_arity(in, "sum", args, 1, 2))
    {
        return std::nullopt;
    }
    Value acc = Value::integer(0);
    if (args.size() == 2)
    {
        acc = args[1];
    }
    else if (const Value* s = find_kwarg(kwargs, "start"))
    {
        acc = *s;
    }
    if (acc.is_str())
    {
        return in.raise("TypeError", "sum() can't sum strings [use ''.join(seq) instead]");
    }
    const auto items = in.iterate(args[0]);
    if (!items.has_value())
    {
        return std::nullopt;
    }
    for (const auto& item : *items)
    {
        auto next = in.binary_op(TokenKind::Plus, acc, item);
        if (!next.has_value())
        {
            return std::nullopt;
        }
        acc = std::move(*next);
    }
    return acc;
}

EvalResult builtin_sorted(Interpreter& in, Args& args, Kwargs& kwargs)
{
    if (!only_kwargs(in, "sorted", kwargs, {"key", "reverse"}) ||
        !check_arity(in, "sorted", args, 1, 1))
    {
        return std::nullopt;
    }
    auto items = in.iterate(args[0]);
    if (!items.has_value())
    {
        return std::nullopt;
    }
    const Value* key = find_kwarg(kwargs, "key");
    const Value* reverse = find_kwarg(kwargs, "reverse");
    if (!in.sort_values(*items, key != nullptr ? *key : Value::none(),
                        reverse != nullptr && rt::truthy(*reverse)))
    {
        return std::nullopt;
    }
    return Value::list(std::move(*items));
}

EvalResult builtin_reversed(Interpreter& in, Args& args, Kwargs& kwargs)
{
    if (!no_kwargs(in, "reversed", kwargs) || !check_arity(in, "reversed", args, 1, 1))
    {
        return std::nullopt;
    }
    const Value& v = args[0];
    if (as<IteratorObject>(v) != nullptr || v.is_set())
    {
        return in.raise("TypeError", "'" + rt::type_name(v) + "' object is not reversible");
    }
    auto items = in.iterate(v);
    if (!items.has_value())
    {
        return std::nullopt;
    }
    std::reverse(items->begin(), items->end());
    return iterator("reversed", std::move(*items));
}

EvalResult builtin_enumerate(Interpreter& in, Args& args, Kwargs& kwargs)
{
    if (!only_kwargs(in, "enumerate", kwargs, {"start"}) ||
        !check_arity(in, "enumerate", args, 1, 2))
    {
        return std::nullopt;
    }
    std::int64_t start = 0;
    const Value* s = args.size() == 2 ? &args[1] : find_kwarg(kwargs, "start");
    if (s != nullptr)
    {
        const auto i = int_arg(in, "enumerate", *s);
        if (!i.has_value())
        {
            return std::nullopt;
        }
        start = *i;
    }
    auto items = in.iterate(args[0]);
    if (!items.has_value())
    {
        return std::nullopt;
    }
    std::vector<Value> out;
    out.reserve(items->size());
    for (auto& item : *items)
    {
        out.push_back(Value::tuple({Value::integer(start++), std::move(item)}));
    }
    return iterator("enumerate", std::move(out));
}

EvalResult builtin_zip(Interpreter& in, Args& args, Kwargs& kwargs)
{
    if (!only_kwargs(in, "zip", kwargs, {"strict"}))
    {
        return std::nullopt;
    }
    const Value* strict = find_kwarg(kwargs, "strict");
    std::vector<std::vector<Value>> columns;
    std::size_t n = std::numeric_limits<std::size_t>::max();
    for (const auto& arg : args)
    {
        auto items = in.iterate(arg);
        if (!items.has_value())
        {
            return std::nullopt;
        }
        if (strict != nullptr && rt::truthy(*strict) && !columns.empty() && items->size() != n)
        {
            return in.raise("ValueError", "zip() arguments have different lengths");
        }
        n = std::min(n, items->size());
        columns.push_back(std::move(*items));
    }
    std::vector<Value> out;
    if (columns.empty())
    {
        return iterator("zip", {});
    }
    for (std::size_t i = 0; i < n; ++i)
    {
        std::vector<Value> row;
        row.reserve(columns.size());
        for (const auto& col : columns)
        {
            row.push_back(col[i]);
        }
        out.push_back(Value::tuple(std::move(row)));
    }
    return iterator("zip", std::move(out));
}

EvalResult builtin_map(Interpreter& in, Args& args, Kwargs& kwargs)
{
    if (!no_kwargs(in, "map", kwargs) || !check_arity(in, "map", args, 2, 64))
    {
        return std::nullopt;
    }
    std::vector<std::vector<Value>> columns;
    std::size_t n = std::numeric_limits<std::size_t>::max();
    for (std::size_t i = 1; i < args.size(); ++i)
    {
        auto items = in.iterate(args[i]);
        if (!items.has_value())
        {
            return std::nullopt;
        }
        n = std::min(n, items->size());
        columns.push_back(std::move(*items));
    }
    std::vector<Value> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
    {
        Args call_args;
        for (const auto& col : columns)
        {
            call_args.push_back(col[i]);
        }
        auto r = in.call_value(args[0], std::move(call_args));
        if (!r.has_value())
        {
            return std::nullopt;
        }
        out.push_back(std::move(*r));
    }
    return iterator("map", std::move(out));
}

EvalResult builtin_filter(Interpreter& in, Args& args, Kwargs& kwargs)
{
    if (!no_kwargs(in, "filter", kwargs) || !check_arity(in, "filter", args, 2, 2))
    {
        return std::nullopt;
    }
    auto items = in.iterate(args[1]);
    if (!items.has_value())
    {
        return std::nullopt;
    }
    std::vector<Value> out;
    for (auto& item : *items)
    {
        bool keep = false;
        if (args[0].is_none())
        {
            keep = rt::truthy(item);
        }
        else
        {
            const auto r = in.call_value(args[0], {item});
            if (!r.has_value())
            {
                return std::nullopt;
            }
            keep = rt::truthy(*r);
        }
        if (keep)
        {
            out.push_back(std::move(item));
        }
    }
    return iterator("filter", std::move(out));
}

EvalResult any_all(Interpreter& in, Args& args, Kwargs& kwargs, bool is_all)
{
    const char* fname = is_all ? "all" : "any";
    if (!no_kwargs(in, fname, kwargs) || !check_arity(in, fname, args, 1, 1))
    {
        return std::nullopt;
    }
    const auto items = in.iterate(args[0]);
    if (!items.has_value())
    {
        return std::nullopt;
    }
    for (const auto& item : *items)
    {
        if (rt::truthy(item) != is_all)
        {
            return Value::boolean(!is_all);
        }
    }
    return Value::boolean(is_all);
}

EvalResult ctor_int(Interpreter& in, Args& args, Kwargs& kwargs)
{
    if (!only_kwargs(in, "int", kwargs, {"base"}) || !check_arity(in, "int", args, 0, 2))
    {
        return std::nullopt;
    }
    if (args.empty())
    {
        return Value::integer(0);
    }
    const Value* base_arg = args.size() == 2 ? &args[1] : find_kwarg(kwargs, "base");
    const Value& v = args[0];
    if (base_arg != nullptr)
    {
        const auto base = int_arg(in, "int", *base_arg);
        if (!base.has_value())
        {
            return std::nullopt;
        }
        if (!v.is_str())
        {
            return in.raise("TypeError", "int() can't convert non-string with explicit base");
        }
        if (*base != 0 && (*base < 2 || *base > 36))
        {
            return in.raise("ValueError", "int() base must be >= 2 and <= 36, or 0");
        }
        bool overflow = false;
        const auto r = parse_int_text(v.as_str(), static_cast<int>(*base), overflow);
        if (overflow)
        {
            return in.raise("OverflowError", "integer overflow");
        }
        if (!r.has_value())
        {
            return in.raise("ValueError", "invalid literal for int() with base " +
                                              std::to_string(*base) + ": " + rt::repr(v));
        }
        return Value::integer(*r);
    }
    if (v.is_integral())
    {
        return Value::integer(v.as_int());
    }
    if (v.is_float())
    {
        return float_to_int(in, v.as_double());
    }
    if (v.is_str())
    {
        bool overflow = false;
        const auto r = parse_int_text(v.as_str(), 10, overflow);
        if (overflow)
        {
            return in.raise("OverflowError", "integer overflow");
        }
        if (!r.has_value())
        {
            return in.raise("ValueError", "invalid literal for int() with base 10: " + rt::repr(v));
        }
        return Value::integer(*r);
    }
    return in.raise("TypeError",
                    "int() argument must be a string, a bytes-like object or a real number, not '" +
                        rt::type_name(v) + "'");
}

EvalResult ctor_float(Interpreter& in, Args& args, Kwargs& kwargs)
{
    if (!no_kwargs(in, "float", kwargs) || !check_arity(in, "float", args, 0, 1))
    {
        return std::nullopt;
    }
    if (args.empty())
    {
        return Value::floating(0.0);
    }
    const Value& v = args[0];
    if (v.is_number())
    {
        return Value::floating(v.as_double());
    }
    if (v.is_str())
    {
        std::string text = trim_ascii(v.as_str());
        std::string lowered = lower_ascii(text);
        std::string_view body = lowered;
        bool negative = false;
        if (!body.empty() && (body[0] == '+' || body[0] == '-'))
        {
            negative = body[0] == '-';
            body.remove_prefix(1);
        }
        if (body == "inf" || body == "infinity")
        {
            return Value::floating(negative ? -std::numeric_limits<double>::infinity()
                                            : std::numeric_limits<double>::infinity());
        }
        if (body == "nan")
        {
            return Value::floating(std::numeric_limits<double>::quiet_NaN());
        }
        text.erase(std::remove(text.begin(), text.end(), '_'), text.end());
        if (!text.empty() && text.find_first_of("xXpP") == std::string::npos)
        {
            char* end = nullptr;
            const double d = std::strtod(text.c_str(), &end);
            if (end == text.c_str() + text.size())
            {
                return Value::floating(d);
            }
        }
        return in.raise("ValueError", "could not convert string to float: " + rt::repr(v));
    }
    return in.raise("TypeError", "float() argument must be a string or a real number, not '" +
                                     rt::type_name(v) + "'");
}

EvalResult ctor_str(Interpreter& in, Args& args, Kwargs& kwargs)
{
    if (!only_kwargs(in, "str", kwargs, {"encoding", "errors"}) ||
        !check_arity(in, "str", args, 0, 3))
    {
        return std::nullopt;
    }
    if (args.empty())
    {
        return Value::str("");
    }
    if (const auto* b = std::get_if<rt::Bytes>(&args[0].data);
        b != nullptr && (args.size() > 1 || !kwargs.empty()))
    {
        return Value::str(b->data);
    }
    auto s = in.to_str(args[0]);
    if (!s.has_value())
    {
        return std::nullopt;
    }
    return Value::str(std::move(*s));
}

EvalResult ctor_bool(Interpreter& in, Args& args, Kwargs& kwargs)
{
    if (!no_kwargs(in, "bool", kwargs) || !check_arity(in, "bool", args, 0, 1))
    {
        return std::nullopt;
    }
    if (args.empty())
    {
        return Value::boolean(false);
    }
    if (const auto inst = as<InstanceObject>(args[0]))
    {
        for (const std::string_view name : {"__bool__", "__len__"})
        {
            if (const Value* method = inst->cls->lookup(name))
            {
                const auto r = in.call_value(*method, {args[0]});
                if (!r.has_value())
                {
                    return std::nullopt;
                }
                return Value::boolean(rt::truthy(*r));
            }
        }
        return Value::boolean(true);
    }
    return Value::boolean(rt::truthy(args[0]));
}

EvalResult ctor_list(Interpreter& in, Args& args, Kwargs& kwargs)
{
    if (!no_kwargs(in, "list", kwargs) || !check_arity(in, "list", args, 0, 1))
    {
        return std::nullopt;
    }
    auto items = iterable_arg(in, args, 0);
    if (!items.has_value())
    {
        return std::nullopt;
    }
    return Value::list(std::move(*items));
}

EvalResult ctor_tuple(Interpreter& in, Args& args, Kwargs& kwargs)
{
    if (!no_kwargs(in, "tuple", kwargs) || !check_arity(in, "tuple", args, 0, 1))
    {
        return std::nullopt;
    }
    auto items = iterable_arg(in, args, 0);
    if (!items.has_value())
    {
        return std::nullopt;
    }
    return Value::tuple(std::move(*items));
}

EvalResult ctor_set(Interpreter& in, Args& args, Kwargs& kwargs)
{
    if (!no_kwargs(in, "set", kwargs) || !check_arity(in, "set", args, 0, 1))
    {
        return std::nullopt;
    }
    auto items = iterable_arg(in, args, 0);
    if (!items.has_value())
    {
        return std::nullopt;
    }
    for (const auto& item : *items)
    {
        if (!rt::hashable(item))
        {
            return in.raise("TypeError", "unhashable type: '" + rt::type_name(item) + "'");
        }
    }
    return Value::set(std::move(*items));
}

EvalResult ctor_dict(Interpreter& in, Args& args, Kwargs& kwargs)
{
    if (!check_arity(in, "dict", args, 0, 1))
    {
        return std::nullopt;
    }
    std::vector<std::pair<Value, Value>> entries;
    if (!args.empty())
    {
        if (args[0].is_dict())
        {
            entries = args[0].as_dict()->items;
        }
        else
        {
            const auto items = in.iterate(args[0]);
            if (!items.has_value())
            {
                return std::nullopt;
            }
            for (const auto& item : *items)
            {
                auto pair = in.iterate(item);
                if (!pair.has_value())
                {
                    return std::nullopt;
                }
                if (pair->size() != 2)
                {
                    return in.raise("ValueError",
                                    "dictionary update sequence element has length " +
                                        std::to_string(pair->size()) + "; 2 is required");
                }
                if (!rt::hashable((*pair)[0]))
                {
                    return in.raise("TypeError",
                                    "unhashable type: '" + rt::type_name((*pair)[0]) + "'");
                }
                entries.emplace_back((*pair)[0], (*pair)[1]);
            }
        }
    }
    for (auto& [key, value] : kwargs)
    {
        entries.emplace_back(Value::str(key), value);
    }
    return Value::dict(std::move(entries));
}

EvalResult ctor_bytes(Interpreter& in, Args& args, Kwargs& kwargs)
{
    if (!only_kwargs(in, "bytes", kwargs, {"encoding", "errors"}) ||
        !check_arity(in, "bytes", args, 0, 3))
    {
        return std::nullopt;
    }
    if (args.empty())
    {
        return Value::bytes("");
    }
    const Value& v = args[0];
    if (v.is_str())
    {
        if (args.size() < 2 && find_kwarg(kwargs, "encoding") == nullptr)
        {
            return in.raise("TypeError", "string argument without an encoding");
        }
        return Value::bytes(v.as_str());
    }
    if (v.is_integral())
    {
        if (v.as_int() < 0)
        {
            return in.raise("ValueError", "negative count");
        }
        if (!in.guard_allocation(static_cast<std::size_t>(v.as_int()) / sizeof(Value)))
        {
            return std::nullopt;
        }
        return Value::bytes(std::string(static_cast<std::size_t>(v.as_int()), '\0'));
    }
    const auto items = in.iterate(v);
    if (!items.has_value())
    {
        return std::nullopt;
    }
    std::string out;
    for (const auto& item : *items)
    {
        if (!item.is_integral() || item.as_int() < 0 || item.as_int() > 255)
        {
            return in.raise("ValueError", "bytes must be in range(0, 256)");
        }
        out.push_back(static_cast<char>(item.as_int()));
    }
    return Value::bytes(std::move(out));
}

EvalResult builtin_round(Interpreter& in, Args& args, Kwargs& kwargs)
{
    if (!only_kwargs(in, "round", kwargs, {"ndigits"}) || !check_arity(in, "round", args, 1, 2))
    {
        return std::nullopt;
    }
    const Value* nd = args.size() == 2 ? &args[1] : find_kwarg(kwargs, "ndigits");
    const Value& v = args[0];
    if (!v.is_number())
    {
        return in.raise("TypeError",
                        "type " + rt::type_name(v) + " doesn't define __round__ method");
    }
    if (nd == nullptr || nd->is_none())
    {
        if (v.is_integral())
        {
            return Value::integer(v.as_int());
        }
        return float_to_int(in, std::nearbyint(v.as_double()));
    }
    const auto digits = int_arg(in, "round", *nd);
    if (!digits.has_value())
    {
        return std::nullopt;
    }
    if (v.is_integral())
    {
        if (*digits >= 0)
        {
            return Value::integer(v.as_int());
        }
        const double scale = std::pow(10.0, static_cast<double>(-*digits));
        return float_to_int(in, std::nearbyint(static_cast<double>(v.as_int()) / scale) * scale);
    }
    const double x = v.as_double();
    if (!std::isfinite(x) || *digits > 300)
    {
        return Value::floating(x);
    }
    const double scale = std::pow(10.0, static_cast<double>(*digits));
    const double scaled = x * scale;
    if (!std::isfinite(scaled))
    {
        return Value::floating(x);
    }
    return Value::floating(std::nearbyint(scaled) / scale);
}

EvalResult builtin_divmod(Interpreter& in, Args& args, Kwargs& kwargs)
{
    if (!no_kwargs(in, "divmod", kwargs) || !check_arity(in, "divmod", args, 2, 2))
    {
        return std::nullopt;
    }
    auto q = in.binary_op(TokenKind::DoubleSlash, args[0], args[1]);
    if (!q.has_value())
    {
        return std::nullopt;
    }
    auto r = in.binary_op(TokenKind::Percent, args[0], args[1]);
    if (!r.has_value())
    {
        return std::nullopt;
    }
    return Value::tuple({std::move(*q), std::move(*r)});
}

EvalResult builtin_pow(Interpreter& in, Args& args, Kwargs& kwargs)
{
    if (!no_kwargs(in, "pow", kwargs) || !check_arity(in, "pow", args, 2, 3))
    {
        return std::nullopt;
    }
    if (args.size() == 2 || args[2].is_none())
    {
        return in.binary_op(TokenKind::DoubleStar, args[0], args[1]);
    }
    if (!args[0].is_integral() || !args[1].is_integral() || !args[2].is_integral())
    {
        return in.raise("TypeError", "pow() 3rd argument not allowed unless all arguments are integers");
    }
    const std::int64_t mod = args[2].as_int();
    std::int64_t e = args[1].as_int();
    if (mod == 0)
    {
        return in.raise("ValueError", "pow() 3rd argument cannot be 0");
    }
    if (e < 0)
    {
        return in.raise("ValueError", "pow() negative exponent with a modulus is not supported");
    }
    __int128 result = 1;
    __int128 base = args[0].as_int() % mod;
    while (e > 0)
    {
        if ((e & 1) != 0)
        {
            result = (result * base) % mod;
        }
        base = (base * base) % mod;
        e >>= 1;
    }
    auto r = static_cast<std::int64_t>(result);
    if (r != 0 && ((r < 0) != (mod < 0)))
    {
        r += mod;
    }
    return Value::integer(r);
}

EvalResult builtin_isinstance(Interpreter& in, Args& args, Kwargs& kwargs)
{
    if (!no_kwargs(in, "isinstance", kwargs) || !check_arity(in, "isinstance", args, 2, 2))
    {
        return std::nullopt;
    }
    const auto r = in.is_instance(args[0], args[1]);
    if (!r.has_value())
    {
        return std::nullopt;
    }
    return Value::boolean(*r);
}

EvalResult builtin_issubclass(Interpreter& in, Args& args, Kwargs& kwargs)
{
    if (!no_kwargs(in, "issubclass", kwargs) || !check_arity(in, "issubclass", args, 2, 2))
    {
        return std::nullopt;
    }
    auto check = [&](const Value& base) -> std::optional<bool>
    {
        if (const auto cls = as<ClassObject>(args[0]))
        {
            if (const auto b = as<ClassObject>(base))
            {
                return cls->is_subclass_of(*b);
            }
            if (as<BuiltinType>(base) != nullptr)
            {
                return false;
            }
        }
        else if (const auto bt = as<BuiltinType>(args[0]))
        {
            if (const auto b = as<BuiltinType>(base))
            {
                return bt->name == b->name || (bt->name == "bool" && b->name == "int");
            }
            if (const auto b = as<ClassObject>(base))
            {
                return b->name == "object" && b->base == nullptr;
            }
        }
        in.raise("TypeError", "issubclass() arg 1 must be a class");
        return std::nullopt;
    };
    if (args[1].is_tuple())
    {
        for (const auto& t : args[1].as_tuple()->items)
        {
            const auto r = check(t);
            if (!r.has_value())
            {
                return std::nullopt;
            }
            if (*r)
            {
                return Value::boolean(true);
            }
        }
        return Value::boolean(false);
    }
    const auto r = check(args[1]);
    if (!r.has_value())
    {
        return std::nullopt;
    }
    return Value::boolean(*r);
}

EvalResult builtin_chr(Interpreter& in, Args& args, Kwargs& kwargs)
{
    if (!no_kwargs(in, "chr", kwargs) || !check_arity(in, "chr", args, 1, 1))
    {
        return std::nullopt;
    }
    const auto cp = int_arg(in, "chr", args[0]);
    if (!cp.has_value())
    {
        return std::nullopt;
    }
    if (*cp < 0 || *cp > 0x10FFFF)
    {
        return in.raise("ValueError", "chr() arg not in range(0x110000)");
    }
    return Value::str(encode_utf8(static_cast<std::uint32_t>(*cp)));
}

EvalResult builtin_ord(Interpreter& in, Args& args, Kwargs& kwargs)
{
    if (!no_kwargs(in, "ord", kwargs) || !check_arity(in, "ord", args, 1, 1))
    {
        return std::nullopt;
    }
    if (const auto* b = std::get_if<rt::Bytes>(&args[0].data))
    {
        if (b->data.size() != 1)
        {
            return in.raise("TypeError", "ord() expected a character, but string of length " +
                                             std::to_string(b->data.size()) + " found");
        }
        return Value::integer(static_cast<unsigned char>(b->data[0]));
    }
    const auto* s = str_arg(in, "ord", args[0]);
    if (s == nullptr)
    {
        return std::nullopt;
    }
    const auto cp = single_code_point(*s);
    if (!cp.has_value())
    {
        return in.raise("TypeError", "ord() expected a character, but string of length " +
                                         std::to_string(s->size()) + " found");
    }
    return Value::integer(*cp);
}

NativeFn base_converter(std::string name, int base, std::string prefix)
{
    return [name, base, prefix](Interpreter& in, Args& args, Kwargs& kwargs) -> EvalResult
    {
        if (!no_kwargs(in, name, kwargs) || !check_arity(in, name, args, 1, 1))
        {
            return std::nullopt;
        }
        if (!args[0].is_integral())
        {
            return in.raise("TypeError", "'" + rt::type_name(args[0]) +
                                             "' object cannot be interpreted as an integer");
        }
        return Value::str(to_base(args[0].as_int(), base, prefix));
    };
}

EvalResult builtin_iter(Interpreter& in, Args& args, Kwargs& kwargs)
{
    if (!no_kwargs(in, "iter", kwargs) || !check_arity(in, "iter", args, 1, 1))
    {
        return std::nullopt;
    }
    if (as<IteratorObject>(args[0]) != nullptr)
    {
        return args[0];
    }
    auto items = in.iterate(args[0]);
    if (!items.has_value())
    {
        return std::nullopt;
    }
    return iterator(rt::type_name(args[0]) + "_iterator", std::move(*items));
}

EvalResult builtin_next(Interpreter& in, Args& args, Kwargs& kwargs)
{
    if (!no_kwargs(in, "next", kwargs) || !check_arity(in, "next", args, 1, 2))
    {
        return std::nullopt;
    }
    const auto it = as<IteratorObject>(args[0]);
    if (it == nullptr)
    {
        return in.raise("TypeError", "'" + rt::type_name(args[0]) + "' object is not an iterator");
    }
    if (it->pos < it->items.size())
    {
        return it->items[it->pos++];
    }
    if (args.size() == 2)
    {
        return args[1];
    }
    return in.raise_bare("StopIteration");
}

EvalResult builtin_callable(Interpreter& in, Args& args, Kwargs& kwargs)
{
    if (!no_kwargs(in, "callable", kwargs) || !check_arity(in, "callable", args, 1, 1))
    {
        return std::nullopt;
    }
    const Value& v = args[0];
    bool result = as<FunctionObject>(v) != nullptr || as<NativeFunction>(v) != nullptr ||
                  as<BoundMethod>(v) != nullptr || as<ClassObject>(v) != nullptr ||
                  as<BuiltinType>(v) != nullptr;
    if (const auto inst = as<InstanceObject>(v))
    {
        result = inst->cls->lookup("__call__") != nullptr;
    }
    return Value::boolean(result);
}

EvalResult builtin_hash(Interpreter& in, Args& args, Kwargs& kwargs)
{
    if (!no_kwargs(in, "hash", kwargs) || !check_arity(in, "hash", args, 1, 1))
    {
        return std::nullopt;
    }
    const auto h = in.hash_value(args[0]);
    if (!h.has_value())
    {
        return std::nullopt;
    }
    return Value::integer(*h);
}

EvalResult builtin_format(Interpreter& in, Args& args, Kwargs& kwargs)
{
    if (!no_kwargs(in, "format", kwargs) || !check_arity(in, "format", args, 1, 2))
    {
        return std::nullopt;
    }
    std::string spec;
    if (args.size() == 2)
    {
        const auto* s = str_arg(in, "format", args[1]);
        if (s == nullptr)
        {
            return std::nullopt;
        }
        spec = *s;
    }
    auto r = format_value(in, args[0], spec);
    if (!r.has_value())
    {
        return std::nullopt;
    }
    return Value::str(std::move(*r));
}

// Native class with is_exception set; `__init__` records the arguments.
std::shared_ptr<ClassObject> exception_type(std::string name, std::shared_ptr<ClassObject> base)
{
    auto cls = std::make_shared<ClassObject>();
    cls->name = std::move(name);
    cls->base = std::move(base);
    cls->is_exception = true;
    return cls;
}

} // namespace

void install_builtins(Interpreter& /*interp*/, AttrMap& table)
{
    auto fn = [&table](std::string name, NativeFn f)
    { table.insert_or_assign(name, make_native(name, std::move(f))); };
    auto type = [&table](std::string name, NativeFn ctor)
    {
        table.insert_or_assign(name, Value::object(std::make_shared<BuiltinType>(name, std::move(ctor))));
    };

    fn("print", builtin_print);
    fn("len",
       [](Interpreter& in, Args& args, Kwargs& kwargs) -> EvalResult
       {
           if (!no_kwargs(in, "len", kwargs) || !check_arity(in, "len", args, 1, 1))
           {
               return std::nullopt;
           }
           const auto n = in.length(args[0]);
           if (!n.has_value())
           {
               return std::nullopt;
           }
           return Value::integer(static_cast<std::int64_t>(*n));
       });
    fn("abs", builtin_abs);
    fn("min", [](Interpreter& in, Args& a, Kwargs& k) { return min_max(in, a, k, false); });
    fn("max", [](Interpreter& in, Args& a, Kwargs& k) { return min_max(in, a, k, true); });
    fn("sum", builtin_sum);
    fn("sorted", builtin_sorted);
    fn("reversed", builtin_reversed);
    fn("enumerate", builtin_enumerate);
    fn("zip", builtin_zip);
    fn("map", builtin_map);
    fn("filter", builtin_filter);
    fn("any", [](Interpreter& in, Args& a, Kwargs& k) { return any_all(in, a, k, false); });
    fn("all", [](Interpreter& in, Args& a, Kwargs& k) { return any_all(in, a, k, true); });
    fn("repr",
       [](Interpreter& in, Args& args, Kwargs& kwargs) -> EvalResult
       {
           if (!no_kwargs(in, "repr", kwargs) || !check_arity(in, "repr", args, 1, 1))
           {
               return std::nullopt;
           }
           auto r = in.to_repr(args[0]);
           if (!r.has_value())
           {
               return std::nullopt;
           }
           return Value::str(std::move(*r));
       });
    fn("round", builtin_round);
    fn("divmod", builtin_divmod);
    fn("pow", builtin_pow);
    fn("isinstance", builtin_isinstance);
    fn("issubclass", builtin_issubclass);
    fn("chr", builtin_chr);
    fn("ord", builtin_ord);
    fn("hex", base_converter("hex", 16, "0x"));
    fn("oct", base_converter("oct", 8, "0o"));
    fn("bin", base_converter("bin", 2, "0b"));
    fn("hash", builtin_hash);
    fn("iter", builtin_iter);
    fn("next", builtin_next);
    fn("callable", builtin_callable);
    fn("format", builtin_format);
    fn("super",
       [](Interpreter& in, Args& args, Kwargs&) -> EvalResult
       {
           if (!args.empty())
           {
               return in.raise("TypeError", "super() with arguments is not supported");
           }
           return in.current_super();
       });

    type("int", ctor_int);
    type("float", ctor_float);
    type("str", ctor_str);
    type("bool", ctor_bool);
    type("list", ctor_list);
    type("tuple", ctor_tuple);
    type("dict", ctor_dict);
    type("set", ctor_set);
    type("frozenset", ctor_set);
    type("bytes", ctor_bytes);
    type("range", builtin_range);
    type("type",
         [](Interpreter& in, Args& args, Kwargs& kwargs) -> EvalResult
         {
             if (!no_kwargs(in, "type", kwargs))
             {
                 return std::nullopt;
             }
             if (args.size() != 1)
             {
                 return in.raise("TypeError", "type() takes 1 argument");
             }
             return in.type_of(args[0]);
         });

    auto object = std::make_shared<ClassObject>();
    object->name = "object";
    table.insert_or_assign("object", Value::object(object));

    auto base_exception = exception_type("BaseException", object);
    base_exception->attrs.insert_or_assign(
        "__init__", make_native("__init__",
                                [](Interpreter&, Args& args, Kwargs&) -> EvalResult
                                {
                                    if (!args.empty())
                                    {
                                        if (const auto self = as<InstanceObject>(args[0]))
                                        {
                                            self->args.assign(args.begin() + 1, args.end());
                                        }
                                    }
                                    return Value::none();
                                }));

    std::map<std::string, std::shared_ptr<ClassObject>> classes;
    classes["BaseException"] = base_exception;
    const std::pair<const char*, const char*> hierarchy[] = {
        {"Exception", "BaseException"},
        {"ArithmeticError", "Exception"},
        {"ZeroDivisionError", "ArithmeticError"},
        {"OverflowError", "ArithmeticError"},
        {"LookupError", "Exception"},
        {"IndexError", "LookupError"},
        {"KeyError", "LookupError"},
        {"ValueError", "Exception"},
        {"UnicodeError", "ValueError"},
        {"TypeError", "Exception"},
        {"NameError", "Exception"},
        {"UnboundLocalError", "NameError"},
        {"AttributeError", "Exception"},
        {"AssertionError", "Exception"},
        {"StopIteration", "Exception"},
        {"MemoryError", "Exception"},
        {"RuntimeError", "Exception"},
        {"RecursionError", "RuntimeError"},
        {"NotImplementedError", "RuntimeError"},
        {"ImportError", "Exception"},
        {"ModuleNotFoundError", "ImportError"},
        {"SyntaxError", "Exception"},
        {"OSError", "Exception"},
        {"EOFError", "Exception"},
        {"SystemError", "Exception"},
        {"KeyboardInterrupt", "BaseException"},
    };
    for (const auto& [name, base] : hierarchy)
    {
        classes[name] = exception_type(name, classes.at(base));
    }
    for (const auto& [name, cls] : classes)
    {
        table.insert_or_assign(name, Value::object(cls));
    }
}

} // namespace codegate::interp
