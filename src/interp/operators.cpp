#include <algorithm>
#include <cmath>
#include <codegate/interp/interpreter.h>
#include <codegate/interp/library.h>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace codegate::interp
{

using codegate::lexer::TokenKind;
using codegate::parser::CmpOp;
namespace rt = codegate::runtime;

namespace
{

std::string op_symbol(TokenKind op)
{
    switch (op)
    {
    case TokenKind::Plus:
        return "+";
    case TokenKind::Minus:
        return "-";
    case TokenKind::Star:
        return "*";
    case TokenKind::DoubleStar:
        return "** or pow()";
    case TokenKind::Slash:
        return "/";
    case TokenKind::DoubleSlash:
        return "//";
    case TokenKind::Percent:
        return "%";
    case TokenKind::Amper:
        return "&";
    case TokenKind::Pipe:
        return "|";
    case TokenKind::Caret:
        return "^";
    case TokenKind::LeftShift:
        return "<<";
    case TokenKind::RightShift:
        return ">>";
    case TokenKind::At:
        return "@";
    default:
        return "?";
    }
}

// Dunder pair (forward, reflected) that user classes may define for `op`.
std::pair<std::string_view, std::string_view> op_dunders(TokenKind op)
{
    switch (op)
    {
    case TokenKind::Plus:
        return {"__add__", "__radd__"};
    case TokenKind::Minus:
        return {"__sub__", "__rsub__"};
    case TokenKind::Star:
        return {"__mul__", "__rmul__"};
    case TokenKind::DoubleStar:
        return {"__pow__", "__rpow__"};
    case TokenKind::Slash:
        return {"__truediv__", "__rtruediv__"};
    case TokenKind::DoubleSlash:
        return {"__floordiv__", "__rfloordiv__"};
    case TokenKind::Percent:
        return {"__mod__", "__rmod__"};
    case TokenKind::Amper:
        return {"__and__", "__rand__"};
    case TokenKind::Pipe:
        return {"__or__", "__ror__"};
    case TokenKind::Caret:
        return {"__xor__", "__rxor__"};
    case TokenKind::LeftShift:
        return {"__lshift__", "__rlshift__"};
    case TokenKind::RightShift:
        return {"__rshift__", "__rrshift__"};
    case TokenKind::At:
        return {"__matmul__", "__rmatmul__"};
    default:
        return {"", ""};
    }
}

// Indices selected by a slice over a sequence of length n.
std::vector<std::size_t> slice_indices(const SliceObject& s, std::size_t size, bool& bad_step)
{
    const auto n = static_cast<std::int64_t>(size);
    const std::int64_t step = s.step.value_or(1);
    std::vector<std::size_t> out;
    bad_step = step == 0;
    if (bad_step)
    {
        return out;
    }

    auto clamp = [&](std::optional<std::int64_t> v, std::int64_t fallback) -> std::int64_t
    {
        if (!v.has_value())
        {
            return fallback;
        }
        std::int64_t i = *v;
        if (i < 0)
        {
            i += n;
            if (i < 0)
            {
                i = step < 0 ? -1 : 0;
            }
        }
        else if (i >= n)
        {
            i = step < 0 ? n - 1 : n;
        }
        return i;
    };

    const std::int64_t lo = clamp(s.lower, step > 0 ? 0 : n - 1);
    const std::int64_t hi = clamp(s.upper, step > 0 ? n : -1);
    for (std::int64_t i = lo; step > 0 ? i < hi : i > hi; i += step)
    {
        out.push_back(static_cast<std::size_t>(i));
    }
    return out;
}

std::optional<std::size_t> normalize_index(std::int64_t i, std::size_t size)
{
    const auto n = static_cast<std::int64_t>(size);
    if (i < 0)
    {
        i += n;
    }
    if (i < 0 || i >= n)
    {
        return std::nullopt;
    }
    return static_cast<std::size_t>(i);
}

bool is_sequence(const Value& v)
{
    return v.is_list() || v.is_tuple();
}

const std::vector<Value>& sequence_items(const Value& v)
{
    return v.is_list() ? v.as_list()->items : v.as_tuple()->items;
}

} // namespace

// --- arithmetic -------------------------------------------------------------

namespace
{

EvalResult int_binop(Interpreter& in, TokenKind op, std::int64_t x, std::int64_t y)
{
    std::int64_t r = 0;
    switch (op)
    {
    case TokenKind::Plus:
        if (__builtin_add_overflow(x, y, &r))
        {
            return in.raise("OverflowError", "integer overflow");
        }
        return Value::integer(r);
    case TokenKind::Minus:
        if (__builtin_sub_overflow(x, y, &r))
        {
            return in.raise("OverflowError", "integer overflow");
        }
        return Value::integer(r);
    case TokenKind::Star:
        if (__builtin_mul_overflow(x, y, &r))
        {
            return in.raise("OverflowError", "integer overflow");
        }
        return Value::integer(r);
    case TokenKind::Slash:
        if (y == 0)
        {
            return in.raise("ZeroDivisionError", "division by zero");
        }
        return Value::floating(static_cast<double>(x) / static_cast<double>(y));
    case TokenKind::DoubleSlash:
    {
        if (y == 0)
        {
            return in.raise("ZeroDivisionError", "integer division or modulo by zero");
        }
        if (x == std::numeric_limits<std::int64_t>::min() && y == -1)
        {
            return in.raise("OverflowError", "integer overflow");
        }
        std::int64_t q = x / y;
        if (x % y != 0 && ((x < 0) != (y < 0)))
        {
            --q;
        }
        return Value::integer(q);
    }
    case TokenKind::Percent:
    {
        if (y == 0)
        {
            return in.raise("ZeroDivisionError", "integer modulo by zero");
        }
        if (y == -1)
        {
            return Value::integer(0);
        }
        std::int64_t m = x % y;
        if (m != 0 && ((m < 0) != (y < 0)))
        {
            m += y;
        }
        return Value::integer(m);
    }
    case TokenKind::DoubleStar:
    {
        if (y < 0)
        {
            if (x == 0)
            {
                return in.raise("ZeroDivisionError",
                                "0.0 cannot be raised to a negative power");
            }
            return Value::floating(std::pow(static_cast<double>(x), static_cast<double>(y)));
        }
        std::int64_t result = 1;
        std::int64_t base = x;
        std::int64_t e = y;
        while (e > 0)
        {
            if ((e & 1) != 0 && __builtin_mul_overflow(result, base, &result))
            {
                return in.raise("OverflowError", "integer overflow");
            }
            e >>= 1;
            if (e > 0 && __builtin_mul_overflow(base, base, &base))
            {
                return in.raise("OverflowError", "integer overflow");
            }
        }
        return Value::integer(result);
    }
    case TokenKind::LeftShift:
        if (y < 0)
        {
            return in.raise("ValueError", "negative shift count");
        }
        if (x == 0)
        {
            return Value::integer(0);
        }
        if (y >= 63 || __builtin_mul_overflow(x, std::int64_t{1} << y, &r))
        {
            return in.raise("OverflowError", "integer overflow");
        }
        return Value::integer(r);
    case TokenKind::RightShift:
        if (y < 0)
        {
            return in.raise("ValueError", "negative shift count");
        }
        if (y >= 63)
        {
            return Value::integer(x < 0 ? -1 : 0);
        }
        return Value::integer(x >> y);
    case TokenKind::Amper:
        return Value::integer(x & y);
    case TokenKind::Pipe:
        return Value::integer(x | y);
    case TokenKind::Caret:
        return Value::integer(x ^ y);
    default:
        return in.raise("TypeError", "unsupported operand type(s) for " + op_symbol(op) +
                                         ": 'int' and 'int'");
    }
}

EvalResult float_binop(Interpreter& in, TokenKind op, double x, double y)
{
    switch (op)
    {
    case TokenKind::Plus:
        return Value::floating(x + y);
    case TokenKind::Minus:
        return Value::floating(x - y);
    case TokenKind::Star:
        return Value::floating(x * y);
    case TokenKind::Slash:
        if (y == 0.0)
        {
            return in.raise("ZeroDivisionError", "float division by zero");
        }
        return Value::floating(x / y);
    case TokenKind::DoubleSlash:
        if (y == 0.0)
        {
            return in.raise("ZeroDivisionError", "float floor division by zero");
        }
        return Value::floating(std::floor(x / y));
    case TokenKind::Percent:
    {
        if (y == 0.0)
        {
            return in.raise("ZeroDivisionError", "float modulo");
        }
        double m = std::fmod(x, y);
        if (m != 0.0 && ((m < 0.0) != (y < 0.0)))
        {
            m += y;
        }
        return Value::floating(m);
    }
    case TokenKind::DoubleStar:
    {
        if (x == 0.0 && y < 0.0)
        {
            return in.raise("ZeroDivisionError", "0.0 cannot be raised to a negative power");
        }
        if (x < 0.0 && std::floor(y) != y)
        {
            return in.raise("ValueError", "negative number cannot be raised to a fractional power");
        }
        const double r = std::pow(x, y);
        if (std::isinf(r) && std::isfinite(x) && std::isfinite(y))
        {
            return in.raise("OverflowError", "(34, 'Numerical result out of range')");
        }
        return Value::floating(r);
    }
    default:
        return in.raise("TypeError", "unsupported operand type(s) for " + op_symbol(op) +
                                         ": 'float' and 'float'");
    }
}

std::optional<std::string> repeat(Interpreter& in, const std::string& s, std::int64_t n)
{
    if (n <= 0 || s.empty())
    {
        return std::string();
    }
    std::size_t total = 0;
    if (__builtin_mul_overflow(s.size(), static_cast<std::size_t>(n), &total))
    {
        return in.out_of_memory("string repetition exceeds the memory limit");
    }
    if (!in.guard_allocation(total / sizeof(Value) + 1))
    {
        return std::nullopt;
    }
    std::string out;
    out.reserve(s.size() * static_cast<std::size_t>(n));
    for (std::int64_t i = 0; i < n; ++i)
    {
        out += s;
    }
    return out;
}

std::optional<std::vector<Value>> repeat_items(Interpreter& in, const std::vector<Value>& items,
                                               std::int64_t n)
{
    if (n <= 0 || items.empty())
    {
        return std::vector<Value>{};
    }
    if (static_cast<std::uint64_t>(n) > std::numeric_limits<std::size_t>::max() / items.size() ||
        !in.guard_allocation(items.size() * static_cast<std::size_t>(n)))
    {
        if (!in.has_pending())
        {
            in.out_of_memory("sequence repetition exceeds the memory limit");
        }
        return std::nullopt;
    }
    std::vector<Value> out;
    out.reserve(items.size() * static_cast<std::size_t>(n));
    for (std::int64_t i = 0; i < n; ++i)
    {
        out.insert(out.end(), items.begin(), items.end());
    }
    return out;
}

} // namespace

EvalResult Interpreter::binary_op(TokenKind op, const Value& a, const Value& b)
{
    if (a.is_integral() && b.is_integral())
    {
        if (a.is_bool() && b.is_bool() &&
            (op == TokenKind::Amper || op == TokenKind::Pipe || op == TokenKind::Caret))
        {
            const bool x = std::get<bool>(a.data);
            const bool y = std::get<bool>(b.data);
            return Value::boolean(op == TokenKind::Amper ? (x && y)
                                  : op == TokenKind::Pipe ? (x || y)
                                                          : (x != y));
        }
        return int_binop(*this, op, a.as_int(), b.as_int());
    }
    if (a.is_number() && b.is_number())
    {
        return float_binop(*this, op, a.as_double(), b.as_double());
    }

    if (a.is_str())
    {
        if (op == TokenKind::Plus && b.is_str())
        {
            if (!guard_allocation((a.as_str().size() + b.as_str().size()) / sizeof(Value)))
            {
                return std::nullopt;
            }
            return Value::str(a.as_str() + b.as_str());
        }
        if (op == TokenKind::Star && b.is_integral())
        {
            auto s = repeat(*this, a.as_str(), b.as_int());
            if (!s.has_value())
            {
                return std::nullopt;
            }
            return Value::str(std::move(*s));
        }
        if (op == TokenKind::Percent)
        {
            auto s = percent_format(*this, a.as_str(), b);
            if (!s.has_value())
            {
                return std::nullopt;
            }
            return Value::str(std::move(*s));
        }
    }
    if (op == TokenKind::Star && a.is_integral() && b.is_str())
    {
        return binary_op(op, b, a);
    }

    if (const auto* ba = std::get_if<rt::Bytes>(&a.data))
    {
        if (const auto* bb = std::get_if<rt::Bytes>(&b.data); bb != nullptr && op == TokenKind::Plus)
        {
            return Value::bytes(ba->data + bb->data);
        }
        if (op == TokenKind::Star && b.is_integral())
        {
            auto s = repeat(*this, ba->data, b.as_int());
            if (!s.has_value())
            {
                return std::nullopt;
            }
            return Value::bytes(std::move(*s));
        }
    }

    if (is_sequence(a))
    {
        if (op == TokenKind::Plus && a.data.index() == b.data.index())
        {
            std::vector<Value> items = sequence_items(a);
            const auto& more = sequence_items(b);
            if (!guard_allocation(items.size() + more.size()))
            {
                return std::nullopt;
            }
            items.insert(items.end(), more.begin(), more.end());
            return a.is_list() ? Value::list(std::move(items)) : Value::tuple(std::move(items));
        }
        if (op == TokenKind::Star && b.is_integral())
        {
            auto items = repeat_items(*this, sequence_items(a), b.as_int());
            if (!items.has_value())
            {
                return std::nullopt;
            }
            return a.is_list() ? Value::list(std::move(*items)) : Value::tuple(std::move(*items));
        }
    }
    if (op == TokenKind::Star && a.is_integral() && is_sequence(b))
    {
        return binary_op(op, b, a);
    }

    if (a.is_set() && b.is_set())
    {
        const auto& x = a.as_set()->items;
        const auto& y = *b.as_set();
        std::vector<Value> out;
        switch (op)
        {
        case TokenKind::Pipe:
            out = x;
            for (const auto& v : y.items)
            {
                if (!a.as_set()->contains(v))
                {
                    out.push_back(v);
                }
            }
            return Value::set(std::move(out));
        case TokenKind::Amper:
            for (const auto& v : x)
            {
                if (y.contains(v))
                {
                    out.push_back(v);
                }
            }
            return Value::set(std::move(out));
        case TokenKind::Minus:
            for (const auto& v : x)
            {
                if (!y.contains(v))
                {
                    out.push_back(v);
                }
            }
            return Value::set(std::move(out));
        case TokenKind::Caret:
            for (const auto& v : x)
            {
                if (!y.contains(v))
                {
                    out.push_back(v);
                }
            }
            for (const auto& v : y.items)
            {
                if (!a.as_set()->contains(v))
                {
                    out.push_back(v);
                }
            }
            return Value::set(std::move(out));
        default:
            break;
        }
    }

    if (a.is_dict() && b.is_dict() && op == TokenKind::Pipe)
    {
        auto merged = std::make_shared<rt::DictData>(*a.as_dict());
        for (const auto& [k, v] : b.as_dict()->items)
        {
            merged->set(k, v);
        }
        return Value{.data = rt::DictRef(std::move(merged))};
    }

    const auto [forward, reflected] = op_dunders(op);
    if (!forward.empty())
    {
        if (const auto method = find_method(a, forward))
        {
            return call_value(*method, {b});
        }
        if (const auto method = find_method(b, reflected))
        {
            return call_value(*method, {a});
        }
    }

    return raise("TypeError", "unsupported operand type(s) for " + op_symbol(op) + ": '" +
                                  rt::type_name(a) + "' and '" + rt::type_name(b) + "'");
}

EvalResult Interpreter::unary_op(TokenKind op, const Value& v)
{
    if (op == TokenKind::KwNot)
    {
        return Value::boolean(!rt::truthy(v));
    }
    if (v.is_integral())
    {
        const std::int64_t x = v.as_int();
        switch (op)
        {
        case TokenKind::Minus:
            if (x == std::numeric_limits<std::int64_t>::min())
            {
                return raise("OverflowError", "integer overflow");
            }
            return Value::integer(-x);
        case TokenKind::Plus:
            return Value::integer(x);
        case TokenKind::Tilde:
            return Value::integer(~x);
        default:
            break;
        }
    }
    else if (v.is_float())
    {
        if (op == TokenKind::Minus)
        {
            return Value::floating(-v.as_double());
        }
        if (op == TokenKind::Plus)
        {
            return v;
        }
    }
    const std::string_view dunder = op == TokenKind::Minus  ? "__neg__"
                                    : op == TokenKind::Plus ? "__pos__"
                                                            : "__invert__";
    if (const auto method = find_method(v, dunder))
    {
        return call_value(*method, {});
    }
    const std::string sym = op == TokenKind::Minus ? "-" : op == TokenKind::Plus ? "+" : "~";
    return raise("TypeError",
                 "bad operand type for unary " + sym + ": '" + rt::type_name(v) + "'");
}

// --- comparison -------------------------------------------------------------

std::optional<bool> Interpreter::eq(const Value& a, const Value& b)
{
    for (const auto& [self, other] : {std::pair{&a, &b}, std::pair{&b, &a}})
    {
        if (const auto method = find_method(*self, "__eq__"))
        {
            const auto r = call_value(*method, {*other});
            if (!r.has_value())
            {
                return std::nullopt;
            }
            return rt::truthy(*r);
        }
    }
    return rt::equals(a, b);
}

std::optional<int> Interpreter::order(const Value& a, const Value& b, std::string_view op)
{
    if (const auto method = find_method(a, "__lt__"))
    {
        const auto less = call_value(*method, {b});
        if (!less.has_value())
        {
            return std::nullopt;
        }
        if (rt::truthy(*less))
        {
            return -1;
        }
        if (const auto reverse = find_method(b, "__lt__"))
        {
            const auto greater = call_value(*reverse, {a});
            if (!greater.has_value())
            {
                return std::nullopt;
            }
            return rt::truthy(*greater) ? 1 : 0;
        }
        return 0;
    }
    if (const auto cmp = rt::compare(a, b))
    {
        return cmp;
    }
    raise("TypeError", "'" + std::string(op) + "' not supported between instances of '" +
                           rt::type_name(a) + "' and '" + rt::type_name(b) + "'");
    return std::nullopt;
}

EvalResult Interpreter::compare_op(CmpOp op, const Value& a, const Value& b)
{
    switch (op)
    {
    case CmpOp::Eq:
    case CmpOp::NotEq:
    {
        const auto r = eq(a, b);
        if (!r.has_value())
        {
            return std::nullopt;
        }
        return Value::boolean(op == CmpOp::Eq ? *r : !*r);
    }
    case CmpOp::In:
    case CmpOp::NotIn:
    {
        const auto r = contains(b, a);
        if (!r.has_value())
        {
            return std::nullopt;
        }
        return Value::boolean(op == CmpOp::In ? *r : !*r);
    }
    case CmpOp::Is:
        return Value::boolean(rt::identical(a, b));
    case CmpOp::IsNot:
        return Value::boolean(!rt::identical(a, b));
    case CmpOp::Lt:
    case CmpOp::LtE:
    case CmpOp::Gt:
    case CmpOp::GtE:
        break;
    }

    const std::string_view sym = op == CmpOp::Lt    ? "<"
                                 : op == CmpOp::LtE ? "<="
                                 : op == CmpOp::Gt  ? ">"
                                                    : ">=";
    const auto c = op == CmpOp::Gt || op == CmpOp::GtE ? order(b, a, sym) : order(a, b, sym);
    if (!c.has_value())
    {
        return std::nullopt;
    }
    if (*c == 2)
    {
        return Value::boolean(false);
    }
    const bool strict = op == CmpOp::Lt || op == CmpOp::Gt;
    return Value::boolean(strict ? *c < 0 : *c <= 0);
}

// --- containers -------------------------------------------------------------

std::optional<std::vector<Value>> Interpreter::iterate(const Value& v)
{
    if (is_sequence(v))
    {
        return sequence_items(v);
    }
    if (v.is_str())
    {
        std::vector<Value> out;
        out.reserve(v.as_str().size());
        for (const char c : v.as_str())
        {
            out.push_back(Value::str(std::string(1, c)));
        }
        return out;
    }
    if (const auto* b = std::get_if<rt::Bytes>(&v.data))
    {
        std::vector<Value> out;
        for (const char c : b->data)
        {
            out.push_back(Value::integer(static_cast<unsigned char>(c)));
        }
        return out;
    }
    if (v.is_dict())
    {
        std::vector<Value> out;
        out.reserve(v.as_dict()->items.size());
        for (const auto& [k, _] : v.as_dict()->items)
        {
            out.push_back(k);
        }
        return out;
    }
    if (v.is_set())
    {
        return v.as_set()->items;
    }
    if (const auto range = as<RangeObject>(v))
    {
        const std::size_t n = range->size();
        if (!guard_allocation(n))
        {
            return std::nullopt;
        }
        std::vector<Value> out;
        out.reserve(n);
        for (std::size_t i = 0; i < n; ++i)
        {
            out.push_back(Value::integer(range->at(i)));
        }
        return out;
    }
    if (const auto it = as<IteratorObject>(v))
    {
        std::vector<Value> out(it->items.begin() + static_cast<std::ptrdiff_t>(it->pos),
                               it->items.end());
        it->pos = it->items.size();
        return out;
    }
    if (const auto method = find_method(v, "__iter__"))
    {
        const auto result = call_value(*method, {});
        if (!result.has_value())
        {
            return std::nullopt;
        }
        if (as<InstanceObject>(*result) != nullptr)
        {
            return raise("TypeError", "user-defined iterator objects are not supported");
        }
        return iterate(*result);
    }
    return raise("TypeError", "'" + rt::type_name(v) + "' object is not iterable");
}

std::optional<bool> Interpreter::contains(const Value& container, const Value& item)
{
    if (container.is_str())
    {
        if (!item.is_str())
        {
            raise("TypeError", "'in <string>' requires string as left operand, not " +
                                   rt::type_name(item));
            return std::nullopt;
        }
        return container.as_str().find(item.as_str()) != std::string::npos;
    }
    if (const auto* b = std::get_if<rt::Bytes>(&container.data))
    {
        if (const auto* needle = std::get_if<rt::Bytes>(&item.data))
        {
            return b->data.find(needle->data) != std::string::npos;
        }
        if (item.is_integral())
        {
            return b->data.find(static_cast<char>(item.as_int())) != std::string::npos;
        }
        raise("TypeError", "a bytes-like object is required, not '" + rt::type_name(item) + "'");
        return std::nullopt;
    }
    if (is_sequence(container))
    {
        for (const auto& v : sequence_items(container))
        {
            const auto r = eq(v, item);
            if (!r.has_value())
            {
                return std::nullopt;
            }
            if (*r)
            {
                return true;
            }
        }
        return false;
    }
    if (container.is_dict() || container.is_set())
    {
        if (!rt::hashable(item))
        {
            raise("TypeError", "unhashable type: '" + rt::type_name(item) + "'");
            return std::nullopt;
        }
        return container.is_dict() ? container.as_dict()->find(item) != nullptr
                                   : container.as_set()->contains(item);
    }
    if (const auto range = as<RangeObject>(container))
    {
        return item.is_integral() && range->contains(item.as_int());
    }
    if (const auto method = find_method(container, "__contains__"))
    {
        const auto r = call_value(*method, {item});
        if (!r.has_value())
        {
            return std::nullopt;
        }
        return rt::truthy(*r);
    }
    if (as<IteratorObject>(container) != nullptr || find_method(container, "__iter__"))
    {
        const auto items = iterate(container);
        if (!items.has_value())
        {
            return std::nullopt;
        }
        for (const auto& v : *items)
        {
            if (rt::equals(v, item))
            {
                return true;
            }
        }
        return false;
    }
    raise("TypeError", "argument of type '" + rt::type_name(container) + "' is not iterable");
    return std::nullopt;
}

std::optional<std::size_t> Interpreter::length(const Value& v)
{
    if (v.is_str())
    {
        return v.as_str().size();
    }
    if (const auto* b = std::get_if<rt::Bytes>(&v.data))
    {
        return b->data.size();
    }
    if (is_sequence(v))
    {
        return sequence_items(v).size();
    }
    if (v.is_dict())
    {
        return v.as_dict()->items.size();
    }
    if (v.is_set())
    {
        return v.as_set()->items.size();
    }
    if (const auto range = as<RangeObject>(v))
    {
        return range->size();
    }
    if (const auto method = find_method(v, "__len__"))
    {
        const auto r = call_value(*method, {});
        if (!r.has_value())
        {
            return std::nullopt;
        }
        if (!r->is_integral() || r->as_int() < 0)
        {
            raise("TypeError", "__len__() should return a non-negative integer");
            return std::nullopt;
        }
        return static_cast<std::size_t>(r->as_int());
    }
    raise("TypeError", "object of type '" + rt::type_name(v) + "' has no len()");
    return std::nullopt;
}

EvalResult Interpreter::get_item(const Value& obj, const Value& index)
{
    const auto slice = as<SliceObject>(index);

    if (obj.is_str() || std::holds_alternative<rt::Bytes>(obj.data))
    {
        const bool is_bytes = !obj.is_str();
        const std::string& s = is_bytes ? std::get<rt::Bytes>(obj.data).data : obj.as_str();
        if (slice != nullptr)
        {
            bool bad_step = false;
            const auto idx = slice_indices(*slice, s.size(), bad_step);
            if (bad_step)
            {
                return raise("ValueError", "slice step cannot be zero");
            }
            std::string out;
            out.reserve(idx.size());
            for (const auto i : idx)
            {
                out.push_back(s[i]);
            }
            return is_bytes ? Value::bytes(std::move(out)) : Value::str(std::move(out));
        }
        if (!index.is_integral())
        {
            return raise("TypeError", std::string(is_bytes ? "byte" : "string") +
                                          " indices must be integers, not '" +
                                          rt::type_name(index) + "'");
        }
        const auto i = normalize_index(index.as_int(), s.size());
        if (!i.has_value())
        {
            return raise("IndexError", std::string(is_bytes ? "index" : "string index") +
                                           " out of range");
        }
        if (is_bytes)
        {
            return Value::integer(static_cast<unsigned char>(s[*i]));
        }
        return Value::str(std::string(1, s[*i]));
    }

    if (is_sequence(obj))
    {
        const auto& items = sequence_items(obj);
        const std::string kind = obj.is_list() ? "list" : "tuple";
        if (slice != nullptr)
        {
            bool bad_step = false;
            const auto idx = slice_indices(*slice, items.size(), bad_step);
            if (bad_step)
            {
                return raise("ValueError", "slice step cannot be zero");
            }
            std::vector<Value> out;
            out.reserve(idx.size());
            for (const auto i : idx)
            {
                out.push_back(items[i]);
            }
            return obj.is_list() ? Value::list(std::move(out)) : Value::tuple(std::move(out));
        }
        if (!index.is_integral())
        {
            return raise("TypeError", kind + " indices must be integers or slices, not " +
                                          rt::type_name(index));
        }
        const auto i = normalize_index(index.as_int(), items.size());
        if (!i.has_value())
        {
            return raise("IndexError", kind + " index out of range");
        }
        return items[*i];
    }

    if (obj.is_dict())
    {
        if (!rt::hashable(index))
        {
            return raise("TypeError", "unhashable type: '" + rt::type_name(index) + "'");
        }
        if (const Value* v = obj.as_dict()->find(index))
        {
            return *v;
        }
        return raise_with("KeyError", index);
    }

    if (const auto range = as<RangeObject>(obj))
    {
        if (!index.is_integral())
        {
            return raise("TypeError", "range indices must be integers");
        }
        const auto i = normalize_index(index.as_int(), range->size());
        if (!i.has_value())
        {
            return raise("IndexError", "range object index out of range");
        }
        return Value::integer(range->at(*i));
    }

    // Generic aliases such as list[int] or Optional[str] in annotations.
    if (as<BuiltinType>(obj) != nullptr || as<TypingObject>(obj) != nullptr)
    {
        return obj;
    }

    if (const auto method = find_method(obj, "__getitem__"))
    {
        return call_value(*method, {index});
    }
    return raise("TypeError", "'" + rt::type_name(obj) + "' object is not subscriptable");
}

bool Interpreter::set_item(const Value& obj, const Value& index, Value value)
{
    if (obj.is_list())
    {
        auto& items = obj.as_list()->items;
        if (const auto slice = as<SliceObject>(index))
        {
            auto replacement = iterate(value);
            if (!replacement.has_value())
            {
                return false;
            }
            if (!slice->step.has_value() || *slice->step == 1)
            {
                const auto n = static_cast<std::int64_t>(items.size());
                auto bound = [n](std::optional<std::int64_t> v, std::int64_t fallback)
                {
                    std::int64_t i = v.value_or(fallback);
                    if (i < 0)
                    {
                        i = std::max<std::int64_t>(0, i + n);
                    }
                    return std::min(i, n);
                };
                const std::int64_t lo = bound(slice->lower, 0);
                const std::int64_t hi = std::max(lo, bound(slice->upper, n));
                if (!guard_allocation(items.size() + replacement->size()))
                {
                    return false;
                }
                items.erase(items.begin() + lo, items.begin() + hi);
                items.insert(items.begin() + lo, replacement->begin(), replacement->end());
                return true;
            }
            bool bad_step = false;
            const auto idx = slice_indices(*slice, items.size(), bad_step);
            if (bad_step)
            {
                raise("ValueError", "slice step cannot be zero");
                return false;
            }
            if (idx.size() != replacement->size())
            {
                raise("ValueError", "attempt to assign sequence of size " +
                                        std::to_string(replacement->size()) +
                                        " to extended slice of size " + std::to_string(idx.size()));
                return false;
            }
            for (std::size_t k = 0; k < idx.size(); ++k)
            {
                items[idx[k]] = (*replacement)[k];
            }
            return true;
        }
        if (!index.is_integral())
        {
            raise("TypeError",
                  "list indices must be integers or slices, not " + rt::type_name(index));
            return false;
        }
        const auto i = normalize_index(index.as_int(), items.size());
        if (!i.has_value())
        {
            raise("IndexError", "list assignment index out of range");
            return false;
        }
        items[*i] = std::move(value);
        return true;
    }
    if (obj.is_dict())
    {
        if (!rt::hashable(index))
        {
            raise("TypeError", "unhashable type: '" + rt::type_name(index) + "'");
            return false;
        }
        obj.as_dict()->set(index, std::move(value));
        return true;
    }
    if (const auto method = find_method(obj, "__setitem__"))
    {
        return call_value(*method, {index, std::move(value)}).has_value();
    }
    raise("TypeError", "'" + rt::type_name(obj) + "' object does not support item assignment");
    return false;
}

bool Interpreter::del_item(const Value& obj, const Value& index)
{
    if (obj.is_list())
    {
        auto& items = obj.as_list()->items;
        if (const auto slice = as<SliceObject>(index))
        {
            bool bad_step = false;
            auto idx = slice_indices(*slice, items.size(), bad_step);
            if (bad_step)
            {
                raise("ValueError", "slice step cannot be zero");
                return false;
            }
            std::sort(idx.begin(), idx.end(), std::greater<>());
            for (const auto i : idx)
            {
                items.erase(items.begin() + static_cast<std::ptrdiff_t>(i));
            }
            return true;
        }
        if (!index.is_integral())
        {
            raise("TypeError",
                  "list indices must be integers or slices, not " + rt::type_name(index));
            return false;
        }
        const auto i = normalize_index(index.as_int(), items.size());
        if (!i.has_value())
        {
            raise("IndexError", "list assignment index out of range");
            return false;
        }
        items.erase(items.begin() + static_cast<std::ptrdiff_t>(*i));
        return true;
    }
    if (obj.is_dict())
    {
        if (!rt::hashable(index))
        {
            raise("TypeError", "unhashable type: '" + rt::type_name(index) + "'");
            return false;
        }
        if (!obj.as_dict()->erase(index))
        {
            raise_with("KeyError", index);
            return false;
        }
        return true;
    }
    if (const auto method = find_method(obj, "__delitem__"))
    {
        return call_value(*method, {index}).has_value();
    }
    raise("TypeError", "'" + rt::type_name(obj) + "' object doesn't support item deletion");
    return false;
}

// --- attributes -------------------------------------------------------------

EvalResult Interpreter::get_attribute(const Value& obj, std::string_view name)
{
    if (registry_->is_forbidden_attribute(name))
    {
        return forbid("forbidden attribute access: ." + std::string(name));
    }
    const std::string attr(name);

    if (const auto inst = as<InstanceObject>(obj))
    {
        if (const auto it = inst->attrs.find(name); it != inst->attrs.end())
        {
            return it->second;
        }
        if (inst->cls->is_exception && name == "args")
        {
            return Value::tuple(inst->args);
        }
        if (const Value* v = inst->cls->lookup(name))
        {
            if (as<FunctionObject>(*v) != nullptr || as<NativeFunction>(*v) != nullptr)
            {
                return Value::object(std::make_shared<BoundMethod>(obj, *v));
            }
            return *v;
        }
        return raise("AttributeError",
                     "'" + inst->cls->name + "' object has no attribute '" + attr + "'");
    }
    if (const auto cls = as<ClassObject>(obj))
    {
        if (name == "__name__")
        {
            return Value::str(cls->name);
        }
        if (const Value* v = cls->lookup(name))
        {
            return *v;
        }
        return raise("AttributeError",
                     "type object '" + cls->name + "' has no attribute '" + attr + "'");
    }
    if (const auto module = as<ModuleObject>(obj))
    {
        if (registry_->is_forbidden_callable(module->name + "." + attr))
        {
            return forbid("forbidden attribute access: " + module->name + "." + attr);
        }
        if (const auto it = module->attrs.find(name); it != module->attrs.end())
        {
            return it->second;
        }
        return raise("AttributeError",
                     "module '" + module->name + "' has no attribute '" + attr + "'");
    }
    if (const auto sup = as<SuperObject>(obj))
    {
        if (sup->start != nullptr)
        {
            if (const Value* v = sup->start->lookup(name))
            {
                if (as<FunctionObject>(*v) != nullptr || as<NativeFunction>(*v) != nullptr)
                {
                    return Value::object(std::make_shared<BoundMethod>(sup->self, *v));
                }
                return *v;
            }
        }
        if (name == "__init__")
        {
            // object.__init__ accepts and ignores the receiver.
            return Value::object(std::make_shared<NativeFunction>(
                "__init__", [](Interpreter&, Args&, Kwargs&) -> EvalResult
                { return Value::none(); }));
        }
        return raise("AttributeError", "'super' object has no attribute '" + attr + "'");
    }
    if (const auto fn = as<FunctionObject>(obj))
    {
        if (name == "__name__")
        {
            return Value::str(fn->name);
        }
        return raise("AttributeError", "'function' object has no attribute '" + attr + "'");
    }
    if (const auto type = as<BuiltinType>(obj))
    {
        if (name == "__name__")
        {
            return Value::str(type->name);
        }
        if (auto method = find_builtin_method(type->name, name))
        {
            return Value::object(std::make_shared<NativeFunction>(attr, std::move(*method)));
        }
        return raise("AttributeError",
                     "type object '" + type->name + "' has no attribute '" + attr + "'");
    }

    if (const auto method = builtin_method(obj, name))
    {
        return Value::object(std::make_shared<BoundMethod>(obj, *method));
    }
    if (const auto range = as<RangeObject>(obj))
    {
        if (name == "start")
        {
            return Value::integer(range->start);
        }
        if (name == "stop")
        {
            return Value::integer(range->stop);
        }
        if (name == "step")
        {
            return Value::integer(range->step);
        }
    }
    if (obj.is_float() && (name == "real"))
    {
        return obj;
    }
    if (obj.is_integral() && (name == "real" || name == "numerator"))
    {
        return Value::integer(obj.as_int());
    }
    if (obj.is_integral() && name == "denominator")
    {
        return Value::integer(1);
    }
    return raise("AttributeError",
                 "'" + rt::type_name(obj) + "' object has no attribute '" + attr + "'");
}

bool Interpreter::set_attribute(const Value& obj, std::string_view name, Value value)
{
    if (registry_->is_forbidden_attribute(name))
    {
        forbid("forbidden attribute access: ." + std::string(name));
        return false;
    }
    if (const auto inst = as<InstanceObject>(obj))
    {
        if (inst->cls->is_exception && name == "args")
        {
            auto items = iterate(value);
            if (!items.has_value())
            {
                return false;
            }
            inst->args = std::move(*items);
            return true;
        }
        inst->attrs.insert_or_assign(std::string(name), std::move(value));
        return true;
    }
    if (const auto cls = as<ClassObject>(obj))
    {
        if (const auto fn = as<FunctionObject>(value); fn != nullptr && fn->owner.expired())
        {
            fn->owner = cls;
        }
        cls->attrs.insert_or_assign(std::string(name), std::move(value));
        return true;
    }
    if (const auto module = as<ModuleObject>(obj))
    {
        module->attrs.insert_or_assign(std::string(name), std::move(value));
        return true;
    }
    raise("AttributeError", "'" + rt::type_name(obj) + "' object has no attribute '" +
                                std::string(name) + "' and no __dict__ for setting new attributes");
    return false;
}

std::optional<Value> Interpreter::builtin_method(const Value& receiver, std::string_view name)
{
    if (receiver.is_object())
    {
        return std::nullopt;
    }
    std::string key = rt::type_name(receiver);
    key += '.';
    key += name;
    if (const auto it = method_cache_.find(key); it != method_cache_.end())
    {
        return it->second;
    }
    auto fn = find_builtin_method(rt::type_name(receiver), name);
    if (!fn.has_value())
    {
        return std::nullopt;
    }
    Value method = Value::object(std::make_shared<NativeFunction>(std::string(name), std::move(*fn)));
    method_cache_.emplace(std::move(key), method);
    return method;
}

// --- conversion -------------------------------------------------------------

std::optional<std::string> Interpreter::to_str(const Value& v)
{
    if (v.is_str())
    {
        return v.as_str();
    }
    if (const auto inst = as<InstanceObject>(v))
    {
        std::optional<Value> method = find_method(v, "__str__");
        if (!method.has_value())
        {
            if (inst->cls->is_exception)
            {
                return inst->exception_message();
            }
            method = find_method(v, "__repr__");
        }
        if (method.has_value())
        {
            const auto r = call_value(*method, {});
            if (!r.has_value())
            {
                return std::nullopt;
            }
            if (!r->is_str())
            {
                raise("TypeError", "__str__ returned non-string (type " + rt::type_name(*r) + ")");
                return std::nullopt;
            }
            return r->as_str();
        }
    }
    return rt::str(v);
}

std::optional<std::string> Interpreter::to_repr(const Value& v)
{
    if (const auto method = find_method(v, "__repr__"))
    {
        const auto r = call_value(*method, {});
        if (!r.has_value())
        {
            return std::nullopt;
        }
        if (!r->is_str())
        {
            raise("TypeError", "__repr__ returned non-string (type " + rt::type_name(*r) + ")");
            return std::nullopt;
        }
        return r->as_str();
    }
    return rt::repr(v);
}

std::optional<std::int64_t> Interpreter::hash_value(const Value& v)
{
    if (!rt::hashable(v))
    {
        raise("TypeError", "unhashable type: '" + rt::type_name(v) + "'");
        return std::nullopt;
    }
    if (v.is_none())
    {
        return 0x5f3a;
    }
    if (v.is_integral())
    {
        const std::int64_t i = v.as_int();
        return i == -1 ? -2 : i;
    }
    if (v.is_float())
    {
        const double d = v.as_double();
        if (std::isfinite(d) && d == std::trunc(d) && std::fabs(d) < 9.2e18)
        {
            const auto i = static_cast<std::int64_t>(d);
            return i == -1 ? -2 : i;
        }
        return static_cast<std::int64_t>(std::hash<double>{}(d) >> 1);
    }
    if (v.is_str())
    {
        return static_cast<std::int64_t>(std::hash<std::string>{}(v.as_str()) >> 1);
    }
    if (const auto* b = std::get_if<rt::Bytes>(&v.data))
    {
        return static_cast<std::int64_t>(std::hash<std::string>{}(b->data) >> 1);
    }
    if (v.is_tuple())
    {
        std::uint64_t acc = 0x345678;
        for (const auto& item : v.as_tuple()->items)
        {
            const auto h = hash_value(item);
            if (!h.has_value())
            {
                return std::nullopt;
            }
            acc = (acc ^ static_cast<std::uint64_t>(*h)) * 1000003u;
        }
        return static_cast<std::int64_t>(acc >> 1);
    }
    if (const auto method = find_method(v, "__hash__"))
    {
        const auto r = call_value(*method, {});
        if (!r.has_value())
        {
            return std::nullopt;
        }
        if (!r->is_integral())
        {
            raise("TypeError", "__hash__ method should return an integer");
            return std::nullopt;
        }
        return r->as_int();
    }
    return static_cast<std::int64_t>(reinterpret_cast<std::uintptr_t>(v.as_object().get()) >> 4);
}

// --- sorting ----------------------------------------------------------------

bool Interpreter::sort_values(std::vector<Value>& items, const Value& key, bool reverse)
{
    std::vector<Value> keys;
    if (key.is_none())
    {
        keys = items;
    }
    else
    {
        keys.reserve(items.size());
        for (const auto& item : items)
        {
            auto k = call_value(key, {item});
            if (!k.has_value())
            {
                return false;
            }
            keys.push_back(std::move(*k));
        }
    }

    bool failed = false;
    auto less = [&](std::size_t i, std::size_t j) -> bool
    {
        if (failed)
        {
            return false;
        }
        const auto c = reverse ? order(keys[j], keys[i], "<") : order(keys[i], keys[j], "<");
        if (!c.has_value())
        {
            failed = true;
            return false;
        }
        return *c == -1;
    };

    // Bottom-up stable merge sort over indices; stops at the first failed comparison.
    const std::size_t n = items.size();
    std::vector<std::size_t> idx(n);
    for (std::size_t i = 0; i < n; ++i)
    {
        idx[i] = i;
    }
    std::vector<std::size_t> tmp(n);
    for (std::size_t width = 1; width < n && !failed; width *= 2)
    {
        for (std::size_t lo = 0; lo < n && !failed; lo += 2 * width)
        {
            const std::size_t mid = std::min(lo + width, n);
            const std::size_t hi = std::min(lo + 2 * width, n);
            std::size_t a = lo;
            std::size_t b = mid;
            std::size_t out = lo;
            while (a < mid && b < hi)
            {
                if (less(idx[b], idx[a]))
                {
                    tmp[out++] = idx[b++];
                }
                else
                {
                    tmp[out++] = idx[a++];
                }
                if (failed)
                {
                    return false;
                }
            }
            while (a < mid)
            {
                tmp[out++] = idx[a++];
            }
            while (b < hi)
            {
                tmp[out++] = idx[b++];
            }
        }
        idx.swap(tmp);
    }
    if (failed)
    {
        return false;
    }

    std::vector<Value> sorted;
    sorted.reserve(n);
    for (const auto i : idx)
    {
        sorted.push_back(std::move(items[i]));
    }
    items = std::move(sorted);
    return true;
}

// --- types ------------------------------------------------------------------

std::optional<bool> Interpreter::is_instance(const Value& v, const Value& type)
{
    if (type.is_tuple())
    {
        for (const auto& t : type.as_tuple()->items)
        {
            const auto r = is_instance(v, t);
            if (!r.has_value())
            {
                return std::nullopt;
            }
            if (*r)
            {
                return true;
            }
        }
        return false;
    }
    if (const auto bt = as<BuiltinType>(type))
    {
        if (v.is_object() && as<InstanceObject>(v) != nullptr)
        {
            return false;
        }
        const std::string name = rt::type_name(v);
        if (bt->name == name)
        {
            return true;
        }
        if (bt->name == "int" && v.is_bool())
        {
            return true;
        }
        if (bt->name == "type")
        {
            return as<ClassObject>(v) != nullptr || as<BuiltinType>(v) != nullptr;
        }
        return false;
    }
    if (const auto cls = as<ClassObject>(type))
    {
        if (cls == object_class_)
        {
            return true;
        }
        const auto inst = as<InstanceObject>(v);
        return inst != nullptr && inst->cls->is_subclass_of(*cls);
    }
    raise("TypeError", "isinstance() arg 2 must be a type, a tuple of types, or a union");
    return std::nullopt;
}

Value Interpreter::type_of(const Value& v)
{
    if (const auto inst = as<InstanceObject>(v))
    {
        return Value::object(inst->cls);
    }
    std::string name = rt::type_name(v);
    if (as<ClassObject>(v) != nullptr || as<BuiltinType>(v) != nullptr)
    {
        name = "type";
    }
    if (const auto it = intrinsics_.find(name); it != intrinsics_.end())
    {
        return it->second;
    }
    Value type = Value::object(std::make_shared<BuiltinType>(
        name, [name](Interpreter& in, Args&, Kwargs&) -> EvalResult
        { return in.raise("TypeError", "cannot create '" + name + "' instances"); }));
    intrinsics_.emplace(name, type);
    return type;
}

} // namespace codegate::interp
