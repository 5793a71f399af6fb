#include <algorithm>
#include <cmath>
#include <codegate/proptest/generator.h>

namespace codegate::proptest
{
namespace
{

using codegate::runtime::Value;
using Kind = TypeSpec::Kind;

constexpr int kMaxDepth = 4;
constexpr char kAlphabet[] = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789 _-.,!?";

Value make_collection(const TypeSpec& type, std::vector<Value> items)
{
    switch (type.kind)
    {
    case Kind::Set:
    {
        std::erase_if(items, [](const Value& v) { return !codegate::runtime::hashable(v); });
        return Value::set(std::move(items));
    }
    case Kind::Tuple:
        return Value::tuple(std::move(items));
    default:
        return Value::list(std::move(items));
    }
}

/** Simplest value of `type`: zero, empty, False or None. */
Value simplest(const TypeSpec& type)
{
    switch (type.kind)
    {
    case Kind::Int:
    case Kind::Any:
        return Value::integer(0);
    case Kind::Float:
        return Value::floating(0.0);
    case Kind::Bool:
        return Value::boolean(false);
    case Kind::Str:
        return Value::str("");
    case Kind::Bytes:
        return Value::bytes("");
    case Kind::List:
    case Kind::Set:
        return make_collection(type, {});
    case Kind::Tuple:
    {
        std::vector<Value> items;
        if (!type.variadic)
        {
            for (const auto& a : type.args)
            {
                items.push_back(simplest(a));
            }
        }
        return Value::tuple(std::move(items));
    }
    case Kind::Dict:
        return Value::dict({});
    case Kind::Optional:
    case Kind::NoneType:
        return Value::none();
    }
    return Value::none();
}

std::vector<Value> shrink_value(const Value& v, const TypeSpec& type, int depth);

std::vector<Value> shrink_items(const std::vector<Value>& items, const TypeSpec& element,
                                const TypeSpec& type, int depth)
{
    std::vector<Value> out;
    if (items.empty())
    {
        return out;
    }
    if (items.size() > 1)
    {
        out.push_back(make_collection(type, {items.front()}));
        std::vector<Value> half(items.begin(), items.begin() + static_cast<std::ptrdiff_t>(items.size() / 2));
        out.push_back(make_collection(type, std::move(half)));
    }
    for (std::size_t i = 0; i < items.size(); ++i)
    {
        std::vector<Value> without;
        without.reserve(items.size() - 1);
        for (std::size_t j = 0; j < items.size(); ++j)
        {
            if (j != i)
            {
                without.push_back(items[j]);
            }
        }
        out.push_back(make_collection(type, std::move(without)));
    }
    for (std::size_t i = 0; i < items.size(); ++i)
    {
        for (auto& smaller : shrink_value(items[i], element, depth + 1))
        {
            std::vector<Value> copy = items;
            copy[i] = std::move(smaller);
            out.push_back(make_collection(type, std::move(copy)));
        }
    }
    return out;
}

std::vector<Value> shrink_value(const Value& v, const TypeSpec& type, int depth)
{
    std::vector<Value> out;
    if (depth > kMaxDepth)
    {
        return out;
    }
    if (v.is_bool())
    {
        if (v.as_int() != 0)
        {
            out.push_back(Value::boolean(false));
        }
        return out;
    }
    if (v.is_int())
    {
        const std::int64_t n = v.as_int();
        if (n == 0)
        {
            return out;
        }
        out.push_back(Value::integer(0));
        if (n < 0 && n != INT64_MIN)
        {
            out.push_back(Value::integer(-n));
        }
        if (n / 2 != 0)
        {
            out.push_back(Value::integer(n / 2));
        }
        out.push_back(Value::integer(n > 0 ? n - 1 : n + 1));
        return out;
    }
    if (v.is_float())
    {
        const double d = v.as_double();
        if (d == 0.0 || !std::isfinite(d))
        {
            if (!std::isfinite(d))
            {
                out.push_back(Value::floating(0.0));
            }
            return out;
        }
        out.push_back(Value::floating(0.0));
        if (std::trunc(d) != d)
        {
            out.push_back(Value::floating(std::trunc(d)));
        }
        else if (std::fabs(d) >= 2.0)
        {
            out.push_back(Value::floating(std::trunc(d / 2.0)));
        }
        return out;
    }
    if (v.is_str())
    {
        const std::string& s = v.as_str();
        if (s.empty())
        {
            return out;
        }
        out.push_back(Value::str(""));
        if (s.size() > 1)
        {
            out.push_back(Value::str(s.substr(0, s.size() / 2)));
            out.push_back(Value::str(s.substr(1)));
            out.push_back(Value::str(s.substr(0, s.size() - 1)));
        }
        if (s.find_first_not_of('a') != std::string::npos)
        {
            out.push_back(Value::str(std::string(s.size(), 'a')));
        }
        return out;
    }
    if (std::holds_alternative<codegate::runtime::Bytes>(v.data))
    {
        const auto& b = std::get<codegate::runtime::Bytes>(v.data).data;
        if (!b.empty())
        {
            out.push_back(Value::bytes(""));
            if (b.size() > 1)
            {
                out.push_back(Value::bytes(b.substr(0, b.size() / 2)));
            }
        }
        return out;
    }
    const TypeSpec any = TypeSpec::of(Kind::Any);
    const TypeSpec& element = type.args.empty() ? any : type.args.front();
    if (v.is_list())
    {
        return shrink_items(v.as_list()->items, element, type, depth);
    }
    if (v.is_set())
    {
        return shrink_items(v.as_set()->items, element, type, depth);
    }
    if (v.is_tuple())
    {
        const auto& items = v.as_tuple()->items;
        if (type.kind == Kind::Tuple && type.variadic)
        {
            return shrink_items(items, element, type, depth);
        }
        for (std::size_t i = 0; i < items.size(); ++i)
        {
            const TypeSpec& t = i < type.args.size() ? type.args[i] : any;
            for (auto& smaller : shrink_value(items[i], t, depth + 1))
            {
                std::vector<Value> copy = items;
                copy[i] = std::move(smaller);
                out.push_back(Value::tuple(std::move(copy)));
            }
        }
        return out;
    }
    if (v.is_dict())
    {
        const auto& items = v.as_dict()->items;
        if (items.empty())
        {
            return out;
        }
        out.push_back(Value::dict({}));
        for (std::size_t i = 0; i < items.size() && items.size() > 1; ++i)
        {
            std::vector<std::pair<Value, Value>> without;
            for (std::size_t j = 0; j < items.size(); ++j)
            {
                if (j != i)
                {
                    without.push_back(items[j]);
                }
            }
            out.push_back(Value::dict(std::move(without)));
        }
        return out;
    }
    if (!v.is_none() && type.kind == Kind::Optional)
    {
        out.push_back(Value::none());
    }
    return out;
}

} // namespace

std::int64_t Generator::int_between(std::int64_t lo, std::int64_t hi)
{
    if (hi < lo)
    {
        std::swap(lo, hi);
    }
    std::uniform_int_distribution<std::int64_t> dist(lo, hi);
    return dist(engine_);
}

Value Generator::value(const TypeSpec& type, int depth)
{
    // Collections deep inside collections stay small.
    const std::size_t max_size = depth >= kMaxDepth ? 0 : limits_.max_collection_size >> depth;
    switch (type.kind)
    {
    case Kind::Int:
    case Kind::Any:
        return Value::integer(int_between(limits_.int_min, limits_.int_max));
    case Kind::Float:
    {
        std::uniform_real_distribution<double> dist(std::min(limits_.float_min, limits_.float_max),
                                                    std::max(limits_.float_min, limits_.float_max));
        return Value::floating(dist(engine_));
    }
    case Kind::Bool:
        return Value::boolean(int_between(0, 1) == 1);
    case Kind::Str:
    case Kind::Bytes:
    {
        const auto len = static_cast<std::size_t>(
            int_between(0, static_cast<std::int64_t>(limits_.max_string_length)));
        std::string s;
        s.reserve(len);
        for (std::size_t i = 0; i < len; ++i)
        {
            s.push_back(kAlphabet[int_between(0, sizeof(kAlphabet) - 2)]);
        }
        return type.kind == Kind::Str ? Value::str(std::move(s)) : Value::bytes(std::move(s));
    }
    case Kind::List:
    case Kind::Set:
    case Kind::Tuple:
    {
        std::vector<Value> items;
        if (type.kind == Kind::Tuple && !type.variadic)
        {
            for (const auto& a : type.args)
            {
                items.push_back(value(a, depth + 1));
            }
            return Value::tuple(std::move(items));
        }
        const auto n = static_cast<std::size_t>(int_between(0, static_cast<std::int64_t>(max_size)));
        for (std::size_t i = 0; i < n; ++i)
        {
            items.push_back(value(type.args.at(0), depth + 1));
        }
        return make_collection(type, std::move(items));
    }
    case Kind::Dict:
    {
        std::vector<std::pair<Value, Value>> items;
        const auto n = static_cast<std::size_t>(int_between(0, static_cast<std::int64_t>(max_size)));
        for (std::size_t i = 0; i < n; ++i)
        {
            Value key = value(type.args.at(0), depth + 1);
            if (!codegate::runtime::hashable(key))
            {
                continue;
            }
            items.emplace_back(std::move(key), value(type.args.at(1), depth + 1));
        }
        return Value::dict(std::move(items));
    }
    case Kind::Optional:
        if (int_between(0, 3) == 0)
        {
            return Value::none();
        }
        return value(type.args.at(0), depth);
    case Kind::NoneType:
        return Value::none();
    }
    return Value::none();
}

std::vector<Inputs> Generator::inputs(const std::vector<Parameter>& params, std::size_t count)
{
    std::vector<std::vector<Value>> edges;
    std::size_t edge_rows = 0;
    for (const auto& p : params)
    {
        edges.push_back(edge_values(p.type, limits_));
        edge_rows = std::max(edge_rows, edges.back().size());
    }

    std::vector<Inputs> out;
    out.reserve(count);
    for (std::size_t row = 0; row < std::min(edge_rows, count); ++row)
    {
        Inputs args;
        for (const auto& e : edges)
        {
            args.push_back(e[row % e.size()]);
        }
        out.push_back(std::move(args));
    }
    while (out.size() < count)
    {
        Inputs args;
        for (const auto& p : params)
        {
            args.push_back(value(p.type));
        }
        out.push_back(std::move(args));
    }
    return out;
}

std::vector<Value> edge_values(const TypeSpec& type, const GeneratorLimits& limits)
{
    std::vector<Value> out;
    const auto add = [&out](Value v)
    {
        for (const auto& existing : out)
        {
            if (codegate::runtime::type_name(existing) == codegate::runtime::type_name(v) &&
                codegate::runtime::equals(existing, v))
            {
                return;
            }
        }
        out.push_back(std::move(v));
    };
    switch (type.kind)
    {
    case Kind::Int:
    case Kind::Any:
        for (std::int64_t n : {std::int64_t{0}, std::int64_t{1}, std::int64_t{-1}, limits.int_min,
                               limits.int_max})
        {
            if (n >= std::min(limits.int_min, limits.int_max) &&
                n <= std::max(limits.int_min, limits.int_max))
            {
                add(Value::integer(n));
            }
        }
        break;
    case Kind::Float:
        for (double d : {0.0, 1.0, -1.0, limits.float_min, limits.float_max})
        {
            if (d >= std::min(limits.float_min, limits.float_max) &&
                d <= std::max(limits.float_min, limits.float_max))
            {
                add(Value::floating(d));
            }
        }
        break;
    case Kind::Bool:
        add(Value::boolean(false));
        add(Value::boolean(true));
        break;
    case Kind::Str:
        add(Value::str(""));
        if (limits.max_string_length > 0)
        {
            add(Value::str("a"));
        }
        break;
    case Kind::Bytes:
        add(Value::bytes(""));
        break;
    case Kind::List:
    case Kind::Set:
        add(make_collection(type, {}));
        if (const auto inner = edge_values(type.args.at(0), limits);
            limits.max_collection_size > 0 && !inner.empty())
        {
            add(make_collection(type, {inner.front()}));
        }
        break;
    case Kind::Tuple:
        add(simplest(type));
        break;
    case Kind::Dict:
        add(Value::dict({}));
        break;
    case Kind::Optional:
        add(Value::none());
        for (auto& e : edge_values(type.args.at(0), limits))
        {
            add(std::move(e));
        }
        break;
    case Kind::NoneType:
        add(Value::none());
        break;
    }
    return out;
}

std::vector<Inputs> shrink_candidates(const Inputs& inputs, const std::vector<Parameter>& params)
{
    std::vector<Inputs> out;
    for (std::size_t i = 0; i < inputs.size(); ++i)
    {
        const TypeSpec type = i < params.size() ? params[i].type : TypeSpec::of(Kind::Any);
        for (auto& smaller : shrink_value(inputs[i], type, 0))
        {
            Inputs copy = inputs;
            copy[i] = std::move(smaller);
            out.push_back(std::move(copy));
        }
    }
    return out;
}

std::string render_call(const std::string& name, const Inputs& inputs)
{
    std::string out = name + "(";
    for (std::size_t i = 0; i < inputs.size(); ++i)
    {
        if (i > 0)
        {
            out += ", ";
        }
        out += codegate::runtime::repr(inputs[i]);
    }
    out += ")";
    return out;
}

} // namespace codegate::proptest
