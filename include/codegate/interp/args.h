#pragma once

#include <codegate/interp/interpreter.h>
#include <codegate/interp/objects.h>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

/**
 * @file args.h
 * @brief Argument checking shared by builtin functions, methods and modules.
 *
 * Each helper raises TypeError on the interpreter and returns false/nullopt
 * when the check fails.
 */

namespace codegate::interp
{

inline bool check_arity(Interpreter& in, std::string_view fname, const Args& args,
                        std::size_t min, std::size_t max)
{
    if (args.size() >= min && args.size() <= max)
    {
        return true;
    }
    std::string msg = std::string(fname) + "() takes ";
    if (min == max)
    {
        msg += "exactly " + std::to_string(min) + " argument" + (min == 1 ? "" : "s");
    }
    else if (args.size() < min)
    {
        msg += "at least " + std::to_string(min) + " argument" + (min == 1 ? "" : "s");
    }
    else
    {
        msg += "at most " + std::to_string(max) + " argument" + (max == 1 ? "" : "s");
    }
    msg += " (" + std::to_string(args.size()) + " given)";
    in.raise("TypeError", msg);
    return false;
}

inline bool no_kwargs(Interpreter& in, std::string_view fname, const Kwargs& kwargs)
{
    if (kwargs.empty())
    {
        return true;
    }
    in.raise("TypeError", std::string(fname) + "() takes no keyword arguments");
    return false;
}

/** @brief Keyword argument `name`, or null. */
inline const Value* find_kwarg(const Kwargs& kwargs, std::string_view name)
{
    for (const auto& [key, value] : kwargs)
    {
        if (key == name)
        {
            return &value;
        }
    }
    return nullptr;
}

/** @brief Rejects keywords outside `allowed`. */
inline bool only_kwargs(Interpreter& in, std::string_view fname, const Kwargs& kwargs,
                        std::initializer_list<std::string_view> allowed)
{
    for (const auto& [key, value] : kwargs)
    {
        bool ok = false;
        for (const auto a : allowed)
        {
            ok = ok || a == key;
        }
        if (!ok)
        {
            in.raise("TypeError", "'" + key + "' is an invalid keyword argument for " +
                                      std::string(fname) + "()");
            return false;
        }
    }
    return true;
}

inline std::optional<std::int64_t> int_arg(Interpreter& in, std::string_view fname,
                                           const Value& v)
{
    if (!v.is_integral())
    {
        in.raise("TypeError", std::string(fname) + "() argument must be int, not '" +
                                  codegate::runtime::type_name(v) + "'");
        return std::nullopt;
    }
    return v.as_int();
}

inline std::optional<double> real_arg(Interpreter& in, std::string_view fname, const Value& v)
{
    if (!v.is_number())
    {
        in.raise("TypeError", std::string(fname) + "() argument must be a real number, not '" +
                                  codegate::runtime::type_name(v) + "'");
        return std::nullopt;
    }
    return v.as_double();
}

inline const std::string* str_arg(Interpreter& in, std::string_view fname, const Value& v)
{
    if (!v.is_str())
    {
        in.raise("TypeError", std::string(fname) + "() argument must be str, not '" +
                                  codegate::runtime::type_name(v) + "'");
        return nullptr;
    }
    return &v.as_str();
}

inline Value make_native(std::string name, NativeFn fn)
{
    return Value::object(std::make_shared<NativeFunction>(std::move(name), std::move(fn)));
}

} // namespace codegate::interp
