#pragma once

#include <codegate/interp/objects.h>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

/**
 * @file library.h
 * @brief Builtin functions, builtin type methods, string formatting and the
 * standard modules available to restricted code.
 */

namespace codegate::interp
{

using ModuleTable = std::map<std::string, std::shared_ptr<ModuleObject>, std::less<>>;

/**
 * @brief Fill `table` with builtin functions, builtin types, `object` and the
 * exception hierarchy. The interpreter removes names its registry forbids.
 */
void install_builtins(Interpreter& interp, AttrMap& table);

/** @brief The importable modules: math, random, string, functools, typing, __future__. */
[[nodiscard]] ModuleTable make_standard_modules(Interpreter& interp);

/** @brief Implementation of method `name` for builtin type `type_name`, taking the receiver first. */
[[nodiscard]] std::optional<NativeFn> find_builtin_method(std::string_view type_name,
                                                          std::string_view name);

/** @brief `format(value, spec)` for builtin values. */
[[nodiscard]] std::optional<std::string> format_value(Interpreter& interp, const Value& value,
                                                      std::string_view spec);

/** @brief printf-style `fmt % args`. */
[[nodiscard]] std::optional<std::string> percent_format(Interpreter& interp, std::string_view fmt,
                                                        const Value& args);

/** @brief `fmt.format(*args, **kwargs)`. */
[[nodiscard]] std::optional<std::string> str_format(Interpreter& interp, std::string_view fmt,
                                                    const Args& args, const Kwargs& kwargs);

} // namespace codegate::interp
