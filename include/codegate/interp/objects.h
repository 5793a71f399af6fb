#pragma once

#include <codegate/parser/ast.h>
#include <codegate/runtime/value.h>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/**
 * @file objects.h
 * @brief Object kinds created by the restricted interpreter: functions, classes,
 * instances, modules and iterators, plus the environments they close over.
 */

namespace codegate::interp
{

using codegate::runtime::Value;

class Interpreter;

using Args = std::vector<Value>;
using Kwargs = std::vector<std::pair<std::string, Value>>;

/** @brief Result of evaluating an expression; nullopt means an exception is pending. */
using EvalResult = std::optional<Value>;

using NativeFn = std::function<EvalResult(Interpreter&, Args&, Kwargs&)>;

using AttrMap = std::map<std::string, Value, std::less<>>;

/** @brief Names a function body binds, computed once per definition. */
struct ScopeInfo
{
    std::set<std::string, std::less<>> locals;
    std::set<std::string, std::less<>> globals;
    std::set<std::string, std::less<>> nonlocals;
    bool is_generator = false;
};

/** @brief Static scope analysis of a function body and its parameters. */
[[nodiscard]] std::shared_ptr<const ScopeInfo> analyze_scope(
    const codegate::parser::Parameters& params, const std::vector<codegate::parser::Stmt>& body);

/** @brief Scope analysis of a lambda: its parameters are the only locals. */
[[nodiscard]] std::shared_ptr<const ScopeInfo> analyze_lambda_scope(
    const codegate::parser::Parameters& params, const codegate::parser::Expr& body);

enum class EnvKind
{
    Module,
    Function,
    Class,
    Comprehension,
};

/**
 * @brief A variable namespace. Function environments carry the ScopeInfo of
 * their definition; other kinds bind every assigned name locally.
 */
struct Env
{
    EnvKind kind = EnvKind::Module;
    AttrMap vars;
    std::shared_ptr<Env> parent;
    std::shared_ptr<const ScopeInfo> info;
};

class ClassObject;

class FunctionObject final : public codegate::runtime::Object
{
  public:
    std::string name;
    std::shared_ptr<const codegate::parser::Parameters> params;
    std::shared_ptr<const std::vector<codegate::parser::Stmt>> body;
    std::shared_ptr<const codegate::parser::Expr> lambda_body;
    /** Defaults of the trailing positional parameters, aligned to the end. */
    std::vector<Value> defaults;
    AttrMap kw_defaults;
    std::shared_ptr<Env> closure;
    std::shared_ptr<const ScopeInfo> info;
    /** Class whose body defined this function; used by zero-argument super(). */
    std::weak_ptr<ClassObject> owner;
    bool is_async = false;

    [[nodiscard]] std::string type_name() const override { return "function"; }
    [[nodiscard]] std::string repr() const override { return "<function " + name + ">"; }
};

class NativeFunction final : public codegate::runtime::Object
{
  public:
    NativeFunction(std::string name, NativeFn fn) : name(std::move(name)), fn(std::move(fn)) {}

    std::string name;
    NativeFn fn;

    [[nodiscard]] std::string type_name() const override { return "builtin_function_or_method"; }
    [[nodiscard]] std::string repr() const override
    {
        return "<built-in function " + name + ">";
    }
};

/** @brief A callable with its receiver bound as the first argument. */
class BoundMethod final : public codegate::runtime::Object
{
  public:
    BoundMethod(Value self, Value callable) : self(std::move(self)), callable(std::move(callable))
    {
    }

    Value self;
    Value callable;

    [[nodiscard]] std::string type_name() const override { return "method"; }
    [[nodiscard]] std::string repr() const override { return "<bound method>"; }
};

/** @brief A builtin type such as `int` or `list`: callable as a constructor, usable with isinstance. */
class BuiltinType final : public codegate::runtime::Object
{
  public:
    BuiltinType(std::string name, NativeFn ctor) : name(std::move(name)), ctor(std::move(ctor)) {}

    std::string name;
    NativeFn ctor;

    [[nodiscard]] std::string type_name() const override { return "type"; }
    [[nodiscard]] std::string repr() const override { return "<class '" + name + "'>"; }
};

/** @brief A class created by a `class` statement, or a builtin exception class. */
class ClassObject final : public codegate::runtime::Object
{
  public:
    std::string name;
    std::shared_ptr<ClassObject> base;
    AttrMap attrs;
    bool is_exception = false;

    /** @brief Find `attr` on this class or a base class. */
    [[nodiscard]] const Value* lookup(std::string_view attr) const;
    /** @brief True when this class is `other` or derives from it. */
    [[nodiscard]] bool is_subclass_of(const ClassObject& other) const;

    [[nodiscard]] std::string type_name() const override { return "type"; }
    [[nodiscard]] std::string repr() const override { return "<class '" + name + "'>"; }
};

class InstanceObject final : public codegate::runtime::Object
{
  public:
    explicit InstanceObject(std::shared_ptr<ClassObject> cls) : cls(std::move(cls)) {}

    std::shared_ptr<ClassObject> cls;
    AttrMap attrs;
    /** Exception arguments; empty for ordinary instances. */
    std::vector<Value> args;

    /** @brief Message the way `str(exc)` renders exception arguments. */
    [[nodiscard]] std::string exception_message() const;

    [[nodiscard]] std::string type_name() const override { return cls->name; }
    [[nodiscard]] std::string repr() const override;
};

class ModuleObject final : public codegate::runtime::Object
{
  public:
    explicit ModuleObject(std::string name) : name(std::move(name)) {}

    std::string name;
    AttrMap attrs;

    [[nodiscard]] std::string type_name() const override { return "module"; }
    [[nodiscard]] std::string repr() const override { return "<module '" + name + "'>"; }
};

/** @brief `range(start, stop, step)`, iterated lazily by `for`. */
class RangeObject final : public codegate::runtime::Object
{
  public:
    RangeObject(std::int64_t start, std::int64_t stop, std::int64_t step)
        : start(start), stop(stop), step(step)
    {
    }

    std::int64_t start;
    std::int64_t stop;
    std::int64_t step;

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::int64_t at(std::size_t index) const { return start + static_cast<std::int64_t>(index) * step; }
    [[nodiscard]] bool contains(std::int64_t v) const;

    [[nodiscard]] std::string type_name() const override { return "range"; }
    [[nodiscard]] std::string repr() const override;
    [[nodiscard]] bool equals(const Object& other) const override;
};

/**
 * @brief Single-pass iterator over materialized items.
 *
 * Generators are collected eagerly when called, and `iter()` snapshots its
 * argument, so both are represented by this type.
 */
class IteratorObject final : public codegate::runtime::Object
{
  public:
    IteratorObject(std::string kind, std::vector<Value> items)
        : kind(std::move(kind)), items(std::move(items))
    {
    }

    std::string kind;
    std::vector<Value> items;
    std::size_t pos = 0;

    [[nodiscard]] std::string type_name() const override { return kind; }
    [[nodiscard]] std::string repr() const override { return "<" + kind + " object>"; }
};

/** @brief Result of zero-argument `super()` inside a method. */
class SuperObject final : public codegate::runtime::Object
{
  public:
    SuperObject(std::shared_ptr<ClassObject> start, Value self)
        : start(std::move(start)), self(std::move(self))
    {
    }

    std::shared_ptr<ClassObject> start;
    Value self;

    [[nodiscard]] std::string type_name() const override { return "super"; }
};

/** @brief A slice index produced while evaluating `x[a:b:c]`. */
class SliceObject final : public codegate::runtime::Object
{
  public:
    std::optional<std::int64_t> lower;
    std::optional<std::int64_t> upper;
    std::optional<std::int64_t> step;

    [[nodiscard]] std::string type_name() const override { return "slice"; }
};

/** @brief Placeholder for `typing` names; subscripting returns itself. */
class TypingObject final : public codegate::runtime::Object
{
  public:
    explicit TypingObject(std::string name) : name(std::move(name)) {}

    std::string name;

    [[nodiscard]] std::string type_name() const override { return "typing"; }
    [[nodiscard]] std::string repr() const override { return "typing." + name; }
};

class EllipsisObject final : public codegate::runtime::Object
{
  public:
    [[nodiscard]] std::string type_name() const override { return "ellipsis"; }
    [[nodiscard]] std::string repr() const override { return "Ellipsis"; }
};

/** @brief Downcast helper: the object held by `v` as `T`, or null. */
template <typename T> std::shared_ptr<T> as(const Value& v)
{
    if (!v.is_object())
    {
        return nullptr;
    }
    return std::dynamic_pointer_cast<T>(v.as_object());
}

} // namespace codegate::interp
