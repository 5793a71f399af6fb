#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

/**
 * @file value.h
 * @brief Python runtime values shared by the interpreter, the sandboxes and the property tester.
 *
 * Integers are 64-bit; arithmetic that leaves that range raises OverflowError
 * in the interpreter. Containers are reference types held through shared_ptr,
 * so copying a Value aliases a list the way Python does.
 */

namespace codegate::runtime
{

struct Value;
struct ListData;
struct TupleData;
struct DictData;
struct SetData;
class Object;

struct NoneValue
{
};

/** @brief `bytes` payload. */
struct Bytes
{
    std::string data;
};

using ListRef = std::shared_ptr<ListData>;
using TupleRef = std::shared_ptr<const TupleData>;
using DictRef = std::shared_ptr<DictData>;
using SetRef = std::shared_ptr<SetData>;
using ObjectRef = std::shared_ptr<Object>;

struct Value
{
    std::variant<NoneValue, bool, std::int64_t, double, std::string, Bytes, ListRef, TupleRef,
                 DictRef, SetRef, ObjectRef>
        data;

    static Value none() { return Value{}; }
    static Value boolean(bool v) { return Value{.data = v}; }
    static Value integer(std::int64_t v) { return Value{.data = v}; }
    static Value floating(double v) { return Value{.data = v}; }
    static Value str(std::string v) { return Value{.data = std::move(v)}; }
    static Value bytes(std::string v) { return Value{.data = Bytes{std::move(v)}}; }
    static Value list(std::vector<Value> items);
    static Value tuple(std::vector<Value> items);
    static Value dict(std::vector<std::pair<Value, Value>> items);
    static Value set(std::vector<Value> items);
    static Value object(ObjectRef obj) { return Value{.data = std::move(obj)}; }

    [[nodiscard]] bool is_none() const { return std::holds_alternative<NoneValue>(data); }
    [[nodiscard]] bool is_bool() const { return std::holds_alternative<bool>(data); }
    [[nodiscard]] bool is_int() const { return std::holds_alternative<std::int64_t>(data); }
    [[nodiscard]] bool is_float() const { return std::holds_alternative<double>(data); }
    [[nodiscard]] bool is_str() const { return std::holds_alternative<std::string>(data); }
    [[nodiscard]] bool is_list() const { return std::holds_alternative<ListRef>(data); }
    [[nodiscard]] bool is_tuple() const { return std::holds_alternative<TupleRef>(data); }
    [[nodiscard]] bool is_dict() const { return std::holds_alternative<DictRef>(data); }
    [[nodiscard]] bool is_set() const { return std::holds_alternative<SetRef>(data); }
    [[nodiscard]] bool is_object() const { return std::holds_alternative<ObjectRef>(data); }

    /** @brief True for int and bool (bool is an int subtype). */
    [[nodiscard]] bool is_integral() const { return is_int() || is_bool(); }
    /** @brief True for int, bool and float. */
    [[nodiscard]] bool is_number() const { return is_integral() || is_float(); }

    /** @brief Integer value of an int or bool. */
    [[nodiscard]] std::int64_t as_int() const;
    /** @brief Numeric value of an int, bool or float. */
    [[nodiscard]] double as_double() const;
    [[nodiscard]] const std::string& as_str() const { return std::get<std::string>(data); }
    [[nodiscard]] const ListRef& as_list() const { return std::get<ListRef>(data); }
    [[nodiscard]] const TupleRef& as_tuple() const { return std::get<TupleRef>(data); }
    [[nodiscard]] const DictRef& as_dict() const { return std::get<DictRef>(data); }
    [[nodiscard]] const SetRef& as_set() const { return std::get<SetRef>(data); }
    [[nodiscard]] const ObjectRef& as_object() const { return std::get<ObjectRef>(data); }
};

struct ListData
{
    std::vector<Value> items;
};

struct TupleData
{
    std::vector<Value> items;
};

/** @brief Insertion-ordered mapping. Lookups compare keys with equals(). */
struct DictData
{
    std::vector<std::pair<Value, Value>> items;

    [[nodiscard]] const Value* find(const Value& key) const;
    [[nodiscard]] Value* find(const Value& key);
    /** @brief Insert or overwrite, keeping the original position of an existing key. */
    void set(Value key, Value value);
    bool erase(const Value& key);
};

/** @brief Insertion-ordered set. */
struct SetData
{
    std::vector<Value> items;

    [[nodiscard]] bool contains(const Value& v) const;
    /** @brief Returns false when `v` was already present. */
    bool add(Value v);
    bool erase(const Value& v);
};

/**
 * @brief Base of every non-builtin-container value: functions, classes,
 * instances, modules, iterators.
 */
class Object
{
  public:
    virtual ~Object() = default;

    [[nodiscard]] virtual std::string type_name() const = 0;
    [[nodiscard]] virtual std::string repr() const;
    /** @brief Identity by default. */
    [[nodiscard]] virtual bool equals(const Object& other) const { return this == &other; }
    [[nodiscard]] virtual bool hashable() const { return true; }
};

/**
 * @brief A value that crossed a process boundary without a structural encoding.
 *
 * Keeps the type name and repr; two opaque values are equal when both match.
 */
class OpaqueObject final : public Object
{
  public:
    OpaqueObject(std::string type_name, std::string repr)
        : type_name_(std::move(type_name)), repr_(std::move(repr))
    {
    }

    [[nodiscard]] std::string type_name() const override { return type_name_; }
    [[nodiscard]] std::string repr() const override { return repr_; }
    [[nodiscard]] bool equals(const Object& other) const override;

  private:
    std::string type_name_;
    std::string repr_;
};

/** @brief Python type name (`int`, `str`, `list`, ...). */
[[nodiscard]] std::string type_name(const Value& v);

/** @brief Python `repr()` for builtin types; objects use Object::repr. */
[[nodiscard]] std::string repr(const Value& v);

/** @brief Python `str()`: strings are returned unquoted, everything else as repr. */
[[nodiscard]] std::string str(const Value& v);

/** @brief Shortest round-tripping float formatting, as Python prints floats. */
[[nodiscard]] std::string format_float(double d);

[[nodiscard]] bool truthy(const Value& v);

/** @brief Python `==`. Numbers compare across int, bool and float. */
[[nodiscard]] bool equals(const Value& a, const Value& b);

/**
 * @brief Python ordering: -1, 0 or 1, and 2 when a NaN makes the pair unordered.
 *
 * Returns nullopt when the operands are not orderable against each other
 * (the interpreter raises TypeError).
 */
[[nodiscard]] std::optional<int> compare(const Value& a, const Value& b);

/** @brief False for list, dict, set and containers holding them. */
[[nodiscard]] bool hashable(const Value& v);

/** @brief Identity test used by `is`. Immutable scalars compare by value. */
[[nodiscard]] bool identical(const Value& a, const Value& b);

/**
 * @brief Copy of `v` with fresh list, dict and set containers at every level.
 *
 * Objects stay shared. Containers nested deeper than 100 levels are shared too.
 */
[[nodiscard]] Value deep_copy(const Value& v);

/** @brief Rough heap footprint of `count` elements, used by allocation guards. */
[[nodiscard]] constexpr std::size_t estimated_bytes(std::size_t count)
{
    return count * sizeof(Value);
}

} // namespace codegate::runtime
