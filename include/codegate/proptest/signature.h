#pragma once

#include <codegate/parser/ast.h>
#include <codegate/runtime/value.h>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

/**
 * @file signature.h
 * @brief Parameter types of a target function, read from its annotations.
 */

namespace codegate::proptest
{

/** @brief Input type the generator understands. */
struct TypeSpec
{
    enum class Kind
    {
        Int,
        Float,
        Bool,
        Str,
        Bytes,
        /** `list[T]` */
        List,
        /** `set[T]` */
        Set,
        /** `tuple[A, B]`; `tuple[T, ...]` is variadic. */
        Tuple,
        /** `dict[K, V]` */
        Dict,
        /** `Optional[T]` / `T | None` */
        Optional,
        /** `None` */
        NoneType,
        /** `Any`; generated as `int`, conforms to everything. */
        Any,
    };

    Kind kind = Kind::Int;
    std::vector<TypeSpec> args;
    bool variadic = false;

    [[nodiscard]] static TypeSpec of(Kind k) { return TypeSpec{.kind = k, .args = {}, .variadic = false}; }
};

[[nodiscard]] bool operator==(const TypeSpec& a, const TypeSpec& b);

/** @brief Python spelling, e.g. `list[int]`. */
[[nodiscard]] std::string to_string(const TypeSpec& type);

/**
 * @brief Type named by an annotation.
 *
 * Missing annotations are `int`. `typing` spellings (`List`, `Optional`,
 * `Union[T, None]`) are accepted; unknown names become Any.
 */
[[nodiscard]] TypeSpec type_from_annotation(const codegate::parser::Expr* annotation);

/** @brief True when `v` is a value of `type` (elements checked recursively). */
[[nodiscard]] bool conforms(const codegate::runtime::Value& v, const TypeSpec& type);

struct Parameter
{
    std::string name;
    TypeSpec type;
};

struct Signature
{
    std::string name;
    /** Positional parameters without defaults; these are the generated inputs. */
    std::vector<Parameter> params;
    std::optional<TypeSpec> returns;
};

/** @brief Why a function cannot be property tested. */
struct SignatureError
{
    std::string message;
};

/**
 * @brief Signature of the top-level `def name` in `module` (the last one wins).
 *
 * Fails when there is no such function or when it has keyword-only
 * parameters without defaults.
 */
[[nodiscard]] std::variant<Signature, SignatureError> signature_of(
    const codegate::parser::Module& module, std::string_view name);

} // namespace codegate::proptest
