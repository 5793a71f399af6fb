#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

/**
 * @file json.h
 * @brief Minimal JSON value, parser and serializer.
 *
 * Used for the sandbox driver protocol, external analyzer output and the
 * validation report. Objects keep their keys sorted, so serialization is
 * deterministic.
 */

namespace codegate::support
{

struct Json
{
    using Object = std::map<std::string, Json>;
    using Array = std::vector<Json>;

    std::variant<std::nullptr_t, bool, double, std::string, Object, Array> value;

    [[nodiscard]] bool is_null() const { return std::holds_alternative<std::nullptr_t>(value); }
    [[nodiscard]] bool is_bool() const { return std::holds_alternative<bool>(value); }
    [[nodiscard]] bool is_number() const { return std::holds_alternative<double>(value); }
    [[nodiscard]] bool is_string() const { return std::holds_alternative<std::string>(value); }
    [[nodiscard]] bool is_object() const { return std::holds_alternative<Object>(value); }
    [[nodiscard]] bool is_array() const { return std::holds_alternative<Array>(value); }

    [[nodiscard]] const Object* as_object() const { return std::get_if<Object>(&value); }
    [[nodiscard]] const Array* as_array() const { return std::get_if<Array>(&value); }
    [[nodiscard]] const std::string* as_string() const { return std::get_if<std::string>(&value); }
    [[nodiscard]] const double* as_number() const { return std::get_if<double>(&value); }
    [[nodiscard]] const bool* as_bool() const { return std::get_if<bool>(&value); }
};

/** @brief Parse a complete JSON document; trailing non-whitespace is an error. */
[[nodiscard]] std::optional<Json> parse_json(std::string_view input);

/** @brief Escape `input` for use inside a JSON string literal (without the quotes). */
[[nodiscard]] std::string json_escape(std::string_view input);

/** @brief Compact serialization. */
[[nodiscard]] std::string json_serialize(const Json& value);

/** @brief Indented serialization, `indent` spaces per level. */
[[nodiscard]] std::string json_serialize_pretty(const Json& value, int indent = 2);

[[nodiscard]] const Json* json_get(const Json::Object& obj, const std::string& key);
[[nodiscard]] std::optional<std::string> json_get_string(const Json::Object& obj,
                                                         const std::string& key);
[[nodiscard]] std::optional<double> json_get_number(const Json::Object& obj, const std::string& key);
[[nodiscard]] std::optional<bool> json_get_bool(const Json::Object& obj, const std::string& key);

} // namespace codegate::support
