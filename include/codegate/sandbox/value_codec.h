#pragma once

#include <codegate/runtime/value.h>
#include <codegate/support/json.h>
#include <optional>

/**
 * @file value_codec.h
 * @brief Tagged JSON encoding of runtime values exchanged with the Python driver.
 *
 * Each value is an object `{"t": tag, "v": payload}`. Tags: none, bool, int
 * (decimal string), float (repr string, including inf and nan), str, bytes (hex),
 * list, tuple, set, dict (array of [key, value] pairs) and opaque
 * (`{"t":"opaque","type":...,"repr":...}`) for anything without a structural
 * encoding. Integers outside 64 bits decode to opaque values.
 */

namespace codegate::sandbox
{

[[nodiscard]] codegate::support::Json encode_value(const codegate::runtime::Value& value);

/** @brief Decode a tagged value; nullopt when the document is malformed. */
[[nodiscard]] std::optional<codegate::runtime::Value> decode_value(
    const codegate::support::Json& json);

} // namespace codegate::sandbox
