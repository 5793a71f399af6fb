#include <charconv>
#include <cmath>
#include <codegate/sandbox/value_codec.h>
#include <cstdlib>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace codegate::sandbox
{

namespace rt = codegate::runtime;
using codegate::support::Json;

namespace
{

constexpr int kMaxDepth = 100;

Json tagged(std::string tag, Json payload)
{
    Json::Object obj;
    obj.emplace("t", Json{std::move(tag)});
    obj.emplace("v", std::move(payload));
    return Json{std::move(obj)};
}

Json opaque(const std::string& type, const std::string& repr)
{
    Json::Object obj;
    obj.emplace("t", Json{std::string("opaque")});
    obj.emplace("type", Json{type});
    obj.emplace("repr", Json{repr});
    return Json{std::move(obj)};
}

std::string to_hex(const std::string& bytes)
{
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (const char c : bytes)
    {
        const auto u = static_cast<unsigned char>(c);
        out.push_back(digits[u >> 4]);
        out.push_back(digits[u & 0xF]);
    }
    return out;
}

std::optional<std::string> from_hex(const std::string& hex)
{
    if (hex.size() % 2 != 0)
    {
        return std::nullopt;
    }
    auto nibble = [](char c) -> int
    {
        if (c >= '0' && c <= '9')
        {
            return c - '0';
        }
        if (c >= 'a' && c <= 'f')
        {
            return c - 'a' + 10;
        }
        if (c >= 'A' && c <= 'F')
        {
            return c - 'A' + 10;
        }
        return -1;
    };
    std::string out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2)
    {
        const int hi = nibble(hex[i]);
        const int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0)
        {
            return std::nullopt;
        }
        out.push_back(static_cast<char>((hi << 4) | lo));
    }
    return out;
}

Json encode_items(const std::string& tag, const std::vector<rt::Value>& items, int depth);

Json encode(const rt::Value& v, int depth)
{
    if (depth > kMaxDepth)
    {
        return opaque(rt::type_name(v), "...");
    }
    if (v.is_none())
    {
        return tagged("none", Json{nullptr});
    }
    if (v.is_bool())
    {
        return tagged("bool", Json{std::get<bool>(v.data)});
    }
    if (v.is_int())
    {
        return tagged("int", Json{std::to_string(v.as_int())});
    }
    if (v.is_float())
    {
        return tagged("float", Json{rt::format_float(v.as_double())});
    }
    if (v.is_str())
    {
        return tagged("str", Json{v.as_str()});
    }
    if (const auto* bytes = std::get_if<rt::Bytes>(&v.data))
    {
        return tagged("bytes", Json{to_hex(bytes->data)});
    }
    if (v.is_list())
    {
        return encode_items("list", v.as_list()->items, depth);
    }
    if (v.is_tuple())
    {
        return encode_items("tuple", v.as_tuple()->items, depth);
    }
    if (v.is_set())
    {
        return encode_items("set", v.as_set()->items, depth);
    }
    if (v.is_dict())
    {
        Json::Array pairs;
        for (const auto& [key, value] : v.as_dict()->items)
        {
            pairs.push_back(Json{Json::Array{encode(key, depth + 1), encode(value, depth + 1)}});
        }
        return tagged("dict", Json{std::move(pairs)});
    }
    return opaque(v.as_object()->type_name(), v.as_object()->repr());
}

Json encode_items(const std::string& tag, const std::vector<rt::Value>& items, int depth)
{
    Json::Array out;
    out.reserve(items.size());
    for (const auto& item : items)
    {
        out.push_back(encode(item, depth + 1));
    }
    return tagged(tag, Json{std::move(out)});
}

std::optional<std::vector<rt::Value>> decode_items(const Json* payload, int depth);

std::optional<rt::Value> decode(const Json& json, int depth)
{
    if (depth > kMaxDepth)
    {
        return std::nullopt;
    }
    const auto* obj = json.as_object();
    if (obj == nullptr)
    {
        return std::nullopt;
    }
    const auto tag = codegate::support::json_get_string(*obj, "t");
    if (!tag.has_value())
    {
        return std::nullopt;
    }
    const Json* payload = codegate::support::json_get(*obj, "v");
    if (*tag == "none")
    {
        return rt::Value::none();
    }
    if (*tag == "bool")
    {
        const auto b = codegate::support::json_get_bool(*obj, "v");
        if (!b.has_value())
        {
            return std::nullopt;
        }
        return rt::Value::boolean(*b);
    }
    if (*tag == "int")
    {
        const auto text = codegate::support::json_get_string(*obj, "v");
        if (!text.has_value() || text->empty())
        {
            return std::nullopt;
        }
        std::int64_t n = 0;
        const auto [ptr, ec] = std::from_chars(text->data(), text->data() + text->size(), n);
        if (ec == std::errc::result_out_of_range)
        {
            return rt::Value::object(std::make_shared<rt::OpaqueObject>("int", *text));
        }
        if (ec != std::errc() || ptr != text->data() + text->size())
        {
            return std::nullopt;
        }
        return rt::Value::integer(n);
    }
    if (*tag == "float")
    {
        const auto text = codegate::support::json_get_string(*obj, "v");
        if (!text.has_value())
        {
            return std::nullopt;
        }
        char* end = nullptr;
        const double d = std::strtod(text->c_str(), &end);
        if (end == text->c_str() || *end != '\0')
        {
            return std::nullopt;
        }
        return rt::Value::floating(d);
    }
    if (*tag == "str")
    {
        const auto text = codegate::support::json_get_string(*obj, "v");
        if (!text.has_value())
        {
            return std::nullopt;
        }
        return rt::Value::str(*text);
    }
    if (*tag == "bytes")
    {
        const auto text = codegate::support::json_get_string(*obj, "v");
        const auto raw = text.has_value() ? from_hex(*text) : std::nullopt;
        if (!raw.has_value())
        {
            return std::nullopt;
        }
        return rt::Value::bytes(*raw);
    }
    if (*tag == "list" || *tag == "tuple" || *tag == "set")
    {
        auto items = decode_items(payload, depth);
        if (!items.has_value())
        {
            return std::nullopt;
        }
        if (*tag == "list")
        {
            return rt::Value::list(std::move(*items));
        }
        if (*tag == "tuple")
        {
            return rt::Value::tuple(std::move(*items));
        }
        return rt::Value::set(std::move(*items));
    }
    if (*tag == "dict")
    {
        const auto* pairs = payload != nullptr ? payload->as_array() : nullptr;
        if (pairs == nullptr)
        {
            return std::nullopt;
        }
        std::vector<std::pair<rt::Value, rt::Value>> entries;
        for (const auto& pair : *pairs)
        {
            const auto* kv = pair.as_array();
            if (kv == nullptr || kv->size() != 2)
            {
                return std::nullopt;
            }
            auto key = decode((*kv)[0], depth + 1);
            auto value = decode((*kv)[1], depth + 1);
            if (!key.has_value() || !value.has_value())
            {
                return std::nullopt;
            }
            entries.emplace_back(std::move(*key), std::move(*value));
        }
        return rt::Value::dict(std::move(entries));
    }
    if (*tag == "opaque")
    {
        const auto type = codegate::support::json_get_string(*obj, "type");
        const auto repr = codegate::support::json_get_string(*obj, "repr");
        if (!type.has_value() || !repr.has_value())
        {
            return std::nullopt;
        }
        return rt::Value::object(std::make_shared<rt::OpaqueObject>(*type, *repr));
    }
    return std::nullopt;
}

std::optional<std::vector<rt::Value>> decode_items(const Json* payload, int depth)
{
    const auto* arr = payload != nullptr ? payload->as_array() : nullptr;
    if (arr == nullptr)
    {
        return std::nullopt;
    }
    std::vector<rt::Value> items;
    items.reserve(arr->size());
    for (const auto& item : *arr)
    {
        auto v = decode(item, depth + 1);
        if (!v.has_value())
        {
            return std::nullopt;
        }
        items.push_back(std::move(*v));
    }
    return items;
}

} // namespace

Json encode_value(const rt::Value& value)
{
    return encode(value, 0);
}

std::optional<rt::Value> decode_value(const Json& json)
{
    return decode(json, 0);
}

} // namespace codegate::sandbox
