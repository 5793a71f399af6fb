#include <cctype>
#include <charconv>
#include <cmath>
#include <codegate/support/json.h>
#include <cstdint>
#include <cstdlib>

namespace codegate::support
{
namespace
{

// Bounds recursion on deeply nested documents.
constexpr std::size_t kMaxDepth = 256;

void append_utf8(std::uint32_t cp, std::string& out)
{
    if (cp < 0x80)
    {
        out.push_back(static_cast<char>(cp));
    }
    else if (cp < 0x800)
    {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp < 0x10000)
    {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

struct JsonParser
{
    std::string_view input;
    std::size_t pos = 0;
    std::size_t depth = 0;

    [[nodiscard]] bool eof() const { return pos >= input.size(); }

    void skip_ws()
    {
        while (!eof() && std::isspace(static_cast<unsigned char>(input[pos])))
        {
            ++pos;
        }
    }

    bool consume(char expected)
    {
        skip_ws();
        if (eof() || input[pos] != expected)
        {
            return false;
        }
        ++pos;
        return true;
    }

    std::optional<Json> parse_value()
    {
        skip_ws();
        if (eof() || depth > kMaxDepth)
        {
            return std::nullopt;
        }
        const char c = input[pos];
        if (c == 'n')
        {
            if (input.substr(pos, 4) == "null")
            {
                pos += 4;
                return Json{nullptr};
            }
            return std::nullopt;
        }
        if (c == 't')
        {
            if (input.substr(pos, 4) == "true")
            {
                pos += 4;
                return Json{true};
            }
            return std::nullopt;
        }
        if (c == 'f')
        {
            if (input.substr(pos, 5) == "false")
            {
                pos += 5;
                return Json{false};
            }
            return std::nullopt;
        }
        if (c == '"')
        {
            auto s = parse_string();
            if (!s.has_value())
            {
                return std::nullopt;
            }
            return Json{std::move(*s)};
        }
        if (c == '{')
        {
            ++depth;
            auto obj = parse_object();
            --depth;
            return obj;
        }
        if (c == '[')
        {
            ++depth;
            auto arr = parse_array();
            --depth;
            return arr;
        }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c)))
        {
            return parse_number();
        }
        return std::nullopt;
    }

    std::optional<std::uint32_t> parse_hex4()
    {
        if (pos + 4 > input.size())
        {
            return std::nullopt;
        }
        std::uint32_t v = 0;
        for (int i = 0; i < 4; ++i)
        {
            const char h = input[pos++];
            v <<= 4;
            if (h >= '0' && h <= '9')
            {
                v |= static_cast<std::uint32_t>(h - '0');
            }
            else if (h >= 'a' && h <= 'f')
            {
                v |= static_cast<std::uint32_t>(h - 'a' + 10);
            }
            else if (h >= 'A' && h <= 'F')
            {
                v |= static_cast<std::uint32_t>(h - 'A' + 10);
            }
            else
            {
                return std::nullopt;
            }
        }
        return v;
    }

    std::optional<std::string> parse_string()
    {
        if (!consume('"'))
        {
            return std::nullopt;
        }
        std::string out;
        while (!eof())
        {
            const char c = input[pos++];
            if (c == '"')
            {
                return out;
            }
            if (c != '\\')
            {
                out.push_back(c);
                continue;
            }
            if (eof())
            {
                return std::nullopt;
            }
            const char esc = input[pos++];
            switch (esc)
            {
            case '"':
                out.push_back('"');
                break;
            case '\\':
                out.push_back('\\');
                break;
            case '/':
                out.push_back('/');
                break;
            case 'b':
                out.push_back('\b');
                break;
            case 'f':
                out.push_back('\f');
                break;
            case 'n':
                out.push_back('\n');
                break;
            case 'r':
                out.push_back('\r');
                break;
            case 't':
                out.push_back('\t');
                break;
            case 'u':
            {
                auto cp = parse_hex4();
                if (!cp.has_value())
                {
                    return std::nullopt;
                }
                std::uint32_t code = *cp;
                // Surrogate pair.
                if (code >= 0xD800 && code <= 0xDBFF && input.substr(pos, 2) == "\\u")
                {
                    pos += 2;
                    auto low = parse_hex4();
                    if (!low.has_value() || *low < 0xDC00 || *low > 0xDFFF)
                    {
                        return std::nullopt;
                    }
                    code = 0x10000 + ((code - 0xD800) << 10) + (*low - 0xDC00);
                }
                append_utf8(code, out);
                break;
            }
            default:
                return std::nullopt;
            }
        }
        return std::nullopt;
    }

    std::optional<Json> parse_number()
    {
        skip_ws();
        const std::size_t start = pos;
        if (!eof() && input[pos] == '-')
        {
            ++pos;
        }
        while (!eof() && std::isdigit(static_cast<unsigned char>(input[pos])))
        {
            ++pos;
        }
        if (!eof() && input[pos] == '.')
        {
            ++pos;
            while (!eof() && std::isdigit(static_cast<unsigned char>(input[pos])))
            {
                ++pos;
            }
        }
        if (!eof() && (input[pos] == 'e' || input[pos] == 'E'))
        {
            ++pos;
            if (!eof() && (input[pos] == '+' || input[pos] == '-'))
            {
                ++pos;
            }
            while (!eof() && std::isdigit(static_cast<unsigned char>(input[pos])))
            {
                ++pos;
            }
        }
        const std::string num(input.substr(start, pos - start));
        char* end_ptr = nullptr;
        const double value = std::strtod(num.c_str(), &end_ptr);
        if (end_ptr == num.c_str())
        {
            return std::nullopt;
        }
        return Json{value};
    }

    std::optional<Json> parse_array()
    {
        if (!consume('['))
        {
            return std::nullopt;
        }
        Json::Array items;
        if (consume(']'))
        {
            return Json{std::move(items)};
        }
        while (true)
        {
            auto value = parse_value();
            if (!value.has_value())
            {
                return std::nullopt;
            }
            items.push_back(std::move(*value));
            if (consume(']'))
            {
                break;
            }
            if (!consume(','))
            {
                return std::nullopt;
            }
        }
        return Json{std::move(items)};
    }

    std::optional<Json> parse_object()
    {
        if (!consume('{'))
        {
            return std::nullopt;
        }
        Json::Object obj;
        if (consume('}'))
        {
            return Json{std::move(obj)};
        }
        while (true)
        {
            skip_ws();
            auto key = parse_string();
            if (!key.has_value())
            {
                return std::nullopt;
            }
            if (!consume(':'))
            {
                return std::nullopt;
            }
            auto val = parse_value();
            if (!val.has_value())
            {
                return std::nullopt;
            }
            obj.insert_or_assign(std::move(*key), std::move(*val));
            if (consume('}'))
            {
                break;
            }
            if (!consume(','))
            {
                return std::nullopt;
            }
        }
        return Json{std::move(obj)};
    }
};

std::string format_number(double v)
{
    if (!std::isfinite(v))
    {
        return "null";
    }
    if (std::floor(v) == v && std::fabs(v) < 1e15)
    {
        return std::to_string(static_cast<long long>(v));
    }
    char buf[64];
    const auto res = std::to_chars(buf, buf + sizeof(buf), v);
    return std::string(buf, res.ptr);
}

void serialize(const Json& value, std::string& out, int indent, int level)
{
    auto newline = [&](int lvl)
    {
        if (indent >= 0)
        {
            out.push_back('\n');
            out.append(static_cast<std::size_t>(indent * lvl), ' ');
        }
    };

    if (value.is_null())
    {
        out += "null";
    }
    else if (const bool* b = value.as_bool())
    {
        out += *b ? "true" : "false";
    }
    else if (const double* d = value.as_number())
    {
        out += format_number(*d);
    }
    else if (const std::string* s = value.as_string())
    {
        out += "\"" + json_escape(*s) + "\"";
    }
    else if (const auto* arr = value.as_array())
    {
        out += "[";
        for (std::size_t i = 0; i < arr->size(); ++i)
        {
            if (i > 0)
            {
                out += ",";
            }
            newline(level + 1);
            serialize((*arr)[i], out, indent, level + 1);
        }
        if (!arr->empty())
        {
            newline(level);
        }
        out += "]";
    }
    else if (const auto* obj = value.as_object())
    {
        out += "{";
        bool first = true;
        for (const auto& [key, val] : *obj)
        {
            if (!first)
            {
                out += ",";
            }
            first = false;
            newline(level + 1);
            out += "\"" + json_escape(key) + "\":";
            if (indent >= 0)
            {
                out += " ";
            }
            serialize(val, out, indent, level + 1);
        }
        if (!obj->empty())
        {
            newline(level);
        }
        out += "}";
    }
}

} // namespace

std::optional<Json> parse_json(std::string_view input)
{
    JsonParser parser{input};
    auto result = parser.parse_value();
    if (!result.has_value())
    {
        return std::nullopt;
    }
    parser.skip_ws();
    if (!parser.eof())
    {
        return std::nullopt;
    }
    return result;
}

std::string json_escape(std::string_view input)
{
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(input.size() + 8);
    for (char c : input)
    {
        switch (c)
        {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20)
            {
                out += "\\u00";
                out.push_back(kHex[(c >> 4) & 0xF]);
                out.push_back(kHex[c & 0xF]);
            }
            else
            {
                out.push_back(c);
            }
            break;
        }
    }
    return out;
}

std::string json_serialize(const Json& value)
{
    std::string out;
    serialize(value, out, -1, 0);
    return out;
}

std::string json_serialize_pretty(const Json& value, int indent)
{
    std::string out;
    serialize(value, out, indent < 0 ? 0 : indent, 0);
    return out;
}

const Json* json_get(const Json::Object& obj, const std::string& key)
{
    const auto it = obj.find(key);
    return it == obj.end() ? nullptr : &it->second;
}

std::optional<std::string> json_get_string(const Json::Object& obj, const std::string& key)
{
    const Json* v = json_get(obj, key);
    if (v == nullptr || !v->is_string())
    {
        return std::nullopt;
    }
    return *v->as_string();
}

std::optional<double> json_get_number(const Json::Object& obj, const std::string& key)
{
    const Json* v = json_get(obj, key);
    if (v == nullptr || !v->is_number())
    {
        return std::nullopt;
    }
    return *v->as_number();
}

std::optional<bool> json_get_bool(const Json::Object& obj, const std::string& key)
{
    const Json* v = json_get(obj, key);
    if (v == nullptr || !v->is_bool())
    {
        return std::nullopt;
    }
    return *v->as_bool();
}

} // namespace codegate::support
