#include <algorithm>
#include <cctype>
#include <cmath>
#include <codegate/interp/interpreter.h>
#include <codegate/interp/library.h>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace codegate::interp
{

namespace rt = codegate::runtime;

namespace
{

struct FormatSpec
{
    char fill = ' ';
    char align = '\0';
    char sign = '-';
    bool alternate = false;
    std::size_t width = 0;
    char grouping = '\0';
    std::optional<std::size_t> precision;
    char type = '\0';
};

bool is_align(char c)
{
    return c == '<' || c == '>' || c == '^' || c == '=';
}

std::optional<std::size_t> read_number(std::string_view s, std::size_t& i)
{
    if (i >= s.size() || std::isdigit(static_cast<unsigned char>(s[i])) == 0)
    {
        return std::nullopt;
    }
    std::size_t n = 0;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i])) != 0)
    {
        n = n * 10 + static_cast<std::size_t>(s[i] - '0');
        if (n > 100000000)
        {
            return std::nullopt;
        }
        ++i;
    }
    return n;
}

std::optional<FormatSpec> parse_spec(Interpreter& in, std::string_view s)
{
    FormatSpec spec;
    std::size_t i = 0;
    if (s.size() >= 2 && is_align(s[1]))
    {
        spec.fill = s[0];
        spec.align = s[1];
        i = 2;
    }
    else if (!s.empty() && is_align(s[0]))
    {
        spec.align = s[0];
        i = 1;
    }
    if (i < s.size() && (s[i] == '+' || s[i] == '-' || s[i] == ' '))
    {
        spec.sign = s[i++];
    }
    if (i < s.size() && s[i] == '#')
    {
        spec.alternate = true;
        ++i;
    }
    if (i < s.size() && s[i] == '0')
    {
        if (spec.align == '\0')
        {
            spec.fill = '0';
            spec.align = '=';
        }
        ++i;
    }
    if (const auto w = read_number(s, i))
    {
        spec.width = *w;
    }
    if (i < s.size() && (s[i] == ',' || s[i] == '_'))
    {
        spec.grouping = s[i++];
    }
    if (i < s.size() && s[i] == '.')
    {
        ++i;
        spec.precision = read_number(s, i);
        if (!spec.precision.has_value())
        {
            in.raise("ValueError", "Format specifier missing precision");
            return std::nullopt;
        }
    }
    if (i < s.size())
    {
        spec.type = s[i++];
    }
    if (i != s.size())
    {
        in.raise("ValueError", "Invalid format specifier '" + std::string(s) + "'");
        return std::nullopt;
    }
    return spec;
}

std::string group_digits(const std::string& digits, char sep, std::size_t every)
{
    if (sep == '\0' || digits.size() <= every)
    {
        return digits;
    }
    std::string out;
    const std::size_t lead = digits.size() % every;
    for (std::size_t i = 0; i < digits.size(); ++i)
    {
        if (i != 0 && (i - lead) % every == 0 && i >= lead)
        {
            out.push_back(sep);
        }
        out.push_back(digits[i]);
    }
    return out;
}

// Pads `sign + prefix + body` to the spec's width using its fill and alignment.
std::string pad(const FormatSpec& spec, const std::string& sign, const std::string& body,
                char default_align)
{
    const std::size_t len = sign.size() + body.size();
    if (len >= spec.width)
    {
        return sign + body;
    }
    const std::size_t total = spec.width - len;
    const std::string fill_all(total, spec.fill);
    switch (spec.align == '\0' ? default_align : spec.align)
    {
    case '<':
        return sign + body + fill_all;
    case '^':
        return std::string(total / 2, spec.fill) + sign + body +
               std::string(total - total / 2, spec.fill);
    case '=':
        return sign + fill_all + body;
    default:
        return fill_all + sign + body;
    }
}

std::string sign_of(bool negative, char sign)
{
    if (negative)
    {
        return "-";
    }
    if (sign == '+')
    {
        return "+";
    }
    return sign == ' ' ? " " : "";
}

std::string unsigned_digits(std::uint64_t u, unsigned base, bool upper)
{
    if (u == 0)
    {
        return "0";
    }
    const char* alphabet = upper ? "0123456789ABCDEF" : "0123456789abcdef";
    std::string out;
    while (u != 0)
    {
        out.insert(out.begin(), alphabet[u % base]);
        u /= base;
    }
    return out;
}

std::uint64_t magnitude(std::int64_t v)
{
    return v < 0 ? 0 - static_cast<std::uint64_t>(v) : static_cast<std::uint64_t>(v);
}

std::string printf_double(char conv, std::size_t precision, bool alternate, double d)
{
    std::string fmt = alternate ? "%#.*" : "%.*";
    fmt.push_back(conv);
    char buf[512];
    const int n = std::snprintf(buf, sizeof(buf), fmt.c_str(), static_cast<int>(precision), d);
    if (n < 0)
    {
        return {};
    }
    if (static_cast<std::size_t>(n) < sizeof(buf))
    {
        return std::string(buf, static_cast<std::size_t>(n));
    }
    std::string big(static_cast<std::size_t>(n) + 1, '\0');
    std::snprintf(big.data(), big.size(), fmt.c_str(), static_cast<int>(precision), d);
    big.resize(static_cast<std::size_t>(n));
    return big;
}

// Applies digit grouping to the integer part of a formatted float.
std::string group_float(const std::string& text, char sep)
{
    if (sep == '\0')
    {
        return text;
    }
    std::size_t end = 0;
    while (end < text.size() && std::isdigit(static_cast<unsigned char>(text[end])) != 0)
    {
        ++end;
    }
    return group_digits(text.substr(0, end), sep, 3) + text.substr(end);
}

std::optional<std::string> format_float_spec(Interpreter& in, double d, const FormatSpec& spec)
{
    const bool negative = std::signbit(d) && !std::isnan(d);
    const double a = std::fabs(d);
    std::string body;
    switch (spec.type)
    {
    case '\0':
        if (!spec.precision.has_value())
        {
            body = rt::format_float(a);
        }
        else
        {
            body = printf_double('g', std::max<std::size_t>(*spec.precision, 1), spec.alternate, a);
            if (std::isfinite(a) && body.find_first_of(".e") == std::string::npos)
            {
                body += ".0";
            }
        }
        break;
    case 'e':
    case 'E':
    case 'f':
    case 'F':
    case 'g':
    case 'G':
        body = printf_double(spec.type, spec.precision.value_or(6), spec.alternate, a);
        break;
    case 'n':
        body = printf_double('g', spec.precision.value_or(6), spec.alternate, a);
        break;
    case '%':
        body = printf_double('f', spec.precision.value_or(6), spec.alternate, a * 100) + "%";
        break;
    default:
        in.raise("ValueError", std::string("Unknown format code '") + spec.type +
                                   "' for object of type 'float'");
        return std::nullopt;
    }
    return pad(spec, sign_of(negative, spec.sign), group_float(body, spec.grouping), '>');
}

std::optional<std::string> format_int_spec(Interpreter& in, std::int64_t v, const FormatSpec& spec)
{
    unsigned base = 10;
    std::string prefix;
    bool upper = false;
    switch (spec.type)
    {
    case '\0':
    case 'd':
    case 'n':
        break;
    case 'b':
        base = 2;
        prefix = "0b";
        break;
    case 'o':
        base = 8;
        prefix = "0o";
        break;
    case 'x':
        base = 16;
        prefix = "0x";
        break;
    case 'X':
        base = 16;
        prefix = "0X";
        upper = true;
        break;
    case 'c':
    {
        if (v < 0 || v > 0x10ffff)
        {
            in.raise("OverflowError", "%c arg not in range(0x110000)");
            return std::nullopt;
        }
        std::string ch;
        const auto cp = static_cast<std::uint32_t>(v);
        if (cp < 0x80)
        {
            ch.push_back(static_cast<char>(cp));
        }
        else if (cp < 0x800)
        {
            ch.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            ch.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
        else if (cp < 0x10000)
        {
            ch.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            ch.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            ch.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
        else
        {
            ch.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            ch.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            ch.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            ch.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
        return pad(spec, "", ch, '<');
    }
    case 'e':
    case 'E':
    case 'f':
    case 'F':
    case 'g':
    case 'G':
    case '%':
        return format_float_spec(in, static_cast<double>(v), spec);
    default:
        in.raise("ValueError", std::string("Unknown format code '") + spec.type +
                                   "' for object of type 'int'");
        return std::nullopt;
    }
    if (spec.grouping == ',' && base != 10)
    {
        in.raise("ValueError", std::string("Cannot specify ',' with '") + spec.type + "'.");
        return std::nullopt;
    }
    std::string digits = unsigned_digits(magnitude(v), base, upper);
    digits = group_digits(digits, spec.grouping, base == 10 ? 3 : 4);
    const std::string sign = sign_of(v < 0, spec.sign) + (spec.alternate ? prefix : "");
    return pad(spec, sign, digits, '>');
}

} // namespace

std::optional<std::string> format_value(Interpreter& interp, const Value& value,
                                        std::string_view spec_text)
{
    if (spec_text.empty())
    {
        return interp.to_str(value);
    }
    const auto spec = parse_spec(interp, spec_text);
    if (!spec.has_value())
    {
        return std::nullopt;
    }
    if (value.is_str())
    {
        if (spec->type != '\0' && spec->type != 's')
        {
            interp.raise("ValueError", std::string("Unknown format code '") + spec->type +
                                           "' for object of type 'str'");
            return std::nullopt;
        }
        if (spec->sign != '-' || spec->align == '=')
        {
            interp.raise("ValueError", "Sign not allowed in string format specifier");
            return std::nullopt;
        }
        std::string text = value.as_str();
        if (spec->precision.has_value() && *spec->precision < text.size())
        {
            text.resize(*spec->precision);
        }
        return pad(*spec, "", text, '<');
    }
    if (value.is_integral())
    {
        return format_int_spec(interp, value.as_int(), *spec);
    }
    if (value.is_float())
    {
        return format_float_spec(interp, value.as_double(), *spec);
    }
    interp.raise("TypeError", "unsupported format string passed to " + rt::type_name(value) +
                                  ".__format__");
    return std::nullopt;
}

std::optional<std::string> percent_format(Interpreter& interp, std::string_view fmt,
                                          const Value& args)
{
    std::vector<Value> positional;
    const rt::DictData* mapping = nullptr;
    if (args.is_tuple())
    {
        positional = args.as_tuple()->items;
    }
    else
    {
        positional.push_back(args);
        if (args.is_dict())
        {
            mapping = args.as_dict().get();
        }
    }
    std::size_t next = 0;
    bool used_mapping = false;
    auto take = [&]() -> std::optional<Value>
    {
        if (next >= positional.size())
        {
            interp.raise("TypeError", "not enough arguments for format string");
            return std::nullopt;
        }
        return positional[next++];
    };

    std::string out;
    std::size_t i = 0;
    while (i < fmt.size())
    {
        const char c = fmt[i++];
        if (c != '%')
        {
            out.push_back(c);
            continue;
        }
        if (i >= fmt.size())
        {
            interp.raise("ValueError", "incomplete format");
            return std::nullopt;
        }
        std::optional<Value> keyed;
        if (fmt[i] == '(')
        {
            const auto close = fmt.find(')', i);
            if (close == std::string_view::npos)
            {
                interp.raise("ValueError", "incomplete format key");
                return std::nullopt;
            }
            if (mapping == nullptr)
            {
                interp.raise("TypeError", "format requires a mapping");
                return std::nullopt;
            }
            const Value key = Value::str(std::string(fmt.substr(i + 1, close - i - 1)));
            const Value* found = mapping->find(key);
            if (found == nullptr)
            {
                interp.raise_with("KeyError", key);
                return std::nullopt;
            }
            keyed = *found;
            used_mapping = true;
            i = close + 1;
        }
        FormatSpec spec;
        bool left = false;
        bool zero = false;
        for (; i < fmt.size(); ++i)
        {
            const char f = fmt[i];
            if (f == '-')
            {
                left = true;
            }
            else if (f == '+' || (f == ' ' && spec.sign != '+'))
            {
                spec.sign = f;
            }
            else if (f == '#')
            {
                spec.alternate = true;
            }
            else if (f == '0')
            {
                zero = true;
            }
            else
            {
                break;
            }
        }
        if (i < fmt.size() && fmt[i] == '*')
        {
            ++i;
            const auto w = take();
            if (!w.has_value())
            {
                return std::nullopt;
            }
            if (!w->is_integral())
            {
                interp.raise("TypeError", "* wants int");
                return std::nullopt;
            }
            if (w->as_int() < 0)
            {
                left = true;
            }
            spec.width = static_cast<std::size_t>(magnitude(w->as_int()));
        }
        else if (const auto w = read_number(fmt, i))
        {
            spec.width = *w;
        }
        if (i < fmt.size() && fmt[i] == '.')
        {
            ++i;
            if (i < fmt.size() && fmt[i] == '*')
            {
                ++i;
                const auto p = take();
                if (!p.has_value())
                {
                    return std::nullopt;
                }
                if (!p->is_integral())
                {
                    interp.raise("TypeError", "* wants int");
                    return std::nullopt;
                }
                spec.precision = static_cast<std::size_t>(std::max<std::int64_t>(0, p->as_int()));
            }
            else
            {
                spec.precision = read_number(fmt, i).value_or(0);
            }
        }
        while (i < fmt.size() && (fmt[i] == 'h' || fmt[i] == 'l' || fmt[i] == 'L'))
        {
            ++i;
        }
        if (i >= fmt.size())
        {
            interp.raise("ValueError", "incomplete format");
            return std::nullopt;
        }
        const char conv = fmt[i++];
        if (conv == '%')
        {
            out.push_back('%');
            continue;
        }
        std::optional<Value> arg = keyed;
        if (!arg.has_value())
        {
            arg = take();
            if (!arg.has_value())
            {
                return std::nullopt;
            }
        }
        spec.align = left ? '<' : (zero ? '=' : '>');
        spec.fill = zero && !left ? '0' : ' ';
        std::optional<std::string> piece;
        switch (conv)
        {
        case 's':
        case 'r':
        case 'a':
        {
            piece = conv == 's' ? interp.to_str(*arg) : interp.to_repr(*arg);
            if (!piece.has_value())
            {
                return std::nullopt;
            }
            if (spec.precision.has_value() && *spec.precision < piece->size())
            {
                piece->resize(*spec.precision);
            }
            FormatSpec text_spec = spec;
            text_spec.fill = ' ';
            text_spec.align = left ? '<' : '>';
            piece = pad(text_spec, "", *piece, '>');
            break;
        }
        case 'd':
        case 'i':
        case 'u':
        case 'x':
        case 'X':
        case 'o':
        {
            if (!arg->is_number())
            {
                interp.raise("TypeError", std::string("%") + conv + " format: " +
                                              (conv == 'd' || conv == 'i' || conv == 'u'
                                                   ? "a real number"
                                                   : "an integer") +
                                              " is required, not " + rt::type_name(*arg));
                return std::nullopt;
            }
            if (arg->is_float() && conv != 'd' && conv != 'i' && conv != 'u')
            {
                interp.raise("TypeError", std::string("%") + conv +
                                              " format: an integer is required, not float");
                return std::nullopt;
            }
            std::int64_t v = 0;
            if (arg->is_float())
            {
                const double d = std::trunc(arg->as_double());
                if (!std::isfinite(d) || std::fabs(d) >= 9.2e18)
                {
                    interp.raise("OverflowError", "cannot convert float to integer");
                    return std::nullopt;
                }
                v = static_cast<std::int64_t>(d);
            }
            else
            {
                v = arg->as_int();
            }
            const unsigned base = conv == 'o' ? 8 : (conv == 'x' || conv == 'X') ? 16 : 10;
            std::string digits = unsigned_digits(magnitude(v), base, conv == 'X');
            if (spec.precision.has_value() && digits.size() < *spec.precision)
            {
                digits.insert(0, *spec.precision - digits.size(), '0');
            }
            std::string sign = sign_of(v < 0, spec.sign);
            if (spec.alternate && base != 10)
            {
                sign += conv == 'o' ? "0o" : conv == 'x' ? "0x" : "0X";
            }
            piece = pad(spec, sign, digits, '>');
            break;
        }
        case 'e':
        case 'E':
        case 'f':
        case 'F':
        case 'g':
        case 'G':
        {
            if (!arg->is_number())
            {
                interp.raise("TypeError", "must be real number, not " + rt::type_name(*arg));
                return std::nullopt;
            }
            const double d = arg->as_double();
            const std::string body =
                printf_double(conv, spec.precision.value_or(6), spec.alternate, std::fabs(d));
            piece = pad(spec, sign_of(std::signbit(d) && !std::isnan(d), spec.sign), body, '>');
            break;
        }
        case 'c':
        {
            std::string ch;
            if (arg->is_str() && arg->as_str().size() == 1)
            {
                ch = arg->as_str();
            }
            else if (arg->is_integral() && arg->as_int() >= 0 && arg->as_int() < 128)
            {
                ch.push_back(static_cast<char>(arg->as_int()));
            }
            else if (arg->is_integral())
            {
                FormatSpec char_spec;
                char_spec.type = 'c';
                const auto encoded = format_int_spec(interp, arg->as_int(), char_spec);
                if (!encoded.has_value())
                {
                    return std::nullopt;
                }
                ch = *encoded;
            }
            else
            {
                interp.raise("TypeError", "%c requires int or char");
                return std::nullopt;
            }
            FormatSpec char_pad = spec;
            char_pad.fill = ' ';
            char_pad.align = left ? '<' : '>';
            piece = pad(char_pad, "", ch, '>');
            break;
        }
        default:
        {
            char hex[8];
            std::snprintf(hex, sizeof(hex), "%x", static_cast<unsigned char>(conv));
            interp.raise("ValueError", std::string("unsupported format character '") + conv +
                                           "' (0x" + hex + ") at index " +
                                           std::to_string(i - 1));
            return std::nullopt;
        }
        }
        out += *piece;
        if (out.size() > 16 * 1024 * 1024 && !interp.guard_allocation(out.size() / sizeof(Value)))
        {
            return std::nullopt;
        }
    }
    if (!used_mapping && next < positional.size() && !(mapping != nullptr && next == 0))
    {
        interp.raise("TypeError", "not all arguments converted during string formatting");
        return std::nullopt;
    }
    return out;
}

namespace
{

// State of one str.format call; nested replacement fields share the auto counter.
class FieldFormatter
{
  public:
    FieldFormatter(Interpreter& in, const Args& args, const Kwargs& kwargs)
        : in_(in), args_(args), kwargs_(kwargs)
    {
    }

    std::optional<std::string> expand(std::string_view fmt, int depth)
    {
        if (depth > 2)
        {
            in_.raise("ValueError", "Max string recursion exceeded");
            return std::nullopt;
        }
        std::string out;
        std::size_t i = 0;
        while (i < fmt.size())
        {
            const char c = fmt[i];
            if (c == '}')
            {
                if (i + 1 < fmt.size() && fmt[i + 1] == '}')
                {
                    out.push_back('}');
                    i += 2;
                    continue;
                }
                in_.raise("ValueError", "Single '}' encountered in format string");
                return std::nullopt;
            }
            if (c != '{')
            {
                out.push_back(c);
                ++i;
                continue;
            }
            if (i + 1 < fmt.size() && fmt[i + 1] == '{')
            {
                out.push_back('{');
                i += 2;
                continue;
            }
            std::size_t j = i + 1;
            int nesting = 1;
            while (j < fmt.size() && nesting > 0)
            {
                nesting += fmt[j] == '{' ? 1 : fmt[j] == '}' ? -1 : 0;
                ++j;
            }
            if (nesting != 0)
            {
                in_.raise("ValueError", "expected '}' before end of string");
                return std::nullopt;
            }
            const auto piece = field(fmt.substr(i + 1, j - i - 2), depth);
            if (!piece.has_value())
            {
                return std::nullopt;
            }
            out += *piece;
            i = j;
        }
        return out;
    }

  private:
    std::optional<std::string> field(std::string_view text, int depth)
    {
        std::size_t name_end = 0;
        while (name_end < text.size() && text[name_end] != '!' && text[name_end] != ':')
        {
            ++name_end;
        }
        const std::string_view name = text.substr(0, name_end);
        char conversion = '\0';
        std::size_t rest = name_end;
        if (rest < text.size() && text[rest] == '!')
        {
            if (rest + 1 >= text.size())
            {
                in_.raise("ValueError", "end of string while looking for conversion specifier");
                return std::nullopt;
            }
            conversion = text[rest + 1];
            rest += 2;
            if (rest < text.size() && text[rest] != ':')
            {
                in_.raise("ValueError", "expected ':' after conversion specifier");
                return std::nullopt;
            }
        }
        std::string_view spec;
        if (rest < text.size())
        {
            spec = text.substr(rest + 1);
        }

        const auto value = resolve(name);
        if (!value.has_value())
        {
            return std::nullopt;
        }
        Value converted = *value;
        if (conversion != '\0')
        {
            std::optional<std::string> text_value;
            switch (conversion)
            {
            case 's':
                text_value = in_.to_str(*value);
                break;
            case 'r':
            case 'a':
                text_value = in_.to_repr(*value);
                break;
            default:
                in_.raise("ValueError", std::string("Unknown conversion specifier ") + conversion);
                return std::nullopt;
            }
            if (!text_value.has_value())
            {
                return std::nullopt;
            }
            converted = Value::str(std::move(*text_value));
        }
        std::string expanded_spec(spec);
        if (spec.find('{') != std::string_view::npos)
        {
            auto nested = expand(spec, depth + 1);
            if (!nested.has_value())
            {
                return std::nullopt;
            }
            expanded_spec = std::move(*nested);
        }
        return format_value(in_, converted, expanded_spec);
    }

    std::optional<Value> resolve(std::string_view name)
    {
        if (name.find_first_of(".[") != std::string_view::npos)
        {
            in_.raise("ValueError", "attribute and index lookup in replacement fields is not supported");
            return std::nullopt;
        }
        std::size_t index = 0;
        if (name.empty())
        {
            if (manual_)
            {
                in_.raise("ValueError",
                          "cannot switch from manual field specification to automatic field numbering");
                return std::nullopt;
            }
            automatic_ = true;
            index = next_++;
        }
        else if (std::isdigit(static_cast<unsigned char>(name[0])) != 0)
        {
            if (automatic_)
            {
                in_.raise("ValueError",
                          "cannot switch from automatic field numbering to manual field specification");
                return std::nullopt;
            }
            manual_ = true;
            std::size_t pos = 0;
            const auto n = read_number(name, pos);
            if (!n.has_value() || pos != name.size())
            {
                in_.raise("ValueError", "invalid replacement field '" + std::string(name) + "'");
                return std::nullopt;
            }
            index = *n;
        }
        else
        {
            for (const auto& [key, value] : kwargs_)
            {
                if (key == name)
                {
                    return value;
                }
            }
            in_.raise_with("KeyError", Value::str(std::string(name)));
            return std::nullopt;
        }
        if (index >= args_.size())
        {
            in_.raise("IndexError", "Replacement index " + std::to_string(index) +
                                        " out of range for positional args tuple");
            return std::nullopt;
        }
        return args_[index];
    }

    Interpreter& in_;
    const Args& args_;
    const Kwargs& kwargs_;
    std::size_t next_ = 0;
    bool automatic_ = false;
    bool manual_ = false;
};

} // namespace

std::optional<std::string> str_format(Interpreter& interp, std::string_view fmt, const Args& args,
                                      const Kwargs& kwargs)
{
    FieldFormatter formatter(interp, args, kwargs);
    return formatter.expand(fmt, 0);
}

} // namespace codegate::interp
