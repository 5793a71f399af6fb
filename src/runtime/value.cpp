#include <algorithm>
#include <charconv>
#include <cmath>
#include <codegate/runtime/value.h>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <system_error>

namespace codegate::runtime
{

namespace
{

// Containers that (directly or indirectly) hold themselves print as "..." past this depth.
constexpr int kMaxReprDepth = 64;

std::string repr_string(std::string_view s, bool is_bytes)
{
    const bool has_single = s.find('\'') != std::string_view::npos;
    const bool has_double = s.find('"') != std::string_view::npos;
    const char quote = (has_single && !has_double) ? '"' : '\'';

    std::string out;
    out.reserve(s.size() + 3);
    if (is_bytes)
    {
        out.push_back('b');
    }
    out.push_back(quote);
    for (const char ch : s)
    {
        const auto c = static_cast<unsigned char>(ch);
        if (ch == quote || ch == '\\')
        {
            out.push_back('\\');
            out.push_back(ch);
        }
        else if (ch == '\n')
        {
            out += "\\n";
        }
        else if (ch == '\r')
        {
            out += "\\r";
        }
        else if (ch == '\t')
        {
            out += "\\t";
        }
        else if (c < 0x20 || c == 0x7f || (is_bytes && c >= 0x80))
        {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\x%02x", c);
            out += buf;
        }
        else
        {
            out.push_back(ch);
        }
    }
    out.push_back(quote);
    return out;
}

std::string repr_impl(const Value& v, int depth);

std::string repr_sequence(const std::vector<Value>& items, char open, char close, int depth)
{
    std::string out(1, open);
    for (std::size_t i = 0; i < items.size(); ++i)
    {
        if (i != 0)
        {
            out += ", ";
        }
        out += repr_impl(items[i], depth + 1);
    }
    out.push_back(close);
    return out;
}

std::string repr_impl(const Value& v, int depth)
{
    if (depth > kMaxReprDepth)
    {
        return "...";
    }
    if (v.is_none())
    {
        return "None";
    }
    if (v.is_bool())
    {
        return std::get<bool>(v.data) ? "True" : "False";
    }
    if (v.is_int())
    {
        return std::to_string(std::get<std::int64_t>(v.data));
    }
    if (v.is_float())
    {
        return format_float(std::get<double>(v.data));
    }
    if (v.is_str())
    {
        return repr_string(v.as_str(), false);
    }
    if (const auto* b = std::get_if<Bytes>(&v.data))
    {
        return repr_string(b->data, true);
    }
    if (v.is_list())
    {
        return repr_sequence(v.as_list()->items, '[', ']', depth);
    }
    if (v.is_tuple())
    {
        const auto& items = v.as_tuple()->items;
        if (items.size() == 1)
        {
            return "(" + repr_impl(items[0], depth + 1) + ",)";
        }
        return repr_sequence(items, '(', ')', depth);
    }
    if (v.is_dict())
    {
        std::string out = "{";
        bool first = true;
        for (const auto& [key, value] : v.as_dict()->items)
        {
            if (!first)
            {
                out += ", ";
            }
            first = false;
            out += repr_impl(key, depth + 1);
            out += ": ";
            out += repr_impl(value, depth + 1);
        }
        out += "}";
        return out;
    }
    if (v.is_set())
    {
        const auto& items = v.as_set()->items;
        if (items.empty())
        {
            return "set()";
        }
        return repr_sequence(items, '{', '}', depth);
    }
    return v.as_object()->repr();
}

bool sequence_equals(const std::vector<Value>& a, const std::vector<Value>& b)
{
    if (a.size() != b.size())
    {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        if (!equals(a[i], b[i]))
        {
            return false;
        }
    }
    return true;
}

std::optional<int> compare_sequences(const std::vector<Value>& a, const std::vector<Value>& b)
{
    const std::size_t n = std::min(a.size(), b.size());
    for (std::size_t i = 0; i < n; ++i)
    {
        if (equals(a[i], b[i]))
        {
            continue;
        }
        return compare(a[i], b[i]);
    }
    if (a.size() == b.size())
    {
        return 0;
    }
    return a.size() < b.size() ? -1 : 1;
}

} // namespace

Value Value::list(std::vector<Value> items)
{
    auto data = std::make_shared<ListData>();
    data->items = std::move(items);
    return Value{.data = std::move(data)};
}

Value Value::tuple(std::vector<Value> items)
{
    auto data = std::make_shared<TupleData>();
    data->items = std::move(items);
    return Value{.data = TupleRef(std::move(data))};
}

Value Value::dict(std::vector<std::pair<Value, Value>> items)
{
    auto data = std::make_shared<DictData>();
    for (auto& [key, value] : items)
    {
        data->set(std::move(key), std::move(value));
    }
    return Value{.data = std::move(data)};
}

Value Value::set(std::vector<Value> items)
{
    auto data = std::make_shared<SetData>();
    for (auto& item : items)
    {
        data->add(std::move(item));
    }
    return Value{.data = std::move(data)};
}

std::int64_t Value::as_int() const
{
    if (const auto* b = std::get_if<bool>(&data))
    {
        return *b ? 1 : 0;
    }
    return std::get<std::int64_t>(data);
}

double Value::as_double() const
{
    if (const auto* d = std::get_if<double>(&data))
    {
        return *d;
    }
    return static_cast<double>(as_int());
}

const Value* DictData::find(const Value& key) const
{
    for (const auto& [k, v] : items)
    {
        if (equals(k, key))
        {
            return &v;
        }
    }
    return nullptr;
}

Value* DictData::find(const Value& key)
{
    for (auto& [k, v] : items)
    {
        if (equals(k, key))
        {
            return &v;
        }
    }
    return nullptr;
}

void DictData::set(Value key, Value value)
{
    if (Value* existing = find(key))
    {
        *existing = std::move(value);
        return;
    }
    items.emplace_back(std::move(key), std::move(value));
}

bool DictData::erase(const Value& key)
{
    const auto it = std::find_if(items.begin(), items.end(),
                                 [&](const auto& kv) { return equals(kv.first, key); });
    if (it == items.end())
    {
        return false;
    }
    items.erase(it);
    return true;
}

bool SetData::contains(const Value& v) const
{
    return std::any_of(items.begin(), items.end(),
                       [&](const Value& item) { return equals(item, v); });
}

bool SetData::add(Value v)
{
    if (contains(v))
    {
        return false;
    }
    items.push_back(std::move(v));
    return true;
}

bool SetData::erase(const Value& v)
{
    const auto it = std::find_if(items.begin(), items.end(),
                                 [&](const Value& item) { return equals(item, v); });
    if (it == items.end())
    {
        return false;
    }
    items.erase(it);
    return true;
}

std::string Object::repr() const
{
    return "<" + type_name() + " object>";
}

bool OpaqueObject::equals(const Object& other) const
{
    const auto* o = dynamic_cast<const OpaqueObject*>(&other);
    return o != nullptr && o->type_name_ == type_name_ && o->repr_ == repr_;
}

std::string type_name(const Value& v)
{
    if (v.is_none())
    {
        return "NoneType";
    }
    if (v.is_bool())
    {
        return "bool";
    }
    if (v.is_int())
    {
        return "int";
    }
    if (v.is_float())
    {
        return "float";
    }
    if (v.is_str())
    {
        return "str";
    }
    if (std::holds_alternative<Bytes>(v.data))
    {
        return "bytes";
    }
    if (v.is_list())
    {
        return "list";
    }
    if (v.is_tuple())
    {
        return "tuple";
    }
    if (v.is_dict())
    {
        return "dict";
    }
    if (v.is_set())
    {
        return "set";
    }
    return v.as_object()->type_name();
}

std::string repr(const Value& v)
{
    return repr_impl(v, 0);
}

std::string str(const Value& v)
{
    if (v.is_str())
    {
        return v.as_str();
    }
    return repr(v);
}

std::string format_float(double d)
{
    if (std::isnan(d))
    {
        return "nan";
    }
    if (std::isinf(d))
    {
        return d < 0 ? "-inf" : "inf";
    }

    char buf[64];
    const auto res = std::to_chars(buf, buf + sizeof(buf), d, std::chars_format::scientific);
    if (res.ec != std::errc())
    {
        return "nan";
    }
    const std::string sci(buf, res.ptr);

    // sci looks like "-1.2345e+02": split sign, digits and exponent.
    std::size_t pos = 0;
    std::string sign;
    if (sci[0] == '-')
    {
        sign = "-";
        pos = 1;
    }
    const std::size_t e_pos = sci.find('e');
    std::string digits;
    for (std::size_t i = pos; i < e_pos; ++i)
    {
        if (sci[i] != '.')
        {
            digits.push_back(sci[i]);
        }
    }
    const int exponent = std::atoi(sci.c_str() + e_pos + 1);

    if (exponent >= -4 && exponent < 16)
    {
        std::string out = sign;
        if (exponent >= 0)
        {
            const auto int_len = static_cast<std::size_t>(exponent) + 1;
            if (digits.size() <= int_len)
            {
                out += digits;
                out.append(int_len - digits.size(), '0');
                out += ".0";
            }
            else
            {
                out += digits.substr(0, int_len);
                out += ".";
                out += digits.substr(int_len);
            }
        }
        else
        {
            out += "0.";
            out.append(static_cast<std::size_t>(-exponent - 1), '0');
            out += digits;
        }
        return out;
    }

    std::string out = sign;
    out.push_back(digits[0]);
    if (digits.size() > 1)
    {
        out += ".";
        out += digits.substr(1);
    }
    char exp_buf[16];
    std::snprintf(exp_buf, sizeof(exp_buf), "e%c%02d", exponent < 0 ? '-' : '+',
                  exponent < 0 ? -exponent : exponent);
    out += exp_buf;
    return out;
}

bool truthy(const Value& v)
{
    if (v.is_none())
    {
        return false;
    }
    if (v.is_bool())
    {
        return std::get<bool>(v.data);
    }
    if (v.is_int())
    {
        return std::get<std::int64_t>(v.data) != 0;
    }
    if (v.is_float())
    {
        return std::get<double>(v.data) != 0.0;
    }
    if (v.is_str())
    {
        return !v.as_str().empty();
    }
    if (const auto* b = std::get_if<Bytes>(&v.data))
    {
        return !b->data.empty();
    }
    if (v.is_list())
    {
        return !v.as_list()->items.empty();
    }
    if (v.is_tuple())
    {
        return !v.as_tuple()->items.empty();
    }
    if (v.is_dict())
    {
        return !v.as_dict()->items.empty();
    }
    if (v.is_set())
    {
        return !v.as_set()->items.empty();
    }
    return true;
}

bool equals(const Value& a, const Value& b)
{
    if (a.is_number() && b.is_number())
    {
        if (a.is_float() || b.is_float())
        {
            return a.as_double() == b.as_double();
        }
        return a.as_int() == b.as_int();
    }
    if (a.data.index() != b.data.index())
    {
        return false;
    }
    if (a.is_none())
    {
        return true;
    }
    if (a.is_str())
    {
        return a.as_str() == b.as_str();
    }
    if (const auto* ab = std::get_if<Bytes>(&a.data))
    {
        return ab->data == std::get<Bytes>(b.data).data;
    }
    if (a.is_list())
    {
        return a.as_list() == b.as_list() || sequence_equals(a.as_list()->items, b.as_list()->items);
    }
    if (a.is_tuple())
    {
        return sequence_equals(a.as_tuple()->items, b.as_tuple()->items);
    }
    if (a.is_dict())
    {
        const auto& da = *a.as_dict();
        const auto& db = *b.as_dict();
        if (da.items.size() != db.items.size())
        {
            return false;
        }
        return std::all_of(da.items.begin(), da.items.end(), [&](const auto& kv) {
            const Value* other = db.find(kv.first);
            return other != nullptr && equals(kv.second, *other);
        });
    }
    if (a.is_set())
    {
        const auto& sa = *a.as_set();
        const auto& sb = *b.as_set();
        return sa.items.size() == sb.items.size() &&
               std::all_of(sa.items.begin(), sa.items.end(),
                           [&](const Value& v) { return sb.contains(v); });
    }
    return a.as_object()->equals(*b.as_object());
}

std::optional<int> compare(const Value& a, const Value& b)
{
    if (a.is_number() && b.is_number())
    {
        if (a.is_float() || b.is_float())
        {
            const double x = a.as_double();
            const double y = b.as_double();
            if (std::isnan(x) || std::isnan(y))
            {
                // Every ordering against NaN is false; callers map 2 to "unordered".
                return 2;
            }
            return x < y ? -1 : (x > y ? 1 : 0);
        }
        const std::int64_t x = a.as_int();
        const std::int64_t y = b.as_int();
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    if (a.is_str() && b.is_str())
    {
        const int c = a.as_str().compare(b.as_str());
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    if (std::holds_alternative<Bytes>(a.data) && std::holds_alternative<Bytes>(b.data))
    {
        const int c = std::get<Bytes>(a.data).data.compare(std::get<Bytes>(b.data).data);
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    if (a.is_list() && b.is_list())
    {
        return compare_sequences(a.as_list()->items, b.as_list()->items);
    }
    if (a.is_tuple() && b.is_tuple())
    {
        return compare_sequences(a.as_tuple()->items, b.as_tuple()->items);
    }
    return std::nullopt;
}

bool hashable(const Value& v)
{
    if (v.is_list() || v.is_dict() || v.is_set())
    {
        return false;
    }
    if (v.is_tuple())
    {
        const auto& items = v.as_tuple()->items;
        return std::all_of(items.begin(), items.end(), [](const Value& x) { return hashable(x); });
    }
    if (v.is_object())
    {
        return v.as_object()->hashable();
    }
    return true;
}

bool identical(const Value& a, const Value& b)
{
    if (a.data.index() != b.data.index())
    {
        return false;
    }
    if (a.is_list())
    {
        return a.as_list() == b.as_list();
    }
    if (a.is_tuple())
    {
        return a.as_tuple() == b.as_tuple() || (a.as_tuple()->items.empty() && b.as_tuple()->items.empty());
    }
    if (a.is_dict())
    {
        return a.as_dict() == b.as_dict();
    }
    if (a.is_set())
    {
        return a.as_set() == b.as_set();
    }
    if (a.is_object())
    {
        return a.as_object() == b.as_object();
    }
    return equals(a, b);
}

namespace
{

Value copy_at(const Value& v, int depth)
{
    if (depth > 100)
    {
        return v;
    }
    auto copy_items = [depth](const std::vector<Value>& items)
    {
        std::vector<Value> out;
        out.reserve(items.size());
        for (const auto& item : items)
        {
            out.push_back(copy_at(item, depth + 1));
        }
        return out;
    };
    if (v.is_list())
    {
        return Value::list(copy_items(v.as_list()->items));
    }
    if (v.is_tuple())
    {
        return Value::tuple(copy_items(v.as_tuple()->items));
    }
    if (v.is_set())
    {
        return Value::set(copy_items(v.as_set()->items));
    }
    if (v.is_dict())
    {
        std::vector<std::pair<Value, Value>> items;
        items.reserve(v.as_dict()->items.size());
        for (const auto& [key, value] : v.as_dict()->items)
        {
            items.emplace_back(copy_at(key, depth + 1), copy_at(value, depth + 1));
        }
        return Value::dict(std::move(items));
    }
    return v;
}

} // namespace

Value deep_copy(const Value& v)
{
    return copy_at(v, 0);
}

} // namespace codegate::runtime
