#include <algorithm>
#include <cctype>
#include <cmath>
#include <codegate/interp/args.h>
#include <codegate/interp/interpreter.h>
#include <codegate/interp/library.h>
#include <limits>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace codegate::interp
{

namespace rt = codegate::runtime;

namespace
{

using MethodTable = std::map<std::string, NativeFn, std::less<>>;

// Arity check that does not count the receiver in args[0].
bool arity(Interpreter& in, std::string_view fname, const Args& args, std::size_t min,
           std::size_t max)
{
    const std::size_t given = args.size() - 1;
    if (given >= min && given <= max)
    {
        return true;
    }
    std::string msg = std::string(fname) + "() takes ";
    if (min == max)
    {
        msg += min == 0 ? "no arguments" : "exactly " + std::to_string(min) + " argument" +
                                               (min == 1 ? "" : "s");
    }
    else if (given < min)
    {
        msg += "at least " + std::to_string(min) + " argument" + (min == 1 ? "" : "s");
    }
    else
    {
        msg += "at most " + std::to_string(max) + " argument" + (max == 1 ? "" : "s");
    }
    msg += " (" + std::to_string(given) + " given)";
    in.raise("TypeError", msg);
    return false;
}

bool plain(Interpreter& in, std::string_view fname, const Args& args, const Kwargs& kwargs,
           std::size_t min, std::size_t max)
{
    return no_kwargs(in, fname, kwargs) && arity(in, fname, args, min, max);
}

bool is_space(char c)
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

char to_upper(char c)
{
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

char to_lower(char c)
{
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

// Optional integer argument at `index`; `fallback` when absent or None.
std::optional<std::int64_t> opt_int(Interpreter& in, std::string_view fname, const Args& args,
                                    std::size_t index, std::int64_t fallback)
{
    if (index >= args.size() || args[index].is_none())
    {
        return fallback;
    }
    return int_arg(in, fname, args[index]);
}

// Resolves optional start/end arguments against a length, Python-style.
std::pair<std::size_t, std::size_t> bounds(const Args& args, std::size_t first, std::size_t size)
{
    const auto n = static_cast<std::int64_t>(size);
    auto clamp = [n](std::int64_t v)
    {
        if (v < 0)
        {
            v = std::max<std::int64_t>(0, v + n);
        }
        return static_cast<std::size_t>(std::min(v, n));
    };
    std::size_t lo = 0;
    std::size_t hi = size;
    if (first < args.size() && args[first].is_integral())
    {
        lo = clamp(args[first].as_int());
    }
    if (first + 1 < args.size() && args[first + 1].is_integral())
    {
        hi = clamp(args[first + 1].as_int());
    }
    return {lo, std::max(lo, hi)};
}

std::vector<std::string> split_whitespace(const std::string& s, std::int64_t maxsplit)
{
    std::vector<std::string> out;
    std::size_t i = 0;
    while (i < s.size())
    {
        while (i < s.size() && is_space(s[i]))
        {
            ++i;
        }
        if (i == s.size())
        {
            break;
        }
        if (maxsplit >= 0 && static_cast<std::int64_t>(out.size()) == maxsplit)
        {
            std::size_t end = s.size();
            while (end > i && is_space(s[end - 1]))
            {
                --end;
            }
            out.push_back(s.substr(i, end - i));
            break;
        }
        std::size_t j = i;
        while (j < s.size() && !is_space(s[j]))
        {
            ++j;
        }
        out.push_back(s.substr(i, j - i));
        i = j;
    }
    return out;
}

std::vector<std::string> split_on(const std::string& s, const std::string& sep,
                                  std::int64_t maxsplit)
{
    std::vector<std::string> out;
    std::size_t start = 0;
    while (maxsplit < 0 || static_cast<std::int64_t>(out.size()) < maxsplit)
    {
        const auto pos = s.find(sep, start);
        if (pos == std::string::npos)
        {
            break;
        }
        out.push_back(s.substr(start, pos - start));
        start = pos + sep.size();
    }
    out.push_back(s.substr(start));
    return out;
}

std::vector<std::string> rsplit_on(const std::string& s, const std::string& sep,
                                   std::int64_t maxsplit)
{
    std::vector<std::string> out;
    std::size_t end = s.size();
    while (maxsplit < 0 || static_cast<std::int64_t>(out.size()) < maxsplit)
    {
        if (end < sep.size())
        {
            break;
        }
        const auto pos = s.rfind(sep, end - sep.size());
        if (pos == std::string::npos)
        {
            break;
        }
        out.push_back(s.substr(pos + sep.size(), end - pos - sep.size()));
        end = pos;
    }
    out.push_back(s.substr(0, end));
    std::reverse(out.begin(), out.end());
    return out;
}

Value str_list(std::vector<std::string> parts)
{
    std::vector<Value> items;
    items.reserve(parts.size());
    for (auto& p : parts)
    {
        items.push_back(Value::str(std::move(p)));
    }
    return Value::list(std::move(items));
}

EvalResult split_method(Interpreter& in, Args& a, Kwargs& k, bool from_right)
{
    const char* fname = from_right ? "rsplit" : "split";
    if (!only_kwargs(in, fname, k, {"sep", "maxsplit"}) || !arity(in, fname, a, 0, 2))
    {
        return std::nullopt;
    }
    const Value* sep = a.size() > 1 ? &a[1] : find_kwarg(k, "sep");
    const Value* maxv = a.size() > 2 ? &a[2] : find_kwarg(k, "maxsplit");
    std::int64_t maxsplit = -1;
    if (maxv != nullptr)
    {
        const auto m = int_arg(in, fname, *maxv);
        if (!m.has_value())
        {
            return std::nullopt;
        }
        maxsplit = *m;
    }
    const std::string& s = a[0].as_str();
    if (sep == nullptr || sep->is_none())
    {
        if (from_right && maxsplit >= 0)
        {
            std::string reversed(s.rbegin(), s.rend());
            auto parts = split_whitespace(reversed, maxsplit);
            for (auto& p : parts)
            {
                std::reverse(p.begin(), p.end());
            }
            std::reverse(parts.begin(), parts.end());
            return str_list(std::move(parts));
        }
        return str_list(split_whitespace(s, maxsplit));
    }
    const auto* sep_str = str_arg(in, fname, *sep);
    if (sep_str == nullptr)
    {
        return std::nullopt;
    }
    if (sep_str->empty())
    {
        return in.raise("ValueError", "empty separator");
    }
    return str_list(from_right ? rsplit_on(s, *sep_str, maxsplit) : split_on(s, *sep_str, maxsplit));
}

EvalResult strip_method(Interpreter& in, Args& a, Kwargs& k, bool left, bool right)
{
    const char* fname = left && right ? "strip" : left ? "lstrip" : "rstrip";
    if (!plain(in, fname, a, k, 0, 1))
    {
        return std::nullopt;
    }
    const std::string& s = a[0].as_str();
    std::string chars = " \t\n\r\f\v";
    if (a.size() > 1 && !a[1].is_none())
    {
        const auto* c = str_arg(in, fname, a[1]);
        if (c == nullptr)
        {
            return std::nullopt;
        }
        chars = *c;
    }
    std::size_t lo = 0;
    std::size_t hi = s.size();
    while (left && lo < hi && chars.find(s[lo]) != std::string::npos)
    {
        ++lo;
    }
    while (right && hi > lo && chars.find(s[hi - 1]) != std::string::npos)
    {
        --hi;
    }
    return Value::str(s.substr(lo, hi - lo));
}

EvalResult find_method_impl(Interpreter& in, Args& a, Kwargs& k, bool from_right, bool raising)
{
    const char* fname = from_right ? (raising ? "rindex" : "rfind") : (raising ? "index" : "find");
    if (!plain(in, fname, a, k, 1, 3))
    {
        return std::nullopt;
    }
    const auto* sub = str_arg(in, fname, a[1]);
    if (sub == nullptr)
    {
        return std::nullopt;
    }
    const std::string& s = a[0].as_str();
    const auto [lo, hi] = bounds(a, 2, s.size());
    std::size_t pos = std::string::npos;
    if (sub->size() <= hi - lo)
    {
        const std::string_view window = std::string_view(s).substr(lo, hi - lo);
        pos = from_right ? window.rfind(*sub) : window.find(*sub);
    }
    if (pos == std::string::npos)
    {
        if (raising)
        {
            return in.raise("ValueError", "substring not found");
        }
        return Value::integer(-1);
    }
    return Value::integer(static_cast<std::int64_t>(lo + pos));
}

EvalResult affix_method(Interpreter& in, Args& a, Kwargs& k, bool prefix)
{
    const char* fname = prefix ? "startswith" : "endswith";
    if (!plain(in, fname, a, k, 1, 3))
    {
        return std::nullopt;
    }
    const std::string& s = a[0].as_str();
    const auto [lo, hi] = bounds(a, 2, s.size());
    const std::string_view window = std::string_view(s).substr(lo, hi - lo);
    std::vector<Value> candidates;
    if (a[1].is_tuple())
    {
        candidates = a[1].as_tuple()->items;
    }
    else
    {
        candidates.push_back(a[1]);
    }
    for (const auto& c : candidates)
    {
        const auto* affix = str_arg(in, fname, c);
        if (affix == nullptr)
        {
            return std::nullopt;
        }
        if (prefix ? window.starts_with(*affix) : window.ends_with(*affix))
        {
            return Value::boolean(true);
        }
    }
    return Value::boolean(false);
}

template <typename Pred> NativeFn char_class(std::string name, Pred pred)
{
    return [name, pred](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, name, a, k, 0, 0))
        {
            return std::nullopt;
        }
        const std::string& s = a[0].as_str();
        if (s.empty())
        {
            return Value::boolean(false);
        }
        return Value::boolean(std::all_of(s.begin(), s.end(), pred));
    };
}

EvalResult case_test(Interpreter& in, Args& a, Kwargs& k, bool upper)
{
    if (!plain(in, upper ? "isupper" : "islower", a, k, 0, 0))
    {
        return std::nullopt;
    }
    bool cased = false;
    for (const char c : a[0].as_str())
    {
        const auto u = static_cast<unsigned char>(c);
        if (std::isupper(u) != 0)
        {
            if (!upper)
            {
                return Value::boolean(false);
            }
            cased = true;
        }
        else if (std::islower(u) != 0)
        {
            if (upper)
            {
                return Value::boolean(false);
            }
            cased = true;
        }
    }
    return Value::boolean(cased);
}

EvalResult pad_method(Interpreter& in, Args& a, Kwargs& k, char align)
{
    const char* fname = align == '<' ? "ljust" : align == '>' ? "rjust" : "center";
    if (!plain(in, fname, a, k, 1, 2))
    {
        return std::nullopt;
    }
    const auto width = int_arg(in, fname, a[1]);
    if (!width.has_value())
    {
        return std::nullopt;
    }
    char fill = ' ';
    if (a.size() > 2)
    {
        const auto* f = str_arg(in, fname, a[2]);
        if (f == nullptr)
        {
            return std::nullopt;
        }
        if (f->size() != 1)
        {
            return in.raise("TypeError", "The fill character must be exactly one character long");
        }
        fill = (*f)[0];
    }
    const std::string& s = a[0].as_str();
    if (*width <= static_cast<std::int64_t>(s.size()))
    {
        return Value::str(s);
    }
    if (!in.guard_allocation(static_cast<std::size_t>(*width) / sizeof(Value)))
    {
        return std::nullopt;
    }
    const std::size_t total = static_cast<std::size_t>(*width) - s.size();
    std::size_t left = 0;
    if (align == '>')
    {
        left = total;
    }
    else if (align == '^')
    {
        left = total / 2 + (total & static_cast<std::size_t>(*width) & 1);
    }
    return Value::str(std::string(left, fill) + s + std::string(total - left, fill));
}

// --- list -------------------------------------------------------------------

EvalResult list_pop(Interpreter& in, Args& a, Kwargs& k)
{
    if (!plain(in, "pop", a, k, 0, 1))
    {
        return std::nullopt;
    }
    auto& items = a[0].as_list()->items;
    if (items.empty())
    {
        return in.raise("IndexError", "pop from empty list");
    }
    const auto index = opt_int(in, "pop", a, 1, -1);
    if (!index.has_value())
    {
        return std::nullopt;
    }
    std::int64_t i = *index;
    if (i < 0)
    {
        i += static_cast<std::int64_t>(items.size());
    }
    if (i < 0 || i >= static_cast<std::int64_t>(items.size()))
    {
        return in.raise("IndexError", "pop index out of range");
    }
    Value v = std::move(items[static_cast<std::size_t>(i)]);
    items.erase(items.begin() + i);
    return v;
}

EvalResult list_insert(Interpreter& in, Args& a, Kwargs& k)
{
    if (!plain(in, "insert", a, k, 2, 2))
    {
        return std::nullopt;
    }
    const auto index = int_arg(in, "insert", a[1]);
    if (!index.has_value())
    {
        return std::nullopt;
    }
    auto& items = a[0].as_list()->items;
    const auto n = static_cast<std::int64_t>(items.size());
    std::int64_t i = *index;
    if (i < 0)
    {
        i = std::max<std::int64_t>(0, i + n);
    }
    i = std::min(i, n);
    if (!in.guard_allocation(items.size() + 1))
    {
        return std::nullopt;
    }
    items.insert(items.begin() + i, a[2]);
    return Value::none();
}

EvalResult sequence_index(Interpreter& in, Args& a, Kwargs& k, const std::vector<Value>& items,
                          std::string_view kind)
{
    if (!plain(in, "index", a, k, 1, 3))
    {
        return std::nullopt;
    }
    const auto [lo, hi] = bounds(a, 2, items.size());
    for (std::size_t i = lo; i < hi; ++i)
    {
        const auto eq = in.eq(items[i], a[1]);
        if (!eq.has_value())
        {
            return std::nullopt;
        }
        if (*eq)
        {
            return Value::integer(static_cast<std::int64_t>(i));
        }
    }
    auto r = in.to_repr(a[1]);
    if (!r.has_value())
    {
        return std::nullopt;
    }
    if (kind == "tuple")
    {
        return in.raise("ValueError", "tuple.index(x): x not in tuple");
    }
    return in.raise("ValueError", *r + " is not in list");
}

EvalResult sequence_count(Interpreter& in, Args& a, Kwargs& k, const std::vector<Value>& items)
{
    if (!plain(in, "count", a, k, 1, 1))
    {
        return std::nullopt;
    }
    std::int64_t n = 0;
    for (const auto& item : items)
    {
        const auto eq = in.eq(item, a[1]);
        if (!eq.has_value())
        {
            return std::nullopt;
        }
        n += *eq ? 1 : 0;
    }
    return Value::integer(n);
}

// --- dict and set -----------------------------------------------------------

bool check_key(Interpreter& in, const Value& key)
{
    if (rt::hashable(key))
    {
        return true;
    }
    in.raise("TypeError", "unhashable type: '" + rt::type_name(key) + "'");
    return false;
}

EvalResult dict_update(Interpreter& in, Args& a, Kwargs& k)
{
    if (!arity(in, "update", a, 0, 1))
    {
        return std::nullopt;
    }
    auto& dict = *a[0].as_dict();
    if (a.size() > 1)
    {
        if (a[1].is_dict())
        {
            const auto entries = a[1].as_dict()->items;
            for (const auto& [key, value] : entries)
            {
                dict.set(key, value);
            }
        }
        else
        {
            const auto items = in.iterate(a[1]);
            if (!items.has_value())
            {
                return std::nullopt;
            }
            for (const auto& item : *items)
            {
                const auto pair = in.iterate(item);
                if (!pair.has_value())
                {
                    return std::nullopt;
                }
                if (pair->size() != 2)
                {
                    return in.raise("ValueError",
                                    "dictionary update sequence element has length " +
                                        std::to_string(pair->size()) + "; 2 is required");
                }
                if (!check_key(in, (*pair)[0]))
                {
                    return std::nullopt;
                }
                dict.set((*pair)[0], (*pair)[1]);
            }
        }
    }
    for (auto& [key, value] : k)
    {
        dict.set(Value::str(key), value);
    }
    return Value::none();
}

// Items of every argument after the receiver, for set operations.
std::optional<std::vector<std::vector<Value>>> other_iterables(Interpreter& in, const Args& a)
{
    std::vector<std::vector<Value>> out;
    for (std::size_t i = 1; i < a.size(); ++i)
    {
        auto items = in.iterate(a[i]);
        if (!items.has_value())
        {
            return std::nullopt;
        }
        for (const auto& item : *items)
        {
            if (!check_key(in, item))
            {
                return std::nullopt;
            }
        }
        out.push_back(std::move(*items));
    }
    return out;
}

Value copy_set(const rt::SetData& s)
{
    return Value::set(s.items);
}

MethodTable build_methods()
{
    MethodTable t;

    // str
    t["str.upper"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "upper", a, k, 0, 0))
        {
            return std::nullopt;
        }
        std::string s = a[0].as_str();
        std::transform(s.begin(), s.end(), s.begin(), to_upper);
        return Value::str(std::move(s));
    };
    t["str.lower"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "lower", a, k, 0, 0))
        {
            return std::nullopt;
        }
        std::string s = a[0].as_str();
        std::transform(s.begin(), s.end(), s.begin(), to_lower);
        return Value::str(std::move(s));
    };
    t["str.casefold"] = t["str.lower"];
    t["str.swapcase"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "swapcase", a, k, 0, 0))
        {
            return std::nullopt;
        }
        std::string s = a[0].as_str();
        for (auto& c : s)
        {
            c = std::isupper(static_cast<unsigned char>(c)) != 0 ? to_lower(c) : to_upper(c);
        }
        return Value::str(std::move(s));
    };
    t["str.capitalize"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "capitalize", a, k, 0, 0))
        {
            return std::nullopt;
        }
        std::string s = a[0].as_str();
        for (std::size_t i = 0; i < s.size(); ++i)
        {
            s[i] = i == 0 ? to_upper(s[i]) : to_lower(s[i]);
        }
        return Value::str(std::move(s));
    };
    t["str.title"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "title", a, k, 0, 0))
        {
            return std::nullopt;
        }
        std::string s = a[0].as_str();
        bool prev_cased = false;
        for (auto& c : s)
        {
            const bool alpha = std::isalpha(static_cast<unsigned char>(c)) != 0;
            c = alpha ? (prev_cased ? to_lower(c) : to_upper(c)) : c;
            prev_cased = alpha;
        }
        return Value::str(std::move(s));
    };
    t["str.strip"] = [](Interpreter& in, Args& a, Kwargs& k) { return strip_method(in, a, k, true, true); };
    t["str.lstrip"] = [](Interpreter& in, Args& a, Kwargs& k) { return strip_method(in, a, k, true, false); };
    t["str.rstrip"] = [](Interpreter& in, Args& a, Kwargs& k) { return strip_method(in, a, k, false, true); };
    t["str.split"] = [](Interpreter& in, Args& a, Kwargs& k) { return split_method(in, a, k, false); };
    t["str.rsplit"] = [](Interpreter& in, Args& a, Kwargs& k) { return split_method(in, a, k, true); };
    t["str.splitlines"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!only_kwargs(in, "splitlines", k, {"keepends"}) || !arity(in, "splitlines", a, 0, 1))
        {
            return std::nullopt;
        }
        const Value* keep_v = a.size() > 1 ? &a[1] : find_kwarg(k, "keepends");
        const bool keep = keep_v != nullptr && rt::truthy(*keep_v);
        const std::string& s = a[0].as_str();
        std::vector<std::string> out;
        std::size_t start = 0;
        for (std::size_t i = 0; i < s.size(); ++i)
        {
            if (s[i] != '\n' && s[i] != '\r')
            {
                continue;
            }
            std::size_t eol = i + 1;
            if (s[i] == '\r' && i + 1 < s.size() && s[i + 1] == '\n')
            {
                ++eol;
            }
            out.push_back(s.substr(start, (keep ? eol : i) - start));
            start = eol;
            i = eol - 1;
        }
        if (start < s.size())
        {
            out.push_back(s.substr(start));
        }
        return str_list(std::move(out));
    };
    t["str.join"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "join", a, k, 1, 1))
        {
            return std::nullopt;
        }
        const auto items = in.iterate(a[1]);
        if (!items.has_value())
        {
            return std::nullopt;
        }
        const std::string& sep = a[0].as_str();
        std::string out;
        for (std::size_t i = 0; i < items->size(); ++i)
        {
            const Value& item = (*items)[i];
            if (!item.is_str())
            {
                return in.raise("TypeError", "sequence item " + std::to_string(i) +
                                                 ": expected str instance, " +
                                                 rt::type_name(item) + " found");
            }
            if (i > 0)
            {
                out += sep;
            }
            out += item.as_str();
            if (out.size() / sizeof(Value) > 0 && !in.guard_allocation(out.size() / sizeof(Value)))
            {
                return std::nullopt;
            }
        }
        return Value::str(std::move(out));
    };
    t["str.replace"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "replace", a, k, 2, 3))
        {
            return std::nullopt;
        }
        const auto* old_s = str_arg(in, "replace", a[1]);
        const auto* new_s = old_s != nullptr ? str_arg(in, "replace", a[2]) : nullptr;
        if (new_s == nullptr)
        {
            return std::nullopt;
        }
        const auto count = opt_int(in, "replace", a, 3, -1);
        if (!count.has_value())
        {
            return std::nullopt;
        }
        const std::string& s = a[0].as_str();
        std::string out;
        std::int64_t done = 0;
        if (old_s->empty())
        {
            for (std::size_t i = 0; i <= s.size(); ++i)
            {
                if (*count < 0 || done < *count)
                {
                    out += *new_s;
                    ++done;
                }
                if (i < s.size())
                {
                    out.push_back(s[i]);
                }
            }
            return Value::str(std::move(out));
        }
        std::size_t pos = 0;
        while (*count < 0 || done < *count)
        {
            const auto hit = s.find(*old_s, pos);
            if (hit == std::string::npos)
            {
                break;
            }
            out.append(s, pos, hit - pos);
            out += *new_s;
            pos = hit + old_s->size();
            ++done;
            if (out.size() / sizeof(Value) > 0 && !in.guard_allocation(out.size() / sizeof(Value)))
            {
                return std::nullopt;
            }
        }
        out.append(s, pos);
        return Value::str(std::move(out));
    };
    t["str.startswith"] = [](Interpreter& in, Args& a, Kwargs& k) { return affix_method(in, a, k, true); };
    t["str.endswith"] = [](Interpreter& in, Args& a, Kwargs& k) { return affix_method(in, a, k, false); };
    t["str.find"] = [](Interpreter& in, Args& a, Kwargs& k) { return find_method_impl(in, a, k, false, false); };
    t["str.rfind"] = [](Interpreter& in, Args& a, Kwargs& k) { return find_method_impl(in, a, k, true, false); };
    t["str.index"] = [](Interpreter& in, Args& a, Kwargs& k) { return find_method_impl(in, a, k, false, true); };
    t["str.rindex"] = [](Interpreter& in, Args& a, Kwargs& k) { return find_method_impl(in, a, k, true, true); };
    t["str.count"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "count", a, k, 1, 3))
        {
            return std::nullopt;
        }
        const auto* sub = str_arg(in, "count", a[1]);
        if (sub == nullptr)
        {
            return std::nullopt;
        }
        const std::string& s = a[0].as_str();
        const auto [lo, hi] = bounds(a, 2, s.size());
        const std::string_view window = std::string_view(s).substr(lo, hi - lo);
        if (sub->empty())
        {
            return Value::integer(static_cast<std::int64_t>(window.size() + 1));
        }
        std::int64_t n = 0;
        for (std::size_t pos = window.find(*sub); pos != std::string_view::npos;
             pos = window.find(*sub, pos + sub->size()))
        {
            ++n;
        }
        return Value::integer(n);
    };
    auto digit = [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; };
    t["str.isdigit"] = char_class("isdigit", digit);
    t["str.isdecimal"] = char_class("isdecimal", digit);
    t["str.isnumeric"] = char_class("isnumeric", digit);
    t["str.isalpha"] = char_class("isalpha",
                                  [](char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0; });
    t["str.isalnum"] = char_class("isalnum",
                                  [](char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; });
    t["str.isspace"] = char_class("isspace", is_space);
    t["str.isupper"] = [](Interpreter& in, Args& a, Kwargs& k) { return case_test(in, a, k, true); };
    t["str.islower"] = [](Interpreter& in, Args& a, Kwargs& k) { return case_test(in, a, k, false); };
    t["str.isidentifier"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "isidentifier", a, k, 0, 0))
        {
            return std::nullopt;
        }
        const std::string& s = a[0].as_str();
        if (s.empty() || std::isdigit(static_cast<unsigned char>(s[0])) != 0)
        {
            return Value::boolean(false);
        }
        return Value::boolean(std::all_of(s.begin(), s.end(), [](char c)
                                          { return c == '_' || std::isalnum(static_cast<unsigned char>(c)) != 0; }));
    };
    t["str.format"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        const Args rest(a.begin() + 1, a.end());
        auto r = str_format(in, a[0].as_str(), rest, k);
        if (!r.has_value())
        {
            return std::nullopt;
        }
        return Value::str(std::move(*r));
    };
    t["str.zfill"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "zfill", a, k, 1, 1))
        {
            return std::nullopt;
        }
        const auto width = int_arg(in, "zfill", a[1]);
        if (!width.has_value())
        {
            return std::nullopt;
        }
        std::string s = a[0].as_str();
        if (*width <= static_cast<std::int64_t>(s.size()))
        {
            return Value::str(std::move(s));
        }
        if (!in.guard_allocation(static_cast<std::size_t>(*width) / sizeof(Value)))
        {
            return std::nullopt;
        }
        const std::size_t fill = static_cast<std::size_t>(*width) - s.size();
        const std::size_t at = !s.empty() && (s[0] == '-' || s[0] == '+') ? 1 : 0;
        s.insert(at, fill, '0');
        return Value::str(std::move(s));
    };
    t["str.ljust"] = [](Interpreter& in, Args& a, Kwargs& k) { return pad_method(in, a, k, '<'); };
    t["str.rjust"] = [](Interpreter& in, Args& a, Kwargs& k) { return pad_method(in, a, k, '>'); };
    t["str.center"] = [](Interpreter& in, Args& a, Kwargs& k) { return pad_method(in, a, k, '^'); };
    t["str.encode"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!only_kwargs(in, "encode", k, {"encoding", "errors"}) || !arity(in, "encode", a, 0, 2))
        {
            return std::nullopt;
        }
        return Value::bytes(a[0].as_str());
    };
    t["str.partition"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "partition", a, k, 1, 1))
        {
            return std::nullopt;
        }
        const auto* sep = str_arg(in, "partition", a[1]);
        if (sep == nullptr)
        {
            return std::nullopt;
        }
        if (sep->empty())
        {
            return in.raise("ValueError", "empty separator");
        }
        const std::string& s = a[0].as_str();
        const auto pos = s.find(*sep);
        if (pos == std::string::npos)
        {
            return Value::tuple({Value::str(s), Value::str(""), Value::str("")});
        }
        return Value::tuple({Value::str(s.substr(0, pos)), Value::str(*sep),
                             Value::str(s.substr(pos + sep->size()))});
    };
    t["str.rpartition"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "rpartition", a, k, 1, 1))
        {
            return std::nullopt;
        }
        const auto* sep = str_arg(in, "rpartition", a[1]);
        if (sep == nullptr)
        {
            return std::nullopt;
        }
        if (sep->empty())
        {
            return in.raise("ValueError", "empty separator");
        }
        const std::string& s = a[0].as_str();
        const auto pos = s.rfind(*sep);
        if (pos == std::string::npos)
        {
            return Value::tuple({Value::str(""), Value::str(""), Value::str(s)});
        }
        return Value::tuple({Value::str(s.substr(0, pos)), Value::str(*sep),
                             Value::str(s.substr(pos + sep->size()))});
    };
    t["str.removeprefix"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "removeprefix", a, k, 1, 1))
        {
            return std::nullopt;
        }
        const auto* p = str_arg(in, "removeprefix", a[1]);
        if (p == nullptr)
        {
            return std::nullopt;
        }
        const std::string& s = a[0].as_str();
        return Value::str(s.starts_with(*p) ? s.substr(p->size()) : s);
    };
    t["str.removesuffix"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "removesuffix", a, k, 1, 1))
        {
            return std::nullopt;
        }
        const auto* p = str_arg(in, "removesuffix", a[1]);
        if (p == nullptr)
        {
            return std::nullopt;
        }
        const std::string& s = a[0].as_str();
        return Value::str(!p->empty() && s.ends_with(*p) ? s.substr(0, s.size() - p->size()) : s);
    };

    // list
    t["list.append"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "append", a, k, 1, 1))
        {
            return std::nullopt;
        }
        auto& items = a[0].as_list()->items;
        if (items.size() % 4096 == 4095 && !in.guard_allocation(items.size() + 1))
        {
            return std::nullopt;
        }
        items.push_back(a[1]);
        return Value::none();
    };
    t["list.extend"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "extend", a, k, 1, 1))
        {
            return std::nullopt;
        }
        const auto more = in.iterate(a[1]);
        if (!more.has_value())
        {
            return std::nullopt;
        }
        auto& items = a[0].as_list()->items;
        if (!in.guard_allocation(items.size() + more->size()))
        {
            return std::nullopt;
        }
        items.insert(items.end(), more->begin(), more->end());
        return Value::none();
    };
    t["list.pop"] = list_pop;
    t["list.insert"] = list_insert;
    t["list.remove"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "remove", a, k, 1, 1))
        {
            return std::nullopt;
        }
        auto& items = a[0].as_list()->items;
        for (std::size_t i = 0; i < items.size(); ++i)
        {
            const auto eq = in.eq(items[i], a[1]);
            if (!eq.has_value())
            {
                return std::nullopt;
            }
            if (*eq)
            {
                items.erase(items.begin() + static_cast<std::ptrdiff_t>(i));
                return Value::none();
            }
        }
        return in.raise("ValueError", "list.remove(x): x not in list");
    };
    t["list.index"] = [](Interpreter& in, Args& a, Kwargs& k)
    {
        const auto items = a[0].as_list()->items;
        return sequence_index(in, a, k, items, "list");
    };
    t["list.count"] = [](Interpreter& in, Args& a, Kwargs& k)
    {
        const auto items = a[0].as_list()->items;
        return sequence_count(in, a, k, items);
    };
    t["list.sort"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!only_kwargs(in, "sort", k, {"key", "reverse"}) || !arity(in, "sort", a, 0, 0))
        {
            return std::nullopt;
        }
        const Value* key = find_kwarg(k, "key");
        const Value* reverse = find_kwarg(k, "reverse");
        auto list = a[0].as_list();
        std::vector<Value> items = list->items;
        if (!in.sort_values(items, key != nullptr ? *key : Value::none(),
                            reverse != nullptr && rt::truthy(*reverse)))
        {
            return std::nullopt;
        }
        list->items = std::move(items);
        return Value::none();
    };
    t["list.reverse"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "reverse", a, k, 0, 0))
        {
            return std::nullopt;
        }
        auto& items = a[0].as_list()->items;
        std::reverse(items.begin(), items.end());
        return Value::none();
    };
    t["list.copy"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "copy", a, k, 0, 0))
        {
            return std::nullopt;
        }
        return Value::list(a[0].as_list()->items);
    };
    t["list.clear"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "clear", a, k, 0, 0))
        {
            return std::nullopt;
        }
        a[0].as_list()->items.clear();
        return Value::none();
    };

    // tuple
    t["tuple.index"] = [](Interpreter& in, Args& a, Kwargs& k)
    { return sequence_index(in, a, k, a[0].as_tuple()->items, "tuple"); };
    t["tuple.count"] = [](Interpreter& in, Args& a, Kwargs& k)
    { return sequence_count(in, a, k, a[0].as_tuple()->items); };

    // dict
    t["dict.get"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "get", a, k, 1, 2) || !check_key(in, a[1]))
        {
            return std::nullopt;
        }
        if (const Value* v = a[0].as_dict()->find(a[1]))
        {
            return *v;
        }
        return a.size() > 2 ? a[2] : Value::none();
    };
    t["dict.keys"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "keys", a, k, 0, 0))
        {
            return std::nullopt;
        }
        std::vector<Value> out;
        for (const auto& [key, _] : a[0].as_dict()->items)
        {
            out.push_back(key);
        }
        return Value::list(std::move(out));
    };
    t["dict.values"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "values", a, k, 0, 0))
        {
            return std::nullopt;
        }
        std::vector<Value> out;
        for (const auto& [_, value] : a[0].as_dict()->items)
        {
            out.push_back(value);
        }
        return Value::list(std::move(out));
    };
    t["dict.items"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "items", a, k, 0, 0))
        {
            return std::nullopt;
        }
        std::vector<Value> out;
        for (const auto& [key, value] : a[0].as_dict()->items)
        {
            out.push_back(Value::tuple({key, value}));
        }
        return Value::list(std::move(out));
    };
    t["dict.pop"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "pop", a, k, 1, 2) || !check_key(in, a[1]))
        {
            return std::nullopt;
        }
        auto& dict = *a[0].as_dict();
        if (const Value* v = dict.find(a[1]))
        {
            Value out = *v;
            dict.erase(a[1]);
            return out;
        }
        if (a.size() > 2)
        {
            return a[2];
        }
        return in.raise_with("KeyError", a[1]);
    };
    t["dict.popitem"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "popitem", a, k, 0, 0))
        {
            return std::nullopt;
        }
        auto& items = a[0].as_dict()->items;
        if (items.empty())
        {
            return in.raise("KeyError", "popitem(): dictionary is empty");
        }
        auto last = std::move(items.back());
        items.pop_back();
        return Value::tuple({std::move(last.first), std::move(last.second)});
    };
    t["dict.setdefault"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "setdefault", a, k, 1, 2) || !check_key(in, a[1]))
        {
            return std::nullopt;
        }
        auto& dict = *a[0].as_dict();
        if (const Value* v = dict.find(a[1]))
        {
            return *v;
        }
        Value fallback = a.size() > 2 ? a[2] : Value::none();
        dict.set(a[1], fallback);
        return fallback;
    };
    t["dict.update"] = dict_update;
    t["dict.copy"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "copy", a, k, 0, 0))
        {
            return std::nullopt;
        }
        return Value::dict(a[0].as_dict()->items);
    };
    t["dict.clear"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "clear", a, k, 0, 0))
        {
            return std::nullopt;
        }
        a[0].as_dict()->items.clear();
        return Value::none();
    };

    // set
    t["set.add"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "add", a, k, 1, 1) || !check_key(in, a[1]))
        {
            return std::nullopt;
        }
        a[0].as_set()->add(a[1]);
        return Value::none();
    };
    t["set.remove"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "remove", a, k, 1, 1) || !check_key(in, a[1]))
        {
            return std::nullopt;
        }
        if (!a[0].as_set()->erase(a[1]))
        {
            return in.raise_with("KeyError", a[1]);
        }
        return Value::none();
    };
    t["set.discard"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "discard", a, k, 1, 1) || !check_key(in, a[1]))
        {
            return std::nullopt;
        }
        a[0].as_set()->erase(a[1]);
        return Value::none();
    };
    t["set.pop"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "pop", a, k, 0, 0))
        {
            return std::nullopt;
        }
        auto& items = a[0].as_set()->items;
        if (items.empty())
        {
            return in.raise("KeyError", "pop from an empty set");
        }
        Value v = std::move(items.front());
        items.erase(items.begin());
        return v;
    };
    t["set.union"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        const auto others = no_kwargs(in, "union", k) ? other_iterables(in, a) : std::nullopt;
        if (!others.has_value())
        {
            return std::nullopt;
        }
        Value out = copy_set(*a[0].as_set());
        for (const auto& items : *others)
        {
            for (const auto& v : items)
            {
                out.as_set()->add(v);
            }
        }
        return out;
    };
    t["set.intersection"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        const auto others = no_kwargs(in, "intersection", k) ? other_iterables(in, a) : std::nullopt;
        if (!others.has_value())
        {
            return std::nullopt;
        }
        std::vector<Value> kept = a[0].as_set()->items;
        for (const auto& items : *others)
        {
            const Value other = Value::set(items);
            std::erase_if(kept, [&](const Value& v) { return !other.as_set()->contains(v); });
        }
        return Value::set(std::move(kept));
    };
    t["set.difference"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        const auto others = no_kwargs(in, "difference", k) ? other_iterables(in, a) : std::nullopt;
        if (!others.has_value())
        {
            return std::nullopt;
        }
        std::vector<Value> kept = a[0].as_set()->items;
        for (const auto& items : *others)
        {
            const Value other = Value::set(items);
            std::erase_if(kept, [&](const Value& v) { return other.as_set()->contains(v); });
        }
        return Value::set(std::move(kept));
    };
    t["set.symmetric_difference"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "symmetric_difference", a, k, 1, 1))
        {
            return std::nullopt;
        }
        const auto others = other_iterables(in, a);
        if (!others.has_value())
        {
            return std::nullopt;
        }
        const Value other = Value::set(others->front());
        std::vector<Value> out;
        for (const auto& v : a[0].as_set()->items)
        {
            if (!other.as_set()->contains(v))
            {
                out.push_back(v);
            }
        }
        for (const auto& v : other.as_set()->items)
        {
            if (!a[0].as_set()->contains(v))
            {
                out.push_back(v);
            }
        }
        return Value::set(std::move(out));
    };
    t["set.update"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        const auto others = no_kwargs(in, "update", k) ? other_iterables(in, a) : std::nullopt;
        if (!others.has_value())
        {
            return std::nullopt;
        }
        for (const auto& items : *others)
        {
            for (const auto& v : items)
            {
                a[0].as_set()->add(v);
            }
        }
        return Value::none();
    };
    auto subset_test = [](std::string name, bool superset) -> NativeFn
    {
        return [name, superset](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
        {
            if (!plain(in, name, a, k, 1, 1))
            {
                return std::nullopt;
            }
            const auto others = other_iterables(in, a);
            if (!others.has_value())
            {
                return std::nullopt;
            }
            const Value other = Value::set(others->front());
            const auto& inner = superset ? *other.as_set() : *a[0].as_set();
            const auto& outer = superset ? *a[0].as_set() : *other.as_set();
            return Value::boolean(std::all_of(inner.items.begin(), inner.items.end(),
                                              [&](const Value& v) { return outer.contains(v); }));
        };
    };
    t["set.issubset"] = subset_test("issubset", false);
    t["set.issuperset"] = subset_test("issuperset", true);
    t["set.isdisjoint"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "isdisjoint", a, k, 1, 1))
        {
            return std::nullopt;
        }
        const auto others = other_iterables(in, a);
        if (!others.has_value())
        {
            return std::nullopt;
        }
        for (const auto& v : others->front())
        {
            if (a[0].as_set()->contains(v))
            {
                return Value::boolean(false);
            }
        }
        return Value::boolean(true);
    };
    t["set.copy"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "copy", a, k, 0, 0))
        {
            return std::nullopt;
        }
        return copy_set(*a[0].as_set());
    };
    t["set.clear"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "clear", a, k, 0, 0))
        {
            return std::nullopt;
        }
        a[0].as_set()->items.clear();
        return Value::none();
    };

    // int, float, bytes
    t["int.bit_length"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "bit_length", a, k, 0, 0))
        {
            return std::nullopt;
        }
        const std::int64_t v = a[0].as_int();
        std::uint64_t u = v < 0 ? 0 - static_cast<std::uint64_t>(v) : static_cast<std::uint64_t>(v);
        std::int64_t bits = 0;
        while (u != 0)
        {
            ++bits;
            u >>= 1;
        }
        return Value::integer(bits);
    };
    t["int.conjugate"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "conjugate", a, k, 0, 0))
        {
            return std::nullopt;
        }
        return Value::integer(a[0].as_int());
    };
    t["float.is_integer"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!plain(in, "is_integer", a, k, 0, 0))
        {
            return std::nullopt;
        }
        const double d = a[0].as_double();
        return Value::boolean(std::isfinite(d) && d == std::trunc(d));
    };
    t["bytes.decode"] = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!only_kwargs(in, "decode", k, {"encoding", "errors"}) || !arity(in, "decode", a, 0, 2))
        {
            return std::nullopt;
        }
        return Value::str(std::get<rt::Bytes>(a[0].data).data);
    };
    return t;
}

} // namespace

std::optional<NativeFn> find_builtin_method(std::string_view type_name, std::string_view name)
{
    static const MethodTable table = build_methods();
    std::string key(type_name == "bool" ? "int" : type_name);
    key += '.';
    key += name;
    const auto it = table.find(key);
    if (it == table.end())
    {
        return std::nullopt;
    }
    return it->second;
}

} // namespace codegate::interp
