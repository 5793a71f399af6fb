#include <codegate/support/json.h>
#include <cstdlib>
#include <iostream>
#include <string>

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

int main()
{
    using namespace codegate::support;

    {
        const auto doc = parse_json(R"( {"b": [1, 2.5, true, null], "a": "x\ny", "c": {}} )");
        if (!doc.has_value() || !doc->is_object())
        {
            fail("expected object to parse");
        }
        const auto& obj = *doc->as_object();
        if (json_get_string(obj, "a") != "x\ny")
        {
            fail("expected escaped newline to decode");
        }
        const Json* b = json_get(obj, "b");
        if (b == nullptr || b->as_array() == nullptr || b->as_array()->size() != 4)
        {
            fail("expected four array elements");
        }
        if (*(*b->as_array())[1].as_number() != 2.5 || !(*b->as_array())[3].is_null())
        {
            fail("unexpected array contents");
        }
        if (json_get_number(obj, "a").has_value() || json_get_bool(obj, "missing").has_value())
        {
            fail("typed getters must reject other kinds and missing keys");
        }
        // Keys are sorted on output.
        if (json_serialize(*doc) != R"({"a":"x\ny","b":[1,2.5,true,null],"c":{}})")
        {
            fail("unexpected compact serialization: " + json_serialize(*doc));
        }
    }

    {
        const auto doc = parse_json(R"("\u00e9\ud83d\ude00\t")");
        if (!doc.has_value() || *doc->as_string() != "\xc3\xa9\xf0\x9f\x98\x80\t")
        {
            fail("expected unicode escapes and surrogate pairs to decode to UTF-8");
        }
    }

    {
        Json::Object obj;
        obj["k"] = Json{Json::Array{Json{1.0}, Json{std::string("v")}}};
        obj["e"] = Json{Json::Array{}};
        const std::string pretty = json_serialize_pretty(Json{obj});
        const std::string expected = "{\n"
                                     "  \"e\": [],\n"
                                     "  \"k\": [\n"
                                     "    1,\n"
                                     "    \"v\"\n"
                                     "  ]\n"
                                     "}";
        if (pretty != expected)
        {
            fail("unexpected pretty serialization:\n" + pretty);
        }
    }

    if (json_escape(std::string("a\"b\\c\x01", 6)) != "a\\\"b\\\\c\\u0001")
    {
        fail("unexpected escaping of quotes, backslashes and control characters");
    }
    if (json_serialize(Json{1e300 * 1e300}) != "null")
    {
        fail("non-finite numbers serialize as null");
    }
    if (json_serialize(Json{-42.0}) != "-42" || json_serialize(Json{0.1}) != "0.1")
    {
        fail("unexpected number formatting");
    }

    const char* bad[] = {"", "{", "[1,]", "{\"a\" 1}", "\"unterminated", "tru", "1 2", "{\"a\":1,}",
                         "\"\\x\""};
    for (const char* text : bad)
    {
        if (parse_json(text).has_value())
        {
            fail(std::string("expected parse failure for: ") + text);
        }
    }

    {
        const std::string deep = std::string(1000, '[') + std::string(1000, ']');
        if (parse_json(deep).has_value())
        {
            fail("expected nesting limit to reject deep arrays");
        }
    }

    std::cout << "OK\n";
    return 0;
}
