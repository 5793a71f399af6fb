#include <codegate/sandbox/driver.h>
#include <codegate/sandbox/value_codec.h>
#include <codegate/support/json.h>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

using codegate::support::Json;

static Json decode_json(const std::string& text)
{
    auto parsed = codegate::support::parse_json(text);
    if (!parsed.has_value())
    {
        fail("expected valid JSON: " + text);
    }
    return std::move(*parsed);
}

int main()
{
    using namespace codegate::sandbox;

    {
        DriverRequest req;
        req.op = "execute";
        req.source = "print(1)\n";
        req.entry = "main";
        req.args = {Value::integer(7), Value::str("s")};
        req.max_output_bytes = 123;
        req.recursion_limit = 456;
        const auto doc = decode_json(encode_request(req));
        const auto& obj = *doc.as_object();
        if (codegate::support::json_get_number(obj, "protocol_version") != 1.0 ||
            codegate::support::json_get_string(obj, "op") != "execute" ||
            codegate::support::json_get_string(obj, "source") != "print(1)\n" ||
            codegate::support::json_get_string(obj, "entry") != "main" ||
            codegate::support::json_get_number(obj, "max_output_bytes") != 123.0 ||
            codegate::support::json_get_number(obj, "recursion_limit") != 456.0)
        {
            fail("unexpected request fields");
        }
        const auto* args = codegate::support::json_get(obj, "args");
        if (args == nullptr || args->as_array() == nullptr || args->as_array()->size() != 2)
        {
            fail("expected two encoded arguments");
        }
        if (codegate::support::json_serialize(args->as_array()->front()) != "{\"t\":\"int\",\"v\":\"7\"}")
        {
            fail("expected ints encoded as decimal strings");
        }
    }

    {
        DriverRequest req;
        req.op = "call_batch";
        req.calls = {{Value::integer(1)}, {}};
        const auto doc = decode_json(encode_request(req));
        const auto& obj = *doc.as_object();
        if (codegate::support::json_get(obj, "entry") != nullptr)
        {
            fail("expected no entry without an entry point");
        }
        const auto* calls = codegate::support::json_get(obj, "calls");
        if (calls == nullptr || calls->as_array()->size() != 2 ||
            !(*calls->as_array())[1].as_array()->empty())
        {
            fail("expected one argument list per call");
        }
    }

    {
        // Only the last non-empty line counts; earlier output is ignored.
        const std::string out =
            "stray print\n"
            "{\"protocol_version\":1,\"status\":\"ok\",\"stdout\":\"hi\\n\",\"stderr\":\"\","
            "\"stdout_truncated\":true,\"result\":{\"t\":\"list\",\"v\":[{\"t\":\"none\"},"
            "{\"t\":\"float\",\"v\":\"1.5\"}]},\"peak_rss_kb\":10}\n\n";
        const auto reply = parse_reply(out);
        if (!reply.has_value())
        {
            fail("expected a reply after noise");
        }
        if (reply->status != "ok" || reply->stdout_text != "hi\n" || !reply->stdout_truncated ||
            reply->peak_rss_bytes != 10 * 1024)
        {
            fail("unexpected reply fields");
        }
        if (!reply->result.has_value() || codegate::runtime::repr(*reply->result) != "[None, 1.5]")
        {
            fail("unexpected decoded result");
        }
    }

    {
        const auto reply = parse_reply(
            "{\"protocol_version\":1,\"status\":\"error\","
            "\"exception\":{\"type\":\"ValueError\",\"message\":\"bad\"}}");
        if (!reply.has_value() || !reply->exception.has_value() ||
            reply->exception->type != "ValueError" || reply->exception->message != "bad")
        {
            fail("expected an exception summary");
        }
    }

    {
        const auto reply = parse_reply(
            "{\"protocol_version\":1,\"status\":\"ok\",\"calls\":["
            "{\"status\":\"returned\",\"value\":{\"t\":\"bool\",\"v\":true}},"
            "{\"status\":\"raised\",\"type\":\"KeyError\",\"message\":\"'k'\"},"
            "{\"status\":\"oom\"}]}");
        if (!reply.has_value() || reply->calls.size() != 3)
        {
            fail("expected three call outcomes");
        }
        if (reply->calls[0].kind != CallOutcome::Kind::Returned || !reply->calls[0].value.is_bool())
        {
            fail("expected a returned bool");
        }
        if (reply->calls[1].kind != CallOutcome::Kind::Raised ||
            reply->calls[1].exception.type != "KeyError" ||
            reply->calls[1].exit != ExitClass::RuntimeError)
        {
            fail("expected a raised KeyError");
        }
        if (reply->calls[2].kind != CallOutcome::Kind::Failed || reply->calls[2].exit != ExitClass::Oom)
        {
            fail("expected an oom call");
        }
    }

    // Rejected replies.
    if (parse_reply("").has_value() || parse_reply("not json").has_value() ||
        parse_reply("{\"status\":\"ok\"}").has_value() ||
        parse_reply("{\"protocol_version\":2,\"status\":\"ok\"}").has_value() ||
        parse_reply("{\"protocol_version\":1,\"status\":\"ok\",\"result\":{\"t\":\"mystery\"}}")
            .has_value() ||
        parse_reply("{\"protocol_version\":1,\"status\":\"ok\",\"calls\":[{\"status\":\"lost\"}]}")
            .has_value())
    {
        fail("expected malformed replies to be rejected");
    }

    {
        const auto v = decode_value(decode_json("{\"t\":\"int\",\"v\":\"123456789012345678901234567890\"}"));
        if (!v.has_value() || !v->is_object() || codegate::runtime::type_name(*v) != "int" ||
            codegate::runtime::repr(*v) != "123456789012345678901234567890")
        {
            fail("expected big integers to decode as opaque ints");
        }
        if (decode_value(decode_json("{\"t\":\"int\",\"v\":\"12x\"}")).has_value() ||
            decode_value(decode_json("{\"t\":\"bytes\",\"v\":\"zz\"}")).has_value() ||
            decode_value(decode_json("[1]")).has_value())
        {
            fail("expected malformed values to be rejected");
        }
    }

    {
        const auto doc = decode_json(
            "{\"t\":\"dict\",\"v\":[[{\"t\":\"str\",\"v\":\"k\"},{\"t\":\"tuple\",\"v\":["
            "{\"t\":\"bytes\",\"v\":\"6869\"},{\"t\":\"float\",\"v\":\"inf\"}]}]]}");
        const auto v = decode_value(doc);
        if (!v.has_value() || codegate::runtime::repr(*v) != "{'k': (b'hi', inf)}")
        {
            fail("expected nested values to decode");
        }
        if (codegate::support::json_serialize(encode_value(*v)) != codegate::support::json_serialize(doc))
        {
            fail("expected encoding to mirror the decoded document");
        }
    }

    {
        const auto nan = encode_value(Value::floating(std::numeric_limits<double>::quiet_NaN()));
        if (codegate::support::json_serialize(nan) != "{\"t\":\"float\",\"v\":\"nan\"}")
        {
            fail("expected nan encoded as a string");
        }
        const auto obj = encode_value(
            Value::object(std::make_shared<codegate::runtime::OpaqueObject>("Fraction", "Fraction(1, 3)")));
        if (codegate::support::json_serialize(obj) !=
            "{\"repr\":\"Fraction(1, 3)\",\"t\":\"opaque\",\"type\":\"Fraction\"}")
        {
            fail("expected objects encoded as opaque");
        }
    }

    {
        const auto src = python_driver_source();
        if (src.find("protocol_version") == std::string_view::npos ||
            src.find("call_batch") == std::string_view::npos)
        {
            fail("expected the driver script to speak the protocol");
        }
    }

    std::cout << "OK\n";
    return 0;
}
