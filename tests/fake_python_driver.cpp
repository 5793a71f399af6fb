#include <chrono>
#include <codegate/support/json.h>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <string>
#include <thread>
#include <unistd.h>

// Stands in for `python3 -I -S -c <driver>`. The behaviour is picked by a
// `#fake:<mode>` marker in the request source, because the subprocess
// backend replaces the child environment.

#if defined(__GNUC__)
extern "C" void __gcov_flush(void) __attribute__((weak));
static void maybe_gcov_flush()
{
    if (__gcov_flush)
    {
        __gcov_flush();
    }
}
#else
static void maybe_gcov_flush() {}
#endif

using codegate::support::Json;

static std::string mode_of(const std::string& source)
{
    const std::string marker = "#fake:";
    const auto pos = source.find(marker);
    if (pos == std::string::npos)
    {
        return "ok";
    }
    const auto start = pos + marker.size();
    const auto end = source.find_first_of(" \n", start);
    return source.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

static Json str(std::string s)
{
    return Json{.value = std::move(s)};
}

static Json none_value()
{
    Json::Object v;
    v["t"] = str("none");
    return Json{.value = std::move(v)};
}

static Json first_or_none(const Json* args)
{
    const auto* items = args != nullptr ? args->as_array() : nullptr;
    if (items == nullptr || items->empty())
    {
        return none_value();
    }
    return items->front();
}

static int emit(Json::Object reply)
{
    reply["protocol_version"] = Json{.value = 1.0};
    if (reply.find("stdout") == reply.end())
    {
        reply["stdout"] = str("");
    }
    if (reply.find("stderr") == reply.end())
    {
        reply["stderr"] = str("");
    }
    reply["peak_rss_kb"] = Json{.value = 2048.0};
    std::cout << "driver noise before the reply\n";
    std::cout << codegate::support::json_serialize(Json{.value = std::move(reply)}) << "\n";
    std::cout.flush();
    maybe_gcov_flush();
    return 0;
}

int main(int argc, char** argv)
{
    const std::string input{std::istreambuf_iterator<char>(std::cin),
                            std::istreambuf_iterator<char>()};
    const auto request = codegate::support::parse_json(input);
    const auto* obj = request.has_value() ? request->as_object() : nullptr;
    if (obj == nullptr)
    {
        std::cerr << "fake_python: bad request\n";
        maybe_gcov_flush();
        return 2;
    }
    const std::string source = codegate::support::json_get_string(*obj, "source").value_or("");
    const std::string op = codegate::support::json_get_string(*obj, "op").value_or("");
    const std::string mode = mode_of(source);

    Json::Object reply;
    reply["status"] = str("ok");

    if (mode == "hang")
    {
        maybe_gcov_flush();
        std::this_thread::sleep_for(std::chrono::seconds(60));
        return 0;
    }
    if (mode == "garbage")
    {
        std::cout << "this is not a reply\n";
        maybe_gcov_flush();
        return 0;
    }
    if (mode == "exit137")
    {
        maybe_gcov_flush();
        _exit(137);
    }
    if (mode == "oom")
    {
        reply["status"] = str("oom");
        return emit(std::move(reply));
    }
    if (mode == "raise")
    {
        reply["status"] = str("error");
        Json::Object exc;
        exc["type"] = str("ValueError");
        exc["message"] = str("boom");
        reply["exception"] = Json{.value = std::move(exc)};
        reply["stderr"] = str("Traceback (most recent call last)\n");
        return emit(std::move(reply));
    }
    if (mode == "env")
    {
        const char* sandboxed = std::getenv("CODEGATE_SANDBOXED");
        const char* home = std::getenv("HOME");
        reply["stdout"] = str(std::string("sandboxed=") + (sandboxed != nullptr ? sandboxed : "0") +
                              " home=" + (home != nullptr ? "set" : "unset") + "\n");
        return emit(std::move(reply));
    }
    if (mode == "argv")
    {
        std::string joined;
        for (int i = 1; i < argc && i < 4; ++i)
        {
            joined += std::string(i > 1 ? " " : "") + argv[i];
        }
        reply["stdout"] = str(joined + "\n");
        return emit(std::move(reply));
    }

    // "ok": echo the first argument of every call.
    reply["stdout"] = str("ran\n");
    if (op == "call_batch")
    {
        const Json* calls = codegate::support::json_get(*obj, "calls");
        Json::Array out;
        if (calls != nullptr && calls->as_array() != nullptr)
        {
            for (const auto& call : *calls->as_array())
            {
                Json::Object entry;
                if (mode == "callraise")
                {
                    entry["status"] = str("raised");
                    entry["type"] = str("ZeroDivisionError");
                    entry["message"] = str("division by zero");
                }
                else
                {
                    entry["status"] = str("returned");
                    entry["value"] = first_or_none(&call);
                }
                out.push_back(Json{.value = std::move(entry)});
            }
        }
        reply["calls"] = Json{.value = std::move(out)};
    }
    else if (codegate::support::json_get_string(*obj, "entry").has_value())
    {
        reply["result"] = first_or_none(codegate::support::json_get(*obj, "args"));
    }
    return emit(std::move(reply));
}
