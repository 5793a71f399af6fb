#include <algorithm>
#include <codegate/sandbox/driver.h>
#include <codegate/sandbox/value_codec.h>
#include <codegate/support/json.h>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>

namespace codegate::sandbox
{

namespace
{

using codegate::support::Json;

constexpr std::string_view kDriver = R"PY(
import io, json, sys, traceback

def _enc(v, d=0):
    if d > 100:
        return {"t": "opaque", "type": type(v).__name__, "repr": "..."}
    if v is None:
        return {"t": "none", "v": None}
    if isinstance(v, bool):
        return {"t": "bool", "v": v}
    if isinstance(v, int):
        try:
            return {"t": "int", "v": str(v)}
        except ValueError:
            return {"t": "opaque", "type": "int", "repr": "<int too large>"}
    if isinstance(v, float):
        return {"t": "float", "v": repr(v)}
    if isinstance(v, str):
        return {"t": "str", "v": v}
    if isinstance(v, (bytes, bytearray)):
        return {"t": "bytes", "v": bytes(v).hex()}
    if isinstance(v, list):
        return {"t": "list", "v": [_enc(x, d + 1) for x in v]}
    if isinstance(v, tuple):
        return {"t": "tuple", "v": [_enc(x, d + 1) for x in v]}
    if isinstance(v, (set, frozenset)):
        return {"t": "set", "v": [_enc(x, d + 1) for x in v]}
    if isinstance(v, dict):
        return {"t": "dict", "v": [[_enc(k, d + 1), _enc(x, d + 1)] for k, x in v.items()]}
    try:
        r = repr(v)
    except Exception:
        r = "<unrepresentable>"
    return {"t": "opaque", "type": type(v).__name__, "repr": r[:1000]}

def _dec(j):
    t = j["t"]
    if t == "none":
        return None
    if t == "bool":
        return bool(j["v"])
    if t == "int":
        return int(j["v"])
    if t == "float":
        return float(j["v"])
    if t == "str":
        return j["v"]
    if t == "bytes":
        return bytes.fromhex(j["v"])
    if t == "list":
        return [_dec(x) for x in j["v"]]
    if t == "tuple":
        return tuple(_dec(x) for x in j["v"])
    if t == "set":
        return set(_dec(x) for x in j["v"])
    if t == "dict":
        return {_dec(k): _dec(x) for k, x in j["v"]}
    raise ValueError("cannot decode opaque value")

class _Capped(io.TextIOBase):
    def __init__(self, cap):
        self.parts = []
        self.size = 0
        self.cap = cap
        self.truncated = False
    def writable(self):
        return True
    def write(self, text):
        room = self.cap - self.size
        if room > 0:
            piece = text[:room]
            self.parts.append(piece)
            self.size += len(piece)
        if len(text) > max(room, 0):
            self.truncated = True
        return len(text)
    def value(self):
        return "".join(self.parts)

def _main():
    real_out = sys.stdout
    req = json.loads(sys.stdin.read())
    reply = {"protocol_version": 1, "status": "ok"}
    cap = int(req.get("max_output_bytes", 10000))
    out, err = _Capped(cap), _Capped(cap)
    sys.setrecursionlimit(max(100, int(req.get("recursion_limit", 1000))))
    sys.stdout, sys.stderr = out, err
    try:
        ns = {"__name__": "__codegate__"}
        exec(compile(req["source"], "<generated>", "exec"), ns)
        entry = req.get("entry")
        if entry:
            fn = ns.get(entry)
            if not callable(fn):
                raise NameError("name '%s' is not defined" % entry)
            if req["op"] == "call_batch":
                calls = []
                for args in req.get("calls", []):
                    try:
                        calls.append({"status": "returned",
                                      "value": _enc(fn(*[_dec(a) for a in args]))})
                    except MemoryError:
                        calls.append({"status": "oom"})
                    except Exception as e:
                        calls.append({"status": "raised", "type": type(e).__name__,
                                      "message": str(e)})
                reply["calls"] = calls
            else:
                reply["result"] = _enc(fn(*[_dec(a) for a in req.get("args", [])]))
    except MemoryError:
        reply["status"] = "oom"
    except BaseException as e:
        reply["status"] = "error"
        reply["exception"] = {"type": type(e).__name__, "message": str(e)}
        traceback.print_exc(file=err)
    finally:
        sys.stdout, sys.stderr = real_out, sys.__stderr__
    reply["stdout"] = out.value()
    reply["stderr"] = err.value()
    reply["stdout_truncated"] = out.truncated
    reply["stderr_truncated"] = err.truncated
    try:
        import resource
        reply["peak_rss_kb"] = resource.getrusage(resource.RUSAGE_SELF).ru_maxrss
    except Exception:
        pass
    real_out.write(json.dumps(reply) + "\n")
    real_out.flush()

_main()
)PY";

bool debug_enabled()
{
    return std::getenv("CODEGATE_DEBUG") != nullptr;
}

Json::Array encode_args(const std::vector<Value>& args)
{
    Json::Array out;
    out.reserve(args.size());
    for (const auto& arg : args)
    {
        out.push_back(encode_value(arg));
    }
    return out;
}

std::optional<CallOutcome> parse_call(const Json& json)
{
    const auto* obj = json.as_object();
    if (obj == nullptr)
    {
        return std::nullopt;
    }
    const auto status = codegate::support::json_get_string(*obj, "status");
    if (!status.has_value())
    {
        return std::nullopt;
    }
    CallOutcome call;
    if (*status == "returned")
    {
        const Json* value = codegate::support::json_get(*obj, "value");
        auto decoded = value != nullptr ? decode_value(*value) : std::nullopt;
        if (!decoded.has_value())
        {
            return std::nullopt;
        }
        call.kind = CallOutcome::Kind::Returned;
        call.value = std::move(*decoded);
        return call;
    }
    if (*status == "raised")
    {
        call.kind = CallOutcome::Kind::Raised;
        call.exit = ExitClass::RuntimeError;
        call.exception.type = codegate::support::json_get_string(*obj, "type").value_or("Exception");
        call.exception.message = codegate::support::json_get_string(*obj, "message").value_or("");
        return call;
    }
    if (*status == "oom")
    {
        call.kind = CallOutcome::Kind::Failed;
        call.exit = ExitClass::Oom;
        return call;
    }
    return std::nullopt;
}

ExecutionResult failed(SandboxState state, ExitClass exit, std::string error)
{
    ExecutionResult result;
    result.state = state;
    result.exit = exit;
    result.backend_error = std::move(error);
    return result;
}

class DriverCallable final : public BatchCallable
{
  public:
    DriverCallable(DriverSandbox& sandbox, std::string source, std::string name)
        : sandbox_(sandbox), source_(std::move(source)), name_(std::move(name))
    {
    }

    std::vector<CallOutcome> call_batch(const std::vector<std::vector<Value>>& inputs) override
    {
        std::vector<CallOutcome> outcomes;
        if (inputs.empty())
        {
            return outcomes;
        }
        auto fail_all = [&](ExitClass exit, const std::string& message)
        {
            CallOutcome call;
            call.kind = CallOutcome::Kind::Failed;
            call.exit = exit;
            call.exception.message = message;
            return std::vector<CallOutcome>(inputs.size(), call);
        };

        auto launch = sandbox_.launch();
        if (const auto* error = std::get_if<std::string>(&launch))
        {
            return fail_all(ExitClass::RuntimeError, *error);
        }
        DriverRequest request;
        request.op = "call_batch";
        request.source = source_;
        request.entry = name_;
        request.calls = inputs;
        request.max_output_bytes = sandbox_.config().max_output_bytes;
        request.recursion_limit = sandbox_.config().max_recursion_depth;

        std::optional<DriverReply> reply;
        const auto result =
            run_driver(std::get<DriverLaunch>(launch), request, sandbox_.config(), &reply);
        usage_.wall_ms += result.wall_ms;
        usage_.cpu_ms += result.cpu_ms;
        usage_.peak_memory_bytes = std::max(usage_.peak_memory_bytes, result.peak_memory_bytes);

        if (!result.ok() || !reply.has_value() || reply->calls.size() != inputs.size())
        {
            const std::string message = !result.backend_error.empty() ? result.backend_error
                                        : result.exception.has_value()
                                            ? result.exception->type + ": " + result.exception->message
                                            : std::string(to_string(result.exit));
            return fail_all(result.ok() ? ExitClass::RuntimeError : result.exit, message);
        }
        return std::move(reply->calls);
    }

    BatchUsage usage() const override { return usage_; }

  private:
    DriverSandbox& sandbox_;
    std::string source_;
    std::string name_;
    BatchUsage usage_;
};

} // namespace

std::string_view python_driver_source()
{
    return kDriver;
}

std::string encode_request(const DriverRequest& request)
{
    Json::Object obj;
    obj.emplace("protocol_version", Json{1.0});
    obj.emplace("op", Json{request.op});
    obj.emplace("source", Json{request.source});
    if (request.entry.has_value())
    {
        obj.emplace("entry", Json{*request.entry});
    }
    obj.emplace("args", Json{encode_args(request.args)});
    Json::Array calls;
    calls.reserve(request.calls.size());
    for (const auto& call : request.calls)
    {
        calls.push_back(Json{encode_args(call)});
    }
    obj.emplace("calls", Json{std::move(calls)});
    obj.emplace("max_output_bytes", Json{static_cast<double>(request.max_output_bytes)});
    obj.emplace("recursion_limit", Json{static_cast<double>(request.recursion_limit)});
    return codegate::support::json_serialize(Json{std::move(obj)});
}

std::optional<DriverReply> parse_reply(std::string_view output)
{
    while (!output.empty() && (output.back() == '\n' || output.back() == '\r' || output.back() == ' '))
    {
        output.remove_suffix(1);
    }
    const auto nl = output.rfind('\n');
    const std::string_view line = nl == std::string_view::npos ? output : output.substr(nl + 1);
    const auto parsed = codegate::support::parse_json(line);
    if (!parsed.has_value() || !parsed->is_object())
    {
        return std::nullopt;
    }
    const auto& obj = *parsed->as_object();
    const auto version = codegate::support::json_get_number(obj, "protocol_version");
    const auto status = codegate::support::json_get_string(obj, "status");
    if (!version.has_value() || *version != 1.0 || !status.has_value())
    {
        return std::nullopt;
    }

    DriverReply reply;
    reply.status = *status;
    reply.stdout_text = codegate::support::json_get_string(obj, "stdout").value_or("");
    reply.stderr_text = codegate::support::json_get_string(obj, "stderr").value_or("");
    reply.stdout_truncated = codegate::support::json_get_bool(obj, "stdout_truncated").value_or(false);
    reply.stderr_truncated = codegate::support::json_get_bool(obj, "stderr_truncated").value_or(false);
    if (const auto kb = codegate::support::json_get_number(obj, "peak_rss_kb"); kb.has_value() && *kb > 0)
    {
        reply.peak_rss_bytes = static_cast<std::uint64_t>(*kb) * 1024;
    }
    if (const Json* exc = codegate::support::json_get(obj, "exception"); exc != nullptr && exc->is_object())
    {
        reply.exception = ExceptionSummary{
            .type = codegate::support::json_get_string(*exc->as_object(), "type").value_or("Exception"),
            .message = codegate::support::json_get_string(*exc->as_object(), "message").value_or(""),
        };
    }
    if (const Json* result = codegate::support::json_get(obj, "result"))
    {
        reply.result = decode_value(*result);
        if (!reply.result.has_value())
        {
            return std::nullopt;
        }
    }
    if (const Json* calls = codegate::support::json_get(obj, "calls"))
    {
        const auto* arr = calls->as_array();
        if (arr == nullptr)
        {
            return std::nullopt;
        }
        for (const auto& item : *arr)
        {
            auto call = parse_call(item);
            if (!call.has_value())
            {
                return std::nullopt;
            }
            reply.calls.push_back(std::move(*call));
        }
    }
    return reply;
}

ExecutionResult run_driver(const DriverLaunch& launch, const DriverRequest& request,
                           const SandboxConfig& config, std::optional<DriverReply>* reply_out)
{
    codegate::process::ProcessRequest proc;
    proc.argv = launch.argv;
    proc.env = launch.env;
    proc.stdin_data = encode_request(request);
    proc.timeout_ms = launch.timeout_ms;
    proc.limits = launch.limits;
    proc.on_kill = launch.on_kill;
    // Room for the capped streams inside the reply, plus the encoded return values.
    proc.max_output_bytes = 4 * config.max_output_bytes + 16 * 1024 * 1024;

    if (debug_enabled())
    {
        std::cerr << "[sandbox] launching " << launch.argv.front() << " (timeout "
                  << launch.timeout_ms << " ms)\n";
    }
    const auto proc_result = codegate::process::run_process(proc);

    ExecutionResult result;
    result.wall_ms = proc_result.wall_ms;
    result.cpu_ms = proc_result.cpu_ms;
    result.peak_memory_bytes = proc_result.peak_rss_bytes;

    if (proc_result.spawn_failed)
    {
        auto r = failed(SandboxState::Crashed, ExitClass::RuntimeError,
                        "failed to start " + launch.argv.front() + ": " + proc_result.spawn_error);
        r.wall_ms = proc_result.wall_ms;
        return r;
    }
    if (proc_result.timed_out || proc_result.term_signal == SIGXCPU)
    {
        result.exit = ExitClass::Timeout;
        result.state = SandboxState::TimedOut;
        result.stderr_text = proc_result.err.substr(0, config.max_output_bytes);
        return result;
    }
    if (proc_result.output_limit_exceeded)
    {
        result.exit = ExitClass::RuntimeError;
        result.state = SandboxState::Completed;
        result.exception = ExceptionSummary{.type = "OutputLimitExceeded",
                                            .message = "driver reply exceeded " +
                                                       std::to_string(proc.max_output_bytes) +
                                                       " bytes"};
        return result;
    }
    if (proc_result.term_signal == SIGKILL || (launch.exit_137_is_oom && proc_result.exit_code == 137))
    {
        result.exit = ExitClass::Oom;
        result.state = SandboxState::ResourceExceeded;
        result.stderr_text = proc_result.err.substr(0, config.max_output_bytes);
        return result;
    }

    auto reply = parse_reply(proc_result.out);
    if (!reply.has_value())
    {
        if (proc_result.err.find("MemoryError") != std::string::npos)
        {
            result.exit = ExitClass::Oom;
            result.state = SandboxState::ResourceExceeded;
            result.stderr_text = proc_result.err.substr(0, config.max_output_bytes);
            return result;
        }
        auto r = failed(SandboxState::Crashed, ExitClass::RuntimeError,
                        "malformed driver reply (exit code " + std::to_string(proc_result.exit_code) +
                            ")");
        r.wall_ms = proc_result.wall_ms;
        r.cpu_ms = proc_result.cpu_ms;
        r.stderr_text = proc_result.err.substr(0, config.max_output_bytes);
        r.stderr_truncated = proc_result.err.size() > config.max_output_bytes;
        return r;
    }

    result.stdout_text = reply->stdout_text;
    result.stderr_text = reply->stderr_text;
    result.stdout_truncated = reply->stdout_truncated;
    result.stderr_truncated = reply->stderr_truncated;
    result.peak_memory_bytes = std::max(result.peak_memory_bytes, reply->peak_rss_bytes);
    if (reply->status == "oom")
    {
        result.exit = ExitClass::Oom;
        result.state = SandboxState::ResourceExceeded;
    }
    else if (reply->status == "error")
    {
        result.exit = ExitClass::RuntimeError;
        result.state = SandboxState::Completed;
        result.exception = reply->exception;
    }
    else
    {
        result.exit = ExitClass::Ok;
        result.state = SandboxState::Completed;
        result.return_value = reply->result;
    }
    if (reply_out != nullptr)
    {
        *reply_out = std::move(reply);
    }
    return result;
}

ExecutionResult DriverSandbox::run(std::string_view source,
                                   const std::optional<std::string>& entry_point,
                                   const std::vector<Value>& inputs)
{
    source_ = std::string(source);
    auto launch_or_error = launch();
    if (const auto* error = std::get_if<std::string>(&launch_or_error))
    {
        return failed(SandboxState::Crashed, ExitClass::RuntimeError, *error);
    }
    DriverRequest request;
    request.source = source_;
    request.entry = entry_point;
    request.args = inputs;
    request.max_output_bytes = config().max_output_bytes;
    request.recursion_limit = config().max_recursion_depth;
    return run_driver(std::get<DriverLaunch>(launch_or_error), request, config());
}

std::unique_ptr<BatchCallable> DriverSandbox::callable(const std::string& name)
{
    if (!last_run_ok())
    {
        return nullptr;
    }
    return std::make_unique<DriverCallable>(*this, source_, name);
}

} // namespace codegate::sandbox
