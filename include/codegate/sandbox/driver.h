#pragma once

#include <codegate/process/process.h>
#include <codegate/sandbox/sandbox.h>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

/**
 * @file driver.h
 * @brief Protocol between the process backends and the Python driver script.
 *
 * The driver runs as `python3 -I -S -c <driver>`. It reads one JSON request
 * from stdin, executes the source in a fresh namespace with stdout and stderr
 * captured (and capped), and writes one JSON reply line to its real stdout.
 *
 * Request: `{"protocol_version":1, "op":"execute"|"call_batch", "source":...,
 * "entry":..., "args":[...], "calls":[[...], ...], "max_output_bytes":N,
 * "recursion_limit":N}`; values use the tagged encoding of value_codec.h.
 *
 * Reply: `{"protocol_version":1, "status":"ok"|"error"|"oom", "stdout":...,
 * "stderr":..., "stdout_truncated":b, "stderr_truncated":b,
 * "exception":{"type","message"}, "result":value, "calls":[...],
 * "peak_rss_kb":N}`. A call entry is `{"status":"returned","value":...}`,
 * `{"status":"raised","type":...,"message":...}` or `{"status":"oom"}`.
 */

namespace codegate::sandbox
{

/** @brief Source text of the driver script. */
[[nodiscard]] std::string_view python_driver_source();

struct DriverRequest
{
    std::string op = "execute";
    std::string source;
    std::optional<std::string> entry;
    std::vector<Value> args;
    std::vector<std::vector<Value>> calls;
    std::size_t max_output_bytes = 10000;
    std::size_t recursion_limit = 1000;
};

[[nodiscard]] std::string encode_request(const DriverRequest& request);

struct DriverReply
{
    std::string status;
    std::string stdout_text;
    std::string stderr_text;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    std::optional<ExceptionSummary> exception;
    std::optional<Value> result;
    std::vector<CallOutcome> calls;
    std::uint64_t peak_rss_bytes = 0;
};

/** @brief Parse the last non-empty line of the driver's stdout. */
[[nodiscard]] std::optional<DriverReply> parse_reply(std::string_view output);

/** @brief How to start one driver run. */
struct DriverLaunch
{
    std::vector<std::string> argv;
    std::optional<std::vector<std::pair<std::string, std::string>>> env;
    int timeout_ms = 10000;
    codegate::process::ResourceLimits limits;
    /** Runs after a timeout kill, for cleanup outside the process group. */
    std::function<void()> on_kill;
    /** Exit status 137 without a timeout means the memory ceiling was hit. */
    bool exit_137_is_oom = false;
};

/**
 * @brief Run the driver once and classify the run.
 *
 * `reply` receives the parsed reply when the driver produced one.
 */
[[nodiscard]] ExecutionResult run_driver(const DriverLaunch& launch, const DriverRequest& request,
                                         const SandboxConfig& config,
                                         std::optional<DriverReply>* reply = nullptr);

/**
 * @brief Base of the backends that run the driver in a child process.
 *
 * Subclasses describe how to launch the driver; running, classification and
 * proxy callables are shared.
 */
class DriverSandbox : public Sandbox
{
  public:
    using Sandbox::Sandbox;

    /** @brief Proxy for `name`; must not outlive this sandbox. */
    [[nodiscard]] std::unique_ptr<BatchCallable> callable(const std::string& name) override;

    /** @brief Launch description for one run, or an error message. */
    [[nodiscard]] virtual std::variant<DriverLaunch, std::string> launch() = 0;

  protected:
    ExecutionResult run(std::string_view source, const std::optional<std::string>& entry_point,
                        const std::vector<Value>& inputs) override;

  private:
    std::string source_;
};

} // namespace codegate::sandbox
