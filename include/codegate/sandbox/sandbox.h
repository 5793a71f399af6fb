#pragma once

#include <codegate/policy/pattern_registry.h>
#include <codegate/runtime/value.h>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

/**
 * @file sandbox.h
 * @brief Isolated execution of untrusted code behind one interface, with three backends.
 *
 * Every backend enforces the wall-clock timeout and the memory ceiling of its
 * SandboxConfig and reports through the same state machine:
 * `Ready -> Running -> {Completed, TimedOut, ResourceExceeded, Crashed}`.
 * A result carries a usable return value only when it is Completed with
 * ExitClass::Ok.
 */

namespace codegate::sandbox
{

using codegate::runtime::Value;

enum class BackendKind
{
    Restricted,
    Subprocess,
    Container,
};

[[nodiscard]] std::string_view to_string(BackendKind kind);
[[nodiscard]] std::optional<BackendKind> backend_from_string(std::string_view name);

enum class NetworkPolicy
{
    Disabled,
    Allowed,
};

enum class FilesystemPolicy
{
    /** Read-only view of the host or image, plus a small writable scratch directory. */
    ReadOnly,
    /** No filesystem restriction beyond the backend's own (file size limit still applies). */
    Unrestricted,
};

struct SandboxConfig
{
    double timeout_seconds = 10.0;
    std::uint64_t max_memory_bytes = 128ull * 1024 * 1024;
    /** Fraction of one CPU granted to container runs. */
    double cpu_share = 0.5;
    NetworkPolicy network = NetworkPolicy::Disabled;
    FilesystemPolicy filesystem = FilesystemPolicy::ReadOnly;
    /** Cap applied to stdout and to stderr separately. */
    std::size_t max_output_bytes = 10000;
    std::size_t max_processes = 50;
    /** Python call frames allowed; matches CPython's default recursion limit. */
    std::size_t max_recursion_depth = 1000;
    /** Interpreter for process backends; CODEGATE_PYTHON, then `python3` when unset. */
    std::optional<std::string> python_path;
    /** Isolation wrapper (bwrap) for the subprocess backend; CODEGATE_BWRAP when unset. */
    std::optional<std::string> isolation_wrapper;
    /** Container runtime binary; CODEGATE_CONTAINER_RUNTIME, then `docker` when unset. */
    std::optional<std::string> container_runtime;
    std::string container_image = "python:3.12-slim";
    /** Extra wall-clock allowance for container startup. */
    double container_startup_seconds = 5.0;
    /** Names the restricted interpreter refuses to expose. */
    std::shared_ptr<const codegate::policy::PatternRegistry> registry =
        codegate::policy::default_registry();
};

/** @brief Invalid configuration, reported before anything runs. */
struct ConfigError
{
    std::string message;
};

/** @brief First problem with `config`, or nullopt when it is usable. */
[[nodiscard]] std::optional<ConfigError> check_config(const SandboxConfig& config);

enum class ExitClass
{
    Ok,
    Timeout,
    Oom,
    RuntimeError,
    ForbiddenOperation,
};

enum class SandboxState
{
    Ready,
    Running,
    Completed,
    TimedOut,
    ResourceExceeded,
    Crashed,
};

[[nodiscard]] std::string_view to_string(ExitClass c);
[[nodiscard]] std::string_view to_string(SandboxState s);

/** @brief Type and message of an exception raised by the code under test. */
struct ExceptionSummary
{
    std::string type;
    std::string message;
};

struct ExecutionResult
{
    std::string stdout_text;
    std::string stderr_text;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    std::optional<Value> return_value;
    std::optional<ExceptionSummary> exception;
    double wall_ms = 0.0;
    double cpu_ms = 0.0;
    std::uint64_t peak_memory_bytes = 0;
    ExitClass exit = ExitClass::Ok;
    SandboxState state = SandboxState::Ready;
    /** Infrastructure failure text (spawn failure, malformed driver reply). */
    std::string backend_error;

    [[nodiscard]] bool ok() const
    {
        return state == SandboxState::Completed && exit == ExitClass::Ok;
    }
};

/** @brief Result of one call made through a BatchCallable. */
struct CallOutcome
{
    enum class Kind
    {
        Returned,
        /** The code under test raised. */
        Raised,
        /** The sandbox stopped the call (timeout, memory, policy, infrastructure). */
        Failed,
    };
    Kind kind = Kind::Failed;
    Value value;
    ExceptionSummary exception;
    ExitClass exit = ExitClass::Ok;
};

/** @brief Resources used by the calls of one batch. */
struct BatchUsage
{
    double wall_ms = 0.0;
    double cpu_ms = 0.0;
    std::uint64_t peak_memory_bytes = 0;
};

/**
 * @brief A function defined by code that already ran in a sandbox.
 *
 * Each batch runs under the limits of the sandbox that produced the callable.
 * Remote backends start a fresh run per batch, so state does not carry over
 * between batches; calls inside one batch share a run.
 */
class BatchCallable
{
  public:
    virtual ~BatchCallable() = default;

    /** @brief One outcome per input, in order. */
    [[nodiscard]] virtual std::vector<CallOutcome> call_batch(
        const std::vector<std::vector<Value>>& inputs) = 0;

    /** @brief Usage summed over every batch so far (peak memory is the maximum). */
    [[nodiscard]] virtual BatchUsage usage() const = 0;
};

class Sandbox
{
  public:
    explicit Sandbox(SandboxConfig config) : config_(std::move(config)) {}
    virtual ~Sandbox() = default;

    Sandbox(const Sandbox&) = delete;
    Sandbox& operator=(const Sandbox&) = delete;

    [[nodiscard]] virtual BackendKind kind() const = 0;

    /**
     * @brief Run `source`; when `entry_point` is given, then call it with `inputs`.
     *
     * An instance executes once. A second call returns a Crashed result.
     */
    [[nodiscard]] ExecutionResult execute(std::string_view source,
                                          const std::optional<std::string>& entry_point = {},
                                          const std::vector<Value>& inputs = {});

    /**
     * @brief Callable for `name` defined by the last execute().
     *
     * Null unless that run completed with ExitClass::Ok.
     */
    [[nodiscard]] virtual std::unique_ptr<BatchCallable> callable(const std::string& name) = 0;

    [[nodiscard]] SandboxState state() const { return state_; }
    [[nodiscard]] const SandboxConfig& config() const { return config_; }

  protected:
    /** Backend run; the base class handles the state machine around it. */
    virtual ExecutionResult run(std::string_view source,
                                const std::optional<std::string>& entry_point,
                                const std::vector<Value>& inputs) = 0;

    [[nodiscard]] bool last_run_ok() const { return last_ok_; }

  private:
    SandboxConfig config_;
    SandboxState state_ = SandboxState::Ready;
    bool last_ok_ = false;
};

using SandboxResult = std::variant<std::unique_ptr<Sandbox>, ConfigError>;

/** @brief A fresh backend of `kind`; ConfigError when `config` is invalid. */
[[nodiscard]] SandboxResult make_sandbox(BackendKind kind, SandboxConfig config);

/** @brief Terminal state matching an exit classification. */
[[nodiscard]] SandboxState state_for(ExitClass exit);

} // namespace codegate::sandbox
