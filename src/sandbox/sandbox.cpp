#include <codegate/sandbox/container_sandbox.h>
#include <codegate/sandbox/restricted_sandbox.h>
#include <codegate/sandbox/sandbox.h>
#include <codegate/sandbox/subprocess_sandbox.h>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

namespace codegate::sandbox
{

std::string_view to_string(BackendKind kind)
{
    switch (kind)
    {
    case BackendKind::Restricted:
        return "restricted";
    case BackendKind::Subprocess:
        return "subprocess";
    case BackendKind::Container:
        return "container";
    }
    return "unknown";
}

std::optional<BackendKind> backend_from_string(std::string_view name)
{
    if (name == "restricted")
    {
        return BackendKind::Restricted;
    }
    if (name == "subprocess")
    {
        return BackendKind::Subprocess;
    }
    if (name == "container")
    {
        return BackendKind::Container;
    }
    return std::nullopt;
}

std::string_view to_string(ExitClass c)
{
    switch (c)
    {
    case ExitClass::Ok:
        return "ok";
    case ExitClass::Timeout:
        return "timeout";
    case ExitClass::Oom:
        return "oom";
    case ExitClass::RuntimeError:
        return "runtime_error";
    case ExitClass::ForbiddenOperation:
        return "forbidden_operation";
    }
    return "unknown";
}

std::string_view to_string(SandboxState s)
{
    switch (s)
    {
    case SandboxState::Ready:
        return "ready";
    case SandboxState::Running:
        return "running";
    case SandboxState::Completed:
        return "completed";
    case SandboxState::TimedOut:
        return "timed_out";
    case SandboxState::ResourceExceeded:
        return "resource_exceeded";
    case SandboxState::Crashed:
        return "crashed";
    }
    return "unknown";
}

std::optional<ConfigError> check_config(const SandboxConfig& config)
{
    if (!(config.timeout_seconds > 0.0))
    {
        return ConfigError{"sandbox timeout must be positive"};
    }
    if (config.max_memory_bytes == 0)
    {
        return ConfigError{"sandbox memory ceiling must be positive"};
    }
    if (config.max_output_bytes == 0)
    {
        return ConfigError{"sandbox output cap must be positive"};
    }
    if (!(config.cpu_share > 0.0))
    {
        return ConfigError{"sandbox CPU share must be positive"};
    }
    if (config.max_processes == 0)
    {
        return ConfigError{"sandbox process limit must be positive"};
    }
    if (config.max_recursion_depth == 0)
    {
        return ConfigError{"sandbox recursion depth must be positive"};
    }
    if (config.python_path.has_value() && config.python_path->empty())
    {
        return ConfigError{"interpreter path is empty"};
    }
    if (config.isolation_wrapper.has_value() && config.isolation_wrapper->empty())
    {
        return ConfigError{"isolation wrapper path is empty"};
    }
    if (config.container_runtime.has_value() && config.container_runtime->empty())
    {
        return ConfigError{"container runtime path is empty"};
    }
    if (config.container_image.empty())
    {
        return ConfigError{"container image is empty"};
    }
    if (config.container_startup_seconds < 0.0)
    {
        return ConfigError{"container startup allowance must not be negative"};
    }
    if (config.registry == nullptr)
    {
        return ConfigError{"pattern registry is missing"};
    }
    return std::nullopt;
}

SandboxState state_for(ExitClass exit)
{
    switch (exit)
    {
    case ExitClass::Timeout:
        return SandboxState::TimedOut;
    case ExitClass::Oom:
        return SandboxState::ResourceExceeded;
    case ExitClass::Ok:
    case ExitClass::RuntimeError:
    case ExitClass::ForbiddenOperation:
        return SandboxState::Completed;
    }
    return SandboxState::Crashed;
}

ExecutionResult Sandbox::execute(std::string_view source,
                                 const std::optional<std::string>& entry_point,
                                 const std::vector<Value>& inputs)
{
    if (state_ != SandboxState::Ready)
    {
        ExecutionResult result;
        result.state = SandboxState::Crashed;
        result.exit = ExitClass::RuntimeError;
        result.backend_error = "sandbox instance already used";
        return result;
    }

    const bool debug = std::getenv("CODEGATE_DEBUG") != nullptr;
    if (debug)
    {
        std::cerr << "[sandbox] " << to_string(kind()) << ": executing " << source.size()
                  << " bytes" << (entry_point.has_value() ? ", entry " + *entry_point : "")
                  << "\n";
    }
    state_ = SandboxState::Running;
    auto result = run(source, entry_point, inputs);
    if (result.state == SandboxState::Ready || result.state == SandboxState::Running)
    {
        result.state = SandboxState::Crashed;
    }
    state_ = result.state;
    last_ok_ = result.ok();
    if (debug)
    {
        std::cerr << "[sandbox] " << to_string(kind()) << ": " << to_string(result.state) << "/"
                  << to_string(result.exit) << " in " << result.wall_ms << " ms\n";
    }
    return result;
}

SandboxResult make_sandbox(BackendKind kind, SandboxConfig config)
{
    if (auto error = check_config(config))
    {
        return std::move(*error);
    }
    switch (kind)
    {
    case BackendKind::Restricted:
        return std::unique_ptr<Sandbox>(std::make_unique<RestrictedSandbox>(std::move(config)));
    case BackendKind::Subprocess:
        return std::unique_ptr<Sandbox>(std::make_unique<SubprocessSandbox>(std::move(config)));
    case BackendKind::Container:
        return std::unique_ptr<Sandbox>(std::make_unique<ContainerSandbox>(std::move(config)));
    }
    return ConfigError{"unknown sandbox backend"};
}

} // namespace codegate::sandbox
