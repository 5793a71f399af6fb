#include <cmath>
#include <codegate/process/process.h>
#include <codegate/sandbox/subprocess_sandbox.h>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace codegate::sandbox
{

namespace
{

std::optional<std::string> env_value(const char* name)
{
    const char* v = std::getenv(name);
    if (v == nullptr || *v == '\0')
    {
        return std::nullopt;
    }
    return std::string(v);
}

std::optional<std::string> isolation_wrapper(const SandboxConfig& config)
{
    if (config.isolation_wrapper.has_value())
    {
        return config.isolation_wrapper;
    }
    return env_value("CODEGATE_BWRAP");
}

} // namespace

std::string python_command(const SandboxConfig& config)
{
    if (config.python_path.has_value())
    {
        return *config.python_path;
    }
    return env_value("CODEGATE_PYTHON").value_or("python3");
}

std::variant<DriverLaunch, std::string> SubprocessSandbox::launch()
{
    const auto& cfg = config();
    const std::string python = python_command(cfg);
    // The wrapper execs its command without a PATH search.
    const auto resolved = codegate::process::find_executable(python);
    if (!resolved.has_value())
    {
        return "python interpreter not found: " + python;
    }

    DriverLaunch launch;
    const auto wrapper = isolation_wrapper(cfg);
    const bool wrapped = cfg.network == NetworkPolicy::Disabled && wrapper.has_value();
    if (wrapped)
    {
        launch.argv = {*wrapper,
                       cfg.filesystem == FilesystemPolicy::ReadOnly ? "--ro-bind" : "--bind",
                       "/",
                       "/",
                       "--dev",
                       "/dev",
                       "--proc",
                       "/proc",
                       "--tmpfs",
                       "/tmp",
                       "--unshare-net",
                       "--unshare-pid",
                       "--die-with-parent",
                       "--new-session",
                       "--"};
    }
    else if (cfg.network == NetworkPolicy::Disabled && std::getenv("CODEGATE_DEBUG") != nullptr)
    {
        std::cerr << "[sandbox] no isolation wrapper configured; network is not isolated\n";
    }
    launch.argv.push_back(*resolved);
    launch.argv.push_back("-I");
    launch.argv.push_back("-S");
    launch.argv.push_back("-c");
    launch.argv.push_back(std::string(python_driver_source()));

    launch.env = std::vector<std::pair<std::string, std::string>>{
        {"PATH", "/usr/bin:/bin"},
        {"LANG", "C.UTF-8"},
    };
    launch.timeout_ms = static_cast<int>(std::ceil(cfg.timeout_seconds * 1000.0));
    launch.limits.address_space_bytes = cfg.max_memory_bytes;
    launch.limits.cpu_seconds = static_cast<std::uint64_t>(std::ceil(cfg.timeout_seconds)) + 1;
    if (cfg.filesystem == FilesystemPolicy::ReadOnly)
    {
        launch.limits.file_size_bytes = 0;
    }
    // bwrap forks its own children, so the process cap only applies unwrapped.
    if (!wrapped)
    {
        launch.limits.max_processes = cfg.max_processes;
    }
    launch.limits.disable_core_dumps = true;
    return launch;
}

} // namespace codegate::sandbox
