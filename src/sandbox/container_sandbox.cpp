#include <atomic>
#include <cmath>
#include <codegate/process/process.h>
#include <codegate/sandbox/container_sandbox.h>
#include <cstdlib>
#include <iostream>
#include <random>
#include <sstream>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>

namespace codegate::sandbox
{

namespace
{

constexpr int kKillTimeoutMs = 5000;

std::atomic<unsigned> g_container_counter{0};

std::string unique_container_name()
{
    std::random_device rd;
    std::ostringstream name;
    name << "codegate-" << ::getpid() << "-" << g_container_counter.fetch_add(1) << "-"
         << std::hex << (rd() & 0xFFFFFFu);
    return name.str();
}

void kill_container(const std::string& runtime, const std::string& name)
{
    codegate::process::ProcessRequest request;
    request.argv = {runtime, "kill", name};
    request.timeout_ms = kKillTimeoutMs;
    request.max_output_bytes = 64 * 1024;
    const auto result = codegate::process::run_process(request);
    if ((result.spawn_failed || result.exit_code != 0) && std::getenv("CODEGATE_DEBUG") != nullptr)
    {
        std::cerr << "[sandbox] " << runtime << " kill " << name << " failed"
                  << (result.spawn_failed ? ": " + result.spawn_error : std::string()) << "\n";
    }
}

} // namespace

std::string container_runtime(const SandboxConfig& config)
{
    if (config.container_runtime.has_value())
    {
        return *config.container_runtime;
    }
    const char* env = std::getenv("CODEGATE_CONTAINER_RUNTIME");
    if (env != nullptr && *env != '\0')
    {
        return env;
    }
    return "docker";
}

std::variant<DriverLaunch, std::string> ContainerSandbox::launch()
{
    const auto& cfg = config();
    const std::string runtime = container_runtime(cfg);
    if (!codegate::process::find_executable(runtime).has_value())
    {
        return "container runtime not found: " + runtime;
    }
    const std::string name = unique_container_name();

    std::ostringstream cpus;
    cpus << cfg.cpu_share;
    const std::string memory = std::to_string(cfg.max_memory_bytes) + "b";

    DriverLaunch launch;
    launch.argv = {runtime, "run", "--rm", "-i", "--name", name};
    if (cfg.network == NetworkPolicy::Disabled)
    {
        launch.argv.push_back("--network=none");
    }
    if (cfg.filesystem == FilesystemPolicy::ReadOnly)
    {
        launch.argv.push_back("--read-only");
    }
    launch.argv.insert(launch.argv.end(),
                       {
                           "--tmpfs",
                           "/scratch:rw,size=16m",
                           "--memory=" + memory,
                           "--memory-swap=" + memory,
                           "--cpus=" + cpus.str(),
                           "--pids-limit=" + std::to_string(cfg.max_processes),
                           "--security-opt=no-new-privileges",
                           "--cap-drop=ALL",
                           cfg.container_image,
                           "python3",
                           "-I",
                           "-S",
                           "-c",
                           std::string(python_driver_source()),
                       });

    launch.timeout_ms = static_cast<int>(
        std::ceil((cfg.timeout_seconds + cfg.container_startup_seconds) * 1000.0));
    launch.limits.disable_core_dumps = true;
    launch.on_kill = [runtime, name] { kill_container(runtime, name); };
    launch.exit_137_is_oom = true;
    return launch;
}

} // namespace codegate::sandbox
