#include <chrono>
#include <codegate/process/process.h>
#include <codegate/sandbox/container_sandbox.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static std::string sibling_exe(const char* argv0, const char* name)
{
    const std::filesystem::path bin = std::filesystem::path(argv0);
    return (bin.parent_path() / name).string();
}

static std::vector<std::string> read_lines(const std::string& path)
{
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line))
    {
        if (!line.empty())
        {
            lines.push_back(line);
        }
    }
    return lines;
}

static void truncate_file(const std::string& path)
{
    std::ofstream out(path, std::ios::trunc);
}

static bool contains(const std::string& haystack, const std::string& needle)
{
    return haystack.find(needle) != std::string::npos;
}

int main(int argc, char** argv)
{
    using namespace codegate::sandbox;
    (void)argc;

    struct EnvVarGuard
    {
        std::string key;
        bool had_old = false;
        std::string old;

        explicit EnvVarGuard(const char* k) : key(k)
        {
            if (const char* v = std::getenv(k); v != nullptr)
            {
                had_old = true;
                old = v;
            }
        }

        void set(const char* v) const { (void)setenv(key.c_str(), v, 1); }
        void unset() const { (void)unsetenv(key.c_str()); }

        ~EnvVarGuard()
        {
            if (had_old)
            {
                (void)setenv(key.c_str(), old.c_str(), 1);
            }
            else
            {
                (void)unsetenv(key.c_str());
            }
        }
    };

    const std::string runtime = sibling_exe(argv[0], "codegate_fake_container_runtime");
    auto log = codegate::process::TempFile::create(".log", "");
    if (!log.has_value())
    {
        fail("expected a temp file for the runtime log");
    }
    EnvVarGuard log_env("CODEGATE_FAKE_RUNTIME_LOG");
    log_env.set(log->path().c_str());

    auto fake_config = [&]
    {
        SandboxConfig config;
        config.container_runtime = runtime;
        config.timeout_seconds = 5.0;
        config.max_memory_bytes = 64ull * 1024 * 1024;
        return config;
    };

    {
        ContainerSandbox sb(fake_config());
        const auto res = sb.execute("def f(x):\n    return x\n", std::string("f"), {Value::str("v")});
        if (!res.ok() || !res.return_value.has_value() || res.return_value->as_str() != "v")
        {
            fail("expected the containerised driver to return its argument: " + res.backend_error);
        }

        const auto lines = read_lines(log->path());
        if (lines.size() != 1)
        {
            fail("expected exactly one runtime invocation");
        }
        const std::string& run = lines[0];
        if (run.rfind("run --rm -i --name codegate-", 0) != 0)
        {
            fail("expected a named throwaway container: " + run);
        }
        for (const char* flag :
             {" --network=none ", " --read-only ", " --tmpfs /scratch:rw,size=16m ",
              " --memory=67108864b ", " --memory-swap=67108864b ", " --cpus=0.5 ",
              " --pids-limit=50 ", " --security-opt=no-new-privileges ", " --cap-drop=ALL "})
        {
            if (!contains(run, flag))
            {
                fail(std::string("expected container flag") + flag + "in: " + run);
            }
        }
        const std::string tail = " python:3.12-slim python3 -I -S -c <script>";
        if (run.size() < tail.size() || run.compare(run.size() - tail.size(), tail.size(), tail) != 0)
        {
            fail("expected the image and isolated interpreter at the end: " + run);
        }
    }

    {
        truncate_file(log->path());
        SandboxConfig config = fake_config();
        config.network = NetworkPolicy::Allowed;
        config.filesystem = FilesystemPolicy::Unrestricted;
        config.container_image = "python:3.11";
        ContainerSandbox sb(config);
        if (!sb.execute("x = 1\n").ok())
        {
            fail("expected a plain run to complete");
        }
        const auto lines = read_lines(log->path());
        if (lines.size() != 1 || contains(lines[0], "--network=none") || contains(lines[0], "--read-only") ||
            !contains(lines[0], " python:3.11 python3 "))
        {
            fail("expected policies and image to follow the config");
        }
    }

    {
        // Two runs never share a container name.
        truncate_file(log->path());
        ContainerSandbox a(fake_config());
        ContainerSandbox b(fake_config());
        (void)a.execute("x = 1\n");
        (void)b.execute("x = 2\n");
        const auto lines = read_lines(log->path());
        if (lines.size() != 2)
        {
            fail("expected two runtime invocations");
        }
        auto name_of = [](const std::string& line)
        {
            std::istringstream in(line);
            std::string word;
            while (in >> word)
            {
                if (word == "--name" && (in >> word))
                {
                    return word;
                }
            }
            return std::string();
        };
        if (name_of(lines[0]).empty() || name_of(lines[0]) == name_of(lines[1]))
        {
            fail("expected unique container names");
        }
    }

    {
        truncate_file(log->path());
        SandboxConfig config = fake_config();
        config.timeout_seconds = 0.5;
        config.container_startup_seconds = 0.5;
        ContainerSandbox sb(config);
        const auto start = std::chrono::steady_clock::now();
        const auto res = sb.execute("#fake:hang\n");
        const double elapsed =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        if (res.state != SandboxState::TimedOut || res.exit != ExitClass::Timeout)
        {
            fail("expected a hanging container to time out");
        }
        if (elapsed < 0.9 || elapsed > 15.0)
        {
            fail("expected the startup allowance on top of the timeout");
        }
        const auto lines = read_lines(log->path());
        if (lines.size() != 2 || lines[1].rfind("kill codegate-", 0) != 0)
        {
            fail("expected the timed out container to be killed through the runtime");
        }
        const std::string name = lines[1].substr(std::string("kill ").size());
        if (!contains(lines[0], "--name " + name + " "))
        {
            fail("expected the kill to target the started container");
        }
    }

    {
        ContainerSandbox sb(fake_config());
        const auto res = sb.execute("#fake:exit137\n");
        if (res.state != SandboxState::ResourceExceeded || res.exit != ExitClass::Oom)
        {
            fail("expected exit 137 from a container to mean the memory ceiling");
        }
    }

    {
        ContainerSandbox sb(fake_config());
        if (!sb.execute("def g(x):\n    return x\n").ok())
        {
            fail("expected definitions to run");
        }
        truncate_file(log->path());
        const auto out = sb.callable("g")->call_batch({{Value::integer(3)}, {Value::boolean(true)}});
        if (out.size() != 2 || out[0].value.as_int() != 3 || !out[1].value.is_bool())
        {
            fail("expected call batches through the container");
        }
        if (read_lines(log->path()).size() != 1)
        {
            fail("expected one container per batch");
        }
    }

    {
        SandboxConfig config = fake_config();
        config.container_runtime = "/nonexistent/container-runtime";
        ContainerSandbox sb(config);
        const auto res = sb.execute("x = 1\n");
        if (res.state != SandboxState::Crashed ||
            res.backend_error != "container runtime not found: /nonexistent/container-runtime")
        {
            fail("expected a missing runtime to be reported: " + res.backend_error);
        }
    }

    {
        EnvVarGuard runtime_env("CODEGATE_CONTAINER_RUNTIME");
        runtime_env.set("podman");
        if (container_runtime(SandboxConfig{}) != "podman")
        {
            fail("expected CODEGATE_CONTAINER_RUNTIME to pick the runtime");
        }
        runtime_env.unset();
        if (container_runtime(SandboxConfig{}) != "docker")
        {
            fail("expected docker by default");
        }
    }

    std::cout << "OK\n";
    return 0;
}
