#include <codegate/process/process.h>
#include <codegate/sandbox/subprocess_sandbox.h>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
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

    const std::string fake_python = sibling_exe(argv[0], "codegate_fake_python");
    const std::string fake_bwrap = sibling_exe(argv[0], "codegate_bwrap_fake");

    // Keep a wrapper from the environment out of the unwrapped cases.
    EnvVarGuard bwrap_env("CODEGATE_BWRAP");
    bwrap_env.unset();

    auto fake_config = [&]
    {
        SandboxConfig config;
        config.python_path = fake_python;
        config.timeout_seconds = 5.0;
        return config;
    };

    {
        SubprocessSandbox sb(fake_config());
        const auto res = sb.execute("def f(x):\n    return x\n", std::string("f"), {Value::integer(9)});
        if (!res.ok() || !res.return_value.has_value() || res.return_value->as_int() != 9)
        {
            fail("expected the driver result to come back: " + res.backend_error);
        }
        if (res.stdout_text != "ran\n" || res.peak_memory_bytes < 2048 * 1024)
        {
            fail("expected captured stdout and the reported peak memory");
        }
    }

    {
        SubprocessSandbox sb(fake_config());
        const auto res = sb.execute("#fake:argv\n");
        if (!res.ok() || res.stdout_text != "-I -S -c\n")
        {
            fail("expected the interpreter to run isolated: " + res.stdout_text);
        }
    }

    {
        SubprocessSandbox sb(fake_config());
        const auto res = sb.execute("#fake:env\n");
        if (!res.ok() || res.stdout_text != "sandboxed=0 home=unset\n")
        {
            fail("expected a minimal environment without a wrapper: " + res.stdout_text);
        }
    }

    {
        SubprocessSandbox sb(fake_config());
        const auto res = sb.execute("#fake:raise\n");
        if (res.state != SandboxState::Completed || res.exit != ExitClass::RuntimeError)
        {
            fail("expected a raised exception to complete with a runtime error");
        }
        if (!res.exception.has_value() || res.exception->type != "ValueError" ||
            res.exception->message != "boom" || res.stderr_text.rfind("Traceback", 0) != 0)
        {
            fail("expected the exception summary and traceback");
        }
        if (sb.callable("f") != nullptr)
        {
            fail("no callables after a failed run");
        }
    }

    {
        SandboxConfig config = fake_config();
        config.timeout_seconds = 1.0;
        SubprocessSandbox sb(config);
        const auto res = sb.execute("#fake:hang\n");
        if (res.state != SandboxState::TimedOut || res.exit != ExitClass::Timeout)
        {
            fail("expected a hanging driver to time out");
        }
        if (res.wall_ms > 10000.0)
        {
            fail("expected the hanging driver to be killed promptly");
        }
    }

    {
        SubprocessSandbox sb(fake_config());
        const auto res = sb.execute("#fake:oom\n");
        if (res.state != SandboxState::ResourceExceeded || res.exit != ExitClass::Oom)
        {
            fail("expected an oom reply to exceed resources");
        }
    }

    {
        SubprocessSandbox sb(fake_config());
        const auto res = sb.execute("#fake:garbage\n");
        if (res.state != SandboxState::Crashed ||
            res.backend_error.rfind("malformed driver reply", 0) != 0)
        {
            fail("expected a malformed reply to crash the run: " + res.backend_error);
        }
    }

    {
        // Without a container runtime, 137 is just an exit status.
        SubprocessSandbox sb(fake_config());
        const auto res = sb.execute("#fake:exit137\n");
        if (res.state != SandboxState::Crashed ||
            res.backend_error != "malformed driver reply (exit code 137)")
        {
            fail("expected exit 137 without a reply to crash: " + res.backend_error);
        }
    }

    {
        SubprocessSandbox sb(fake_config());
        if (!sb.execute("def g(x):\n    return x\n").ok())
        {
            fail("expected definitions to run");
        }
        auto g = sb.callable("g");
        if (g == nullptr)
        {
            fail("expected a proxy callable");
        }
        const auto out = g->call_batch({{Value::str("a")}, {Value::integer(4)}, {}});
        if (out.size() != 3 || out[0].kind != CallOutcome::Kind::Returned ||
            out[0].value.as_str() != "a" || out[1].value.as_int() != 4 || !out[2].value.is_none())
        {
            fail("expected one echoed value per call");
        }
        if (g->usage().wall_ms <= 0.0 || !g->call_batch({}).empty())
        {
            fail("expected usage to accumulate and empty batches to be free");
        }
    }

    {
        SubprocessSandbox sb(fake_config());
        if (!sb.execute("#fake:callraise\ndef h(x):\n    return 1 / 0\n").ok())
        {
            fail("expected definitions to run");
        }
        const auto out = sb.callable("h")->call_batch({{Value::integer(1)}, {Value::integer(2)}});
        if (out.size() != 2 || out[1].kind != CallOutcome::Kind::Raised ||
            out[1].exception.type != "ZeroDivisionError")
        {
            fail("expected raised calls to be reported individually");
        }
    }

    {
        SandboxConfig config = fake_config();
        config.isolation_wrapper = fake_bwrap;
        SubprocessSandbox sb(config);
        const auto res = sb.execute("#fake:env\n");
        if (!res.ok() || res.stdout_text != "sandboxed=1 home=unset\n")
        {
            fail("expected the driver to run under the isolation wrapper: " + res.stdout_text +
                 res.backend_error);
        }
    }

    {
        // Network access skips the wrapper.
        SandboxConfig config = fake_config();
        config.isolation_wrapper = fake_bwrap;
        config.network = NetworkPolicy::Allowed;
        SubprocessSandbox sb(config);
        const auto res = sb.execute("#fake:env\n");
        if (!res.ok() || res.stdout_text != "sandboxed=0 home=unset\n")
        {
            fail("expected no wrapper with network allowed");
        }
    }

    {
        bwrap_env.set(fake_bwrap.c_str());
        SubprocessSandbox sb(fake_config());
        const auto res = sb.execute("#fake:env\n");
        bwrap_env.unset();
        if (!res.ok() || res.stdout_text != "sandboxed=1 home=unset\n")
        {
            fail("expected CODEGATE_BWRAP to select the wrapper");
        }
    }

    {
        SandboxConfig config = fake_config();
        config.python_path = "/nonexistent/codegate-python";
        SubprocessSandbox sb(config);
        const auto res = sb.execute("x = 1\n");
        if (res.state != SandboxState::Crashed ||
            res.backend_error != "python interpreter not found: /nonexistent/codegate-python")
        {
            fail("expected a missing interpreter to be reported: " + res.backend_error);
        }
    }

    {
        EnvVarGuard python_env("CODEGATE_PYTHON");
        python_env.set("/opt/py/bin/python3");
        SandboxConfig config;
        if (python_command(config) != "/opt/py/bin/python3")
        {
            fail("expected CODEGATE_PYTHON to pick the interpreter");
        }
        config.python_path = "py";
        if (python_command(config) != "py")
        {
            fail("expected the config to take precedence");
        }
        python_env.unset();
        if (python_command(SandboxConfig{}) != "python3")
        {
            fail("expected python3 by default");
        }
    }

    // The real driver script, when an interpreter is installed.
    EnvVarGuard python_env("CODEGATE_PYTHON");
    python_env.unset();
    if (!codegate::process::find_executable("python3").has_value())
    {
        std::cout << "SKIP: python3 not installed\n";
        return 77;
    }

    {
        SubprocessSandbox sb(SandboxConfig{});
        const auto res = sb.execute("def f(x):\n    print('in f')\n    return [x * 2, None]\n",
                                    std::string("f"), {Value::integer(21)});
        if (!res.ok() || !res.return_value.has_value() ||
            codegate::runtime::repr(*res.return_value) != "[42, None]" || res.stdout_text != "in f\n")
        {
            fail("expected the python driver to return [42, None]: " + res.backend_error +
                 res.stderr_text);
        }
        auto f = sb.callable("f");
        const auto out = f->call_batch({{Value::integer(1)}, {Value::str("ab")}});
        if (out.size() != 2 || codegate::runtime::repr(out[0].value) != "[2, None]" ||
            codegate::runtime::repr(out[1].value) != "['abab', None]")
        {
            fail("expected python call batches to return per-call values");
        }
    }

    {
        SubprocessSandbox sb(SandboxConfig{});
        const auto res = sb.execute("def f():\n    return {}['k']\n", std::string("f"));
        if (res.exit != ExitClass::RuntimeError || !res.exception.has_value() ||
            res.exception->type != "KeyError")
        {
            fail("expected a KeyError from the python driver");
        }
    }

    {
        SandboxConfig config;
        config.timeout_seconds = 1.0;
        SubprocessSandbox sb(config);
        const auto res = sb.execute("while True:\n    pass\n");
        if (res.exit != ExitClass::Timeout)
        {
            fail("expected a python infinite loop to time out");
        }
    }

    std::cout << "OK\n";
    return 0;
}
