#include <codegate/sandbox/restricted_sandbox.h>
#include <codegate/sandbox/sandbox.h>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <variant>
#include <vector>

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static std::unique_ptr<codegate::sandbox::Sandbox> restricted(codegate::sandbox::SandboxConfig config)
{
    auto made = codegate::sandbox::make_sandbox(codegate::sandbox::BackendKind::Restricted,
                                                std::move(config));
    if (auto* error = std::get_if<codegate::sandbox::ConfigError>(&made))
    {
        fail("unexpected config error: " + error->message);
    }
    return std::get<std::unique_ptr<codegate::sandbox::Sandbox>>(std::move(made));
}

int main()
{
    using namespace codegate::sandbox;

    {
        auto sb = restricted(SandboxConfig{});
        if (sb->kind() != BackendKind::Restricted || sb->state() != SandboxState::Ready)
        {
            fail("expected a ready restricted sandbox");
        }
        const auto res = sb->execute("def add(a, b):\n    print('adding')\n    return a + b\n",
                                     std::string("add"), {Value::integer(2), Value::integer(3)});
        if (!res.ok() || !res.return_value.has_value() || res.return_value->as_int() != 5)
        {
            fail("expected add(2, 3) to return 5");
        }
        if (res.stdout_text != "adding\n" || sb->state() != SandboxState::Completed)
        {
            fail("expected captured output and a completed state");
        }

        // One execution per instance.
        const auto again = sb->execute("x = 1\n");
        if (again.state != SandboxState::Crashed || again.backend_error != "sandbox instance already used")
        {
            fail("expected a second execute to be refused");
        }
    }

    {
        auto sb = restricted(SandboxConfig{});
        const auto res = sb->execute("print('side effect')\n");
        if (!res.ok() || res.return_value.has_value() || res.stdout_text != "side effect\n")
        {
            fail("expected a plain run without a return value");
        }
    }

    {
        SandboxConfig config;
        config.timeout_seconds = 0.3;
        auto sb = restricted(config);
        const auto res = sb->execute("while True:\n    pass\n");
        if (res.state != SandboxState::TimedOut || res.exit != ExitClass::Timeout)
        {
            fail("expected an infinite loop to time out");
        }
        if (!res.exception.has_value() || res.exception->type != "TimeoutError")
        {
            fail("expected a TimeoutError summary");
        }
        if (res.wall_ms < 250.0)
        {
            fail("expected the timeout to be honoured before cancelling");
        }
    }

    {
        auto sb = restricted(SandboxConfig{});
        const auto res = sb->execute("import subprocess\nsubprocess.run(['ls'])\n");
        if (res.state != SandboxState::Completed || res.exit != ExitClass::ForbiddenOperation)
        {
            fail("expected a forbidden import to end the run");
        }
        if (!res.exception.has_value() || res.exception->type != "PolicyViolation" ||
            res.exception->message != "forbidden import: subprocess")
        {
            fail("expected a policy violation summary");
        }
        if (sb->callable("anything") != nullptr)
        {
            fail("no callables after a failed run");
        }
    }

    {
        auto sb = restricted(SandboxConfig{});
        const auto res = sb->execute("def f(:\n    pass\n");
        if (res.exit != ExitClass::RuntimeError || !res.exception.has_value() ||
            res.exception->type != "SyntaxError" || res.stderr_text.rfind("SyntaxError: ", 0) != 0)
        {
            fail("expected syntax errors to surface as SyntaxError");
        }
    }

    {
        auto sb = restricted(SandboxConfig{});
        const auto res = sb->execute("raise KeyError('k')\n");
        if (res.exit != ExitClass::RuntimeError || res.exception->type != "KeyError" ||
            res.stderr_text.find("KeyError") == std::string::npos)
        {
            fail("expected an uncaught KeyError");
        }
    }

    {
        SandboxConfig config;
        config.max_memory_bytes = 1024 * 1024;
        auto sb = restricted(config);
        const auto res = sb->execute("xs = [0] * 50000000\n");
        if (res.state != SandboxState::ResourceExceeded || res.exit != ExitClass::Oom)
        {
            fail("expected the memory ceiling to stop a huge allocation");
        }
    }

    {
        SandboxConfig config;
        config.max_output_bytes = 8;
        auto sb = restricted(config);
        const auto res = sb->execute("print('0123456789')\n");
        if (!res.ok() || res.stdout_text != "01234567" || !res.stdout_truncated)
        {
            fail("expected stdout capped at 8 bytes");
        }
    }

    {
        // Callables share the interpreter of the run.
        auto sb = restricted(SandboxConfig{});
        const auto res = sb->execute("calls = []\n"
                                     "def inv(x):\n"
                                     "    calls.append(x)\n"
                                     "    return 10 // x\n"
                                     "def count():\n"
                                     "    return len(calls)\n");
        if (!res.ok())
        {
            fail("expected definitions to run");
        }
        if (sb->callable("missing") != nullptr)
        {
            fail("expected no callable for an undefined name");
        }
        auto inv = sb->callable("inv");
        auto count = sb->callable("count");
        if (inv == nullptr || count == nullptr)
        {
            fail("expected callables for defined functions");
        }
        const auto outcomes = inv->call_batch({{Value::integer(2)}, {Value::integer(0)}, {Value::integer(5)}});
        if (outcomes.size() != 3)
        {
            fail("expected one outcome per input");
        }
        if (outcomes[0].kind != CallOutcome::Kind::Returned || outcomes[0].value.as_int() != 5)
        {
            fail("expected 10 // 2 == 5");
        }
        if (outcomes[1].kind != CallOutcome::Kind::Raised ||
            outcomes[1].exception.type != "ZeroDivisionError" ||
            outcomes[1].exit != ExitClass::RuntimeError)
        {
            fail("expected ZeroDivisionError to be reported per call");
        }
        if (outcomes[2].kind != CallOutcome::Kind::Returned || outcomes[2].value.as_int() != 2)
        {
            fail("expected later calls to run after a raised one");
        }
        const auto n = count->call_batch({{}});
        if (n.size() != 1 || n[0].value.as_int() != 3)
        {
            fail("expected calls to share module state");
        }
        if (!inv->call_batch({}).empty())
        {
            fail("expected an empty batch to return nothing");
        }
        if (inv->usage().wall_ms <= 0.0)
        {
            fail("expected batch usage to be recorded");
        }
    }

    {
        // Arguments are copied; the caller's values are not mutated.
        auto sb = restricted(SandboxConfig{});
        if (!sb->execute("def grow(xs):\n    xs.append(1)\n    return len(xs)\n").ok())
        {
            fail("expected definition to run");
        }
        auto grow = sb->callable("grow");
        const Value input = Value::list({});
        const auto out = grow->call_batch({{input}});
        if (out[0].value.as_int() != 1 || !input.as_list()->items.empty())
        {
            fail("expected the caller's list to stay empty");
        }
    }

    {
        SandboxConfig config;
        config.timeout_seconds = 0.3;
        auto sb = restricted(config);
        if (!sb->execute("base = 10\n"
                         "def spin(n):\n    while n >= 0:\n        n = n\n    return n + base\n")
                 .ok())
        {
            fail("expected definition to run");
        }
        auto spin = sb->callable("spin");
        const auto out = spin->call_batch({{Value::integer(-1)}, {Value::integer(1)}, {Value::integer(2)}});
        if (out.size() != 3 || out[0].kind != CallOutcome::Kind::Returned || out[0].value.as_int() != 9)
        {
            fail("expected the call before the timeout to return");
        }
        if (out[1].exit != ExitClass::Timeout || out[1].exception.type != "TimeoutError")
        {
            fail("expected the second call to time out");
        }
        if (out[2].kind != CallOutcome::Kind::Failed || out[2].exit != ExitClass::Timeout ||
            out[2].exception.message != "not run: call 2 of the batch ended it (timeout)")
        {
            fail("expected the unrun call to name the call that ended the batch: " + out[2].exception.message);
        }

        // The next batch runs against a fresh run of the module.
        const auto later = spin->call_batch({{Value::integer(-3)}, {Value::integer(-1)}});
        if (later.size() != 2 || later[0].kind != CallOutcome::Kind::Returned || later[0].value.as_int() != 7 ||
            later[1].value.as_int() != 9)
        {
            fail("expected calls to run again after a timed out batch");
        }
    }

    {
        auto sb = restricted(SandboxConfig{});
        if (SandboxConfig{}.max_recursion_depth != 1000)
        {
            fail("expected the default recursion depth of CPython");
        }
        if (!sb->execute("def depth(n):\n    return 0 if n == 0 else 1 + depth(n - 1)\n").ok())
        {
            fail("expected definition to run");
        }
        auto depth = sb->callable("depth");
        const auto out = depth->call_batch({{Value::integer(900)}, {Value::integer(5000)}});
        if (out[0].kind != CallOutcome::Kind::Returned || out[0].value.as_int() != 900)
        {
            fail("expected 900 nested calls to fit the default depth");
        }
        if (out[1].kind != CallOutcome::Kind::Raised || out[1].exception.type != "RecursionError")
        {
            fail("expected unbounded recursion to raise RecursionError");
        }
    }

    {
        SandboxConfig config;
        config.timeout_seconds = 0.0;
        auto made = make_sandbox(BackendKind::Restricted, config);
        const auto* error = std::get_if<ConfigError>(&made);
        if (error == nullptr || error->message != "sandbox timeout must be positive")
        {
            fail("expected a config error for a zero timeout");
        }
        config = SandboxConfig{};
        config.registry = nullptr;
        if (!check_config(config).has_value())
        {
            fail("expected a missing registry to be rejected");
        }
        if (check_config(SandboxConfig{}).has_value())
        {
            fail("expected the default config to be valid");
        }
    }

    if (backend_from_string("subprocess") != BackendKind::Subprocess ||
        backend_from_string("docker").has_value() || to_string(BackendKind::Container) != "container")
    {
        fail("unexpected backend names");
    }
    if (state_for(ExitClass::Oom) != SandboxState::ResourceExceeded ||
        state_for(ExitClass::ForbiddenOperation) != SandboxState::Completed)
    {
        fail("unexpected terminal states");
    }

    std::cout << "OK\n";
    return 0;
}
