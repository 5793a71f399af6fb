#include <codegate/validator/validator.h>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <variant>
#include <vector>

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

using namespace codegate::validator;
using codegate::diag::Severity;

namespace
{

/** Restricted backend, no external tools. */
ValidatorConfig in_process()
{
    ValidatorConfig config;
    config.use_ruff = false;
    config.use_mypy = false;
    config.use_bandit = false;
    config.sandbox_backend = codegate::sandbox::BackendKind::Restricted;
    config.property_test_trial_count = 40;
    return config;
}

ValidationReport run(const std::string& source, const std::optional<std::string>& entry,
                     const ValidatorConfig& config)
{
    auto result = validate(source, entry, config);
    if (const auto* error = std::get_if<ConfigError>(&result))
    {
        fail("unexpected config error: " + error->message);
    }
    return std::get<ValidationReport>(std::move(result));
}

bool has_code(const StageResult& stage, const std::string& code, Severity severity)
{
    for (const auto& f : stage.findings)
    {
        if (f.code == code && f.severity == severity)
        {
            return true;
        }
    }
    return false;
}

const codegate::proptest::PropertyCheckResult* property(const ValidationReport& report, const std::string& name)
{
    for (const auto& p : report.properties)
    {
        if (p.property == name)
        {
            return &p;
        }
    }
    return nullptr;
}

} // namespace

int main()
{
    {
        const auto report = run("import os\nos.system('rm -rf /')\n", std::nullopt, in_process());
        const auto* pre = report.stage(StageId::Prevalidation);
        if (report.status != OverallStatus::Failed || pre->status != StageStatus::Failed)
        {
            fail("expected os.system to fail prevalidation");
        }
        if (!has_code(*pre, "PV001", Severity::Error) || !has_code(*pre, "PV002", Severity::Error))
        {
            fail("expected the forbidden import and call to be reported");
        }
        for (StageId id : {StageId::StaticAnalysis, StageId::Sandbox, StageId::PropertyTests})
        {
            if (report.stage(id)->status != StageStatus::Skipped ||
                report.stage(id)->reason != "stopped after prevalidation failed")
            {
                fail("expected " + std::string(to_string(id)) + " to be skipped after prevalidation");
            }
        }
        if (report.execution.has_value())
        {
            fail("nothing may run after a failed prevalidation");
        }
    }

    {
        // Without stop-on-failure the restricted interpreter refuses the import itself.
        auto config = in_process();
        config.stop_on_failure = false;
        const auto report = run("import subprocess\n", std::nullopt, config);
        const auto* sb = report.stage(StageId::Sandbox);
        if (sb->status != StageStatus::Failed || !has_code(*sb, "SB004", Severity::Critical))
        {
            fail("expected the sandbox to report a forbidden operation");
        }
        if (report.status != OverallStatus::Failed)
        {
            fail("expected a failed report");
        }
    }

    {
        const auto report = run("def f(:\n    return 1\n", std::nullopt, in_process());
        const auto* pre = report.stage(StageId::Prevalidation);
        if (pre->findings.size() != 1 || pre->findings[0].code != "PV000" ||
            pre->findings[0].severity != Severity::Critical || pre->findings[0].line != 1)
        {
            fail("expected exactly one Critical parse finding");
        }
        const auto* parsed = codegate::support::json_get(*pre->details.as_object(), "parsed");
        if (parsed == nullptr || parsed->as_bool() == nullptr || *parsed->as_bool())
        {
            fail("expected the details to record the parse failure");
        }
    }

    {
        const auto report = run("x = ().__class__.__bases__[0].__subclasses__()\n", std::nullopt, in_process());
        if (report.status != OverallStatus::Failed ||
            !has_code(*report.stage(StageId::Prevalidation), "PV003", Severity::Critical))
        {
            fail("expected dunder traversal to be Critical");
        }
    }

    {
        // Recursive and unannotated; parameters without annotations are generated as ints.
        const std::string fib = "def fib(n): return n if n<=1 else fib(n-1)+fib(n-2)\n";
        auto config = in_process();
        config.property.limits.int_min = 0;
        config.property.limits.int_max = 12;
        // fib(fib(12)) = fib(144) never finishes; the idempotence check may time out.
        config.sandbox_timeout_seconds = 2.0;
        const auto report = run(fib, std::string("fib"), config);
        if (report.stage(StageId::Prevalidation)->status != StageStatus::Passed)
        {
            fail("expected recursive fib to pass prevalidation");
        }
        if (report.stage(StageId::Sandbox)->status != StageStatus::Passed || !report.execution.has_value() ||
            report.execution->state != codegate::sandbox::SandboxState::Completed)
        {
            fail("expected the module run to complete");
        }
        const auto* ne = property(report, "no_exception");
        const auto* det = property(report, "deterministic");
        if (ne == nullptr || ne->outcome != codegate::proptest::PropertyOutcome::Holds || ne->trials != 40)
        {
            fail("expected recursive fib to hold no_exception: " + (ne == nullptr ? std::string() : ne->message));
        }
        if (det == nullptr || det->outcome != codegate::proptest::PropertyOutcome::Holds)
        {
            fail("expected recursive fib to be deterministic: " + (det == nullptr ? std::string() : det->message));
        }
    }

    {
        const std::string fib = "def fib(n: int) -> int:\n"
                                "    a, b = 0, 1\n"
                                "    for _ in range(n):\n"
                                "        a, b = b, a + b\n"
                                "    return a\n"
                                "\n"
                                "print(fib(10))\n";
        auto config = in_process();
        config.property.limits.int_min = 0;
        config.property.limits.int_max = 15;
        const auto report = run(fib, std::string("fib"), config);
        if (report.status != OverallStatus::Passed)
        {
            fail("expected fib to pass");
        }
        if (!report.execution.has_value() || report.execution->stdout_text != "55\n")
        {
            fail("expected the module run to print fib(10)");
        }
        const auto* ne = property(report, "no_exception");
        const auto* det = property(report, "deterministic");
        if (ne == nullptr || ne->outcome != codegate::proptest::PropertyOutcome::Holds || ne->trials != 40 ||
            det == nullptr || det->outcome != codegate::proptest::PropertyOutcome::Holds)
        {
            fail("expected fib to hold no_exception and deterministic");
        }
        // fib(fib(3)) = fib(2) = 1 differs from fib(3) = 2.
        const auto* idem = property(report, "idempotent");
        if (idem == nullptr || idem->outcome != codegate::proptest::PropertyOutcome::Violated)
        {
            fail("expected fib not to be idempotent");
        }
        const auto* pt = report.stage(StageId::PropertyTests);
        if (pt->status != StageStatus::Passed || !has_code(*pt, "PT001", Severity::Warning))
        {
            fail("expected a non-fatal property warning");
        }
        if (report.stage(StageId::ResourceGuard)->status != StageStatus::Passed)
        {
            fail("expected the resource guard to pass");
        }
    }

    {
        const std::string sorter = "def normalize(xs: list[int]) -> list[int]:\n"
                                   "    return sorted(xs)\n";
        auto config = in_process();
        config.properties.push_back(codegate::proptest::predicates::list_elements_preserved());
        const auto report = run(sorter, std::string("normalize"), config);
        if (report.status != OverallStatus::Passed || report.properties.size() != 4)
        {
            fail("expected sorting to pass with four properties");
        }
        for (const auto& p : report.properties)
        {
            if (p.outcome != codegate::proptest::PropertyOutcome::Holds)
            {
                fail("expected sorted to satisfy " + p.property + ": " + p.message);
            }
        }
        if (!report.stage(StageId::PropertyTests)->findings.empty())
        {
            fail("expected no property findings");
        }
    }

    {
        // Same source, same seed: the same verdicts, findings and counter-examples.
        const std::string clamp = "def clamp(x: int) -> int:\n"
                                  "    if x > 100:\n"
                                  "        return 100\n"
                                  "    return x\n";
        auto config = in_process();
        config.property.seed = 11;
        const auto first = run(clamp, std::string("clamp"), config);
        const auto second = run(clamp, std::string("clamp"), config);
        if (first.status != second.status || first.properties.size() != second.properties.size())
        {
            fail("expected repeated validations to agree");
        }
        for (std::size_t i = 0; i < first.stages.size(); ++i)
        {
            const auto& a = first.stages[i];
            const auto& b = second.stages[i];
            if (a.status != b.status || a.reason != b.reason || a.findings.size() != b.findings.size())
            {
                fail("expected the same result for " + std::string(to_string(a.stage)));
            }
            for (std::size_t k = 0; k < a.findings.size(); ++k)
            {
                if (a.findings[k].code != b.findings[k].code || a.findings[k].message != b.findings[k].message)
                {
                    fail("expected the same findings for " + std::string(to_string(a.stage)));
                }
            }
        }
        for (std::size_t i = 0; i < first.properties.size(); ++i)
        {
            if (first.properties[i].outcome != second.properties[i].outcome ||
                first.properties[i].message != second.properties[i].message)
            {
                fail("expected the same outcome for property " + first.properties[i].property);
            }
        }
    }

    {
        const std::string noisy = "import random\n"
                                  "\n"
                                  "def noisy(x: int) -> int:\n"
                                  "    return x + random.randint(0, 1000000)\n";
        auto config = in_process();
        config.property_violations_fatal = true;
        const auto report = run(noisy, std::string("noisy"), config);
        const auto* det = property(report, "deterministic");
        if (det == nullptr || det->outcome != codegate::proptest::PropertyOutcome::Violated)
        {
            fail("expected unseeded randomness to break determinism");
        }
        const auto* pt = report.stage(StageId::PropertyTests);
        if (report.status != OverallStatus::Failed || pt->status != StageStatus::Failed ||
            !has_code(*pt, "PT001", Severity::Error) || pt->reason != "property violated")
        {
            fail("expected a fatal property violation");
        }
    }

    {
        auto config = in_process();
        config.sandbox_timeout_seconds = 0.5;
        const auto report = run("while True:\n    pass\n", std::nullopt, config);
        const auto* sb = report.stage(StageId::Sandbox);
        if (report.status != OverallStatus::Failed || sb->status != StageStatus::Failed ||
            !has_code(*sb, "SB001", Severity::Error) || sb->reason != "timeout of 0.5 s exceeded")
        {
            fail("expected an infinite loop to fail on the sandbox timeout: " + sb->reason);
        }
        if (!has_code(*report.stage(StageId::Prevalidation), "PV005", Severity::Warning))
        {
            fail("expected the loop warning from prevalidation");
        }
        if (!has_code(*report.stage(StageId::StaticAnalysis), "CG103", Severity::Error))
        {
            fail("expected the condition analyzer to prove the loop endless");
        }
    }

    {
        // The deadline, not the sandbox timeout, stops this run.
        auto config = in_process();
        config.deadline_seconds = 0.5;
        const auto report = run("while True:\n    pass\n", std::nullopt, config);
        if (report.status != OverallStatus::Error ||
            report.stage(StageId::Sandbox)->status != StageStatus::TimedOut)
        {
            fail("expected the deadline to time the sandbox stage out");
        }
        if (report.stage(StageId::ResourceGuard)->reason != "validation deadline exceeded during sandbox")
        {
            fail("expected the resource guard to be skipped after the deadline");
        }
        if (report.elapsed_ms > 5000.0)
        {
            fail("expected the deadline to bound the run");
        }
    }

    {
        const auto report = run("raise ValueError('bad input')\n", std::nullopt, in_process());
        const auto* sb = report.stage(StageId::Sandbox);
        if (sb->status != StageStatus::Failed || sb->findings.size() != 1 ||
            sb->findings[0].message != "execution raised ValueError: bad input")
        {
            fail("expected a module-level raise to fail the sandbox stage");
        }
    }

    {
        const auto report = run("def f(x):\n    return x\n", std::string("g"), in_process());
        if (report.status != OverallStatus::Passed ||
            report.stage(StageId::PropertyTests)->reason != "no top-level function named 'g'")
        {
            fail("expected property tests to be skipped for a missing entry point");
        }
    }

    {
        auto config = in_process();
        config.resource_max_time_seconds = 0.000001;
        const auto report = run("x = sum(range(1000))\n", std::nullopt, config);
        const auto* rg = report.stage(StageId::ResourceGuard);
        if (report.status != OverallStatus::Failed || rg->status != StageStatus::Failed ||
            !has_code(*rg, "RG002", Severity::Error))
        {
            fail("expected the wall time to exceed a tiny resource limit");
        }
    }

    {
        codegate::sandbox::SandboxConfig sc;
        auto result = execute_safe("print('hello')\n", codegate::sandbox::BackendKind::Restricted, sc);
        const auto* exec = std::get_if<codegate::sandbox::ExecutionResult>(&result);
        if (exec == nullptr || !exec->ok() || exec->stdout_text != "hello\n")
        {
            fail("expected execute_safe to run the source");
        }
        sc.timeout_seconds = 0.0;
        if (!std::holds_alternative<ConfigError>(
                execute_safe("x = 1\n", codegate::sandbox::BackendKind::Restricted, sc)))
        {
            fail("expected execute_safe to reject an invalid config");
        }
    }

    std::cout << "OK\n";
    return 0;
}
