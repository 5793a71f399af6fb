#include <codegate/analysis/analyzer.h>
#include <codegate/support/json.h>
#include <codegate/validator/validator.h>
#include <cstdlib>
#include <iostream>
#include <memory>
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

/** Reports one finding of a fixed severity. */
class FixedAnalyzer final : public codegate::analysis::Analyzer
{
  public:
    explicit FixedAnalyzer(Severity severity) : severity_(severity) {}

    std::string name() const override { return "fixed"; }

    codegate::analysis::AnalyzerReport run(const codegate::source::SourceUnit&, double) override
    {
        codegate::diag::Finding f;
        f.severity = severity_;
        f.code = "FX001";
        f.message = "fixed finding";
        f.line = 1;
        f.col = 1;
        codegate::analysis::AnalyzerReport report;
        report.findings.push_back(f);
        return report;
    }

  private:
    Severity severity_;
};

ValidatorConfig offline()
{
    ValidatorConfig config;
    config.use_ruff = false;
    config.use_mypy = false;
    config.use_bandit = false;
    config.enable_condition_analyzer = false;
    config.enable_sandbox = false;
    return config;
}

std::string check_message(const ValidatorConfig& config)
{
    const auto error = config.check();
    return error.has_value() ? error->message : "";
}

} // namespace

int main()
{
    {
        if (!check_message(ValidatorConfig{}).empty())
        {
            fail("expected the default configuration to be valid");
        }
        ValidatorConfig c;
        c.deadline_seconds = 0.0;
        if (check_message(c) != "deadline must be positive")
        {
            fail("expected a zero deadline to be rejected");
        }
        c = ValidatorConfig{};
        c.max_lines = 0;
        if (check_message(c) != "size ceilings must be positive")
        {
            fail("expected a zero line ceiling to be rejected");
        }
        c = ValidatorConfig{};
        c.sandbox_timeout_seconds = -1.0;
        if (check_message(c) != "sandbox timeout must be positive")
        {
            fail("expected a negative sandbox timeout to be rejected");
        }
        c = ValidatorConfig{};
        c.sandbox_max_memory_mb = 0;
        if (check_message(c) != "sandbox memory ceiling must be positive")
        {
            fail("expected a zero memory ceiling to be rejected");
        }
        c = ValidatorConfig{};
        c.property_test_trial_count = 0;
        if (check_message(c) != "property trial count must be positive")
        {
            fail("expected zero trials to be rejected");
        }
        c = ValidatorConfig{};
        c.properties.push_back(codegate::proptest::Property{"unnamed", nullptr});
        if (check_message(c) != "property needs a name and a predicate")
        {
            fail("expected a property without a predicate to be rejected");
        }
        c = ValidatorConfig{};
        c.extra_analyzers.push_back(nullptr);
        if (check_message(c) != "empty analyzer factory")
        {
            fail("expected an empty analyzer factory to be rejected");
        }
        c = ValidatorConfig{};
        c.resource_max_time_seconds = 0.0;
        if (check_message(c) != "resource limits must be positive")
        {
            fail("expected a zero resource limit to be rejected");
        }

        auto created = Validator::create(c);
        if (!std::holds_alternative<ConfigError>(created))
        {
            fail("expected create() to refuse an invalid configuration");
        }
        auto result = validate("x = 1\n", std::nullopt, c);
        if (!std::holds_alternative<ConfigError>(result))
        {
            fail("expected validate() to refuse an invalid configuration");
        }
        if (is_safe("x = 1\n", c))
        {
            fail("expected is_safe to be false for an invalid configuration");
        }
    }

    {
        ValidatorConfig c;
        if (c.registry() != codegate::policy::default_registry())
        {
            fail("expected the shared default registry without overrides");
        }
        c.extra_forbidden_modules = {"numpy"};
        c.extra_forbidden_callables = {"print"};
        c.replace_forbidden_attributes = std::vector<std::string>{"__secret__"};
        const auto registry = c.registry();
        if (!registry->is_forbidden_module("numpy.linalg") || !registry->is_forbidden_module("os"))
        {
            fail("expected extra modules on top of the defaults");
        }
        if (!registry->is_forbidden_callable("print") || !registry->is_forbidden_callable("eval"))
        {
            fail("expected extra callables on top of the defaults");
        }
        if (!registry->is_forbidden_attribute("__secret__") || registry->is_forbidden_attribute("__globals__"))
        {
            fail("expected the attribute set to be replaced");
        }
        if (!codegate::policy::default_registry()->is_forbidden_attribute("__globals__"))
        {
            fail("overrides must not touch the default registry");
        }

        auto config = offline();
        config.extra_forbidden_modules = {"numpy"};
        if (is_safe("import numpy\n", config) || !is_safe("import json\n", config))
        {
            fail("expected the extended denylist to be applied");
        }
        config = offline();
        config.replace_forbidden_modules = std::vector<std::string>{};
        if (!is_safe("import socket\n", config))
        {
            fail("expected an emptied module denylist to allow socket");
        }
    }

    {
        if (!is_safe("def add(a, b):\n    return a + b\n") || is_safe("import os\n") ||
            is_safe("eval('1 + 1')\n") || is_safe("def f(:\n"))
        {
            fail("unexpected is_safe results");
        }
        // Warnings alone are safe.
        if (!is_safe("while True:\n    pass\n"))
        {
            fail("expected a warning-only source to be safe");
        }
    }

    {
        auto config = offline();
        config.extra_analyzers.push_back([] { return std::make_unique<FixedAnalyzer>(Severity::Error); });
        auto created = Validator::create(config);
        const auto& validator = std::get<Validator>(created);
        const auto report = validator.validate(codegate::source::SourceUnit{"x = 1\n", "snippet.py"});
        if (report.status != OverallStatus::Passed || report.source.name != "snippet.py" ||
            report.source.line_count != 1 || report.source.length != 6)
        {
            fail("expected an Error finding below the Critical threshold to pass");
        }
        const auto* st = report.stage(StageId::StaticAnalysis);
        if (st == nullptr || st->status != StageStatus::Passed || st->findings.size() != 1 ||
            st->findings[0].code != "FX001")
        {
            fail("expected the extra analyzer's finding in the static stage");
        }
        const auto* analyzers = codegate::support::json_get(*st->details.as_object(), "analyzers");
        if (analyzers == nullptr || analyzers->as_array() == nullptr || analyzers->as_array()->size() != 1)
        {
            fail("expected one analyzer in the stage details");
        }

        config.static_fatal_threshold = Severity::Error;
        const auto strict = std::get<Validator>(Validator::create(config)).validate(codegate::source::SourceUnit{"x = 1\n"});
        if (strict.status != OverallStatus::Failed ||
            strict.stage(StageId::StaticAnalysis)->reason != "finding at or above error")
        {
            fail("expected a lowered threshold to fail the stage");
        }
        if (strict.stage(StageId::Sandbox)->status != StageStatus::Skipped ||
            strict.stage(StageId::Sandbox)->reason != "stopped after static_analysis failed")
        {
            fail("expected later stages to be skipped after a failure");
        }

        config.extra_analyzers.clear();
        const auto none = std::get<Validator>(Validator::create(config)).validate(codegate::source::SourceUnit{"x = 1\n"});
        if (none.stage(StageId::StaticAnalysis)->reason != "no analyzers enabled")
        {
            fail("expected the static stage to be skipped without analyzers");
        }
    }

    {
        auto config = offline();
        config.enable_static_analysis = false;
        const auto report = std::get<ValidationReport>(validate("x = 1\n", std::string("f"), config));
        if (report.stages.size() != 5)
        {
            fail("expected one result per stage");
        }
        for (std::size_t i = 0; i < report.stages.size(); ++i)
        {
            if (report.stages[i].stage != kStageOrder[i])
            {
                fail("expected stages in pipeline order");
            }
        }
        const std::vector<std::string> reasons{"", "static analysis disabled", "sandbox execution disabled",
                                               "sandbox run did not complete", "sandbox stage did not run"};
        for (std::size_t i = 0; i < reasons.size(); ++i)
        {
            if (report.stages[i].reason != reasons[i])
            {
                fail("unexpected reason for " + std::string(to_string(report.stages[i].stage)) + ": " +
                     report.stages[i].reason);
            }
        }
        if (report.status != OverallStatus::Passed || report.entry_point != std::optional<std::string>("f"))
        {
            fail("expected a passing report that records the entry point");
        }
    }

    {
        if (to_string(StageId::StaticAnalysis) != "static_analysis" || to_string(StageStatus::TimedOut) != "timed_out" ||
            to_string(OverallStatus::Error) != "error")
        {
            fail("unexpected status names");
        }
    }

    std::cout << "OK\n";
    return 0;
}
