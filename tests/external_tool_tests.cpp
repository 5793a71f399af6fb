#include <codegate/analysis/external_tool.h>
#include <codegate/source/source_unit.h>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

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
    using namespace codegate::analysis;
    using codegate::diag::Severity;
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

    {
        const auto findings = parse_ruff_output(
            R"([{"code":"E501","message":"Line too long","location":{"row":3,"column":89}},)"
            R"({"code":null,"message":"SyntaxError: bad","location":{"row":1,"column":1}},)"
            R"({"code":"B006","message":"mutable default","location":{"row":7,"column":12}}])");
        if (!findings.has_value() || findings->size() != 3)
        {
            fail("expected three ruff findings");
        }
        const auto& f = *findings;
        if (f[0].code != "E501" || f[0].severity != Severity::Error || f[0].line != 3 || f[0].col != 89)
        {
            fail("unexpected E501 finding");
        }
        if (f[1].code != "syntax-error" || f[1].severity != Severity::Error)
        {
            fail("expected a null code to be a syntax error");
        }
        if (f[2].severity != Severity::Warning || f[2].origin != "ruff")
        {
            fail("expected non E/F codes to be warnings");
        }
        if (!parse_ruff_output("[]").has_value() || parse_ruff_output("{}").has_value() ||
            parse_ruff_output("[1]").has_value() || parse_ruff_output("oops").has_value())
        {
            fail("unexpected ruff output acceptance");
        }
    }

    {
        const auto findings = parse_mypy_output(
            "/tmp/x.py:3:12: error: Incompatible return value type (got \"str\", expected \"int\")  [return-value]\n"
            "/tmp/x.py:5: warning: unused 'type: ignore' comment\n"
            "/tmp/x.py:5: note: Revealed type is \"builtins.int\"\n"
            "Success: no issues found in 1 source file\n");
        if (!findings.has_value() || findings->size() != 3)
        {
            fail("expected three mypy findings");
        }
        const auto& f = *findings;
        if (f[0].code != "return-value" || f[0].severity != Severity::Error || f[0].line != 3 ||
            f[0].col != 12 ||
            f[0].message != "Incompatible return value type (got \"str\", expected \"int\")")
        {
            fail("unexpected mypy error: " + f[0].message);
        }
        if (f[1].severity != Severity::Warning || f[1].code != "mypy" || f[1].col != 0)
        {
            fail("unexpected mypy warning");
        }
        if (f[2].severity != Severity::Info)
        {
            fail("expected notes to be info");
        }
        if (!parse_mypy_output("").has_value() || !parse_mypy_output("").value().empty())
        {
            fail("empty mypy output has no findings");
        }
    }

    {
        // Long lines and out-of-range numbers are handled without throwing.
        const std::string long_message(200000, 'x');
        const auto findings = parse_mypy_output("C:\\gen.py:7:3: error: " + long_message + "  [misc]\n"
                                                "gen.py:99999999999999999999999: error: too far\n"
                                                "gen.py:2: note:   spaced   \n");
        if (!findings.has_value() || findings->size() != 2)
        {
            fail("expected the oversized line number to be skipped");
        }
        const auto& f = *findings;
        if (f[0].line != 7 || f[0].col != 3 || f[0].code != "misc" || f[0].message != long_message)
        {
            fail("unexpected long mypy finding");
        }
        if (f[1].line != 2 || f[1].severity != Severity::Info || f[1].message != "spaced" || f[1].code != "mypy")
        {
            fail("unexpected trimmed mypy note: " + f[1].message);
        }
    }

    {
        const auto findings = parse_bandit_output(
            R"({"results":[)"
            R"({"test_id":"B602","issue_severity":"HIGH","issue_confidence":"HIGH","issue_text":"shell","line_number":4,"col_offset":4},)"
            R"({"test_id":"B307","issue_severity":"HIGH","issue_confidence":"MEDIUM","issue_text":"eval","line_number":1,"col_offset":0},)"
            R"({"test_id":"B311","issue_severity":"MEDIUM","issue_confidence":"HIGH","issue_text":"random","line_number":2,"col_offset":0},)"
            R"({"test_id":"B101","issue_severity":"LOW","issue_confidence":"HIGH","issue_text":"assert","line_number":9,"col_offset":0}]})");
        if (!findings.has_value() || findings->size() != 4)
        {
            fail("expected four bandit findings");
        }
        const auto& f = *findings;
        if (f[0].severity != Severity::Critical || f[0].code != "B602" || f[0].line != 4 || f[0].col != 5)
        {
            fail("expected HIGH/HIGH to be critical with a one-based column");
        }
        if (f[1].severity != Severity::Error || f[2].severity != Severity::Warning ||
            f[3].severity != Severity::Info)
        {
            fail("unexpected bandit severity mapping");
        }
        if (f[0].notes.size() != 1 || f[0].notes.front().message != "confidence: HIGH")
        {
            fail("expected the confidence as a note");
        }
        if (parse_bandit_output("[]").has_value() || parse_bandit_output("{\"errors\":[]}").has_value())
        {
            fail("expected bandit output without results to be rejected");
        }
    }

    const std::string fake = sibling_exe(argv[0], "codegate_fake_analyzer");
    EnvVarGuard ruff_env("CODEGATE_RUFF");
    EnvVarGuard mypy_env("CODEGATE_MYPY");
    EnvVarGuard bandit_env("CODEGATE_BANDIT");
    EnvVarGuard mode_env("CODEGATE_FAKE_ANALYZER_MODE");
    ruff_env.set(fake.c_str());
    mypy_env.set(fake.c_str());
    bandit_env.set(fake.c_str());

    const codegate::source::SourceUnit unit("import os\nx = 1 \n", "gen.py");

    {
        mode_env.set("ruff");
        auto analyzer = make_analyzer("ruff");
        if (analyzer == nullptr || analyzer->name() != "ruff")
        {
            fail("expected a ruff analyzer");
        }
        const auto report = analyzer->run(unit, 10.0);
        if (report.outcome != AnalyzerOutcome::Completed || report.findings.size() != 2)
        {
            fail("expected two ruff findings: " + report.detail);
        }
        if (report.findings[0].code != "F401" || report.findings[0].severity != Severity::Error ||
            report.findings[0].line != 1 || report.findings[0].col != 8 ||
            report.findings[1].severity != Severity::Warning)
        {
            fail("unexpected ruff findings from the tool");
        }
    }

    {
        mode_env.set("mypy");
        const auto report = make_analyzer("mypy")->run(unit, 10.0);
        if (report.outcome != AnalyzerOutcome::Completed || report.findings.size() != 2 ||
            report.findings[0].code != "return-value" || report.findings[1].severity != Severity::Info)
        {
            fail("expected a mypy error and a note: " + report.detail);
        }
        if (report.findings[0].origin != "mypy")
        {
            fail("expected findings tagged with the tool name");
        }
    }

    {
        mode_env.set("bandit");
        const auto report = make_analyzer("bandit")->run(unit, 10.0);
        if (report.outcome != AnalyzerOutcome::Completed || report.findings.size() != 1 ||
            report.findings[0].severity != Severity::Critical)
        {
            fail("expected a critical bandit finding: " + report.detail);
        }
    }

    {
        // The tool sees a real copy of the source.
        mode_env.set("missing-file");
        const auto report = make_analyzer("ruff")->run(unit, 10.0);
        if (report.outcome != AnalyzerOutcome::Completed || !report.findings.empty())
        {
            fail("expected the temporary file to exist while the tool runs: " + report.detail);
        }
    }

    {
        mode_env.set("hang");
        const auto report = make_analyzer("ruff")->run(unit, 0.5);
        if (report.outcome != AnalyzerOutcome::TimedOut || report.detail != "no result after 500 ms")
        {
            fail("expected a hanging tool to time out: " + report.detail);
        }
    }

    {
        mode_env.set("crash");
        const auto report = make_analyzer("bandit")->run(unit, 10.0);
        if (report.outcome != AnalyzerOutcome::Crashed ||
            report.detail != "exit code 2: fatal: internal error")
        {
            fail("expected a crash with the first stderr line: " + report.detail);
        }
    }

    {
        mode_env.set("garbage");
        const auto report = make_analyzer("ruff")->run(unit, 10.0);
        if (report.outcome != AnalyzerOutcome::Crashed || report.detail != "unrecognized output")
        {
            fail("expected unparsable output to count as a crash");
        }
    }

    {
        // Text output without diagnostic lines is a clean mypy run.
        mode_env.set("garbage");
        const auto report = make_analyzer("mypy")->run(unit, 10.0);
        if (report.outcome != AnalyzerOutcome::Completed || !report.findings.empty())
        {
            fail("expected mypy exit 0 with no findings to complete");
        }
    }

    {
        ruff_env.set("/nonexistent/ruff");
        const auto report = make_analyzer("ruff")->run(unit, 10.0);
        if (report.outcome != AnalyzerOutcome::Unavailable || report.detail != "/nonexistent/ruff not found")
        {
            fail("expected a missing tool to be unavailable: " + report.detail);
        }
    }

    {
        auto conditions = make_analyzer("conditions");
        if (conditions == nullptr || conditions->name() != "conditions" ||
            make_analyzer("pylint") != nullptr)
        {
            fail("unexpected analyzer registry");
        }
        const ToolSpec spec = bandit_tool();
        if (spec.args.back() != "{file}" || spec.program != fake)
        {
            fail("expected the tool location from the environment");
        }
    }

    std::cout << "OK\n";
    return 0;
}
