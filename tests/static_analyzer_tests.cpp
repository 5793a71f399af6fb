#include <chrono>
#include <codegate/analysis/static_analyzer.h>
#include <codegate/source/source_unit.h>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

using namespace codegate::analysis;
using codegate::diag::Finding;
using codegate::diag::Severity;

class ScriptedAnalyzer final : public Analyzer
{
  public:
    ScriptedAnalyzer(std::string name, AnalyzerOutcome outcome, std::vector<Finding> findings,
                     std::chrono::milliseconds delay = std::chrono::milliseconds(0),
                     std::string detail = {})
        : name_(std::move(name)), outcome_(outcome), findings_(std::move(findings)), delay_(delay),
          detail_(std::move(detail))
    {
    }

    std::string name() const override { return name_; }

    AnalyzerReport run(const codegate::source::SourceUnit& source, double timeout_seconds) override
    {
        if (source.text().empty() || timeout_seconds <= 0.0)
        {
            fail("expected the source and a positive timeout");
        }
        std::this_thread::sleep_for(delay_);
        AnalyzerReport report;
        report.outcome = outcome_;
        report.findings = findings_;
        report.detail = detail_;
        return report;
    }

  private:
    std::string name_;
    AnalyzerOutcome outcome_;
    std::vector<Finding> findings_;
    std::chrono::milliseconds delay_;
    std::string detail_;
};

static Finding finding(Severity severity, std::string code)
{
    Finding f;
    f.severity = severity;
    f.code = std::move(code);
    f.message = "m";
    return f;
}

int main()
{
    const codegate::source::SourceUnit unit("x = 1\n", "gen.py");

    {
        StaticAnalyzer stage;
        stage.add(std::make_unique<ScriptedAnalyzer>(
            "slow", AnalyzerOutcome::Completed,
            std::vector<Finding>{finding(Severity::Warning, "W1")}, std::chrono::milliseconds(150)));
        stage.add(std::make_unique<ScriptedAnalyzer>(
            "fast", AnalyzerOutcome::Completed,
            std::vector<Finding>{finding(Severity::Error, "E1"), finding(Severity::Info, "I1")}));
        stage.add(nullptr);
        if (stage.size() != 2 || stage.names() != std::vector<std::string>{"slow", "fast"})
        {
            fail("expected two registered analyzers");
        }

        const auto result = stage.analyze(unit, StaticAnalyzerConfig{});
        if (!result.passed)
        {
            fail("errors stay below the default critical threshold");
        }
        if (result.reports.size() != 2 || result.reports[0].analyzer != "slow" ||
            result.reports[1].analyzer != "fast")
        {
            fail("expected reports in registration order");
        }
        if (result.findings.size() != 3 || result.findings[0].code != "W1" ||
            result.findings[1].code != "E1" || result.findings[2].code != "I1")
        {
            fail("expected findings in registration order");
        }
    }

    {
        // The analyzers run concurrently.
        StaticAnalyzer stage;
        for (int i = 0; i < 3; ++i)
        {
            stage.add(std::make_unique<ScriptedAnalyzer>("a" + std::to_string(i),
                                                         AnalyzerOutcome::Completed,
                                                         std::vector<Finding>{},
                                                         std::chrono::milliseconds(300)));
        }
        const auto result = stage.analyze(unit, StaticAnalyzerConfig{});
        if (result.elapsed_ms > 800.0)
        {
            fail("expected the analyzers to overlap");
        }
    }

    {
        StaticAnalyzer stage;
        stage.add(std::make_unique<ScriptedAnalyzer>(
            "bandit", AnalyzerOutcome::Completed,
            std::vector<Finding>{finding(Severity::Critical, "B602")}));
        if (stage.analyze(unit, StaticAnalyzerConfig{}).passed)
        {
            fail("expected a critical finding to fail the stage");
        }
        StaticAnalyzerConfig strict;
        strict.fatal_threshold = Severity::Warning;
        StaticAnalyzer warn_stage;
        warn_stage.add(std::make_unique<ScriptedAnalyzer>(
            "ruff", AnalyzerOutcome::Completed,
            std::vector<Finding>{finding(Severity::Warning, "W291")}));
        if (warn_stage.analyze(unit, strict).passed)
        {
            fail("expected the threshold to be configurable");
        }
    }

    {
        StaticAnalyzer stage;
        stage.add(std::make_unique<ScriptedAnalyzer>("mypy", AnalyzerOutcome::Unavailable,
                                                     std::vector<Finding>{},
                                                     std::chrono::milliseconds(0), "mypy not found"));
        stage.add(std::make_unique<ScriptedAnalyzer>("ruff", AnalyzerOutcome::TimedOut,
                                                     std::vector<Finding>{}));
        const auto result = stage.analyze(unit, StaticAnalyzerConfig{});
        if (!result.passed || result.findings.size() != 2)
        {
            fail("expected tool problems to be warnings only");
        }
        if (result.findings[0].code != "SA002" || result.findings[0].severity != Severity::Warning ||
            result.findings[0].message != "analyzer failed: mypy (mypy not found)")
        {
            fail("unexpected SA002: " + result.findings[0].message);
        }
        if (result.findings[1].code != "SA001" ||
            result.findings[1].message != "analyzer timed out: ruff")
        {
            fail("unexpected SA001: " + result.findings[1].message);
        }
    }

    {
        // An analyzer ignoring its timeout is abandoned after the grace period.
        StaticAnalyzer stage;
        stage.add(std::make_unique<ScriptedAnalyzer>("stuck", AnalyzerOutcome::Completed,
                                                     std::vector<Finding>{finding(Severity::Critical, "X")},
                                                     std::chrono::milliseconds(3000)));
        stage.add(std::make_unique<ScriptedAnalyzer>("ok", AnalyzerOutcome::Completed,
                                                     std::vector<Finding>{}));
        StaticAnalyzerConfig config;
        config.analyzer_timeout_seconds = 0.2;
        config.grace_seconds = 0.2;
        const auto start = std::chrono::steady_clock::now();
        const auto result = stage.analyze(unit, config);
        const double waited =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        if (waited > 2.0)
        {
            fail("expected the stage to stop waiting for a stuck analyzer");
        }
        if (result.reports.size() != 2 || result.reports[0].outcome != AnalyzerOutcome::TimedOut ||
            result.reports[1].outcome != AnalyzerOutcome::Completed)
        {
            fail("expected the stuck analyzer to be reported as timed out");
        }
        if (!result.passed || result.findings.size() != 1 || result.findings[0].code != "SA001")
        {
            fail("expected only an SA001 warning for the stuck analyzer");
        }
    }

    std::cout << "OK\n";
    return 0;
}
