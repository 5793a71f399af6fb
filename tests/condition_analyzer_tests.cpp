#include <codegate/analysis/condition_analyzer.h>
#include <codegate/source/source_unit.h>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static codegate::analysis::AnalyzerReport analyze(const std::string& src, double timeout = 10.0)
{
    codegate::analysis::ConditionAnalyzer analyzer;
    const codegate::source::SourceUnit unit(src, "gen.py");
    return analyzer.run(unit, timeout);
}

static const codegate::diag::Finding& only_finding(const codegate::analysis::AnalyzerReport& report,
                                                   const std::string& code)
{
    if (report.outcome != codegate::analysis::AnalyzerOutcome::Completed)
    {
        fail("expected the condition checks to complete: " + report.detail);
    }
    if (report.findings.size() != 1)
    {
        fail("expected exactly one finding for " + code + ", got " +
             std::to_string(report.findings.size()));
    }
    if (report.findings.front().code != code)
    {
        fail("expected " + code + ", got " + report.findings.front().code);
    }
    return report.findings.front();
}

static void expect_clean(const std::string& src)
{
    const auto report = analyze(src);
    if (!report.findings.empty())
    {
        fail("expected no findings for:\n" + src + "got " + report.findings.front().code + ": " +
             report.findings.front().message);
    }
}

int main()
{
    using codegate::diag::Severity;

    {
        const auto report = analyze("def f(x: int):\n"
                                    "    if x > 0 and x < 1:\n"
                                    "        return 1\n"
                                    "    return 0\n");
        const auto& f = only_finding(report, "CG101");
        if (f.severity != Severity::Warning || f.line != 2 || f.origin != "conditions" ||
            f.message != "condition is always false; this branch never runs")
        {
            fail("unexpected CG101 finding");
        }
        if (report.analyzer != "conditions")
        {
            fail("expected the report to name the analyzer");
        }
    }

    // Without an annotation the parameter is a real, and the range is not empty.
    expect_clean("def f(x):\n"
                 "    if x > 0 and x < 1:\n"
                 "        return 1\n"
                 "    return 0\n");

    {
        const auto report = analyze("def g(x):\n"
                                    "    if x > 5:\n"
                                    "        return 1\n"
                                    "    elif x > 10:\n"
                                    "        return 2\n"
                                    "    return 3\n");
        const auto& f = only_finding(report, "CG101");
        if (f.line != 4 || f.message.find("earlier conditions") == std::string::npos)
        {
            fail("expected the elif to be dead under the earlier test");
        }
    }

    {
        const auto report = analyze("def g(n: int):\n"
                                    "    if n > 0 or n <= 0:\n"
                                    "        return 1\n"
                                    "    else:\n"
                                    "        return 2\n");
        const auto& f = only_finding(report, "CG102");
        if (f.severity != Severity::Warning || f.line != 2)
        {
            fail("unexpected CG102 finding");
        }
    }

    {
        const auto report = analyze("def spin():\n"
                                    "    n = 0\n"
                                    "    while 1 == 1:\n"
                                    "        n += 1\n");
        const auto& f = only_finding(report, "CG103");
        if (f.severity != Severity::Error || f.line != 3)
        {
            fail("unexpected CG103 finding");
        }
    }

    {
        // A break inside a nested loop does not leave the outer one.
        const auto report = analyze("while True:\n"
                                    "    for i in range(3):\n"
                                    "        break\n");
        (void)only_finding(report, "CG103");
    }

    expect_clean("while True:\n    line = next_line()\n    if not line:\n        break\n");
    expect_clean("def gen():\n    while True:\n        yield 1\n");
    expect_clean("def serve():\n    while True:\n        try:\n            step()\n"
                 "        except ValueError:\n            return\n");
    expect_clean("while True:\n    raise SystemExit\n");

    {
        const auto report = analyze("while False:\n    pass\n");
        const auto& f = only_finding(report, "CG101");
        if (f.message != "loop condition is always false; the body never runs")
        {
            fail("expected a dead loop body");
        }
    }

    {
        const auto report = analyze("def k(x: int):\n    assert x > 0 and x < 0\n");
        const auto& f = only_finding(report, "CG104");
        if (f.severity != Severity::Error || f.line != 2)
        {
            fail("unexpected CG104 finding");
        }
    }

    // `assert False` is an intentional marker.
    expect_clean("def todo():\n    assert False\n");

    {
        const auto report = analyze("for i in range(10):\n"
                                    "    if i > 2 and i < 3:\n"
                                    "        print(i)\n");
        (void)only_finding(report, "CG101");
    }

    {
        const auto report = analyze("count: int = 0\n"
                                    "if count > 0 and count < 1:\n"
                                    "    pass\n");
        (void)only_finding(report, "CG101");
    }

    // Unsupported conditions are skipped.
    expect_clean("if f(x) and not f(x):\n    pass\n");
    expect_clean("if name == 'a' and name == 'b':\n    pass\n");
    expect_clean("if x in xs:\n    pass\n");

    {
        // Findings inside nested functions are reported too.
        const auto report = analyze("class A:\n"
                                    "    def m(self, v: float):\n"
                                    "        if v < 0 and v > 0:\n"
                                    "            return None\n");
        (void)only_finding(report, "CG101");
    }

    {
        const auto report = analyze("def broken(:\n    pass\n");
        if (report.outcome != codegate::analysis::AnalyzerOutcome::Completed ||
            !report.findings.empty() || report.detail != "source does not parse")
        {
            fail("expected unparsable source to be skipped");
        }
    }

    {
        const auto report = analyze("if x > 0:\n    pass\n", 0.0);
        if (report.outcome != codegate::analysis::AnalyzerOutcome::TimedOut)
        {
            fail("expected a zero solver timeout to time out");
        }
    }

    std::cout << "OK\n";
    return 0;
}
