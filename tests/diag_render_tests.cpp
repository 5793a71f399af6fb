#include <codegate/diag/finding.h>
#include <codegate/diag/render.h>
#include <codegate/source/source_unit.h>
#include <cstdlib>
#include <iostream>
#include <string>

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static void expect_contains(const std::string& got, const std::string& needle, const char* what)
{
    if (got.find(needle) == std::string::npos)
    {
        std::cerr << "FAIL: " << what << ": expected output to contain: '" << needle << "'\n";
        std::cerr << "Got:\n" << got << "\n";
        std::exit(1);
    }
}

int main()
{
    using namespace codegate::diag;

    const codegate::source::SourceUnit unit("abc\n"   // line 1
                                            "defg\n"  // line 2
                                            "hi\n",   // line 3
                                            "gen.py");

    // No location: header line plus notes.
    {
        Finding f;
        f.severity = Severity::Warning;
        f.code = "SA001";
        f.message = "analyzer timed out";
        f.origin = "static";
        f.notes.push_back(Related{.message = "note 1", .span = std::nullopt});

        const std::string out = render(f, unit);
        expect_contains(out, "gen.py: warning[SA001]: analyzer timed out (static)",
                        "no-span header");
        expect_contains(out, "note: note 1", "no-span note");
        if (out.find("  |") != std::string::npos)
        {
            fail("expected no excerpt without a location");
        }
    }

    // Span within a line.
    {
        Finding f;
        f.severity = Severity::Critical;
        f.code = "PV002";
        f.message = "bad";
        f.span = codegate::source::Span{.start = 5, .end = 7}; // "ef" in line 2

        const std::string out = render(f, unit);
        expect_contains(out, "gen.py:2:2: critical[PV002]: bad", "span header");
        expect_contains(out, "  | defg\n", "source line");
        expect_contains(out, "  |  ^^\n", "caret under span");
    }

    // Zero-length span renders one caret.
    {
        Finding f;
        f.message = "point";
        f.span = codegate::source::Span{.start = 3, .end = 3};

        const std::string out = render(f, unit);
        expect_contains(out, "gen.py:1:4: error: point", "zero-length header");
        expect_contains(out, "  |    ^\n", "zero-length caret");
    }

    // Multi-line span highlights the rest of the first line only.
    {
        Finding f;
        f.message = "cross";
        f.span = codegate::source::Span{.start = 2, .end = 100};

        const std::string out = render(f, unit);
        expect_contains(out, "gen.py:1:3: error: cross", "multiline header");
        expect_contains(out, "  |   ^\n", "multiline caret");
    }

    // Line and column without a span (external tools).
    {
        Finding f;
        f.code = "F401";
        f.message = "unused import";
        f.origin = "ruff";
        f.line = 3;
        f.col = 2;

        const std::string out = render(f, unit);
        expect_contains(out, "gen.py:3:2: error[F401]: unused import (ruff)", "line/col header");
        expect_contains(out, "  | hi\n", "line/col excerpt");
    }

    // locate fills line and column from the span.
    {
        Finding f;
        f.span = codegate::source::Span{.start = 9, .end = 10};
        locate(f, unit);
        if (f.line != 3 || f.col != 1)
        {
            fail("expected locate to map offset 9 to 3:1");
        }
        Finding g;
        g.line = 7;
        locate(g, unit);
        if (g.line != 7)
        {
            fail("expected locate to leave span-less findings alone");
        }
    }

    // Severity helpers.
    {
        if (!at_least(Severity::Critical, Severity::Error) ||
            at_least(Severity::Warning, Severity::Error))
        {
            fail("unexpected at_least ordering");
        }
        std::vector<Finding> findings(2);
        findings[0].severity = Severity::Info;
        findings[1].severity = Severity::Warning;
        if (max_severity(findings) != Severity::Warning || max_severity({}).has_value())
        {
            fail("unexpected max_severity");
        }
        if (any_at_least(findings, Severity::Error) || !any_at_least(findings, Severity::Warning))
        {
            fail("unexpected any_at_least");
        }
        if (severity_from_string("critical") != Severity::Critical ||
            severity_from_string("fatal").has_value())
        {
            fail("unexpected severity_from_string");
        }
    }

    std::cout << "OK\n";
    return 0;
}
