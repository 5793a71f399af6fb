#include <codegate/report/report.h>
#include <codegate/support/json.h>
#include <codegate/validator/validator.h>
#include <cstdlib>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

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

using codegate::support::Json;
using codegate::support::json_get;
using codegate::support::json_get_number;
using codegate::support::json_get_string;
using namespace codegate::validator;

int main()
{
    {
        ValidatorConfig config;
        config.enable_static_analysis = false;
        config.enable_sandbox = false;
        const auto report = std::get<ValidationReport>(validate("import os\n", std::nullopt, config));
        const std::string text = codegate::report::to_json(report);
        if (text.rfind("{\n  \"elapsed_ms\": ", 0) != 0 || text.back() != '\n')
        {
            fail("expected an indented document with sorted keys:\n" + text);
        }
        const auto doc = codegate::support::parse_json(text);
        if (!doc.has_value() || doc->as_object() == nullptr)
        {
            fail("expected the report to parse back");
        }
        const auto& root = *doc->as_object();
        const std::vector<std::string> keys{"elapsed_ms", "entry_point", "source", "stages", "status"};
        std::vector<std::string> got;
        for (const auto& [key, value] : root)
        {
            got.push_back(key);
        }
        if (got != keys)
        {
            fail("unexpected top-level keys");
        }
        if (json_get_string(root, "status") != "failed" || !json_get(root, "entry_point")->is_null())
        {
            fail("expected a failed status without an entry point");
        }
        const auto& source = *json_get(root, "source")->as_object();
        if (json_get_string(source, "name") != "<generated>" || json_get_number(source, "length") != 10.0 ||
            json_get_number(source, "lines") != 1.0)
        {
            fail("unexpected source summary");
        }

        const auto& stages = *json_get(root, "stages")->as_array();
        const std::vector<std::string> names{"prevalidation", "static_analysis", "sandbox", "property_tests",
                                             "resource_guard"};
        if (stages.size() != names.size())
        {
            fail("expected one entry per stage");
        }
        for (std::size_t i = 0; i < names.size(); ++i)
        {
            if (json_get_string(*stages[i].as_object(), "stage") != names[i])
            {
                fail("expected stages in pipeline order");
            }
        }
        const auto& pre = *stages[0].as_object();
        if (json_get_string(pre, "status") != "failed" ||
            json_get_string(pre, "reason") != "finding at or above error")
        {
            fail("unexpected prevalidation entry");
        }
        const auto& findings = *json_get(pre, "findings")->as_array();
        if (findings.empty())
        {
            fail("expected prevalidation findings");
        }
        const auto& f = *findings[0].as_object();
        if (json_get_string(f, "code") != "PV001" || json_get_string(f, "severity") != "error" ||
            json_get_number(f, "line") != 1.0 || json_get_number(f, "col") != 8.0 ||
            json_get_string(f, "origin") != "prevalidator" || json_get(f, "span") == nullptr)
        {
            fail("unexpected finding entry");
        }
        const auto& skipped = *stages[1].as_object();
        if (json_get_string(skipped, "status") != "skipped" ||
            json_get_string(skipped, "reason") != "stopped after prevalidation failed" ||
            !json_get(skipped, "details")->is_object())
        {
            fail("unexpected skipped stage entry");
        }
    }

    {
        ValidationReport report;
        report.status = OverallStatus::Failed;
        report.elapsed_ms = 3.0;
        report.source = SourceInfo{.name = "gen.py", .length = 18, .line_count = 2};
        report.entry_point = "f";
        for (StageId id : kStageOrder)
        {
            StageResult s;
            s.stage = id;
            s.status = StageStatus::Skipped;
            s.reason = "not reached";
            report.stages.push_back(s);
        }
        report.stages[0].status = StageStatus::Passed;
        report.stages[0].reason.clear();
        report.stages[0].elapsed_ms = 1.5;
        report.stages[3].status = StageStatus::Failed;
        report.stages[3].reason = "property violated";
        codegate::diag::Finding f;
        f.severity = codegate::diag::Severity::Error;
        f.code = "PT001";
        f.message = "property 'deterministic' violated";
        f.origin = "property_tests";
        f.notes.push_back({.message = "also falsified by f(2)", .span = std::nullopt});
        report.stages[3].findings.push_back(f);
        codegate::proptest::PropertyCheckResult p;
        p.property = "deterministic";
        p.outcome = codegate::proptest::PropertyOutcome::Violated;
        p.message = "falsified by f(1)";
        report.properties.push_back(p);

        const codegate::source::SourceUnit unit{"def f(x):\n    ...\n", "gen.py"};
        const std::string text = codegate::report::to_text(report, unit);
        expect_contains(text, "gen.py: failed (3.0 ms)\n", "summary line");
        expect_contains(text, "  prevalidation   passed    1.5 ms\n", "passed stage line");
        expect_contains(text, "  sandbox         skipped     not reached\n", "skipped stage line");
        expect_contains(text, "gen.py: error[PT001]: property 'deterministic' violated", "finding");
        expect_contains(text, "property deterministic: violated (falsified by f(1))\n", "property line");

        const auto doc = codegate::support::parse_json(codegate::report::to_json(report));
        const auto& root = *doc->as_object();
        if (json_get_string(root, "entry_point") != "f")
        {
            fail("expected the entry point");
        }
        const auto& pt = *(*json_get(root, "stages")->as_array())[3].as_object();
        const auto& notes = *json_get(*(*json_get(pt, "findings")->as_array())[0].as_object(), "notes")->as_array();
        if (notes.size() != 1 || *notes[0].as_string() != "also falsified by f(2)")
        {
            fail("expected finding notes");
        }
        if (!json_get(*(*json_get(root, "stages")->as_array())[0].as_object(), "reason")->is_null())
        {
            fail("expected an empty reason to be null");
        }
    }

    {
        codegate::sandbox::ExecutionResult result;
        result.state = codegate::sandbox::SandboxState::Completed;
        result.exit = codegate::sandbox::ExitClass::RuntimeError;
        result.stdout_text = "line\n";
        result.exception = codegate::sandbox::ExceptionSummary{"KeyError", "'k'"};
        result.wall_ms = 12.5;
        result.peak_memory_bytes = 4096;
        const auto doc = codegate::support::parse_json(codegate::report::to_json(result));
        if (!doc.has_value())
        {
            fail("expected the execution result to parse back");
        }
        const auto& root = *doc->as_object();
        if (json_get_string(root, "state") != "completed" || json_get_string(root, "exit") != "runtime_error" ||
            json_get_string(root, "stdout") != "line\n" || json_get_number(root, "wall_ms") != 12.5 ||
            json_get_number(root, "peak_memory_bytes") != 4096.0)
        {
            fail("unexpected execution fields");
        }
        if (!json_get(root, "return_value")->is_null() || !json_get(root, "backend_error")->is_null())
        {
            fail("expected nulls for missing values");
        }
        const auto& exc = *json_get(root, "exception")->as_object();
        if (json_get_string(exc, "type") != "KeyError" || json_get_string(exc, "message") != "'k'")
        {
            fail("unexpected exception entry");
        }

        result.exception.reset();
        result.exit = codegate::sandbox::ExitClass::Ok;
        result.return_value = codegate::runtime::Value::list(
            {codegate::runtime::Value::integer(1), codegate::runtime::Value::str("a")});
        const auto ok = codegate::support::parse_json(codegate::report::to_json(result));
        if (json_get_string(*ok->as_object(), "return_value") != "[1, 'a']")
        {
            fail("expected the return value as its repr");
        }
    }

    std::cout << "OK\n";
    return 0;
}
