#include <algorithm>
#include <charconv>
#include <cmath>
#include <codegate/analysis/condition_analyzer.h>
#include <codegate/analysis/external_tool.h>
#include <codegate/support/json.h>
#include <cstdlib>
#include <iostream>
#include <string>

namespace codegate::analysis
{
namespace
{

using codegate::diag::Finding;
using codegate::diag::Severity;
using codegate::support::Json;

constexpr std::size_t kMaxToolOutputBytes = 8 * 1024 * 1024;

std::string tool_program(const char* env_name, const char* fallback)
{
    const char* v = std::getenv(env_name);
    if (v != nullptr && *v != '\0')
    {
        return v;
    }
    return fallback;
}

std::size_t to_position(std::optional<double> n, std::size_t offset = 0)
{
    if (!n.has_value() || !std::isfinite(*n) || *n < 0)
    {
        return 0;
    }
    return static_cast<std::size_t>(*n) + offset;
}

std::string first_line(std::string_view text)
{
    const auto nl = text.find('\n');
    return std::string(text.substr(0, std::min<std::size_t>(nl, 200)));
}

bool is_space(char c)
{
    return c == ' ' || c == '\t' || c == '\r';
}

std::string_view trim(std::string_view s)
{
    while (!s.empty() && is_space(s.front()))
    {
        s.remove_prefix(1);
    }
    while (!s.empty() && is_space(s.back()))
    {
        s.remove_suffix(1);
    }
    return s;
}

// Reads `<digits>:` at the front of `s`, advancing past the colon.
std::optional<std::size_t> take_number(std::string_view& s)
{
    std::size_t value = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr == s.data() + s.size() || *ptr != ':')
    {
        return std::nullopt;
    }
    s.remove_prefix(static_cast<std::size_t>(ptr - s.data()) + 1);
    return value;
}

bool is_code_char(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' ||
           c == '-';
}

// `path:line[:col]: error|warning|note: message  [code]`. The path ends at the
// first `:<digits>:` that is followed by a known severity.
std::optional<Finding> parse_mypy_line(std::string_view line)
{
    for (std::size_t colon = line.find(':'); colon != std::string_view::npos;
         colon = line.find(':', colon + 1))
    {
        std::string_view rest = line.substr(colon + 1);
        const auto row = take_number(rest);
        if (!row.has_value())
        {
            continue;
        }
        std::string_view after_col = rest;
        const auto col = take_number(after_col);
        if (col.has_value())
        {
            rest = after_col;
        }
        rest = trim(rest);
        Severity severity = Severity::Info;
        std::size_t kind_len = 0;
        if (rest.starts_with("error:"))
        {
            severity = Severity::Error;
            kind_len = 5;
        }
        else if (rest.starts_with("warning:"))
        {
            severity = Severity::Warning;
            kind_len = 7;
        }
        else if (rest.starts_with("note:"))
        {
            kind_len = 4;
        }
        else
        {
            continue;
        }
        std::string_view message = trim(rest.substr(kind_len + 1));

        Finding f;
        f.line = *row;
        f.col = col.value_or(0);
        f.severity = severity;
        f.code = "mypy";
        if (message.ends_with(']'))
        {
            const auto open = message.rfind('[');
            const auto code = open == std::string_view::npos
                                  ? std::string_view{}
                                  : message.substr(open + 1, message.size() - open - 2);
            if (open != std::string_view::npos && open > 0 && is_space(message[open - 1]) &&
                !code.empty() && std::all_of(code.begin(), code.end(), is_code_char))
            {
                f.code = std::string(code);
                message = trim(message.substr(0, open));
            }
        }
        f.message = std::string(message);
        f.origin = "mypy";
        return f;
    }
    return std::nullopt;
}

} // namespace

std::optional<Findings> parse_ruff_output(std::string_view json)
{
    const auto parsed = codegate::support::parse_json(json);
    const auto* items = parsed.has_value() ? parsed->as_array() : nullptr;
    if (items == nullptr)
    {
        return std::nullopt;
    }
    Findings out;
    for (const auto& item : *items)
    {
        const auto* obj = item.as_object();
        if (obj == nullptr)
        {
            return std::nullopt;
        }
        Finding f;
        // Syntax errors carry a null code.
        f.code = codegate::support::json_get_string(*obj, "code").value_or("syntax-error");
        f.message = codegate::support::json_get_string(*obj, "message").value_or("");
        f.severity = f.code.starts_with('E') || f.code.starts_with('F') ||
                             f.code == "syntax-error"
                         ? Severity::Error
                         : Severity::Warning;
        if (const Json* loc = codegate::support::json_get(*obj, "location");
            loc != nullptr && loc->is_object())
        {
            f.line = to_position(codegate::support::json_get_number(*loc->as_object(), "row"));
            f.col = to_position(codegate::support::json_get_number(*loc->as_object(), "column"));
        }
        f.origin = "ruff";
        out.push_back(std::move(f));
    }
    return out;
}

std::optional<Findings> parse_mypy_output(std::string_view text)
{
    Findings out;
    while (!text.empty())
    {
        const auto nl = text.find('\n');
        const std::string_view line = text.substr(0, nl);
        text = nl == std::string_view::npos ? std::string_view{} : text.substr(nl + 1);
        if (auto f = parse_mypy_line(line); f.has_value())
        {
            out.push_back(std::move(*f));
        }
    }
    return out;
}

std::optional<Findings> parse_bandit_output(std::string_view json)
{
    const auto parsed = codegate::support::parse_json(json);
    const auto* root = parsed.has_value() ? parsed->as_object() : nullptr;
    if (root == nullptr)
    {
        return std::nullopt;
    }
    const Json* results = codegate::support::json_get(*root, "results");
    const auto* items = results != nullptr ? results->as_array() : nullptr;
    if (items == nullptr)
    {
        return std::nullopt;
    }
    Findings out;
    for (const auto& item : *items)
    {
        const auto* obj = item.as_object();
        if (obj == nullptr)
        {
            return std::nullopt;
        }
        const auto severity = codegate::support::json_get_string(*obj, "issue_severity").value_or("");
        const auto confidence =
            codegate::support::json_get_string(*obj, "issue_confidence").value_or("");
        Finding f;
        if (severity == "HIGH")
        {
            f.severity = confidence == "HIGH" ? Severity::Critical : Severity::Error;
        }
        else if (severity == "MEDIUM")
        {
            f.severity = Severity::Warning;
        }
        else
        {
            f.severity = Severity::Info;
        }
        f.code = codegate::support::json_get_string(*obj, "test_id").value_or("bandit");
        f.message = codegate::support::json_get_string(*obj, "issue_text").value_or("");
        f.line = to_position(codegate::support::json_get_number(*obj, "line_number"));
        f.col = to_position(codegate::support::json_get_number(*obj, "col_offset"), 1);
        f.origin = "bandit";
        if (!confidence.empty())
        {
            f.notes.push_back({.message = "confidence: " + confidence, .span = std::nullopt});
        }
        out.push_back(std::move(f));
    }
    return out;
}

ToolSpec ruff_tool()
{
    return ToolSpec{
        .name = "ruff",
        .program = tool_program("CODEGATE_RUFF", "ruff"),
        .args = {"check", "--output-format=json", "--no-cache", "--isolated", "--exit-zero",
                 "{file}"},
        .ok_exit_codes = {0, 1},
        .parse = [](const codegate::process::ProcResult& r) { return parse_ruff_output(r.out); },
    };
}

ToolSpec mypy_tool()
{
    return ToolSpec{
        .name = "mypy",
        .program = tool_program("CODEGATE_MYPY", "mypy"),
        .args = {"--no-error-summary", "--show-column-numbers", "--show-error-codes",
                 "--no-color-output", "--ignore-missing-imports", "--follow-imports=skip",
                 "--cache-dir=/dev/null", "{file}"},
        .ok_exit_codes = {0, 1},
        .parse = [](const codegate::process::ProcResult& r) -> std::optional<Findings>
        {
            auto findings = parse_mypy_output(r.out);
            // Exit status 1 promises at least one finding.
            if (r.exit_code == 1 && findings.has_value() && findings->empty())
            {
                return std::nullopt;
            }
            return findings;
        },
    };
}

ToolSpec bandit_tool()
{
    return ToolSpec{
        .name = "bandit",
        .program = tool_program("CODEGATE_BANDIT", "bandit"),
        .args = {"-f", "json", "-q", "{file}"},
        .ok_exit_codes = {0, 1},
        .parse = [](const codegate::process::ProcResult& r) { return parse_bandit_output(r.out); },
    };
}

std::unique_ptr<Analyzer> make_analyzer(std::string_view name)
{
    if (name == "ruff")
    {
        return std::make_unique<ExternalToolAnalyzer>(ruff_tool());
    }
    if (name == "mypy")
    {
        return std::make_unique<ExternalToolAnalyzer>(mypy_tool());
    }
    if (name == "bandit")
    {
        return std::make_unique<ExternalToolAnalyzer>(bandit_tool());
    }
    if (name == "conditions")
    {
        return std::make_unique<ConditionAnalyzer>();
    }
    return nullptr;
}

AnalyzerReport ExternalToolAnalyzer::run(const codegate::source::SourceUnit& source,
                                         double timeout_seconds)
{
    AnalyzerReport report;
    report.analyzer = spec_.name;

    const auto program = codegate::process::find_executable(spec_.program);
    if (!program.has_value())
    {
        report.outcome = AnalyzerOutcome::Unavailable;
        report.detail = spec_.program + " not found";
        return report;
    }
    auto file = codegate::process::TempFile::create(".py", source.text());
    if (!file.has_value())
    {
        report.outcome = AnalyzerOutcome::Crashed;
        report.detail = "could not write temporary source file";
        return report;
    }

    codegate::process::ProcessRequest request;
    request.argv.push_back(*program);
    for (const auto& arg : spec_.args)
    {
        request.argv.push_back(arg == "{file}" ? file->path() : arg);
    }
    request.timeout_ms = static_cast<int>(std::ceil(std::max(0.001, timeout_seconds) * 1000.0));
    request.max_output_bytes = kMaxToolOutputBytes;
    request.limits.disable_core_dumps = true;

    if (std::getenv("CODEGATE_DEBUG") != nullptr)
    {
        std::cerr << "[static] running " << spec_.name << " (" << *program << ")\n";
    }
    const auto result = codegate::process::run_process(request);
    report.elapsed_ms = result.wall_ms;

    if (result.spawn_failed)
    {
        report.outcome = AnalyzerOutcome::Unavailable;
        report.detail = result.spawn_error;
        return report;
    }
    if (result.timed_out)
    {
        report.outcome = AnalyzerOutcome::TimedOut;
        report.detail = "no result after " + std::to_string(request.timeout_ms) + " ms";
        return report;
    }
    if (result.term_signal != 0)
    {
        report.outcome = AnalyzerOutcome::Crashed;
        report.detail = "killed by signal " + std::to_string(result.term_signal);
        return report;
    }
    if (result.output_limit_exceeded)
    {
        report.outcome = AnalyzerOutcome::Crashed;
        report.detail = "output exceeded " + std::to_string(kMaxToolOutputBytes) + " bytes";
        return report;
    }
    if (std::find(spec_.ok_exit_codes.begin(), spec_.ok_exit_codes.end(), result.exit_code) ==
        spec_.ok_exit_codes.end())
    {
        report.outcome = AnalyzerOutcome::Crashed;
        report.detail = "exit code " + std::to_string(result.exit_code);
        if (!result.err.empty())
        {
            report.detail += ": " + first_line(result.err);
        }
        return report;
    }
    auto findings = spec_.parse ? spec_.parse(result) : std::nullopt;
    if (!findings.has_value())
    {
        report.outcome = AnalyzerOutcome::Crashed;
        report.detail = "unrecognized output";
        return report;
    }
    for (auto& f : *findings)
    {
        f.origin = spec_.name;
    }
    report.findings = std::move(*findings);
    return report;
}

} // namespace codegate::analysis
