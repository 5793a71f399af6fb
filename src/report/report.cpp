#include <codegate/diag/render.h>
#include <codegate/report/report.h>
#include <iomanip>
#include <sstream>

namespace codegate::report
{
namespace
{

using codegate::support::Json;

Json str(std::string_view s)
{
    return Json{std::string(s)};
}

Json num(double d)
{
    return Json{d};
}

Json finding_json(const codegate::diag::Finding& f)
{
    Json::Object obj;
    obj.emplace("severity", str(codegate::diag::to_string(f.severity)));
    obj.emplace("code", str(f.code));
    obj.emplace("message", str(f.message));
    obj.emplace("origin", str(f.origin));
    obj.emplace("line", num(static_cast<double>(f.line)));
    obj.emplace("col", num(static_cast<double>(f.col)));
    if (f.span.has_value())
    {
        obj.emplace("span", Json{Json::Array{num(static_cast<double>(f.span->start)),
                                             num(static_cast<double>(f.span->end))}});
    }
    Json::Array notes;
    for (const auto& n : f.notes)
    {
        notes.push_back(str(n.message));
    }
    obj.emplace("notes", Json{std::move(notes)});
    return Json{std::move(obj)};
}

Json stage_json(const codegate::validator::StageResult& s)
{
    Json::Object obj;
    obj.emplace("stage", str(codegate::validator::to_string(s.stage)));
    obj.emplace("status", str(codegate::validator::to_string(s.status)));
    obj.emplace("elapsed_ms", num(s.elapsed_ms));
    obj.emplace("reason", s.reason.empty() ? Json{nullptr} : str(s.reason));
    Json::Array findings;
    for (const auto& f : s.findings)
    {
        findings.push_back(finding_json(f));
    }
    obj.emplace("findings", Json{std::move(findings)});
    obj.emplace("details", s.details);
    return Json{std::move(obj)};
}

std::string fixed_ms(double ms)
{
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << ms << " ms";
    return out.str();
}

} // namespace

Json to_json_value(const codegate::validator::ValidationReport& report)
{
    Json::Object obj;
    obj.emplace("status", str(codegate::validator::to_string(report.status)));
    obj.emplace("elapsed_ms", num(report.elapsed_ms));
    obj.emplace("entry_point", report.entry_point.has_value() ? str(*report.entry_point) : Json{nullptr});

    Json::Object source;
    source.emplace("name", str(report.source.name));
    source.emplace("length", num(static_cast<double>(report.source.length)));
    source.emplace("lines", num(static_cast<double>(report.source.line_count)));
    obj.emplace("source", Json{std::move(source)});

    Json::Array stages;
    for (const auto& s : report.stages)
    {
        stages.push_back(stage_json(s));
    }
    obj.emplace("stages", Json{std::move(stages)});
    return Json{std::move(obj)};
}

Json to_json_value(const codegate::sandbox::ExecutionResult& result)
{
    Json::Object obj;
    obj.emplace("state", str(codegate::sandbox::to_string(result.state)));
    obj.emplace("exit", str(codegate::sandbox::to_string(result.exit)));
    obj.emplace("stdout", str(result.stdout_text));
    obj.emplace("stderr", str(result.stderr_text));
    obj.emplace("stdout_truncated", Json{result.stdout_truncated});
    obj.emplace("stderr_truncated", Json{result.stderr_truncated});
    obj.emplace("wall_ms", num(result.wall_ms));
    obj.emplace("cpu_ms", num(result.cpu_ms));
    obj.emplace("peak_memory_bytes", num(static_cast<double>(result.peak_memory_bytes)));
    obj.emplace("return_value",
                result.return_value.has_value() ? str(codegate::runtime::repr(*result.return_value)) : Json{nullptr});
    if (result.exception.has_value())
    {
        Json::Object e;
        e.emplace("type", str(result.exception->type));
        e.emplace("message", str(result.exception->message));
        obj.emplace("exception", Json{std::move(e)});
    }
    else
    {
        obj.emplace("exception", Json{nullptr});
    }
    obj.emplace("backend_error", result.backend_error.empty() ? Json{nullptr} : str(result.backend_error));
    return Json{std::move(obj)};
}

std::string to_json(const codegate::validator::ValidationReport& report)
{
    return codegate::support::json_serialize_pretty(to_json_value(report)) + "\n";
}

std::string to_json(const codegate::sandbox::ExecutionResult& result)
{
    return codegate::support::json_serialize_pretty(to_json_value(result)) + "\n";
}

std::string to_text(const codegate::validator::ValidationReport& report,
                    const codegate::source::SourceUnit& source)
{
    std::ostringstream out;
    out << report.source.name << ": " << codegate::validator::to_string(report.status) << " ("
        << fixed_ms(report.elapsed_ms) << ")\n";
    for (const auto& s : report.stages)
    {
        out << "  " << std::left << std::setw(16) << codegate::validator::to_string(s.stage) << std::setw(10)
            << codegate::validator::to_string(s.status);
        if (s.status != codegate::validator::StageStatus::Skipped)
        {
            out << fixed_ms(s.elapsed_ms);
        }
        if (!s.reason.empty())
        {
            out << "  " << s.reason;
        }
        out << "\n";
    }
    for (const auto& s : report.stages)
    {
        for (const auto& f : s.findings)
        {
            out << codegate::diag::render(f, source);
        }
    }
    for (const auto& p : report.properties)
    {
        out << "property " << p.property << ": " << codegate::proptest::to_string(p.outcome);
        if (!p.message.empty())
        {
            out << " (" << p.message << ")";
        }
        out << "\n";
    }
    return out.str();
}

} // namespace codegate::report
