#include <codegate/diag/finding.h>

namespace codegate::diag
{

std::optional<Severity> severity_from_string(std::string_view name)
{
    if (name == "info")
    {
        return Severity::Info;
    }
    if (name == "warning")
    {
        return Severity::Warning;
    }
    if (name == "error")
    {
        return Severity::Error;
    }
    if (name == "critical")
    {
        return Severity::Critical;
    }
    return std::nullopt;
}

std::optional<Severity> max_severity(const std::vector<Finding>& findings)
{
    std::optional<Severity> out;
    for (const auto& f : findings)
    {
        if (!out.has_value() || at_least(f.severity, *out))
        {
            out = f.severity;
        }
    }
    return out;
}

bool any_at_least(const std::vector<Finding>& findings, Severity threshold)
{
    for (const auto& f : findings)
    {
        if (at_least(f.severity, threshold))
        {
            return true;
        }
    }
    return false;
}

} // namespace codegate::diag
