#pragma once

#include <codegate/source/span.h>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * @file finding.h
 * @brief Findings reported by validation stages.
 */

namespace codegate::diag
{

/** @brief Ordered severity scale: Info < Warning < Error < Critical. */
enum class Severity
{
    Info,
    Warning,
    Error,
    Critical,
};

[[nodiscard]] constexpr std::string_view to_string(Severity s)
{
    switch (s)
    {
    case Severity::Info:
        return "info";
    case Severity::Warning:
        return "warning";
    case Severity::Error:
        return "error";
    case Severity::Critical:
        return "critical";
    }
    return "error";
}

/** @brief True when `s` is at or above `threshold`. */
[[nodiscard]] constexpr bool at_least(Severity s, Severity threshold)
{
    return static_cast<int>(s) >= static_cast<int>(threshold);
}

/** @brief Parse a lowercase severity name. */
[[nodiscard]] std::optional<Severity> severity_from_string(std::string_view name);

/** @brief Additional related message attached to a finding, with optional span. */
struct Related
{
    std::string message;
    std::optional<codegate::source::Span> span;
};

/**
 * @brief One problem found by a stage.
 *
 * `code` identifies the rule (e.g. `PV001`); `origin` names the stage or analyzer
 * that produced the finding. `line`/`col` are 1-based and zero when unknown.
 */
struct Finding
{
    Severity severity = Severity::Error;
    std::string code;
    std::string message;
    std::optional<codegate::source::Span> span;
    std::size_t line = 0;
    std::size_t col = 0;
    std::string origin;
    std::vector<Related> notes;
};

/** @brief Highest severity among `findings`, or nullopt when empty. */
[[nodiscard]] std::optional<Severity> max_severity(const std::vector<Finding>& findings);

/** @brief True when any finding reaches `threshold`. */
[[nodiscard]] bool any_at_least(const std::vector<Finding>& findings, Severity threshold);

} // namespace codegate::diag
