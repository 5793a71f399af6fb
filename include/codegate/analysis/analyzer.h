#pragma once

#include <codegate/diag/finding.h>
#include <codegate/source/source_unit.h>
#include <string>
#include <string_view>
#include <vector>

/**
 * @file analyzer.h
 * @brief Interface shared by the built-in and external static analyzers.
 */

namespace codegate::analysis
{

enum class AnalyzerOutcome
{
    Completed,
    TimedOut,
    /** Started but failed: non-zero exit without parsable output, signal, bad output. */
    Crashed,
    /** Could not be started at all (tool not installed). */
    Unavailable,
};

[[nodiscard]] std::string_view to_string(AnalyzerOutcome outcome);

struct AnalyzerReport
{
    std::string analyzer;
    AnalyzerOutcome outcome = AnalyzerOutcome::Completed;
    std::vector<codegate::diag::Finding> findings;
    double elapsed_ms = 0.0;
    /** Why the analyzer did not complete. */
    std::string detail;
};

/**
 * @brief One static analyzer.
 *
 * `run` is called on its own thread and must return within roughly
 * `timeout_seconds`; the stage stops waiting for it after that.
 */
class Analyzer
{
  public:
    virtual ~Analyzer() = default;

    [[nodiscard]] virtual std::string name() const = 0;
    [[nodiscard]] virtual AnalyzerReport run(const codegate::source::SourceUnit& source,
                                             double timeout_seconds) = 0;
};

} // namespace codegate::analysis
