#pragma once

#include <codegate/analysis/analyzer.h>
#include <codegate/diag/finding.h>
#include <codegate/source/source_unit.h>
#include <memory>
#include <string>
#include <vector>

/**
 * @file static_analyzer.h
 * @brief Runs the registered analyzers concurrently and merges their findings.
 *
 * Each analyzer gets its own thread and its own timeout. The stage waits for
 * all of them up to the timeout plus a grace period; an analyzer still running
 * after that is abandoned and reported as timed out. An analyzer that times
 * out adds a Warning `SA001`; one that crashes or cannot start adds a Warning
 * `SA002`. Reports and findings appear in registration order.
 */

namespace codegate::analysis
{

struct StaticAnalyzerConfig
{
    double analyzer_timeout_seconds = 30.0;
    /** Extra wait past the timeout before an analyzer is abandoned. */
    double grace_seconds = 2.0;
    /** Findings at or above this severity fail the stage. */
    codegate::diag::Severity fatal_threshold = codegate::diag::Severity::Critical;
};

struct AnalysisResult
{
    bool passed = true;
    std::vector<AnalyzerReport> reports;
    /** Findings of every analyzer plus SA001/SA002, in registration order. */
    std::vector<codegate::diag::Finding> findings;
    double elapsed_ms = 0.0;
};

class StaticAnalyzer
{
  public:
    void add(std::unique_ptr<Analyzer> analyzer);
    [[nodiscard]] std::size_t size() const { return analyzers_.size(); }
    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] AnalysisResult analyze(const codegate::source::SourceUnit& source,
                                         const StaticAnalyzerConfig& config) const;

  private:
    // Shared so an abandoned analyzer thread keeps its analyzer alive.
    std::vector<std::shared_ptr<Analyzer>> analyzers_;
};

} // namespace codegate::analysis
