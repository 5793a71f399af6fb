#pragma once

#include <codegate/analysis/analyzer.h>
#include <string>

/**
 * @file condition_analyzer.h
 * @brief Z3-backed checks of branch, loop and assertion conditions.
 *
 * Codes:
 * - `CG101` (warning): an `if`/`elif`/`while` condition can never be true.
 * - `CG102` (warning): an `if` condition is always true, so its `else` never runs.
 * - `CG103` (error): a loop condition is always true and the body has no
 *   `break`, `return`, `raise` or `yield`.
 * - `CG104` (error): an assertion can never hold.
 *
 * `elif` tests are checked under the negation of the earlier tests of the
 * chain. Conditions the lowering does not support are skipped.
 */

namespace codegate::analysis
{

class ConditionAnalyzer final : public Analyzer
{
  public:
    explicit ConditionAnalyzer(unsigned query_timeout_ms = 2000)
        : query_timeout_ms_(query_timeout_ms)
    {
    }

    [[nodiscard]] std::string name() const override { return "conditions"; }
    [[nodiscard]] AnalyzerReport run(const codegate::source::SourceUnit& source,
                                     double timeout_seconds) override;

  private:
    unsigned query_timeout_ms_;
};

} // namespace codegate::analysis
