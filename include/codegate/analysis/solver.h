#pragma once

#include <optional>
#include <string>
#include <z3++.h>

/**
 * @file solver.h
 * @brief Thin wrapper around Z3 used by the condition analyzer.
 */

namespace codegate::analysis
{

/** @brief Check result from the solver. */
enum class CheckResult
{
    Sat,
    Unsat,
    Unknown,
};

/** @brief Solver wrapper exposing the minimal API the analyzer needs. */
class Solver
{
  public:
    Solver();

    [[nodiscard]] z3::context& context();
    void add(const z3::expr& constraint);
    void push();
    void pop();
    /** @brief Per-query limit; a query that runs out returns Unknown. */
    void set_timeout(unsigned milliseconds);
    [[nodiscard]] CheckResult check();
    /** @brief Z3's explanation for the last Unknown result, if any. */
    [[nodiscard]] const std::optional<std::string>& last_unknown_reason() const
    {
        return unknown_reason_;
    }

  private:
    z3::context ctx_;
    z3::solver solver_;
    std::optional<std::string> unknown_reason_;
};

} // namespace codegate::analysis
