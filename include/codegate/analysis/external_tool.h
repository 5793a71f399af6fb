#pragma once

#include <codegate/analysis/analyzer.h>
#include <codegate/process/process.h>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/**
 * @file external_tool.h
 * @brief Analyzers that run a third-party tool over a temporary copy of the source.
 *
 * Stock tools and their severity mapping:
 * - ruff (JSON): `E` and `F` codes are errors, everything else a warning.
 * - mypy (text): error, warning and note map to Error, Warning and Info.
 * - bandit (JSON): HIGH severity with HIGH confidence is Critical, other HIGH
 *   is Error, MEDIUM is Warning, LOW is Info.
 *
 * Tool locations come from CODEGATE_RUFF, CODEGATE_MYPY and CODEGATE_BANDIT,
 * falling back to a PATH lookup of the tool name.
 */

namespace codegate::analysis
{

using Findings = std::vector<codegate::diag::Finding>;

/** @brief Findings in a tool's output; nullopt when the output is not understood. */
using OutputParser = std::function<std::optional<Findings>(const codegate::process::ProcResult&)>;

struct ToolSpec
{
    std::string name;
    std::string program;
    /** Arguments; the element `{file}` is replaced by the path of the source copy. */
    std::vector<std::string> args;
    /** Exit codes meaning the tool ran to completion (with or without findings). */
    std::vector<int> ok_exit_codes = {0, 1};
    OutputParser parse;
};

class ExternalToolAnalyzer final : public Analyzer
{
  public:
    explicit ExternalToolAnalyzer(ToolSpec spec) : spec_(std::move(spec)) {}

    [[nodiscard]] std::string name() const override { return spec_.name; }
    [[nodiscard]] AnalyzerReport run(const codegate::source::SourceUnit& source,
                                     double timeout_seconds) override;

  private:
    ToolSpec spec_;
};

[[nodiscard]] std::optional<Findings> parse_ruff_output(std::string_view json);
[[nodiscard]] std::optional<Findings> parse_mypy_output(std::string_view text);
[[nodiscard]] std::optional<Findings> parse_bandit_output(std::string_view json);

[[nodiscard]] ToolSpec ruff_tool();
[[nodiscard]] ToolSpec mypy_tool();
[[nodiscard]] ToolSpec bandit_tool();

/** @brief Analyzer for a stock tool (`ruff`, `mypy`, `bandit`, `conditions`); null for unknown names. */
[[nodiscard]] std::unique_ptr<Analyzer> make_analyzer(std::string_view name);

} // namespace codegate::analysis
