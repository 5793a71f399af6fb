#pragma once

#include <codegate/diag/finding.h>
#include <codegate/source/source_unit.h>
#include <string>

namespace codegate::diag
{

/** @brief Fill `line`/`col` of `finding` from its span, when it has one. */
void locate(Finding& finding, const codegate::source::SourceUnit& unit);

/**
 * @brief Render a finding as `name:line:col: severity[code]: message` with a caret excerpt.
 *
 * Findings without a span fall back to their `line`/`col` fields, and to a
 * single header line when neither is known.
 */
[[nodiscard]] std::string render(const Finding& finding, const codegate::source::SourceUnit& unit);

} // namespace codegate::diag
