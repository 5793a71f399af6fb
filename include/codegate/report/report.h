#pragma once

#include <codegate/sandbox/sandbox.h>
#include <codegate/source/source_unit.h>
#include <codegate/support/json.h>
#include <codegate/validator/validator.h>
#include <string>

/**
 * @file report.h
 * @brief Machine-readable and human-readable forms of validation results.
 *
 * The JSON document has a fixed shape:
 * `{"elapsed_ms", "entry_point", "source": {...}, "stages": [...], "status"}`.
 * Stages appear in pipeline order; severities and statuses are lowercase
 * strings and timings are milliseconds.
 */

namespace codegate::report
{

[[nodiscard]] codegate::support::Json to_json_value(const codegate::validator::ValidationReport& report);
[[nodiscard]] codegate::support::Json to_json_value(const codegate::sandbox::ExecutionResult& result);

/** @brief Indented JSON document for `report`. */
[[nodiscard]] std::string to_json(const codegate::validator::ValidationReport& report);
[[nodiscard]] std::string to_json(const codegate::sandbox::ExecutionResult& result);

/** @brief One line per stage followed by the rendered findings. */
[[nodiscard]] std::string to_text(const codegate::validator::ValidationReport& report,
                                  const codegate::source::SourceUnit& source);

} // namespace codegate::report
