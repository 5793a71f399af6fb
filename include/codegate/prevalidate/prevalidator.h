#pragma once

#include <codegate/diag/finding.h>
#include <codegate/parser/ast.h>
#include <codegate/policy/pattern_registry.h>
#include <codegate/source/source_unit.h>
#include <cstddef>
#include <memory>
#include <vector>

/**
 * @file prevalidator.h
 * @brief Execution-free gate: parse, size limits, and denylist walk.
 */

namespace codegate::prevalidate
{

struct PrevalidatorConfig
{
    std::size_t max_code_length = 50000;
    std::size_t max_lines = 1000;
    std::size_t max_nesting_depth = 50;
    /** When false, size ceiling findings are reported as warnings. */
    bool size_limits_fatal = true;
    /** Scan raw text for suspicious patterns (dunder names, os.system, ...). */
    bool scan_text_patterns = true;
    /** Findings at or above this severity fail the stage. */
    codegate::diag::Severity fatal_threshold = codegate::diag::Severity::Error;
    std::shared_ptr<const codegate::policy::PatternRegistry> registry =
        codegate::policy::default_registry();
};

struct PrevalidationResult
{
    bool passed = false;
    std::vector<codegate::diag::Finding> findings;
    /** Parsed module; null when parsing failed. Views into the SourceUnit text. */
    std::shared_ptr<const codegate::parser::Module> module;
};

/**
 * @brief Run the prevalidator over `source`.
 *
 * A lex or parse error yields exactly one Critical `PV000` finding and no
 * further checks. Never executes code.
 */
[[nodiscard]] PrevalidationResult validate(const codegate::source::SourceUnit& source,
                                           const PrevalidatorConfig& config = {});

} // namespace codegate::prevalidate
