#pragma once

#include <codegate/analysis/analyzer.h>
#include <codegate/diag/finding.h>
#include <codegate/policy/pattern_registry.h>
#include <codegate/proptest/property_tester.h>
#include <codegate/sandbox/sandbox.h>
#include <codegate/source/source_unit.h>
#include <codegate/support/json.h>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

/**
 * @file validator.h
 * @brief The validation pipeline and its convenience entry points.
 *
 * Stages run in a fixed order: prevalidation, static analysis, sandbox,
 * property tests, resource guard. The report always holds one result per
 * stage; stages that did not run are Skipped with a reason.
 *
 * Overall status:
 * - Failed when any stage failed (a finding reached that stage's threshold).
 * - Error when no stage failed but one timed out against the deadline or the
 *   sandbox itself could not run.
 * - Passed otherwise.
 */

namespace codegate::validator
{

using ConfigError = codegate::sandbox::ConfigError;

enum class StageId
{
    Prevalidation,
    StaticAnalysis,
    Sandbox,
    PropertyTests,
    ResourceGuard,
};

inline constexpr StageId kStageOrder[] = {StageId::Prevalidation, StageId::StaticAnalysis,
                                          StageId::Sandbox, StageId::PropertyTests,
                                          StageId::ResourceGuard};

enum class StageStatus
{
    Passed,
    Failed,
    Skipped,
    TimedOut,
    Error,
};

enum class OverallStatus
{
    Passed,
    Failed,
    Error,
};

[[nodiscard]] std::string_view to_string(StageId id);
[[nodiscard]] std::string_view to_string(StageStatus status);
[[nodiscard]] std::string_view to_string(OverallStatus status);

struct StageResult
{
    StageId stage = StageId::Prevalidation;
    StageStatus status = StageStatus::Skipped;
    std::vector<codegate::diag::Finding> findings;
    double elapsed_ms = 0.0;
    /**
     * Why the stage was skipped, timed out or errored.
     *
     * A stage that is both disabled and downstream of a stop reports the stop
     * ("stopped after prevalidation failed"), not that it was disabled.
     */
    std::string reason;
    /** Stage-specific structured data (analyzer outcomes, execution summary, properties). */
    codegate::support::Json details{codegate::support::Json::Object{}};
};

struct SourceInfo
{
    std::string name;
    std::size_t length = 0;
    std::size_t line_count = 0;
};

struct ValidationReport
{
    OverallStatus status = OverallStatus::Passed;
    std::vector<StageResult> stages;
    double elapsed_ms = 0.0;
    SourceInfo source;
    std::optional<std::string> entry_point;
    /** Sandbox run, when the sandbox stage executed. */
    std::optional<codegate::sandbox::ExecutionResult> execution;
    std::vector<codegate::proptest::PropertyCheckResult> properties;

    [[nodiscard]] const StageResult* stage(StageId id) const;
};

using AnalyzerFactory = std::function<std::unique_ptr<codegate::analysis::Analyzer>()>;

struct ValidatorConfig
{
    bool stop_on_failure = true;
    /** Overall bound on one validate() call. */
    std::optional<double> deadline_seconds;

    std::size_t max_code_length = 50000;
    std::size_t max_lines = 1000;
    std::size_t max_nesting_depth = 50;
    bool size_limits_fatal = true;
    bool scan_text_patterns = true;
    codegate::diag::Severity prevalidation_fatal_threshold = codegate::diag::Severity::Error;

    /** Denylist overrides: `replace_*` swaps a set, `extra_*` adds to it. */
    std::optional<std::vector<std::string>> replace_forbidden_modules;
    std::optional<std::vector<std::string>> replace_forbidden_callables;
    std::optional<std::vector<std::string>> replace_forbidden_attributes;
    std::vector<std::string> extra_forbidden_modules;
    std::vector<std::string> extra_forbidden_callables;
    std::vector<std::string> extra_forbidden_attributes;

    bool enable_static_analysis = true;
    bool enable_condition_analyzer = true;
    bool use_ruff = true;
    bool use_mypy = true;
    bool use_bandit = true;
    /** Further analyzers, run after the stock ones. */
    std::vector<AnalyzerFactory> extra_analyzers;
    double analyzer_timeout_seconds = 30.0;
    codegate::diag::Severity static_fatal_threshold = codegate::diag::Severity::Critical;

    bool enable_sandbox = true;
    codegate::sandbox::BackendKind sandbox_backend = codegate::sandbox::BackendKind::Subprocess;
    double sandbox_timeout_seconds = 10.0;
    std::size_t sandbox_max_memory_mb = 128;
    /** Remaining sandbox settings; timeout, memory and registry come from the fields above. */
    codegate::sandbox::SandboxConfig sandbox;

    bool enable_property_tests = true;
    std::size_t property_test_trial_count = 100;
    /** Remaining property settings; the trial count comes from the field above. */
    codegate::proptest::PropertyConfig property;
    std::vector<codegate::proptest::Property> properties;
    /** When true, violated properties are errors and fail the stage. */
    bool property_violations_fatal = false;

    bool enable_resource_guard = true;
    double resource_max_memory_mb = 256.0;
    double resource_max_time_seconds = 30.0;

    /** @brief First configuration problem, or nullopt. */
    [[nodiscard]] std::optional<ConfigError> check() const;

    /** @brief Default denylist with the overrides applied. */
    [[nodiscard]] std::shared_ptr<const codegate::policy::PatternRegistry> registry() const;
};

class Validator
{
  public:
    /** @brief Validator for `config`; ConfigError when the configuration is invalid. */
    [[nodiscard]] static std::variant<Validator, ConfigError> create(ValidatorConfig config);

    /** @brief Run the pipeline. Never fails: unsafe code is a Failed report. */
    [[nodiscard]] ValidationReport validate(const codegate::source::SourceUnit& source,
                                            const std::optional<std::string>& entry_point = {}) const;

    [[nodiscard]] const ValidatorConfig& config() const { return config_; }

  private:
    Validator(ValidatorConfig config, std::shared_ptr<const codegate::policy::PatternRegistry> registry)
        : config_(std::move(config)), registry_(std::move(registry))
    {
    }

    ValidatorConfig config_;
    std::shared_ptr<const codegate::policy::PatternRegistry> registry_;
};

/** @brief Prevalidation only, default configuration. */
[[nodiscard]] bool is_safe(std::string_view source);

/** @brief Prevalidation, plus static analysis when `config` enables it. False for an invalid config. */
[[nodiscard]] bool is_safe(std::string_view source, const ValidatorConfig& config);

[[nodiscard]] std::variant<ValidationReport, ConfigError> validate(
    std::string_view source, const std::optional<std::string>& entry_point = {},
    const ValidatorConfig& config = {});

/** @brief Sandbox stage alone; assumes the source already passed prevalidation. */
[[nodiscard]] std::variant<codegate::sandbox::ExecutionResult, ConfigError> execute_safe(
    std::string_view source, codegate::sandbox::BackendKind kind,
    const codegate::sandbox::SandboxConfig& config);

} // namespace codegate::validator
