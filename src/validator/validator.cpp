#include <algorithm>
#include <chrono>
#include <cmath>
#include <codegate/analysis/external_tool.h>
#include <codegate/analysis/static_analyzer.h>
#include <codegate/diag/render.h>
#include <codegate/prevalidate/prevalidator.h>
#include <codegate/proptest/signature.h>
#include <codegate/validator/validator.h>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <sstream>

namespace codegate::validator
{
namespace
{

using codegate::diag::Finding;
using codegate::diag::Severity;
using codegate::support::Json;
using Clock = std::chrono::steady_clock;

constexpr double kBytesPerMb = 1024.0 * 1024.0;
/** Resource use at this fraction of a limit draws a warning. */
constexpr double kResourceWarnFraction = 0.8;

bool debug_enabled()
{
    return std::getenv("CODEGATE_DEBUG") != nullptr;
}

double ms_since(Clock::time_point start)
{
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

Json str(std::string s)
{
    return Json{std::move(s)};
}

Json num(double d)
{
    return Json{d};
}

std::string seconds_text(double seconds)
{
    std::ostringstream out;
    out << seconds;
    return out.str() + " s";
}

std::string mb_text(double mb)
{
    std::ostringstream out;
    out.precision(1);
    out << std::fixed << mb;
    return out.str() + " MB";
}

Finding finding(Severity severity, std::string code, std::string message, std::string origin)
{
    Finding f;
    f.severity = severity;
    f.code = std::move(code);
    f.message = std::move(message);
    f.origin = std::move(origin);
    return f;
}

/** Fails every batch once the validation deadline has passed. */
class DeadlineCallable final : public codegate::sandbox::BatchCallable
{
  public:
    DeadlineCallable(codegate::sandbox::BatchCallable& inner, std::optional<Clock::time_point> deadline)
        : inner_(inner), deadline_(deadline)
    {
    }

    std::vector<codegate::sandbox::CallOutcome> call_batch(
        const std::vector<std::vector<codegate::runtime::Value>>& inputs) override
    {
        if (deadline_.has_value() && Clock::now() >= *deadline_)
        {
            codegate::sandbox::CallOutcome stopped;
            stopped.kind = codegate::sandbox::CallOutcome::Kind::Failed;
            stopped.exit = codegate::sandbox::ExitClass::Timeout;
            stopped.exception.message = "validation deadline reached";
            return std::vector<codegate::sandbox::CallOutcome>(inputs.size(), stopped);
        }
        return inner_.call_batch(inputs);
    }

    codegate::sandbox::BatchUsage usage() const override { return inner_.usage(); }

  private:
    codegate::sandbox::BatchCallable& inner_;
    std::optional<Clock::time_point> deadline_;
};

/** One validate() call. */
class PipelineRun
{
  public:
    PipelineRun(const ValidatorConfig& config,
                std::shared_ptr<const codegate::policy::PatternRegistry> registry,
                const codegate::source::SourceUnit& source, const std::optional<std::string>& entry)
        : config_(config), registry_(std::move(registry)), source_(source), entry_(entry),
          started_(Clock::now())
    {
        if (config_.deadline_seconds.has_value())
        {
            deadline_ = started_ + std::chrono::duration_cast<Clock::duration>(
                                       std::chrono::duration<double>(*config_.deadline_seconds));
        }
        report_.source = SourceInfo{.name = source.name(),
                                    .length = source.length(),
                                    .line_count = source.line_count()};
        report_.entry_point = entry;
        for (StageId id : kStageOrder)
        {
            StageResult r;
            r.stage = id;
            r.status = StageStatus::Skipped;
            r.reason = "not reached";
            report_.stages.push_back(std::move(r));
        }
    }

    ValidationReport run()
    {
        prevalidation();
        static_analysis();
        sandbox_stage();
        property_stage();
        resource_guard();
        report_.status = overall_status();
        report_.elapsed_ms = ms_since(started_);
        if (debug_enabled())
        {
            std::cerr << "[validator] " << source_.name() << ": " << to_string(report_.status) << " in "
                      << report_.elapsed_ms << " ms\n";
        }
        return std::move(report_);
    }

  private:
    StageResult& stage(StageId id) { return report_.stages[static_cast<std::size_t>(id)]; }

    /** Seconds left before the deadline; infinity without one. */
    double remaining() const
    {
        if (!deadline_.has_value())
        {
            return std::numeric_limits<double>::infinity();
        }
        return std::chrono::duration<double>(*deadline_ - Clock::now()).count();
    }

    bool past_deadline() const { return deadline_.has_value() && Clock::now() > *deadline_; }

    /** Records a skip; returns true when the stage must not run. */
    bool skip_if(StageId id, bool condition, std::string reason)
    {
        if (!condition)
        {
            return false;
        }
        auto& s = stage(id);
        s.status = StageStatus::Skipped;
        s.reason = std::move(reason);
        return true;
    }

    bool halted(StageId id) { return skip_if(id, halt_reason_.has_value(), halt_reason_.value_or("")); }

    void begin(StageId id)
    {
        auto& s = stage(id);
        s.reason.clear();
        if (debug_enabled())
        {
            std::cerr << "[validator] stage " << to_string(id) << "\n";
        }
    }

    /** Deadline and stop-on-failure bookkeeping once a stage has run. */
    void finish(StageId id, Clock::time_point stage_start)
    {
        auto& s = stage(id);
        s.elapsed_ms = ms_since(stage_start);
        if (s.status != StageStatus::TimedOut && past_deadline())
        {
            s.status = StageStatus::TimedOut;
            s.reason = "validation deadline of " + seconds_text(*config_.deadline_seconds) + " exceeded";
        }
        if (s.status == StageStatus::TimedOut)
        {
            halt_reason_ = "validation deadline exceeded during " + std::string(to_string(id));
            halted_by_deadline_ = true;
            return;
        }
        if (s.status != StageStatus::Passed && config_.stop_on_failure && !halt_reason_.has_value())
        {
            halt_reason_ = "stopped after " + std::string(to_string(id)) + " " + std::string(to_string(s.status));
        }
    }

    void prevalidation()
    {
        const auto t0 = Clock::now();
        begin(StageId::Prevalidation);
        codegate::prevalidate::PrevalidatorConfig pc;
        pc.max_code_length = config_.max_code_length;
        pc.max_lines = config_.max_lines;
        pc.max_nesting_depth = config_.max_nesting_depth;
        pc.size_limits_fatal = config_.size_limits_fatal;
        pc.scan_text_patterns = config_.scan_text_patterns;
        pc.fatal_threshold = config_.prevalidation_fatal_threshold;
        pc.registry = registry_;
        auto result = codegate::prevalidate::validate(source_, pc);

        auto& s = stage(StageId::Prevalidation);
        s.status = result.passed ? StageStatus::Passed : StageStatus::Failed;
        if (!result.passed)
        {
            s.reason = "finding at or above " + std::string(codegate::diag::to_string(pc.fatal_threshold));
        }
        s.findings = std::move(result.findings);
        Json::Object details;
        details.emplace("parsed", Json{result.module != nullptr});
        details.emplace("fatal_threshold", str(std::string(codegate::diag::to_string(pc.fatal_threshold))));
        s.details = Json{std::move(details)};
        module_ = std::move(result.module);
        finish(StageId::Prevalidation, t0);
    }

    void static_analysis()
    {
        if (halted(StageId::StaticAnalysis) ||
            skip_if(StageId::StaticAnalysis, !config_.enable_static_analysis, "static analysis disabled"))
        {
            return;
        }
        codegate::analysis::StaticAnalyzer analyzer;
        if (config_.enable_condition_analyzer)
        {
            analyzer.add(codegate::analysis::make_analyzer("conditions"));
        }
        if (config_.use_ruff)
        {
            analyzer.add(codegate::analysis::make_analyzer("ruff"));
        }
        if (config_.use_mypy)
        {
            analyzer.add(codegate::analysis::make_analyzer("mypy"));
        }
        if (config_.use_bandit)
        {
            analyzer.add(codegate::analysis::make_analyzer("bandit"));
        }
        for (const auto& factory : config_.extra_analyzers)
        {
            analyzer.add(factory());
        }
        if (skip_if(StageId::StaticAnalysis, analyzer.size() == 0, "no analyzers enabled"))
        {
            return;
        }

        const auto t0 = Clock::now();
        begin(StageId::StaticAnalysis);
        codegate::analysis::StaticAnalyzerConfig sc;
        sc.analyzer_timeout_seconds = std::min(config_.analyzer_timeout_seconds, std::max(0.001, remaining()));
        sc.grace_seconds = std::min(sc.grace_seconds, std::max(0.0, remaining() - sc.analyzer_timeout_seconds));
        sc.fatal_threshold = config_.static_fatal_threshold;
        auto result = analyzer.analyze(source_, sc);

        auto& s = stage(StageId::StaticAnalysis);
        s.status = result.passed ? StageStatus::Passed : StageStatus::Failed;
        if (!result.passed)
        {
            s.reason = "finding at or above " + std::string(codegate::diag::to_string(sc.fatal_threshold));
        }
        for (auto& f : result.findings)
        {
            codegate::diag::locate(f, source_);
        }
        s.findings = std::move(result.findings);
        Json::Array analyzers;
        for (const auto& r : result.reports)
        {
            Json::Object a;
            a.emplace("name", str(r.analyzer));
            a.emplace("outcome", str(std::string(codegate::analysis::to_string(r.outcome))));
            a.emplace("elapsed_ms", num(r.elapsed_ms));
            a.emplace("findings", num(static_cast<double>(r.findings.size())));
            if (!r.detail.empty())
            {
                a.emplace("detail", str(r.detail));
            }
            analyzers.push_back(Json{std::move(a)});
        }
        Json::Object details;
        details.emplace("analyzers", Json{std::move(analyzers)});
        details.emplace("timeout_seconds", num(sc.analyzer_timeout_seconds));
        s.details = Json{std::move(details)};
        finish(StageId::StaticAnalysis, t0);
    }

    void sandbox_stage()
    {
        if (halted(StageId::Sandbox) ||
            skip_if(StageId::Sandbox, !config_.enable_sandbox, "sandbox execution disabled"))
        {
            return;
        }
        const auto t0 = Clock::now();
        begin(StageId::Sandbox);
        auto sc = config_.sandbox;
        sc.timeout_seconds = std::min(config_.sandbox_timeout_seconds, std::max(0.001, remaining()));
        const bool deadline_bound = sc.timeout_seconds < config_.sandbox_timeout_seconds;
        sc.max_memory_bytes = static_cast<std::uint64_t>(config_.sandbox_max_memory_mb) * 1024 * 1024;
        sc.registry = registry_;

        auto& s = stage(StageId::Sandbox);
        auto made = codegate::sandbox::make_sandbox(config_.sandbox_backend, sc);
        if (const auto* error = std::get_if<ConfigError>(&made))
        {
            s.status = StageStatus::Error;
            s.reason = error->message;
            s.findings.push_back(finding(Severity::Error, "SB005", "sandbox could not run: " + error->message,
                                         "sandbox"));
            finish(StageId::Sandbox, t0);
            return;
        }
        sandbox_ = std::move(std::get<std::unique_ptr<codegate::sandbox::Sandbox>>(made));
        auto result = sandbox_->execute(source_.text());
        classify_execution(s, result, sc, deadline_bound);

        Json::Object details;
        details.emplace("backend", str(std::string(codegate::sandbox::to_string(config_.sandbox_backend))));
        details.emplace("state", str(std::string(codegate::sandbox::to_string(result.state))));
        details.emplace("exit", str(std::string(codegate::sandbox::to_string(result.exit))));
        details.emplace("wall_ms", num(result.wall_ms));
        details.emplace("cpu_ms", num(result.cpu_ms));
        details.emplace("peak_memory_bytes", num(static_cast<double>(result.peak_memory_bytes)));
        details.emplace("timeout_seconds", num(sc.timeout_seconds));
        details.emplace("stdout", str(result.stdout_text));
        details.emplace("stderr", str(result.stderr_text));
        details.emplace("stdout_truncated", Json{result.stdout_truncated});
        details.emplace("stderr_truncated", Json{result.stderr_truncated});
        if (result.exception.has_value())
        {
            details.emplace("exception", str(result.exception->type + ": " + result.exception->message));
        }
        if (!result.backend_error.empty())
        {
            details.emplace("backend_error", str(result.backend_error));
        }
        s.details = Json{std::move(details)};
        report_.execution = std::move(result);
        sandbox_ran_ = true;
        finish(StageId::Sandbox, t0);
    }

    void classify_execution(StageResult& s, const codegate::sandbox::ExecutionResult& result,
                            const codegate::sandbox::SandboxConfig& sc, bool deadline_bound)
    {
        using codegate::sandbox::ExitClass;
        if (result.ok())
        {
            s.status = StageStatus::Passed;
            return;
        }
        if (!result.backend_error.empty())
        {
            s.status = StageStatus::Error;
            s.reason = result.backend_error;
            s.findings.push_back(
                finding(Severity::Error, "SB005", "sandbox could not run: " + result.backend_error, "sandbox"));
            return;
        }
        s.status = StageStatus::Failed;
        switch (result.exit)
        {
        case ExitClass::Timeout:
            if (deadline_bound)
            {
                s.status = StageStatus::TimedOut;
            }
            s.reason = "timeout of " + seconds_text(sc.timeout_seconds) + " exceeded";
            s.findings.push_back(finding(Severity::Error, "SB001",
                                         "execution exceeded the " + seconds_text(sc.timeout_seconds) + " timeout",
                                         "sandbox"));
            break;
        case ExitClass::Oom:
            s.reason = "memory ceiling of " + mb_text(static_cast<double>(sc.max_memory_bytes) / kBytesPerMb) +
                       " exceeded";
            s.findings.push_back(finding(Severity::Error, "SB002", s.reason, "sandbox"));
            break;
        case ExitClass::ForbiddenOperation:
        {
            const std::string what = result.exception.has_value() ? result.exception->message : "";
            s.reason = "forbidden operation";
            s.findings.push_back(finding(Severity::Critical, "SB004", "forbidden operation: " + what, "sandbox"));
            break;
        }
        case ExitClass::RuntimeError:
        case ExitClass::Ok:
        {
            std::string what = "execution failed";
            if (result.exception.has_value())
            {
                what = "execution raised " + result.exception->type;
                if (!result.exception->message.empty())
                {
                    what += ": " + result.exception->message;
                }
            }
            s.reason = what;
            s.findings.push_back(finding(Severity::Error, "SB003", what, "sandbox"));
            break;
        }
        }
    }

    void property_stage()
    {
        constexpr StageId id = StageId::PropertyTests;
        if (halted(id) || skip_if(id, !config_.enable_property_tests, "property tests disabled") ||
            skip_if(id, !entry_.has_value(), "no target entry point supplied") ||
            skip_if(id, stage(StageId::Sandbox).status != StageStatus::Passed,
                    "sandbox run did not complete") ||
            skip_if(id, module_ == nullptr, "source did not parse"))
        {
            return;
        }
        auto sig = codegate::proptest::signature_of(*module_, *entry_);
        if (const auto* error = std::get_if<codegate::proptest::SignatureError>(&sig))
        {
            skip_if(id, true, error->message);
            return;
        }
        auto callable = sandbox_->callable(*entry_);
        if (skip_if(id, callable == nullptr, "no callable named '" + *entry_ + "'"))
        {
            return;
        }

        const auto t0 = Clock::now();
        begin(id);
        codegate::proptest::PropertyTester tester;
        for (const auto& p : config_.properties)
        {
            tester.add_property(p);
        }
        auto pc = config_.property;
        pc.trials = config_.property_test_trial_count;
        DeadlineCallable bounded(*callable, deadline_);
        auto results = tester.test(bounded, std::get<codegate::proptest::Signature>(sig), pc);
        property_usage_ = callable->usage();

        auto& s = stage(id);
        const Severity violation_severity =
            config_.property_violations_fatal ? Severity::Error : Severity::Warning;
        Json::Array properties;
        for (const auto& r : results)
        {
            using codegate::proptest::PropertyOutcome;
            if (r.outcome == PropertyOutcome::Violated)
            {
                auto f = finding(violation_severity, "PT001", "property '" + r.property + "' violated: " + r.message,
                                 "property_tests");
                for (std::size_t i = 1; i < r.counter_examples.size(); ++i)
                {
                    f.notes.push_back({.message = "also falsified by " + r.counter_examples[i].call,
                                       .span = std::nullopt});
                }
                s.findings.push_back(std::move(f));
            }
            else if (r.outcome == PropertyOutcome::Error)
            {
                s.findings.push_back(finding(Severity::Warning, "PT002",
                                             "property '" + r.property + "' could not be checked: " + r.message,
                                             "property_tests"));
            }
            Json::Object p;
            p.emplace("name", str(r.property));
            p.emplace("outcome", str(std::string(codegate::proptest::to_string(r.outcome))));
            p.emplace("trials", num(static_cast<double>(r.trials)));
            p.emplace("message", str(r.message));
            Json::Array examples;
            for (const auto& c : r.counter_examples)
            {
                Json::Object e;
                e.emplace("call", str(c.call));
                e.emplace("detail", str(c.detail));
                e.emplace("shrink_steps", num(static_cast<double>(c.shrink_steps)));
                examples.push_back(Json{std::move(e)});
            }
            p.emplace("counter_examples", Json{std::move(examples)});
            properties.push_back(Json{std::move(p)});
        }
        s.status = codegate::diag::any_at_least(s.findings, Severity::Error) ? StageStatus::Failed
                                                                               : StageStatus::Passed;
        if (s.status == StageStatus::Failed)
        {
            s.reason = "property violated";
        }
        Json::Object details;
        details.emplace("properties", Json{std::move(properties)});
        details.emplace("seed", num(static_cast<double>(pc.seed)));
        s.details = Json{std::move(details)};
        report_.properties = std::move(results);
        finish(id, t0);
    }

    void resource_guard()
    {
        constexpr StageId id = StageId::ResourceGuard;
        if (skip_if(id, halted_by_deadline_, halt_reason_.value_or("")) ||
            skip_if(id, !config_.enable_resource_guard, "resource guard disabled") ||
            skip_if(id, !sandbox_ran_, "sandbox stage did not run"))
        {
            return;
        }
        const auto t0 = Clock::now();
        begin(id);
        double wall_ms = 0.0;
        for (const auto& st : report_.stages)
        {
            wall_ms += st.elapsed_ms;
        }
        double cpu_ms = property_usage_.cpu_ms;
        std::uint64_t peak = property_usage_.peak_memory_bytes;
        if (report_.execution.has_value())
        {
            cpu_ms += report_.execution->cpu_ms;
            peak = std::max(peak, report_.execution->peak_memory_bytes);
        }
        const double peak_mb = static_cast<double>(peak) / kBytesPerMb;
        const double wall_s = wall_ms / 1000.0;
        const double cpu_s = cpu_ms / 1000.0;

        auto& s = stage(id);
        const auto check = [&s](double used, double limit, const char* code, const char* warn_code,
                                const std::string& what, const std::string& used_text,
                                const std::string& limit_text)
        {
            if (used > limit)
            {
                s.findings.push_back(finding(Severity::Error, code,
                                             what + " " + used_text + " exceeds the limit of " + limit_text,
                                             "resource_guard"));
            }
            else if (used >= limit * kResourceWarnFraction)
            {
                s.findings.push_back(finding(Severity::Warning, warn_code,
                                             what + " " + used_text + " is close to the limit of " + limit_text,
                                             "resource_guard"));
            }
        };
        check(peak_mb, config_.resource_max_memory_mb, "RG001", "RG011", "peak memory", mb_text(peak_mb),
              mb_text(config_.resource_max_memory_mb));
        check(wall_s, config_.resource_max_time_seconds, "RG002", "RG012", "total wall time",
              seconds_text(wall_s), seconds_text(config_.resource_max_time_seconds));
        check(cpu_s, config_.resource_max_time_seconds, "RG003", "RG013", "cpu time", seconds_text(cpu_s),
              seconds_text(config_.resource_max_time_seconds));

        s.status = codegate::diag::any_at_least(s.findings, Severity::Error) ? StageStatus::Failed
                                                                               : StageStatus::Passed;
        if (s.status == StageStatus::Failed)
        {
            s.reason = "resource limit exceeded";
        }
        Json::Object details;
        details.emplace("wall_ms", num(wall_ms));
        details.emplace("cpu_ms", num(cpu_ms));
        details.emplace("peak_memory_bytes", num(static_cast<double>(peak)));
        details.emplace("max_memory_mb", num(config_.resource_max_memory_mb));
        details.emplace("max_time_seconds", num(config_.resource_max_time_seconds));
        s.details = Json{std::move(details)};
        finish(id, t0);
    }

    OverallStatus overall_status() const
    {
        bool error = false;
        for (const auto& s : report_.stages)
        {
            if (s.status == StageStatus::Failed)
            {
                return OverallStatus::Failed;
            }
            if (s.status == StageStatus::TimedOut || s.status == StageStatus::Error)
            {
                error = true;
            }
        }
        return error ? OverallStatus::Error : OverallStatus::Passed;
    }

    const ValidatorConfig& config_;
    std::shared_ptr<const codegate::policy::PatternRegistry> registry_;
    const codegate::source::SourceUnit& source_;
    const std::optional<std::string>& entry_;
    Clock::time_point started_;
    std::optional<Clock::time_point> deadline_;

    ValidationReport report_;
    std::optional<std::string> halt_reason_;
    bool halted_by_deadline_ = false;
    std::shared_ptr<const codegate::parser::Module> module_;
    std::unique_ptr<codegate::sandbox::Sandbox> sandbox_;
    bool sandbox_ran_ = false;
    codegate::sandbox::BatchUsage property_usage_;
};

bool positive(double d)
{
    return std::isfinite(d) && d > 0.0;
}

} // namespace

std::string_view to_string(StageId id)
{
    switch (id)
    {
    case StageId::Prevalidation:
        return "prevalidation";
    case StageId::StaticAnalysis:
        return "static_analysis";
    case StageId::Sandbox:
        return "sandbox";
    case StageId::PropertyTests:
        return "property_tests";
    case StageId::ResourceGuard:
        return "resource_guard";
    }
    return "unknown";
}

std::string_view to_string(StageStatus status)
{
    switch (status)
    {
    case StageStatus::Passed:
        return "passed";
    case StageStatus::Failed:
        return "failed";
    case StageStatus::Skipped:
        return "skipped";
    case StageStatus::TimedOut:
        return "timed_out";
    case StageStatus::Error:
        return "error";
    }
    return "error";
}

std::string_view to_string(OverallStatus status)
{
    switch (status)
    {
    case OverallStatus::Passed:
        return "passed";
    case OverallStatus::Failed:
        return "failed";
    case OverallStatus::Error:
        return "error";
    }
    return "error";
}

const StageResult* ValidationReport::stage(StageId id) const
{
    for (const auto& s : stages)
    {
        if (s.stage == id)
        {
            return &s;
        }
    }
    return nullptr;
}

std::optional<ConfigError> ValidatorConfig::check() const
{
    if (deadline_seconds.has_value() && !positive(*deadline_seconds))
    {
        return ConfigError{"deadline must be positive"};
    }
    if (max_code_length == 0 || max_lines == 0 || max_nesting_depth == 0)
    {
        return ConfigError{"size ceilings must be positive"};
    }
    if (!positive(analyzer_timeout_seconds))
    {
        return ConfigError{"analyzer timeout must be positive"};
    }
    for (const auto& factory : extra_analyzers)
    {
        if (!factory)
        {
            return ConfigError{"empty analyzer factory"};
        }
    }
    if (!positive(sandbox_timeout_seconds))
    {
        return ConfigError{"sandbox timeout must be positive"};
    }
    if (sandbox_max_memory_mb == 0)
    {
        return ConfigError{"sandbox memory ceiling must be positive"};
    }
    auto sc = sandbox;
    sc.timeout_seconds = sandbox_timeout_seconds;
    sc.max_memory_bytes = static_cast<std::uint64_t>(sandbox_max_memory_mb) * 1024 * 1024;
    if (auto error = codegate::sandbox::check_config(sc))
    {
        return error;
    }
    if (property_test_trial_count == 0)
    {
        return ConfigError{"property trial count must be positive"};
    }
    auto pc = property;
    pc.trials = property_test_trial_count;
    if (auto message = codegate::proptest::check_config(pc); !message.empty())
    {
        return ConfigError{std::move(message)};
    }
    for (const auto& p : properties)
    {
        if (p.name.empty() || !p.predicate)
        {
            return ConfigError{"property needs a name and a predicate"};
        }
    }
    if (!positive(resource_max_memory_mb) || !positive(resource_max_time_seconds))
    {
        return ConfigError{"resource limits must be positive"};
    }
    return std::nullopt;
}

std::shared_ptr<const codegate::policy::PatternRegistry> ValidatorConfig::registry() const
{
    const bool untouched = !replace_forbidden_modules && !replace_forbidden_callables &&
                           !replace_forbidden_attributes && extra_forbidden_modules.empty() &&
                           extra_forbidden_callables.empty() && extra_forbidden_attributes.empty();
    if (untouched)
    {
        return codegate::policy::default_registry();
    }
    auto registry = std::make_shared<codegate::policy::PatternRegistry>(*codegate::policy::default_registry());
    if (replace_forbidden_modules)
    {
        registry->replace_modules(*replace_forbidden_modules);
    }
    if (replace_forbidden_callables)
    {
        registry->replace_callables(*replace_forbidden_callables);
    }
    if (replace_forbidden_attributes)
    {
        registry->replace_attributes(*replace_forbidden_attributes);
    }
    registry->extend_modules(extra_forbidden_modules);
    registry->extend_callables(extra_forbidden_callables);
    registry->extend_attributes(extra_forbidden_attributes);
    return registry;
}

std::variant<Validator, ConfigError> Validator::create(ValidatorConfig config)
{
    if (auto error = config.check())
    {
        return *error;
    }
    auto registry = config.registry();
    return Validator(std::move(config), std::move(registry));
}

ValidationReport Validator::validate(const codegate::source::SourceUnit& source,
                                     const std::optional<std::string>& entry_point) const
{
    PipelineRun run(config_, registry_, source, entry_point);
    return run.run();
}

bool is_safe(std::string_view source)
{
    ValidatorConfig config;
    config.enable_static_analysis = false;
    return is_safe(source, config);
}

bool is_safe(std::string_view source, const ValidatorConfig& config)
{
    auto cfg = config;
    cfg.enable_sandbox = false;
    cfg.enable_property_tests = false;
    cfg.enable_resource_guard = false;
    cfg.stop_on_failure = true;
    auto created = Validator::create(std::move(cfg));
    if (const auto* error = std::get_if<ConfigError>(&created))
    {
        if (debug_enabled())
        {
            std::cerr << "[validator] is_safe: " << error->message << "\n";
        }
        return false;
    }
    const codegate::source::SourceUnit unit{std::string(source)};
    const auto report = std::get<Validator>(created).validate(unit);
    return report.status == OverallStatus::Passed;
}

std::variant<ValidationReport, ConfigError> validate(std::string_view source,
                                                     const std::optional<std::string>& entry_point,
                                                     const ValidatorConfig& config)
{
    auto created = Validator::create(config);
    if (auto* error = std::get_if<ConfigError>(&created))
    {
        return std::move(*error);
    }
    const codegate::source::SourceUnit unit{std::string(source)};
    return std::get<Validator>(created).validate(unit, entry_point);
}

std::variant<codegate::sandbox::ExecutionResult, ConfigError> execute_safe(
    std::string_view source, codegate::sandbox::BackendKind kind, const codegate::sandbox::SandboxConfig& config)
{
    auto made = codegate::sandbox::make_sandbox(kind, config);
    if (auto* error = std::get_if<ConfigError>(&made))
    {
        return std::move(*error);
    }
    return std::get<std::unique_ptr<codegate::sandbox::Sandbox>>(made)->execute(source);
}

} // namespace codegate::validator
