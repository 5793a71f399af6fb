#include <charconv>
#include <codegate/cli/cli.h>
#include <codegate/diag/render.h>
#include <codegate/report/report.h>
#include <codegate/sandbox/sandbox.h>
#include <codegate/source/source_unit.h>
#include <codegate/validator/validator.h>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#ifndef CODEGATE_VERSION
#define CODEGATE_VERSION "0.0.0"
#endif
#ifndef CODEGATE_GIT_SHA
#define CODEGATE_GIT_SHA "unknown"
#endif
#ifndef CODEGATE_BUILD_TYPE
#define CODEGATE_BUILD_TYPE "unknown"
#endif

namespace codegate::cli
{

namespace
{

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;
constexpr int kExitError = 3;

void print_usage(std::ostream& out)
{
    out << "codegate: multi-stage validator for generated Python code\n\n";
    out << "usage:\n";
    out << "  codegate --help\n";
    out << "  codegate --version\n";
    out << "  codegate check [--analyzer <name>]... [--json] <file.py>\n";
    out << "  codegate validate [options] <file.py>\n";
    out << "  codegate run [--backend <kind>] [--timeout <s>] [--memory-mb <n>] [--json] <file.py>\n";
    out << "\n";
    out << "options:\n";
    out << "  --entry <name>          function to property test\n";
    out << "  --backend <kind>        restricted, subprocess (default) or container\n";
    out << "  --timeout <s>           sandbox wall-clock timeout in seconds\n";
    out << "  --memory-mb <n>         sandbox memory ceiling\n";
    out << "  --trials <n>            property test trials\n";
    out << "  --seed <n>              property test seed\n";
    out << "  --no-stop-on-failure    run every stage even after a failure\n";
    out << "  --no-static             skip static analysis\n";
    out << "  --no-sandbox            skip sandbox execution\n";
    out << "  --no-property           skip property tests\n";
    out << "  --analyzer <name>       ruff, mypy, bandit or conditions; repeatable, replaces the defaults\n";
    out << "  --deadline <s>          overall bound on the validation\n";
    out << "  --json                  print the report as JSON\n";
    out << "\n";
    out << "A file name of '-' reads the source from standard input.\n";
}

bool is_help_flag(std::string_view arg)
{
    return arg == "--help" || arg == "-h" || arg == "help";
}

std::optional<std::uint64_t> parse_count(std::string_view text)
{
    std::uint64_t value = 0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end || text.empty())
    {
        return std::nullopt;
    }
    return value;
}

std::optional<double> parse_seconds(std::string_view text)
{
    double value = 0.0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end || text.empty())
    {
        return std::nullopt;
    }
    return value;
}

struct Options
{
    std::optional<std::string> path;
    std::optional<std::string> entry;
    std::optional<codegate::sandbox::BackendKind> backend;
    std::optional<double> timeout;
    std::optional<std::uint64_t> memory_mb;
    std::optional<std::uint64_t> trials;
    std::optional<std::uint64_t> seed;
    std::optional<double> deadline;
    std::vector<std::string> analyzers;
    bool stop_on_failure = true;
    bool no_static = false;
    bool no_sandbox = false;
    bool no_property = false;
    bool json = false;
};

/** Names accepted by each subcommand, besides the file. */
struct Accepts
{
    bool validate_flags = false;
    bool sandbox_flags = false;
    bool analyzer_flag = false;
};

/** Parses `args`; prints the problem and returns nullopt on a usage error. */
std::optional<Options> parse_options(std::string_view cmd, const std::vector<std::string_view>& args,
                                     Accepts accepts)
{
    Options opts;
    const auto usage_error = [&](const std::string& message) -> std::optional<Options>
    {
        std::cerr << "error: " << message << "\n\n";
        print_usage(std::cerr);
        return std::nullopt;
    };

    for (std::size_t i = 0; i < args.size();)
    {
        std::string_view a = args[i];
        std::optional<std::string_view> inline_value;
        if (a.starts_with("--"))
        {
            if (const auto eq = a.find('='); eq != std::string_view::npos)
            {
                inline_value = a.substr(eq + 1);
                a = a.substr(0, eq);
            }
        }

        const bool takes_value = a == "--entry" || a == "--backend" || a == "--timeout" ||
                                 a == "--memory-mb" || a == "--trials" || a == "--seed" ||
                                 a == "--analyzer" || a == "--deadline";
        const bool allowed =
            a == "--json" ||
            (accepts.validate_flags &&
             (a == "--entry" || a == "--trials" || a == "--seed" || a == "--no-stop-on-failure" ||
              a == "--no-static" || a == "--no-sandbox" || a == "--no-property" || a == "--deadline")) ||
            (accepts.sandbox_flags && (a == "--backend" || a == "--timeout" || a == "--memory-mb")) ||
            (accepts.analyzer_flag && a == "--analyzer");

        if (a.starts_with('-') && a != "-")
        {
            if (!allowed)
            {
                return usage_error("unknown option for " + std::string(cmd) + ": " + std::string(a));
            }
            std::string_view value;
            if (takes_value)
            {
                if (inline_value.has_value())
                {
                    value = *inline_value;
                    ++i;
                }
                else if (i + 1 < args.size())
                {
                    value = args[i + 1];
                    i += 2;
                }
                else
                {
                    return usage_error("expected a value after " + std::string(a));
                }
                if (value.empty())
                {
                    return usage_error("expected a value after " + std::string(a));
                }
            }
            else
            {
                if (inline_value.has_value())
                {
                    return usage_error(std::string(a) + " takes no value");
                }
                ++i;
            }

            if (a == "--json")
            {
                opts.json = true;
            }
            else if (a == "--entry")
            {
                opts.entry = std::string(value);
            }
            else if (a == "--backend")
            {
                opts.backend = codegate::sandbox::backend_from_string(value);
                if (!opts.backend.has_value())
                {
                    return usage_error("unknown backend: " + std::string(value));
                }
            }
            else if (a == "--timeout" || a == "--deadline")
            {
                const auto seconds = parse_seconds(value);
                if (!seconds.has_value() || !(*seconds > 0.0))
                {
                    return usage_error(std::string(a) + " expects a positive number of seconds");
                }
                (a == "--timeout" ? opts.timeout : opts.deadline) = *seconds;
            }
            else if (a == "--memory-mb" || a == "--trials")
            {
                const auto n = parse_count(value);
                if (!n.has_value() || *n == 0)
                {
                    return usage_error(std::string(a) + " expects a positive integer");
                }
                (a == "--memory-mb" ? opts.memory_mb : opts.trials) = *n;
            }
            else if (a == "--seed")
            {
                opts.seed = parse_count(value);
                if (!opts.seed.has_value())
                {
                    return usage_error("--seed expects a non-negative integer");
                }
            }
            else if (a == "--analyzer")
            {
                if (value != "ruff" && value != "mypy" && value != "bandit" && value != "conditions")
                {
                    return usage_error("unknown analyzer: " + std::string(value));
                }
                opts.analyzers.emplace_back(value);
            }
            else if (a == "--no-stop-on-failure")
            {
                opts.stop_on_failure = false;
            }
            else if (a == "--no-static")
            {
                opts.no_static = true;
            }
            else if (a == "--no-sandbox")
            {
                opts.no_sandbox = true;
            }
            else if (a == "--no-property")
            {
                opts.no_property = true;
            }
            continue;
        }

        if (opts.path.has_value())
        {
            return usage_error("expected a single <file.py>");
        }
        opts.path = std::string(a);
        ++i;
    }

    if (!opts.path.has_value())
    {
        return usage_error("expected <file.py>");
    }
    return opts;
}

std::optional<codegate::source::SourceUnit> load(const std::string& path)
{
    auto loaded = path == "-" ? codegate::source::load_source_stream(std::cin, "<stdin>")
                              : codegate::source::load_source_file(path);
    if (auto* err = std::get_if<codegate::source::LoadError>(&loaded))
    {
        std::cerr << "error: " << err->message << "\n";
        return std::nullopt;
    }
    return std::move(std::get<codegate::source::SourceUnit>(loaded));
}

void apply_analyzers(const Options& opts, codegate::validator::ValidatorConfig& config)
{
    if (opts.analyzers.empty())
    {
        return;
    }
    const auto wants = [&opts](std::string_view name)
    {
        for (const auto& a : opts.analyzers)
        {
            if (a == name)
            {
                return true;
            }
        }
        return false;
    };
    config.enable_condition_analyzer = wants("conditions");
    config.use_ruff = wants("ruff");
    config.use_mypy = wants("mypy");
    config.use_bandit = wants("bandit");
}

void apply_sandbox(const Options& opts, codegate::validator::ValidatorConfig& config)
{
    if (opts.backend.has_value())
    {
        config.sandbox_backend = *opts.backend;
    }
    if (opts.timeout.has_value())
    {
        config.sandbox_timeout_seconds = *opts.timeout;
    }
    if (opts.memory_mb.has_value())
    {
        config.sandbox_max_memory_mb = static_cast<std::size_t>(*opts.memory_mb);
    }
}

int exit_code_for(codegate::validator::OverallStatus status)
{
    switch (status)
    {
    case codegate::validator::OverallStatus::Passed:
        return kExitOk;
    case codegate::validator::OverallStatus::Failed:
        return kExitFailed;
    case codegate::validator::OverallStatus::Error:
        return kExitError;
    }
    return kExitError;
}

std::optional<codegate::validator::Validator> make_validator(codegate::validator::ValidatorConfig config)
{
    auto created = codegate::validator::Validator::create(std::move(config));
    if (const auto* error = std::get_if<codegate::validator::ConfigError>(&created))
    {
        std::cerr << "error: invalid configuration: " << error->message << "\n";
        return std::nullopt;
    }
    return std::move(std::get<codegate::validator::Validator>(created));
}

int cmd_check(const Options& opts)
{
    const auto unit = load(*opts.path);
    if (!unit.has_value())
    {
        return kExitError;
    }
    codegate::validator::ValidatorConfig config;
    config.enable_static_analysis = !opts.analyzers.empty();
    apply_analyzers(opts, config);
    config.enable_sandbox = false;
    config.enable_property_tests = false;
    config.enable_resource_guard = false;
    const auto validator = make_validator(std::move(config));
    if (!validator.has_value())
    {
        return kExitError;
    }

    const auto report = validator->validate(*unit);
    if (opts.json)
    {
        std::cout << codegate::report::to_json(report);
    }
    else
    {
        for (const auto& stage : report.stages)
        {
            for (const auto& f : stage.findings)
            {
                std::cout << codegate::diag::render(f, *unit);
            }
        }
        std::cout << "codegate check: " << (report.status == codegate::validator::OverallStatus::Passed ? "ok" : "unsafe")
                  << "\n";
    }
    return report.status == codegate::validator::OverallStatus::Passed ? kExitOk : kExitFailed;
}

int cmd_validate(const Options& opts)
{
    const auto unit = load(*opts.path);
    if (!unit.has_value())
    {
        return kExitError;
    }
    codegate::validator::ValidatorConfig config;
    config.stop_on_failure = opts.stop_on_failure;
    config.deadline_seconds = opts.deadline;
    config.enable_static_analysis = !opts.no_static;
    config.enable_sandbox = !opts.no_sandbox;
    config.enable_property_tests = !opts.no_property;
    apply_analyzers(opts, config);
    apply_sandbox(opts, config);
    if (opts.trials.has_value())
    {
        config.property_test_trial_count = static_cast<std::size_t>(*opts.trials);
    }
    if (opts.seed.has_value())
    {
        config.property.seed = *opts.seed;
    }
    const auto validator = make_validator(std::move(config));
    if (!validator.has_value())
    {
        return kExitError;
    }

    const auto report = validator->validate(*unit, opts.entry);
    if (opts.json)
    {
        std::cout << codegate::report::to_json(report);
    }
    else
    {
        std::cout << codegate::report::to_text(report, *unit);
    }
    return exit_code_for(report.status);
}

int cmd_run(const Options& opts)
{
    const auto unit = load(*opts.path);
    if (!unit.has_value())
    {
        return kExitError;
    }
    codegate::sandbox::SandboxConfig config;
    if (opts.timeout.has_value())
    {
        config.timeout_seconds = *opts.timeout;
    }
    if (opts.memory_mb.has_value())
    {
        config.max_memory_bytes = *opts.memory_mb * 1024 * 1024;
    }
    const auto kind = opts.backend.value_or(codegate::sandbox::BackendKind::Subprocess);
    const auto executed = codegate::validator::execute_safe(unit->text(), kind, config);
    if (const auto* error = std::get_if<codegate::validator::ConfigError>(&executed))
    {
        std::cerr << "error: invalid configuration: " << error->message << "\n";
        return kExitError;
    }
    const auto& result = std::get<codegate::sandbox::ExecutionResult>(executed);
    if (opts.json)
    {
        std::cout << codegate::report::to_json(result);
    }
    else
    {
        std::cout << result.stdout_text;
        std::cerr << result.stderr_text;
        std::cerr << "codegate run: " << codegate::sandbox::to_string(result.state) << " ("
                  << codegate::sandbox::to_string(result.exit) << ")";
        if (!result.backend_error.empty())
        {
            std::cerr << ": " << result.backend_error;
        }
        std::cerr << "\n";
    }
    if (result.ok())
    {
        return kExitOk;
    }
    return result.backend_error.empty() ? kExitFailed : kExitError;
}

} // namespace

int run(int argc, char** argv)
{
    if (argc <= 1)
    {
        print_usage(std::cerr);
        return kExitUsage;
    }

    const std::string_view cmd = argv[1];
    if (is_help_flag(cmd))
    {
        print_usage(std::cout);
        return kExitOk;
    }
    if (cmd == "--version")
    {
        std::cout << "codegate " << CODEGATE_VERSION << " sha=" << CODEGATE_GIT_SHA
                  << " build=" << CODEGATE_BUILD_TYPE << "\n";
        return kExitOk;
    }

    std::vector<std::string_view> args;
    for (int i = 2; i < argc; ++i)
    {
        args.push_back(argv[i]);
    }
    for (const auto a : args)
    {
        if (is_help_flag(a))
        {
            print_usage(std::cout);
            return kExitOk;
        }
    }

    if (cmd == "check")
    {
        const auto opts = parse_options(cmd, args, Accepts{.analyzer_flag = true});
        return opts.has_value() ? cmd_check(*opts) : kExitUsage;
    }
    if (cmd == "validate")
    {
        const auto opts = parse_options(
            cmd, args, Accepts{.validate_flags = true, .sandbox_flags = true, .analyzer_flag = true});
        return opts.has_value() ? cmd_validate(*opts) : kExitUsage;
    }
    if (cmd == "run")
    {
        const auto opts = parse_options(cmd, args, Accepts{.sandbox_flags = true});
        return opts.has_value() ? cmd_run(*opts) : kExitUsage;
    }

    std::cerr << "error: unknown command: " << cmd << "\n\n";
    print_usage(std::cerr);
    return kExitUsage;
}

} // namespace codegate::cli
