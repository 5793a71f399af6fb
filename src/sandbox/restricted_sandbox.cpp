#include <algorithm>
#include <atomic>
#include <chrono>
#include <codegate/interp/interpreter.h>
#include <codegate/parser/parser.h>
#include <codegate/sandbox/restricted_sandbox.h>
#include <condition_variable>
#include <cstring>
#include <ctime>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <pthread.h>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace codegate::sandbox
{

namespace interp = codegate::interp;

struct RestrictedSandbox::Session
{
    /** The tree holds views into this text. */
    std::string text;
    codegate::parser::Module module;
    std::atomic<bool> cancel{false};
    std::unique_ptr<interp::Interpreter> interpreter;
    std::shared_ptr<const codegate::policy::PatternRegistry> registry;
    interp::Limits limits;
    double timeout_seconds = 10.0;
    /** Set once a call ended fatally; the next batch starts from a fresh run of the module. */
    bool stopped = false;

    void make_interpreter()
    {
        interpreter = std::make_unique<interp::Interpreter>(registry, limits, &cancel);
    }
};

namespace
{

// Deep recursion in the tree walker needs far more than the default 8 MB.
constexpr std::size_t kWorkerStackBytes = 256ull * 1024 * 1024;

double thread_cpu_ms()
{
    timespec ts{};
    if (clock_gettime(CLOCK_THREAD_CPUTIME_ID, &ts) != 0)
    {
        return 0.0;
    }
    return static_cast<double>(ts.tv_sec) * 1000.0 + static_cast<double>(ts.tv_nsec) / 1e6;
}

struct WorkerJob
{
    std::function<void()> work;
    std::mutex mutex;
    std::condition_variable done_cv;
    bool done = false;
    double cpu_ms = 0.0;
};

void* worker_main(void* arg)
{
    auto* job = static_cast<WorkerJob*>(arg);
    const double start = thread_cpu_ms();
    job->work();
    const double cpu = thread_cpu_ms() - start;
    {
        std::lock_guard<std::mutex> lock(job->mutex);
        job->cpu_ms = cpu;
        job->done = true;
    }
    job->done_cv.notify_all();
    return nullptr;
}

struct WorkerStats
{
    bool timed_out = false;
    double wall_ms = 0.0;
    double cpu_ms = 0.0;
    /** Set when the worker thread could not be started. */
    std::string error;
};

/**
 * @brief Run `work` on a fresh thread and wait at most `timeout_seconds`.
 *
 * On timeout `cancel` is raised and the worker is still joined: the
 * interpreter polls the flag, so it unwinds promptly.
 */
WorkerStats run_on_worker(std::function<void()> work, double timeout_seconds,
                          std::atomic<bool>& cancel)
{
    WorkerStats stats;
    WorkerJob job;
    job.work = std::move(work);

    pthread_attr_t attr;
    pthread_attr_init(&attr);
    pthread_attr_setstacksize(&attr, kWorkerStackBytes);
    const auto start = std::chrono::steady_clock::now();
    pthread_t thread;
    const int rc = pthread_create(&thread, &attr, worker_main, &job);
    pthread_attr_destroy(&attr);
    if (rc != 0)
    {
        stats.error = std::string("failed to start interpreter thread: ") + std::strerror(rc);
        return stats;
    }

    {
        std::unique_lock<std::mutex> lock(job.mutex);
        const auto deadline =
            start + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                        std::chrono::duration<double>(timeout_seconds));
        if (!job.done_cv.wait_until(lock, deadline, [&job] { return job.done; }))
        {
            stats.timed_out = true;
            cancel.store(true);
            job.done_cv.wait(lock, [&job] { return job.done; });
        }
    }
    pthread_join(thread, nullptr);

    stats.wall_ms = std::chrono::duration<double, std::milli>(
                        std::chrono::steady_clock::now() - start)
                        .count();
    stats.cpu_ms = job.cpu_ms;
    return stats;
}

ExceptionSummary summary_of(const interp::Outcome& outcome)
{
    switch (outcome.kind)
    {
    case interp::Outcome::Kind::Forbidden:
        return ExceptionSummary{.type = "PolicyViolation", .message = outcome.message};
    case interp::Outcome::Kind::Timeout:
        return ExceptionSummary{.type = "TimeoutError", .message = "execution timed out"};
    case interp::Outcome::Kind::MemoryExceeded:
        return ExceptionSummary{.type = "MemoryError", .message = outcome.message};
    case interp::Outcome::Kind::Ok:
    case interp::Outcome::Kind::Raised:
        break;
    }
    return ExceptionSummary{.type = outcome.exception_type, .message = outcome.message};
}

bool is_fatal(const interp::Outcome& outcome)
{
    return outcome.kind == interp::Outcome::Kind::Timeout ||
           outcome.kind == interp::Outcome::Kind::MemoryExceeded ||
           outcome.kind == interp::Outcome::Kind::Forbidden;
}

ExitClass exit_of(const interp::Outcome& outcome)
{
    switch (outcome.kind)
    {
    case interp::Outcome::Kind::Ok:
        return ExitClass::Ok;
    case interp::Outcome::Kind::Raised:
        return ExitClass::RuntimeError;
    case interp::Outcome::Kind::Timeout:
        return ExitClass::Timeout;
    case interp::Outcome::Kind::MemoryExceeded:
        return ExitClass::Oom;
    case interp::Outcome::Kind::Forbidden:
        return ExitClass::ForbiddenOperation;
    }
    return ExitClass::RuntimeError;
}

std::vector<Value> copy_args(const std::vector<Value>& args)
{
    std::vector<Value> out;
    out.reserve(args.size());
    for (const auto& arg : args)
    {
        out.push_back(codegate::runtime::deep_copy(arg));
    }
    return out;
}

class RestrictedCallable final : public BatchCallable
{
  public:
    RestrictedCallable(std::shared_ptr<RestrictedSandbox::Session> session, std::string name)
        : session_(std::move(session)), name_(std::move(name))
    {
    }

    std::vector<CallOutcome> call_batch(const std::vector<std::vector<Value>>& inputs) override
    {
        std::vector<CallOutcome> outcomes;
        if (inputs.empty())
        {
            return outcomes;
        }
        CallOutcome stopped;
        stopped.kind = CallOutcome::Kind::Failed;
        stopped.exit = ExitClass::RuntimeError;
        if (session_->stopped)
        {
            if (auto failure = restart(); failure.has_value())
            {
                return std::vector<CallOutcome>(inputs.size(), *failure);
            }
        }

        session_->cancel.store(false);
        auto& in = *session_->interpreter;
        const auto stats = run_on_worker(
            [&]
            {
                for (const auto& args : inputs)
                {
                    const auto outcome = in.call(name_, copy_args(args));
                    CallOutcome call;
                    call.exit = exit_of(outcome);
                    if (outcome.kind == interp::Outcome::Kind::Ok)
                    {
                        call.kind = CallOutcome::Kind::Returned;
                        call.value = codegate::runtime::deep_copy(outcome.value);
                    }
                    else
                    {
                        call.kind = outcome.kind == interp::Outcome::Kind::Raised
                                        ? CallOutcome::Kind::Raised
                                        : CallOutcome::Kind::Failed;
                        call.exception = summary_of(outcome);
                    }
                    outcomes.push_back(std::move(call));
                    if (is_fatal(outcome))
                    {
                        stopped.exit = outcomes.back().exit;
                        break;
                    }
                }
            },
            session_->timeout_seconds, session_->cancel);

        usage_.wall_ms += stats.wall_ms;
        usage_.cpu_ms += stats.cpu_ms;
        usage_.peak_memory_bytes =
            std::max(usage_.peak_memory_bytes, in.peak_memory_growth());
        if (!stats.error.empty())
        {
            stopped.exception = ExceptionSummary{.type = "SandboxError", .message = stats.error};
            return std::vector<CallOutcome>(inputs.size(), stopped);
        }
        if (stats.timed_out && !outcomes.empty() &&
            outcomes.back().kind == CallOutcome::Kind::Returned)
        {
            // The last call finished after the deadline.
            outcomes.back().kind = CallOutcome::Kind::Failed;
            outcomes.back().exit = ExitClass::Timeout;
            outcomes.back().exception =
                ExceptionSummary{.type = "TimeoutError", .message = "execution timed out"};
        }
        if (outcomes.size() < inputs.size() || stats.timed_out)
        {
            // Calls after the fatal one never ran; they carry its exit class and are
            // ordered after it, so the failure stays attributed to the call that caused it.
            session_->stopped = true;
            if (stats.timed_out)
            {
                stopped.exit = ExitClass::Timeout;
            }
            stopped.exception = ExceptionSummary{
                .type = "SandboxError",
                .message = "not run: call " + std::to_string(outcomes.size()) + " of the batch ended it (" +
                           std::string(to_string(stopped.exit)) + ")"};
            outcomes.resize(inputs.size(), stopped);
        }
        return outcomes;
    }

    BatchUsage usage() const override { return usage_; }

  private:
    /** Replaces a stopped interpreter by re-running the module; the failure when that run fails. */
    std::optional<CallOutcome> restart()
    {
        session_->cancel.store(false);
        session_->make_interpreter();
        auto& in = *session_->interpreter;
        interp::Outcome outcome;
        const auto stats = run_on_worker([&] { outcome = in.run(session_->module); },
                                         session_->timeout_seconds, session_->cancel);
        usage_.wall_ms += stats.wall_ms;
        usage_.cpu_ms += stats.cpu_ms;

        CallOutcome failure;
        failure.kind = CallOutcome::Kind::Failed;
        if (!stats.error.empty())
        {
            failure.exit = ExitClass::RuntimeError;
            failure.exception = ExceptionSummary{.type = "SandboxError", .message = stats.error};
            return failure;
        }
        if (stats.timed_out || outcome.kind != interp::Outcome::Kind::Ok)
        {
            failure.exit = stats.timed_out ? ExitClass::Timeout : exit_of(outcome);
            failure.exception = stats.timed_out
                                    ? ExceptionSummary{.type = "TimeoutError", .message = "execution timed out"}
                                    : summary_of(outcome);
            failure.exception.message = "module re-run failed: " + failure.exception.message;
            return failure;
        }
        session_->stopped = false;
        return std::nullopt;
    }

    std::shared_ptr<RestrictedSandbox::Session> session_;
    std::string name_;
    BatchUsage usage_;
};

std::string capped(std::string text, std::size_t cap, bool& truncated)
{
    if (text.size() > cap)
    {
        text.resize(cap);
        truncated = true;
    }
    return text;
}

} // namespace

RestrictedSandbox::~RestrictedSandbox() = default;

ExecutionResult RestrictedSandbox::run(std::string_view source,
                                       const std::optional<std::string>& entry_point,
                                       const std::vector<Value>& inputs)
{
    ExecutionResult result;
    auto session = std::make_shared<Session>();
    session->text = std::string(source);
    auto parsed = codegate::parser::parse_source(session->text);
    if (const auto* errors = std::get_if<std::vector<codegate::diag::Finding>>(&parsed))
    {
        std::string message = errors->empty() ? "invalid syntax" : errors->front().message;
        if (!errors->empty() && errors->front().line > 0)
        {
            message += " (line " + std::to_string(errors->front().line) + ")";
        }
        result.state = SandboxState::Completed;
        result.exit = ExitClass::RuntimeError;
        result.exception = ExceptionSummary{.type = "SyntaxError", .message = message};
        result.stderr_text = capped("SyntaxError: " + message + "\n", config().max_output_bytes,
                                    result.stderr_truncated);
        return result;
    }

    session->module = std::move(std::get<codegate::parser::Module>(parsed));
    session->timeout_seconds = config().timeout_seconds;
    session->registry = config().registry;
    session->limits = interp::Limits{
        .max_output_bytes = config().max_output_bytes,
        .max_memory_bytes = config().max_memory_bytes,
        .max_recursion_depth = config().max_recursion_depth,
    };
    session->make_interpreter();

    interp::Outcome outcome;
    auto& in = *session->interpreter;
    const auto stats = run_on_worker(
        [&]
        {
            outcome = in.run(session->module);
            if (outcome.kind == interp::Outcome::Kind::Ok && entry_point.has_value())
            {
                outcome = in.call(*entry_point, copy_args(inputs));
            }
        },
        config().timeout_seconds, session->cancel);

    result.wall_ms = stats.wall_ms;
    result.cpu_ms = stats.cpu_ms;
    result.peak_memory_bytes = in.peak_memory_growth();
    if (!stats.error.empty())
    {
        result.state = SandboxState::Crashed;
        result.exit = ExitClass::RuntimeError;
        result.backend_error = stats.error;
        return result;
    }

    result.stdout_text = in.output();
    result.stdout_truncated = in.output_truncated();
    result.exit = stats.timed_out ? ExitClass::Timeout : exit_of(outcome);
    result.state = state_for(result.exit);
    if (result.exit == ExitClass::Ok)
    {
        if (entry_point.has_value())
        {
            result.return_value = outcome.value;
        }
        session_ = std::move(session);
        return result;
    }

    result.exception = stats.timed_out
                           ? ExceptionSummary{.type = "TimeoutError", .message = "execution timed out"}
                           : summary_of(outcome);
    result.stderr_text = capped(result.exception->type + ": " + result.exception->message + "\n",
                                config().max_output_bytes, result.stderr_truncated);
    return result;
}

std::unique_ptr<BatchCallable> RestrictedSandbox::callable(const std::string& name)
{
    if (!last_run_ok() || session_ == nullptr || !session_->interpreter->has_callable(name))
    {
        return nullptr;
    }
    return std::make_unique<RestrictedCallable>(session_, name);
}

} // namespace codegate::sandbox
