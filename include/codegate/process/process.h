#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/**
 * @file process.h
 * @brief Child process execution with timeout, output cap and resource limits.
 */

namespace codegate::process
{

/** @brief setrlimit values applied in the child before exec. Unset fields are left alone. */
struct ResourceLimits
{
    std::optional<std::uint64_t> address_space_bytes;
    std::optional<std::uint64_t> cpu_seconds;
    std::optional<std::uint64_t> file_size_bytes;
    std::optional<std::uint64_t> max_processes;
    bool disable_core_dumps = true;
};

struct ProcessRequest
{
    /** argv[0] is resolved through PATH when it contains no '/'. */
    std::vector<std::string> argv;
    std::string stdin_data;
    /** When set, the child gets exactly this environment. */
    std::optional<std::vector<std::pair<std::string, std::string>>> env;
    int timeout_ms = 10000;
    std::size_t max_output_bytes = 1024 * 1024;
    ResourceLimits limits;
    /** Child runs in its own process group; timeouts kill the whole group. */
    bool new_process_group = true;
    /** Polled every slice; when it becomes true the child is killed. */
    const std::atomic<bool>* cancel = nullptr;
    /** Called after the child was killed for timeout or cancellation. */
    std::function<void()> on_kill;
};

struct ProcResult
{
    int exit_code = -1;
    /** Signal that terminated the child, 0 when it exited normally. */
    int term_signal = 0;
    std::string out;
    std::string err;
    bool timed_out = false;
    bool cancelled = false;
    bool output_limit_exceeded = false;
    /** The executable could not be found or started. */
    bool spawn_failed = false;
    std::string spawn_error;
    double wall_ms = 0.0;
    double cpu_ms = 0.0;
    std::uint64_t peak_rss_bytes = 0;
};

/**
 * @brief Run a child process to completion, or until it is killed.
 *
 * stdout and stderr are read concurrently through a poll loop; their combined
 * size is capped by `max_output_bytes`. Reaching the cap, the timeout or the
 * cancel flag kills the child (and its process group).
 */
[[nodiscard]] ProcResult run_process(const ProcessRequest& request);

/** @brief Resolve `name` against PATH, or check it directly when it contains '/'. */
[[nodiscard]] std::optional<std::string> find_executable(std::string_view name);

/** @brief A file in the temporary directory, removed when the object is destroyed. */
class TempFile
{
  public:
    /** @brief Create a file whose name ends with `suffix` and write `contents` to it. */
    [[nodiscard]] static std::optional<TempFile> create(std::string_view suffix,
                                                        std::string_view contents);

    TempFile(TempFile&& other) noexcept;
    TempFile& operator=(TempFile&& other) noexcept;
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    ~TempFile();

    [[nodiscard]] const std::string& path() const { return path_; }

  private:
    explicit TempFile(std::string path) : path_(std::move(path)) {}
    std::string path_;
};

} // namespace codegate::process
