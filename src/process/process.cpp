#include <cerrno>
#include <chrono>
#include <codegate/process/process.h>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <pthread.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace codegate::process
{
namespace
{

constexpr int kPollSliceMs = 50;

void set_nonblocking(int fd)
{
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1)
    {
        return;
    }
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

void close_fd(int& fd)
{
    if (fd >= 0)
    {
        close(fd);
        fd = -1;
    }
}

void read_into(int fd, std::string& out, bool& eof, std::size_t& total_bytes,
               std::size_t max_total_bytes, bool& limit_hit)
{
    char buf[4096];
    while (true)
    {
        const ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0)
        {
            const std::size_t count = static_cast<std::size_t>(n);
            if (total_bytes >= max_total_bytes)
            {
                limit_hit = true;
                eof = true;
                return;
            }

            const std::size_t remaining = max_total_bytes - total_bytes;
            const std::size_t to_append = (count <= remaining) ? count : remaining;
            out.append(buf, to_append);
            total_bytes += to_append;
            if (to_append < count)
            {
                limit_hit = true;
                eof = true;
                return;
            }

            continue;
        }
        if (n == 0)
        {
            eof = true;
            return;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
        {
            return;
        }
        eof = true;
        return;
    }
}

// Blocks SIGPIPE on the calling thread while we write to a child's stdin, and
// discards a SIGPIPE raised meanwhile.
class SigpipeGuard
{
  public:
    SigpipeGuard()
    {
        sigemptyset(&set_);
        sigaddset(&set_, SIGPIPE);
        active_ = pthread_sigmask(SIG_BLOCK, &set_, &old_) == 0;
    }

    ~SigpipeGuard()
    {
        if (!active_)
        {
            return;
        }
        sigset_t pending;
        sigemptyset(&pending);
        if (sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1 &&
            sigismember(&old_, SIGPIPE) == 0)
        {
            const timespec zero{0, 0};
            (void)sigtimedwait(&set_, nullptr, &zero);
        }
        (void)pthread_sigmask(SIG_SETMASK, &old_, nullptr);
    }

    SigpipeGuard(const SigpipeGuard&) = delete;
    SigpipeGuard& operator=(const SigpipeGuard&) = delete;

  private:
    sigset_t set_{};
    sigset_t old_{};
    bool active_ = false;
};

void apply_limit(int resource, std::uint64_t value)
{
    struct rlimit rl;
    rl.rlim_cur = static_cast<rlim_t>(value);
    rl.rlim_max = static_cast<rlim_t>(value);
    (void)setrlimit(resource, &rl);
}

// Runs in the forked child: only async-signal-safe calls from here on.
[[noreturn]] void exec_child(const ProcessRequest& request, const char* path, char* const* argv,
                             char* const* envp, int in_fd, int out_fd, int err_fd)
{
    if (request.new_process_group)
    {
        (void)setpgid(0, 0);
    }

    const auto& limits = request.limits;
    if (limits.address_space_bytes.has_value())
    {
        apply_limit(RLIMIT_AS, *limits.address_space_bytes);
    }
    if (limits.cpu_seconds.has_value())
    {
        apply_limit(RLIMIT_CPU, *limits.cpu_seconds);
    }
    if (limits.file_size_bytes.has_value())
    {
        apply_limit(RLIMIT_FSIZE, *limits.file_size_bytes);
    }
    if (limits.max_processes.has_value())
    {
        apply_limit(RLIMIT_NPROC, *limits.max_processes);
    }
    if (limits.disable_core_dumps)
    {
        apply_limit(RLIMIT_CORE, 0);
    }

    (void)dup2(in_fd, STDIN_FILENO);
    (void)dup2(out_fd, STDOUT_FILENO);
    (void)dup2(err_fd, STDERR_FILENO);

    if (envp != nullptr)
    {
        execve(path, argv, envp);
    }
    else
    {
        execv(path, argv);
    }
    static const char msg[] = "codegate: exec failed\n";
    (void)!write(STDERR_FILENO, msg, sizeof(msg) - 1);
    _exit(127);
}

} // namespace

std::optional<std::string> find_executable(std::string_view name)
{
    auto usable = [](const std::string& p)
    {
        struct stat st;
        return stat(p.c_str(), &st) == 0 && S_ISREG(st.st_mode) && access(p.c_str(), X_OK) == 0;
    };

    if (name.empty())
    {
        return std::nullopt;
    }
    if (name.find('/') != std::string_view::npos)
    {
        std::string p(name);
        if (usable(p))
        {
            return p;
        }
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    const std::string_view path = path_env != nullptr ? path_env : "/usr/local/bin:/usr/bin:/bin";
    std::size_t start = 0;
    while (start <= path.size())
    {
        const std::size_t end = path.find(':', start);
        const std::string_view dir =
            path.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
        const std::string candidate = (dir.empty() ? std::string(".") : std::string(dir)) + "/" +
                                      std::string(name);
        if (usable(candidate))
        {
            return candidate;
        }
        if (end == std::string_view::npos)
        {
            break;
        }
        start = end + 1;
    }
    return std::nullopt;
}

ProcResult run_process(const ProcessRequest& request)
{
    ProcResult result;
    if (request.argv.empty())
    {
        result.spawn_failed = true;
        result.spawn_error = "empty command";
        return result;
    }

    const auto exe = find_executable(request.argv.front());
    if (!exe.has_value())
    {
        result.spawn_failed = true;
        result.spawn_error = "executable not found: " + request.argv.front();
        result.exit_code = 127;
        return result;
    }

    // Everything the child needs is prepared before fork.
    std::vector<char*> argv;
    argv.reserve(request.argv.size() + 1);
    for (const auto& a : request.argv)
    {
        argv.push_back(const_cast<char*>(a.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage;
    std::vector<char*> envp;
    if (request.env.has_value())
    {
        env_storage.reserve(request.env->size());
        for (const auto& [key, value] : *request.env)
        {
            env_storage.push_back(key + "=" + value);
        }
        for (auto& e : env_storage)
        {
            envp.push_back(e.data());
        }
        envp.push_back(nullptr);
    }

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (pipe2(in_pipe, O_CLOEXEC) != 0 || pipe2(out_pipe, O_CLOEXEC) != 0 ||
        pipe2(err_pipe, O_CLOEXEC) != 0)
    {
        result.spawn_failed = true;
        result.spawn_error = std::string("pipe failed: ") + std::strerror(errno);
        result.exit_code = 127;
        for (int* p : {in_pipe, out_pipe, err_pipe})
        {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return result;
    }

    SigpipeGuard sigpipe_guard;
    const auto start = std::chrono::steady_clock::now();
    const auto deadline = start + std::chrono::milliseconds(request.timeout_ms);

    const pid_t pid = fork();
    if (pid < 0)
    {
        result.spawn_failed = true;
        result.spawn_error = std::string("fork failed: ") + std::strerror(errno);
        result.exit_code = 127;
        for (int* p : {in_pipe, out_pipe, err_pipe})
        {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return result;
    }

    if (pid == 0)
    {
        exec_child(request, exe->c_str(), argv.data(), request.env.has_value() ? envp.data() : nullptr,
                   in_pipe[0], out_pipe[1], err_pipe[1]);
    }

    if (request.new_process_group)
    {
        (void)setpgid(pid, pid);
    }

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    int in_fd = in_pipe[1];
    if (request.stdin_data.empty())
    {
        close_fd(in_fd);
    }
    else
    {
        set_nonblocking(in_fd);
    }
    set_nonblocking(out_pipe[0]);
    set_nonblocking(err_pipe[0]);

    bool out_eof = false;
    bool err_eof = false;
    bool limit_hit = false;
    std::size_t total_bytes = 0;
    std::size_t written = 0;

    auto cancel_requested = [&]()
    { return request.cancel != nullptr && request.cancel->load(std::memory_order_relaxed); };

    while (!out_eof || !err_eof)
    {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
        {
            result.timed_out = true;
            break;
        }
        if (cancel_requested())
        {
            result.cancelled = true;
            break;
        }

        struct pollfd fds[3];
        nfds_t count = 0;
        if (!out_eof)
        {
            fds[count++] = pollfd{out_pipe[0], POLLIN, 0};
        }
        if (!err_eof)
        {
            fds[count++] = pollfd{err_pipe[0], POLLIN, 0};
        }
        if (in_fd >= 0)
        {
            fds[count++] = pollfd{in_fd, POLLOUT, 0};
        }
        const auto remaining_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        const int poll_ms = remaining_ms < kPollSliceMs ? static_cast<int>(remaining_ms) : kPollSliceMs;
        (void)poll(fds, count, poll_ms);

        if (in_fd >= 0)
        {
            const ssize_t n = write(in_fd, request.stdin_data.data() + written,
                                    request.stdin_data.size() - written);
            if (n > 0)
            {
                written += static_cast<std::size_t>(n);
                if (written == request.stdin_data.size())
                {
                    close_fd(in_fd);
                }
            }
            else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
            {
                close_fd(in_fd);
            }
        }

        if (!out_eof)
        {
            read_into(out_pipe[0], result.out, out_eof, total_bytes, request.max_output_bytes,
                      limit_hit);
        }
        if (!err_eof)
        {
            read_into(err_pipe[0], result.err, err_eof, total_bytes, request.max_output_bytes,
                      limit_hit);
        }

        if (limit_hit)
        {
            result.output_limit_exceeded = true;
            break;
        }
    }

    bool killed = false;
    auto kill_child = [&]()
    {
        if (request.new_process_group)
        {
            (void)kill(-pid, SIGKILL);
        }
        (void)kill(pid, SIGKILL);
        killed = true;
    };

    if (result.timed_out || result.cancelled || result.output_limit_exceeded)
    {
        kill_child();
    }

    close_fd(in_fd);
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);

    // The child may have closed its output but still be running.
    int status = 0;
    struct rusage usage;
    std::memset(&usage, 0, sizeof(usage));
    while (true)
    {
        const pid_t r = wait4(pid, &status, killed ? 0 : WNOHANG, &usage);
        if (r == pid)
        {
            break;
        }
        if (r < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            result.exit_code = 127;
            result.wall_ms = std::chrono::duration<double, std::milli>(
                                 std::chrono::steady_clock::now() - start)
                                 .count();
            return result;
        }
        if (std::chrono::steady_clock::now() >= deadline)
        {
            result.timed_out = true;
            kill_child();
            continue;
        }
        if (cancel_requested())
        {
            result.cancelled = true;
            kill_child();
            continue;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    // Reap stray descendants left in the group.
    if (request.new_process_group)
    {
        (void)kill(-pid, SIGKILL);
    }

    if ((result.timed_out || result.cancelled) && request.on_kill)
    {
        request.on_kill();
    }

    result.wall_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    result.cpu_ms = static_cast<double>(usage.ru_utime.tv_sec + usage.ru_stime.tv_sec) * 1000.0 +
                    static_cast<double>(usage.ru_utime.tv_usec + usage.ru_stime.tv_usec) / 1000.0;
    result.peak_rss_bytes = static_cast<std::uint64_t>(usage.ru_maxrss) * 1024;

    if (WIFEXITED(status))
    {
        result.exit_code = WEXITSTATUS(status);
    }
    else if (WIFSIGNALED(status))
    {
        result.term_signal = WTERMSIG(status);
        result.exit_code = 128 + result.term_signal;
    }
    else
    {
        result.exit_code = 128;
    }
    return result;
}

std::optional<TempFile> TempFile::create(std::string_view suffix, std::string_view contents)
{
    std::error_code ec;
    std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
    if (ec)
    {
        dir = "/tmp";
    }

    std::string pattern = (dir / "codegate-XXXXXX").string() + std::string(suffix);
    const int fd = mkstemps(pattern.data(), static_cast<int>(suffix.size()));
    if (fd < 0)
    {
        return std::nullopt;
    }

    TempFile file(pattern);
    std::size_t done = 0;
    while (done < contents.size())
    {
        const ssize_t n = write(fd, contents.data() + done, contents.size() - done);
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            close(fd);
            return std::nullopt;
        }
        done += static_cast<std::size_t>(n);
    }
    close(fd);
    return file;
}

TempFile::TempFile(TempFile&& other) noexcept : path_(std::move(other.path_))
{
    other.path_.clear();
}

TempFile& TempFile::operator=(TempFile&& other) noexcept
{
    if (this != &other)
    {
        if (!path_.empty())
        {
            (void)unlink(path_.c_str());
        }
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

TempFile::~TempFile()
{
    if (!path_.empty())
    {
        (void)unlink(path_.c_str());
    }
}

} // namespace codegate::process
