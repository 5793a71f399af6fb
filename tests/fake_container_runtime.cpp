#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>
#include <vector>

// Stands in for `docker`. `run ... <image> python3 ARGS` execs the sibling
// fake interpreter with ARGS; `kill NAME` only records the call. Every
// invocation is appended to CODEGATE_FAKE_RUNTIME_LOG when it is set.

#if defined(__GNUC__)
extern "C" void __gcov_flush(void) __attribute__((weak));
static void maybe_gcov_flush()
{
    if (__gcov_flush)
    {
        __gcov_flush();
    }
}
#else
static void maybe_gcov_flush() {}
#endif

static void log_invocation(int argc, char** argv)
{
    const char* log = std::getenv("CODEGATE_FAKE_RUNTIME_LOG");
    if (log == nullptr)
    {
        return;
    }
    std::ofstream out(log, std::ios::app);
    for (int i = 1; i < argc; ++i)
    {
        // The driver script is long; keep the log to one line per call.
        const std::string arg = argv[i];
        out << (i > 1 ? " " : "") << (arg.find('\n') != std::string::npos ? "<script>" : arg);
    }
    out << "\n";
}

int main(int argc, char** argv)
{
    log_invocation(argc, argv);
    if (argc < 2)
    {
        std::cerr << "fake_runtime: missing command\n";
        maybe_gcov_flush();
        return 2;
    }
    if (std::strcmp(argv[1], "kill") == 0)
    {
        maybe_gcov_flush();
        return 0;
    }
    if (std::strcmp(argv[1], "run") != 0)
    {
        std::cerr << "fake_runtime: unknown command " << argv[1] << "\n";
        maybe_gcov_flush();
        return 2;
    }

    int python = -1;
    for (int i = 2; i < argc; ++i)
    {
        if (std::strcmp(argv[i], "python3") == 0)
        {
            python = i;
            break;
        }
    }
    if (python < 0)
    {
        std::cerr << "fake_runtime: no python3 in command\n";
        maybe_gcov_flush();
        return 125;
    }

    std::error_code ec;
    const auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec)
    {
        std::cerr << "fake_runtime: cannot locate itself\n";
        maybe_gcov_flush();
        return 125;
    }
    const std::string interpreter = (self.parent_path() / "codegate_fake_python").string();

    std::vector<char*> child_argv;
    child_argv.push_back(const_cast<char*>(interpreter.c_str()));
    for (int i = python + 1; i < argc; ++i)
    {
        child_argv.push_back(argv[i]);
    }
    child_argv.push_back(nullptr);

    maybe_gcov_flush();
    execv(child_argv[0], child_argv.data());
    std::cerr << "fake_runtime: execv failed: " << std::strerror(errno) << "\n";
    maybe_gcov_flush();
    return 127;
}
