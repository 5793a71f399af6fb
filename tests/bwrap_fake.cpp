#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <set>
#include <string>
#include <unistd.h>
#include <vector>

// Stands in for bwrap. Parses the options the subprocess backend passes,
// refuses to run without network isolation and a root mount, marks the
// environment and execs the command after `--`.

namespace
{

/** Number of operands taken by a bwrap option, or -1 when unknown. */
int operand_count(const std::string& opt)
{
    static const std::set<std::string> two{"--bind", "--ro-bind", "--dev-bind"};
    static const std::set<std::string> one{"--dev", "--proc", "--tmpfs", "--chdir"};
    static const std::set<std::string> none{"--unshare-net", "--unshare-pid", "--unshare-all",
                                            "--die-with-parent", "--new-session"};
    if (two.count(opt) != 0)
    {
        return 2;
    }
    if (one.count(opt) != 0)
    {
        return 1;
    }
    if (none.count(opt) != 0)
    {
        return 0;
    }
    return -1;
}

} // namespace

int main(int argc, char** argv)
{
    std::set<std::string> seen;
    bool root_mounted = false;
    int i = 1;
    while (i < argc && std::strcmp(argv[i], "--") != 0)
    {
        const std::string opt = argv[i];
        const int n = operand_count(opt);
        if (n < 0)
        {
            std::cerr << "bwrap_fake: unknown option " << opt << "\n";
            return 2;
        }
        if (i + n >= argc)
        {
            std::cerr << "bwrap_fake: " << opt << " needs " << n << " operand(s)\n";
            return 2;
        }
        if (n == 2 && std::strcmp(argv[i + 2], "/") == 0)
        {
            root_mounted = true;
        }
        seen.insert(opt);
        i += 1 + n;
    }

    if (i + 1 >= argc)
    {
        std::cerr << "bwrap_fake: missing -- COMMAND\n";
        return 2;
    }
    if (seen.count("--unshare-net") == 0 || seen.count("--die-with-parent") == 0 || !root_mounted)
    {
        std::cerr << "bwrap_fake: expected --unshare-net, --die-with-parent and a root mount\n";
        return 3;
    }

    (void)setenv("CODEGATE_SANDBOXED", "1", 1);

    std::vector<char*> child_argv(argv + i + 1, argv + argc);
    child_argv.push_back(nullptr);
    execv(child_argv[0], child_argv.data());
    std::cerr << "bwrap_fake: execv " << child_argv[0] << " failed: " << std::strerror(errno) << "\n";
    return 127;
}
