#include <cctype>
#include <codegate/cli/cli.h>
#include <codegate/process/process.h>
#include <codegate/support/json.h>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

[[noreturn]] static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static int run_cli_capture(const std::vector<std::string>& argv_storage, std::string& out,
                           std::string& err)
{
    std::ostringstream captured_out;
    std::ostringstream captured_err;

    auto* old_out = std::cout.rdbuf(captured_out.rdbuf());
    auto* old_err = std::cerr.rdbuf(captured_err.rdbuf());

    std::vector<std::string> args = argv_storage;
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (auto& s : args)
    {
        argv.push_back(s.data());
    }

    const int rc = codegate::cli::run(static_cast<int>(argv.size()), argv.data());

    std::cout.rdbuf(old_out);
    std::cerr.rdbuf(old_err);

    out = captured_out.str();
    err = captured_err.str();
    return rc;
}

static void expect_contains(const std::string& haystack, const std::string& needle,
                            const std::string& what)
{
    if (haystack.find(needle) == std::string::npos)
    {
        fail("expected " + what + " to contain '" + needle + "'\n---\n" + haystack + "\n---");
    }
}

static codegate::process::TempFile source_file(const std::string& text)
{
    auto file = codegate::process::TempFile::create(".py", text);
    if (!file.has_value())
    {
        fail("unable to create a temporary source file");
    }
    return std::move(*file);
}

int main()
{
    struct EnvVarGuard
    {
        std::string key;
        bool had_old = false;
        std::string old;

        explicit EnvVarGuard(const char* k) : key(k)
        {
            if (const char* v = std::getenv(k); v != nullptr)
            {
                had_old = true;
                old = v;
            }
        }

        void set(const char* v) const { (void)setenv(key.c_str(), v, 1); }

        ~EnvVarGuard()
        {
            if (had_old)
            {
                (void)setenv(key.c_str(), old.c_str(), 1);
            }
            else
            {
                (void)unsetenv(key.c_str());
            }
        }
    };

    std::string out;
    std::string err;

    // version
    {
        const int rc = run_cli_capture({"codegate", "--version"}, out, err);
        if (rc != 0 || !err.empty())
        {
            fail("expected --version to exit 0 quietly");
        }
        if (out.rfind("codegate ", 0) != 0 || out.find(" sha=") == std::string::npos ||
            out.find(" build=") == std::string::npos || out.back() != '\n')
        {
            fail("unexpected version line: " + out);
        }
        const std::string version = out.substr(9, out.find(' ', 9) - 9);
        if (version.empty() || !std::isdigit(static_cast<unsigned char>(version.front())))
        {
            fail("expected a numeric version: " + version);
        }
    }

    // help
    for (const std::string flag : {"--help", "-h", "help"})
    {
        if (run_cli_capture({"codegate", flag}, out, err) != 0)
        {
            fail("expected " + flag + " to exit 0");
        }
        expect_contains(out, "usage:", "help output");
        expect_contains(out, "--no-stop-on-failure", "help output");
    }
    if (run_cli_capture({"codegate", "validate", "--help"}, out, err) != 0)
    {
        fail("expected subcommand help to exit 0");
    }

    const auto safe = source_file("def double(x: int) -> int:\n    return 2 * x\n");
    const auto unsafe = source_file("import os\nos.system('id')\n");

    // usage errors
    {
        const std::vector<std::vector<std::string>> bad{
            {"codegate"},
            {"codegate", "frobnicate", safe.path()},
            {"codegate", "validate"},
            {"codegate", "validate", safe.path(), safe.path()},
            {"codegate", "check", "--timeout", "1", safe.path()},
            {"codegate", "run", "--entry", "f", safe.path()},
            {"codegate", "validate", "--trials", "0", safe.path()},
            {"codegate", "validate", "--timeout", "-1", safe.path()},
            {"codegate", "validate", "--backend=vm", safe.path()},
            {"codegate", "validate", "--analyzer", "pylint", safe.path()},
            {"codegate", "validate", "--json=yes", safe.path()},
            {"codegate", "validate", safe.path(), "--entry"},
            {"codegate", "validate", "--seed", "-3", safe.path()},
        };
        for (const auto& args : bad)
        {
            if (run_cli_capture(args, out, err) != 2)
            {
                std::string joined;
                for (const auto& a : args)
                {
                    joined += a + " ";
                }
                fail("expected a usage error for: " + joined);
            }
            expect_contains(err, "usage:", "usage error output");
        }
        run_cli_capture({"codegate", "validate", "--backend=vm", safe.path()}, out, err);
        expect_contains(err, "error: unknown backend: vm", "backend error");
    }

    // check
    {
        if (run_cli_capture({"codegate", "check", safe.path()}, out, err) != 0)
        {
            fail("expected a safe file to pass check");
        }
        expect_contains(out, "codegate check: ok", "check output");

        if (run_cli_capture({"codegate", "check", unsafe.path()}, out, err) != 1)
        {
            fail("expected os.system to fail check");
        }
        expect_contains(out, "error[PV001]: forbidden import: os", "check output");
        expect_contains(out, "codegate check: unsafe", "check output");

        if (run_cli_capture({"codegate", "check", "--json", unsafe.path()}, out, err) != 1)
        {
            fail("expected JSON check to fail");
        }
        const auto doc = codegate::support::parse_json(out);
        if (!doc.has_value() || codegate::support::json_get_string(*doc->as_object(), "status") != "failed")
        {
            fail("expected a JSON report from check");
        }

        if (run_cli_capture({"codegate", "check", "/nonexistent/codegate/missing.py"}, out, err) != 3)
        {
            fail("expected an unreadable file to be an error");
        }
        expect_contains(err, "error: ", "missing file output");
    }

    // validate, in process
    {
        const std::vector<std::string> base{"codegate", "validate", "--backend", "restricted", "--analyzer",
                                            "conditions"};
        auto args = base;
        args.insert(args.end(), {"--entry", "double", "--trials", "20", "--seed", "7", safe.path()});
        if (run_cli_capture(args, out, err) != 0)
        {
            fail("expected double to validate:\n" + out + err);
        }
        expect_contains(out, ": passed (", "validate output");
        expect_contains(out, "property no_exception: holds", "validate output");

        args = base;
        args.insert(args.end(), {"--json", "--entry=double", safe.path()});
        if (run_cli_capture(args, out, err) != 0)
        {
            fail("expected JSON validation to pass");
        }
        const auto doc = codegate::support::parse_json(out);
        if (!doc.has_value() || codegate::support::json_get_string(*doc->as_object(), "entry_point") != "double")
        {
            fail("expected the entry point in the JSON report");
        }

        const auto loop = source_file("while True:\n    pass\n");
        args = base;
        args.insert(args.end(), {"--timeout", "0.3", loop.path()});
        if (run_cli_capture(args, out, err) != 1)
        {
            fail("expected a timed-out run to fail validation");
        }
        expect_contains(out, "timeout of 0.3 s exceeded", "timeout output");

        args = base;
        args.insert(args.end(), {"--deadline", "0.3", loop.path()});
        if (run_cli_capture(args, out, err) != 3)
        {
            fail("expected the deadline to make validation an error");
        }

        args = base;
        args.insert(args.end(), {"--no-stop-on-failure", "--no-property", unsafe.path()});
        if (run_cli_capture(args, out, err) != 1)
        {
            fail("expected unsafe code to fail validation");
        }
        expect_contains(out, "SB004", "sandbox refusal");

        if (run_cli_capture({"codegate", "validate", "--no-static", "--no-sandbox", safe.path()}, out, err) != 0)
        {
            fail("expected prevalidation alone to pass");
        }
        expect_contains(out, "static analysis disabled", "skipped stage reason");
    }

    // run
    {
        const auto hello = source_file("print('hi')\n");
        if (run_cli_capture({"codegate", "run", "--backend", "restricted", hello.path()}, out, err) != 0 ||
            out != "hi\n")
        {
            fail("expected run to print the program output");
        }
        expect_contains(err, "codegate run: completed (ok)", "run status");

        const auto raising = source_file("raise KeyError('k')\n");
        if (run_cli_capture({"codegate", "run", "--backend", "restricted", "--json", raising.path()}, out, err) !=
            1)
        {
            fail("expected a raising program to exit 1");
        }
        const auto doc = codegate::support::parse_json(out);
        if (!doc.has_value() || codegate::support::json_get_string(*doc->as_object(), "exit") != "runtime_error")
        {
            fail("expected a JSON execution result");
        }

        EnvVarGuard python("CODEGATE_PYTHON");
        python.set("/nonexistent/codegate-python");
        if (run_cli_capture({"codegate", "run", "--backend", "subprocess", hello.path()}, out, err) != 3)
        {
            fail("expected a missing interpreter to be an error");
        }
        expect_contains(err, "python interpreter not found", "missing interpreter output");
    }

    std::cout << "OK\n";
    return 0;
}
