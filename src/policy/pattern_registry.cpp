#include <codegate/policy/pattern_registry.h>

namespace codegate::policy
{
namespace
{

const NameSet& default_modules()
{
    static const NameSet names{
        "os",      "sys",      "subprocess", "shutil",      "pathlib",         "socket",
        "requests", "urllib",  "http",       "ctypes",      "multiprocessing", "threading",
        "pickle",  "shelve",   "marshal",    "importlib",   "runpy",           "__builtin__",
        "builtins", "code",    "codeop",     "compileall",  "pty",             "signal",
        "resource", "gc",      "inspect",    "tempfile",
    };
    return names;
}

const NameSet& default_callables()
{
    static const NameSet names{
        // builtins
        "eval",
        "exec",
        "compile",
        "open",
        "input",
        "__import__",
        "globals",
        "locals",
        "vars",
        "getattr",
        "setattr",
        "delattr",
        "hasattr",
        "breakpoint",
        "help",
        "exit",
        "quit",
        "memoryview",
        // qualified process, file and loader entry points
        "os.system",
        "os.popen",
        "os.fork",
        "os.kill",
        "os.execl",
        "os.execle",
        "os.execlp",
        "os.execv",
        "os.execve",
        "os.execvp",
        "os.spawnl",
        "os.spawnv",
        "os.remove",
        "os.unlink",
        "os.rmdir",
        "subprocess.Popen",
        "subprocess.run",
        "subprocess.call",
        "subprocess.check_call",
        "subprocess.check_output",
        "subprocess.getoutput",
        "subprocess.getstatusoutput",
        "shutil.rmtree",
        "pty.spawn",
        "importlib.import_module",
        "builtins.eval",
        "builtins.exec",
        "builtins.__import__",
        "pickle.loads",
        "marshal.loads",
    };
    return names;
}

const NameSet& default_attributes()
{
    static const NameSet names{
        "__code__",    "__globals__", "__builtins__", "__subclasses__", "__bases__",
        "__base__",    "__mro__",     "__class__",    "__dict__",       "__module__",
        "__loader__",  "__spec__",    "__closure__",  "__func__",       "__self__",
        "__getattribute__", "__reduce__", "__reduce_ex__", "gi_frame",  "f_globals",
        "f_locals",    "f_back",      "tb_frame",     "cr_frame",
    };
    return names;
}

void insert_all(NameSet& set, const std::vector<std::string>& names)
{
    for (const auto& n : names)
    {
        set.insert(n);
    }
}

} // namespace

PatternRegistry::PatternRegistry()
    : modules_(default_modules()), callables_(default_callables()),
      attributes_(default_attributes())
{
}

PatternRegistry PatternRegistry::empty()
{
    return PatternRegistry(EmptyTag{});
}

bool PatternRegistry::is_forbidden_module(std::string_view dotted) const
{
    std::size_t from = 0;
    while (true)
    {
        const std::size_t end = dotted.find('.', from);
        if (modules_.find(dotted.substr(0, end)) != modules_.end())
        {
            return true;
        }
        if (end == std::string_view::npos)
        {
            return false;
        }
        from = end + 1;
    }
}

bool PatternRegistry::is_forbidden_callable(std::string_view name) const
{
    return callables_.find(name) != callables_.end();
}

bool PatternRegistry::is_forbidden_attribute(std::string_view name) const
{
    return attributes_.find(name) != attributes_.end();
}

void PatternRegistry::extend_modules(const std::vector<std::string>& names)
{
    insert_all(modules_, names);
}

void PatternRegistry::extend_callables(const std::vector<std::string>& names)
{
    insert_all(callables_, names);
}

void PatternRegistry::extend_attributes(const std::vector<std::string>& names)
{
    insert_all(attributes_, names);
}

void PatternRegistry::replace_modules(const std::vector<std::string>& names)
{
    modules_.clear();
    insert_all(modules_, names);
}

void PatternRegistry::replace_callables(const std::vector<std::string>& names)
{
    callables_.clear();
    insert_all(callables_, names);
}

void PatternRegistry::replace_attributes(const std::vector<std::string>& names)
{
    attributes_.clear();
    insert_all(attributes_, names);
}

std::shared_ptr<const PatternRegistry> default_registry()
{
    static const std::shared_ptr<const PatternRegistry> instance =
        std::make_shared<PatternRegistry>();
    return instance;
}

} // namespace codegate::policy
