#include <algorithm>
#include <codegate/policy/pattern_registry.h>
#include <cstdlib>
#include <iostream>
#include <string>

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

int main()
{
    using namespace codegate::policy;

    {
        const auto reg = default_registry();
        if (reg == nullptr || reg.get() != default_registry().get())
        {
            fail("expected one shared default registry");
        }
        if (!reg->is_forbidden_module("os") || !reg->is_forbidden_module("os.path") ||
            !reg->is_forbidden_module("urllib.request.urlopen"))
        {
            fail("expected forbidden modules and their submodules");
        }
        if (reg->is_forbidden_module("math") || reg->is_forbidden_module("osx") ||
            reg->is_forbidden_module("my.os") || reg->is_forbidden_module(".os"))
        {
            fail("only dotted prefixes of a listed module are forbidden");
        }
        if (!reg->is_forbidden_callable("eval") || !reg->is_forbidden_callable("os.system") ||
            !reg->is_forbidden_callable("subprocess.run"))
        {
            fail("expected forbidden callables");
        }
        if (reg->is_forbidden_callable("print") || reg->is_forbidden_callable("system"))
        {
            fail("callable matching is exact");
        }
        if (!reg->is_forbidden_attribute("__subclasses__") ||
            !reg->is_forbidden_attribute("__globals__") || reg->is_forbidden_attribute("append"))
        {
            fail("unexpected attribute membership");
        }
    }

    {
        // Copies are independent of the shared default.
        PatternRegistry copy = *default_registry();
        copy.extend_modules({"numpy"});
        copy.extend_callables({"print"});
        copy.extend_attributes({"secret"});
        if (!copy.is_forbidden_module("numpy.linalg") || !copy.is_forbidden_callable("print") ||
            !copy.is_forbidden_attribute("secret") || !copy.is_forbidden_module("os"))
        {
            fail("expected extend to add to the defaults");
        }
        if (default_registry()->is_forbidden_module("numpy") ||
            default_registry()->is_forbidden_callable("print"))
        {
            fail("extending a copy must not change the default registry");
        }

        copy.replace_modules({"json"});
        if (copy.is_forbidden_module("os") || !copy.is_forbidden_module("json"))
        {
            fail("expected replace to drop the defaults");
        }
        copy.replace_callables({});
        copy.replace_attributes({});
        if (!copy.callables().empty() || !copy.attributes().empty())
        {
            fail("expected empty sets after replacing with nothing");
        }
    }

    {
        // No name sits in more than one default set.
        const PatternRegistry reg;
        const auto overlaps = [](const NameSet& a, const NameSet& b)
        {
            return std::any_of(a.begin(), a.end(), [&](const std::string& n) { return b.count(n) != 0; });
        };
        if (overlaps(reg.modules(), reg.callables()) || overlaps(reg.modules(), reg.attributes()) ||
            overlaps(reg.callables(), reg.attributes()))
        {
            fail("expected the default sets to be disjoint");
        }
        if (!reg.is_forbidden_callable("__import__") || reg.is_forbidden_attribute("__import__"))
        {
            fail("expected __import__ to be a callable only");
        }
    }

    {
        const auto empty = PatternRegistry::empty();
        if (!empty.modules().empty() || empty.is_forbidden_callable("eval"))
        {
            fail("expected empty registry");
        }
    }

    std::cout << "OK\n";
    return 0;
}
