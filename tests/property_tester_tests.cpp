#include <codegate/proptest/property_tester.h>
#include <codegate/sandbox/sandbox.h>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

[[noreturn]] static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

using namespace codegate::proptest;
using codegate::runtime::Value;
using codegate::sandbox::CallOutcome;
using Kind = TypeSpec::Kind;

namespace
{

/** Calls a C++ function in place of sandboxed code. */
class FunctionCallable : public codegate::sandbox::BatchCallable
{
  public:
    explicit FunctionCallable(std::function<CallOutcome(const std::vector<Value>&)> fn) : fn_(std::move(fn)) {}

    std::vector<CallOutcome> call_batch(const std::vector<std::vector<Value>>& inputs) override
    {
        ++batches;
        std::vector<CallOutcome> out;
        for (const auto& args : inputs)
        {
            ++calls;
            out.push_back(fn_(args));
        }
        return out;
    }

    codegate::sandbox::BatchUsage usage() const override { return {}; }

    std::size_t batches = 0;
    std::size_t calls = 0;

  private:
    std::function<CallOutcome(const std::vector<Value>&)> fn_;
};

CallOutcome returned(Value v)
{
    CallOutcome o;
    o.kind = CallOutcome::Kind::Returned;
    o.value = std::move(v);
    return o;
}

CallOutcome raised(std::string type, std::string message)
{
    CallOutcome o;
    o.kind = CallOutcome::Kind::Raised;
    o.exception = {std::move(type), std::move(message)};
    o.exit = codegate::sandbox::ExitClass::RuntimeError;
    return o;
}

Signature int_signature(std::size_t arity = 1)
{
    Signature sig;
    sig.name = "f";
    for (std::size_t i = 0; i < arity; ++i)
    {
        sig.params.push_back(Parameter{.name = "x" + std::to_string(i), .type = TypeSpec::of(Kind::Int)});
    }
    return sig;
}

const PropertyCheckResult& find(const std::vector<PropertyCheckResult>& results, const std::string& name)
{
    for (const auto& r : results)
    {
        if (r.property == name)
        {
            return r;
        }
    }
    fail("missing property result: " + name);
}

} // namespace

int main()
{
    {
        FunctionCallable doubler([](const std::vector<Value>& args) { return returned(Value::integer(args[0].as_int() * 2)); });
        const auto results = PropertyTester{}.test(doubler, int_signature(), PropertyConfig{});
        if (results.size() != 3 || results[0].property != "no_exception" ||
            results[1].property != "deterministic" || results[2].property != "idempotent")
        {
            fail("expected the built-in battery in order");
        }
        if (results[0].outcome != PropertyOutcome::Holds || results[0].trials != 100 ||
            results[0].message != "held for 100 input(s)")
        {
            fail("expected no_exception to hold: " + results[0].message);
        }
        if (results[1].outcome != PropertyOutcome::Holds)
        {
            fail("expected a pure function to be deterministic");
        }
        const auto& idem = results[2];
        if (idem.outcome != PropertyOutcome::Violated || idem.counter_examples.size() != 1 ||
            idem.counter_examples[0].call != "f(1)" ||
            idem.message != "falsified by f(1): f(x) = 2 but f(f(x)) = 4")
        {
            fail("expected doubling to fail idempotence at f(1): " + idem.message);
        }
        if (doubler.batches < 8)
        {
            fail("expected inputs to be sent in batches");
        }
    }

    {
        FunctionCallable absolute([](const std::vector<Value>& args)
                                  { return returned(Value::integer(std::llabs(args[0].as_int()))); });
        auto sig = int_signature();
        sig.returns = TypeSpec::of(Kind::Int);
        const auto results = PropertyTester{}.test(absolute, sig, PropertyConfig{});
        for (const auto& r : results)
        {
            if (r.outcome != PropertyOutcome::Holds)
            {
                fail("expected abs to satisfy " + r.property + ": " + r.message);
            }
        }
    }

    {
        FunctionCallable negative_raises([](const std::vector<Value>& args)
                                         {
                                             if (args[0].as_int() < 0)
                                             {
                                                 return raised("ValueError", "negative");
                                             }
                                             return returned(args[0]);
                                         });
        const auto results = PropertyTester{}.test(negative_raises, int_signature(), PropertyConfig{});
        const auto& ne = find(results, "no_exception");
        if (ne.outcome != PropertyOutcome::Violated || ne.counter_examples.front().call != "f(-1)" ||
            ne.counter_examples.front().detail != "raised ValueError: negative")
        {
            fail("expected f(-1) to falsify no_exception: " + ne.message);
        }
        if (ne.trials != 3)
        {
            fail("expected the run to halt at the first violation");
        }
        // Raising twice the same way is deterministic; raising inputs do not count for idempotence.
        if (find(results, "deterministic").outcome != PropertyOutcome::Holds ||
            find(results, "idempotent").outcome != PropertyOutcome::Holds)
        {
            fail("expected deterministic and idempotent to hold");
        }
    }

    {
        FunctionCallable large_raises([](const std::vector<Value>& args)
                                      {
                                          if (args[0].as_int() >= 10)
                                          {
                                              return raised("OverflowError", "too big");
                                          }
                                          return returned(Value::none());
                                      });
        PropertyConfig config;
        const auto results = PropertyTester{}.test(large_raises, int_signature(), config);
        const auto& ne = find(results, "no_exception");
        if (ne.outcome != PropertyOutcome::Violated || ne.counter_examples.front().call != "f(10)" ||
            ne.counter_examples.front().shrink_steps != 11)
        {
            fail("expected f(1000) to shrink to f(10): " + ne.message);
        }
        if (find(results, "idempotent").outcome != PropertyOutcome::Skipped)
        {
            fail("expected idempotence to be skipped when the output is None");
        }

        config.shrink = false;
        const auto unshrunk = PropertyTester{}.test(large_raises, int_signature(), config);
        if (find(unshrunk, "no_exception").counter_examples.front().call != "f(1000)")
        {
            fail("expected the first failing input without shrinking");
        }
    }

    {
        int counter = 0;
        FunctionCallable counting([&counter](const std::vector<Value>&) { return returned(Value::integer(counter++)); });
        const auto results = PropertyTester{}.test(counting, int_signature(), PropertyConfig{});
        const auto& det = find(results, "deterministic");
        if (det.outcome != PropertyOutcome::Violated ||
            det.counter_examples.front().detail.find("first call returned") != 0)
        {
            fail("expected a counter to be nondeterministic: " + det.message);
        }
    }

    {
        FunctionCallable timing_out([](const std::vector<Value>& args)
                                    {
                                        if (args[0].as_int() == 1000)
                                        {
                                            CallOutcome o;
                                            o.kind = CallOutcome::Kind::Failed;
                                            o.exit = codegate::sandbox::ExitClass::Timeout;
                                            o.exception.message = "call exceeded 1 s";
                                            return o;
                                        }
                                        return returned(args[0]);
                                    });
        const auto results = PropertyTester{}.test(timing_out, int_signature(), PropertyConfig{});
        const auto& ne = find(results, "no_exception");
        if (ne.outcome != PropertyOutcome::Error ||
            ne.message != "f(1000): sandbox stopped the call (timeout): call exceeded 1 s" || ne.trials != 4)
        {
            fail("expected a stopped call to make the property an error: " + ne.message);
        }
    }

    {
        FunctionCallable always_raises([](const std::vector<Value>&) { return raised("RuntimeError", ""); });
        PropertyConfig config;
        config.halt_on_first_violation = false;
        config.max_counter_examples = 3;
        const auto results = PropertyTester{}.test(always_raises, int_signature(), config);
        const auto& ne = find(results, "no_exception");
        if (ne.counter_examples.size() != 3 || ne.counter_examples[0].call != "f(0)" ||
            ne.counter_examples[0].detail != "raised RuntimeError")
        {
            fail("expected three counter-examples");
        }
        if (find(results, "idempotent").outcome != PropertyOutcome::Skipped ||
            find(results, "idempotent").message != "no call returned, output type unknown")
        {
            fail("expected idempotence to be skipped without outputs");
        }
    }

    {
        FunctionCallable add([](const std::vector<Value>& args)
                             { return returned(Value::integer(args[0].as_int() + args[1].as_int())); });
        const auto results = PropertyTester{}.test(add, int_signature(2), PropertyConfig{});
        if (find(results, "idempotent").message != "needs exactly one parameter, f takes 2")
        {
            fail("expected idempotence to need one parameter");
        }

        FunctionCallable show([](const std::vector<Value>& args) { return returned(Value::str(codegate::runtime::repr(args[0]))); });
        auto sig = int_signature();
        sig.returns = TypeSpec::of(Kind::Str);
        const auto declared = PropertyTester{}.test(show, sig, PropertyConfig{});
        if (find(declared, "idempotent").message != "declared output type str differs from input type int")
        {
            fail("expected idempotence to compare declared types");
        }
        sig.returns.reset();
        const auto observed = PropertyTester{}.test(show, sig, PropertyConfig{});
        if (find(observed, "idempotent").message != "observed output type str differs from input type int")
        {
            fail("expected idempotence to compare observed types");
        }
    }

    {
        FunctionCallable sometimes_none([](const std::vector<Value>& args)
                                        {
                                            return returned(args[0].as_int() == -1 ? Value::none() : args[0]);
                                        });
        PropertyTester tester;
        tester.add_property(predicates::output_not_none());
        tester.add_property(predicates::numeric_in_range(-1000.0, 1000.0));
        PropertyConfig config;
        config.run_builtin_properties = false;
        const auto results = tester.test(sometimes_none, int_signature(), config);
        if (results.size() != 2 || results[0].property != "output_not_none" ||
            results[1].property != "numeric_in_range")
        {
            fail("expected only user properties, in order");
        }
        if (results[0].outcome != PropertyOutcome::Violated || results[0].counter_examples.front().call != "f(-1)" ||
            results[0].counter_examples.front().detail != "predicate false for output None")
        {
            fail("expected output_not_none to fail at f(-1)");
        }
        if (results[1].outcome != PropertyOutcome::Holds)
        {
            fail("expected outputs to stay in range");
        }
    }

    {
        const auto xs = Value::list({Value::integer(1), Value::integer(2), Value::integer(2)});
        const auto same = Value::list({Value::integer(2), Value::integer(1), Value::integer(2)});
        const auto other = Value::list({Value::integer(1), Value::integer(1), Value::integer(2)});
        if (!predicates::list_elements_preserved().predicate({xs}, same) ||
            predicates::list_elements_preserved().predicate({xs}, other))
        {
            fail("unexpected list_elements_preserved result");
        }
        if (!predicates::list_length_preserved().predicate({xs}, other) ||
            predicates::list_length_preserved().predicate({xs}, Value::list({})))
        {
            fail("unexpected list_length_preserved result");
        }
        if (!predicates::string_not_longer().predicate({Value::str("abc")}, Value::str("ab")) ||
            predicates::string_not_longer().predicate({Value::str("a")}, Value::str("ab")))
        {
            fail("unexpected string_not_longer result");
        }
        if (!predicates::output_same_type_as_first_arg().predicate({Value::integer(1)}, Value::integer(5)) ||
            predicates::output_same_type_as_first_arg().predicate({Value::integer(1)}, Value::floating(5.0)))
        {
            fail("unexpected output_same_type_as_first_arg result");
        }
    }

    {
        PropertyConfig config;
        if (!check_config(config).empty())
        {
            fail("expected the default config to be usable");
        }
        config.trials = 0;
        if (check_config(config) != "property trial count must be positive")
        {
            fail("expected zero trials to be rejected");
        }
        config = PropertyConfig{};
        config.limits.int_min = 5;
        config.limits.int_max = 4;
        if (check_config(config) != "integer range is empty")
        {
            fail("expected an empty integer range to be rejected");
        }
        if (to_string(PropertyOutcome::Violated) != "violated" || to_string(PropertyOutcome::Skipped) != "skipped")
        {
            fail("unexpected outcome names");
        }
    }

    {
        // Through the restricted sandbox.
        auto made = codegate::sandbox::make_sandbox(codegate::sandbox::BackendKind::Restricted,
                                                    codegate::sandbox::SandboxConfig{});
        auto& sb = std::get<std::unique_ptr<codegate::sandbox::Sandbox>>(made);
        const auto res = sb->execute("def dedupe(xs: list[int]) -> list[int]:\n    return sorted(set(xs))\n");
        if (!res.ok())
        {
            fail("expected the definition to run");
        }
        auto callable = sb->callable("dedupe");
        if (!callable)
        {
            fail("expected a callable for dedupe");
        }
        Signature sig;
        sig.name = "dedupe";
        sig.params.push_back(Parameter{.name = "xs", .type = TypeSpec{.kind = Kind::List,
                                                                      .args = {TypeSpec::of(Kind::Int)},
                                                                      .variadic = false}});
        sig.returns = sig.params.front().type;
        PropertyTester tester;
        tester.add_property(predicates::list_length_preserved());
        PropertyConfig config;
        config.trials = 40;
        config.limits.int_min = 0;
        config.limits.int_max = 3;
        const auto results = tester.test(*callable, sig, config);
        for (const char* name : {"no_exception", "deterministic", "idempotent"})
        {
            if (find(results, name).outcome != PropertyOutcome::Holds)
            {
                fail(std::string("expected dedupe to satisfy ") + name + ": " + find(results, name).message);
            }
        }
        const auto& length = find(results, "list_length_preserved");
        if (length.outcome != PropertyOutcome::Violated ||
            length.counter_examples.front().inputs.front().as_list()->items.size() < 2)
        {
            fail("expected duplicates to shorten the output: " + length.message);
        }
    }

    std::cout << "OK\n";
    return 0;
}
