#include <algorithm>
#include <codegate/proptest/property_tester.h>
#include <cstdlib>
#include <iostream>

namespace codegate::proptest
{
namespace
{

using codegate::runtime::Value;
using codegate::sandbox::CallOutcome;

constexpr std::size_t kMaxDetailChars = 200;

struct Verdict
{
    enum class Kind
    {
        Pass,
        Fail,
        /** The sandbox stopped the call. */
        Error,
        /** The input says nothing about the property (e.g. the call raised). */
        Ignore,
    };
    Kind kind = Kind::Ignore;
    std::string detail;
};

/** Verdicts for a list of inputs, one per input. */
using Check = std::function<std::vector<Verdict>(const std::vector<Inputs>&)>;

bool debug_enabled()
{
    return std::getenv("CODEGATE_DEBUG") != nullptr;
}

std::string brief(std::string text)
{
    if (text.size() > kMaxDetailChars)
    {
        text.resize(kMaxDetailChars);
        text += "...";
    }
    return text;
}

std::string brief_repr(const Value& v)
{
    return brief(codegate::runtime::repr(v));
}

bool values_match(const Value& a, const Value& b)
{
    if (codegate::runtime::equals(a, b))
    {
        return true;
    }
    // NaN and identity-compared objects: fall back to type and repr.
    return codegate::runtime::type_name(a) == codegate::runtime::type_name(b) &&
           codegate::runtime::repr(a) == codegate::runtime::repr(b);
}

std::string describe_raise(const CallOutcome& o)
{
    std::string out = "raised " + o.exception.type;
    if (!o.exception.message.empty())
    {
        out += ": " + o.exception.message;
    }
    return brief(std::move(out));
}

std::string describe_failure(const CallOutcome& o)
{
    std::string out = "sandbox stopped the call (" + std::string(codegate::sandbox::to_string(o.exit)) + ")";
    if (!o.exception.message.empty())
    {
        out += ": " + o.exception.message;
    }
    return brief(std::move(out));
}

/** Calls `inputs`, padding a short reply with failures. */
std::vector<CallOutcome> call_all(codegate::sandbox::BatchCallable& callable,
                                  const std::vector<Inputs>& inputs)
{
    if (inputs.empty())
    {
        return {};
    }
    auto outcomes = callable.call_batch(inputs);
    while (outcomes.size() < inputs.size())
    {
        CallOutcome missing;
        missing.kind = CallOutcome::Kind::Failed;
        missing.exit = codegate::sandbox::ExitClass::RuntimeError;
        missing.exception.message = "no result for call";
        outcomes.push_back(std::move(missing));
    }
    return outcomes;
}

Check no_exception_check(codegate::sandbox::BatchCallable& callable)
{
    return [&callable](const std::vector<Inputs>& inputs)
    {
        std::vector<Verdict> out;
        for (const auto& o : call_all(callable, inputs))
        {
            switch (o.kind)
            {
            case CallOutcome::Kind::Returned:
                out.push_back({Verdict::Kind::Pass, ""});
                break;
            case CallOutcome::Kind::Raised:
                out.push_back({Verdict::Kind::Fail, describe_raise(o)});
                break;
            case CallOutcome::Kind::Failed:
                out.push_back({Verdict::Kind::Error, describe_failure(o)});
                break;
            }
        }
        return out;
    };
}

Check deterministic_check(codegate::sandbox::BatchCallable& callable)
{
    return [&callable](const std::vector<Inputs>& inputs)
    {
        std::vector<Inputs> doubled;
        doubled.reserve(inputs.size() * 2);
        for (const auto& in : inputs)
        {
            doubled.push_back(in);
            doubled.push_back(in);
        }
        const auto outcomes = call_all(callable, doubled);
        std::vector<Verdict> out;
        for (std::size_t i = 0; i < inputs.size(); ++i)
        {
            const auto& first = outcomes[2 * i];
            const auto& second = outcomes[2 * i + 1];
            if (first.kind == CallOutcome::Kind::Failed || second.kind == CallOutcome::Kind::Failed)
            {
                out.push_back({Verdict::Kind::Error,
                               describe_failure(first.kind == CallOutcome::Kind::Failed ? first : second)});
                continue;
            }
            if (first.kind == CallOutcome::Kind::Returned && second.kind == CallOutcome::Kind::Returned)
            {
                if (values_match(first.value, second.value))
                {
                    out.push_back({Verdict::Kind::Pass, ""});
                }
                else
                {
                    out.push_back({Verdict::Kind::Fail, "first call returned " + brief_repr(first.value) +
                                                            ", second returned " +
                                                            brief_repr(second.value)});
                }
                continue;
            }
            if (first.kind == CallOutcome::Kind::Raised && second.kind == CallOutcome::Kind::Raised)
            {
                if (first.exception.type == second.exception.type &&
                    first.exception.message == second.exception.message)
                {
                    out.push_back({Verdict::Kind::Pass, ""});
                }
                else
                {
                    out.push_back({Verdict::Kind::Fail,
                                   "first call " + describe_raise(first) + ", second " + describe_raise(second)});
                }
                continue;
            }
            const auto& returned = first.kind == CallOutcome::Kind::Returned ? first : second;
            const auto& raised = first.kind == CallOutcome::Kind::Raised ? first : second;
            out.push_back({Verdict::Kind::Fail, "one call returned " + brief_repr(returned.value) +
                                                    ", the other " + describe_raise(raised)});
        }
        return out;
    };
}

Check idempotent_check(codegate::sandbox::BatchCallable& callable)
{
    return [&callable](const std::vector<Inputs>& inputs)
    {
        const auto firsts = call_all(callable, inputs);
        std::vector<Verdict> out(inputs.size());
        std::vector<Inputs> again;
        std::vector<std::size_t> again_index;
        for (std::size_t i = 0; i < firsts.size(); ++i)
        {
            switch (firsts[i].kind)
            {
            case CallOutcome::Kind::Returned:
                again.push_back({firsts[i].value});
                again_index.push_back(i);
                break;
            case CallOutcome::Kind::Raised:
                out[i] = {Verdict::Kind::Ignore, ""};
                break;
            case CallOutcome::Kind::Failed:
                out[i] = {Verdict::Kind::Error, describe_failure(firsts[i])};
                break;
            }
        }
        const auto seconds = call_all(callable, again);
        for (std::size_t k = 0; k < seconds.size(); ++k)
        {
            const std::size_t i = again_index[k];
            const auto& once = firsts[i].value;
            const auto& o = seconds[k];
            switch (o.kind)
            {
            case CallOutcome::Kind::Returned:
                if (values_match(o.value, once))
                {
                    out[i] = {Verdict::Kind::Pass, ""};
                }
                else
                {
                    out[i] = {Verdict::Kind::Fail,
                              "f(x) = " + brief_repr(once) + " but f(f(x)) = " + brief_repr(o.value)};
                }
                break;
            case CallOutcome::Kind::Raised:
                out[i] = {Verdict::Kind::Fail, "f(f(x)) " + describe_raise(o)};
                break;
            case CallOutcome::Kind::Failed:
                out[i] = {Verdict::Kind::Error, describe_failure(o)};
                break;
            }
        }
        return out;
    };
}

Check predicate_check(codegate::sandbox::BatchCallable& callable, const Predicate& predicate)
{
    return [&callable, &predicate](const std::vector<Inputs>& inputs)
    {
        const auto outcomes = call_all(callable, inputs);
        std::vector<Verdict> out;
        for (std::size_t i = 0; i < outcomes.size(); ++i)
        {
            const auto& o = outcomes[i];
            switch (o.kind)
            {
            case CallOutcome::Kind::Returned:
                if (predicate(inputs[i], o.value))
                {
                    out.push_back({Verdict::Kind::Pass, ""});
                }
                else
                {
                    out.push_back({Verdict::Kind::Fail, "predicate false for output " + brief_repr(o.value)});
                }
                break;
            case CallOutcome::Kind::Raised:
                out.push_back({Verdict::Kind::Ignore, ""});
                break;
            case CallOutcome::Kind::Failed:
                out.push_back({Verdict::Kind::Error, describe_failure(o)});
                break;
            }
        }
        return out;
    };
}

void shrink(CounterExample& example, const Check& check, const Signature& signature,
            const PropertyConfig& config)
{
    std::size_t attempts = 0;
    while (attempts < config.max_shrink_attempts)
    {
        auto candidates = shrink_candidates(example.inputs, signature.params);
        if (candidates.empty())
        {
            return;
        }
        if (candidates.size() > config.max_shrink_attempts - attempts)
        {
            candidates.resize(config.max_shrink_attempts - attempts);
        }
        attempts += candidates.size();
        const auto verdicts = check(candidates);
        bool improved = false;
        for (std::size_t i = 0; i < verdicts.size() && i < candidates.size(); ++i)
        {
            if (verdicts[i].kind == Verdict::Kind::Fail)
            {
                example.inputs = std::move(candidates[i]);
                example.call = render_call(signature.name, example.inputs);
                example.detail = verdicts[i].detail;
                ++example.shrink_steps;
                improved = true;
                break;
            }
        }
        if (!improved)
        {
            return;
        }
    }
}

PropertyCheckResult run_property(const std::string& name, const Check& check,
                                 const std::vector<Inputs>& inputs, const Signature& signature,
                                 const PropertyConfig& config)
{
    PropertyCheckResult result;
    result.property = name;
    std::string error;
    bool done = false;

    for (std::size_t start = 0; start < inputs.size() && !done; start += config.batch_size)
    {
        const std::size_t end = std::min(inputs.size(), start + config.batch_size);
        const std::vector<Inputs> chunk(inputs.begin() + static_cast<std::ptrdiff_t>(start),
                                        inputs.begin() + static_cast<std::ptrdiff_t>(end));
        const auto verdicts = check(chunk);
        for (std::size_t i = 0; i < verdicts.size() && i < chunk.size(); ++i)
        {
            const auto& v = verdicts[i];
            if (v.kind == Verdict::Kind::Ignore)
            {
                continue;
            }
            if (v.kind == Verdict::Kind::Error)
            {
                error = render_call(signature.name, chunk[i]) + ": " + v.detail;
                done = true;
                break;
            }
            ++result.trials;
            if (v.kind == Verdict::Kind::Pass)
            {
                continue;
            }
            const std::string call = render_call(signature.name, chunk[i]);
            const bool seen = std::any_of(result.counter_examples.begin(), result.counter_examples.end(),
                                          [&call](const CounterExample& c) { return c.call == call; });
            if (!seen)
            {
                result.counter_examples.push_back(
                    CounterExample{.inputs = chunk[i], .call = call, .detail = v.detail, .shrink_steps = 0});
            }
            if (config.halt_on_first_violation ||
                result.counter_examples.size() >= config.max_counter_examples)
            {
                done = true;
                break;
            }
        }
    }

    if (!result.counter_examples.empty())
    {
        if (config.shrink)
        {
            shrink(result.counter_examples.front(), check, signature, config);
        }
        const auto& first = result.counter_examples.front();
        result.outcome = PropertyOutcome::Violated;
        result.message = "falsified by " + first.call + ": " + first.detail;
        if (!error.empty())
        {
            result.message += "; stopped early at " + error;
        }
        return result;
    }
    if (!error.empty())
    {
        result.outcome = PropertyOutcome::Error;
        result.message = error;
        return result;
    }
    if (result.trials == 0)
    {
        result.outcome = PropertyOutcome::Skipped;
        result.message = "no input produced a checkable result";
        return result;
    }
    result.outcome = PropertyOutcome::Holds;
    result.message = "held for " + std::to_string(result.trials) + " input(s)";
    return result;
}

PropertyCheckResult skipped(std::string name, std::string why)
{
    PropertyCheckResult r;
    r.property = std::move(name);
    r.outcome = PropertyOutcome::Skipped;
    r.message = std::move(why);
    return r;
}

/** Empty when idempotence applies, otherwise why it does not. */
std::string idempotence_gate(codegate::sandbox::BatchCallable& callable, const Signature& signature,
                             const std::vector<Inputs>& inputs, std::size_t batch_size)
{
    if (signature.params.size() != 1)
    {
        return "needs exactly one parameter, " + signature.name + " takes " +
               std::to_string(signature.params.size());
    }
    const TypeSpec& input_type = signature.params.front().type;
    if (signature.returns.has_value())
    {
        if (*signature.returns == input_type)
        {
            return "";
        }
        return "declared output type " + to_string(*signature.returns) + " differs from input type " +
               to_string(input_type);
    }
    const std::vector<Inputs> sample(inputs.begin(),
                                     inputs.begin() + static_cast<std::ptrdiff_t>(std::min(inputs.size(), batch_size)));
    std::size_t returned = 0;
    for (const auto& o : call_all(callable, sample))
    {
        if (o.kind != CallOutcome::Kind::Returned)
        {
            continue;
        }
        ++returned;
        if (!conforms(o.value, input_type))
        {
            return "observed output type " + codegate::runtime::type_name(o.value) +
                   " differs from input type " + to_string(input_type);
        }
    }
    if (returned == 0)
    {
        return "no call returned, output type unknown";
    }
    return "";
}

} // namespace

std::string_view to_string(PropertyOutcome outcome)
{
    switch (outcome)
    {
    case PropertyOutcome::Holds:
        return "holds";
    case PropertyOutcome::Violated:
        return "violated";
    case PropertyOutcome::Error:
        return "error";
    case PropertyOutcome::Skipped:
        return "skipped";
    }
    return "error";
}

std::string check_config(const PropertyConfig& config)
{
    if (config.trials == 0)
    {
        return "property trial count must be positive";
    }
    if (config.batch_size == 0)
    {
        return "property batch size must be positive";
    }
    if (config.max_counter_examples == 0)
    {
        return "max counter-examples must be positive";
    }
    if (config.limits.int_min > config.limits.int_max)
    {
        return "integer range is empty";
    }
    if (!(config.limits.float_min <= config.limits.float_max))
    {
        return "float range is empty";
    }
    return "";
}

std::vector<PropertyCheckResult> PropertyTester::test(codegate::sandbox::BatchCallable& callable,
                                                      const Signature& signature,
                                                      const PropertyConfig& config) const
{
    Generator generator(config.seed, config.limits);
    const auto inputs = generator.inputs(signature.params, config.trials);
    if (debug_enabled())
    {
        std::cerr << "[proptest] " << signature.name << ": " << inputs.size() << " input(s), seed "
                  << config.seed << "\n";
    }

    std::vector<PropertyCheckResult> results;
    if (config.run_builtin_properties)
    {
        results.push_back(run_property("no_exception", no_exception_check(callable), inputs, signature, config));
        results.push_back(run_property("deterministic", deterministic_check(callable), inputs, signature, config));
        if (auto why = idempotence_gate(callable, signature, inputs, config.batch_size); !why.empty())
        {
            results.push_back(skipped("idempotent", std::move(why)));
        }
        else
        {
            results.push_back(run_property("idempotent", idempotent_check(callable), inputs, signature, config));
        }
    }
    for (const auto& property : properties_)
    {
        results.push_back(
            run_property(property.name, predicate_check(callable, property.predicate), inputs, signature, config));
    }
    if (debug_enabled())
    {
        for (const auto& r : results)
        {
            std::cerr << "[proptest] " << r.property << ": " << to_string(r.outcome) << "\n";
        }
    }
    return results;
}

namespace predicates
{

Property output_not_none()
{
    return {"output_not_none", [](const Inputs&, const Value& output) { return !output.is_none(); }};
}

Property output_same_type_as_first_arg()
{
    return {"output_same_type_as_first_arg",
            [](const Inputs& inputs, const Value& output)
            {
                return inputs.empty() ||
                       codegate::runtime::type_name(inputs.front()) == codegate::runtime::type_name(output);
            }};
}

Property list_length_preserved()
{
    return {"list_length_preserved",
            [](const Inputs& inputs, const Value& output)
            {
                if (inputs.empty() || !inputs.front().is_list() || !output.is_list())
                {
                    return true;
                }
                return inputs.front().as_list()->items.size() == output.as_list()->items.size();
            }};
}

Property list_elements_preserved()
{
    return {"list_elements_preserved",
            [](const Inputs& inputs, const Value& output)
            {
                if (inputs.empty() || !inputs.front().is_list() || !output.is_list())
                {
                    return true;
                }
                auto remaining = inputs.front().as_list()->items;
                const auto& produced = output.as_list()->items;
                if (remaining.size() != produced.size())
                {
                    return false;
                }
                for (const auto& item : produced)
                {
                    const auto it = std::find_if(remaining.begin(), remaining.end(),
                                                 [&item](const Value& v) { return values_match(v, item); });
                    if (it == remaining.end())
                    {
                        return false;
                    }
                    remaining.erase(it);
                }
                return true;
            }};
}

Property string_not_longer()
{
    return {"string_not_longer",
            [](const Inputs& inputs, const Value& output)
            {
                if (inputs.empty() || !inputs.front().is_str() || !output.is_str())
                {
                    return true;
                }
                return output.as_str().size() <= inputs.front().as_str().size();
            }};
}

Property numeric_in_range(double min, double max)
{
    return {"numeric_in_range",
            [min, max](const Inputs&, const Value& output)
            {
                if (!output.is_number())
                {
                    return true;
                }
                const double d = output.as_double();
                return min <= d && d <= max;
            }};
}

} // namespace predicates

} // namespace codegate::proptest
