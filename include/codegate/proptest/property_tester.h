#pragma once

#include <codegate/proptest/generator.h>
#include <codegate/proptest/signature.h>
#include <codegate/sandbox/sandbox.h>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/**
 * @file property_tester.h
 * @brief Randomized behavioral checks of a function that already ran in a sandbox.
 *
 * Every property runs over the same seeded inputs. The fixed battery is:
 * - `no_exception`: the call returns for every input.
 * - `deterministic`: two calls with the same input, in the same run, agree.
 * - `idempotent`: `f(f(x)) == f(x)`; only for one-parameter functions whose
 *   declared or observed output type is the input type, Skipped otherwise.
 *
 * A call stopped by the sandbox (timeout, memory ceiling, policy) makes the
 * property Error rather than Violated.
 */

namespace codegate::proptest
{

enum class PropertyOutcome
{
    Holds,
    Violated,
    Error,
    Skipped,
};

[[nodiscard]] std::string_view to_string(PropertyOutcome outcome);

struct CounterExample
{
    Inputs inputs;
    /** `f(1, [2])` */
    std::string call;
    /** What went wrong for this input. */
    std::string detail;
    /** Accepted shrink steps from the input first found. */
    std::size_t shrink_steps = 0;
};

struct PropertyCheckResult
{
    std::string property;
    PropertyOutcome outcome = PropertyOutcome::Holds;
    std::vector<CounterExample> counter_examples;
    std::size_t trials = 0;
    std::string message;
};

/** @brief User predicate over the arguments of one call and its return value. */
using Predicate = std::function<bool(const Inputs& inputs, const codegate::runtime::Value& output)>;

struct Property
{
    std::string name;
    Predicate predicate;
};

struct PropertyConfig
{
    std::size_t trials = 100;
    std::uint64_t seed = 0;
    bool halt_on_first_violation = true;
    std::size_t max_counter_examples = 5;
    bool shrink = true;
    /** Candidate calls spent shrinking one counter-example. */
    std::size_t max_shrink_attempts = 200;
    /** Inputs sent to the callable per batch. */
    std::size_t batch_size = 25;
    bool run_builtin_properties = true;
    GeneratorLimits limits;
};

/** @brief Empty when usable; otherwise the first problem. */
[[nodiscard]] std::string check_config(const PropertyConfig& config);

class PropertyTester
{
  public:
    void add_property(Property property) { properties_.push_back(std::move(property)); }

    /** @brief Results for the battery, then the user properties in the order added. */
    [[nodiscard]] std::vector<PropertyCheckResult> test(codegate::sandbox::BatchCallable& callable,
                                                        const Signature& signature,
                                                        const PropertyConfig& config) const;

  private:
    std::vector<Property> properties_;
};

/** @brief Stock predicates. */
namespace predicates
{

[[nodiscard]] Property output_not_none();
[[nodiscard]] Property output_same_type_as_first_arg();
[[nodiscard]] Property list_length_preserved();
/** The output list holds the same elements as the first argument, in any order. */
[[nodiscard]] Property list_elements_preserved();
[[nodiscard]] Property string_not_longer();
[[nodiscard]] Property numeric_in_range(double min, double max);

} // namespace predicates

} // namespace codegate::proptest
