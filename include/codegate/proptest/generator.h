#pragma once

#include <codegate/proptest/signature.h>
#include <codegate/runtime/value.h>
#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

/**
 * @file generator.h
 * @brief Seeded input generation and shrinking for property tests.
 */

namespace codegate::proptest
{

struct GeneratorLimits
{
    std::int64_t int_min = -1000;
    std::int64_t int_max = 1000;
    double float_min = -1000.0;
    double float_max = 1000.0;
    std::size_t max_string_length = 20;
    std::size_t max_collection_size = 10;
};

/** @brief Arguments of one call. */
using Inputs = std::vector<codegate::runtime::Value>;

class Generator
{
  public:
    Generator(std::uint64_t seed, GeneratorLimits limits) : engine_(seed), limits_(limits) {}

    /** @brief A random value of `type`. */
    [[nodiscard]] codegate::runtime::Value value(const TypeSpec& type, int depth = 0);

    /**
     * @brief `count` argument lists for `params`.
     *
     * The leading lists walk the edge values of every parameter in lockstep
     * (0, +-1, range extremes, empty and single-element collections); the
     * rest are random.
     */
    [[nodiscard]] std::vector<Inputs> inputs(const std::vector<Parameter>& params, std::size_t count);

  private:
    std::int64_t int_between(std::int64_t lo, std::int64_t hi);

    std::mt19937_64 engine_;
    GeneratorLimits limits_;
};

/** @brief Fixed boundary values of `type`, simplest first. */
[[nodiscard]] std::vector<codegate::runtime::Value> edge_values(const TypeSpec& type,
                                                                const GeneratorLimits& limits);

/**
 * @brief Simpler variants of `inputs`, one parameter changed at a time.
 *
 * Integers move toward zero, floats toward zero and integral values,
 * strings and collections get shorter, collection elements shrink.
 */
[[nodiscard]] std::vector<Inputs> shrink_candidates(const Inputs& inputs,
                                                    const std::vector<Parameter>& params);

/** @brief `name(arg, ...)` with Python reprs. */
[[nodiscard]] std::string render_call(const std::string& name, const Inputs& inputs);

} // namespace codegate::proptest
