#pragma once

#include <functional>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

/**
 * @file pattern_registry.h
 * @brief Denylists of modules, callables and attributes used by the prevalidator.
 *
 * This registry is a living denylist. It names constructs known to be used for
 * sandbox escape or process/network/file access, and it is maintained as new
 * bypass techniques appear. Passing a check against it is NOT a proof that code
 * is safe: code that avoids every listed name may still be harmful. Consumers
 * should treat it as one layer among several (sandboxing, resource limits).
 */

namespace codegate::policy
{

using NameSet = std::set<std::string, std::less<>>;

/**
 * @brief Three independent name sets with membership tests.
 *
 * A registry is a plain value; copies are independent. The shared default
 * instance returned by default_registry() is never mutated.
 */
class PatternRegistry
{
  public:
    /** @brief Registry populated with the default lists. */
    PatternRegistry();

    /** @brief Registry with all three sets empty. */
    [[nodiscard]] static PatternRegistry empty();

    /**
     * @brief True when `dotted` or any of its dotted prefixes is a forbidden module.
     *
     * `os.path` is forbidden because `os` is.
     */
    [[nodiscard]] bool is_forbidden_module(std::string_view dotted) const;

    /** @brief Exact match against bare (`eval`) and qualified (`os.system`) callables. */
    [[nodiscard]] bool is_forbidden_callable(std::string_view name) const;

    [[nodiscard]] bool is_forbidden_attribute(std::string_view name) const;

    void extend_modules(const std::vector<std::string>& names);
    void extend_callables(const std::vector<std::string>& names);
    void extend_attributes(const std::vector<std::string>& names);

    void replace_modules(const std::vector<std::string>& names);
    void replace_callables(const std::vector<std::string>& names);
    void replace_attributes(const std::vector<std::string>& names);

    [[nodiscard]] const NameSet& modules() const { return modules_; }
    [[nodiscard]] const NameSet& callables() const { return callables_; }
    [[nodiscard]] const NameSet& attributes() const { return attributes_; }

  private:
    struct EmptyTag
    {
    };
    explicit PatternRegistry(EmptyTag) {}

    NameSet modules_;
    NameSet callables_;
    NameSet attributes_;
};

/** @brief Shared read-only registry holding the default lists. */
[[nodiscard]] std::shared_ptr<const PatternRegistry> default_registry();

} // namespace codegate::policy
