#pragma once

#include <codegate/sandbox/driver.h>
#include <string>
#include <variant>

/**
 * @file subprocess_sandbox.h
 * @brief Backend running the driver under `python3 -I -S` in a child process.
 *
 * The child gets its own process group, a minimal environment and rlimits for
 * address space, CPU time, file size, process count and core dumps. With the
 * network disabled and an isolation wrapper configured (bwrap), the
 * interpreter runs inside it with a private network namespace.
 */

namespace codegate::sandbox
{

class SubprocessSandbox final : public DriverSandbox
{
  public:
    using DriverSandbox::DriverSandbox;

    [[nodiscard]] BackendKind kind() const override { return BackendKind::Subprocess; }
    [[nodiscard]] std::variant<DriverLaunch, std::string> launch() override;
};

/** @brief Interpreter for the process backends: config, then CODEGATE_PYTHON, then `python3`. */
[[nodiscard]] std::string python_command(const SandboxConfig& config);

} // namespace codegate::sandbox
