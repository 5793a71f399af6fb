#pragma once

#include <codegate/sandbox/driver.h>
#include <string>
#include <variant>

/**
 * @file container_sandbox.h
 * @brief Backend running the driver in a throwaway container.
 *
 * `<runtime> run --rm -i` with no network, a read-only root, a small tmpfs
 * scratch directory, memory, CPU and pid limits, and no new privileges. Each
 * run gets a unique container name so a timed-out container can be killed
 * through the runtime.
 */

namespace codegate::sandbox
{

class ContainerSandbox final : public DriverSandbox
{
  public:
    using DriverSandbox::DriverSandbox;

    [[nodiscard]] BackendKind kind() const override { return BackendKind::Container; }
    [[nodiscard]] std::variant<DriverLaunch, std::string> launch() override;
};

/** @brief Runtime binary: config, then CODEGATE_CONTAINER_RUNTIME, then `docker`. */
[[nodiscard]] std::string container_runtime(const SandboxConfig& config);

} // namespace codegate::sandbox
