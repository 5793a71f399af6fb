#pragma once

#include <codegate/sandbox/sandbox.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * @file restricted_sandbox.h
 * @brief In-process backend running the code in the restricted interpreter.
 *
 * Code runs on a worker thread with a large stack. The calling thread acts as
 * the watchdog: when the timeout passes it raises the interpreter's
 * cancellation flag and waits for the worker to unwind. Forbidden builtins are
 * absent from the namespace; forbidden attributes and modules end the run with
 * ExitClass::ForbiddenOperation.
 */

namespace codegate::sandbox
{

class RestrictedSandbox final : public Sandbox
{
  public:
    using Sandbox::Sandbox;
    ~RestrictedSandbox() override;

    [[nodiscard]] BackendKind kind() const override { return BackendKind::Restricted; }

    /**
     * @brief In-process callable sharing the interpreter of the last run.
     *
     * A batch that ends in a timeout, memory or policy stop discards the
     * interpreter; the next batch re-runs the module in a fresh one.
     */
    [[nodiscard]] std::unique_ptr<BatchCallable> callable(const std::string& name) override;

    struct Session;

  protected:
    ExecutionResult run(std::string_view source, const std::optional<std::string>& entry_point,
                        const std::vector<Value>& inputs) override;

  private:
    std::shared_ptr<Session> session_;
};

} // namespace codegate::sandbox
