/*
 * process_backend.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file process_backend.hpp
 * @brief Isolation backend running each script in a separate OS process
 */

#ifndef WARDEN_SANDBOX_PROCESS_BACKEND_HPP
#define WARDEN_SANDBOX_PROCESS_BACKEND_HPP

#include "process_spawning.hpp"
#include "sandbox/backend.hpp"
#include "sandbox/config.hpp"
#include "sandbox/environment_filter.hpp"

#include <spdlog/logger.h>

#include <memory>

namespace warden::sandbox::process {

/**
 * @brief Runs scripts in a freshly spawned Python process
 *
 * Each execution gets an owner-only temp directory holding the wrapped
 * script, a filtered environment, rlimits, and a parent-side monitor that
 * enforces the wall deadline, memory and CPU ceilings. The child is always
 * reaped and the directory always removed before executeInSandbox returns.
 *
 * Usage accuracy: memory (peak RSS), CPU time and threads come from /proc
 * while running and from wait4 rusage once reaped. Files and network
 * endpoints are not observable from the parent and are reported as nullopt.
 */
class ProcessBackend : public IsolationBackend {
public:
    explicit ProcessBackend(SandboxConfig config,
                            std::shared_ptr<spdlog::logger> logger = nullptr);
    ~ProcessBackend() override;

    ProcessBackend(const ProcessBackend&) = delete;
    ProcessBackend& operator=(const ProcessBackend&) = delete;

    [[nodiscard]] std::string_view name() const noexcept override {
        return "process";
    }

    using IsolationBackend::executeInSandbox;

    [[nodiscard]] RawExecutionResult executeInSandbox(
        const IsolationRequest& request, const ExecutionHooks& hooks) override;

    bool terminateExecution(const IsolationId& isolationId) override;

    [[nodiscard]] std::optional<ResourceUsageSnapshot> getResourceUsage(
        const IsolationId& isolationId) const override;

    [[nodiscard]] std::size_t activeCount() const override;

    void cleanup() override;

    /**
     * @brief Map a reaped child onto the result variants
     *
     * 0 is success with the output as value, 1 an in-child violation,
     * 2 a script error, anything else an unexpected exit.
     */
    [[nodiscard]] static RawExecutionResult classifyExit(
        const ExitStatus& status, std::string output, const IsolationId& isolationId,
        ResourceUsageSnapshot usage, std::chrono::milliseconds executionTime);

    /**
     * @brief Memory limit of one run in MB
     *
     * A declared limit is honoured as given. Only the configured default is
     * raised to the minimum.
     */
    [[nodiscard]] static std::int64_t memoryLimitMb(const ResourceLimits& limits,
                                                    const ProcessBackendConfig& config);

    /// Process and Isolate runs install the audit hook, others get the watchdog only
    [[nodiscard]] static bool auditsOperations(std::optional<IsolationLevel> level);

    /**
     * @brief Decode the value line of captured output
     *
     * Without a value line the trimmed output becomes a string result, and
     * empty output a null one.
     */
    [[nodiscard]] static ScriptValue parseOutput(std::string_view output);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace warden::sandbox::process

#endif  // WARDEN_SANDBOX_PROCESS_BACKEND_HPP
