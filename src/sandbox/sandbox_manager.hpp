/*
 * sandbox_manager.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file sandbox_manager.hpp
 * @brief Single entry point for secure script execution
 *
 * The manager validates a request against the policy ceilings, selects a
 * backend from the isolation level, races the backend against its own
 * wall-clock deadline and tracks every in-flight execution until cleanup.
 */

#ifndef WARDEN_SANDBOX_SANDBOX_MANAGER_HPP
#define WARDEN_SANDBOX_SANDBOX_MANAGER_HPP

#include "backend.hpp"
#include "config.hpp"
#include "types.hpp"

#include <spdlog/logger.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace warden::sandbox {

/**
 * @brief Per-request state, CleanedUp is always reached
 */
enum class ExecutionPhase {
    Dispatched,
    Validating,
    SelectedBackend,
    Running,
    Completed,
    TimedOut,
    Failed,
    CleanedUp
};

[[nodiscard]] constexpr std::string_view executionPhaseToString(
    ExecutionPhase phase) noexcept {
    switch (phase) {
        case ExecutionPhase::Dispatched: return "DISPATCHED";
        case ExecutionPhase::Validating: return "VALIDATING";
        case ExecutionPhase::SelectedBackend: return "SELECTED_BACKEND";
        case ExecutionPhase::Running: return "RUNNING";
        case ExecutionPhase::Completed: return "COMPLETED";
        case ExecutionPhase::TimedOut: return "TIMED_OUT";
        case ExecutionPhase::Failed: return "FAILED";
        case ExecutionPhase::CleanedUp: return "CLEANED_UP";
    }
    return "UNKNOWN";
}

/// Backend instances keyed by strategy
using BackendTable = std::unordered_map<BackendKind, std::shared_ptr<IsolationBackend>>;

/**
 * @brief Secure execution front end
 *
 * Thread-safe; every executeSecurely call blocks its caller until the
 * execution is complete and cleaned up.
 */
class SandboxManager {
public:
    /**
     * @brief Construct with the built-in process and interpreter backends
     */
    explicit SandboxManager(SandboxConfig config = {},
                            std::shared_ptr<spdlog::logger> logger = nullptr);

    /**
     * @brief Construct with an explicit backend table
     */
    SandboxManager(SandboxConfig config, BackendTable backends,
                   std::shared_ptr<spdlog::logger> logger = nullptr);

    ~SandboxManager();

    SandboxManager(const SandboxManager&) = delete;
    SandboxManager& operator=(const SandboxManager&) = delete;

    /**
     * @brief Execute a script and convert its value to T
     *
     * Never throws for expected failure modes; every one of them is a
     * Failure with a classified SandboxError.
     */
    template <typename T = ScriptValue>
    [[nodiscard]] ExecutionResult<T> executeSecurely(
        std::string scriptText, std::string scriptName, ExecutionContext context,
        CompilationOptions compileOptions = {}, EvaluationOptions evalOptions = {}) {
        return convertResult<T>(executeRaw(IsolationRequest{
            .scriptText = std::move(scriptText),
            .scriptName = std::move(scriptName),
            .context = std::move(context),
            .compileOptions = std::move(compileOptions),
            .evalOptions = std::move(evalOptions)}));
    }

    /**
     * @brief Execute a prepared request without converting its value
     */
    [[nodiscard]] RawExecutionResult executeRaw(IsolationRequest request);

    /**
     * @brief Request a stop of a tracked execution
     * @return false if the key is unknown or a stop was already requested
     */
    bool terminateExecution(const std::string& executionKey);

    [[nodiscard]] std::optional<ResourceUsageSnapshot> getResourceUsage(
        const std::string& executionKey) const;

    /**
     * @brief Point-in-time usage of every tracked execution
     */
    [[nodiscard]] std::unordered_map<std::string, ResourceUsageSnapshot>
    getActiveExecutions() const;

    [[nodiscard]] SecurityPolicyValidation validateSecurityPolicy(
        const ExecutionContext& context) const;

    /**
     * @brief Stop everything and clean up each backend exactly once
     *
     * Idempotent. Later executions fail with LaunchFailed.
     */
    void shutdown();

    [[nodiscard]] bool isShutdown() const noexcept;

    [[nodiscard]] const SandboxConfig& config() const noexcept;

    /**
     * @brief Backend for an isolation level, Interpreter when absent
     */
    [[nodiscard]] static BackendKind selectBackend(
        std::optional<IsolationLevel> level) noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace warden::sandbox

#endif  // WARDEN_SANDBOX_SANDBOX_MANAGER_HPP
