/*
 * backend.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file backend.hpp
 * @brief Contract implemented by every isolation strategy
 */

#ifndef WARDEN_SANDBOX_BACKEND_HPP
#define WARDEN_SANDBOX_BACKEND_HPP

#include "types.hpp"

#include <functional>
#include <optional>
#include <stop_token>
#include <string_view>

namespace warden::sandbox {

/**
 * @brief Closed set of isolation strategies
 */
enum class BackendKind { Process, Interpreter };

[[nodiscard]] constexpr std::string_view backendKindToString(BackendKind kind) noexcept {
    switch (kind) {
        case BackendKind::Process: return "process";
        case BackendKind::Interpreter: return "isolate";
    }
    return "unknown";
}

/**
 * @brief Caller-side hooks of one execution
 */
struct ExecutionHooks {
    /// A stop request terminates the execution (graceful, then forced)
    std::stop_token stopToken;
    /// Called once the IsolationId is assigned and tracked
    std::function<void(const IsolationId&)> onStarted;
};

/**
 * @brief Isolation backend interface
 *
 * executeInSandbox blocks until completion, timeout or violation and never
 * leaves temp files, processes or interpreter contexts behind.
 */
class IsolationBackend {
public:
    virtual ~IsolationBackend() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /**
     * @brief Run one request
     * @return Success with the raw script value, or a classified Failure
     */
    [[nodiscard]] virtual RawExecutionResult executeInSandbox(
        const IsolationRequest& request, const ExecutionHooks& hooks) = 0;

    [[nodiscard]] RawExecutionResult executeInSandbox(
        const IsolationRequest& request) {
        return executeInSandbox(request, ExecutionHooks{});
    }

    /**
     * @brief Run one request and convert the result to T
     */
    template <typename T>
    [[nodiscard]] ExecutionResult<T> executeAs(const IsolationRequest& request,
                                               const ExecutionHooks& hooks = {}) {
        return convertResult<T>(executeInSandbox(request, hooks));
    }

    /**
     * @brief Graceful stop, forced after the grace window
     * @return false if the id is unknown or already finished
     */
    virtual bool terminateExecution(const IsolationId& isolationId) = 0;

    /**
     * @brief Live usage of a tracked execution, nullopt once cleaned up
     */
    [[nodiscard]] virtual std::optional<ResourceUsageSnapshot> getResourceUsage(
        const IsolationId& isolationId) const = 0;

    [[nodiscard]] virtual std::size_t activeCount() const = 0;

    /**
     * @brief Terminate everything tracked and release shared handles
     *
     * Idempotent. Implementations log failures and must not throw.
     */
    virtual void cleanup() = 0;
};

}  // namespace warden::sandbox

#endif  // WARDEN_SANDBOX_BACKEND_HPP
