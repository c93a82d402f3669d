/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file types.hpp
 * @brief Sandbox type definitions shared by the manager and the backends
 * @date 2024
 * @version 1.0.0
 */

#ifndef WARDEN_SANDBOX_TYPES_HPP
#define WARDEN_SANDBOX_TYPES_HPP

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace warden::sandbox {

/**
 * @brief Value produced by a sandboxed script before conversion
 */
using ScriptValue = nlohmann::json;

/**
 * @brief Identifier of one execution inside a backend
 *
 * Format: "<backend>-<sanitized-script-name>-<timestamp>"
 */
using IsolationId = std::string;

/**
 * @brief Requested strength of sandboxing, weakest first
 */
enum class IsolationLevel {
    None,     ///< Trusted in-process interpreter
    Thread,   ///< Constrained in-process interpreter
    Isolate,  ///< Isolated in-process interpreter, no host access
    Process   ///< Separate OS process
};

[[nodiscard]] constexpr std::string_view isolationLevelToString(
    IsolationLevel level) noexcept {
    switch (level) {
        case IsolationLevel::None: return "none";
        case IsolationLevel::Thread: return "thread";
        case IsolationLevel::Isolate: return "isolate";
        case IsolationLevel::Process: return "process";
    }
    return "unknown";
}

/**
 * @brief Parse an isolation level, case-insensitive
 * @return The level, or nullopt for unknown names
 */
[[nodiscard]] std::optional<IsolationLevel> isolationLevelFromString(
    std::string_view name);

/**
 * @brief Error kinds reported by the sandbox
 *
 * The first six kinds are security violations.
 */
enum class SandboxErrorKind {
    ResourceLimitExceeded,
    UnauthorizedFileAccess,
    UnauthorizedNetworkAccess,
    UnauthorizedSystemAccess,
    MaliciousCodeDetected,
    ExecutionTimeout,
    ExecutionFailed,  ///< Script raised, not a security signal
    LaunchFailed,     ///< Backend could not start the execution
    PolicyViolation,  ///< Rejected before dispatch
    Terminated        ///< Cancelled by terminateExecution
};

[[nodiscard]] constexpr std::string_view sandboxErrorKindToString(
    SandboxErrorKind kind) noexcept {
    switch (kind) {
        case SandboxErrorKind::ResourceLimitExceeded: return "RESOURCE_LIMIT_EXCEEDED";
        case SandboxErrorKind::UnauthorizedFileAccess: return "UNAUTHORIZED_FILE_ACCESS";
        case SandboxErrorKind::UnauthorizedNetworkAccess: return "UNAUTHORIZED_NETWORK_ACCESS";
        case SandboxErrorKind::UnauthorizedSystemAccess: return "UNAUTHORIZED_SYSTEM_ACCESS";
        case SandboxErrorKind::MaliciousCodeDetected: return "MALICIOUS_CODE_DETECTED";
        case SandboxErrorKind::ExecutionTimeout: return "EXECUTION_TIMEOUT";
        case SandboxErrorKind::ExecutionFailed: return "EXECUTION_FAILED";
        case SandboxErrorKind::LaunchFailed: return "LAUNCH_FAILED";
        case SandboxErrorKind::PolicyViolation: return "POLICY_VIOLATION";
        case SandboxErrorKind::Terminated: return "TERMINATED";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr bool isSecurityViolation(SandboxErrorKind kind) noexcept {
    switch (kind) {
        case SandboxErrorKind::ResourceLimitExceeded:
        case SandboxErrorKind::UnauthorizedFileAccess:
        case SandboxErrorKind::UnauthorizedNetworkAccess:
        case SandboxErrorKind::UnauthorizedSystemAccess:
        case SandboxErrorKind::MaliciousCodeDetected:
        case SandboxErrorKind::ExecutionTimeout:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Typed sandbox error
 */
struct SandboxError {
    SandboxErrorKind kind{SandboxErrorKind::ExecutionFailed};
    std::string message;
    IsolationId isolationId;
    std::optional<std::string> cause;

    [[nodiscard]] bool isSecurityViolation() const noexcept {
        return sandbox::isSecurityViolation(kind);
    }

    /// Only timeouts are worth retrying automatically
    [[nodiscard]] bool isRetryable() const noexcept {
        return kind == SandboxErrorKind::ExecutionTimeout;
    }

    /**
     * @brief Render as "KIND: message (cause)"
     */
    [[nodiscard]] std::string describe() const;
};

template <typename T>
using Result = std::expected<T, SandboxError>;

/**
 * @brief Optional resource ceilings
 *
 * An absent field means "use the backend default", never "unlimited".
 */
struct ResourceLimits {
    std::optional<std::int64_t> maxMemoryMb;
    std::optional<std::int64_t> maxCpuTimeMs;
    std::optional<std::int64_t> maxWallTimeMs;
    std::optional<int> maxThreads;
    std::optional<int> maxFileHandles;
};

struct ExecutionPolicy {
    /// Absent or unknown levels select the least restrictive backend
    std::optional<IsolationLevel> isolationLevel;
};

/**
 * @brief Environment a script is executed in
 */
struct ExecutionContext {
    std::filesystem::path workingDirectory;
    std::unordered_map<std::string, std::string> environmentVariables;
    ScriptValue variables = ScriptValue::object();  ///< Bindings visible to the script
    std::optional<ResourceLimits> resourceLimits;
    std::optional<std::chrono::milliseconds> timeout;
    ExecutionPolicy policy;
};

struct CompilationOptions {
    bool adaptSyntax{true};                        ///< Apply the pipeline DSL rewrite
    std::vector<std::string> extraAllowedModules;  ///< Added to the tier allow-list
};

struct EvaluationOptions {
    std::optional<std::uint64_t> statementBudget;  ///< Overrides the derived budget
    std::size_t maxOutputBytes{1024 * 1024};       ///< Captured print() output cap
};

/**
 * @brief Immutable input of one execution
 */
struct IsolationRequest {
    std::string scriptText;
    std::string scriptName;
    ExecutionContext context;
    CompilationOptions compileOptions;
    EvaluationOptions evalOptions;
};

/**
 * @brief Point-in-time resource metrics
 *
 * Fields a backend cannot measure are nullopt, never a placeholder zero.
 */
struct ResourceUsageSnapshot {
    std::optional<std::uint64_t> memoryUsedBytes;
    std::optional<std::int64_t> cpuTimeMs;
    std::int64_t wallTimeMs{0};
    std::optional<int> threadsCreated;
    std::optional<std::vector<std::string>> filesAccessed;
    std::optional<std::vector<std::string>> networkConnections;

    [[nodiscard]] std::string toHumanReadable() const;
};

template <typename T>
struct ExecutionSuccess {
    T result;
    IsolationId isolationId;
    ResourceUsageSnapshot resourceUsage;
    std::chrono::milliseconds executionTime{0};
};

struct ExecutionFailure {
    SandboxError error;
    IsolationId isolationId;
    std::string reason;
    std::optional<ResourceUsageSnapshot> resourceUsage;
};

/**
 * @brief Either a typed Success or a Failure, never both
 */
template <typename T>
using ExecutionResult = std::expected<ExecutionSuccess<T>, ExecutionFailure>;

using RawExecutionResult = ExecutionResult<ScriptValue>;

/**
 * @brief Build the Failure variant
 */
[[nodiscard]] std::unexpected<ExecutionFailure> makeFailure(
    SandboxErrorKind kind, const IsolationId& isolationId, std::string reason,
    std::optional<ResourceUsageSnapshot> usage = std::nullopt,
    std::optional<std::string> cause = std::nullopt);

/**
 * @brief Effective wall-time deadline of a context
 *
 * maxWallTimeMs wins over the context timeout, which wins over the default.
 */
[[nodiscard]] std::chrono::milliseconds effectiveWallTime(
    const ExecutionContext& context, std::chrono::milliseconds fallback);

/**
 * @brief Map a raw script value onto the caller's type
 *
 * A std::string target accepts every value; non-strings use their JSON text.
 */
template <typename T>
[[nodiscard]] ExecutionResult<T> convertResult(RawExecutionResult raw) {
    if constexpr (std::is_same_v<T, ScriptValue>) {
        return raw;
    } else {
        if (!raw) {
            return std::unexpected(std::move(raw.error()));
        }
        auto& success = *raw;
        ExecutionSuccess<T> typed{.result = T{},
                                  .isolationId = std::move(success.isolationId),
                                  .resourceUsage = std::move(success.resourceUsage),
                                  .executionTime = success.executionTime};
        if constexpr (std::is_same_v<T, std::string>) {
            typed.result = success.result.is_string()
                               ? success.result.template get<std::string>()
                               : success.result.dump();
        } else {
            try {
                typed.result = success.result.template get<T>();
            } catch (const nlohmann::json::exception& e) {
                return makeFailure(SandboxErrorKind::ExecutionFailed,
                                   typed.isolationId,
                                   "Script result has an unexpected type: " +
                                       success.result.dump(),
                                   std::move(typed.resourceUsage), e.what());
            }
        }
        return typed;
    }
}

/**
 * @brief Thrown by SecurityPolicyValidation::throwIfInvalid
 */
class SecurityPolicyException : public std::runtime_error {
public:
    explicit SecurityPolicyException(std::vector<std::string> issues);

    [[nodiscard]] const std::vector<std::string>& issues() const noexcept {
        return issues_;
    }

private:
    std::vector<std::string> issues_;
};

/**
 * @brief Outcome of policy validation, listing every violated rule
 */
struct SecurityPolicyValidation {
    bool isValid{true};
    std::vector<std::string> issues;

    void throwIfInvalid() const;
};

// JSON conversion
void to_json(nlohmann::json& j, const IsolationLevel& level);
void from_json(const nlohmann::json& j, IsolationLevel& level);
void to_json(nlohmann::json& j, const ResourceLimits& limits);
void from_json(const nlohmann::json& j, ResourceLimits& limits);
void to_json(nlohmann::json& j, const ExecutionContext& context);
void from_json(const nlohmann::json& j, ExecutionContext& context);
void to_json(nlohmann::json& j, const ResourceUsageSnapshot& usage);
void to_json(nlohmann::json& j, const SandboxError& error);

}  // namespace warden::sandbox

#endif  // WARDEN_SANDBOX_TYPES_HPP
