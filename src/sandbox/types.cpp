/*
 * types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "types.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

#include <algorithm>
#include <cctype>

namespace warden::sandbox {

namespace {

std::string joinOrNone(const std::optional<std::vector<std::string>>& items) {
    if (!items) {
        return "n/a";
    }
    if (items->empty()) {
        return "none";
    }
    return fmt::format("{} ({})", items->size(), fmt::join(*items, ", "));
}

template <typename T>
std::string valueOrNa(const std::optional<T>& value, std::string_view unit) {
    if (!value) {
        return "n/a";
    }
    return fmt::format("{}{}", *value, unit);
}

template <typename T>
void putOptional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

template <typename T>
void getOptional(const nlohmann::json& j, const char* key, std::optional<T>& value) {
    if (auto it = j.find(key); it != j.end() && !it->is_null()) {
        value = it->get<T>();
    } else {
        value.reset();
    }
}

}  // namespace

std::optional<IsolationLevel> isolationLevelFromString(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    for (auto level : {IsolationLevel::None, IsolationLevel::Thread,
                       IsolationLevel::Isolate, IsolationLevel::Process}) {
        if (lowered == isolationLevelToString(level)) {
            return level;
        }
    }
    return std::nullopt;
}

std::string SandboxError::describe() const {
    if (cause && !cause->empty()) {
        return fmt::format("{}: {} ({})", sandboxErrorKindToString(kind),
                           message, *cause);
    }
    return fmt::format("{}: {}", sandboxErrorKindToString(kind), message);
}

std::string ResourceUsageSnapshot::toHumanReadable() const {
    std::string memory = "n/a";
    if (memoryUsedBytes) {
        memory = fmt::format("{:.2f} MB",
                             static_cast<double>(*memoryUsedBytes) / (1024.0 * 1024.0));
    }
    return fmt::format(
        "Memory: {}\nCPU Time: {}\nWall Time: {}ms\nThreads: {}\n"
        "Files Accessed: {}\nNetwork Connections: {}",
        memory, valueOrNa(cpuTimeMs, "ms"), wallTimeMs,
        valueOrNa(threadsCreated, ""), joinOrNone(filesAccessed),
        joinOrNone(networkConnections));
}

std::unexpected<ExecutionFailure> makeFailure(
    SandboxErrorKind kind, const IsolationId& isolationId, std::string reason,
    std::optional<ResourceUsageSnapshot> usage,
    std::optional<std::string> cause) {
    ExecutionFailure failure{
        .error = SandboxError{.kind = kind,
                              .message = reason,
                              .isolationId = isolationId,
                              .cause = std::move(cause)},
        .isolationId = isolationId,
        .reason = std::move(reason),
        .resourceUsage = std::move(usage)};
    return std::unexpected(std::move(failure));
}

std::chrono::milliseconds effectiveWallTime(const ExecutionContext& context,
                                            std::chrono::milliseconds fallback) {
    if (context.resourceLimits && context.resourceLimits->maxWallTimeMs) {
        return std::chrono::milliseconds{*context.resourceLimits->maxWallTimeMs};
    }
    if (context.timeout) {
        return *context.timeout;
    }
    return fallback;
}

SecurityPolicyException::SecurityPolicyException(std::vector<std::string> issues)
    : std::runtime_error(fmt::format("Security policy validation failed: {}",
                                     fmt::join(issues, "; "))),
      issues_(std::move(issues)) {}

void SecurityPolicyValidation::throwIfInvalid() const {
    if (!isValid) {
        throw SecurityPolicyException(issues);
    }
}

// =============================================================================
// JSON
// =============================================================================

void to_json(nlohmann::json& j, const IsolationLevel& level) {
    j = std::string(isolationLevelToString(level));
}

void from_json(const nlohmann::json& j, IsolationLevel& level) {
    auto parsed = isolationLevelFromString(j.get<std::string>());
    if (!parsed) {
        throw std::invalid_argument("Unknown isolation level: " + j.dump());
    }
    level = *parsed;
}

void to_json(nlohmann::json& j, const ResourceLimits& limits) {
    j = nlohmann::json::object();
    putOptional(j, "maxMemoryMb", limits.maxMemoryMb);
    putOptional(j, "maxCpuTimeMs", limits.maxCpuTimeMs);
    putOptional(j, "maxWallTimeMs", limits.maxWallTimeMs);
    putOptional(j, "maxThreads", limits.maxThreads);
    putOptional(j, "maxFileHandles", limits.maxFileHandles);
}

void from_json(const nlohmann::json& j, ResourceLimits& limits) {
    getOptional(j, "maxMemoryMb", limits.maxMemoryMb);
    getOptional(j, "maxCpuTimeMs", limits.maxCpuTimeMs);
    getOptional(j, "maxWallTimeMs", limits.maxWallTimeMs);
    getOptional(j, "maxThreads", limits.maxThreads);
    getOptional(j, "maxFileHandles", limits.maxFileHandles);
}

void to_json(nlohmann::json& j, const ExecutionContext& context) {
    j = nlohmann::json{{"workingDirectory", context.workingDirectory.string()},
                       {"environmentVariables", context.environmentVariables},
                       {"variables", context.variables}};
    if (context.resourceLimits) {
        j["resourceLimits"] = *context.resourceLimits;
    }
    if (context.timeout) {
        j["timeoutMs"] = context.timeout->count();
    }
    if (context.policy.isolationLevel) {
        j["isolationLevel"] = *context.policy.isolationLevel;
    }
}

void from_json(const nlohmann::json& j, ExecutionContext& context) {
    context.workingDirectory = j.value("workingDirectory", std::string{});
    context.environmentVariables =
        j.value("environmentVariables",
                std::unordered_map<std::string, std::string>{});
    context.variables = j.value("variables", nlohmann::json::object());
    if (auto it = j.find("resourceLimits"); it != j.end() && it->is_object()) {
        context.resourceLimits = it->get<ResourceLimits>();
    } else {
        context.resourceLimits.reset();
    }
    if (auto it = j.find("timeoutMs"); it != j.end() && it->is_number()) {
        context.timeout = std::chrono::milliseconds{it->get<std::int64_t>()};
    } else {
        context.timeout.reset();
    }
    // Unknown level names fall back to the least restrictive backend
    if (auto it = j.find("isolationLevel"); it != j.end() && it->is_string()) {
        context.policy.isolationLevel =
            isolationLevelFromString(it->get<std::string>());
    } else {
        context.policy.isolationLevel.reset();
    }
}

void to_json(nlohmann::json& j, const ResourceUsageSnapshot& usage) {
    j = nlohmann::json::object();
    putOptional(j, "memoryUsedBytes", usage.memoryUsedBytes);
    putOptional(j, "cpuTimeMs", usage.cpuTimeMs);
    j["wallTimeMs"] = usage.wallTimeMs;
    putOptional(j, "threadsCreated", usage.threadsCreated);
    putOptional(j, "filesAccessed", usage.filesAccessed);
    putOptional(j, "networkConnections", usage.networkConnections);
}

void to_json(nlohmann::json& j, const SandboxError& error) {
    j = nlohmann::json{{"kind", sandboxErrorKindToString(error.kind)},
                       {"message", error.message},
                       {"isolationId", error.isolationId},
                       {"securityViolation", error.isSecurityViolation()}};
    putOptional(j, "cause", error.cause);
}

}  // namespace warden::sandbox
