/*
 * config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "config.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace warden::sandbox {

namespace {

std::chrono::milliseconds msValue(const nlohmann::json& j, const char* key,
                                  std::chrono::milliseconds fallback) {
    return std::chrono::milliseconds{j.value(key, fallback.count())};
}

}  // namespace

void to_json(nlohmann::json& j, const PolicyCeilings& policy) {
    j = nlohmann::json{
        {"maxMemoryMb", policy.maxMemoryMb},
        {"maxCpuTimeMs", policy.maxCpuTimeMs},
        {"maxThreads", policy.maxThreads},
        {"maxWallTimeMs", policy.maxWallTimeMs},
        {"maxFileHandles", policy.maxFileHandles},
        {"maxEnvironmentVariablesAtThreadLevel",
         policy.maxEnvironmentVariablesAtThreadLevel},
        {"systemEnvironmentPrefixes", policy.systemEnvironmentPrefixes}};
}

void from_json(const nlohmann::json& j, PolicyCeilings& policy) {
    PolicyCeilings defaults;
    policy.maxMemoryMb = j.value("maxMemoryMb", defaults.maxMemoryMb);
    policy.maxCpuTimeMs = j.value("maxCpuTimeMs", defaults.maxCpuTimeMs);
    policy.maxThreads = j.value("maxThreads", defaults.maxThreads);
    policy.maxWallTimeMs = j.value("maxWallTimeMs", defaults.maxWallTimeMs);
    policy.maxFileHandles = j.value("maxFileHandles", defaults.maxFileHandles);
    policy.maxEnvironmentVariablesAtThreadLevel =
        j.value("maxEnvironmentVariablesAtThreadLevel",
                defaults.maxEnvironmentVariablesAtThreadLevel);
    policy.systemEnvironmentPrefixes =
        j.value("systemEnvironmentPrefixes", defaults.systemEnvironmentPrefixes);
}

void to_json(nlohmann::json& j, const EnvironmentPolicy& policy) {
    j = nlohmann::json{{"allowedPrefixes", policy.allowedPrefixes},
                       {"deniedNames", policy.deniedNames}};
}

void from_json(const nlohmann::json& j, EnvironmentPolicy& policy) {
    EnvironmentPolicy defaults;
    policy.allowedPrefixes = j.value("allowedPrefixes", defaults.allowedPrefixes);
    policy.deniedNames = j.value("deniedNames", defaults.deniedNames);
}

void to_json(nlohmann::json& j, const ProcessBackendConfig& config) {
    j = nlohmann::json{{"pythonExecutable", config.pythonExecutable.string()},
                       {"tempRoot", config.tempRoot.string()},
                       {"defaultMemoryMb", config.defaultMemoryMb},
                       {"minimumMemoryMb", config.minimumMemoryMb},
                       {"defaultWallTimeMs", config.defaultWallTime.count()},
                       {"gracePeriodMs", config.gracePeriod.count()},
                       {"pollIntervalMs", config.pollInterval.count()},
                       {"monitorMarginMs", config.monitorMargin.count()},
                       {"maxOutputBytes", config.maxOutputBytes}};
}

void from_json(const nlohmann::json& j, ProcessBackendConfig& config) {
    ProcessBackendConfig defaults;
    config.pythonExecutable = j.value("pythonExecutable", std::string{});
    config.tempRoot = j.value("tempRoot", std::string{});
    config.defaultMemoryMb = j.value("defaultMemoryMb", defaults.defaultMemoryMb);
    config.minimumMemoryMb = j.value("minimumMemoryMb", defaults.minimumMemoryMb);
    config.defaultWallTime = msValue(j, "defaultWallTimeMs", defaults.defaultWallTime);
    config.gracePeriod = msValue(j, "gracePeriodMs", defaults.gracePeriod);
    config.pollInterval = msValue(j, "pollIntervalMs", defaults.pollInterval);
    config.monitorMargin = msValue(j, "monitorMarginMs", defaults.monitorMargin);
    config.maxOutputBytes = j.value("maxOutputBytes", defaults.maxOutputBytes);
}

void to_json(nlohmann::json& j, const InterpreterBackendConfig& config) {
    j = nlohmann::json{{"statementsPerCpuMs", config.statementsPerCpuMs},
                       {"memoryStatementBudget", config.memoryStatementBudget},
                       {"cpuCheckInterval", config.cpuCheckInterval},
                       {"gracePeriodMs", config.gracePeriod.count()},
                       {"constrainedModules", config.constrainedModules},
                       {"isolatedModules", config.isolatedModules},
                       {"threadingModules", config.threadingModules}};
}

void from_json(const nlohmann::json& j, InterpreterBackendConfig& config) {
    InterpreterBackendConfig defaults;
    config.statementsPerCpuMs =
        j.value("statementsPerCpuMs", defaults.statementsPerCpuMs);
    config.memoryStatementBudget =
        j.value("memoryStatementBudget", defaults.memoryStatementBudget);
    config.cpuCheckInterval = j.value("cpuCheckInterval", defaults.cpuCheckInterval);
    config.gracePeriod = msValue(j, "gracePeriodMs", defaults.gracePeriod);
    config.constrainedModules =
        j.value("constrainedModules", defaults.constrainedModules);
    config.isolatedModules = j.value("isolatedModules", defaults.isolatedModules);
    config.threadingModules = j.value("threadingModules", defaults.threadingModules);
}

void to_json(nlohmann::json& j, const SandboxConfig& config) {
    j = nlohmann::json{{"policy", config.policy},
                       {"environment", config.environment},
                       {"process", config.process},
                       {"interpreter", config.interpreter},
                       {"defaultWallTimeMs", config.defaultWallTime.count()},
                       {"stopWaitMs", config.stopWait.count()}};
}

void from_json(const nlohmann::json& j, SandboxConfig& config) {
    SandboxConfig defaults;
    config.policy = j.value("policy", nlohmann::json::object()).get<PolicyCeilings>();
    config.environment =
        j.value("environment", nlohmann::json::object()).get<EnvironmentPolicy>();
    config.process =
        j.value("process", nlohmann::json::object()).get<ProcessBackendConfig>();
    config.interpreter = j.value("interpreter", nlohmann::json::object())
                             .get<InterpreterBackendConfig>();
    config.defaultWallTime = msValue(j, "defaultWallTimeMs", defaults.defaultWallTime);
    config.stopWait = msValue(j, "stopWaitMs", defaults.stopWait);
}

Result<SandboxConfig> loadSandboxConfig(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return std::unexpected(SandboxError{
            .kind = SandboxErrorKind::LaunchFailed,
            .message = "Cannot open sandbox configuration: " + path.string()});
    }

    try {
        auto document = nlohmann::json::parse(file);
        auto config = document.get<SandboxConfig>();
        spdlog::debug("Loaded sandbox configuration from {}", path.string());
        return config;
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Invalid sandbox configuration {}: {}", path.string(),
                      e.what());
        return std::unexpected(SandboxError{
            .kind = SandboxErrorKind::LaunchFailed,
            .message = "Invalid sandbox configuration: " + path.string(),
            .cause = e.what()});
    }
}

std::optional<std::filesystem::path> ConfigDiscovery::findPythonExecutable() {
    std::vector<std::filesystem::path> searchPaths = {
        "/usr/bin/python3",
        "/usr/local/bin/python3",
        "/usr/bin/python"
    };

    for (const auto& path : searchPaths) {
        std::error_code ec;
        if (std::filesystem::exists(path, ec)) {
            return path;
        }
    }
    return std::nullopt;
}

Result<std::filesystem::path> ConfigDiscovery::resolvePythonExecutable(
    const ProcessBackendConfig& config) {
    auto pythonPath = config.pythonExecutable.empty()
                          ? findPythonExecutable()
                          : std::optional{config.pythonExecutable};

    std::error_code ec;
    if (!pythonPath || !std::filesystem::exists(*pythonPath, ec)) {
        return std::unexpected(SandboxError{
            .kind = SandboxErrorKind::LaunchFailed,
            .message = "Python interpreter not found",
            .cause = config.pythonExecutable.empty()
                         ? std::nullopt
                         : std::optional{config.pythonExecutable.string()}});
    }
    return *pythonPath;
}

std::filesystem::path ConfigDiscovery::resolveTempRoot(
    const ProcessBackendConfig& config) {
    if (!config.tempRoot.empty()) {
        return config.tempRoot;
    }
    std::error_code ec;
    auto root = std::filesystem::temp_directory_path(ec);
    if (ec) {
        spdlog::warn("No system temp directory ({}), using /tmp", ec.message());
        return "/tmp";
    }
    return root;
}

}  // namespace warden::sandbox
