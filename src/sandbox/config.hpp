/*
 * config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file config.hpp
 * @brief Sandbox configuration and discovery helpers
 */

#ifndef WARDEN_SANDBOX_CONFIG_HPP
#define WARDEN_SANDBOX_CONFIG_HPP

#include "types.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace warden::sandbox {

/**
 * @brief Hard ceilings enforced by policy validation
 */
struct PolicyCeilings {
    std::int64_t maxMemoryMb{2048};
    std::int64_t maxCpuTimeMs{300000};
    int maxThreads{10};
    std::int64_t maxWallTimeMs{3600000};
    int maxFileHandles{1024};
    std::size_t maxEnvironmentVariablesAtThreadLevel{50};
    std::vector<std::string> systemEnvironmentPrefixes{"SYSTEM_"};
};

/**
 * @brief Which environment variables may reach a script
 */
struct EnvironmentPolicy {
    std::vector<std::string> allowedPrefixes{"PIPELINE_", "USER_", "CUSTOM_"};
    std::vector<std::string> deniedNames{"PATH",       "JAVA_HOME",  "CLASSPATH",
                                         "LD_LIBRARY_PATH", "LD_PRELOAD",
                                         "PYTHONPATH", "PYTHONHOME"};
};

struct ProcessBackendConfig {
    std::filesystem::path pythonExecutable;  ///< Discovered when empty
    std::filesystem::path tempRoot;          ///< System temp dir when empty
    std::int64_t defaultMemoryMb{512};
    std::int64_t minimumMemoryMb{64};
    std::chrono::milliseconds defaultWallTime{60000};
    std::chrono::milliseconds gracePeriod{5000};
    std::chrono::milliseconds pollInterval{10};
    std::chrono::milliseconds monitorMargin{1000};  ///< Slack of the in-child watchdog
    std::size_t maxOutputBytes{10 * 1024 * 1024};
};

struct InterpreterBackendConfig {
    std::uint64_t statementsPerCpuMs{1000};
    std::uint64_t memoryStatementBudget{100000};
    std::uint64_t cpuCheckInterval{1000};
    std::chrono::milliseconds gracePeriod{5000};
    std::vector<std::string> constrainedModules{
        "math",     "cmath",       "json",    "re",        "datetime",
        "time",     "random",      "string",  "collections", "itertools",
        "functools", "operator",   "decimal", "fractions", "statistics",
        "textwrap", "typing",      "dataclasses", "enum",  "copy",
        "hashlib",  "base64",      "uuid",    "heapq",     "bisect",
        "os",       "pathlib",     "io",      "glob"};
    std::vector<std::string> isolatedModules{
        "math",     "cmath",      "json",    "re",        "datetime",
        "random",   "string",     "collections", "itertools", "functools",
        "operator", "decimal",    "fractions", "statistics", "textwrap",
        "typing",   "dataclasses", "enum",   "copy",      "heapq",
        "bisect",   "base64",     "hashlib"};
    std::vector<std::string> threadingModules{"threading", "_thread", "queue",
                                              "concurrent"};
};

/**
 * @brief Complete sandbox configuration
 */
struct SandboxConfig {
    PolicyCeilings policy;
    EnvironmentPolicy environment;
    ProcessBackendConfig process;
    InterpreterBackendConfig interpreter;
    std::chrono::milliseconds defaultWallTime{60000};  ///< Manager-level deadline
    /// How long a stopped backend may take to return before the manager
    /// abandons it and reports the timeout
    std::chrono::milliseconds stopWait{2000};
};

/**
 * @brief Load a configuration file, missing keys keep their defaults
 */
[[nodiscard]] Result<SandboxConfig> loadSandboxConfig(
    const std::filesystem::path& path);

/**
 * @brief Discovery utilities for the process backend
 */
class ConfigDiscovery {
public:
    /**
     * @brief Find the default Python executable
     * @return Path to Python executable or nullopt
     */
    [[nodiscard]] static std::optional<std::filesystem::path> findPythonExecutable();

    /**
     * @brief Resolve the configured interpreter, falling back to discovery
     */
    [[nodiscard]] static Result<std::filesystem::path> resolvePythonExecutable(
        const ProcessBackendConfig& config);

    /**
     * @brief Directory sandbox directories are created in
     */
    [[nodiscard]] static std::filesystem::path resolveTempRoot(
        const ProcessBackendConfig& config);
};

void to_json(nlohmann::json& j, const PolicyCeilings& policy);
void from_json(const nlohmann::json& j, PolicyCeilings& policy);
void to_json(nlohmann::json& j, const EnvironmentPolicy& policy);
void from_json(const nlohmann::json& j, EnvironmentPolicy& policy);
void to_json(nlohmann::json& j, const ProcessBackendConfig& config);
void from_json(const nlohmann::json& j, ProcessBackendConfig& config);
void to_json(nlohmann::json& j, const InterpreterBackendConfig& config);
void from_json(const nlohmann::json& j, InterpreterBackendConfig& config);
void to_json(nlohmann::json& j, const SandboxConfig& config);
void from_json(const nlohmann::json& j, SandboxConfig& config);

}  // namespace warden::sandbox

#endif  // WARDEN_SANDBOX_CONFIG_HPP
