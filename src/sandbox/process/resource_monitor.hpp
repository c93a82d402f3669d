/*
 * resource_monitor.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef WARDEN_SANDBOX_RESOURCE_MONITOR_HPP
#define WARDEN_SANDBOX_RESOURCE_MONITOR_HPP

#include <cstdint>
#include <optional>

namespace warden::sandbox::process {

/**
 * @brief /proc based sampling of a child process
 */
struct ProcessSample {
    std::optional<std::uint64_t> residentBytes;
    std::optional<std::uint64_t> peakResidentBytes;
    std::optional<std::int64_t> cpuTimeMs;
    std::optional<int> threads;
};

/**
 * @brief Resource monitoring utilities for subprocess
 */
class ResourceMonitor {
public:
    /**
     * @brief Get current resident memory of a process
     * @param processId Process ID to query
     * @return Resident set size in bytes or nullopt if unavailable
     */
    [[nodiscard]] static std::optional<std::uint64_t> getMemoryUsage(int processId);

    /**
     * @brief Get peak resident memory (VmHWM) of a process
     */
    [[nodiscard]] static std::optional<std::uint64_t> getPeakMemoryUsage(int processId);

    /**
     * @brief Get consumed CPU time (user + system) of a process
     */
    [[nodiscard]] static std::optional<std::int64_t> getCpuTimeMs(int processId);

    /**
     * @brief Get the current thread count of a process
     */
    [[nodiscard]] static std::optional<int> getThreadCount(int processId);

    /**
     * @brief Check if process exceeds memory limit
     * @param processId Process ID to check
     * @param limitMB Memory limit in megabytes
     * @return True if limit exceeded
     */
    [[nodiscard]] static bool isMemoryLimitExceeded(int processId,
                                                    std::uint64_t limitMB);

    /**
     * @brief Sample every metric in one pass
     */
    [[nodiscard]] static ProcessSample sample(int processId);
};

}  // namespace warden::sandbox::process

#endif  // WARDEN_SANDBOX_RESOURCE_MONITOR_HPP
