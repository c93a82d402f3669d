/*
 * resource_monitor.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "resource_monitor.hpp"

#include <fstream>
#include <sstream>
#include <string>
#include <string_view>

#include <unistd.h>

namespace warden::sandbox::process {

namespace {

std::string procPath(int processId, const char* entry) {
    return "/proc/" + std::to_string(processId) + "/" + entry;
}

/// Value of a "Key:   <n> ..." line in /proc/<pid>/status
std::optional<std::uint64_t> statusField(int processId, std::string_view key) {
    std::ifstream status(procPath(processId, "status"));
    if (!status) {
        return std::nullopt;
    }
    std::string line;
    while (std::getline(status, line)) {
        if (line.size() > key.size() && line.compare(0, key.size(), key) == 0 &&
            line[key.size()] == ':') {
            std::uint64_t value = 0;
            std::istringstream fields(line.substr(key.size() + 1));
            if (fields >> value) {
                return value;
            }
        }
    }
    return std::nullopt;
}

}  // namespace

std::optional<std::uint64_t> ResourceMonitor::getMemoryUsage(int processId) {
    if (processId <= 0) return std::nullopt;

    std::ifstream statm(procPath(processId, "statm"));
    if (statm) {
        std::uint64_t size = 0;
        std::uint64_t resident = 0;
        if (statm >> size >> resident) {
            return resident * static_cast<std::uint64_t>(::sysconf(_SC_PAGESIZE));
        }
    }
    return std::nullopt;
}

std::optional<std::uint64_t> ResourceMonitor::getPeakMemoryUsage(int processId) {
    if (processId <= 0) return std::nullopt;

    if (auto peak = statusField(processId, "VmHWM")) {
        return *peak * 1024;  // kB
    }
    return std::nullopt;
}

std::optional<std::int64_t> ResourceMonitor::getCpuTimeMs(int processId) {
    if (processId <= 0) return std::nullopt;

    std::ifstream statFile(procPath(processId, "stat"));
    std::string stat;
    if (!statFile || !std::getline(statFile, stat)) {
        return std::nullopt;
    }

    // comm may contain spaces, fields restart after the closing parenthesis
    auto close = stat.rfind(')');
    if (close == std::string::npos) {
        return std::nullopt;
    }
    std::istringstream fields(stat.substr(close + 2));
    std::string skipped;
    // state is field 3; utime and stime are fields 14 and 15
    for (int field = 3; field < 14; ++field) {
        if (!(fields >> skipped)) {
            return std::nullopt;
        }
    }
    std::uint64_t utime = 0;
    std::uint64_t stime = 0;
    if (!(fields >> utime >> stime)) {
        return std::nullopt;
    }
    auto ticks = ::sysconf(_SC_CLK_TCK);
    if (ticks <= 0) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>((utime + stime) * 1000 /
                                     static_cast<std::uint64_t>(ticks));
}

std::optional<int> ResourceMonitor::getThreadCount(int processId) {
    if (processId <= 0) return std::nullopt;

    if (auto threads = statusField(processId, "Threads")) {
        return static_cast<int>(*threads);
    }
    return std::nullopt;
}

bool ResourceMonitor::isMemoryLimitExceeded(int processId, std::uint64_t limitMB) {
    if (limitMB == 0) return false;  // No limit

    auto memUsage = getMemoryUsage(processId);
    if (memUsage) {
        return *memUsage > limitMB * 1024 * 1024;
    }
    return false;
}

ProcessSample ResourceMonitor::sample(int processId) {
    return ProcessSample{.residentBytes = getMemoryUsage(processId),
                         .peakResidentBytes = getPeakMemoryUsage(processId),
                         .cpuTimeMs = getCpuTimeMs(processId),
                         .threads = getThreadCount(processId)};
}

}  // namespace warden::sandbox::process
