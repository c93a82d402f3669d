/*
 * policy_validator.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "policy_validator.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>

namespace warden::sandbox {

PolicyValidator::PolicyValidator(PolicyCeilings ceilings)
    : ceilings_(std::move(ceilings)) {}

SecurityPolicyValidation PolicyValidator::validate(
    const ExecutionContext& context) const {
    std::vector<std::string> issues;

    if (context.resourceLimits) {
        checkLimits(*context.resourceLimits, issues);
    }

    if (context.timeout && context.timeout->count() <= 0) {
        issues.push_back(fmt::format("Timeout must be positive, got {}ms",
                                     context.timeout->count()));
    }

    checkEnvironment(context, issues);

    return SecurityPolicyValidation{.isValid = issues.empty(),
                                    .issues = std::move(issues)};
}

void PolicyValidator::checkLimits(const ResourceLimits& limits,
                                  std::vector<std::string>& issues) const {
    if (limits.maxMemoryMb) {
        if (*limits.maxMemoryMb <= 0) {
            issues.push_back(fmt::format("Memory limit must be positive, got {}MB",
                                         *limits.maxMemoryMb));
        } else if (*limits.maxMemoryMb > ceilings_.maxMemoryMb) {
            issues.push_back(fmt::format(
                "Memory limit {}MB exceeds maximum allowed {}MB",
                *limits.maxMemoryMb, ceilings_.maxMemoryMb));
        }
    }

    if (limits.maxCpuTimeMs) {
        if (*limits.maxCpuTimeMs <= 0) {
            issues.push_back(fmt::format("CPU time limit must be positive, got {}ms",
                                         *limits.maxCpuTimeMs));
        } else if (*limits.maxCpuTimeMs > ceilings_.maxCpuTimeMs) {
            issues.push_back(fmt::format(
                "CPU time limit {}ms exceeds maximum allowed {}ms",
                *limits.maxCpuTimeMs, ceilings_.maxCpuTimeMs));
        }
    }

    if (limits.maxThreads) {
        if (*limits.maxThreads < 0) {
            issues.push_back(fmt::format("Thread count cannot be negative, got {}",
                                         *limits.maxThreads));
        } else if (*limits.maxThreads > ceilings_.maxThreads) {
            issues.push_back(fmt::format("Thread count {} exceeds maximum allowed {}",
                                         *limits.maxThreads, ceilings_.maxThreads));
        }
    }

    if (limits.maxWallTimeMs) {
        if (*limits.maxWallTimeMs <= 0) {
            issues.push_back(fmt::format("Wall time limit must be positive, got {}ms",
                                         *limits.maxWallTimeMs));
        } else if (*limits.maxWallTimeMs > ceilings_.maxWallTimeMs) {
            issues.push_back(fmt::format(
                "Wall time limit {}ms exceeds maximum allowed {}ms",
                *limits.maxWallTimeMs, ceilings_.maxWallTimeMs));
        }
    }

    if (limits.maxFileHandles) {
        if (*limits.maxFileHandles < 0) {
            issues.push_back(fmt::format("File handle limit cannot be negative, got {}",
                                         *limits.maxFileHandles));
        } else if (*limits.maxFileHandles > ceilings_.maxFileHandles) {
            issues.push_back(fmt::format(
                "File handle limit {} exceeds maximum allowed {}",
                *limits.maxFileHandles, ceilings_.maxFileHandles));
        }
    }
}

void PolicyValidator::checkEnvironment(const ExecutionContext& context,
                                       std::vector<std::string>& issues) const {
    if (!context.policy.isolationLevel) {
        return;
    }
    auto level = *context.policy.isolationLevel;

    switch (level) {
        case IsolationLevel::Process:
        case IsolationLevel::Isolate: {
            std::vector<std::string> offending;
            for (const auto& [name, value] : context.environmentVariables) {
                for (const auto& prefix : ceilings_.systemEnvironmentPrefixes) {
                    if (name.starts_with(prefix)) {
                        offending.push_back(name);
                        break;
                    }
                }
            }
            // Sorted so reports are stable across map iteration orders
            std::sort(offending.begin(), offending.end());
            for (const auto& name : offending) {
                issues.push_back(fmt::format(
                    "System environment variable {} is not allowed at {} isolation",
                    name, isolationLevelToString(level)));
            }
            break;
        }
        case IsolationLevel::Thread:
            if (context.environmentVariables.size() >
                ceilings_.maxEnvironmentVariablesAtThreadLevel) {
                issues.push_back(fmt::format(
                    "Too many environment variables for thread isolation: {} > {}",
                    context.environmentVariables.size(),
                    ceilings_.maxEnvironmentVariablesAtThreadLevel));
            }
            break;
        case IsolationLevel::None:
            break;
    }
}

}  // namespace warden::sandbox
