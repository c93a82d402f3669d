/*
 * capability_profile.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "capability_profile.hpp"

#include <algorithm>
#include <array>

namespace warden::sandbox::interpreter {

namespace {

constexpr std::array<std::string_view, 15> kNetworkModules = {
    "socket", "ssl",    "http",    "urllib",    "ftplib",
    "smtplib", "poplib", "imaplib", "telnetlib", "xmlrpc",
    "asyncio", "selectors", "select", "socketserver", "requests"};

constexpr std::array<std::string_view, 7> kFileModules = {
    "io", "pathlib", "glob", "tempfile", "fileinput", "shutil", "zipfile"};

std::string_view topLevel(std::string_view module) {
    return module.substr(0, module.find('.'));
}

}  // namespace

IsolationTier tierForLevel(std::optional<IsolationLevel> level) noexcept {
    if (!level) {
        return IsolationTier::Trusted;
    }
    switch (*level) {
        case IsolationLevel::None: return IsolationTier::Trusted;
        case IsolationLevel::Thread: return IsolationTier::Constrained;
        case IsolationLevel::Isolate:
        case IsolationLevel::Process: return IsolationTier::Isolated;
    }
    return IsolationTier::Trusted;
}

CapabilityProfile CapabilityProfile::build(IsolationTier tier,
                                           const IsolationRequest& request,
                                           const SandboxConfig& config) {
    const auto& interpreterConfig = config.interpreter;
    const auto limits = request.context.resourceLimits.value_or(ResourceLimits{});

    CapabilityProfile profile;
    profile.tier = tier;
    profile.wallTime = effectiveWallTime(request.context, config.defaultWallTime);
    profile.cpuTimeMs = limits.maxCpuTimeMs;
    profile.cpuCheckInterval = std::max<std::uint64_t>(interpreterConfig.cpuCheckInterval, 1);
    profile.maxOutputBytes = request.evalOptions.maxOutputBytes;

    switch (tier) {
        case IsolationTier::Trusted:
            break;
        case IsolationTier::Constrained:
            profile.fullHostAccess = false;
            profile.restrictImports = true;
            profile.allowThreads = limits.maxThreads.value_or(0) > 1;
            profile.allowNetwork = false;
            profile.allowSystem = false;
            profile.allowDynamicCode = false;
            profile.scanForEscapes = true;
            profile.allowedModules.insert(interpreterConfig.constrainedModules.begin(),
                                          interpreterConfig.constrainedModules.end());
            break;
        case IsolationTier::Isolated:
            profile.exposeHost = false;
            profile.fullHostAccess = false;
            profile.restrictImports = true;
            profile.allowThreads = false;
            profile.allowFilesystem = false;
            profile.allowNetwork = false;
            profile.allowSystem = false;
            profile.allowDynamicCode = false;
            profile.scanForEscapes = true;
            profile.allowedModules.insert(interpreterConfig.isolatedModules.begin(),
                                          interpreterConfig.isolatedModules.end());
            break;
    }

    if (profile.restrictImports) {
        if (profile.allowThreads) {
            profile.allowedModules.insert(interpreterConfig.threadingModules.begin(),
                                          interpreterConfig.threadingModules.end());
        }
        profile.allowedModules.insert(request.compileOptions.extraAllowedModules.begin(),
                                      request.compileOptions.extraAllowedModules.end());
    }

    if (request.evalOptions.statementBudget) {
        profile.statementBudget = request.evalOptions.statementBudget;
    } else if (limits.maxCpuTimeMs) {
        profile.statementBudget = static_cast<std::uint64_t>(*limits.maxCpuTimeMs) *
                                  interpreterConfig.statementsPerCpuMs;
    } else if (limits.maxMemoryMb) {
        profile.statementBudget = interpreterConfig.memoryStatementBudget;
    }

    return profile;
}

bool CapabilityProfile::isModuleAllowed(std::string_view module) const {
    if (!restrictImports) {
        return true;
    }
    return allowedModules.contains(std::string(module)) ||
           allowedModules.contains(std::string(topLevel(module)));
}

SandboxErrorKind classifyModule(std::string_view module) noexcept {
    auto top = topLevel(module);
    if (std::find(kNetworkModules.begin(), kNetworkModules.end(), top) !=
        kNetworkModules.end()) {
        return SandboxErrorKind::UnauthorizedNetworkAccess;
    }
    if (std::find(kFileModules.begin(), kFileModules.end(), top) !=
        kFileModules.end()) {
        return SandboxErrorKind::UnauthorizedFileAccess;
    }
    return SandboxErrorKind::UnauthorizedSystemAccess;
}

}  // namespace warden::sandbox::interpreter
