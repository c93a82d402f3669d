/*
 * capability_profile.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef WARDEN_SANDBOX_CAPABILITY_PROFILE_HPP
#define WARDEN_SANDBOX_CAPABILITY_PROFILE_HPP

#include "sandbox/config.hpp"
#include "sandbox/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace warden::sandbox::interpreter {

/**
 * @brief Host-access tier of an interpreter context
 */
enum class IsolationTier {
    Trusted,      ///< Full host object, any import
    Constrained,  ///< Allow-listed host members and modules
    Isolated      ///< No host object, pure modules only
};

[[nodiscard]] constexpr std::string_view isolationTierToString(
    IsolationTier tier) noexcept {
    switch (tier) {
        case IsolationTier::Trusted: return "TRUSTED";
        case IsolationTier::Constrained: return "CONSTRAINED";
        case IsolationTier::Isolated: return "ISOLATED";
    }
    return "UNKNOWN";
}

/**
 * @brief Tier for an isolation level, TRUSTED when absent
 */
[[nodiscard]] IsolationTier tierForLevel(std::optional<IsolationLevel> level) noexcept;

/**
 * @brief Everything an interpreter context is allowed to do
 */
struct CapabilityProfile {
    IsolationTier tier{IsolationTier::Trusted};

    bool exposeHost{true};          ///< `pipeline` object is bound
    bool fullHostAccess{true};      ///< Every host member, not just the allow-list
    bool restrictImports{false};    ///< Imports must match allowedModules
    bool allowThreads{true};
    bool allowFilesystem{true};
    bool allowNetwork{true};
    bool allowSystem{true};         ///< Processes, signals, native code
    bool allowDynamicCode{true};    ///< eval / exec / compile builtins
    bool scanForEscapes{false};     ///< Reject dunder escapes before evaluation

    std::set<std::string> allowedModules;
    std::optional<std::uint64_t> statementBudget;
    std::optional<std::int64_t> cpuTimeMs;
    std::chrono::milliseconds wallTime{60000};
    std::uint64_t cpuCheckInterval{1000};
    std::size_t maxOutputBytes{1024 * 1024};

    /**
     * @brief Build the profile of one request
     */
    [[nodiscard]] static CapabilityProfile build(IsolationTier tier,
                                                 const IsolationRequest& request,
                                                 const SandboxConfig& config);

    /**
     * @brief Whether a (dotted) module may be imported
     */
    [[nodiscard]] bool isModuleAllowed(std::string_view module) const;
};

/**
 * @brief Violation kind of a denied import, by module category
 */
[[nodiscard]] SandboxErrorKind classifyModule(std::string_view module) noexcept;

}  // namespace warden::sandbox::interpreter

#endif  // WARDEN_SANDBOX_CAPABILITY_PROFILE_HPP
