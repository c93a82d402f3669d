/*
 * script_wrapper.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef WARDEN_SANDBOX_SCRIPT_WRAPPER_HPP
#define WARDEN_SANDBOX_SCRIPT_WRAPPER_HPP

#include "sandbox/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace warden::sandbox::process {

/// Exit status of the wrapper when its monitor or audit hook trips
inline constexpr int kSecurityViolationExitCode = 1;
/// Exit status of the wrapper when the script raises
inline constexpr int kScriptErrorExitCode = 2;

inline constexpr std::string_view kSecurityViolationMarker = "SECURITY_VIOLATION:";
inline constexpr std::string_view kScriptErrorMarker = "SCRIPT_ERROR:";
/// Prefixes the line carrying the JSON-encoded return value
inline constexpr std::string_view kResultMarker = "SCRIPT_RESULT:";

struct WrapperSettings {
    std::chrono::milliseconds deadline{0};  ///< 0 disables the in-child clock
    std::int64_t memoryLimitMb{0};          ///< 0 disables the memory check
    bool strict{false};                     ///< Install the audit hook
    std::vector<std::string> allowedEnvironment;
    ScriptValue bindings = ScriptValue::object();
};

/**
 * @brief Renders the self-monitoring Python wrapper around a script
 *
 * The wrapper re-checks elapsed time and memory growth from inside the
 * child, denies process and socket operations in strict mode, and prints
 * the script's value. Exit codes: 0 success, 1 violation, 2 script error.
 */
class ScriptWrapper {
public:
    [[nodiscard]] static std::string render(std::string_view scriptText,
                                            const WrapperSettings& settings);

    /**
     * @brief Audit events denied in strict mode
     */
    [[nodiscard]] static const std::vector<std::string>& deniedAuditEvents();
};

}  // namespace warden::sandbox::process

#endif  // WARDEN_SANDBOX_SCRIPT_WRAPPER_HPP
