/*
 * isolation_id.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef WARDEN_SANDBOX_ISOLATION_ID_HPP
#define WARDEN_SANDBOX_ISOLATION_ID_HPP

#include "types.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>

namespace warden::sandbox {

/**
 * @brief Replace every character outside [A-Za-z0-9] with '-'
 */
[[nodiscard]] std::string sanitizeScriptName(std::string_view name);

/**
 * @brief Generates "<backend>-<sanitized-name>-<timestamp>" identifiers
 *
 * The timestamp is milliseconds since the epoch, bumped when two ids are
 * requested within the same millisecond so an id is never reused.
 */
class IsolationIdGenerator {
public:
    explicit IsolationIdGenerator(std::string backendName);

    [[nodiscard]] IsolationId next(std::string_view scriptName);

    [[nodiscard]] const std::string& backendName() const noexcept {
        return backendName_;
    }

private:
    std::string backendName_;
    std::atomic<std::int64_t> lastStamp_{0};
};

}  // namespace warden::sandbox

#endif  // WARDEN_SANDBOX_ISOLATION_ID_HPP
