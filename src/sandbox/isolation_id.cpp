/*
 * isolation_id.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "isolation_id.hpp"

#include <spdlog/fmt/fmt.h>

#include <cctype>
#include <chrono>

namespace warden::sandbox {

std::string sanitizeScriptName(std::string_view name) {
    std::string sanitized;
    sanitized.reserve(name.size());
    for (unsigned char c : name) {
        sanitized.push_back(std::isalnum(c) ? static_cast<char>(c) : '-');
    }
    if (sanitized.empty()) {
        sanitized = "script";
    }
    return sanitized;
}

IsolationIdGenerator::IsolationIdGenerator(std::string backendName)
    : backendName_(std::move(backendName)) {}

IsolationId IsolationIdGenerator::next(std::string_view scriptName) {
    auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
                   .count();

    auto last = lastStamp_.load(std::memory_order_relaxed);
    std::int64_t stamp;
    do {
        stamp = now > last ? now : last + 1;
    } while (!lastStamp_.compare_exchange_weak(last, stamp,
                                               std::memory_order_relaxed));

    return fmt::format("{}-{}-{}", backendName_, sanitizeScriptName(scriptName),
                       stamp);
}

}  // namespace warden::sandbox
