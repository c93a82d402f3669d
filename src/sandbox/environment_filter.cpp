/*
 * environment_filter.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "environment_filter.hpp"

#include <algorithm>
#include <cctype>

namespace warden::sandbox {

namespace {

std::string toUpper(std::string_view value) {
    std::string upper(value);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return upper;
}

}  // namespace

EnvironmentFilter::EnvironmentFilter(EnvironmentPolicy policy)
    : policy_(std::move(policy)) {
    for (auto& prefix : policy_.allowedPrefixes) {
        prefix = toUpper(prefix);
    }
    for (auto& name : policy_.deniedNames) {
        name = toUpper(name);
    }
}

bool EnvironmentFilter::isAllowed(std::string_view name) const {
    if (name.empty() || name.find('=') != std::string_view::npos) {
        return false;
    }
    auto upper = toUpper(name);
    if (std::find(policy_.deniedNames.begin(), policy_.deniedNames.end(), upper) !=
        policy_.deniedNames.end()) {
        return false;
    }
    return std::any_of(policy_.allowedPrefixes.begin(), policy_.allowedPrefixes.end(),
                       [&upper](const std::string& prefix) {
                           return upper.starts_with(prefix);
                       });
}

EnvironmentFilter::Environment EnvironmentFilter::apply(
    const Environment& input) const {
    Environment filtered;
    for (const auto& [name, value] : input) {
        if (isAllowed(name)) {
            filtered.emplace(name, value);
        }
    }
    return filtered;
}

}  // namespace warden::sandbox
