/*
 * environment_filter.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef WARDEN_SANDBOX_ENVIRONMENT_FILTER_HPP
#define WARDEN_SANDBOX_ENVIRONMENT_FILTER_HPP

#include "config.hpp"

#include <string>
#include <string_view>
#include <unordered_map>

namespace warden::sandbox {

/**
 * @brief Allow-prefix / deny-list filter for script environments
 *
 * Names are compared upper-cased. A variable passes when its name starts
 * with an allowed prefix and is not denied.
 */
class EnvironmentFilter {
public:
    using Environment = std::unordered_map<std::string, std::string>;

    explicit EnvironmentFilter(EnvironmentPolicy policy);

    [[nodiscard]] bool isAllowed(std::string_view name) const;

    /**
     * @brief Copy forward only the permitted variables
     */
    [[nodiscard]] Environment apply(const Environment& input) const;

    [[nodiscard]] const EnvironmentPolicy& policy() const noexcept {
        return policy_;
    }

private:
    EnvironmentPolicy policy_;
};

}  // namespace warden::sandbox

#endif  // WARDEN_SANDBOX_ENVIRONMENT_FILTER_HPP
