/*
 * policy_validator.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef WARDEN_SANDBOX_POLICY_VALIDATOR_HPP
#define WARDEN_SANDBOX_POLICY_VALIDATOR_HPP

#include "config.hpp"
#include "types.hpp"

namespace warden::sandbox {

/**
 * @brief Checks a requested execution against the hard ceilings
 *
 * Runs before any resource is allocated. Every violated rule is reported,
 * so a caller can fix all of them in one round trip.
 */
class PolicyValidator {
public:
    explicit PolicyValidator(PolicyCeilings ceilings);

    [[nodiscard]] SecurityPolicyValidation validate(
        const ExecutionContext& context) const;

    [[nodiscard]] const PolicyCeilings& ceilings() const noexcept {
        return ceilings_;
    }

private:
    void checkLimits(const ResourceLimits& limits,
                     std::vector<std::string>& issues) const;
    void checkEnvironment(const ExecutionContext& context,
                          std::vector<std::string>& issues) const;

    PolicyCeilings ceilings_;
};

}  // namespace warden::sandbox

#endif  // WARDEN_SANDBOX_POLICY_VALIDATOR_HPP
