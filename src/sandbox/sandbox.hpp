/*
 * sandbox.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file sandbox.hpp
 * @brief Aggregated header for the secure execution sandbox
 *
 * Include this header to get the manager, both backends and the shared
 * types. Components can also be included individually.
 */

#ifndef WARDEN_SANDBOX_SANDBOX_HPP
#define WARDEN_SANDBOX_SANDBOX_HPP

#include "backend.hpp"
#include "config.hpp"
#include "environment_filter.hpp"
#include "policy_validator.hpp"
#include "sandbox_manager.hpp"
#include "types.hpp"

#include "interpreter/interpreter_backend.hpp"
#include "process/process_backend.hpp"

#endif  // WARDEN_SANDBOX_SANDBOX_HPP
