/*
 * interpreter_backend.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file interpreter_backend.hpp
 * @brief Isolation backend evaluating scripts inside the host interpreter
 */

#ifndef WARDEN_SANDBOX_INTERPRETER_BACKEND_HPP
#define WARDEN_SANDBOX_INTERPRETER_BACKEND_HPP

#include "python_engine.hpp"
#include "sandbox/backend.hpp"
#include "sandbox/config.hpp"

#include <spdlog/logger.h>

#include <memory>

namespace warden::sandbox::interpreter {

/**
 * @brief Runs scripts in-process with a tiered capability profile
 *
 * The isolation level picks the tier: absent or NONE is TRUSTED, THREAD is
 * CONSTRAINED, ISOLATE and PROCESS are ISOLATED. Each execution gets a
 * fresh globals namespace with guarded builtins; the shared interpreter is
 * opened lazily and closed by cleanup().
 *
 * Limitations: memory and thread counts cannot be attributed to one
 * evaluation and are reported as nullopt; a script blocked in a single C
 * call is only interrupted once control returns to Python bytecode.
 */
class InterpreterBackend : public IsolationBackend {
public:
    explicit InterpreterBackend(SandboxConfig config,
                                std::shared_ptr<spdlog::logger> logger = nullptr,
                                std::shared_ptr<PythonEngine> engine = nullptr);
    ~InterpreterBackend() override;

    InterpreterBackend(const InterpreterBackend&) = delete;
    InterpreterBackend& operator=(const InterpreterBackend&) = delete;

    [[nodiscard]] std::string_view name() const noexcept override {
        return "isolate";
    }

    using IsolationBackend::executeInSandbox;

    [[nodiscard]] RawExecutionResult executeInSandbox(
        const IsolationRequest& request, const ExecutionHooks& hooks) override;

    bool terminateExecution(const IsolationId& isolationId) override;

    [[nodiscard]] std::optional<ResourceUsageSnapshot> getResourceUsage(
        const IsolationId& isolationId) const override;

    [[nodiscard]] std::size_t activeCount() const override;

    void cleanup() override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace warden::sandbox::interpreter

#endif  // WARDEN_SANDBOX_INTERPRETER_BACKEND_HPP
