/*
 * interpreter_context.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file interpreter_context.hpp
 * @brief One in-process evaluation and the guards enforcing its profile
 */

#ifndef WARDEN_SANDBOX_INTERPRETER_CONTEXT_HPP
#define WARDEN_SANDBOX_INTERPRETER_CONTEXT_HPP

#include "capability_profile.hpp"
#include "python_engine.hpp"
#include "sandbox/environment_filter.hpp"
#include "sandbox/types.hpp"

#include <pybind11/pybind11.h>

#include <spdlog/logger.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace warden::sandbox::interpreter {

/**
 * @brief State of a single evaluation inside the shared interpreter
 *
 * Capability checks run on the evaluating thread through three channels:
 * guarded builtins in the script's globals, the process-wide audit hook,
 * and a line tracer that enforces stop requests and budgets. The first
 * denied capability is recorded and sticks: the evaluation ends as a
 * failure of that kind even if the script catches the raised exception.
 *
 * Threads spawned by the script, and time spent inside a single C call,
 * are outside the tracer's reach.
 */
class InterpreterContext : public std::enable_shared_from_this<InterpreterContext> {
public:
    InterpreterContext(IsolationId id, CapabilityProfile profile,
                       std::shared_ptr<PythonEngine> engine,
                       std::shared_ptr<spdlog::logger> logger);

    InterpreterContext(const InterpreterContext&) = delete;
    InterpreterContext& operator=(const InterpreterContext&) = delete;

    /**
     * @brief Build the script globals: guarded builtins, bindings, host object (GIL)
     */
    [[nodiscard]] py::dict buildGlobals(const IsolationRequest& request,
                                        const EnvironmentFilter::Environment& environment);

    /**
     * @brief Call the compiled entry point with every guard active (GIL)
     *
     * Conversion of the return value and release of the globals happen
     * before the guards are lifted. The error side carries the formatted
     * Python exception.
     */
    [[nodiscard]] std::expected<ScriptValue, std::string> evaluate(
        const py::object& function, py::dict& globals);

    /**
     * @brief Record a violation and raise it into the script (GIL)
     * @throws py::error_already_set always
     */
    [[noreturn]] void deny(SandboxErrorKind kind, const std::string& reason);

    /**
     * @brief Record a stop reason and make the tracer end the evaluation
     */
    void requestStop(SandboxErrorKind kind, std::string reason);

    /**
     * @brief Inject the violation exception into the evaluating thread (GIL)
     * @return true if a thread state received it
     */
    bool interruptThread();

    void markFinished();
    [[nodiscard]] bool waitFinished(std::chrono::milliseconds timeout);
    [[nodiscard]] bool isFinished() const;

    [[nodiscard]] std::optional<SandboxError> violation() const;
    [[nodiscard]] ResourceUsageSnapshot usage() const;
    [[nodiscard]] std::string capturedOutput() const;
    [[nodiscard]] bool stopRequested() const noexcept {
        return stop_.load(std::memory_order_acquire);
    }

    [[nodiscard]] const IsolationId& id() const noexcept { return id_; }
    [[nodiscard]] const CapabilityProfile& profile() const noexcept { return profile_; }
    [[nodiscard]] const std::shared_ptr<spdlog::logger>& logger() const noexcept {
        return logger_;
    }
    [[nodiscard]] std::thread::id ownerThread() const noexcept { return ownerThread_; }

    /// Process-wide audit hook, dispatches to the context active on this thread
    static int auditHook(const char* event, PyObject* args, void* userData);

private:
    class HostScope;
    class Activation;

    static int traceHook(PyObject* object, PyFrameObject* frame, int what,
                         PyObject* arg);

    int onAudit(std::string_view event, PyObject* args);
    int onOpen(PyObject* args);
    int onSocket(std::string_view event, PyObject* args);
    int onLine();
    int raiseStop();
    int refuse(SandboxErrorKind kind, const std::string& reason);
    bool recordViolation(SandboxErrorKind kind, const std::string& reason);

    void appendOutput(std::string_view text);
    void recordFile(std::string path);
    void recordConnection(std::string endpoint);
    [[nodiscard]] std::optional<std::int64_t> threadCpuMs() const;

    py::dict buildBuiltins();
    py::object buildHostObject(const IsolationRequest& request,
                               const EnvironmentFilter::Environment& environment);

    IsolationId id_;
    CapabilityProfile profile_;
    std::shared_ptr<PythonEngine> engine_;
    std::shared_ptr<spdlog::logger> logger_;
    std::thread::id ownerThread_;
    std::chrono::steady_clock::time_point startedAt_;

    // Touched only on the evaluating thread with the GIL held
    int hostDepth_{0};
    std::uint64_t statements_{0};
    std::chrono::steady_clock::time_point deadline_;

    std::atomic<bool> stop_{false};
    std::atomic<bool> evaluating_{false};
    std::atomic<unsigned long> threadIdent_{0};
    std::atomic<bool> cpuClockValid_{false};
    std::atomic<std::int64_t> cpuStartMs_{0};
    clockid_t cpuClock_{};

    mutable std::mutex mutex_;
    std::condition_variable finishedCv_;
    bool finished_{false};
    std::optional<SandboxError> violation_;
    std::optional<std::int64_t> cpuTimeMs_;
    std::optional<std::int64_t> wallTimeMs_;
    std::string output_;
    bool outputTruncated_{false};
    std::vector<std::string> filesAccessed_;
    std::vector<std::string> networkConnections_;
};

}  // namespace warden::sandbox::interpreter

#endif  // WARDEN_SANDBOX_INTERPRETER_CONTEXT_HPP
