/*
 * test_sandbox_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_sandbox_manager.cpp
 * @brief Tests for dispatch, deadlines, termination and shutdown
 */

#include <gtest/gtest.h>
#include "sandbox/sandbox.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

using namespace warden::sandbox;
using namespace std::chrono_literals;

namespace {

/**
 * @brief Scripted backend with no deadline of its own
 */
class FakeBackend : public IsolationBackend {
public:
    enum class Mode { Succeed, WaitForStop, TimeoutOnStop, IgnoreStop, Throw };

    explicit FakeBackend(Mode mode = Mode::Succeed, std::string name = "fake")
        : mode_(mode), name_(std::move(name)) {}

    [[nodiscard]] std::string_view name() const noexcept override { return name_; }

    RawExecutionResult executeInSandbox(const IsolationRequest& request,
                                        const ExecutionHooks& hooks) override {
        auto id = name_ + "-" + std::to_string(++calls_);
        {
            std::lock_guard lock(mutex_);
            running_.insert(id);
            lastScript_ = request.scriptText;
        }
        if (hooks.onStarted) {
            hooks.onStarted(id);
        }

        auto finish = [this, &id](RawExecutionResult result) {
            forget(id);
            return result;
        };

        switch (mode_) {
            case Mode::Succeed:
                return finish(ExecutionSuccess<ScriptValue>{
                    .result = value, .isolationId = id, .executionTime = 1ms});
            case Mode::Throw:
                forget(id);
                throw std::runtime_error("backend exploded");
            case Mode::IgnoreStop:
                std::this_thread::sleep_for(1500ms);
                return finish(ExecutionSuccess<ScriptValue>{
                    .result = value, .isolationId = id, .executionTime = 1500ms});
            case Mode::WaitForStop:
            case Mode::TimeoutOnStop: {
                auto giveUp = std::chrono::steady_clock::now() + 10s;
                while (!hooks.stopToken.stop_requested() &&
                       std::chrono::steady_clock::now() < giveUp) {
                    std::this_thread::sleep_for(5ms);
                }
                ++stopsObserved_;
                if (mode_ == Mode::TimeoutOnStop) {
                    return finish(makeFailure(SandboxErrorKind::ExecutionTimeout, id,
                                              "backend deadline"));
                }
                return finish(makeFailure(SandboxErrorKind::Terminated, id,
                                          "Script execution was terminated"));
            }
        }
        return finish(makeFailure(SandboxErrorKind::ExecutionFailed, id, "unreachable"));
    }

    bool terminateExecution(const IsolationId&) override { return false; }

    [[nodiscard]] std::optional<ResourceUsageSnapshot> getResourceUsage(
        const IsolationId& isolationId) const override {
        std::lock_guard lock(mutex_);
        if (!running_.contains(isolationId)) {
            return std::nullopt;
        }
        ResourceUsageSnapshot snapshot;
        snapshot.wallTimeMs = 7;
        snapshot.cpuTimeMs = 3;
        return snapshot;
    }

    [[nodiscard]] std::size_t activeCount() const override {
        std::lock_guard lock(mutex_);
        return running_.size();
    }

    void cleanup() override { ++cleanups_; }

    std::string lastScript() const {
        std::lock_guard lock(mutex_);
        return lastScript_;
    }

    ScriptValue value = 42;
    std::atomic<int> calls_{0};
    std::atomic<int> stopsObserved_{0};
    std::atomic<int> cleanups_{0};

private:
    void forget(const std::string& id) {
        std::lock_guard lock(mutex_);
        running_.erase(id);
    }

    Mode mode_;
    std::string name_;
    mutable std::mutex mutex_;
    std::set<std::string> running_;
    std::string lastScript_;
};

}  // namespace

// =============================================================================
// Test Fixture
// =============================================================================

class SandboxManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.process.gracePeriod = 500ms;
        config_.interpreter.gracePeriod = 500ms;
    }

    std::unique_ptr<SandboxManager> makeManager(std::shared_ptr<FakeBackend> process,
                                                std::shared_ptr<FakeBackend> interpreter) {
        BackendTable backends;
        if (process) {
            backends.emplace(BackendKind::Process, process);
        }
        if (interpreter) {
            backends.emplace(BackendKind::Interpreter, interpreter);
        }
        return std::make_unique<SandboxManager>(config_, std::move(backends));
    }

    static ExecutionContext contextFor(std::optional<IsolationLevel> level) {
        ExecutionContext context;
        context.policy.isolationLevel = level;
        return context;
    }

    /// Key of the single tracked execution, waiting for it to appear
    static std::string awaitActiveKey(SandboxManager& manager) {
        for (int i = 0; i < 400; ++i) {
            auto active = manager.getActiveExecutions();
            if (!active.empty()) {
                return active.begin()->first;
            }
            std::this_thread::sleep_for(5ms);
        }
        return {};
    }

    SandboxConfig config_;
};

// =============================================================================
// Dispatch Tests
// =============================================================================

TEST_F(SandboxManagerTest, SelectBackend) {
    EXPECT_EQ(SandboxManager::selectBackend(IsolationLevel::Process), BackendKind::Process);
    EXPECT_EQ(SandboxManager::selectBackend(IsolationLevel::Isolate),
              BackendKind::Interpreter);
    EXPECT_EQ(SandboxManager::selectBackend(IsolationLevel::Thread),
              BackendKind::Interpreter);
    EXPECT_EQ(SandboxManager::selectBackend(IsolationLevel::None),
              BackendKind::Interpreter);
    EXPECT_EQ(SandboxManager::selectBackend(std::nullopt), BackendKind::Interpreter);
}

TEST_F(SandboxManagerTest, RoutesByIsolationLevel) {
    auto process = std::make_shared<FakeBackend>(FakeBackend::Mode::Succeed, "proc");
    auto interpreter = std::make_shared<FakeBackend>(FakeBackend::Mode::Succeed, "interp");
    auto manager = makeManager(process, interpreter);

    auto viaProcess = manager->executeSecurely<int>(
        "a", "job", contextFor(IsolationLevel::Process));
    ASSERT_TRUE(viaProcess.has_value());
    EXPECT_EQ(viaProcess->result, 42);
    EXPECT_EQ(viaProcess->isolationId, "proc-1");

    auto viaInterpreter = manager->executeSecurely<int>("b", "job", contextFor(std::nullopt));
    ASSERT_TRUE(viaInterpreter.has_value());
    EXPECT_EQ(viaInterpreter->isolationId, "interp-1");

    EXPECT_EQ(process->calls_.load(), 1);
    EXPECT_EQ(interpreter->calls_.load(), 1);
    EXPECT_EQ(process->lastScript(), "a");
    EXPECT_EQ(interpreter->lastScript(), "b");
}

TEST_F(SandboxManagerTest, TypedConversionFailure) {
    auto interpreter = std::make_shared<FakeBackend>();
    interpreter->value = "not a number";
    auto manager = makeManager(nullptr, interpreter);

    auto result = manager->executeSecurely<int>("x", "job", ExecutionContext{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().error.kind, SandboxErrorKind::ExecutionFailed);
}

TEST_F(SandboxManagerTest, MissingBackendIsLaunchFailed) {
    auto manager = makeManager(nullptr, std::make_shared<FakeBackend>());

    auto result = manager->executeSecurely("x", "job", contextFor(IsolationLevel::Process));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().error.kind, SandboxErrorKind::LaunchFailed);
}

TEST_F(SandboxManagerTest, BackendExceptionIsExecutionFailed) {
    auto manager =
        makeManager(nullptr, std::make_shared<FakeBackend>(FakeBackend::Mode::Throw));

    auto result = manager->executeSecurely("x", "job", ExecutionContext{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().error.kind, SandboxErrorKind::ExecutionFailed);
    EXPECT_EQ(result.error().error.cause, "backend exploded");
    EXPECT_TRUE(manager->getActiveExecutions().empty());
}

// =============================================================================
// Policy Tests
// =============================================================================

TEST_F(SandboxManagerTest, PolicyViolationReportsEveryIssue) {
    auto interpreter = std::make_shared<FakeBackend>();
    auto manager = makeManager(nullptr, interpreter);

    ExecutionContext context;
    context.resourceLimits =
        ResourceLimits{.maxMemoryMb = 4096, .maxCpuTimeMs = 400000, .maxThreads = -1};

    auto report = manager->validateSecurityPolicy(context);
    EXPECT_FALSE(report.isValid);
    EXPECT_EQ(report.issues.size(), 3u);

    auto result = manager->executeSecurely("x", "job", context);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().error.kind, SandboxErrorKind::PolicyViolation);
    EXPECT_EQ(result.error().reason,
              "Security policy violation: "
              "Memory limit 4096MB exceeds maximum allowed 2048MB; "
              "CPU time limit 400000ms exceeds maximum allowed 300000ms; "
              "Thread count cannot be negative, got -1");
    EXPECT_EQ(interpreter->calls_.load(), 0);
}

TEST_F(SandboxManagerTest, SystemVariablesRejectedBeforeDispatch) {
    auto process = std::make_shared<FakeBackend>();
    auto manager = makeManager(process, nullptr);

    auto context = contextFor(IsolationLevel::Process);
    context.environmentVariables = {{"SYSTEM_TOKEN", "x"}};

    auto result = manager->executeSecurely("x", "job", context);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().error.kind, SandboxErrorKind::PolicyViolation);
    EXPECT_EQ(process->calls_.load(), 0);
}

// =============================================================================
// Deadline Tests
// =============================================================================

TEST_F(SandboxManagerTest, ManagerDeadlineStopsBackendWithoutOwnDeadline) {
    auto interpreter = std::make_shared<FakeBackend>(FakeBackend::Mode::WaitForStop);
    auto manager = makeManager(nullptr, interpreter);

    auto context = contextFor(IsolationLevel::Isolate);
    context.timeout = 200ms;

    auto start = std::chrono::steady_clock::now();
    auto result = manager->executeSecurely("loop", "job", context);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().error.kind, SandboxErrorKind::ExecutionTimeout);
    EXPECT_EQ(result.error().reason, "Script execution exceeded wall time limit of 200ms");
    EXPECT_EQ(result.error().isolationId, "fake-1");
    ASSERT_TRUE(result.error().resourceUsage.has_value());
    EXPECT_GE(result.error().resourceUsage->wallTimeMs, 200);
    EXPECT_EQ(interpreter->stopsObserved_.load(), 1);
    EXPECT_LT(elapsed, 5s);
    EXPECT_TRUE(manager->getActiveExecutions().empty());
}

TEST_F(SandboxManagerTest, UnresponsiveBackendIsAbandonedAfterStopWait) {
    config_.stopWait = 100ms;
    auto interpreter = std::make_shared<FakeBackend>(FakeBackend::Mode::IgnoreStop);
    auto manager = makeManager(nullptr, interpreter);

    auto context = contextFor(IsolationLevel::Isolate);
    context.timeout = 100ms;

    auto start = std::chrono::steady_clock::now();
    auto result = manager->executeSecurely("stuck", "job", context);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().error.kind, SandboxErrorKind::ExecutionTimeout);
    EXPECT_EQ(result.error().reason, "Script execution exceeded wall time limit of 100ms");
    EXPECT_EQ(result.error().isolationId, "fake-1");
    ASSERT_TRUE(result.error().resourceUsage.has_value());
    EXPECT_GE(result.error().resourceUsage->wallTimeMs, 100);
    EXPECT_LT(elapsed, 1s);
    EXPECT_TRUE(manager->getActiveExecutions().empty());

    // Shutdown joins the abandoned task once it returns
    manager->shutdown();
    EXPECT_EQ(interpreter->activeCount(), 0u);
    EXPECT_EQ(interpreter->cleanups_.load(), 1);
}

TEST_F(SandboxManagerTest, BackendTimeoutIsReturnedAsIs) {
    auto interpreter = std::make_shared<FakeBackend>(FakeBackend::Mode::TimeoutOnStop);
    auto manager = makeManager(nullptr, interpreter);

    auto context = contextFor(IsolationLevel::Thread);
    context.resourceLimits = ResourceLimits{.maxWallTimeMs = 150};

    auto result = manager->executeSecurely("loop", "job", context);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().error.kind, SandboxErrorKind::ExecutionTimeout);
    EXPECT_EQ(result.error().reason, "backend deadline");
}

// =============================================================================
// Termination and Usage Tests
// =============================================================================

TEST_F(SandboxManagerTest, UnknownKeys) {
    auto manager = makeManager(nullptr, std::make_shared<FakeBackend>());
    EXPECT_FALSE(manager->terminateExecution("nothing-1"));
    EXPECT_FALSE(manager->getResourceUsage("nothing-1").has_value());
    EXPECT_TRUE(manager->getActiveExecutions().empty());
}

TEST_F(SandboxManagerTest, TerminateTrackedExecution) {
    auto interpreter = std::make_shared<FakeBackend>(FakeBackend::Mode::WaitForStop);
    auto manager = makeManager(nullptr, interpreter);

    auto pending = std::async(std::launch::async, [&] {
        return manager->executeSecurely("loop", "job", ExecutionContext{});
    });

    auto key = awaitActiveKey(*manager);
    ASSERT_FALSE(key.empty());
    EXPECT_TRUE(key.starts_with("job-"));

    auto usage = manager->getResourceUsage(key);
    ASSERT_TRUE(usage.has_value());

    EXPECT_TRUE(manager->terminateExecution(key));
    EXPECT_FALSE(manager->terminateExecution(key));

    auto result = pending.get();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().error.kind, SandboxErrorKind::Terminated);
    EXPECT_FALSE(manager->getResourceUsage(key).has_value());
}

TEST_F(SandboxManagerTest, UsageComesFromBackend) {
    auto interpreter = std::make_shared<FakeBackend>(FakeBackend::Mode::WaitForStop);
    auto manager = makeManager(nullptr, interpreter);

    auto pending = std::async(std::launch::async, [&] {
        return manager->executeSecurely("loop", "job", ExecutionContext{});
    });
    auto key = awaitActiveKey(*manager);
    ASSERT_FALSE(key.empty());

    // The backend reports once onStarted has assigned the id
    std::optional<ResourceUsageSnapshot> usage;
    for (int i = 0; i < 200 && !(usage && usage->cpuTimeMs); ++i) {
        usage = manager->getResourceUsage(key);
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_TRUE(usage.has_value());
    EXPECT_EQ(usage->cpuTimeMs, 3);
    EXPECT_EQ(usage->wallTimeMs, 7);

    manager->terminateExecution(key);
    [[maybe_unused]] auto result = pending.get();
}

// =============================================================================
// Shutdown Tests
// =============================================================================

TEST_F(SandboxManagerTest, ShutdownCleansEachBackendOnce) {
    auto shared = std::make_shared<FakeBackend>();
    auto manager = makeManager(shared, shared);

    manager->shutdown();
    manager->shutdown();
    EXPECT_TRUE(manager->isShutdown());
    EXPECT_EQ(shared->cleanups_.load(), 1);

    auto result = manager->executeSecurely("x", "job", ExecutionContext{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().error.kind, SandboxErrorKind::LaunchFailed);
    EXPECT_EQ(result.error().reason, "Sandbox manager has been shut down");
    EXPECT_EQ(shared->calls_.load(), 0);

    manager.reset();
    EXPECT_EQ(shared->cleanups_.load(), 1);
}

TEST_F(SandboxManagerTest, ShutdownStopsInFlightExecutions) {
    auto interpreter = std::make_shared<FakeBackend>(FakeBackend::Mode::WaitForStop);
    auto manager = makeManager(nullptr, interpreter);

    auto pending = std::async(std::launch::async, [&] {
        return manager->executeSecurely("loop", "job", ExecutionContext{});
    });
    ASSERT_FALSE(awaitActiveKey(*manager).empty());

    manager->shutdown();
    auto result = pending.get();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().error.kind, SandboxErrorKind::Terminated);
    EXPECT_TRUE(manager->getActiveExecutions().empty());
    EXPECT_EQ(interpreter->cleanups_.load(), 1);
}

TEST_F(SandboxManagerTest, PhaseNames) {
    EXPECT_EQ(executionPhaseToString(ExecutionPhase::Dispatched), "DISPATCHED");
    EXPECT_EQ(executionPhaseToString(ExecutionPhase::TimedOut), "TIMED_OUT");
    EXPECT_EQ(executionPhaseToString(ExecutionPhase::CleanedUp), "CLEANED_UP");
}

// =============================================================================
// Integration Tests
// =============================================================================

class SandboxManagerIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        SandboxConfig config;
        config.process.gracePeriod = 500ms;
        config.interpreter.gracePeriod = 500ms;
        manager_ = std::make_unique<SandboxManager>(config);
    }

    void TearDown() override { manager_.reset(); }

    std::unique_ptr<SandboxManager> manager_;
};

TEST_F(SandboxManagerIntegrationTest, InterpreterBackendEndToEnd) {
    ExecutionContext context;
    context.policy.isolationLevel = IsolationLevel::Isolate;
    context.variables = {{"base", 40}};

    auto result = manager_->executeSecurely<int>("base + 2", "sum", context);
    ASSERT_TRUE(result.has_value()) << result.error().error.describe();
    EXPECT_EQ(result->result, 42);
    EXPECT_TRUE(result->isolationId.starts_with("isolate-sum-"));
}

TEST_F(SandboxManagerIntegrationTest, ProcessBackendEndToEnd) {
    if (!ConfigDiscovery::findPythonExecutable()) {
        GTEST_SKIP() << "No Python interpreter available";
    }
    ExecutionContext context;
    context.policy.isolationLevel = IsolationLevel::Process;

    auto result = manager_->executeSecurely<int>("2 + 2", "sum", context);
    ASSERT_TRUE(result.has_value()) << result.error().error.describe();
    EXPECT_EQ(result->result, 4);
    EXPECT_TRUE(result->isolationId.starts_with("process-sum-"));
}

TEST_F(SandboxManagerIntegrationTest, InfiniteLoopTimesOut) {
    ExecutionContext context;
    context.policy.isolationLevel = IsolationLevel::Isolate;
    context.timeout = 300ms;

    auto result = manager_->executeSecurely("while True:\n    pass", "spin", context);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().error.kind, SandboxErrorKind::ExecutionTimeout);
    EXPECT_TRUE(result.error().error.isRetryable());
}

TEST_F(SandboxManagerIntegrationTest, SecurityViolationIsFlagged) {
    ExecutionContext context;
    context.policy.isolationLevel = IsolationLevel::Isolate;

    auto result = manager_->executeSecurely("import subprocess", "escape", context);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().error.kind, SandboxErrorKind::UnauthorizedSystemAccess);
    EXPECT_TRUE(result.error().error.isSecurityViolation());
}

TEST_F(SandboxManagerIntegrationTest, TopLevelReturnWithoutLimits) {
    auto result = manager_->executeSecurely<int>("return 2+2", "sum", ExecutionContext{});
    ASSERT_TRUE(result.has_value()) << result.error().error.describe();
    EXPECT_EQ(result->result, 4);
    EXPECT_GE(result->resourceUsage.wallTimeMs, 0);
    if (result->resourceUsage.cpuTimeMs) {
        EXPECT_GE(*result->resourceUsage.cpuTimeMs, 0);
    }
}

TEST_F(SandboxManagerIntegrationTest, WallTimeLimitBoundsSpinningScript) {
    ExecutionContext context;
    context.resourceLimits = ResourceLimits{.maxWallTimeMs = 200};

    auto result = manager_->executeSecurely("while True:\n    pass", "spin", context);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().error.kind, SandboxErrorKind::ExecutionTimeout);
    ASSERT_TRUE(result.error().resourceUsage.has_value());
    EXPECT_GE(result.error().resourceUsage->wallTimeMs, 200);
    EXPECT_LT(result.error().resourceUsage->wallTimeMs, 1000);
    EXPECT_TRUE(manager_->getActiveExecutions().empty());
}

TEST_F(SandboxManagerIntegrationTest, NativeCallDoesNotHoldTheDeadline) {
    SandboxConfig config;
    config.interpreter.gracePeriod = 200ms;
    config.stopWait = 200ms;
    auto interpreter = std::make_shared<interpreter::InterpreterBackend>(config);
    BackendTable backends;
    backends.emplace(BackendKind::Interpreter, interpreter);
    SandboxManager manager(config, std::move(backends));

    ExecutionContext context;
    context.policy.isolationLevel = IsolationLevel::Isolate;
    context.resourceLimits = ResourceLimits{.maxWallTimeMs = 100};

    // A single C call with no line events for the tracer to act on
    auto start = std::chrono::steady_clock::now();
    auto result = manager.executeSecurely("sum(range(3 * 10**8))", "native", context);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().error.kind, SandboxErrorKind::ExecutionTimeout);
    EXPECT_EQ(result.error().reason, "Script execution exceeded wall time limit of 100ms");
    ASSERT_TRUE(result.error().resourceUsage.has_value());
    EXPECT_GE(result.error().resourceUsage->wallTimeMs, 100);
    EXPECT_LT(elapsed, 1s);
    EXPECT_TRUE(manager.getActiveExecutions().empty());

    // The abandoned evaluation still ends once the call returns
    for (int i = 0; i < 1200 && interpreter->activeCount() > 0; ++i) {
        std::this_thread::sleep_for(50ms);
    }
    EXPECT_EQ(interpreter->activeCount(), 0u);
}
