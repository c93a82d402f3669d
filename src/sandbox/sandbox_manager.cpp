/*
 * sandbox_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "sandbox_manager.hpp"

#include "execution_registry.hpp"
#include "interpreter/interpreter_backend.hpp"
#include "policy_validator.hpp"
#include "process/process_backend.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <future>
#include <mutex>
#include <stop_token>
#include <system_error>
#include <thread>
#include <unordered_set>
#include <vector>

namespace warden::sandbox {

using Clock = std::chrono::steady_clock;

namespace {

/**
 * @brief One logical execution tracked by the manager
 */
struct ActiveExecution {
    std::string key;
    BackendKind kind{BackendKind::Interpreter};
    std::shared_ptr<IsolationBackend> backend;
    std::stop_source stopSource;
    Clock::time_point startedAt{Clock::now()};

    mutable std::mutex mutex;
    std::optional<IsolationId> isolationId;

    [[nodiscard]] std::optional<IsolationId> assignedId() const {
        std::lock_guard lock(mutex);
        return isolationId;
    }
};

std::int64_t elapsedMs(Clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - since)
        .count();
}

BackendTable defaultBackends(const SandboxConfig& config,
                             const std::shared_ptr<spdlog::logger>& logger) {
    BackendTable backends;
    backends.emplace(BackendKind::Process,
                     std::make_shared<process::ProcessBackend>(config, logger));
    backends.emplace(BackendKind::Interpreter,
                     std::make_shared<interpreter::InterpreterBackend>(config, logger));
    return backends;
}

}  // namespace

class SandboxManager::Impl {
public:
    Impl(SandboxConfig config, std::optional<BackendTable> backends,
         std::shared_ptr<spdlog::logger> logger)
        : config_(std::move(config)),
          logger_(logger ? std::move(logger) : spdlog::default_logger()),
          validator_(config_.policy),
          backends_(backends ? std::move(*backends) : defaultBackends(config_, logger_)) {
        logger_->info("Sandbox manager ready with {} backends", backends_.size());
    }

    ~Impl() {
        // Only reached when shutdown() failed before reaping
        for (auto& straggler : stragglers_) {
            if (straggler.worker.joinable()) {
                straggler.worker.detach();
            }
        }
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    RawExecutionResult execute(IsolationRequest request) {
        const auto key = fmt::format("{}-{}", request.scriptName, ++counter_);
        transition(key, ExecutionPhase::Dispatched);

        if (shutdown_.load()) {
            logger_->error("Execution {} rejected, sandbox manager is shut down", key);
            transition(key, ExecutionPhase::CleanedUp);
            return makeFailure(SandboxErrorKind::LaunchFailed, key,
                               "Sandbox manager has been shut down");
        }

        transition(key, ExecutionPhase::Validating);
        auto validation = validator_.validate(request.context);
        if (!validation.isValid) {
            auto reason = fmt::format("Security policy violation: {}",
                                      fmt::join(validation.issues, "; "));
            logger_->error("Execution {} rejected: {}", key, reason);
            transition(key, ExecutionPhase::Failed);
            transition(key, ExecutionPhase::CleanedUp);
            return makeFailure(SandboxErrorKind::PolicyViolation, key, std::move(reason));
        }

        const auto kind = selectBackend(request.context.policy.isolationLevel);
        auto backendIt = backends_.find(kind);
        if (backendIt == backends_.end() || !backendIt->second) {
            logger_->error("Execution {} has no {} backend", key, backendKindToString(kind));
            transition(key, ExecutionPhase::CleanedUp);
            return makeFailure(SandboxErrorKind::LaunchFailed, key,
                               fmt::format("No backend registered for isolation '{}'",
                                           backendKindToString(kind)));
        }
        auto backend = backendIt->second;
        logger_->debug("Execution {} -> {} ({})", key,
                       executionPhaseToString(ExecutionPhase::SelectedBackend),
                       backend->name());

        auto execution = std::make_shared<ActiveExecution>();
        execution->key = key;
        execution->kind = kind;
        execution->backend = backend;
        active_.insert(key, execution);
        Untrack untrack(*this, key);

        // A shutdown that raced the insert still reaches this execution
        if (shutdown_.load()) {
            execution->stopSource.request_stop();
        }

        return run(std::move(request), execution);
    }

    bool terminate(const std::string& key) {
        auto execution = active_.find(key);
        if (!execution) {
            logger_->warn("Terminate ignored, unknown execution {}", key);
            return false;
        }
        if (!(*execution)->stopSource.request_stop()) {
            return false;
        }
        logger_->info("Termination requested for execution {}", key);
        return true;
    }

    std::optional<ResourceUsageSnapshot> usage(const std::string& key) const {
        auto execution = active_.find(key);
        if (!execution) {
            return std::nullopt;
        }
        return usageOf(**execution);
    }

    std::unordered_map<std::string, ResourceUsageSnapshot> activeExecutions() const {
        std::unordered_map<std::string, ResourceUsageSnapshot> result;
        for (const auto& [key, execution] : active_.snapshot()) {
            result.emplace(key, usageOf(*execution));
        }
        return result;
    }

    SecurityPolicyValidation validate(const ExecutionContext& context) const {
        return validator_.validate(context);
    }

    void shutdown() {
        if (shutdown_.exchange(true)) {
            return;
        }
        auto executions = active_.snapshot();
        logger_->info("Shutting down sandbox manager, {} active executions",
                      executions.size());
        for (const auto& [key, execution] : executions) {
            execution->stopSource.request_stop();
        }

        {
            std::unique_lock lock(drainMutex_);
            if (!drained_.wait_for(lock, drainTimeout(), [this] { return active_.empty(); })) {
                logger_->warn("{} executions still active after the shutdown window",
                              active_.size());
            }
        }

        reapStragglers(Clock::now() + drainTimeout());

        std::unordered_set<IsolationBackend*> cleaned;
        for (const auto& [kind, backend] : backends_) {
            if (!backend || !cleaned.insert(backend.get()).second) {
                continue;
            }
            try {
                backend->cleanup();
                logger_->debug("Backend {} cleaned up", backend->name());
            } catch (const std::exception& e) {
                logger_->error("Cleanup of backend {} failed: {}", backend->name(),
                               e.what());
            }
        }
        logger_->info("Sandbox manager shut down");
    }

    [[nodiscard]] bool isShutdown() const noexcept { return shutdown_.load(); }

    const SandboxConfig& config() const noexcept { return config_; }

private:
    /**
     * @brief Backend task that did not return after its stop request
     */
    struct Straggler {
        std::string key;
        std::thread worker;
        std::future<RawExecutionResult> result;
    };

    /**
     * @brief Removes the manager entry on every exit path
     */
    class Untrack {
    public:
        Untrack(Impl& impl, std::string key) : impl_(impl), key_(std::move(key)) {}

        ~Untrack() {
            {
                std::lock_guard lock(impl_.drainMutex_);
                impl_.active_.erase(key_);
            }
            impl_.drained_.notify_all();
            impl_.transition(key_, ExecutionPhase::CleanedUp);
        }

        Untrack(const Untrack&) = delete;
        Untrack& operator=(const Untrack&) = delete;

    private:
        Impl& impl_;
        std::string key_;
    };

    RawExecutionResult run(IsolationRequest request,
                           const std::shared_ptr<ActiveExecution>& execution) {
        const auto& key = execution->key;
        const auto wallTime = effectiveWallTime(request.context, config_.defaultWallTime);

        ExecutionHooks hooks{.stopToken = execution->stopSource.get_token(),
                             .onStarted = [execution](const IsolationId& id) {
                                 std::lock_guard lock(execution->mutex);
                                 execution->isolationId = id;
                             }};

        std::packaged_task<RawExecutionResult()> task(
            [backend = execution->backend, request = std::move(request), hooks]() {
                return backend->executeInSandbox(request, hooks);
            });
        auto future = task.get_future();
        std::thread worker;
        try {
            worker = std::thread(std::move(task));
        } catch (const std::system_error& e) {
            logger_->error("Execution {} could not start a task: {}", key, e.what());
            transition(key, ExecutionPhase::Failed);
            return makeFailure(SandboxErrorKind::LaunchFailed, key,
                               "Failed to start execution task", std::nullopt, e.what());
        }
        transition(key, ExecutionPhase::Running);

        if (future.wait_for(wallTime) == std::future_status::timeout) {
            logger_->error("Execution {} exceeded its {}ms deadline, terminating", key,
                           wallTime.count());
            execution->stopSource.request_stop();
            const auto timeoutReason = fmt::format(
                "Script execution exceeded wall time limit of {}ms", wallTime.count());

            // A backend stuck in native code never sees the stop request
            if (future.wait_for(config_.stopWait) == std::future_status::timeout) {
                logger_->error("Execution {} did not stop within {}ms, abandoning it", key,
                               config_.stopWait.count());
                transition(key, ExecutionPhase::TimedOut);
                auto usage = usageOf(*execution);
                usage.wallTimeMs = elapsedMs(execution->startedAt);
                auto id = execution->assignedId().value_or(key);
                abandon(key, std::move(worker), std::move(future));
                return makeFailure(SandboxErrorKind::ExecutionTimeout, id, timeoutReason,
                                   usage);
            }

            auto result = collect(future, key);
            worker.join();
            transition(key, ExecutionPhase::TimedOut);
            if (!result && result.error().error.kind == SandboxErrorKind::ExecutionTimeout) {
                return result;
            }

            ResourceUsageSnapshot usage;
            if (result) {
                usage = result->resourceUsage;
            } else if (result.error().resourceUsage) {
                usage = *result.error().resourceUsage;
            }
            usage.wallTimeMs = elapsedMs(execution->startedAt);
            return makeFailure(SandboxErrorKind::ExecutionTimeout,
                               execution->assignedId().value_or(key), timeoutReason, usage);
        }

        auto result = collect(future, key);
        worker.join();
        transition(key, result ? ExecutionPhase::Completed : ExecutionPhase::Failed);
        return result;
    }

    /**
     * @brief Park a task that outlived its deadline, reaping finished ones
     */
    void abandon(const std::string& key, std::thread worker,
                 std::future<RawExecutionResult> future) {
        std::lock_guard lock(stragglerMutex_);
        std::erase_if(stragglers_, [](Straggler& straggler) {
            if (straggler.result.wait_for(std::chrono::seconds::zero()) !=
                std::future_status::ready) {
                return false;
            }
            straggler.worker.join();
            return true;
        });
        stragglers_.push_back(Straggler{.key = key,
                                        .worker = std::move(worker),
                                        .result = std::move(future)});
    }

    /**
     * @brief Join abandoned tasks that finish before the deadline, detach the rest
     */
    void reapStragglers(Clock::time_point deadline) {
        std::vector<Straggler> stragglers;
        {
            std::lock_guard lock(stragglerMutex_);
            stragglers.swap(stragglers_);
        }
        for (auto& straggler : stragglers) {
            if (straggler.result.wait_until(deadline) == std::future_status::ready) {
                straggler.worker.join();
                continue;
            }
            logger_->error("Abandoned execution {} is still running at shutdown",
                           straggler.key);
            straggler.worker.detach();
        }
    }

    RawExecutionResult collect(std::future<RawExecutionResult>& future,
                               const std::string& key) {
        try {
            return future.get();
        } catch (const std::exception& e) {
            logger_->error("Execution {} raised: {}", key, e.what());
            return makeFailure(SandboxErrorKind::ExecutionFailed, key,
                               "Sandbox execution failed", std::nullopt, e.what());
        }
    }

    ResourceUsageSnapshot usageOf(const ActiveExecution& execution) const {
        if (auto id = execution.assignedId()) {
            if (auto snapshot = execution.backend->getResourceUsage(*id)) {
                return *snapshot;
            }
        }
        ResourceUsageSnapshot snapshot;
        snapshot.wallTimeMs = elapsedMs(execution.startedAt);
        return snapshot;
    }

    void transition(const std::string& key, ExecutionPhase phase) const {
        logger_->debug("Execution {} -> {}", key, executionPhaseToString(phase));
    }

    std::chrono::milliseconds drainTimeout() const {
        auto grace = std::max(config_.process.gracePeriod, config_.interpreter.gracePeriod);
        return grace * 2 + std::chrono::milliseconds{1000};
    }

    SandboxConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
    PolicyValidator validator_;
    BackendTable backends_;
    ExecutionRegistry<std::shared_ptr<ActiveExecution>> active_;
    std::atomic<std::uint64_t> counter_{0};
    std::atomic<bool> shutdown_{false};
    std::mutex drainMutex_;
    std::condition_variable drained_;
    std::mutex stragglerMutex_;
    std::vector<Straggler> stragglers_;
};

SandboxManager::SandboxManager(SandboxConfig config, std::shared_ptr<spdlog::logger> logger)
    : pImpl_(std::make_unique<Impl>(std::move(config), std::nullopt, std::move(logger))) {}

SandboxManager::SandboxManager(SandboxConfig config, BackendTable backends,
                               std::shared_ptr<spdlog::logger> logger)
    : pImpl_(std::make_unique<Impl>(std::move(config), std::move(backends),
                                    std::move(logger))) {}

SandboxManager::~SandboxManager() { shutdown(); }

RawExecutionResult SandboxManager::executeRaw(IsolationRequest request) {
    return pImpl_->execute(std::move(request));
}

bool SandboxManager::terminateExecution(const std::string& executionKey) {
    return pImpl_->terminate(executionKey);
}

std::optional<ResourceUsageSnapshot> SandboxManager::getResourceUsage(
    const std::string& executionKey) const {
    return pImpl_->usage(executionKey);
}

std::unordered_map<std::string, ResourceUsageSnapshot>
SandboxManager::getActiveExecutions() const {
    return pImpl_->activeExecutions();
}

SecurityPolicyValidation SandboxManager::validateSecurityPolicy(
    const ExecutionContext& context) const {
    return pImpl_->validate(context);
}

void SandboxManager::shutdown() {
    try {
        pImpl_->shutdown();
    } catch (const std::exception& e) {
        spdlog::error("Sandbox manager shutdown failed: {}", e.what());
    }
}

bool SandboxManager::isShutdown() const noexcept { return pImpl_->isShutdown(); }

const SandboxConfig& SandboxManager::config() const noexcept { return pImpl_->config(); }

BackendKind SandboxManager::selectBackend(std::optional<IsolationLevel> level) noexcept {
    if (level && *level == IsolationLevel::Process) {
        return BackendKind::Process;
    }
    return BackendKind::Interpreter;
}

}  // namespace warden::sandbox
