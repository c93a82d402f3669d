/*
 * process_backend.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "process_backend.hpp"

#include "resource_monitor.hpp"
#include "script_wrapper.hpp"
#include "sandbox/execution_registry.hpp"
#include "sandbox/isolation_id.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <mutex>
#include <optional>
#include <string_view>
#include <thread>

#include <poll.h>
#include <signal.h>
#include <unistd.h>

namespace warden::sandbox::process {

namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;

namespace {

constexpr std::uint64_t kMiB = 1024 * 1024;
constexpr std::uint64_t kAddressSpaceFloorMb = 256;
constexpr std::uint64_t kOpenFilesFloor = 16;

/**
 * @brief State of one tracked child
 */
struct ProcessExecution {
    IsolationId id;
    fs::path directory;
    Clock::time_point startedAt{Clock::now()};
    std::atomic<bool> stopRequested{false};

    mutable std::mutex mutex;
    std::condition_variable finishedCv;
    int processId{-1};
    bool reaped{false};
    bool finished{false};
    std::uint64_t peakRssBytes{0};
    std::optional<int> peakThreads;
    std::optional<std::int64_t> lastCpuTimeMs;
};

std::int64_t elapsedMs(Clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - since)
        .count();
}

std::string_view trim(std::string_view text) {
    constexpr std::string_view whitespace = " \t\r\n";
    auto first = text.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

/// Text following a marker line, or the whole trimmed output
std::string markedMessage(std::string_view output, std::string_view marker) {
    auto position = output.rfind(marker);
    if (position == std::string_view::npos) {
        return std::string(trim(output));
    }
    auto line = output.substr(position + marker.size());
    line = line.substr(0, line.find('\n'));
    return std::string(trim(line));
}

/**
 * @brief Kills and reaps the child on every exit path
 */
class ChildGuard {
public:
    ChildGuard(SpawnedProcess child, std::shared_ptr<ProcessExecution> execution)
        : child_(child), execution_(std::move(execution)) {}

    ~ChildGuard() {
        if (!isReaped()) {
            ProcessSpawner::signalGroup(child_.processId, SIGKILL);
            auto status = ProcessSpawner::reap(child_.processId);
            markReaped(status.has_value());
        }
        if (child_.outputFd >= 0) {
            ::close(child_.outputFd);
        }
    }

    ChildGuard(const ChildGuard&) = delete;
    ChildGuard& operator=(const ChildGuard&) = delete;

    [[nodiscard]] int processId() const noexcept { return child_.processId; }
    [[nodiscard]] int outputFd() const noexcept { return child_.outputFd; }

    [[nodiscard]] bool isReaped() const {
        std::lock_guard lock(execution_->mutex);
        return execution_->reaped;
    }

    void markReaped(bool reaped) {
        std::lock_guard lock(execution_->mutex);
        execution_->reaped = reaped;
    }

private:
    SpawnedProcess child_;
    std::shared_ptr<ProcessExecution> execution_;
};

}  // namespace

class ProcessBackend::Impl {
public:
    Impl(SandboxConfig config, std::shared_ptr<spdlog::logger> logger)
        : config_(std::move(config)),
          logger_(logger ? std::move(logger) : spdlog::default_logger()),
          environmentFilter_(config_.environment) {}

    RawExecutionResult execute(const IsolationRequest& request,
                               const ExecutionHooks& hooks) {
        auto id = ids_.next(request.scriptName);
        logger_->info("Dispatching script '{}' to process sandbox {}",
                      request.scriptName, id);

        auto python = ConfigDiscovery::resolvePythonExecutable(config_.process);
        if (!python) {
            logger_->error("Process sandbox {} cannot start: {}", id,
                           python.error().describe());
            return makeFailure(SandboxErrorKind::LaunchFailed, id,
                               python.error().message, std::nullopt,
                               python.error().cause);
        }

        auto directory = createSandboxDirectory(id);
        if (!directory) {
            logger_->error("Process sandbox {} cannot start: {}", id,
                           directory.error().describe());
            return makeFailure(SandboxErrorKind::LaunchFailed, id,
                               directory.error().message, std::nullopt,
                               directory.error().cause);
        }

        auto execution = std::make_shared<ProcessExecution>();
        execution->id = id;
        execution->directory = *directory;
        active_.insert(id, execution);

        auto result = [&]() -> RawExecutionResult {
            try {
                if (hooks.onStarted) {
                    hooks.onStarted(id);
                }
                return run(request, hooks, *python, execution);
            } catch (const std::exception& e) {
                logger_->error("Process sandbox {} failed: {}", id, e.what());
                return makeFailure(SandboxErrorKind::ExecutionFailed, id,
                                   "Sandbox execution failed", std::nullopt,
                                   e.what());
            }
        }();

        finish(execution);
        return result;
    }

    bool terminate(const IsolationId& id) {
        auto execution = active_.find(id);
        if (!execution) {
            logger_->debug("Terminate ignored, unknown process sandbox {}", id);
            return false;
        }
        {
            std::lock_guard lock((*execution)->mutex);
            if ((*execution)->finished) {
                return false;
            }
        }
        logger_->info("Terminating process sandbox {}", id);
        (*execution)->stopRequested = true;
        awaitFinished(**execution, terminationWindow());
        return true;
    }

    std::optional<ResourceUsageSnapshot> usage(const IsolationId& id) const {
        auto execution = active_.find(id);
        if (!execution) {
            return std::nullopt;
        }
        auto& state = **execution;
        std::lock_guard lock(state.mutex);
        if (state.finished) {
            return std::nullopt;
        }

        ResourceUsageSnapshot snapshot;
        snapshot.wallTimeMs = elapsedMs(state.startedAt);
        if (state.processId > 0 && !state.reaped) {
            auto sample = ResourceMonitor::sample(state.processId);
            snapshot.memoryUsedBytes = sample.residentBytes;
            snapshot.cpuTimeMs = sample.cpuTimeMs;
            snapshot.threadsCreated = sample.threads;
        } else {
            if (state.peakRssBytes > 0) {
                snapshot.memoryUsedBytes = state.peakRssBytes;
            }
            snapshot.cpuTimeMs = state.lastCpuTimeMs;
            snapshot.threadsCreated = state.peakThreads;
        }
        return snapshot;
    }

    std::size_t activeCount() const { return active_.size(); }

    void cleanup() {
        auto executions = active_.snapshot();
        if (!executions.empty()) {
            logger_->info("Process backend cleanup, terminating {} executions",
                          executions.size());
        }
        for (const auto& [id, execution] : executions) {
            execution->stopRequested = true;
        }
        for (const auto& [id, execution] : executions) {
            if (!awaitFinished(*execution, terminationWindow())) {
                logger_->warn("Process sandbox {} did not finish during cleanup", id);
            }
        }
    }

private:
    std::chrono::milliseconds terminationWindow() const {
        return config_.process.gracePeriod + config_.process.pollInterval * 4 +
               std::chrono::milliseconds{1000};
    }

    bool awaitFinished(ProcessExecution& execution, std::chrono::milliseconds timeout) {
        std::unique_lock lock(execution.mutex);
        return execution.finishedCv.wait_for(
            lock, timeout, [&execution] { return execution.finished; });
    }

    Result<fs::path> createSandboxDirectory(const IsolationId& id) {
        auto root = ConfigDiscovery::resolveTempRoot(config_.process);
        auto pattern = (root / ("pipeline-sandbox-" + id + "-XXXXXX")).string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');

        if (::mkdtemp(buffer.data()) == nullptr) {
            return std::unexpected(SandboxError{
                .kind = SandboxErrorKind::LaunchFailed,
                .message = "Failed to create sandbox directory",
                .isolationId = id,
                .cause = fmt::format("{}: {}", pattern, std::strerror(errno))});
        }

        fs::path directory(buffer.data());
        std::error_code ec;
        fs::permissions(directory, fs::perms::owner_all, fs::perm_options::replace, ec);
        if (ec) {
            logger_->warn("Could not restrict permissions of {}: {}",
                          directory.string(), ec.message());
        }
        logger_->debug("Created sandbox directory {}", directory.string());
        return directory;
    }

    void finish(const std::shared_ptr<ProcessExecution>& execution) {
        active_.erase(execution->id);

        std::error_code ec;
        fs::remove_all(execution->directory, ec);
        if (ec) {
            logger_->warn("Failed to remove sandbox directory {}: {}",
                          execution->directory.string(), ec.message());
        }

        {
            std::lock_guard lock(execution->mutex);
            execution->finished = true;
        }
        execution->finishedCv.notify_all();
        logger_->debug("Process sandbox {} cleaned up", execution->id);
    }

    RawExecutionResult run(const IsolationRequest& request, const ExecutionHooks& hooks,
                           const fs::path& python,
                           const std::shared_ptr<ProcessExecution>& execution) {
        const auto& id = execution->id;
        const auto& context = request.context;
        const auto limits = context.resourceLimits.value_or(ResourceLimits{});
        const auto wallTime = effectiveWallTime(context, config_.process.defaultWallTime);
        const auto memoryMb =
            static_cast<std::uint64_t>(memoryLimitMb(limits, config_.process));
        const bool strict = auditsOperations(context.policy.isolationLevel);

        auto environment = environmentFilter_.apply(context.environmentVariables);
        if (environment.size() != context.environmentVariables.size()) {
            logger_->debug("Process sandbox {} dropped {} environment variables", id,
                           context.environmentVariables.size() - environment.size());
        }

        WrapperSettings wrapper{.deadline = wallTime + config_.process.monitorMargin,
                                .memoryLimitMb = static_cast<std::int64_t>(memoryMb),
                                .strict = strict,
                                .allowedEnvironment = {},
                                .bindings = context.variables};
        for (const auto& [name, value] : environment) {
            wrapper.allowedEnvironment.push_back(name);
        }

        auto scriptPath =
            execution->directory / (sanitizeScriptName(request.scriptName) + ".py");
        {
            std::ofstream script(scriptPath, std::ios::binary | std::ios::trunc);
            script << ScriptWrapper::render(request.scriptText, wrapper);
            if (!script) {
                return makeFailure(SandboxErrorKind::LaunchFailed, id,
                                   "Failed to write sandbox script", std::nullopt,
                                   scriptPath.string());
            }
        }

        SpawnSpec spec{.executable = python,
                       .arguments = {"-I", "-B", scriptPath.string()},
                       .environment = std::move(environment),
                       .workingDirectory = execution->directory,
                       .limits = {}};
        spec.limits.addressSpaceBytes =
            std::max(memoryMb * 2, kAddressSpaceFloorMb) * kMiB;
        if (limits.maxCpuTimeMs) {
            spec.limits.cpuSeconds =
                static_cast<std::uint64_t>((*limits.maxCpuTimeMs + 999) / 1000);
        }
        if (limits.maxFileHandles) {
            spec.limits.openFiles = std::max<std::uint64_t>(
                static_cast<std::uint64_t>(*limits.maxFileHandles), kOpenFilesFloor);
        }

        auto spawned = ProcessSpawner::spawn(spec);
        if (!spawned) {
            logger_->error("Process sandbox {} launch failed: {}", id,
                           spawned.error().describe());
            return makeFailure(SandboxErrorKind::LaunchFailed, id,
                               spawned.error().message, std::nullopt,
                               spawned.error().cause);
        }

        {
            std::lock_guard lock(execution->mutex);
            execution->processId = spawned->processId;
        }
        ChildGuard child(*spawned, execution);
        logger_->debug("Process sandbox {} running as PID {}", id, child.processId());

        return monitor(child, execution, hooks, wallTime, memoryMb, limits);
    }

    RawExecutionResult monitor(ChildGuard& child,
                               const std::shared_ptr<ProcessExecution>& execution,
                               const ExecutionHooks& hooks,
                               std::chrono::milliseconds wallTime,
                               std::uint64_t memoryMb, const ResourceLimits& limits) {
        const auto& id = execution->id;
        const auto& processConfig = config_.process;
        const auto deadline = execution->startedAt + wallTime;
        const int pollMs = static_cast<int>(std::max<std::int64_t>(
            processConfig.pollInterval.count(), 1));

        std::string output;
        bool truncated = false;
        bool outputOpen = true;
        std::optional<ExitStatus> status;
        std::optional<SandboxErrorKind> verdict;
        std::string verdictReason;
        std::optional<Clock::time_point> terminateSentAt;

        while (!status) {
            if (outputOpen) {
                struct pollfd descriptor {child.outputFd(), POLLIN, 0};
                if (::poll(&descriptor, 1, pollMs) < 0 && errno != EINTR) {
                    logger_->warn("poll on sandbox {} output failed: {}", id,
                                  std::strerror(errno));
                }
                outputOpen = ProcessSpawner::drainOutput(
                    child.outputFd(), output, processConfig.maxOutputBytes, truncated);
            } else {
                std::this_thread::sleep_for(processConfig.pollInterval);
            }

            {
                std::lock_guard lock(execution->mutex);
                status = ProcessSpawner::tryReap(child.processId());
                if (status) {
                    execution->reaped = true;
                    break;
                }
            }

            auto sample = ResourceMonitor::sample(child.processId());
            {
                std::lock_guard lock(execution->mutex);
                execution->peakRssBytes = std::max(
                    execution->peakRssBytes, sample.peakResidentBytes.value_or(
                                                 sample.residentBytes.value_or(0)));
                if (sample.threads) {
                    execution->peakThreads =
                        std::max(execution->peakThreads.value_or(0), *sample.threads);
                }
                if (sample.cpuTimeMs) {
                    execution->lastCpuTimeMs = sample.cpuTimeMs;
                }
            }

            const auto now = Clock::now();
            if (verdict) {
                if (terminateSentAt && now - *terminateSentAt >= processConfig.gracePeriod) {
                    logger_->warn("Process sandbox {} ignored SIGTERM, killing", id);
                    ProcessSpawner::signalGroup(child.processId(), SIGKILL);
                    terminateSentAt.reset();
                }
                continue;
            }

            bool forceKill = false;
            if (now >= deadline) {
                verdict = SandboxErrorKind::ExecutionTimeout;
                verdictReason = fmt::format(
                    "Script execution exceeded wall time limit of {}ms", wallTime.count());
                forceKill = true;
            } else if (sample.residentBytes && *sample.residentBytes > memoryMb * kMiB) {
                verdict = SandboxErrorKind::ResourceLimitExceeded;
                verdictReason = fmt::format("Memory limit of {}MB exceeded", memoryMb);
                forceKill = true;
            } else if (limits.maxCpuTimeMs && sample.cpuTimeMs &&
                       *sample.cpuTimeMs > *limits.maxCpuTimeMs) {
                verdict = SandboxErrorKind::ResourceLimitExceeded;
                verdictReason = fmt::format("CPU time limit of {}ms exceeded",
                                            *limits.maxCpuTimeMs);
                forceKill = true;
            } else if (hooks.stopToken.stop_requested() || execution->stopRequested) {
                verdict = SandboxErrorKind::Terminated;
                verdictReason = "Script execution was terminated";
                ProcessSpawner::signalGroup(child.processId(), SIGTERM);
                terminateSentAt = now;
            }

            if (forceKill) {
                ProcessSpawner::signalGroup(child.processId(), SIGKILL);
                status = ProcessSpawner::reap(child.processId());
                child.markReaped(true);
                if (!status) {
                    status = ExitStatus{};
                }
            }
        }

        if (outputOpen) {
            ProcessSpawner::drainOutput(child.outputFd(), output,
                                        processConfig.maxOutputBytes, truncated);
        }
        if (truncated) {
            logger_->warn("Process sandbox {} output truncated at {} bytes", id,
                          processConfig.maxOutputBytes);
        }

        const auto executionTime = std::chrono::milliseconds{elapsedMs(execution->startedAt)};
        ResourceUsageSnapshot usage;
        usage.wallTimeMs = executionTime.count();
        {
            std::lock_guard lock(execution->mutex);
            auto peak = std::max(execution->peakRssBytes, status->maxRssBytes);
            if (peak > 0) {
                usage.memoryUsedBytes = peak;
            }
            usage.cpuTimeMs = status->cpuTimeMs > 0
                                  ? std::optional<std::int64_t>{status->cpuTimeMs}
                                  : execution->lastCpuTimeMs;
            usage.threadsCreated = execution->peakThreads;
            execution->lastCpuTimeMs = usage.cpuTimeMs;
        }

        if (verdict) {
            logger_->error("Process sandbox {} failed: {}", id, verdictReason);
            return makeFailure(*verdict, id, verdictReason, usage,
                               output.empty() ? std::nullopt
                                              : std::optional{std::string(trim(output))});
        }

        if (!status->exited && status->signal == SIGXCPU) {
            logger_->error("Process sandbox {} exceeded its CPU rlimit", id);
            return makeFailure(SandboxErrorKind::ResourceLimitExceeded, id,
                               "CPU time limit exceeded", usage);
        }

        auto result = classifyExit(*status, std::move(output), id, usage, executionTime);
        if (result) {
            logger_->info("Process sandbox {} completed in {}ms", id,
                          executionTime.count());
        } else {
            logger_->error("Process sandbox {} failed: {}", id, result.error().reason);
        }
        return result;
    }

    SandboxConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
    EnvironmentFilter environmentFilter_;
    IsolationIdGenerator ids_{"process"};
    ExecutionRegistry<std::shared_ptr<ProcessExecution>> active_;
};

ProcessBackend::ProcessBackend(SandboxConfig config,
                               std::shared_ptr<spdlog::logger> logger)
    : pImpl_(std::make_unique<Impl>(std::move(config), std::move(logger))) {}

ProcessBackend::~ProcessBackend() { cleanup(); }

RawExecutionResult ProcessBackend::executeInSandbox(const IsolationRequest& request,
                                                    const ExecutionHooks& hooks) {
    return pImpl_->execute(request, hooks);
}

bool ProcessBackend::terminateExecution(const IsolationId& isolationId) {
    return pImpl_->terminate(isolationId);
}

std::optional<ResourceUsageSnapshot> ProcessBackend::getResourceUsage(
    const IsolationId& isolationId) const {
    return pImpl_->usage(isolationId);
}

std::size_t ProcessBackend::activeCount() const { return pImpl_->activeCount(); }

void ProcessBackend::cleanup() {
    try {
        pImpl_->cleanup();
    } catch (const std::exception& e) {
        spdlog::warn("Process backend cleanup failed: {}", e.what());
    }
}

RawExecutionResult ProcessBackend::classifyExit(const ExitStatus& status,
                                                std::string output,
                                                const IsolationId& isolationId,
                                                ResourceUsageSnapshot usage,
                                                std::chrono::milliseconds executionTime) {
    const auto text = std::string(trim(output));

    if (!status.exited) {
        return makeFailure(SandboxErrorKind::ExecutionFailed, isolationId,
                           fmt::format("Process terminated by signal {}: {}",
                                       status.signal, text),
                           std::move(usage));
    }

    switch (status.exitCode) {
        case 0:
            return ExecutionSuccess<ScriptValue>{.result = parseOutput(output),
                                                 .isolationId = isolationId,
                                                 .resourceUsage = std::move(usage),
                                                 .executionTime = executionTime};
        case kSecurityViolationExitCode:
            return makeFailure(SandboxErrorKind::MaliciousCodeDetected, isolationId,
                               "Security violation detected: " +
                                   markedMessage(output, kSecurityViolationMarker),
                               std::move(usage), text);
        case kScriptErrorExitCode:
            return makeFailure(SandboxErrorKind::ExecutionFailed, isolationId,
                               "Script execution error: " +
                                   markedMessage(output, kScriptErrorMarker),
                               std::move(usage), text);
        default:
            return makeFailure(SandboxErrorKind::ExecutionFailed, isolationId,
                               fmt::format("Process exited with unexpected code {}: {}",
                                           status.exitCode, text),
                               std::move(usage));
    }
}

std::int64_t ProcessBackend::memoryLimitMb(const ResourceLimits& limits,
                                           const ProcessBackendConfig& config) {
    if (limits.maxMemoryMb) {
        return *limits.maxMemoryMb;
    }
    return std::max(config.defaultMemoryMb, config.minimumMemoryMb);
}

bool ProcessBackend::auditsOperations(std::optional<IsolationLevel> level) {
    return level &&
           (*level == IsolationLevel::Process || *level == IsolationLevel::Isolate);
}

ScriptValue ProcessBackend::parseOutput(std::string_view output) {
    std::optional<std::string_view> encoded;
    std::size_t lineStart = 0;
    while (lineStart < output.size()) {
        auto lineEnd = output.find('\n', lineStart);
        auto line = output.substr(lineStart, lineEnd == std::string_view::npos
                                                 ? std::string_view::npos
                                                 : lineEnd - lineStart);
        if (line.starts_with(kResultMarker)) {
            encoded = trim(line.substr(kResultMarker.size()));
        }
        if (lineEnd == std::string_view::npos) {
            break;
        }
        lineStart = lineEnd + 1;
    }

    if (encoded) {
        auto parsed = ScriptValue::parse(*encoded, nullptr, false);
        if (parsed.is_discarded()) {
            return ScriptValue(std::string(*encoded));
        }
        return parsed;
    }

    // No returned value, the printed text stands in for it
    auto text = trim(output);
    if (text.empty()) {
        return ScriptValue();
    }
    return ScriptValue(std::string(text));
}

}  // namespace warden::sandbox::process
