/*
 * interpreter_backend.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "interpreter_backend.hpp"

#include "capability_profile.hpp"
#include "interpreter_context.hpp"
#include "script_adapter.hpp"
#include "sandbox/environment_filter.hpp"
#include "sandbox/execution_registry.hpp"
#include "sandbox/isolation_id.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <future>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

namespace warden::sandbox::interpreter {

namespace {

using ContextRegistry = ExecutionRegistry<std::shared_ptr<InterpreterContext>>;

std::string_view trim(std::string_view text) {
    constexpr std::string_view whitespace = " \t\r\n";
    auto first = text.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

std::string firstLine(std::string_view text) {
    return std::string(trim(text.substr(0, text.find('\n'))));
}

/**
 * @brief Untracks the context and wakes terminators on every exit path
 */
class FinishGuard {
public:
    FinishGuard(ContextRegistry& registry, std::shared_ptr<InterpreterContext> context)
        : registry_(registry), context_(std::move(context)) {}

    ~FinishGuard() {
        registry_.erase(context_->id());
        context_->markFinished();
    }

    FinishGuard(const FinishGuard&) = delete;
    FinishGuard& operator=(const FinishGuard&) = delete;

private:
    ContextRegistry& registry_;
    std::shared_ptr<InterpreterContext> context_;
};

}  // namespace

class InterpreterBackend::Impl {
public:
    Impl(SandboxConfig config, std::shared_ptr<spdlog::logger> logger,
         std::shared_ptr<PythonEngine> engine)
        : config_(std::move(config)),
          logger_(logger ? std::move(logger) : spdlog::default_logger()),
          engine_(engine ? std::move(engine) : std::make_shared<PythonEngine>(logger_)),
          environmentFilter_(config_.environment) {}

    RawExecutionResult execute(const IsolationRequest& request,
                               const ExecutionHooks& hooks) {
        auto id = ids_.next(request.scriptName);
        logger_->info("Dispatching script '{}' to interpreter sandbox {}",
                      request.scriptName, id);

        if (auto opened = engine_->open(); !opened) {
            return makeFailure(SandboxErrorKind::LaunchFailed, id,
                               opened.error().message, std::nullopt,
                               opened.error().cause);
        }

        auto tier = tierForLevel(request.context.policy.isolationLevel);
        auto context = std::make_shared<InterpreterContext>(
            id, CapabilityProfile::build(tier, request, config_), engine_, logger_);
        logger_->debug("Interpreter sandbox {} runs at tier {}", id,
                       isolationTierToString(tier));
        active_.insert(id, context);

        // Declared before the guard so the context is marked finished before
        // the callback is unregistered.
        std::stop_callback onStop(hooks.stopToken, [this, context] { stop(context); });
        FinishGuard finished(active_, context);

        try {
            if (hooks.onStarted) {
                hooks.onStarted(id);
            }
            return evaluate(request, *context);
        } catch (const std::exception& e) {
            logger_->error("Interpreter sandbox {} failed: {}", id, e.what());
            return makeFailure(SandboxErrorKind::ExecutionFailed, id,
                               "Sandbox execution failed", context->usage(), e.what());
        }
    }

    bool terminate(const IsolationId& id) {
        auto context = active_.find(id);
        if (!context) {
            logger_->debug("Terminate ignored, unknown interpreter sandbox {}", id);
            return false;
        }
        return stop(*context);
    }

    std::optional<ResourceUsageSnapshot> usage(const IsolationId& id) const {
        auto context = active_.find(id);
        if (!context || (*context)->isFinished()) {
            return std::nullopt;
        }
        return (*context)->usage();
    }

    std::size_t activeCount() const { return active_.size(); }

    void cleanup() {
        auto contexts = active_.snapshot();
        if (!contexts.empty()) {
            logger_->info("Interpreter backend cleanup, terminating {} executions",
                          contexts.size());
        }
        for (const auto& [id, context] : contexts) {
            context->requestStop(SandboxErrorKind::Terminated,
                                 "Script execution was terminated");
        }
        for (const auto& [id, context] : contexts) {
            stop(context);
        }
        awaitEscalations();
        engine_->close();
    }

private:
    /**
     * @brief Graceful stop through the tracer, then an injected exception
     *
     * Only flags the context and schedules the escalation, so a stop
     * callback never blocks the thread that requested the stop. Called from
     * the evaluating thread itself (a stop callback firing on registration)
     * the flag is enough.
     */
    bool stop(const std::shared_ptr<InterpreterContext>& context) {
        if (context->isFinished()) {
            return false;
        }
        context->requestStop(SandboxErrorKind::Terminated,
                             "Script execution was terminated");
        if (std::this_thread::get_id() == context->ownerThread()) {
            return true;
        }

        logger_->info("Terminating interpreter sandbox {}", context->id());
        std::lock_guard lock(escalationMutex_);
        std::erase_if(escalations_, [](const std::future<void>& escalation) {
            return escalation.wait_for(std::chrono::seconds::zero()) ==
                   std::future_status::ready;
        });
        escalations_.push_back(
            std::async(std::launch::async, [this, context] { escalate(*context); }));
        return true;
    }

    void escalate(InterpreterContext& context) {
        const auto grace = config_.interpreter.gracePeriod;
        if (context.waitFinished(grace)) {
            return;
        }

        logger_->warn("Interpreter sandbox {} ignored the stop request, interrupting",
                      context.id());
        {
            py::gil_scoped_acquire gil;
            if (!context.interruptThread()) {
                logger_->debug("Interpreter sandbox {} has no evaluating thread",
                               context.id());
            }
        }
        if (!context.waitFinished(grace)) {
            logger_->error("Interpreter sandbox {} is still blocked in native code",
                           context.id());
        }
    }

    void awaitEscalations() {
        std::vector<std::future<void>> escalations;
        {
            std::lock_guard lock(escalationMutex_);
            escalations.swap(escalations_);
        }
        for (auto& escalation : escalations) {
            escalation.wait();
        }
    }

    RawExecutionResult evaluate(const IsolationRequest& request,
                                InterpreterContext& context) {
        const auto& id = context.id();
        auto environment = environmentFilter_.apply(request.context.environmentVariables);
        auto source = request.compileOptions.adaptSyntax
                          ? ScriptAdapter::adapt(request.scriptText)
                          : request.scriptText;
        auto filename = "<" + sanitizeScriptName(request.scriptName) + ">";

        std::expected<ScriptValue, std::string> outcome = ScriptValue(nullptr);
        {
            py::gil_scoped_acquire gil;
            try {
                auto compiled =
                    engine_->compile(source, filename, context.profile().scanForEscapes);
                if (compiled.escape) {
                    context.requestStop(
                        SandboxErrorKind::MaliciousCodeDetected,
                        fmt::format("Restricted name '{}' found in script",
                                    *compiled.escape));
                } else {
                    py::dict globals = context.buildGlobals(request, environment);
                    auto defined = py::reinterpret_steal<py::object>(PyEval_EvalCode(
                        compiled.code.ptr(), globals.ptr(), globals.ptr()));
                    if (!defined) {
                        throw py::error_already_set();
                    }
                    py::object entry = globals["__sandbox_main__"];
                    outcome = context.evaluate(entry, globals);
                }
            } catch (const py::error_already_set& e) {
                outcome = std::unexpected(std::string(e.what()));
            }
        }

        auto usage = context.usage();
        const std::chrono::milliseconds executionTime{usage.wallTimeMs};

        if (auto violation = context.violation()) {
            logger_->error("Interpreter sandbox {} failed: {}", id, violation->message);
            return makeFailure(violation->kind, id, violation->message, usage);
        }
        if (!outcome) {
            logger_->error("Interpreter sandbox {} failed: {}", id, firstLine(outcome.error()));
            return makeFailure(SandboxErrorKind::ExecutionFailed, id,
                               "Script execution failed in sandbox: " +
                                   firstLine(outcome.error()),
                               usage, outcome.error());
        }

        ScriptValue value = std::move(*outcome);
        if (value.is_null()) {
            auto output = trim(context.capturedOutput());
            if (!output.empty()) {
                value = std::string(output);
            }
        }

        logger_->info("Interpreter sandbox {} completed in {}ms", id,
                      executionTime.count());
        return ExecutionSuccess<ScriptValue>{.result = std::move(value),
                                             .isolationId = id,
                                             .resourceUsage = std::move(usage),
                                             .executionTime = executionTime};
    }

    SandboxConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<PythonEngine> engine_;
    EnvironmentFilter environmentFilter_;
    IsolationIdGenerator ids_{"isolate"};
    ContextRegistry active_;
    std::mutex escalationMutex_;
    std::vector<std::future<void>> escalations_;
};

InterpreterBackend::InterpreterBackend(SandboxConfig config,
                                       std::shared_ptr<spdlog::logger> logger,
                                       std::shared_ptr<PythonEngine> engine)
    : pImpl_(std::make_unique<Impl>(std::move(config), std::move(logger),
                                    std::move(engine))) {}

InterpreterBackend::~InterpreterBackend() { cleanup(); }

RawExecutionResult InterpreterBackend::executeInSandbox(const IsolationRequest& request,
                                                        const ExecutionHooks& hooks) {
    return pImpl_->execute(request, hooks);
}

bool InterpreterBackend::terminateExecution(const IsolationId& isolationId) {
    return pImpl_->terminate(isolationId);
}

std::optional<ResourceUsageSnapshot> InterpreterBackend::getResourceUsage(
    const IsolationId& isolationId) const {
    return pImpl_->usage(isolationId);
}

std::size_t InterpreterBackend::activeCount() const { return pImpl_->activeCount(); }

void InterpreterBackend::cleanup() {
    try {
        pImpl_->cleanup();
    } catch (const std::exception& e) {
        spdlog::warn("Interpreter backend cleanup failed: {}", e.what());
    }
}

}  // namespace warden::sandbox::interpreter
