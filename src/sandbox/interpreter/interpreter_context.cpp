/*
 * interpreter_context.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "interpreter_context.hpp"

#include <fcntl.h>
#include <pthread.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>

namespace warden::sandbox::interpreter {

namespace {

thread_local InterpreterContext* tActiveContext = nullptr;

constexpr std::array<std::string_view, 15> kSystemEvents = {
    "os.system",      "os.exec",         "os.posix_spawn", "os.spawn",
    "os.fork",        "os.forkpty",      "os.kill",        "os.killpg",
    "os.chdir",       "os.putenv",       "os.unsetenv",    "subprocess.Popen",
    "ctypes.dlopen",  "ctypes.dlsym",    "ctypes.call_function"};

constexpr std::array<std::string_view, 9> kIntrospectionEvents = {
    "sys.settrace",     "sys.setprofile",  "sys.addaudithook",
    "sys._current_frames", "code.__new__", "function.__new__",
    "gc.get_objects",   "gc.get_referrers", "gc.get_referents"};

constexpr std::array<std::string_view, 12> kFileEvents = {
    "os.listdir", "os.scandir", "os.mkdir",   "os.remove",
    "os.rename",  "os.rmdir",   "os.chmod",   "os.chown",
    "os.link",    "os.symlink", "os.truncate", "shutil.rmtree"};

// Modules an allowed library must never pull in behind the import guard
constexpr std::array<std::string_view, 12> kDangerousModules = {
    "ctypes", "_ctypes", "subprocess", "_posixsubprocess", "multiprocessing",
    "pty",    "socket",  "_socket",    "ssl",              "mmap",
    "signal", "resource"};

constexpr std::array<std::string_view, 4> kThreadModules = {
    "threading", "_thread", "concurrent", "multiprocessing"};

constexpr std::uint64_t kDeadlineCheckMask = 0x3F;

template <std::size_t N>
bool contains(const std::array<std::string_view, N>& values, std::string_view value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

std::string_view topLevel(std::string_view module) {
    return module.substr(0, module.find('.'));
}

std::int64_t nowMs(clockid_t clock) {
    timespec ts{};
    if (clock_gettime(clock, &ts) != 0) {
        return -1;
    }
    return static_cast<std::int64_t>(ts.tv_sec) * 1000 + ts.tv_nsec / 1000000;
}

/// str() of a borrowed object, usable from inside the audit hook
std::string describe(PyObject* object) {
    if (object == nullptr) {
        return {};
    }
    if (PyBytes_Check(object)) {
        return std::string(PyBytes_AsString(object),
                           static_cast<std::size_t>(PyBytes_Size(object)));
    }
    PyObject* text = PyObject_Str(object);
    if (text == nullptr) {
        PyErr_Clear();
        return "<unprintable>";
    }
    const char* utf8 = PyUnicode_AsUTF8(text);
    std::string result = utf8 != nullptr ? utf8 : "<unprintable>";
    if (utf8 == nullptr) {
        PyErr_Clear();
    }
    Py_DECREF(text);
    return result;
}

PyObject* argument(PyObject* args, Py_ssize_t index) {
    if (args == nullptr || !PyTuple_Check(args) || PyTuple_GET_SIZE(args) <= index) {
        return nullptr;
    }
    return PyTuple_GET_ITEM(args, index);
}

std::shared_ptr<InterpreterContext> lockContext(
    const std::weak_ptr<InterpreterContext>& weak) {
    auto context = weak.lock();
    if (!context) {
        PyErr_SetString(PyExc_RuntimeError, "Sandbox context is no longer available");
        throw py::error_already_set();
    }
    return context;
}

bool isDunder(std::string_view name) {
    return name.size() > 4 && name.starts_with("__") && name.ends_with("__");
}

}  // namespace

// Marks host-side work (allowed imports) that the guards must not inspect
class InterpreterContext::HostScope {
public:
    explicit HostScope(InterpreterContext& context) : context_(context) {
        ++context_.hostDepth_;
    }
    ~HostScope() { --context_.hostDepth_; }

    HostScope(const HostScope&) = delete;
    HostScope& operator=(const HostScope&) = delete;

private:
    InterpreterContext& context_;
};

// Guards are live for exactly the lifetime of this object. The tracer is
// installed before the context becomes active and removed after it is
// deactivated, so the sys.settrace audit events it raises pass through.
class InterpreterContext::Activation {
public:
    Activation(InterpreterContext& context, py::dict& globals)
        : context_(context), globals_(globals), previous_(tActiveContext) {
        context_.threadIdent_.store(PyThread_get_thread_ident());
        clockid_t clock{};
        if (pthread_getcpuclockid(pthread_self(), &clock) == 0) {
            context_.cpuClock_ = clock;
            context_.cpuStartMs_.store(nowMs(clock));
            context_.cpuClockValid_.store(true, std::memory_order_release);
        }
        context_.statements_ = 0;
        context_.deadline_ = std::chrono::steady_clock::now() + context_.profile_.wallTime;
        context_.evaluating_.store(true);

        PyEval_SetTrace(&InterpreterContext::traceHook, nullptr);
        tActiveContext = &context_;
    }

    ~Activation() {
        // Finalizers of script objects still run under the guards
        PyDict_Clear(globals_.ptr());

        tActiveContext = previous_;
        PyEval_SetTrace(nullptr, nullptr);

        std::optional<std::int64_t> cpu;
        if (context_.cpuClockValid_.load(std::memory_order_acquire)) {
            auto end = nowMs(context_.cpuClock_);
            if (end >= 0) {
                cpu = end - context_.cpuStartMs_.load();
            }
        }
        context_.cpuClockValid_.store(false);
        context_.evaluating_.store(false);

        auto wall = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - context_.startedAt_);
        std::lock_guard lock(context_.mutex_);
        context_.cpuTimeMs_ = cpu;
        context_.wallTimeMs_ = wall.count();
    }

    Activation(const Activation&) = delete;
    Activation& operator=(const Activation&) = delete;

private:
    InterpreterContext& context_;
    py::dict& globals_;
    InterpreterContext* previous_;
};

InterpreterContext::InterpreterContext(IsolationId id, CapabilityProfile profile,
                                       std::shared_ptr<PythonEngine> engine,
                                       std::shared_ptr<spdlog::logger> logger)
    : id_(std::move(id)),
      profile_(std::move(profile)),
      engine_(std::move(engine)),
      logger_(logger ? std::move(logger) : spdlog::default_logger()),
      ownerThread_(std::this_thread::get_id()),
      startedAt_(std::chrono::steady_clock::now()) {}

// ============================================================================
// Script globals
// ============================================================================

py::dict InterpreterContext::buildBuiltins() {
    auto original = py::reinterpret_borrow<py::dict>(
        py::module_::import("builtins").attr("__dict__"));
    py::dict builtins = original.attr("copy")();
    std::weak_ptr<InterpreterContext> weak = weak_from_this();

    py::object realImport = original["__import__"];
    builtins["__import__"] = py::cpp_function(
        [weak, realImport](const py::str& name, const py::object& globals,
                           const py::object& locals, const py::object& fromlist,
                           int level) -> py::object {
            auto context = lockContext(weak);
            auto module = name.cast<std::string>();
            if (context->profile_.restrictImports) {
                if (level != 0) {
                    context->deny(SandboxErrorKind::UnauthorizedSystemAccess,
                                  "Relative imports are not allowed in the sandbox");
                }
                if (!context->profile_.isModuleAllowed(module)) {
                    if (contains(kThreadModules, topLevel(module))) {
                        context->deny(SandboxErrorKind::UnauthorizedSystemAccess,
                                      "Thread creation is not allowed in the sandbox");
                    }
                    context->deny(classifyModule(module),
                                  fmt::format("Import of module '{}' is not allowed",
                                              module));
                }
            }
            HostScope host(*context);
            return realImport(name, globals, locals, fromlist, level);
        },
        py::arg("name"), py::arg("globals") = py::none(), py::arg("locals") = py::none(),
        py::arg("fromlist") = py::tuple(), py::arg("level") = 0);

    if (!profile_.allowDynamicCode) {
        for (const char* name : {"eval", "exec", "compile", "breakpoint", "input"}) {
            builtins[name] = py::cpp_function(
                [weak, label = std::string(name)](const py::args&,
                                                  const py::kwargs&) -> py::object {
                    lockContext(weak)->deny(
                        SandboxErrorKind::MaliciousCodeDetected,
                        fmt::format("Call to '{}' is not allowed in the sandbox", label));
                });
        }
    }

    if (!profile_.allowFilesystem) {
        builtins["open"] = py::cpp_function(
            [weak](const py::args& args, const py::kwargs&) -> py::object {
                auto context = lockContext(weak);
                std::string target = args.size() > 0 ? describe(args[0].ptr()) : "";
                context->deny(SandboxErrorKind::UnauthorizedFileAccess,
                              fmt::format("File access is not allowed: {}", target));
            });
    }

    if (profile_.scanForEscapes) {
        for (const char* name : {"getattr", "setattr", "delattr"}) {
            py::object real = original[name];
            builtins[name] = py::cpp_function(
                [weak, real](const py::args& args) -> py::object {
                    auto context = lockContext(weak);
                    if (args.size() >= 2 && py::isinstance<py::str>(args[1])) {
                        auto attribute = args[1].cast<std::string>();
                        if (isDunder(attribute) || context->engine_->isEscapeName(attribute)) {
                            context->deny(
                                SandboxErrorKind::MaliciousCodeDetected,
                                fmt::format("Access to attribute '{}' is not allowed",
                                            attribute));
                        }
                    }
                    return real(*args);
                });
        }
    }

    py::object realPrint = original["print"];
    builtins["print"] = py::cpp_function(
        [weak, realPrint](const py::args& args, const py::kwargs& kwargs) -> py::object {
            auto context = lockContext(weak);
            if (kwargs.contains("file") && !kwargs["file"].is_none()) {
                return realPrint(*args, **kwargs);
            }
            std::string separator = " ";
            std::string end = "\n";
            if (kwargs.contains("sep") && !kwargs["sep"].is_none()) {
                separator = py::str(kwargs["sep"]).cast<std::string>();
            }
            if (kwargs.contains("end") && !kwargs["end"].is_none()) {
                end = py::str(kwargs["end"]).cast<std::string>();
            }
            std::string line;
            for (std::size_t i = 0; i < args.size(); ++i) {
                if (i > 0) {
                    line += separator;
                }
                line += py::str(args[i]).cast<std::string>();
            }
            line += end;
            context->appendOutput(line);
            return py::none();
        });

    return builtins;
}

py::object InterpreterContext::buildHostObject(
    const IsolationRequest& request, const EnvironmentFilter::Environment& environment) {
    std::weak_ptr<InterpreterContext> weak = weak_from_this();

    py::dict members;
    members["log"] = py::cpp_function([weak](const py::object& message) {
        auto context = lockContext(weak);
        context->logger_->info("[{}] {}", context->id_,
                               py::str(message).cast<std::string>());
    });

    py::dict env;
    for (const auto& [name, value] : environment) {
        env[py::str(name)] = py::str(value);
    }
    members["env"] = env;
    members["variables"] = fromScriptValue(request.context.variables);

    if (profile_.fullHostAccess) {
        members["scriptName"] = py::str(request.scriptName);
        members["isolationId"] = py::str(id_);
        members["workingDirectory"] = py::str(request.context.workingDirectory.string());
    }

    return py::module_::import("types").attr("SimpleNamespace")(**members);
}

py::dict InterpreterContext::buildGlobals(const IsolationRequest& request,
                                          const EnvironmentFilter::Environment& environment) {
    py::dict globals;
    globals["__name__"] = py::str("__sandbox__");
    globals["__builtins__"] = buildBuiltins();

    if (request.context.variables.is_object()) {
        for (const auto& [name, value] : request.context.variables.items()) {
            if (name.starts_with("__")) {
                logger_->debug("{}: skipping reserved binding '{}'", id_, name);
                continue;
            }
            globals[py::str(name)] = fromScriptValue(value);
        }
    }

    if (profile_.exposeHost) {
        globals["pipeline"] = buildHostObject(request, environment);
    }
    return globals;
}

// ============================================================================
// Evaluation
// ============================================================================

std::expected<ScriptValue, std::string> InterpreterContext::evaluate(
    const py::object& function, py::dict& globals) {
    Activation activation(*this, globals);
    try {
        py::object result = function();
        return toScriptValue(result);
    } catch (py::error_already_set& e) {
        if (e.matches(PyExc_SystemExit)) {
            py::object code = e.value().attr("code");
            if (code.is_none() ||
                (py::isinstance<py::int_>(code) && code.cast<long long>() == 0)) {
                return ScriptValue(nullptr);
            }
        }
        return std::unexpected(std::string(e.what()));
    }
}

// ============================================================================
// Violations and stop requests
// ============================================================================

bool InterpreterContext::recordViolation(SandboxErrorKind kind, const std::string& reason) {
    {
        std::lock_guard lock(mutex_);
        if (violation_) {
            return false;
        }
        violation_ = SandboxError{kind, reason, id_, std::nullopt};
    }
    if (kind == SandboxErrorKind::Terminated) {
        logger_->info("{}: {}", id_, reason);
    } else {
        logger_->warn("{}: {} ({})", id_, reason, sandboxErrorKindToString(kind));
    }
    return true;
}

int InterpreterContext::refuse(SandboxErrorKind kind, const std::string& reason) {
    recordViolation(kind, reason);
    stop_.store(true, std::memory_order_release);
    PyObject* type = engine_->violationType();
    PyErr_SetString(type != nullptr ? type : PyExc_RuntimeError, reason.c_str());
    return -1;
}

void InterpreterContext::deny(SandboxErrorKind kind, const std::string& reason) {
    refuse(kind, reason);
    throw py::error_already_set();
}

void InterpreterContext::requestStop(SandboxErrorKind kind, std::string reason) {
    recordViolation(kind, reason);
    stop_.store(true, std::memory_order_release);
}

int InterpreterContext::raiseStop() {
    std::string message = "Sandbox execution stopped";
    {
        std::lock_guard lock(mutex_);
        if (violation_) {
            message = violation_->message;
        }
    }
    PyObject* type = engine_->violationType();
    PyErr_SetString(type != nullptr ? type : PyExc_RuntimeError, message.c_str());
    return -1;
}

bool InterpreterContext::interruptThread() {
    auto ident = threadIdent_.load();
    if (!evaluating_.load() || ident == 0) {
        return false;
    }
    PyObject* type = engine_->violationType();
    return PyThreadState_SetAsyncExc(ident, type != nullptr ? type : PyExc_RuntimeError) > 0;
}

void InterpreterContext::markFinished() {
    {
        std::lock_guard lock(mutex_);
        finished_ = true;
    }
    finishedCv_.notify_all();
}

bool InterpreterContext::waitFinished(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return finishedCv_.wait_for(lock, timeout, [this] { return finished_; });
}

bool InterpreterContext::isFinished() const {
    std::lock_guard lock(mutex_);
    return finished_;
}

std::optional<SandboxError> InterpreterContext::violation() const {
    std::lock_guard lock(mutex_);
    return violation_;
}

// ============================================================================
// Hooks
// ============================================================================

int InterpreterContext::auditHook(const char* event, PyObject* args, void*) {
    InterpreterContext* context = tActiveContext;
    if (context == nullptr) {
        return 0;
    }
    try {
        return context->onAudit(event, args);
    } catch (const std::exception& e) {
        PyErr_SetString(PyExc_RuntimeError, e.what());
        return -1;
    }
}

int InterpreterContext::traceHook(PyObject*, PyFrameObject*, int what, PyObject*) {
    InterpreterContext* context = tActiveContext;
    if (context == nullptr || what != PyTrace_LINE) {
        return 0;
    }
    return context->onLine();
}

int InterpreterContext::onAudit(std::string_view event, PyObject* args) {
    if (hostDepth_ > 0) {
        return 0;
    }
    if (event == "open") {
        return onOpen(args);
    }
    if (event.starts_with("socket.")) {
        return onSocket(event, args);
    }
    if (profile_.tier == IsolationTier::Trusted) {
        return 0;
    }

    if (!profile_.allowSystem && contains(kSystemEvents, event)) {
        return refuse(SandboxErrorKind::UnauthorizedSystemAccess,
                      fmt::format("System operation '{}' is not allowed", event));
    }
    if (profile_.scanForEscapes && contains(kIntrospectionEvents, event)) {
        return refuse(SandboxErrorKind::MaliciousCodeDetected,
                      fmt::format("Introspection hook '{}' is not allowed", event));
    }
    if (event == "import") {
        auto module = describe(argument(args, 0));
        if (contains(kDangerousModules, topLevel(module)) &&
            !profile_.isModuleAllowed(module)) {
            return refuse(classifyModule(module),
                          fmt::format("Import of module '{}' is not allowed", module));
        }
        return 0;
    }
    if (!profile_.allowFilesystem && contains(kFileEvents, event)) {
        auto path = describe(argument(args, 0));
        bool listing = event == "os.listdir" || event == "os.scandir";
        if (!(listing && engine_->isReadOnlyRoot(path))) {
            return refuse(SandboxErrorKind::UnauthorizedFileAccess,
                          fmt::format("File operation '{}' on '{}' is not allowed",
                                      event, path));
        }
    }
    return 0;
}

int InterpreterContext::onOpen(PyObject* args) {
    PyObject* target = argument(args, 0);
    std::string path;
    if (target != nullptr && PyLong_Check(target)) {
        path = fmt::format("fd:{}", PyLong_AsLong(target));
        if (PyErr_Occurred()) {
            PyErr_Clear();
        }
    } else {
        path = describe(target);
    }

    bool readOnly = true;
    PyObject* mode = argument(args, 1);
    PyObject* flags = argument(args, 2);
    if (mode != nullptr && PyUnicode_Check(mode)) {
        readOnly = describe(mode).find_first_of("wax+") == std::string::npos;
    } else if (flags != nullptr && PyLong_Check(flags)) {
        long value = PyLong_AsLong(flags);
        if (PyErr_Occurred()) {
            PyErr_Clear();
            value = O_RDWR;
        }
        readOnly = (value & O_ACCMODE) == O_RDONLY &&
                   (value & (O_CREAT | O_TRUNC | O_APPEND)) == 0;
    }

    bool libraryPath = engine_->isReadOnlyRoot(path);
    if (profile_.allowFilesystem) {
        if (!libraryPath) {
            recordFile(std::move(path));
        }
        return 0;
    }
    // Library sources and their bytecode caches stay reachable for lazy imports
    if (libraryPath && (readOnly || path.find("/__pycache__/") != std::string::npos)) {
        return 0;
    }
    return refuse(SandboxErrorKind::UnauthorizedFileAccess,
                  fmt::format("File access is not allowed: {}", path));
}

int InterpreterContext::onSocket(std::string_view event, PyObject* args) {
    std::string endpoint;
    if (event == "socket.connect" || event == "socket.bind" || event == "socket.sendto") {
        endpoint = describe(argument(args, 1));
    } else if (event == "socket.getaddrinfo") {
        endpoint = fmt::format("{}:{}", describe(argument(args, 0)),
                               describe(argument(args, 1)));
    } else if (event == "socket.gethostbyname" || event == "socket.gethostbyaddr") {
        endpoint = describe(argument(args, 0));
    }

    if (profile_.allowNetwork) {
        if (!endpoint.empty()) {
            recordConnection(std::move(endpoint));
        }
        return 0;
    }
    return refuse(SandboxErrorKind::UnauthorizedNetworkAccess,
                  endpoint.empty()
                      ? fmt::format("Network operation '{}' is not allowed", event)
                      : fmt::format("Network operation '{}' to {} is not allowed", event,
                                    endpoint));
}

int InterpreterContext::onLine() {
    if (stop_.load(std::memory_order_acquire)) {
        return raiseStop();
    }
    if (hostDepth_ > 0) {
        return 0;
    }

    ++statements_;
    if (profile_.statementBudget && statements_ > *profile_.statementBudget) {
        requestStop(SandboxErrorKind::ResourceLimitExceeded,
                    fmt::format("Statement budget of {} exceeded",
                                *profile_.statementBudget));
        return raiseStop();
    }
    if ((statements_ & kDeadlineCheckMask) == 0 &&
        std::chrono::steady_clock::now() >= deadline_) {
        requestStop(SandboxErrorKind::ExecutionTimeout,
                    fmt::format("Script exceeded its wall-clock limit of {} ms",
                                profile_.wallTime.count()));
        return raiseStop();
    }
    if (profile_.cpuTimeMs && statements_ % profile_.cpuCheckInterval == 0) {
        auto cpu = threadCpuMs();
        if (cpu && *cpu > *profile_.cpuTimeMs) {
            requestStop(SandboxErrorKind::ResourceLimitExceeded,
                        fmt::format("CPU time limit of {} ms exceeded ({} ms used)",
                                    *profile_.cpuTimeMs, *cpu));
            return raiseStop();
        }
    }
    return 0;
}

// ============================================================================
// Accounting
// ============================================================================

void InterpreterContext::appendOutput(std::string_view text) {
    std::lock_guard lock(mutex_);
    if (output_.size() >= profile_.maxOutputBytes) {
        if (!outputTruncated_) {
            outputTruncated_ = true;
            logger_->warn("{}: captured output truncated at {} bytes", id_,
                          profile_.maxOutputBytes);
        }
        return;
    }
    auto room = profile_.maxOutputBytes - output_.size();
    output_.append(text.substr(0, room));
}

void InterpreterContext::recordFile(std::string path) {
    std::lock_guard lock(mutex_);
    if (std::find(filesAccessed_.begin(), filesAccessed_.end(), path) ==
        filesAccessed_.end()) {
        filesAccessed_.push_back(std::move(path));
    }
}

void InterpreterContext::recordConnection(std::string endpoint) {
    std::lock_guard lock(mutex_);
    networkConnections_.push_back(std::move(endpoint));
}

std::optional<std::int64_t> InterpreterContext::threadCpuMs() const {
    if (!cpuClockValid_.load(std::memory_order_acquire)) {
        return std::nullopt;
    }
    auto now = nowMs(cpuClock_);
    if (now < 0) {
        return std::nullopt;
    }
    return now - cpuStartMs_.load();
}

std::string InterpreterContext::capturedOutput() const {
    std::lock_guard lock(mutex_);
    return output_;
}

ResourceUsageSnapshot InterpreterContext::usage() const {
    ResourceUsageSnapshot snapshot;
    auto live = threadCpuMs();

    std::lock_guard lock(mutex_);
    snapshot.wallTimeMs = wallTimeMs_.value_or(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - startedAt_)
            .count());
    snapshot.cpuTimeMs = cpuTimeMs_ ? cpuTimeMs_ : live;
    snapshot.filesAccessed = filesAccessed_;
    snapshot.networkConnections = networkConnections_;
    return snapshot;
}

}  // namespace warden::sandbox::interpreter
