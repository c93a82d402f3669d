/*
 * python_engine.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "python_engine.hpp"

#include "interpreter_context.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <stdexcept>

namespace warden::sandbox::interpreter {

namespace {

constexpr int kMaxConversionDepth = 64;

constexpr const char* kHelperSource = R"PY(
import ast as _ast
import sysconfig as _sysconfig


class SandboxViolation(BaseException):
    pass


ESCAPE_NAMES = frozenset((
    "__subclasses__", "__globals__", "__builtins__", "__bases__", "__base__",
    "__mro__", "__class__", "__code__", "__closure__", "__func__", "__self__",
    "__dict__", "__getattribute__", "__import__", "__loader__", "__spec__",
    "__reduce__", "__reduce_ex__", "__init_subclass__", "__subclasshook__",
    "f_globals", "f_locals", "f_back", "f_builtins", "f_code",
    "gi_frame", "gi_code", "cr_frame", "cr_code", "ag_frame", "ag_code",
    "tb_frame", "tb_next",
))


def find_escape(tree):
    for node in _ast.walk(tree):
        if isinstance(node, _ast.Attribute) and node.attr in ESCAPE_NAMES:
            return node.attr
        if isinstance(node, _ast.Name) and node.id in ESCAPE_NAMES:
            return node.id
        if (isinstance(node, _ast.Constant) and isinstance(node.value, str)
                and node.value in ESCAPE_NAMES):
            return node.value
    return None


def build(source, filename, scan):
    tree = _ast.parse(source, filename=filename, mode="exec")
    if scan:
        escape = find_escape(tree)
        if escape is not None:
            return None, escape
    body = tree.body or [_ast.Pass()]
    if isinstance(body[-1], _ast.Expr):
        body[-1] = _ast.copy_location(_ast.Return(value=body[-1].value), body[-1])
    module = _ast.parse("def __sandbox_main__():\n    pass\n", filename=filename)
    module.body[0].body = body
    _ast.fix_missing_locations(module)
    return compile(module, filename, "exec"), None


def read_only_roots():
    paths = _sysconfig.get_paths()
    return sorted({paths[key] for key in ("stdlib", "platstdlib") if paths.get(key)})
)PY";

// Audit hooks cannot be removed, so install exactly one per process.
std::mutex gHookMutex;
bool gHookInstalled = false;

void installAuditHook() {
    std::lock_guard lock(gHookMutex);
    if (gHookInstalled) {
        return;
    }
    if (PySys_AddAuditHook(&InterpreterContext::auditHook, nullptr) != 0) {
        if (PyErr_Occurred()) {
            throw py::error_already_set();
        }
        throw std::runtime_error("PySys_AddAuditHook refused the sandbox hook");
    }
    gHookInstalled = true;
}

}  // namespace

PythonEngine::PythonEngine(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

PythonEngine::~PythonEngine() { close(); }

Result<void> PythonEngine::open() {
    std::lock_guard lock(mutex_);
    if (open_) {
        return {};
    }

    if (!Py_IsInitialized()) {
        logger_->error(
            "Python interpreter not initialized. Please use "
            "py::scoped_interpreter in main.");
        return std::unexpected(SandboxError{
            SandboxErrorKind::LaunchFailed,
            "Python interpreter is not initialized", {}, std::nullopt});
    }

    try {
        py::gil_scoped_acquire gil;
        installAuditHook();

        py::dict scope;
        scope["__builtins__"] = py::module_::import("builtins");
        py::exec(kHelperSource, scope);

        build_ = scope["build"];
        violationTypeHandle_ = scope["SandboxViolation"];
        violationType_ = violationTypeHandle_.ptr();

        escapeNames_.clear();
        for (auto name : scope["ESCAPE_NAMES"]) {
            escapeNames_.insert(name.cast<std::string>());
        }
        readOnlyRoots_.clear();
        for (auto root : scope["read_only_roots"]()) {
            readOnlyRoots_.push_back(root.cast<std::string>());
        }
    } catch (const std::exception& e) {
        logger_->error("Failed to prepare sandbox interpreter: {}", e.what());
        return std::unexpected(SandboxError{SandboxErrorKind::LaunchFailed,
                                            "Failed to prepare sandbox interpreter",
                                            {}, std::string(e.what())});
    }

    open_ = true;
    logger_->info("Sandbox interpreter engine opened ({} read-only roots)",
                  readOnlyRoots_.size());
    return {};
}

void PythonEngine::close() noexcept {
    std::lock_guard lock(mutex_);
    if (!open_ && !build_ && !violationTypeHandle_) {
        return;
    }
    open_ = false;
    violationType_ = nullptr;

    if (!Py_IsInitialized()) {
        // The interpreter is already gone; dropping the references would
        // touch freed memory.
        build_.release();
        violationTypeHandle_.release();
        return;
    }

    py::gil_scoped_acquire gil;
    build_ = py::object();
    violationTypeHandle_ = py::object();
    logger_->info("Sandbox interpreter engine closed");
}

bool PythonEngine::isOpen() const {
    std::lock_guard lock(mutex_);
    return open_;
}

CompiledScript PythonEngine::compile(const std::string& source,
                                     const std::string& filename,
                                     bool scanForEscapes) const {
    py::tuple built = build_(source, filename, scanForEscapes);
    CompiledScript compiled;
    if (!built[1].is_none()) {
        compiled.escape = built[1].cast<std::string>();
    } else {
        compiled.code = built[0];
    }
    return compiled;
}

bool PythonEngine::isEscapeName(std::string_view name) const {
    return escapeNames_.contains(name);
}

bool PythonEngine::isReadOnlyRoot(std::string_view path) const {
    for (const auto& root : readOnlyRoots_) {
        if (path.size() > root.size() && path.starts_with(root) &&
            path[root.size()] == '/') {
            return true;
        }
    }
    return false;
}

ScriptValue toScriptValue(py::handle value, int depth) {
    if (depth > kMaxConversionDepth) {
        return py::str(value).cast<std::string>();
    }
    if (value.is_none()) {
        return nullptr;
    }
    if (py::isinstance<py::bool_>(value)) {
        return value.cast<bool>();
    }
    if (py::isinstance<py::int_>(value)) {
        int overflow = 0;
        long long number = PyLong_AsLongLongAndOverflow(value.ptr(), &overflow);
        if (overflow == 0 && !(number == -1 && PyErr_Occurred())) {
            return static_cast<std::int64_t>(number);
        }
        PyErr_Clear();
        return py::str(value).cast<std::string>();
    }
    if (py::isinstance<py::float_>(value)) {
        double number = value.cast<double>();
        if (std::isfinite(number)) {
            return number;
        }
        return py::str(value).cast<std::string>();
    }
    if (py::isinstance<py::str>(value)) {
        return value.cast<std::string>();
    }
    if (py::isinstance<py::list>(value) || py::isinstance<py::tuple>(value)) {
        ScriptValue array = ScriptValue::array();
        for (auto item : value) {
            array.push_back(toScriptValue(item, depth + 1));
        }
        return array;
    }
    if (py::isinstance<py::dict>(value)) {
        auto dict = py::reinterpret_borrow<py::dict>(value);
        bool stringKeys = true;
        for (auto item : dict) {
            if (!py::isinstance<py::str>(item.first)) {
                stringKeys = false;
                break;
            }
        }
        if (stringKeys) {
            ScriptValue object = ScriptValue::object();
            for (auto item : dict) {
                object[item.first.cast<std::string>()] =
                    toScriptValue(item.second, depth + 1);
            }
            return object;
        }
    }
    return py::str(value).cast<std::string>();
}

py::object fromScriptValue(const ScriptValue& value) {
    switch (value.type()) {
        case ScriptValue::value_t::null:
        case ScriptValue::value_t::discarded:
            return py::none();
        case ScriptValue::value_t::boolean:
            return py::bool_(value.get<bool>());
        case ScriptValue::value_t::number_integer:
            return py::int_(value.get<std::int64_t>());
        case ScriptValue::value_t::number_unsigned:
            return py::int_(value.get<std::uint64_t>());
        case ScriptValue::value_t::number_float:
            return py::float_(value.get<double>());
        case ScriptValue::value_t::string:
            return py::str(value.get_ref<const std::string&>());
        case ScriptValue::value_t::array: {
            py::list list;
            for (const auto& item : value) {
                list.append(fromScriptValue(item));
            }
            return list;
        }
        case ScriptValue::value_t::object: {
            py::dict dict;
            for (const auto& [key, item] : value.items()) {
                dict[py::str(key)] = fromScriptValue(item);
            }
            return dict;
        }
        case ScriptValue::value_t::binary:
            return py::bytes(std::string(value.get_binary().begin(),
                                         value.get_binary().end()));
    }
    return py::none();
}

}  // namespace warden::sandbox::interpreter
