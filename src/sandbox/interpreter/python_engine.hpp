/*
 * python_engine.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file python_engine.hpp
 * @brief Shared embedded-Python handle used by interpreter contexts
 */

#ifndef WARDEN_SANDBOX_PYTHON_ENGINE_HPP
#define WARDEN_SANDBOX_PYTHON_ENGINE_HPP

#include "sandbox/types.hpp"

#include <pybind11/embed.h>
#include <pybind11/pybind11.h>

#include <spdlog/logger.h>

#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace py = pybind11;

namespace warden::sandbox::interpreter {

/**
 * @brief Script compiled into a `__sandbox_main__` function definition
 */
struct CompiledScript {
    py::object code;                    ///< Code object defining the function
    std::optional<std::string> escape;  ///< Restricted name found by the scan
};

/**
 * @brief Process-wide embedded interpreter handle
 *
 * The interpreter itself is owned by the host (py::scoped_interpreter in
 * main). The engine installs the sandbox audit hook once, keeps the helper
 * namespace alive, and releases it on close(). Methods marked "GIL" must be
 * called with the GIL held.
 */
class PythonEngine {
public:
    explicit PythonEngine(std::shared_ptr<spdlog::logger> logger = nullptr);
    ~PythonEngine();

    PythonEngine(const PythonEngine&) = delete;
    PythonEngine& operator=(const PythonEngine&) = delete;

    /**
     * @brief Load helpers and install the audit hook, idempotent
     *
     * Must be called without holding the GIL.
     */
    [[nodiscard]] Result<void> open();

    /**
     * @brief Release every Python handle, safe to call repeatedly
     */
    void close() noexcept;

    [[nodiscard]] bool isOpen() const;

    /**
     * @brief Parse, optionally scan, and wrap a script (GIL)
     * @throws py::error_already_set on syntax errors
     */
    [[nodiscard]] CompiledScript compile(const std::string& source,
                                         const std::string& filename,
                                         bool scanForEscapes) const;

    /// Exception type raised into scripts on a denied capability (borrowed)
    [[nodiscard]] PyObject* violationType() const noexcept { return violationType_; }

    /// Names rejected by the escape scan and by the guarded getattr
    [[nodiscard]] bool isEscapeName(std::string_view name) const;

    /// Interpreter library directories readable at every tier
    [[nodiscard]] bool isReadOnlyRoot(std::string_view path) const;

private:
    std::shared_ptr<spdlog::logger> logger_;
    mutable std::mutex mutex_;
    bool open_{false};

    py::object build_;
    py::object violationTypeHandle_;
    PyObject* violationType_{nullptr};
    std::set<std::string, std::less<>> escapeNames_;
    std::vector<std::string> readOnlyRoots_;
};

/**
 * @brief Convert a Python value to a script value (GIL)
 *
 * None, bool, int, float, str, list/tuple and str-keyed dicts map
 * structurally; everything else falls back to str().
 */
[[nodiscard]] ScriptValue toScriptValue(py::handle value, int depth = 0);

/**
 * @brief Convert a script value to a Python object (GIL)
 */
[[nodiscard]] py::object fromScriptValue(const ScriptValue& value);

}  // namespace warden::sandbox::interpreter

#endif  // WARDEN_SANDBOX_PYTHON_ENGINE_HPP
