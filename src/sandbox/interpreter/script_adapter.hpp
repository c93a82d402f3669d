/*
 * script_adapter.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef WARDEN_SANDBOX_SCRIPT_ADAPTER_HPP
#define WARDEN_SANDBOX_SCRIPT_ADAPTER_HPP

#include <string>
#include <string_view>

namespace warden::sandbox::interpreter {

/**
 * @brief Best-effort rewrite of pipeline DSL snippets into Python
 *
 * Handles a handful of simple constructs outside string literals:
 * `println(` to `print(`, leading `val`/`var` declarations, line comments
 * starting with `//`, a trailing `;`, and `true`/`false`/`null`.
 * It is not a compiler. Anything else is left untouched and fails at
 * evaluation time with the interpreter's own error.
 */
class ScriptAdapter {
public:
    [[nodiscard]] static std::string adapt(std::string_view source);
};

}  // namespace warden::sandbox::interpreter

#endif  // WARDEN_SANDBOX_SCRIPT_ADAPTER_HPP
