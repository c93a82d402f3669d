/*
 * script_wrapper.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "script_wrapper.hpp"

#include <spdlog/fmt/fmt.h>

#include <unordered_map>
#include <utility>

namespace warden::sandbox::process {

namespace {

constexpr std::string_view kWrapperTemplate = R"PY(import ast as _ast
import json as _json
import os as _os
import resource as _resource
import sys as _sys
import threading as _threading
import time as _time

_SOURCE = @SOURCE@
_BINDINGS = _json.loads(@BINDINGS@)
_DEADLINE_S = @DEADLINE_S@
_MEMORY_LIMIT_KB = @MEMORY_LIMIT_KB@
_STRICT = @STRICT@
_ALLOWED_ENV = frozenset(@ALLOWED_ENV@)
_DENIED_EVENTS = frozenset(@DENIED_EVENTS@)


def _violation(message):
    try:
        _os.write(1, ("@VIOLATION_MARKER@ " + message + "\n").encode("utf-8", "replace"))
    finally:
        _os._exit(@VIOLATION_EXIT@)


for _name in list(_os.environ):
    if _name not in _ALLOWED_ENV:
        del _os.environ[_name]

_START = _time.monotonic()
_BASELINE_KB = _resource.getrusage(_resource.RUSAGE_SELF).ru_maxrss


def _watch():
    while True:
        _time.sleep(0.05)
        if _DEADLINE_S > 0 and _time.monotonic() - _START > _DEADLINE_S:
            _violation("wall time limit exceeded")
        if _MEMORY_LIMIT_KB > 0:
            grown = _resource.getrusage(_resource.RUSAGE_SELF).ru_maxrss - _BASELINE_KB
            if grown > _MEMORY_LIMIT_KB:
                _violation("memory limit exceeded")


_threading.Thread(target=_watch, name="sandbox-monitor", daemon=True).start()


def _audit(event, args):
    if event in _DENIED_EVENTS:
        _violation("denied operation " + event)


if _STRICT:
    _sys.addaudithook(_audit)


def _compile(source):
    tree = _ast.parse(source, filename="<sandbox>", mode="exec")
    body = tree.body or [_ast.Pass()]
    if isinstance(body[-1], _ast.Expr):
        body[-1] = _ast.copy_location(_ast.Return(value=body[-1].value), body[-1])
    module = _ast.parse("def __sandbox_main__():\n    pass\n", filename="<sandbox>")
    module.body[0].body = body
    _ast.fix_missing_locations(module)
    return compile(module, "<sandbox>", "exec")


def _emit(value):
    if value is None:
        return
    try:
        text = _json.dumps(value, default=str, allow_nan=False)
    except (TypeError, ValueError):
        text = _json.dumps(str(value))
    _sys.stdout.write("\n@RESULT_MARKER@ " + text + "\n")


def _run():
    try:
        namespace = {"__name__": "__sandbox__", "__builtins__": __builtins__}
        namespace.update(_BINDINGS)
        exec(_compile(_SOURCE), namespace)
        _emit(namespace["__sandbox_main__"]())
        return 0
    except MemoryError:
        _sys.stdout.write("@VIOLATION_MARKER@ memory exhausted\n")
        return @VIOLATION_EXIT@
    except SystemExit as request:
        return 0 if request.code in (None, 0) else @ERROR_EXIT@
    except BaseException as error:
        _sys.stdout.write("@ERROR_MARKER@ %s: %s\n" % (type(error).__name__, error))
        return @ERROR_EXIT@


_status = _run()
try:
    _sys.stdout.flush()
    _sys.stderr.flush()
finally:
    _os._exit(_status)
)PY";

/// Single pass over the template, so substituted text is never rescanned
std::string substitute(std::string_view text,
                       const std::unordered_map<std::string_view, std::string>& values) {
    std::string output;
    output.reserve(text.size() + 1024);
    std::size_t position = 0;
    while (position < text.size()) {
        auto open = text.find('@', position);
        if (open == std::string_view::npos) {
            break;
        }
        auto close = text.find('@', open + 1);
        if (close == std::string_view::npos) {
            break;
        }
        auto it = values.find(text.substr(open + 1, close - open - 1));
        if (it == values.end()) {
            output.append(text.substr(position, close - position));
            position = close;
            continue;
        }
        output.append(text.substr(position, open - position));
        output.append(it->second);
        position = close + 1;
    }
    output.append(text.substr(position));
    return output;
}

/// JSON string literals are valid Python string literals
std::string pythonLiteral(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace

const std::vector<std::string>& ScriptWrapper::deniedAuditEvents() {
    static const std::vector<std::string> events = {
        "os.system",       "os.exec",          "os.posix_spawn",
        "os.spawn",        "os.fork",          "os.forkpty",
        "os.kill",         "os.killpg",        "subprocess.Popen",
        "pty.spawn",       "ctypes.dlopen",    "ctypes.dlsym",
        "socket.connect",  "socket.bind",      "socket.sendto",
        "socket.sendmsg",  "socket.getaddrinfo", "socket.gethostbyname",
        "socket.gethostbyaddr", "sys.remote_exec"};
    return events;
}

std::string ScriptWrapper::render(std::string_view scriptText,
                                  const WrapperSettings& settings) {
    const double deadlineSeconds =
        static_cast<double>(settings.deadline.count()) / 1000.0;
    const auto& bindings =
        settings.bindings.is_object() ? settings.bindings : ScriptValue::object();

    std::unordered_map<std::string_view, std::string> values{
        {"SOURCE", pythonLiteral(std::string(scriptText))},
        {"BINDINGS", pythonLiteral(pythonLiteral(bindings))},
        {"DEADLINE_S", fmt::format("{:.3f}", deadlineSeconds)},
        {"MEMORY_LIMIT_KB", std::to_string(settings.memoryLimitMb > 0
                                               ? settings.memoryLimitMb * 1024
                                               : 0)},
        {"STRICT", settings.strict ? "True" : "False"},
        {"ALLOWED_ENV", pythonLiteral(nlohmann::json(settings.allowedEnvironment))},
        {"DENIED_EVENTS", pythonLiteral(nlohmann::json(deniedAuditEvents()))},
        {"VIOLATION_MARKER", std::string(kSecurityViolationMarker)},
        {"ERROR_MARKER", std::string(kScriptErrorMarker)},
        {"RESULT_MARKER", std::string(kResultMarker)},
        {"VIOLATION_EXIT", std::to_string(kSecurityViolationExitCode)},
        {"ERROR_EXIT", std::to_string(kScriptErrorExitCode)}};

    return substitute(kWrapperTemplate, values);
}

}  // namespace warden::sandbox::process
