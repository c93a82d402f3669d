/*
 * sandbox_usage_example.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-18

Description: Walkthrough of secure pipeline script execution

*************************************************/

#include "sandbox/sandbox.hpp"

#include <pybind11/embed.h>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <future>
#include <iostream>
#include <thread>

namespace py = pybind11;

using namespace warden::sandbox;
using namespace std::chrono_literals;

namespace {

void printOutcome(const RawExecutionResult& result) {
    if (result) {
        std::cout << "  result: " << result->result.dump() << "\n";
        std::cout << "  isolation: " << result->isolationId << "\n";
        std::cout << "  usage: " << result->resourceUsage.toHumanReadable() << "\n";
        return;
    }
    const auto& failure = result.error();
    std::cout << "  failed: " << failure.reason << "\n";
    std::cout << "  error: " << failure.error.describe() << "\n";
    std::cout << "  security violation: "
              << (failure.error.isSecurityViolation() ? "yes" : "no") << "\n";
}

// Example 1: Evaluate a build expression in the isolated interpreter
void basicEvaluationExample(SandboxManager& manager) {
    std::cout << "\n=== Basic Evaluation ===\n";

    ExecutionContext context;
    context.policy.isolationLevel = IsolationLevel::Isolate;
    context.variables = {{"buildNumber", 41}, {"branch", "main"}};

    auto result = manager.executeSecurely<int>("buildNumber + 1", "next-build", context);
    if (result) {
        std::cout << "Next build number: " << result->result << "\n";
    } else {
        std::cout << "Evaluation failed: " << result.error().reason << "\n";
    }
}

// Example 2: Pipeline DSL syntax is rewritten before evaluation
void dslExample(SandboxManager& manager) {
    std::cout << "\n=== Pipeline DSL ===\n";

    ExecutionContext context;
    context.policy.isolationLevel = IsolationLevel::Thread;
    context.environmentVariables = {{"PIPELINE_DEPLOY_TARGET", "staging"}};

    const std::string script =
        "// choose a deployment flavour\n"
        "val target = pipeline.env['PIPELINE_DEPLOY_TARGET']\n"
        "println(target)\n"
        "target == 'staging' and true\n";
    printOutcome(manager.executeSecurely(script, "deploy-check", context));
}

// Example 3: Run a script in a separate interpreter process
void processExample(SandboxManager& manager) {
    std::cout << "\n=== Process Isolation ===\n";

    ExecutionContext context;
    context.policy.isolationLevel = IsolationLevel::Process;
    context.resourceLimits = ResourceLimits{.maxMemoryMb = 256, .maxCpuTimeMs = 5000};
    context.environmentVariables = {{"PIPELINE_ARTIFACT", "app.tar.gz"}};

    printOutcome(manager.executeSecurely(
        "import os\n{'artifact': os.environ.get('PIPELINE_ARTIFACT'), 'sizes': [1, 2, 3]}",
        "package", context));
}

// Example 4: Escape attempts are reported as security violations
void securityExample(SandboxManager& manager) {
    std::cout << "\n=== Security Violations ===\n";

    ExecutionContext context;
    context.policy.isolationLevel = IsolationLevel::Isolate;

    for (const auto* script : {"import subprocess\nsubprocess.run(['id'])",
                               "open('/etc/passwd').read()",
                               "().__class__.__bases__[0].__subclasses__()"}) {
        std::cout << "Script: " << script << "\n";
        printOutcome(manager.executeSecurely(script, "escape-attempt", context));
    }

    ExecutionContext greedy;
    greedy.resourceLimits = ResourceLimits{.maxMemoryMb = 8192, .maxThreads = 64};
    auto validation = manager.validateSecurityPolicy(greedy);
    std::cout << "Greedy policy valid: " << (validation.isValid ? "yes" : "no") << "\n";
    for (const auto& issue : validation.issues) {
        std::cout << "  - " << issue << "\n";
    }
}

// Example 5: Deadlines and explicit termination
void terminationExample(SandboxManager& manager) {
    std::cout << "\n=== Timeouts and Termination ===\n";

    ExecutionContext context;
    context.policy.isolationLevel = IsolationLevel::Isolate;
    context.timeout = 500ms;
    printOutcome(manager.executeSecurely("while True:\n    pass", "spin", context));

    ExecutionContext longRunning;
    longRunning.policy.isolationLevel = IsolationLevel::Process;
    longRunning.timeout = 30s;
    auto pending = std::async(std::launch::async, [&manager, longRunning] {
        return manager.executeSecurely("import time\ntime.sleep(60)", "sleeper",
                                       longRunning);
    });

    std::this_thread::sleep_for(500ms);
    for (const auto& [key, usage] : manager.getActiveExecutions()) {
        std::cout << "Active " << key << ": " << usage.toHumanReadable() << "\n";
        if (!manager.terminateExecution(key)) {
            std::cout << "Termination of " << key << " was not accepted\n";
        }
    }
    printOutcome(pending.get());
}

}  // namespace

int main(int argc, char** argv) {
    auto logger = spdlog::stdout_color_mt("sandbox");
    logger->set_level(spdlog::level::info);

    SandboxConfig config;
    if (argc > 1) {
        auto loaded = loadSandboxConfig(argv[1]);
        if (!loaded) {
            logger->error("Failed to load configuration: {}", loaded.error().describe());
            return 1;
        }
        config = std::move(*loaded);
        logger->info("Loaded configuration from {}", argv[1]);
    }

    py::scoped_interpreter guard{false};
    {
        py::gil_scoped_release release;

        SandboxManager manager(config, logger);
        basicEvaluationExample(manager);
        dslExample(manager);
        if (ConfigDiscovery::resolvePythonExecutable(config.process)) {
            processExample(manager);
        } else {
            logger->warn("No Python executable found, skipping process isolation");
        }
        securityExample(manager);
        terminationExample(manager);
        manager.shutdown();
    }

    logger->info("Sandbox usage example completed");
    return 0;
}
