/*
 * test_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>
#include "sandbox/config.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

using namespace warden::sandbox;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

class SandboxConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = fs::temp_directory_path() / "warden_config_test";
        fs::create_directories(testDir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(testDir_, ec);
    }

    fs::path writeFile(const std::string& name, const std::string& content) {
        auto path = testDir_ / name;
        std::ofstream file(path);
        file << content;
        return path;
    }

    fs::path testDir_;
};

TEST_F(SandboxConfigTest, Defaults) {
    SandboxConfig config;
    EXPECT_EQ(config.policy.maxMemoryMb, 2048);
    EXPECT_EQ(config.policy.maxCpuTimeMs, 300000);
    EXPECT_EQ(config.policy.maxThreads, 10);
    EXPECT_EQ(config.policy.maxWallTimeMs, 3600000);
    EXPECT_EQ(config.policy.maxFileHandles, 1024);
    EXPECT_EQ(config.policy.maxEnvironmentVariablesAtThreadLevel, 50u);
    EXPECT_EQ(config.process.defaultMemoryMb, 512);
    EXPECT_EQ(config.defaultWallTime, 60000ms);
    EXPECT_EQ(config.stopWait, 2000ms);
}

TEST_F(SandboxConfigTest, IsolatedModulesExcludeHostAccess) {
    InterpreterBackendConfig config;
    for (const auto* module : {"os", "io", "pathlib", "glob", "time", "uuid"}) {
        EXPECT_EQ(std::find(config.isolatedModules.begin(), config.isolatedModules.end(),
                            module),
                  config.isolatedModules.end())
            << module;
        EXPECT_NE(std::find(config.constrainedModules.begin(),
                            config.constrainedModules.end(), module),
                  config.constrainedModules.end())
            << module;
    }
}

TEST_F(SandboxConfigTest, LoadPartialDocumentKeepsDefaults) {
    auto path = writeFile("partial.json", R"({
        "policy": {"maxMemoryMb": 1024},
        "process": {"gracePeriodMs": 250},
        "defaultWallTimeMs": 9000,
        "stopWaitMs": 300
    })");

    auto config = loadSandboxConfig(path);
    ASSERT_TRUE(config.has_value()) << config.error().describe();
    EXPECT_EQ(config->policy.maxMemoryMb, 1024);
    EXPECT_EQ(config->policy.maxThreads, 10);
    EXPECT_EQ(config->process.gracePeriod, 250ms);
    EXPECT_EQ(config->process.pollInterval, 10ms);
    EXPECT_EQ(config->defaultWallTime, 9000ms);
    EXPECT_EQ(config->stopWait, 300ms);
    EXPECT_FALSE(config->environment.allowedPrefixes.empty());
}

TEST_F(SandboxConfigTest, LoadMissingFile) {
    auto config = loadSandboxConfig(testDir_ / "absent.json");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().kind, SandboxErrorKind::LaunchFailed);
}

TEST_F(SandboxConfigTest, LoadMalformedFile) {
    auto path = writeFile("broken.json", "{ not json");
    auto config = loadSandboxConfig(path);
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().kind, SandboxErrorKind::LaunchFailed);
    EXPECT_TRUE(config.error().cause.has_value());
}

TEST_F(SandboxConfigTest, JsonRoundTrip) {
    SandboxConfig config;
    config.interpreter.statementsPerCpuMs = 42;
    config.environment.allowedPrefixes = {"JOB_"};

    auto restored = nlohmann::json(config).get<SandboxConfig>();
    EXPECT_EQ(restored.interpreter.statementsPerCpuMs, 42u);
    ASSERT_EQ(restored.environment.allowedPrefixes.size(), 1u);
    EXPECT_EQ(restored.environment.allowedPrefixes[0], "JOB_");
}

// =============================================================================
// Discovery Tests
// =============================================================================

TEST_F(SandboxConfigTest, ResolveMissingPythonExecutable) {
    ProcessBackendConfig config;
    config.pythonExecutable = testDir_ / "no-such-python";

    auto resolved = ConfigDiscovery::resolvePythonExecutable(config);
    ASSERT_FALSE(resolved.has_value());
    EXPECT_EQ(resolved.error().kind, SandboxErrorKind::LaunchFailed);
    EXPECT_EQ(resolved.error().message, "Python interpreter not found");
}

TEST_F(SandboxConfigTest, ResolveTempRoot) {
    ProcessBackendConfig config;
    EXPECT_FALSE(ConfigDiscovery::resolveTempRoot(config).empty());

    config.tempRoot = testDir_;
    EXPECT_EQ(ConfigDiscovery::resolveTempRoot(config), testDir_);
}
