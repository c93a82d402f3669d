/*
 * test_types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_types.cpp
 * @brief Tests for sandbox result, error and usage types
 */

#include <gtest/gtest.h>
#include "sandbox/types.hpp"

#include <chrono>

using namespace warden::sandbox;
using namespace std::chrono_literals;

// =============================================================================
// Isolation Level Tests
// =============================================================================

TEST(IsolationLevelTest, ToStringNames) {
    EXPECT_EQ(isolationLevelToString(IsolationLevel::None), "none");
    EXPECT_EQ(isolationLevelToString(IsolationLevel::Thread), "thread");
    EXPECT_EQ(isolationLevelToString(IsolationLevel::Isolate), "isolate");
    EXPECT_EQ(isolationLevelToString(IsolationLevel::Process), "process");
}

TEST(IsolationLevelTest, FromStringIsCaseInsensitive) {
    EXPECT_EQ(isolationLevelFromString("PROCESS"), IsolationLevel::Process);
    EXPECT_EQ(isolationLevelFromString("Isolate"), IsolationLevel::Isolate);
    EXPECT_EQ(isolationLevelFromString("thread"), IsolationLevel::Thread);
}

TEST(IsolationLevelTest, FromStringUnknown) {
    EXPECT_FALSE(isolationLevelFromString("container").has_value());
    EXPECT_FALSE(isolationLevelFromString("").has_value());
}

TEST(IsolationLevelTest, JsonRejectsUnknownName) {
    nlohmann::json j = "vm";
    EXPECT_THROW(j.get<IsolationLevel>(), std::invalid_argument);
}

// =============================================================================
// Error Tests
// =============================================================================

TEST(SandboxErrorTest, SecurityClassification) {
    EXPECT_TRUE(isSecurityViolation(SandboxErrorKind::ResourceLimitExceeded));
    EXPECT_TRUE(isSecurityViolation(SandboxErrorKind::UnauthorizedFileAccess));
    EXPECT_TRUE(isSecurityViolation(SandboxErrorKind::UnauthorizedNetworkAccess));
    EXPECT_TRUE(isSecurityViolation(SandboxErrorKind::UnauthorizedSystemAccess));
    EXPECT_TRUE(isSecurityViolation(SandboxErrorKind::MaliciousCodeDetected));
    EXPECT_TRUE(isSecurityViolation(SandboxErrorKind::ExecutionTimeout));

    EXPECT_FALSE(isSecurityViolation(SandboxErrorKind::ExecutionFailed));
    EXPECT_FALSE(isSecurityViolation(SandboxErrorKind::LaunchFailed));
    EXPECT_FALSE(isSecurityViolation(SandboxErrorKind::PolicyViolation));
    EXPECT_FALSE(isSecurityViolation(SandboxErrorKind::Terminated));
}

TEST(SandboxErrorTest, OnlyTimeoutIsRetryable) {
    SandboxError error{.kind = SandboxErrorKind::ExecutionTimeout};
    EXPECT_TRUE(error.isRetryable());

    error.kind = SandboxErrorKind::MaliciousCodeDetected;
    EXPECT_FALSE(error.isRetryable());
}

TEST(SandboxErrorTest, DescribeWithAndWithoutCause) {
    SandboxError error{.kind = SandboxErrorKind::ExecutionFailed,
                       .message = "boom"};
    EXPECT_EQ(error.describe(), "EXECUTION_FAILED: boom");

    error.cause = "ZeroDivisionError";
    EXPECT_EQ(error.describe(), "EXECUTION_FAILED: boom (ZeroDivisionError)");
}

TEST(SandboxErrorTest, JsonCarriesSecurityFlag) {
    SandboxError error{.kind = SandboxErrorKind::UnauthorizedFileAccess,
                       .message = "denied",
                       .isolationId = "isolate-a-1"};
    nlohmann::json j = error;
    EXPECT_EQ(j["kind"], "UNAUTHORIZED_FILE_ACCESS");
    EXPECT_EQ(j["message"], "denied");
    EXPECT_EQ(j["isolationId"], "isolate-a-1");
    EXPECT_TRUE(j["securityViolation"].get<bool>());
    EXPECT_TRUE(j["cause"].is_null());
}

TEST(SandboxErrorTest, MakeFailureFillsBothIds) {
    auto failure = makeFailure(SandboxErrorKind::ExecutionTimeout, "process-x-1",
                               "too slow");
    EXPECT_EQ(failure.error().isolationId, "process-x-1");
    EXPECT_EQ(failure.error().error.isolationId, "process-x-1");
    EXPECT_EQ(failure.error().reason, "too slow");
    EXPECT_EQ(failure.error().error.message, "too slow");
    EXPECT_FALSE(failure.error().resourceUsage.has_value());
}

// =============================================================================
// Usage Snapshot Tests
// =============================================================================

TEST(ResourceUsageSnapshotTest, HumanReadableUnmeasured) {
    ResourceUsageSnapshot usage;
    usage.wallTimeMs = 12;
    auto text = usage.toHumanReadable();

    EXPECT_NE(text.find("Memory: n/a"), std::string::npos);
    EXPECT_NE(text.find("CPU Time: n/a"), std::string::npos);
    EXPECT_NE(text.find("Wall Time: 12ms"), std::string::npos);
    EXPECT_NE(text.find("Threads: n/a"), std::string::npos);
    EXPECT_NE(text.find("Files Accessed: n/a"), std::string::npos);
}

TEST(ResourceUsageSnapshotTest, HumanReadableMeasured) {
    ResourceUsageSnapshot usage{.memoryUsedBytes = 2 * 1024 * 1024,
                                .cpuTimeMs = 40,
                                .wallTimeMs = 55,
                                .threadsCreated = 1,
                                .filesAccessed = std::vector<std::string>{"a", "b"},
                                .networkConnections = std::vector<std::string>{}};
    auto text = usage.toHumanReadable();

    EXPECT_NE(text.find("Memory: 2.00 MB"), std::string::npos);
    EXPECT_NE(text.find("CPU Time: 40ms"), std::string::npos);
    EXPECT_NE(text.find("Threads: 1"), std::string::npos);
    EXPECT_NE(text.find("Files Accessed: 2 (a, b)"), std::string::npos);
    EXPECT_NE(text.find("Network Connections: none"), std::string::npos);
}

TEST(ResourceUsageSnapshotTest, JsonKeepsNullForUnmeasured) {
    ResourceUsageSnapshot usage;
    usage.wallTimeMs = 3;
    nlohmann::json j = usage;
    EXPECT_TRUE(j["memoryUsedBytes"].is_null());
    EXPECT_TRUE(j["cpuTimeMs"].is_null());
    EXPECT_EQ(j["wallTimeMs"], 3);
}

// =============================================================================
// Context Tests
// =============================================================================

TEST(ExecutionContextTest, WallTimeUsesLimitThenTimeoutThenFallback) {
    ExecutionContext context;
    EXPECT_EQ(effectiveWallTime(context, 7000ms), 7000ms);

    context.timeout = 3000ms;
    EXPECT_EQ(effectiveWallTime(context, 7000ms), 3000ms);

    context.resourceLimits = ResourceLimits{.maxWallTimeMs = 1500};
    EXPECT_EQ(effectiveWallTime(context, 7000ms), 1500ms);
}

TEST(ExecutionContextTest, JsonUnknownLevelIsAbsent) {
    auto j = nlohmann::json::parse(R"({
        "workingDirectory": "/work",
        "environmentVariables": {"PIPELINE_ID": "7"},
        "timeoutMs": 250,
        "isolationLevel": "hypervisor"
    })");
    auto context = j.get<ExecutionContext>();

    EXPECT_EQ(context.workingDirectory.string(), "/work");
    EXPECT_EQ(context.environmentVariables.at("PIPELINE_ID"), "7");
    ASSERT_TRUE(context.timeout.has_value());
    EXPECT_EQ(*context.timeout, 250ms);
    EXPECT_FALSE(context.policy.isolationLevel.has_value());
    EXPECT_FALSE(context.resourceLimits.has_value());
}

TEST(ExecutionContextTest, JsonRoundTripKeepsLimits) {
    ExecutionContext context;
    context.resourceLimits = ResourceLimits{.maxMemoryMb = 128, .maxThreads = 2};
    context.policy.isolationLevel = IsolationLevel::Process;

    auto restored = nlohmann::json(context).get<ExecutionContext>();
    ASSERT_TRUE(restored.resourceLimits.has_value());
    EXPECT_EQ(restored.resourceLimits->maxMemoryMb, 128);
    EXPECT_EQ(restored.resourceLimits->maxThreads, 2);
    EXPECT_FALSE(restored.resourceLimits->maxCpuTimeMs.has_value());
    EXPECT_EQ(restored.policy.isolationLevel, IsolationLevel::Process);
}

// =============================================================================
// Conversion Tests
// =============================================================================

TEST(ConvertResultTest, TypedValue) {
    RawExecutionResult raw = ExecutionSuccess<ScriptValue>{
        .result = 4, .isolationId = "isolate-a-1", .executionTime = 5ms};
    auto typed = convertResult<int>(std::move(raw));
    ASSERT_TRUE(typed.has_value());
    EXPECT_EQ(typed->result, 4);
    EXPECT_EQ(typed->isolationId, "isolate-a-1");
}

TEST(ConvertResultTest, StringAcceptsAnyValue) {
    RawExecutionResult raw = ExecutionSuccess<ScriptValue>{
        .result = nlohmann::json{{"a", 1}}, .isolationId = "id"};
    auto typed = convertResult<std::string>(std::move(raw));
    ASSERT_TRUE(typed.has_value());
    EXPECT_EQ(typed->result, R"({"a":1})");
}

TEST(ConvertResultTest, TypeMismatchIsExecutionFailed) {
    RawExecutionResult raw = ExecutionSuccess<ScriptValue>{
        .result = "text", .isolationId = "id"};
    auto typed = convertResult<int>(std::move(raw));
    ASSERT_FALSE(typed.has_value());
    EXPECT_EQ(typed.error().error.kind, SandboxErrorKind::ExecutionFailed);
    EXPECT_EQ(typed.error().isolationId, "id");
}

TEST(ConvertResultTest, FailurePassesThrough) {
    RawExecutionResult raw = makeFailure(SandboxErrorKind::Terminated, "id", "stop");
    auto typed = convertResult<int>(std::move(raw));
    ASSERT_FALSE(typed.has_value());
    EXPECT_EQ(typed.error().error.kind, SandboxErrorKind::Terminated);
}

// =============================================================================
// Policy Exception Tests
// =============================================================================

TEST(SecurityPolicyValidationTest, ThrowIfInvalid) {
    SecurityPolicyValidation valid;
    EXPECT_NO_THROW(valid.throwIfInvalid());

    SecurityPolicyValidation invalid{.isValid = false, .issues = {"a", "b"}};
    try {
        invalid.throwIfInvalid();
        FAIL() << "expected SecurityPolicyException";
    } catch (const SecurityPolicyException& e) {
        EXPECT_STREQ(e.what(), "Security policy validation failed: a; b");
        EXPECT_EQ(e.issues().size(), 2u);
    }
}
