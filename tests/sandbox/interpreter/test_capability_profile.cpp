/*
 * test_capability_profile.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>
#include "sandbox/interpreter/capability_profile.hpp"

using namespace warden::sandbox;
using namespace warden::sandbox::interpreter;
using namespace std::chrono_literals;

class CapabilityProfileTest : public ::testing::Test {
protected:
    CapabilityProfile build(IsolationTier tier) {
        return CapabilityProfile::build(tier, request_, config_);
    }

    IsolationRequest request_;
    SandboxConfig config_;
};

TEST_F(CapabilityProfileTest, TierForLevel) {
    EXPECT_EQ(tierForLevel(std::nullopt), IsolationTier::Trusted);
    EXPECT_EQ(tierForLevel(IsolationLevel::None), IsolationTier::Trusted);
    EXPECT_EQ(tierForLevel(IsolationLevel::Thread), IsolationTier::Constrained);
    EXPECT_EQ(tierForLevel(IsolationLevel::Isolate), IsolationTier::Isolated);
    EXPECT_EQ(tierForLevel(IsolationLevel::Process), IsolationTier::Isolated);
}

TEST_F(CapabilityProfileTest, TrustedAllowsEverything) {
    auto profile = build(IsolationTier::Trusted);
    EXPECT_TRUE(profile.exposeHost);
    EXPECT_TRUE(profile.fullHostAccess);
    EXPECT_FALSE(profile.restrictImports);
    EXPECT_TRUE(profile.allowFilesystem);
    EXPECT_TRUE(profile.allowDynamicCode);
    EXPECT_FALSE(profile.scanForEscapes);
    EXPECT_TRUE(profile.isModuleAllowed("subprocess"));
    EXPECT_FALSE(profile.statementBudget.has_value());
}

TEST_F(CapabilityProfileTest, ConstrainedUsesAllowList) {
    auto profile = build(IsolationTier::Constrained);
    EXPECT_TRUE(profile.exposeHost);
    EXPECT_FALSE(profile.fullHostAccess);
    EXPECT_TRUE(profile.allowFilesystem);
    EXPECT_FALSE(profile.allowThreads);
    EXPECT_FALSE(profile.allowSystem);
    EXPECT_TRUE(profile.scanForEscapes);

    EXPECT_TRUE(profile.isModuleAllowed("os"));
    EXPECT_TRUE(profile.isModuleAllowed("os.path"));
    EXPECT_TRUE(profile.isModuleAllowed("json"));
    EXPECT_FALSE(profile.isModuleAllowed("subprocess"));
    EXPECT_FALSE(profile.isModuleAllowed("threading"));
}

TEST_F(CapabilityProfileTest, ConstrainedThreadsNeedMoreThanOne) {
    request_.context.resourceLimits = ResourceLimits{.maxThreads = 1};
    EXPECT_FALSE(build(IsolationTier::Constrained).allowThreads);

    request_.context.resourceLimits = ResourceLimits{.maxThreads = 4};
    auto profile = build(IsolationTier::Constrained);
    EXPECT_TRUE(profile.allowThreads);
    EXPECT_TRUE(profile.isModuleAllowed("threading"));
    EXPECT_TRUE(profile.isModuleAllowed("concurrent.futures"));
}

TEST_F(CapabilityProfileTest, IsolatedHasNoHostAccess) {
    auto profile = build(IsolationTier::Isolated);
    EXPECT_FALSE(profile.exposeHost);
    EXPECT_FALSE(profile.allowFilesystem);
    EXPECT_FALSE(profile.allowNetwork);
    EXPECT_FALSE(profile.allowThreads);

    EXPECT_TRUE(profile.isModuleAllowed("math"));
    EXPECT_FALSE(profile.isModuleAllowed("os"));
    EXPECT_FALSE(profile.isModuleAllowed("time"));
    EXPECT_FALSE(profile.isModuleAllowed("pathlib"));
}

TEST_F(CapabilityProfileTest, ExtraAllowedModules) {
    request_.compileOptions.extraAllowedModules = {"xml"};
    auto profile = build(IsolationTier::Isolated);
    EXPECT_TRUE(profile.isModuleAllowed("xml.etree"));
}

TEST_F(CapabilityProfileTest, StatementBudget) {
    request_.context.resourceLimits = ResourceLimits{.maxCpuTimeMs = 20};
    EXPECT_EQ(build(IsolationTier::Isolated).statementBudget, 20000u);

    request_.context.resourceLimits = ResourceLimits{.maxMemoryMb = 64};
    EXPECT_EQ(build(IsolationTier::Isolated).statementBudget, 100000u);

    request_.evalOptions.statementBudget = 7;
    EXPECT_EQ(build(IsolationTier::Isolated).statementBudget, 7u);
}

TEST_F(CapabilityProfileTest, WallTime) {
    EXPECT_EQ(build(IsolationTier::Trusted).wallTime, config_.defaultWallTime);

    request_.context.timeout = 1234ms;
    EXPECT_EQ(build(IsolationTier::Trusted).wallTime, 1234ms);
}

TEST_F(CapabilityProfileTest, ClassifyModule) {
    EXPECT_EQ(classifyModule("socket"), SandboxErrorKind::UnauthorizedNetworkAccess);
    EXPECT_EQ(classifyModule("urllib.request"),
              SandboxErrorKind::UnauthorizedNetworkAccess);
    EXPECT_EQ(classifyModule("pathlib"), SandboxErrorKind::UnauthorizedFileAccess);
    EXPECT_EQ(classifyModule("os"), SandboxErrorKind::UnauthorizedSystemAccess);
    EXPECT_EQ(classifyModule("subprocess"), SandboxErrorKind::UnauthorizedSystemAccess);
}
