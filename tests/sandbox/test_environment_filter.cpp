/*
 * test_environment_filter.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>
#include "sandbox/environment_filter.hpp"

using namespace warden::sandbox;

class EnvironmentFilterTest : public ::testing::Test {
protected:
    EnvironmentFilter filter_{EnvironmentPolicy{}};
};

TEST_F(EnvironmentFilterTest, AllowedPrefixes) {
    EXPECT_TRUE(filter_.isAllowed("PIPELINE_ID"));
    EXPECT_TRUE(filter_.isAllowed("USER_NAME"));
    EXPECT_TRUE(filter_.isAllowed("CUSTOM_FLAG"));
}

TEST_F(EnvironmentFilterTest, CaseInsensitive) {
    EXPECT_TRUE(filter_.isAllowed("pipeline_stage"));
    EXPECT_FALSE(filter_.isAllowed("ld_preload"));
}

TEST_F(EnvironmentFilterTest, RejectsUnlistedAndDenied) {
    EXPECT_FALSE(filter_.isAllowed("HOME"));
    EXPECT_FALSE(filter_.isAllowed("PATH"));
    EXPECT_FALSE(filter_.isAllowed("PYTHONPATH"));
    EXPECT_FALSE(filter_.isAllowed("SYSTEM_SECRET"));
}

TEST_F(EnvironmentFilterTest, RejectsMalformedNames) {
    EXPECT_FALSE(filter_.isAllowed(""));
    EXPECT_FALSE(filter_.isAllowed("PIPELINE_A=B"));
}

TEST_F(EnvironmentFilterTest, DenyWinsOverAllow) {
    EnvironmentPolicy policy;
    policy.allowedPrefixes = {"LD_"};
    EnvironmentFilter filter(policy);
    EXPECT_TRUE(filter.isAllowed("LD_BIND_NOW"));
    EXPECT_FALSE(filter.isAllowed("LD_PRELOAD"));
}

TEST_F(EnvironmentFilterTest, ApplyKeepsOnlyPermitted) {
    EnvironmentFilter::Environment input{{"PIPELINE_ID", "42"},
                                         {"USER_NAME", "ci"},
                                         {"PATH", "/bin"},
                                         {"SECRET", "x"}};
    auto filtered = filter_.apply(input);

    EXPECT_EQ(filtered.size(), 2u);
    EXPECT_EQ(filtered.at("PIPELINE_ID"), "42");
    EXPECT_EQ(filtered.at("USER_NAME"), "ci");
    EXPECT_FALSE(filtered.contains("PATH"));
}

TEST_F(EnvironmentFilterTest, PolicyIsNormalized) {
    EnvironmentPolicy policy;
    policy.allowedPrefixes = {"job_"};
    EnvironmentFilter filter(policy);
    EXPECT_EQ(filter.policy().allowedPrefixes.front(), "JOB_");
    EXPECT_TRUE(filter.isAllowed("JOB_ID"));
}
