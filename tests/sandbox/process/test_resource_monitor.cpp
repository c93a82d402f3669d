/*
 * test_resource_monitor.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>
#include "sandbox/process/resource_monitor.hpp"

#include <unistd.h>

using namespace warden::sandbox::process;

class ResourceMonitorTest : public ::testing::Test {
protected:
    int self_ = static_cast<int>(::getpid());
};

TEST_F(ResourceMonitorTest, OwnProcess) {
    auto memory = ResourceMonitor::getMemoryUsage(self_);
    ASSERT_TRUE(memory.has_value());
    EXPECT_GT(*memory, 0u);

    auto peak = ResourceMonitor::getPeakMemoryUsage(self_);
    ASSERT_TRUE(peak.has_value());
    EXPECT_GE(*peak, 0u);

    auto cpu = ResourceMonitor::getCpuTimeMs(self_);
    ASSERT_TRUE(cpu.has_value());
    EXPECT_GE(*cpu, 0);

    auto threads = ResourceMonitor::getThreadCount(self_);
    ASSERT_TRUE(threads.has_value());
    EXPECT_GE(*threads, 1);
}

TEST_F(ResourceMonitorTest, InvalidProcessIsUnmeasured) {
    EXPECT_FALSE(ResourceMonitor::getMemoryUsage(-1).has_value());
    EXPECT_FALSE(ResourceMonitor::getPeakMemoryUsage(0).has_value());
    EXPECT_FALSE(ResourceMonitor::getCpuTimeMs(-1).has_value());
    EXPECT_FALSE(ResourceMonitor::getThreadCount(-1).has_value());

    auto sample = ResourceMonitor::sample(-1);
    EXPECT_FALSE(sample.residentBytes.has_value());
    EXPECT_FALSE(sample.cpuTimeMs.has_value());
}

TEST_F(ResourceMonitorTest, MemoryLimit) {
    EXPECT_FALSE(ResourceMonitor::isMemoryLimitExceeded(self_, 0));
    EXPECT_FALSE(ResourceMonitor::isMemoryLimitExceeded(self_, 1024 * 1024));
    EXPECT_TRUE(ResourceMonitor::isMemoryLimitExceeded(self_, 1));
}
