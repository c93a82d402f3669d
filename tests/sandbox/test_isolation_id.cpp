/*
 * test_isolation_id.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>
#include "sandbox/isolation_id.hpp"

#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace warden::sandbox;

TEST(IsolationIdTest, SanitizeScriptName) {
    EXPECT_EQ(sanitizeScriptName("build.py"), "build-py");
    EXPECT_EQ(sanitizeScriptName("stage 1/deploy"), "stage-1-deploy");
    EXPECT_EQ(sanitizeScriptName("plain"), "plain");
    EXPECT_EQ(sanitizeScriptName(""), "script");
}

TEST(IsolationIdTest, Format) {
    IsolationIdGenerator generator("process");
    auto id = generator.next("my script");

    EXPECT_TRUE(id.starts_with("process-my-script-")) << id;
    auto stamp = id.substr(std::string("process-my-script-").size());
    EXPECT_FALSE(stamp.empty());
    EXPECT_EQ(stamp.find_first_not_of("0123456789"), std::string::npos);
}

TEST(IsolationIdTest, NeverRepeats) {
    IsolationIdGenerator generator("isolate");
    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i) {
        ids.insert(generator.next("same"));
    }
    EXPECT_EQ(ids.size(), 1000u);
}

TEST(IsolationIdTest, ConcurrentCallersGetDistinctIds) {
    IsolationIdGenerator generator("isolate");
    std::mutex mutex;
    std::set<std::string> ids;

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 250; ++i) {
                auto id = generator.next("job");
                std::lock_guard lock(mutex);
                ids.insert(std::move(id));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(ids.size(), 1000u);
}
