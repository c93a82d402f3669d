/*
 * test_execution_registry.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>
#include "sandbox/execution_registry.hpp"

#include <memory>
#include <thread>
#include <vector>

using namespace warden::sandbox;

class ExecutionRegistryTest : public ::testing::Test {
protected:
    ExecutionRegistry<std::shared_ptr<int>> registry_;
};

TEST_F(ExecutionRegistryTest, InsertFindErase) {
    EXPECT_TRUE(registry_.empty());
    EXPECT_TRUE(registry_.insert("a", std::make_shared<int>(1)));
    EXPECT_FALSE(registry_.insert("a", std::make_shared<int>(2)));

    auto found = registry_.find("a");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(**found, 1);
    EXPECT_TRUE(registry_.contains("a"));
    EXPECT_EQ(registry_.size(), 1u);

    EXPECT_TRUE(registry_.erase("a"));
    EXPECT_FALSE(registry_.erase("a"));
    EXPECT_FALSE(registry_.find("a").has_value());
}

TEST_F(ExecutionRegistryTest, SnapshotIsACopy) {
    registry_.insert("a", std::make_shared<int>(1));
    registry_.insert("b", std::make_shared<int>(2));

    auto snapshot = registry_.snapshot();
    registry_.erase("a");

    EXPECT_EQ(snapshot.size(), 2u);
    EXPECT_EQ(registry_.size(), 1u);
}

TEST_F(ExecutionRegistryTest, ConcurrentInsertAndErase) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this, t] {
            for (int i = 0; i < 200; ++i) {
                auto key = std::to_string(t) + "-" + std::to_string(i);
                registry_.insert(key, std::make_shared<int>(i));
                EXPECT_TRUE(registry_.contains(key));
                if (i % 2 == 0) {
                    registry_.erase(key);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(registry_.size(), 400u);
}
