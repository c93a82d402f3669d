/*
 * execution_registry.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef WARDEN_SANDBOX_EXECUTION_REGISTRY_HPP
#define WARDEN_SANDBOX_EXECUTION_REGISTRY_HPP

#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace warden::sandbox {

/**
 * @brief Concurrent table of in-flight executions keyed by id
 *
 * Lookups take a shared lock, insert and erase an exclusive one. Values are
 * returned by copy, so store shared pointers for live state.
 */
template <typename Value>
class ExecutionRegistry {
public:
    /**
     * @brief Insert a new entry
     * @return false if the key is already tracked
     */
    bool insert(const std::string& key, Value value) {
        std::unique_lock lock(mutex_);
        return entries_.emplace(key, std::move(value)).second;
    }

    [[nodiscard]] std::optional<Value> find(const std::string& key) const {
        std::shared_lock lock(mutex_);
        if (auto it = entries_.find(key); it != entries_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        std::shared_lock lock(mutex_);
        return entries_.contains(key);
    }

    bool erase(const std::string& key) {
        std::unique_lock lock(mutex_);
        return entries_.erase(key) > 0;
    }

    [[nodiscard]] std::size_t size() const {
        std::shared_lock lock(mutex_);
        return entries_.size();
    }

    [[nodiscard]] bool empty() const {
        std::shared_lock lock(mutex_);
        return entries_.empty();
    }

    /**
     * @brief Point-in-time copy of every entry
     */
    [[nodiscard]] std::vector<std::pair<std::string, Value>> snapshot() const {
        std::shared_lock lock(mutex_);
        return {entries_.begin(), entries_.end()};
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Value> entries_;
};

}  // namespace warden::sandbox

#endif  // WARDEN_SANDBOX_EXECUTION_REGISTRY_HPP
