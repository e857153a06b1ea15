/**
 * @file keyed_mutex.hpp
 * @brief Registry of mutexes addressed by string key.
 *
 * Critical sections that lock the same key are mutually exclusive; different
 * keys never contend beyond the short registry lookup. A key's mutex is
 * created on first use and lives as long as the registry, so the key space
 * must stay bounded (operation names, node or VM names).
 */

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace flex_resolver {

class KeyedMutex {
public:
    KeyedMutex() = default;

    KeyedMutex(const KeyedMutex&) = delete;
    KeyedMutex& operator=(const KeyedMutex&) = delete;

    /// Block until the mutex for `key` is held by the caller.
    void lock(const std::string& key);

    /// Release a key previously locked by this thread.
    void unlock(const std::string& key);

    /// Number of keys ever locked.
    [[nodiscard]] size_t size() const;

private:
    std::mutex& entry(const std::string& key);

    mutable std::mutex registry_mutex_;
    std::unordered_map<std::string, std::unique_ptr<std::mutex>> entries_;
};

/**
 * @brief RAII holder of one KeyedMutex entry.
 */
class ScopedKeyLock {
public:
    ScopedKeyLock(KeyedMutex& registry, std::string key)
        : registry_(registry), key_(std::move(key)) {
        registry_.lock(key_);
    }

    ~ScopedKeyLock() { registry_.unlock(key_); }

    ScopedKeyLock(const ScopedKeyLock&) = delete;
    ScopedKeyLock& operator=(const ScopedKeyLock&) = delete;

    [[nodiscard]] const std::string& key() const noexcept { return key_; }

private:
    KeyedMutex& registry_;
    std::string key_;
};

}  // namespace flex_resolver
