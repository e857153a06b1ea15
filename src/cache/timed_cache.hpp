/**
 * @file timed_cache.hpp
 * @brief TTL cache with an injected loader and per-key single-flight refresh.
 *
 * Values are held as std::shared_ptr<const T>: a refresh replaces the pointer
 * and never mutates a published value, so readers holding an older value
 * keep a consistent view of it.
 */

#pragma once

#include "cache/keyed_mutex.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace flex_resolver {

/// TTL applied when a cache is constructed with a zero TTL.
inline constexpr std::chrono::seconds kDefaultCacheTtl{600};

/**
 * @brief Produces the value cached under a key.
 *
 * Called with the cache key lock held; implementations need no locking of
 * their own for the same key.
 */
template <typename T>
class ICacheLoader {
public:
    virtual ~ICacheLoader() = default;

    virtual Result<std::shared_ptr<const T>> load(const std::string& key) = 0;
};

template <typename T>
class TimedCache {
public:
    using ValuePtr = std::shared_ptr<const T>;

    TimedCache(std::chrono::seconds ttl,
               std::shared_ptr<ICacheLoader<T>> loader,
               bool disabled = false,
               NowFn now = [] { return std::chrono::steady_clock::now(); })
        : ttl_(ttl.count() == 0 ? kDefaultCacheTtl : ttl)
        , loader_(std::move(loader))
        , disabled_(disabled)
        , now_(std::move(now)) {}

    TimedCache(const TimedCache&) = delete;
    TimedCache& operator=(const TimedCache&) = delete;

    /**
     * @brief Return the value for `key`, loading it when needed.
     *
     * Default serves an entry younger than the TTL; ForceRefresh always
     * reloads. A failed load leaves the stored entry untouched.
     */
    Result<ValuePtr> get(const std::string& key, CacheReadType crt);

    /// Drop the entry; the next get() reloads.
    void erase(const std::string& key);

    /// Seed or replace the entry with a fresh timestamp.
    void set(const std::string& key, ValuePtr value);

    [[nodiscard]] std::chrono::seconds ttl() const noexcept { return ttl_; }
    [[nodiscard]] bool disabled() const noexcept { return disabled_; }
    [[nodiscard]] uint64_t load_count() const noexcept { return load_count_.load(); }

private:
    struct Entry {
        ValuePtr data;
        SteadyTime created_at;
    };

    /// Fresh entry for `key`, or nullptr.
    ValuePtr fresh_entry(const std::string& key) const;
    Result<ValuePtr> invoke_loader(const std::string& key);

    std::chrono::seconds ttl_;
    std::shared_ptr<ICacheLoader<T>> loader_;
    bool disabled_;
    NowFn now_;

    KeyedMutex key_locks_;
    mutable std::mutex entries_mutex_;
    std::unordered_map<std::string, Entry> entries_;
    std::atomic<uint64_t> load_count_{0};
};

// ── Template implementations ─────────────────

template <typename T>
Result<typename TimedCache<T>::ValuePtr> TimedCache<T>::get(const std::string& key,
                                                            CacheReadType crt) {
    if (disabled_) {
        return invoke_loader(key);
    }

    // Waiters for an in-flight load block here and then find the fresh entry.
    ScopedKeyLock key_lock(key_locks_, key);

    if (crt == CacheReadType::Default) {
        if (auto cached = fresh_entry(key)) {
            return cached;
        }
    }

    auto loaded = invoke_loader(key);
    if (!loaded) {
        return loaded.error();
    }

    {
        std::lock_guard lock(entries_mutex_);
        entries_[key] = Entry{*loaded, now_()};
    }
    return loaded;
}

template <typename T>
void TimedCache<T>::erase(const std::string& key) {
    std::lock_guard lock(entries_mutex_);
    entries_.erase(key);
}

template <typename T>
void TimedCache<T>::set(const std::string& key, ValuePtr value) {
    std::lock_guard lock(entries_mutex_);
    entries_[key] = Entry{std::move(value), now_()};
}

template <typename T>
typename TimedCache<T>::ValuePtr TimedCache<T>::fresh_entry(const std::string& key) const {
    std::lock_guard lock(entries_mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end() || !it->second.data) return nullptr;
    if (now_() - it->second.created_at >= ttl_) return nullptr;
    return it->second.data;
}

template <typename T>
Result<typename TimedCache<T>::ValuePtr> TimedCache<T>::invoke_loader(const std::string& key) {
    load_count_.fetch_add(1, std::memory_order_relaxed);
    auto loaded = loader_->load(key);
    if (loaded && !*loaded) {
        return Error::upstream("Cache loader returned no value for key " + key);
    }
    return loaded;
}

}  // namespace flex_resolver
