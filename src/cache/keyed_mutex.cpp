/**
 * @file keyed_mutex.cpp
 * @brief KeyedMutex implementation.
 */

#include "cache/keyed_mutex.hpp"

namespace flex_resolver {

std::mutex& KeyedMutex::entry(const std::string& key) {
    std::lock_guard lock(registry_mutex_);
    auto& slot = entries_[key];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    // Entries are never erased, so the reference stays valid after unlocking.
    return *slot;
}

void KeyedMutex::lock(const std::string& key) {
    entry(key).lock();
}

void KeyedMutex::unlock(const std::string& key) {
    entry(key).unlock();
}

size_t KeyedMutex::size() const {
    std::lock_guard lock(registry_mutex_);
    return entries_.size();
}

}  // namespace flex_resolver
