/**
 * @file identity_index.cpp
 * @brief ConcurrentStringMap and IdentityIndex implementation.
 */

#include "cache/identity_index.hpp"
#include "core/strings.hpp"

#include <mutex>

namespace flex_resolver {

// ── ConcurrentStringMap ──────────────────────

std::optional<std::string> ConcurrentStringMap::load(const std::string& key) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

void ConcurrentStringMap::store(const std::string& key, std::string value) {
    std::unique_lock lock(mutex_);
    entries_[key] = std::move(value);
}

void ConcurrentStringMap::erase(const std::string& key) {
    std::unique_lock lock(mutex_);
    entries_.erase(key);
}

void ConcurrentStringMap::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
}

void ConcurrentStringMap::for_each(
    const std::function<bool(const std::string&, const std::string&)>& fn) const {
    std::shared_lock lock(mutex_);
    for (const auto& [key, value] : entries_) {
        if (!fn(key, value)) break;
    }
}

size_t ConcurrentStringMap::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

bool ConcurrentStringMap::contains(const std::string& key) const {
    std::shared_lock lock(mutex_);
    return entries_.count(key) > 0;
}

// ── IdentityIndex ────────────────────────────

bool IdentityIndex::cache_vm_record(const VMRecord& vm) {
    if (!vm.computer_name || vm.computer_name->empty()) {
        return false;
    }

    auto node_name = to_lower(*vm.computer_name);
    vm_to_node_.store(vm.name, node_name);
    node_to_vm_.store(node_name, vm.name);
    if (vm.scale_set_id && !vm.scale_set_id->empty()) {
        node_to_scale_set_.store(node_name, *vm.scale_set_id);
    }
    return true;
}

void IdentityIndex::forget_node(const NodeName& node_name) {
    if (auto vm_name = node_to_vm_.load(node_name)) {
        vm_to_node_.erase(*vm_name);
    }
    node_to_scale_set_.erase(node_name);
    node_to_vm_.erase(node_name);
}

void IdentityIndex::clear() {
    vm_to_node_.clear();
    node_to_vm_.clear();
    node_to_scale_set_.clear();
}

}  // namespace flex_resolver
