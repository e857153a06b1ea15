/**
 * @file identity_index.hpp
 * @brief Incrementally built lookup tables between node, VM and scale-set identities.
 */

#pragma once

#include "core/types.hpp"

#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace flex_resolver {

/**
 * @brief String-to-string map safe for concurrent readers and writers.
 *
 * Every operation is individually atomic; there is no multi-key transaction.
 */
class ConcurrentStringMap {
public:
    [[nodiscard]] std::optional<std::string> load(const std::string& key) const;
    void store(const std::string& key, std::string value);
    void erase(const std::string& key);
    void clear();

    /// Visit entries under a shared lock. Stop early by returning false.
    void for_each(const std::function<bool(const std::string&, const std::string&)>& fn) const;

    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool contains(const std::string& key) const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::string> entries_;
};

/**
 * @brief The three identity tables maintained by the resolver.
 *
 * Populated opportunistically from VM records; there is no TTL, entries go
 * away only when a node deletion is reported. The tables are independent:
 * a reader may observe one populated and another not yet.
 */
class IdentityIndex {
public:
    ConcurrentStringMap& vm_to_node() noexcept { return vm_to_node_; }
    ConcurrentStringMap& node_to_vm() noexcept { return node_to_vm_; }
    ConcurrentStringMap& node_to_scale_set() noexcept { return node_to_scale_set_; }

    const ConcurrentStringMap& vm_to_node() const noexcept { return vm_to_node_; }
    const ConcurrentStringMap& node_to_vm() const noexcept { return node_to_vm_; }
    const ConcurrentStringMap& node_to_scale_set() const noexcept { return node_to_scale_set_; }

    /**
     * @brief Record the identities carried by a VM.
     *
     * Stores VM name → node name and node name → VM name (node name lower-cased)
     * and, when the VM belongs to a scale set, node name → scale-set ID.
     * Returns false without touching the tables when the VM has no computer name.
     */
    bool cache_vm_record(const VMRecord& vm);

    /**
     * @brief Forget everything known about `node_name` (already lower-cased).
     *
     * The VM name → node name entry is found through node name → VM name
     * before that entry is erased.
     */
    void forget_node(const NodeName& node_name);

    void clear();

private:
    ConcurrentStringMap vm_to_node_;
    ConcurrentStringMap node_to_vm_;
    ConcurrentStringMap node_to_scale_set_;
};

}  // namespace flex_resolver
