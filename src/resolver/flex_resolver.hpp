/**
 * @file flex_resolver.hpp
 * @brief Resolves node names to VMs and flexible scale sets.
 *
 * Lookups go through three layers, fastest first:
 *   1. IdentityIndex:  node/VM/scale-set identities seen on earlier lookups
 *   2. InventoryCache: TTL-bounded snapshot of all flexible scale sets
 *   3. IComputeClient: the rate-limited inventory API
 *
 * Node-level lookups that come back NotFound are retried exactly once with
 * CacheReadType::ForceRefresh, which bounds the false negatives caused by a
 * stale cache to one extra round trip. Other errors are returned as-is.
 *
 * All public members are safe to call from many threads.
 */

#pragma once

#include "cache/identity_index.hpp"
#include "cache/keyed_mutex.hpp"
#include "cloud/compute_client.hpp"
#include "cloud/inventory_loader.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace flex_resolver {

/// Serializes the composite index-check/fetch/index-populate of node lookups.
inline const std::string kGetNodeScaleSetIdLockKey = "get_node_scale_set_id";

struct ResolverOptions {
    std::string resource_group;                 ///< Group for computer-name lookups
    std::chrono::seconds inventory_cache_ttl{kDefaultVmssFlexCacheTtlSeconds};
    bool disable_api_call_cache = false;

    static ResolverOptions from_config(const Config& config);
};

class FlexScaleSetResolver {
public:
    FlexScaleSetResolver(std::shared_ptr<IComputeClient> client,
                         ResolverOptions options,
                         Logger& logger,
                         NowFn now = [] { return std::chrono::steady_clock::now(); });

    FlexScaleSetResolver(const FlexScaleSetResolver&) = delete;
    FlexScaleSetResolver& operator=(const FlexScaleSetResolver&) = delete;

    // ── Node and VM identities ───────────────

    /// ID of the scale set owning the VM behind `node_name`.
    Result<ResourceId> scale_set_id_for_node(const NodeName& node_name);

    /// Lower-cased node (computer) name of `vm_name`.
    Result<NodeName> node_name_for_vm(const VmName& vm_name);

    /// VM record backing `node_name`.
    Result<VMRecord> vm_for_node(const NodeName& node_name, CacheReadType crt);

    /// VM record by VM name; indexes its identities as a side effect.
    Result<VMRecord> vm_by_name(const VmName& vm_name, CacheReadType crt);

    // ── Scale sets ───────────────────────────

    /// Scale set by full ID, with one forced inventory refresh on a miss.
    Result<ScaleSetRecord> scale_set_by_id(const ResourceId& id, CacheReadType crt);

    /// Scale set owning the VM behind `node_name`.
    Result<ScaleSetRecord> scale_set_for_node(const NodeName& node_name, CacheReadType crt);

    /**
     * @brief Scale set whose ID ends in `name` (case-insensitive).
     *
     * Reads the cached inventory without forcing a refresh. When several
     * resource groups hold a scale set of that name the first one in
     * snapshot iteration order wins.
     */
    Result<ScaleSetRecord> scale_set_by_name(const std::string& name);
    Result<ResourceId> scale_set_id_by_name(const std::string& name);

    /// Current inventory snapshot.
    Result<std::shared_ptr<const InventorySnapshot>> inventory(CacheReadType crt);

    // ── Invalidation ─────────────────────────

    /// Drop every identity cached for a deleted node. No-op with caching disabled.
    Result<void> invalidate_node(const NodeName& node_name);

    // ── Introspection ────────────────────────

    [[nodiscard]] const IdentityIndex& index() const noexcept { return index_; }
    [[nodiscard]] const InventoryCache& inventory_cache() const noexcept { return inventory_cache_; }
    [[nodiscard]] const ResolverOptions& options() const noexcept { return options_; }

private:
    Result<ResourceId> fetch_scale_set_id(const NodeName& node_name, CacheReadType crt);
    Result<NodeName> fetch_node_name(const VmName& vm_name, CacheReadType crt);
    Result<VmName> fetch_vm_name(const NodeName& node_name);

    [[nodiscard]] bool caching_enabled() const noexcept { return !options_.disable_api_call_cache; }

    std::shared_ptr<IComputeClient> client_;
    ResolverOptions options_;
    Logger& logger_;

    KeyedMutex lock_map_;
    IdentityIndex index_;
    InventoryCache inventory_cache_;
};

}  // namespace flex_resolver
