/**
 * @file flex_resolver.cpp
 * @brief FlexScaleSetResolver implementation.
 */

#include "resolver/flex_resolver.hpp"
#include "core/strings.hpp"

namespace flex_resolver {

namespace {

/// Run `attempt` with Default reads; on NotFound run it once more with ForceRefresh.
template <typename T, typename Attempt>
Result<T> retry_on_not_found(Logger& logger, const std::string& subject, Attempt&& attempt) {
    auto result = attempt(CacheReadType::Default);
    if (result.is_not_found()) {
        logger.debug("Could not find " + subject
                     + " in the existing cache, forcing a refresh to check again");
        return attempt(CacheReadType::ForceRefresh);
    }
    return result;
}

const ScaleSetRecord* find_by_short_name(const InventorySnapshot& snapshot,
                                         const std::string& name) {
    for (const auto& [id, scale_set] : snapshot) {
        auto short_name = last_segment(id);
        if (!short_name) continue;
        if (iequals(*short_name, name)) return &scale_set;
    }
    return nullptr;
}

}  // namespace

ResolverOptions ResolverOptions::from_config(const Config& config) {
    ResolverOptions options;
    options.resource_group = config.cloud.resource_group;
    options.inventory_cache_ttl = std::chrono::seconds(config.cache.vmss_flex_cache_ttl_seconds);
    options.disable_api_call_cache = config.cache.disable_api_call_cache;
    return options;
}

FlexScaleSetResolver::FlexScaleSetResolver(std::shared_ptr<IComputeClient> client,
                                           ResolverOptions options,
                                           Logger& logger,
                                           NowFn now)
    : client_(std::move(client))
    , options_(std::move(options))
    , logger_(logger)
    , inventory_cache_(options_.inventory_cache_ttl,
                       std::make_shared<ScaleSetInventoryLoader>(client_, logger_),
                       options_.disable_api_call_cache,
                       std::move(now)) {}

// ── Node and VM identities ───────────────────

Result<ResourceId> FlexScaleSetResolver::scale_set_id_for_node(const NodeName& node_name) {
    auto node = to_lower(node_name);
    ScopedKeyLock lock(lock_map_, kGetNodeScaleSetIdLockKey);

    if (caching_enabled()) {
        if (auto cached = index_.node_to_scale_set().load(node)) {
            return *cached;
        }
    }

    return retry_on_not_found<ResourceId>(logger_, "node " + node, [&](CacheReadType crt) {
        return fetch_scale_set_id(node, crt);
    });
}

Result<NodeName> FlexScaleSetResolver::node_name_for_vm(const VmName& vm_name) {
    ScopedKeyLock lock(lock_map_, kGetNodeScaleSetIdLockKey);

    if (caching_enabled()) {
        if (auto cached = index_.vm_to_node().load(vm_name)) {
            return *cached;
        }
    }

    return retry_on_not_found<NodeName>(logger_, "VM " + vm_name, [&](CacheReadType crt) {
        return fetch_node_name(vm_name, crt);
    });
}

Result<VMRecord> FlexScaleSetResolver::vm_for_node(const NodeName& node_name, CacheReadType crt) {
    auto node = to_lower(node_name);

    if (caching_enabled()) {
        if (auto cached_vm = index_.node_to_vm().load(node)) {
            return vm_by_name(*cached_vm, crt);
        }
    }

    auto vm_name = fetch_vm_name(node);
    if (!vm_name) return vm_name.error();
    return vm_by_name(*vm_name, crt);
}

Result<VMRecord> FlexScaleSetResolver::vm_by_name(const VmName& vm_name, CacheReadType crt) {
    auto vm = client_->get_vm(vm_name, crt);
    if (!vm) return vm.error();

    if (caching_enabled() && !index_.cache_vm_record(*vm)) {
        logger_.debug("VM " + vm_name + " has no computer name yet, identities not indexed");
    }
    return vm;
}

Result<ResourceId> FlexScaleSetResolver::fetch_scale_set_id(const NodeName& node_name,
                                                            CacheReadType crt) {
    auto vm = vm_for_node(node_name, crt);
    if (!vm) return vm.error();

    if (!vm->scale_set_id || vm->scale_set_id->empty()) {
        return Error::not_found("Node " + node_name + " (VM " + vm->name
                                + ") does not belong to a scale set");
    }
    return *vm->scale_set_id;
}

Result<NodeName> FlexScaleSetResolver::fetch_node_name(const VmName& vm_name, CacheReadType crt) {
    auto vm = vm_by_name(vm_name, crt);
    if (!vm) return vm.error();

    if (!vm->computer_name || vm->computer_name->empty()) {
        return Error::not_found("VM " + vm_name + " has no computer name");
    }
    return to_lower(*vm->computer_name);
}

Result<VmName> FlexScaleSetResolver::fetch_vm_name(const NodeName& node_name) {
    auto vm_name = client_->get_vm_name_by_computer_name(options_.resource_group, node_name);
    if (vm_name) return vm_name;

    if (vm_name.is_not_found()) {
        return Error::not_found("Instance not found: node " + node_name);
    }
    logger_.warn("Looking up the VM of node " + node_name + " failed: " + vm_name.error().message);
    return vm_name.error();
}

// ── Scale sets ───────────────────────────────

Result<ScaleSetRecord> FlexScaleSetResolver::scale_set_by_id(const ResourceId& id, CacheReadType crt) {
    auto snapshot = inventory_cache_.get(kVmssFlexInventoryKey, crt);
    if (!snapshot) return snapshot.error();
    if (const auto* found = (*snapshot)->find(id)) {
        return *found;
    }

    logger_.debug("Could not find scale set " + id + ", refreshing the inventory cache");
    snapshot = inventory_cache_.get(kVmssFlexInventoryKey, CacheReadType::ForceRefresh);
    if (!snapshot) return snapshot.error();
    if (const auto* found = (*snapshot)->find(id)) {
        return *found;
    }
    return Error::not_found("Scale set " + id + " not found");
}

Result<ScaleSetRecord> FlexScaleSetResolver::scale_set_for_node(const NodeName& node_name,
                                                                CacheReadType crt) {
    auto id = scale_set_id_for_node(node_name);
    if (!id) return id.error();
    return scale_set_by_id(*id, crt);
}

Result<ScaleSetRecord> FlexScaleSetResolver::scale_set_by_name(const std::string& name) {
    auto snapshot = inventory_cache_.get(kVmssFlexInventoryKey, CacheReadType::Default);
    if (!snapshot) return snapshot.error();

    if (const auto* found = find_by_short_name(**snapshot, name)) {
        return *found;
    }
    return Error::not_found("Scale set named " + name + " not found");
}

Result<ResourceId> FlexScaleSetResolver::scale_set_id_by_name(const std::string& name) {
    auto snapshot = inventory_cache_.get(kVmssFlexInventoryKey, CacheReadType::Default);
    if (!snapshot) return snapshot.error();

    if (const auto* found = find_by_short_name(**snapshot, name)) {
        return found->id;
    }
    return Error::not_found("Scale set named " + name + " not found");
}

Result<std::shared_ptr<const InventorySnapshot>> FlexScaleSetResolver::inventory(CacheReadType crt) {
    return inventory_cache_.get(kVmssFlexInventoryKey, crt);
}

// ── Invalidation ─────────────────────────────

Result<void> FlexScaleSetResolver::invalidate_node(const NodeName& node_name) {
    if (!caching_enabled()) {
        return {};
    }

    auto node = to_lower(node_name);
    index_.forget_node(node);
    logger_.info("Deleted cached identities of node " + node);
    return {};
}

}  // namespace flex_resolver
