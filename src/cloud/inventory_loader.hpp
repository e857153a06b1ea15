/**
 * @file inventory_loader.hpp
 * @brief Flexible scale-set inventory snapshot and the loader that builds it.
 */

#pragma once

#include "cache/timed_cache.hpp"
#include "cloud/compute_client.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"

#include <memory>
#include <string>
#include <unordered_map>

namespace flex_resolver {

/// Cache key under which the whole inventory snapshot is stored.
inline const std::string kVmssFlexInventoryKey = "vmss_flex_inventory";

/**
 * @brief Immutable map of scale-set ID to record.
 *
 * Only flexible-orchestration scale sets with a non-empty ID are present,
 * and every record's `id` equals its key. Iteration order is unspecified.
 */
class InventorySnapshot {
public:
    using Map = std::unordered_map<ResourceId, ScaleSetRecord>;

    InventorySnapshot() = default;
    explicit InventorySnapshot(Map scale_sets) : scale_sets_(std::move(scale_sets)) {}

    [[nodiscard]] const ScaleSetRecord* find(const ResourceId& id) const {
        auto it = scale_sets_.find(id);
        return it == scale_sets_.end() ? nullptr : &it->second;
    }

    [[nodiscard]] bool contains(const ResourceId& id) const { return scale_sets_.count(id) > 0; }
    [[nodiscard]] size_t size() const noexcept { return scale_sets_.size(); }
    [[nodiscard]] bool empty() const noexcept { return scale_sets_.empty(); }

    [[nodiscard]] Map::const_iterator begin() const noexcept { return scale_sets_.begin(); }
    [[nodiscard]] Map::const_iterator end() const noexcept { return scale_sets_.end(); }

private:
    Map scale_sets_;
};

using InventoryCache = TimedCache<InventorySnapshot>;

/**
 * @brief Lists every resource group's scale sets and keeps the flexible ones.
 *
 * A resource group reported as not found is skipped with a warning; any
 * other listing failure fails the whole load so the previous snapshot stays
 * in the cache.
 */
class ScaleSetInventoryLoader : public ICacheLoader<InventorySnapshot> {
public:
    ScaleSetInventoryLoader(std::shared_ptr<IComputeClient> client, Logger& logger);

    Result<std::shared_ptr<const InventorySnapshot>> load(const std::string& key) override;

private:
    std::shared_ptr<IComputeClient> client_;
    Logger& logger_;
};

}  // namespace flex_resolver
