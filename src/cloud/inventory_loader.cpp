/**
 * @file inventory_loader.cpp
 * @brief ScaleSetInventoryLoader implementation.
 */

#include "cloud/inventory_loader.hpp"

namespace flex_resolver {

ScaleSetInventoryLoader::ScaleSetInventoryLoader(std::shared_ptr<IComputeClient> client,
                                                 Logger& logger)
    : client_(std::move(client)), logger_(logger) {}

Result<std::shared_ptr<const InventorySnapshot>> ScaleSetInventoryLoader::load(
    const std::string& /*key*/) {
    auto groups = client_->list_resource_groups();
    if (!groups) {
        logger_.error("Listing resource groups failed: " + groups.error().message);
        return groups.error();
    }

    InventorySnapshot::Map scale_sets;
    for (const auto& resource_group : *groups) {
        auto listed = client_->list_scale_sets(resource_group);
        if (!listed) {
            if (listed.is_not_found()) {
                logger_.warn("Skip caching scale sets for resource group " + resource_group
                             + ": " + listed.error().message);
                continue;
            }
            logger_.error("Listing scale sets of resource group " + resource_group
                          + " failed: " + listed.error().message);
            return listed.error();
        }

        for (auto& scale_set : *listed) {
            if (scale_set.id.empty()) {
                logger_.warn("Scale set " + scale_set.name + " in resource group "
                             + resource_group + " has no ID");
                continue;
            }
            if (scale_set.orchestration_mode != OrchestrationMode::Flexible) continue;

            auto id = scale_set.id;
            scale_sets.insert_or_assign(std::move(id), std::move(scale_set));
        }
    }

    logger_.debug("Loaded " + std::to_string(scale_sets.size()) + " flexible scale sets from "
                  + std::to_string(groups->size()) + " resource groups");
    return std::make_shared<const InventorySnapshot>(std::move(scale_sets));
}

}  // namespace flex_resolver
