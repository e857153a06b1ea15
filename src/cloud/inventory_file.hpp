/**
 * @file inventory_file.hpp
 * @brief Static inventory description read from TOML.
 *
 * Example:
 * @code
 * resource_groups = ["fleet-rg", "empty-rg"]
 *
 * [[scale_set]]
 * id = "/subscriptions/sub/resourceGroups/fleet-rg/providers/Microsoft.Compute/virtualMachineScaleSets/ss-a"
 * resource_group = "fleet-rg"
 * location = "westeurope"
 * orchestration_mode = "Flexible"
 *
 * [[vm]]
 * name = "vm-1"
 * resource_group = "fleet-rg"
 * computer_name = "node-1"
 * scale_set_id = "/subscriptions/sub/.../virtualMachineScaleSets/ss-a"
 * @endcode
 */

#pragma once

#include "cloud/memory_client.hpp"
#include "core/result.hpp"

#include <filesystem>
#include <memory>

namespace flex_resolver {

/// Parse an orchestration mode name ("Flexible" / "Uniform", case-insensitive).
[[nodiscard]] Result<OrchestrationMode> parse_orchestration_mode(std::string_view name);

/**
 * @brief Build an InMemoryComputeClient from an inventory file.
 *
 * A missing file, a parse error or a record lacking a required field yields
 * ErrorKind::InvalidConfig.
 */
Result<std::shared_ptr<InMemoryComputeClient>> load_inventory_file(const std::filesystem::path& path);

}  // namespace flex_resolver
