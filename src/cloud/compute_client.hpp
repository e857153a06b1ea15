/**
 * @file compute_client.hpp
 * @brief Interface to the external compute inventory API.
 *
 * Every call may block on the network. Errors are classified with
 * ErrorKind::NotFound when the queried resource does not exist and
 * ErrorKind::Upstream for every other failure (throttling, transport,
 * malformed responses).
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace flex_resolver {

class IComputeClient {
public:
    virtual ~IComputeClient() = default;

    /// All resource groups the resolver is allowed to inspect.
    virtual Result<std::unordered_set<std::string>> list_resource_groups() = 0;

    /// All scale sets of one resource group, any orchestration mode.
    virtual Result<std::vector<ScaleSetRecord>> list_scale_sets(const std::string& resource_group) = 0;

    /// Name of the VM whose OS computer name equals `computer_name`.
    virtual Result<VmName> get_vm_name_by_computer_name(const std::string& resource_group,
                                                        const std::string& computer_name) = 0;

    /// A VM by name. Implementations with their own cache honor `crt`.
    virtual Result<VMRecord> get_vm(const VmName& vm_name, CacheReadType crt) = 0;
};

}  // namespace flex_resolver
