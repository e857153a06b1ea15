/**
 * @file memory_client.hpp
 * @brief In-memory IComputeClient backed by a static inventory.
 *
 * Serves the CLI from an inventory file and the tests from records added
 * programmatically. Counts calls per operation and can inject failures and
 * latency so that cache and retry behavior is observable.
 */

#pragma once

#include "cloud/compute_client.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace flex_resolver {

enum class ClientOperation : uint8_t {
    ListResourceGroups,
    ListScaleSets,
    GetVmNameByComputerName,
    GetVm
};

inline constexpr size_t kClientOperationCount = 4;

[[nodiscard]] constexpr std::string_view to_string(ClientOperation op) noexcept {
    switch (op) {
        case ClientOperation::ListResourceGroups:      return "list_resource_groups";
        case ClientOperation::ListScaleSets:           return "list_scale_sets";
        case ClientOperation::GetVmNameByComputerName: return "get_vm_name_by_computer_name";
        case ClientOperation::GetVm:                   return "get_vm";
    }
    return "unknown";
}

class InMemoryComputeClient : public IComputeClient {
public:
    InMemoryComputeClient() = default;

    // IComputeClient interface
    Result<std::unordered_set<std::string>> list_resource_groups() override;
    Result<std::vector<ScaleSetRecord>> list_scale_sets(const std::string& resource_group) override;
    Result<VmName> get_vm_name_by_computer_name(const std::string& resource_group,
                                                const std::string& computer_name) override;
    Result<VMRecord> get_vm(const VmName& vm_name, CacheReadType crt) override;

    // Inventory mutation
    void add_resource_group(const std::string& resource_group);
    void add_scale_set(ScaleSetRecord scale_set);
    bool remove_scale_set(const ResourceId& id);
    void add_vm(VMRecord vm);
    bool remove_vm(const VmName& vm_name);

    [[nodiscard]] size_t scale_set_count() const;
    [[nodiscard]] size_t vm_count() const;

    /**
     * @brief Make `op` fail with `error` until clear_failures().
     *
     * For ListScaleSets and GetVmNameByComputerName a non-empty
     * `resource_group` restricts the failure to that group.
     */
    void inject_failure(ClientOperation op, Error error, std::string resource_group = {});
    void clear_failures();

    /// Delay applied to every call before it is served.
    void set_latency(std::chrono::milliseconds latency) noexcept { latency_ms_ = latency.count(); }

    [[nodiscard]] uint64_t call_count(ClientOperation op) const noexcept;
    [[nodiscard]] uint64_t total_calls() const noexcept;
    void reset_call_counts() noexcept;

private:
    struct FailureRule {
        ClientOperation op;
        std::string resource_group;   ///< Empty = any group
        Error error;
    };

    void begin_call(ClientOperation op);
    std::optional<Error> failure_for(ClientOperation op, const std::string& resource_group) const;

    mutable std::mutex mutex_;
    std::unordered_set<std::string> resource_groups_;
    std::map<ResourceId, ScaleSetRecord> scale_sets_;
    std::unordered_map<VmName, VMRecord> vms_;
    std::vector<FailureRule> failures_;

    std::atomic<int64_t> latency_ms_{0};
    std::array<std::atomic<uint64_t>, kClientOperationCount> calls_{};
};

}  // namespace flex_resolver
