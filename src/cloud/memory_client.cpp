/**
 * @file memory_client.cpp
 * @brief InMemoryComputeClient implementation.
 */

#include "cloud/memory_client.hpp"
#include "core/strings.hpp"

#include <algorithm>
#include <thread>

namespace flex_resolver {

// ── IComputeClient interface ─────────────────

Result<std::unordered_set<std::string>> InMemoryComputeClient::list_resource_groups() {
    begin_call(ClientOperation::ListResourceGroups);
    std::lock_guard lock(mutex_);
    if (auto err = failure_for(ClientOperation::ListResourceGroups, {})) return *err;
    return resource_groups_;
}

Result<std::vector<ScaleSetRecord>> InMemoryComputeClient::list_scale_sets(
    const std::string& resource_group) {
    begin_call(ClientOperation::ListScaleSets);
    std::lock_guard lock(mutex_);
    if (auto err = failure_for(ClientOperation::ListScaleSets, resource_group)) return *err;

    bool known = std::any_of(resource_groups_.begin(), resource_groups_.end(),
                             [&](const std::string& group) { return iequals(group, resource_group); });
    if (!known) {
        return Error::not_found("Resource group " + resource_group + " could not be found");
    }

    std::vector<ScaleSetRecord> result;
    for (const auto& [id, scale_set] : scale_sets_) {
        if (iequals(scale_set.resource_group, resource_group)) {
            result.push_back(scale_set);
        }
    }
    return result;
}

Result<VmName> InMemoryComputeClient::get_vm_name_by_computer_name(
    const std::string& resource_group, const std::string& computer_name) {
    begin_call(ClientOperation::GetVmNameByComputerName);
    std::lock_guard lock(mutex_);
    if (auto err = failure_for(ClientOperation::GetVmNameByComputerName, resource_group)) {
        return *err;
    }

    for (const auto& [name, vm] : vms_) {
        if (!resource_group.empty() && !iequals(vm.resource_group, resource_group)) continue;
        if (vm.computer_name && iequals(*vm.computer_name, computer_name)) {
            return VmName{name};
        }
    }
    return Error::not_found("No VM with computer name " + computer_name);
}

Result<VMRecord> InMemoryComputeClient::get_vm(const VmName& vm_name, CacheReadType /*crt*/) {
    begin_call(ClientOperation::GetVm);
    std::lock_guard lock(mutex_);
    if (auto err = failure_for(ClientOperation::GetVm, {})) return *err;

    auto it = vms_.find(vm_name);
    if (it == vms_.end()) {
        return Error::not_found("VM " + vm_name + " could not be found");
    }
    return it->second;
}

// ── Inventory mutation ───────────────────────

void InMemoryComputeClient::add_resource_group(const std::string& resource_group) {
    std::lock_guard lock(mutex_);
    resource_groups_.insert(resource_group);
}

void InMemoryComputeClient::add_scale_set(ScaleSetRecord scale_set) {
    std::lock_guard lock(mutex_);
    resource_groups_.insert(scale_set.resource_group);
    auto id = scale_set.id;
    scale_sets_.insert_or_assign(std::move(id), std::move(scale_set));
}

bool InMemoryComputeClient::remove_scale_set(const ResourceId& id) {
    std::lock_guard lock(mutex_);
    return scale_sets_.erase(id) > 0;
}

void InMemoryComputeClient::add_vm(VMRecord vm) {
    std::lock_guard lock(mutex_);
    if (!vm.resource_group.empty()) {
        resource_groups_.insert(vm.resource_group);
    }
    auto name = vm.name;
    vms_.insert_or_assign(std::move(name), std::move(vm));
}

bool InMemoryComputeClient::remove_vm(const VmName& vm_name) {
    std::lock_guard lock(mutex_);
    return vms_.erase(vm_name) > 0;
}

size_t InMemoryComputeClient::scale_set_count() const {
    std::lock_guard lock(mutex_);
    return scale_sets_.size();
}

size_t InMemoryComputeClient::vm_count() const {
    std::lock_guard lock(mutex_);
    return vms_.size();
}

// ── Fault injection and accounting ───────────

void InMemoryComputeClient::inject_failure(ClientOperation op, Error error,
                                           std::string resource_group) {
    std::lock_guard lock(mutex_);
    failures_.push_back(FailureRule{op, std::move(resource_group), std::move(error)});
}

void InMemoryComputeClient::clear_failures() {
    std::lock_guard lock(mutex_);
    failures_.clear();
}

uint64_t InMemoryComputeClient::call_count(ClientOperation op) const noexcept {
    return calls_[static_cast<size_t>(op)].load();
}

uint64_t InMemoryComputeClient::total_calls() const noexcept {
    uint64_t total = 0;
    for (const auto& counter : calls_) total += counter.load();
    return total;
}

void InMemoryComputeClient::reset_call_counts() noexcept {
    for (auto& counter : calls_) counter.store(0);
}

void InMemoryComputeClient::begin_call(ClientOperation op) {
    calls_[static_cast<size_t>(op)].fetch_add(1);
    auto latency = latency_ms_.load();
    if (latency > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(latency));
    }
}

std::optional<Error> InMemoryComputeClient::failure_for(ClientOperation op,
                                                        const std::string& resource_group) const {
    for (const auto& rule : failures_) {
        if (rule.op != op) continue;
        if (!rule.resource_group.empty() && !iequals(rule.resource_group, resource_group)) continue;
        return rule.error;
    }
    return std::nullopt;
}

}  // namespace flex_resolver
