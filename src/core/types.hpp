/**
 * @file types.hpp
 * @brief Vocabulary types shared by the cache, cloud and resolver layers.
 *
 * Records mirror the subset of the compute inventory API that the resolver
 * consumes. They are plain values; the resolver never mutates them.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace flex_resolver {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using NodeName = std::string;
using VmName = std::string;
using ResourceId = std::string;
using SteadyTime = std::chrono::steady_clock::time_point;

/// Source of "now" for TTL bookkeeping. Tests substitute a manual clock.
using NowFn = std::function<SteadyTime()>;

// ─────────────────────────────────────────────
// Cache Read Type
// ─────────────────────────────────────────────

enum class CacheReadType : uint8_t {
    Default,        ///< Serve a fresh cached value, load otherwise
    ForceRefresh    ///< Always reload and overwrite the cached value
};

[[nodiscard]] constexpr std::string_view to_string(CacheReadType crt) noexcept {
    switch (crt) {
        case CacheReadType::Default:      return "default";
        case CacheReadType::ForceRefresh: return "force_refresh";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Scale Set
// ─────────────────────────────────────────────

enum class OrchestrationMode : uint8_t {
    Uniform,
    Flexible
};

[[nodiscard]] constexpr std::string_view to_string(OrchestrationMode mode) noexcept {
    switch (mode) {
        case OrchestrationMode::Uniform:  return "Uniform";
        case OrchestrationMode::Flexible: return "Flexible";
    }
    return "unknown";
}

/**
 * @brief A virtual machine scale set as listed by the inventory API.
 *
 * `id` is the full resource path, e.g.
 * `/subscriptions/<sub>/resourceGroups/<rg>/providers/Microsoft.Compute/virtualMachineScaleSets/<name>`.
 */
struct ScaleSetRecord {
    ResourceId id;
    std::string name;
    std::string resource_group;
    std::string location;
    OrchestrationMode orchestration_mode{OrchestrationMode::Uniform};

    bool operator==(const ScaleSetRecord&) const = default;
};

// ─────────────────────────────────────────────
// Virtual Machine
// ─────────────────────────────────────────────

/**
 * @brief A virtual machine as returned by the compute API.
 *
 * `computer_name` is the OS-level host name and therefore the node name.
 * It is absent for VMs still provisioning.
 */
struct VMRecord {
    ResourceId id;
    VmName name;
    std::string resource_group;
    std::optional<std::string> computer_name;
    std::optional<ResourceId> scale_set_id;   ///< Owning scale set, if any

    bool operator==(const VMRecord&) const = default;
};

}  // namespace flex_resolver
