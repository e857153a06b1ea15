/**
 * @file test_resolver.cpp
 * @brief Tests for FlexScaleSetResolver: index fast path, retry policy,
 *        inventory lookups and invalidation.
 */

#include "resolver/flex_resolver.hpp"
#include "cloud/memory_client.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace flex_resolver;
using namespace std::chrono_literals;

namespace {

constexpr const char* kResourceGroup = "fleet-rg";

std::string scale_set_id(const std::string& rg, const std::string& name) {
    return "/subscriptions/sub/resourceGroups/" + rg
         + "/providers/Microsoft.Compute/virtualMachineScaleSets/" + name;
}

ScaleSetRecord make_scale_set(const std::string& name,
                              OrchestrationMode mode = OrchestrationMode::Flexible,
                              const std::string& rg = kResourceGroup) {
    return ScaleSetRecord{
        .id = scale_set_id(rg, name),
        .name = name,
        .resource_group = rg,
        .location = "westeurope",
        .orchestration_mode = mode
    };
}

VMRecord make_vm(const std::string& name,
                 std::optional<std::string> computer_name,
                 std::optional<std::string> owner = std::nullopt) {
    VMRecord vm;
    vm.id = "/subscriptions/sub/resourceGroups/fleet-rg/providers/Microsoft.Compute/virtualMachines/" + name;
    vm.name = name;
    vm.resource_group = kResourceGroup;
    vm.computer_name = std::move(computer_name);
    vm.scale_set_id = std::move(owner);
    return vm;
}

class ManualClock {
public:
    NowFn fn() {
        return [this] { return SteadyTime{} + std::chrono::seconds(offset_.load()); };
    }
    void advance(std::chrono::seconds by) { offset_ += by.count(); }

private:
    std::atomic<int64_t> offset_{1000};
};

}  // namespace

class ResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        client_->add_scale_set(make_scale_set("ss-a"));
        client_->add_scale_set(make_scale_set("ss-b"));
        client_->add_scale_set(make_scale_set("ss-uniform", OrchestrationMode::Uniform));
        client_->add_vm(make_vm("vm-1", "node-1", scale_set_id(kResourceGroup, "ss-b")));
        client_->add_vm(make_vm("vm-2", "Node-2", scale_set_id(kResourceGroup, "ss-a")));
        client_->add_vm(make_vm("vm-standalone", "standalone"));
        client_->add_vm(make_vm("vm-provisioning", std::nullopt));
    }

    std::unique_ptr<FlexScaleSetResolver> make_resolver(bool disable_cache = false,
                                                        std::chrono::seconds ttl = 30s) {
        ResolverOptions options;
        options.resource_group = kResourceGroup;
        options.inventory_cache_ttl = ttl;
        options.disable_api_call_cache = disable_cache;
        return std::make_unique<FlexScaleSetResolver>(client_, options, logger_, clock_.fn());
    }

    uint64_t calls(ClientOperation op) const { return client_->call_count(op); }

    std::shared_ptr<InMemoryComputeClient> client_ = std::make_shared<InMemoryComputeClient>();
    Logger logger_{std::make_unique<NullSink>(), LogLevel::Debug};
    ManualClock clock_;
};

// ═══════════════════════════════════════════════
// Node → scale set ID
// ═══════════════════════════════════════════════

TEST_F(ResolverTest, NodeToScaleSetIdColdThenIndexed) {
    auto resolver = make_resolver();

    auto id = resolver->scale_set_id_for_node("node-1");
    ASSERT_TRUE(id.has_value()) << id.error().message;
    EXPECT_EQ(*id, scale_set_id(kResourceGroup, "ss-b"));
    EXPECT_EQ(calls(ClientOperation::GetVmNameByComputerName), 1u);
    EXPECT_EQ(calls(ClientOperation::GetVm), 1u);

    client_->reset_call_counts();
    auto again = resolver->scale_set_id_for_node("node-1");
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(*again, *id);
    EXPECT_EQ(client_->total_calls(), 0u);
}

TEST_F(ResolverTest, FirstResolutionPopulatesIdentityIndex) {
    auto resolver = make_resolver();
    ASSERT_TRUE(resolver->scale_set_id_for_node("node-1").has_value());

    const auto& index = resolver->index();
    EXPECT_EQ(index.node_to_vm().load("node-1"), "vm-1");
    EXPECT_EQ(index.vm_to_node().load("vm-1"), "node-1");
    EXPECT_EQ(index.node_to_scale_set().load("node-1"), scale_set_id(kResourceGroup, "ss-b"));
}

TEST_F(ResolverTest, NodeNamesAreCaseInsensitive) {
    auto resolver = make_resolver();

    auto id = resolver->scale_set_id_for_node("NODE-2");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(*id, scale_set_id(kResourceGroup, "ss-a"));
    EXPECT_TRUE(resolver->index().node_to_vm().contains("node-2"));

    client_->reset_call_counts();
    ASSERT_TRUE(resolver->scale_set_id_for_node("node-2").has_value());
    EXPECT_EQ(client_->total_calls(), 0u);
}

TEST_F(ResolverTest, UnknownNodeRetriedOnceWithForceRefresh) {
    auto resolver = make_resolver();

    auto id = resolver->scale_set_id_for_node("ghost");
    ASSERT_FALSE(id.has_value());
    EXPECT_TRUE(id.is_not_found());
    EXPECT_EQ(calls(ClientOperation::GetVmNameByComputerName), 2u);
    EXPECT_EQ(calls(ClientOperation::GetVm), 0u);
}

TEST_F(ResolverTest, NotFoundFromVmLookupIsRetried) {
    auto resolver = make_resolver();
    client_->inject_failure(ClientOperation::GetVm, Error::not_found("not yet"));

    auto missing = resolver->scale_set_id_for_node("node-1");
    EXPECT_TRUE(missing.is_not_found());
    EXPECT_EQ(calls(ClientOperation::GetVm), 2u);

    client_->clear_failures();
    auto found = resolver->scale_set_id_for_node("node-1");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, scale_set_id(kResourceGroup, "ss-b"));
}

TEST_F(ResolverTest, UpstreamErrorIsNotRetried) {
    auto resolver = make_resolver();
    client_->inject_failure(ClientOperation::GetVmNameByComputerName, Error::upstream("429 throttled"));

    auto id = resolver->scale_set_id_for_node("node-1");
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().kind, ErrorKind::Upstream);
    EXPECT_EQ(id.error().message, "429 throttled");
    EXPECT_EQ(calls(ClientOperation::GetVmNameByComputerName), 1u);
}

TEST_F(ResolverTest, VmWithoutScaleSetIsNotFound) {
    auto resolver = make_resolver();

    auto id = resolver->scale_set_id_for_node("standalone");
    ASSERT_FALSE(id.has_value());
    EXPECT_TRUE(id.is_not_found());
    // The retry reuses the node → VM entry learned on the first attempt.
    EXPECT_EQ(calls(ClientOperation::GetVmNameByComputerName), 1u);
    EXPECT_EQ(calls(ClientOperation::GetVm), 2u);
    EXPECT_FALSE(resolver->index().node_to_scale_set().contains("standalone"));
}

// ═══════════════════════════════════════════════
// VM ↔ node
// ═══════════════════════════════════════════════

TEST_F(ResolverTest, VmForNodeUsesIndexedVmName) {
    auto resolver = make_resolver();

    auto vm = resolver->vm_for_node("node-1", CacheReadType::Default);
    ASSERT_TRUE(vm.has_value());
    EXPECT_EQ(vm->name, "vm-1");

    client_->reset_call_counts();
    auto again = resolver->vm_for_node("node-1", CacheReadType::ForceRefresh);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(calls(ClientOperation::GetVmNameByComputerName), 0u);
    EXPECT_EQ(calls(ClientOperation::GetVm), 1u);
}

TEST_F(ResolverTest, VmByNameIndexesAsSideEffect) {
    auto resolver = make_resolver();

    auto vm = resolver->vm_by_name("vm-2", CacheReadType::Default);
    ASSERT_TRUE(vm.has_value());
    EXPECT_EQ(resolver->index().node_to_vm().load("node-2"), "vm-2");
    EXPECT_EQ(resolver->index().vm_to_node().load("vm-2"), "node-2");
}

TEST_F(ResolverTest, VmWithoutComputerNameIsNotIndexed) {
    auto resolver = make_resolver();

    auto vm = resolver->vm_by_name("vm-provisioning", CacheReadType::Default);
    ASSERT_TRUE(vm.has_value());
    EXPECT_EQ(resolver->index().vm_to_node().size(), 0u);
    EXPECT_EQ(resolver->index().node_to_vm().size(), 0u);
}

TEST_F(ResolverTest, NodeNameForVm) {
    auto resolver = make_resolver();

    auto node = resolver->node_name_for_vm("vm-2");
    ASSERT_TRUE(node.has_value());
    EXPECT_EQ(*node, "node-2");

    client_->reset_call_counts();
    auto again = resolver->node_name_for_vm("vm-2");
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(client_->total_calls(), 0u);
}

TEST_F(ResolverTest, NodeNameForVmWithoutComputerName) {
    auto resolver = make_resolver();

    auto node = resolver->node_name_for_vm("vm-provisioning");
    ASSERT_FALSE(node.has_value());
    EXPECT_TRUE(node.is_not_found());
    EXPECT_EQ(calls(ClientOperation::GetVm), 2u);
}

TEST_F(ResolverTest, NodeNameForUnknownVm) {
    auto resolver = make_resolver();
    auto node = resolver->node_name_for_vm("vm-missing");
    EXPECT_TRUE(node.is_not_found());
    EXPECT_EQ(calls(ClientOperation::GetVm), 2u);
}

// ═══════════════════════════════════════════════
// Scale sets from the inventory
// ═══════════════════════════════════════════════

TEST_F(ResolverTest, ScaleSetById) {
    auto resolver = make_resolver();

    auto ss = resolver->scale_set_by_id(scale_set_id(kResourceGroup, "ss-a"), CacheReadType::Default);
    ASSERT_TRUE(ss.has_value());
    EXPECT_EQ(ss->name, "ss-a");
    EXPECT_EQ(resolver->inventory_cache().load_count(), 1u);

    ASSERT_TRUE(resolver->scale_set_by_id(scale_set_id(kResourceGroup, "ss-b"),
                                          CacheReadType::Default).has_value());
    EXPECT_EQ(resolver->inventory_cache().load_count(), 1u);
}

TEST_F(ResolverTest, ScaleSetByIdRefreshesOnMiss) {
    auto resolver = make_resolver();
    ASSERT_TRUE(resolver->inventory(CacheReadType::Default).has_value());

    client_->add_scale_set(make_scale_set("ss-c"));
    auto ss = resolver->scale_set_by_id(scale_set_id(kResourceGroup, "ss-c"), CacheReadType::Default);
    ASSERT_TRUE(ss.has_value());
    EXPECT_EQ(ss->name, "ss-c");
    EXPECT_EQ(resolver->inventory_cache().load_count(), 2u);
}

TEST_F(ResolverTest, ScaleSetByIdMissingAfterRefresh) {
    auto resolver = make_resolver();
    ASSERT_TRUE(resolver->inventory(CacheReadType::Default).has_value());

    auto ss = resolver->scale_set_by_id(scale_set_id(kResourceGroup, "ss-c"), CacheReadType::Default);
    ASSERT_FALSE(ss.has_value());
    EXPECT_TRUE(ss.is_not_found());
    EXPECT_EQ(resolver->inventory_cache().load_count(), 2u);
}

TEST_F(ResolverTest, UniformScaleSetIsNotInInventory) {
    auto resolver = make_resolver();
    auto ss = resolver->scale_set_by_id(scale_set_id(kResourceGroup, "ss-uniform"),
                                        CacheReadType::Default);
    EXPECT_TRUE(ss.is_not_found());
    EXPECT_TRUE(resolver->scale_set_by_name("ss-uniform").is_not_found());
}

TEST_F(ResolverTest, InventoryErrorPropagatesWithoutRetry) {
    auto resolver = make_resolver();
    client_->inject_failure(ClientOperation::ListResourceGroups, Error::upstream("network down"));

    auto ss = resolver->scale_set_by_id(scale_set_id(kResourceGroup, "ss-a"), CacheReadType::Default);
    ASSERT_FALSE(ss.has_value());
    EXPECT_EQ(ss.error().kind, ErrorKind::Upstream);
    EXPECT_EQ(calls(ClientOperation::ListResourceGroups), 1u);
}

TEST_F(ResolverTest, ScaleSetByNameIsCaseInsensitive) {
    auto resolver = make_resolver();

    auto ss = resolver->scale_set_by_name("SS-B");
    ASSERT_TRUE(ss.has_value());
    EXPECT_EQ(ss->id, scale_set_id(kResourceGroup, "ss-b"));

    auto id = resolver->scale_set_id_by_name("ss-a");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(*id, scale_set_id(kResourceGroup, "ss-a"));
}

TEST_F(ResolverTest, ScaleSetByNameDoesNotForceRefresh) {
    auto resolver = make_resolver();
    ASSERT_TRUE(resolver->inventory(CacheReadType::Default).has_value());

    client_->add_scale_set(make_scale_set("ss-new"));
    EXPECT_TRUE(resolver->scale_set_by_name("ss-new").is_not_found());
    EXPECT_TRUE(resolver->scale_set_id_by_name("ss-new").is_not_found());
    EXPECT_EQ(resolver->inventory_cache().load_count(), 1u);

    ASSERT_TRUE(resolver->inventory(CacheReadType::ForceRefresh).has_value());
    EXPECT_TRUE(resolver->scale_set_by_name("ss-new").has_value());
}

TEST_F(ResolverTest, DuplicateShortNameResolvesToOneOfThem) {
    client_->add_scale_set(make_scale_set("ss-a", OrchestrationMode::Flexible, "other-rg"));
    auto resolver = make_resolver();

    auto first = resolver->scale_set_id_by_name("ss-a");
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(*first == scale_set_id(kResourceGroup, "ss-a")
                || *first == scale_set_id("other-rg", "ss-a"));

    // Same snapshot, same answer.
    auto second = resolver->scale_set_id_by_name("ss-a");
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, *second);
}

TEST_F(ResolverTest, ScaleSetForNode) {
    auto resolver = make_resolver();

    auto ss = resolver->scale_set_for_node("node-1", CacheReadType::Default);
    ASSERT_TRUE(ss.has_value()) << ss.error().message;
    EXPECT_EQ(ss->name, "ss-b");
}

TEST_F(ResolverTest, InventoryTtlScenario) {
    auto resolver = make_resolver(false, 30s);

    auto s1 = resolver->inventory(CacheReadType::Default);              // t=0
    ASSERT_TRUE(s1.has_value());
    EXPECT_EQ((*s1)->size(), 2u);

    client_->add_scale_set(make_scale_set("ss-late"));
    clock_.advance(10s);                                                 // t=10
    auto cached = resolver->inventory(CacheReadType::Default);
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(cached->get(), s1->get());
    EXPECT_EQ(resolver->inventory_cache().load_count(), 1u);

    clock_.advance(21s);                                                 // t=31
    auto s2 = resolver->inventory(CacheReadType::Default);
    ASSERT_TRUE(s2.has_value());
    EXPECT_EQ((*s2)->size(), 3u);
    EXPECT_EQ(resolver->inventory_cache().load_count(), 2u);
}

TEST_F(ResolverTest, ZeroTtlUsesDefault) {
    auto resolver = make_resolver(false, 0s);
    EXPECT_EQ(resolver->inventory_cache().ttl(), kDefaultCacheTtl);
}

// ═══════════════════════════════════════════════
// Invalidation and disabled caching
// ═══════════════════════════════════════════════

TEST_F(ResolverTest, InvalidateNodeForcesClientLookup) {
    auto resolver = make_resolver();
    ASSERT_TRUE(resolver->scale_set_id_for_node("node-1").has_value());

    ASSERT_TRUE(resolver->invalidate_node("Node-1").has_value());
    EXPECT_FALSE(resolver->index().node_to_vm().contains("node-1"));
    EXPECT_FALSE(resolver->index().vm_to_node().contains("vm-1"));
    EXPECT_FALSE(resolver->index().node_to_scale_set().contains("node-1"));

    client_->reset_call_counts();
    ASSERT_TRUE(resolver->scale_set_id_for_node("node-1").has_value());
    EXPECT_EQ(calls(ClientOperation::GetVmNameByComputerName), 1u);
    EXPECT_EQ(calls(ClientOperation::GetVm), 1u);
}

TEST_F(ResolverTest, InvalidatedDeletedNodeIsNotFound) {
    auto resolver = make_resolver();
    ASSERT_TRUE(resolver->scale_set_id_for_node("node-1").has_value());

    client_->remove_vm("vm-1");
    ASSERT_TRUE(resolver->invalidate_node("node-1").has_value());

    auto id = resolver->scale_set_id_for_node("node-1");
    EXPECT_TRUE(id.is_not_found());
}

TEST_F(ResolverTest, InvalidateLeavesOtherNodesAlone) {
    auto resolver = make_resolver();
    ASSERT_TRUE(resolver->scale_set_id_for_node("node-1").has_value());
    ASSERT_TRUE(resolver->scale_set_id_for_node("node-2").has_value());

    ASSERT_TRUE(resolver->invalidate_node("node-1").has_value());
    EXPECT_TRUE(resolver->index().node_to_scale_set().contains("node-2"));
    EXPECT_TRUE(resolver->index().vm_to_node().contains("vm-2"));
}

TEST_F(ResolverTest, DisabledCacheAlwaysCallsClient) {
    auto resolver = make_resolver(true);

    ASSERT_TRUE(resolver->scale_set_id_for_node("node-1").has_value());
    ASSERT_TRUE(resolver->scale_set_id_for_node("node-1").has_value());
    EXPECT_EQ(calls(ClientOperation::GetVmNameByComputerName), 2u);
    EXPECT_EQ(resolver->index().node_to_vm().size(), 0u);

    ASSERT_TRUE(resolver->inventory(CacheReadType::Default).has_value());
    ASSERT_TRUE(resolver->inventory(CacheReadType::Default).has_value());
    EXPECT_EQ(calls(ClientOperation::ListResourceGroups), 2u);

    EXPECT_TRUE(resolver->invalidate_node("node-1").has_value());
}

// ═══════════════════════════════════════════════
// Concurrency
// ═══════════════════════════════════════════════

TEST_F(ResolverTest, ConcurrentColdLookupsFetchOnce) {
    auto resolver = make_resolver();
    client_->set_latency(20ms);

    std::atomic<int> successes{0};
    std::vector<std::thread> workers;
    for (int i = 0; i < 12; ++i) {
        workers.emplace_back([&] {
            auto id = resolver->scale_set_id_for_node("node-1");
            if (id && *id == scale_set_id(kResourceGroup, "ss-b")) ++successes;
        });
    }
    for (auto& t : workers) t.join();

    EXPECT_EQ(successes.load(), 12);
    EXPECT_EQ(calls(ClientOperation::GetVmNameByComputerName), 1u);
    EXPECT_EQ(calls(ClientOperation::GetVm), 1u);
}

TEST_F(ResolverTest, ConcurrentInventoryReadsLoadOnce) {
    auto resolver = make_resolver();
    client_->set_latency(20ms);

    std::vector<std::thread> workers;
    for (int i = 0; i < 8; ++i) {
        workers.emplace_back([&] {
            auto ss = resolver->scale_set_by_name("ss-a");
            EXPECT_TRUE(ss.has_value());
        });
    }
    for (auto& t : workers) t.join();

    EXPECT_EQ(calls(ClientOperation::ListResourceGroups), 1u);
    EXPECT_EQ(resolver->inventory_cache().load_count(), 1u);
}

TEST_F(ResolverTest, ConcurrentMixedOperations) {
    auto resolver = make_resolver();

    std::vector<std::thread> workers;
    for (int i = 0; i < 6; ++i) {
        workers.emplace_back([&, i] {
            for (int j = 0; j < 50; ++j) {
                auto node = (i + j) % 2 == 0 ? "node-1" : "node-2";
                (void)resolver->scale_set_id_for_node(node);
                (void)resolver->scale_set_by_name("ss-a");
                if (j % 10 == 0) (void)resolver->invalidate_node(node);
            }
        });
    }
    for (auto& t : workers) t.join();

    auto final_id = resolver->scale_set_id_for_node("node-2");
    ASSERT_TRUE(final_id.has_value());
    EXPECT_EQ(*final_id, scale_set_id(kResourceGroup, "ss-a"));
}
