/**
 * @file inventory_file.cpp
 * @brief Inventory file parsing using toml++.
 */

#include "cloud/inventory_file.hpp"
#include "core/strings.hpp"

#include <toml++/toml.hpp>

namespace flex_resolver {

namespace {

std::optional<std::string> optional_string(const toml::table& tbl, std::string_view key) {
    if (auto value = tbl[key].value<std::string>(); value && !value->empty()) {
        return value;
    }
    return std::nullopt;
}

Result<ScaleSetRecord> parse_scale_set(const toml::table& tbl, size_t index) {
    ScaleSetRecord record;
    record.id = tbl["id"].value_or(std::string{});
    record.resource_group = tbl["resource_group"].value_or(std::string{});
    record.location = tbl["location"].value_or(std::string{});

    if (record.resource_group.empty()) {
        return Error::invalid_config("scale_set #" + std::to_string(index)
                                     + " is missing resource_group");
    }

    // An empty id is kept: the inventory API can return such records.
    record.name = tbl["name"].value_or(last_segment(record.id).value_or(std::string{}));

    auto mode = parse_orchestration_mode(tbl["orchestration_mode"].value_or(std::string{"Uniform"}));
    if (!mode) {
        return Error::invalid_config("scale_set #" + std::to_string(index) + ": "
                                     + mode.error().message);
    }
    record.orchestration_mode = *mode;
    return record;
}

Result<VMRecord> parse_vm(const toml::table& tbl, size_t index) {
    VMRecord record;
    record.name = tbl["name"].value_or(std::string{});
    if (record.name.empty()) {
        return Error::invalid_config("vm #" + std::to_string(index) + " is missing name");
    }
    record.id = tbl["id"].value_or(std::string{});
    record.resource_group = tbl["resource_group"].value_or(std::string{});
    record.computer_name = optional_string(tbl, "computer_name");
    record.scale_set_id = optional_string(tbl, "scale_set_id");
    return record;
}

}  // namespace

Result<OrchestrationMode> parse_orchestration_mode(std::string_view name) {
    if (iequals(name, "Flexible")) return OrchestrationMode::Flexible;
    if (iequals(name, "Uniform")) return OrchestrationMode::Uniform;
    return Error::invalid_config("Unknown orchestration mode: " + std::string(name));
}

Result<std::shared_ptr<InMemoryComputeClient>> load_inventory_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error::invalid_config("Inventory file not found: " + path.string());
    }

    try {
        auto tbl = toml::parse_file(path.string());
        auto client = std::make_shared<InMemoryComputeClient>();

        if (auto groups = tbl["resource_groups"].as_array()) {
            for (const auto& group : *groups) {
                if (auto name = group.value<std::string>()) {
                    client->add_resource_group(*name);
                }
            }
        }

        if (auto scale_sets = tbl["scale_set"].as_array()) {
            size_t index = 0;
            for (const auto& node : *scale_sets) {
                const auto* entry = node.as_table();
                if (!entry) {
                    return Error::invalid_config("scale_set entries must be tables");
                }
                auto record = parse_scale_set(*entry, index++);
                if (!record) return record.error();
                client->add_scale_set(std::move(*record));
            }
        }

        if (auto vms = tbl["vm"].as_array()) {
            size_t index = 0;
            for (const auto& node : *vms) {
                const auto* entry = node.as_table();
                if (!entry) {
                    return Error::invalid_config("vm entries must be tables");
                }
                auto record = parse_vm(*entry, index++);
                if (!record) return record.error();
                client->add_vm(std::move(*record));
            }
        }

        return client;

    } catch (const toml::parse_error& err) {
        return Error::invalid_config(std::string{"TOML parse error: "} + std::string{err.description()});
    }
}

}  // namespace flex_resolver
