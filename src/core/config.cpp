/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <cstdint>

#include <toml++/toml.hpp>

namespace flex_resolver {

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error::invalid_config("Configuration file not found: " + path.string());
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [cloud]
        if (auto cloud = tbl["cloud"]; cloud.is_table()) {
            config.cloud.resource_group = cloud["resource_group"].value_or(std::string{});
        }

        // [cache]
        if (auto cache = tbl["cache"]; cache.is_table()) {
            auto ttl = cache["vmss_flex_cache_ttl_seconds"].value_or(
                int64_t{kDefaultVmssFlexCacheTtlSeconds});
            if (ttl < 0) {
                return Error::invalid_config("cache.vmss_flex_cache_ttl_seconds must not be negative");
            }
            config.cache.vmss_flex_cache_ttl_seconds = static_cast<uint32_t>(ttl);
            config.cache.disable_api_call_cache = cache["disable_api_call_cache"].value_or(false);
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});
            auto max_file_size_mb = telemetry["max_file_size_mb"].value_or(int64_t{50});
            if (max_file_size_mb < 0 || max_file_size_mb > UINT32_MAX) {
                return Error::invalid_config("telemetry.max_file_size_mb out of range");
            }
            auto rotate_count = telemetry["rotate_count"].value_or(int64_t{5});
            if (rotate_count < 0 || rotate_count > UINT32_MAX) {
                return Error::invalid_config("telemetry.rotate_count out of range");
            }
            config.telemetry.max_file_size_mb = static_cast<uint32_t>(max_file_size_mb);
            config.telemetry.rotate_count = static_cast<uint32_t>(rotate_count);
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            if (!parse_log_level(config.telemetry.log_level)) {
                return Error::invalid_config("Unknown log level: " + config.telemetry.log_level);
            }
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error::invalid_config(std::string{"TOML parse error: "} + std::string{err.description()});
    }
}

Config default_config() {
    return Config{};
}

}  // namespace flex_resolver
