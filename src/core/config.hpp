/**
 * @file config.hpp
 * @brief Resolver configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"

namespace flex_resolver {

/// TTL used when the configured inventory cache TTL is zero.
inline constexpr uint32_t kDefaultVmssFlexCacheTtlSeconds = 600;

struct CloudConfig {
    std::string resource_group;     ///< Group searched by computer-name lookups
};

struct CacheConfig {
    uint32_t vmss_flex_cache_ttl_seconds = kDefaultVmssFlexCacheTtlSeconds;
    bool disable_api_call_cache = false;
};

struct TelemetryConfig {
    std::filesystem::path log_dir;  ///< Empty = stderr
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    CloudConfig cloud;
    CacheConfig cache;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing tables and keys keep their defaults. A missing file, a parse
 * error or an unknown log level yields ErrorKind::InvalidConfig.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace flex_resolver
