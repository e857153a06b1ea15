/**
 * @file strings.hpp
 * @brief Small string helpers for resource IDs and node names.
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace flex_resolver {

/// ASCII lower-casing. Node names are compared case-insensitively.
[[nodiscard]] std::string to_lower(std::string_view s);

/// ASCII case-insensitive equality.
[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept;

/**
 * @brief Last `separator`-delimited segment of a resource ID.
 *
 * Returns std::nullopt when the segment is empty (e.g. a trailing slash).
 */
[[nodiscard]] std::optional<std::string> last_segment(std::string_view id, char separator = '/');

}  // namespace flex_resolver
