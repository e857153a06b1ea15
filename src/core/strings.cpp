/**
 * @file strings.cpp
 * @brief String helper implementations.
 */

#include "core/strings.hpp"

#include <algorithm>
#include <cctype>

namespace flex_resolver {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size()
        && std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

std::optional<std::string> last_segment(std::string_view id, char separator) {
    auto pos = id.rfind(separator);
    auto name = pos == std::string_view::npos ? id : id.substr(pos + 1);
    if (name.empty()) return std::nullopt;
    return std::string(name);
}

}  // namespace flex_resolver
