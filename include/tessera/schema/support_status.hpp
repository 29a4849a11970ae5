#pragma once

#include <tessera/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: support status.
// Lifecycle state of one profile type version as of a given release.
namespace tessera::schema {

enum class support_status_t : uint8_t {
  supported = 0,
  deprecated = 1,
  unsupported = 2
};

inline constexpr auto kSupportStatusMappings = std::array{
    std::pair<std::string_view, support_status_t>{"SUPPORTED",
                                                  support_status_t::supported},
    std::pair<std::string_view, support_status_t>{
        "DEPRECATED", support_status_t::deprecated},
    std::pair<std::string_view, support_status_t>{
        "UNSUPPORTED", support_status_t::unsupported}};

template <>
inline std::optional<support_status_t> try_from_string<support_status_t>(
    const std::string_view value) {
  return from_string(value, kSupportStatusMappings);
}

inline constexpr std::string_view to_string(const support_status_t value) {
  return to_string(value, kSupportStatusMappings).value_or("unknown");
}

}  // namespace tessera::schema
