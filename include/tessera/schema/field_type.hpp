#pragma once

#include <tessera/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: field type.
// Closed set of value types a profile field may declare.
namespace tessera::schema {

enum class field_type_t : uint8_t {
  boolean = 0,
  integer = 1,
  floating = 2,
  string = 3,
  map = 4,
  list = 5
};

inline constexpr auto kFieldTypeMappings = std::array{
    std::pair<std::string_view, field_type_t>{"Boolean", field_type_t::boolean},
    std::pair<std::string_view, field_type_t>{"Integer", field_type_t::integer},
    std::pair<std::string_view, field_type_t>{"Float", field_type_t::floating},
    std::pair<std::string_view, field_type_t>{"String", field_type_t::string},
    std::pair<std::string_view, field_type_t>{"Map", field_type_t::map},
    std::pair<std::string_view, field_type_t>{"List", field_type_t::list}};

template <>
inline std::optional<field_type_t> try_from_string<field_type_t>(
    const std::string_view value) {
  return from_string(value, kFieldTypeMappings);
}

inline constexpr std::string_view to_string(const field_type_t value) {
  return to_string(value, kFieldTypeMappings).value_or("unknown");
}

}  // namespace tessera::schema
