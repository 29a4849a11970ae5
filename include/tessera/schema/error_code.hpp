#pragma once

#include <tessera/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: error code.
// Failure taxonomy shared by registration, validation, update authorization
// and support resolution. Numeric values are stable; the CLI exits with them.
namespace tessera::schema {

enum class error_code : uint32_t {
  ok = 0,
  duplicate_schema = 1,
  invalid_schema = 2,
  unknown_schema = 3,
  missing_required_field = 4,
  unknown_field = 5,
  type_mismatch = 6,
  immutable_field_changed = 7,
  unsupported_version = 8,
  constraint_violated = 9,
  field_version_unsupported = 10,
  invalid_release = 11,
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code>{"Ok", error_code::ok},
    std::pair<std::string_view, error_code>{"DuplicateSchema",
                                            error_code::duplicate_schema},
    std::pair<std::string_view, error_code>{"InvalidSchema",
                                            error_code::invalid_schema},
    std::pair<std::string_view, error_code>{"UnknownSchema",
                                            error_code::unknown_schema},
    std::pair<std::string_view, error_code>{
        "MissingRequiredField", error_code::missing_required_field},
    std::pair<std::string_view, error_code>{"UnknownField",
                                            error_code::unknown_field},
    std::pair<std::string_view, error_code>{"TypeMismatch",
                                            error_code::type_mismatch},
    std::pair<std::string_view, error_code>{
        "ImmutableFieldChanged", error_code::immutable_field_changed},
    std::pair<std::string_view, error_code>{"UnsupportedVersion",
                                            error_code::unsupported_version},
    std::pair<std::string_view, error_code>{"ConstraintViolated",
                                            error_code::constraint_violated},
    std::pair<std::string_view, error_code>{
        "FieldVersionUnsupported", error_code::field_version_unsupported},
    std::pair<std::string_view, error_code>{"InvalidRelease",
                                            error_code::invalid_release}};

template <>
inline std::optional<error_code> try_from_string<error_code>(
    const std::string_view value) {
  return from_string(value, kErrorCodeMappings);
}

inline constexpr std::string_view to_string(const error_code value) {
  return to_string(value, kErrorCodeMappings).value_or("unknown");
}

}  // namespace tessera::schema
