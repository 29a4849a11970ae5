#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Schema type: dotted version.
// Release markers ("2016.04") and schema versions ("1.0", "1.10") share one
// numeric, component-wise ordering. Trailing zero components are
// insignificant, so "1" and "1.0" name the same version.
namespace tessera::schema {

struct dotted_version_t final {
  std::vector<uint32_t> components;
  std::string text;

  std::strong_ordering operator<=>(const dotted_version_t& other) const;
  bool operator==(const dotted_version_t& other) const;
};

std::optional<dotted_version_t> try_parse_dotted_version(std::string_view text);

/// Three-way comparison of two version strings; std::nullopt if either is
/// malformed.
std::optional<std::strong_ordering> compare_versions(std::string_view lhs,
                                                     std::string_view rhs);

}  // namespace tessera::schema
