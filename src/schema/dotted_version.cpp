#include <tessera/schema/dotted_version.hpp>

#include <algorithm>
#include <charconv>

namespace tessera::schema {

std::strong_ordering dotted_version_t::operator<=>(
    const dotted_version_t& other) const {
  const auto width = std::max(components.size(), other.components.size());
  for (std::size_t i = 0; i < width; ++i) {
    const auto lhs = i < components.size() ? components[i] : 0u;
    const auto rhs = i < other.components.size() ? other.components[i] : 0u;
    if (lhs != rhs) {
      return lhs <=> rhs;
    }
  }
  return std::strong_ordering::equal;
}

bool dotted_version_t::operator==(const dotted_version_t& other) const {
  return (*this <=> other) == std::strong_ordering::equal;
}

std::optional<dotted_version_t> try_parse_dotted_version(
    const std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }

  auto version = dotted_version_t{};
  version.text = std::string{text};
  auto remaining = text;
  while (true) {
    const auto dot = remaining.find('.');
    const auto part = remaining.substr(0, dot);
    if (part.empty()) {
      return std::nullopt;
    }
    auto component = uint32_t{};
    const auto* first = part.data();
    const auto* last = part.data() + part.size();
    auto [ptr, ec] = std::from_chars(first, last, component);
    if (ec != std::errc{} || ptr != last) {
      return std::nullopt;
    }
    version.components.push_back(component);
    if (dot == std::string_view::npos) {
      break;
    }
    remaining.remove_prefix(dot + 1);
  }
  return version;
}

std::optional<std::strong_ordering> compare_versions(
    const std::string_view lhs,
    const std::string_view rhs) {
  auto left = try_parse_dotted_version(lhs);
  auto right = try_parse_dotted_version(rhs);
  if (!left || !right) {
    return std::nullopt;
  }
  return *left <=> *right;
}

}  // namespace tessera::schema
