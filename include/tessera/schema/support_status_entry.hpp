#pragma once
#include <tessera/schema/support_status.hpp>

#include <cstddef>
#include <string>

// Schema type: support status entry.
// One transition in a schema version's support lineage.
namespace tessera::schema {

template <uint16_t Version>
struct support_status_entry;

template <>
struct support_status_entry<1> final {
  support_status_t status{support_status_t::supported};
  // Release marker, e.g. "2016.04".
  std::string since;

  bool operator==(const support_status_entry<1>&) const = default;
};

using support_status_entry_t = support_status_entry<1>;

/// Outcome of resolving a ledger against a reference release.
struct support_resolution_t final {
  support_status_t status{support_status_t::supported};
  std::string since;
  std::size_t entry_index{};
};

}  // namespace tessera::schema
