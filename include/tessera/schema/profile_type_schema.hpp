#pragma once
#include <tessera/schema/field_spec.hpp>
#include <tessera/schema/support_status_entry.hpp>

#include <string>
#include <string_view>
#include <vector>

// Schema type: profile type schema.
// A named, versioned bundle of field specs plus its support lineage.
namespace tessera::schema {

template <uint16_t Version>
struct profile_type_schema;

template <>
struct profile_type_schema<1> final {
  // Stable identifier, e.g. "os.heat.stack".
  std::string type_name;
  std::string version;
  // Names are unique; order is the validation order.
  std::vector<field_spec_t> fields;
  // Ordered by `since`, strictly increasing.
  std::vector<support_status_entry_t> support_status;

  const field_spec_t* find_field(std::string_view name) const;
};

using profile_type_schema_t = profile_type_schema<1>;

const field_spec_t* find_field(const std::vector<field_spec_t>& fields,
                               std::string_view name);

}  // namespace tessera::schema
