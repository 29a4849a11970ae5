#include <tessera/schema/profile_type_schema.hpp>

#include <algorithm>

namespace tessera::schema {

const field_spec_t* find_field(const std::vector<field_spec_t>& fields,
                               const std::string_view name) {
  auto it = std::find_if(
      std::begin(fields), std::end(fields),
      [&](const field_spec_t& field) { return field.name == name; });
  return it == std::end(fields) ? nullptr : &*it;
}

const field_spec_t* profile_type_schema<1>::find_field(
    const std::string_view name) const {
  return tessera::schema::find_field(fields, name);
}

}  // namespace tessera::schema
