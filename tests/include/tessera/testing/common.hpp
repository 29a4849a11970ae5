#pragma once

#include <tessera/schema/field_spec.hpp>
#include <tessera/schema/primitives.hpp>
#include <tessera/schema/profile_type_schema.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tessera::testing {

inline tessera::schema::field_spec_t make_field(
    const std::string_view name,
    const tessera::schema::field_type_t type,
    std::optional<tessera::schema::value_t> default_value = std::nullopt,
    const bool updatable = false,
    const bool required = false) {
  auto field = tessera::schema::field_spec_t{};
  field.name = std::string{name};
  field.type = type;
  field.default_value = std::move(default_value);
  field.updatable = updatable;
  field.required = required;
  return field;
}

/// The stack profile type as shipped in schemas/os.heat.stack.json.
inline tessera::schema::profile_type_schema_t make_heat_stack_schema(
    const std::string_view version = "1.0") {
  using tessera::schema::field_type_t;
  using tessera::schema::map_t;
  using tessera::schema::value_t;

  auto schema = tessera::schema::profile_type_schema_t{};
  schema.type_name = "os.heat.stack";
  schema.version = std::string{version};
  schema.fields = {
      make_field("context", field_type_t::map, value_t{map_t{}}, false),
      make_field("template", field_type_t::map, value_t{map_t{}}, true),
      make_field("template_url", field_type_t::string, value_t{""}, true),
      make_field("parameters", field_type_t::map, value_t{map_t{}}, true),
      make_field("files", field_type_t::map, value_t{map_t{}}, true),
      make_field("timeout", field_type_t::integer, std::nullopt, true),
      make_field("disable_rollback", field_type_t::boolean, value_t{true},
                 true),
      make_field("environment", field_type_t::map, value_t{map_t{}}, true)};
  schema.support_status = {
      tessera::schema::support_status_entry_t{
          .status = tessera::schema::support_status_t::supported,
          .since = "2016.04"}};
  return schema;
}

inline tessera::schema::profile_type_schema_t make_schema(
    const std::string_view type_name,
    const std::string_view version,
    std::vector<tessera::schema::field_spec_t> fields = {},
    std::vector<tessera::schema::support_status_entry_t> ledger = {}) {
  auto schema = tessera::schema::profile_type_schema_t{};
  schema.type_name = std::string{type_name};
  schema.version = std::string{version};
  schema.fields = std::move(fields);
  schema.support_status = std::move(ledger);
  return schema;
}

}  // namespace tessera::testing
