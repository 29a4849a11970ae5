#pragma once
#include <tessera/schema/dotted_version.hpp>
#include <tessera/schema/field_spec.hpp>
#include <tessera/schema/primitives.hpp>
#include <tessera/schema/profile_spec.hpp>
#include <tessera/schema/profile_type_schema.hpp>
#include <tessera/schema/result.hpp>

#include <optional>
#include <string_view>

namespace tessera::validation {

/// Normalize a raw specification against one schema version.
///
/// Undeclared keys fail with unknown_field. Supplied fields are
/// type-checked (numeric strings are coerced to Integer/Float), absent
/// required fields fail with missing_required_field, and absent optional
/// fields receive a deep copy of their default, normalized so that nested
/// Map/List defaults are filled in. Fields that declare neither
/// a default nor a value are left out of the result.
tessera::schema::result<tessera::schema::profile_spec_t> validate(
    const tessera::schema::profile_type_schema_t& schema,
    const tessera::schema::map_t& raw_spec);

/// Shape-check a partial update: only supplied keys are checked and
/// coerced. No defaults are applied and required fields are not enforced.
tessera::schema::result<tessera::schema::map_t> validate_patch(
    const tessera::schema::profile_type_schema_t& schema,
    const tessera::schema::map_t& raw_patch);

/// Type-check and coerce one value against a field spec, descending into
/// nested Map/List specs. `path` names the value in diagnostics.
///
/// When `schema_version` is std::nullopt, field version windows are not
/// enforced (used when checking schema defaults).
tessera::schema::status_t normalize_value(
    const tessera::schema::field_spec_t& field,
    const tessera::schema::value_t& input,
    std::string_view path,
    const std::optional<tessera::schema::dotted_version_t>& schema_version,
    tessera::schema::value_t& out);

}  // namespace tessera::validation
