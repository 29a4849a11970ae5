#pragma once
#include <tessera/schema/profile_type_schema.hpp>
#include <tessera/schema/result.hpp>

namespace tessera::validation {

/// Check the registration invariants of a schema.
///
/// Returns invalid_schema when the type name or version is malformed, a
/// field name repeats, a required field declares a default, a default or
/// allowed value does not type-check, nested specs are attached to a scalar
/// field, a field's version window is inverted, or the support ledger is not
/// strictly ordered by release.
tessera::schema::status_t check_schema(
    const tessera::schema::profile_type_schema_t& schema);

}  // namespace tessera::validation
