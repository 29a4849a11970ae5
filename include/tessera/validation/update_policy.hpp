#pragma once
#include <tessera/schema/primitives.hpp>
#include <tessera/schema/profile_spec.hpp>
#include <tessera/schema/profile_type_schema.hpp>
#include <tessera/schema/result.hpp>

namespace tessera::validation {

/// Decide whether `proposed` may be applied on top of `current`.
///
/// `current` must be bound to `schema` (same type name, equal version),
/// otherwise the call fails with unknown_schema.
/// `proposed` is a partial patch: keys it omits keep their current value.
/// Every key whose value differs from the current one must belong to an
/// updatable field, otherwise the call fails with immutable_field_changed.
/// On success the merged spec is returned. The proposed values are not
/// type-checked here; run validate_patch first.
tessera::schema::result<tessera::schema::profile_spec_t> authorize_update(
    const tessera::schema::profile_type_schema_t& schema,
    const tessera::schema::profile_spec_t& current,
    const tessera::schema::map_t& proposed);

}  // namespace tessera::validation
