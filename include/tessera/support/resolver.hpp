#pragma once
#include <tessera/schema/profile_type_schema.hpp>
#include <tessera/schema/result.hpp>
#include <tessera/schema/support_status_entry.hpp>

#include <string_view>

namespace tessera::support {

/// Compute the support status of a schema version as of a release.
///
/// Chooses the ledger entry with the latest `since` that is not newer than
/// `reference_release`. Fails with unsupported_version when the release
/// predates every entry, and with invalid_release when it does not parse.
/// UNSUPPORTED is not treated as terminal: a later entry may restore any
/// status.
tessera::schema::result<tessera::schema::support_resolution_t> resolve(
    const tessera::schema::profile_type_schema_t& schema,
    std::string_view reference_release);

}  // namespace tessera::support
