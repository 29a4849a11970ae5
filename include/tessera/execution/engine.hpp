#pragma once

#include <tessera/registry/schema_registry.hpp>
#include <tessera/schema/primitives.hpp>
#include <tessera/schema/profile_spec.hpp>
#include <tessera/schema/profile_type_schema.hpp>
#include <tessera/schema/result.hpp>
#include <tessera/schema/support_status_entry.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tessera::execution {

/// Deployment policy applied before a schema is used.
struct engine_options final {
  // Platform release used to gate validation and updates. No gating when
  // unset.
  std::optional<std::string> current_release;
  // Fail with unsupported_version instead of warning when the schema is
  // UNSUPPORTED (or not yet supported) at `current_release`.
  bool reject_unsupported{false};
};

/// Type/version keyed front door to the schema engine.
///
/// Every call works on one registry snapshot, so a concurrent reload never
/// changes the schema a call started with. The engine keeps no per-call
/// state and may be shared between threads.
class engine final {
 public:
  explicit engine(tessera::registry::schema_registry& registry,
                  engine_options options = {});

  /// Register a schema with the underlying registry.
  tessera::schema::status_t register_schema(
      tessera::schema::profile_type_schema_t schema);

  /// Resolve (type_name, version), gate on support status, then normalize.
  tessera::schema::result<tessera::schema::profile_spec_t> validate(
      std::string_view type_name,
      std::string_view version,
      const tessera::schema::map_t& raw_spec) const;

  /// Resolve (type_name, version) and authorize a partial update.
  ///
  /// `proposed` is expected to be shape-checked already; see update().
  tessera::schema::result<tessera::schema::profile_spec_t> authorize_update(
      std::string_view type_name,
      std::string_view version,
      const tessera::schema::profile_spec_t& current,
      const tessera::schema::map_t& proposed) const;

  /// Shape-check a raw patch, then authorize it against `current`.
  tessera::schema::result<tessera::schema::profile_spec_t> update(
      std::string_view type_name,
      std::string_view version,
      const tessera::schema::profile_spec_t& current,
      const tessera::schema::map_t& raw_patch) const;

  /// Support status of (type_name, version) as of `reference_release`.
  tessera::schema::result<tessera::schema::support_resolution_t>
  resolve_support(std::string_view type_name,
                  std::string_view version,
                  std::string_view reference_release) const;

  const engine_options& options() const { return options_; }
  tessera::registry::schema_registry& registry() { return registry_; }

 private:
  /// Look up the schema and apply the support status policy.
  ///
  /// Warnings for DEPRECATED/UNSUPPORTED versions are appended to
  /// `warnings`.
  tessera::schema::result<tessera::registry::schema_ptr_t> admit(
      std::string_view type_name,
      std::string_view version,
      std::string_view codespace,
      std::vector<std::string>& warnings) const;

  tessera::registry::schema_registry& registry_;
  engine_options options_;
};

}  // namespace tessera::execution
