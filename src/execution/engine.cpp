#include <spdlog/spdlog.h>
#include <tessera/execution/engine.hpp>
#include <tessera/support/resolver.hpp>
#include <tessera/validation/update_policy.hpp>
#include <tessera/validation/validator.hpp>

#include <utility>

using namespace tessera::schema;

namespace {

template <typename T, typename U>
result<T> forward_failure(result<U>&& failed,
                          std::vector<std::string>&& warnings) {
  auto out = make_failure<T>(std::move(failed.status));
  out.warnings = std::move(warnings);
  return out;
}

}  // namespace

namespace tessera::execution {

engine::engine(tessera::registry::schema_registry& registry,
               engine_options options)
    : registry_{registry}, options_{std::move(options)} {
  if (options_.current_release) {
    spdlog::info("Schema engine gating on release {} ({} unsupported types)",
                 *options_.current_release,
                 options_.reject_unsupported ? "rejecting" : "warning on");
  }
}

status_t engine::register_schema(profile_type_schema_t schema) {
  return registry_.register_schema(std::move(schema));
}

result<tessera::registry::schema_ptr_t> engine::admit(
    const std::string_view type_name,
    const std::string_view version,
    const std::string_view codespace,
    std::vector<std::string>& warnings) const {
  auto snapshot = registry_.snapshot();
  auto found = tessera::registry::find_schema(*snapshot, type_name, version);
  if (!found.ok() || !options_.current_release) {
    return found;
  }

  const auto& schema = **found.value;
  const auto& release = *options_.current_release;
  auto resolved = tessera::support::resolve(schema, release);
  if (!resolved.ok()) {
    if (resolved.status.code == error_code::invalid_release) {
      return make_failure<tessera::registry::schema_ptr_t>(
          std::move(resolved.status));
    }
    auto message = schema.type_name + "-" + schema.version +
                   " is not yet supported at release " + release;
    if (options_.reject_unsupported) {
      spdlog::warn("Refusing {}", message);
      return make_failure<tessera::registry::schema_ptr_t>(
          make_error(error_code::unsupported_version, std::string{codespace},
                     message));
    }
    spdlog::warn("{}", message);
    warnings.push_back(std::move(message));
    return found;
  }

  const auto& resolution = *resolved.value;
  if (resolution.status == support_status_t::supported) {
    return found;
  }
  auto message = schema.type_name + "-" + schema.version + " is " +
                 std::string{to_string(resolution.status)} + " since " +
                 resolution.since;
  if (resolution.status == support_status_t::unsupported &&
      options_.reject_unsupported) {
    spdlog::warn("Refusing {}", message);
    return make_failure<tessera::registry::schema_ptr_t>(make_error(
        error_code::unsupported_version, std::string{codespace}, message));
  }
  spdlog::warn("{}", message);
  warnings.push_back(std::move(message));
  return found;
}

result<profile_spec_t> engine::validate(const std::string_view type_name,
                                        const std::string_view version,
                                        const map_t& raw_spec) const {
  auto warnings = std::vector<std::string>{};
  auto schema = admit(type_name, version, "tessera.validate", warnings);
  if (!schema.ok()) {
    return forward_failure<profile_spec_t>(std::move(schema),
                                           std::move(warnings));
  }
  auto out = tessera::validation::validate(**schema.value, raw_spec);
  out.warnings = std::move(warnings);
  return out;
}

result<profile_spec_t> engine::authorize_update(
    const std::string_view type_name,
    const std::string_view version,
    const profile_spec_t& current,
    const map_t& proposed) const {
  auto warnings = std::vector<std::string>{};
  auto schema = admit(type_name, version, "tessera.update", warnings);
  if (!schema.ok()) {
    return forward_failure<profile_spec_t>(std::move(schema),
                                           std::move(warnings));
  }
  auto out =
      tessera::validation::authorize_update(**schema.value, current, proposed);
  out.warnings = std::move(warnings);
  return out;
}

result<profile_spec_t> engine::update(const std::string_view type_name,
                                      const std::string_view version,
                                      const profile_spec_t& current,
                                      const map_t& raw_patch) const {
  auto warnings = std::vector<std::string>{};
  auto schema = admit(type_name, version, "tessera.update", warnings);
  if (!schema.ok()) {
    return forward_failure<profile_spec_t>(std::move(schema),
                                           std::move(warnings));
  }
  auto patch = tessera::validation::validate_patch(**schema.value, raw_patch);
  if (!patch.ok()) {
    return forward_failure<profile_spec_t>(std::move(patch),
                                           std::move(warnings));
  }
  auto out = tessera::validation::authorize_update(**schema.value, current,
                                                   *patch.value);
  out.warnings = std::move(warnings);
  return out;
}

result<support_resolution_t> engine::resolve_support(
    const std::string_view type_name,
    const std::string_view version,
    const std::string_view reference_release) const {
  auto schema = registry_.lookup(type_name, version);
  if (!schema.ok()) {
    return make_failure<support_resolution_t>(std::move(schema.status));
  }
  return tessera::support::resolve(**schema.value, reference_release);
}

}  // namespace tessera::execution
