#include <spdlog/spdlog.h>
#include <tessera/schema/dotted_version.hpp>
#include <tessera/validation/update_policy.hpp>

#include <iterator>
#include <string>

using namespace tessera::schema;

namespace {

constexpr auto kCodespace = std::string_view{"tessera.update"};

bool same_schema(const profile_type_schema_t& schema,
                 const profile_spec_t& spec) {
  if (spec.type_name != schema.type_name) {
    return false;
  }
  auto schema_version = try_parse_dotted_version(schema.version);
  auto spec_version = try_parse_dotted_version(spec.version);
  if (!schema_version || !spec_version) {
    return schema.version == spec.version;
  }
  return *schema_version == *spec_version;
}

}  // namespace

namespace tessera::validation {

result<profile_spec_t> authorize_update(const profile_type_schema_t& schema,
                                        const profile_spec_t& current,
                                        const map_t& proposed) {
  if (!same_schema(schema, current)) {
    return make_failure<profile_spec_t>(make_error(
        error_code::unknown_schema, std::string{kCodespace},
        "The profile spec of type '" + current.type_name + "-" +
            current.version + "' cannot be updated with profile type '" +
            schema.type_name + "-" + schema.version + "'",
        {}, schema.type_name + "-" + schema.version,
        current.type_name + "-" + current.version));
  }

  auto merged = current;
  for (const auto& [key, value] : proposed) {
    const auto* field = schema.find_field(key);
    if (field == nullptr) {
      return make_failure<profile_spec_t>(make_error(
          error_code::unknown_field, std::string{kCodespace},
          "Unrecognizable spec item '" + key + "'", key));
    }

    auto existing = current.properties.find(key);
    const auto changed = existing == std::end(current.properties) ||
                         existing->second != value;
    if (!changed) {
      continue;
    }
    if (!field->updatable) {
      auto before = existing == std::end(current.properties)
                        ? std::string{"<unset>"}
                        : describe(existing->second);
      auto after = describe(value);
      spdlog::debug("Rejected update of immutable field {} on {}-{}", key,
                    schema.type_name, schema.version);
      return make_failure<profile_spec_t>(
          make_error(error_code::immutable_field_changed,
                     std::string{kCodespace},
                     "Field '" + key + "' is not updatable: " + before +
                         " -> " + after,
                     key, before, after));
    }
    merged.properties.insert_or_assign(key, value);
  }
  return make_result(std::move(merged));
}

}  // namespace tessera::validation
