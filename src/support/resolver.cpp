#include <tessera/schema/dotted_version.hpp>
#include <tessera/support/resolver.hpp>

#include <optional>
#include <string>

using namespace tessera::schema;

namespace {

constexpr auto kCodespace = std::string_view{"tessera.support"};

}  // namespace

namespace tessera::support {

result<support_resolution_t> resolve(const profile_type_schema_t& schema,
                                     const std::string_view reference_release) {
  auto reference = try_parse_dotted_version(reference_release);
  if (!reference) {
    return make_failure<support_resolution_t>(
        make_error(error_code::invalid_release, std::string{kCodespace},
                   "Malformed reference release '" +
                       std::string{reference_release} + "'"));
  }

  auto chosen = std::optional<std::size_t>{};
  auto chosen_since = std::optional<dotted_version_t>{};
  for (std::size_t i = 0; i < schema.support_status.size(); ++i) {
    auto since = try_parse_dotted_version(schema.support_status[i].since);
    if (!since || *since > *reference) {
      continue;
    }
    if (!chosen_since || *since >= *chosen_since) {
      chosen = i;
      chosen_since = std::move(since);
    }
  }

  if (!chosen) {
    return make_failure<support_resolution_t>(make_error(
        error_code::unsupported_version, std::string{kCodespace},
        schema.type_name + "-" + schema.version +
            " has no support status as of release " + reference->text));
  }

  const auto& entry = schema.support_status[*chosen];
  return make_result(support_resolution_t{
      .status = entry.status, .since = entry.since, .entry_index = *chosen});
}

}  // namespace tessera::support
