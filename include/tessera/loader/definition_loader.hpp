#pragma once
#include <tessera/schema/primitives.hpp>
#include <tessera/schema/profile_type_schema.hpp>
#include <tessera/schema/result.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string_view>
#include <vector>

namespace tessera::loader {

using schema_list_t = std::vector<tessera::schema::profile_type_schema_t>;

/// Parse one profile type definition document.
///
/// A definition declares `type_name`, a `schema` object of field specs and
/// a `support_status` object keyed by version. One schema is produced per
/// version key, all sharing the same fields. Parse and shape errors are
/// reported as invalid_schema; registration invariants are left to the
/// registry.
tessera::schema::result<schema_list_t> parse_definition(std::string_view text);

/// Same as parse_definition for an already parsed document.
tessera::schema::result<schema_list_t> parse_definition_document(
    const nlohmann::json& document);

tessera::schema::result<schema_list_t> load_definition_file(
    const std::filesystem::path& path);

/// Load every `*.json` definition under `directory`, in file name order.
tessera::schema::result<schema_list_t> load_directory(
    const std::filesystem::path& directory);

tessera::schema::value_t to_value(const nlohmann::json& json);
nlohmann::json to_json(const tessera::schema::value_t& value);

/// Parse a JSON object into a raw spec map; anything else is rejected.
tessera::schema::result<tessera::schema::map_t> parse_spec(
    std::string_view text);

}  // namespace tessera::loader
