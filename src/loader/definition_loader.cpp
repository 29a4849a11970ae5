#include <spdlog/spdlog.h>
#include <tessera/loader/definition_loader.hpp>
#include <tessera/schema/field_type.hpp>
#include <tessera/schema/support_status.hpp>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>
#include <string>
#include <system_error>

using namespace tessera::schema;

namespace {

constexpr auto kCodespace = std::string_view{"tessera.load"};

status_t invalid(std::string log) {
  return make_error(error_code::invalid_schema, std::string{kCodespace},
                    std::move(log));
}

status_t read_bool(const nlohmann::json& spec,
                   const char* key,
                   const std::string& path,
                   bool& out) {
  auto it = spec.find(key);
  if (it == spec.end()) {
    return status_t{};
  }
  if (!it->is_boolean()) {
    return invalid("'" + std::string{key} + "' of field '" + path +
                   "' must be a boolean");
  }
  out = it->get<bool>();
  return status_t{};
}

status_t read_string(const nlohmann::json& spec,
                     const char* key,
                     const std::string& path,
                     std::optional<std::string>& out) {
  auto it = spec.find(key);
  if (it == spec.end()) {
    return status_t{};
  }
  if (!it->is_string()) {
    return invalid("'" + std::string{key} + "' of field '" + path +
                   "' must be a string");
  }
  out = it->get<std::string>();
  return status_t{};
}

status_t parse_fields(const nlohmann::json& object,
                      const std::string& path,
                      std::vector<field_spec_t>& out);

status_t parse_field(const std::string& name,
                     const nlohmann::json& spec,
                     const std::string& path,
                     field_spec_t& field) {
  if (!spec.is_object()) {
    return invalid("Field '" + path + "' must be an object");
  }
  field.name = name;

  auto type = spec.find("type");
  if (type == spec.end() || !type->is_string()) {
    return invalid("Field '" + path + "' must declare a string 'type'");
  }
  auto parsed_type = try_from_string<field_type_t>(type->get<std::string>());
  if (!parsed_type) {
    return invalid("Field '" + path + "' has unknown type '" +
                   type->get<std::string>() + "', expected " +
                   join_names(kFieldTypeMappings));
  }
  field.type = *parsed_type;

  if (auto it = spec.find("default"); it != spec.end()) {
    field.default_value = tessera::loader::to_value(*it);
  }
  auto description = std::optional<std::string>{};
  for (auto status : {read_bool(spec, "required", path, field.required),
                      read_bool(spec, "updatable", path, field.updatable),
                      read_string(spec, "description", path, description),
                      read_string(spec, "min_version", path, field.min_version),
                      read_string(spec, "max_version", path, field.max_version)}) {
    if (!status.ok()) {
      return status;
    }
  }
  field.description = description.value_or("");

  if (auto it = spec.find("allowed_values"); it != spec.end()) {
    if (!it->is_array()) {
      return invalid("'allowed_values' of field '" + path +
                     "' must be an array");
    }
    for (const auto& allowed : *it) {
      field.allowed_values.push_back(tessera::loader::to_value(allowed));
    }
  }

  if (auto it = spec.find("schema"); it != spec.end()) {
    if (!it->is_object()) {
      return invalid("'schema' of field '" + path + "' must be an object");
    }
    if (field.type == field_type_t::list) {
      // A List element is keyed by "*" (any index).
      if (it->size() != 1 || !it->contains("*")) {
        return invalid("List field '" + path +
                       "' must declare its element schema under '*'");
      }
      auto element = field_spec_t{};
      auto status = parse_field("*", it->at("*"), path + "[*]", element);
      if (!status.ok()) {
        return status;
      }
      field.nested.push_back(std::move(element));
    } else {
      auto status = parse_fields(*it, path, field.nested);
      if (!status.ok()) {
        return status;
      }
    }
  }
  return status_t{};
}

status_t parse_fields(const nlohmann::json& object,
                      const std::string& path,
                      std::vector<field_spec_t>& out) {
  for (const auto& [name, spec] : object.items()) {
    auto field_path = path.empty() ? name : path + "." + name;
    auto field = field_spec_t{};
    auto status = parse_field(name, spec, field_path, field);
    if (!status.ok()) {
      return status;
    }
    out.push_back(std::move(field));
  }
  return status_t{};
}

status_t parse_ledger(const nlohmann::json& entries,
                      const std::string& label,
                      std::vector<support_status_entry_t>& out) {
  if (!entries.is_array()) {
    return invalid("Support status of " + label + " must be an array");
  }
  for (const auto& entry : entries) {
    if (!entry.is_object()) {
      return invalid("Support status entries of " + label +
                     " must be objects");
    }
    auto status = entry.find("status");
    auto since = entry.find("since");
    if (status == entry.end() || !status->is_string() ||
        since == entry.end() || !since->is_string()) {
      return invalid("Support status entries of " + label +
                     " need string 'status' and 'since'");
    }
    auto parsed = try_from_string<support_status_t>(status->get<std::string>());
    if (!parsed) {
      return invalid("Unknown support status '" + status->get<std::string>() +
                     "' for " + label + ", expected " +
                     join_names(kSupportStatusMappings));
    }
    out.push_back(support_status_entry_t{.status = *parsed,
                                         .since = since->get<std::string>()});
  }
  return status_t{};
}

}  // namespace

namespace tessera::loader {

value_t to_value(const nlohmann::json& json) {
  switch (json.type()) {
    case nlohmann::json::value_t::boolean:
      return value_t{json.get<bool>()};
    case nlohmann::json::value_t::number_integer:
      return value_t{json.get<int64_t>()};
    case nlohmann::json::value_t::number_unsigned: {
      // Beyond the Integer range; kept as a Float so Integer fields reject it.
      const auto unsigned_value = json.get<uint64_t>();
      if (unsigned_value >
          static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return value_t{static_cast<double>(unsigned_value)};
      }
      return value_t{static_cast<int64_t>(unsigned_value)};
    }
    case nlohmann::json::value_t::number_float:
      return value_t{json.get<double>()};
    case nlohmann::json::value_t::string:
      return value_t{json.get<std::string>()};
    case nlohmann::json::value_t::array: {
      auto items = list_t{};
      items.reserve(json.size());
      for (const auto& item : json) {
        items.push_back(to_value(item));
      }
      return value_t{std::move(items)};
    }
    case nlohmann::json::value_t::object: {
      auto entries = map_t{};
      for (const auto& [key, item] : json.items()) {
        entries.insert_or_assign(key, to_value(item));
      }
      return value_t{std::move(entries)};
    }
    default:
      return value_t{};
  }
}

nlohmann::json to_json(const value_t& value) {
  return std::visit(
      overloaded{[](const std::monostate&) { return nlohmann::json{}; },
                 [](const bool arg) { return nlohmann::json(arg); },
                 [](const int64_t arg) { return nlohmann::json(arg); },
                 [](const double arg) { return nlohmann::json(arg); },
                 [](const std::string& arg) { return nlohmann::json(arg); },
                 [](const list_t& arg) {
                   auto out = nlohmann::json::array();
                   for (const auto& item : arg) {
                     out.push_back(to_json(item));
                   }
                   return out;
                 },
                 [](const map_t& arg) {
                   auto out = nlohmann::json::object();
                   for (const auto& [key, item] : arg) {
                     out[key] = to_json(item);
                   }
                   return out;
                 }},
      value.data);
}

result<schema_list_t> parse_definition_document(
    const nlohmann::json& document) {
  if (!document.is_object()) {
    return make_failure<schema_list_t>(
        invalid("Profile type definition must be an object"));
  }
  auto type_name = document.find("type_name");
  if (type_name == document.end() || !type_name->is_string()) {
    return make_failure<schema_list_t>(
        invalid("Profile type definition needs a string 'type_name'"));
  }
  auto name = type_name->get<std::string>();

  auto fields = std::vector<field_spec_t>{};
  if (auto it = document.find("schema"); it != document.end()) {
    if (!it->is_object()) {
      return make_failure<schema_list_t>(
          invalid("'schema' of " + name + " must be an object"));
    }
    auto status = parse_fields(*it, "", fields);
    if (!status.ok()) {
      return make_failure<schema_list_t>(std::move(status));
    }
  }

  auto ledger = document.find("support_status");
  if (ledger == document.end() || !ledger->is_object() || ledger->empty()) {
    return make_failure<schema_list_t>(invalid(
        "Profile type " + name + " must declare 'support_status' by version"));
  }

  auto schemas = schema_list_t{};
  for (const auto& [version, entries] : ledger->items()) {
    auto schema = profile_type_schema_t{
        .type_name = name, .version = version, .fields = fields};
    auto status =
        parse_ledger(entries, name + "-" + version, schema.support_status);
    if (!status.ok()) {
      return make_failure<schema_list_t>(std::move(status));
    }
    schemas.push_back(std::move(schema));
  }
  return make_result(std::move(schemas));
}

result<schema_list_t> parse_definition(const std::string_view text) {
  try {
    return parse_definition_document(nlohmann::json::parse(text));
  } catch (const nlohmann::json::exception& ex) {
    return make_failure<schema_list_t>(
        invalid(std::string{"Malformed definition: "} + ex.what()));
  }
}

result<schema_list_t> load_definition_file(const std::filesystem::path& path) {
  auto stream = std::ifstream{path};
  if (!stream) {
    return make_failure<schema_list_t>(
        invalid("Unable to open definition file '" + path.string() + "'"));
  }
  auto buffer = std::stringstream{};
  buffer << stream.rdbuf();
  auto loaded = parse_definition(buffer.str());
  if (!loaded.ok()) {
    loaded.status.log = path.filename().string() + ": " + loaded.status.log;
    return loaded;
  }
  spdlog::debug("Loaded {} schema(s) from {}", loaded.value->size(),
                path.string());
  return loaded;
}

result<schema_list_t> load_directory(const std::filesystem::path& directory) {
  auto error = std::error_code{};
  auto files = std::vector<std::filesystem::path>{};
  for (auto it = std::filesystem::directory_iterator{directory, error};
       !error && it != std::filesystem::directory_iterator{};
       it.increment(error)) {
    auto type_error = std::error_code{};
    if (it->is_regular_file(type_error) &&
        it->path().extension() == ".json") {
      files.push_back(it->path());
    }
  }
  if (error) {
    return make_failure<schema_list_t>(invalid(
        "Unable to read schema directory '" + directory.string() +
        "': " + error.message()));
  }
  std::sort(std::begin(files), std::end(files));

  auto schemas = schema_list_t{};
  for (const auto& file : files) {
    auto loaded = load_definition_file(file);
    if (!loaded.ok()) {
      return loaded;
    }
    std::move(std::begin(*loaded.value), std::end(*loaded.value),
              std::back_inserter(schemas));
  }
  spdlog::info("Loaded {} schema(s) from {} definition file(s) in {}",
               schemas.size(), files.size(), directory.string());
  return make_result(std::move(schemas));
}

result<map_t> parse_spec(const std::string_view text) {
  try {
    auto document = nlohmann::json::parse(text);
    if (!document.is_object()) {
      return make_failure<map_t>(make_error(
          error_code::type_mismatch, std::string{kCodespace},
          "A profile spec must be a JSON object", "", "Map",
          std::string{document.type_name()}));
    }
    return make_result(*to_value(document).get_if<map_t>());
  } catch (const nlohmann::json::exception& ex) {
    return make_failure<map_t>(make_error(
        error_code::type_mismatch, std::string{kCodespace},
        std::string{"Malformed spec: "} + ex.what(), "", "Map", "text"));
  }
}

}  // namespace tessera::loader
