#include <tessera/validation/schema_checker.hpp>
#include <tessera/validation/validator.hpp>

#include <iterator>
#include <set>
#include <string>

using namespace tessera::schema;

namespace {

constexpr auto kCodespace = std::string_view{"tessera.register"};

status_t invalid(std::string log, std::string field = {}) {
  return make_error(error_code::invalid_schema, std::string{kCodespace},
                    std::move(log), std::move(field));
}

status_t check_fields(const std::vector<field_spec_t>& fields,
                      const std::string& path);

// Normalizing may add nested defaults but must not alter any declared value.
bool only_adds_defaults(const value_t& declared, const value_t& normalized) {
  const auto* declared_map = declared.get_if<map_t>();
  const auto* normalized_map = normalized.get_if<map_t>();
  if (declared_map != nullptr && normalized_map != nullptr) {
    for (const auto& [key, value] : *declared_map) {
      auto it = normalized_map->find(key);
      if (it == std::end(*normalized_map) ||
          !only_adds_defaults(value, it->second)) {
        return false;
      }
    }
    return true;
  }
  const auto* declared_list = declared.get_if<list_t>();
  const auto* normalized_list = normalized.get_if<list_t>();
  if (declared_list != nullptr && normalized_list != nullptr) {
    if (declared_list->size() != normalized_list->size()) {
      return false;
    }
    for (std::size_t i = 0; i < declared_list->size(); ++i) {
      if (!only_adds_defaults((*declared_list)[i], (*normalized_list)[i])) {
        return false;
      }
    }
    return true;
  }
  return declared == normalized;
}

status_t check_conformant(const field_spec_t& field,
                          const value_t& value,
                          const std::string& path,
                          const std::string_view what) {
  auto normalized = value_t{};
  auto status = tessera::validation::normalize_value(field, value, path,
                                                     std::nullopt, normalized);
  if (!status.ok()) {
    return invalid("Invalid " + std::string{what} + " " + render(value) +
                       " for field '" + path + "': " + status.log,
                   path);
  }
  if (!only_adds_defaults(value, normalized)) {
    return invalid("Invalid " + std::string{what} + " " + describe(value) +
                       " for field '" + path + "': expected " +
                       std::string{to_string(field.type)},
                   path);
  }
  return status_t{};
}

status_t check_field(const field_spec_t& field, const std::string& path) {
  if (field.required && field.default_value) {
    return invalid("Field '" + path + "' is required and declares a default",
                   path);
  }

  if (!field.nested.empty()) {
    if (field.type != field_type_t::map && field.type != field_type_t::list) {
      return invalid("Schema valid only for List or Map, not " +
                         std::string{to_string(field.type)} + " (field '" +
                         path + "')",
                     path);
    }
    if (field.type == field_type_t::list) {
      if (field.nested.size() != 1) {
        return invalid(
            "List field '" + path + "' must declare exactly one element spec",
            path);
      }
      auto element = check_field(field.nested.front(), path + "[*]");
      if (!element.ok()) {
        return element;
      }
    } else {
      auto nested = check_fields(field.nested, path);
      if (!nested.ok()) {
        return nested;
      }
    }
  }

  auto min = std::optional<dotted_version_t>{};
  auto max = std::optional<dotted_version_t>{};
  if (field.min_version) {
    min = try_parse_dotted_version(*field.min_version);
    if (!min) {
      return invalid("Field '" + path + "' has malformed min_version '" +
                         *field.min_version + "'",
                     path);
    }
  }
  if (field.max_version) {
    max = try_parse_dotted_version(*field.max_version);
    if (!max) {
      return invalid("Field '" + path + "' has malformed max_version '" +
                         *field.max_version + "'",
                     path);
    }
  }
  if (min && max && *min > *max) {
    return invalid("Field '" + path + "' has min_version " + min->text +
                       " above max_version " + max->text,
                   path);
  }

  // Allowed values are checked without the constraint itself in effect.
  auto unconstrained = field;
  unconstrained.allowed_values.clear();
  for (const auto& allowed : field.allowed_values) {
    auto status = check_conformant(unconstrained, allowed, path, "allowed value");
    if (!status.ok()) {
      return status;
    }
  }

  if (field.default_value) {
    auto status = check_conformant(field, *field.default_value, path, "default");
    if (!status.ok()) {
      return status;
    }
  }
  return status_t{};
}

status_t check_fields(const std::vector<field_spec_t>& fields,
                      const std::string& path) {
  auto names = std::set<std::string>{};
  for (const auto& field : fields) {
    auto field_path = path.empty() ? field.name : path + "." + field.name;
    if (field.name.empty()) {
      return invalid("Field names must not be empty (under '" + path + "')",
                     path);
    }
    if (!names.insert(field.name).second) {
      return invalid("Duplicate field name '" + field_path + "'", field_path);
    }
    auto status = check_field(field, field_path);
    if (!status.ok()) {
      return status;
    }
  }
  return status_t{};
}

}  // namespace

namespace tessera::validation {

status_t check_schema(const profile_type_schema_t& schema) {
  if (schema.type_name.empty()) {
    return invalid("Schema type_name must not be empty");
  }
  if (!try_parse_dotted_version(schema.version)) {
    return invalid("Schema " + schema.type_name + " has malformed version '" +
                   schema.version + "'");
  }

  auto status = check_fields(schema.fields, "");
  if (!status.ok()) {
    return status;
  }

  auto previous = std::optional<dotted_version_t>{};
  for (const auto& entry : schema.support_status) {
    auto since = try_parse_dotted_version(entry.since);
    if (!since) {
      return invalid("Support status of " + schema.type_name + "-" +
                     schema.version + " has malformed release '" +
                     entry.since + "'");
    }
    if (previous && *since <= *previous) {
      return invalid("Support status of " + schema.type_name + "-" +
                     schema.version + " regresses from release " +
                     previous->text + " to " + since->text);
    }
    previous = std::move(since);
  }
  return status_t{};
}

}  // namespace tessera::validation
