#include <spdlog/spdlog.h>
#include <tessera/validation/validator.hpp>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <iterator>
#include <string>

using namespace tessera::schema;

namespace {

constexpr auto kCodespace = std::string_view{"tessera.validate"};

std::string join_path(const std::string_view parent,
                      const std::string_view name) {
  if (parent.empty()) {
    return std::string{name};
  }
  auto out = std::string{parent};
  out.push_back('.');
  out += name;
  return out;
}

std::string index_path(const std::string_view parent, const std::size_t index) {
  return std::string{parent} + "[" + std::to_string(index) + "]";
}

std::string_view strip_plus(std::string_view text) {
  if (text.size() > 1 && text.front() == '+' && text[1] != '-') {
    text.remove_prefix(1);
  }
  return text;
}

std::optional<int64_t> parse_integer(std::string_view text) {
  text = strip_plus(text);
  if (text.empty()) {
    return std::nullopt;
  }
  auto value = int64_t{};
  const auto* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), last, value);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return value;
}

std::optional<double> parse_float(std::string_view text) {
  text = strip_plus(text);
  if (text.empty()) {
    return std::nullopt;
  }
  auto value = double{};
  const auto* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), last, value);
  if (ec != std::errc{} || ptr != last || !std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

status_t type_mismatch(const std::string_view path,
                       const field_spec_t& field,
                       const value_t& input) {
  auto expected = std::string{to_string(field.type)};
  auto received = describe(input);
  return make_error(error_code::type_mismatch, std::string{kCodespace},
                    "The value " + received + " is not a valid " + expected +
                        " for field '" + std::string{path} + "'",
                    std::string{path}, expected, received);
}

bool field_in_window(const field_spec_t& field,
                     const std::optional<dotted_version_t>& schema_version) {
  if (!schema_version) {
    return true;
  }
  if (field.min_version) {
    auto min = try_parse_dotted_version(*field.min_version);
    if (min && *schema_version < *min) {
      return false;
    }
  }
  if (field.max_version) {
    auto max = try_parse_dotted_version(*field.max_version);
    if (max && *schema_version > *max) {
      return false;
    }
  }
  return true;
}

status_t check_window(const field_spec_t& field,
                      const std::string_view path,
                      const std::optional<dotted_version_t>& schema_version) {
  if (!schema_version) {
    return status_t{};
  }
  if (field.min_version) {
    auto min = try_parse_dotted_version(*field.min_version);
    if (min && *schema_version < *min) {
      return make_error(error_code::field_version_unsupported,
                        std::string{kCodespace},
                        std::string{path} + " (min_version=" +
                            *field.min_version +
                            ") is not supported by spec version " +
                            schema_version->text + ".",
                        std::string{path});
    }
  }
  if (field.max_version) {
    auto max = try_parse_dotted_version(*field.max_version);
    if (max && *schema_version > *max) {
      return make_error(error_code::field_version_unsupported,
                        std::string{kCodespace},
                        std::string{path} + " (max_version=" +
                            *field.max_version +
                            ") is not supported by spec version " +
                            schema_version->text + ".",
                        std::string{path});
    }
    if (max && *schema_version == *max) {
      spdlog::warn("{} (max_version={}) will not be supported after spec "
                   "version {}",
                   path, *field.max_version, schema_version->text);
    }
  }
  return status_t{};
}

status_t normalize_fields(const std::vector<field_spec_t>& fields,
                          const map_t& input,
                          const std::string_view path,
                          const std::optional<dotted_version_t>& schema_version,
                          const bool apply_defaults,
                          map_t& out) {
  for (const auto& [key, value] : input) {
    if (find_field(fields, key) == nullptr) {
      auto field_path = join_path(path, key);
      return make_error(error_code::unknown_field, std::string{kCodespace},
                        "Unrecognizable spec item '" + field_path + "'",
                        field_path);
    }
  }

  for (const auto& field : fields) {
    auto field_path = join_path(path, field.name);
    auto it = input.find(field.name);
    if (it != std::end(input)) {
      auto window = check_window(field, field_path, schema_version);
      if (!window.ok()) {
        return window;
      }
      auto normalized = value_t{};
      auto status = tessera::validation::normalize_value(
          field, it->second, field_path, schema_version, normalized);
      if (!status.ok()) {
        return status;
      }
      out.insert_or_assign(field.name, std::move(normalized));
      continue;
    }

    if (!apply_defaults || !field_in_window(field, schema_version)) {
      continue;
    }
    if (field.required) {
      return make_error(error_code::missing_required_field,
                        std::string{kCodespace},
                        "Required spec item '" + field_path + "' not provided",
                        field_path);
    }
    if (field.default_value) {
      // Defaults of nested Map/List specs fill in the declared default.
      auto normalized = value_t{};
      auto status = tessera::validation::normalize_value(
          field, *field.default_value, field_path, schema_version, normalized);
      if (!status.ok()) {
        return status;
      }
      out.insert_or_assign(field.name, std::move(normalized));
    }
  }
  return status_t{};
}

}  // namespace

namespace tessera::validation {

status_t normalize_value(const field_spec_t& field,
                         const value_t& input,
                         const std::string_view path,
                         const std::optional<dotted_version_t>& schema_version,
                         value_t& out) {
  auto status = status_t{};
  switch (field.type) {
    case field_type_t::boolean:
      if (!input.is<bool>()) {
        return type_mismatch(path, field, input);
      }
      out = input;
      break;
    case field_type_t::integer:
      if (input.is<int64_t>()) {
        out = input;
      } else if (const auto* text = input.get_if<std::string>()) {
        auto parsed = parse_integer(*text);
        if (!parsed) {
          return type_mismatch(path, field, input);
        }
        out = value_t{*parsed};
      } else {
        return type_mismatch(path, field, input);
      }
      break;
    case field_type_t::floating:
      if (input.is<double>()) {
        out = input;
      } else if (const auto* text = input.get_if<std::string>()) {
        auto parsed = parse_float(*text);
        if (!parsed) {
          return type_mismatch(path, field, input);
        }
        out = value_t{*parsed};
      } else {
        return type_mismatch(path, field, input);
      }
      break;
    case field_type_t::string:
      if (!input.is<std::string>()) {
        return type_mismatch(path, field, input);
      }
      out = input;
      break;
    case field_type_t::map: {
      const auto* entries = input.get_if<map_t>();
      if (entries == nullptr) {
        return type_mismatch(path, field, input);
      }
      if (field.nested.empty()) {
        out = input;
        break;
      }
      auto normalized = map_t{};
      status = normalize_fields(field.nested, *entries, path, schema_version,
                                true, normalized);
      if (!status.ok()) {
        return status;
      }
      out = value_t{std::move(normalized)};
      break;
    }
    case field_type_t::list: {
      const auto* items = input.get_if<list_t>();
      if (items == nullptr) {
        return type_mismatch(path, field, input);
      }
      if (field.nested.empty()) {
        out = input;
        break;
      }
      auto normalized = list_t{};
      normalized.reserve(items->size());
      for (std::size_t i = 0; i < items->size(); ++i) {
        auto item = value_t{};
        status = normalize_value(field.nested.front(), (*items)[i],
                                 index_path(path, i), schema_version, item);
        if (!status.ok()) {
          return status;
        }
        normalized.push_back(std::move(item));
      }
      out = value_t{std::move(normalized)};
      break;
    }
  }

  if (!field.allowed_values.empty() &&
      std::find(std::begin(field.allowed_values),
                std::end(field.allowed_values),
                out) == std::end(field.allowed_values)) {
    auto allowed = std::string{};
    for (const auto& candidate : field.allowed_values) {
      if (!allowed.empty()) {
        allowed += ", ";
      }
      allowed += render(candidate);
    }
    return make_error(error_code::constraint_violated, std::string{kCodespace},
                      "The value " + render(out) + " for field '" +
                          std::string{path} + "' is not one of: " + allowed,
                      std::string{path}, allowed, describe(input));
  }
  return status;
}

result<profile_spec_t> validate(const profile_type_schema_t& schema,
                                const map_t& raw_spec) {
  auto schema_version = try_parse_dotted_version(schema.version);
  auto properties = map_t{};
  auto status = normalize_fields(schema.fields, raw_spec, "", schema_version,
                                 true, properties);
  if (!status.ok()) {
    spdlog::debug("Spec for {}-{} rejected: {}", schema.type_name,
                  schema.version, status.log);
    return make_failure<profile_spec_t>(std::move(status));
  }
  spdlog::debug("Spec for {}-{} normalized with {} field(s)", schema.type_name,
                schema.version, properties.size());
  return make_result(profile_spec_t{.type_name = schema.type_name,
                                    .version = schema.version,
                                    .properties = std::move(properties)});
}

result<map_t> validate_patch(const profile_type_schema_t& schema,
                             const map_t& raw_patch) {
  auto schema_version = try_parse_dotted_version(schema.version);
  auto patch = map_t{};
  auto status = normalize_fields(schema.fields, raw_patch, "", schema_version,
                                 false, patch);
  if (!status.ok()) {
    return make_failure<map_t>(std::move(status));
  }
  return make_result(std::move(patch));
}

}  // namespace tessera::validation
