#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>
#include <tessera/execution/engine.hpp>
#include <tessera/loader/definition_loader.hpp>
#include <tessera/registry/schema_registry.hpp>
#include <tessera/support/resolver.hpp>

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;
using namespace tessera::schema;

constexpr auto kUsage =
    "Usage: tessera_profile_tool <types|versions|show|validate|update|support> "
    "[options]";

void configure_logging(const bool verbose) {
  auto logger = spdlog::stderr_color_mt("tessera");
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
}

int emit(const nlohmann::json& document) {
  std::cout << document.dump(2) << std::endl;
  return 0;
}

int emit_error(const status_t& status,
               const std::vector<std::string>& warnings = {}) {
  auto document = nlohmann::json{{"ok", false},
                                 {"code", static_cast<uint32_t>(status.code)},
                                 {"error", std::string{to_string(status.code)}},
                                 {"codespace", status.codespace},
                                 {"message", status.log}};
  if (!status.field.empty()) {
    document["field"] = status.field;
  }
  if (!status.expected.empty()) {
    document["expected"] = status.expected;
  }
  if (!status.received.empty()) {
    document["received"] = status.received;
  }
  if (!warnings.empty()) {
    document["warnings"] = warnings;
  }
  std::cout << document.dump(2) << std::endl;
  return static_cast<int>(status.code);
}

// EX_USAGE from sysexits.h; error codes of the engine stay below it.
constexpr auto kUsageExitCode = 64;

int usage_error(const std::string& message) {
  std::cerr << message << "\n" << kUsage << std::endl;
  return kUsageExitCode;
}

// Values starting with '@' name a file holding the JSON text.
std::optional<std::string> read_argument(const std::string& argument) {
  if (argument.empty() || argument.front() != '@') {
    return argument;
  }
  auto stream = std::ifstream{argument.substr(1)};
  if (!stream) {
    return std::nullopt;
  }
  auto buffer = std::stringstream{};
  buffer << stream.rdbuf();
  return buffer.str();
}

std::optional<std::string> read_json_option(const po::variables_map& vm,
                                            const std::string& name) {
  if (!vm.contains(name)) {
    return std::nullopt;
  }
  return read_argument(vm[name].as<std::string>());
}

nlohmann::json field_to_json(const field_spec_t& field) {
  auto out = nlohmann::json{{"type", std::string{to_string(field.type)}},
                            {"description", field.description},
                            {"required", field.required},
                            {"updatable", field.updatable}};
  if (field.default_value) {
    out["default"] = tessera::loader::to_json(*field.default_value);
  }
  if (field.min_version) {
    out["min_version"] = *field.min_version;
  }
  if (field.max_version) {
    out["max_version"] = *field.max_version;
  }
  if (!field.allowed_values.empty()) {
    auto allowed = nlohmann::json::array();
    for (const auto& value : field.allowed_values) {
      allowed.push_back(tessera::loader::to_json(value));
    }
    out["allowed_values"] = allowed;
  }
  if (!field.nested.empty()) {
    auto nested = nlohmann::json::object();
    if (field.type == field_type_t::list) {
      nested["*"] = field_to_json(field.nested.front());
    } else {
      for (const auto& child : field.nested) {
        nested[child.name] = field_to_json(child);
      }
    }
    out["schema"] = nested;
  }
  return out;
}

nlohmann::json schema_to_json(const profile_type_schema_t& schema) {
  auto fields = nlohmann::json::object();
  for (const auto& field : schema.fields) {
    fields[field.name] = field_to_json(field);
  }
  auto ledger = nlohmann::json::array();
  for (const auto& entry : schema.support_status) {
    ledger.push_back({{"status", std::string{to_string(entry.status)}},
                      {"since", entry.since}});
  }
  return nlohmann::json{
      {"type_name", schema.type_name},
      {"schema", fields},
      {"support_status", nlohmann::json{{schema.version, ledger}}}};
}

nlohmann::json spec_to_json(const profile_spec_t& spec,
                            const std::vector<std::string>& warnings) {
  auto out = nlohmann::json{
      {"ok", true},
      {"type_name", spec.type_name},
      {"version", spec.version},
      {"properties", tessera::loader::to_json(value_t{spec.properties})}};
  if (!warnings.empty()) {
    out["warnings"] = warnings;
  }
  return out;
}

std::string required_option(const po::variables_map& vm,
                            const std::string& name) {
  return vm.contains(name) ? vm[name].as<std::string>() : std::string{};
}

}  // namespace

int main(int argc, char* argv[]) {
  auto command = std::string{};
  auto schema_dir = std::string{};
  auto config_file = std::string{};

  auto description = po::options_description{"tessera profile tool"};
  description.add_options()("help,h", "Show the help message")(
      "command", po::value<std::string>(&command),
      "types, versions, show, validate, update or support")(
      "config,c", po::value<std::string>(&config_file),
      "INI file providing any of the options below")(
      "schema-dir,d", po::value<std::string>(&schema_dir),
      "Directory of *.json profile type definitions")(
      "type,t", po::value<std::string>(), "Profile type name")(
      "version", po::value<std::string>(),
      "Profile type version (defaults to the latest)")(
      "spec,s", po::value<std::string>(), "Raw spec JSON (or @file)")(
      "current", po::value<std::string>(), "Current spec JSON (or @file)")(
      "patch,p", po::value<std::string>(), "Update patch JSON (or @file)")(
      "release,r", po::value<std::string>(),
      "Reference release for the support command")(
      "current-release", po::value<std::string>(),
      "Platform release used to gate validate and update")(
      "reject-unsupported", po::bool_switch(),
      "Fail instead of warning on UNSUPPORTED profile types")(
      "verbose,v", po::bool_switch(), "Enable debug logging");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(description)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
    if (!config_file.empty()) {
      po::store(po::parse_config_file<char>(config_file.c_str(), description),
                vm);
      po::notify(vm);
    }
  } catch (const po::error& ex) {
    return usage_error(ex.what());
  }

  if (vm.contains("help") || command.empty()) {
    std::cout << kUsage << "\n" << description << std::endl;
    return vm.contains("help") ? 0 : kUsageExitCode;
  }

  configure_logging(vm["verbose"].as<bool>());

  auto options = tessera::execution::engine_options{};
  if (vm.contains("current-release")) {
    options.current_release = vm["current-release"].as<std::string>();
  }
  options.reject_unsupported = vm["reject-unsupported"].as<bool>();

  auto registry = tessera::registry::schema_registry{};
  if (!schema_dir.empty()) {
    auto loaded = tessera::loader::load_directory(schema_dir);
    if (!loaded.ok()) {
      return emit_error(loaded.status);
    }
    auto registered = registry.register_schemas(std::move(*loaded.value));
    if (!registered.ok()) {
      return emit_error(registered);
    }
  }
  auto engine = tessera::execution::engine{registry, options};

  if (command == "types") {
    return emit(nlohmann::json(registry.type_names()));
  }

  auto type_name = required_option(vm, "type");
  if (type_name.empty()) {
    return usage_error("--type is required for " + command);
  }

  if (command == "versions") {
    auto versions = nlohmann::json::array();
    for (const auto& schema : registry.list(type_name)) {
      auto entry = nlohmann::json{{"version", schema.version}};
      if (vm.contains("release")) {
        auto resolved = tessera::support::resolve(
            schema, vm["release"].as<std::string>());
        entry["status"] =
            resolved.ok() ? std::string{to_string(resolved.value->status)}
                          : std::string{to_string(resolved.status.code)};
      }
      versions.push_back(entry);
    }
    if (versions.empty()) {
      return emit_error(registry.lookup_latest(type_name).status);
    }
    return emit(versions);
  }

  auto version = required_option(vm, "version");
  if (version.empty()) {
    auto latest = registry.lookup_latest(type_name);
    if (!latest.ok()) {
      return emit_error(latest.status);
    }
    version = (*latest.value)->version;
  }

  if (command == "show") {
    auto schema = registry.lookup(type_name, version);
    if (!schema.ok()) {
      return emit_error(schema.status);
    }
    return emit(schema_to_json(**schema.value));
  }

  if (command == "validate") {
    auto text = read_json_option(vm, "spec");
    if (!text) {
      return usage_error("--spec is required and must be readable");
    }
    auto raw = tessera::loader::parse_spec(*text);
    if (!raw.ok()) {
      return emit_error(raw.status);
    }
    auto validated = engine.validate(type_name, version, *raw.value);
    if (!validated.ok()) {
      return emit_error(validated.status, validated.warnings);
    }
    return emit(spec_to_json(*validated.value, validated.warnings));
  }

  if (command == "update") {
    auto current_text = read_json_option(vm, "current");
    auto patch_text = read_json_option(vm, "patch");
    if (!current_text || !patch_text) {
      return usage_error("--current and --patch are required and must be "
                         "readable");
    }
    auto current_raw = tessera::loader::parse_spec(*current_text);
    if (!current_raw.ok()) {
      return emit_error(current_raw.status);
    }
    auto patch = tessera::loader::parse_spec(*patch_text);
    if (!patch.ok()) {
      return emit_error(patch.status);
    }
    auto current = engine.validate(type_name, version, *current_raw.value);
    if (!current.ok()) {
      return emit_error(current.status, current.warnings);
    }
    auto updated =
        engine.update(type_name, version, *current.value, *patch.value);
    if (!updated.ok()) {
      return emit_error(updated.status, updated.warnings);
    }
    return emit(spec_to_json(*updated.value, updated.warnings));
  }

  if (command == "support") {
    auto release = required_option(vm, "release");
    if (release.empty()) {
      return usage_error("--release is required for support");
    }
    auto resolved = engine.resolve_support(type_name, version, release);
    if (!resolved.ok()) {
      return emit_error(resolved.status);
    }
    return emit(nlohmann::json{
        {"ok", true},
        {"type_name", type_name},
        {"version", version},
        {"status", std::string{to_string(resolved.value->status)}},
        {"since", resolved.value->since}});
  }

  return usage_error("Unknown command '" + command + "'");
}
