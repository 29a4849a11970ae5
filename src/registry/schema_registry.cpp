#include <spdlog/spdlog.h>
#include <tessera/registry/schema_registry.hpp>
#include <tessera/validation/schema_checker.hpp>

#include <iterator>
#include <utility>

using namespace tessera::schema;

namespace {

constexpr auto kLookupCodespace = std::string_view{"tessera.lookup"};
constexpr auto kRegisterCodespace = std::string_view{"tessera.register"};

status_t unknown_schema(const std::string_view type_name,
                        const std::string_view version) {
  auto name = std::string{type_name};
  if (!version.empty()) {
    name += "-";
    name += version;
  }
  return make_error(error_code::unknown_schema, std::string{kLookupCodespace},
                    "The profile type '" + name + "' could not be found");
}

}  // namespace

namespace tessera::registry {

schema_sequence::schema_sequence(std::shared_ptr<const catalog_t> snapshot,
                                 const version_map_t* versions)
    : snapshot_{std::move(snapshot)}, versions_{versions} {}

schema_sequence::iterator schema_sequence::begin() const {
  return versions_ == nullptr ? iterator{} : iterator{versions_->cbegin()};
}

schema_sequence::iterator schema_sequence::end() const {
  return versions_ == nullptr ? iterator{} : iterator{versions_->cend()};
}

std::size_t schema_sequence::size() const {
  return versions_ == nullptr ? 0 : versions_->size();
}

bool schema_sequence::empty() const {
  return size() == 0;
}

result<schema_ptr_t> find_schema(const catalog_t& catalog,
                                 const std::string_view type_name,
                                 const std::string_view version) {
  auto versions = catalog.find(type_name);
  auto parsed = try_parse_dotted_version(version);
  if (versions == std::end(catalog) || !parsed) {
    return make_failure<schema_ptr_t>(unknown_schema(type_name, version));
  }
  auto it = versions->second.find(*parsed);
  if (it == std::end(versions->second)) {
    return make_failure<schema_ptr_t>(unknown_schema(type_name, version));
  }
  return make_result(it->second);
}

result<schema_ptr_t> find_latest(const catalog_t& catalog,
                                 const std::string_view type_name) {
  auto versions = catalog.find(type_name);
  if (versions == std::end(catalog) || versions->second.empty()) {
    return make_failure<schema_ptr_t>(unknown_schema(type_name, {}));
  }
  return make_result(std::prev(std::end(versions->second))->second);
}

schema_registry::schema_registry()
    : catalog_{std::make_shared<const catalog_t>()} {}

status_t schema_registry::register_schema(profile_type_schema_t schema) {
  auto schemas = std::vector<profile_type_schema_t>{};
  schemas.push_back(std::move(schema));
  return register_schemas(std::move(schemas));
}

status_t schema_registry::register_schemas(
    std::vector<profile_type_schema_t> schemas) {
  auto lock = std::scoped_lock{writer_mutex_};
  auto base = std::make_shared<catalog_t>(*catalog_.load());
  return publish(std::move(base), std::move(schemas));
}

status_t schema_registry::reload(std::vector<profile_type_schema_t> schemas) {
  auto lock = std::scoped_lock{writer_mutex_};
  spdlog::info("Reloading schema catalog with {} schema(s)", schemas.size());
  return publish(std::make_shared<catalog_t>(), std::move(schemas));
}

status_t schema_registry::publish(std::shared_ptr<catalog_t> base,
                                  std::vector<profile_type_schema_t> schemas) {
  for (auto& schema : schemas) {
    auto checked = tessera::validation::check_schema(schema);
    if (!checked.ok()) {
      spdlog::warn("Rejected profile type {}-{}: {}", schema.type_name,
                   schema.version, checked.log);
      return checked;
    }

    auto version = *try_parse_dotted_version(schema.version);
    auto& versions = (*base)[schema.type_name];
    if (versions.contains(version)) {
      spdlog::warn("Rejected duplicate profile type {}-{}", schema.type_name,
                   schema.version);
      return make_error(error_code::duplicate_schema,
                        std::string{kRegisterCodespace},
                        "The profile type '" + schema.type_name + "-" +
                            schema.version + "' is already registered");
    }
    spdlog::info("Registered profile type {}-{} with {} field(s)",
                 schema.type_name, schema.version, schema.fields.size());
    versions.emplace(std::move(version),
                     std::make_shared<const profile_type_schema_t>(
                         std::move(schema)));
  }

  catalog_.store(std::shared_ptr<const catalog_t>{std::move(base)});
  return status_t{};
}

result<schema_ptr_t> schema_registry::lookup(
    const std::string_view type_name,
    const std::string_view version) const {
  return find_schema(*catalog_.load(), type_name, version);
}

result<schema_ptr_t> schema_registry::lookup_latest(
    const std::string_view type_name) const {
  return find_latest(*catalog_.load(), type_name);
}

schema_sequence schema_registry::list(const std::string_view type_name) const {
  auto snapshot = catalog_.load();
  auto it = snapshot->find(type_name);
  const auto* versions = it == std::end(*snapshot) ? nullptr : &it->second;
  return schema_sequence{std::move(snapshot), versions};
}

std::vector<std::string> schema_registry::type_names() const {
  auto snapshot = catalog_.load();
  auto names = std::vector<std::string>{};
  names.reserve(snapshot->size());
  for (const auto& [name, versions] : *snapshot) {
    if (!versions.empty()) {
      names.push_back(name);
    }
  }
  return names;
}

std::size_t schema_registry::size() const {
  auto snapshot = catalog_.load();
  auto total = std::size_t{};
  for (const auto& [name, versions] : *snapshot) {
    total += versions.size();
  }
  return total;
}

std::shared_ptr<const catalog_t> schema_registry::snapshot() const {
  return catalog_.load();
}

}  // namespace tessera::registry
