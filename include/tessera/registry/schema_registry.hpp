#pragma once
#include <tessera/schema/dotted_version.hpp>
#include <tessera/schema/profile_type_schema.hpp>
#include <tessera/schema/result.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace tessera::registry {

using schema_ptr_t =
    std::shared_ptr<const tessera::schema::profile_type_schema_t>;
using version_map_t = std::map<tessera::schema::dotted_version_t, schema_ptr_t>;
using catalog_t = std::map<std::string, version_map_t, std::less<>>;

/// Registered versions of one profile type, ascending.
///
/// The sequence pins the catalog snapshot it was created from, so it stays
/// valid and unchanged across later registrations. Iterating it again
/// yields the same schemas.
class schema_sequence final {
 public:
  class iterator final {
   public:
    using iterator_category = std::forward_iterator_tag;
    using difference_type = std::ptrdiff_t;
    using value_type = tessera::schema::profile_type_schema_t;
    using pointer = const value_type*;
    using reference = const value_type&;

    iterator() = default;
    explicit iterator(version_map_t::const_iterator it) : it_{it} {}

    reference operator*() const { return *it_->second; }
    pointer operator->() const { return it_->second.get(); }
    iterator& operator++() {
      ++it_;
      return *this;
    }
    iterator operator++(int) {
      auto copy = *this;
      ++it_;
      return copy;
    }
    bool operator==(const iterator& other) const { return it_ == other.it_; }
    bool operator!=(const iterator& other) const { return it_ != other.it_; }

   private:
    version_map_t::const_iterator it_;
  };

  schema_sequence(std::shared_ptr<const catalog_t> snapshot,
                  const version_map_t* versions);

  iterator begin() const;
  iterator end() const;
  std::size_t size() const;
  bool empty() const;

 private:
  std::shared_ptr<const catalog_t> snapshot_;
  const version_map_t* versions_{nullptr};
};

/// Find one (type_name, version) in a catalog snapshot.
tessera::schema::result<schema_ptr_t> find_schema(const catalog_t& catalog,
                                                  std::string_view type_name,
                                                  std::string_view version);

/// Find the highest registered version of a type in a catalog snapshot.
tessera::schema::result<schema_ptr_t> find_latest(const catalog_t& catalog,
                                                  std::string_view type_name);

/// Process-wide catalog of profile type schemas.
///
/// Populated once during start-up and read-mostly afterwards. The catalog is
/// an immutable snapshot published through an atomic shared pointer: readers
/// never block, writers are serialized and publish a modified copy, and
/// in-flight readers keep the snapshot they loaded.
class schema_registry final {
 public:
  schema_registry();

  schema_registry(const schema_registry&) = delete;
  schema_registry& operator=(const schema_registry&) = delete;

  /// Register one schema after checking its invariants.
  ///
  /// Fails with duplicate_schema when (type_name, version) is present and
  /// with invalid_schema when the schema checker rejects it.
  tessera::schema::status_t register_schema(
      tessera::schema::profile_type_schema_t schema);

  /// Register several schemas atomically: either all or none are published.
  tessera::schema::status_t register_schemas(
      std::vector<tessera::schema::profile_type_schema_t> schemas);

  /// Replace the whole catalog (hot reload). The live catalog is untouched
  /// if any schema is rejected.
  tessera::schema::status_t reload(
      std::vector<tessera::schema::profile_type_schema_t> schemas);

  tessera::schema::result<schema_ptr_t> lookup(std::string_view type_name,
                                               std::string_view version) const;

  tessera::schema::result<schema_ptr_t> lookup_latest(
      std::string_view type_name) const;

  /// Lazily enumerate registered versions of a type, ascending.
  schema_sequence list(std::string_view type_name) const;

  /// Registered type names, sorted.
  std::vector<std::string> type_names() const;

  /// Total number of registered (type_name, version) pairs.
  std::size_t size() const;

  /// Current immutable catalog.
  std::shared_ptr<const catalog_t> snapshot() const;

 private:
  tessera::schema::status_t publish(
      std::shared_ptr<catalog_t> base,
      std::vector<tessera::schema::profile_type_schema_t> schemas);

  std::mutex writer_mutex_;
  std::atomic<std::shared_ptr<const catalog_t>> catalog_;
};

}  // namespace tessera::registry
