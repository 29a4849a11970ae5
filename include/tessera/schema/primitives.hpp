#pragma once
#include <boost/container/map.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace tessera::schema {

struct value_t;

using list_t = std::vector<value_t>;
// boost::container::map tolerates the incomplete value_t below.
using map_t = boost::container::map<std::string, value_t>;

/// Dynamically typed field value carried by raw and normalized specs.
///
/// Copies are deep: a default copied out of a field spec never shares
/// storage with the schema or with another spec.
struct value_t final {
  using storage_t = std::variant<std::monostate,
                                 bool,
                                 int64_t,
                                 double,
                                 std::string,
                                 list_t,
                                 map_t>;

  storage_t data;

  value_t() = default;
  value_t(std::nullptr_t) {}
  value_t(bool value) : data{value} {}
  value_t(int value) : data{static_cast<int64_t>(value)} {}
  value_t(int64_t value) : data{value} {}
  value_t(double value) : data{value} {}
  value_t(const char* value) : data{std::string{value}} {}
  value_t(std::string_view value) : data{std::string{value}} {}
  value_t(std::string value) : data{std::move(value)} {}
  value_t(list_t value) : data{std::move(value)} {}
  value_t(map_t value) : data{std::move(value)} {}

  bool is_null() const { return std::holds_alternative<std::monostate>(data); }

  template <typename T>
  bool is() const {
    return std::holds_alternative<T>(data);
  }

  template <typename T>
  const T* get_if() const {
    return std::get_if<T>(&data);
  }

  bool operator==(const value_t& other) const { return data == other.data; }
  bool operator!=(const value_t& other) const { return !(*this == other); }
};

map_t make_map(std::initializer_list<std::pair<const std::string, value_t>> entries);
list_t make_list(std::initializer_list<value_t> entries);

/// Name of the dynamic type held by value, e.g. "Integer" or "null".
std::string_view kind_name(const value_t& value);

/// Compact JSON-like rendering used in error messages and logs.
std::string render(const value_t& value);

/// Human readable description of a received value: rendering plus kind.
std::string describe(const value_t& value);

}  // namespace tessera::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
