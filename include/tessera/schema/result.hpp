#pragma once

#include <tessera/schema/error_code.hpp>

#include <optional>
#include <string>
#include <utility>
#include <vector>

// Schema type: result.
// Envelopes returned by every public operation. Failures are values, never
// exceptions; `codespace` names the operation that produced them.
namespace tessera::schema {

template <uint16_t Version>
struct status;

template <>
struct status<1> final {
  uint16_t version{1};
  error_code code{error_code::ok};
  std::string codespace;
  std::string log;
  // Offending field path (e.g. "parameters.size" or "items[2]"), if any.
  std::string field;
  std::string expected;
  std::string received;

  bool ok() const { return code == error_code::ok; }
};

using status_t = status<1>;

template <typename T>
struct result final {
  status_t status;
  std::optional<T> value;
  std::vector<std::string> warnings;

  bool ok() const { return status.ok() && value.has_value(); }
};

inline status_t make_error(const error_code code,
                           std::string codespace,
                           std::string log,
                           std::string field = {},
                           std::string expected = {},
                           std::string received = {}) {
  return status_t{.code = code,
                  .codespace = std::move(codespace),
                  .log = std::move(log),
                  .field = std::move(field),
                  .expected = std::move(expected),
                  .received = std::move(received)};
}

template <typename T>
result<T> make_result(T value) {
  return result<T>{.status = status_t{}, .value = std::move(value)};
}

template <typename T>
result<T> make_failure(status_t status) {
  return result<T>{.status = std::move(status), .value = std::nullopt};
}

}  // namespace tessera::schema
