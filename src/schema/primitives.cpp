#include <tessera/schema/primitives.hpp>

#include <array>
#include <charconv>
#include <cmath>
#include <iterator>
#include <string>

namespace tessera::schema {

namespace {

void append_quoted(std::string& out, const std::string_view text) {
  out.push_back('"');
  for (const auto ch : text) {
    switch (ch) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        out.push_back(ch);
    }
  }
  out.push_back('"');
}

void append_double(std::string& out, const double value) {
  if (!std::isfinite(value)) {
    out += std::isnan(value) ? "nan" : (value < 0 ? "-inf" : "inf");
    return;
  }
  // Shortest form that parses back to the same double.
  auto buffer = std::array<char, 32>{};
  auto [ptr, ec] =
      std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
  auto text = ec == std::errc{} ? std::string{buffer.data(), ptr}
                                : std::to_string(value);
  // Keep a visible fractional part so 1.0 does not read like Integer 1.
  if (text.find_first_of(".eE") == std::string::npos) {
    text += ".0";
  }
  out += text;
}

void append_rendered(std::string& out, const value_t& value) {
  std::visit(overloaded{[&](const std::monostate&) { out += "null"; },
                        [&](const bool arg) { out += arg ? "true" : "false"; },
                        [&](const int64_t arg) { out += std::to_string(arg); },
                        [&](const double arg) { append_double(out, arg); },
                        [&](const std::string& arg) { append_quoted(out, arg); },
                        [&](const list_t& arg) {
                          out.push_back('[');
                          for (auto it = std::begin(arg); it != std::end(arg);
                               ++it) {
                            if (it != std::begin(arg)) {
                              out.push_back(',');
                            }
                            append_rendered(out, *it);
                          }
                          out.push_back(']');
                        },
                        [&](const map_t& arg) {
                          out.push_back('{');
                          for (auto it = std::begin(arg); it != std::end(arg);
                               ++it) {
                            if (it != std::begin(arg)) {
                              out.push_back(',');
                            }
                            append_quoted(out, it->first);
                            out.push_back(':');
                            append_rendered(out, it->second);
                          }
                          out.push_back('}');
                        }},
             value.data);
}

}  // namespace

map_t make_map(
    std::initializer_list<std::pair<const std::string, value_t>> entries) {
  auto out = map_t{};
  for (const auto& entry : entries) {
    out.insert_or_assign(entry.first, entry.second);
  }
  return out;
}

list_t make_list(std::initializer_list<value_t> entries) {
  return list_t{entries};
}

std::string_view kind_name(const value_t& value) {
  return std::visit(
      overloaded{[](const std::monostate&) { return std::string_view{"null"}; },
                 [](const bool) { return std::string_view{"Boolean"}; },
                 [](const int64_t) { return std::string_view{"Integer"}; },
                 [](const double) { return std::string_view{"Float"}; },
                 [](const std::string&) { return std::string_view{"String"}; },
                 [](const list_t&) { return std::string_view{"List"}; },
                 [](const map_t&) { return std::string_view{"Map"}; }},
      value.data);
}

std::string render(const value_t& value) {
  auto out = std::string{};
  append_rendered(out, value);
  return out;
}

std::string describe(const value_t& value) {
  auto out = render(value);
  if (out.size() > 64) {
    // Never split a UTF-8 sequence.
    auto cut = std::size_t{61};
    while (cut > 0 && (static_cast<unsigned char>(out[cut]) & 0xC0) == 0x80) {
      --cut;
    }
    out.resize(cut);
    out += "...";
  }
  out += " (";
  out += kind_name(value);
  out += ")";
  return out;
}

}  // namespace tessera::schema
