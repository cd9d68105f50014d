#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitrelay {

// Validate 40-char lowercase/uppercase hex
auto looks_hex40(std::string_view str) -> bool;

// View text as bytes / copy bytes into text (no encoding applied)
inline auto as_bytes(std::string_view s) -> std::span<const std::uint8_t> {
  return {reinterpret_cast<const std::uint8_t *>(s.data()), s.size()};
}
inline auto to_bytes(std::string_view s) -> std::vector<std::uint8_t> {
  return {s.begin(), s.end()};
}
inline auto to_string(std::span<const std::uint8_t> bytes) -> std::string {
  return {bytes.begin(), bytes.end()};
}

// String helpers
namespace strutil {
  // Strip trailing CR/LF characters in place
  void rstrip_newlines(std::string& str);

  // Strip leading/trailing spaces, tabs, CR and LF
  auto trim(std::string_view sv) -> std::string;

  // Split on a single character; empty fields are kept
  auto split(std::string_view sv, char sep) -> std::vector<std::string>;
}

}
