// String and hex helpers
#include "gitrelay/util.hpp"

#include "gitrelay/consts.hpp"

#include <algorithm>
#include <cctype>

namespace gitrelay {

bool looks_hex40(std::string_view str) {
  if (str.size() != consts::kOidHexLen) {
    return false;
  }
  return std::ranges::all_of(str,
                             [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); });
}

namespace strutil {

void rstrip_newlines(std::string &s) {
  while (!s.empty()) {
    char c = s.back();
    if (c == '\n' || c == '\r') {
      s.pop_back();
    } else {
      break;
    }
  }
}

std::string trim(std::string_view sv) {
  const auto is_ws = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
  while (!sv.empty() && is_ws(sv.front()))
    sv.remove_prefix(1);
  while (!sv.empty() && is_ws(sv.back()))
    sv.remove_suffix(1);
  return std::string(sv);
}

std::vector<std::string> split(std::string_view sv, char sep) {
  std::vector<std::string> out;
  std::size_t start = 0;
  for (;;) {
    const std::size_t pos = sv.find(sep, start);
    if (pos == std::string_view::npos) {
      out.emplace_back(sv.substr(start));
      return out;
    }
    out.emplace_back(sv.substr(start, pos - start));
    start = pos + 1;
  }
}

} // namespace strutil

} // namespace gitrelay
