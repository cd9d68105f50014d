#include "gitrelay/object.hpp"

#include "gitrelay/consts.hpp"
#include "gitrelay/errors.hpp"
#include "gitrelay/hash.hpp"
#include "gitrelay/util.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstring>

namespace gitrelay {

namespace {

auto ascii_octal_to_mode(std::string_view s) -> std::uint32_t {
  std::uint32_t v = 0;
  for (const char c : s) {
    if (c < '0' || c > '7') {
      throw MalformedObjectError("tree parse: bad mode '" + std::string(s) + "'");
    }
    v = static_cast<std::uint32_t>((v << 3U) + static_cast<unsigned>(c - '0'));
  }
  return v;
}

auto checked_hex(std::string_view hex, std::string_view what) -> std::string {
  if (!looks_hex40(hex)) {
    throw MalformedObjectError(std::string(what) + ": bad object id '" + std::string(hex) + "'");
  }
  std::string out(hex);
  std::ranges::transform(out, out.begin(),
                         [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
  return out;
}

// Headers end at the first empty line; the message that follows is never scanned.
void header_references(std::string_view text, ObjectKind kind, std::vector<std::string>& out) {
  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t nl = text.find(consts::kLF, pos);
    const std::string_view line =
        (nl == std::string_view::npos) ? text.substr(pos) : text.substr(pos, nl - pos);
    if (line.empty()) {
      break;
    }
    if (kind == ObjectKind::Commit) {
      if (line.starts_with(consts::kTreePrefix)) {
        out.push_back(checked_hex(line.substr(consts::kTreePrefix.size()), "commit tree"));
      } else if (line.starts_with(consts::kParentPrefix)) {
        out.push_back(checked_hex(line.substr(consts::kParentPrefix.size()), "commit parent"));
      }
    } else if (line.starts_with(consts::kObjectPrefix)) {
      out.push_back(checked_hex(line.substr(consts::kObjectPrefix.size()), "tag object"));
    }
    if (nl == std::string_view::npos) {
      break;
    }
    pos = nl + 1;
  }
}

void tree_references(const std::vector<std::uint8_t>& data, std::vector<std::string>& out) {
  auto p = data.begin();
  const auto end = data.end();

  while (p < end) {
    const auto q_space = std::find(p, end, static_cast<std::uint8_t>(consts::kSpace));
    if (q_space == end) {
      throw MalformedObjectError("tree parse: expected space");
    }
    const std::uint32_t mode = ascii_octal_to_mode(std::string(p, q_space));

    p = q_space + 1;
    const auto q_nul = std::find(p, end, static_cast<std::uint8_t>(consts::kNul));
    if (q_nul == end) {
      throw MalformedObjectError("tree parse: expected NUL");
    }
    p = q_nul + 1;

    if (static_cast<std::size_t>(end - p) < consts::kOidRawLen) {
      throw MalformedObjectError("tree parse: truncated oid");
    }
    oid id{};
    std::memcpy(id.data(), &(*p), consts::kOidRawLen);
    p += static_cast<std::ptrdiff_t>(consts::kOidRawLen);

    if (mode != consts::kModeGitlink) {
      out.push_back(to_hex(id));
    }
  }
}

} // namespace

std::string_view kind_name(ObjectKind kind) {
  switch (kind) {
  case ObjectKind::Commit:
    return consts::kTypeCommit;
  case ObjectKind::Tree:
    return consts::kTypeTree;
  case ObjectKind::Blob:
    return consts::kTypeBlob;
  case ObjectKind::Tag:
    return consts::kTypeTag;
  }
  return consts::kTypeBlob;
}

std::optional<ObjectKind> parse_kind(std::string_view name) {
  if (name == consts::kTypeCommit) return ObjectKind::Commit;
  if (name == consts::kTypeTree) return ObjectKind::Tree;
  if (name == consts::kTypeBlob) return ObjectKind::Blob;
  if (name == consts::kTypeTag) return ObjectKind::Tag;
  return std::nullopt;
}

namespace object {

Object decode(std::span<const std::uint8_t> raw) {
  const auto it_nul = std::ranges::find(raw, static_cast<std::uint8_t>(consts::kNul));
  if (it_nul == raw.end()) {
    throw MalformedObjectError("object: missing header terminator");
  }
  const std::string header(raw.begin(), it_nul);
  const std::size_t sp = header.find(consts::kSpace);
  if (sp == std::string::npos) {
    throw MalformedObjectError("object: invalid header '" + header + "'");
  }

  const auto kind = parse_kind(std::string_view(header).substr(0, sp));
  if (!kind) {
    throw MalformedObjectError("object: unknown kind '" + header.substr(0, sp) + "'");
  }

  const std::string_view len_str = std::string_view(header).substr(sp + 1);
  std::size_t declared = 0;
  const auto [ptr, ec] = std::from_chars(len_str.data(), len_str.data() + len_str.size(), declared);
  if (len_str.empty() || ec != std::errc{} || ptr != len_str.data() + len_str.size()) {
    throw MalformedObjectError("object: bad length '" + std::string(len_str) + "'");
  }

  const std::size_t payload_off = static_cast<std::size_t>(it_nul - raw.begin()) + 1;
  const std::size_t actual = raw.size() - payload_off;
  if (declared != actual) {
    throw MalformedObjectError("object: declared length " + std::to_string(declared) +
                               " but payload is " + std::to_string(actual) + " bytes");
  }
  return Object{.kind = *kind, .data = {raw.begin() + static_cast<std::ptrdiff_t>(payload_off), raw.end()}};
}

std::vector<std::uint8_t> encode(const Object &obj) {
  std::string hdr(kind_name(obj.kind));
  hdr.push_back(consts::kSpace);
  hdr.append(std::to_string(obj.data.size()));
  hdr.push_back(consts::kNul);

  std::vector<std::uint8_t> out;
  out.reserve(hdr.size() + obj.data.size());
  out.insert(out.end(), hdr.begin(), hdr.end());
  out.insert(out.end(), obj.data.begin(), obj.data.end());
  return out;
}

std::string hash_of(std::span<const std::uint8_t> raw) { return to_hex(sha1(raw)); }

bool verify(std::string_view hash, std::span<const std::uint8_t> raw) {
  oid expected{};
  if (!from_hex(hash, expected)) {
    return false;
  }
  return sha1(raw) == expected;
}

std::vector<std::string> references(const Object &obj) {
  std::vector<std::string> out;
  switch (obj.kind) {
  case ObjectKind::Commit:
  case ObjectKind::Tag:
    header_references(std::string_view(reinterpret_cast<const char *>(obj.data.data()), obj.data.size()),
                      obj.kind, out);
    break;
  case ObjectKind::Tree:
    tree_references(obj.data, out);
    break;
  case ObjectKind::Blob:
    break;
  }
  return out;
}

} // namespace object

} // namespace gitrelay
