#pragma once
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitrelay {

enum class ObjectKind : std::uint8_t { Commit, Tree, Blob, Tag };

// "commit" | "tree" | "blob" | "tag"
std::string_view kind_name(ObjectKind kind);
std::optional<ObjectKind> parse_kind(std::string_view name);

struct Object {
  ObjectKind kind = ObjectKind::Blob;
  std::vector<std::uint8_t> data; // payload bytes (no header)

  bool operator==(const Object&) const = default;
};

namespace object {

// Parse the loose form "<kind> <len>\0<payload>" (uncompressed).
// Throws MalformedObjectError on an unknown kind or a length mismatch.
Object decode(std::span<const std::uint8_t> raw);

// Inverse of decode. Deterministic.
std::vector<std::uint8_t> encode(const Object& obj);

// 40-hex SHA-1 over the exact loose bytes.
std::string hash_of(std::span<const std::uint8_t> raw);

// Recompute the id of `raw` and compare with `hash` (hex, any case).
bool verify(std::string_view hash, std::span<const std::uint8_t> raw);

/**
 * Ids this object points at, in a stable order:
 *   commit -> tree, then parents
 *   tree   -> entries (gitlinks skipped, they live in other repositories)
 *   tag    -> tagged object
 *   blob   -> nothing
 */
std::vector<std::string> references(const Object& obj);

} // namespace object

} // namespace gitrelay
