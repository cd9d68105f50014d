#pragma once
#include "gitrelay/backend.hpp"

#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitrelay {

class TransferPool;

// Uncompressed loose bytes of a local object, by 40-hex id.
using ObjectReader = std::function<std::vector<std::uint8_t>(const std::string& hex_oid)>;

// Maps object ids and ref names onto backend keys below a repository
// prefix. Holds no mutable state of its own.
//
//   <prefix>/objects/<2 hex>/<38 hex>   zlib-deflated loose object
//   <prefix>/refs/...                   "<hex>\n" or "ref: <name>\n"
//   <prefix>/HEAD
class RemoteStore {
public:
  RemoteStore(const Backend& backend, std::string prefix);

  [[nodiscard]] const Backend& backend() const { return backend_; }
  [[nodiscard]] const std::string& prefix() const { return prefix_; }

  // Key of an object (40-hex id). Throws std::invalid_argument on bad ids.
  [[nodiscard]] std::string object_path(std::string_view hex_oid) const;

  // Key of a ref; `name` must be "HEAD" or start with "refs/".
  [[nodiscard]] std::string ref_path(std::string_view name) const;

  // Key of a namespace directory below the prefix ("refs", "objects").
  [[nodiscard]] std::string dir_path(std::string_view name) const;

  // Uncompressed loose bytes of an object.
  // Throws NotFoundError if absent, TransportError on other backend
  // failures, MalformedObjectError if the stored bytes do not inflate.
  [[nodiscard]] std::vector<std::uint8_t> get_object(std::string_view hex_oid) const;

  // Store loose bytes under `hex_oid` (compressed on the way out).
  void put_object(std::string_view hex_oid, std::span<const std::uint8_t> raw) const;

  // Store `ids` as one backend batch. Each object is read and compressed
  // only when the batch writes it.
  void put_objects(const std::vector<std::string>& ids, const ObjectReader& read,
                   const TransferPool& pool) const;

private:
  const Backend& backend_;
  std::string prefix_;
};

} // namespace gitrelay
