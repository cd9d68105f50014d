#include "gitrelay/remote_store.hpp"

#include "gitrelay/consts.hpp"
#include "gitrelay/errors.hpp"
#include "gitrelay/fs.hpp"
#include "gitrelay/util.hpp"

#include <stdexcept>

namespace gfs = gitrelay::fs;

namespace gitrelay {

namespace {

std::string normalize_prefix(std::string prefix) {
  while (!prefix.empty() && prefix.front() == '/') {
    prefix.erase(prefix.begin());
  }
  while (!prefix.empty() && prefix.back() == '/') {
    prefix.pop_back();
  }
  return prefix;
}

} // namespace

RemoteStore::RemoteStore(const Backend &backend, std::string prefix)
    : backend_(backend), prefix_(normalize_prefix(std::move(prefix))) {}

std::string RemoteStore::dir_path(std::string_view name) const {
  return prefix_.empty() ? std::string(name) : prefix_ + "/" + std::string(name);
}

std::string RemoteStore::object_path(std::string_view hex_oid) const {
  if (!looks_hex40(hex_oid)) {
    throw std::invalid_argument("remote_store: bad oid hex '" + std::string(hex_oid) + "'");
  }
  const std::string rel = std::string(consts::kObjectsDir) + "/" +
                          std::string(hex_oid.substr(0, consts::kFanoutDirHexLen)) + "/" +
                          std::string(hex_oid.substr(consts::kFanoutDirHexLen));
  return dir_path(rel);
}

std::string RemoteStore::ref_path(std::string_view name) const {
  if (name != consts::kHeadFile && !name.starts_with(consts::kRefsPrefix)) {
    throw std::invalid_argument("invalid ref name '" + std::string(name) + "'");
  }
  if (name.find("..") != std::string_view::npos || name.ends_with("/")) {
    throw std::invalid_argument("invalid ref name '" + std::string(name) + "'");
  }
  return dir_path(name);
}

std::vector<std::uint8_t> RemoteStore::get_object(std::string_view hex_oid) const {
  const auto path = object_path(hex_oid);
  auto res = backend_.get(path);
  if (res.is_absent()) {
    throw NotFoundError("object " + std::string(hex_oid) + " not found at " + path);
  }
  if (res.is_failed()) {
    throw TransportError(res.reason);
  }
  try {
    return gfs::z_decompress(res.value);
  } catch (const std::runtime_error &e) {
    throw MalformedObjectError("object " + std::string(hex_oid) + ": " + e.what());
  }
}

void RemoteStore::put_object(std::string_view hex_oid, std::span<const std::uint8_t> raw) const {
  backend_.put(object_path(hex_oid), gfs::z_compress(raw));
}

void RemoteStore::put_objects(const std::vector<std::string> &ids, const ObjectReader &read,
                              const TransferPool &pool) const {
  std::vector<Upload> uploads;
  uploads.reserve(ids.size());
  for (const auto &hex : ids) {
    uploads.push_back(Upload{.path = object_path(hex),
                             .contents = [&read, hex] { return gfs::z_compress(read(hex)); }});
  }
  backend_.put_batch(uploads, pool);
}

} // namespace gitrelay
