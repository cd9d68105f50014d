#include "gitrelay/closure.hpp"

#include "gitrelay/errors.hpp"
#include "gitrelay/local_repo.hpp"
#include "gitrelay/log.hpp"
#include "gitrelay/object.hpp"
#include "gitrelay/transfer_pool.hpp"

namespace gitrelay::closure {

std::vector<std::uint8_t> read_verified(const LocalRepository &local, std::string_view hex_oid) {
  auto raw = local.read_object(hex_oid);
  if (!object::verify(hex_oid, raw)) {
    throw IntegrityError("local object " + std::string(hex_oid) + " does not match its id");
  }
  return raw;
}

std::vector<std::string> objects_to_upload(const LocalRepository &local, std::string_view root,
                                           const std::unordered_set<std::string> &present) {
  std::vector<std::string> out;
  std::vector<std::string> stack{std::string(root)};
  std::unordered_set<std::string> seen;

  while (!stack.empty()) {
    std::string cur = std::move(stack.back());
    stack.pop_back();
    if (present.contains(cur) || !seen.insert(cur).second) {
      continue;
    }

    const auto refs = object::references(object::decode(read_verified(local, cur)));
    out.push_back(std::move(cur));

    // reversed so the first reference is walked first
    for (auto it = refs.rbegin(); it != refs.rend(); ++it) {
      if (!present.contains(*it) && !seen.contains(*it)) {
        stack.push_back(*it);
      }
    }
  }
  return out;
}

void fetch_all(const RemoteStore &store, const LocalRepository &local, const TransferPool &pool,
               const std::vector<std::string> &roots, std::unordered_set<std::string> &seen,
               Logger &log) {
  pool.walk(
      roots,
      [&](const std::string &hex) {
        log.debug("fetching: " + store.object_path(hex));
        const auto raw = store.get_object(hex);
        if (!object::verify(hex, raw)) {
          throw IntegrityError("hash mismatch: remote object " + hex + " is corrupt");
        }
        const Object obj = object::decode(raw);
        const std::string written = local.write_object(obj);
        if (written != hex) {
          throw IntegrityError("local database stored " + hex + " as " + written);
        }
        return object::references(obj);
      },
      seen);
}

} // namespace gitrelay::closure
