#include "gitrelay/backend.hpp"

#include "gitrelay/transfer_pool.hpp"

#include <unordered_map>

namespace gitrelay {

void Backend::put_batch(const std::vector<Upload> &uploads, const TransferPool &pool) const {
  std::unordered_map<std::string, const Upload *> by_path;
  std::vector<std::string> paths;
  paths.reserve(uploads.size());
  for (const auto &u : uploads) {
    if (by_path.emplace(u.path, &u).second) {
      paths.push_back(u.path);
    }
  }
  pool.for_each(paths, [this, &by_path](const std::string &path) {
    put(path, by_path.at(path)->contents());
  });
}

} // namespace gitrelay
