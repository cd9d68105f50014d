#pragma once
#include "gitrelay/backend.hpp"

#include <filesystem>

namespace gitrelay {

// Backend over a directory of a (possibly network-mounted) filesystem.
// Keys map to files below `root`; writes are temp-file + rename.
class DirBackend : public Backend {
public:
  explicit DirBackend(std::filesystem::path root) : root_(std::move(root)) {}

  Lookup<std::vector<std::uint8_t>> get(std::string_view path) const override;
  void put(std::string_view path, const std::vector<std::uint8_t>& data) const override;
  void remove(std::string_view path) const override;
  Lookup<std::vector<BackendEntry>> list_recursive(std::string_view path) const override;

  [[nodiscard]] const std::filesystem::path& root() const { return root_; }

private:
  [[nodiscard]] std::filesystem::path resolve(std::string_view path) const;

  std::filesystem::path root_;
};

} // namespace gitrelay
