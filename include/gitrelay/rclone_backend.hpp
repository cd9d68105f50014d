#pragma once
#include "gitrelay/backend.hpp"
#include "gitrelay/subprocess.hpp"

#include <string>
#include <vector>

namespace gitrelay {

class Logger;

// Backend that shells out to the rclone CLI against "<remote>:<path>".
// rclone's documented exit codes 3 (directory not found) and 4 (file not
// found) are the absence signal.
class RcloneBackend : public Backend {
public:
  RcloneBackend(std::string remote, std::string executable, Logger& log);

  Lookup<std::vector<std::uint8_t>> get(std::string_view path) const override;
  void put(std::string_view path, const std::vector<std::uint8_t>& data) const override;
  void remove(std::string_view path) const override;
  Lookup<std::vector<BackendEntry>> list_recursive(std::string_view path) const override;

  // Stages every file under a scratch directory mirroring the remote keys
  // and transfers it with a single "rclone copy".
  void put_batch(const std::vector<Upload>& uploads, const TransferPool& pool) const override;

  // "<remote>:<path>"
  [[nodiscard]] std::string remote_path(std::string_view path) const;

private:
  proc::Result invoke(std::vector<std::string> args, std::span<const std::uint8_t> input = {}) const;

  std::string remote_;
  std::string executable_;
  Logger& log_;
};

} // namespace gitrelay
