#include "gitrelay/rclone_backend.hpp"

#include "gitrelay/errors.hpp"
#include "gitrelay/fs.hpp"
#include "gitrelay/log.hpp"
#include "gitrelay/transfer_pool.hpp"
#include "gitrelay/util.hpp"

#include <sstream>
#include <unordered_map>

namespace gitrelay {

namespace {

// rclone exit codes (see "rclone --help", section "Exit Code")
constexpr int kRcloneDirNotFound = 3;
constexpr int kRcloneFileNotFound = 4;

bool is_absent(int exit_code) {
  return exit_code == kRcloneDirNotFound || exit_code == kRcloneFileNotFound;
}

std::string first_line(const std::string &text) {
  std::string line = text.substr(0, text.find('\n'));
  strutil::rstrip_newlines(line);
  return line.empty() ? std::string("no diagnostics") : line;
}

std::string strip_leading_slashes(std::string_view path) {
  while (!path.empty() && path.front() == '/') {
    path.remove_prefix(1);
  }
  return std::string(path);
}

} // namespace

RcloneBackend::RcloneBackend(std::string remote, std::string executable, Logger &log)
    : remote_(std::move(remote)), executable_(std::move(executable)), log_(log) {}

std::string RcloneBackend::remote_path(std::string_view path) const {
  return remote_ + ":" + strip_leading_slashes(path);
}

proc::Result RcloneBackend::invoke(std::vector<std::string> args,
                                   std::span<const std::uint8_t> input) const {
  args.insert(args.begin(), executable_);
  if (log_.enabled(Level::Debug)) {
    std::ostringstream cmd;
    for (const auto &a : args) {
      cmd << (cmd.tellp() > 0 ? " " : "") << a;
    }
    log_.debug("rclone command: " + cmd.str());
  }
  try {
    auto result = proc::run(args, input);
    log_.debug("rclone rc=" + std::to_string(result.exit_code) +
               " stdout_len=" + std::to_string(result.out.size()));
    return result;
  } catch (const std::exception &e) {
    throw TransportError(std::string("rclone: ") + e.what());
  }
}

auto RcloneBackend::get(std::string_view path) const -> Lookup<std::vector<std::uint8_t>> {
  auto res = invoke({"cat", remote_path(path)});
  if (res.exit_code == 0) {
    return Lookup<std::vector<std::uint8_t>>::found(std::move(res.out));
  }
  if (is_absent(res.exit_code)) {
    return Lookup<std::vector<std::uint8_t>>::absent();
  }
  return Lookup<std::vector<std::uint8_t>>::failed("rclone cat " + remote_path(path) + ": " +
                                                   first_line(res.err));
}

void RcloneBackend::put(std::string_view path, const std::vector<std::uint8_t> &data) const {
  const auto res = invoke({"rcat", remote_path(path)}, data);
  if (res.exit_code != 0) {
    throw TransportError("rclone rcat " + remote_path(path) + ": " + first_line(res.err));
  }
}

void RcloneBackend::remove(std::string_view path) const {
  const auto res = invoke({"deletefile", remote_path(path)});
  if (res.exit_code != 0 && !is_absent(res.exit_code)) {
    throw TransportError("rclone deletefile " + remote_path(path) + ": " + first_line(res.err));
  }
}

auto RcloneBackend::list_recursive(std::string_view path) const -> Lookup<std::vector<BackendEntry>> {
  const auto res = invoke({"lsf", "-R", remote_path(path)});
  if (is_absent(res.exit_code)) {
    return Lookup<std::vector<BackendEntry>>::absent();
  }
  if (res.exit_code != 0) {
    return Lookup<std::vector<BackendEntry>>::failed("rclone lsf " + remote_path(path) + ": " +
                                                     first_line(res.err));
  }

  // One entry per line, relative to `path`; directories end with '/'.
  std::vector<BackendEntry> out;
  std::istringstream lines(to_string(res.out));
  std::string line;
  while (std::getline(lines, line)) {
    strutil::rstrip_newlines(line);
    if (line.empty()) {
      continue;
    }
    BackendEntry e;
    e.is_directory = line.back() == '/';
    if (e.is_directory) {
      line.pop_back();
    }
    e.path = std::move(line);
    out.push_back(std::move(e));
  }
  return Lookup<std::vector<BackendEntry>>::found(std::move(out));
}

void RcloneBackend::put_batch(const std::vector<Upload> &uploads, const TransferPool &pool) const {
  if (uploads.empty()) {
    return;
  }
  const fs::ScratchDir staging{"gitrelay_batch_"};
  log_.debug("started batch operation in " + staging.path().string());

  std::unordered_map<std::string, const Upload *> by_path;
  std::vector<std::string> paths;
  paths.reserve(uploads.size());
  for (const auto &u : uploads) {
    if (by_path.emplace(u.path, &u).second) {
      paths.push_back(u.path);
    }
  }
  // rclone parallelises the copy itself; the pool only fills the staging tree
  pool.for_each(paths, [&staging, &by_path](const std::string &path) {
    const auto bytes = by_path.at(path)->contents();
    try {
      fs::write_file_atomic(staging.path() / strip_leading_slashes(path), bytes);
    } catch (const std::runtime_error &e) {
      throw TransportError(std::string("staging batch: ") + e.what());
    }
  });

  log_.info("executing batch copy with " + std::to_string(paths.size()) + " files");
  const auto res = invoke({"copy", "-v", staging.path().string(), remote_ + ":"});
  if (!res.err.empty()) {
    std::istringstream lines(res.err);
    std::string line;
    while (std::getline(lines, line)) {
      log_.debug("rclone: " + line);
    }
  }
  if (res.exit_code != 0) {
    throw TransportError("rclone copy failed with exit code " + std::to_string(res.exit_code) +
                         ": " + first_line(res.err));
  }
  log_.debug("batch copy completed");
}

} // namespace gitrelay
