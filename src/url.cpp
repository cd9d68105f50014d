#include "gitrelay/url.hpp"

#include "gitrelay/config.hpp"
#include "gitrelay/consts.hpp"
#include "gitrelay/dir_backend.hpp"
#include "gitrelay/rclone_backend.hpp"

#include <stdexcept>

namespace gitrelay {

namespace {

std::string strip_slashes(std::string_view s) {
  while (!s.empty() && s.front() == '/')
    s.remove_prefix(1);
  while (!s.empty() && s.back() == '/')
    s.remove_suffix(1);
  return std::string(s);
}

} // namespace

auto parse_location(std::string_view url) -> Location {
  if (url.empty()) {
    throw std::invalid_argument("empty remote url");
  }
  if (!url.starts_with(consts::kScheme)) {
    if (url.find("://") != std::string_view::npos) {
      throw std::invalid_argument("unsupported remote url '" + std::string(url) + "'");
    }
    return Location{.kind = BackendKind::Directory, .remote = {}, .path = std::string(url)};
  }

  auto rest = url.substr(consts::kScheme.size()); // strip "relay://"
  if (rest.starts_with('/')) {
    if (rest.size() == 1) {
      throw std::invalid_argument("remote url '" + std::string(url) + "' names no directory");
    }
    return Location{.kind = BackendKind::Directory, .remote = {}, .path = std::string(rest)};
  }

  const auto slash = rest.find('/');
  std::string remote(rest.substr(0, slash));
  if (remote.empty() || remote.find(':') != std::string::npos) {
    throw std::invalid_argument("bad rclone remote in url '" + std::string(url) + "'");
  }
  std::string path = slash == std::string_view::npos ? std::string() : strip_slashes(rest.substr(slash + 1));
  return Location{.kind = BackendKind::Rclone, .remote = std::move(remote), .path = std::move(path)};
}

auto open_backend(const Location &loc, const Settings &settings, Logger &log) -> std::unique_ptr<Backend> {
  if (loc.kind == BackendKind::Rclone) {
    return std::make_unique<RcloneBackend>(loc.remote, settings.rclone, log);
  }
  return std::make_unique<DirBackend>(loc.path);
}

auto store_prefix(const Location &loc) -> std::string {
  return loc.kind == BackendKind::Rclone ? loc.path : std::string();
}

} // namespace gitrelay
