#pragma once
#include "gitrelay/backend.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace gitrelay {

class Logger;
struct Settings;

enum class BackendKind : std::uint8_t { Rclone, Directory };

// Where a remote URL points.
struct Location {
  BackendKind kind = BackendKind::Directory;
  std::string remote; // rclone remote name (Rclone only)
  std::string path;   // key prefix for Rclone, root directory for Directory
};

// relay://<rclone-remote>/<path>  -> Rclone, prefix <path>
// relay:///<abs-path> or <path>   -> Directory rooted at the path
// Throws std::invalid_argument for anything else.
Location parse_location(std::string_view url);

// Backend for `loc`. The RemoteStore prefix to pair it with is
// store_prefix(loc).
std::unique_ptr<Backend> open_backend(const Location& loc, const Settings& settings, Logger& log);
std::string store_prefix(const Location& loc);

} // namespace gitrelay
