#pragma once
#include "gitrelay/consts.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace gitrelay {

struct Settings {
  unsigned jobs = consts::kDefaultJobs; // transfer workers
  std::string rclone = "rclone";        // rclone executable
  std::optional<int> verbosity;         // before git sends "option verbosity"
};

// Read <git_dir>/relay.conf ("key: value" lines, '#' comments).
// A missing file yields defaults; malformed numbers throw.
Settings load_settings(const std::filesystem::path& git_dir);

// Apply GITRELAY_JOBS / GITRELAY_RCLONE on top of `base`.
Settings apply_environment(Settings base);

} // namespace gitrelay
