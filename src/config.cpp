#include "gitrelay/config.hpp"

#include "gitrelay/fs.hpp"
#include "gitrelay/util.hpp"

#include <charconv>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace {

int parse_int(std::string_view key, std::string_view value) {
  int out = 0;
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
  if (value.empty() || ec != std::errc{} || ptr != value.data() + value.size()) {
    throw std::runtime_error("config: '" + std::string(key) + "' expects a number, got '" +
                             std::string(value) + "'");
  }
  return out;
}

unsigned parse_jobs(std::string_view value) {
  const int n = parse_int("jobs", value);
  if (n < 1 || n > static_cast<int>(gitrelay::consts::kMaxJobs)) {
    throw std::runtime_error("config: 'jobs' must be between 1 and " +
                             std::to_string(gitrelay::consts::kMaxJobs));
  }
  return static_cast<unsigned>(n);
}

} // namespace

namespace gitrelay {

auto load_settings(const std::filesystem::path &git_dir) -> Settings {
  Settings out{};
  const auto path = git_dir / consts::kConfigFile;
  if (!fs::exists(path))
    return out;

  const auto bytes = fs::read_file(path);
  std::istringstream iss(to_string(bytes));

  std::string line;
  while (std::getline(iss, line)) {
    const std::string entry = strutil::trim(line);
    if (entry.empty() || entry[0] == '#')
      continue; // allow comments
    const std::size_t colon = entry.find(':');
    if (colon == std::string::npos)
      continue;
    const std::string key = strutil::trim(std::string_view(entry).substr(0, colon));
    const std::string value = strutil::trim(std::string_view(entry).substr(colon + 1));
    if (key == "jobs") {
      out.jobs = parse_jobs(value);
    } else if (key == "rclone") {
      out.rclone = value;
    } else if (key == "verbosity") {
      out.verbosity = parse_int(key, value);
    }
  }
  return out;
}

auto apply_environment(Settings base) -> Settings {
  if (const char *jobs = std::getenv("GITRELAY_JOBS"); jobs != nullptr && *jobs != '\0') {
    base.jobs = parse_jobs(jobs);
  }
  if (const char *rclone = std::getenv("GITRELAY_RCLONE"); rclone != nullptr && *rclone != '\0') {
    base.rclone = rclone;
  }
  return base;
}

} // namespace gitrelay
