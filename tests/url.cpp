#include "gitrelay/config.hpp"
#include "gitrelay/dir_backend.hpp"
#include "gitrelay/log.hpp"
#include "gitrelay/rclone_backend.hpp"
#include "gitrelay/url.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>

using gitrelay::BackendKind;

int main() {
  try {
    {
      const auto loc = gitrelay::parse_location("relay://gdrive/backups/project.git/");
      if (loc.kind != BackendKind::Rclone || loc.remote != "gdrive" || loc.path != "backups/project.git") {
        std::cerr << "rclone url\n"; return 1;
      }
      if (gitrelay::store_prefix(loc) != "backups/project.git") { std::cerr << "rclone prefix\n"; return 1; }

      std::ostringstream diag;
      gitrelay::Logger log(diag);
      const auto backend = gitrelay::open_backend(loc, gitrelay::Settings{}, log);
      const auto* rclone = dynamic_cast<const gitrelay::RcloneBackend*>(backend.get());
      if (rclone == nullptr || rclone->remote_path("HEAD") != "gdrive:HEAD") { std::cerr << "rclone backend\n"; return 1; }
    }
    {
      const auto loc = gitrelay::parse_location("relay://s3remote");
      if (loc.kind != BackendKind::Rclone || loc.remote != "s3remote" || !loc.path.empty()) { std::cerr << "bare remote\n"; return 1; }
    }
    {
      const auto loc = gitrelay::parse_location("relay:///mnt/share/repo.git");
      if (loc.kind != BackendKind::Directory || loc.path != "/mnt/share/repo.git") { std::cerr << "directory url\n"; return 1; }
      if (!gitrelay::store_prefix(loc).empty()) { std::cerr << "directory prefix\n"; return 1; }

      std::ostringstream diag;
      gitrelay::Logger log(diag);
      const auto backend = gitrelay::open_backend(loc, gitrelay::Settings{}, log);
      const auto* dir = dynamic_cast<const gitrelay::DirBackend*>(backend.get());
      if (dir == nullptr || dir->root() != "/mnt/share/repo.git") { std::cerr << "directory backend\n"; return 1; }
    }
    {
      const auto loc = gitrelay::parse_location("/srv/git/repo");
      if (loc.kind != BackendKind::Directory || loc.path != "/srv/git/repo") { std::cerr << "bare path\n"; return 1; }
    }
    for (const char* bad : {"", "https://example.com/repo", "relay:///", "relay://:x/y"}) {
      bool threw = false;
      try { (void)gitrelay::parse_location(bad); } catch (const std::invalid_argument&) { threw = true; }
      if (!threw) { std::cerr << "accepted '" << bad << "'\n"; return 1; }
    }
    std::cout << "url OK\n";
  } catch (const std::exception& e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
