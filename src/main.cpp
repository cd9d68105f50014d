#include "gitrelay/config.hpp"
#include "gitrelay/helper.hpp"
#include "gitrelay/local_repo.hpp"
#include "gitrelay/log.hpp"
#include "gitrelay/refs.hpp"
#include "gitrelay/remote_store.hpp"
#include "gitrelay/transfer_pool.hpp"
#include "gitrelay/url.hpp"

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

namespace {

std::filesystem::path git_dir() {
  if (const char *dir = std::getenv("GIT_DIR"); dir != nullptr && *dir != '\0') {
    return dir;
  }
  return std::filesystem::current_path() / ".git";
}

} // namespace

int main(int argc, char **argv) {
  // a subprocess that exits early must not take the helper down with it
  std::signal(SIGPIPE, SIG_IGN);

  if (argc != 3) {
    std::cerr << "usage: git-remote-relay <remote-name> <url>\n";
    return 2;
  }

  try {
    const auto settings = gitrelay::apply_environment(gitrelay::load_settings(git_dir()));
    const auto level = static_cast<gitrelay::Level>(settings.verbosity.value_or(1));

    gitrelay::Logger log(std::cerr, level);
    const auto location = gitrelay::parse_location(argv[2]);
    const auto backend = gitrelay::open_backend(location, settings, log);
    const gitrelay::RemoteStore store(*backend, gitrelay::store_prefix(location));
    const gitrelay::RefStore refs(store, log);
    const gitrelay::GitCli local(log);
    const gitrelay::TransferPool pool(settings.jobs);

    gitrelay::Helper helper(store, refs, local, pool, log);
    helper.run(std::cin, std::cout);
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}
