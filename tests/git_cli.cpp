#include "gitrelay/local_repo.hpp"
#include "gitrelay/log.hpp"
#include "gitrelay/object.hpp"
#include "gitrelay/subprocess.hpp"
#include "gitrelay/util.hpp"

#include "support/fakes.hpp"

#include <csignal>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

static bool git(const std::vector<std::string>& args) {
  std::vector<std::string> argv{"git"};
  argv.insert(argv.end(), args.begin(), args.end());
  return gitrelay::proc::run(argv).exit_code == 0;
}

int main() {
  std::signal(SIGPIPE, SIG_IGN);
  try {
    if (!git({"--version"})) {
      std::cout << "git_cli SKIPPED (git exited non-zero)\n";
      return 77;
    }
  } catch (const std::runtime_error&) {
    std::cout << "git_cli SKIPPED (no git)\n";
    return 77;
  }

  const fs::path repo = fakes::temp_dir("gitcli");
  const fs::path previous = fs::current_path();
  try {
    if (!git({"init", "-q", repo.string()})) { std::cerr << "git init failed\n"; return 1; }
    fs::current_path(repo);

    std::ostringstream diag;
    gitrelay::Logger log(diag, gitrelay::Level::Debug);
    const gitrelay::GitCli cli{log};

    // Objects built in memory get the same ids from git
    fakes::MemoryRepo mem;
    const auto c1 = mem.commit_file("first", {});
    const auto c2 = mem.commit_file("second", {c1});
    for (const auto& id : {c1, c2}) {
      // write the closure bottom-up so git can check the references
      const auto commit = gitrelay::object::decode(mem.read_object(id));
      const auto refs = gitrelay::object::references(commit);
      const auto tree = gitrelay::object::decode(mem.read_object(refs[0]));
      for (const auto& blob : gitrelay::object::references(tree)) {
        if (cli.write_object(gitrelay::object::decode(mem.read_object(blob))) != blob) { std::cerr << "blob id\n"; return 1; }
      }
      if (cli.write_object(tree) != refs[0]) { std::cerr << "tree id\n"; return 1; }
      if (cli.write_object(commit) != id) { std::cerr << "commit id\n"; return 1; }
    }
    if (cli.read_object(c2) != mem.read_object(c2)) { std::cerr << "read_object bytes\n"; return 1; }

    bool threw = false;
    try { (void)cli.read_object("3333333333333333333333333333333333333333"); } catch (const std::runtime_error&) { threw = true; }
    if (!threw) { std::cerr << "read_object on missing id\n"; return 1; }

    // Refs and ancestry
    if (!git({"update-ref", "refs/heads/main", c2}) || !git({"symbolic-ref", "HEAD", "refs/heads/main"})) {
      std::cerr << "git update-ref failed\n"; return 1;
    }
    if (cli.resolve_ref("refs/heads/main") != c2) { std::cerr << "resolve_ref\n"; return 1; }
    if (cli.current_branch() != std::optional<std::string>("refs/heads/main")) { std::cerr << "current_branch\n"; return 1; }
    if (!cli.is_ancestor(c1, c2) || cli.is_ancestor(c2, c1) || !cli.is_ancestor(c2, c2)) { std::cerr << "is_ancestor\n"; return 1; }
    if (cli.is_ancestor("4444444444444444444444444444444444444444", c2)) { std::cerr << "unknown id is an ancestor\n"; return 1; }

    threw = false;
    try { (void)cli.resolve_ref("refs/heads/absent"); } catch (const std::runtime_error&) { threw = true; }
    if (!threw) { std::cerr << "resolve_ref on missing ref\n"; return 1; }

    if (!git({"update-ref", "--no-deref", "HEAD", c1})) { std::cerr << "detach failed\n"; return 1; }
    if (cli.current_branch()) { std::cerr << "detached HEAD reported a branch\n"; return 1; }

    std::cout << "git_cli OK\n";
  } catch (const std::exception& e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::current_path(previous);
    std::error_code ec; fs::remove_all(repo, ec);
    return 1;
  }
  fs::current_path(previous);
  std::error_code ec; fs::remove_all(repo, ec);
  return 0;
}
