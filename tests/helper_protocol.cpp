#include "gitrelay/dir_backend.hpp"
#include "gitrelay/errors.hpp"
#include "gitrelay/helper.hpp"
#include "gitrelay/log.hpp"
#include "gitrelay/refs.hpp"
#include "gitrelay/remote_store.hpp"
#include "gitrelay/transfer_pool.hpp"

#include "support/fakes.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

namespace {

struct Fixture {
  explicit Fixture(const fs::path& root) : dir{root}, store{dir, "proto"}, refs{store, log} {}

  // Run one conversation; returns everything the helper wrote to stdout.
  std::string talk(const gitrelay::LocalRepository& local, const std::string& input) {
    std::istringstream in(input);
    std::ostringstream out;
    gitrelay::Helper helper{store, refs, local, pool, log};
    helper.run(in, out);
    return out.str();
  }

  // Expect the conversation to end in a ProtocolError.
  bool rejects(const gitrelay::LocalRepository& local, const std::string& input) {
    try {
      (void)talk(local, input);
    } catch (const gitrelay::ProtocolError&) {
      return true;
    }
    return false;
  }

  std::ostringstream diag;
  gitrelay::Logger log{diag, gitrelay::Level::Info};
  gitrelay::DirBackend dir;
  gitrelay::RemoteStore store;
  gitrelay::RefStore refs;
  gitrelay::TransferPool pool{2};
};

} // namespace

int main() {
  const fs::path root = fakes::temp_dir("proto");
  try {
    Fixture fx{root};
    fakes::MemoryRepo local;
    local.set_branch("refs/heads/main");
    const auto c1 = local.commit_file("hello", {});
    local.set_ref("refs/heads/main", c1);

    // Capabilities and options
    {
      const auto out = fx.talk(local,
                               "capabilities\n"
                               "option verbosity 2\n"
                               "option progress true\n"
                               "option verbosity loud\n"
                               "\n");
      const std::string expected = "option\npush\nfetch\n\n"
                                   "ok\n"
                                   "unsupported\n"
                                   "error invalid verbosity 'loud'\n";
      if (out != expected) { std::cerr << "capabilities/options:\n" << out; return 1; }
      if (fx.log.verbosity() != 2) { std::cerr << "verbosity not applied\n"; return 1; }
      if (fx.diag.str().find("helper recv: option progress true") == std::string::npos) { std::cerr << "no debug echo\n"; return 1; }
      fx.log.set_verbosity(1);
    }

    // Empty remote, first push, then listing with HEAD
    {
      const auto out = fx.talk(local,
                               "list for-push\n"
                               "push refs/heads/main:refs/heads/main\n"
                               "\n"
                               "list\n");
      const std::string expected = "\n"
                                   "ok refs/heads/main\n\n" +
                                   c1 + " refs/heads/main\n@refs/heads/main HEAD\n\n";
      if (out != expected) { std::cerr << "push conversation:\n" << out; return 1; }
    }

    // Two refs in one batch: replies in order, one blank line
    {
      const auto c2 = local.commit_file("world", {c1});
      local.set_ref("refs/heads/main", c2);
      const auto stray = local.commit_file("stray", {});
      local.set_ref("refs/heads/stray", stray);
      local.set_ref("refs/heads/old", stray);
      const auto out = fx.talk(local,
                               "list for-push\n"
                               "push refs/heads/main:refs/heads/main\n"
                               "push refs/heads/old:refs/heads/main\n"
                               "push +refs/heads/stray:refs/heads/stray\n"
                               "\n");
      const std::string expected = c1 + " refs/heads/main\n@refs/heads/main HEAD\n\n"
                                   "ok refs/heads/main\n"
                                   "error refs/heads/main non-fast-forward\n"
                                   "ok refs/heads/stray\n"
                                   "\n";
      if (out != expected) { std::cerr << "batch push:\n" << out; return 1; }
    }

    // Fetch into an empty database
    {
      fakes::MemoryRepo clone;
      const auto listing = fx.talk(clone, "list\n\n");
      if (listing.find(" refs/heads/main\n") == std::string::npos) { std::cerr << "clone listing:\n" << listing; return 1; }
      const auto tip = fx.refs.get_ref("refs/heads/main").value;
      const auto out = fx.talk(clone, "fetch " + tip + " refs/heads/main\nfetch " + c1 + " refs/heads/main\n\n");
      if (out != "\n") { std::cerr << "fetch reply:\n" << out; return 1; }
      if (!clone.has(tip) || !clone.has(c1)) { std::cerr << "fetch did not populate the database\n"; return 1; }
    }

    // Input the helper must refuse
    {
      if (!fx.rejects(local, "frobnicate\n")) { std::cerr << "unknown command accepted\n"; return 1; }
      if (!fx.rejects(local, "push refs/heads/main:refs/heads/main\n")) { std::cerr << "EOF in push batch accepted\n"; return 1; }
      if (!fx.rejects(local, "push refs/heads/main\n\n")) { std::cerr << "refspec without ':' accepted\n"; return 1; }
      if (!fx.rejects(local, "fetch nothex refs/heads/main\n\n")) { std::cerr << "bad fetch id accepted\n"; return 1; }
      if (!fx.rejects(local, "fetch " + c1 + " refs/heads/main\nlist\n")) { std::cerr << "list inside fetch batch accepted\n"; return 1; }
      if (!fx.rejects(local, "list sideways\n")) { std::cerr << "bad list argument accepted\n"; return 1; }
    }

    // Blank line or EOF while idle ends the session quietly
    {
      if (!fx.talk(local, "").empty()) { std::cerr << "EOF produced output\n"; return 1; }
      if (!fx.talk(local, "\ncapabilities\n").empty()) { std::cerr << "input after blank line was read\n"; return 1; }
    }

    std::cout << "helper_protocol OK\n";
  } catch (const std::exception& e) {
    std::cerr << "exception: " << e.what() << "\n";
    std::error_code ec; fs::remove_all(root, ec);
    return 1;
  }
  std::error_code ec; fs::remove_all(root, ec);
  return 0;
}
