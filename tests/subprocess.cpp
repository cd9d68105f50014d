#include "gitrelay/subprocess.hpp"
#include "gitrelay/transfer_pool.hpp"
#include "gitrelay/util.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

int main() {
  std::signal(SIGPIPE, SIG_IGN);
  try {
    // stdin larger than a pipe buffer comes back intact
    {
      const std::string big(300000, 'q');
      const auto res = gitrelay::proc::run({"cat"}, gitrelay::as_bytes(big));
      if (res.exit_code != 0 || gitrelay::to_string(res.out) != big) { std::cerr << "cat round trip\n"; return 1; }
    }

    // exit status and stderr are reported, not thrown
    {
      const auto res = gitrelay::proc::run({"sh", "-c", "echo oops >&2; exit 3"});
      if (res.exit_code != 3 || res.err != "oops\n" || !res.out.empty()) { std::cerr << "exit status/stderr\n"; return 1; }
    }

    // a child that ignores its input does not wedge the caller
    {
      const std::string input(200000, 'z');
      const auto res = gitrelay::proc::run({"true"}, gitrelay::as_bytes(input));
      if (res.exit_code != 0) { std::cerr << "child ignoring stdin\n"; return 1; }
    }

    // a missing executable is an exception
    {
      bool threw = false;
      try { (void)gitrelay::proc::run({"gitrelay-no-such-program"}); } catch (const std::runtime_error&) { threw = true; }
      if (!threw) { std::cerr << "missing executable not reported\n"; return 1; }
    }

    // many children started at once from the transfer workers
    {
      const gitrelay::TransferPool pool{8};
      std::vector<std::string> items;
      for (int i = 0; i < 64; ++i) items.push_back(std::to_string(i));
      std::atomic<int> good{0};
      pool.for_each(items, [&good](const std::string& n) {
        const auto res = gitrelay::proc::run({"sh", "-c", "read x; echo \"$x-$0\"", n}, gitrelay::as_bytes("in\n"));
        if (res.exit_code == 0 && gitrelay::to_string(res.out) == "in-" + n + "\n") {
          ++good;
        }
      });
      if (good != 64) { std::cerr << "concurrent runs: " << good << " of 64 correct\n"; return 1; }
    }

    std::cout << "subprocess OK\n";
  } catch (const std::exception& e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
