#pragma once
#include <atomic>
#include <iostream>
#include <mutex>
#include <ostream>
#include <string_view>

namespace gitrelay {

// Verbosity as negotiated with git via "option verbosity <n>".
enum class Level : int { Error = 0, Info = 1, Debug = 2 };

// Diagnostics on the helper's error stream ("error: ...", "info: ...",
// "debug: ..."). Safe to call from transfer workers.
class Logger {
public:
  explicit Logger(std::ostream& out = std::cerr, Level level = Level::Info)
      : out_(&out), level_(static_cast<int>(level)) {}

  void set_verbosity(int verbosity) { level_.store(verbosity); }
  [[nodiscard]] int verbosity() const { return level_.load(); }
  [[nodiscard]] bool enabled(Level level) const { return static_cast<int>(level) <= level_.load(); }

  void log(Level level, std::string_view message);

  void error(std::string_view message) { log(Level::Error, message); }
  void info(std::string_view message) { log(Level::Info, message); }
  void debug(std::string_view message) { log(Level::Debug, message); }

private:
  std::ostream* out_;
  std::atomic<int> level_;
  std::mutex mutex_;
};

} // namespace gitrelay
