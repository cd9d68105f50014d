#pragma once
#include "gitrelay/log.hpp"
#include "gitrelay/refs.hpp"

#include <optional>
#include <vector>

namespace gitrelay {

// State of one protocol conversation; discarded when the helper exits.
struct Session {
  explicit Session(Logger& logger) : log(logger) {}

  Logger& log;             // holds the negotiated verbosity
  bool first_push = true;  // cleared after the first successful push batch
  std::optional<std::vector<RefEntry>> listed_refs; // last ref listing seen this session
};

} // namespace gitrelay
