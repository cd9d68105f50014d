#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace gitrelay::proc {

struct Result {
  int exit_code = 0; // 128 + signal number if the child was killed
  std::vector<std::uint8_t> out;
  std::string err;
};

/**
 * Run argv[0] (looked up on PATH) with `input` fed to its stdin, and collect
 * stdout and stderr. Safe to call from several threads at once.
 * Throws std::runtime_error if the process cannot be started at all; a
 * non-zero exit is reported through Result::exit_code, not thrown.
 * The caller must ignore SIGPIPE (a child may exit before reading stdin).
 */
Result run(const std::vector<std::string>& argv, std::span<const std::uint8_t> input = {});

} // namespace gitrelay::proc
