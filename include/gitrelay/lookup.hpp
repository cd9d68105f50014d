#pragma once
#include <cstdint>
#include <string>
#include <utility>

namespace gitrelay {

enum class Presence : std::uint8_t { Found, Absent, Failed };

// Outcome of reading something that may legitimately not exist.
// `reason` is only meaningful for Failed.
template <typename T>
struct Lookup {
  Presence status = Presence::Absent;
  T value{};
  std::string reason;

  static Lookup found(T v) { return Lookup{Presence::Found, std::move(v), {}}; }
  static Lookup absent() { return Lookup{Presence::Absent, T{}, {}}; }
  static Lookup failed(std::string why) { return Lookup{Presence::Failed, T{}, std::move(why)}; }

  [[nodiscard]] bool is_found() const { return status == Presence::Found; }
  [[nodiscard]] bool is_absent() const { return status == Presence::Absent; }
  [[nodiscard]] bool is_failed() const { return status == Presence::Failed; }
};

} // namespace gitrelay
