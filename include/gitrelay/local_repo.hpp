#pragma once
#include "gitrelay/object.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitrelay {

class Logger;

// The host's local object database, as the helper needs it.
// All operations throw std::runtime_error when the database cannot answer.
class LocalRepository {
public:
  virtual ~LocalRepository() = default;

  // 40-hex id a local ref / revision names (tags are not peeled).
  [[nodiscard]] virtual std::string resolve_ref(std::string_view name) const = 0;

  // Ref HEAD points at, or nullopt when HEAD is detached.
  [[nodiscard]] virtual std::optional<std::string> current_branch() const = 0;

  // Uncompressed loose bytes "<kind> <len>\0<payload>" of a local object.
  [[nodiscard]] virtual std::vector<std::uint8_t> read_object(std::string_view hex_oid) const = 0;

  // Store an object; returns its 40-hex id.
  virtual std::string write_object(const Object& obj) const = 0;

  // Graph query: is `ancestor` an ancestor of `descendant`?
  // Includes equality (a commit is an ancestor of itself). Unknown ids are
  // reported as false.
  [[nodiscard]] virtual bool is_ancestor(std::string_view ancestor,
                                         std::string_view descendant) const = 0;
};

// LocalRepository backed by the `git` executable, run in the current
// directory (git exports GIT_DIR to remote helpers).
class GitCli : public LocalRepository {
public:
  explicit GitCli(Logger& log, std::string executable = "git")
      : log_(log), executable_(std::move(executable)) {}

  [[nodiscard]] std::string resolve_ref(std::string_view name) const override;
  [[nodiscard]] std::optional<std::string> current_branch() const override;
  [[nodiscard]] std::vector<std::uint8_t> read_object(std::string_view hex_oid) const override;
  std::string write_object(const Object& obj) const override;
  [[nodiscard]] bool is_ancestor(std::string_view ancestor,
                                 std::string_view descendant) const override;

private:
  Logger& log_;
  std::string executable_;
};

} // namespace gitrelay
