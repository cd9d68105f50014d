#pragma once
#include "gitrelay/lookup.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace gitrelay {

class Logger;
class RemoteStore;

struct RefEntry {
  std::string hash; // 40-hex
  std::string name; // "refs/..."

  bool operator==(const RefEntry&) const = default;
};

// Raw content of a ref slot.
struct RefValue {
  std::string value;     // target ref name if symbolic, else the stored id
  bool symbolic = false; // stored as "ref: <value>"

  bool operator==(const RefValue&) const = default;
};

// Refs and symbolic refs of a remote repository, read and written through
// the RemoteStore key mapping.
class RefStore {
public:
  RefStore(const RemoteStore& store, Logger& log) : store_(store), log_(log) {}

  /**
   * Every ref below <prefix>/refs with the id it resolves to, sorted by name.
   * An absent ref namespace is an empty result when `for_push` (first push
   * into an empty repository) and NotFoundError otherwise. Refs that vanish
   * between listing and reading, symbolic refs that do not resolve, and
   * entries with an unusable name or content (sync conflict copies, stray
   * files) are skipped. Backend failures throw TransportError.
   */
  [[nodiscard]] std::vector<RefEntry> list_refs(bool for_push) const;

  // Id a ref points at, following symbolic refs. Failed on backend errors
  // or unparsable content.
  [[nodiscard]] Lookup<std::string> get_ref(std::string_view name) const;

  // Overwrite/create a ref with the given 40-hex id ("<hex>\n" on the remote).
  void put_ref(std::string_view name, std::string_view hex_oid) const;

  // Idempotent: deleting an absent ref succeeds.
  void delete_ref(std::string_view name) const;

  // Read a ref slot without resolving it ("HEAD" is the usual caller).
  [[nodiscard]] Lookup<RefValue> get_symbolic(std::string_view name) const;

  // Write "ref: <target>\n"
  void put_symbolic(std::string_view name, std::string_view target) const;

private:
  // `malformed` is set when a Failed result comes from the stored content
  // rather than from the backend.
  [[nodiscard]] Lookup<std::string> resolve(std::string_view name, int depth, bool& malformed) const;

  const RemoteStore& store_;
  Logger& log_;
};

} // namespace gitrelay
