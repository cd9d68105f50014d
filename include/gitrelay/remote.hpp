#pragma once
#include "gitrelay/refs.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace gitrelay {

class LocalRepository;
class RemoteStore;
class TransferPool;
struct Session;

// One "<src>:<dst>" refspec from a push command.
struct PushIntent {
  std::string src;   // local ref or id; empty means delete `dst`
  std::string dst;   // remote ref
  bool force = false;

  // Parse "[+]<src>:<dst>". Throws ProtocolError if there is no ':'.
  static PushIntent parse(std::string_view refspec);

  [[nodiscard]] bool is_delete() const { return src.empty(); }
};

struct PushReply {
  std::string dst;
  std::optional<std::string> error; // nullopt on success

  // "ok <dst>" or "error <dst> <why>"
  [[nodiscard]] std::string line() const;
};

/**
 * Push, fetch and delete against one remote repository.
 *
 * A push uploads the missing part of the object closure as one batch and
 * writes the ref only after the batch has completed. The fast-forward check
 * is check-then-act: two helpers pushing the same ref at the same time can
 * both pass it, since the remote offers no locking.
 */
class Remote {
public:
  Remote(const RemoteStore& store, const RefStore& refs, const LocalRepository& local,
         const TransferPool& pool, Session& session);

  // Remote refs, remembered in the session for later pushes.
  std::vector<RefEntry> list(bool for_push);

  // Remote HEAD slot, if there is one. Throws TransportError on failure.
  [[nodiscard]] std::optional<RefValue> head() const;

  // Non-fast-forward and per-ref failures come back as PushReply::error.
  PushReply push(const PushIntent& intent);

  // Delete a remote ref; an absent ref is success.
  PushReply remove(std::string_view dst);

  // End of a push batch: on the session's first successful push, point a
  // missing remote HEAD at the pushed branch.
  void finish_push_batch();

  // Download `hex_oid` and its closure into the local database.
  void fetch(std::string_view hex_oid);

  // End of a fetch batch: forget what this batch downloaded.
  void finish_fetch_batch();

private:
  [[nodiscard]] std::unordered_set<std::string> present_ids();
  void remember_ref(const std::string& dst, const std::optional<std::string>& hex);
  void init_remote_head();

  const RemoteStore& store_;
  const RefStore& refs_;
  const LocalRepository& local_;
  const TransferPool& pool_;
  Session& session_;

  std::vector<std::pair<std::string, std::string>> pushed_; // (src, dst) this batch
  std::unordered_set<std::string> fetched_;                 // ids fetched this batch
};

} // namespace gitrelay
