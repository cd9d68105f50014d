#pragma once
#include "gitrelay/remote.hpp"
#include "gitrelay/session.hpp"

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace gitrelay {

/**
 * The git remote-helper protocol over a line stream.
 *
 *   capabilities            -> option, push, fetch, blank
 *   option verbosity <n>    -> ok
 *   list [for-push]         -> "<hex> <ref>"..., "@<target> HEAD", blank
 *   push <src>:<dst> ...    -> "ok <dst>" / "error <dst> <why>"..., blank
 *   fetch <hex> <name> ...  -> blank once the batch is done
 *
 * A blank line or end of input between batches ends the conversation.
 */
class Helper {
public:
  Helper(const RemoteStore& store, const RefStore& refs, const LocalRepository& local,
         const TransferPool& pool, Logger& log);

  // Serve one conversation. Throws ProtocolError on input it cannot accept;
  // TransportError / IntegrityError from list and fetch also end it.
  void run(std::istream& in, std::ostream& out);

  [[nodiscard]] Session& session() { return session_; }

private:
  enum class State : std::uint8_t { Idle, PushBatch, FetchBatch };

  State on_idle(const std::string& line, std::ostream& out);
  void on_option(const std::string& line, std::ostream& out);
  void on_list(const std::string& line, std::ostream& out);
  void on_push(const std::string& line);
  void on_fetch(const std::string& line);

  void send(std::ostream& out, std::string_view line = {});

  Session session_;
  Remote remote_;
  std::vector<std::string> replies_; // buffered push replies
};

} // namespace gitrelay
