#include "gitrelay/remote.hpp"

#include "gitrelay/closure.hpp"
#include "gitrelay/consts.hpp"
#include "gitrelay/errors.hpp"
#include "gitrelay/local_repo.hpp"
#include "gitrelay/remote_store.hpp"
#include "gitrelay/session.hpp"
#include "gitrelay/transfer_pool.hpp"

#include <algorithm>
#include <exception>

namespace gitrelay {

namespace {

// Protocol replies are single lines.
std::string one_line(std::string s) {
  std::ranges::replace(s, '\n', ' ');
  std::ranges::replace(s, '\r', ' ');
  return s;
}

} // namespace

PushIntent PushIntent::parse(std::string_view refspec) {
  PushIntent intent;
  if (refspec.starts_with('+')) {
    intent.force = true;
    refspec.remove_prefix(1);
  }
  const std::size_t colon = refspec.find(':');
  if (colon == std::string_view::npos) {
    throw ProtocolError("malformed push refspec '" + std::string(refspec) + "'");
  }
  intent.src = std::string(refspec.substr(0, colon));
  intent.dst = std::string(refspec.substr(colon + 1));
  if (intent.dst.empty()) {
    throw ProtocolError("push refspec without destination '" + std::string(refspec) + "'");
  }
  return intent;
}

std::string PushReply::line() const {
  if (!error) {
    return std::string(consts::kReplyOk) + " " + dst;
  }
  return std::string(consts::kReplyError) + " " + dst + " " + one_line(*error);
}

Remote::Remote(const RemoteStore &store, const RefStore &refs, const LocalRepository &local,
               const TransferPool &pool, Session &session)
    : store_(store), refs_(refs), local_(local), pool_(pool), session_(session) {}

std::vector<RefEntry> Remote::list(bool for_push) {
  auto refs = refs_.list_refs(for_push);
  session_.listed_refs = refs;
  return refs;
}

std::optional<RefValue> Remote::head() const {
  const auto slot = refs_.get_symbolic(consts::kHeadFile);
  if (slot.is_failed()) {
    throw TransportError(slot.reason);
  }
  if (slot.is_absent()) {
    return std::nullopt;
  }
  return slot.value;
}

std::unordered_set<std::string> Remote::present_ids() {
  if (!session_.listed_refs) {
    session_.listed_refs = refs_.list_refs(/*for_push=*/true);
  }
  std::unordered_set<std::string> present;
  for (const auto &r : *session_.listed_refs) {
    present.insert(r.hash);
  }
  return present;
}

void Remote::remember_ref(const std::string &dst, const std::optional<std::string> &hex) {
  if (!session_.listed_refs) {
    return;
  }
  auto &refs = *session_.listed_refs;
  std::erase_if(refs, [&dst](const RefEntry &r) { return r.name == dst; });
  if (hex) {
    refs.push_back(RefEntry{.hash = *hex, .name = dst});
    std::ranges::sort(refs, [](const RefEntry &a, const RefEntry &b) { return a.name < b.name; });
  }
}

PushReply Remote::push(const PushIntent &intent) {
  if (intent.is_delete()) {
    return remove(intent.dst);
  }
  auto &log = session_.log;
  PushReply reply{.dst = intent.dst, .error = std::nullopt};
  try {
    const auto current = refs_.get_ref(intent.dst);
    if (current.is_failed()) {
      throw TransportError(current.reason);
    }
    const std::string new_hex = local_.resolve_ref(intent.src);

    if (current.is_found() && !intent.force && !local_.is_ancestor(current.value, new_hex)) {
      log.info("rejecting " + intent.dst + ": " + current.value + " is not an ancestor of " + new_hex);
      reply.error = std::string(consts::kNonFastForward);
      return reply;
    }

    const auto present = present_ids();
    const auto ids = closure::objects_to_upload(local_, new_hex, present);
    log.info("pushing " + intent.dst + ": " + std::to_string(ids.size()) + " objects");
    store_.put_objects(
        ids, [this](const std::string &hex) { return closure::read_verified(local_, hex); }, pool_);
    // only after every object of the closure is stored
    refs_.put_ref(intent.dst, new_hex);

    remember_ref(intent.dst, new_hex);
    pushed_.emplace_back(intent.src, intent.dst);
  } catch (const ProtocolError &) {
    throw;
  } catch (const std::exception &e) {
    log.error("push " + intent.dst + ": " + e.what());
    reply.error = e.what();
  }
  return reply;
}

PushReply Remote::remove(std::string_view dst) {
  PushReply reply{.dst = std::string(dst), .error = std::nullopt};
  session_.log.debug("deleting ref " + reply.dst);
  try {
    refs_.delete_ref(dst);
    remember_ref(reply.dst, std::nullopt);
  } catch (const std::exception &e) {
    session_.log.error("delete " + reply.dst + ": " + e.what());
    reply.error = e.what();
  }
  return reply;
}

void Remote::finish_push_batch() {
  if (session_.first_push && !pushed_.empty()) {
    session_.first_push = false;
    init_remote_head();
  }
  pushed_.clear();
}

void Remote::init_remote_head() {
  auto &log = session_.log;
  const auto slot = refs_.get_symbolic(consts::kHeadFile);
  if (slot.is_found()) {
    return;
  }
  if (slot.is_failed()) {
    log.info("cannot read remote HEAD: " + slot.reason);
    return;
  }

  std::string target = pushed_.front().second;
  try {
    if (const auto branch = local_.current_branch()) {
      const auto it = std::ranges::find_if(pushed_, [&branch](const auto &p) { return p.first == *branch; });
      if (it != pushed_.end()) {
        target = it->second;
      }
    }
  } catch (const std::exception &e) {
    log.debug(std::string("local HEAD unavailable: ") + e.what());
  }

  try {
    refs_.put_symbolic(consts::kHeadFile, target);
    log.debug("set remote HEAD to " + target);
  } catch (const TransportError &e) {
    log.info(std::string("failed to set default branch on remote: ") + e.what());
  }
}

void Remote::fetch(std::string_view hex_oid) {
  closure::fetch_all(store_, local_, pool_, {std::string(hex_oid)}, fetched_, session_.log);
}

void Remote::finish_fetch_batch() { fetched_.clear(); }

} // namespace gitrelay
