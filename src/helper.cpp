#include "gitrelay/helper.hpp"

#include "gitrelay/consts.hpp"
#include "gitrelay/errors.hpp"
#include "gitrelay/util.hpp"

#include <charconv>

namespace gitrelay {

namespace {

// "<cmd>" alone or "<cmd> <args>"
bool is_command(std::string_view line, std::string_view cmd) {
  return line == cmd || (line.starts_with(cmd) && line.size() > cmd.size() && line[cmd.size()] == ' ');
}

bool read_line(std::istream &in, std::string &line) {
  if (!std::getline(in, line)) {
    return false;
  }
  strutil::rstrip_newlines(line);
  return true;
}

} // namespace

Helper::Helper(const RemoteStore &store, const RefStore &refs, const LocalRepository &local,
               const TransferPool &pool, Logger &log)
    : session_(log), remote_(store, refs, local, pool, session_) {}

void Helper::send(std::ostream &out, std::string_view line) {
  out << line << '\n';
  session_.log.debug("helper send: " + (line.empty() ? std::string("<blank>") : std::string(line)));
}

void Helper::run(std::istream &in, std::ostream &out) {
  State state = State::Idle;
  std::string line;
  for (;;) {
    const bool got = read_line(in, line);
    if (got) {
      session_.log.debug("helper recv: " + line);
    }

    switch (state) {
    case State::Idle:
      if (!got || line.empty()) {
        return;
      }
      state = on_idle(line, out);
      break;

    case State::PushBatch:
      if (!got) {
        throw ProtocolError("unexpected end of input inside a push batch");
      }
      if (line.empty()) {
        remote_.finish_push_batch();
        for (const auto &r : replies_) {
          send(out, r);
        }
        replies_.clear();
        send(out);
        out.flush();
        state = State::Idle;
      } else if (is_command(line, consts::kCmdPush)) {
        on_push(line);
      } else {
        throw ProtocolError("unexpected line inside a push batch: " + line);
      }
      break;

    case State::FetchBatch:
      if (!got) {
        throw ProtocolError("unexpected end of input inside a fetch batch");
      }
      if (line.empty()) {
        remote_.finish_fetch_batch();
        send(out);
        out.flush();
        state = State::Idle;
      } else if (is_command(line, consts::kCmdFetch)) {
        on_fetch(line);
      } else {
        throw ProtocolError("unexpected line inside a fetch batch: " + line);
      }
      break;
    }
  }
}

Helper::State Helper::on_idle(const std::string &line, std::ostream &out) {
  if (line == consts::kCmdCapabilities) {
    send(out, consts::kCmdOption);
    send(out, consts::kCmdPush);
    send(out, consts::kCmdFetch);
    send(out);
    out.flush();
    return State::Idle;
  }
  if (is_command(line, consts::kCmdOption)) {
    on_option(line, out);
    return State::Idle;
  }
  if (is_command(line, consts::kCmdList)) {
    on_list(line, out);
    return State::Idle;
  }
  if (is_command(line, consts::kCmdPush)) {
    on_push(line);
    return State::PushBatch;
  }
  if (is_command(line, consts::kCmdFetch)) {
    on_fetch(line);
    return State::FetchBatch;
  }
  throw ProtocolError("unsupported operation: " + line);
}

void Helper::on_option(const std::string &line, std::ostream &out) {
  const auto fields = strutil::split(line, consts::kSpace);
  if (fields.size() < 3) {
    throw ProtocolError("malformed option: " + line);
  }
  if (fields[1] == consts::kOptVerbosity) {
    int level = 0;
    const std::string &v = fields[2];
    const auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), level);
    if (ec != std::errc{} || ptr != v.data() + v.size() || fields.size() != 3) {
      send(out, std::string(consts::kReplyError) + " invalid verbosity '" + v + "'");
    } else {
      session_.log.set_verbosity(level);
      send(out, consts::kReplyOk);
    }
  } else {
    send(out, consts::kReplyUnsupported);
  }
  out.flush();
}

void Helper::on_list(const std::string &line, std::ostream &out) {
  const std::string args = strutil::trim(std::string_view(line).substr(consts::kCmdList.size()));
  if (!args.empty() && args != consts::kForPush) {
    throw ProtocolError("malformed list: " + line);
  }
  const bool for_push = args == consts::kForPush;

  for (const auto &ref : remote_.list(for_push)) {
    send(out, ref.hash + " " + ref.name);
  }
  if (const auto head = remote_.head()) {
    if (head->symbolic) {
      send(out, "@" + head->value + " " + std::string(consts::kHeadFile));
    } else if (looks_hex40(head->value)) {
      send(out, head->value + " " + std::string(consts::kHeadFile));
    }
  }
  send(out);
  out.flush();
}

void Helper::on_push(const std::string &line) {
  const auto fields = strutil::split(line, consts::kSpace);
  if (fields.size() != 2) {
    throw ProtocolError("malformed push: " + line);
  }
  const auto intent = PushIntent::parse(fields[1]);
  replies_.push_back(remote_.push(intent).line());
}

void Helper::on_fetch(const std::string &line) {
  const auto fields = strutil::split(line, consts::kSpace);
  if (fields.size() < 3 || !looks_hex40(fields[1])) {
    throw ProtocolError("malformed fetch: " + line);
  }
  remote_.fetch(fields[1]);
}

} // namespace gitrelay
