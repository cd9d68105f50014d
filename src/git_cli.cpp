#include "gitrelay/local_repo.hpp"

#include "gitrelay/consts.hpp"
#include "gitrelay/log.hpp"
#include "gitrelay/subprocess.hpp"
#include "gitrelay/util.hpp"

#include <algorithm>
#include <charconv>
#include <stdexcept>

namespace gitrelay {

namespace {

std::string output_line(const proc::Result &res) {
  return strutil::trim(to_string(res.out));
}

std::string error_line(const proc::Result &res) {
  std::string line = res.err.substr(0, res.err.find('\n'));
  return line.empty() ? "exit code " + std::to_string(res.exit_code) : line;
}

} // namespace

std::string GitCli::resolve_ref(std::string_view name) const {
  const auto res = proc::run({executable_, "rev-parse", "--verify", "-q", std::string(name)});
  const std::string hex = output_line(res);
  if (res.exit_code != 0 || !looks_hex40(hex)) {
    throw std::runtime_error("cannot resolve local ref '" + std::string(name) + "'");
  }
  return hex;
}

std::optional<std::string> GitCli::current_branch() const {
  const auto res = proc::run({executable_, "symbolic-ref", "-q", std::string(consts::kHeadFile)});
  if (res.exit_code == 0) {
    return output_line(res);
  }
  if (res.exit_code == 1) {
    return std::nullopt; // detached
  }
  throw std::runtime_error("git symbolic-ref HEAD: " + error_line(res));
}

std::vector<std::uint8_t> GitCli::read_object(std::string_view hex_oid) const {
  const std::string request = std::string(hex_oid) + "\n";
  const auto res = proc::run({executable_, "cat-file", "--batch"}, as_bytes(request));
  if (res.exit_code != 0) {
    throw std::runtime_error("git cat-file " + std::string(hex_oid) + ": " + error_line(res));
  }

  // "<hex> <type> <size>\n<contents>\n" or "<hex> missing\n"
  const auto nl = std::ranges::find(res.out, static_cast<std::uint8_t>(consts::kLF));
  if (nl == res.out.end()) {
    throw std::runtime_error("git cat-file " + std::string(hex_oid) + ": no header");
  }
  const auto fields = strutil::split(std::string(res.out.begin(), nl), consts::kSpace);
  if (fields.size() != 3) {
    throw std::runtime_error("local object " + std::string(hex_oid) + " is missing");
  }
  const auto kind = parse_kind(fields[1]);
  std::size_t size = 0;
  const auto [ptr, ec] = std::from_chars(fields[2].data(), fields[2].data() + fields[2].size(), size);
  if (!kind || ec != std::errc{}) {
    throw std::runtime_error("git cat-file " + std::string(hex_oid) + ": bad header");
  }
  const auto body = nl + 1;
  if (static_cast<std::size_t>(res.out.end() - body) < size) {
    throw std::runtime_error("git cat-file " + std::string(hex_oid) + ": truncated contents");
  }
  Object obj{.kind = *kind, .data = {body, body + static_cast<std::ptrdiff_t>(size)}};
  return object::encode(obj);
}

std::string GitCli::write_object(const Object &obj) const {
  const auto res = proc::run({executable_, "hash-object", "-w", "--stdin", "--literally", "-t",
                              std::string(kind_name(obj.kind))},
                             obj.data);
  const std::string hex = output_line(res);
  if (res.exit_code != 0 || !looks_hex40(hex)) {
    throw std::runtime_error("git hash-object: " + error_line(res));
  }
  return hex;
}

bool GitCli::is_ancestor(std::string_view ancestor, std::string_view descendant) const {
  const auto res = proc::run({executable_, "merge-base", "--is-ancestor", std::string(ancestor),
                              std::string(descendant)});
  if (res.exit_code == 0) {
    return true;
  }
  if (res.exit_code != 1) {
    log_.debug("merge-base --is-ancestor " + std::string(ancestor) + " " + std::string(descendant) +
               ": " + error_line(res));
  }
  return false;
}

} // namespace gitrelay
