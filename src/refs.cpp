#include "gitrelay/refs.hpp"

#include "gitrelay/consts.hpp"
#include "gitrelay/errors.hpp"
#include "gitrelay/log.hpp"
#include "gitrelay/remote_store.hpp"
#include "gitrelay/util.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace gitrelay {

namespace {

// Symbolic chains longer than this are treated as broken.
constexpr int kMaxSymrefDepth = 5;

RefValue parse_ref_content(const std::vector<std::uint8_t> &bytes) {
  const std::string s = strutil::trim(to_string(bytes));
  if (s.starts_with(consts::kRefPrefix)) {
    return RefValue{.value = strutil::trim(std::string_view(s).substr(consts::kRefPrefix.size())),
                    .symbolic = true};
  }
  return RefValue{.value = s, .symbolic = false};
}

std::string lowercase(std::string s) {
  std::ranges::transform(s, s.begin(),
                         [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
  return s;
}

} // namespace

auto RefStore::get_symbolic(std::string_view name) const -> Lookup<RefValue> {
  auto res = store_.backend().get(store_.ref_path(name));
  if (res.is_absent()) {
    return Lookup<RefValue>::absent();
  }
  if (res.is_failed()) {
    return Lookup<RefValue>::failed(res.reason);
  }
  return Lookup<RefValue>::found(parse_ref_content(res.value));
}

auto RefStore::get_ref(std::string_view name) const -> Lookup<std::string> {
  bool malformed = false;
  return resolve(name, 0, malformed);
}

auto RefStore::resolve(std::string_view name, int depth, bool &malformed) const -> Lookup<std::string> {
  if (depth > kMaxSymrefDepth) {
    malformed = true;
    return Lookup<std::string>::failed("symbolic ref chain too deep at " + std::string(name));
  }
  const auto slot = get_symbolic(name);
  if (!slot.is_found()) {
    return slot.is_absent() ? Lookup<std::string>::absent() : Lookup<std::string>::failed(slot.reason);
  }
  if (slot.value.symbolic) {
    try {
      (void)store_.ref_path(slot.value.value);
    } catch (const std::invalid_argument &e) {
      malformed = true;
      return Lookup<std::string>::failed("symbolic ref " + std::string(name) + ": " + e.what());
    }
    return resolve(slot.value.value, depth + 1, malformed);
  }
  if (!looks_hex40(slot.value.value)) {
    malformed = true;
    return Lookup<std::string>::failed("malformed ref " + std::string(name) + ": '" +
                                       slot.value.value + "'");
  }
  return Lookup<std::string>::found(lowercase(slot.value.value));
}

void RefStore::put_ref(std::string_view name, std::string_view hex_oid) const {
  const std::string s = std::string(hex_oid) + "\n";
  store_.backend().put(store_.ref_path(name), to_bytes(s));
}

void RefStore::delete_ref(std::string_view name) const {
  store_.backend().remove(store_.ref_path(name));
}

void RefStore::put_symbolic(std::string_view name, std::string_view target) const {
  const std::string s = std::string(consts::kRefPrefix) + std::string(target) + "\n";
  store_.backend().put(store_.ref_path(name), to_bytes(s));
}

std::vector<RefEntry> RefStore::list_refs(bool for_push) const {
  const std::string loc = store_.dir_path(consts::kRefsDir);
  const auto listing = store_.backend().list_recursive(loc);
  if (listing.is_absent()) {
    if (for_push) {
      log_.debug("no refs at " + loc + ", treating as empty repository");
      return {};
    }
    throw NotFoundError("remote repository not found: " + loc);
  }
  if (listing.is_failed()) {
    throw TransportError(listing.reason);
  }

  std::vector<RefEntry> refs;
  for (const auto &entry : listing.value) {
    if (entry.is_directory) {
      continue;
    }
    const std::string name = std::string(consts::kRefsDir) + "/" + entry.path;
    bool malformed = false;
    Lookup<std::string> hash;
    try {
      hash = resolve(name, 0, malformed);
    } catch (const std::invalid_argument &e) {
      log_.info("skipping unusable ref name: " + std::string(e.what()));
      continue;
    }
    if (hash.is_absent()) {
      log_.debug("ref vanished or dangling, skipping: " + name);
      continue;
    }
    if (hash.is_failed()) {
      if (malformed) {
        log_.info("skipping " + hash.reason);
        continue;
      }
      throw TransportError(hash.reason);
    }
    refs.push_back(RefEntry{.hash = hash.value, .name = name});
  }
  std::ranges::sort(refs, [](const RefEntry &a, const RefEntry &b) { return a.name < b.name; });
  return refs;
}

} // namespace gitrelay
