#pragma once
#include "gitrelay/backend.hpp"
#include "gitrelay/errors.hpp"
#include "gitrelay/hash.hpp"
#include "gitrelay/local_repo.hpp"
#include "gitrelay/object.hpp"
#include "gitrelay/util.hpp"

#include <cstdint>
#include <deque>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fakes {

inline std::filesystem::path temp_dir(std::string_view tag) {
  const auto p = std::filesystem::temp_directory_path() /
                 ("gitrelay_" + std::string(tag) + "_" + std::to_string(std::random_device{}()));
  std::filesystem::create_directories(p);
  return p;
}

struct TreeEntry {
  std::string mode; // "100644", "40000", "160000"
  std::string name;
  std::string hex;
};

// Local object database held in memory. Objects are stored as loose bytes,
// so ids are real SHA-1 ids.
class MemoryRepo : public gitrelay::LocalRepository {
public:
  std::string add(const gitrelay::Object& obj) {
    const auto raw = gitrelay::object::encode(obj);
    const auto hex = gitrelay::object::hash_of(raw);
    std::lock_guard lk(mutex_);
    objects_[hex] = raw;
    return hex;
  }

  std::string blob(std::string_view text) {
    return add({gitrelay::ObjectKind::Blob, gitrelay::to_bytes(text)});
  }

  std::string tree(const std::vector<TreeEntry>& entries) {
    std::vector<std::uint8_t> data;
    for (const auto& e : entries) {
      const std::string head = e.mode + " " + e.name;
      data.insert(data.end(), head.begin(), head.end());
      data.push_back(0);
      gitrelay::oid id{};
      if (!gitrelay::from_hex(e.hex, id)) {
        throw std::invalid_argument("bad tree entry id " + e.hex);
      }
      data.insert(data.end(), id.begin(), id.end());
    }
    return add({gitrelay::ObjectKind::Tree, std::move(data)});
  }

  std::string commit(const std::string& tree_hex, const std::vector<std::string>& parents,
                     std::string_view message) {
    std::string text = "tree " + tree_hex + "\n";
    for (const auto& p : parents) {
      text += "parent " + p + "\n";
    }
    text += "author T <t@example.com> 1700000000 +0000\n";
    text += "committer T <t@example.com> 1700000000 +0000\n\n";
    text += message;
    return add({gitrelay::ObjectKind::Commit, gitrelay::to_bytes(text)});
  }

  // Commit with a single-file tree.
  std::string commit_file(std::string_view content, const std::vector<std::string>& parents) {
    const auto b = blob(content);
    const auto t = tree({{"100644", "file.txt", b}});
    return commit(t, parents, std::string(content) + "\n");
  }

  void set_ref(const std::string& name, const std::string& hex) {
    std::lock_guard lk(mutex_);
    refs_[name] = hex;
  }
  void set_branch(std::optional<std::string> branch) {
    std::lock_guard lk(mutex_);
    branch_ = std::move(branch);
  }

  bool has(const std::string& hex) const {
    std::lock_guard lk(mutex_);
    return objects_.contains(hex);
  }
  std::size_t size() const {
    std::lock_guard lk(mutex_);
    return objects_.size();
  }

  // Replace stored bytes without changing the key (corruption).
  void overwrite(const std::string& hex, std::vector<std::uint8_t> raw) {
    std::lock_guard lk(mutex_);
    objects_[hex] = std::move(raw);
  }

  std::string resolve_ref(std::string_view name) const override {
    std::lock_guard lk(mutex_);
    if (const auto it = refs_.find(std::string(name)); it != refs_.end()) {
      return it->second;
    }
    if (gitrelay::looks_hex40(name) && objects_.contains(std::string(name))) {
      return std::string(name);
    }
    throw std::runtime_error("cannot resolve '" + std::string(name) + "'");
  }

  std::optional<std::string> current_branch() const override {
    std::lock_guard lk(mutex_);
    return branch_;
  }

  std::vector<std::uint8_t> read_object(std::string_view hex) const override {
    std::lock_guard lk(mutex_);
    const auto it = objects_.find(std::string(hex));
    if (it == objects_.end()) {
      throw std::runtime_error("missing object " + std::string(hex));
    }
    return it->second;
  }

  std::string write_object(const gitrelay::Object& obj) const override {
    const auto raw = gitrelay::object::encode(obj);
    const auto hex = gitrelay::object::hash_of(raw);
    std::lock_guard lk(mutex_);
    objects_[hex] = raw;
    return hex;
  }

  bool is_ancestor(std::string_view ancestor, std::string_view descendant) const override {
    std::deque<std::string> queue{std::string(descendant)};
    std::set<std::string> seen;
    while (!queue.empty()) {
      const std::string cur = queue.front();
      queue.pop_front();
      if (cur == ancestor) {
        return true;
      }
      if (!seen.insert(cur).second) {
        continue;
      }
      std::vector<std::uint8_t> raw;
      {
        std::lock_guard lk(mutex_);
        const auto it = objects_.find(cur);
        if (it == objects_.end()) {
          continue;
        }
        raw = it->second;
      }
      const auto obj = gitrelay::object::decode(raw);
      if (obj.kind != gitrelay::ObjectKind::Commit) {
        continue;
      }
      const auto refs = gitrelay::object::references(obj);
      // skip the tree, walk parents
      queue.insert(queue.end(), refs.begin() + 1, refs.end());
    }
    return false;
  }

private:
  mutable std::mutex mutex_;
  mutable std::map<std::string, std::vector<std::uint8_t>> objects_;
  std::map<std::string, std::string> refs_;
  std::optional<std::string> branch_;
};

// Wraps a backend: records writes in order and fails any operation on a key
// containing one of the configured fragments.
class RecordingBackend : public gitrelay::Backend {
public:
  explicit RecordingBackend(const gitrelay::Backend& inner) : inner_(inner) {}

  void fail_on(std::string fragment) {
    std::lock_guard lk(mutex_);
    failing_.push_back(std::move(fragment));
  }
  void clear_failures() {
    std::lock_guard lk(mutex_);
    failing_.clear();
  }

  std::vector<std::string> writes() const {
    std::lock_guard lk(mutex_);
    return writes_;
  }
  std::size_t gets() const {
    std::lock_guard lk(mutex_);
    return gets_;
  }
  void reset_counters() {
    std::lock_guard lk(mutex_);
    writes_.clear();
    gets_ = 0;
  }

  gitrelay::Lookup<std::vector<std::uint8_t>> get(std::string_view path) const override {
    {
      std::lock_guard lk(mutex_);
      ++gets_;
    }
    if (failing(path)) {
      return gitrelay::Lookup<std::vector<std::uint8_t>>::failed("injected failure");
    }
    return inner_.get(path);
  }

  void put(std::string_view path, const std::vector<std::uint8_t>& data) const override {
    if (failing(path)) {
      throw gitrelay::TransportError("injected failure writing " + std::string(path));
    }
    inner_.put(path, data);
    std::lock_guard lk(mutex_);
    writes_.emplace_back(path);
  }

  void remove(std::string_view path) const override {
    if (failing(path)) {
      throw gitrelay::TransportError("injected failure removing " + std::string(path));
    }
    inner_.remove(path);
  }

  gitrelay::Lookup<std::vector<gitrelay::BackendEntry>> list_recursive(std::string_view path) const override {
    if (failing(path)) {
      return gitrelay::Lookup<std::vector<gitrelay::BackendEntry>>::failed("injected failure");
    }
    return inner_.list_recursive(path);
  }

private:
  bool failing(std::string_view path) const {
    std::lock_guard lk(mutex_);
    for (const auto& f : failing_) {
      if (path.find(f) != std::string_view::npos) {
        return true;
      }
    }
    return false;
  }

  const gitrelay::Backend& inner_;
  mutable std::mutex mutex_;
  std::vector<std::string> failing_;
  mutable std::vector<std::string> writes_;
  mutable std::size_t gets_ = 0;
};

} // namespace fakes
