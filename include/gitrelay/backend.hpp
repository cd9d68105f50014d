#pragma once
#include "gitrelay/lookup.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace gitrelay {

class TransferPool;

struct BackendEntry {
  std::string path;          // relative to the listed directory, '/'-separated
  bool is_directory = false;
};

struct Upload {
  std::string path;
  // Bytes to store. Called once, on a transfer worker, when the file is written.
  std::function<std::vector<std::uint8_t>()> contents;
};

// Byte-addressable blob store keyed by '/'-separated path strings.
// Implementations must be safe to call from several transfer workers.
class Backend {
public:
  virtual ~Backend() = default;

  // Found(bytes), Absent if the path does not exist, Failed(reason) otherwise.
  virtual Lookup<std::vector<std::uint8_t>> get(std::string_view path) const = 0;

  // Throws TransportError; a failed put leaves no partial file behind.
  virtual void put(std::string_view path, const std::vector<std::uint8_t>& data) const = 0;

  // Absence is success; other failures throw TransportError.
  virtual void remove(std::string_view path) const = 0;

  // Every entry below `path`, recursively. Absent if `path` does not exist.
  virtual Lookup<std::vector<BackendEntry>> list_recursive(std::string_view path) const = 0;

  // Write a group of files. Returns only once every file is written.
  // The default spreads single puts over `pool`, producing each file's
  // contents on the worker that writes it. Not transactional: a failure
  // can leave part of the group written.
  virtual void put_batch(const std::vector<Upload>& uploads, const TransferPool& pool) const;
};

} // namespace gitrelay
