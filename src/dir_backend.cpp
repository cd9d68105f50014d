#include "gitrelay/dir_backend.hpp"

#include "gitrelay/errors.hpp"
#include "gitrelay/fs.hpp"

#include <algorithm>
#include <system_error>

namespace stdfs = std::filesystem;
namespace gfs   = gitrelay::fs;

namespace gitrelay {

stdfs::path DirBackend::resolve(std::string_view path) const {
  std::string rel(path);
  while (!rel.empty() && rel.front() == '/') {
    rel.erase(rel.begin());
  }
  return rel.empty() ? root_ : root_ / stdfs::path(rel).lexically_normal();
}

auto DirBackend::get(std::string_view path) const -> Lookup<std::vector<std::uint8_t>> {
  const auto p = resolve(path);
  std::error_code ec;
  const auto st = stdfs::status(p, ec);
  if (st.type() == stdfs::file_type::not_found) {
    return Lookup<std::vector<std::uint8_t>>::absent();
  }
  if (ec) {
    return Lookup<std::vector<std::uint8_t>>::failed(p.string() + ": " + ec.message());
  }
  if (!stdfs::is_regular_file(st)) {
    return Lookup<std::vector<std::uint8_t>>::failed(p.string() + ": not a regular file");
  }
  try {
    return Lookup<std::vector<std::uint8_t>>::found(gfs::read_file(p));
  } catch (const std::exception &e) {
    // vanished between stat and open
    if (!gfs::exists(p)) {
      return Lookup<std::vector<std::uint8_t>>::absent();
    }
    return Lookup<std::vector<std::uint8_t>>::failed(e.what());
  }
}

void DirBackend::put(std::string_view path, const std::vector<std::uint8_t> &data) const {
  try {
    gfs::write_file_atomic(resolve(path), data);
  } catch (const std::exception &e) {
    throw TransportError(std::string("write ") + std::string(path) + ": " + e.what());
  }
}

void DirBackend::remove(std::string_view path) const {
  std::error_code ec;
  stdfs::remove(resolve(path), ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    throw TransportError(std::string("delete ") + std::string(path) + ": " + ec.message());
  }
}

auto DirBackend::list_recursive(std::string_view path) const -> Lookup<std::vector<BackendEntry>> {
  const auto dir = resolve(path);
  std::error_code ec;
  const auto st = stdfs::status(dir, ec);
  if (st.type() == stdfs::file_type::not_found) {
    return Lookup<std::vector<BackendEntry>>::absent();
  }
  if (ec || !stdfs::is_directory(st)) {
    return Lookup<std::vector<BackendEntry>>::failed(dir.string() + ": not a directory");
  }

  std::vector<BackendEntry> out;
  for (auto it = stdfs::recursive_directory_iterator(dir, ec);
       !ec && it != stdfs::recursive_directory_iterator(); it.increment(ec)) {
    const auto name = it->path().filename().string();
    if (name.starts_with(".")) {
      // in-flight temp files from write_file_atomic
      if (it->is_directory()) {
        it.disable_recursion_pending();
      }
      continue;
    }
    out.push_back(BackendEntry{.path = stdfs::relative(it->path(), dir).generic_string(),
                               .is_directory = it->is_directory()});
  }
  if (ec) {
    return Lookup<std::vector<BackendEntry>>::failed(dir.string() + ": " + ec.message());
  }
  std::ranges::sort(out, [](const BackendEntry &a, const BackendEntry &b) { return a.path < b.path; });
  return Lookup<std::vector<BackendEntry>>::found(std::move(out));
}

} // namespace gitrelay
