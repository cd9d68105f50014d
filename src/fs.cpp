#include "gitrelay/fs.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <limits>
#include <random>
#include <stdexcept>
#include <zlib.h>

namespace gitrelay::fs {

namespace {

constexpr std::size_t kInflateChunk = 64 * 1024;

std::string tmp_suffix() {
  thread_local std::mt19937_64 rng{std::random_device{}()};
  return std::to_string(rng());
}

} // namespace

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

void ensure_parent_dir(const std::filesystem::path &p) {
  std::error_code ec;
  std::filesystem::create_directories(p.parent_path(), ec);
  // another writer may have created it between the check and the mkdir
  if (ec && !std::filesystem::is_directory(p.parent_path()))
    throw std::runtime_error("mkdir -p failed: " + ec.message());
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("open for read failed: " + p.string());
  }
  ifs.seekg(0, std::ios::end);
  auto n = static_cast<std::size_t>(ifs.tellg());
  ifs.seekg(0);
  std::vector<std::uint8_t> buf(n);
  if (n)
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(n));
  if (!ifs)
    throw std::runtime_error("read failed: " + p.string());
  return buf;
}

void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data) {
  ensure_parent_dir(p);
  // hidden sibling: ref names never have components starting with '.'
  const auto tmp = p.parent_path() / ("." + p.filename().string() + ".tmp" + tmp_suffix());
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw std::runtime_error("open temp for write failed: " + tmp.string());
    }
    if (!data.empty()) {
      ofs.write(reinterpret_cast<const char *>(data.data()),
                static_cast<std::streamsize>(data.size()));
    }
    ofs.flush();
    if (!ofs)
      throw std::runtime_error("flush temp failed: " + tmp.string());
  }
  std::error_code ec;
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    throw std::runtime_error("atomic replace failed: " + p.string() + ": " + ec.message());
  }
}

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data) {
  uLongf bound = compressBound(static_cast<uLong>(data.size()));
  std::vector<std::uint8_t> out(bound);
  const int rc = compress2(out.data(), &bound, reinterpret_cast<const Bytef *>(data.data()),
                           static_cast<uLong>(data.size()), Z_BEST_SPEED);
  if (rc != Z_OK)
    throw std::runtime_error("zlib compress failed");
  out.resize(bound);
  return out;
}

std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data, std::size_t max_slice) {
  // avail_in is a uInt
  max_slice = std::clamp<std::size_t>(max_slice, 1, std::numeric_limits<uInt>::max());

  z_stream zs{};
  if (inflateInit(&zs) != Z_OK)
    throw std::runtime_error("zlib inflateInit failed");

  std::size_t fed = 0;
  std::vector<std::uint8_t> out;
  std::array<std::uint8_t, kInflateChunk> chunk{};
  int rc = Z_OK;
  while (rc != Z_STREAM_END) {
    if (zs.avail_in == 0 && fed < data.size()) {
      const std::size_t n = std::min(max_slice, data.size() - fed);
      zs.next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(data.data() + fed));
      zs.avail_in = static_cast<uInt>(n);
      fed += n;
    }
    zs.next_out = chunk.data();
    zs.avail_out = static_cast<uInt>(chunk.size());
    rc = inflate(&zs, Z_NO_FLUSH);
    if (rc != Z_OK && rc != Z_STREAM_END) {
      inflateEnd(&zs);
      throw std::runtime_error("zlib uncompress failed");
    }
    const std::size_t produced = chunk.size() - zs.avail_out;
    out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(produced));
    if (rc == Z_OK && zs.avail_in == 0 && fed == data.size() && produced == 0) {
      inflateEnd(&zs);
      throw std::runtime_error("zlib uncompress: truncated stream");
    }
  }
  inflateEnd(&zs);
  return out;
}

std::filesystem::path make_temp_dir(std::string_view prefix) {
  const auto base = std::filesystem::temp_directory_path();
  for (int attempt = 0; attempt < 16; ++attempt) {
    auto candidate = base / (std::string(prefix) + tmp_suffix());
    std::error_code ec;
    if (std::filesystem::create_directory(candidate, ec)) {
      return candidate;
    }
    if (ec) {
      throw std::runtime_error("create temp dir failed: " + ec.message());
    }
  }
  throw std::runtime_error("create temp dir failed: no unique name under " + base.string());
}

ScratchDir::~ScratchDir() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

} // namespace gitrelay::fs
