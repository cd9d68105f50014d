#pragma once
#include <cstdint>
#include <filesystem>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitrelay::fs {

bool exists(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);
void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data);
// Input is handed to zlib `max_slice` bytes at a time (zlib counts in 32 bits).
std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data,
                                       std::size_t max_slice = std::numeric_limits<std::uint32_t>::max());

// Create a fresh, uniquely named directory under the system temp dir.
std::filesystem::path make_temp_dir(std::string_view prefix);

// Owns a scratch directory and removes it (recursively) on destruction.
class ScratchDir {
public:
  explicit ScratchDir(std::string_view prefix) : path_(make_temp_dir(prefix)) {}
  ~ScratchDir();

  ScratchDir(const ScratchDir&) = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;

  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

} // namespace gitrelay::fs
