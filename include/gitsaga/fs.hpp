#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gitsaga::fs {

bool exists(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);
void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);

// Text convenience wrappers over read_file/write_file_atomic.
std::string read_text(const std::filesystem::path& p);
void write_text_atomic(const std::filesystem::path& p, std::string_view text);

// gzip member (RFC 1952) around a raw deflate stream.
std::vector<std::uint8_t> gzip_compress(std::span<const std::uint8_t> data);
std::vector<std::uint8_t> gzip_decompress(std::span<const std::uint8_t> data);

// Absolute, normalized form used for every path comparison (symlinks resolved where they exist).
std::filesystem::path normalize(const std::filesystem::path& p);

// True when `ancestor` equals `p` or is one of its parent directories (component-wise).
bool is_same_or_ancestor(const std::filesystem::path& ancestor, const std::filesystem::path& p);

// Create `target` as a symlink to `source` when `source` exists.
// Returns false (no error) if the source is missing or the target already exists.
bool safe_symlink(const std::filesystem::path& source, const std::filesystem::path& target);

// Path of a scratch file (a temporary git index) removed when this goes out of scope.
class TempFile {
public:
  explicit TempFile(std::filesystem::path p) : path_(std::move(p)) {}
  ~TempFile();
  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;

  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

} // namespace gitsaga::fs
