#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

// tar.gz snapshot archives: ustar headers, pax records for long names, gzip via zlib.
namespace gitsaga::archive {

// Malformed archive, or an entry that would land outside the destination.
class ArchiveError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

enum class EntryType { File, Directory, Symlink };

struct Entry {
  std::string path; // '/'-separated, relative
  EntryType type = EntryType::File;
  std::uint32_t mode = 0644;
  std::vector<std::uint8_t> data; // File only
  std::string link_target;        // Symlink only
};

std::vector<std::uint8_t> write_tar(const std::vector<Entry> &entries);
std::vector<Entry> read_tar(std::span<const std::uint8_t> tar);

// Relative path with no root, no drive, no ".." and no ".git" component.
bool is_safe_path(std::string_view path);

// Throws ArchiveError when a parent directory of `root / rel` is a symlink.
void refuse_symlinked_parent(const std::filesystem::path &root, const std::string &rel);

// Collect `paths` (relative to `root`) into a tar.gz. Symlinks are stored as links,
// directories are skipped, missing paths throw.
std::vector<std::uint8_t> pack(const std::filesystem::path &root,
                               const std::vector<std::string> &paths);

// Unpack a tar.gz over `dest`, replacing existing files. Returns the entry paths written.
std::vector<std::string> extract(std::span<const std::uint8_t> tar_gz,
                                 const std::filesystem::path &dest);

} // namespace gitsaga::archive
