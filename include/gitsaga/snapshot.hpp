#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitsaga {

enum class FileStatus { Added, Modified, Deleted };

// 'A', 'M' or 'D'
char status_code(FileStatus status);
// git name-status letter to FileStatus; anything other than A/D counts as a modification.
FileStatus status_from_code(std::string_view code);

struct FileChange {
  std::string path;
  FileStatus status = FileStatus::Modified;
};

// A captured working-tree state: a git tree object plus the archive of its changed files.
struct TreeSnapshot {
  std::string tree_hash;
  std::optional<std::string> base_commit; // HEAD at capture time
  std::optional<std::string> archive_url;
  std::vector<FileChange> changes;
  std::string timestamp; // ISO-8601 UTC
  bool interrupted = false;
};

// Text manifest: "tree: <hash>", "base: <sha>", "archive: <url>", "timestamp: <iso>",
// "interrupted: true", then one "change: <A|M|D> <path>" per change.
std::string format_snapshot(const TreeSnapshot &snapshot);
TreeSnapshot parse_snapshot(std::string_view text);

/**
 * Remote side of snapshot application.
 * download_artifact returns the archive bytes; an empty result means the
 * artifact could not be fetched.
 */
class ApiClient {
public:
  virtual ~ApiClient() = default;
  virtual std::vector<std::uint8_t> download_artifact(const std::string &task_id,
                                                      const std::string &run_id,
                                                      const std::string &archive_url) = 0;
};

// Serves `file://` URLs and plain paths from the local filesystem.
class FileApiClient : public ApiClient {
public:
  explicit FileApiClient(std::filesystem::path root = {}) : root_(std::move(root)) {}

  std::vector<std::uint8_t> download_artifact(const std::string &task_id, const std::string &run_id,
                                              const std::string &archive_url) override;

private:
  std::filesystem::path root_; // base for relative paths
};

} // namespace gitsaga
