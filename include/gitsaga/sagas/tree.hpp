#pragma once
#include "gitsaga/git_saga.hpp"
#include "gitsaga/snapshot.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gitsaga {

struct CaptureTreeInput {
  std::optional<std::string> last_tree_hash;
  std::optional<std::filesystem::path> archive_path; // write a tar.gz of the changed files here
};

struct CaptureTreeOutput {
  std::optional<TreeSnapshot> snapshot; // nullopt when nothing changed
  std::optional<std::filesystem::path> archive_path;
  bool changed = false;
};

/**
 * Record the working tree as a git tree object without touching the real index.
 *
 * A temporary index under the git directory is seeded from HEAD, every change
 * is staged into it and written out as a tree. The changes relative to HEAD
 * become the snapshot; the temporary index is removed on every path.
 */
class CaptureTreeSaga : public GitSaga<CaptureTreeInput, CaptureTreeOutput> {
public:
  explicit CaptureTreeSaga(std::filesystem::path base_dir, std::shared_ptr<Logger> logger = nullptr,
                           std::shared_ptr<const AbortSignal> signal = nullptr);

protected:
  CaptureTreeOutput execute_git_operations(const CaptureTreeInput &input) override;
};

struct ApplyTreeInput {
  std::string tree_hash;
  std::optional<std::string> base_commit;
  std::vector<FileChange> changes;
  std::optional<std::filesystem::path> archive_path;
};

struct ApplyTreeOutput {
  std::string tree_hash;
  bool checkout_performed = false;
};

// Replay a locally captured tree: optional base checkout, archive extraction and
// deletions. Overwritten and deleted files are backed up in memory for rollback.
class ApplyTreeSaga : public GitSaga<ApplyTreeInput, ApplyTreeOutput> {
public:
  explicit ApplyTreeSaga(std::filesystem::path base_dir, std::shared_ptr<Logger> logger = nullptr,
                         std::shared_ptr<const AbortSignal> signal = nullptr);

protected:
  ApplyTreeOutput execute_git_operations(const ApplyTreeInput &input) override;
};

struct ReadTreeInput {
  std::string tree_hash;
};

struct ReadTreeOutput {
  std::vector<std::string> files;
};

class ReadTreeSaga : public GitSaga<ReadTreeInput, ReadTreeOutput> {
public:
  explicit ReadTreeSaga(std::filesystem::path base_dir, std::shared_ptr<Logger> logger = nullptr,
                        std::shared_ptr<const AbortSignal> signal = nullptr);

protected:
  ReadTreeOutput execute_git_operations(const ReadTreeInput &input) override;
};

// Changes between `from` and `to` (`diff-tree -r --name-status`); every file of `to`
// is reported as added when there is no `from`.
std::vector<FileChange> tree_changes(const GitClient &git, const std::optional<std::string> &from,
                                     const std::string &to);

} // namespace gitsaga
