#pragma once
#include "gitsaga/git_saga.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitsaga {

/**
 * Checkpoints record HEAD, the index and the whole working tree (untracked
 * files included) as one commit under refs/gitsaga-checkpoint/<id>.
 *
 * The commit's tree holds the index tree under `index/` and the working tree
 * under `worktree/`, so both stay reachable; the message repeats the tree ids
 * together with HEAD, the branch and a timestamp:
 *
 *   GITSAGA-CHECKPOINT v1
 *   head=<sha|null>
 *   branch=<name|null>
 *   index=<tree>
 *   worktree=<tree>
 *   timestamp=<ISO-8601>
 */
struct CheckpointMetadata {
  std::optional<std::string> head;
  std::optional<std::string> branch;
  std::optional<std::string> index_tree;
  std::optional<std::string> worktree_tree;
  std::optional<std::string> timestamp;
};

std::string format_checkpoint_message(const CheckpointMetadata &meta);
// nullopt when the message is not a checkpoint message
std::optional<CheckpointMetadata> parse_checkpoint_message(std::string_view message);

// A checkpoint resolved from its ref (or from a commit id).
struct CheckpointRecord {
  std::string checkpoint_id;
  std::string commit;
  CheckpointMetadata meta;
};

enum class GitBusyOperation { Rebase, Merge, CherryPick, Revert };

std::string_view busy_operation_name(GitBusyOperation op);

// Rebase, merge, cherry-pick or revert in progress in this working directory.
std::optional<GitBusyOperation> git_busy_state(const GitClient &git);

// Throws "Checkpoint not found: <id>" when neither the ref nor a commit resolves.
CheckpointRecord resolve_checkpoint(const GitClient &git, const std::string &checkpoint_id);

// Every checkpoint ref, newest first. Refs that are not checkpoint commits are skipped.
std::vector<CheckpointRecord> list_checkpoints(const GitClient &git);

void delete_checkpoint(const GitClient &git, const std::string &checkpoint_id);

// Tree of the full working tree (untracked files staged into a temporary index).
std::string write_worktree_tree(const GitClient &git, const std::optional<std::string> &head);

struct CaptureCheckpointInput {
  std::optional<std::string> checkpoint_id; // random UUID when unset
};

struct CheckpointState {
  std::string checkpoint_id;
  std::string commit;
  std::optional<std::string> head;
  std::optional<std::string> branch;
  std::string index_tree;
  std::string worktree_tree;
  std::string timestamp;
};

// Refuses while a rebase/merge/cherry-pick/revert is in progress or the index has
// conflicts. Only the ref update is compensated; the commit object is left to gc.
class CaptureCheckpointSaga : public GitSaga<CaptureCheckpointInput, CheckpointState> {
public:
  explicit CaptureCheckpointSaga(std::filesystem::path base_dir,
                                 std::shared_ptr<Logger> logger = nullptr,
                                 std::shared_ptr<const AbortSignal> signal = nullptr);

protected:
  CheckpointState execute_git_operations(const CaptureCheckpointInput &input) override;
};

struct RevertCheckpointInput {
  std::string checkpoint_id;
};

struct RevertCheckpointOutput {
  std::string checkpoint_id;
  std::string commit;
  std::optional<std::string> head;
  std::optional<std::string> branch;
};

/**
 * Put HEAD, the working tree and the index back to a checkpoint.
 *
 * The checkpoint's branch is checked out when it still exists (detached at the
 * recorded commit otherwise) and hard-reset to that commit; untracked files are
 * cleaned, then the working tree and the index are read from the recorded trees.
 * Ignored files are never touched. Rollback returns the moved branch to its
 * previous tip, HEAD to where it was, and the working tree and index to the state
 * captured before the first change.
 */
class RevertCheckpointSaga : public GitSaga<RevertCheckpointInput, RevertCheckpointOutput> {
public:
  explicit RevertCheckpointSaga(std::filesystem::path base_dir,
                                std::shared_ptr<Logger> logger = nullptr,
                                std::shared_ptr<const AbortSignal> signal = nullptr);

protected:
  RevertCheckpointOutput execute_git_operations(const RevertCheckpointInput &input) override;
};

// `to` names a checkpoint, or kCurrentWorktree for the working tree as it is now.
struct DiffCheckpointInput {
  static constexpr std::string_view kCurrentWorktree = "current";

  std::string from;
  std::string to = std::string(kCurrentWorktree);
};

struct DiffCheckpointOutput {
  std::string diff;
  std::string from_tree;
  std::string to_tree;
};

class DiffCheckpointSaga : public GitSaga<DiffCheckpointInput, DiffCheckpointOutput> {
public:
  explicit DiffCheckpointSaga(std::filesystem::path base_dir,
                              std::shared_ptr<Logger> logger = nullptr,
                              std::shared_ptr<const AbortSignal> signal = nullptr);

protected:
  DiffCheckpointOutput execute_git_operations(const DiffCheckpointInput &input) override;
};

} // namespace gitsaga
