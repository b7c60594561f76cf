#pragma once
#include "gitsaga/git_saga.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gitsaga {

struct CreateWorktreeInput {
  std::filesystem::path worktree_path;
  std::string branch_name;                // created by the saga
  std::optional<std::string> base_branch; // default branch when unset
  std::vector<std::string> shared_paths;  // default_shared_paths() when empty
};

struct CreateWorktreeOutput {
  std::filesystem::path worktree_path;
  std::string branch_name;
  std::string base_branch;
  std::vector<std::filesystem::path> linked;
};

/**
 * `git worktree add -b` plus the shared editor configuration links, as a saga.
 *
 * Rollback removes the links, then the worktree (falling back to deleting the
 * directory and pruning), then the new branch.
 */
class CreateWorktreeSaga : public GitSaga<CreateWorktreeInput, CreateWorktreeOutput> {
public:
  explicit CreateWorktreeSaga(std::filesystem::path main_repo_path,
                              std::shared_ptr<Logger> logger = nullptr,
                              std::shared_ptr<const AbortSignal> signal = nullptr);

protected:
  CreateWorktreeOutput execute_git_operations(const CreateWorktreeInput &input) override;
};

struct CreateWorktreeForBranchInput {
  std::filesystem::path worktree_path;
  std::string branch_name; // must exist
  std::vector<std::string> shared_paths;
};

struct CreateWorktreeForBranchOutput {
  std::filesystem::path worktree_path;
  std::string branch_name;
  std::vector<std::filesystem::path> linked;
};

// Same as CreateWorktreeSaga for a branch that already exists; rollback keeps the branch.
class CreateWorktreeForBranchSaga
    : public GitSaga<CreateWorktreeForBranchInput, CreateWorktreeForBranchOutput> {
public:
  explicit CreateWorktreeForBranchSaga(std::filesystem::path main_repo_path,
                                       std::shared_ptr<Logger> logger = nullptr,
                                       std::shared_ptr<const AbortSignal> signal = nullptr);

protected:
  CreateWorktreeForBranchOutput
  execute_git_operations(const CreateWorktreeForBranchInput &input) override;
};

struct DeleteWorktreeInput {
  std::filesystem::path worktree_path;
};

struct DeleteWorktreeOutput {
  bool deleted = false;
};

// Guarded removal (see check_worktree_deletable). Not reversible.
class DeleteWorktreeSaga : public GitSaga<DeleteWorktreeInput, DeleteWorktreeOutput> {
public:
  explicit DeleteWorktreeSaga(std::filesystem::path main_repo_path,
                              std::shared_ptr<Logger> logger = nullptr,
                              std::shared_ptr<const AbortSignal> signal = nullptr);

protected:
  DeleteWorktreeOutput execute_git_operations(const DeleteWorktreeInput &input) override;
};

} // namespace gitsaga
