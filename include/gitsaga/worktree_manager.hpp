#pragma once
#include "gitsaga/git_client.hpp"
#include "gitsaga/logger.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace gitsaga {

struct WorktreeConfig {
  std::filesystem::path main_repo_path;
  // When set, worktrees live in <base>/<repo basename>/ instead of <repo>/.twig/
  std::optional<std::filesystem::path> worktree_base_path;
  std::shared_ptr<Logger> logger;
  // Colors for generated names; empty selects default_palette()
  std::vector<std::string> palette;
  // Entries of the main checkout linked into each new worktree; empty selects
  // the editor defaults (.claude, CLAUDE.local.md)
  std::vector<std::string> shared_paths;
};

struct WorktreeInfo {
  std::filesystem::path worktree_path;
  std::string worktree_name;
  std::string branch_name;
  std::string base_branch; // empty for listed worktrees
  std::string created_at;  // ISO-8601; empty for listed worktrees
};

struct CleanupError {
  std::filesystem::path path;
  std::string error;
};

struct CleanupResult {
  std::vector<std::filesystem::path> deleted;
  std::vector<CleanupError> errors;
};

// The 49 colors used for `workspace-<color>` names.
const std::vector<std::string> &default_palette();

// Editor configuration linked into new worktrees: .claude and CLAUDE.local.md.
std::vector<std::string> default_shared_paths();

// Throws unless `target` may be removed as a linked worktree of `main_repo`: never the
// main checkout, a directory above it, or a directory holding a real .git directory.
void check_worktree_deletable(const std::filesystem::path &main_repo,
                              const std::filesystem::path &target);

// Symlink each of `names` that exists in `main_repo` into the worktree `worktree_git`
// runs in, and list it in the local exclude file. Returns the links created.
std::vector<std::filesystem::path> link_shared_paths(const GitClient &worktree_git,
                                                     const std::filesystem::path &main_repo,
                                                     const std::vector<std::string> &names);

/**
 * Lifecycle of the linked worktrees of one repository.
 *
 * Every git call goes through git_operations() against the main repository
 * path. Creation is a single `git worktree add` followed by linking the shared
 * editor configuration; sagas/worktree.hpp has the compensated form.
 */
class WorktreeManager {
public:
  explicit WorktreeManager(WorktreeConfig config);

  // "workspace-<color>" with a random palette color; not checked for collisions.
  std::string generate_worktree_name();

  [[nodiscard]] std::filesystem::path worktree_folder_path() const;
  [[nodiscard]] std::filesystem::path worktree_path(const std::string &name) const;
  [[nodiscard]] std::filesystem::path local_worktree_path() const;
  [[nodiscard]] bool local_worktree_exists() const;
  [[nodiscard]] bool worktree_exists(const std::string &name) const;

  // Add "/.twig/" to the main repository's info/exclude unless already there.
  void ensure_worktree_folder_ignored();

  // New branch named after the worktree, started at `base_branch` (default branch if unset).
  WorktreeInfo create_worktree(const std::optional<std::string> &base_branch = std::nullopt);
  WorktreeInfo create_worktree_for_existing_branch(const std::string &branch);

  // Remove a linked worktree. Refuses the main checkout, any directory above it,
  // and any directory holding a real .git directory.
  void delete_worktree(const std::filesystem::path &path);

  std::optional<WorktreeInfo> get_worktree_info(const std::filesystem::path &path);
  std::vector<WorktreeInfo> list_worktrees();

  // Delete every managed worktree not in `associated_paths`; failures are collected.
  CleanupResult cleanup_orphaned_worktrees(const std::vector<std::filesystem::path> &associated_paths);

private:
  [[nodiscard]] bool uses_external_path() const { return config_.worktree_base_path.has_value(); }
  std::string generate_unique_worktree_name();
  void prepare_worktree_folder();
  void link_shared_config(const std::filesystem::path &worktree);

  WorktreeConfig config_;
  std::string repo_name_;
  std::shared_ptr<Logger> log_;
  std::mt19937 rng_;
};

} // namespace gitsaga
