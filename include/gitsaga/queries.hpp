#pragma once
#include "gitsaga/git_client.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitsaga::queries {

struct GitStatus {
  std::vector<std::string> staged;
  std::vector<std::string> modified;
  std::vector<std::string> deleted;
  std::vector<std::string> untracked;

  [[nodiscard]] bool is_clean() const {
    return staged.empty() && modified.empty() && deleted.empty() && untracked.empty();
  }
  // Tracked paths with uncommitted changes (untracked files not counted).
  [[nodiscard]] std::size_t tracked_change_count() const {
    return staged.size() + modified.size() + deleted.size();
  }
};

struct WorktreeListEntry {
  std::filesystem::path path;
  std::string head;
  std::optional<std::string> branch; // nullopt when detached or bare
};

// Where HEAD stood before a saga moved it.
struct HeadState {
  std::optional<std::string> branch; // nullopt when detached
  std::optional<std::string> sha;    // nullopt before the first commit

  // Name to hand to `git checkout` to come back here: the branch, else the commit.
  [[nodiscard]] std::string ref() const { return branch ? *branch : sha.value_or(std::string{}); }
};

HeadState head_state(const GitClient& git);

// Branch checked out in the working directory; nullopt on a detached HEAD.
std::optional<std::string> current_branch(const GitClient& git);

// Commit HEAD points at; nullopt in a repository without commits.
std::optional<std::string> head_sha(const GitClient& git);

bool branch_exists(const GitClient& git, std::string_view branch);

// Tip of refs/heads/<branch>, or nullopt.
std::optional<std::string> branch_sha(const GitClient& git, std::string_view branch);

// Local branches whose tip is exactly `sha`.
std::vector<std::string> branches_pointing_at(const GitClient& git, std::string_view sha);

// origin/HEAD target, else local main, else local master; throws otherwise.
std::string detect_default_branch(const GitClient& git);

// Parse of `git status --porcelain=v1 -z`.
GitStatus status(const GitClient& git);
GitStatus parse_porcelain_status(std::string_view porcelain_z);

std::size_t stash_count(const GitClient& git);

// Absolute git directory (".git" for a main checkout, ".git/worktrees/<n>" for a worktree).
std::filesystem::path resolve_git_dir(const GitClient& git);

// Git directory shared by every worktree of the repository.
std::filesystem::path resolve_common_git_dir(const GitClient& git);

// Absolute form of `git rev-parse --git-path <name>`.
std::filesystem::path git_path(const GitClient& git, std::string_view name);

// Append `pattern` to info/exclude of the common git dir unless already present.
// Returns true if added.
bool add_to_local_exclude(const GitClient& git, std::string_view pattern);

std::vector<WorktreeListEntry> list_worktrees(const GitClient& git);
std::vector<WorktreeListEntry> parse_worktree_list(std::string_view porcelain);

} // namespace gitsaga::queries
