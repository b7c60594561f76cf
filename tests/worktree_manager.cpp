#include "gitsaga/worktree_manager.hpp"

#include "gitsaga/fs.hpp"
#include "gitsaga/queries.hpp"
#include "test_repo.hpp"

#include <iostream>

using namespace gitsaga;
using testutil::TempRepo;

namespace {

bool has_line(const std::string &text, const std::string &line) {
  for (const auto &l : strutil::split_lines(text)) {
    if (strutil::trim(l) == line)
      return true;
  }
  return false;
}

} // namespace

int main() {
  try {
    // 1) Names come from the palette; a taken name falls back to a timestamp suffix
    {
      TempRepo repo("gitsaga_wt_names");
      WorktreeManager mgr(WorktreeConfig{.main_repo_path = repo.path(),
                                         .worktree_base_path = std::nullopt,
                                         .logger = nullptr,
                                         .palette = {"red"},
                                         .shared_paths = {}});
      if (mgr.generate_worktree_name() != "workspace-red") {
        std::cerr << "names: unexpected generated name\n";
        return 1;
      }

      const auto first = mgr.create_worktree();
      if (first.worktree_name != "workspace-red" || first.branch_name != "workspace-red" ||
          first.base_branch != "main") {
        std::cerr << "create: unexpected info for first worktree\n";
        return 1;
      }
      if (first.worktree_path != repo.path() / ".twig" / "workspace-red" ||
          !std::filesystem::exists(first.worktree_path / "README.md")) {
        std::cerr << "create: worktree not checked out under .twig\n";
        return 1;
      }
      if (!has_line(repo.read(".git/info/exclude"), "/.twig/")) {
        std::cerr << "create: .twig not excluded\n";
        return 1;
      }

      const auto second = mgr.create_worktree();
      if (!second.worktree_name.starts_with("workspace-red-") ||
          second.worktree_name.size() <= std::string("workspace-red-").size()) {
        std::cerr << "create: expected timestamp suffix, got " << second.worktree_name << "\n";
        return 1;
      }

      const auto listed = mgr.list_worktrees();
      if (listed.size() != 2) {
        std::cerr << "list: expected 2 worktrees, got " << listed.size() << "\n";
        return 1;
      }
      const auto info = mgr.get_worktree_info(first.worktree_path);
      if (!info || info->branch_name != "workspace-red") {
        std::cerr << "info: first worktree not found\n";
        return 1;
      }

      // Excluding twice leaves a single line
      mgr.ensure_worktree_folder_ignored();
      const auto exclude = repo.read(".git/info/exclude");
      std::size_t hits = 0;
      for (const auto &l : strutil::split_lines(exclude))
        hits += strutil::trim(l) == "/.twig/" ? 1 : 0;
      if (hits != 1) {
        std::cerr << "exclude: pattern written " << hits << " times\n";
        return 1;
      }

      // 2) Cleanup keeps associated worktrees and removes the rest
      const auto result = mgr.cleanup_orphaned_worktrees({first.worktree_path});
      if (result.deleted.size() != 1 || !result.errors.empty() ||
          std::filesystem::exists(second.worktree_path)) {
        std::cerr << "cleanup: orphan not removed\n";
        return 1;
      }
      if (!std::filesystem::exists(first.worktree_path) || mgr.list_worktrees().size() != 1) {
        std::cerr << "cleanup: associated worktree touched\n";
        return 1;
      }

      mgr.delete_worktree(first.worktree_path);
      if (std::filesystem::exists(first.worktree_path) || !mgr.list_worktrees().empty()) {
        std::cerr << "delete: worktree still present\n";
        return 1;
      }
    }

    // 3) Deleting the main checkout or one of its ancestors is refused
    {
      TempRepo repo("gitsaga_wt_guard");
      WorktreeManager mgr(WorktreeConfig{.main_repo_path = repo.path(),
                                         .worktree_base_path = std::nullopt,
                                         .logger = nullptr,
                                         .palette = {},
                                         .shared_paths = {}});
      const std::vector<std::pair<std::filesystem::path, std::string>> refused{
          {repo.path(), "matches main repo"},
          {repo.path() / "sub" / "..", "matches main repo"},
          {repo.path().parent_path(), "parent of main repo"},
      };
      for (const auto &[target, expected] : refused) {
        try {
          mgr.delete_worktree(target);
          std::cerr << "guard: deleting " << target << " was allowed\n";
          return 1;
        } catch (const std::runtime_error &e) {
          if (std::string(e.what()).find(expected) == std::string::npos) {
            std::cerr << "guard: unexpected message: " << e.what() << "\n";
            return 1;
          }
        }
      }
      if (!std::filesystem::exists(repo.path() / ".git")) {
        std::cerr << "guard: main repository damaged\n";
        return 1;
      }

      // A sibling directory sharing the repo name as a prefix is not an ancestor
      const auto sibling = std::filesystem::path(repo.path().string() + "-other");
      std::filesystem::create_directories(sibling / ".git");
      try {
        mgr.delete_worktree(sibling);
        std::cerr << "guard: directory with .git was deleted\n";
        return 1;
      } catch (const std::runtime_error &e) {
        if (std::string(e.what()).find("contains .git directory") == std::string::npos) {
          std::cerr << "guard: unexpected message: " << e.what() << "\n";
          return 1;
        }
      }
      std::filesystem::remove_all(sibling);
    }

    // 4) Existing branches, external base path and shared configuration links
    {
      TempRepo repo("gitsaga_wt_existing");
      const auto external = testutil::make_temp_dir("gitsaga_wt_external");
      repo.git_out({"branch", "feature/login"});
      testutil::write_file(repo.path() / ".claude" / "settings.json", "{}\n");
      repo.write("CLAUDE.local.md", "notes\n");

      WorktreeManager mgr(WorktreeConfig{.main_repo_path = repo.path(),
                                         .worktree_base_path = external,
                                         .logger = nullptr,
                                         .palette = {},
                                         .shared_paths = {}});
      const auto folder = external / repo.path().filename();
      if (mgr.worktree_folder_path() != folder) {
        std::cerr << "external: unexpected folder\n";
        return 1;
      }

      try {
        mgr.create_worktree_for_existing_branch("no-such-branch");
        std::cerr << "existing: missing branch accepted\n";
        return 1;
      } catch (const std::runtime_error &e) {
        if (std::string(e.what()) != "Branch 'no-such-branch' does not exist") {
          std::cerr << "existing: unexpected message: " << e.what() << "\n";
          return 1;
        }
      }

      const auto info = mgr.create_worktree_for_existing_branch("feature/login");
      if (info.worktree_name != "feature-login" || info.worktree_path != folder / "feature-login" ||
          info.branch_name != "feature/login") {
        std::cerr << "existing: unexpected info\n";
        return 1;
      }

      const auto linked = info.worktree_path / ".claude";
      if (!std::filesystem::is_symlink(linked) ||
          std::filesystem::read_symlink(linked) != repo.path() / ".claude" ||
          !std::filesystem::is_symlink(info.worktree_path / "CLAUDE.local.md")) {
        std::cerr << "shared: configuration not linked\n";
        return 1;
      }
      GitClient wt_git(info.worktree_path);
      // Linked worktrees read info/exclude from the shared git dir
      const auto wt_exclude = repo.read(".git/info/exclude");
      if (!has_line(wt_exclude, ".claude") || !has_line(wt_exclude, "CLAUDE.local.md")) {
        std::cerr << "shared: links not excluded in the worktree\n";
        return 1;
      }
      if (!queries::status(wt_git).is_clean()) {
        std::cerr << "shared: links show up as untracked\n";
        return 1;
      }

      // A second worktree for another branch whose name sanitizes the same way gets a suffix
      repo.git_out({"branch", "feature-login"});
      const auto clash = mgr.create_worktree_for_existing_branch("feature-login");
      if (!clash.worktree_name.starts_with("feature-login-") ||
          clash.worktree_path.parent_path() != folder) {
        std::cerr << "existing: colliding name not suffixed\n";
        return 1;
      }

      mgr.delete_worktree(clash.worktree_path);
      mgr.delete_worktree(info.worktree_path);
      std::filesystem::remove_all(external);
    }
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  std::cout << "worktree manager OK\n";
  return 0;
}
