#include "cli/common.hpp"
#include "gitsaga/worktree_manager.hpp"

#include <iostream>
#include <string>

using namespace gitsaga;

namespace {

WorktreeManager make_manager() {
  const auto root = cli::repo_root();
  const auto settings = load_settings(root);
  return WorktreeManager(WorktreeConfig{.main_repo_path = root,
                                        .worktree_base_path = settings.worktree_base_path,
                                        .logger = cli::make_logger(settings),
                                        .palette = {},
                                        .shared_paths = settings.shared_paths});
}

void print_info(const WorktreeInfo &info) {
  std::cout << info.worktree_name << "\t" << info.branch_name << "\t"
            << info.worktree_path.string() << "\n";
}

int usage() {
  std::cerr << "usage: gitsaga worktree create [base-branch]\n"
               "       gitsaga worktree create-for <branch>\n"
               "       gitsaga worktree delete <path>\n"
               "       gitsaga worktree list\n"
               "       gitsaga worktree cleanup [keep-path...]\n";
  return 2;
}

} // namespace

int cmd_worktree(int argc, char **argv) {
  if (argc < 2)
    return usage();
  const std::string sub = argv[1];
  try {
    if (sub == "create" && argc <= 3) {
      auto manager = make_manager();
      std::optional<std::string> base;
      if (argc == 3)
        base = argv[2];
      print_info(manager.create_worktree(base));
      return 0;
    }
    if (sub == "create-for" && argc == 3) {
      auto manager = make_manager();
      print_info(manager.create_worktree_for_existing_branch(argv[2]));
      return 0;
    }
    if (sub == "delete" && argc == 3) {
      auto manager = make_manager();
      manager.delete_worktree(argv[2]);
      std::cout << "Deleted " << argv[2] << "\n";
      return 0;
    }
    if (sub == "list" && argc == 2) {
      auto manager = make_manager();
      for (const auto &info : manager.list_worktrees())
        print_info(info);
      return 0;
    }
    if (sub == "cleanup") {
      auto manager = make_manager();
      std::vector<std::filesystem::path> keep;
      for (int i = 2; i < argc; ++i)
        keep.emplace_back(argv[i]);
      const auto result = manager.cleanup_orphaned_worktrees(keep);
      for (const auto &p : result.deleted)
        std::cout << "Deleted " << p.string() << "\n";
      for (const auto &err : result.errors)
        std::cerr << "worktree: " << err.path.string() << ": " << err.error << "\n";
      return result.errors.empty() ? 0 : 1;
    }
  } catch (const std::exception &e) {
    return cli::report_error("worktree", e);
  }
  return usage();
}
