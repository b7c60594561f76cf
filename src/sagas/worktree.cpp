#include "gitsaga/sagas/worktree.hpp"

#include "gitsaga/queries.hpp"
#include "gitsaga/util.hpp"
#include "gitsaga/worktree_manager.hpp"

#include <stdexcept>
#include <system_error>

namespace gitsaga {

namespace {

std::filesystem::path absolute_from(const std::filesystem::path &base, const std::filesystem::path &p) {
  return p.is_absolute() ? p : (base / p).lexically_normal();
}

// `worktree remove --force`, else delete the directory and prune the registration
void remove_worktree(const GitClient &git, const std::filesystem::path &path, Logger &log) {
  const auto removed = git.run({"worktree", "remove", path.string(), "--force"});
  if (removed.exit_code == 0)
    return;
  log.warn("git worktree remove failed, deleting directory",
           {{"path", path.string()}, {"error", strutil::trim(removed.err)}});
  std::error_code ec;
  std::filesystem::remove_all(path, ec);
  if (ec)
    throw std::runtime_error("remove failed: " + path.string() + ": " + ec.message());
  git.raw({"worktree", "prune"});
}

void unlink_all(const std::vector<std::filesystem::path> &links) {
  for (const auto &link : links) {
    std::error_code ec;
    std::filesystem::remove(link, ec);
    if (ec)
      throw std::runtime_error("remove failed: " + link.string() + ": " + ec.message());
  }
}

} // namespace

CreateWorktreeSaga::CreateWorktreeSaga(std::filesystem::path main_repo_path,
                                       std::shared_ptr<Logger> logger,
                                       std::shared_ptr<const AbortSignal> signal)
    : GitSaga("CreateWorktreeSaga", std::move(main_repo_path), std::move(logger),
              std::move(signal)) {}

CreateWorktreeOutput CreateWorktreeSaga::execute_git_operations(const CreateWorktreeInput &input) {
  const auto path = absolute_from(base_dir_, input.worktree_path);

  const auto base = read_only_step("get-base-branch", [&] {
    return input.base_branch ? *input.base_branch : queries::detect_default_branch(git_);
  });

  step<void>({
      .name = "create-worktree",
      .execute =
          [&] {
            git_.raw({"worktree", "add", "--quiet", "-b", input.branch_name, path.string(), base});
          },
      .rollback =
          [this, path, branch = input.branch_name] {
            remove_worktree(git_, path, log());
            git_.delete_local_branch(branch, true);
          },
  });

  const auto names = input.shared_paths.empty() ? default_shared_paths() : input.shared_paths;
  auto linked = step<std::vector<std::filesystem::path>>({
      .name = "symlink-shared-config",
      .execute = [&] { return link_shared_paths(GitClient(path, signal_), base_dir_, names); },
      .rollback = [](const std::vector<std::filesystem::path> &links) { unlink_all(links); },
  });

  log().info("Worktree created", {{"path", path.string()},
                                  {"branch", input.branch_name},
                                  {"base", base},
                                  {"linked", std::to_string(linked.size())}});

  return {.worktree_path = path,
          .branch_name = input.branch_name,
          .base_branch = base,
          .linked = std::move(linked)};
}

CreateWorktreeForBranchSaga::CreateWorktreeForBranchSaga(std::filesystem::path main_repo_path,
                                                         std::shared_ptr<Logger> logger,
                                                         std::shared_ptr<const AbortSignal> signal)
    : GitSaga("CreateWorktreeForBranchSaga", std::move(main_repo_path), std::move(logger),
              std::move(signal)) {}

CreateWorktreeForBranchOutput
CreateWorktreeForBranchSaga::execute_git_operations(const CreateWorktreeForBranchInput &input) {
  const auto path = absolute_from(base_dir_, input.worktree_path);

  read_only_step("verify-branch-exists", [&] {
    if (!queries::branch_exists(git_, input.branch_name))
      throw std::runtime_error("Branch '" + input.branch_name + "' does not exist");
  });

  step<void>({
      .name = "create-worktree",
      .execute =
          [&] { git_.raw({"worktree", "add", "--quiet", path.string(), input.branch_name}); },
      .rollback = [this, path] { remove_worktree(git_, path, log()); },
  });

  const auto names = input.shared_paths.empty() ? default_shared_paths() : input.shared_paths;
  auto linked = step<std::vector<std::filesystem::path>>({
      .name = "symlink-shared-config",
      .execute = [&] { return link_shared_paths(GitClient(path, signal_), base_dir_, names); },
      .rollback = [](const std::vector<std::filesystem::path> &links) { unlink_all(links); },
  });

  log().info("Worktree created for existing branch",
             {{"path", path.string()}, {"branch", input.branch_name}});

  return {.worktree_path = path, .branch_name = input.branch_name, .linked = std::move(linked)};
}

DeleteWorktreeSaga::DeleteWorktreeSaga(std::filesystem::path main_repo_path,
                                       std::shared_ptr<Logger> logger,
                                       std::shared_ptr<const AbortSignal> signal)
    : GitSaga("DeleteWorktreeSaga", std::move(main_repo_path), std::move(logger),
              std::move(signal)) {}

DeleteWorktreeOutput DeleteWorktreeSaga::execute_git_operations(const DeleteWorktreeInput &input) {
  const auto path = absolute_from(base_dir_, input.worktree_path);

  read_only_step("safety-checks", [&] { check_worktree_deletable(base_dir_, path); });

  step<void>({
      .name = "delete-worktree",
      .execute = [&] { remove_worktree(git_, path, log()); },
      .rollback = nullptr,
  });

  log().info("Worktree deleted", {{"path", path.string()}});
  return {.deleted = true};
}

} // namespace gitsaga
