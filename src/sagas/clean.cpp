#include "gitsaga/sagas/clean.hpp"

#include "gitsaga/consts.hpp"
#include "gitsaga/queries.hpp"
#include "gitsaga/util.hpp"

#include <functional>
#include <stdexcept>

namespace gitsaga {

CleanWorkingTreeSaga::CleanWorkingTreeSaga(std::filesystem::path base_dir,
                                           std::shared_ptr<Logger> logger,
                                           std::shared_ptr<const AbortSignal> signal)
    : GitSaga("CleanWorkingTreeSaga", std::move(base_dir), std::move(logger),
              std::move(signal)) {}

CleanWorkingTreeOutput
CleanWorkingTreeSaga::execute_git_operations(const CleanWorkingTreeInput & /*input*/) {
  const auto st = read_only_step("check-changes", [&] { return queries::status(git_); });
  if (st.is_clean())
    return {.backup_created = false, .stash_sha = std::nullopt};

  const auto count_before =
      read_only_step("get-stash-count", [&] { return queries::stash_count(git_); });

  // Set once the backup exists; every later rollback shares it
  auto backup_sha = std::make_shared<std::optional<std::string>>();
  auto restored = std::make_shared<bool>(false);

  std::function<void()> restore_backup = [this, backup_sha, restored] {
    if (*restored || !*backup_sha)
      return;
    const auto top = git_.run({"rev-parse", "--verify", "--quiet", "stash@{0}"});
    if (top.exit_code != 0 || strutil::trim(top.out) != **backup_sha) {
      log().warn("Backup stash is no longer on top; leaving it in place",
                 {{"stash", **backup_sha}});
      *restored = true;
      return;
    }
    // Pop onto a pristine tree so partial cleanup leftovers cannot conflict
    git_.raw({"reset", "--hard", "HEAD"});
    git_.raw({"clean", "-fd"});
    git_.raw({"stash", "pop", "--index"});
    *restored = true;
  };

  step<void>({
      .name = "backup-changes",
      .execute =
          [&] {
            git_.raw({"stash", "push", "--include-untracked", "-m",
                      std::string(consts::kCleanBackupMessage)});
            if (queries::stash_count(git_) <= count_before)
              throw std::runtime_error("git stash did not create a backup entry");
            *backup_sha = git_.rev_parse({"stash@{0}"});
          },
      .rollback = restore_backup,
  });

  step<void>({
      .name = "reset-index",
      .execute = [&] { git_.raw({"reset", "HEAD"}); },
      .rollback = restore_backup,
  });

  step<void>({
      .name = "restore-working-tree",
      .execute = [&] { git_.raw({"checkout", "--", "."}); },
      .rollback = restore_backup,
  });

  step<void>({
      .name = "remove-untracked",
      .execute = [&] { git_.raw({"clean", "-fd"}); },
      .rollback = restore_backup,
  });

  return {.backup_created = true, .stash_sha = *backup_sha};
}

} // namespace gitsaga
