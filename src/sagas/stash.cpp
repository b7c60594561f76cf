#include "gitsaga/sagas/stash.hpp"

#include "gitsaga/consts.hpp"
#include "gitsaga/queries.hpp"
#include "gitsaga/util.hpp"

#include <stdexcept>

namespace gitsaga {

namespace {

constexpr std::string_view kApplyBackupMessage = "gitsaga-stash-apply-backup";

std::optional<std::string> top_stash_sha(const GitClient &git) {
  const auto result = git.run({"rev-parse", "--verify", "--quiet", "stash@{0}"});
  if (result.exit_code != 0)
    return std::nullopt;
  return strutil::trim(result.out);
}

// stash@{N} selector for the entry whose commit is `sha`
std::optional<std::string> find_stash_selector(const GitClient &git, const std::string &sha) {
  const auto out = git.raw({"stash", "list", "--format=%H %gd"});
  for (const auto &line : strutil::split_lines(out)) {
    if (line.starts_with(sha + " "))
      return strutil::trim(line.substr(sha.size() + 1));
  }
  return std::nullopt;
}

} // namespace

StashPushSaga::StashPushSaga(std::filesystem::path base_dir, std::shared_ptr<Logger> logger,
                             std::shared_ptr<const AbortSignal> signal)
    : GitSaga("StashPushSaga", std::move(base_dir), std::move(logger), std::move(signal)) {}

StashPushOutput StashPushSaga::execute_git_operations(const StashPushInput &input) {
  const auto before =
      read_only_step("get-before-count", [&] { return queries::stash_count(git_); });

  const auto staged =
      read_only_step("get-staged-files", [&] { return queries::status(git_).staged; });

  step<void>({
      .name = "stage-all",
      .execute = [&] { git_.raw({"add", "-A"}); },
      .rollback =
          [this, staged] {
            git_.raw({"reset"});
            if (staged.empty())
              return;
            std::vector<std::string> args{"add", "--"};
            args.insert(args.end(), staged.begin(), staged.end());
            git_.raw(args);
          },
  });

  step<void>({
      .name = "stash-push",
      .execute = [&] { git_.raw({"stash", "push", "--include-untracked", "-m", input.message}); },
      .rollback =
          [this, before] {
            if (queries::stash_count(git_) > before)
              git_.raw({"stash", "pop", "--index"});
          },
  });

  auto sha = read_only_step("get-stash-sha", [&]() -> std::optional<std::string> {
    if (queries::stash_count(git_) > before)
      return git_.rev_parse({"stash@{0}"});
    return std::nullopt;
  });

  return {.stash_sha = std::move(sha)};
}

StashApplySaga::StashApplySaga(std::filesystem::path base_dir, std::shared_ptr<Logger> logger,
                               std::shared_ptr<const AbortSignal> signal)
    : GitSaga("StashApplySaga", std::move(base_dir), std::move(logger), std::move(signal)) {}

StashApplyOutput StashApplySaga::execute_git_operations(const StashApplyInput &input) {
  // Resolve before mutating: `stash apply` falls back to stash@{0} for some bad ids
  read_only_step("verify-stash", [&] {
    const auto result =
        git_.run({"rev-parse", "--verify", "--quiet", input.stash_sha + "^{commit}"});
    if (input.stash_sha.empty() || result.exit_code != 0)
      throw std::runtime_error("Stash entry not found: " + input.stash_sha);
  });

  const bool dirty =
      read_only_step("check-existing-changes", [&] { return !queries::status(git_).is_clean(); });

  // True while the backup stash sits on the stash list waiting to be restored
  auto backup_pending = std::make_shared<bool>(false);

  if (dirty) {
    const auto before = read_only_step("get-stash-count-before-backup",
                                       [&] { return queries::stash_count(git_); });
    step<void>({
        .name = "backup-existing-changes",
        .execute =
            [&] {
              git_.raw({"stash", "push", "--include-untracked", "-m",
                        std::string(kApplyBackupMessage)});
              *backup_pending = queries::stash_count(git_) > before;
            },
        .rollback =
            [this, backup_pending] {
              if (!*backup_pending)
                return;
              git_.raw({"stash", "pop", "--index"});
              *backup_pending = false;
            },
    });
  }

  step<void>({
      .name = "apply-stash",
      .execute = [&] { git_.raw({"stash", "apply", input.stash_sha}); },
      .rollback =
          [this, backup_pending] {
            git_.raw({"reset", "--hard"});
            git_.raw({"clean", "-fd"});
            if (*backup_pending) {
              git_.raw({"stash", "pop", "--index"});
              *backup_pending = false;
            }
          },
  });

  if (*backup_pending) {
    // Not reversible once popped: the backup is merged with the applied changes
    step<void>({
        .name = "restore-backup",
        .execute =
            [&] {
              git_.raw({"stash", "pop"});
              *backup_pending = false;
            },
        .rollback = nullptr,
    });
  }

  const auto selector = read_only_step(
      "find-stash-index", [&] { return find_stash_selector(git_, input.stash_sha); });

  bool dropped = false;
  if (selector) {
    step<void>({
        .name = "drop-stash",
        .execute =
            [&] {
              git_.raw({"stash", "drop", *selector});
              dropped = true;
            },
        .rollback = nullptr,
    });
  }

  return {.dropped = dropped};
}

StashPopSaga::StashPopSaga(std::filesystem::path base_dir, std::shared_ptr<Logger> logger,
                           std::shared_ptr<const AbortSignal> signal)
    : GitSaga("StashPopSaga", std::move(base_dir), std::move(logger), std::move(signal)) {}

StashPopOutput StashPopSaga::execute_git_operations(const StashPopInput & /*input*/) {
  struct StashInfo {
    std::string sha;
    std::string message;
  };

  const auto info = read_only_step("get-stash-info", [&] {
    const auto sha = top_stash_sha(git_);
    if (!sha)
      throw std::runtime_error("No stash entries to pop");
    auto message = strutil::trim(git_.raw({"stash", "list", "-1", "--format=%gs"}));
    if (message.empty())
      message = std::string(consts::kPopRestoreMessage);
    return StashInfo{.sha = *sha, .message = std::move(message)};
  });

  step<void>({
      .name = "stash-pop",
      .execute = [&] { git_.raw({"stash", "pop"}); },
      .rollback =
          [this, info] {
            git_.raw({"reset", "--hard"});
            git_.raw({"clean", "-fd"});
            git_.raw({"stash", "store", "-m", info.message, info.sha});
          },
  });

  return {.popped = true};
}

} // namespace gitsaga
