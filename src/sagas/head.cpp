#include "gitsaga/sagas/head.hpp"

#include "gitsaga/queries.hpp"

#include <stdexcept>

namespace gitsaga {

DetachHeadSaga::DetachHeadSaga(std::filesystem::path base_dir, std::shared_ptr<Logger> logger,
                               std::shared_ptr<const AbortSignal> signal)
    : GitSaga("DetachHeadSaga", std::move(base_dir), std::move(logger), std::move(signal)) {}

DetachHeadOutput DetachHeadSaga::execute_git_operations(const DetachHeadInput & /*input*/) {
  const auto branch =
      read_only_step("get-current-branch", [&] { return queries::current_branch(git_); });

  const auto sha = read_only_step("get-head-sha", [&] { return queries::head_sha(git_); });
  if (!sha)
    throw std::runtime_error("Cannot detach HEAD: repository has no commits");

  step<void>({
      .name = "detach-head",
      .execute = [&] { git_.raw({"checkout", "--detach"}); },
      .rollback =
          [this, branch] {
            if (branch)
              git_.checkout(*branch);
          },
  });

  return {.previous_branch = branch, .head_sha = *sha};
}

ReattachBranchSaga::ReattachBranchSaga(std::filesystem::path base_dir,
                                       std::shared_ptr<Logger> logger,
                                       std::shared_ptr<const AbortSignal> signal)
    : GitSaga("ReattachBranchSaga", std::move(base_dir), std::move(logger), std::move(signal)) {}

ReattachBranchOutput
ReattachBranchSaga::execute_git_operations(const ReattachBranchInput &input) {
  const auto original = read_only_step("get-head", [&] { return queries::head_state(git_); });
  if (!original.sha)
    throw std::runtime_error("Cannot reattach branch: repository has no commits");

  const auto previous_sha = read_only_step(
      "get-branch-tip", [&] { return queries::branch_sha(git_, input.branch_name); });

  step<void>({
      .name = "reattach-branch",
      .execute = [&] { git_.raw({"checkout", "-B", input.branch_name}); },
      .rollback =
          [this, original, previous_sha, branch = input.branch_name] {
            // Move HEAD off the branch first so it can be reset or deleted
            const bool was_on_branch = original.branch && *original.branch == branch;
            if (original.branch && !was_on_branch)
              git_.checkout(*original.branch);
            else
              git_.raw({"checkout", "--detach", *original.sha});

            if (previous_sha)
              git_.raw({"branch", "-f", branch, *previous_sha});
            else
              git_.delete_local_branch(branch, true);

            if (was_on_branch)
              git_.checkout(branch);
          },
  });

  return {.branch_name = input.branch_name,
          .head_sha = *original.sha,
          .created = !previous_sha.has_value(),
          .previous_sha = previous_sha};
}

} // namespace gitsaga
