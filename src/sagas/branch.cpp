#include "gitsaga/sagas/branch.hpp"

#include "gitsaga/queries.hpp"

#include <stdexcept>

namespace gitsaga {

namespace {

// A failed create may have left nothing behind; only delete what exists.
void delete_branch_if_present(const GitClient &git, const std::string &branch) {
  if (queries::branch_exists(git, branch))
    git.delete_local_branch(branch, true);
}

} // namespace

CreateBranchSaga::CreateBranchSaga(std::filesystem::path base_dir, std::shared_ptr<Logger> logger,
                                   std::shared_ptr<const AbortSignal> signal)
    : GitSaga("CreateBranchSaga", std::move(base_dir), std::move(logger), std::move(signal)) {}

CreateBranchOutput CreateBranchSaga::execute_git_operations(const CreateBranchInput &input) {
  const auto original =
      read_only_step("get-original-branch", [&] { return queries::head_state(git_); });

  const std::string base = input.base_branch.value_or(original.ref());
  if (base.empty())
    throw std::runtime_error("Cannot create branch: repository has no commits");

  step<void>({
      .name = "create-branch",
      .execute = [&] { git_.checkout_new_branch(input.branch_name, base); },
      .rollback =
          [this, original, branch = input.branch_name] {
            git_.checkout(original.ref());
            delete_branch_if_present(git_, branch);
          },
  });

  return {.branch_name = input.branch_name, .base_branch = base};
}

SwitchBranchSaga::SwitchBranchSaga(std::filesystem::path base_dir, std::shared_ptr<Logger> logger,
                                   std::shared_ptr<const AbortSignal> signal)
    : GitSaga("SwitchBranchSaga", std::move(base_dir), std::move(logger), std::move(signal)) {}

SwitchBranchOutput SwitchBranchSaga::execute_git_operations(const SwitchBranchInput &input) {
  const auto original =
      read_only_step("get-original-branch", [&] { return queries::head_state(git_); });

  step<void>({
      .name = "switch-branch",
      .execute = [&] { git_.checkout(input.branch_name); },
      .rollback = [this, original] { git_.checkout(original.ref()); },
  });

  return {.previous_branch = original.ref(), .current_branch = input.branch_name};
}

CreateOrSwitchBranchSaga::CreateOrSwitchBranchSaga(std::filesystem::path base_dir,
                                                   std::shared_ptr<Logger> logger,
                                                   std::shared_ptr<const AbortSignal> signal)
    : GitSaga("CreateOrSwitchBranchSaga", std::move(base_dir), std::move(logger),
              std::move(signal)) {}

CreateOrSwitchBranchOutput
CreateOrSwitchBranchSaga::execute_git_operations(const CreateOrSwitchBranchInput &input) {
  const auto original =
      read_only_step("get-original-branch", [&] { return queries::head_state(git_); });

  const bool exists = read_only_step(
      "check-branch-exists", [&] { return queries::branch_exists(git_, input.branch_name); });

  if (exists) {
    step<void>({
        .name = "switch-to-existing",
        .execute = [&] { git_.checkout(input.branch_name); },
        .rollback = [this, original] { git_.checkout(original.ref()); },
    });
    return {.branch_name = input.branch_name, .created = false};
  }

  const std::string base = input.base_branch.value_or(original.ref());
  if (base.empty())
    throw std::runtime_error("Cannot create branch: repository has no commits");

  // Shared with the rollback closure: only a branch this run created may be deleted
  auto created = std::make_shared<bool>(false);
  step<void>({
      .name = "create-new-branch",
      .execute =
          [&] {
            git_.checkout_new_branch(input.branch_name, base);
            *created = true;
          },
      .rollback =
          [this, original, created, branch = input.branch_name] {
            git_.checkout(original.ref());
            if (*created)
              delete_branch_if_present(git_, branch);
          },
  });

  return {.branch_name = input.branch_name, .created = true};
}

ResetToDefaultBranchSaga::ResetToDefaultBranchSaga(std::filesystem::path base_dir,
                                                   std::shared_ptr<Logger> logger,
                                                   std::shared_ptr<const AbortSignal> signal)
    : GitSaga("ResetToDefaultBranchSaga", std::move(base_dir), std::move(logger),
              std::move(signal)) {}

ResetToDefaultBranchOutput
ResetToDefaultBranchSaga::execute_git_operations(const ResetToDefaultBranchInput & /*input*/) {
  const auto original =
      read_only_step("get-current-branch", [&] { return queries::head_state(git_); });

  const auto default_branch = read_only_step(
      "get-default-branch", [&] { return queries::detect_default_branch(git_); });

  if (original.branch && *original.branch == default_branch) {
    return {.previous_branch = *original.branch, .default_branch = default_branch,
            .switched = false};
  }

  const bool has_changes =
      read_only_step("check-changes", [&] { return !queries::status(git_).is_clean(); });
  if (has_changes) {
    throw std::runtime_error(
        "Uncommitted changes detected. Please commit or stash before switching branches.");
  }

  step<void>({
      .name = "switch-to-default",
      .execute = [&] { git_.checkout(default_branch); },
      .rollback = [this, original] { git_.checkout(original.ref()); },
  });

  return {.previous_branch = original.ref(), .default_branch = default_branch, .switched = true};
}

} // namespace gitsaga
