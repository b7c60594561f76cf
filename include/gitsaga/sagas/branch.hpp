#pragma once
#include "gitsaga/git_saga.hpp"

#include <optional>
#include <string>

namespace gitsaga {

struct CreateBranchInput {
  std::string branch_name;
  std::optional<std::string> base_branch; // defaults to the current branch (or commit)
};

struct CreateBranchOutput {
  std::string branch_name;
  std::string base_branch;
};

// Create a new branch and check it out.
class CreateBranchSaga : public GitSaga<CreateBranchInput, CreateBranchOutput> {
public:
  explicit CreateBranchSaga(std::filesystem::path base_dir,
                            std::shared_ptr<Logger> logger = nullptr,
                            std::shared_ptr<const AbortSignal> signal = nullptr);

protected:
  CreateBranchOutput execute_git_operations(const CreateBranchInput &input) override;
};

struct SwitchBranchInput {
  std::string branch_name;
};

struct SwitchBranchOutput {
  std::string previous_branch; // branch name, or the commit when HEAD was detached
  std::string current_branch;
};

// Switch to an existing branch.
class SwitchBranchSaga : public GitSaga<SwitchBranchInput, SwitchBranchOutput> {
public:
  explicit SwitchBranchSaga(std::filesystem::path base_dir,
                            std::shared_ptr<Logger> logger = nullptr,
                            std::shared_ptr<const AbortSignal> signal = nullptr);

protected:
  SwitchBranchOutput execute_git_operations(const SwitchBranchInput &input) override;
};

struct CreateOrSwitchBranchInput {
  std::string branch_name;
  std::optional<std::string> base_branch;
};

struct CreateOrSwitchBranchOutput {
  std::string branch_name;
  bool created = false;
};

// Create a branch if it doesn't exist, or switch to it if it does.
// Rollback never deletes a branch this saga did not create.
class CreateOrSwitchBranchSaga
    : public GitSaga<CreateOrSwitchBranchInput, CreateOrSwitchBranchOutput> {
public:
  explicit CreateOrSwitchBranchSaga(std::filesystem::path base_dir,
                                    std::shared_ptr<Logger> logger = nullptr,
                                    std::shared_ptr<const AbortSignal> signal = nullptr);

protected:
  CreateOrSwitchBranchOutput execute_git_operations(const CreateOrSwitchBranchInput &input) override;
};

struct ResetToDefaultBranchInput {};

struct ResetToDefaultBranchOutput {
  std::string previous_branch;
  std::string default_branch;
  bool switched = false;
};

// Switch to the default branch if not already on it. Refuses on a dirty working tree.
class ResetToDefaultBranchSaga
    : public GitSaga<ResetToDefaultBranchInput, ResetToDefaultBranchOutput> {
public:
  explicit ResetToDefaultBranchSaga(std::filesystem::path base_dir,
                                    std::shared_ptr<Logger> logger = nullptr,
                                    std::shared_ptr<const AbortSignal> signal = nullptr);

protected:
  ResetToDefaultBranchOutput execute_git_operations(const ResetToDefaultBranchInput &input) override;
};

} // namespace gitsaga
