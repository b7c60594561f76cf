#pragma once
#include "gitsaga/git_saga.hpp"

#include <optional>
#include <string>

namespace gitsaga {

struct DetachHeadInput {};

struct DetachHeadOutput {
  std::optional<std::string> previous_branch; // nullopt if HEAD was already detached
  std::string head_sha;
};

// Detach HEAD at the current commit.
class DetachHeadSaga : public GitSaga<DetachHeadInput, DetachHeadOutput> {
public:
  explicit DetachHeadSaga(std::filesystem::path base_dir, std::shared_ptr<Logger> logger = nullptr,
                          std::shared_ptr<const AbortSignal> signal = nullptr);

protected:
  DetachHeadOutput execute_git_operations(const DetachHeadInput &input) override;
};

struct ReattachBranchInput {
  std::string branch_name;
};

struct ReattachBranchOutput {
  std::string branch_name;
  std::string head_sha;
  bool created = false;                    // branch did not exist before
  std::optional<std::string> previous_sha; // tip before the move, when it existed
};

/**
 * Point `branch_name` at the current HEAD and check it out (`checkout -B`).
 *
 * Rollback puts HEAD back where it was, then deletes the branch if this run
 * created it or force-resets it to its previous tip if it already existed.
 */
class ReattachBranchSaga : public GitSaga<ReattachBranchInput, ReattachBranchOutput> {
public:
  explicit ReattachBranchSaga(std::filesystem::path base_dir,
                              std::shared_ptr<Logger> logger = nullptr,
                              std::shared_ptr<const AbortSignal> signal = nullptr);

protected:
  ReattachBranchOutput execute_git_operations(const ReattachBranchInput &input) override;
};

} // namespace gitsaga
