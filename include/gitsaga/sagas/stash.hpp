#pragma once
#include "gitsaga/git_saga.hpp"

#include <optional>
#include <string>

namespace gitsaga {

struct StashPushInput {
  std::string message;
};

struct StashPushOutput {
  std::optional<std::string> stash_sha; // nullopt when there was nothing to stash
};

// Stage everything and push it (untracked files included) onto the stash.
class StashPushSaga : public GitSaga<StashPushInput, StashPushOutput> {
public:
  explicit StashPushSaga(std::filesystem::path base_dir, std::shared_ptr<Logger> logger = nullptr,
                         std::shared_ptr<const AbortSignal> signal = nullptr);

protected:
  StashPushOutput execute_git_operations(const StashPushInput &input) override;
};

struct StashApplyInput {
  std::string stash_sha;
};

struct StashApplyOutput {
  bool dropped = false;
};

/**
 * Apply a stash entry by commit id and drop it from the stash list.
 *
 * Local changes present beforehand are parked in a backup stash and popped
 * back on top once the entry has been applied.
 */
class StashApplySaga : public GitSaga<StashApplyInput, StashApplyOutput> {
public:
  explicit StashApplySaga(std::filesystem::path base_dir, std::shared_ptr<Logger> logger = nullptr,
                          std::shared_ptr<const AbortSignal> signal = nullptr);

protected:
  StashApplyOutput execute_git_operations(const StashApplyInput &input) override;
};

struct StashPopInput {};

struct StashPopOutput {
  bool popped = false;
};

// `git stash pop`; rollback stores the popped commit back onto the stash.
class StashPopSaga : public GitSaga<StashPopInput, StashPopOutput> {
public:
  explicit StashPopSaga(std::filesystem::path base_dir, std::shared_ptr<Logger> logger = nullptr,
                        std::shared_ptr<const AbortSignal> signal = nullptr);

protected:
  StashPopOutput execute_git_operations(const StashPopInput &input) override;
};

} // namespace gitsaga
