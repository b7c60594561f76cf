#pragma once
#include "gitsaga/git_saga.hpp"

#include <optional>
#include <string>

namespace gitsaga {

struct CleanWorkingTreeInput {};

struct CleanWorkingTreeOutput {
  bool backup_created = false;
  std::optional<std::string> stash_sha; // commit holding the backup
};

/**
 * Discard every staged, modified and untracked change.
 *
 * The changes are first stashed (untracked files included) so that any
 * failure afterwards can pop them back. A tree that is already clean is left
 * untouched.
 */
class CleanWorkingTreeSaga : public GitSaga<CleanWorkingTreeInput, CleanWorkingTreeOutput> {
public:
  explicit CleanWorkingTreeSaga(std::filesystem::path base_dir,
                                std::shared_ptr<Logger> logger = nullptr,
                                std::shared_ptr<const AbortSignal> signal = nullptr);

protected:
  CleanWorkingTreeOutput execute_git_operations(const CleanWorkingTreeInput &input) override;
};

} // namespace gitsaga
