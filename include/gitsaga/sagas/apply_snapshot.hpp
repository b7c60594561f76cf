#pragma once
#include "gitsaga/git_saga.hpp"
#include "gitsaga/snapshot.hpp"

#include <string>

namespace gitsaga {

struct ApplySnapshotInput {
  TreeSnapshot snapshot;
  ApiClient *api_client = nullptr; // not owned
  std::string task_id;
  std::string run_id;
};

struct ApplySnapshotOutput {
  std::string tree_hash;
  bool checkout_performed = false;
  std::string archive_digest; // SHA-1 of the downloaded archive, hex
};

/**
 * Replay a remote snapshot onto the local checkout.
 *
 * Downloads the snapshot archive into <repo>/.gitsaga/tmp, moves HEAD to the
 * snapshot's base commit when it differs, extracts the archive over the working
 * tree and removes the files the snapshot deleted.
 *
 * Extraction and deletion overwrite file content without a backup: their
 * rollbacks only log a warning, so a failure after extraction leaves the
 * snapshot's files in place.
 */
class ApplySnapshotSaga : public GitSaga<ApplySnapshotInput, ApplySnapshotOutput> {
public:
  explicit ApplySnapshotSaga(std::filesystem::path repository_path,
                             std::shared_ptr<Logger> logger = nullptr,
                             std::shared_ptr<const AbortSignal> signal = nullptr);

protected:
  ApplySnapshotOutput execute_git_operations(const ApplySnapshotInput &input) override;
};

} // namespace gitsaga
