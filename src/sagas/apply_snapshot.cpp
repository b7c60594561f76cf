#include "gitsaga/sagas/apply_snapshot.hpp"

#include "gitsaga/archive.hpp"
#include "gitsaga/consts.hpp"
#include "gitsaga/fs.hpp"
#include "gitsaga/hash.hpp"
#include "gitsaga/queries.hpp"
#include "gitsaga/util.hpp"

#include <stdexcept>
#include <system_error>

namespace gitsaga {

ApplySnapshotSaga::ApplySnapshotSaga(std::filesystem::path repository_path,
                                     std::shared_ptr<Logger> logger,
                                     std::shared_ptr<const AbortSignal> signal)
    : GitSaga("ApplySnapshotSaga", std::move(repository_path), std::move(logger),
              std::move(signal)) {}

ApplySnapshotOutput ApplySnapshotSaga::execute_git_operations(const ApplySnapshotInput &input) {
  const auto &snapshot = input.snapshot;

  read_only_step("validate_snapshot", [&] {
    if (!snapshot.archive_url || snapshot.archive_url->empty())
      throw std::runtime_error("Cannot apply snapshot: no archive URL");
    // The tree hash names the downloaded file
    if (!looks_hex40(snapshot.tree_hash))
      throw std::runtime_error("Cannot apply snapshot: invalid tree hash '" + snapshot.tree_hash + "'");
    if (input.api_client == nullptr)
      throw std::invalid_argument("Cannot apply snapshot: no API client");
    for (const auto &c : snapshot.changes) {
      if (!archive::is_safe_path(c.path))
        throw std::runtime_error("Cannot apply snapshot: unsafe path " + c.path);
    }
  });

  const auto original =
      read_only_step("get_current_head", [&] { return queries::head_state(git_); });

  const bool needs_checkout = snapshot.base_commit && snapshot.base_commit != original.sha;

  if (needs_checkout) {
    read_only_step("check_working_tree", [&] {
      const auto st = queries::status(git_);
      if (!st.is_clean()) {
        const auto n = st.tracked_change_count() + st.untracked.size();
        throw std::runtime_error("Cannot apply snapshot: " + std::to_string(n) +
                                 " uncommitted change(s) exist. Commit or stash your changes "
                                 "first.");
      }
    });
  }

  const auto tmp_dir = base_dir_ / consts::kScratchDir / consts::kScratchTmpDir;
  step<void>({
      .name = "create_tmp_dir",
      .execute =
          [&] {
            std::error_code ec;
            std::filesystem::create_directories(tmp_dir, ec);
            if (ec)
              throw std::runtime_error("mkdir failed: " + tmp_dir.string() + ": " + ec.message());
          },
      .rollback = nullptr,
  });

  const auto archive_file = tmp_dir / (snapshot.tree_hash + std::string(consts::kArchiveSuffix));
  std::string digest;

  step<void>({
      .name = "download_archive",
      .execute =
          [&] {
            const auto bytes =
                input.api_client->download_artifact(input.task_id, input.run_id, *snapshot.archive_url);
            if (bytes.empty())
              throw std::runtime_error("Failed to download archive from " + *snapshot.archive_url);
            digest = sha1_hex(bytes);
            fs::write_file_atomic(archive_file, bytes);
            log().debug("Archive downloaded",
                        {{"path", archive_file.string()},
                         {"bytes", std::to_string(bytes.size())},
                         {"sha1", digest}});
          },
      .rollback =
          [archive_file] {
            std::error_code ec;
            std::filesystem::remove(archive_file, ec);
            if (ec)
              throw std::runtime_error("remove failed: " + archive_file.string() + ": " +
                                       ec.message());
          },
  });

  bool checkout_performed = false;
  if (needs_checkout) {
    const auto &base = *snapshot.base_commit;
    step<void>({
        .name = "checkout_base",
        .execute =
            [&] {
              // Stay on a branch when one already sits at the base commit
              const auto branches = queries::branches_pointing_at(git_, base);
              if (!branches.empty()) {
                git_.checkout(branches.front());
              } else {
                git_.raw({"checkout", "--detach", base});
                log().warn("Applied snapshot from different commit - now in detached HEAD state",
                           {{"originalHead", original.sha.value_or("")},
                            {"originalBranch", original.branch.value_or("")},
                            {"baseCommit", base}});
              }
              checkout_performed = true;
            },
        .rollback =
            [this, original] {
              if (!original.branch && !original.sha)
                return;
              git_.checkout(original.ref());
            },
    });
  }

  step<void>({
      .name = "extract_archive",
      .execute =
          [&] {
            const auto written = archive::extract(fs::read_file(archive_file), base_dir_);
            log().debug("Archive extracted", {{"entries", std::to_string(written.size())}});
          },
      .rollback =
          [this, tree = snapshot.tree_hash] {
            log().warn("Extracted snapshot files cannot be restored; the working tree keeps them",
                       {{"treeHash", tree}});
          },
  });

  step<void>({
      .name = "delete_removed_files",
      .execute =
          [&] {
            // Extraction may have planted symlinks; check every path before removing any
            for (const auto &c : snapshot.changes) {
              if (c.status == FileStatus::Deleted)
                archive::refuse_symlinked_parent(base_dir_, c.path);
            }
            for (const auto &c : snapshot.changes) {
              if (c.status != FileStatus::Deleted)
                continue;
              const auto full = base_dir_ / c.path;
              std::error_code ec;
              std::filesystem::remove(full, ec);
              if (ec)
                throw std::runtime_error("remove failed: " + full.string() + ": " + ec.message());
              log().debug("Deleted file: " + c.path);
            }
          },
      .rollback =
          [this, tree = snapshot.tree_hash] {
            log().warn("Files deleted by the snapshot cannot be restored",
                       {{"treeHash", tree}});
          },
  });

  read_only_step("cleanup_archive", [&] {
    std::error_code ec;
    std::filesystem::remove(archive_file, ec);
    if (ec)
      log().warn("Failed to remove downloaded archive",
                 {{"path", archive_file.string()}, {"error", ec.message()}});
  });

  log().info("Snapshot applied",
             {{"treeHash", snapshot.tree_hash},
              {"changes", std::to_string(snapshot.changes.size())},
              {"checkoutPerformed", checkout_performed ? "true" : "false"}});

  return {.tree_hash = snapshot.tree_hash,
          .checkout_performed = checkout_performed,
          .archive_digest = digest};
}

} // namespace gitsaga
