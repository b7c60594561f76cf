#include "gitsaga/sagas/tree.hpp"

#include "gitsaga/archive.hpp"
#include "gitsaga/consts.hpp"
#include "gitsaga/fs.hpp"
#include "gitsaga/queries.hpp"
#include "gitsaga/time.hpp"
#include "gitsaga/util.hpp"

#include <map>
#include <stdexcept>
#include <system_error>

namespace gitsaga {

namespace {

std::vector<std::string> split_nul(std::string_view data) {
  std::vector<std::string> out;
  std::size_t pos = 0;
  while (pos < data.size()) {
    auto end = data.find('\0', pos);
    if (end == std::string_view::npos)
      end = data.size();
    if (end > pos)
      out.emplace_back(data.substr(pos, end - pos));
    pos = end + 1;
  }
  return out;
}

std::optional<std::vector<std::uint8_t>> read_if_file(const std::filesystem::path &p) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(std::filesystem::symlink_status(p, ec)))
    return std::nullopt;
  return fs::read_file(p);
}

} // namespace

std::vector<FileChange> tree_changes(const GitClient &git, const std::optional<std::string> &from,
                                     const std::string &to) {
  std::vector<FileChange> changes;
  if (!from) {
    for (auto &p : split_nul(git.raw({"ls-tree", "-r", "-z", "--name-only", to})))
      changes.push_back(FileChange{.path = std::move(p), .status = FileStatus::Added});
    return changes;
  }
  // -z output alternates "<status>" and "<path>" fields
  const auto fields = split_nul(git.raw({"diff-tree", "-r", "-z", "--name-status", *from, to}));
  for (std::size_t i = 0; i + 1 < fields.size(); i += 2)
    changes.push_back(FileChange{.path = fields[i + 1], .status = status_from_code(fields[i])});
  return changes;
}

CaptureTreeSaga::CaptureTreeSaga(std::filesystem::path base_dir, std::shared_ptr<Logger> logger,
                                 std::shared_ptr<const AbortSignal> signal)
    : GitSaga("CaptureTreeSaga", std::move(base_dir), std::move(logger), std::move(signal)) {}

CaptureTreeOutput CaptureTreeSaga::execute_git_operations(const CaptureTreeInput &input) {
  const auto tmp_dir = read_only_step("resolve_tmp_dir", [&] {
    return queries::resolve_git_dir(git_) / consts::kCaptureTmpDir;
  });

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

  fs::TempFile index(tmp_dir / ("index-" + std::to_string(timeutil::now_millis())));
  const GitClient temp_git = git_.with_env("GIT_INDEX_FILE", index.path().string());

  const auto base_commit =
      read_only_step("get_base_commit", [&] { return queries::head_sha(git_); });

  step<void>({
      .name = "init_temp_index",
      .execute =
          [&] {
            if (base_commit)
              temp_git.raw({"read-tree", "HEAD"});
            else
              temp_git.raw({"read-tree", "--empty"});
          },
      // TempFile removes the index
      .rollback = nullptr,
  });

  read_only_step("stage_files", [&] { temp_git.raw({"add", "-A"}); });

  const auto tree_hash =
      read_only_step("write_tree", [&] { return strutil::trim(temp_git.raw({"write-tree"})); });

  if (input.last_tree_hash && *input.last_tree_hash == tree_hash) {
    log().debug("No changes since last capture", {{"treeHash", tree_hash}});
    return {.snapshot = std::nullopt, .archive_path = std::nullopt, .changed = false};
  }

  auto changes = read_only_step("get_changes", [&] { return tree_changes(git_, base_commit, tree_hash); });

  TreeSnapshot snapshot{.tree_hash = tree_hash,
                        .base_commit = base_commit,
                        .archive_url = std::nullopt,
                        .changes = std::move(changes),
                        .timestamp = timeutil::now_iso8601(),
                        .interrupted = false};

  std::optional<std::filesystem::path> archive_path;
  if (input.archive_path) {
    std::vector<std::string> files;
    for (const auto &c : snapshot.changes) {
      std::error_code ec;
      if (c.status != FileStatus::Deleted &&
          std::filesystem::symlink_status(base_dir_ / c.path, ec).type() !=
              std::filesystem::file_type::not_found)
        files.push_back(c.path);
    }

    if (!files.empty()) {
      const auto target = *input.archive_path;
      step<void>({
          .name = "create_archive",
          .execute =
              [&] {
                const auto bytes = archive::pack(base_dir_, files);
                fs::write_file_atomic(target, bytes);
              },
          .rollback =
              [target] {
                std::error_code ec;
                std::filesystem::remove(target, ec);
                if (ec)
                  throw std::runtime_error("remove failed: " + target.string() + ": " +
                                           ec.message());
              },
      });
      archive_path = target;
      snapshot.archive_url = target.string();
    }
  }

  log().info("Tree captured", {{"treeHash", tree_hash},
                               {"changes", std::to_string(snapshot.changes.size())},
                               {"archived", archive_path ? "true" : "false"}});

  return {.snapshot = std::move(snapshot), .archive_path = archive_path, .changed = true};
}

ApplyTreeSaga::ApplyTreeSaga(std::filesystem::path base_dir, std::shared_ptr<Logger> logger,
                             std::shared_ptr<const AbortSignal> signal)
    : GitSaga("ApplyTreeSaga", std::move(base_dir), std::move(logger), std::move(signal)) {}

ApplyTreeOutput ApplyTreeSaga::execute_git_operations(const ApplyTreeInput &input) {
  const auto original =
      read_only_step("get_current_head", [&] { return queries::head_state(git_); });

  bool checkout_performed = false;
  if (input.base_commit && input.base_commit != original.sha) {
    read_only_step("check_working_tree", [&] {
      const auto st = queries::status(git_);
      if (!st.is_clean())
        throw std::runtime_error("Cannot apply tree: " +
                                 std::to_string(st.tracked_change_count()) +
                                 " uncommitted change(s) exist. Commit or stash your changes first.");
    });

    step<void>({
        .name = "checkout_base",
        .execute =
            [&] {
              git_.raw({"checkout", "--detach", *input.base_commit});
              checkout_performed = true;
              log().warn("Applied tree from different commit - now in detached HEAD state",
                         {{"originalHead", original.sha.value_or("")},
                          {"originalBranch", original.branch.value_or("")},
                          {"baseCommit", *input.base_commit}});
            },
        .rollback = [this, original] { git_.checkout(original.ref()); },
    });
  }

  if (input.archive_path) {
    std::vector<std::string> to_extract;
    for (const auto &c : input.changes) {
      if (c.status != FileStatus::Deleted)
        to_extract.push_back(c.path);
    }

    const auto backups = read_only_step("backup_existing_files", [&] {
      std::map<std::string, std::vector<std::uint8_t>> saved;
      for (const auto &p : to_extract) {
        if (auto data = read_if_file(base_dir_ / p))
          saved.emplace(p, std::move(*data));
      }
      return saved;
    });

    step<void>({
        .name = "extract_archive",
        .execute = [&] { archive::extract(fs::read_file(*input.archive_path), base_dir_); },
        .rollback =
            [this, to_extract, backups] {
              for (const auto &p : to_extract) {
                const auto full = base_dir_ / p;
                if (auto it = backups.find(p); it != backups.end()) {
                  fs::write_file_atomic(full, it->second);
                } else {
                  std::error_code ec;
                  std::filesystem::remove(full, ec);
                  if (ec)
                    throw std::runtime_error("remove failed: " + full.string() + ": " +
                                             ec.message());
                }
              }
            },
    });
  }

  std::size_t deleted = 0;
  for (const auto &c : input.changes) {
    if (c.status != FileStatus::Deleted)
      continue;
    if (!archive::is_safe_path(c.path))
      throw std::runtime_error("Refusing to delete path outside the repository: " + c.path);
    const auto full = base_dir_ / c.path;
    const auto backup = read_only_step("backup_" + c.path, [&] {
      archive::refuse_symlinked_parent(base_dir_, c.path);
      return read_if_file(full);
    });

    step<void>({
        .name = "delete_" + c.path,
        .execute =
            [&] {
              archive::refuse_symlinked_parent(base_dir_, c.path);
              std::error_code ec;
              std::filesystem::remove(full, ec);
              if (ec)
                throw std::runtime_error("remove failed: " + full.string() + ": " + ec.message());
              log().debug("Deleted file: " + c.path);
            },
        .rollback =
            [full, backup] {
              if (backup)
                fs::write_file_atomic(full, *backup);
            },
    });
    ++deleted;
  }

  log().info("Tree applied", {{"treeHash", input.tree_hash},
                              {"totalChanges", std::to_string(input.changes.size())},
                              {"deletedFiles", std::to_string(deleted)},
                              {"checkoutPerformed", checkout_performed ? "true" : "false"}});

  return {.tree_hash = input.tree_hash, .checkout_performed = checkout_performed};
}

ReadTreeSaga::ReadTreeSaga(std::filesystem::path base_dir, std::shared_ptr<Logger> logger,
                           std::shared_ptr<const AbortSignal> signal)
    : GitSaga("ReadTreeSaga", std::move(base_dir), std::move(logger), std::move(signal)) {}

ReadTreeOutput ReadTreeSaga::execute_git_operations(const ReadTreeInput &input) {
  auto files = read_only_step("ls_tree", [&] {
    return split_nul(git_.raw({"ls-tree", "-r", "-z", "--name-only", input.tree_hash}));
  });
  return {.files = std::move(files)};
}

} // namespace gitsaga
