#include "gitsaga/sagas/checkpoint.hpp"

#include "gitsaga/consts.hpp"
#include "gitsaga/fs.hpp"
#include "gitsaga/queries.hpp"
#include "gitsaga/random.hpp"
#include "gitsaga/time.hpp"
#include "gitsaga/util.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace gitsaga {

namespace {

constexpr std::string_view kUnmergedIndexError =
    "Cannot capture checkpoint with unresolved merge conflicts in the index";
constexpr std::string_view kGitBusyError =
    "Cannot capture checkpoint while git operation is in progress";

std::string checkpoint_ref(const std::string &checkpoint_id) {
  return std::string(consts::kCheckpointRefPrefix) + checkpoint_id;
}

std::optional<std::string> verify_commit(const GitClient &git, const std::string &rev) {
  const auto result = git.run({"rev-parse", "--verify", "--quiet", rev + "^{commit}"});
  if (result.exit_code != 0)
    return std::nullopt;
  return strutil::trim(result.out);
}

bool ref_exists(const GitClient &git, const std::string &ref) {
  return git.run({"rev-parse", "--verify", "--quiet", ref}).exit_code == 0;
}

// A client on a throwaway index under the common git dir; the index goes away with `file`.
GitClient temp_index_client(const GitClient &git, std::string_view label,
                            std::optional<fs::TempFile> &file) {
  const auto dir = queries::resolve_common_git_dir(git) / consts::kCaptureTmpDir;
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec)
    throw std::runtime_error("mkdir failed: " + dir.string() + ": " + ec.message());
  file.emplace(dir / (std::string(label) + "-" + std::to_string(timeutil::now_millis()) + "-" +
                      random_uuid()));
  return git.with_env("GIT_INDEX_FILE", file->path().string());
}

// Commit tree holding the index tree under index/ and the working tree under worktree/
std::string write_meta_tree(const GitClient &git, const std::string &index_tree,
                            const std::string &worktree_tree) {
  std::optional<fs::TempFile> file;
  const auto temp = temp_index_client(git, "checkpoint-meta", file);
  temp.raw({"read-tree", "--empty"});
  // An empty tree adds no entry; the message still records it
  if (index_tree != consts::kEmptyTree)
    temp.raw({"read-tree", "--prefix=index/", index_tree});
  if (worktree_tree != consts::kEmptyTree)
    temp.raw({"read-tree", "--prefix=worktree/", worktree_tree});
  return strutil::trim(temp.raw({"write-tree"}));
}

void tree_entries_from_commit(const GitClient &git, const std::string &commit,
                              CheckpointMetadata &meta) {
  for (const auto &line : strutil::split_lines(git.raw({"ls-tree", commit + "^{tree}"}))) {
    // "<mode> <type> <sha>\t<name>"
    const auto tab = line.find('\t');
    if (tab == std::string::npos || tab < 41)
      continue;
    const auto name = line.substr(tab + 1);
    const auto sha = line.substr(tab - 40, 40);
    if (name == "index" && !meta.index_tree)
      meta.index_tree = sha;
    else if (name == "worktree" && !meta.worktree_tree)
      meta.worktree_tree = sha;
  }
}

std::optional<CheckpointRecord> read_record(const GitClient &git, const std::string &checkpoint_id,
                                            const std::string &commit) {
  auto meta = parse_checkpoint_message(git.raw({"log", "-1", "--format=%B", commit}));
  if (!meta)
    return std::nullopt;
  if (!meta->index_tree || !meta->worktree_tree)
    tree_entries_from_commit(git, commit, *meta);
  return CheckpointRecord{.checkpoint_id = checkpoint_id, .commit = commit, .meta = std::move(*meta)};
}

} // namespace

std::string format_checkpoint_message(const CheckpointMetadata &meta) {
  std::string out = std::string(consts::kCheckpointHeader) + " " +
                    std::string(consts::kCheckpointVersion) + "\n";
  out += "head=" + meta.head.value_or("null") + "\n";
  out += "branch=" + meta.branch.value_or("null") + "\n";
  out += "index=" + meta.index_tree.value_or("") + "\n";
  out += "worktree=" + meta.worktree_tree.value_or("") + "\n";
  out += "timestamp=" + meta.timestamp.value_or("");
  return out;
}

std::optional<CheckpointMetadata> parse_checkpoint_message(std::string_view message) {
  std::vector<std::string> lines;
  for (const auto &line : strutil::split_lines(message)) {
    auto t = strutil::trim(line);
    if (!t.empty())
      lines.push_back(std::move(t));
  }
  if (lines.empty() || !lines.front().starts_with(consts::kCheckpointHeader))
    return std::nullopt;

  const auto nullable = [](const std::string &v) -> std::optional<std::string> {
    if (v == "null")
      return std::nullopt;
    return v;
  };
  const auto non_empty = [](const std::string &v) -> std::optional<std::string> {
    if (v.empty())
      return std::nullopt;
    return v;
  };

  CheckpointMetadata meta;
  for (std::size_t i = 1; i < lines.size(); ++i) {
    const auto eq = lines[i].find('=');
    if (eq == std::string::npos || eq == 0)
      continue;
    const auto key = lines[i].substr(0, eq);
    const auto value = strutil::trim(lines[i].substr(eq + 1));
    if (key == "head")
      meta.head = nullable(value);
    else if (key == "branch")
      meta.branch = nullable(value);
    else if (key == "index")
      meta.index_tree = non_empty(value);
    else if (key == "worktree")
      meta.worktree_tree = non_empty(value);
    else if (key == "timestamp")
      meta.timestamp = non_empty(value);
  }
  return meta;
}

std::string_view busy_operation_name(GitBusyOperation op) {
  switch (op) {
  case GitBusyOperation::Rebase:
    return "rebase";
  case GitBusyOperation::Merge:
    return "merge";
  case GitBusyOperation::CherryPick:
    return "cherry-pick";
  case GitBusyOperation::Revert:
    return "revert";
  }
  return "unknown";
}

std::optional<GitBusyOperation> git_busy_state(const GitClient &git) {
  std::error_code ec;
  if (std::filesystem::is_directory(queries::git_path(git, "rebase-merge"), ec) ||
      std::filesystem::is_directory(queries::git_path(git, "rebase-apply"), ec))
    return GitBusyOperation::Rebase;
  if (fs::exists(queries::git_path(git, "MERGE_HEAD")))
    return GitBusyOperation::Merge;
  if (fs::exists(queries::git_path(git, "CHERRY_PICK_HEAD")))
    return GitBusyOperation::CherryPick;
  if (fs::exists(queries::git_path(git, "REVERT_HEAD")))
    return GitBusyOperation::Revert;
  return std::nullopt;
}

CheckpointRecord resolve_checkpoint(const GitClient &git, const std::string &checkpoint_id) {
  if (checkpoint_id.empty())
    throw std::runtime_error("Checkpoint not found: (empty id)");
  auto commit = verify_commit(git, checkpoint_ref(checkpoint_id));
  if (!commit)
    commit = verify_commit(git, checkpoint_id);
  if (!commit)
    throw std::runtime_error("Checkpoint not found: " + checkpoint_id);
  auto record = read_record(git, checkpoint_id, *commit);
  if (!record)
    throw std::runtime_error("Not a gitsaga checkpoint commit: " + *commit);
  return std::move(*record);
}

std::vector<CheckpointRecord> list_checkpoints(const GitClient &git) {
  const auto refs = strutil::split_lines(
      git.raw({"for-each-ref", "--format=%(refname)", std::string(consts::kCheckpointRefPrefix)}));

  std::vector<CheckpointRecord> out;
  for (const auto &ref : refs) {
    if (!ref.starts_with(consts::kCheckpointRefPrefix))
      continue;
    const auto id = ref.substr(consts::kCheckpointRefPrefix.size());
    const auto commit = verify_commit(git, ref);
    if (!commit)
      continue;
    if (auto record = read_record(git, id, *commit))
      out.push_back(std::move(*record));
  }
  // ISO-8601 UTC sorts lexically; undated entries go last
  std::ranges::stable_sort(out, [](const CheckpointRecord &a, const CheckpointRecord &b) {
    return a.meta.timestamp.value_or("") > b.meta.timestamp.value_or("");
  });
  return out;
}

void delete_checkpoint(const GitClient &git, const std::string &checkpoint_id) {
  const auto ref = checkpoint_ref(checkpoint_id);
  if (checkpoint_id.empty() || !ref_exists(git, ref))
    throw std::runtime_error("Checkpoint not found: " + checkpoint_id);
  git.raw({"update-ref", "-d", ref});
}

std::string write_worktree_tree(const GitClient &git, const std::optional<std::string> &head) {
  std::optional<fs::TempFile> file;
  const auto temp = temp_index_client(git, "checkpoint-worktree", file);
  if (head)
    temp.raw({"read-tree", *head});
  else
    temp.raw({"read-tree", "--empty"});
  temp.raw({"add", "-A", "--", "."});
  return strutil::trim(temp.raw({"write-tree"}));
}

CaptureCheckpointSaga::CaptureCheckpointSaga(std::filesystem::path base_dir,
                                             std::shared_ptr<Logger> logger,
                                             std::shared_ptr<const AbortSignal> signal)
    : GitSaga("CaptureCheckpointSaga", std::move(base_dir), std::move(logger), std::move(signal)) {}

CheckpointState CaptureCheckpointSaga::execute_git_operations(const CaptureCheckpointInput &input) {
  const auto head = read_only_step("get_head_info", [&] { return queries::head_state(git_); });

  read_only_step("check_git_busy", [&] {
    if (const auto op = git_busy_state(git_))
      throw std::runtime_error(std::string(kGitBusyError) + ": " +
                               std::string(busy_operation_name(*op)));
  });

  read_only_step("check_unmerged_index", [&] {
    if (!strutil::trim(git_.raw({"ls-files", "--unmerged"})).empty())
      throw std::runtime_error(std::string(kUnmergedIndexError));
  });

  const auto checkpoint_id = input.checkpoint_id.value_or(random_uuid());
  const auto ref = checkpoint_ref(checkpoint_id);

  read_only_step("check_existing_ref", [&] {
    if (checkpoint_id.empty() || git_.run({"check-ref-format", ref}).exit_code != 0)
      throw std::runtime_error("Invalid checkpoint id: '" + checkpoint_id + "'");
    if (ref_exists(git_, ref))
      throw std::runtime_error("Checkpoint ref already exists: " + ref);
  });

  const auto index_tree =
      read_only_step("write_index_tree", [&] { return strutil::trim(git_.raw({"write-tree"})); });

  const auto worktree_tree =
      read_only_step("write_worktree_tree", [&] { return write_worktree_tree(git_, head.sha); });

  const auto meta_tree = read_only_step(
      "write_meta_tree", [&] { return write_meta_tree(git_, index_tree, worktree_tree); });

  const auto timestamp = timeutil::now_iso8601();
  const auto message = format_checkpoint_message({.head = head.sha,
                                                  .branch = head.branch,
                                                  .index_tree = index_tree,
                                                  .worktree_tree = worktree_tree,
                                                  .timestamp = timestamp});

  const auto commit = step<std::string>({
      .name = "create_checkpoint_commit",
      .execute =
          [&] {
            const auto author = std::string(consts::kCheckpointAuthor);
            const auto email = std::string(consts::kCheckpointEmail);
            const auto committer = git_.with_env("GIT_AUTHOR_NAME", author)
                                       .with_env("GIT_AUTHOR_EMAIL", email)
                                       .with_env("GIT_COMMITTER_NAME", author)
                                       .with_env("GIT_COMMITTER_EMAIL", email);
            return strutil::trim(committer.raw({"commit-tree", meta_tree, "-m", message}));
          },
      // An unreferenced commit object is left for gc
      .rollback = nullptr,
  });

  step<void>({
      .name = "update_checkpoint_ref",
      // Empty old value: fail instead of overwriting a ref created meanwhile
      .execute = [&] { git_.raw({"update-ref", ref, commit, ""}); },
      .rollback = [this, ref] { git_.raw({"update-ref", "-d", ref}); },
  });

  log().info("Checkpoint captured", {{"checkpointId", checkpoint_id},
                                     {"commit", commit},
                                     {"branch", head.branch.value_or("")}});

  return CheckpointState{.checkpoint_id = checkpoint_id,
                         .commit = commit,
                         .head = head.sha,
                         .branch = head.branch,
                         .index_tree = index_tree,
                         .worktree_tree = worktree_tree,
                         .timestamp = timestamp};
}

RevertCheckpointSaga::RevertCheckpointSaga(std::filesystem::path base_dir,
                                           std::shared_ptr<Logger> logger,
                                           std::shared_ptr<const AbortSignal> signal)
    : GitSaga("RevertCheckpointSaga", std::move(base_dir), std::move(logger), std::move(signal)) {}

RevertCheckpointOutput RevertCheckpointSaga::execute_git_operations(const RevertCheckpointInput &input) {
  const auto checkpoint =
      read_only_step("resolve_checkpoint", [&] { return resolve_checkpoint(git_, input.checkpoint_id); });
  const auto &meta = checkpoint.meta;
  if (!meta.index_tree || !meta.worktree_tree)
    throw std::runtime_error("Checkpoint is missing tree data");

  struct OriginalState {
    queries::HeadState head;
    std::string index_tree;
    std::string worktree_tree;
  };
  const auto original = read_only_step("capture_original_state", [&] {
    auto head = queries::head_state(git_);
    auto index_tree = strutil::trim(git_.raw({"write-tree"}));
    auto worktree_tree = write_worktree_tree(git_, head.sha);
    return OriginalState{.head = std::move(head),
                         .index_tree = std::move(index_tree),
                         .worktree_tree = std::move(worktree_tree)};
  });

  // Runs last during rollback, once HEAD is back: working tree, then index
  step<void>({
      .name = "save_restore_point",
      .execute = [] {},
      .rollback =
          [this, original] {
            // Stage leftovers so the reset below removes them
            git_.raw({"add", "-A"});
            git_.raw({"read-tree", "--reset", "-u", original.worktree_tree});
            git_.raw({"read-tree", original.index_tree});
          },
  });

  if (meta.head) {
    const auto &target = *meta.head;
    step<void>({
        .name = "checkout_head",
        .execute =
            [&] {
              if (meta.branch && queries::branch_exists(git_, *meta.branch))
                git_.raw({"checkout", "--quiet", "-f", *meta.branch});
              else
                git_.raw({"checkout", "--quiet", "-f", "--detach", target});
            },
        .rollback =
            [this, head = original.head] {
              if (head.branch && !head.sha) {
                // Unborn branch: only HEAD itself can be pointed back
                git_.raw({"symbolic-ref", "HEAD", std::string(consts::kHeadsPrefix) + *head.branch});
                return;
              }
              if (head.branch && queries::branch_exists(git_, *head.branch))
                git_.raw({"checkout", "--quiet", "-f", *head.branch});
              else if (head.sha)
                git_.raw({"checkout", "--quiet", "-f", "--detach", *head.sha});
            },
    });

    const auto previous_tip =
        read_only_step("get_previous_tip", [&] { return queries::head_sha(git_); });

    step<void>({
        .name = "reset_head",
        .execute = [&] { git_.raw({"reset", "--quiet", "--hard", target}); },
        .rollback =
            [this, previous_tip] {
              if (previous_tip)
                git_.raw({"reset", "--quiet", "--hard", *previous_tip});
            },
    });
  }

  // The remaining steps are undone by save_restore_point
  step<void>({
      .name = "clean_worktree",
      .execute = [&] { git_.raw({"clean", "-f", "-d", "-q"}); },
      .rollback = nullptr,
  });

  step<void>({
      .name = "restore_worktree_tree",
      .execute = [&] { git_.raw({"read-tree", "--reset", "-u", *meta.worktree_tree}); },
      .rollback = nullptr,
  });

  step<void>({
      .name = "restore_index_tree",
      .execute = [&] { git_.raw({"read-tree", *meta.index_tree}); },
      .rollback = nullptr,
  });

  log().info("Checkpoint restored", {{"checkpointId", input.checkpoint_id},
                                     {"commit", checkpoint.commit},
                                     {"branch", meta.branch.value_or("")}});

  return {.checkpoint_id = input.checkpoint_id,
          .commit = checkpoint.commit,
          .head = meta.head,
          .branch = meta.branch};
}

DiffCheckpointSaga::DiffCheckpointSaga(std::filesystem::path base_dir,
                                       std::shared_ptr<Logger> logger,
                                       std::shared_ptr<const AbortSignal> signal)
    : GitSaga("DiffCheckpointSaga", std::move(base_dir), std::move(logger), std::move(signal)) {}

DiffCheckpointOutput DiffCheckpointSaga::execute_git_operations(const DiffCheckpointInput &input) {
  const auto worktree_of = [&](const std::string &id) {
    const auto record = resolve_checkpoint(git_, id);
    if (!record.meta.worktree_tree)
      throw std::runtime_error("Checkpoint is missing worktree tree");
    return *record.meta.worktree_tree;
  };

  const auto from_tree = read_only_step("resolve_from_tree", [&] { return worktree_of(input.from); });

  const auto to_tree = read_only_step("resolve_to_tree", [&] {
    if (input.to == DiffCheckpointInput::kCurrentWorktree)
      return write_worktree_tree(git_, queries::head_sha(git_));
    return worktree_of(input.to);
  });

  auto diff = read_only_step("diff_trees",
                             [&] { return git_.raw({"diff", "--no-color", from_tree, to_tree}); });

  return {.diff = std::move(diff), .from_tree = from_tree, .to_tree = to_tree};
}

} // namespace gitsaga
