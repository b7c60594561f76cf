#include "gitsaga/worktree_manager.hpp"

#include "gitsaga/consts.hpp"
#include "gitsaga/fs.hpp"
#include "gitsaga/operation_manager.hpp"
#include "gitsaga/queries.hpp"
#include "gitsaga/time.hpp"
#include "gitsaga/util.hpp"

#include <stdexcept>
#include <system_error>
#include <unordered_set>

namespace gitsaga {

const std::vector<std::string> &default_palette() {
  static const std::vector<std::string> colors{
      "red",      "orange",    "yellow", "green",    "blue",   "purple",   "pink",
      "brown",    "cyan",      "magenta", "teal",    "navy",   "maroon",   "olive",
      "coral",    "turquoise", "indigo", "violet",   "lavender", "crimson", "gold",
      "silver",   "bronze",    "ivory",  "charcoal", "slate",  "jade",     "ruby",
      "amber",    "emerald",   "sapphire", "pearl",  "onyx",   "copper",   "mint",
      "peach",    "plum",      "lime",   "aqua",     "rose",   "sky",      "moss",
      "sand",     "rust",      "burgundy", "cobalt", "ochre",  "lilac",    "cedar",
  };
  return colors;
}

std::vector<std::string> default_shared_paths() {
  return {std::string(consts::kSharedConfigDir), std::string(consts::kSharedNotesFile)};
}

void check_worktree_deletable(const std::filesystem::path &main_repo,
                              const std::filesystem::path &target) {
  const auto t = fs::normalize(target);
  const auto m = fs::normalize(main_repo);
  if (t == m)
    throw std::runtime_error("Cannot delete worktree: path matches main repo path");
  if (fs::is_same_or_ancestor(t, m))
    throw std::runtime_error("Cannot delete worktree: path is a parent of main repo path");
  std::error_code ec;
  if (std::filesystem::is_directory(t / consts::kGitDir, ec))
    throw std::runtime_error(
        "Cannot delete worktree: path appears to be a main repository (contains .git directory)");
}

std::vector<std::filesystem::path> link_shared_paths(const GitClient &worktree_git,
                                                     const std::filesystem::path &main_repo,
                                                     const std::vector<std::string> &names) {
  std::vector<std::filesystem::path> linked;
  const auto source_root = fs::normalize(main_repo);
  for (const auto &name : names) {
    const auto target = worktree_git.base_dir() / name;
    if (!fs::safe_symlink(source_root / name, target))
      continue;
    linked.push_back(target);
    queries::add_to_local_exclude(worktree_git, name);
  }
  return linked;
}

WorktreeManager::WorktreeManager(WorktreeConfig config)
    : config_(std::move(config)),
      repo_name_(fs::normalize(config_.main_repo_path).filename().string()),
      log_(config_.logger ? config_.logger : null_logger()), rng_(std::random_device{}()) {
  if (config_.palette.empty())
    config_.palette = default_palette();
  if (config_.shared_paths.empty())
    config_.shared_paths = default_shared_paths();
}

std::string WorktreeManager::generate_worktree_name() {
  std::uniform_int_distribution<std::size_t> pick(0, config_.palette.size() - 1);
  return std::string(consts::kWorktreeNamePrefix) + config_.palette[pick(rng_)];
}

std::filesystem::path WorktreeManager::worktree_folder_path() const {
  if (config_.worktree_base_path)
    return *config_.worktree_base_path / repo_name_;
  return config_.main_repo_path / consts::kWorktreeFolder;
}

std::filesystem::path WorktreeManager::worktree_path(const std::string &name) const {
  return worktree_folder_path() / name;
}

std::filesystem::path WorktreeManager::local_worktree_path() const {
  return worktree_folder_path() / consts::kLocalWorktree;
}

bool WorktreeManager::local_worktree_exists() const { return fs::exists(local_worktree_path()); }

bool WorktreeManager::worktree_exists(const std::string &name) const {
  return fs::exists(worktree_path(name));
}

void WorktreeManager::ensure_worktree_folder_ignored() {
  const std::string pattern = "/" + std::string(consts::kWorktreeFolder) + "/";
  const bool added = git_operations().execute_write(
      config_.main_repo_path, [&](GitClient &git) { return queries::add_to_local_exclude(git, pattern); });
  if (added)
    log_->debug("Excluded worktree folder", {{"pattern", pattern}});
}

std::string WorktreeManager::generate_unique_worktree_name() {
  const auto taken = [&](const std::string &name) {
    if (worktree_exists(name))
      return true;
    return git_operations().execute_read(
        config_.main_repo_path, [&](GitClient &git) { return queries::branch_exists(git, name); });
  };

  std::string name = generate_worktree_name();
  int attempts = 0;
  while (taken(name) && attempts < consts::kMaxNameAttempts) {
    name = generate_worktree_name();
    ++attempts;
  }
  if (attempts >= consts::kMaxNameAttempts)
    name = generate_worktree_name() + "-" + std::to_string(timeutil::now_millis());
  return name;
}

void WorktreeManager::prepare_worktree_folder() {
  if (!uses_external_path()) {
    ensure_worktree_folder_ignored();
    return;
  }
  const auto folder = worktree_folder_path();
  std::error_code ec;
  std::filesystem::create_directories(folder, ec);
  if (ec)
    throw std::runtime_error("mkdir failed: " + folder.string() + ": " + ec.message());
}

WorktreeInfo WorktreeManager::create_worktree(const std::optional<std::string> &base_branch) {
  prepare_worktree_folder();

  const auto name = generate_unique_worktree_name();
  const auto base = base_branch ? *base_branch
                                : git_operations().execute_read(config_.main_repo_path, [](GitClient &git) {
                                    return queries::detect_default_branch(git);
                                  });
  const auto path = worktree_path(name);

  git_operations().execute_write(config_.main_repo_path, [&](GitClient &git) {
    git.raw({"worktree", "add", "--quiet", "-b", name, path.string(), base});
  });
  log_->info("Worktree created", {{"path", path.string()}, {"branch", name}, {"base", base}});

  link_shared_config(path);

  return WorktreeInfo{.worktree_path = path,
                      .worktree_name = name,
                      .branch_name = name,
                      .base_branch = base,
                      .created_at = timeutil::now_iso8601()};
}

WorktreeInfo WorktreeManager::create_worktree_for_existing_branch(const std::string &branch) {
  const bool exists = git_operations().execute_read(
      config_.main_repo_path, [&](GitClient &git) { return queries::branch_exists(git, branch); });
  if (!exists)
    throw std::runtime_error("Branch '" + branch + "' does not exist");

  const auto sanitized = strutil::replace_all(branch, "/", "-");
  std::string name = sanitized;
  if (worktree_exists(name))
    name = sanitized + "-" + std::to_string(timeutil::now_millis());

  prepare_worktree_folder();
  const auto path = worktree_path(name);

  git_operations().execute_write(config_.main_repo_path, [&](GitClient &git) {
    git.raw({"worktree", "add", "--quiet", path.string(), branch});
  });
  log_->info("Worktree created for existing branch", {{"path", path.string()}, {"branch", branch}});

  link_shared_config(path);

  return WorktreeInfo{.worktree_path = path,
                      .worktree_name = name,
                      .branch_name = branch,
                      .base_branch = branch,
                      .created_at = timeutil::now_iso8601()};
}

void WorktreeManager::delete_worktree(const std::filesystem::path &path) {
  check_worktree_deletable(config_.main_repo_path, path);
  const auto target = fs::normalize(path);

  git_operations().execute_write(config_.main_repo_path, [&](GitClient &git) {
    const auto removed = git.run({"worktree", "remove", target.string(), "--force"});
    if (removed.exit_code == 0)
      return;
    log_->warn("git worktree remove failed, deleting directory",
               {{"path", target.string()}, {"error", strutil::trim(removed.err)}});
    std::error_code rm_ec;
    std::filesystem::remove_all(target, rm_ec);
    if (rm_ec)
      throw std::runtime_error("remove failed: " + target.string() + ": " + rm_ec.message());
    git.raw({"worktree", "prune"});
  });
  log_->info("Worktree deleted", {{"path", target.string()}});
}

std::optional<WorktreeInfo> WorktreeManager::get_worktree_info(const std::filesystem::path &path) {
  const auto target = fs::normalize(path);
  for (auto &info : list_worktrees()) {
    if (fs::normalize(info.worktree_path) == target)
      return info;
  }
  return std::nullopt;
}

std::vector<WorktreeInfo> WorktreeManager::list_worktrees() {
  const auto entries = git_operations().execute_read(
      config_.main_repo_path, [](GitClient &git) { return queries::list_worktrees(git); });

  const auto main_repo = fs::normalize(config_.main_repo_path);
  const auto folder = fs::normalize(worktree_folder_path());

  std::vector<WorktreeInfo> out;
  for (const auto &e : entries) {
    if (!e.branch)
      continue;
    const auto p = fs::normalize(e.path);
    if (p == main_repo || p == folder || !fs::is_same_or_ancestor(folder, p))
      continue;
    out.push_back(WorktreeInfo{.worktree_path = e.path,
                               .worktree_name = e.path.filename().string(),
                               .branch_name = *e.branch,
                               .base_branch = {},
                               .created_at = {}});
  }
  return out;
}

CleanupResult
WorktreeManager::cleanup_orphaned_worktrees(const std::vector<std::filesystem::path> &associated_paths) {
  std::unordered_set<std::string> keep;
  for (const auto &p : associated_paths)
    keep.insert(fs::normalize(p).string());

  CleanupResult result;
  for (const auto &wt : list_worktrees()) {
    if (keep.contains(fs::normalize(wt.worktree_path).string()))
      continue;
    try {
      delete_worktree(wt.worktree_path);
      result.deleted.push_back(wt.worktree_path);
    } catch (const std::exception &e) {
      log_->warn("Failed to delete orphaned worktree",
                 {{"path", wt.worktree_path.string()}, {"error", e.what()}});
      result.errors.push_back(CleanupError{.path = wt.worktree_path, .error = e.what()});
    }
  }
  return result;
}

void WorktreeManager::link_shared_config(const std::filesystem::path &worktree) {
  const auto linked = git_operations().execute_write(worktree, [&](GitClient &git) {
    return link_shared_paths(git, config_.main_repo_path, config_.shared_paths);
  });
  for (const auto &link : linked)
    log_->debug("Linked shared config", {{"path", link.string()}});
}

} // namespace gitsaga
