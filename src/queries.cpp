#include "gitsaga/queries.hpp"

#include "gitsaga/consts.hpp"
#include "gitsaga/fs.hpp"
#include "gitsaga/util.hpp"

#include <stdexcept>

namespace gitsaga::queries {

namespace {

std::string heads_ref(std::string_view branch) {
  return std::string(consts::kHeadsPrefix) + std::string(branch);
}

bool contains_line(std::string_view content, std::string_view line) {
  for (const auto &l : strutil::split_lines(content)) {
    if (strutil::trim(l) == line)
      return true;
  }
  return false;
}

} // namespace

HeadState head_state(const GitClient &git) {
  return HeadState{.branch = current_branch(git), .sha = head_sha(git)};
}

std::optional<std::string> current_branch(const GitClient &git) {
  const auto result = git.run({"symbolic-ref", "--quiet", "--short", "HEAD"});
  if (result.exit_code != 0)
    return std::nullopt;
  auto name = strutil::trim(result.out);
  if (name.empty())
    return std::nullopt;
  return name;
}

std::optional<std::string> head_sha(const GitClient &git) {
  const auto result = git.run({"rev-parse", "--verify", "--quiet", "HEAD"});
  if (result.exit_code != 0)
    return std::nullopt;
  return strutil::trim(result.out);
}

bool branch_exists(const GitClient &git, std::string_view branch) {
  return branch_sha(git, branch).has_value();
}

std::optional<std::string> branch_sha(const GitClient &git, std::string_view branch) {
  const auto result = git.run({"rev-parse", "--verify", "--quiet", heads_ref(branch) + "^{commit}"});
  if (result.exit_code != 0)
    return std::nullopt;
  return strutil::trim(result.out);
}

std::vector<std::string> branches_pointing_at(const GitClient &git, std::string_view sha) {
  const auto out = git.raw(
      {"for-each-ref", "--points-at", std::string(sha), "--format=%(refname:short)", "refs/heads"});
  std::vector<std::string> names;
  for (auto &line : strutil::split_lines(out)) {
    auto name = strutil::trim(line);
    if (!name.empty())
      names.push_back(std::move(name));
  }
  return names;
}

std::string detect_default_branch(const GitClient &git) {
  const auto remote = git.run({"symbolic-ref", std::string(consts::kRemoteHeadRef)});
  if (remote.exit_code == 0) {
    auto ref = strutil::trim(remote.out);
    if (ref.starts_with(consts::kRemotePrefix))
      ref = ref.substr(consts::kRemotePrefix.size());
    if (!ref.empty())
      return ref;
  }
  if (branch_exists(git, consts::kMainBranch))
    return std::string(consts::kMainBranch);
  if (branch_exists(git, consts::kMasterBranch))
    return std::string(consts::kMasterBranch);
  throw std::runtime_error("Cannot determine default branch");
}

GitStatus parse_porcelain_status(std::string_view porcelain_z) {
  GitStatus st;
  std::size_t pos = 0;
  while (pos < porcelain_z.size()) {
    const auto end = porcelain_z.find('\0', pos);
    const auto entry = porcelain_z.substr(pos, end == std::string_view::npos ? std::string_view::npos
                                                                              : end - pos);
    pos = end == std::string_view::npos ? porcelain_z.size() : end + 1;
    if (entry.size() < 4)
      continue;
    const char x = entry[0];
    const char y = entry[1];
    std::string path(entry.substr(3));
    // Renames and copies carry the source path as the next NUL-terminated field
    if (x == 'R' || x == 'C') {
      const auto next = porcelain_z.find('\0', pos);
      pos = next == std::string_view::npos ? porcelain_z.size() : next + 1;
    }
    if (x == '?' && y == '?') {
      st.untracked.push_back(std::move(path));
      continue;
    }
    if (x == '!')
      continue;
    if (x != ' ')
      st.staged.push_back(path);
    if (y == 'M' || y == 'T')
      st.modified.push_back(path);
    else if (y == 'D')
      st.deleted.push_back(path);
  }
  return st;
}

GitStatus status(const GitClient &git) {
  return parse_porcelain_status(git.raw({"status", "--porcelain=v1", "-z", "--untracked-files=all"}));
}

std::size_t stash_count(const GitClient &git) {
  const auto out = git.raw({"stash", "list", "--format=%H"});
  std::size_t n = 0;
  for (const auto &line : strutil::split_lines(out)) {
    if (!strutil::trim(line).empty())
      ++n;
  }
  return n;
}

std::filesystem::path resolve_git_dir(const GitClient &git) {
  const std::filesystem::path dir = git.rev_parse({"--git-dir"});
  if (dir.is_absolute())
    return dir;
  return (git.base_dir() / dir).lexically_normal();
}

std::filesystem::path resolve_common_git_dir(const GitClient &git) {
  const std::filesystem::path dir = git.rev_parse({"--git-common-dir"});
  if (dir.is_absolute())
    return dir;
  return (git.base_dir() / dir).lexically_normal();
}

std::filesystem::path git_path(const GitClient &git, std::string_view name) {
  const std::filesystem::path p = git.rev_parse({"--git-path", std::string(name)});
  if (p.is_absolute())
    return p;
  return (git.base_dir() / p).lexically_normal();
}

bool add_to_local_exclude(const GitClient &git, std::string_view pattern) {
  // info/exclude lives in the common git dir, which linked worktrees share
  const auto exclude =
      git_path(git, std::string(consts::kInfoDir) + "/" + std::string(consts::kExcludeFile));
  std::string content;
  if (fs::exists(exclude))
    content = fs::read_text(exclude);

  std::string bare(pattern);
  while (bare.starts_with('/'))
    bare.erase(0, 1);
  if (contains_line(content, pattern) || contains_line(content, bare) ||
      contains_line(content, "/" + bare))
    return false;

  std::string trimmed = content;
  while (!trimmed.empty() && (trimmed.back() == '\n' || trimmed.back() == '\r' ||
                              trimmed.back() == ' ' || trimmed.back() == '\t'))
    trimmed.pop_back();
  const std::string updated =
      trimmed.empty() ? std::string(pattern) + "\n" : trimmed + "\n" + std::string(pattern) + "\n";
  fs::write_text_atomic(exclude, updated);
  return true;
}

std::vector<WorktreeListEntry> parse_worktree_list(std::string_view porcelain) {
  std::vector<WorktreeListEntry> out;
  std::optional<WorktreeListEntry> current;
  for (const auto &line : strutil::split_lines(porcelain)) {
    if (line.starts_with("worktree ")) {
      if (current)
        out.push_back(std::move(*current));
      current = WorktreeListEntry{.path = line.substr(9), .head = {}, .branch = std::nullopt};
    } else if (!current) {
      continue;
    } else if (line.starts_with("HEAD ")) {
      current->head = line.substr(5);
    } else if (line.starts_with("branch ")) {
      auto ref = line.substr(7);
      if (ref.starts_with(consts::kHeadsPrefix))
        ref = ref.substr(consts::kHeadsPrefix.size());
      current->branch = ref;
    } else if (line == "detached") {
      current->branch = std::nullopt;
    }
  }
  if (current)
    out.push_back(std::move(*current));
  return out;
}

std::vector<WorktreeListEntry> list_worktrees(const GitClient &git) {
  return parse_worktree_list(git.raw({"worktree", "list", "--porcelain"}));
}

} // namespace gitsaga::queries
