#include "gitsaga/config.hpp"

#include "gitsaga/consts.hpp"
#include "gitsaga/fs.hpp"
#include "gitsaga/util.hpp"

#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace gitsaga {

std::filesystem::path settings_path(const std::filesystem::path &repo_root) {
  const std::string env_name(consts::kSettingsEnv);
  if (const char *env = std::getenv(env_name.c_str()); env != nullptr && *env != '\0')
    return env;
  return repo_root / consts::kGitDir / consts::kSettingsFile;
}

auto load_settings(const std::filesystem::path &repo_root) -> Settings {
  Settings out{};
  const auto path = settings_path(repo_root);
  if (!fs::exists(path))
    return out;

  std::istringstream iss(fs::read_text(path));

  constexpr std::string_view k_worktree_base = "worktree_base";
  constexpr std::string_view k_log_level = "log_level";
  constexpr std::string_view k_shared_path = "shared_path";

  std::string line;
  int lineno = 0;
  while (std::getline(iss, line)) {
    ++lineno;
    const auto sv = strutil::trim(line);
    if (sv.empty() || sv[0] == '#')
      continue; // allow comments
    const auto colon = sv.find(':');
    if (colon == std::string::npos)
      throw std::runtime_error(path.string() + ":" + std::to_string(lineno) + ": expected 'key: value'");
    const auto key = strutil::trim(std::string_view(sv).substr(0, colon));
    const auto value = strutil::trim(std::string_view(sv).substr(colon + 1));

    if (key == k_worktree_base) {
      if (value.empty())
        out.worktree_base_path.reset();
      else
        out.worktree_base_path = value;
    } else if (key == k_log_level) {
      out.log_level = parse_level(value);
    } else if (key == k_shared_path) {
      if (!value.empty())
        out.shared_paths.push_back(value);
    } else {
      throw std::runtime_error(path.string() + ":" + std::to_string(lineno) + ": unknown key '" +
                               key + "'");
    }
  }
  return out;
}

void save_settings(const std::filesystem::path &repo_root, const Settings &settings) {
  std::ostringstream os;
  if (settings.worktree_base_path)
    os << "worktree_base: " << settings.worktree_base_path->string() << '\n';
  os << "log_level: " << level_name(settings.log_level) << '\n';
  for (const auto &p : settings.shared_paths)
    os << "shared_path: " << p << '\n';

  fs::write_text_atomic(settings_path(repo_root), os.str());
}

} // namespace gitsaga
