#pragma once
#include "gitsaga/logger.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gitsaga {

struct Settings {
  std::optional<std::filesystem::path> worktree_base_path;
  LogLevel log_level = LogLevel::Info;
  std::vector<std::string> shared_paths; // empty: editor defaults
};

// $GITSAGA_CONFIG when set, else <repo>/.git/gitsaga.conf
std::filesystem::path settings_path(const std::filesystem::path &repo_root);

// Defaults when the file is missing; throws on an unknown key or a bad log level.
Settings load_settings(const std::filesystem::path &repo_root);

// Overwrite the settings file
void save_settings(const std::filesystem::path &repo_root, const Settings &settings);

} // namespace gitsaga
