#include "cli/common.hpp"
#include "gitsaga/config.hpp"

#include <iostream>
#include <string>

using namespace gitsaga;

int cmd_config(int argc, char **argv) {
  try {
    const auto root = cli::repo_root();
    auto settings = load_settings(root);

    if (argc == 1) {
      std::cout << "file: " << settings_path(root).string() << "\n";
      std::cout << "worktree_base: "
                << (settings.worktree_base_path ? settings.worktree_base_path->string() : "")
                << "\n";
      std::cout << "log_level: " << level_name(settings.log_level) << "\n";
      for (const auto &p : settings.shared_paths)
        std::cout << "shared_path: " << p << "\n";
      return 0;
    }

    const std::string first = argv[1];
    if (first == "--unset" && argc == 3) {
      const std::string key = argv[2];
      if (key == "worktree_base")
        settings.worktree_base_path.reset();
      else if (key == "log_level")
        settings.log_level = LogLevel::Info;
      else if (key == "shared_path")
        settings.shared_paths.clear();
      else {
        std::cerr << "config: unknown key '" << key << "'\n";
        return 2;
      }
    } else if (argc == 3) {
      const std::string value = argv[2];
      if (first == "worktree_base")
        settings.worktree_base_path = std::filesystem::absolute(value);
      else if (first == "log_level")
        settings.log_level = parse_level(value);
      else if (first == "shared_path")
        settings.shared_paths.push_back(value);
      else {
        std::cerr << "config: unknown key '" << first << "'\n";
        return 2;
      }
    } else {
      std::cerr << "usage: gitsaga config [<key> <value> | --unset <key>]\n";
      return 2;
    }

    save_settings(root, settings);
    return 0;
  } catch (const std::exception &e) {
    return cli::report_error("config", e);
  }
}
