#include "gitsaga/config.hpp"

#include "test_repo.hpp"

#include <cstdlib>
#include <iostream>

using namespace gitsaga;

int main() {
  const auto dir = testutil::make_temp_dir("gitsaga_settings");
  const auto file = dir / "gitsaga.conf";
  ::setenv("GITSAGA_CONFIG", file.c_str(), 1);

  int rc = 0;
  try {
    if (settings_path(dir) != file) {
      std::cerr << "path: environment override ignored\n";
      rc = 1;
    }

    // Missing file gives the defaults
    const auto defaults = load_settings(dir);
    if (defaults.worktree_base_path || defaults.log_level != LogLevel::Info ||
        !defaults.shared_paths.empty()) {
      std::cerr << "defaults: unexpected values\n";
      rc = 1;
    }

    Settings s;
    s.worktree_base_path = dir / "worktrees";
    s.log_level = LogLevel::Debug;
    s.shared_paths = {".vscode", ".env.local"};
    save_settings(dir, s);

    const auto loaded = load_settings(dir);
    if (loaded.worktree_base_path != s.worktree_base_path || loaded.log_level != LogLevel::Debug ||
        loaded.shared_paths != s.shared_paths) {
      std::cerr << "save/load: values differ\n";
      rc = 1;
    }

    testutil::write_file(file, "# comment\n\nlog_level: warning\n");
    if (load_settings(dir).log_level != LogLevel::Warn) {
      std::cerr << "parse: comment or alias not handled\n";
      rc = 1;
    }

    const std::vector<std::string> bad{"colour: blue\n", "log_level: loud\n", "just a line\n"};
    for (const auto &content : bad) {
      testutil::write_file(file, content);
      try {
        (void)load_settings(dir);
        std::cerr << "parse: accepted '" << content << "'\n";
        rc = 1;
      } catch (const std::exception &) {
        // expected
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    rc = 1;
  }

  ::unsetenv("GITSAGA_CONFIG");
  std::filesystem::remove_all(dir);
  if (rc == 0)
    std::cout << "settings OK\n";
  return rc;
}
