#include "cli/common.hpp"
#include "gitsaga/sagas/clean.hpp"

#include <iostream>

using namespace gitsaga;

int cmd_clean(int argc, char ** /*argv*/) {
  if (argc != 1) {
    std::cerr << "usage: gitsaga clean\n";
    return 2;
  }
  try {
    const auto root = cli::repo_root();
    CleanWorkingTreeSaga saga(root, cli::make_logger(load_settings(root)));
    const auto out = saga.run({});
    if (!out.backup_created) {
      std::cout << "Working tree already clean\n";
      return 0;
    }
    std::cout << "Working tree cleaned; backup stash " << out.stash_sha.value_or("?") << "\n";
    return 0;
  } catch (const std::exception &e) {
    return cli::report_error("clean", e);
  }
}
