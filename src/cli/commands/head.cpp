#include "cli/common.hpp"
#include "gitsaga/sagas/head.hpp"

#include <iostream>

using namespace gitsaga;

int cmd_detach(int argc, char ** /*argv*/) {
  if (argc != 1) {
    std::cerr << "usage: gitsaga detach\n";
    return 2;
  }
  try {
    const auto root = cli::repo_root();
    DetachHeadSaga saga(root, cli::make_logger(load_settings(root)));
    const auto out = saga.run({});
    std::cout << "HEAD detached at " << out.head_sha.substr(0, 7);
    if (out.previous_branch)
      std::cout << " (was on " << *out.previous_branch << ")";
    std::cout << "\n";
    return 0;
  } catch (const std::exception &e) {
    return cli::report_error("detach", e);
  }
}

int cmd_reattach(int argc, char **argv) {
  if (argc != 2) {
    std::cerr << "usage: gitsaga reattach <branch>\n";
    return 2;
  }
  try {
    const auto root = cli::repo_root();
    ReattachBranchSaga saga(root, cli::make_logger(load_settings(root)));
    const auto out = saga.run({.branch_name = argv[1]});
    std::cout << (out.created ? "Created " : "Reset ") << out.branch_name << " at "
              << out.head_sha.substr(0, 7);
    if (out.previous_sha)
      std::cout << " (was " << out.previous_sha->substr(0, 7) << ")";
    std::cout << "\n";
    return 0;
  } catch (const std::exception &e) {
    return cli::report_error("reattach", e);
  }
}
