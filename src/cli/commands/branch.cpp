#include "cli/common.hpp"
#include "gitsaga/sagas/branch.hpp"

#include <iostream>
#include <string>

using namespace gitsaga;

int cmd_branch(int argc, char **argv) {
  auto args = cli::collect_args(argc, argv);
  const auto base = cli::take_option(args, "--base");
  if (args.size() != 1) {
    std::cerr << "usage: gitsaga branch <name> [--base <ref>]\n";
    return 2;
  }
  try {
    const auto root = cli::repo_root();
    CreateBranchSaga saga(root, cli::make_logger(load_settings(root)));
    const auto out = saga.run({.branch_name = args[0], .base_branch = base});
    std::cout << "Switched to a new branch '" << out.branch_name << "' (from " << out.base_branch
              << ")\n";
    return 0;
  } catch (const std::exception &e) {
    return cli::report_error("branch", e);
  }
}

int cmd_switch(int argc, char **argv) {
  if (argc != 2) {
    std::cerr << "usage: gitsaga switch <name>\n";
    return 2;
  }
  try {
    const auto root = cli::repo_root();
    SwitchBranchSaga saga(root, cli::make_logger(load_settings(root)));
    const auto out = saga.run({.branch_name = argv[1]});
    std::cout << "Switched from " << out.previous_branch << " to " << out.current_branch << "\n";
    return 0;
  } catch (const std::exception &e) {
    return cli::report_error("switch", e);
  }
}

int cmd_ensure_branch(int argc, char **argv) {
  auto args = cli::collect_args(argc, argv);
  const auto base = cli::take_option(args, "--base");
  if (args.size() != 1) {
    std::cerr << "usage: gitsaga ensure-branch <name> [--base <ref>]\n";
    return 2;
  }
  try {
    const auto root = cli::repo_root();
    CreateOrSwitchBranchSaga saga(root, cli::make_logger(load_settings(root)));
    const auto out = saga.run({.branch_name = args[0], .base_branch = base});
    std::cout << (out.created ? "Created and switched to '" : "Switched to '") << out.branch_name
              << "'\n";
    return 0;
  } catch (const std::exception &e) {
    return cli::report_error("ensure-branch", e);
  }
}

int cmd_reset_default(int argc, char ** /*argv*/) {
  if (argc != 1) {
    std::cerr << "usage: gitsaga reset-default\n";
    return 2;
  }
  try {
    const auto root = cli::repo_root();
    ResetToDefaultBranchSaga saga(root, cli::make_logger(load_settings(root)));
    const auto out = saga.run({});
    if (out.switched)
      std::cout << "Switched from " << out.previous_branch << " to " << out.default_branch << "\n";
    else
      std::cout << "Already on " << out.default_branch << "\n";
    return 0;
  } catch (const std::exception &e) {
    return cli::report_error("reset-default", e);
  }
}
