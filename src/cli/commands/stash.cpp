#include "cli/common.hpp"
#include "gitsaga/sagas/stash.hpp"

#include <iostream>
#include <string>

using namespace gitsaga;

int cmd_stash_push(int argc, char **argv) {
  auto args = cli::collect_args(argc, argv);
  auto message = cli::take_option(args, "-m");
  if (!message)
    message = cli::take_option(args, "--message");
  if (!args.empty()) {
    std::cerr << "usage: gitsaga stash-push [-m <message>]\n";
    return 2;
  }
  try {
    const auto root = cli::repo_root();
    StashPushSaga saga(root, cli::make_logger(load_settings(root)));
    const auto out = saga.run({.message = message.value_or("gitsaga stash")});
    if (out.stash_sha)
      std::cout << "Saved working tree as " << *out.stash_sha << "\n";
    else
      std::cout << "No local changes to save\n";
    return 0;
  } catch (const std::exception &e) {
    return cli::report_error("stash-push", e);
  }
}

int cmd_stash_pop(int argc, char ** /*argv*/) {
  if (argc != 1) {
    std::cerr << "usage: gitsaga stash-pop\n";
    return 2;
  }
  try {
    const auto root = cli::repo_root();
    StashPopSaga saga(root, cli::make_logger(load_settings(root)));
    saga.run({});
    std::cout << "Popped stash@{0}\n";
    return 0;
  } catch (const std::exception &e) {
    return cli::report_error("stash-pop", e);
  }
}

int cmd_stash_apply(int argc, char **argv) {
  if (argc != 2) {
    std::cerr << "usage: gitsaga stash-apply <stash-sha>\n";
    return 2;
  }
  try {
    const auto root = cli::repo_root();
    StashApplySaga saga(root, cli::make_logger(load_settings(root)));
    const auto out = saga.run({.stash_sha = argv[1]});
    std::cout << "Applied " << argv[1] << (out.dropped ? " and dropped it" : "") << "\n";
    return 0;
  } catch (const std::exception &e) {
    return cli::report_error("stash-apply", e);
  }
}
