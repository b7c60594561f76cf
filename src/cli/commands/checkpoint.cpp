#include "cli/common.hpp"
#include "gitsaga/git_client.hpp"
#include "gitsaga/sagas/checkpoint.hpp"

#include <iostream>
#include <string>

using namespace gitsaga;

namespace {

int usage() {
  std::cerr << "usage: gitsaga checkpoint capture [id]\n"
               "       gitsaga checkpoint revert <id>\n"
               "       gitsaga checkpoint diff <from> [to|current]\n"
               "       gitsaga checkpoint list\n"
               "       gitsaga checkpoint delete <id>\n";
  return 2;
}

} // namespace

int cmd_checkpoint(int argc, char **argv) {
  if (argc < 2)
    return usage();
  const std::string sub = argv[1];
  try {
    const auto root = cli::repo_root();
    if (sub == "capture" && argc <= 3) {
      CaptureCheckpointSaga saga(root, cli::make_logger(load_settings(root)));
      CaptureCheckpointInput input;
      if (argc == 3)
        input.checkpoint_id = argv[2];
      const auto out = saga.run(input);
      std::cout << out.checkpoint_id << "\t" << out.commit << "\n";
      return 0;
    }
    if (sub == "revert" && argc == 3) {
      RevertCheckpointSaga saga(root, cli::make_logger(load_settings(root)));
      const auto out = saga.run({.checkpoint_id = argv[2]});
      std::cout << "Restored " << out.checkpoint_id << " (" << out.branch.value_or("detached")
                << ")\n";
      return 0;
    }
    if (sub == "diff" && (argc == 3 || argc == 4)) {
      DiffCheckpointSaga saga(root, cli::make_logger(load_settings(root)));
      DiffCheckpointInput input{.from = argv[2]};
      if (argc == 4)
        input.to = argv[3];
      std::cout << saga.run(input).diff;
      return 0;
    }
    if (sub == "list" && argc == 2) {
      for (const auto &cp : list_checkpoints(GitClient(root)))
        std::cout << cp.checkpoint_id << "\t" << cp.meta.timestamp.value_or("-") << "\t"
                  << cp.meta.branch.value_or("(detached)") << "\t" << cp.commit << "\n";
      return 0;
    }
    if (sub == "delete" && argc == 3) {
      delete_checkpoint(GitClient(root), argv[2]);
      std::cout << "Deleted " << argv[2] << "\n";
      return 0;
    }
  } catch (const std::exception &e) {
    return cli::report_error("checkpoint", e);
  }
  return usage();
}
