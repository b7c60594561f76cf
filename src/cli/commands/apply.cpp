#include "cli/common.hpp"
#include "gitsaga/fs.hpp"
#include "gitsaga/sagas/apply_snapshot.hpp"

#include <iostream>
#include <string>

using namespace gitsaga;

int cmd_apply(int argc, char **argv) {
  auto args = cli::collect_args(argc, argv);
  const auto task = cli::take_option(args, "--task");
  const auto run = cli::take_option(args, "--run");
  if (args.size() != 1) {
    std::cerr << "usage: gitsaga apply <manifest> [--task <id>] [--run <id>]\n";
    return 2;
  }
  try {
    const auto root = cli::repo_root();
    const std::filesystem::path manifest = std::filesystem::absolute(args[0]);
    // Relative archive locations in the manifest are resolved next to it
    FileApiClient api(manifest.parent_path());

    ApplySnapshotSaga saga(root, cli::make_logger(load_settings(root)));
    const auto out = saga.run({.snapshot = parse_snapshot(fs::read_text(manifest)),
                               .api_client = &api,
                               .task_id = task.value_or("local"),
                               .run_id = run.value_or("local")});
    std::cout << "Applied tree " << out.tree_hash << (out.checkout_performed ? " (checked out base)" : "")
              << " sha1:" << out.archive_digest << "\n";
    return 0;
  } catch (const std::exception &e) {
    return cli::report_error("apply", e);
  }
}
