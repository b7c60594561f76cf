#include "cli/common.hpp"
#include "gitsaga/fs.hpp"
#include "gitsaga/sagas/tree.hpp"

#include <iostream>
#include <string>

using namespace gitsaga;

int cmd_capture(int argc, char **argv) {
  auto args = cli::collect_args(argc, argv);
  const auto last = cli::take_option(args, "--last");
  const auto archive = cli::take_option(args, "--archive");
  const auto manifest = cli::take_option(args, "-o");
  if (!args.empty()) {
    std::cerr << "usage: gitsaga capture [--last <tree>] [--archive <file>] [-o <manifest>]\n";
    return 2;
  }
  try {
    const auto root = cli::repo_root();
    CaptureTreeSaga saga(root, cli::make_logger(load_settings(root)));

    CaptureTreeInput input{.last_tree_hash = last, .archive_path = std::nullopt};
    if (archive)
      input.archive_path = std::filesystem::absolute(*archive);

    const auto out = saga.run(input);
    if (!out.changed || !out.snapshot) {
      std::cout << "No changes since " << last.value_or("last capture") << "\n";
      return 0;
    }

    const auto text = format_snapshot(*out.snapshot);
    if (manifest) {
      fs::write_text_atomic(*manifest, text);
      std::cout << "Captured " << out.snapshot->tree_hash << " ("
                << out.snapshot->changes.size() << " changes) -> " << *manifest << "\n";
    } else {
      std::cout << text;
    }
    return 0;
  } catch (const std::exception &e) {
    return cli::report_error("capture", e);
  }
}
