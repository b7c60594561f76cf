#include "gitsaga/sagas/tree.hpp"

#include "gitsaga/archive.hpp"
#include "gitsaga/fs.hpp"
#include "gitsaga/queries.hpp"
#include "test_repo.hpp"

#include <algorithm>
#include <iostream>

using namespace gitsaga;
using testutil::FailAfter;
using testutil::TempRepo;

namespace {

std::optional<FileStatus> status_of(const std::vector<FileChange> &changes, const std::string &path) {
  for (const auto &c : changes) {
    if (c.path == path)
      return c.status;
  }
  return std::nullopt;
}

bool no_temp_index(const TempRepo &repo) {
  const auto dir = repo.path() / ".git" / "gitsaga-tmp";
  return !std::filesystem::exists(dir) || std::filesystem::is_empty(dir);
}

} // namespace

int main() {
  const auto scratch = testutil::make_temp_dir("gitsaga_capture_out");
  int rc = 0;
  try {
    TempRepo repo("gitsaga_capture");
    repo.write("gone.txt", "bye\n");
    const auto base = repo.commit_all("base");

    repo.write("README.md", "# captured\n");
    repo.write("dir/new.txt", "fresh\n");
    std::filesystem::remove(repo.path() / "gone.txt");
    repo.git_out({"add", "README.md"}); // real index state must survive the capture

    // 1) Capture records the tree and changes without touching the real index
    const auto archive_path = scratch / "snap.tar.gz";
    CaptureTreeSaga capture(repo.path());
    const auto out = capture.run({.last_tree_hash = std::nullopt, .archive_path = archive_path});
    if (!out.changed || !out.snapshot || out.archive_path != archive_path) {
      std::cerr << "capture: no snapshot produced\n";
      return 1;
    }
    const auto &snap = *out.snapshot;
    if (snap.base_commit != base || snap.tree_hash.size() != 40 || snap.archive_url != archive_path.string()) {
      std::cerr << "capture: unexpected snapshot header\n";
      rc = 1;
    }
    if (snap.changes.size() != 3 || status_of(snap.changes, "README.md") != FileStatus::Modified ||
        status_of(snap.changes, "dir/new.txt") != FileStatus::Added ||
        status_of(snap.changes, "gone.txt") != FileStatus::Deleted) {
      std::cerr << "capture: unexpected changes\n";
      rc = 1;
    }
    const auto st = queries::status(repo.git());
    if (st.staged != std::vector<std::string>{"README.md"} ||
        st.untracked != std::vector<std::string>{"dir/new.txt"} ||
        st.deleted != std::vector<std::string>{"gone.txt"}) {
      std::cerr << "capture: real index was modified\n";
      rc = 1;
    }
    if (!no_temp_index(repo)) {
      std::cerr << "capture: temporary index left behind\n";
      rc = 1;
    }
    const auto entries = archive::read_tar(fs::gzip_decompress(fs::read_file(archive_path)));
    std::vector<std::string> archived;
    for (const auto &e : entries)
      archived.push_back(e.path);
    std::ranges::sort(archived);
    if (archived != std::vector<std::string>{"README.md", "dir/new.txt"}) {
      std::cerr << "capture: archive holds the wrong files\n";
      rc = 1;
    }

    // 2) The same tree again reports no change
    const auto again = capture.run({.last_tree_hash = snap.tree_hash, .archive_path = std::nullopt});
    if (again.changed || again.snapshot || !no_temp_index(repo)) {
      std::cerr << "capture: unchanged tree reported as changed\n";
      rc = 1;
    }

    // 3) The tree object is readable
    ReadTreeSaga read(repo.path());
    auto files = read.run({.tree_hash = snap.tree_hash}).files;
    std::ranges::sort(files);
    if (files != std::vector<std::string>{"README.md", "dir/new.txt"}) {
      std::cerr << "read tree: unexpected file list\n";
      rc = 1;
    }

    // 4) The manifest text keeps every field
    const auto parsed = parse_snapshot(format_snapshot(snap));
    if (parsed.tree_hash != snap.tree_hash || parsed.base_commit != snap.base_commit ||
        parsed.archive_url != snap.archive_url || parsed.timestamp != snap.timestamp ||
        parsed.changes.size() != snap.changes.size()) {
      std::cerr << "manifest: fields lost\n";
      rc = 1;
    }
    try {
      (void)parse_snapshot("base: abc\n");
      std::cerr << "manifest: missing tree accepted\n";
      rc = 1;
    } catch (const std::runtime_error &) {
      // expected
    }

    // 5) Replay the capture onto a clone of the base commit
    const auto clone_dir = scratch / "clone";
    GitClient(scratch).raw({"clone", "--quiet", repo.path().string(), clone_dir.string()});
    GitClient clone(clone_dir);
    clone.raw({"checkout", "--quiet", "--detach", base});
    const ApplyTreeInput apply_input{.tree_hash = snap.tree_hash,
                                     .base_commit = snap.base_commit,
                                     .changes = snap.changes,
                                     .archive_path = archive_path};

    FailAfter<ApplyTreeSaga, ApplyTreeInput, ApplyTreeOutput> failing(clone_dir);
    try {
      failing.run(apply_input);
      std::cerr << "apply tree rollback: expected SagaError\n";
      rc = 1;
    } catch (const SagaError &e) {
      if (!e.rollback_failures().empty()) {
        std::cerr << "apply tree rollback: rollback failures: " << e.what() << "\n";
        rc = 1;
      }
    }
    if (testutil::read_file(clone_dir / "README.md") != "# test\n" ||
        std::filesystem::exists(clone_dir / "dir/new.txt") ||
        testutil::read_file(clone_dir / "gone.txt") != "bye\n") {
      std::cerr << "apply tree rollback: clone not restored\n";
      rc = 1;
    }

    ApplyTreeSaga apply(clone_dir);
    const auto applied = apply.run(apply_input);
    if (applied.checkout_performed || applied.tree_hash != snap.tree_hash) {
      std::cerr << "apply tree: unexpected output\n";
      rc = 1;
    }
    if (testutil::read_file(clone_dir / "README.md") != "# captured\n" ||
        testutil::read_file(clone_dir / "dir/new.txt") != "fresh\n" ||
        std::filesystem::exists(clone_dir / "gone.txt")) {
      std::cerr << "apply tree: clone does not match the capture\n";
      rc = 1;
    }
    clone.raw({"add", "-A"});
    if (strutil::trim(clone.raw({"write-tree"})) != snap.tree_hash) {
      std::cerr << "apply tree: resulting tree hash differs\n";
      rc = 1;
    }

    // 6) Deleting through a symlink the archive just created is refused and undone
    {
      TempRepo target("gitsaga_apply_tree_symlink");
      const auto outside = scratch / "outside";
      testutil::write_file(outside / "victim.txt", "keep me\n");
      const auto link_archive = scratch / "link.tar.gz";
      fs::write_file_atomic(link_archive,
                            fs::gzip_compress(archive::write_tar({{.path = "link",
                                                                   .type = archive::EntryType::Symlink,
                                                                   .mode = 0777,
                                                                   .data = {},
                                                                   .link_target = outside.string()}})));
      ApplyTreeSaga saga(target.path());
      try {
        saga.run({.tree_hash = "4b825dc642cb6eb9a060e54bf8d69288fbee4904",
                  .base_commit = std::nullopt,
                  .changes = {{.path = "link", .status = FileStatus::Added},
                              {.path = "link/victim.txt", .status = FileStatus::Deleted}},
                  .archive_path = link_archive});
        std::cerr << "apply tree symlink: expected SagaError\n";
        rc = 1;
      } catch (const SagaError &e) {
        if (e.failed_step() != "backup_link/victim.txt" || !e.rollback_failures().empty()) {
          std::cerr << "apply tree symlink: wrong failure: " << e.what() << "\n";
          rc = 1;
        }
      }
      if (testutil::read_file(outside / "victim.txt") != "keep me\n" || target.exists("link")) {
        std::cerr << "apply tree symlink: outside file touched or link left behind\n";
        rc = 1;
      }
    }

    // 7) A repository without commits reports every file as added
    {
      TempRepo unborn("gitsaga_capture_unborn", false);
      unborn.write("first.txt", "1\n");
      CaptureTreeSaga first(unborn.path());
      const auto res = first.run({.last_tree_hash = std::nullopt, .archive_path = std::nullopt});
      if (!res.snapshot || res.snapshot->base_commit ||
          status_of(res.snapshot->changes, "first.txt") != FileStatus::Added || res.archive_path) {
        std::cerr << "unborn: unexpected capture\n";
        rc = 1;
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    rc = 1;
  }

  std::filesystem::remove_all(scratch);
  if (rc == 0)
    std::cout << "capture tree OK\n";
  return rc;
}
