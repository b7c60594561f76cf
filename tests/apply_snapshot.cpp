#include "gitsaga/sagas/apply_snapshot.hpp"

#include "gitsaga/archive.hpp"
#include "gitsaga/fs.hpp"
#include "gitsaga/hash.hpp"
#include "gitsaga/queries.hpp"
#include "test_repo.hpp"

#include <iostream>
#include <memory>

using namespace gitsaga;
using testutil::TempRepo;

namespace {

class MockApiClient : public ApiClient {
public:
  explicit MockApiClient(std::vector<std::uint8_t> payload) : payload_(std::move(payload)) {}

  std::vector<std::uint8_t> download_artifact(const std::string &task_id, const std::string &run_id,
                                              const std::string &archive_url) override {
    ++calls;
    last_task = task_id;
    last_run = run_id;
    last_url = archive_url;
    return payload_;
  }

  int calls = 0;
  std::string last_task;
  std::string last_run;
  std::string last_url;

private:
  std::vector<std::uint8_t> payload_;
};

// Archive holding the remote versions of README.md and src/new.txt
std::vector<std::uint8_t> remote_archive() {
  const auto dir = testutil::make_temp_dir("gitsaga_remote_files");
  testutil::write_file(dir / "README.md", "# remote\n");
  testutil::write_file(dir / "src/new.txt", "added remotely\n");
  auto gz = archive::pack(dir, {"README.md", "src/new.txt"});
  std::filesystem::remove_all(dir);
  return gz;
}

TreeSnapshot make_snapshot(std::optional<std::string> base) {
  return TreeSnapshot{.tree_hash = "4b825dc642cb6eb9a060e54bf8d69288fbee4904",
                      .base_commit = std::move(base),
                      .archive_url = "https://artifacts.example/snapshot.tar.gz",
                      .changes = {{.path = "README.md", .status = FileStatus::Modified},
                                  {.path = "src/new.txt", .status = FileStatus::Added},
                                  {.path = "old.txt", .status = FileStatus::Deleted}},
                      .timestamp = "2026-01-01T00:00:00.000Z",
                      .interrupted = false};
}

// Repository at A (README.md, old.txt); returns A
std::string seed(const TempRepo &repo) {
  repo.write("old.txt", "to be removed\n");
  return repo.commit_all("A");
}

bool applied(const TempRepo &repo) {
  return repo.read("README.md") == "# remote\n" && repo.read("src/new.txt") == "added remotely\n" &&
         !repo.exists("old.txt");
}

std::filesystem::path archive_file(const TempRepo &repo, const TreeSnapshot &s) {
  return repo.path() / ".gitsaga" / "tmp" / (s.tree_hash + ".tar.gz");
}

} // namespace

int main() {
  try {
    const auto payload = remote_archive();

    // 1) Base equal to HEAD: no checkout, files replayed, archive cleaned up
    {
      TempRepo repo("gitsaga_apply_same_base");
      const auto a = seed(repo);
      MockApiClient api(payload);
      auto log = std::make_shared<RecordingLogger>();
      ApplySnapshotSaga saga(repo.path(), log);
      const auto snapshot = make_snapshot(a);
      const auto out = saga.run(
          {.snapshot = snapshot, .api_client = &api, .task_id = "task-1", .run_id = "run-9"});

      if (out.checkout_performed || log->contains("checkout_base")) {
        std::cerr << "same base: checkout was issued\n";
        return 1;
      }
      if (out.tree_hash != snapshot.tree_hash || out.archive_digest != sha1_hex(payload)) {
        std::cerr << "same base: unexpected output\n";
        return 1;
      }
      if (api.calls != 1 || api.last_task != "task-1" || api.last_run != "run-9" ||
          api.last_url != *snapshot.archive_url) {
        std::cerr << "same base: download not forwarded\n";
        return 1;
      }
      if (!applied(repo) || repo.branch() != "main" || repo.head() != a) {
        std::cerr << "same base: working tree not updated in place\n";
        return 1;
      }
      if (std::filesystem::exists(archive_file(repo, snapshot))) {
        std::cerr << "same base: downloaded archive left behind\n";
        return 1;
      }
    }

    // 2) A snapshot without an archive URL is rejected before anything runs
    {
      TempRepo repo("gitsaga_apply_no_url");
      const auto a = seed(repo);
      MockApiClient api(payload);
      ApplySnapshotSaga saga(repo.path());
      auto snapshot = make_snapshot(a);
      snapshot.archive_url.reset();
      try {
        saga.run({.snapshot = snapshot, .api_client = &api, .task_id = "t", .run_id = "r"});
        std::cerr << "no url: expected failure\n";
        return 1;
      } catch (const SagaError &e) {
        if (e.failed_step() != "validate_snapshot" ||
            e.cause() != "Cannot apply snapshot: no archive URL" || e.rollbacks_attempted() != 0) {
          std::cerr << "no url: wrong failure: " << e.what() << "\n";
          return 1;
        }
      }
      if (api.calls != 0) {
        std::cerr << "no url: download attempted\n";
        return 1;
      }
    }

    // 3) An empty download fails the download step
    {
      TempRepo repo("gitsaga_apply_empty");
      const auto a = seed(repo);
      MockApiClient api(std::vector<std::uint8_t>{});
      ApplySnapshotSaga saga(repo.path());
      try {
        saga.run({.snapshot = make_snapshot(a), .api_client = &api, .task_id = "t", .run_id = "r"});
        std::cerr << "empty download: expected failure\n";
        return 1;
      } catch (const SagaError &e) {
        if (e.failed_step() != "download_archive" ||
            e.cause().find("Failed to download archive from") == std::string::npos) {
          std::cerr << "empty download: wrong failure: " << e.what() << "\n";
          return 1;
        }
      }
      if (repo.read("README.md") != "# test\n" || !repo.exists("old.txt")) {
        std::cerr << "empty download: working tree modified\n";
        return 1;
      }
    }

    // 4) Dirty tree with a different base fails before downloading
    {
      TempRepo repo("gitsaga_apply_dirty");
      const auto a = seed(repo);
      repo.write("b.txt", "b\n");
      repo.commit_all("B");
      repo.write("README.md", "# local edit\n");
      MockApiClient api(payload);
      ApplySnapshotSaga saga(repo.path());
      try {
        saga.run({.snapshot = make_snapshot(a), .api_client = &api, .task_id = "t", .run_id = "r"});
        std::cerr << "dirty: expected failure\n";
        return 1;
      } catch (const SagaError &e) {
        if (e.failed_step() != "check_working_tree" ||
            e.cause().find("1 uncommitted change(s)") == std::string::npos) {
          std::cerr << "dirty: wrong failure: " << e.what() << "\n";
          return 1;
        }
      }
      if (api.calls != 0 || repo.read("README.md") != "# local edit\n") {
        std::cerr << "dirty: state changed\n";
        return 1;
      }
    }

    // 5) A corrupt archive after a base checkout rolls HEAD back and removes the download
    {
      TempRepo repo("gitsaga_apply_corrupt");
      const auto a = seed(repo);
      repo.write("b.txt", "b\n");
      const auto b = repo.commit_all("B");
      MockApiClient api(std::vector<std::uint8_t>{'n', 'o', 't', ' ', 'g', 'z'});
      auto log = std::make_shared<RecordingLogger>();
      ApplySnapshotSaga saga(repo.path(), log);
      const auto snapshot = make_snapshot(a);
      try {
        saga.run({.snapshot = snapshot, .api_client = &api, .task_id = "t", .run_id = "r"});
        std::cerr << "corrupt: expected failure\n";
        return 1;
      } catch (const SagaError &e) {
        if (e.failed_step() != "extract_archive" || !e.rollback_failures().empty()) {
          std::cerr << "corrupt: wrong failure: " << e.what() << "\n";
          return 1;
        }
      }
      if (repo.branch() != "main" || repo.head() != b) {
        std::cerr << "corrupt: HEAD not returned to main at B\n";
        return 1;
      }
      if (std::filesystem::exists(archive_file(repo, snapshot))) {
        std::cerr << "corrupt: downloaded archive not removed\n";
        return 1;
      }
      if (!log->contains("detached HEAD")) {
        std::cerr << "corrupt: detached warning missing\n";
        return 1;
      }
    }

    // 6) Different base with no branch there: applied on a detached HEAD
    {
      TempRepo repo("gitsaga_apply_detached");
      const auto a = seed(repo);
      repo.write("b.txt", "b\n");
      repo.commit_all("B");
      MockApiClient api(payload);
      auto log = std::make_shared<RecordingLogger>();
      ApplySnapshotSaga saga(repo.path(), log);
      const auto out =
          saga.run({.snapshot = make_snapshot(a), .api_client = &api, .task_id = "t", .run_id = "r"});
      if (!out.checkout_performed || queries::current_branch(repo.git()) || repo.head() != a) {
        std::cerr << "detached: HEAD not detached at the base commit\n";
        return 1;
      }
      if (log->count(LogLevel::Warn) == 0 ||
          !log->contains("Applied snapshot from different commit - now in detached HEAD state")) {
        std::cerr << "detached: warning missing\n";
        return 1;
      }
      if (!applied(repo) || repo.exists("b.txt")) {
        std::cerr << "detached: working tree not at the snapshot\n";
        return 1;
      }
    }

    // 7) Different base with a branch there: that branch is checked out instead
    {
      TempRepo repo("gitsaga_apply_branch");
      const auto a = seed(repo);
      repo.git_out({"branch", "release", a});
      repo.write("b.txt", "b\n");
      repo.commit_all("B");
      MockApiClient api(payload);
      auto log = std::make_shared<RecordingLogger>();
      ApplySnapshotSaga saga(repo.path(), log);
      const auto out =
          saga.run({.snapshot = make_snapshot(a), .api_client = &api, .task_id = "t", .run_id = "r"});
      if (!out.checkout_performed || repo.branch() != "release" || log->contains("detached HEAD")) {
        std::cerr << "branch: expected release to be checked out\n";
        return 1;
      }
      if (!applied(repo)) {
        std::cerr << "branch: working tree not at the snapshot\n";
        return 1;
      }
    }

    // 8) A deletion that would pass through a symlink planted by the archive is refused
    {
      TempRepo repo("gitsaga_apply_symlink_delete");
      const auto a = seed(repo);
      const auto outside = testutil::make_temp_dir("gitsaga_apply_outside");
      testutil::write_file(outside / "victim.txt", "keep me\n");
      const auto tar = archive::write_tar({{.path = "link",
                                            .type = archive::EntryType::Symlink,
                                            .mode = 0777,
                                            .data = {},
                                            .link_target = outside.string()}});
      MockApiClient api(fs::gzip_compress(tar));
      auto snapshot = make_snapshot(a);
      snapshot.changes = {{.path = "link", .status = FileStatus::Added},
                          {.path = "link/victim.txt", .status = FileStatus::Deleted}};
      ApplySnapshotSaga saga(repo.path());
      bool refused = false;
      try {
        saga.run({.snapshot = snapshot, .api_client = &api, .task_id = "t", .run_id = "r"});
      } catch (const SagaError &e) {
        refused = e.failed_step() == "delete_removed_files" &&
                  e.cause().find("symlink") != std::string::npos;
        if (!refused)
          std::cerr << "symlink delete: wrong failure: " << e.what() << "\n";
      }
      const bool kept = testutil::read_file(outside / "victim.txt") == "keep me\n";
      std::filesystem::remove_all(outside);
      if (!refused || !kept) {
        std::cerr << "symlink delete: file outside the repository was removed\n";
        return 1;
      }
    }

    std::cout << "apply snapshot OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
