#include "gitsaga/sagas/clean.hpp"

#include "gitsaga/queries.hpp"
#include "test_repo.hpp"

#include <algorithm>
#include <iostream>
#include <memory>

using namespace gitsaga;
using testutil::FailAfter;
using testutil::TempRepo;

namespace {

bool contains(const std::vector<std::string> &v, const std::string &s) {
  return std::find(v.begin(), v.end(), s) != v.end();
}

// staged.txt staged, README.md modified, scratch/new.txt untracked
void make_dirty(const TempRepo &repo) {
  repo.write("staged.txt", "staged\n");
  repo.git_out({"add", "staged.txt"});
  repo.write("README.md", "# modified\n");
  repo.write("scratch/new.txt", "untracked\n");
}

} // namespace

int main() {
  try {
    // 1) A clean tree is left alone
    {
      TempRepo repo("gitsaga_clean_noop");
      auto log = std::make_shared<RecordingLogger>();
      CleanWorkingTreeSaga saga(repo.path(), log);
      const auto out = saga.run({});
      if (out.backup_created || out.stash_sha) {
        std::cerr << "noop: backup created for a clean tree\n";
        return 1;
      }
      if (log->contains("backup-changes") || queries::stash_count(repo.git()) != 0) {
        std::cerr << "noop: mutating steps ran\n";
        return 1;
      }
    }

    // 2) Staged, modified and untracked changes are all discarded and kept in a backup stash
    {
      TempRepo repo("gitsaga_clean_dirty");
      make_dirty(repo);
      CleanWorkingTreeSaga saga(repo.path());
      const auto out = saga.run({});
      if (!out.backup_created || !out.stash_sha) {
        std::cerr << "dirty: no backup reported\n";
        return 1;
      }
      if (!queries::status(repo.git()).is_clean()) {
        std::cerr << "dirty: tree not clean afterwards\n";
        return 1;
      }
      if (repo.exists("staged.txt") || repo.exists("scratch/new.txt") ||
          repo.read("README.md") != "# test\n") {
        std::cerr << "dirty: working tree files not reset\n";
        return 1;
      }
      if (queries::stash_count(repo.git()) != 1 ||
          repo.git_out({"rev-parse", "stash@{0}"}) != *out.stash_sha) {
        std::cerr << "dirty: backup stash missing\n";
        return 1;
      }
    }

    // 3) Failure after the clean restores every change from the backup
    {
      TempRepo repo("gitsaga_clean_rollback");
      make_dirty(repo);
      FailAfter<CleanWorkingTreeSaga, CleanWorkingTreeInput, CleanWorkingTreeOutput> failing(
          repo.path());
      try {
        failing.run({});
        std::cerr << "rollback: expected SagaError\n";
        return 1;
      } catch (const SagaError &e) {
        if (!e.rollback_failures().empty()) {
          std::cerr << "rollback: rollback failures: " << e.what() << "\n";
          return 1;
        }
      }
      const auto st = queries::status(repo.git());
      if (!contains(st.staged, "staged.txt") || !contains(st.modified, "README.md")) {
        std::cerr << "rollback: staged or modified change lost\n";
        return 1;
      }
      if (repo.read("scratch/new.txt") != "untracked\n" ||
          repo.read("README.md") != "# modified\n") {
        std::cerr << "rollback: file contents not restored\n";
        return 1;
      }
      if (queries::stash_count(repo.git()) != 0) {
        std::cerr << "rollback: backup stash left behind\n";
        return 1;
      }
    }

    std::cout << "clean saga OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
