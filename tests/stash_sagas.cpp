#include "gitsaga/sagas/stash.hpp"

#include "gitsaga/queries.hpp"
#include "test_repo.hpp"

#include <algorithm>
#include <iostream>

using namespace gitsaga;
using testutil::FailAfter;
using testutil::TempRepo;

namespace {

bool contains(const std::vector<std::string> &v, const std::string &s) {
  return std::find(v.begin(), v.end(), s) != v.end();
}

} // namespace

int main() {
  try {
    // 1) Push stashes tracked and untracked changes
    {
      TempRepo repo("gitsaga_stash_push");
      repo.write("README.md", "# edited\n");
      repo.write("extra.txt", "extra\n");
      StashPushSaga saga(repo.path());
      const auto out = saga.run({.message = "wip"});
      if (!out.stash_sha || queries::stash_count(repo.git()) != 1) {
        std::cerr << "push: no stash entry\n";
        return 1;
      }
      if (!queries::status(repo.git()).is_clean() || repo.exists("extra.txt")) {
        std::cerr << "push: tree not clean\n";
        return 1;
      }
      if (repo.git_out({"stash", "list", "-1", "--format=%gs"}).find("wip") == std::string::npos) {
        std::cerr << "push: message not recorded\n";
        return 1;
      }
    }

    // 2) Push on a clean tree reports nothing stashed
    {
      TempRepo repo("gitsaga_stash_push_clean");
      StashPushSaga saga(repo.path());
      const auto out = saga.run({.message = "nothing"});
      if (out.stash_sha || queries::stash_count(repo.git()) != 0) {
        std::cerr << "push clean: unexpected stash\n";
        return 1;
      }
    }

    // 3) Push rollback brings the changes back with the original staging
    {
      TempRepo repo("gitsaga_stash_push_rollback");
      repo.write("staged.txt", "staged\n");
      repo.git_out({"add", "staged.txt"});
      repo.write("README.md", "# unstaged edit\n");
      repo.write("loose.txt", "loose\n");
      FailAfter<StashPushSaga, StashPushInput, StashPushOutput> failing(repo.path());
      try {
        failing.run({.message = "doomed"});
        std::cerr << "push rollback: expected SagaError\n";
        return 1;
      } catch (const SagaError &e) {
        if (!e.rollback_failures().empty()) {
          std::cerr << "push rollback: rollback failures: " << e.what() << "\n";
          return 1;
        }
      }
      const auto st = queries::status(repo.git());
      if (!contains(st.staged, "staged.txt") || !contains(st.modified, "README.md") ||
          !contains(st.untracked, "loose.txt") || contains(st.staged, "README.md")) {
        std::cerr << "push rollback: staging not restored\n";
        return 1;
      }
      if (queries::stash_count(repo.git()) != 0) {
        std::cerr << "push rollback: stash entry left behind\n";
        return 1;
      }
    }

    // 4) Pop restores the top entry; on an empty stash list it fails
    {
      TempRepo repo("gitsaga_stash_pop");
      StashPopSaga saga(repo.path());
      try {
        saga.run({});
        std::cerr << "pop empty: expected failure\n";
        return 1;
      } catch (const SagaError &e) {
        if (e.failed_step() != "get-stash-info" ||
            e.cause().find("No stash entries") == std::string::npos) {
          std::cerr << "pop empty: wrong failure: " << e.what() << "\n";
          return 1;
        }
      }

      repo.write("README.md", "# stashed\n");
      repo.git_out({"stash", "push", "-m", "saved"});
      const auto out = saga.run({});
      if (!out.popped || repo.read("README.md") != "# stashed\n" ||
          queries::stash_count(repo.git()) != 0) {
        std::cerr << "pop: entry not applied and dropped\n";
        return 1;
      }
    }

    // 5) Pop rollback puts the entry back on the stash list and resets the tree
    {
      TempRepo repo("gitsaga_stash_pop_rollback");
      repo.write("README.md", "# stashed\n");
      repo.git_out({"stash", "push", "-m", "keep this"});
      const auto sha = repo.git_out({"rev-parse", "stash@{0}"});

      FailAfter<StashPopSaga, StashPopInput, StashPopOutput> failing(repo.path());
      try {
        failing.run({});
        std::cerr << "pop rollback: expected SagaError\n";
        return 1;
      } catch (const SagaError &e) {
        if (!e.rollback_failures().empty()) {
          std::cerr << "pop rollback: rollback failures: " << e.what() << "\n";
          return 1;
        }
      }
      if (queries::stash_count(repo.git()) != 1 || repo.git_out({"rev-parse", "stash@{0}"}) != sha) {
        std::cerr << "pop rollback: entry not stored back\n";
        return 1;
      }
      if (repo.git_out({"stash", "list", "-1", "--format=%gs"}).find("keep this") ==
          std::string::npos) {
        std::cerr << "pop rollback: message lost\n";
        return 1;
      }
      if (!queries::status(repo.git()).is_clean()) {
        std::cerr << "pop rollback: tree not reset\n";
        return 1;
      }
    }

    // 6) Apply by sha keeps local changes and drops the applied entry
    {
      TempRepo repo("gitsaga_stash_apply");
      repo.write("feature.txt", "from stash\n");
      repo.git_out({"stash", "push", "--include-untracked", "-m", "feature"});
      const auto sha = repo.git_out({"rev-parse", "stash@{0}"});

      repo.write("README.md", "# local edit\n");
      StashApplySaga saga(repo.path());
      const auto out = saga.run({.stash_sha = sha});
      if (!out.dropped || queries::stash_count(repo.git()) != 0) {
        std::cerr << "apply: entry not dropped\n";
        return 1;
      }
      if (repo.read("feature.txt") != "from stash\n" || repo.read("README.md") != "# local edit\n") {
        std::cerr << "apply: changes missing\n";
        return 1;
      }
    }

    // 7) Unknown commit ids are refused before the local changes are touched
    for (const auto *bogus : {"1234567890abcdef1234567890abcdef12345678",
                              "0000000000000000000000000000000000000000"}) {
      TempRepo repo("gitsaga_stash_apply_bad");
      repo.write("parked.txt", "parked\n");
      repo.git_out({"stash", "push", "--include-untracked", "-m", "parked"});
      repo.write("README.md", "# local edit\n");
      StashApplySaga saga(repo.path());
      try {
        saga.run({.stash_sha = bogus});
        std::cerr << "apply bad: expected failure for " << bogus << "\n";
        return 1;
      } catch (const SagaError &e) {
        if (e.failed_step() != "verify-stash" || e.rollbacks_attempted() != 0 ||
            e.cause() != std::string("Stash entry not found: ") + bogus) {
          std::cerr << "apply bad: wrong failure: " << e.what() << "\n";
          return 1;
        }
      }
      if (repo.read("README.md") != "# local edit\n" || repo.exists("parked.txt") ||
          queries::stash_count(repo.git()) != 1) {
        std::cerr << "apply bad: repository state changed\n";
        return 1;
      }
    }

    // 8) A failing apply restores the backed-up local changes
    {
      TempRepo repo("gitsaga_stash_apply_conflict");
      repo.write("README.md", "# stashed edit\n");
      repo.git_out({"stash", "push", "-m", "conflicting"});
      const auto sha = repo.git_out({"rev-parse", "stash@{0}"});
      repo.write("README.md", "# committed edit\n");
      repo.commit_all("diverge");
      repo.write("local.txt", "local\n");
      StashApplySaga saga(repo.path());
      try {
        saga.run({.stash_sha = sha});
        std::cerr << "apply conflict: expected failure\n";
        return 1;
      } catch (const SagaError &e) {
        if (e.failed_step() != "apply-stash" || !e.rollback_failures().empty()) {
          std::cerr << "apply conflict: wrong failure: " << e.what() << "\n";
          return 1;
        }
      }
      if (repo.read("local.txt") != "local\n" || repo.read("README.md") != "# committed edit\n" ||
          queries::stash_count(repo.git()) != 1) {
        std::cerr << "apply conflict: local changes not restored\n";
        return 1;
      }
    }

    std::cout << "stash sagas OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
