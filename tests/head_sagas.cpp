#include "gitsaga/sagas/head.hpp"

#include "gitsaga/queries.hpp"
#include "test_repo.hpp"

#include <iostream>

using namespace gitsaga;
using testutil::FailAfter;
using testutil::TempRepo;

int main() {
  try {
    // 1) Detach records the branch it left; rollback checks it out again
    {
      TempRepo repo("gitsaga_head_detach");
      const auto a = repo.head();
      DetachHeadSaga saga(repo.path());
      const auto out = saga.run({});
      if (!out.previous_branch || *out.previous_branch != "main" || out.head_sha != a) {
        std::cerr << "detach: unexpected output\n";
        return 1;
      }
      if (queries::current_branch(repo.git()).has_value() || repo.head() != a) {
        std::cerr << "detach: HEAD is not detached at A\n";
        return 1;
      }

      repo.git_out({"checkout", "--quiet", "main"});
      FailAfter<DetachHeadSaga, DetachHeadInput, DetachHeadOutput> failing(repo.path());
      try {
        failing.run({});
        std::cerr << "detach rollback: expected SagaError\n";
        return 1;
      } catch (const SagaError &e) {
        if (e.rollback_failed()) {
          std::cerr << "detach rollback: rollback failed: " << e.what() << "\n";
          return 1;
        }
      }
      if (repo.branch() != "main") {
        std::cerr << "detach rollback: not back on main\n";
        return 1;
      }
    }

    // 2) Reattach a new branch at a detached HEAD
    {
      TempRepo repo("gitsaga_head_reattach_new");
      repo.write("b.txt", "b\n");
      const auto b = repo.commit_all("B");
      repo.git_out({"checkout", "--quiet", "--detach", b});

      ReattachBranchSaga saga(repo.path());
      const auto out = saga.run({.branch_name = "rescued"});
      if (!out.created || out.previous_sha || out.head_sha != b) {
        std::cerr << "reattach new: unexpected output\n";
        return 1;
      }
      if (repo.branch() != "rescued" || repo.head() != b) {
        std::cerr << "reattach new: branch not checked out at B\n";
        return 1;
      }
    }

    // 3) Failure after moving an existing branch restores it to its prior commit
    {
      TempRepo repo("gitsaga_head_reattach_rollback");
      const auto x = repo.head();
      repo.git_out({"branch", "work", x});
      repo.write("y.txt", "y\n");
      const auto y = repo.commit_all("Y");
      repo.git_out({"checkout", "--quiet", "--detach", y});

      FailAfter<ReattachBranchSaga, ReattachBranchInput, ReattachBranchOutput> failing(
          repo.path());
      try {
        failing.run({.branch_name = "work"});
        std::cerr << "reattach rollback: expected SagaError\n";
        return 1;
      } catch (const SagaError &e) {
        if (e.failed_step() != "injected-failure" || e.rollback_failed()) {
          std::cerr << "reattach rollback: wrong error: " << e.what() << "\n";
          return 1;
        }
      }
      if (repo.git_out({"rev-parse", "work"}) != x) {
        std::cerr << "reattach rollback: branch not restored to X\n";
        return 1;
      }
      if (queries::current_branch(repo.git()).has_value() || repo.head() != y) {
        std::cerr << "reattach rollback: HEAD not detached at Y\n";
        return 1;
      }
    }

    // 4) Failure after creating the branch removes it again
    {
      TempRepo repo("gitsaga_head_reattach_created");
      const auto a = repo.head();
      FailAfter<ReattachBranchSaga, ReattachBranchInput, ReattachBranchOutput> failing(
          repo.path());
      try {
        failing.run({.branch_name = "temp"});
        std::cerr << "reattach created: expected SagaError\n";
        return 1;
      } catch (const SagaError &) {
        // expected
      }
      if (queries::branch_exists(repo.git(), "temp") || repo.branch() != "main" ||
          repo.head() != a) {
        std::cerr << "reattach created: state not restored\n";
        return 1;
      }
    }

    std::cout << "head sagas OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
