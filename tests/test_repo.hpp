#pragma once
#include "gitsaga/git_client.hpp"
#include "gitsaga/saga.hpp"
#include "gitsaga/util.hpp"

#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace testutil {

namespace fs = std::filesystem;

inline fs::path make_temp_dir(std::string_view prefix) {
  const fs::path dir = fs::temp_directory_path() /
                       (std::string(prefix) + "_" + std::to_string(std::random_device{}()));
  fs::create_directories(dir);
  return fs::canonical(dir);
}

inline void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary | std::ios::trunc) << s;
}

inline std::string read_file(const fs::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  std::ostringstream os;
  os << ifs.rdbuf();
  return os.str();
}

// Scratch git repository on branch "main" with one commit (README.md); removed on destruction.
class TempRepo {
public:
  explicit TempRepo(std::string_view prefix, bool with_commit = true)
      : root_(make_temp_dir(prefix)), git_(root_) {
    git_.raw({"init", "--quiet", "-b", "main"});
    git_.raw({"config", "user.name", "Test User"});
    git_.raw({"config", "user.email", "test@example.com"});
    git_.raw({"config", "commit.gpgsign", "false"});
    if (with_commit) {
      write("README.md", "# test\n");
      commit_all("initial");
    }
  }
  ~TempRepo() {
    std::error_code ec;
    fs::remove_all(root_, ec);
  }
  TempRepo(const TempRepo &) = delete;
  TempRepo &operator=(const TempRepo &) = delete;

  [[nodiscard]] const fs::path &path() const { return root_; }
  [[nodiscard]] const gitsaga::GitClient &git() const { return git_; }

  // Trimmed stdout of a git command that must succeed
  std::string git_out(const std::vector<std::string> &args) const {
    return gitsaga::strutil::trim(git_.raw(args));
  }

  void write(const std::string &rel, std::string_view content) const {
    write_file(root_ / rel, content);
  }
  [[nodiscard]] std::string read(const std::string &rel) const { return read_file(root_ / rel); }
  [[nodiscard]] bool exists(const std::string &rel) const {
    std::error_code ec;
    return fs::symlink_status(root_ / rel, ec).type() != fs::file_type::not_found;
  }

  std::string commit_all(const std::string &message) const {
    git_.raw({"add", "-A"});
    git_.raw({"commit", "--quiet", "-m", message});
    return head();
  }

  [[nodiscard]] std::string head() const { return git_out({"rev-parse", "HEAD"}); }
  [[nodiscard]] std::string branch() const { return git_out({"branch", "--show-current"}); }

private:
  fs::path root_;
  gitsaga::GitClient git_;
};

// Runs the wrapped saga's work, then fails in an extra step so its rollbacks run.
template <typename SagaT, typename In, typename Out> class FailAfter : public SagaT {
public:
  using SagaT::SagaT;

protected:
  Out execute_git_operations(const In &input) override {
    Out out = SagaT::execute_git_operations(input);
    this->template step<void>({
        .name = "injected-failure",
        .execute = [] { throw std::runtime_error("injected failure"); },
        .rollback = nullptr,
    });
    return out;
  }
};

} // namespace testutil
