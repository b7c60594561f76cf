#pragma once
#include "gitsaga/abort.hpp"

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gitsaga {

struct GitResult {
  int exit_code = 0;
  std::string out;
  std::string err;
};

// git exited with a non-zero status (or could not be started).
class GitError : public std::runtime_error {
public:
  GitError(std::vector<std::string> args, int exit_code, std::string stderr_text);

  [[nodiscard]] const std::vector<std::string> &args() const { return args_; }
  [[nodiscard]] int exit_code() const { return exit_code_; }
  [[nodiscard]] const std::string &stderr_text() const { return stderr_; }

private:
  std::vector<std::string> args_;
  int exit_code_;
  std::string stderr_;
};

/**
 * Runs the `git` executable against one working directory.
 *
 * Every call is synchronous; the child is started with execvp (no shell), stdin
 * attached to /dev/null and prompts disabled. When an AbortSignal is attached
 * and fires, the running child is killed and AbortedError is thrown.
 */
class GitClient {
public:
  explicit GitClient(std::filesystem::path base_dir,
                     std::shared_ptr<const AbortSignal> signal = nullptr);

  [[nodiscard]] const std::filesystem::path &base_dir() const { return base_dir_; }

  // Exit status and captured output; never throws on a non-zero exit.
  [[nodiscard]] GitResult run(const std::vector<std::string> &args) const;

  // stdout of a successful call; GitError otherwise.
  std::string raw(const std::vector<std::string> &args) const;

  // `git rev-parse <args>`, trimmed.
  [[nodiscard]] std::string rev_parse(const std::vector<std::string> &args) const;

  void checkout(std::string_view target) const;
  // `git checkout -b <branch> <start>`
  void checkout_new_branch(std::string_view branch, std::string_view start_point) const;
  void delete_local_branch(std::string_view branch, bool force) const;

  // Copy of this client with an extra environment variable for the child.
  [[nodiscard]] GitClient with_env(std::string key, std::string value) const;

  void set_signal(std::shared_ptr<const AbortSignal> signal) { signal_ = std::move(signal); }
  [[nodiscard]] const std::shared_ptr<const AbortSignal> &signal() const { return signal_; }

private:
  std::filesystem::path base_dir_;
  std::shared_ptr<const AbortSignal> signal_;
  std::vector<std::pair<std::string, std::string>> env_;
};

} // namespace gitsaga
