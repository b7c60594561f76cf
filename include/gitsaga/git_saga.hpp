#pragma once
#include "gitsaga/abort.hpp"
#include "gitsaga/git_client.hpp"
#include "gitsaga/operation_manager.hpp"
#include "gitsaga/saga.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <utility>

namespace gitsaga {

/**
 * A Saga bound to one git working directory.
 *
 * The whole run, rollback included, holds the write slot for that directory in
 * git_operations(). Subclasses implement execute_git_operations() and use the
 * protected `git_` handle. The abort signal is detached from `git_` before the
 * rollback pass so compensation always runs to the end.
 */
template <typename Input, typename Output> class GitSaga : public Saga<Input, Output> {
public:
  GitSaga(std::string name, std::filesystem::path base_dir,
          std::shared_ptr<Logger> logger = nullptr,
          std::shared_ptr<const AbortSignal> signal = nullptr)
      : Saga<Input, Output>(std::move(name), std::move(logger)), base_dir_(std::move(base_dir)),
        signal_(std::move(signal)), git_(base_dir_, signal_) {}

  [[nodiscard]] const std::filesystem::path &base_dir() const { return base_dir_; }

  Output run(const Input &input) override {
    git_.set_signal(signal_);
    return git_operations().execute_write(
        base_dir_, [&](GitClient &) { return Saga<Input, Output>::run(input); }, signal_);
  }

protected:
  virtual Output execute_git_operations(const Input &input) = 0;

  Output execute(const Input &input) final { return execute_git_operations(input); }

  void before_rollback() override { git_.set_signal(nullptr); }

  [[nodiscard]] std::string failure_context() const override {
    return "repository " + base_dir_.string();
  }

  std::filesystem::path base_dir_;
  std::shared_ptr<const AbortSignal> signal_;
  GitClient git_;
};

} // namespace gitsaga
