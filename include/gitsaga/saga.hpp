#pragma once
#include "gitsaga/logger.hpp"

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace gitsaga {

// One named unit of work and its compensating action.
// The rollback receives the value produced by execute.
template <typename T> struct SagaStep {
  std::string name;
  std::function<T()> execute;
  std::function<void(const T &)> rollback;
};

template <> struct SagaStep<void> {
  std::string name;
  std::function<void()> execute;
  std::function<void()> rollback;
};

struct RollbackFailure {
  std::string step;
  std::string message;
};

// Thrown by Saga::run after the rollback pass has finished.
class SagaError : public std::runtime_error {
public:
  SagaError(std::string saga_name, std::string failed_step, std::string cause, std::string context,
            std::vector<RollbackFailure> rollback_failures, std::size_t rollbacks_attempted,
            std::exception_ptr original);

  [[nodiscard]] const std::string &saga_name() const { return saga_name_; }
  [[nodiscard]] const std::string &failed_step() const { return failed_step_; }
  [[nodiscard]] const std::string &cause() const { return cause_; }
  // Repository path (or other scope) the saga was bound to; empty for plain sagas.
  [[nodiscard]] const std::string &context() const { return context_; }
  [[nodiscard]] const std::vector<RollbackFailure> &rollback_failures() const {
    return rollback_failures_;
  }
  [[nodiscard]] std::size_t rollbacks_attempted() const { return rollbacks_attempted_; }
  // Every attempted compensation failed, so nothing was undone.
  [[nodiscard]] bool rollback_failed() const {
    return rollbacks_attempted_ > 0 && rollback_failures_.size() == rollbacks_attempted_;
  }
  // The exception thrown by the failing step, unchanged.
  [[nodiscard]] std::exception_ptr original() const { return original_; }

private:
  std::string saga_name_;
  std::string failed_step_;
  std::string cause_;
  std::string context_;
  std::vector<RollbackFailure> rollback_failures_;
  std::size_t rollbacks_attempted_;
  std::exception_ptr original_;
};

/**
 * Base class for multi-step operations with manual compensation.
 *
 * Subclasses implement execute() and call step() for every mutation and
 * read_only_step() for lookups. When anything thrown escapes execute(), the
 * rollbacks of the completed steps run newest-first and run() throws a
 * SagaError naming the step that failed. A rollback that throws is logged and
 * recorded; the remaining rollbacks still run.
 */
template <typename Input, typename Output> class Saga {
public:
  explicit Saga(std::string name, std::shared_ptr<Logger> logger = nullptr)
      : name_(std::move(name)), log_(logger ? std::move(logger) : null_logger()) {}
  virtual ~Saga() = default;

  Saga(const Saga &) = delete;
  Saga &operator=(const Saga &) = delete;

  [[nodiscard]] const std::string &name() const { return name_; }

  virtual Output run(const Input &input) {
    completed_.clear();
    current_step_ = "unknown";
    log_->info("Starting saga", {{"saga", name_}});

    try {
      Output out = execute(input);
      log_->info("Saga completed successfully",
                 {{"saga", name_}, {"stepsCompleted", std::to_string(completed_.size())}});
      completed_.clear();
      return out;
    } catch (const std::exception &e) {
      const auto original = std::current_exception();
      const std::string failed_step = current_step_;
      log_->error("Saga failed, initiating rollback",
                  {{"saga", name_}, {"failedStep", failed_step}, {"error", e.what()}});
      const auto attempted = completed_.size();
      auto failures = rollback_completed();
      throw SagaError(name_, failed_step, e.what(), failure_context(), std::move(failures),
                      attempted, original);
    } catch (...) {
      log_->error("Saga failed with a non-standard exception, initiating rollback",
                  {{"saga", name_}, {"failedStep", current_step_}});
      rollback_completed();
      throw;
    }
  }

protected:
  virtual Output execute(const Input &input) = 0;

  // Runs a mutating step. Only a step whose execute returned is recorded for rollback.
  template <typename T> T step(SagaStep<T> config) {
    current_step_ = config.name;
    log_->debug("Executing step: " + config.name);
    try {
      if constexpr (std::is_void_v<T>) {
        config.execute();
        completed_.push_back(CompletedStep{.name = config.name, .rollback = std::move(config.rollback)});
        log_->debug("Step completed: " + config.name);
      } else {
        T result = config.execute();
        auto rollback = std::move(config.rollback);
        completed_.push_back(CompletedStep{
            .name = config.name, .rollback = [rollback, result]() {
              if (rollback)
                rollback(result);
            }});
        log_->debug("Step completed: " + config.name);
        return result;
      }
    } catch (const std::exception &e) {
      log_->warn("Step failed: " + config.name, {{"error", e.what()}});
      throw;
    }
  }

  // Runs a lookup that never needs compensation.
  template <typename F> auto read_only_step(std::string_view step_name, F &&fn) {
    current_step_ = std::string(step_name);
    log_->debug("Executing read-only step: " + current_step_);
    if constexpr (std::is_void_v<std::invoke_result_t<F>>) {
      std::forward<F>(fn)();
      log_->debug("Read-only step completed: " + std::string(step_name));
    } else {
      auto result = std::forward<F>(fn)();
      log_->debug("Read-only step completed: " + std::string(step_name));
      return result;
    }
  }

  // Called once before the rollback pass begins.
  virtual void before_rollback() {}

  // Scope reported in SagaError::context().
  [[nodiscard]] virtual std::string failure_context() const { return {}; }

  [[nodiscard]] std::size_t completed_step_count() const { return completed_.size(); }

  [[nodiscard]] Logger &log() const { return *log_; }

private:
  struct CompletedStep {
    std::string name;
    std::function<void()> rollback;
  };

  std::vector<RollbackFailure> rollback_completed() {
    before_rollback();
    log_->info("Rolling back saga", {{"saga", name_},
                                     {"stepsToRollback", std::to_string(completed_.size())}});
    std::vector<RollbackFailure> failures;
    for (auto it = completed_.rbegin(); it != completed_.rend(); ++it) {
      log_->debug("Rolling back step: " + it->name);
      try {
        if (it->rollback)
          it->rollback();
        log_->debug("Step rolled back: " + it->name);
      } catch (const std::exception &e) {
        log_->warn("Failed to rollback step: " + it->name, {{"error", e.what()}});
        failures.push_back(RollbackFailure{.step = it->name, .message = e.what()});
      } catch (...) {
        log_->warn("Failed to rollback step: " + it->name, {{"error", "non-standard exception"}});
        failures.push_back(RollbackFailure{.step = it->name, .message = "non-standard exception"});
      }
    }
    log_->info("Rollback completed",
               {{"stepsAttempted", std::to_string(completed_.size())},
                {"failures", std::to_string(failures.size())}});
    completed_.clear();
    return failures;
  }

  std::string name_;
  std::shared_ptr<Logger> log_;
  std::vector<CompletedStep> completed_;
  std::string current_step_ = "unknown";
};

} // namespace gitsaga
