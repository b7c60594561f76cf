#pragma once
#include "gitsaga/abort.hpp"
#include "gitsaga/git_client.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace gitsaga {

/**
 * Per-repository reader/writer admission queue.
 *
 * Reads on one path run together, a write on a path excludes every other
 * operation on that path, and different paths never wait on each other.
 * Waiters on a path are admitted in arrival order, so a queued write is not
 * starved by a stream of later reads. Paths are compared in normalized form.
 */
class GitOperationManager {
public:
  enum class Mode { Read, Write };

  template <typename F>
  auto execute_read(const std::filesystem::path &path, F &&fn,
                    std::shared_ptr<const AbortSignal> signal = nullptr) {
    return execute(path, Mode::Read, std::forward<F>(fn), std::move(signal));
  }

  template <typename F>
  auto execute_write(const std::filesystem::path &path, F &&fn,
                     std::shared_ptr<const AbortSignal> signal = nullptr) {
    return execute(path, Mode::Write, std::forward<F>(fn), std::move(signal));
  }

  // Number of paths with admitted or queued operations (diagnostics and tests).
  [[nodiscard]] std::size_t active_paths() const;

private:
  // Holds one admitted slot; released on destruction.
  class Slot {
  public:
    Slot(GitOperationManager &owner, std::string key, Mode mode);
    ~Slot();
    Slot(const Slot &) = delete;
    Slot &operator=(const Slot &) = delete;

  private:
    GitOperationManager &owner_;
    std::string key_;
    Mode mode_;
  };

  struct PathState {
    int readers = 0;
    bool writer = false;
    std::deque<std::pair<std::uint64_t, Mode>> queue;
  };

  template <typename F>
  auto execute(const std::filesystem::path &path, Mode mode, F &&fn,
               std::shared_ptr<const AbortSignal> signal) {
    const auto key = key_for(path);
    acquire(key, mode, signal.get());
    const Slot slot(*this, key, mode);
    GitClient git{path, std::move(signal)};
    return std::forward<F>(fn)(git);
  }

  static std::string key_for(const std::filesystem::path &path);
  void acquire(const std::string &key, Mode mode, const AbortSignal *signal);
  void release(const std::string &key, Mode mode);

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::map<std::string, PathState> paths_;
  std::uint64_t next_ticket_ = 0;
};

// Process-wide instance shared by every saga and the worktree manager.
GitOperationManager &git_operations();

} // namespace gitsaga
