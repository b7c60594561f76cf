#include "gitsaga/operation_manager.hpp"

#include "gitsaga/fs.hpp"

#include <chrono>

namespace gitsaga {

std::string GitOperationManager::key_for(const std::filesystem::path &path) {
  return fs::normalize(path).generic_string();
}

void GitOperationManager::acquire(const std::string &key, Mode mode, const AbortSignal *signal) {
  std::unique_lock lock(mu_);
  auto &state = paths_[key];
  const std::uint64_t ticket = next_ticket_++;
  state.queue.emplace_back(ticket, mode);

  auto admissible = [&] {
    auto &st = paths_[key];
    if (st.queue.front().first != ticket)
      return false;
    return mode == Mode::Read ? !st.writer : (!st.writer && st.readers == 0);
  };

  while (!admissible()) {
    if (signal && signal->aborted()) {
      auto &st = paths_[key];
      std::erase_if(st.queue, [&](const auto &entry) { return entry.first == ticket; });
      if (st.queue.empty() && st.readers == 0 && !st.writer)
        paths_.erase(key);
      cv_.notify_all();
      throw AbortedError("aborted while waiting for git operation on " + key);
    }
    cv_.wait_for(lock, std::chrono::milliseconds(50));
  }

  auto &st = paths_[key];
  st.queue.pop_front();
  if (mode == Mode::Read)
    ++st.readers;
  else
    st.writer = true;
  // A following reader may be admissible now
  cv_.notify_all();
}

void GitOperationManager::release(const std::string &key, Mode mode) {
  const std::lock_guard lock(mu_);
  auto it = paths_.find(key);
  if (it == paths_.end())
    return;
  auto &st = it->second;
  if (mode == Mode::Read)
    --st.readers;
  else
    st.writer = false;
  if (st.queue.empty() && st.readers == 0 && !st.writer)
    paths_.erase(it);
  cv_.notify_all();
}

std::size_t GitOperationManager::active_paths() const {
  const std::lock_guard lock(mu_);
  return paths_.size();
}

GitOperationManager::Slot::Slot(GitOperationManager &owner, std::string key, Mode mode)
    : owner_(owner), key_(std::move(key)), mode_(mode) {}

GitOperationManager::Slot::~Slot() { owner_.release(key_, mode_); }

GitOperationManager &git_operations() {
  static GitOperationManager instance;
  return instance;
}

} // namespace gitsaga
