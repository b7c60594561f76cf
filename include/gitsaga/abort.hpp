#pragma once
#include <atomic>
#include <stdexcept>
#include <string>

namespace gitsaga {

// Cooperative cancellation flag shared between a caller and the git calls it starts.
class AbortSignal {
public:
  void abort() noexcept { aborted_.store(true); }
  [[nodiscard]] bool aborted() const noexcept { return aborted_.load(); }

private:
  std::atomic<bool> aborted_{false};
};

class AbortedError : public std::runtime_error {
public:
  explicit AbortedError(const std::string &what) : std::runtime_error(what) {}
};

} // namespace gitsaga
