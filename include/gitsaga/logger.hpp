#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace spdlog {
class logger;
}

namespace gitsaga {

enum class LogLevel { Debug, Info, Warn, Error };

// Ordered key=value context attached to a record
using LogFields = std::vector<std::pair<std::string, std::string>>;

[[nodiscard]] auto level_name(LogLevel level) -> std::string_view;

// Parse "debug" / "info" / "warn" / "error" (case-insensitive); throws on anything else.
[[nodiscard]] auto parse_level(std::string_view text) -> LogLevel;

class Logger {
public:
  virtual ~Logger() = default;

  virtual void log(LogLevel level, std::string_view message, const LogFields &fields) = 0;

  void debug(std::string_view message, const LogFields &fields = {}) {
    log(LogLevel::Debug, message, fields);
  }
  void info(std::string_view message, const LogFields &fields = {}) {
    log(LogLevel::Info, message, fields);
  }
  void warn(std::string_view message, const LogFields &fields = {}) {
    log(LogLevel::Warn, message, fields);
  }
  void error(std::string_view message, const LogFields &fields = {}) {
    log(LogLevel::Error, message, fields);
  }
};

// Discards everything. Default sink for sagas and the worktree manager.
class NullLogger final : public Logger {
public:
  void log(LogLevel, std::string_view, const LogFields &) override {}
};

// spdlog-backed sink on stderr: "[gitsaga] [warn] message key=value key=value"
class SpdLogger final : public Logger {
public:
  explicit SpdLogger(LogLevel min_level, const std::string &name = "gitsaga");

  void log(LogLevel level, std::string_view message, const LogFields &fields) override;

private:
  std::shared_ptr<spdlog::logger> logger_;
};

// Keeps every record in memory for later inspection.
class RecordingLogger final : public Logger {
public:
  struct Record {
    LogLevel level;
    std::string message;
    LogFields fields;
  };

  void log(LogLevel level, std::string_view message, const LogFields &fields) override;

  [[nodiscard]] auto records() const -> std::vector<Record>;
  [[nodiscard]] auto contains(std::string_view needle) const -> bool;
  [[nodiscard]] auto count(LogLevel level) const -> std::size_t;
  void clear();

private:
  mutable std::mutex mu_;
  std::vector<Record> records_;
};

[[nodiscard]] auto null_logger() -> std::shared_ptr<Logger>;

} // namespace gitsaga
