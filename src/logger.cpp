#include "gitsaga/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace gitsaga {

std::string_view level_name(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

LogLevel parse_level(std::string_view text) {
  std::string lower(text);
  std::ranges::transform(lower, lower.begin(),
                         [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "debug")
    return LogLevel::Debug;
  if (lower == "info")
    return LogLevel::Info;
  if (lower == "warn" || lower == "warning")
    return LogLevel::Warn;
  if (lower == "error")
    return LogLevel::Error;
  throw std::invalid_argument("unknown log level: " + std::string(text));
}

namespace {

spdlog::level::level_enum to_spdlog(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return spdlog::level::debug;
  case LogLevel::Info:
    return spdlog::level::info;
  case LogLevel::Warn:
    return spdlog::level::warn;
  case LogLevel::Error:
    return spdlog::level::err;
  }
  return spdlog::level::info;
}

std::string serialize_fields(const LogFields &fields) {
  std::string out;
  for (const auto &[key, value] : fields) {
    if (!out.empty())
      out += ' ';
    out += key + '=' + value;
  }
  return out;
}

} // namespace

SpdLogger::SpdLogger(LogLevel min_level, const std::string &name)
    : logger_(std::make_shared<spdlog::logger>(
          name, std::make_shared<spdlog::sinks::stderr_color_sink_mt>())) {
  logger_->set_pattern("[%n] [%^%l%$] %v");
  logger_->set_level(to_spdlog(min_level));
  logger_->flush_on(spdlog::level::warn);
}

void SpdLogger::log(LogLevel level, std::string_view message, const LogFields &fields) {
  const auto serialized = serialize_fields(fields);
  if (serialized.empty())
    logger_->log(to_spdlog(level), "{}", message);
  else
    logger_->log(to_spdlog(level), "{} {}", message, serialized);
}

void RecordingLogger::log(LogLevel level, std::string_view message, const LogFields &fields) {
  const std::lock_guard lock(mu_);
  records_.push_back(Record{.level = level, .message = std::string(message), .fields = fields});
}

std::vector<RecordingLogger::Record> RecordingLogger::records() const {
  const std::lock_guard lock(mu_);
  return records_;
}

bool RecordingLogger::contains(std::string_view needle) const {
  const std::lock_guard lock(mu_);
  return std::ranges::any_of(records_, [&](const Record &r) {
    return r.message.find(needle) != std::string::npos;
  });
}

std::size_t RecordingLogger::count(LogLevel level) const {
  const std::lock_guard lock(mu_);
  return static_cast<std::size_t>(
      std::ranges::count_if(records_, [&](const Record &r) { return r.level == level; }));
}

void RecordingLogger::clear() {
  const std::lock_guard lock(mu_);
  records_.clear();
}

std::shared_ptr<Logger> null_logger() {
  static const auto instance = std::make_shared<NullLogger>();
  return instance;
}

} // namespace gitsaga
