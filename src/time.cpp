#include "gitsaga/time.hpp"

#include <cstdio>
#include <ctime>

namespace gitsaga::timeutil {

std::int64_t now_millis() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string iso8601_utc(std::chrono::system_clock::time_point when) {
  using namespace std::chrono;
  const auto ms = duration_cast<milliseconds>(when.time_since_epoch()).count() % 1000;
  const std::time_t t = system_clock::to_time_t(when);
  std::tm gt{};
#if defined(_WIN32)
  gmtime_s(&gt, &t);
#else
  gmtime_r(&t, &gt);
#endif
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", gt.tm_year + 1900,
                gt.tm_mon + 1, gt.tm_mday, gt.tm_hour, gt.tm_min, gt.tm_sec,
                static_cast<int>(ms < 0 ? 0 : ms));
  return std::string(buf);
}

std::string now_iso8601() { return iso8601_utc(std::chrono::system_clock::now()); }

} // namespace gitsaga::timeutil
