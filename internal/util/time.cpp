#include "internal/util/time.hpp"

#include <cstdio>

#include "internal/util/errors.hpp"

namespace docflow::util {

TimePoint Now() {
  return Clock::now();
}

std::uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(std::uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

Date Today() {
  return std::chrono::floor<std::chrono::days>(Now());
}

Date ParseDate(std::string_view text) {
  int  year  = 0;
  int  month = 0;
  int  day   = 0;
  char tail  = 0;

  const std::string copy(text);
  if (copy.size() != 10 || std::sscanf(copy.c_str(), "%4d-%2d-%2d%c", &year, &month, &day, &tail) != 3) {
    throw InvalidArgument("invalid date '" + copy + "', expected YYYY-MM-DD");
  }

  const std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
                                        std::chrono::day{static_cast<unsigned>(day)}};
  if (!ymd.ok()) {
    throw InvalidArgument("invalid date '" + copy + "'");
  }
  return Date{ymd};
}

std::string FormatDate(Date date) {
  const std::chrono::year_month_day ymd{date};

  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()));
  return buf;
}

int YearOf(Date date) {
  return static_cast<int>(std::chrono::year_month_day{date}.year());
}

} // namespace docflow::util
