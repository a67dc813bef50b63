#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace docflow::util {

/*
  Time utilities. Single place to control clock source later.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Calendar date of a business document (delivery, issue, due, payment).
using Date = std::chrono::sys_days;

TimePoint Now();

std::uint64_t ToUnixMillis(TimePoint tp);
TimePoint     FromUnixMillis(std::uint64_t ms);

Date Today();

// ISO-8601 calendar date, "YYYY-MM-DD".
Date        ParseDate(std::string_view text);
std::string FormatDate(Date date);

int YearOf(Date date);

} // namespace docflow::util
