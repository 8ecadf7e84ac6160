#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pipeline::util {

/*
  Time utilities.

  Everything on the write path takes "now" from an injected
  context::Clock; these helpers only format and parse.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Date      = std::chrono::year_month_day;

TimePoint Now();

Date      ToDate(TimePoint tp);
TimePoint FromDate(Date date);

// Days from `from` to `to`; negative when `to` is earlier.
int64_t DaysBetween(Date from, Date to);

// yyyy-MM-dd
std::string FormatDate(Date date);
// yyyyMMdd
std::string FormatCompactDate(Date date);
// yyyyMMdd_HHmmss (UTC)
std::string FormatBackupTimestamp(TimePoint tp);
// yyyy-MM-ddTHH:MM:SSZ (UTC)
std::string FormatIso8601(TimePoint tp);

/*
  Accepts ISO yyyy-MM-dd (with an optional time part), yyyy/MM/dd,
  dd/MM/yyyy, d/M/yyyy, dd-MM-yyyy and d-M-yyyy. Calendar-invalid
  dates are rejected.
*/
std::optional<Date> ParseDate(std::string_view text);

// yyyy-MM-dd or yyyy-MM-ddTHH:MM:SS[.fff][Z]
std::optional<TimePoint> ParseIso8601(std::string_view text);

uint64_t ToUnixMillis(TimePoint tp);

} // namespace pipeline::util
