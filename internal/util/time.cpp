#include "time.hpp"

#include <charconv>
#include <cstdio>
#include <vector>

#include "internal/util/strings.hpp"

namespace pipeline::util {

namespace {

bool ParseUnsigned(std::string_view text, std::size_t min_digits, std::size_t max_digits, int& out) {
  if (text.size() < min_digits || text.size() > max_digits) return false;
  for (char c : text) {
    if (c < '0' || c > '9') return false;
  }
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
  return ec == std::errc{} && ptr == text.data() + text.size();
}

std::optional<Date> MakeDate(int y, int m, int d) {
  if (m < 1 || m > 12 || d < 1 || d > 31) return std::nullopt;
  Date date{std::chrono::year{y}, std::chrono::month{static_cast<unsigned>(m)}, std::chrono::day{static_cast<unsigned>(d)}};
  if (!date.ok()) return std::nullopt;
  return date;
}

std::vector<std::string_view> SplitOn(std::string_view text, char sep) {
  std::vector<std::string_view> parts;
  std::size_t                   start = 0;
  while (true) {
    auto pos = text.find(sep, start);
    if (pos == std::string_view::npos) {
      parts.push_back(text.substr(start));
      return parts;
    }
    parts.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
}

std::optional<Date> ParseYearFirst(std::string_view text, char sep) {
  if (text.size() != 10 || text[4] != sep || text[7] != sep) return std::nullopt;
  int y = 0, m = 0, d = 0;
  if (!ParseUnsigned(text.substr(0, 4), 4, 4, y)) return std::nullopt;
  if (!ParseUnsigned(text.substr(5, 2), 2, 2, m)) return std::nullopt;
  if (!ParseUnsigned(text.substr(8, 2), 2, 2, d)) return std::nullopt;
  return MakeDate(y, m, d);
}

std::optional<Date> ParseDayFirst(std::string_view text, char sep) {
  auto parts = SplitOn(text, sep);
  if (parts.size() != 3) return std::nullopt;
  int d = 0, m = 0, y = 0;
  if (!ParseUnsigned(parts[0], 1, 2, d)) return std::nullopt;
  if (!ParseUnsigned(parts[1], 1, 2, m)) return std::nullopt;
  if (!ParseUnsigned(parts[2], 4, 4, y)) return std::nullopt;
  return MakeDate(y, m, d);
}

bool IsValidTimeSuffix(std::string_view rest) {
  // Accept "THH:MM[:SS[.fff]][Z]" or " HH:MM[:SS]"; the time part is dropped.
  if (rest.empty()) return true;
  if (rest[0] != 'T' && rest[0] != ' ') return false;
  rest.remove_prefix(1);
  if (!rest.empty() && rest.back() == 'Z') rest.remove_suffix(1);
  if (auto dot = rest.find('.'); dot != std::string_view::npos) rest = rest.substr(0, dot);
  auto parts = SplitOn(rest, ':');
  if (parts.size() < 2 || parts.size() > 3) return false;
  int value = 0;
  if (!ParseUnsigned(parts[0], 1, 2, value) || value > 23) return false;
  if (!ParseUnsigned(parts[1], 2, 2, value) || value > 59) return false;
  if (parts.size() == 3 && (!ParseUnsigned(parts[2], 2, 2, value) || value > 60)) return false;
  return true;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

Date ToDate(TimePoint tp) {
  return Date{std::chrono::floor<std::chrono::days>(tp)};
}

TimePoint FromDate(Date date) {
  return std::chrono::sys_days{date};
}

int64_t DaysBetween(Date from, Date to) {
  return (std::chrono::sys_days{to} - std::chrono::sys_days{from}).count();
}

std::string FormatDate(Date date) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(date.year()), static_cast<unsigned>(date.month()),
                static_cast<unsigned>(date.day()));
  return buf;
}

std::string FormatCompactDate(Date date) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d%02u%02u", static_cast<int>(date.year()), static_cast<unsigned>(date.month()),
                static_cast<unsigned>(date.day()));
  return buf;
}

std::string FormatBackupTimestamp(TimePoint tp) {
  const auto day  = std::chrono::floor<std::chrono::days>(tp);
  const Date date{day};
  const std::chrono::hh_mm_ss hms{std::chrono::floor<std::chrono::seconds>(tp - day)};

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%s_%02d%02d%02d", FormatCompactDate(date).c_str(), static_cast<int>(hms.hours().count()),
                static_cast<int>(hms.minutes().count()), static_cast<int>(hms.seconds().count()));
  return buf;
}

std::string FormatIso8601(TimePoint tp) {
  const auto day  = std::chrono::floor<std::chrono::days>(tp);
  const Date date{day};
  const std::chrono::hh_mm_ss hms{std::chrono::floor<std::chrono::seconds>(tp - day)};

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%sT%02d:%02d:%02dZ", FormatDate(date).c_str(), static_cast<int>(hms.hours().count()),
                static_cast<int>(hms.minutes().count()), static_cast<int>(hms.seconds().count()));
  return buf;
}

std::optional<Date> ParseDate(std::string_view text) {
  const std::string trimmed = Trim(text);
  std::string_view  value   = trimmed;
  if (value.empty()) return std::nullopt;

  if (value.size() >= 10 && value[4] == '-' && value[7] == '-') {
    if (!IsValidTimeSuffix(value.substr(10))) return std::nullopt;
    return ParseYearFirst(value.substr(0, 10), '-');
  }
  if (value.size() == 10 && value[4] == '/') {
    return ParseYearFirst(value, '/');
  }
  if (value.find('/') != std::string_view::npos) {
    return ParseDayFirst(value, '/');
  }
  if (value.find('-') != std::string_view::npos) {
    return ParseDayFirst(value, '-');
  }
  return std::nullopt;
}

std::optional<TimePoint> ParseIso8601(std::string_view text) {
  const std::string trimmed = Trim(text);
  std::string_view  value   = trimmed;
  if (value.size() < 10) return std::nullopt;

  auto date = ParseYearFirst(value.substr(0, 10), '-');
  if (!date) return std::nullopt;

  TimePoint tp = FromDate(*date);
  auto      rest = value.substr(10);
  if (rest.empty()) return tp;
  if (!IsValidTimeSuffix(rest)) return std::nullopt;

  rest.remove_prefix(1);
  if (!rest.empty() && rest.back() == 'Z') rest.remove_suffix(1);
  if (auto dot = rest.find('.'); dot != std::string_view::npos) rest = rest.substr(0, dot);

  auto parts = SplitOn(rest, ':');
  int  h = 0, m = 0, s = 0;
  if (!ParseUnsigned(parts[0], 1, 2, h) || !ParseUnsigned(parts[1], 2, 2, m)) return std::nullopt;
  if (parts.size() == 3 && !ParseUnsigned(parts[2], 2, 2, s)) return std::nullopt;

  return tp + std::chrono::hours(h) + std::chrono::minutes(m) + std::chrono::seconds(s);
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace pipeline::util
