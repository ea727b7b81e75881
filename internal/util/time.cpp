#include "time.hpp"

#include <cstdio>
#include <ctime>
#include <stdexcept>
#include <vector>

#include "parse.hpp"

namespace quotecast::util {

namespace {

std::vector<std::string_view> Split(std::string_view text, char sep) {
  std::vector<std::string_view> parts;
  std::size_t                   start = 0;
  while (true) {
    const auto pos = text.find(sep, start);
    if (pos == std::string_view::npos) {
      parts.push_back(text.substr(start));
      return parts;
    }
    parts.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
}

std::time_t ToTimeT(TimePoint tp) {
  return static_cast<std::time_t>(std::chrono::floor<std::chrono::seconds>(tp).time_since_epoch().count());
}

} // namespace

TimePoint Now() {
  return std::chrono::floor<std::chrono::milliseconds>(Clock::now());
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(int64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

std::string FormatDate(const Date& date) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(date.year()), static_cast<unsigned>(date.month()),
                static_cast<unsigned>(date.day()));
  return buf;
}

std::optional<Date> ParseDate(std::string_view text) {
  const auto parts = Split(text, '-');
  if (parts.size() != 3) {
    return std::nullopt;
  }

  const auto year  = ParseInt(parts[0]);
  const auto month = ParseInt(parts[1]);
  const auto day   = ParseInt(parts[2]);
  if (!year || !month || !day || *month < 1 || *day < 1) {
    return std::nullopt;
  }

  const Date date{std::chrono::year{*year}, std::chrono::month{static_cast<unsigned>(*month)},
                  std::chrono::day{static_cast<unsigned>(*day)}};
  if (!date.ok()) {
    return std::nullopt;
  }
  return date;
}

std::string FormatTimestamp(TimePoint tp) {
  const std::time_t t = ToTimeT(tp);
  std::tm           tm{};
  gmtime_r(&t, &tm);

  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

unsigned IsoWeekday(const Date& date) {
  return std::chrono::weekday{std::chrono::sys_days{date}}.iso_encoding();
}

// ------------------------------------------------------------
// TimeZone
// ------------------------------------------------------------

TimeZone TimeZone::Utc() {
  return TimeZone(Kind::kUtc, std::chrono::minutes{0});
}

TimeZone TimeZone::Fixed(std::chrono::minutes utc_offset) {
  return TimeZone(Kind::kFixed, utc_offset);
}

TimeZone TimeZone::System() {
  return TimeZone(Kind::kSystem, std::chrono::minutes{0});
}

std::optional<TimeZone> TimeZone::Parse(std::string_view spec) {
  if (spec.empty() || spec == "local") {
    return System();
  }
  if (spec == "UTC" || spec == "utc" || spec == "Z") {
    return Utc();
  }
  if (spec.front() != '+' && spec.front() != '-') {
    return std::nullopt;
  }

  const int        sign = spec.front() == '-' ? -1 : 1;
  std::string_view body = spec.substr(1);

  std::optional<int> hours;
  std::optional<int> minutes = 0;
  if (const auto colon = body.find(':'); colon != std::string_view::npos) {
    hours   = ParseInt(body.substr(0, colon));
    minutes = ParseInt(body.substr(colon + 1));
  } else if (body.size() == 4) {
    hours   = ParseInt(body.substr(0, 2));
    minutes = ParseInt(body.substr(2));
  } else if (body.size() <= 2) {
    hours = ParseInt(body);
  }

  if (!hours || !minutes || *hours < 0 || *hours > 14 || *minutes < 0 || *minutes > 59) {
    return std::nullopt;
  }
  return Fixed(std::chrono::minutes{sign * (*hours * 60 + *minutes)});
}

Date TimeZone::LocalDate(TimePoint tp) const {
  if (kind_ != Kind::kSystem) {
    return Date{std::chrono::floor<std::chrono::days>(tp + offset_)};
  }

  const std::time_t t = ToTimeT(tp);
  std::tm           tm{};
  if (!localtime_r(&t, &tm)) {
    throw std::runtime_error("localtime_r failed");
  }
  return Date{std::chrono::year{tm.tm_year + 1900}, std::chrono::month{static_cast<unsigned>(tm.tm_mon + 1)},
              std::chrono::day{static_cast<unsigned>(tm.tm_mday)}};
}

TimePoint TimeZone::AtLocalTime(const Date& date, int hour, int minute) const {
  if (kind_ != Kind::kSystem) {
    return std::chrono::sys_days{date} + std::chrono::hours{hour} + std::chrono::minutes{minute} - offset_;
  }

  std::tm tm{};
  tm.tm_year  = static_cast<int>(date.year()) - 1900;
  tm.tm_mon   = static_cast<int>(static_cast<unsigned>(date.month())) - 1;
  tm.tm_mday  = static_cast<int>(static_cast<unsigned>(date.day()));
  tm.tm_hour  = hour;
  tm.tm_min   = minute;
  tm.tm_sec   = 0;
  tm.tm_isdst = -1;

  const std::time_t t = std::mktime(&tm);
  if (t == static_cast<std::time_t>(-1)) {
    throw std::runtime_error("mktime failed for " + FormatDate(date));
  }
  return Clock::from_time_t(t);
}

std::string TimeZone::Name() const {
  switch (kind_) {
    case Kind::kUtc:
      return "UTC";
    case Kind::kSystem:
      return "local";
    case Kind::kFixed:
      break;
  }

  const auto total = offset_.count();
  const auto abs   = total < 0 ? -total : total;
  char       buf[8];
  std::snprintf(buf, sizeof(buf), "%c%02d:%02d", total < 0 ? '-' : '+', static_cast<int>(abs / 60), static_cast<int>(abs % 60));
  return buf;
}

} // namespace quotecast::util
