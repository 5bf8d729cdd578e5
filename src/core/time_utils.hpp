#ifndef TRACR_CORE_TIME_UTILS_HPP_
#define TRACR_CORE_TIME_UTILS_HPP_

#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace tracr::core {

// Canonical UTC timestamp formatter used by logs, persisted records and
// telemetry. Millisecond precision, always suffixed with `Z`.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm utc_time{};
#if defined(_WIN32)
  const errno_t result = gmtime_s(&utc_time, &epoch_seconds);
  if (result != 0) {
    return "";
  }
#else
  const std::tm* result = gmtime_r(&epoch_seconds, &utc_time);
  if (result == nullptr) {
    return "";
  }
#endif

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

inline std::int64_t ToEpochMilliseconds(std::chrono::system_clock::time_point ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

inline std::chrono::system_clock::time_point FromEpochMilliseconds(std::int64_t epoch_ms) {
  return std::chrono::system_clock::time_point(std::chrono::milliseconds(epoch_ms));
}

namespace detail {

// Howard Hinnant's days-from-civil; avoids timegm() portability gaps.
constexpr std::int64_t DaysFromCivil(std::int64_t y, unsigned m, unsigned d) {
  y -= m <= 2 ? 1 : 0;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const auto yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

inline bool ReadDigits(std::string_view text, std::size_t& pos, std::size_t count, int& value) {
  if (pos + count > text.size()) {
    return false;
  }
  value = 0;
  for (std::size_t i = 0; i < count; ++i) {
    const char c = text[pos + i];
    if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
      return false;
    }
    value = value * 10 + (c - '0');
  }
  pos += count;
  return true;
}

inline bool Expect(std::string_view text, std::size_t& pos, char expected) {
  if (pos >= text.size() || text[pos] != expected) {
    return false;
  }
  ++pos;
  return true;
}

} // namespace detail

// Parses ISO-8601 `YYYY-MM-DDTHH:MM:SS[.fraction][Z|+HH:MM|-HH:MM]`.
// A missing zone designator is read as UTC. Fractions beyond milliseconds are
// truncated.
inline bool ParseUtcTimestamp(std::string_view text, std::chrono::system_clock::time_point& out) {
  std::size_t pos = 0;
  int year = 0;
  int month = 0;
  int day = 0;
  int hour = 0;
  int minute = 0;
  int second = 0;
  if (!detail::ReadDigits(text, pos, 4, year) || !detail::Expect(text, pos, '-') ||
      !detail::ReadDigits(text, pos, 2, month) || !detail::Expect(text, pos, '-') ||
      !detail::ReadDigits(text, pos, 2, day)) {
    return false;
  }
  if (pos >= text.size() || (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ')) {
    return false;
  }
  ++pos;
  if (!detail::ReadDigits(text, pos, 2, hour) || !detail::Expect(text, pos, ':') ||
      !detail::ReadDigits(text, pos, 2, minute) || !detail::Expect(text, pos, ':') ||
      !detail::ReadDigits(text, pos, 2, second)) {
    return false;
  }
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
    return false;
  }

  int millis = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    std::size_t digits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
      if (digits < 3U) {
        millis = millis * 10 + (text[pos] - '0');
      }
      ++digits;
      ++pos;
    }
    if (digits == 0U) {
      return false;
    }
    for (std::size_t i = digits; i < 3U; ++i) {
      millis *= 10;
    }
  }

  int offset_minutes = 0;
  if (pos < text.size()) {
    const char zone = text[pos];
    if (zone == 'Z' || zone == 'z') {
      ++pos;
    } else if (zone == '+' || zone == '-') {
      ++pos;
      int off_h = 0;
      int off_m = 0;
      if (!detail::ReadDigits(text, pos, 2, off_h)) {
        return false;
      }
      if (pos < text.size() && text[pos] == ':') {
        ++pos;
      }
      if (!detail::ReadDigits(text, pos, 2, off_m)) {
        return false;
      }
      offset_minutes = (off_h * 60 + off_m) * (zone == '-' ? -1 : 1);
    } else {
      return false;
    }
  }
  if (pos != text.size()) {
    return false;
  }

  const std::int64_t days = detail::DaysFromCivil(year, static_cast<unsigned>(month),
                                                  static_cast<unsigned>(day));
  const std::int64_t seconds_total = days * 86400 + hour * 3600 + minute * 60 + second -
                                     static_cast<std::int64_t>(offset_minutes) * 60;
  out = FromEpochMilliseconds(seconds_total * 1000 + millis);
  return true;
}

} // namespace tracr::core

#endif // TRACR_CORE_TIME_UTILS_HPP_
