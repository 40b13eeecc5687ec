#pragma once

#include <fmt/format.h>
#include <tl/expected.hpp>

#include <array>
#include <cctype>
#include <chrono>
#include <climits>
#include <limits>
#include <string>
#include <string_view>

#include <cassert>
#include <cstdint>
#include <ctime>

/**
 * @defgroup date-time Date and Time
 * @ingroup miniocpp-utils
 */

namespace miniocpp {
constexpr bool is_leap_year(int y);
constexpr bool is_valid_date(int y, int m, int d);
constexpr bool is_valid_time(int h, int m, int s);
constexpr int day_of_year(int y, int m, int d);
constexpr bool seconds_to_tm(int64_t t, std::tm* tm);
constexpr int64_t datetime_to_seconds(int y, int m, int d, int H, int M, int S);

/**@brief UTC timestamp with microsecond accuracy, based on 64 bit signed
 *        integer representation.
 * @ingroup date-time
 *
 * Formats (and parses) the ISO-8601 `dateTime` used in protocol payloads:
 * `YYYY-MM-DDTHH:MM:SS.ffffffZ`.
 */
struct Timestamp {
public:
  using value_type = int64_t;

private:
  static constexpr value_type M = 1000000;
  value_type x_{0};

public:
  ///@{ @name Construction/Destruction
  constexpr Timestamp() = default;
  constexpr explicit Timestamp(value_type x) : x_{x} {}
  constexpr explicit Timestamp(std::chrono::system_clock::time_point whence)
      : x_{value_type(
            std::chrono::duration_cast<std::chrono::microseconds>(whence.time_since_epoch())
                .count())} {}
  ///@}

  /**
   * @brief Parse an ISO-8601 string as a timestamp.
   *
   * It's valid to pass in:
   * + `YYYY-MM-DD`,
   * + `YYYY-MM-DDTHH:MM:SS`
   * + `YYYY-MM-DDTHH:MM:SS.[0-9]*`,
   * optionally followed by a `Z` designator. The fractional part must be at
   * most 6 characters long. Other timezone offsets are not accepted.
   */
  static tl::expected<Timestamp, std::string> parse(std::string_view s) {
    // 0123456789.123456789.123456789.
    // 2018-04-11T21:35:56.356193Z
    if (!s.empty() && (s.back() == 'Z' || s.back() == 'z'))
      s.remove_suffix(1);

    if (s.size() < 10 or s.size() > 26 or s.size() == 11 or (s.size() > 10 and s.size() < 19) or
        s.size() == 20) {
      return tl::make_unexpected(
          fmt::format("timestamp string '{}' has an invalid length of {}", s, s.size()));
    }

    for (auto i = 0u; i < s.size(); ++i) {
      const bool ok = (i == 4 or i == 7)     ? s[i] == '-'
                      : (i == 13 or i == 16) ? s[i] == ':'
                      : (i == 10)            ? (s[i] == 'T' or s[i] == 't' or s[i] == ' ')
                      : (i == 19)            ? s[i] == '.'
                                             : std::isdigit(static_cast<unsigned char>(s[i])) != 0;
      if (!ok)
        return tl::make_unexpected(
            fmt::format("unexpected character '{}' in timestamp '{}'", s[i], s));
    }

    auto d = [&](unsigned ind) -> int { return (ind >= s.size()) ? 0 : int(s[ind] - '0'); };

    const int year = d(0) * 1000 + d(1) * 100 + d(2) * 10 + d(3);
    const int month = d(5) * 10 + d(6);
    const int day = d(8) * 10 + d(9);
    const int hour = d(11) * 10 + d(12);
    const int min = d(14) * 10 + d(15);
    const int sec = d(17) * 10 + d(18);
    const int micros =
        d(20) * 100000 + d(21) * 10000 + d(22) * 1000 + d(23) * 100 + d(24) * 10 + d(25);

    if (!is_valid_date(year, month, day))
      return tl::make_unexpected(fmt::format("invalid date in timestamp '{}'", s));
    if (!is_valid_time(hour, min, sec))
      return tl::make_unexpected(fmt::format("invalid time in timestamp '{}'", s));

    return Timestamp{datetime_to_seconds(year, month, day, hour, min, sec) * M + micros};
  }

  /// @brief Reads the system (wall) clock.
  static Timestamp now() { return Timestamp{std::chrono::system_clock::now()}; }

  ///@{ @name Ordering
  constexpr bool operator==(const Timestamp& o) const { return x_ == o.x_; }
  constexpr bool operator!=(const Timestamp& o) const { return x_ != o.x_; }
  constexpr bool operator<=(const Timestamp& o) const { return x_ <= o.x_; }
  constexpr bool operator>=(const Timestamp& o) const { return x_ >= o.x_; }
  constexpr bool operator<(const Timestamp& o) const { return x_ < o.x_; }
  constexpr bool operator>(const Timestamp& o) const { return x_ > o.x_; }
  ///@}

  constexpr int micros() const {
    int m = int(x_ % M);
    return (m < 0) ? (m + int(M)) : m;
  }

  constexpr int64_t seconds_from_epoch() const {
    auto div = int64_t(x_ / M);
    auto rem = x_ % M;
    return (rem < 0) ? (div - 1) : div;
  }

  constexpr value_type value() const { return x_; }

  std::tm to_tm() const {
    std::tm tm{};
    seconds_to_tm(seconds_from_epoch(), &tm);
    return tm;
  }

  /// @brief ISO-8601, UTC, microsecond precision: `2024-07-09T12:00:00.000000Z`
  std::string to_string() const {
    std::tm tm = to_tm();
    return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:06d}Z", tm.tm_year + 1900,
                       tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, micros());
  }

  /// @brief String-shim function.
  friend inline std::string str(const Timestamp& x) { return x.to_string(); }
};

// ---------------------------------------------------------------- is leap year
/**@brief Test if a year is a leap year.
 * @ingroup date-time
 * @relates Timestamp
 * @return TRUE iff the passed year is a (gregorian) leap year.
 */
constexpr bool is_leap_year(int y) {
  if (y < 0)
    return is_leap_year(-y);
  return (y % 4 == 0) and ((y % 100 != 0) or (y % 400 == 0));
}

// --------------------------------------------------------------- is valid date
/**@brief Test if the passed year/month/day combination is a valid date.
 * @ingroup date-time
 * @relates Timestamp
 */
constexpr bool is_valid_date(int y, int m, int d) {
  if (m < 1 or m > 12)
    return false;
  if (d < 1 or d > 31)
    return false;
  if (d > 30 and (m == 4 or m == 6 or m == 9 or m == 11))
    return false;
  if (m == 2) {
    if (d > 29)
      return false;
    if (d == 29 and not is_leap_year(y))
      return false;
  }
  return true;
}

// --------------------------------------------------------------- is valid time
/**@brief Test if the passed hour/minute/second combination is a valid time
 * @ingroup date-time
 * @relates Timestamp
 */
constexpr bool is_valid_time(int h, int m, int s) {
  return (h >= 0 and h < 24) and (m >= 0 and m < 60) and (s >= 0 and s < 60);
}

// ----------------------------------------------------------------- day of year
/**@brief The day of the year, for example, Jan/1 is the 0th day of the year.
 * @ingroup date-time
 * @relates Timestamp
 */
constexpr int day_of_year(int y, int m, int d) {
  assert(is_valid_date(y, m, d));
  int ret = (d - 1) + (m > 2 && is_leap_year(y) ? 1 : 0);
  constexpr std::array<int, 12> L{{0, 31, 59, 90, 120, 151, 181, 212, 243, 273, 304, 334}};
  if (m >= 1 && m <= 12)
    ret += L[size_t(m - 1)];
  return ret;
}

// --------------------------------------------------------------- Seconds to TM
/**@brief Converts "seconds from epoch" to a `std::tm` struct
 * @ingroup date-time
 * @relates Timestamp
 * @author The developers of MUSL libc, MIT license.
 */
constexpr bool seconds_to_tm(int64_t t, std::tm* tm) {
  // 2000-03-01 (mod 400 year, immediately after feb29
  constexpr int64_t LEAPOCH = (946684800LL + 86400 * (31 + 29));
  constexpr int64_t DAYS_PER_400Y = (365 * 400 + 97);
  constexpr int64_t DAYS_PER_100Y = (365 * 100 + 24);
  constexpr int64_t DAYS_PER_4Y = (365 * 4 + 1);
  constexpr int8_t k_days_in_month[] = {31, 30, 31, 30, 31, 31, 30, 31, 30, 31, 31, 29};

  // Reject time_t values whose year would overflow int
  if (t < INT_MIN * 31622400LL || t > INT_MAX * 31622400LL)
    return false;

  int64_t secs = t - LEAPOCH;
  int64_t days = secs / 86400;
  int remsecs = int(secs % 86400);
  if (remsecs < 0) {
    remsecs += 86400;
    days--;
  }

  int wday = int((3 + days) % 7);
  if (wday < 0)
    wday += 7;

  int qc_cycles = int(days / DAYS_PER_400Y);
  int remdays = int(days % DAYS_PER_400Y);
  if (remdays < 0) {
    remdays += DAYS_PER_400Y;
    qc_cycles--;
  }

  int c_cycles = remdays / DAYS_PER_100Y;
  if (c_cycles == 4)
    c_cycles--;
  remdays -= c_cycles * DAYS_PER_100Y;

  int q_cycles = remdays / DAYS_PER_4Y;
  if (q_cycles == 25)
    q_cycles--;
  remdays -= q_cycles * DAYS_PER_4Y;

  int remyears = remdays / 365;
  if (remyears == 4)
    remyears--;
  remdays -= remyears * 365;

  const int leap = !remyears and (q_cycles or !c_cycles);
  int yday = remdays + 31 + 28 + leap;
  if (yday >= 365 + leap)
    yday -= 365 + leap;

  const int years = remyears + 4 * q_cycles + 100 * c_cycles + 400 * qc_cycles;

  int months = 0;
  for (; k_days_in_month[months] <= remdays; months++)
    remdays -= k_days_in_month[months];

  tm->tm_year = years + 100;
  tm->tm_mon = months + 2;
  if (tm->tm_mon >= 12) {
    tm->tm_mon -= 12;
    tm->tm_year++;
  }
  tm->tm_mday = remdays + 1;
  tm->tm_wday = wday;
  tm->tm_yday = yday;

  tm->tm_hour = remsecs / 3600;
  tm->tm_min = remsecs / 60 % 60;
  tm->tm_sec = remsecs % 60;

  return true;
}

// --------------------------------------------------------- datetime to seconds
/**@brief Converts a year/month/day/hour/min/second to "seconds from epoch".
 * @ingroup date-time
 * @relates Timestamp
 */
constexpr int64_t datetime_to_seconds(int y, int m, int d, int H, int M, int S) {
  assert(is_valid_date(y, m, d));
  assert(is_valid_time(H, M, S));
  // Days from 1970-01-01 to Jan/1 of year `y`
  int64_t days = 0;
  if (y >= 1970) {
    for (int year = 1970; year < y; ++year)
      days += is_leap_year(year) ? 366 : 365;
  } else {
    for (int year = y; year < 1970; ++year)
      days -= is_leap_year(year) ? 366 : 365;
  }
  days += day_of_year(y, m, d);
  return days * 86400LL + 3600LL * H + 60LL * M + S;
}

} // namespace miniocpp
