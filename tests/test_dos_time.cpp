#include "arcio/core/dos_time.h"

#include <cassert>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <limits>
#include <optional>

#include "arcio/error.h"

namespace {

using arcio::core::DateTime;
using arcio::core::DateTimeKind;

constexpr uint16_t PackDate(int year, int month, int day) {
  return static_cast<uint16_t>(((year - 1980) << 9) | (month << 5) | day);
}

constexpr uint16_t PackTime(int hour, int minute, int second) {
  return static_cast<uint16_t>((hour << 11) | (minute << 5) | (second / 2));
}

void UseUtcTimeZone() {
#if defined(_WIN32)
  _putenv_s("TZ", "UTC");
  _tzset();
#else
  setenv("TZ", "UTC", 1);
  tzset();
#endif
}

void TestDecodeKnownValue() {
  const DateTime decoded = arcio::core::DosDateToDateTime(PackDate(2023, 7, 15), PackTime(13, 45, 30));
  assert(decoded.year == 2023 && decoded.month == 7 && decoded.day == 15);
  assert(decoded.hour == 13 && decoded.minute == 45 && decoded.second == 30);
  assert(decoded.kind == DateTimeKind::kLocal);

  const uint32_t packed = (static_cast<uint32_t>(PackDate(2023, 7, 15)) << 16) | PackTime(13, 45, 30);
  assert(arcio::core::DosDateToDateTime(packed) == decoded && "combined form must split high/low halves");
}

void TestSentinelFallbacks() {
  const DateTime no_date = arcio::core::DosDateToDateTime(arcio::core::kDosFieldSentinel, PackTime(8, 9, 10));
  assert(no_date.year == 1980 && no_date.month == 1 && no_date.day == 1);
  assert(no_date.hour == 8 && no_date.minute == 9 && no_date.second == 10);

  const DateTime no_time = arcio::core::DosDateToDateTime(PackDate(2001, 2, 3), arcio::core::kDosFieldSentinel);
  assert(no_time.year == 2001 && no_time.month == 2 && no_time.day == 3);
  assert(no_time.hour == 0 && no_time.minute == 0 && no_time.second == 0);

  const DateTime zero = arcio::core::DosDateToDateTime(0, 0);
  assert(zero.year == 1980 && zero.month == 1 && zero.day == 1 && zero.hour == 0);
  assert(zero.kind == DateTimeKind::kLocal);

  const DateTime zero_day = arcio::core::DosDateToDateTime(PackDate(1999, 5, 0), 0);
  assert(zero_day.year == 1980 && zero_day.month == 1 && zero_day.day == 1 &&
         "a zero day must fall back to the DOS epoch date");
}

void TestInvalidFieldsDecodeToDefault() {
  assert(arcio::core::DosDateToDateTime(PackDate(2021, 2, 31), 0) == DateTime{});
  assert(arcio::core::DosDateToDateTime(PackDate(2021, 2, 29), 0) == DateTime{} && "2021 is not a leap year");
  assert(arcio::core::DosDateToDateTime(PackDate(2020, 2, 29), 0).day == 29);
  assert(arcio::core::DosDateToDateTime(PackDate(2020, 13, 1), 0) == DateTime{});
  assert(arcio::core::DosDateToDateTime(PackDate(2020, 1, 1), static_cast<uint16_t>(24 << 11)) == DateTime{});
  assert(arcio::core::DosDateToDateTime(PackDate(2020, 1, 1), static_cast<uint16_t>(60 << 5)) == DateTime{});
  assert(arcio::core::DosDateToDateTime(PackDate(2020, 1, 1), static_cast<uint16_t>(30)) == DateTime{} &&
         "second field 30 encodes 60 seconds");
}

void TestLocalRoundTrip() {
  const int days[] = {1, 15, 28};
  for (int year = 1980; year <= 2107; year += 7) {
    for (int month = 1; month <= 12; ++month) {
      for (int day : days) {
        DateTime value;
        value.year = year;
        value.month = month;
        value.day = day;
        value.hour = (year + month) % 24;
        value.minute = (day * 7) % 60;
        value.second = (month * 4) % 60;
        value.kind = DateTimeKind::kLocal;
        const uint32_t packed = arcio::core::DateTimeToDosTime(value);
        assert(arcio::core::DosDateToDateTime(packed) == value);
      }
    }
  }

  DateTime last_day;
  last_day.year = 2107;
  last_day.month = 12;
  last_day.day = 31;
  last_day.hour = 23;
  last_day.minute = 59;
  last_day.second = 58;
  last_day.kind = DateTimeKind::kLocal;
  assert(arcio::core::DosDateToDateTime(arcio::core::DateTimeToDosTime(last_day)) == last_day);
}

void TestOddSecondsTruncate() {
  DateTime value;
  value.year = 2010;
  value.month = 6;
  value.day = 6;
  value.hour = 6;
  value.minute = 6;
  value.second = 7;
  value.kind = DateTimeKind::kLocal;
  const DateTime decoded = arcio::core::DosDateToDateTime(arcio::core::DateTimeToDosTime(value));
  assert(decoded.second == 6 && "DOS time stores two-second resolution");
}

void TestEncodeAbsentAndOutOfRange() {
  assert(arcio::core::DateTimeToDosTime(std::nullopt) == 0);

  DateTime early;
  early.year = 1979;
  early.month = 12;
  early.day = 31;
  early.kind = DateTimeKind::kLocal;
  bool threw = false;
  try {
    (void)arcio::core::DateTimeToDosTime(early);
  } catch (const arcio::Error& error) {
    threw = error.code == arcio::errors::validation::kOutOfRange;
  }
  assert(threw && "years before 1980 cannot be packed");

  DateTime late = early;
  late.year = 2108;
  late.month = 1;
  late.day = 1;
  threw = false;
  try {
    (void)arcio::core::DateTimeToDosTime(late);
  } catch (const arcio::Error& error) {
    threw = arcio::IsInvalidArgument(error);
  }
  assert(threw && "years after 2107 overflow the seven-bit year field");
}

void TestUtcValuesConvertToLocal() {
  UseUtcTimeZone();
  DateTime utc;
  utc.year = 2020;
  utc.month = 2;
  utc.day = 29;
  utc.hour = 10;
  utc.minute = 20;
  utc.second = 30;
  utc.kind = DateTimeKind::kUtc;
  const DateTime decoded = arcio::core::DosDateToDateTime(arcio::core::DateTimeToDosTime(utc));
  assert(decoded.year == 2020 && decoded.month == 2 && decoded.day == 29);
  assert(decoded.hour == 10 && decoded.minute == 20 && decoded.second == 30);

  const DateTime local = arcio::core::ToLocalTime(utc);
  assert(local.kind == DateTimeKind::kLocal && local.hour == 10);
  assert(arcio::core::DateTimeToUnixTime(local) == arcio::core::DateTimeToUnixTime(utc));
}

void TestUnixTimeConversion() {
  const DateTime epoch = arcio::core::UnixTimeToDateTime(0);
  assert(epoch.year == 1970 && epoch.month == 1 && epoch.day == 1 && epoch.hour == 0);
  assert(epoch.kind == DateTimeKind::kUtc);

  const DateTime sample = arcio::core::UnixTimeToDateTime(1700000000);
  assert(arcio::core::FormatIso8601(sample) == "2023-11-14T22:13:20Z");
  assert(arcio::core::DateTimeToUnixTime(sample) == 1700000000);

  const DateTime before_epoch = arcio::core::UnixTimeToDateTime(-1);
  assert(arcio::core::FormatIso8601(before_epoch) == "1969-12-31T23:59:59Z");

  const DateTime upper = arcio::core::UnixTimeToDateTime(253402300799);
  assert(arcio::core::FormatIso8601(upper) == "9999-12-31T23:59:59Z");
  const DateTime lower = arcio::core::UnixTimeToDateTime(-62135596800);
  assert(arcio::core::FormatIso8601(lower) == "0001-01-01T00:00:00Z");
}

void TestDateTimeToUnixTimeChecksInput() {
  UseUtcTimeZone();
  DateTime local;
  local.year = 1969;
  local.month = 12;
  local.day = 31;
  local.hour = 23;
  local.minute = 59;
  local.second = 59;
  local.kind = DateTimeKind::kLocal;
  assert(arcio::core::DateTimeToUnixTime(local) == -1 && "one second before the epoch is a real result");

  DateTime bad = local;
  bad.month = 2;
  bad.day = 30;
  bool rejected = false;
  try {
    (void)arcio::core::DateTimeToUnixTime(bad);
  } catch (const arcio::Error& error) {
    rejected = error.code == arcio::errors::validation::kOutOfRange;
  }
  assert(rejected && "invalid local fields must not be normalized silently");

  bad.kind = DateTimeKind::kUtc;
  bad.day = 1;
  bad.hour = 24;
  rejected = false;
  try {
    (void)arcio::core::DateTimeToUnixTime(bad);
  } catch (const arcio::Error& error) {
    rejected = arcio::IsInvalidArgument(error);
  }
  assert(rejected);
}

void TestUnixTimeOverflow() {
  const int64_t overflowing[] = {253402300800, -62135596801, std::numeric_limits<int64_t>::max(),
                                 std::numeric_limits<int64_t>::min()};
  for (int64_t seconds : overflowing) {
    bool threw = false;
    try {
      (void)arcio::core::UnixTimeToDateTime(seconds);
    } catch (const arcio::Error& error) {
      threw = error.domain == arcio::ErrorDomain::Validation &&
              error.code == arcio::errors::validation::kTimestampOverflow;
    }
    assert(threw && "values outside years 1..9999 must report overflow");
  }
}

void TestCalendarHelpers() {
  static_assert(arcio::core::IsLeapYear(2000), "divisible by 400");
  static_assert(!arcio::core::IsLeapYear(1900), "century");
  static_assert(arcio::core::DaysInMonth(2024, 2) == 29, "leap february");
  static_assert(arcio::core::DaysInMonth(2024, 13) == 0, "invalid month");
  assert(arcio::core::IsValidDateTime(DateTime{}));
  DateTime bad;
  bad.second = 60;
  assert(!arcio::core::IsValidDateTime(bad));
}

}  // namespace

int main() {
  TestDecodeKnownValue();
  TestSentinelFallbacks();
  TestInvalidFieldsDecodeToDefault();
  TestLocalRoundTrip();
  TestOddSecondsTruncate();
  TestEncodeAbsentAndOutOfRange();
  TestUtcValuesConvertToLocal();
  TestUnixTimeConversion();
  TestDateTimeToUnixTimeChecksInput();
  TestUnixTimeOverflow();
  TestCalendarHelpers();
  std::cout << "dos time tests ok\n";
  return 0;
}
