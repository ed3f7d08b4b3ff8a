#pragma once

// Legacy packed date/time conversions

#include <cstdint>
#include <optional>
#include <string>

#include "arcio/error.h"

namespace arcio::core {

enum class DateTimeKind : uint8_t {
  kUnspecified = 0,
  kLocal,
  kUtc,
};

// Broken-down calendar timestamp. The default value (0001-01-01T00:00:00,
// unspecified kind) is what malformed packed input decodes to.
struct DateTime {
  int32_t year{1};
  int32_t month{1};
  int32_t day{1};
  int32_t hour{0};
  int32_t minute{0};
  int32_t second{0};
  DateTimeKind kind{DateTimeKind::kUnspecified};

  friend bool operator==(const DateTime&, const DateTime&) = default;
};

inline constexpr uint16_t kDosFieldSentinel = 0xFFFF;
inline constexpr int32_t kDosEpochYear = 1980;
inline constexpr int32_t kDosMaxYear = kDosEpochYear + 127;

[[nodiscard]] constexpr bool IsLeapYear(int32_t year) noexcept {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

[[nodiscard]] constexpr int32_t DaysInMonth(int32_t year, int32_t month) noexcept {
  constexpr int32_t kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month < 1 || month > 12) {
    return 0;
  }
  return (month == 2 && IsLeapYear(year)) ? 29 : kDays[month - 1];
}

// Calendar validity over the supported range (years 1..9999).
[[nodiscard]] bool IsValidDateTime(const DateTime& value) noexcept;

// Decodes a packed DOS date and time. A sentinel (0xFFFF) date or a zero
// month/day falls back to 1980-01-01; a sentinel time falls back to midnight.
// Fields that still do not form a valid calendar value yield DateTime{}.
// Never throws. The result is local-time qualified.
[[nodiscard]] DateTime DosDateToDateTime(uint16_t date, uint16_t time);

// |packed| carries the date in its high 16 bits and the time in the low 16.
[[nodiscard]] DateTime DosDateToDateTime(uint32_t packed);

// Packs |value| (converted to local time first) into the combined 32-bit DOS
// layout. Returns 0 for nullopt. Throws arcio::Error (Validation/kOutOfRange)
// when the local year falls outside [1980, 2107].
[[nodiscard]] uint32_t DateTimeToDosTime(const std::optional<DateTime>& value);

// 1970-01-01T00:00:00Z plus |seconds|. Throws arcio::Error
// (Validation/kTimestampOverflow) outside years 1..9999.
[[nodiscard]] DateTime UnixTimeToDateTime(int64_t seconds);

// Seconds since the Unix epoch. Local values go through the process time
// zone; UTC and unspecified values are read as UTC. Invalid calendar fields
// throw Validation/kOutOfRange; a local time the platform cannot convert
// throws Validation/kTimestampOverflow.
[[nodiscard]] int64_t DateTimeToUnixTime(const DateTime& value);

// Converts to the process time zone. Local values are returned unchanged,
// unspecified values are treated as UTC.
[[nodiscard]] DateTime ToLocalTime(const DateTime& value);

[[nodiscard]] std::string FormatIso8601(const DateTime& value);

}  // namespace arcio::core
