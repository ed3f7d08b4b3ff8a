#include "arcio/core/dos_time.h"

#include <cstdio>
#include <ctime>
#include <string>

#include "arcio/diag/event_bus.h"
#include "arcio/errors.h"

namespace arcio::core {
namespace {

constexpr int64_t kSecondsPerDay = 86400;
constexpr int64_t kMinSupportedDays = -719162;  // 0001-01-01
constexpr int64_t kMaxSupportedDays = 2932896;  // 9999-12-31

// Days since 1970-01-01 for a proleptic Gregorian date.
constexpr int64_t DaysFromCivil(int64_t y, int64_t m, int64_t d) noexcept {
  y -= m <= 2 ? 1 : 0;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const int64_t yoe = y - era * 400;
  const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

struct CivilDate {
  int64_t year;
  int32_t month;
  int32_t day;
};

constexpr CivilDate CivilFromDays(int64_t z) noexcept {
  z += 719468;
  const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const int64_t doe = z - era * 146097;
  const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const int64_t mp = (5 * doy + 2) / 153;
  const int64_t d = doy - (153 * mp + 2) / 5 + 1;
  const int64_t m = mp < 10 ? mp + 3 : mp - 9;
  return CivilDate{yoe + era * 400 + (m <= 2 ? 1 : 0), static_cast<int32_t>(m), static_cast<int32_t>(d)};
}

static_assert(DaysFromCivil(1970, 1, 1) == 0, "epoch anchor");
static_assert(DaysFromCivil(1, 1, 1) == kMinSupportedDays, "lower calendar bound");
static_assert(DaysFromCivil(9999, 12, 31) == kMaxSupportedDays, "upper calendar bound");

int64_t FloorDiv(int64_t value, int64_t divisor) noexcept {
  int64_t q = value / divisor;
  if ((value % divisor) != 0 && ((value < 0) != (divisor < 0))) {
    --q;
  }
  return q;
}

DateTime FromTm(const std::tm& tm, DateTimeKind kind) {
  DateTime out;
  out.year = tm.tm_year + 1900;
  out.month = tm.tm_mon + 1;
  out.day = tm.tm_mday;
  out.hour = tm.tm_hour;
  out.minute = tm.tm_min;
  out.second = tm.tm_sec > 59 ? 59 : tm.tm_sec;  // leap second
  out.kind = kind;
  return out;
}

int64_t UtcFieldsToSeconds(const DateTime& value) noexcept {
  return DaysFromCivil(value.year, value.month, value.day) * kSecondsPerDay +
         static_cast<int64_t>(value.hour) * 3600 + static_cast<int64_t>(value.minute) * 60 + value.second;
}

void PublishFallback(uint16_t date, uint16_t time) {
  diag::Event event;
  event.category = diag::EventCategory::kDiagnostics;
  event.severity = diag::EventSeverity::kDebug;
  event.event_id = "dos_time_fallback";
  event.message = "Packed DOS timestamp is not a valid calendar value; using default";
  event.fields.emplace_back("dos_date", std::to_string(date), diag::FieldPrivacy::kPublic, true);
  event.fields.emplace_back("dos_time", std::to_string(time), diag::FieldPrivacy::kPublic, true);
  diag::EventBus::Instance().Publish(event);
}

}  // namespace

bool IsValidDateTime(const DateTime& value) noexcept {
  if (value.year < 1 || value.year > 9999) {
    return false;
  }
  if (value.month < 1 || value.month > 12) {
    return false;
  }
  if (value.day < 1 || value.day > DaysInMonth(value.year, value.month)) {
    return false;
  }
  return value.hour >= 0 && value.hour <= 23 && value.minute >= 0 && value.minute <= 59 &&
         value.second >= 0 && value.second <= 59;
}

DateTime DosDateToDateTime(uint16_t date, uint16_t time) {
  DateTime result;
  result.year = (date >> 9) + kDosEpochYear;
  result.month = (date >> 5) & 0x0F;
  result.day = date & 0x1F;
  result.hour = time >> 11;
  result.minute = (time >> 5) & 0x3F;
  result.second = (time & 0x1F) * 2;
  result.kind = DateTimeKind::kLocal;

  if (date == kDosFieldSentinel || result.month == 0 || result.day == 0) {
    result.year = kDosEpochYear;
    result.month = 1;
    result.day = 1;
  }
  if (time == kDosFieldSentinel) {
    result.hour = 0;
    result.minute = 0;
    result.second = 0;
  }

  // Malformed legacy headers decode to the default value instead of failing.
  if (!IsValidDateTime(result)) {
    PublishFallback(date, time);
    return DateTime{};
  }
  return result;
}

DateTime DosDateToDateTime(uint32_t packed) {
  return DosDateToDateTime(static_cast<uint16_t>(packed >> 16), static_cast<uint16_t>(packed & 0xFFFFu));
}

uint32_t DateTimeToDosTime(const std::optional<DateTime>& value) {
  if (!value) {
    return 0;
  }
  const DateTime local = ToLocalTime(*value);
  if (local.year < kDosEpochYear || local.year > kDosMaxYear) {
    ThrowOutOfRange(std::string(errors::msg::kDosYearOutOfRange) + ": " + std::to_string(local.year));
  }
  return static_cast<uint32_t>(local.second / 2) |
         (static_cast<uint32_t>(local.minute) << 5) |
         (static_cast<uint32_t>(local.hour) << 11) |
         (static_cast<uint32_t>(local.day) << 16) |
         (static_cast<uint32_t>(local.month) << 21) |
         (static_cast<uint32_t>(local.year - kDosEpochYear) << 25);
}

DateTime UnixTimeToDateTime(int64_t seconds) {
  const int64_t days = FloorDiv(seconds, kSecondsPerDay);
  if (days < kMinSupportedDays || days > kMaxSupportedDays) {
    throw Error{ErrorDomain::Validation, errors::validation::kTimestampOverflow,
                std::string(errors::msg::kUnixTimeOverflow) + ": " + std::to_string(seconds)};
  }
  const int64_t remainder = seconds - days * kSecondsPerDay;
  const CivilDate civil = CivilFromDays(days);

  DateTime out;
  out.year = static_cast<int32_t>(civil.year);
  out.month = civil.month;
  out.day = civil.day;
  out.hour = static_cast<int32_t>(remainder / 3600);
  out.minute = static_cast<int32_t>((remainder % 3600) / 60);
  out.second = static_cast<int32_t>(remainder % 60);
  out.kind = DateTimeKind::kUtc;
  return out;
}

int64_t DateTimeToUnixTime(const DateTime& value) {
  if (!IsValidDateTime(value)) {
    ThrowOutOfRange(std::string(errors::msg::kInvalidCalendarValue) + ": " + FormatIso8601(value));
  }
  if (value.kind != DateTimeKind::kLocal) {
    return UtcFieldsToSeconds(value);
  }
  std::tm tm{};
  tm.tm_year = value.year - 1900;
  tm.tm_mon = value.month - 1;
  tm.tm_mday = value.day;
  tm.tm_hour = value.hour;
  tm.tm_min = value.minute;
  tm.tm_sec = value.second;
  tm.tm_isdst = -1;
  tm.tm_wday = -1;  // mktime sets it on success; -1 is also a valid result
  const std::time_t tt = std::mktime(&tm);
  if (tt == static_cast<std::time_t>(-1) && tm.tm_wday == -1) {
    throw Error{ErrorDomain::Validation, errors::validation::kTimestampOverflow,
                std::string(errors::msg::kUnixTimeOverflow) + ": " + FormatIso8601(value)};
  }
  return static_cast<int64_t>(tt);
}

DateTime ToLocalTime(const DateTime& value) {
  if (value.kind == DateTimeKind::kLocal) {
    return value;
  }
  const auto tt = static_cast<std::time_t>(UtcFieldsToSeconds(value));
  std::tm tm{};
#if defined(_WIN32)
  const bool converted = localtime_s(&tm, &tt) == 0;
#else
  const bool converted = localtime_r(&tt, &tm) != nullptr;
#endif
  if (!converted) {
    ThrowOutOfRange(std::string(errors::msg::kUnixTimeOverflow) + ": " + FormatIso8601(value));
  }
  return FromTm(tm, DateTimeKind::kLocal);
}

std::string FormatIso8601(const DateTime& value) {
  char buf[40] = {0};
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d%s", value.year, value.month, value.day,
                value.hour, value.minute, value.second, value.kind == DateTimeKind::kUtc ? "Z" : "");
  return std::string(buf);
}

}  // namespace arcio::core
