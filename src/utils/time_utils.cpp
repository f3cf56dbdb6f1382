#include "utils/time_utils.h"
#include <cctype>
#include <cstdio>

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date.
int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
  y -= m <= 2;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civilFromDays(int64_t z, int64_t &y, unsigned &m, unsigned &d) {
  z += 719468;
  const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  y = static_cast<int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  d = doy - (153 * mp + 2) / 5 + 1;
  m = mp < 10 ? mp + 3 : mp - 9;
  y += m <= 2;
}

bool readDigits(std::string_view text, size_t &pos, size_t count,
                int &value) {
  if (pos + count > text.size())
    return false;
  value = 0;
  for (size_t i = 0; i < count; ++i) {
    char c = text[pos + i];
    if (!std::isdigit(static_cast<unsigned char>(c)))
      return false;
    value = value * 10 + (c - '0');
  }
  pos += count;
  return true;
}

bool expect(std::string_view text, size_t &pos, char c) {
  if (pos < text.size() && text[pos] == c) {
    ++pos;
    return true;
  }
  return false;
}

unsigned daysInMonth(int64_t year, unsigned month) {
  static const unsigned days[] = {31, 28, 31, 30, 31, 30,
                                  31, 31, 30, 31, 30, 31};
  if (month == 2) {
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return leap ? 29 : 28;
  }
  return days[month - 1];
}

} // namespace

namespace TimeUtils {

std::string toIso8601(std::chrono::system_clock::time_point tp) {
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                    tp.time_since_epoch())
                    .count();
  micros -= micros % 1000;
  return formatDateTimeMicros(micros, 'T', true);
}

std::optional<int64_t> parseDateTimeMicros(std::string_view text) {
  size_t pos = 0;
  int year = 0, month = 0, day = 0;
  if (!readDigits(text, pos, 4, year) || !expect(text, pos, '-') ||
      !readDigits(text, pos, 2, month) || !expect(text, pos, '-') ||
      !readDigits(text, pos, 2, day))
    return std::nullopt;
  if (month < 1 || month > 12 || day < 1 ||
      static_cast<unsigned>(day) >
          daysInMonth(year, static_cast<unsigned>(month)))
    return std::nullopt;

  int hour = 0, minute = 0, second = 0;
  int64_t fractionMicros = 0;
  int64_t offsetSeconds = 0;

  if (pos < text.size() && (text[pos] == ' ' || text[pos] == 'T')) {
    ++pos;
    if (!readDigits(text, pos, 2, hour) || !expect(text, pos, ':') ||
        !readDigits(text, pos, 2, minute))
      return std::nullopt;
    if (expect(text, pos, ':')) {
      if (!readDigits(text, pos, 2, second))
        return std::nullopt;
      if (expect(text, pos, '.')) {
        int64_t scale = 100000;
        size_t digits = 0;
        while (pos < text.size() &&
               std::isdigit(static_cast<unsigned char>(text[pos]))) {
          if (digits < 6) {
            fractionMicros += (text[pos] - '0') * scale;
            scale /= 10;
          }
          ++digits;
          ++pos;
        }
        if (digits == 0)
          return std::nullopt;
      }
    }
    if (hour > 23 || minute > 59 || second > 59)
      return std::nullopt;

    if (expect(text, pos, 'Z')) {
      offsetSeconds = 0;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
      int sign = text[pos] == '-' ? -1 : 1;
      ++pos;
      int offHour = 0, offMinute = 0;
      if (!readDigits(text, pos, 2, offHour))
        return std::nullopt;
      expect(text, pos, ':');
      if (!readDigits(text, pos, 2, offMinute))
        return std::nullopt;
      offsetSeconds = sign * (offHour * 3600 + offMinute * 60);
    }
  }

  if (pos != text.size())
    return std::nullopt;

  int64_t days = daysFromCivil(year, static_cast<unsigned>(month),
                               static_cast<unsigned>(day));
  int64_t seconds =
      days * 86400 + hour * 3600 + minute * 60 + second - offsetSeconds;
  return seconds * 1000000 + fractionMicros;
}

std::string formatDateTimeMicros(int64_t micros, char separator,
                                 bool withZone) {
  int64_t seconds = micros / 1000000;
  int64_t fraction = micros % 1000000;
  if (fraction < 0) {
    fraction += 1000000;
    seconds -= 1;
  }
  int64_t days = seconds / 86400;
  int64_t secOfDay = seconds % 86400;
  if (secOfDay < 0) {
    secOfDay += 86400;
    days -= 1;
  }

  int64_t year;
  unsigned month, day;
  civilFromDays(days, year, month, day);

  char buf[64];
  std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u%c%02lld:%02lld:%02lld",
                static_cast<long long>(year), month, day, separator,
                static_cast<long long>(secOfDay / 3600),
                static_cast<long long>((secOfDay % 3600) / 60),
                static_cast<long long>(secOfDay % 60));
  std::string result(buf);
  if (fraction != 0) {
    std::snprintf(buf, sizeof(buf), ".%06lld",
                  static_cast<long long>(fraction));
    result += buf;
  }
  if (withZone)
    result += 'Z';
  return result;
}

} // namespace TimeUtils
