/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "DateTime.h"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace lqe::ir {

// Days/civil conversion for the proleptic Gregorian calendar.
int64_t daysFromCivil(int64_t year, unsigned month, unsigned day) {
  year -= month <= 2;
  const int64_t era = (year >= 0 ? year : year - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(year - era * 400);
  const unsigned doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

CivilDate civilFromDays(int64_t days) {
  days += 719468;
  const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(days - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const int64_t year = static_cast<int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned day = doy - (153 * mp + 2) / 5 + 1;
  const unsigned month = mp < 10 ? mp + 3 : mp - 9;
  return {year + (month <= 2), month, day};
}

int64_t timestampToDays(int64_t micros) {
  auto days = micros / kMicrosecsPerDay;
  if (micros % kMicrosecsPerDay < 0) {
    --days;
  }
  return days;
}

namespace {

unsigned daysInMonth(int64_t year, unsigned month) {
  static const unsigned kDaysInMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
  return kDaysInMonth[month - 1] + (month == 2 && leap ? 1 : 0);
}

bool validDate(int year, int month, int day) {
  if (month < 1 || month > 12 || day < 1) {
    return false;
  }
  return static_cast<unsigned>(day) <= daysInMonth(year, month);
}

}  // namespace

std::optional<int64_t> parseDate(const std::string& str) {
  int year, month, day;
  int consumed = 0;
  if (std::sscanf(str.c_str(), "%d-%d-%d%n", &year, &month, &day, &consumed) != 3 ||
      static_cast<size_t>(consumed) != str.size() || !validDate(year, month, day)) {
    return std::nullopt;
  }
  return daysFromCivil(year, month, day);
}

std::optional<int64_t> parseTimestamp(const std::string& str) {
  if (str.size() == 10) {
    auto days = parseDate(str);
    if (!days) {
      return std::nullopt;
    }
    return *days * kMicrosecsPerDay;
  }
  int year, month, day, hour, minute, second;
  char sep;
  int consumed = 0;
  if (std::sscanf(str.c_str(),
                  "%d-%d-%d%c%d:%d:%d%n",
                  &year,
                  &month,
                  &day,
                  &sep,
                  &hour,
                  &minute,
                  &second,
                  &consumed) != 7 ||
      (sep != ' ' && sep != 'T') || !validDate(year, month, day) || hour < 0 ||
      hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 59) {
    return std::nullopt;
  }
  int64_t micros = 0;
  size_t pos = consumed;
  if (pos < str.size()) {
    if (str[pos] != '.') {
      return std::nullopt;
    }
    int64_t scale = 100'000;
    for (++pos; pos < str.size(); ++pos) {
      if (str[pos] < '0' || str[pos] > '9' || !scale) {
        return std::nullopt;
      }
      micros += (str[pos] - '0') * scale;
      scale /= 10;
    }
  }
  return daysFromCivil(year, month, day) * kMicrosecsPerDay +
         (hour * 3600 + minute * 60 + second) * kMicrosecsPerSec + micros;
}

std::string formatDate(int64_t days) {
  auto date = civilFromDays(days);
  char buf[32];
  std::snprintf(
      buf, sizeof(buf), "%04lld-%02u-%02u", (long long)date.year, date.month, date.day);
  return buf;
}

std::string formatTimestamp(int64_t micros) {
  auto days = timestampToDays(micros);
  int64_t rem = micros - days * kMicrosecsPerDay;
  int64_t secs = rem / kMicrosecsPerSec;
  int64_t frac = rem % kMicrosecsPerSec;
  char buf[64];
  std::snprintf(buf,
                sizeof(buf),
                "%s %02lld:%02lld:%02lld",
                formatDate(days).c_str(),
                (long long)(secs / 3600),
                (long long)(secs / 60 % 60),
                (long long)(secs % 60));
  std::string res(buf);
  if (frac) {
    std::snprintf(buf, sizeof(buf), ".%06lld", (long long)frac);
    res += buf;
  }
  return res;
}

int64_t Duration::addTo(int64_t ts) const {
  if (months) {
    auto days = timestampToDays(ts);
    auto time_of_day = ts - days * kMicrosecsPerDay;
    auto date = civilFromDays(days);
    int64_t month_idx = date.year * 12 + (date.month - 1) + months;
    int64_t year = month_idx >= 0 ? month_idx / 12 : (month_idx - 11) / 12;
    auto month = static_cast<unsigned>(month_idx - year * 12 + 1);
    auto day = std::min(date.day, daysInMonth(year, month));
    ts = daysFromCivil(year, month, day) * kMicrosecsPerDay + time_of_day;
  }
  return ts + days * kMicrosecsPerDay + micros;
}

std::string Duration::toString() const {
  if (isZero()) {
    return "0d";
  }
  std::string res;
  if (months) {
    res += std::to_string(months) + "mo";
  }
  if (days) {
    res += std::to_string(days) + "d";
  }
  if (micros) {
    res += std::to_string(micros) + "us";
  }
  return res;
}

std::optional<Duration> parseDuration(const std::string& str) {
  Duration res;
  size_t pos = 0;
  bool negative = !str.empty() && str.front() == '-';
  if (negative) {
    ++pos;
  }
  if (pos == str.size()) {
    return std::nullopt;
  }
  while (pos < str.size()) {
    auto begin = pos;
    while (pos < str.size() && std::isdigit(static_cast<unsigned char>(str[pos]))) {
      ++pos;
    }
    // Nine digits keep every unit within the int64 range.
    if (pos == begin || pos - begin > 9) {
      return std::nullopt;
    }
    int64_t val = std::stoll(str.substr(begin, pos - begin));
    begin = pos;
    while (pos < str.size() && std::isalpha(static_cast<unsigned char>(str[pos]))) {
      ++pos;
    }
    auto unit = str.substr(begin, pos - begin);
    if (unit == "us") {
      res.micros += val;
    } else if (unit == "ms") {
      res.micros += val * 1000;
    } else if (unit == "s") {
      res.micros += val * kMicrosecsPerSec;
    } else if (unit == "m") {
      res.micros += val * 60 * kMicrosecsPerSec;
    } else if (unit == "h") {
      res.micros += val * 3600 * kMicrosecsPerSec;
    } else if (unit == "d") {
      res.days += val;
    } else if (unit == "w") {
      res.days += val * 7;
    } else if (unit == "mo") {
      res.months += val;
    } else if (unit == "q") {
      res.months += val * 3;
    } else if (unit == "y") {
      res.months += val * 12;
    } else {
      return std::nullopt;
    }
  }
  return negative ? res * -1 : res;
}

}  // namespace lqe::ir
