/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace lqe::ir {

constexpr int64_t kMicrosecsPerSec = 1'000'000;
constexpr int64_t kMicrosecsPerDay = 86'400 * kMicrosecsPerSec;

struct CivilDate {
  int64_t year;
  unsigned month;  // [1, 12]
  unsigned day;    // [1, 31]
};

int64_t daysFromCivil(int64_t year, unsigned month, unsigned day);
CivilDate civilFromDays(int64_t days);

// Floor division of a timestamp to days.
int64_t timestampToDays(int64_t micros);

// Parses YYYY-MM-DD.
std::optional<int64_t> parseDate(const std::string& str);
// Parses YYYY-MM-DD[( |T)HH:MM:SS[.ffffff]].
std::optional<int64_t> parseTimestamp(const std::string& str);

std::string formatDate(int64_t days);
std::string formatTimestamp(int64_t micros);

/**
 * Calendar duration. Months are added in calendar terms: the day of month is kept
 * and clamped to the length of the target month. Days are added as 24 hours.
 */
struct Duration {
  int64_t months = 0;
  int64_t days = 0;
  int64_t micros = 0;

  bool isZero() const { return !months && !days && !micros; }
  bool isNegative() const { return months < 0 || days < 0 || micros < 0; }

  Duration operator*(int64_t factor) const {
    return {months * factor, days * factor, micros * factor};
  }

  // Timestamp shifted by the duration.
  int64_t addTo(int64_t micros) const;
  std::string toString() const;
};

// Parses a sequence of <integer><unit> pairs with an optional leading minus, e.g.
// "1d", "3d12h" or "-15m". Units: us, ms, s, m, h, d, w, mo, q, y.
std::optional<Duration> parseDuration(const std::string& str);

}  // namespace lqe::ir
