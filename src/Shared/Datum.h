/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace lqe {

// Value of a literal or of a single column cell. Booleans, integers, dates and
// timestamps are held in the integer alternative; monostate is null.
using Datum = std::variant<std::monostate, int64_t, double, std::string>;

inline bool isNull(const Datum& d) {
  return std::holds_alternative<std::monostate>(d);
}

}  // namespace lqe
