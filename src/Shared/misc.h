/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace lqe {

template <typename... Ts>
std::string cat(Ts&&... args) {
  std::ostringstream oss;
  (oss << ... << std::forward<Ts>(args));
  return oss.str();
}

template <typename T, typename ToStringFn>
std::string join(const std::vector<T>& vals, const std::string& sep, ToStringFn fn) {
  std::string res;
  for (size_t i = 0; i < vals.size(); ++i) {
    if (i) {
      res += sep;
    }
    res += fn(vals[i]);
  }
  return res;
}

inline std::string join(const std::vector<std::string>& vals, const std::string& sep) {
  return join(vals, sep, [](const std::string& s) { return s; });
}

// Number of chunks of the given size required to cover n elements.
inline size_t chunk_count(size_t n, size_t chunk_size) {
  return chunk_size ? (n + chunk_size - 1) / chunk_size : 0;
}

}  // namespace lqe
