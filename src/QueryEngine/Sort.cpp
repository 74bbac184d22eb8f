/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "Sort.h"

#include "Logger/Logger.h"
#include "Shared/ThreadPool.h"

#include <tbb/parallel_sort.h>

#include <algorithm>
#include <numeric>

namespace lqe {

std::vector<int64_t> sortIndices(const std::vector<ColumnPtr>& keys,
                                 const std::vector<SortOrder>& order,
                                 size_t num_rows,
                                 bool parallel,
                                 std::optional<size_t> limit,
                                 size_t offset) {
  CHECK_EQ(keys.size(), order.size());
  for (auto& key : keys) {
    CHECK_EQ(key->size(), num_rows);
  }

  std::vector<int64_t> indices(num_rows);
  std::iota(indices.begin(), indices.end(), 0);
  // Ties are broken by the row position, which makes unstable sorts stable.
  // Rows with a null descending leading key are taken in reverse order.
  bool reverse_nulls = !order.empty() && order.front().descending;
  auto less = [&](int64_t lhs, int64_t rhs) {
    auto cmp = compareRows(keys, order, lhs, rhs);
    if (cmp) {
      return cmp < 0;
    }
    if (reverse_nulls && keys.front()->isNull(lhs)) {
      return lhs > rhs;
    }
    return lhs < rhs;
  };

  if (limit) {
    auto end = std::min(num_rows, offset + *limit);
    std::partial_sort(indices.begin(), indices.begin() + end, indices.end(), less);
    indices.resize(end);
    indices.erase(indices.begin(), indices.begin() + std::min(offset, end));
    return indices;
  }

  if (parallel) {
    threading::ThreadPool::instance().execute(
        [&] { tbb::parallel_sort(indices.begin(), indices.end(), less); });
  } else {
    std::sort(indices.begin(), indices.end(), less);
  }
  if (offset) {
    indices.erase(indices.begin(), indices.begin() + std::min(offset, indices.size()));
  }
  return indices;
}

bool isSorted(const Column& key, const std::vector<int64_t>& rows) {
  int64_t prev = -1;
  for (auto row : rows) {
    if (key.isNull(row)) {
      continue;
    }
    if (prev >= 0 && compareValues(key, prev, key, row) > 0) {
      return false;
    }
    prev = row;
  }
  return true;
}

}  // namespace lqe
