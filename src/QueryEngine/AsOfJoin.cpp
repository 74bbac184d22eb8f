/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "AsOfJoin.h"
#include "Aggregator.h"
#include "Sort.h"

#include "IR/Exception.h"
#include "Logger/Logger.h"

#include <algorithm>
#include <cmath>

namespace lqe {

using namespace ir;

namespace {

// Rows with non-null keys and 'by' values per group.
std::vector<std::vector<int64_t>> groupRows(const Column& key,
                                            const std::vector<ColumnPtr>& by,
                                            const GroupIds& groups,
                                            size_t num_groups) {
  std::vector<std::vector<int64_t>> res(num_groups);
  for (size_t row = 0; row < key.size(); ++row) {
    if (!key.isNull(row) && !rowHasNull(by, row)) {
      res[groups[row]].push_back(row);
    }
  }
  return res;
}

void checkSorted(const Column& key,
                 const std::vector<std::vector<int64_t>>& groups,
                 const char* side) {
  for (auto& rows : groups) {
    if (!isSorted(key, rows)) {
      throw ComputeError() << "As-of join requires the " << side
                           << " key to be sorted in ascending order.";
    }
  }
}

}  // namespace

JoinMatches asofJoinMatches(ColumnPtr left_key,
                            ColumnPtr right_key,
                            std::vector<ColumnPtr> left_by,
                            std::vector<ColumnPtr> right_by,
                            const AsOfOptions& options) {
  std::vector<ColumnPtr> left_keys{left_key};
  std::vector<ColumnPtr> right_keys{right_key};
  unifyKeyTypes(left_keys, right_keys);
  left_key = left_keys.front();
  right_key = right_keys.front();
  unifyKeyTypes(left_by, right_by);

  auto left_rows = left_key->size();
  auto right_rows = right_key->size();
  GroupIds left_groups(left_rows, 0);
  GroupIds right_groups(right_rows, 0);
  size_t num_groups = 1;
  if (!left_by.empty()) {
    GroupTable table(left_by.size());
    table.insert(right_by, right_rows, right_groups);
    table.insert(left_by, left_rows, left_groups);
    num_groups = table.size();
  }

  auto right_group_rows = groupRows(*right_key, right_by, right_groups, num_groups);
  checkSorted(*right_key, right_group_rows, "right");
  checkSorted(
      *left_key, groupRows(*left_key, left_by, left_groups, num_groups), "left");

  auto& lkey = *left_key;
  auto& rkey = *right_key;
  auto within_tolerance = [&](size_t lrow, int64_t rrow) {
    if (!options.tolerance) {
      return true;
    }
    return std::abs(lkey.numAt(lrow) - rkey.numAt(rrow)) <= *options.tolerance;
  };

  JoinMatches res;
  res.probe.reserve(left_rows);
  res.build.reserve(left_rows);
  for (size_t lrow = 0; lrow < left_rows; ++lrow) {
    res.probe.push_back(lrow);
    res.build.push_back(-1);
    if (lkey.isNull(lrow) || rowHasNull(left_by, lrow)) {
      continue;
    }
    auto& candidates = right_group_rows[left_groups[lrow]];
    // First candidate with a key greater than the left key.
    auto after = std::partition_point(
        candidates.begin(), candidates.end(), [&](int64_t rrow) {
          return compareValues(rkey, rrow, lkey, lrow) <= 0;
        });
    // First candidate with a key not less than the left key.
    auto not_before = std::partition_point(
        candidates.begin(), candidates.end(), [&](int64_t rrow) {
          return compareValues(rkey, rrow, lkey, lrow) < 0;
        });
    int64_t backward = after == candidates.begin() ? -1 : *(after - 1);
    int64_t forward = not_before == candidates.end() ? -1 : *not_before;

    int64_t match = -1;
    switch (options.strategy) {
      case AsOfStrategy::kBackward:
        match = backward;
        break;
      case AsOfStrategy::kForward:
        match = forward;
        break;
      case AsOfStrategy::kNearest:
        if (backward < 0 || forward < 0) {
          match = backward < 0 ? forward : backward;
        } else {
          auto back_dist = lkey.numAt(lrow) - rkey.numAt(backward);
          auto fwd_dist = rkey.numAt(forward) - lkey.numAt(lrow);
          match = fwd_dist < back_dist ? forward : backward;
        }
        break;
    }
    if (match >= 0 && within_tolerance(lrow, match)) {
      res.build.back() = match;
    }
  }
  return res;
}

}  // namespace lqe
