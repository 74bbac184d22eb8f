/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "HashJoin.h"

#include "IR/TypeUtils.h"
#include "Logger/Logger.h"
#include "Shared/ThreadPool.h"
#include "Shared/misc.h"

namespace lqe {

using namespace ir;

namespace {

// Runs body over row ranges and concatenates per-range results in range order.
template <typename T, typename F>
std::vector<T> collectRanges(size_t num_rows, size_t grain, bool parallel, F&& body) {
  grain = grain ? grain : 1;
  std::vector<T> parts(chunk_count(num_rows, grain));
  threading::parallel_for_ranges(num_rows, grain, parallel, [&](size_t begin, size_t end) {
    body(begin, end, parts[begin / grain]);
  });
  return parts;
}

}  // namespace

HashJoinTable::HashJoinTable(std::vector<ColumnPtr> keys,
                             size_t num_rows,
                             size_t num_partitions,
                             size_t grain,
                             bool parallel)
    : keys_(std::move(keys)), num_rows_(num_rows) {
  num_partitions = std::max<size_t>(num_partitions, 1);
  partitions_.resize(num_partitions);

  std::vector<size_t> hashes(num_rows);
  threading::parallel_for_ranges(num_rows, grain, parallel, [&](size_t begin, size_t end) {
    std::vector<size_t> range_hashes;
    hashRows(keys_, begin, end, range_hashes);
    std::copy(range_hashes.begin(), range_hashes.end(), hashes.begin() + begin);
  });

  threading::parallel_for_each(num_partitions, parallel, [&](size_t part_idx) {
    auto& part = partitions_[part_idx];
    for (size_t row = 0; row < num_rows; ++row) {
      if (hashes[row] % num_partitions == part_idx && !rowHasNull(keys_, row)) {
        part[hashes[row]].push_back(static_cast<uint32_t>(row));
      }
    }
  });
}

const std::vector<uint32_t>* HashJoinTable::find(const std::vector<ColumnPtr>& keys,
                                                 size_t row,
                                                 size_t hash) const {
  if (rowHasNull(keys, row)) {
    return nullptr;
  }
  auto& part = partitions_[hash % partitions_.size()];
  auto it = part.find(hash);
  return it == part.end() ? nullptr : &it->second;
}

void HashJoinTable::probe(const std::vector<ColumnPtr>& keys,
                          size_t begin,
                          size_t end,
                          JoinMatches& matches) const {
  CHECK_EQ(keys.size(), keys_.size());
  std::vector<size_t> hashes;
  hashRows(keys, begin, end, hashes);
  for (size_t row = begin; row < end; ++row) {
    auto rows = find(keys, row, hashes[row - begin]);
    if (!rows) {
      continue;
    }
    for (auto build_row : *rows) {
      if (rowsEqual(keys, row, keys_, build_row, false)) {
        matches.probe.push_back(static_cast<int64_t>(row));
        matches.build.push_back(build_row);
      }
    }
  }
}

JoinMatches HashJoinTable::probeAll(const std::vector<ColumnPtr>& keys,
                                    size_t num_rows,
                                    bool left_outer,
                                    size_t grain,
                                    bool parallel) const {
  auto parts = collectRanges<JoinMatches>(
      num_rows, grain, parallel, [&](size_t begin, size_t end, JoinMatches& res) {
        if (!left_outer) {
          probe(keys, begin, end, res);
          return;
        }
        JoinMatches matches;
        probe(keys, begin, end, matches);
        size_t pos = 0;
        for (size_t row = begin; row < end; ++row) {
          bool matched = false;
          while (pos < matches.size() && matches.probe[pos] == static_cast<int64_t>(row)) {
            res.probe.push_back(matches.probe[pos]);
            res.build.push_back(matches.build[pos]);
            matched = true;
            ++pos;
          }
          if (!matched) {
            res.probe.push_back(static_cast<int64_t>(row));
            res.build.push_back(-1);
          }
        }
      });

  JoinMatches res;
  size_t total = 0;
  for (auto& part : parts) {
    total += part.size();
  }
  res.probe.reserve(total);
  res.build.reserve(total);
  for (auto& part : parts) {
    res.probe.insert(res.probe.end(), part.probe.begin(), part.probe.end());
    res.build.insert(res.build.end(), part.build.begin(), part.build.end());
  }
  return res;
}

std::vector<int64_t> HashJoinTable::filterProbe(const std::vector<ColumnPtr>& keys,
                                                size_t num_rows,
                                                bool anti,
                                                size_t grain,
                                                bool parallel) const {
  auto parts = collectRanges<std::vector<int64_t>>(
      num_rows, grain, parallel, [&](size_t begin, size_t end, std::vector<int64_t>& res) {
        std::vector<size_t> hashes;
        hashRows(keys, begin, end, hashes);
        for (size_t row = begin; row < end; ++row) {
          bool matched = false;
          if (auto rows = find(keys, row, hashes[row - begin])) {
            for (auto build_row : *rows) {
              if (rowsEqual(keys, row, keys_, build_row, false)) {
                matched = true;
                break;
              }
            }
          }
          if (matched != anti) {
            res.push_back(static_cast<int64_t>(row));
          }
        }
      });
  std::vector<int64_t> res;
  for (auto& part : parts) {
    res.insert(res.end(), part.begin(), part.end());
  }
  return res;
}

JoinOutput::JoinOutput(const Join& join, const QueryDag& dag)
    : type_(join.joinType()), schema_(join.schema()), sources_(join.outputSources()) {
  if (type_ != JoinType::kOuter || join.droppedRightColumns().empty()) {
    return;
  }
  auto& arena = dag.exprs();
  auto& left_schema = dag.node(join.input(0))->schema();
  auto& right_schema = dag.node(join.input(1))->schema();
  for (size_t i = 0; i < join.leftKeys().size(); ++i) {
    auto left_ref = arena.get(join.leftKeys()[i])->as<ColumnRef>();
    auto right_ref = arena.get(join.rightKeys()[i])->as<ColumnRef>();
    if (!left_ref || !right_ref) {
      continue;
    }
    auto right_idx = right_schema.indexOfOrThrow(right_ref->name());
    auto& dropped = join.droppedRightColumns();
    if (std::find(dropped.begin(), dropped.end(), right_idx) != dropped.end()) {
      coalesced_[left_schema.indexOfOrThrow(left_ref->name())] = right_idx;
    }
  }
}

Batch JoinOutput::build(const Batch& left,
                        const std::vector<int64_t>& left_rows,
                        const Batch& right,
                        const std::vector<int64_t>& right_rows) const {
  CHECK(right_rows.empty() || right_rows.size() == left_rows.size());
  std::vector<ColumnPtr> cols;
  cols.reserve(sources_.size());
  for (size_t out_idx = 0; out_idx < sources_.size(); ++out_idx) {
    auto& src = sources_[out_idx];
    if (!src.from_left) {
      cols.push_back(take(right.column(src.input_idx), right_rows));
      continue;
    }
    auto it = coalesced_.find(src.input_idx);
    if (it == coalesced_.end()) {
      cols.push_back(take(left.column(src.input_idx), left_rows));
      continue;
    }
    auto& left_col = *left.column(src.input_idx);
    auto& right_col = *right.column(it->second);
    ColumnBuilder builder(left_col.type(), left_rows.size());
    for (size_t i = 0; i < left_rows.size(); ++i) {
      if (left_rows[i] >= 0) {
        builder.appendFrom(left_col, left_rows[i]);
      } else if (right_rows[i] >= 0) {
        builder.appendFrom(right_col, right_rows[i]);
      } else {
        builder.appendNull();
      }
    }
    cols.push_back(builder.finish());
  }
  return Batch(schema_, std::move(cols), left_rows.size());
}

void unifyKeyTypes(std::vector<ColumnPtr>& left_keys, std::vector<ColumnPtr>& right_keys) {
  CHECK_EQ(left_keys.size(), right_keys.size());
  for (size_t i = 0; i < left_keys.size(); ++i) {
    auto left_type = left_keys[i]->type();
    auto right_type = right_keys[i]->type();
    if (left_type->equal(*right_type)) {
      continue;
    }
    auto type = commonTypeOrThrow(left_type, right_type, "join keys");
    left_keys[i] = cast(left_keys[i], type, true);
    right_keys[i] = cast(right_keys[i], type, true);
  }
}

JoinMatches crossJoinMatches(size_t left_rows, size_t right_rows) {
  JoinMatches res;
  res.probe.reserve(left_rows * right_rows);
  res.build.reserve(left_rows * right_rows);
  for (size_t lhs = 0; lhs < left_rows; ++lhs) {
    for (size_t rhs = 0; rhs < right_rows; ++rhs) {
      res.probe.push_back(lhs);
      res.build.push_back(rhs);
    }
  }
  return res;
}

}  // namespace lqe
