/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "Reshape.h"
#include "Aggregator.h"
#include "Sort.h"

#include "IR/Exception.h"
#include "Logger/Logger.h"

#include <algorithm>
#include <iterator>
#include <numeric>

namespace lqe {

using namespace ir;

std::vector<int64_t> distinctRows(const std::vector<ColumnPtr>& keys,
                                  size_t num_rows,
                                  UniqueKeep keep) {
  GroupTable table(keys.size());
  GroupIds group_ids;
  if (keys.empty()) {
    group_ids.assign(num_rows, 0);
  } else {
    table.insert(keys, num_rows, group_ids);
  }
  auto num_groups = keys.empty() ? std::min<size_t>(num_rows, 1) : table.size();

  std::vector<int64_t> res;
  switch (keep) {
    case UniqueKeep::kAny:
    case UniqueKeep::kFirst: {
      std::vector<char> seen(num_groups, 0);
      for (size_t row = 0; row < num_rows; ++row) {
        if (!seen[group_ids[row]]) {
          seen[group_ids[row]] = 1;
          res.push_back(row);
        }
      }
      break;
    }
    case UniqueKeep::kLast: {
      std::vector<int64_t> last(num_groups, -1);
      for (size_t row = 0; row < num_rows; ++row) {
        last[group_ids[row]] = row;
      }
      res = std::move(last);
      std::sort(res.begin(), res.end());
      break;
    }
    case UniqueKeep::kNone: {
      std::vector<size_t> counts(num_groups, 0);
      for (auto group : group_ids) {
        ++counts[group];
      }
      for (size_t row = 0; row < num_rows; ++row) {
        if (counts[group_ids[row]] == 1) {
          res.push_back(row);
        }
      }
      break;
    }
  }
  return res;
}

Batch explode(const Batch& input,
              const std::vector<size_t>& columns,
              const Schema& schema) {
  CHECK(!columns.empty());
  auto num_rows = input.numRows();
  std::vector<size_t> lengths(num_rows, 0);
  for (size_t row = 0; row < num_rows; ++row) {
    for (size_t i = 0; i < columns.size(); ++i) {
      auto& col = *input.column(columns[i]);
      size_t len = col.isNull(row) ? 0 : col.listLength(row);
      if (i && len != lengths[row]) {
        throw ComputeError() << "Exploded columns must have matching element counts in row "
                             << row << ": " << lengths[row] << " vs " << len;
      }
      lengths[row] = len;
    }
  }

  std::vector<int64_t> indices;
  for (size_t row = 0; row < num_rows; ++row) {
    indices.insert(indices.end(), std::max<size_t>(lengths[row], 1), row);
  }

  std::vector<ColumnPtr> cols;
  for (size_t col_idx = 0; col_idx < input.numColumns(); ++col_idx) {
    if (std::find(columns.begin(), columns.end(), col_idx) == columns.end()) {
      cols.push_back(take(input.column(col_idx), indices));
      continue;
    }
    auto& col = *input.column(col_idx);
    ColumnBuilder builder(schema[col_idx].type, indices.size());
    for (size_t row = 0; row < num_rows; ++row) {
      if (!lengths[row]) {
        builder.appendNull();
      } else {
        auto begin = col.listOffset(row);
        builder.appendRange(*col.child(), begin, begin + lengths[row]);
      }
    }
    cols.push_back(builder.finish());
  }
  return Batch(schema, std::move(cols), indices.size());
}

Batch melt(const Batch& input,
           const std::vector<size_t>& id_columns,
           const std::vector<size_t>& value_columns,
           const Schema& schema) {
  CHECK_EQ(schema.size(), id_columns.size() + 2);
  auto num_rows = input.numRows();
  auto out_rows = num_rows * value_columns.size();

  std::vector<int64_t> indices;
  indices.reserve(out_rows);
  for (size_t i = 0; i < value_columns.size(); ++i) {
    for (size_t row = 0; row < num_rows; ++row) {
      indices.push_back(row);
    }
  }

  std::vector<ColumnPtr> cols;
  for (auto idx : id_columns) {
    cols.push_back(take(input.column(idx), indices));
  }

  auto variable_type = schema[id_columns.size()].type;
  auto value_type = schema[id_columns.size() + 1].type;
  ColumnBuilder variable(variable_type, out_rows);
  std::vector<ColumnPtr> values;
  for (auto idx : value_columns) {
    auto& name = input.schema()[idx].name;
    for (size_t row = 0; row < num_rows; ++row) {
      variable.appendStr(name);
    }
    values.push_back(cast(input.column(idx), value_type, true));
  }
  cols.push_back(variable.finish());
  cols.push_back(values.empty() ? ColumnBuilder(value_type).finish() : concat(values));
  return Batch(schema, std::move(cols), out_rows);
}

Batch upsample(const Batch& input,
               const std::vector<size_t>& by_columns,
               size_t time_column,
               const Duration& every,
               const Duration& offset,
               const Schema& schema) {
  CHECK(!every.isZero() && !every.isNegative());
  auto num_rows = input.numRows();
  auto& time = *input.column(time_column);
  auto& time_name = input.schema()[time_column].name;
  std::vector<int64_t> all_rows(num_rows);
  std::iota(all_rows.begin(), all_rows.end(), 0);
  if (!isSorted(time, all_rows)) {
    throw ComputeError() << "Upsample requires column '" << time_name
                         << "' to be sorted in ascending order";
  }

  std::vector<std::vector<int64_t>> groups;
  if (by_columns.empty()) {
    groups.push_back(std::move(all_rows));
  } else {
    std::vector<ColumnPtr> keys;
    for (auto idx : by_columns) {
      keys.push_back(input.column(idx));
    }
    GroupTable table(keys.size());
    GroupIds group_ids;
    table.insert(keys, num_rows, group_ids);
    groups.resize(table.size());
    for (size_t row = 0; row < num_rows; ++row) {
      groups[group_ids[row]].push_back(row);
    }
  }

  // Dates are upsampled as midnight timestamps.
  bool is_date = time.type()->isDate();
  auto micros_at = [&](int64_t row) {
    return is_date ? time.intAt(row) * kMicrosecsPerDay : time.intAt(row);
  };

  ColumnBuilder time_builder(time.type());
  // Row providing values, -1 for generated rows.
  std::vector<int64_t> value_rows;
  // Row providing the group values.
  std::vector<int64_t> group_rows;
  for (auto& rows : groups) {
    std::vector<int64_t> timed;
    std::copy_if(rows.begin(), rows.end(), std::back_inserter(timed), [&](int64_t row) {
      return !time.isNull(row);
    });
    if (timed.empty()) {
      throw ComputeError() << "Cannot determine upsample boundaries: column '"
                           << time_name << "' has no values";
    }
    auto start = offset.addTo(micros_at(timed.front()));
    auto last = micros_at(timed.back());
    size_t pos = 0;
    for (int64_t step = 0;; ++step) {
      auto ts = (every * step).addTo(start);
      if (ts > last) {
        break;
      }
      auto val = is_date ? timestampToDays(ts) : ts;
      while (pos < timed.size() && micros_at(timed[pos]) < ts) {
        ++pos;
      }
      if (pos == timed.size() || micros_at(timed[pos]) != ts) {
        time_builder.appendInt(val);
        value_rows.push_back(-1);
        group_rows.push_back(rows.front());
        continue;
      }
      for (; pos < timed.size() && micros_at(timed[pos]) == ts; ++pos) {
        time_builder.appendInt(val);
        value_rows.push_back(timed[pos]);
        group_rows.push_back(timed[pos]);
      }
    }
  }

  std::vector<ColumnPtr> columns{time_builder.finish()};
  for (size_t col = 0; col < input.numColumns(); ++col) {
    if (col == time_column) {
      continue;
    }
    bool is_group_col =
        std::find(by_columns.begin(), by_columns.end(), col) != by_columns.end();
    columns.push_back(take(input.column(col), is_group_col ? group_rows : value_rows));
  }
  return Batch(schema, std::move(columns), value_rows.size());
}

}  // namespace lqe
