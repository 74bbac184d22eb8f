/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "DataMgr/Batch.h"
#include "DataProvider/MemoryTable.h"
#include "IR/Context.h"
#include "IR/DateTime.h"
#include "IR/Exception.h"
#include "Logger/Logger.h"
#include "QueryEngine/QueryExecutor.h"
#include "SchemaMgr/SchemaMgr.h"

#include <boost/algorithm/string.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <type_traits>
#include <vector>

namespace TestHelpers {

template <typename T>
T inline_null_value() {
  if constexpr (std::is_floating_point_v<T>) {
    return std::numeric_limits<T>::lowest();
  } else {
    return std::numeric_limits<T>::min();
  }
}

const std::string kNullStr = "<NULL>";
constexpr int64_t NULL_BIGINT = std::numeric_limits<int64_t>::min();
constexpr double NULL_DOUBLE = std::numeric_limits<double>::lowest();

inline void init_logger_stderr_only(int argc, char const* const* argv) {
  logger::LogOptions log_options(argv[0]);
  log_options.max_files_ = 0;  // stderr only by default
  log_options.parse_command_line(argc, argv);
  logger::init(log_options);
}

inline void appendCsvValue(lqe::ColumnBuilder& builder, const std::string& raw) {
  auto val = boost::trim_copy(raw);
  auto type = builder.type();
  if (val.empty() || type->isNull()) {
    builder.appendNull();
  } else if (type->isBoolean()) {
    auto lower = boost::algorithm::to_lower_copy(val);
    builder.appendInt(lower == "true" || lower == "1" ? 1 : 0);
  } else if (type->isInteger()) {
    builder.appendInt(std::stoll(val));
  } else if (type->isFloatingPoint()) {
    builder.appendFp(std::stod(val));
  } else if (type->isText()) {
    builder.appendStr(val);
  } else if (type->isDate()) {
    auto days = lqe::ir::parseDate(val);
    if (!days) {
      throw std::runtime_error("Cannot parse date: " + val);
    }
    builder.appendInt(*days);
  } else if (type->isTimestamp()) {
    auto micros = lqe::ir::parseTimestamp(val);
    if (!micros) {
      throw std::runtime_error("Cannot parse timestamp: " + val);
    }
    builder.appendInt(*micros);
  } else if (type->isList()) {
    // Lists are written as [v1;v2;...], an element left empty is null.
    if (val.size() < 2 || val.front() != '[' || val.back() != ']') {
      throw std::runtime_error("Cannot parse list: " + val);
    }
    auto body = val.substr(1, val.size() - 2);
    if (!boost::trim_copy(body).empty()) {
      std::vector<std::string> elems;
      boost::split(elems, body, boost::is_any_of(";"));
      for (auto& elem : elems) {
        appendCsvValue(builder.childBuilder(), elem);
      }
    }
    builder.finishListRow();
  } else {
    throw std::runtime_error("Unsupported column type: " + type->toString());
  }
}

// Rows are separated with new lines and values with commas. Empty values are
// nulls.
inline lqe::Batch makeBatch(const std::vector<lqe::ir::Field>& fields,
                            const std::string& csv) {
  std::vector<lqe::ColumnBuilder> builders;
  for (auto& field : fields) {
    builders.emplace_back(field.type);
  }
  std::vector<std::string> lines;
  boost::split(lines, csv, boost::is_any_of("\n"));
  size_t num_rows = 0;
  for (auto& line : lines) {
    if (boost::trim_copy(line).empty() && fields.size() > 1) {
      continue;
    }
    if (line.empty()) {
      continue;
    }
    std::vector<std::string> vals;
    boost::split(vals, line, boost::is_any_of(","));
    if (vals.size() != fields.size()) {
      throw std::runtime_error("Wrong number of values in line: " + line);
    }
    for (size_t i = 0; i < vals.size(); ++i) {
      appendCsvValue(builders[i], vals[i]);
    }
    ++num_rows;
  }
  std::vector<lqe::ColumnPtr> columns;
  for (auto& builder : builders) {
    columns.push_back(builder.finish());
  }
  return lqe::Batch(lqe::ir::Schema(fields), std::move(columns), num_rows);
}

inline std::shared_ptr<lqe::MemoryTable> createTable(lqe::SchemaMgr& schema_mgr,
                                                     const std::string& table_name,
                                                     const std::vector<lqe::ir::Field>& fields,
                                                     const std::string& csv,
                                                     size_t fragment_size = 3) {
  auto table = lqe::MemoryTable::fromBatch(makeBatch(fields, csv), fragment_size);
  schema_mgr.registerTable(table_name, table);
  return table;
}

template <typename T>
void compare_column_data(const lqe::Column& col,
                         const std::vector<T>& expected,
                         const std::string& col_name) {
  ASSERT_EQ(col.size(), expected.size()) << "column " << col_name;
  for (size_t row = 0; row < expected.size(); ++row) {
    if constexpr (std::is_same_v<T, std::string>) {
      if (expected[row] == kNullStr) {
        ASSERT_TRUE(col.isNull(row)) << "column " << col_name << " row " << row;
      } else {
        ASSERT_FALSE(col.isNull(row)) << "column " << col_name << " row " << row;
        ASSERT_EQ(col.strAt(row), expected[row]) << "column " << col_name << " row " << row;
      }
    } else if constexpr (std::is_floating_point_v<T>) {
      if (expected[row] == inline_null_value<T>()) {
        ASSERT_TRUE(col.isNull(row)) << "column " << col_name << " row " << row;
      } else {
        ASSERT_FALSE(col.isNull(row)) << "column " << col_name << " row " << row;
        ASSERT_NEAR(col.numAt(row),
                    static_cast<double>(expected[row]),
                    1e-6 * std::max(1.0, std::abs(static_cast<double>(expected[row]))))
            << "column " << col_name << " row " << row;
      }
    } else {
      if (expected[row] == inline_null_value<T>()) {
        ASSERT_TRUE(col.isNull(row)) << "column " << col_name << " row " << row;
      } else {
        ASSERT_FALSE(col.isNull(row)) << "column " << col_name << " row " << row;
        ASSERT_EQ(col.intAt(row), static_cast<int64_t>(expected[row]))
            << "column " << col_name << " row " << row;
      }
    }
  }
}

inline void compare_batch_data_impl(const lqe::Batch&, size_t) {}

template <typename T, typename... Ts>
void compare_batch_data_impl(const lqe::Batch& batch,
                             size_t col_idx,
                             const std::vector<T>& expected,
                             const std::vector<Ts>&... rest) {
  compare_column_data(
      *batch.column(col_idx), expected, batch.schema()[col_idx].name);
  compare_batch_data_impl(batch, col_idx + 1, rest...);
}

template <typename... Ts>
void compare_batch_data(const lqe::Batch& batch, const std::vector<Ts>&... expected) {
  ASSERT_EQ(batch.numColumns(), sizeof...(Ts)) << batch.toString();
  compare_batch_data_impl(batch, 0, expected...);
}

template <typename... Ts>
void compare_res_data(const lqe::ExecutionResult& res,
                      const std::vector<Ts>&... expected) {
  compare_batch_data(res.batch(), expected...);
}

inline std::vector<std::string> rowStrings(const lqe::Batch& batch) {
  std::vector<std::string> res;
  for (size_t row = 0; row < batch.numRows(); ++row) {
    std::string str;
    for (size_t col = 0; col < batch.numColumns(); ++col) {
      str += batch.column(col)->valueToString(row);
      str += "|";
    }
    res.push_back(std::move(str));
  }
  return res;
}

// Compares names, types and values. Floating point values are compared in their
// printed form.
inline void compare_batches(const lqe::Batch& expected,
                            const lqe::Batch& actual,
                            bool ordered = true) {
  ASSERT_EQ(expected.schema().toString(), actual.schema().toString());
  ASSERT_EQ(expected.numRows(), actual.numRows());
  auto expected_rows = rowStrings(expected);
  auto actual_rows = rowStrings(actual);
  if (!ordered) {
    std::sort(expected_rows.begin(), expected_rows.end());
    std::sort(actual_rows.begin(), actual_rows.end());
  }
  for (size_t row = 0; row < expected_rows.size(); ++row) {
    ASSERT_EQ(expected_rows[row], actual_rows[row]) << "row " << row;
  }
}

}  // namespace TestHelpers
