/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "Batch.h"

#include "Logger/Logger.h"

#include <algorithm>
#include <sstream>

namespace lqe {

Batch::Batch(ir::Schema schema, std::vector<ColumnPtr> columns, size_t num_rows)
    : schema_(std::move(schema)), columns_(std::move(columns)), num_rows_(num_rows) {
  CHECK_EQ(schema_.size(), columns_.size());
  for (size_t i = 0; i < columns_.size(); ++i) {
    CHECK(columns_[i]);
    CHECK_EQ(columns_[i]->size(), num_rows_) << "column " << schema_[i].name;
    CHECK(columns_[i]->type()->equal(*schema_[i].type))
        << schema_[i].name << ": " << columns_[i]->type()->toString() << " vs "
        << schema_[i].type->toString();
  }
}

Batch::Batch(ir::Schema schema, std::vector<ColumnPtr> columns)
    : Batch(std::move(schema),
            columns,
            columns.empty() ? 0 : columns.front()->size()) {
  CHECK(!columns_.empty());
}

Batch Batch::makeEmpty(const ir::Schema& schema) {
  std::vector<ColumnPtr> columns;
  columns.reserve(schema.size());
  for (auto& field : schema) {
    columns.push_back(ColumnBuilder(field.type).finish());
  }
  return Batch(schema, std::move(columns), 0);
}

const ColumnPtr& Batch::column(const std::string& name) const {
  return columns_[schema_.indexOfOrThrow(name)];
}

Batch Batch::select(const std::vector<std::string>& names) const {
  std::vector<ColumnPtr> columns;
  columns.reserve(names.size());
  for (auto& name : names) {
    columns.push_back(column(name));
  }
  return Batch(schema_.select(names), std::move(columns), num_rows_);
}

Batch Batch::slice(size_t offset, size_t length) const {
  auto begin = std::min(offset, num_rows_);
  auto end = begin + std::min(length, num_rows_ - begin);
  if (begin == 0 && end == num_rows_) {
    return *this;
  }
  std::vector<ColumnPtr> columns;
  columns.reserve(columns_.size());
  for (auto& col : columns_) {
    ColumnBuilder builder(col->type(), end - begin);
    builder.appendRange(*col, begin, end);
    columns.push_back(builder.finish());
  }
  return Batch(schema_, std::move(columns), end - begin);
}

std::string Batch::toString(size_t max_rows) const {
  std::stringstream ss;
  ss << "Batch " << schema_.toString() << " rows=" << num_rows_ << "\n";
  auto rows = std::min(num_rows_, max_rows);
  for (size_t row = 0; row < rows; ++row) {
    for (size_t col = 0; col < columns_.size(); ++col) {
      if (col) {
        ss << " | ";
      }
      ss << columns_[col]->valueToString(row);
    }
    ss << "\n";
  }
  if (rows < num_rows_) {
    ss << "...\n";
  }
  return ss.str();
}

}  // namespace lqe
