/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "Column.h"

#include "IR/Schema.h"

namespace lqe {

/**
 * A horizontal slice of a table: schema, one column per field and an explicit
 * row count, so a batch without columns still knows its size.
 */
class Batch {
 public:
  Batch() = default;
  Batch(ir::Schema schema, std::vector<ColumnPtr> columns, size_t num_rows);
  // Row count is taken from the columns, which must not be empty.
  Batch(ir::Schema schema, std::vector<ColumnPtr> columns);

  static Batch makeEmpty(const ir::Schema& schema);

  const ir::Schema& schema() const { return schema_; }
  size_t numRows() const { return num_rows_; }
  size_t numColumns() const { return columns_.size(); }
  bool empty() const { return num_rows_ == 0; }

  const std::vector<ColumnPtr>& columns() const { return columns_; }
  const ColumnPtr& column(size_t idx) const { return columns_[idx]; }
  // Throws SchemaError for unknown names.
  const ColumnPtr& column(const std::string& name) const;

  Batch select(const std::vector<std::string>& names) const;
  // Copies rows [offset, offset + length) clamped to the batch size.
  Batch slice(size_t offset, size_t length) const;

  std::string toString(size_t max_rows = 20) const;

 private:
  ir::Schema schema_;
  std::vector<ColumnPtr> columns_;
  size_t num_rows_ = 0;
};

using BatchList = std::vector<Batch>;

}  // namespace lqe
