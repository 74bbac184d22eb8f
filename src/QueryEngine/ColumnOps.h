/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * Column kernels used by the expression engine and operators. Binary kernels
 * accept operands of either num_rows or one element; a single element is
 * broadcast. All kernels propagate nulls unless stated otherwise.
 */

#pragma once

#include "DataMgr/Batch.h"
#include "IR/OpTypeEnums.h"

#include <vector>

namespace lqe {

// Row -1 produces a null.
ColumnPtr take(const ColumnPtr& col, const std::vector<int64_t>& indices);
Batch take(const Batch& batch, const std::vector<int64_t>& indices);

// Positions of rows where the mask is true. A null mask value is false. A single
// element mask selects all or nothing.
std::vector<int64_t> maskToIndices(const Column& mask, size_t num_rows);
Batch filter(const Batch& batch, const Column& mask);

ColumnPtr concat(const std::vector<ColumnPtr>& cols);
Batch concat(const ir::Schema& schema, const BatchList& batches);

// Expands a single element column to num_rows rows.
ColumnPtr broadcast(const ColumnPtr& col, size_t num_rows);

// Strict casts throw ComputeError on values that cannot be represented,
// non-strict casts produce nulls for them.
ColumnPtr cast(const ColumnPtr& col, const ir::Type* type, bool strict);

ColumnPtr binaryOp(ir::OpType op,
                   const ColumnPtr& lhs,
                   const ColumnPtr& rhs,
                   const ir::Type* type);
ColumnPtr unaryOp(ir::OpType op, const ColumnPtr& col, const ir::Type* type);

// Wraps a value to the integer type width.
int64_t wrapInteger(int64_t val, int size);

// Value hashing and comparison for group, join and sort keys. Floating point
// values are canonicalized: all NaNs are equal and greater than any other
// value, -0.0 equals 0.0.
size_t hashValue(const Column& col, size_t row);
void hashRows(const std::vector<ColumnPtr>& cols,
              size_t begin,
              size_t end,
              std::vector<size_t>& hashes);
// Both values must be non-null.
bool valuesEqual(const Column& lhs, size_t lhs_row, const Column& rhs, size_t rhs_row);
int compareValues(const Column& lhs, size_t lhs_row, const Column& rhs, size_t rhs_row);

bool rowHasNull(const std::vector<ColumnPtr>& cols, size_t row);
// Null values are equal to each other when nulls_equal is set and never match
// otherwise.
bool rowsEqual(const std::vector<ColumnPtr>& lhs,
               size_t lhs_row,
               const std::vector<ColumnPtr>& rhs,
               size_t rhs_row,
               bool nulls_equal);

struct SortOrder {
  bool descending = false;
  bool nulls_last = false;
};

int compareRows(const std::vector<ColumnPtr>& cols,
                const std::vector<SortOrder>& order,
                size_t lhs_row,
                size_t rhs_row);

}  // namespace lqe
