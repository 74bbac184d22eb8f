/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * Row selection and reshaping kernels: distinct, explode, melt, upsample.
 */

#pragma once

#include "ColumnOps.h"

#include "IR/DateTime.h"

namespace lqe {

// Rows kept by a distinct operation over key columns in ascending row order.
// Null key values are equal to each other.
std::vector<int64_t> distinctRows(const std::vector<ColumnPtr>& keys,
                                  size_t num_rows,
                                  ir::UniqueKeep keep);

// Produces a row per list element. Empty and null lists produce a single row
// with null values. Lists of exploded columns must have equal lengths in each
// row, otherwise ComputeError is thrown.
Batch explode(const Batch& input,
              const std::vector<size_t>& columns,
              const ir::Schema& schema);

// Stacks value columns under the id columns. Rows are ordered by value column
// then by input row.
Batch melt(const Batch& input,
           const std::vector<size_t>& id_columns,
           const std::vector<size_t>& value_columns,
           const ir::Schema& schema);

// Inserts rows at the 'every' interval between the first time value of each group
// shifted by 'offset' and the last one. Groups of the by columns keep the order of
// their first row. Input rows whose time is not on the grid are dropped. Throws
// ComputeError when the time column is not sorted or a group has no time values.
Batch upsample(const Batch& input,
               const std::vector<size_t>& by_columns,
               size_t time_column,
               const ir::Duration& every,
               const ir::Duration& offset,
               const ir::Schema& schema);

}  // namespace lqe
