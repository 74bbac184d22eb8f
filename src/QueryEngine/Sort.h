/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "ColumnOps.h"

#include <optional>

namespace lqe {

/**
 * Row order for the given key columns. The sort is stable: rows with equal keys
 * keep their input order. With a limit only the first offset + limit positions
 * are computed (top-k) and returned starting at offset.
 */
std::vector<int64_t> sortIndices(const std::vector<ColumnPtr>& keys,
                                 const std::vector<SortOrder>& order,
                                 size_t num_rows,
                                 bool parallel,
                                 std::optional<size_t> limit = std::nullopt,
                                 size_t offset = 0);

// Checks that non-null key values of the rows are in ascending order.
bool isSorted(const Column& key, const std::vector<int64_t>& rows);

}  // namespace lqe
