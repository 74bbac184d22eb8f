/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "HashJoin.h"

namespace lqe {

/**
 * As-of join of sorted inputs: every left row is matched with at most one right
 * row whose key is the closest one in the strategy direction and whose 'by'
 * values are equal. Both key columns must be sorted in ascending order within
 * each 'by' group, otherwise ComputeError is thrown. Left rows keep their order,
 * unmatched rows get build row -1.
 */
JoinMatches asofJoinMatches(ColumnPtr left_key,
                            ColumnPtr right_key,
                            std::vector<ColumnPtr> left_by,
                            std::vector<ColumnPtr> right_by,
                            const ir::AsOfOptions& options);

}  // namespace lqe
