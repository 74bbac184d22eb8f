/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * Operator kernels shared by the in-memory and the streaming executors. Each
 * function processes a batch or a part of an input and keeps no state between
 * calls.
 */

#pragma once

#include "ExecutionOptions.h"
#include "PhysicalPlan.h"

namespace lqe {

// Fetches a fragment and re-applies the hints the provider did not honor. The
// limit is the number of rows still required by a scan slice.
Batch scanFragment(const PhysicalScan& scan,
                   size_t frag_idx,
                   std::optional<size_t> limit = std::nullopt);

// Applies a stateless operator (filter, project, explode, melt) to a batch.
// Filter and project split large batches into sub-tasks.
Batch processBatch(const PhysicalNode& node, const Batch& input, const ExecutionContext& ctx);

// True for operators processBatch supports.
bool isStatelessOperator(PhysicalKind kind);

// Partial aggregation states over row ranges of the input in row order.
std::vector<std::unique_ptr<GroupByState>> aggregatePartial(const PhysicalAggregate& agg,
                                                            const Batch& input,
                                                            const ExecutionContext& ctx);
// Builds output columns from the merged aggregation result.
Batch finalizeAggregate(const PhysicalAggregate& agg,
                        GroupByState::Result result,
                        const ExecutionContext& ctx);

// Evaluates join keys with types unified between sides.
std::pair<std::vector<ColumnPtr>, std::vector<ColumnPtr>> evalJoinKeys(
    const PhysicalHashJoin& join,
    const Batch& left,
    const Batch& right);

std::unique_ptr<HashJoinTable> buildHashTable(const std::vector<ColumnPtr>& keys,
                                              size_t num_rows,
                                              const ExecutionContext& ctx);

// Joins a probe batch with a built hash table. The probe side is the left input
// except for inner joins built on the left input.
Batch probeHashJoin(const PhysicalHashJoin& join,
                    const HashJoinTable& table,
                    const Batch& build,
                    const std::vector<ColumnPtr>& probe_keys,
                    const Batch& probe,
                    const ExecutionContext& ctx);

Batch crossJoin(const PhysicalCrossJoin& join,
                const Batch& left,
                const Batch& right,
                const ExecutionContext& ctx);

// Throws ResourceExhaustedError when a join produces too many rows.
void checkJoinRows(const std::string& label, size_t num_rows, const ExecutionContext& ctx);

// Resolves a slice against the total row count: (offset, length).
std::pair<size_t, size_t> resolveSlice(int64_t offset, size_t length, size_t total);

}  // namespace lqe
