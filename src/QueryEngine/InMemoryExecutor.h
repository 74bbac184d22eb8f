/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "ExecutionOptions.h"
#include "PhysicalPlan.h"

namespace lqe {

/**
 * Executes in-memory subtrees of a physical plan in a single pass. Every operator
 * materializes its whole output; the work inside an operator is split over the
 * shared worker pool. Streaming subtrees below Materialize nodes are delegated
 * to the StreamingExecutor.
 */
class InMemoryExecutor {
 public:
  explicit InMemoryExecutor(ExecutionContext ctx) : ctx_(std::move(ctx)) {}

  // Errors get the label of the failed operator.
  Batch execute(const PhysicalNode& node) const;

 private:
  Batch executeNode(const PhysicalNode& node) const;
  Batch executeScan(const PhysicalScan& scan) const;
  Batch executeAggregate(const PhysicalAggregate& agg) const;
  Batch executeHashJoin(const PhysicalHashJoin& join) const;
  Batch executeAsOfJoin(const PhysicalAsOfJoin& join) const;
  Batch executeSort(const PhysicalSort& sort) const;
  Batch executeSlice(const PhysicalSlice& slice) const;
  Batch executeUnion(const PhysicalUnion& union_node) const;
  Batch executeDistinct(const PhysicalDistinct& distinct) const;
  Batch executeUpsample(const PhysicalUpsample& upsample) const;

  ExecutionContext ctx_;
};

}  // namespace lqe
