/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "ExecutionOptions.h"
#include "PhysicalPlan.h"

#include "IR/Node.h"

namespace lqe {

/**
 * Lowers an optimized logical plan into a physical operator tree. Expressions
 * are compiled against operator input schemas. With streaming enabled, every
 * subtree built of streaming-capable operators is marked for streaming
 * execution and explicit Materialize / MemorySource boundaries are inserted
 * between streaming and in-memory parts.
 */
class PhysicalPlanner {
 public:
  PhysicalPlanner(const ir::QueryDag& dag, const Config& config, const ExecutionOptions& opts)
      : dag_(dag), config_(config), opts_(opts) {}

  // Plan rooted at the DAG root. The root is an in-memory node unless
  // streaming_root is set, in which case it is a streaming node.
  PhysicalNodePtr plan(bool streaming_root = false);

  // True if the logical node can process its input morsel by morsel.
  static bool isStreamingCapable(const ir::QueryDag& dag, const ir::Node* node);

 private:
  PhysicalNodePtr lower(ir::NodeId id);
  PhysicalNodePtr lowerNode(const ir::Node* node);
  PhysicalNodePtr lowerScan(const ir::Scan* scan) const;
  PhysicalNodePtr lowerAggregate(const ir::Aggregate* agg) const;
  PhysicalNodePtr lowerJoin(const ir::Join* join) const;

  // Chooses strategies bottom-up and inserts boundary nodes.
  void assignStrategies(PhysicalNode& node) const;

  ExprCompiler compiler(const ir::Schema& schema) const;
  const ir::Schema& inputSchema(const ir::Node* node, size_t idx = 0) const;

  const ir::QueryDag& dag_;
  const Config& config_;
  const ExecutionOptions& opts_;
  std::unordered_map<const PhysicalNode*, bool> capable_;
};

}  // namespace lqe
