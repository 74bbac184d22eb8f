/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "IR/Node.h"
#include "Shared/Datum.h"

#include <functional>
#include <ostream>

namespace lqe {

struct OptimizerOptions {
  bool predicate_pushdown = true;
  bool projection_pushdown = true;
  bool slice_pushdown = true;
  bool cse = true;
  bool simplify_expr = true;
  bool join_reorder = true;
};

std::ostream& operator<<(std::ostream& os, const OptimizerOptions& opts);

// Computes the value of an expression without column references. Throws
// ir::Error when the expression cannot be evaluated.
using ConstantEvaluator = std::function<Datum(const ir::ExprArena&, ir::ExprId)>;

/**
 * Rule-based plan optimizer. Passes never modify existing nodes: each pass
 * appends rewritten nodes to the DAG and the root is moved to the new plan, so
 * every earlier plan version stays valid. Type coercion always runs, other
 * passes can be disabled one by one without changing query results.
 */
class Optimizer {
 public:
  // Returns the new root, which is also set as the DAG root. Constant
  // expressions are folded only when an evaluator is given.
  static ir::NodeId optimize(ir::QueryDag& dag,
                             const OptimizerOptions& opts,
                             const ConstantEvaluator& evaluate = nullptr);

  // Checks every node reachable from the root against its input schemas.
  static void validate(const ir::QueryDag& dag);
};

}  // namespace lqe
