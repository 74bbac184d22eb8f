/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "Optimizer.h"

#include "IR/Node.h"

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace lqe {

// Every pass takes the current root and returns the root of the rewritten
// plan. Nodes that do not change keep their ids.

ir::NodeId coerceTypes(ir::QueryDag& dag, ir::NodeId root);
ir::NodeId simplifyExpressions(ir::QueryDag& dag,
                               ir::NodeId root,
                               const ConstantEvaluator& evaluate = nullptr);
ir::NodeId pushDownPredicates(ir::QueryDag& dag, ir::NodeId root);
ir::NodeId pushDownProjections(ir::QueryDag& dag, ir::NodeId root);
ir::NodeId pushDownSlices(ir::QueryDag& dag, ir::NodeId root);
ir::NodeId eliminateCommonSubexpressions(ir::QueryDag& dag, ir::NodeId root);
ir::NodeId simplifyJoins(ir::QueryDag& dag, ir::NodeId root);

//
// Helpers shared by passes.
//

using NodeRewriteFn = std::function<ir::NodeId(const ir::Node*, ir::NodeIdList)>;

// Visits nodes reachable from the root bottom-up. The callback gets a node with
// its rewritten inputs and returns the replacement. Shared nodes are rewritten
// once.
ir::NodeId rewriteBottomUp(ir::QueryDag& dag, ir::NodeId root, const NodeRewriteFn& fn);

// Node rebuilt over new inputs with mapped expressions. Returns the original
// id when neither inputs nor expressions change.
ir::NodeId rebuildNode(ir::QueryDag& dag,
                       const ir::Node* node,
                       ir::NodeIdList inputs,
                       const ir::ExprMapper& mapper = nullptr);

// Projection of the given input columns.
ir::NodeId makeColumnProjection(ir::QueryDag& dag,
                                ir::NodeId input,
                                const std::vector<std::string>& names);

using NameSet = std::unordered_set<std::string>;

bool referencesOnly(const ir::ExprArena& arena, ir::ExprId id, const NameSet& names);

// Replaces column references by the given expressions. Columns not found in the
// map are kept.
ir::ExprId substituteColumns(ir::ExprArena& arena,
                             ir::ExprId id,
                             const std::unordered_map<std::string, ir::ExprId>& subst);

}  // namespace lqe
