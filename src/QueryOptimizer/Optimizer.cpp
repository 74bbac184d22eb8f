/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "Optimizer.h"
#include "Passes.h"

#include "IR/Exception.h"
#include "IR/ExprRewriter.h"
#include "Logger/Logger.h"
#include "Shared/measure.h"

#include <unordered_map>

namespace lqe {

using namespace ir;

std::ostream& operator<<(std::ostream& os, const OptimizerOptions& opts) {
  os << "(predicate_pushdown=" << opts.predicate_pushdown
     << " projection_pushdown=" << opts.projection_pushdown
     << " slice_pushdown=" << opts.slice_pushdown << " cse=" << opts.cse
     << " simplify_expr=" << opts.simplify_expr << " join_reorder=" << opts.join_reorder
     << ")";
  return os;
}

NodeId Optimizer::optimize(QueryDag& dag,
                           const OptimizerOptions& opts,
                           const ConstantEvaluator& evaluate) {
  CHECK_NE(dag.root(), kInvalidNodeId);
  VLOG(1) << "Optimizing plan with options " << opts;
  auto log_plans = dag.config()->debug.log_plans;
  if (log_plans) {
    LOG(INFO) << "Input plan:\n" << dag.toString();
  }

  auto root = dag.root();
  auto run_pass = [&](const char* name, bool enabled, auto pass) {
    if (!enabled) {
      VLOG(1) << name << " is disabled";
      return;
    }
    auto clock_begin = timer_start();
    auto new_root = pass(dag, root);
    VLOG(1) << name << " finished in " << timer_stop(clock_begin) << "ms"
            << (new_root == root ? " (no changes)" : "");
    root = new_root;
    if (log_plans) {
      LOG(INFO) << "Plan after " << name << ":\n" << dag.toString(root);
    }
  };

  run_pass("Type coercion", true, coerceTypes);
  run_pass("Expression simplification",
           opts.simplify_expr,
           [&](QueryDag& pass_dag, NodeId pass_root) {
             return simplifyExpressions(pass_dag, pass_root, evaluate);
           });
  run_pass("Predicate pushdown", opts.predicate_pushdown, pushDownPredicates);
  run_pass("Projection pushdown", opts.projection_pushdown, pushDownProjections);
  run_pass("Slice pushdown", opts.slice_pushdown, pushDownSlices);
  run_pass("Common subexpression elimination", opts.cse, eliminateCommonSubexpressions);
  run_pass("Join simplification", opts.join_reorder, simplifyJoins);

  dag.setRoot(root);
  validate(dag);
  return root;
}

void Optimizer::validate(const QueryDag& dag) {
  for (auto id : dag.topologicalOrder()) {
    auto node = dag.node(id);
    // Node constructors check expressions against input schemas.
    auto copy = node->withInputs(dag, node->inputs());
    if (copy->schema() != node->schema()) {
      throw SchemaError() << "Inconsistent schema of " << node->label() << ": "
                          << node->schema().toString() << " vs "
                          << copy->schema().toString();
    }
  }
}

//
// Pass helpers
//

NodeId rewriteBottomUp(QueryDag& dag, NodeId root, const NodeRewriteFn& fn) {
  std::unordered_map<NodeId, NodeId> rewritten;
  std::function<NodeId(NodeId)> visit = [&](NodeId id) -> NodeId {
    auto it = rewritten.find(id);
    if (it != rewritten.end()) {
      return it->second;
    }
    auto node = dag.node(id);
    NodeIdList inputs;
    for (auto input : node->inputs()) {
      inputs.push_back(visit(input));
    }
    auto res = fn(node, std::move(inputs));
    rewritten.emplace(id, res);
    return res;
  };
  return visit(root);
}

NodeId rebuildNode(QueryDag& dag,
                   const Node* node,
                   NodeIdList inputs,
                   const ExprMapper& mapper) {
  bool changed = inputs != node->inputs();
  if (mapper && !changed) {
    for (auto id : node->exprs()) {
      if (mapper(id) != id) {
        changed = true;
        break;
      }
    }
  }
  if (!changed) {
    return node->id();
  }
  if (mapper) {
    return dag.addNode(node->rebuild(dag, std::move(inputs), mapper));
  }
  return dag.addNode(node->withInputs(dag, std::move(inputs)));
}

NodeId makeColumnProjection(QueryDag& dag,
                            NodeId input,
                            const std::vector<std::string>& names) {
  auto& schema = dag.node(input)->schema();
  ExprIdList exprs;
  for (auto& name : names) {
    exprs.push_back(dag.exprs().make<ColumnRef>(schema.typeOf(name), name));
  }
  return dag.makeNode<Project>(std::move(exprs), input);
}

bool referencesOnly(const ExprArena& arena, ExprId id, const NameSet& names) {
  for (auto& name : referencedColumns(arena, id)) {
    if (!names.count(name)) {
      return false;
    }
  }
  return true;
}

namespace {

class ColumnSubstitution : public ExprRewriter {
 public:
  ColumnSubstitution(ExprArena& arena, const std::unordered_map<std::string, ExprId>& subst)
      : ExprRewriter(arena), subst_(subst) {}

 protected:
  ExprId visitColumnRef(const ColumnRef* col_ref) override {
    auto it = subst_.find(col_ref->name());
    if (it == subst_.end()) {
      return col_ref->id();
    }
    return it->second;
  }

 private:
  const std::unordered_map<std::string, ExprId>& subst_;
};

}  // namespace

ExprId substituteColumns(ExprArena& arena,
                         ExprId id,
                         const std::unordered_map<std::string, ExprId>& subst) {
  return ColumnSubstitution(arena, subst).visit(id);
}

}  // namespace lqe
