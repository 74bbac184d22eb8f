/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "Passes.h"

#include "IR/CardinalityEstimator.h"
#include "IR/TypeUtils.h"
#include "Logger/Logger.h"

namespace lqe {

using namespace ir;

namespace {

class JoinSimplification {
 public:
  explicit JoinSimplification(QueryDag& dag) : dag_(dag), arena_(dag.exprs()) {}

  NodeId run(NodeId root) {
    return rewriteBottomUp(dag_, root, [this](const Node* node, NodeIdList inputs) {
      auto res = rebuildNode(dag_, node, std::move(inputs));
      auto new_node = dag_.node(res);
      if (auto filter = new_node->as<Filter>()) {
        auto join = dag_.node(filter->input(0))->as<Join>();
        if (join && join->joinType() == JoinType::kCross) {
          res = crossToInner(filter, join);
        }
      } else if (auto join = new_node->as<Join>()) {
        res = chooseBuildSide(join);
      }
      return res;
    });
  }

 private:
  // Filter(CrossJoin) with equalities between left and right columns becomes an
  // inner join on these columns. Other conjuncts stay in the filter.
  NodeId crossToInner(const Filter* filter, const Join* join) {
    auto& schema = join->schema();
    auto& right_schema = dag_.node(join->input(1))->schema();
    NameSet left_names;
    std::unordered_map<std::string, ExprId> right_subst;
    auto& sources = join->outputSources();
    for (size_t i = 0; i < sources.size(); ++i) {
      if (sources[i].from_left) {
        left_names.insert(schema[i].name);
      } else {
        auto& field = right_schema[sources[i].input_idx];
        right_subst.emplace(schema[i].name, arena_.make<ColumnRef>(field.type, field.name));
      }
    }
    NameSet right_names;
    for (auto& [name, _] : right_subst) {
      right_names.insert(name);
    }

    ExprIdList left_keys;
    ExprIdList right_keys;
    ExprIdList remaining;
    for (auto pred : splitConjunction(arena_, filter->predicate())) {
      auto eq = arena_.get(pred)->as<BinOper>();
      if (!eq || eq->opType() != OpType::kEq || !isElementwise(arena_, pred)) {
        remaining.push_back(pred);
        continue;
      }
      auto lhs = eq->leftOperand();
      auto rhs = eq->rightOperand();
      if (!isKeyPair(lhs, rhs)) {
        remaining.push_back(pred);
        continue;
      }
      if (referencesOnly(arena_, lhs, left_names) &&
          referencesOnly(arena_, rhs, right_names)) {
        left_keys.push_back(lhs);
        right_keys.push_back(substituteColumns(arena_, rhs, right_subst));
      } else if (referencesOnly(arena_, rhs, left_names) &&
                 referencesOnly(arena_, lhs, right_names)) {
        left_keys.push_back(rhs);
        right_keys.push_back(substituteColumns(arena_, lhs, right_subst));
      } else {
        remaining.push_back(pred);
      }
    }
    if (left_keys.empty()) {
      return filter->id();
    }

    JoinOptions options;
    options.type = JoinType::kInner;
    options.suffix = join->options().suffix;
    // Cross join keeps all right columns.
    options.coalesce = false;
    auto inner = dag_.makeNode<Join>(join->input(0),
                                     join->input(1),
                                     std::move(left_keys),
                                     std::move(right_keys),
                                     std::move(options));
    VLOG(1) << "Converted " << join->label() << " with " << filter->label()
            << " to inner join " << dag_.node(inner)->label();
    CHECK(dag_.node(inner)->schema() == schema);
    inner = chooseBuildSide(dag_.node(inner)->as<Join>());
    if (remaining.empty()) {
      return inner;
    }
    return dag_.makeNode<Filter>(makeConjunction(arena_, remaining), inner);
  }

  // Both sides reference columns and are comparable the way join keys are.
  bool isKeyPair(ExprId lhs, ExprId rhs) const {
    if (referencedColumns(arena_, lhs).empty() || referencedColumns(arena_, rhs).empty()) {
      return false;
    }
    auto lhs_type = arena_.type(lhs);
    auto rhs_type = arena_.type(rhs);
    // Join keys treat NaN as equal to NaN, equality does not.
    if (lhs_type->isList() || rhs_type->isList() || lhs_type->isNull() ||
        rhs_type->isNull() || lhs_type->isFloatingPoint() ||
        rhs_type->isFloatingPoint()) {
      return false;
    }
    return commonType(lhs_type, rhs_type) != nullptr;
  }

  // Smaller input of an inner hash join becomes the build side.
  NodeId chooseBuildSide(const Join* join) {
    if (join->joinType() != JoinType::kInner ||
        join->options().build_side != BuildSide::kAuto) {
      return join->id();
    }
    auto left_rows = estimateRows(dag_, join->input(0));
    auto right_rows = estimateRows(dag_, join->input(1));
    if (!left_rows || !right_rows) {
      return join->id();
    }
    auto options = join->options();
    options.build_side = *left_rows < *right_rows ? BuildSide::kLeft : BuildSide::kRight;
    VLOG(1) << "Estimated rows of " << join->label() << " inputs: " << *left_rows << " and "
            << *right_rows << ", build side " << toString(options.build_side);
    return dag_.addNode(join->withOptions(dag_, std::move(options)));
  }

  QueryDag& dag_;
  ExprArena& arena_;
};

}  // namespace

NodeId simplifyJoins(QueryDag& dag, NodeId root) {
  return JoinSimplification(dag).run(root);
}

}  // namespace lqe
