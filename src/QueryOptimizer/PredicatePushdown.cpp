/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "Passes.h"

#include "Logger/Logger.h"

#include <algorithm>

namespace lqe {

using namespace ir;

namespace {

/**
 * Moves filter conjuncts towards scans. Conjuncts are collected top-down and
 * every operator decides which of them may be evaluated on its input. The rest
 * is applied in a filter right above the operator. Filters with non element-wise
 * predicates are barriers: their predicate depends on the whole input.
 */
class PredicatePushdown {
 public:
  explicit PredicatePushdown(QueryDag& dag) : dag_(dag), arena_(dag.exprs()) {}

  NodeId push(NodeId id, ExprIdList preds) {
    if (preds.empty()) {
      auto it = visited_.find(id);
      if (it != visited_.end()) {
        return it->second;
      }
      auto res = pushNode(dag_.node(id), {});
      visited_.emplace(id, res);
      return res;
    }
    return pushNode(dag_.node(id), std::move(preds));
  }

 private:
  NodeId pushNode(const Node* node, ExprIdList preds) {
    switch (node->kind()) {
      case NodeKind::kScan:
        return pushScan(node->as<Scan>(), std::move(preds));
      case NodeKind::kFilter:
        return pushFilter(node->as<Filter>(), std::move(preds));
      case NodeKind::kProject:
        return pushProject(node->as<Project>(), std::move(preds));
      case NodeKind::kAggregate:
        return pushAggregate(node->as<Aggregate>(), std::move(preds));
      case NodeKind::kJoin:
        return pushJoin(node->as<Join>(), std::move(preds));
      case NodeKind::kSort:
        if (node->as<Sort>()->limit()) {
          return barrier(node, preds);
        }
        return pushThrough(node, std::move(preds), [](ExprId) { return true; });
      case NodeKind::kSlice:
        return barrier(node, preds);
      case NodeKind::kUnion: {
        NodeIdList inputs;
        for (auto input : node->inputs()) {
          inputs.push_back(push(input, preds));
        }
        return rebuildNode(dag_, node, std::move(inputs));
      }
      case NodeKind::kDistinct: {
        auto keys = node->as<Distinct>()->keyColumns();
        NameSet names(keys.begin(), keys.end());
        return pushThrough(node, std::move(preds), [&](ExprId pred) {
          return referencesOnly(arena_, pred, names);
        });
      }
      case NodeKind::kExplode: {
        auto& cols = node->as<Explode>()->columns();
        return pushThrough(node, std::move(preds), [&](ExprId pred) {
          for (auto& name : referencedColumns(arena_, pred)) {
            if (std::find(cols.begin(), cols.end(), name) != cols.end()) {
              return false;
            }
          }
          return true;
        });
      }
      case NodeKind::kMelt: {
        auto& ids = node->as<Melt>()->idVars();
        NameSet names(ids.begin(), ids.end());
        return pushThrough(node, std::move(preds), [&](ExprId pred) {
          return referencesOnly(arena_, pred, names);
        });
      }
      case NodeKind::kUpsample:
        return barrier(node, preds);
    }
    UNREACHABLE() << "Unsupported node " << node->label();
    return kInvalidNodeId;
  }

  NodeId pushScan(const Scan* scan, ExprIdList preds) {
    auto hints = scan->hints();
    if (preds.empty() || hints.slice) {
      return applyPredicates(scan->id(), preds);
    }
    ExprIdList pushed;
    ExprIdList remaining;
    if (hints.predicate != kInvalidExprId) {
      pushed = splitConjunction(arena_, hints.predicate);
    }
    for (auto pred : preds) {
      if (arena_.type(pred)->isBoolean()) {
        pushed.push_back(pred);
      } else {
        remaining.push_back(pred);
      }
    }
    hints.predicate = makeConjunction(arena_, pushed);
    VLOG(2) << "Pushed predicate " << arena_.toString(hints.predicate) << " into "
            << scan->label();
    auto new_scan = dag_.addNode(scan->withHints(dag_, std::move(hints)));
    return applyPredicates(new_scan, remaining);
  }

  NodeId pushFilter(const Filter* filter, ExprIdList preds) {
    auto conjuncts = splitConjunction(arena_, filter->predicate());
    bool elementwise = std::all_of(conjuncts.begin(), conjuncts.end(), [&](ExprId id) {
      return isElementwise(arena_, id);
    });
    if (!elementwise) {
      return barrier(filter, preds);
    }
    conjuncts.insert(conjuncts.end(), preds.begin(), preds.end());
    return push(filter->input(0), std::move(conjuncts));
  }

  NodeId pushProject(const Project* project, ExprIdList preds) {
    if (preds.empty()) {
      return barrier(project, preds);
    }
    // Windows and aggregates depend on all input rows. A projection of scalars
    // produces a single row.
    bool has_columns = false;
    for (auto id : project->projections()) {
      if (!isElementwise(arena_, id)) {
        return barrier(project, preds);
      }
      has_columns = has_columns || !referencedColumns(arena_, id).empty();
    }
    if (!has_columns) {
      return barrier(project, preds);
    }

    std::unordered_map<std::string, ExprId> subst;
    for (auto id : project->projections()) {
      subst.emplace(outputName(arena_, id), stripAlias(arena_, id));
    }
    ExprIdList pushed;
    ExprIdList remaining;
    for (auto pred : preds) {
      bool pushable = true;
      for (auto& name : referencedColumns(arena_, pred)) {
        pushable = pushable && subst.count(name);
      }
      if (pushable) {
        pushed.push_back(substituteColumns(arena_, pred, subst));
      } else {
        remaining.push_back(pred);
      }
    }
    auto input = push(project->input(0), std::move(pushed));
    return applyPredicates(rebuildNode(dag_, project, {input}), remaining);
  }

  NodeId pushAggregate(const Aggregate* agg, ExprIdList preds) {
    if (agg->keys().empty()) {
      return barrier(agg, preds);
    }
    std::unordered_map<std::string, ExprId> subst;
    for (auto key : agg->keys()) {
      subst.emplace(outputName(arena_, key), stripAlias(arena_, key));
    }
    ExprIdList pushed;
    ExprIdList remaining;
    for (auto pred : preds) {
      bool pushable = true;
      for (auto& name : referencedColumns(arena_, pred)) {
        pushable = pushable && subst.count(name);
      }
      if (pushable) {
        pushed.push_back(substituteColumns(arena_, pred, subst));
      } else {
        remaining.push_back(pred);
      }
    }
    auto input = push(agg->input(0), std::move(pushed));
    return applyPredicates(rebuildNode(dag_, agg, {input}), remaining);
  }

  NodeId pushJoin(const Join* join, ExprIdList preds) {
    auto type = join->joinType();
    // Filtering the side which may get nulls would change the result.
    bool to_left = type != JoinType::kOuter;
    bool to_right = type == JoinType::kInner || type == JoinType::kCross;

    auto& schema = join->schema();
    auto& left_schema = dag_.node(join->input(0))->schema();
    auto& right_schema = dag_.node(join->input(1))->schema();
    NameSet left_names;
    std::unordered_map<std::string, ExprId> right_subst;
    auto& sources = join->outputSources();
    for (size_t i = 0; i < sources.size(); ++i) {
      if (sources[i].from_left) {
        left_names.insert(schema[i].name);
      } else {
        auto& field = right_schema[sources[i].input_idx];
        right_subst.emplace(schema[i].name,
                            arena_.make<ColumnRef>(field.type, field.name));
      }
    }
    CHECK_EQ(left_names.size(), left_schema.size());

    ExprIdList left_preds;
    ExprIdList right_preds;
    ExprIdList remaining;
    for (auto pred : preds) {
      auto refs = referencedColumns(arena_, pred);
      bool left_only = std::all_of(refs.begin(), refs.end(), [&](const std::string& name) {
        return left_names.count(name);
      });
      bool right_only = std::all_of(refs.begin(), refs.end(), [&](const std::string& name) {
        return right_subst.count(name);
      });
      if (to_left && left_only) {
        left_preds.push_back(pred);
      } else if (to_right && right_only) {
        right_preds.push_back(substituteColumns(arena_, pred, right_subst));
      } else {
        remaining.push_back(pred);
      }
    }
    auto left = push(join->input(0), std::move(left_preds));
    auto right = push(join->input(1), std::move(right_preds));
    return applyPredicates(rebuildNode(dag_, join, {left, right}), remaining);
  }

  template <typename Pred>
  NodeId pushThrough(const Node* node, ExprIdList preds, Pred pushable) {
    ExprIdList pushed;
    ExprIdList remaining;
    for (auto pred : preds) {
      (pushable(pred) ? pushed : remaining).push_back(pred);
    }
    auto input = push(node->input(0), std::move(pushed));
    return applyPredicates(rebuildNode(dag_, node, {input}), remaining);
  }

  // Inputs are optimized independently and all predicates stay above the node.
  NodeId barrier(const Node* node, const ExprIdList& preds) {
    NodeIdList inputs;
    for (auto input : node->inputs()) {
      inputs.push_back(push(input, {}));
    }
    return applyPredicates(rebuildNode(dag_, node, std::move(inputs)), preds);
  }

  NodeId applyPredicates(NodeId id, const ExprIdList& preds) {
    if (preds.empty()) {
      return id;
    }
    return dag_.makeNode<Filter>(makeConjunction(arena_, preds), id);
  }

  QueryDag& dag_;
  ExprArena& arena_;
  std::unordered_map<NodeId, NodeId> visited_;
};

}  // namespace

NodeId pushDownPredicates(QueryDag& dag, NodeId root) {
  return PredicatePushdown(dag).push(root, {});
}

}  // namespace lqe
