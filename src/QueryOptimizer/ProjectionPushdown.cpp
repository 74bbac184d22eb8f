/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "Passes.h"

#include "Logger/Logger.h"
#include "Shared/misc.h"

#include <algorithm>
#include <map>

namespace lqe {

using namespace ir;

namespace {

using Required = std::optional<NameSet>;

void addColumns(NameSet& names, const std::vector<std::string>& cols) {
  names.insert(cols.begin(), cols.end());
}

// Expression certainly produces a column with a value per input row.
bool isFullColumn(const ExprArena& arena, ExprId id) {
  auto expr = arena.get(stripAlias(arena, id));
  if (expr->is<WindowExpr>()) {
    return true;
  }
  return isElementwise(arena, id) && !referencedColumns(arena, id).empty();
}

// Expression might produce a column with a value per input row.
bool mayBeFullColumn(const ExprArena& arena, ExprId id) {
  auto expr = arena.get(stripAlias(arena, id));
  return !expr->is<AggExpr>() && !referencedColumns(arena, id).empty();
}

/**
 * Propagates the set of required columns from the root to scans. Every node is
 * rebuilt over inputs that provide at least the columns it needs; node outputs
 * may keep columns nobody requires when dropping them is not safe.
 */
class ProjectionPushdown {
 public:
  explicit ProjectionPushdown(QueryDag& dag) : dag_(dag), arena_(dag.exprs()) {}

  NodeId prune(NodeId id, const Required& required) {
    std::string key = "*";
    if (required) {
      std::vector<std::string> names(required->begin(), required->end());
      std::sort(names.begin(), names.end());
      key = join(names, ",");
    }
    auto memo_key = std::make_pair(id, key);
    auto it = visited_.find(memo_key);
    if (it != visited_.end()) {
      return it->second;
    }
    auto res = pruneNode(dag_.node(id), required);
    visited_.emplace(memo_key, res);
    return res;
  }

 private:
  NodeId pruneNode(const Node* node, const Required& required) {
    switch (node->kind()) {
      case NodeKind::kScan:
        return pruneScan(node->as<Scan>(), required);
      case NodeKind::kFilter:
        return pruneUnary(node, required, referencedColumns(arena_, node->exprs()));
      case NodeKind::kProject:
        return pruneProject(node->as<Project>(), required);
      case NodeKind::kAggregate:
        return pruneAggregate(node->as<Aggregate>(), required);
      case NodeKind::kJoin:
        return pruneJoin(node->as<Join>(), required);
      case NodeKind::kSort:
        return pruneUnary(node, required, referencedColumns(arena_, node->exprs()));
      case NodeKind::kSlice:
        return pruneUnary(node, required, {});
      case NodeKind::kUnion:
        return pruneUnion(node->as<Union>(), required);
      case NodeKind::kDistinct:
        return pruneUnary(node, required, node->as<Distinct>()->keyColumns());
      case NodeKind::kExplode:
        return pruneUnary(node, required, node->as<Explode>()->columns());
      case NodeKind::kMelt: {
        auto melt = node->as<Melt>();
        NameSet cols;
        addColumns(cols, melt->idVars());
        addColumns(cols, melt->valueVars());
        auto input = prune(melt->input(0), cols);
        return rebuildNode(dag_, node, {input});
      }
      case NodeKind::kUpsample: {
        auto upsample = node->as<Upsample>();
        auto used = upsample->by();
        used.push_back(upsample->timeColumn());
        return pruneUnary(node, required, used);
      }
    }
    UNREACHABLE() << "Unsupported node " << node->label();
    return kInvalidNodeId;
  }

  NodeId pruneScan(const Scan* scan, const Required& required) {
    if (!required) {
      return scan->id();
    }
    std::vector<std::string> cols;
    for (auto& field : scan->tableSchema()) {
      if (required->count(field.name) && scan->schema().contains(field.name)) {
        cols.push_back(field.name);
      }
    }
    if (cols.size() == scan->schema().size()) {
      return scan->id();
    }
    VLOG(2) << scan->label() << " reads " << cols.size() << " of "
            << scan->schema().size() << " columns";
    auto hints = scan->hints();
    hints.projection = std::move(cols);
    return dag_.addNode(scan->withHints(dag_, std::move(hints)));
  }

  // Node keeping its input columns, which additionally reads the given ones.
  NodeId pruneUnary(const Node* node,
                    const Required& required,
                    const std::vector<std::string>& used) {
    Required input_required;
    if (required) {
      input_required = *required;
      addColumns(*input_required, used);
    }
    auto input = prune(node->input(0), input_required);
    return rebuildNode(dag_, node, {input});
  }

  NodeId pruneProject(const Project* project, const Required& required) {
    auto& exprs = project->projections();
    ExprIdList kept;
    if (required) {
      for (auto id : exprs) {
        if (required->count(outputName(arena_, id))) {
          kept.push_back(id);
        }
      }
      // Dropped expressions might define the number of rows.
      bool kept_full = std::any_of(kept.begin(), kept.end(), [&](ExprId id) {
        return isFullColumn(arena_, id);
      });
      bool had_full = std::any_of(exprs.begin(), exprs.end(), [&](ExprId id) {
        return mayBeFullColumn(arena_, id);
      });
      if (kept.empty() || (!kept_full && had_full)) {
        kept = exprs;
      }
    } else {
      kept = exprs;
    }

    NameSet input_required;
    addColumns(input_required, referencedColumns(arena_, kept));
    auto input = prune(project->input(0), input_required);
    if (kept.size() == exprs.size()) {
      return rebuildNode(dag_, project, {input});
    }
    return dag_.makeNode<Project>(std::move(kept), input);
  }

  NodeId pruneAggregate(const Aggregate* agg, const Required& required) {
    auto& aggs = agg->aggs();
    ExprIdList kept;
    if (required) {
      for (auto id : aggs) {
        if (required->count(outputName(arena_, id))) {
          kept.push_back(id);
        }
      }
      if (kept.empty() && agg->keys().empty() && !aggs.empty()) {
        kept.push_back(aggs.front());
      }
    } else {
      kept = aggs;
    }

    NameSet input_required;
    addColumns(input_required, referencedColumns(arena_, agg->keys()));
    addColumns(input_required, referencedColumns(arena_, kept));
    auto input = prune(agg->input(0), input_required);
    if (kept.size() == aggs.size()) {
      return rebuildNode(dag_, agg, {input});
    }
    return dag_.makeNode<Aggregate>(agg->keys(), std::move(kept), input);
  }

  NodeId pruneJoin(const Join* join, const Required& required) {
    if (!required) {
      return rebuildNode(
          dag_, join, {prune(join->input(0), {}), prune(join->input(1), {})});
    }

    auto& schema = join->schema();
    auto& left_schema = dag_.node(join->input(0))->schema();
    auto& right_schema = dag_.node(join->input(1))->schema();
    NameSet left_required;
    NameSet right_required;
    addColumns(left_required, referencedColumns(arena_, join->leftKeys()));
    addColumns(right_required, referencedColumns(arena_, join->rightKeys()));
    addColumns(left_required, join->options().asof.left_by);
    addColumns(right_required, join->options().asof.right_by);
    auto& sources = join->outputSources();
    for (size_t i = 0; i < sources.size(); ++i) {
      if (!required->count(schema[i].name)) {
        continue;
      }
      if (sources[i].from_left) {
        left_required.insert(left_schema[sources[i].input_idx].name);
      } else {
        auto& name = right_schema[sources[i].input_idx].name;
        right_required.insert(name);
        // Keep the left column causing the suffix, so the output name is the same.
        if (name != schema[i].name) {
          left_required.insert(name);
        }
      }
    }

    auto res = rebuildNode(dag_,
                           join,
                           {prune(join->input(0), left_required),
                            prune(join->input(1), right_required)});
    auto& new_schema = dag_.node(res)->schema();
    for (auto& name : *required) {
      auto idx = new_schema.indexOf(name);
      if (!idx || !new_schema[*idx].type->equal(*schema.typeOf(name))) {
        VLOG(1) << "Cannot prune inputs of " << join->label() << ": column " << name
                << " changes";
        return rebuildNode(
            dag_, join, {prune(join->input(0), {}), prune(join->input(1), {})});
      }
    }
    return res;
  }

  NodeId pruneUnion(const Union* union_node, const Required& required) {
    if (!required) {
      NodeIdList inputs;
      for (auto input : union_node->inputs()) {
        inputs.push_back(prune(input, {}));
      }
      return rebuildNode(dag_, union_node, std::move(inputs));
    }
    // All inputs must have exactly the same columns.
    std::vector<std::string> cols;
    for (auto& field : union_node->schema()) {
      if (required->count(field.name)) {
        cols.push_back(field.name);
      }
    }
    if (cols.empty()) {
      cols.push_back(union_node->schema()[0].name);
    }
    NameSet input_required(cols.begin(), cols.end());
    NodeIdList inputs;
    for (auto input : union_node->inputs()) {
      auto new_input = prune(input, input_required);
      if (dag_.node(new_input)->schema().names() != cols) {
        new_input = makeColumnProjection(dag_, new_input, cols);
      }
      inputs.push_back(new_input);
    }
    return rebuildNode(dag_, union_node, std::move(inputs));
  }

  QueryDag& dag_;
  ExprArena& arena_;
  std::map<std::pair<NodeId, std::string>, NodeId> visited_;
};

}  // namespace

NodeId pushDownProjections(QueryDag& dag, NodeId root) {
  auto& schema = dag.node(root)->schema();
  auto res = ProjectionPushdown(dag).prune(root, std::nullopt);
  if (dag.node(res)->schema() != schema) {
    res = makeColumnProjection(dag, res, schema.names());
  }
  return res;
}

}  // namespace lqe
