/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "Passes.h"

#include "IR/ExprRewriter.h"
#include "Logger/Logger.h"

#include <unordered_map>

namespace lqe {

using namespace ir;

namespace {

class SubexprReplacer : public ExprRewriter {
 public:
  SubexprReplacer(ExprArena& arena, const std::unordered_map<ExprId, ExprId>& replacements)
      : ExprRewriter(arena), replacements_(replacements) {}

  ExprId visit(ExprId id) override {
    auto it = replacements_.find(id);
    if (it != replacements_.end()) {
      return it->second;
    }
    return ExprRewriter::visit(id);
  }

 private:
  const std::unordered_map<ExprId, ExprId>& replacements_;
};

/**
 * Finds element-wise subtrees computed more than once by a node. Expressions
 * are interned, so equal subtrees have equal ids and counting ids is enough.
 */
class SubexprFinder {
 public:
  explicit SubexprFinder(const ExprArena& arena) : arena_(arena) {}

  ExprIdList find(const ExprIdList& exprs) {
    for (auto id : exprs) {
      count(id);
    }
    for (auto id : exprs) {
      select(id);
    }
    return selected_;
  }

 private:
  void count(ExprId id) {
    ++counts_[id];
    for (auto child : arena_.get(id)->children()) {
      count(child);
    }
  }

  bool isCandidate(ExprId id) const {
    auto expr = arena_.get(id);
    switch (expr->kind()) {
      case ExprKind::kColumnRef:
      case ExprKind::kLiteral:
      case ExprKind::kAlias:
      case ExprKind::kSortKey:
        return false;
      default:
        break;
    }
    return counts_.at(id) > 1 && isElementwise(arena_, id) &&
           !referencedColumns(arena_, id).empty();
  }

  // Outermost repeated subtrees are selected. Their operands are computed once
  // as a part of them.
  void select(ExprId id) {
    if (isCandidate(id)) {
      if (!selected_set_.count(id)) {
        selected_set_.insert(id);
        selected_.push_back(id);
      }
      return;
    }
    for (auto child : arena_.get(id)->children()) {
      select(child);
    }
  }

  const ExprArena& arena_;
  std::unordered_map<ExprId, size_t> counts_;
  std::unordered_set<ExprId> selected_set_;
  ExprIdList selected_;
};

class CommonSubexprElimination {
 public:
  explicit CommonSubexprElimination(QueryDag& dag) : dag_(dag), arena_(dag.exprs()) {}

  NodeId run(NodeId root) {
    return rewriteBottomUp(dag_, root, [this](const Node* node, NodeIdList inputs) {
      auto res = rebuildNode(dag_, node, std::move(inputs));
      if (node->is<Project>() || node->is<Aggregate>()) {
        return eliminate(dag_.node(res));
      }
      return res;
    });
  }

 private:
  NodeId eliminate(const Node* node) {
    auto subexprs = SubexprFinder(arena_).find(node->exprs());
    if (subexprs.empty()) {
      return node->id();
    }

    // Precompute subexpressions next to all input columns.
    auto& input_schema = dag_.node(node->input(0))->schema();
    ExprIdList lower_exprs;
    for (auto& field : input_schema) {
      lower_exprs.push_back(arena_.make<ColumnRef>(field.type, field.name));
    }
    std::unordered_map<ExprId, ExprId> replacements;
    for (auto id : subexprs) {
      auto name = nextName(input_schema);
      auto type = arena_.type(id);
      lower_exprs.push_back(arena_.make<AliasExpr>(type, id, name));
      replacements.emplace(id, arena_.make<ColumnRef>(type, name));
      VLOG(2) << "Computing " << arena_.toString(id) << " once as " << name << " for "
              << node->label();
    }
    auto lower = dag_.makeNode<Project>(std::move(lower_exprs), node->input(0));

    SubexprReplacer replacer(arena_, replacements);
    auto mapper = [&](ExprId id) {
      auto new_id = replacer.visit(id);
      auto name = outputName(arena_, id);
      if (new_id != id && outputName(arena_, new_id) != name) {
        new_id = arena_.make<AliasExpr>(arena_.type(new_id), stripAlias(arena_, new_id), name);
      }
      return new_id;
    };
    return dag_.addNode(node->rebuild(dag_, {lower}, mapper));
  }

  std::string nextName(const Schema& schema) {
    std::string name;
    do {
      name = "__cse_" + std::to_string(next_idx_++);
    } while (schema.contains(name));
    return name;
  }

  QueryDag& dag_;
  ExprArena& arena_;
  size_t next_idx_ = 0;
};

}  // namespace

NodeId eliminateCommonSubexpressions(QueryDag& dag, NodeId root) {
  return CommonSubexprElimination(dag).run(root);
}

}  // namespace lqe
