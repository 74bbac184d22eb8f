/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "ExprVisitor.h"

#include <unordered_map>

namespace lqe::ir {

/**
 * Bottom-up rewriter. New expressions are added to the arena; an expression whose
 * operands did not change is returned as is. Results are memoized per id, so
 * shared subexpressions are rewritten once.
 */
class ExprRewriter : public ExprVisitor<ExprId> {
 public:
  explicit ExprRewriter(ExprArena& arena)
      : ExprVisitor<ExprId>(arena), mutable_arena_(arena) {}

  ExprId visit(ExprId id) override {
    auto it = cache_.find(id);
    if (it != cache_.end()) {
      return it->second;
    }
    auto res = ExprVisitor<ExprId>::visit(id);
    cache_.emplace(id, res);
    return res;
  }

  ExprIdList visit(const ExprIdList& ids) {
    ExprIdList res;
    res.reserve(ids.size());
    for (auto id : ids) {
      res.push_back(visit(id));
    }
    return res;
  }

 protected:
  ExprId visitBinOper(const BinOper* bin_oper) override {
    return rewriteChildren(bin_oper);
  }

  ExprId visitUOper(const UOper* uoper) override { return rewriteChildren(uoper); }

  ExprId visitFunctionOper(const FunctionOper* func) override {
    return rewriteChildren(func);
  }

  ExprId visitAggExpr(const AggExpr* agg) override { return rewriteChildren(agg); }

  ExprId visitWindowExpr(const WindowExpr* window) override {
    return rewriteChildren(window);
  }

  ExprId visitCast(const CastExpr* cast) override { return rewriteChildren(cast); }

  ExprId visitSortKey(const SortKey* key) override { return rewriteChildren(key); }

  ExprId visitAlias(const AliasExpr* alias) override { return rewriteChildren(alias); }

  ExprId defaultResult(const Expr* expr) const override { return expr->id(); }

  ExprId rewriteChildren(const Expr* expr) {
    auto children = expr->children();
    bool rewrite = false;
    for (auto& child : children) {
      auto new_child = visit(child);
      rewrite = rewrite || new_child != child;
      child = new_child;
    }
    if (rewrite) {
      return mutable_arena_.add(expr->withChildren(children));
    }
    return defaultResult(expr);
  }

  ExprArena& mutable_arena_;

 private:
  std::unordered_map<ExprId, ExprId> cache_;
};

}  // namespace lqe::ir
