/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "Expr.h"

#include "Logger/Logger.h"

namespace lqe::ir {

template <class T>
class ExprVisitor {
 public:
  explicit ExprVisitor(const ExprArena& arena) : arena_(arena) {}
  virtual ~ExprVisitor() {}

  virtual T visit(ExprId id) {
    auto expr = arena_.get(id);
    switch (expr->kind()) {
      case ExprKind::kColumnRef:
        return visitColumnRef(static_cast<const ColumnRef*>(expr));
      case ExprKind::kLiteral:
        return visitLiteral(static_cast<const Literal*>(expr));
      case ExprKind::kBinOper:
        return visitBinOper(static_cast<const BinOper*>(expr));
      case ExprKind::kUOper:
        return visitUOper(static_cast<const UOper*>(expr));
      case ExprKind::kFunction:
        return visitFunctionOper(static_cast<const FunctionOper*>(expr));
      case ExprKind::kAgg:
        return visitAggExpr(static_cast<const AggExpr*>(expr));
      case ExprKind::kWindow:
        return visitWindowExpr(static_cast<const WindowExpr*>(expr));
      case ExprKind::kCast:
        return visitCast(static_cast<const CastExpr*>(expr));
      case ExprKind::kSortKey:
        return visitSortKey(static_cast<const SortKey*>(expr));
      case ExprKind::kAlias:
        return visitAlias(static_cast<const AliasExpr*>(expr));
    }
    CHECK(false) << "Unhandled expr: " << arena_.toString(id);
    return defaultResult(expr);
  }

 protected:
  virtual T visitColumnRef(const ColumnRef* col_ref) { return defaultResult(col_ref); }

  virtual T visitLiteral(const Literal* lit) { return defaultResult(lit); }

  virtual T visitBinOper(const BinOper* bin_oper) {
    visit(bin_oper->leftOperand());
    visit(bin_oper->rightOperand());
    return defaultResult(bin_oper);
  }

  virtual T visitUOper(const UOper* uoper) {
    visit(uoper->operand());
    return defaultResult(uoper);
  }

  virtual T visitFunctionOper(const FunctionOper* func) {
    for (auto arg : func->args()) {
      visit(arg);
    }
    return defaultResult(func);
  }

  virtual T visitAggExpr(const AggExpr* agg) {
    if (agg->hasArg()) {
      visit(agg->arg());
    }
    return defaultResult(agg);
  }

  virtual T visitWindowExpr(const WindowExpr* window) {
    for (auto child : window->children()) {
      visit(child);
    }
    return defaultResult(window);
  }

  virtual T visitCast(const CastExpr* cast) {
    visit(cast->operand());
    return defaultResult(cast);
  }

  virtual T visitSortKey(const SortKey* key) {
    visit(key->operand());
    return defaultResult(key);
  }

  virtual T visitAlias(const AliasExpr* alias) {
    visit(alias->operand());
    return defaultResult(alias);
  }

  virtual T defaultResult(const Expr*) const {
    if constexpr (!std::is_same<T, void>::value) {
      return T{};
    }
  }

  const ExprArena& arena_;
};

}  // namespace lqe::ir
