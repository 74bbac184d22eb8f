/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "Context.h"
#include "OpType.h"
#include "Type.h"

#include "Shared/Datum.h"

#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace lqe::ir {

using ExprId = uint32_t;
using ExprIdList = std::vector<ExprId>;

constexpr ExprId kInvalidExprId = std::numeric_limits<ExprId>::max();

struct FunctionDescriptor;
class ExprArena;

enum class ExprKind {
  kColumnRef,
  kLiteral,
  kBinOper,
  kUOper,
  kFunction,
  kAgg,
  kWindow,
  kCast,
  kSortKey,
  kAlias,
};

/**
 * Base class of all expression nodes. Expressions live in an ExprArena and refer
 * to their operands by ExprId. Nodes are immutable.
 */
class Expr {
 public:
  virtual ~Expr() = default;

  ExprKind kind() const { return kind_; }
  const Type* type() const { return type_; }
  Context& ctx() const { return type_->ctx(); }
  ExprId id() const { return id_; }

  // Operands in evaluation order.
  virtual ExprIdList children() const = 0;
  // Same expression over new operands. The number of operands is preserved.
  virtual std::unique_ptr<Expr> withChildren(const ExprIdList& children) const = 0;

  // Shallow hash and comparison. Operands are compared by id, which is
  // sufficient for expressions interned in the same arena.
  virtual size_t hash() const;
  virtual bool equal(const Expr& other) const;

  virtual std::string toString(const ExprArena& arena) const = 0;

  template <typename T>
  bool is() const {
    return dynamic_cast<const T*>(this) != nullptr;
  }

  template <typename T>
  const T* as() const {
    return dynamic_cast<const T*>(this);
  }

 protected:
  Expr(ExprKind kind, const Type* type) : kind_(kind), type_(type) {}

 private:
  friend class ExprArena;

  ExprKind kind_;
  const Type* type_;
  ExprId id_ = kInvalidExprId;
};

// Reference to an input column by name.
class ColumnRef : public Expr {
 public:
  ColumnRef(const Type* type, std::string name)
      : Expr(ExprKind::kColumnRef, type), name_(std::move(name)) {}

  const std::string& name() const { return name_; }

  ExprIdList children() const override { return {}; }
  std::unique_ptr<Expr> withChildren(const ExprIdList& children) const override;
  size_t hash() const override;
  bool equal(const Expr& other) const override;
  std::string toString(const ExprArena& arena) const override;

 private:
  std::string name_;
};

class Literal : public Expr {
 public:
  Literal(const Type* type, Datum value)
      : Expr(ExprKind::kLiteral, type), value_(std::move(value)) {}

  const Datum& value() const { return value_; }
  bool isNull() const { return lqe::isNull(value_); }

  ExprIdList children() const override { return {}; }
  std::unique_ptr<Expr> withChildren(const ExprIdList& children) const override;
  size_t hash() const override;
  bool equal(const Expr& other) const override;
  std::string toString(const ExprArena& arena) const override;

 private:
  Datum value_;
};

class BinOper : public Expr {
 public:
  BinOper(const Type* type, OpType op, ExprId lhs, ExprId rhs)
      : Expr(ExprKind::kBinOper, type), op_(op), lhs_(lhs), rhs_(rhs) {}

  OpType opType() const { return op_; }
  ExprId leftOperand() const { return lhs_; }
  ExprId rightOperand() const { return rhs_; }

  ExprIdList children() const override { return {lhs_, rhs_}; }
  std::unique_ptr<Expr> withChildren(const ExprIdList& children) const override;
  size_t hash() const override;
  bool equal(const Expr& other) const override;
  std::string toString(const ExprArena& arena) const override;

 private:
  OpType op_;
  ExprId lhs_;
  ExprId rhs_;
};

class UOper : public Expr {
 public:
  UOper(const Type* type, OpType op, ExprId operand)
      : Expr(ExprKind::kUOper, type), op_(op), operand_(operand) {}

  OpType opType() const { return op_; }
  ExprId operand() const { return operand_; }

  ExprIdList children() const override { return {operand_}; }
  std::unique_ptr<Expr> withChildren(const ExprIdList& children) const override;
  size_t hash() const override;
  bool equal(const Expr& other) const override;
  std::string toString(const ExprArena& arena) const override;

 private:
  OpType op_;
  ExprId operand_;
};

// Call of a function resolved in the FunctionRegistry.
class FunctionOper : public Expr {
 public:
  FunctionOper(const Type* type, const FunctionDescriptor* desc, ExprIdList args)
      : Expr(ExprKind::kFunction, type), desc_(desc), args_(std::move(args)) {}

  const FunctionDescriptor* desc() const { return desc_; }
  const std::string& name() const;
  const ExprIdList& args() const { return args_; }
  ExprId arg(size_t idx) const { return args_[idx]; }
  size_t arity() const { return args_.size(); }

  ExprIdList children() const override { return args_; }
  std::unique_ptr<Expr> withChildren(const ExprIdList& children) const override;
  size_t hash() const override;
  bool equal(const Expr& other) const override;
  std::string toString(const ExprArena& arena) const override;

 private:
  const FunctionDescriptor* desc_;
  ExprIdList args_;
};

// Aggregate over a group. LEN has no argument.
class AggExpr : public Expr {
 public:
  AggExpr(const Type* type, AggType agg, ExprId arg)
      : Expr(ExprKind::kAgg, type), agg_(agg), arg_(arg) {}

  AggType aggType() const { return agg_; }
  ExprId arg() const { return arg_; }
  bool hasArg() const { return arg_ != kInvalidExprId; }

  ExprIdList children() const override;
  std::unique_ptr<Expr> withChildren(const ExprIdList& children) const override;
  size_t hash() const override;
  bool equal(const Expr& other) const override;
  std::string toString(const ExprArena& arena) const override;

 private:
  AggType agg_;
  ExprId arg_;
};

/**
 * Expression evaluated over partitions of rows with equal partition keys.
 * Aggregates are broadcast to all rows of the partition, other expressions are
 * computed per partition (after ordering by order keys when given) and put back
 * to the original row positions.
 */
class WindowExpr : public Expr {
 public:
  WindowExpr(const Type* type, ExprId func, ExprIdList partition_by, ExprIdList order_by)
      : Expr(ExprKind::kWindow, type)
      , func_(func)
      , partition_by_(std::move(partition_by))
      , order_by_(std::move(order_by)) {}

  ExprId func() const { return func_; }
  const ExprIdList& partitionBy() const { return partition_by_; }
  // SortKey expressions.
  const ExprIdList& orderBy() const { return order_by_; }

  ExprIdList children() const override;
  std::unique_ptr<Expr> withChildren(const ExprIdList& children) const override;
  size_t hash() const override;
  bool equal(const Expr& other) const override;
  std::string toString(const ExprArena& arena) const override;

 private:
  ExprId func_;
  ExprIdList partition_by_;
  ExprIdList order_by_;
};

class CastExpr : public Expr {
 public:
  CastExpr(const Type* type, ExprId operand, bool strict)
      : Expr(ExprKind::kCast, type), operand_(operand), strict_(strict) {}

  ExprId operand() const { return operand_; }
  bool isStrict() const { return strict_; }

  ExprIdList children() const override { return {operand_}; }
  std::unique_ptr<Expr> withChildren(const ExprIdList& children) const override;
  size_t hash() const override;
  bool equal(const Expr& other) const override;
  std::string toString(const ExprArena& arena) const override;

 private:
  ExprId operand_;
  bool strict_;
};

class SortKey : public Expr {
 public:
  SortKey(const Type* type, ExprId operand, bool descending, bool nulls_last)
      : Expr(ExprKind::kSortKey, type)
      , operand_(operand)
      , descending_(descending)
      , nulls_last_(nulls_last) {}

  ExprId operand() const { return operand_; }
  bool isDescending() const { return descending_; }
  bool nullsLast() const { return nulls_last_; }

  ExprIdList children() const override { return {operand_}; }
  std::unique_ptr<Expr> withChildren(const ExprIdList& children) const override;
  size_t hash() const override;
  bool equal(const Expr& other) const override;
  std::string toString(const ExprArena& arena) const override;

 private:
  ExprId operand_;
  bool descending_;
  bool nulls_last_;
};

class AliasExpr : public Expr {
 public:
  AliasExpr(const Type* type, ExprId operand, std::string name)
      : Expr(ExprKind::kAlias, type), operand_(operand), name_(std::move(name)) {}

  ExprId operand() const { return operand_; }
  const std::string& name() const { return name_; }

  ExprIdList children() const override { return {operand_}; }
  std::unique_ptr<Expr> withChildren(const ExprIdList& children) const override;
  size_t hash() const override;
  bool equal(const Expr& other) const override;
  std::string toString(const ExprArena& arena) const override;

 private:
  ExprId operand_;
  std::string name_;
};

/**
 * Owns expressions and interns them: adding an expression structurally equal
 * to an existing one returns the existing id. Expressions are never removed, so
 * ids stay valid for the arena lifetime.
 */
class ExprArena {
 public:
  ExprArena() = default;
  ExprArena(const ExprArena&) = delete;
  ExprArena& operator=(const ExprArena&) = delete;

  ExprId add(std::unique_ptr<Expr> expr);

  template <typename T, typename... Args>
  ExprId make(Args&&... args) {
    return add(std::make_unique<T>(std::forward<Args>(args)...));
  }

  const Expr* get(ExprId id) const;
  const Expr* operator[](ExprId id) const { return get(id); }
  const Type* type(ExprId id) const { return get(id)->type(); }
  size_t size() const { return exprs_.size(); }

  // Copies an expression tree from another arena.
  ExprId import(const ExprArena& other, ExprId id);

  std::string toString(ExprId id) const;
  std::string toString(const ExprIdList& ids) const;

 private:
  std::vector<std::unique_ptr<Expr>> exprs_;
  std::unordered_multimap<size_t, ExprId> index_;
};

// Name of the column produced by the expression in a projection.
std::string outputName(const ExprArena& arena, ExprId id);

// Column names referenced by the expression in order of the first reference.
std::vector<std::string> referencedColumns(const ExprArena& arena, ExprId id);
std::vector<std::string> referencedColumns(const ExprArena& arena, const ExprIdList& ids);

bool containsAgg(const ExprArena& arena, ExprId id);
bool containsWindow(const ExprArena& arena, ExprId id);

// True if the value of every row depends only on the row itself: no aggregates,
// windows, sort keys or order dependent functions.
bool isElementwise(const ExprArena& arena, ExprId id);

// Expression without top-level aliases.
ExprId stripAlias(const ExprArena& arena, ExprId id);

// Splits nested AND operations into a list of conjuncts.
ExprIdList splitConjunction(const ExprArena& arena, ExprId id);
// Combines predicates with AND. Returns kInvalidExprId for an empty list.
ExprId makeConjunction(ExprArena& arena, const ExprIdList& conjuncts);

}  // namespace lqe::ir
