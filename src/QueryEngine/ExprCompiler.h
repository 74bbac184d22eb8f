/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "DataMgr/Batch.h"
#include "IR/Expr.h"

#include <functional>
#include <unordered_map>

namespace lqe {

// Per-group aggregate results used in place of aggregate expressions.
using AggSubstitution = std::unordered_map<ir::ExprId, ColumnPtr>;

/**
 * Expression compiled against an input schema. Evaluation produces either a
 * column with one value per input row or a single value column which should be
 * broadcast (literals, aggregates over the whole batch).
 */
class CompiledExpr {
 public:
  using EvalFn = std::function<ColumnPtr(const Batch&, const AggSubstitution*)>;

  CompiledExpr() = default;
  CompiledExpr(ir::ExprId id, const ir::Type* type, EvalFn fn)
      : id_(id), type_(type), fn_(std::move(fn)) {}

  ir::ExprId id() const { return id_; }
  const ir::Type* type() const { return type_; }

  ColumnPtr eval(const Batch& batch, const AggSubstitution* subst = nullptr) const {
    return fn_(batch, subst);
  }

  // Result expanded to the batch row count.
  ColumnPtr evalFull(const Batch& batch, const AggSubstitution* subst = nullptr) const;

 private:
  ir::ExprId id_ = ir::kInvalidExprId;
  const ir::Type* type_ = nullptr;
  EvalFn fn_;
};

using CompiledExprList = std::vector<CompiledExpr>;

/**
 * Compiles arena expressions into closures. Column references are resolved to
 * input positions during compilation, unknown columns raise SchemaError.
 * Window partitions are evaluated in parallel when parallel is set.
 */
class ExprCompiler {
 public:
  ExprCompiler(const ir::ExprArena& arena, ir::Schema schema, bool parallel = false)
      : arena_(arena), schema_(std::move(schema)), parallel_(parallel) {}

  CompiledExpr compile(ir::ExprId id) const;
  CompiledExprList compile(const ir::ExprIdList& ids) const;

  const ir::Schema& schema() const { return schema_; }

 private:
  const ir::ExprArena& arena_;
  ir::Schema schema_;
  bool parallel_;
};

// Evaluates expressions into a batch with the given output schema.
Batch evalProjection(const CompiledExprList& exprs,
                     const ir::Schema& schema,
                     const Batch& input,
                     const AggSubstitution* subst = nullptr);

// Value of an expression without column references, used by the optimizer for
// constant folding. Throws ir::Error when the evaluation fails.
Datum evaluateConstant(const ir::ExprArena& arena, ir::ExprId id);

}  // namespace lqe
