/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ExprCompiler.h"
#include "Aggregator.h"
#include "ColumnOps.h"
#include "Sort.h"

#include "IR/Exception.h"
#include "IR/ExprVisitor.h"
#include "IR/FunctionRegistry.h"
#include "Logger/Logger.h"
#include "Shared/ThreadPool.h"

#include <algorithm>

namespace lqe {

using namespace ir;

namespace {

using EvalFn = CompiledExpr::EvalFn;

class CompilerVisitor : public ExprVisitor<EvalFn> {
 public:
  CompilerVisitor(const ExprArena& arena, const Schema& schema, bool parallel)
      : ExprVisitor<EvalFn>(arena), schema_(schema), parallel_(parallel) {}

 protected:
  EvalFn visitColumnRef(const ColumnRef* col_ref) override {
    auto idx = schema_.indexOfOrThrow(col_ref->name());
    if (schema_[idx].type != col_ref->type()) {
      throw SchemaError() << "Column " << col_ref->name() << " has type "
                          << schema_[idx].type->toString() << " but "
                          << col_ref->type()->toString() << " is expected.";
    }
    return [idx](const Batch& batch, const AggSubstitution*) { return batch.column(idx); };
  }

  EvalFn visitLiteral(const Literal* lit) override {
    auto col = Column::makeConstant(lit->type(), lit->value(), 1);
    return [col](const Batch&, const AggSubstitution*) { return col; };
  }

  EvalFn visitBinOper(const BinOper* bin_oper) override {
    auto lhs = visit(bin_oper->leftOperand());
    auto rhs = visit(bin_oper->rightOperand());
    auto op = bin_oper->opType();
    auto type = bin_oper->type();
    return [lhs, rhs, op, type](const Batch& batch, const AggSubstitution* subst) {
      return binaryOp(op, lhs(batch, subst), rhs(batch, subst), type);
    };
  }

  EvalFn visitUOper(const UOper* uoper) override {
    auto operand = visit(uoper->operand());
    auto op = uoper->opType();
    auto type = uoper->type();
    return [operand, op, type](const Batch& batch, const AggSubstitution* subst) {
      return unaryOp(op, operand(batch, subst), type);
    };
  }

  EvalFn visitFunctionOper(const FunctionOper* func) override {
    std::vector<EvalFn> args;
    for (auto arg : func->args()) {
      args.push_back(visit(arg));
    }
    auto desc = func->desc();
    auto type = func->type();
    return [args, desc, type](const Batch& batch, const AggSubstitution* subst) {
      std::vector<ColumnPtr> vals;
      vals.reserve(args.size());
      for (auto& arg : args) {
        vals.push_back(arg(batch, subst));
      }
      size_t num_rows = 1;
      if (desc->elementwise) {
        for (auto& val : vals) {
          if (val->size() != 1) {
            num_rows = val->size();
            break;
          }
        }
      } else {
        // Order dependent functions always work on full columns.
        num_rows = batch.numRows();
        if (!vals.empty() && vals.front()->size() != num_rows) {
          vals.front() = broadcast(vals.front(), num_rows);
        }
      }
      return desc->kernel(vals, num_rows, type);
    };
  }

  EvalFn visitAggExpr(const AggExpr* agg) override {
    EvalFn arg;
    if (agg->hasArg()) {
      arg = visit(agg->arg());
    }
    auto id = agg->id();
    AggSpec spec{agg->aggType(),
                 agg->hasArg() ? arena_.type(agg->arg()) : nullptr,
                 agg->type()};
    return [arg, id, spec](const Batch& batch, const AggSubstitution* subst) {
      if (subst) {
        auto it = subst->find(id);
        if (it != subst->end()) {
          return it->second;
        }
      }
      // Aggregate over the whole batch.
      ColumnPtr arg_col;
      if (arg) {
        arg_col = arg(batch, subst);
        if (arg_col->size() != batch.numRows()) {
          arg_col = broadcast(arg_col, batch.numRows());
        }
      }
      auto acc = makeAccumulator(spec);
      acc->resize(1);
      acc->update(arg_col, GroupIds(batch.numRows(), 0));
      return acc->finalize();
    };
  }

  EvalFn visitWindowExpr(const WindowExpr* window) override;

  EvalFn visitCast(const CastExpr* cast_expr) override {
    auto operand = visit(cast_expr->operand());
    auto type = cast_expr->type();
    auto strict = cast_expr->isStrict();
    if (arena_.type(cast_expr->operand()) == type) {
      return operand;
    }
    return [operand, type, strict](const Batch& batch, const AggSubstitution* subst) {
      return cast(operand(batch, subst), type, strict);
    };
  }

  EvalFn visitSortKey(const SortKey* key) override {
    auto operand = visit(key->operand());
    SortOrder order{key->isDescending(), key->nullsLast()};
    auto parallel = parallel_;
    return [operand, order, parallel](const Batch& batch, const AggSubstitution* subst) {
      auto col = operand(batch, subst);
      auto indices = sortIndices({col}, {order}, col->size(), parallel);
      return take(col, indices);
    };
  }

  EvalFn visitAlias(const AliasExpr* alias) override { return visit(alias->operand()); }

 private:
  const Schema& schema_;
  bool parallel_;
};

// Rows are grouped by partition keys in order of the first occurrence, each
// partition is ordered by the order keys and the function is evaluated on a
// batch holding only the partition rows of referenced columns. Results are put
// back to the original row positions.
EvalFn CompilerVisitor::visitWindowExpr(const WindowExpr* window) {
  std::vector<EvalFn> part_keys;
  for (auto key : window->partitionBy()) {
    part_keys.push_back(visit(key));
  }
  std::vector<EvalFn> order_keys;
  std::vector<SortOrder> order;
  for (auto key_id : window->orderBy()) {
    auto key = arena_.get(key_id)->as<SortKey>();
    CHECK(key) << "Window order key is not a sort key: " << arena_.toString(key_id);
    order_keys.push_back(visit(key->operand()));
    order.push_back({key->isDescending(), key->nullsLast()});
  }

  auto ref_names = referencedColumns(arena_, window->func());
  std::vector<size_t> ref_indices;
  for (auto& name : ref_names) {
    ref_indices.push_back(schema_.indexOfOrThrow(name));
  }
  auto sub_schema = schema_.select(ref_names);
  auto func = ExprCompiler(arena_, sub_schema).compile(window->func());
  auto type = window->type();
  auto parallel = parallel_;

  return [=](const Batch& batch, const AggSubstitution*) -> ColumnPtr {
    auto num_rows = batch.numRows();
    if (!num_rows) {
      return ColumnBuilder(type).finish();
    }

    auto full = [&](const EvalFn& fn) {
      auto col = fn(batch, nullptr);
      return col->size() == num_rows ? col : broadcast(col, num_rows);
    };

    std::vector<std::vector<int64_t>> partitions;
    if (part_keys.empty()) {
      partitions.resize(1);
      partitions.front().resize(num_rows);
      for (size_t row = 0; row < num_rows; ++row) {
        partitions.front()[row] = row;
      }
    } else {
      std::vector<ColumnPtr> keys;
      for (auto& key : part_keys) {
        keys.push_back(full(key));
      }
      GroupTable table(keys.size());
      GroupIds group_ids;
      table.insert(keys, num_rows, group_ids);
      partitions.resize(table.size());
      for (size_t row = 0; row < num_rows; ++row) {
        partitions[group_ids[row]].push_back(row);
      }
    }

    std::vector<ColumnPtr> order_cols;
    for (auto& key : order_keys) {
      order_cols.push_back(full(key));
    }

    std::vector<ColumnPtr> results(partitions.size());
    threading::parallel_for_each(partitions.size(), parallel, [&](size_t part_idx) {
      auto& rows = partitions[part_idx];
      if (!order_cols.empty()) {
        std::stable_sort(rows.begin(), rows.end(), [&](int64_t lhs, int64_t rhs) {
          return compareRows(order_cols, order, lhs, rhs) < 0;
        });
      }
      std::vector<ColumnPtr> cols;
      for (auto idx : ref_indices) {
        cols.push_back(take(batch.column(idx), rows));
      }
      Batch part(sub_schema, std::move(cols), rows.size());
      auto res = func.eval(part);
      if (res->size() != rows.size()) {
        CHECK_EQ(res->size(), (size_t)1);
        res = broadcast(res, rows.size());
      }
      results[part_idx] = res;
    });

    std::vector<int64_t> positions(num_rows);
    int64_t pos = 0;
    for (auto& rows : partitions) {
      for (auto row : rows) {
        positions[row] = pos++;
      }
    }
    return take(concat(results), positions);
  };
}

}  // namespace

ColumnPtr CompiledExpr::evalFull(const Batch& batch, const AggSubstitution* subst) const {
  auto res = eval(batch, subst);
  if (res->size() != batch.numRows()) {
    CHECK_EQ(res->size(), (size_t)1);
    res = broadcast(res, batch.numRows());
  }
  return res;
}

CompiledExpr ExprCompiler::compile(ExprId id) const {
  CompilerVisitor visitor(arena_, schema_, parallel_);
  return CompiledExpr(id, arena_.type(id), visitor.visit(id));
}

CompiledExprList ExprCompiler::compile(const ExprIdList& ids) const {
  CompiledExprList res;
  res.reserve(ids.size());
  for (auto id : ids) {
    res.push_back(compile(id));
  }
  return res;
}

Batch evalProjection(const CompiledExprList& exprs,
                     const Schema& schema,
                     const Batch& input,
                     const AggSubstitution* subst) {
  CHECK_EQ(exprs.size(), schema.size());
  std::vector<ColumnPtr> cols;
  cols.reserve(exprs.size());
  bool all_scalar = !exprs.empty();
  for (auto& expr : exprs) {
    cols.push_back(expr.eval(input, subst));
    all_scalar = all_scalar && cols.back()->size() == 1;
  }
  size_t num_rows = all_scalar ? 1 : input.numRows();
  for (auto& col : cols) {
    if (col->size() != num_rows) {
      CHECK_EQ(col->size(), (size_t)1);
      col = broadcast(col, num_rows);
    }
  }
  return Batch(schema, std::move(cols), num_rows);
}

Datum evaluateConstant(const ExprArena& arena, ExprId id) {
  auto res = ExprCompiler(arena, Schema()).compile(id).eval(Batch(Schema(), {}, 1));
  CHECK_EQ(res->size(), (size_t)1);
  return res->valueAt(0);
}

}  // namespace lqe
