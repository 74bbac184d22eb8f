/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "Passes.h"

#include "IR/Exception.h"
#include "IR/ExprRewriter.h"
#include "IR/FunctionRegistry.h"
#include "IR/TypeUtils.h"
#include "Logger/Logger.h"

namespace lqe {

using namespace ir;

namespace {

/**
 * Makes operand types of binary operators and function calls explicit. Result
 * types are computed when expressions are built, so casts inserted here never
 * change the type of the rewritten expression.
 */
class CoercionRewriter : public ExprRewriter {
 public:
  explicit CoercionRewriter(ExprArena& arena) : ExprRewriter(arena) {}

 protected:
  ExprId visitBinOper(const BinOper* bin_oper) override {
    auto lhs = visit(bin_oper->leftOperand());
    auto rhs = visit(bin_oper->rightOperand());
    auto operand_type =
        binOperOperandType(bin_oper->opType(), arena_.type(lhs), arena_.type(rhs));
    auto new_lhs = castTo(lhs, operand_type);
    auto new_rhs = castTo(rhs, operand_type);
    if (new_lhs == bin_oper->leftOperand() && new_rhs == bin_oper->rightOperand()) {
      return bin_oper->id();
    }
    return mutable_arena_.make<BinOper>(
        bin_oper->type(), bin_oper->opType(), new_lhs, new_rhs);
  }

  ExprId visitFunctionOper(const FunctionOper* func) override {
    ExprIdList args;
    TypeList arg_types;
    for (auto arg : func->args()) {
      args.push_back(visit(arg));
      arg_types.push_back(arena_.type(args.back()));
    }
    auto desc = func->desc();
    if (desc->arg_types) {
      auto targets = desc->arg_types(arg_types);
      CHECK_EQ(targets.size(), args.size()) << func->name();
      for (size_t i = 0; i < args.size(); ++i) {
        if (targets[i]) {
          args[i] = castTo(args[i], targets[i]);
        }
      }
    }
    if (args == func->args()) {
      return func->id();
    }
    return mutable_arena_.add(func->withChildren(args));
  }

 private:
  ExprId castTo(ExprId id, const Type* type) {
    auto from = arena_.type(id);
    if (from->equal(*type)) {
      return id;
    }
    if (!isCastSupported(from, type)) {
      throw SchemaError() << "Cannot coerce " << arena_.toString(id) << " of type "
                          << from->toString() << " to " << type->toString();
    }
    return mutable_arena_.make<CastExpr>(type, id, true);
  }
};

}  // namespace

NodeId coerceTypes(QueryDag& dag, NodeId root) {
  CoercionRewriter rewriter(dag.exprs());
  return rewriteBottomUp(dag, root, [&](const Node* node, NodeIdList inputs) {
    return rebuildNode(
        dag, node, std::move(inputs), [&](ExprId id) { return rewriter.visit(id); });
  });
}

}  // namespace lqe
