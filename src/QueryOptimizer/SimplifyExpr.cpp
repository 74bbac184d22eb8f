/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "Passes.h"

#include "IR/Exception.h"
#include "IR/ExprRewriter.h"
#include "IR/FunctionRegistry.h"
#include "Logger/Logger.h"

namespace lqe {

using namespace ir;

namespace {

const Literal* asLiteral(const ExprArena& arena, ExprId id) {
  return arena.get(id)->as<Literal>();
}

bool isBoolLiteral(const ExprArena& arena, ExprId id, bool val) {
  auto lit = asLiteral(arena, id);
  if (!lit || !lit->type()->isBoolean() || lit->isNull()) {
    return false;
  }
  return std::get<int64_t>(lit->value()) == (val ? 1 : 0);
}

// Replacing an expression with a literal is only valid when it would not change
// the result length.
bool isScalar(const ExprArena& arena, ExprId id) {
  return referencedColumns(arena, id).empty();
}

bool isNumLiteral(const ExprArena& arena, ExprId id, int64_t val) {
  auto lit = asLiteral(arena, id);
  if (!lit || lit->isNull()) {
    return false;
  }
  if (lit->type()->isInteger()) {
    return std::get<int64_t>(lit->value()) == val;
  }
  if (lit->type()->isFloatingPoint()) {
    return std::get<double>(lit->value()) == static_cast<double>(val);
  }
  return false;
}

class SimplifyRewriter : public ExprRewriter {
 public:
  SimplifyRewriter(ExprArena& arena, ConstantEvaluator evaluate)
      : ExprRewriter(arena), evaluate_(std::move(evaluate)) {}

  // Filter masks broadcast, so a predicate may collapse into a literal.
  void setPredicateContext(bool val) { predicate_context_ = val; }

 protected:
  ExprId visitBinOper(const BinOper* bin_oper) override {
    auto id = rewriteChildren(bin_oper);
    auto expr = arena_.get(id)->as<BinOper>();
    auto lhs = expr->leftOperand();
    auto rhs = expr->rightOperand();
    if (asLiteral(arena_, lhs) && asLiteral(arena_, rhs)) {
      return fold(id);
    }

    auto type = expr->type();
    auto same_type = [&](ExprId operand) { return arena_.type(operand)->equal(*type); };
    switch (expr->opType()) {
      case OpType::kAnd:
        if ((isBoolLiteral(arena_, lhs, false) && absorbs(rhs)) ||
            (isBoolLiteral(arena_, rhs, false) && absorbs(lhs))) {
          return mutable_arena_.make<Literal>(type, Datum(int64_t(0)));
        }
        if (isBoolLiteral(arena_, rhs, true) && same_type(lhs)) {
          return lhs;
        }
        if (isBoolLiteral(arena_, lhs, true) && same_type(rhs)) {
          return rhs;
        }
        break;
      case OpType::kOr:
        if ((isBoolLiteral(arena_, lhs, true) && absorbs(rhs)) ||
            (isBoolLiteral(arena_, rhs, true) && absorbs(lhs))) {
          return mutable_arena_.make<Literal>(type, Datum(int64_t(1)));
        }
        if (isBoolLiteral(arena_, rhs, false) && same_type(lhs)) {
          return lhs;
        }
        if (isBoolLiteral(arena_, lhs, false) && same_type(rhs)) {
          return rhs;
        }
        break;
      case OpType::kPlus:
        // x + 0.0 is not an identity for x = -0.0.
        if (type->isInteger()) {
          if (isNumLiteral(arena_, rhs, 0) && same_type(lhs)) {
            return lhs;
          }
          if (isNumLiteral(arena_, lhs, 0) && same_type(rhs)) {
            return rhs;
          }
        }
        break;
      case OpType::kMinus:
        if (type->isInteger() && isNumLiteral(arena_, rhs, 0) && same_type(lhs)) {
          return lhs;
        }
        break;
      case OpType::kMul:
        if (isNumLiteral(arena_, rhs, 1) && same_type(lhs)) {
          return lhs;
        }
        if (isNumLiteral(arena_, lhs, 1) && same_type(rhs)) {
          return rhs;
        }
        break;
      default:
        break;
    }
    return id;
  }

  ExprId visitUOper(const UOper* uoper) override {
    auto id = rewriteChildren(uoper);
    auto expr = arena_.get(id)->as<UOper>();
    if (asLiteral(arena_, expr->operand())) {
      return fold(id);
    }
    // Double NOT and double negation.
    auto inner = arena_.get(expr->operand())->as<UOper>();
    if (inner && inner->opType() == expr->opType() &&
        (expr->opType() == OpType::kNot || expr->opType() == OpType::kUMinus) &&
        arena_.type(inner->operand())->equal(*expr->type())) {
      return inner->operand();
    }
    return id;
  }

  ExprId visitFunctionOper(const FunctionOper* func) override {
    auto id = rewriteChildren(func);
    auto expr = arena_.get(id)->as<FunctionOper>();
    if (!expr->desc()->elementwise || expr->args().empty()) {
      return id;
    }
    for (auto arg : expr->args()) {
      if (!asLiteral(arena_, arg)) {
        return id;
      }
    }
    return fold(id);
  }

  ExprId visitCast(const CastExpr* cast_expr) override {
    auto id = rewriteChildren(cast_expr);
    auto expr = arena_.get(id)->as<CastExpr>();
    if (arena_.type(expr->operand())->equal(*expr->type())) {
      return expr->operand();
    }
    if (asLiteral(arena_, expr->operand())) {
      return fold(id);
    }
    return id;
  }

 private:
  bool absorbs(ExprId operand) const {
    return predicate_context_ || isScalar(arena_, operand);
  }

  // Evaluates a literal-only expression. Evaluation errors are left to the
  // execution.
  ExprId fold(ExprId id) {
    auto type = arena_.type(id);
    if (type->isList() || !evaluate_) {
      return id;
    }
    try {
      return mutable_arena_.make<Literal>(type, evaluate_(arena_, id));
    } catch (const Error& e) {
      VLOG(1) << "Cannot fold " << arena_.toString(id) << ": " << e.what();
      return id;
    }
  }

  ConstantEvaluator evaluate_;
  bool predicate_context_ = false;
};

bool isTrueFilter(const QueryDag& dag, const Node* node) {
  auto filter = node->as<Filter>();
  return filter && isBoolLiteral(dag.exprs(), filter->predicate(), true);
}

}  // namespace

NodeId simplifyExpressions(QueryDag& dag, NodeId root, const ConstantEvaluator& evaluate) {
  SimplifyRewriter rewriter(dag.exprs(), evaluate);
  auto& arena = dag.exprs();
  return rewriteBottomUp(dag, root, [&](const Node* node, NodeIdList inputs) -> NodeId {
    // Join output columns depend on the key kinds.
    if (node->is<Join>()) {
      return rebuildNode(dag, node, std::move(inputs));
    }
    bool keep_names = node->is<Project>() || node->is<Aggregate>();
    rewriter.setPredicateContext(node->is<Filter>());
    auto res = rebuildNode(dag, node, std::move(inputs), [&](ExprId id) {
      auto new_id = rewriter.visit(id);
      if (keep_names && new_id != id) {
        auto name = outputName(arena, id);
        if (outputName(arena, new_id) != name) {
          new_id = arena.make<AliasExpr>(arena.type(new_id), stripAlias(arena, new_id), name);
        }
      }
      return new_id;
    });
    auto new_node = dag.node(res);
    if (isTrueFilter(dag, new_node)) {
      VLOG(2) << "Removed always true " << node->label();
      return new_node->input(0);
    }
    return res;
  });
}

}  // namespace lqe
