/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "TypeUtils.h"
#include "Context.h"
#include "Exception.h"
#include "OpType.h"

#include "Shared/misc.h"

namespace lqe::ir {

namespace {

const Type* commonNumberType(const Type* lhs, const Type* rhs) {
  auto& ctx = lhs->ctx();
  if (lhs->isBoolean() && rhs->isBoolean()) {
    return lhs;
  }
  if (lhs->isBoolean()) {
    return rhs->isNumber() ? rhs : nullptr;
  }
  if (rhs->isBoolean()) {
    return lhs->isNumber() ? lhs : nullptr;
  }
  if (lhs->isInteger() && rhs->isInteger()) {
    return lhs->size() >= rhs->size() ? lhs : rhs;
  }
  if (lhs->isFloatingPoint() && rhs->isFloatingPoint()) {
    return lhs->size() >= rhs->size() ? lhs : rhs;
  }
  auto fp_type = lhs->isFloatingPoint() ? lhs : rhs;
  auto int_type = lhs->isInteger() ? lhs : rhs;
  if (fp_type->isFp32() && int_type->size() <= 2) {
    return fp_type;
  }
  return ctx.fp64();
}

bool isNumberLike(const Type* type) {
  return type->isNumber() || type->isBoolean();
}

}  // namespace

const Type* commonType(const Type* lhs, const Type* rhs) {
  if (lhs->equal(*rhs)) {
    return lhs;
  }
  if (lhs->isNull()) {
    return rhs;
  }
  if (rhs->isNull()) {
    return lhs;
  }
  if (isNumberLike(lhs) && isNumberLike(rhs)) {
    return commonNumberType(lhs, rhs);
  }
  if (lhs->isDateTime() && rhs->isDateTime()) {
    return lhs->ctx().timestamp();
  }
  if (lhs->isList() && rhs->isList()) {
    auto elem = commonType(lhs->as<ListType>()->elemType(), rhs->as<ListType>()->elemType());
    return elem ? lhs->ctx().list(elem) : nullptr;
  }
  return nullptr;
}

const Type* commonTypeOrThrow(const Type* lhs, const Type* rhs, const std::string& ctx) {
  auto res = commonType(lhs, rhs);
  if (!res) {
    throw SchemaError() << "Cannot find a common type for " << lhs->toString() << " and "
                        << rhs->toString() << " in " << ctx;
  }
  return res;
}

const Type* binOperOperandType(OpType op, const Type* lhs, const Type* rhs) {
  auto ctx = cat(op, "(", lhs->toString(), ", ", rhs->toString(), ")");
  if (isLogic(op)) {
    for (auto type : {lhs, rhs}) {
      if (!type->isBoolean() && !type->isNull()) {
        throw SchemaError() << "Logical operator expects boolean operands, got "
                            << type->toString() << " in " << ctx;
      }
    }
    return lhs->ctx().boolean();
  }
  auto common = commonTypeOrThrow(lhs, rhs, ctx);
  if (isArithmetic(op)) {
    if (common->isNull()) {
      return lhs->ctx().int64();
    }
    if (!isNumberLike(common)) {
      throw SchemaError() << "Arithmetic is not supported for " << common->toString()
                          << " in " << ctx;
    }
    if (common->isBoolean()) {
      return lhs->ctx().int64();
    }
    if (op == OpType::kDiv && common->isInteger()) {
      return lhs->ctx().fp64();
    }
  } else if (isComparison(op) && common->isList()) {
    throw SchemaError() << "Comparison is not supported for " << common->toString()
                        << " in " << ctx;
  }
  return common;
}

const Type* binOperResultType(OpType op, const Type* lhs, const Type* rhs) {
  auto operand_type = binOperOperandType(op, lhs, rhs);
  if (isComparison(op) || isLogic(op)) {
    return lhs->ctx().boolean();
  }
  return operand_type;
}

const Type* unaryOperResultType(OpType op, const Type* operand) {
  auto& ctx = operand->ctx();
  switch (op) {
    case OpType::kNot:
      if (!operand->isBoolean() && !operand->isNull()) {
        throw SchemaError() << "NOT expects a boolean operand, got "
                            << operand->toString();
      }
      return ctx.boolean();
    case OpType::kUMinus:
      if (operand->isNull()) {
        return ctx.int64();
      }
      if (!operand->isNumber()) {
        throw SchemaError() << "Negation is not supported for " << operand->toString();
      }
      return operand;
    case OpType::kIsNull:
    case OpType::kIsNotNull:
      return ctx.boolean();
    default:
      throw InvalidOperationError() << "Not a unary operation: " << op;
  }
}

const Type* aggResultType(AggType agg, const Type* arg) {
  auto& ctx = arg ? arg->ctx() : Context::defaultCtx();
  switch (agg) {
    case AggType::kCount:
    case AggType::kLen:
    case AggType::kNUnique:
      return ctx.int64();
    case AggType::kSum:
      if (arg->isFloatingPoint()) {
        return arg;
      }
      if (arg->isInteger() || arg->isBoolean() || arg->isNull()) {
        return ctx.int64();
      }
      throw SchemaError() << "SUM is not supported for " << arg->toString();
    case AggType::kMean:
    case AggType::kStd:
    case AggType::kVar:
    case AggType::kMedian:
      if (!isNumberLike(arg) && !arg->isNull()) {
        throw SchemaError() << agg << " is not supported for " << arg->toString();
      }
      return ctx.fp64();
    case AggType::kMin:
    case AggType::kMax:
      if (arg->isList()) {
        throw SchemaError() << agg << " is not supported for " << arg->toString();
      }
      return arg;
    case AggType::kFirst:
    case AggType::kLast:
      return arg;
  }
  UNREACHABLE();
  return nullptr;
}

bool isCastSupported(const Type* from, const Type* to) {
  if (from->equal(*to) || from->isNull()) {
    return true;
  }
  if (to->isText()) {
    return !from->isList();
  }
  if (from->isList() || to->isList()) {
    return from->isList() && to->isList() &&
           isCastSupported(from->as<ListType>()->elemType(), to->as<ListType>()->elemType());
  }
  if (from->isText()) {
    return isNumberLike(to) || to->isDateTime();
  }
  if (isNumberLike(from) && isNumberLike(to)) {
    return true;
  }
  if (from->isDateTime() && to->isDateTime()) {
    return true;
  }
  if ((from->isDateTime() && to->isInteger()) || (from->isInteger() && to->isDateTime())) {
    return true;
  }
  return false;
}

}  // namespace lqe::ir
