/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "OpTypeEnums.h"

#include "Logger/Logger.h"

#include <string>

inline std::string toString(lqe::ir::OpType op) {
  switch (op) {
    case lqe::ir::OpType::kEq:
      return "EQ";
    case lqe::ir::OpType::kNe:
      return "NE";
    case lqe::ir::OpType::kLt:
      return "LT";
    case lqe::ir::OpType::kGt:
      return "GT";
    case lqe::ir::OpType::kLe:
      return "LE";
    case lqe::ir::OpType::kGe:
      return "GE";
    case lqe::ir::OpType::kAnd:
      return "AND";
    case lqe::ir::OpType::kOr:
      return "OR";
    case lqe::ir::OpType::kNot:
      return "NOT";
    case lqe::ir::OpType::kMinus:
      return "MINUS";
    case lqe::ir::OpType::kPlus:
      return "PLUS";
    case lqe::ir::OpType::kMul:
      return "MULTIPLY";
    case lqe::ir::OpType::kDiv:
      return "DIVIDE";
    case lqe::ir::OpType::kMod:
      return "MODULO";
    case lqe::ir::OpType::kFloorDiv:
      return "FLOOR_DIVIDE";
    case lqe::ir::OpType::kUMinus:
      return "UMINUS";
    case lqe::ir::OpType::kIsNull:
      return "IS_NULL";
    case lqe::ir::OpType::kIsNotNull:
      return "IS_NOT_NULL";
  }
  LOG(FATAL) << "Invalid operation kind: " << (int)op;
  return "";
}

inline std::string toString(lqe::ir::AggType agg) {
  switch (agg) {
    case lqe::ir::AggType::kCount:
      return "COUNT";
    case lqe::ir::AggType::kLen:
      return "LEN";
    case lqe::ir::AggType::kSum:
      return "SUM";
    case lqe::ir::AggType::kMean:
      return "MEAN";
    case lqe::ir::AggType::kMin:
      return "MIN";
    case lqe::ir::AggType::kMax:
      return "MAX";
    case lqe::ir::AggType::kFirst:
      return "FIRST";
    case lqe::ir::AggType::kLast:
      return "LAST";
    case lqe::ir::AggType::kNUnique:
      return "N_UNIQUE";
    case lqe::ir::AggType::kStd:
      return "STD";
    case lqe::ir::AggType::kVar:
      return "VAR";
    case lqe::ir::AggType::kMedian:
      return "MEDIAN";
  }
  LOG(FATAL) << "Invalid aggregate kind: " << (int)agg;
  return "";
}

inline std::string toString(lqe::ir::JoinType join_type) {
  switch (join_type) {
    case lqe::ir::JoinType::kInner:
      return "INNER";
    case lqe::ir::JoinType::kLeft:
      return "LEFT";
    case lqe::ir::JoinType::kOuter:
      return "OUTER";
    case lqe::ir::JoinType::kSemi:
      return "SEMI";
    case lqe::ir::JoinType::kAnti:
      return "ANTI";
    case lqe::ir::JoinType::kCross:
      return "CROSS";
    case lqe::ir::JoinType::kAsOf:
      return "ASOF";
  }
  LOG(FATAL) << "Invalid join kind: " << (int)join_type;
  return "";
}

inline std::string toString(lqe::ir::AsOfStrategy strategy) {
  switch (strategy) {
    case lqe::ir::AsOfStrategy::kBackward:
      return "BACKWARD";
    case lqe::ir::AsOfStrategy::kForward:
      return "FORWARD";
    case lqe::ir::AsOfStrategy::kNearest:
      return "NEAREST";
  }
  LOG(FATAL) << "Invalid as-of strategy: " << (int)strategy;
  return "";
}

inline std::string toString(lqe::ir::UniqueKeep keep) {
  switch (keep) {
    case lqe::ir::UniqueKeep::kAny:
      return "ANY";
    case lqe::ir::UniqueKeep::kFirst:
      return "FIRST";
    case lqe::ir::UniqueKeep::kLast:
      return "LAST";
    case lqe::ir::UniqueKeep::kNone:
      return "NONE";
  }
  LOG(FATAL) << "Invalid keep strategy: " << (int)keep;
  return "";
}

namespace lqe::ir {

inline std::ostream& operator<<(std::ostream& os, OpType op) {
  return os << ::toString(op);
}

inline std::ostream& operator<<(std::ostream& os, AggType agg) {
  return os << ::toString(agg);
}

inline std::ostream& operator<<(std::ostream& os, JoinType join_type) {
  return os << ::toString(join_type);
}

inline std::ostream& operator<<(std::ostream& os, AsOfStrategy strategy) {
  return os << ::toString(strategy);
}

inline std::ostream& operator<<(std::ostream& os, UniqueKeep keep) {
  return os << ::toString(keep);
}

}  // namespace lqe::ir
