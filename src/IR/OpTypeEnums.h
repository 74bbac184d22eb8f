/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

namespace lqe::ir {

enum class OpType {
  kEq = 0,
  kNe,
  kLt,
  kGt,
  kLe,
  kGe,
  kAnd,
  kOr,
  kNot,
  kMinus,
  kPlus,
  kMul,
  kDiv,
  kMod,
  kFloorDiv,
  kUMinus,
  kIsNull,
  kIsNotNull,
};

inline bool isComparison(OpType op) {
  return op == OpType::kEq || op == OpType::kNe || op == OpType::kLt ||
         op == OpType::kGt || op == OpType::kLe || op == OpType::kGe;
}

inline bool isLogic(OpType op) {
  return op == OpType::kAnd || op == OpType::kOr;
}

inline bool isArithmetic(OpType op) {
  return op == OpType::kMinus || op == OpType::kPlus || op == OpType::kMul ||
         op == OpType::kDiv || op == OpType::kMod || op == OpType::kFloorDiv;
}

inline OpType commuteComparison(OpType op) {
  return op == OpType::kLt   ? OpType::kGt
         : op == OpType::kLe ? OpType::kGe
         : op == OpType::kGt ? OpType::kLt
         : op == OpType::kGe ? OpType::kLe
                             : op;
}

inline bool isUnary(OpType op) {
  return op == OpType::kNot || op == OpType::kUMinus || op == OpType::kIsNull ||
         op == OpType::kIsNotNull;
}

enum class AggType {
  kCount,
  kLen,
  kSum,
  kMean,
  kMin,
  kMax,
  kFirst,
  kLast,
  kNUnique,
  kStd,
  kVar,
  kMedian,
};

enum class JoinType {
  kInner,
  kLeft,
  kOuter,
  kSemi,
  kAnti,
  kCross,
  kAsOf,
};

enum class AsOfStrategy {
  kBackward,
  kForward,
  kNearest,
};

// Row kept by a distinct operation among rows with equal subset values.
enum class UniqueKeep {
  kAny,
  kFirst,
  kLast,
  kNone,
};

}  // namespace lqe::ir
