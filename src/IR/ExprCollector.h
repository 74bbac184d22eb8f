/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "ExprVisitor.h"

namespace lqe::ir {

template <typename ResultType, typename CollectorType>
class ExprCollector : public ExprVisitor<void> {
 public:
  template <typename... Ts>
  static ResultType collect(const ExprArena& arena, ExprId id, Ts&&... args) {
    CollectorType collector(arena, std::forward<Ts>(args)...);
    collector.visit(id);
    return std::move(collector.result_);
  }

  template <typename... Ts>
  static ResultType collect(const ExprArena& arena, const ExprIdList& ids, Ts&&... args) {
    CollectorType collector(arena, std::forward<Ts>(args)...);
    for (auto id : ids) {
      collector.visit(id);
    }
    return std::move(collector.result_);
  }

  ResultType& result() { return result_; }
  const ResultType& result() const { return result_; }

 protected:
  using BaseClass = ExprCollector<ResultType, CollectorType>;

  explicit ExprCollector(const ExprArena& arena) : ExprVisitor<void>(arena) {}

  ResultType result_;
};

}  // namespace lqe::ir
