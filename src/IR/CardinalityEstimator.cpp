/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "CardinalityEstimator.h"

#include "DataProvider/DataProvider.h"
#include "Logger/Logger.h"

#include <algorithm>

namespace lqe::ir {

namespace {

constexpr size_t kFilterSelectivityDiv = 2;

std::optional<size_t> estimateSlice(std::optional<size_t> rows, size_t offset, size_t len) {
  if (!rows) {
    return len;
  }
  return *rows > offset ? std::min(*rows - offset, len) : 0;
}

}  // namespace

std::optional<size_t> estimateRows(const QueryDag& dag, NodeId id) {
  auto node = dag.node(id);
  switch (node->kind()) {
    case NodeKind::kScan: {
      auto scan = node->as<Scan>();
      auto rows = scan->provider()->rowCount();
      auto& hints = scan->hints();
      if (rows && hints.predicate != kInvalidExprId) {
        rows = *rows / kFilterSelectivityDiv;
      }
      if (hints.slice) {
        rows = estimateSlice(rows, hints.slice->first, hints.slice->second);
      }
      return rows;
    }
    case NodeKind::kFilter: {
      auto rows = estimateRows(dag, node->input(0));
      if (rows) {
        return *rows / kFilterSelectivityDiv;
      }
      return rows;
    }
    case NodeKind::kProject:
    case NodeKind::kDistinct:
      return estimateRows(dag, node->input(0));
    case NodeKind::kAggregate:
      if (node->as<Aggregate>()->keys().empty()) {
        return 1;
      }
      return estimateRows(dag, node->input(0));
    case NodeKind::kSort: {
      auto sort = node->as<Sort>();
      auto rows = estimateRows(dag, sort->input(0));
      if (sort->limit()) {
        return estimateSlice(rows, sort->offset(), *sort->limit());
      }
      return rows;
    }
    case NodeKind::kSlice: {
      auto slice = node->as<Slice>();
      auto rows = estimateRows(dag, slice->input(0));
      if (slice->offset() < 0) {
        return rows ? std::min(*rows, slice->length()) : slice->length();
      }
      return estimateSlice(rows, static_cast<size_t>(slice->offset()), slice->length());
    }
    case NodeKind::kUnion: {
      size_t res = 0;
      for (auto input : node->inputs()) {
        auto rows = estimateRows(dag, input);
        if (!rows) {
          return std::nullopt;
        }
        res += *rows;
      }
      return res;
    }
    case NodeKind::kJoin: {
      auto join = node->as<Join>();
      auto left = estimateRows(dag, join->input(0));
      auto right = estimateRows(dag, join->input(1));
      if (!left || !right) {
        return std::nullopt;
      }
      switch (join->joinType()) {
        case JoinType::kCross:
          return *left * *right;
        case JoinType::kOuter:
          return *left + *right;
        case JoinType::kInner:
          return std::max(*left, *right);
        default:
          return left;
      }
    }
    case NodeKind::kExplode:
      return estimateRows(dag, node->input(0));
    case NodeKind::kMelt: {
      auto rows = estimateRows(dag, node->input(0));
      if (rows) {
        return *rows * std::max<size_t>(node->as<Melt>()->valueVars().size(), 1);
      }
      return rows;
    }
    case NodeKind::kUpsample:
      return std::nullopt;
  }
  UNREACHABLE() << "Unsupported node " << node->label();
  return std::nullopt;
}

}  // namespace lqe::ir
