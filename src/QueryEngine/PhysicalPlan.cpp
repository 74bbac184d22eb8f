/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "PhysicalPlan.h"

#include "IR/OpType.h"
#include "Shared/misc.h"

namespace lqe {

std::string toString(PhysicalKind kind) {
  switch (kind) {
    case PhysicalKind::kScan:
      return "Scan";
    case PhysicalKind::kFilter:
      return "Filter";
    case PhysicalKind::kProject:
      return "Project";
    case PhysicalKind::kAggregate:
      return "Aggregate";
    case PhysicalKind::kHashJoin:
      return "HashJoin";
    case PhysicalKind::kCrossJoin:
      return "CrossJoin";
    case PhysicalKind::kAsOfJoin:
      return "AsOfJoin";
    case PhysicalKind::kSort:
      return "Sort";
    case PhysicalKind::kSlice:
      return "Slice";
    case PhysicalKind::kUnion:
      return "Union";
    case PhysicalKind::kDistinct:
      return "Distinct";
    case PhysicalKind::kExplode:
      return "Explode";
    case PhysicalKind::kMelt:
      return "Melt";
    case PhysicalKind::kUpsample:
      return "Upsample";
    case PhysicalKind::kMaterialize:
      return "Materialize";
    case PhysicalKind::kMemorySource:
      return "MemorySource";
  }
  return "Unknown";
}

std::string toString(ExecutionStrategy strategy) {
  return strategy == ExecutionStrategy::kStreaming ? "streaming" : "in-memory";
}

std::string PhysicalNode::toString() const {
  std::string res;
  print(0, res);
  return res;
}

void PhysicalNode::print(size_t indent, std::string& res) const {
  res += std::string(indent * 2, ' ') + label_ + " [" + ::lqe::toString(strategy_);
  if (num_partitions_ > 1) {
    res += ", partitions=" + std::to_string(num_partitions_);
  }
  res += "]";
  auto extra = details();
  if (!extra.empty()) {
    res += " " + extra;
  }
  res += "\n";
  for (auto& input : inputs_) {
    input->print(indent + 1, res);
  }
}

std::string PhysicalScan::details() const {
  auto res = "table=" + table_name + " columns=[" + join(read_columns, ", ") + "]";
  if (predicate) {
    res += " predicate";
  }
  if (slice) {
    res += cat(" slice=(", slice->first, ", ", slice->second, ")");
  }
  return res;
}

std::string PhysicalAggregate::details() const {
  return cat("keys=", keys.size(), " aggs=", agg_specs.size(), mergeable ? "" : " final");
}

std::string PhysicalHashJoin::details() const {
  return "type=" + ::toString(joinType()) + (build_left ? " build=left" : " build=right");
}

std::string PhysicalAsOfJoin::details() const {
  return "strategy=" + ::toString(options.strategy);
}

std::string PhysicalSort::details() const {
  auto res = cat("keys=", keys.size());
  if (limit) {
    res += cat(" limit=", *limit, " offset=", offset);
  }
  return res;
}

std::string PhysicalSlice::details() const {
  return cat("offset=", offset, " length=", length);
}

std::string PhysicalDistinct::details() const {
  return "keep=" + ::toString(keep);
}

std::string PhysicalUpsample::details() const {
  return "every=" + every.toString() + " offset=" + offset.toString();
}

}  // namespace lqe
