/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "InMemoryExecutor.h"
#include "AsOfJoin.h"
#include "Operators.h"
#include "Reshape.h"
#include "StreamingExecutor.h"

#include "IR/Exception.h"
#include "Logger/Logger.h"
#include "Shared/ThreadPool.h"
#include "Shared/measure.h"

#include <new>

namespace lqe {

using namespace ir;

Batch InMemoryExecutor::execute(const PhysicalNode& node) const {
  ctx_.checkCancelled();
  try {
    auto clock_begin = timer_start();
    auto res = executeNode(node);
    VLOG(2) << node.label() << " produced " << res.numRows() << " rows in "
            << timer_stop(clock_begin) << "ms";
    return res;
  } catch (const Error& e) {
    e.setOperatorLabel(node.label());
    throw;
  } catch (const std::bad_alloc&) {
    ResourceExhaustedError err("Out of memory");
    err.setOperatorLabel(node.label());
    throw err;
  }
}

Batch InMemoryExecutor::executeNode(const PhysicalNode& node) const {
  switch (node.kind()) {
    case PhysicalKind::kScan:
      return executeScan(static_cast<const PhysicalScan&>(node));
    case PhysicalKind::kFilter:
    case PhysicalKind::kProject:
    case PhysicalKind::kExplode:
    case PhysicalKind::kMelt:
      return processBatch(node, execute(node.input(0)), ctx_);
    case PhysicalKind::kAggregate:
      return executeAggregate(static_cast<const PhysicalAggregate&>(node));
    case PhysicalKind::kHashJoin:
      return executeHashJoin(static_cast<const PhysicalHashJoin&>(node));
    case PhysicalKind::kCrossJoin: {
      auto left = execute(node.input(0));
      auto right = execute(node.input(1));
      return crossJoin(static_cast<const PhysicalCrossJoin&>(node), left, right, ctx_);
    }
    case PhysicalKind::kAsOfJoin:
      return executeAsOfJoin(static_cast<const PhysicalAsOfJoin&>(node));
    case PhysicalKind::kSort:
      return executeSort(static_cast<const PhysicalSort&>(node));
    case PhysicalKind::kSlice:
      return executeSlice(static_cast<const PhysicalSlice&>(node));
    case PhysicalKind::kUnion:
      return executeUnion(static_cast<const PhysicalUnion&>(node));
    case PhysicalKind::kDistinct:
      return executeDistinct(static_cast<const PhysicalDistinct&>(node));
    case PhysicalKind::kUpsample:
      return executeUpsample(static_cast<const PhysicalUpsample&>(node));
    case PhysicalKind::kMaterialize:
      return StreamingExecutor(ctx_).collect(node.input(0));
    case PhysicalKind::kMemorySource:
      return execute(node.input(0));
  }
  UNREACHABLE() << "Unsupported physical node " << node.label();
  return {};
}

Batch InMemoryExecutor::executeScan(const PhysicalScan& scan) const {
  auto frag_count = scan.provider->fragmentCount();
  if (scan.slice) {
    // Fragments are fetched in order until the slice is covered.
    auto required = scan.slice->first + scan.slice->second;
    BatchList batches;
    size_t collected = 0;
    for (size_t frag_idx = 0; frag_idx < frag_count && collected < required; ++frag_idx) {
      ctx_.checkCancelled();
      batches.push_back(scanFragment(scan, frag_idx, required - collected));
      collected += batches.back().numRows();
    }
    return concat(scan.schema(), batches).slice(scan.slice->first, scan.slice->second);
  }

  BatchList batches(frag_count);
  threading::parallel_for_each(frag_count, ctx_.parallel, [&](size_t frag_idx) {
    ctx_.checkCancelled();
    batches[frag_idx] = scanFragment(scan, frag_idx);
  });
  ctx_.checkCancelled();
  return concat(scan.schema(), batches);
}

Batch InMemoryExecutor::executeAggregate(const PhysicalAggregate& agg) const {
  auto input = execute(agg.input(0));
  auto states = aggregatePartial(agg, input, ctx_);
  auto num_partitions = agg.partitionCount() > 1 ? agg.partitionCount() : ctx_.hash_partitions;
  auto result = GroupByState::mergePartitioned(states, num_partitions, ctx_.parallel);
  ctx_.checkCancelled();
  return finalizeAggregate(agg, std::move(result), ctx_);
}

Batch InMemoryExecutor::executeHashJoin(const PhysicalHashJoin& join) const {
  auto left = execute(join.input(0));
  auto right = execute(join.input(1));
  auto keys = evalJoinKeys(join, left, right);
  if (join.build_left) {
    auto table = buildHashTable(keys.first, left.numRows(), ctx_);
    ctx_.checkCancelled();
    return probeHashJoin(join, *table, left, keys.second, right, ctx_);
  }
  auto table = buildHashTable(keys.second, right.numRows(), ctx_);
  ctx_.checkCancelled();
  return probeHashJoin(join, *table, right, keys.first, left, ctx_);
}

Batch InMemoryExecutor::executeAsOfJoin(const PhysicalAsOfJoin& join) const {
  auto left = execute(join.input(0));
  auto right = execute(join.input(1));
  std::vector<ColumnPtr> left_by;
  for (auto idx : join.left_by) {
    left_by.push_back(left.column(idx));
  }
  std::vector<ColumnPtr> right_by;
  for (auto idx : join.right_by) {
    right_by.push_back(right.column(idx));
  }
  auto matches = asofJoinMatches(join.left_key.evalFull(left),
                                 join.right_key.evalFull(right),
                                 std::move(left_by),
                                 std::move(right_by),
                                 join.options);
  return join.output.build(left, matches.probe, right, matches.build);
}

Batch InMemoryExecutor::executeSort(const PhysicalSort& sort) const {
  auto input = execute(sort.input(0));
  std::vector<ColumnPtr> keys;
  for (auto& key : sort.keys) {
    keys.push_back(key.evalFull(input));
  }
  auto indices =
      sortIndices(keys, sort.order, input.numRows(), ctx_.parallel, sort.limit, sort.offset);
  return take(input, indices);
}

Batch InMemoryExecutor::executeSlice(const PhysicalSlice& slice) const {
  auto input = execute(slice.input(0));
  auto range = resolveSlice(slice.offset, slice.length, input.numRows());
  return input.slice(range.first, range.second);
}

Batch InMemoryExecutor::executeUnion(const PhysicalUnion& union_node) const {
  BatchList batches;
  for (auto& input : union_node.inputs()) {
    batches.push_back(execute(*input));
  }
  return concat(union_node.schema(), batches);
}

Batch InMemoryExecutor::executeDistinct(const PhysicalDistinct& distinct) const {
  auto input = execute(distinct.input(0));
  std::vector<ColumnPtr> keys;
  for (auto idx : distinct.key_columns) {
    keys.push_back(input.column(idx));
  }
  return take(input, distinctRows(keys, input.numRows(), distinct.keep));
}

Batch InMemoryExecutor::executeUpsample(const PhysicalUpsample& upsample) const {
  auto input = execute(upsample.input(0));
  return lqe::upsample(input,
                       upsample.by_columns,
                       upsample.time_column,
                       upsample.every,
                       upsample.offset,
                       upsample.schema());
}

}  // namespace lqe
