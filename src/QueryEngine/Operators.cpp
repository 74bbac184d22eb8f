/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "Operators.h"
#include "Reshape.h"

#include "IR/Exception.h"
#include "Logger/Logger.h"
#include "Shared/ThreadPool.h"
#include "Shared/misc.h"

#include <algorithm>
#include <limits>

namespace lqe {

using namespace ir;

namespace {

size_t grainFor(const PhysicalNode& node, const ExecutionContext& ctx) {
  return node.subTaskSize() ? node.subTaskSize() : ctx.sub_task_size;
}

// Applies fn to row ranges of the input in parallel and concatenates results in
// row order.
template <typename F>
Batch runSplit(const Batch& input,
               const Schema& schema,
               size_t grain,
               const ExecutionContext& ctx,
               F&& fn) {
  auto num_rows = input.numRows();
  if (!ctx.parallel || num_rows <= grain) {
    return fn(input);
  }
  BatchList parts(chunk_count(num_rows, grain));
  threading::parallel_for_ranges(num_rows, grain, true, [&](size_t begin, size_t end) {
    ctx.checkCancelled();
    parts[begin / grain] = fn(input.slice(begin, end - begin));
  });
  ctx.checkCancelled();
  return concat(schema, parts);
}

// Stable counting sort of matches by the build row. Makes the output of a join
// built on the left side identical to the one built on the right side.
void orderByBuildRows(JoinMatches& matches, size_t build_rows) {
  std::vector<size_t> offsets(build_rows + 1, 0);
  for (auto row : matches.build) {
    ++offsets[row + 1];
  }
  for (size_t i = 1; i < offsets.size(); ++i) {
    offsets[i] += offsets[i - 1];
  }
  JoinMatches res;
  res.probe.resize(matches.size());
  res.build.resize(matches.size());
  for (size_t i = 0; i < matches.size(); ++i) {
    auto pos = offsets[matches.build[i]]++;
    res.probe[pos] = matches.probe[i];
    res.build[pos] = matches.build[i];
  }
  matches = std::move(res);
}

}  // namespace

Batch scanFragment(const PhysicalScan& scan, size_t frag_idx, std::optional<size_t> limit) {
  FragmentHints hints;
  hints.columns = scan.read_columns;
  if (scan.predicate) {
    auto pred = *scan.predicate;
    hints.predicate = [pred](const Batch& batch) { return pred.evalFull(batch); };
    hints.predicate_columns = scan.predicate_columns;
  }
  hints.limit = limit;

  auto res = scan.provider->fetchFragment(frag_idx, hints);
  auto batch = std::move(res.batch);
  if (!res.projection_applied) {
    batch = batch.select(scan.read_columns);
  }
  if (scan.predicate && !res.predicate_applied) {
    batch = filter(batch, *scan.predicate->eval(batch));
  }
  if (batch.schema() != scan.schema()) {
    batch = batch.select(scan.schema().names());
  }
  if (limit && batch.numRows() > *limit) {
    batch = batch.slice(0, *limit);
  }
  return batch;
}

bool isStatelessOperator(PhysicalKind kind) {
  return kind == PhysicalKind::kFilter || kind == PhysicalKind::kProject ||
         kind == PhysicalKind::kExplode || kind == PhysicalKind::kMelt;
}

Batch processBatch(const PhysicalNode& node, const Batch& input, const ExecutionContext& ctx) {
  switch (node.kind()) {
    case PhysicalKind::kFilter: {
      auto& filter_node = static_cast<const PhysicalFilter&>(node);
      auto fn = [&](const Batch& batch) {
        return filter(batch, *filter_node.predicate.eval(batch));
      };
      if (!filter_node.splittable) {
        return fn(input);
      }
      return runSplit(input, node.schema(), grainFor(node, ctx), ctx, fn);
    }
    case PhysicalKind::kProject: {
      auto& project = static_cast<const PhysicalProject&>(node);
      auto fn = [&](const Batch& batch) {
        return evalProjection(project.exprs, project.schema(), batch);
      };
      if (!project.splittable) {
        return fn(input);
      }
      return runSplit(input, node.schema(), grainFor(node, ctx), ctx, fn);
    }
    case PhysicalKind::kExplode: {
      auto& explode_node = static_cast<const PhysicalExplode&>(node);
      return explode(input, explode_node.columns, node.schema());
    }
    case PhysicalKind::kMelt: {
      auto& melt_node = static_cast<const PhysicalMelt&>(node);
      return melt(input, melt_node.id_columns, melt_node.value_columns, node.schema());
    }
    default:
      break;
  }
  throw InvalidOperationError() << "Not a stateless operator: " << node.label();
}

std::vector<std::unique_ptr<GroupByState>> aggregatePartial(const PhysicalAggregate& agg,
                                                            const Batch& input,
                                                            const ExecutionContext& ctx) {
  auto update = [&](GroupByState& state, const Batch& batch) {
    std::vector<ColumnPtr> keys;
    for (auto& key : agg.keys) {
      keys.push_back(key.evalFull(batch));
    }
    std::vector<ColumnPtr> args;
    for (auto& arg : agg.agg_args) {
      args.push_back(arg ? arg->evalFull(batch) : nullptr);
    }
    state.update(keys, args, batch.numRows());
  };

  auto grain = grainFor(agg, ctx);
  auto num_rows = input.numRows();
  std::vector<std::unique_ptr<GroupByState>> states;
  if (!ctx.parallel || num_rows <= grain) {
    states.push_back(std::make_unique<GroupByState>(agg.key_types, agg.agg_specs));
    update(*states.back(), input);
    return states;
  }

  states.resize(chunk_count(num_rows, grain));
  threading::parallel_for_ranges(num_rows, grain, true, [&](size_t begin, size_t end) {
    ctx.checkCancelled();
    auto state = std::make_unique<GroupByState>(agg.key_types, agg.agg_specs);
    update(*state, input.slice(begin, end - begin));
    states[begin / grain] = std::move(state);
  });
  ctx.checkCancelled();
  return states;
}

Batch finalizeAggregate(const PhysicalAggregate& agg,
                        GroupByState::Result result,
                        const ExecutionContext& ctx) {
  if (ctx.watchdog.enable && result.num_groups > ctx.watchdog.max_groups) {
    throw ResourceExhaustedError()
        << "Group-by produced " << result.num_groups << " groups, the limit is "
        << ctx.watchdog.max_groups;
  }
  CHECK_EQ(result.aggs.size(), agg.agg_ids.size());
  AggSubstitution subst;
  for (size_t i = 0; i < agg.agg_ids.size(); ++i) {
    subst.emplace(agg.agg_ids[i], result.aggs[i]);
  }

  Batch groups(Schema(), {}, result.num_groups);
  auto cols = std::move(result.keys);
  for (auto& output : agg.outputs) {
    cols.push_back(output.evalFull(groups, &subst));
  }
  return Batch(agg.schema(), std::move(cols), result.num_groups);
}

std::pair<std::vector<ColumnPtr>, std::vector<ColumnPtr>> evalJoinKeys(
    const PhysicalHashJoin& join,
    const Batch& left,
    const Batch& right) {
  std::vector<ColumnPtr> left_keys;
  for (auto& key : join.left_keys) {
    left_keys.push_back(key.evalFull(left));
  }
  std::vector<ColumnPtr> right_keys;
  for (auto& key : join.right_keys) {
    right_keys.push_back(key.evalFull(right));
  }
  unifyKeyTypes(left_keys, right_keys);
  return {std::move(left_keys), std::move(right_keys)};
}

std::unique_ptr<HashJoinTable> buildHashTable(const std::vector<ColumnPtr>& keys,
                                              size_t num_rows,
                                              const ExecutionContext& ctx) {
  return std::make_unique<HashJoinTable>(
      keys, num_rows, ctx.hash_partitions, ctx.sub_task_size, ctx.parallel);
}

Batch probeHashJoin(const PhysicalHashJoin& join,
                    const HashJoinTable& table,
                    const Batch& build,
                    const std::vector<ColumnPtr>& probe_keys,
                    const Batch& probe,
                    const ExecutionContext& ctx) {
  auto grain = grainFor(join, ctx);
  auto num_rows = probe.numRows();
  switch (join.joinType()) {
    case JoinType::kSemi:
    case JoinType::kAnti: {
      auto rows = table.filterProbe(
          probe_keys, num_rows, join.joinType() == JoinType::kAnti, grain, ctx.parallel);
      return join.output.build(probe, rows, build, {});
    }
    case JoinType::kInner: {
      auto matches = table.probeAll(probe_keys, num_rows, false, grain, ctx.parallel);
      checkJoinRows(join.label(), matches.size(), ctx);
      if (join.build_left) {
        orderByBuildRows(matches, build.numRows());
        return join.output.build(build, matches.build, probe, matches.probe);
      }
      return join.output.build(probe, matches.probe, build, matches.build);
    }
    case JoinType::kLeft: {
      auto matches = table.probeAll(probe_keys, num_rows, true, grain, ctx.parallel);
      checkJoinRows(join.label(), matches.size(), ctx);
      return join.output.build(probe, matches.probe, build, matches.build);
    }
    case JoinType::kOuter: {
      auto matches = table.probeAll(probe_keys, num_rows, true, grain, ctx.parallel);
      std::vector<char> matched(build.numRows(), 0);
      for (auto row : matches.build) {
        if (row >= 0) {
          matched[row] = 1;
        }
      }
      for (size_t row = 0; row < build.numRows(); ++row) {
        if (!matched[row]) {
          matches.probe.push_back(-1);
          matches.build.push_back(row);
        }
      }
      checkJoinRows(join.label(), matches.size(), ctx);
      return join.output.build(probe, matches.probe, build, matches.build);
    }
    default:
      break;
  }
  throw InvalidOperationError() << "Unsupported hash join type: " << join.joinType();
}

Batch crossJoin(const PhysicalCrossJoin& join,
                const Batch& left,
                const Batch& right,
                const ExecutionContext& ctx) {
  checkJoinRows(join.label(), left.numRows() * right.numRows(), ctx);
  auto matches = crossJoinMatches(left.numRows(), right.numRows());
  return join.output.build(left, matches.probe, right, matches.build);
}

void checkJoinRows(const std::string& label, size_t num_rows, const ExecutionContext& ctx) {
  if (ctx.watchdog.enable && num_rows > ctx.watchdog.max_join_rows) {
    throw ResourceExhaustedError() << label << " produced " << num_rows
                                   << " rows, the limit is " << ctx.watchdog.max_join_rows;
  }
}

std::pair<size_t, size_t> resolveSlice(int64_t offset, size_t length, size_t total) {
  auto signed_total = static_cast<int64_t>(total);
  auto start = offset < 0 ? offset + signed_total : offset;
  // The length applies from the unclamped start, saturating on overflow.
  auto max_length = static_cast<size_t>(std::numeric_limits<int64_t>::max() -
                                        std::max<int64_t>(start, 0));
  auto stop = start + static_cast<int64_t>(std::min(length, max_length));
  start = std::clamp<int64_t>(start, 0, signed_total);
  stop = std::clamp<int64_t>(stop, 0, signed_total);
  return {static_cast<size_t>(start), static_cast<size_t>(stop - start)};
}

}  // namespace lqe
