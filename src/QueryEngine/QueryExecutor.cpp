/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "QueryExecutor.h"
#include "ColumnOps.h"
#include "ExprCompiler.h"
#include "InMemoryExecutor.h"
#include "PhysicalPlanner.h"

#include "IR/Exception.h"
#include "Logger/Logger.h"
#include "QueryOptimizer/Optimizer.h"
#include "Shared/ThreadPool.h"
#include "Shared/measure.h"

namespace lqe {

using namespace ir;

ResultStream::ResultStream(QueryDagPtr dag, PhysicalNodePtr root, ExecutionContext ctx)
    : dag_(std::move(dag)), root_(std::move(root)) {
  CHECK(root_->isStreaming()) << root_->label();
  auto source = StreamingExecutor(std::move(ctx)).build(*root_);
  pipeline_ = std::make_unique<Pipeline>(root_->label(), std::move(source));
}

std::optional<Batch> ResultStream::next() {
  return pipeline_->next();
}

Batch ResultStream::collectAll() {
  BatchList batches;
  while (auto batch = next()) {
    batches.push_back(std::move(*batch));
  }
  return concat(schema(), batches);
}

QueryExecutor::QueryExecutor(ConfigPtr config) : config_(std::move(config)) {
  CHECK(config_);
  default_opts_ = ExecutionOptions::fromConfig(*config_);
  threading::ThreadPool::instance(config_->exec.num_threads);
}

ExecutionResult QueryExecutor::collect(const QueryDag& dag) const {
  return collect(dag, default_opts_);
}

ExecutionResult QueryExecutor::collect(const QueryDag& dag,
                                       const ExecutionOptions& opts) const {
  VLOG(1) << "Executing query with options " << opts;
  auto clock_begin = timer_start();
  auto optimized = optimize(dag, opts);
  auto root = PhysicalPlanner(*optimized, *config_, opts).plan(false);
  auto physical_plan = root->toString();

  InMemoryExecutor executor(ExecutionContext::make(*config_, opts));
  auto batch = executor.execute(*root);
  auto time_ms = timer_stop(clock_begin);
  VLOG(1) << "Query produced " << batch.numRows() << " rows in " << time_ms << "ms";
  return ExecutionResult(std::move(batch), optimized->toString(), physical_plan, time_ms);
}

ResultStreamPtr QueryExecutor::collectStreaming(const QueryDag& dag) const {
  return collectStreaming(dag, default_opts_);
}

ResultStreamPtr QueryExecutor::collectStreaming(const QueryDag& dag,
                                                const ExecutionOptions& opts) const {
  VLOG(1) << "Starting streaming query with options " << opts;
  auto optimized = optimize(dag, opts);
  auto root = PhysicalPlanner(*optimized, *config_, opts).plan(true);
  return std::make_unique<ResultStream>(
      std::move(optimized), std::move(root), ExecutionContext::make(*config_, opts));
}

std::string QueryExecutor::explain(const QueryDag& dag) const {
  return explain(dag, default_opts_);
}

std::string QueryExecutor::explain(const QueryDag& dag, const ExecutionOptions& opts) const {
  auto optimized = optimize(dag, opts);
  auto root = PhysicalPlanner(*optimized, *config_, opts).plan(false);
  return "Logical plan:\n" + optimized->toString() + "\nPhysical plan:\n" +
         root->toString();
}

QueryDagPtr QueryExecutor::optimize(const QueryDag& dag,
                                    const ExecutionOptions& opts) const {
  if (dag.root() == kInvalidNodeId) {
    throw InvalidOperationError("Cannot execute an empty query plan.");
  }
  auto res = std::make_unique<QueryDag>(config_);
  res->setRoot(res->import(dag, dag.root()));
  Optimizer::optimize(*res, opts.optimizerOptions(), evaluateConstant);
  return res;
}

}  // namespace lqe
