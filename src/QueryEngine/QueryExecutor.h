/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "ExecutionOptions.h"
#include "PhysicalPlan.h"
#include "StreamingExecutor.h"

#include "DataMgr/Batch.h"
#include "IR/Node.h"

namespace lqe {

class ExecutionResult {
 public:
  ExecutionResult(Batch batch,
                  std::string logical_plan,
                  std::string physical_plan,
                  int64_t execution_time_ms)
      : batch_(std::move(batch))
      , logical_plan_(std::move(logical_plan))
      , physical_plan_(std::move(physical_plan))
      , execution_time_ms_(execution_time_ms) {}

  const Batch& batch() const { return batch_; }
  Batch releaseBatch() { return std::move(batch_); }
  const ir::Schema& schema() const { return batch_.schema(); }
  size_t numRows() const { return batch_.numRows(); }

  // Optimized logical plan.
  const std::string& logicalPlan() const { return logical_plan_; }
  const std::string& physicalPlan() const { return physical_plan_; }
  int64_t executionTimeMs() const { return execution_time_ms_; }

 private:
  Batch batch_;
  std::string logical_plan_;
  std::string physical_plan_;
  int64_t execution_time_ms_;
};

/**
 * Incremental result of a streaming collect. Owns the optimized plan and the
 * operator state of the running query, which is released at the end of the
 * input, on an error or when the stream is destroyed.
 */
class ResultStream {
 public:
  ResultStream(ir::QueryDagPtr dag, PhysicalNodePtr root, ExecutionContext ctx);

  // Next result batch in the row order or nullopt after the last one.
  std::optional<Batch> next();
  // Remaining batches concatenated.
  Batch collectAll();

  const ir::Schema& schema() const { return root_->schema(); }
  PipelineState state() const { return pipeline_->state(); }
  std::string physicalPlan() const { return root_->toString(); }

 private:
  ir::QueryDagPtr dag_;
  PhysicalNodePtr root_;
  std::unique_ptr<Pipeline> pipeline_;
};

using ResultStreamPtr = std::unique_ptr<ResultStream>;

/**
 * Query entry point: optimizes a copy of the given plan, lowers it to physical
 * operators and runs them. The caller's DAG is never modified.
 */
class QueryExecutor {
 public:
  explicit QueryExecutor(ConfigPtr config);

  ExecutionResult collect(const ir::QueryDag& dag) const;
  ExecutionResult collect(const ir::QueryDag& dag, const ExecutionOptions& opts) const;

  ResultStreamPtr collectStreaming(const ir::QueryDag& dag) const;
  ResultStreamPtr collectStreaming(const ir::QueryDag& dag,
                                   const ExecutionOptions& opts) const;

  // Optimized logical plan followed by the physical plan.
  std::string explain(const ir::QueryDag& dag) const;
  std::string explain(const ir::QueryDag& dag, const ExecutionOptions& opts) const;

  const ExecutionOptions& defaultOptions() const { return default_opts_; }

 private:
  ir::QueryDagPtr optimize(const ir::QueryDag& dag, const ExecutionOptions& opts) const;

  ConfigPtr config_;
  ExecutionOptions default_opts_;
};

}  // namespace lqe
