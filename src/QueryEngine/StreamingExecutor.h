/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "ExecutionOptions.h"
#include "PhysicalPlan.h"

#include <optional>

namespace lqe {

/**
 * Pull-based producer of morsels. next() returns the following morsel in order
 * or nullopt at the end of input.
 */
class MorselSource {
 public:
  virtual ~MorselSource() = default;

  virtual std::optional<Batch> next() = 0;
  virtual const ir::Schema& schema() const = 0;
};

using MorselSourcePtr = std::unique_ptr<MorselSource>;

enum class PipelineState {
  kIdle,
  kRunning,
  kFinished,
  kCancelled,
  kFailed,
};

std::string toString(PipelineState state);

/**
 * Root of a streaming execution. Tracks the pipeline state:
 * Idle -> Running -> {Finished | Cancelled | Failed}. Sources and their operator
 * state are released when the pipeline reaches a final state.
 */
class Pipeline {
 public:
  Pipeline(std::string name, MorselSourcePtr source);

  std::optional<Batch> next();

  PipelineState state() const { return state_; }
  const ir::Schema& schema() const { return schema_; }

 private:
  void setState(PipelineState state);

  std::string name_;
  ir::Schema schema_;
  MorselSourcePtr source_;
  PipelineState state_ = PipelineState::kIdle;
};

/**
 * Builds morsel sources for streaming subtrees of a physical plan. Stateless
 * operators are fused into chains processing several morsels in parallel, hash
 * joins probe morsels against a build side materialized on the first pull,
 * aggregations merge per-morsel partial states.
 */
class StreamingExecutor {
 public:
  explicit StreamingExecutor(ExecutionContext ctx) : ctx_(std::move(ctx)) {}

  // The node and its subtree must outlive the source.
  MorselSourcePtr build(const PhysicalNode& node) const;

  // Runs the subtree and concatenates all morsels.
  Batch collect(const PhysicalNode& node) const;

 private:
  ExecutionContext ctx_;
};

}  // namespace lqe
