/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "CancellationToken.h"

#include "QueryOptimizer/Optimizer.h"
#include "Shared/Config.h"

#include <ostream>

namespace lqe {

// Per query switches. Defaults come from the config and can be overridden for a
// single call.
struct ExecutionOptions {
  bool streaming = false;
  bool projection_pushdown = true;
  bool predicate_pushdown = true;
  bool cse = true;
  bool slice_pushdown = true;
  bool simplify_expr = true;
  bool join_reorder = true;
  bool parallel = true;
  CancellationTokenPtr cancellation;

  static ExecutionOptions fromConfig(const Config& config) {
    ExecutionOptions res;
    res.streaming = config.exec.streaming.enable;
    res.projection_pushdown = config.opts.projection_pushdown;
    res.predicate_pushdown = config.opts.predicate_pushdown;
    res.cse = config.opts.cse;
    res.slice_pushdown = config.opts.slice_pushdown;
    res.simplify_expr = config.opts.simplify_expr;
    res.join_reorder = config.opts.join_reorder;
    res.parallel = config.exec.parallel;
    return res;
  }

  OptimizerOptions optimizerOptions() const {
    OptimizerOptions res;
    res.predicate_pushdown = predicate_pushdown;
    res.projection_pushdown = projection_pushdown;
    res.slice_pushdown = slice_pushdown;
    res.cse = cse;
    res.simplify_expr = simplify_expr;
    res.join_reorder = join_reorder;
    return res;
  }
};

inline std::ostream& operator<<(std::ostream& os, const ExecutionOptions& opts) {
  os << "(streaming=" << opts.streaming << " parallel=" << opts.parallel
     << " optimizer=" << opts.optimizerOptions() << ")";
  return os;
}

// Execution parameters shared by operators of a query.
struct ExecutionContext {
  bool parallel = true;
  size_t sub_task_size = 16'384;
  size_t morsel_size = 65'536;
  size_t hash_partitions = 16;
  WatchdogConfig watchdog;
  CancellationTokenPtr cancellation;

  static ExecutionContext make(const Config& config, const ExecutionOptions& opts) {
    ExecutionContext res;
    res.parallel = opts.parallel;
    res.sub_task_size = config.exec.sub_task_size;
    res.morsel_size = config.exec.streaming.morsel_size;
    res.hash_partitions = config.exec.hash_partitions;
    res.watchdog = config.exec.watchdog;
    res.cancellation = opts.cancellation;
    return res;
  }

  bool isCancelled() const { return cancellation && cancellation->isCancelled(); }

  void checkCancelled() const {
    if (cancellation) {
      cancellation->throwIfCancelled();
    }
  }
};

}  // namespace lqe
