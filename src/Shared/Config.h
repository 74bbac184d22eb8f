/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <memory>

struct WatchdogConfig {
  bool enable = false;
  size_t max_groups = 100'000'000;
  size_t max_join_rows = 1'000'000'000;
};

struct StreamingConfig {
  bool enable = false;
  size_t morsel_size = 65'536;
};

struct ExecConfig {
  WatchdogConfig watchdog;
  StreamingConfig streaming;

  bool parallel = true;
  // Zero means hardware concurrency.
  unsigned num_threads = 0;
  // Row-range split used for intra-operator parallelism.
  size_t sub_task_size = 16'384;
  // Number of hash partitions for partitioned joins and aggregations.
  size_t hash_partitions = 16;
};

struct OptimizationsConfig {
  bool predicate_pushdown = true;
  bool projection_pushdown = true;
  bool slice_pushdown = true;
  bool cse = true;
  bool simplify_expr = true;
  bool join_reorder = true;
};

struct StorageConfig {
  size_t default_fragment_size = 1'000'000;
};

struct DebugConfig {
  bool log_plans = false;
};

struct Config {
  ExecConfig exec;
  OptimizationsConfig opts;
  StorageConfig storage;
  DebugConfig debug;
};

using ConfigPtr = std::shared_ptr<Config>;
