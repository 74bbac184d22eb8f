/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "ColumnOps.h"

#include "IR/Node.h"

#include <unordered_map>

namespace lqe {

// Pairs of matched rows. -1 marks a missing side of outer join rows.
struct JoinMatches {
  std::vector<int64_t> probe;
  std::vector<int64_t> build;

  size_t size() const { return probe.size(); }
};

/**
 * Hash table over the build side keys. Rows are distributed over hash
 * partitions which are built in parallel. Rows with null keys are never
 * inserted: null keys do not match anything.
 */
class HashJoinTable {
 public:
  HashJoinTable(std::vector<ColumnPtr> keys,
                size_t num_rows,
                size_t num_partitions,
                size_t grain,
                bool parallel);

  size_t numRows() const { return num_rows_; }

  // Matches of probe rows [begin, end) in probe row order. Build rows of one
  // probe row follow the build side order.
  void probe(const std::vector<ColumnPtr>& keys,
             size_t begin,
             size_t end,
             JoinMatches& matches) const;

  // Matches of all probe rows. With left_outer set every probe row without a
  // match produces a pair with build row -1.
  JoinMatches probeAll(const std::vector<ColumnPtr>& keys,
                       size_t num_rows,
                       bool left_outer,
                       size_t grain,
                       bool parallel) const;

  // Probe rows having at least one match (semi) or none (anti).
  std::vector<int64_t> filterProbe(const std::vector<ColumnPtr>& keys,
                                   size_t num_rows,
                                   bool anti,
                                   size_t grain,
                                   bool parallel) const;

 private:
  using Partition = std::unordered_map<size_t, std::vector<uint32_t>>;

  const std::vector<uint32_t>* find(const std::vector<ColumnPtr>& keys,
                                    size_t row,
                                    size_t hash) const;

  std::vector<ColumnPtr> keys_;
  size_t num_rows_;
  std::vector<Partition> partitions_;
};

/**
 * Maps join matches to output columns. Semi and anti joins output left rows
 * only.
 */
class JoinOutput {
 public:
  JoinOutput(const ir::Join& join, const ir::QueryDag& dag);

  ir::JoinType joinType() const { return type_; }
  const ir::Schema& schema() const { return schema_; }

  Batch build(const Batch& left,
              const std::vector<int64_t>& left_rows,
              const Batch& right,
              const std::vector<int64_t>& right_rows) const;

 private:
  ir::JoinType type_;
  ir::Schema schema_;
  std::vector<ir::Join::ColumnSource> sources_;
  // Output positions of coalesced outer join keys with the right column used
  // for rows without a left match.
  std::unordered_map<size_t, size_t> coalesced_;
};

// Key columns cast to the common type of both sides.
void unifyKeyTypes(std::vector<ColumnPtr>& left_keys, std::vector<ColumnPtr>& right_keys);

// All pairs of rows, left row major.
JoinMatches crossJoinMatches(size_t left_rows, size_t right_rows);

}  // namespace lqe
