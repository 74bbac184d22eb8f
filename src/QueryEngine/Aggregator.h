/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "DataMgr/Batch.h"
#include "IR/OpTypeEnums.h"

#include <limits>
#include <memory>
#include <unordered_map>
#include <vector>

namespace lqe {

using GroupIds = std::vector<uint32_t>;

constexpr uint32_t kNoGroup = std::numeric_limits<uint32_t>::max();

/**
 * Per-group state of an aggregate function. Accumulators are updated with
 * per-row group ids, merged with a mapping of source groups to target groups,
 * and finalized into a column with one row per group.
 */
class Accumulator {
 public:
  virtual ~Accumulator() = default;

  virtual void resize(size_t num_groups) = 0;
  // The argument has one value per group id and is nullptr for LEN.
  virtual void update(const ColumnPtr& arg, const GroupIds& group_ids) = 0;
  // Group i of other is merged into group group_map[i]. Groups mapped to
  // kNoGroup are skipped. Merging keeps the order: for FIRST and LAST other is
  // treated as coming after this accumulator's input.
  virtual void merge(const Accumulator& other, const GroupIds& group_map) = 0;
  virtual ColumnPtr finalize() const = 0;

  // Empty accumulator of the same kind.
  virtual std::unique_ptr<Accumulator> makeEmpty() const = 0;
};

using AccumulatorPtr = std::unique_ptr<Accumulator>;

struct AggSpec {
  ir::AggType agg;
  // nullptr for LEN.
  const ir::Type* arg_type;
  const ir::Type* result_type;
};

AccumulatorPtr makeAccumulator(const AggSpec& spec);

/**
 * Hash table mapping key tuples to dense group ids assigned in order of first
 * occurrence. Null key values form their own group. Key values are not copied:
 * the table keeps references to the key columns it was fed with.
 */
class GroupTable {
 public:
  explicit GroupTable(size_t num_keys) : num_keys_(num_keys) {}

  size_t size() const { return groups_.size(); }
  size_t numKeys() const { return num_keys_; }

  void insert(const std::vector<ColumnPtr>& keys, size_t num_rows, GroupIds& group_ids);
  // Adds a group of another table, returns its id here.
  uint32_t insertGroupFrom(const GroupTable& other, uint32_t group);

  size_t groupHash(uint32_t group) const { return groups_[group].hash; }

  std::vector<ColumnPtr> keyColumns(const std::vector<const ir::Type*>& types) const;

 private:
  struct GroupRef {
    uint32_t chunk;
    uint32_t row;
    size_t hash;
  };

  uint32_t findOrInsert(const std::vector<ColumnPtr>& keys,
                        uint32_t chunk,
                        size_t row,
                        size_t hash);
  uint32_t addChunk(const std::vector<ColumnPtr>& keys);

  size_t num_keys_;
  std::vector<std::vector<ColumnPtr>> chunks_;
  std::vector<GroupRef> groups_;
  std::unordered_multimap<size_t, uint32_t> index_;
};

/**
 * Hash aggregation state: groups and one accumulator per aggregate. States
 * built over consecutive row ranges can be merged, preserving the first-seen
 * group order.
 */
class GroupByState {
 public:
  struct Result {
    std::vector<ColumnPtr> keys;
    std::vector<ColumnPtr> aggs;
    size_t num_groups;
  };

  GroupByState(std::vector<const ir::Type*> key_types, std::vector<AggSpec> aggs);

  // Arguments are ordered as aggregates and have num_rows rows (nullptr for LEN).
  void update(const std::vector<ColumnPtr>& keys,
              const std::vector<ColumnPtr>& args,
              size_t num_rows);
  // Merges a state built over rows following the rows of this state.
  void merge(const GroupByState& other);

  size_t groupCount() const { return table_.size(); }

  // An aggregation without keys always produces one row.
  Result finalize() const;

  // Merges states of consecutive row ranges. Groups are distributed over
  // hash partitions merged in parallel; the result keeps the first-seen order.
  static Result mergePartitioned(const std::vector<std::unique_ptr<GroupByState>>& states,
                                 size_t num_partitions,
                                 bool parallel);

 private:
  std::unique_ptr<GroupByState> makeEmpty() const;
  void mergeGroups(const GroupByState& other, GroupIds& group_map);

  std::vector<const ir::Type*> key_types_;
  std::vector<AggSpec> specs_;
  GroupTable table_;
  std::vector<AccumulatorPtr> accs_;
};

}  // namespace lqe
