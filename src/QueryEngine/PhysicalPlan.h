/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "Aggregator.h"
#include "ExprCompiler.h"
#include "HashJoin.h"
#include "Sort.h"

#include "DataProvider/DataProvider.h"
#include "IR/Node.h"

#include <memory>
#include <optional>

namespace lqe {

enum class PhysicalKind {
  kScan,
  kFilter,
  kProject,
  kAggregate,
  kHashJoin,
  kCrossJoin,
  kAsOfJoin,
  kSort,
  kSlice,
  kUnion,
  kDistinct,
  kExplode,
  kMelt,
  kUpsample,
  // Streaming input consumed by an in-memory operator.
  kMaterialize,
  // In-memory input consumed by a streaming operator.
  kMemorySource,
};

std::string toString(PhysicalKind kind);

enum class ExecutionStrategy {
  kInMemory,
  kStreaming,
};

std::string toString(ExecutionStrategy strategy);

class PhysicalNode;
using PhysicalNodePtr = std::unique_ptr<PhysicalNode>;

/**
 * Executable operator. Physical nodes form a tree owning their inputs; a
 * logical node used by several consumers is lowered once per consumer.
 */
class PhysicalNode {
 public:
  virtual ~PhysicalNode() = default;

  PhysicalKind kind() const { return kind_; }
  ExecutionStrategy strategy() const { return strategy_; }
  bool isStreaming() const { return strategy_ == ExecutionStrategy::kStreaming; }
  const ir::Schema& schema() const { return schema_; }
  // Operator name with the logical node id, e.g. Filter#3.
  const std::string& label() const { return label_; }

  const std::vector<PhysicalNodePtr>& inputs() const { return inputs_; }
  const PhysicalNode& input(size_t idx) const { return *inputs_[idx]; }
  size_t inputCount() const { return inputs_.size(); }

  // Row range processed by a single task.
  size_t subTaskSize() const { return sub_task_size_; }
  size_t partitionCount() const { return num_partitions_; }
  void setPartitioning(size_t sub_task_size, size_t num_partitions) {
    sub_task_size_ = sub_task_size;
    num_partitions_ = num_partitions;
  }

  void setStrategy(ExecutionStrategy strategy) { strategy_ = strategy; }
  void addInput(PhysicalNodePtr input) { inputs_.push_back(std::move(input)); }
  PhysicalNodePtr releaseInput(size_t idx) { return std::move(inputs_[idx]); }
  void setInput(size_t idx, PhysicalNodePtr input) { inputs_[idx] = std::move(input); }

  // Operator specific parameters.
  virtual std::string details() const { return ""; }
  std::string toString() const;

  template <typename T>
  const T* as() const {
    return dynamic_cast<const T*>(this);
  }

 protected:
  PhysicalNode(PhysicalKind kind, ir::Schema schema, std::string label)
      : kind_(kind), schema_(std::move(schema)), label_(std::move(label)) {}

 private:
  void print(size_t indent, std::string& res) const;

  PhysicalKind kind_;
  ExecutionStrategy strategy_ = ExecutionStrategy::kInMemory;
  ir::Schema schema_;
  std::string label_;
  std::vector<PhysicalNodePtr> inputs_;
  size_t sub_task_size_ = 0;
  size_t num_partitions_ = 1;
};

class PhysicalScan : public PhysicalNode {
 public:
  PhysicalScan(ir::Schema schema, std::string label)
      : PhysicalNode(PhysicalKind::kScan, std::move(schema), std::move(label)) {}

  std::string details() const override;

  std::string table_name;
  DataProviderPtr provider;
  // Columns fetched from the provider: output columns and predicate columns.
  std::vector<std::string> read_columns;
  // Predicate compiled against the read columns.
  std::optional<CompiledExpr> predicate;
  std::vector<std::string> predicate_columns;
  std::optional<std::pair<size_t, size_t>> slice;
};

class PhysicalFilter : public PhysicalNode {
 public:
  PhysicalFilter(ir::Schema schema, std::string label, CompiledExpr predicate)
      : PhysicalNode(PhysicalKind::kFilter, std::move(schema), std::move(label))
      , predicate(std::move(predicate)) {}

  CompiledExpr predicate;
  // Row ranges can be filtered independently.
  bool splittable = true;
};

class PhysicalProject : public PhysicalNode {
 public:
  PhysicalProject(ir::Schema schema, std::string label, CompiledExprList exprs)
      : PhysicalNode(PhysicalKind::kProject, std::move(schema), std::move(label))
      , exprs(std::move(exprs)) {}

  CompiledExprList exprs;
  // Row ranges can be projected independently.
  bool splittable = true;
};

/**
 * Group-by: key and aggregate argument expressions are evaluated over the input,
 * output expressions are evaluated over per-group aggregate results.
 */
class PhysicalAggregate : public PhysicalNode {
 public:
  PhysicalAggregate(ir::Schema schema, std::string label)
      : PhysicalNode(PhysicalKind::kAggregate, std::move(schema), std::move(label)) {}

  std::string details() const override;

  CompiledExprList keys;
  std::vector<const ir::Type*> key_types;
  // Distinct aggregate expressions found in outputs.
  std::vector<ir::ExprId> agg_ids;
  // Arguments of aggregates, nullopt for LEN.
  std::vector<std::optional<CompiledExpr>> agg_args;
  std::vector<AggSpec> agg_specs;
  // Compiled against the input schema. Aggregates are always substituted by
  // per-group results.
  CompiledExprList outputs;
  // All aggregates can be computed per morsel and merged.
  bool mergeable = true;
};

class PhysicalHashJoin : public PhysicalNode {
 public:
  PhysicalHashJoin(ir::Schema schema, std::string label, JoinOutput output)
      : PhysicalNode(PhysicalKind::kHashJoin, std::move(schema), std::move(label))
      , output(std::move(output)) {}

  std::string details() const override;

  ir::JoinType joinType() const { return output.joinType(); }

  JoinOutput output;
  CompiledExprList left_keys;
  CompiledExprList right_keys;
  // Inner joins may build the hash table on the left input.
  bool build_left = false;
};

class PhysicalCrossJoin : public PhysicalNode {
 public:
  PhysicalCrossJoin(ir::Schema schema, std::string label, JoinOutput output)
      : PhysicalNode(PhysicalKind::kCrossJoin, std::move(schema), std::move(label))
      , output(std::move(output)) {}

  JoinOutput output;
};

class PhysicalAsOfJoin : public PhysicalNode {
 public:
  PhysicalAsOfJoin(ir::Schema schema, std::string label, JoinOutput output)
      : PhysicalNode(PhysicalKind::kAsOfJoin, std::move(schema), std::move(label))
      , output(std::move(output)) {}

  std::string details() const override;

  JoinOutput output;
  CompiledExpr left_key;
  CompiledExpr right_key;
  std::vector<size_t> left_by;
  std::vector<size_t> right_by;
  ir::AsOfOptions options;
};

class PhysicalSort : public PhysicalNode {
 public:
  PhysicalSort(ir::Schema schema, std::string label)
      : PhysicalNode(PhysicalKind::kSort, std::move(schema), std::move(label)) {}

  std::string details() const override;

  CompiledExprList keys;
  std::vector<SortOrder> order;
  std::optional<size_t> limit;
  size_t offset = 0;
};

class PhysicalSlice : public PhysicalNode {
 public:
  PhysicalSlice(ir::Schema schema, std::string label, int64_t offset, size_t length)
      : PhysicalNode(PhysicalKind::kSlice, std::move(schema), std::move(label))
      , offset(offset)
      , length(length) {}

  std::string details() const override;

  int64_t offset;
  size_t length;
};

class PhysicalUnion : public PhysicalNode {
 public:
  PhysicalUnion(ir::Schema schema, std::string label)
      : PhysicalNode(PhysicalKind::kUnion, std::move(schema), std::move(label)) {}
};

class PhysicalDistinct : public PhysicalNode {
 public:
  PhysicalDistinct(ir::Schema schema, std::string label)
      : PhysicalNode(PhysicalKind::kDistinct, std::move(schema), std::move(label)) {}

  std::string details() const override;

  std::vector<size_t> key_columns;
  ir::UniqueKeep keep = ir::UniqueKeep::kAny;
};

class PhysicalExplode : public PhysicalNode {
 public:
  PhysicalExplode(ir::Schema schema, std::string label, std::vector<size_t> columns)
      : PhysicalNode(PhysicalKind::kExplode, std::move(schema), std::move(label))
      , columns(std::move(columns)) {}

  std::vector<size_t> columns;
};

class PhysicalMelt : public PhysicalNode {
 public:
  PhysicalMelt(ir::Schema schema, std::string label)
      : PhysicalNode(PhysicalKind::kMelt, std::move(schema), std::move(label)) {}

  std::vector<size_t> id_columns;
  std::vector<size_t> value_columns;
};

class PhysicalUpsample : public PhysicalNode {
 public:
  PhysicalUpsample(ir::Schema schema, std::string label)
      : PhysicalNode(PhysicalKind::kUpsample, std::move(schema), std::move(label)) {}

  std::string details() const override;

  std::vector<size_t> by_columns;
  size_t time_column = 0;
  ir::Duration every;
  ir::Duration offset;
};

// Boundary between streaming and in-memory execution.
class PhysicalBoundary : public PhysicalNode {
 public:
  PhysicalBoundary(PhysicalKind kind, PhysicalNodePtr input)
      : PhysicalNode(kind,
                     input->schema(),
                     ::lqe::toString(kind) + "(" + input->label() + ")") {
    setStrategy(kind == PhysicalKind::kMaterialize ? ExecutionStrategy::kInMemory
                                                   : ExecutionStrategy::kStreaming);
    addInput(std::move(input));
  }
};

}  // namespace lqe
