/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "DateTime.h"
#include "Expr.h"
#include "Schema.h"

#include "Shared/Config.h"

#include <functional>
#include <optional>

namespace lqe {

class DataProvider;

}  // namespace lqe

namespace lqe::ir {

using NodeId = uint32_t;
using NodeIdList = std::vector<NodeId>;

constexpr NodeId kInvalidNodeId = std::numeric_limits<NodeId>::max();

class QueryDag;

enum class NodeKind {
  kScan,
  kFilter,
  kProject,
  kAggregate,
  kJoin,
  kSort,
  kSlice,
  kUnion,
  kDistinct,
  kExplode,
  kMelt,
  kUpsample,
};

std::string toString(NodeKind kind);

using ExprMapper = std::function<ExprId(ExprId)>;

/**
 * Base class of logical plan nodes. Nodes are owned by a QueryDag and refer to
 * their inputs by NodeId. The output schema is computed at construction, so a
 * node is always consistent with its inputs. Nodes are never modified after
 * construction; rewrites create new nodes.
 */
class Node {
 public:
  virtual ~Node() = default;

  NodeKind kind() const { return kind_; }
  NodeId id() const { return id_; }

  const NodeIdList& inputs() const { return inputs_; }
  NodeId input(size_t idx) const { return inputs_[idx]; }
  size_t inputCount() const { return inputs_.size(); }

  const Schema& schema() const { return schema_; }

  // All expressions evaluated by the node.
  virtual ExprIdList exprs() const = 0;

  // Builds the same node over new inputs. Expressions are passed through the
  // mapper, which allows copying nodes between DAGs.
  virtual std::unique_ptr<Node> rebuild(const QueryDag& dag,
                                        NodeIdList inputs,
                                        const ExprMapper& mapper) const = 0;

  std::unique_ptr<Node> withInputs(const QueryDag& dag, NodeIdList inputs) const;

  // Single line description without inputs.
  virtual std::string toString(const QueryDag& dag) const = 0;

  std::string getIdString() const { return "#" + std::to_string(id_); }
  std::string label() const { return ::lqe::ir::toString(kind_) + getIdString(); }

  template <typename T>
  bool is() const {
    return dynamic_cast<const T*>(this) != nullptr;
  }

  template <typename T>
  const T* as() const {
    return dynamic_cast<const T*>(this);
  }

 protected:
  Node(NodeKind kind, NodeIdList inputs, Schema schema)
      : schema_(std::move(schema)), kind_(kind), inputs_(std::move(inputs)) {}

  // Set by nodes whose schema depends on validated parameters.
  Schema schema_;

 private:
  friend class QueryDag;

  NodeKind kind_;
  NodeId id_ = kInvalidNodeId;
  NodeIdList inputs_;
};

// Optional work a scan may do on behalf of its consumers. The executor re-applies
// everything the data provider reports as not done.
struct ScanHints {
  // Columns to read, in the table order.
  std::optional<std::vector<std::string>> projection;
  ExprId predicate = kInvalidExprId;
  // Offset and length of the rows required from the beginning of the table.
  std::optional<std::pair<size_t, size_t>> slice;
};

class Scan : public Node {
 public:
  Scan(const QueryDag& dag,
       std::string table_name,
       std::shared_ptr<DataProvider> provider,
       ScanHints hints = {});

  const std::string& tableName() const { return table_name_; }
  const std::shared_ptr<DataProvider>& provider() const { return provider_; }
  const ScanHints& hints() const { return hints_; }
  // Schema of the table before projection.
  const Schema& tableSchema() const;

  ExprIdList exprs() const override;
  std::unique_ptr<Node> rebuild(const QueryDag& dag,
                                NodeIdList inputs,
                                const ExprMapper& mapper) const override;
  std::unique_ptr<Scan> withHints(const QueryDag& dag, ScanHints hints) const;
  std::string toString(const QueryDag& dag) const override;

 private:
  std::string table_name_;
  std::shared_ptr<DataProvider> provider_;
  ScanHints hints_;
};

class Filter : public Node {
 public:
  Filter(const QueryDag& dag, ExprId predicate, NodeId input);

  ExprId predicate() const { return predicate_; }

  ExprIdList exprs() const override { return {predicate_}; }
  std::unique_ptr<Node> rebuild(const QueryDag& dag,
                                NodeIdList inputs,
                                const ExprMapper& mapper) const override;
  std::string toString(const QueryDag& dag) const override;

 private:
  ExprId predicate_;
};

// Select: computes one output column per expression.
class Project : public Node {
 public:
  Project(const QueryDag& dag, ExprIdList exprs, NodeId input);

  const ExprIdList& projections() const { return exprs_; }
  size_t size() const { return exprs_.size(); }
  // True if every expression is a column reference to an input column with the
  // same name.
  bool isSimple(const QueryDag& dag) const;

  ExprIdList exprs() const override { return exprs_; }
  std::unique_ptr<Node> rebuild(const QueryDag& dag,
                                NodeIdList inputs,
                                const ExprMapper& mapper) const override;
  std::string toString(const QueryDag& dag) const override;

 private:
  ExprIdList exprs_;
};

// Group-by. Output columns are keys followed by aggregates. Aggregate
// expressions may combine several aggregates with element-wise operations.
// An aggregation without keys produces exactly one row.
class Aggregate : public Node {
 public:
  Aggregate(const QueryDag& dag, ExprIdList keys, ExprIdList aggs, NodeId input);

  const ExprIdList& keys() const { return keys_; }
  const ExprIdList& aggs() const { return aggs_; }

  ExprIdList exprs() const override;
  std::unique_ptr<Node> rebuild(const QueryDag& dag,
                                NodeIdList inputs,
                                const ExprMapper& mapper) const override;
  std::string toString(const QueryDag& dag) const override;

 private:
  ExprIdList keys_;
  ExprIdList aggs_;
};

struct AsOfOptions {
  AsOfStrategy strategy = AsOfStrategy::kBackward;
  // Maximum distance between the matched keys.
  std::optional<double> tolerance;
  // Equality keys matched before the as-of search.
  std::vector<std::string> left_by;
  std::vector<std::string> right_by;
};

enum class BuildSide {
  kAuto,
  kLeft,
  kRight,
};

std::string toString(BuildSide side);

struct JoinOptions {
  JoinType type = JoinType::kInner;
  std::string suffix = "_right";
  // Drop right key columns that are plain column references. Applies to inner,
  // left and as-of joins.
  bool coalesce = true;
  AsOfOptions asof;
  BuildSide build_side = BuildSide::kAuto;
};

class Join : public Node {
 public:
  // Where an output column comes from.
  struct ColumnSource {
    bool from_left;
    size_t input_idx;
  };

  Join(const QueryDag& dag,
       NodeId lhs,
       NodeId rhs,
       ExprIdList left_keys,
       ExprIdList right_keys,
       JoinOptions options);

  JoinType joinType() const { return options_.type; }
  const JoinOptions& options() const { return options_; }
  const ExprIdList& leftKeys() const { return left_keys_; }
  const ExprIdList& rightKeys() const { return right_keys_; }
  const std::vector<ColumnSource>& outputSources() const { return sources_; }
  // Right input column indexes dropped from the output because of coalescing.
  const std::vector<size_t>& droppedRightColumns() const { return dropped_right_; }

  ExprIdList exprs() const override;
  std::unique_ptr<Node> rebuild(const QueryDag& dag,
                                NodeIdList inputs,
                                const ExprMapper& mapper) const override;
  std::unique_ptr<Join> withOptions(const QueryDag& dag, JoinOptions options) const;
  std::string toString(const QueryDag& dag) const override;

 private:
  ExprIdList left_keys_;
  ExprIdList right_keys_;
  JoinOptions options_;
  std::vector<ColumnSource> sources_;
  std::vector<size_t> dropped_right_;
};

// Stable multi-key sort with an optional fused slice (top-k).
class Sort : public Node {
 public:
  Sort(const QueryDag& dag,
       ExprIdList keys,
       NodeId input,
       std::optional<size_t> limit = std::nullopt,
       size_t offset = 0);

  // SortKey expressions.
  const ExprIdList& keys() const { return keys_; }
  std::optional<size_t> limit() const { return limit_; }
  size_t offset() const { return offset_; }

  ExprIdList exprs() const override { return keys_; }
  std::unique_ptr<Node> rebuild(const QueryDag& dag,
                                NodeIdList inputs,
                                const ExprMapper& mapper) const override;
  std::unique_ptr<Sort> withLimit(const QueryDag& dag,
                                  std::optional<size_t> limit,
                                  size_t offset) const;
  std::string toString(const QueryDag& dag) const override;

 private:
  ExprIdList keys_;
  std::optional<size_t> limit_;
  size_t offset_;
};

class Slice : public Node {
 public:
  // A negative offset counts from the end.
  Slice(const QueryDag& dag, int64_t offset, size_t length, NodeId input);

  int64_t offset() const { return offset_; }
  size_t length() const { return length_; }

  ExprIdList exprs() const override { return {}; }
  std::unique_ptr<Node> rebuild(const QueryDag& dag,
                                NodeIdList inputs,
                                const ExprMapper& mapper) const override;
  std::string toString(const QueryDag& dag) const override;

 private:
  int64_t offset_;
  size_t length_;
};

// Concatenation of inputs with equal schemas.
class Union : public Node {
 public:
  Union(const QueryDag& dag, NodeIdList inputs);

  ExprIdList exprs() const override { return {}; }
  std::unique_ptr<Node> rebuild(const QueryDag& dag,
                                NodeIdList inputs,
                                const ExprMapper& mapper) const override;
  std::string toString(const QueryDag& dag) const override;
};

class Distinct : public Node {
 public:
  // An empty subset means all columns.
  Distinct(const QueryDag& dag,
           std::vector<std::string> subset,
           UniqueKeep keep,
           bool maintain_order,
           NodeId input);

  const std::vector<std::string>& subset() const { return subset_; }
  // Subset with the default resolved.
  std::vector<std::string> keyColumns() const;
  UniqueKeep keep() const { return keep_; }
  bool maintainOrder() const { return maintain_order_; }

  ExprIdList exprs() const override { return {}; }
  std::unique_ptr<Node> rebuild(const QueryDag& dag,
                                NodeIdList inputs,
                                const ExprMapper& mapper) const override;
  std::string toString(const QueryDag& dag) const override;

 private:
  std::vector<std::string> subset_;
  UniqueKeep keep_;
  bool maintain_order_;
};

// Produces one row per list element of the given list columns.
class Explode : public Node {
 public:
  Explode(const QueryDag& dag, std::vector<std::string> columns, NodeId input);

  const std::vector<std::string>& columns() const { return columns_; }

  ExprIdList exprs() const override { return {}; }
  std::unique_ptr<Node> rebuild(const QueryDag& dag,
                                NodeIdList inputs,
                                const ExprMapper& mapper) const override;
  std::string toString(const QueryDag& dag) const override;

 private:
  std::vector<std::string> columns_;
};

// Unpivots value columns into variable/value pairs.
class Melt : public Node {
 public:
  Melt(const QueryDag& dag,
       std::vector<std::string> id_vars,
       std::vector<std::string> value_vars,
       std::string variable_name,
       std::string value_name,
       NodeId input);

  const std::vector<std::string>& idVars() const { return id_vars_; }
  const std::vector<std::string>& valueVars() const { return value_vars_; }
  const std::string& variableName() const { return variable_name_; }
  const std::string& valueName() const { return value_name_; }

  ExprIdList exprs() const override { return {}; }
  std::unique_ptr<Node> rebuild(const QueryDag& dag,
                                NodeIdList inputs,
                                const ExprMapper& mapper) const override;
  std::string toString(const QueryDag& dag) const override;

 private:
  std::vector<std::string> id_vars_;
  std::vector<std::string> value_vars_;
  std::string variable_name_;
  std::string value_name_;
};

/**
 * Fills time gaps: for each group of the 'by' columns produces a row per step of
 * 'every' from the first time value shifted by 'offset' to the last one. Input
 * rows with a matching time keep their values, generated rows get nulls except
 * for the group columns. The time column goes first in the output.
 */
class Upsample : public Node {
 public:
  Upsample(const QueryDag& dag,
           std::vector<std::string> by,
           std::string time_column,
           Duration every,
           Duration offset,
           NodeId input);

  const std::vector<std::string>& by() const { return by_; }
  const std::string& timeColumn() const { return time_column_; }
  const Duration& every() const { return every_; }
  const Duration& offset() const { return offset_; }

  ExprIdList exprs() const override { return {}; }
  std::unique_ptr<Node> rebuild(const QueryDag& dag,
                                NodeIdList inputs,
                                const ExprMapper& mapper) const override;
  std::string toString(const QueryDag& dag) const override;

 private:
  std::vector<std::string> by_;
  std::string time_column_;
  Duration every_;
  Duration offset_;
};

/**
 * Owner of a logical plan: expression arena, node arena and the root node.
 * Nodes are appended and never removed, so every NodeId handed out stays valid
 * and earlier versions of an optimized plan remain inspectable.
 */
class QueryDag {
 public:
  explicit QueryDag(ConfigPtr config = nullptr);
  QueryDag(const QueryDag&) = delete;
  QueryDag& operator=(const QueryDag&) = delete;

  ExprArena& exprs() { return exprs_; }
  const ExprArena& exprs() const { return exprs_; }

  template <typename T, typename... Args>
  NodeId makeNode(Args&&... args) {
    return addNode(std::make_unique<T>(*this, std::forward<Args>(args)...));
  }

  NodeId addNode(std::unique_ptr<Node> node);

  const Node* node(NodeId id) const;
  size_t size() const { return nodes_.size(); }

  NodeId root() const { return root_; }
  const Node* rootNode() const { return node(root_); }
  void setRoot(NodeId root);

  const ConfigPtr& config() const { return config_; }

  // Copies the plan rooted at a node of another DAG into this one.
  NodeId import(const QueryDag& other, NodeId id);

  // Nodes reachable from the root with every node placed after its inputs.
  NodeIdList topologicalOrder() const;

  std::string toString() const;
  std::string toString(NodeId id) const;

 private:
  void print(NodeId id, size_t indent, std::string& res) const;

  ConfigPtr config_;
  ExprArena exprs_;
  std::vector<std::unique_ptr<Node>> nodes_;
  NodeId root_ = kInvalidNodeId;
};

using QueryDagPtr = std::unique_ptr<QueryDag>;

}  // namespace lqe::ir
