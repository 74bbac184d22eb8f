/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "IR/Exception.h"
#include "IR/Node.h"
#include "QueryEngine/QueryExecutor.h"
#include "SchemaMgr/SchemaMgr.h"
#include "Shared/Config.h"

#include <variant>

namespace lqe {

class QueryBuilder;
class BuilderNode;

class BuilderExpr {
 public:
  BuilderExpr();
  BuilderExpr(const QueryBuilder* builder, ir::ExprId expr);

  BuilderExpr rename(const std::string& name) const;
  std::string name() const;

  ir::ExprId id() const { return expr_; }
  const ir::Type* type() const;
  const ir::Expr* expr() const;

  BuilderExpr count() const;
  BuilderExpr sum() const;
  BuilderExpr mean() const;
  BuilderExpr min() const;
  BuilderExpr max() const;
  BuilderExpr first() const;
  BuilderExpr last() const;
  BuilderExpr nUnique() const;
  BuilderExpr stdDev() const;
  BuilderExpr var() const;
  BuilderExpr median() const;

  BuilderExpr agg(ir::AggType agg_kind) const;
  BuilderExpr agg(const std::string& agg_str) const;

  // Window expression evaluated per partition of rows with equal keys.
  BuilderExpr over(const std::vector<BuilderExpr>& partition_by) const;
  BuilderExpr over(const std::vector<BuilderExpr>& partition_by,
                   const std::vector<BuilderExpr>& order_by) const;

  BuilderExpr cast(const ir::Type* new_type, bool strict = true) const;
  BuilderExpr cast(const std::string& new_type, bool strict = true) const;

  BuilderExpr sortKey(bool descending = false, bool nulls_last = false) const;

  BuilderExpr logicalNot() const;
  BuilderExpr uminus() const;
  BuilderExpr isNull() const;
  BuilderExpr isNotNull() const;

  BuilderExpr add(const BuilderExpr& rhs) const;
  BuilderExpr add(int val) const;
  BuilderExpr add(int64_t val) const;
  BuilderExpr add(double val) const;

  BuilderExpr sub(const BuilderExpr& rhs) const;
  BuilderExpr sub(int val) const;
  BuilderExpr sub(int64_t val) const;
  BuilderExpr sub(double val) const;

  BuilderExpr mul(const BuilderExpr& rhs) const;
  BuilderExpr mul(int val) const;
  BuilderExpr mul(int64_t val) const;
  BuilderExpr mul(double val) const;

  BuilderExpr div(const BuilderExpr& rhs) const;
  BuilderExpr div(int val) const;
  BuilderExpr div(int64_t val) const;
  BuilderExpr div(double val) const;

  BuilderExpr mod(const BuilderExpr& rhs) const;
  BuilderExpr mod(int val) const;
  BuilderExpr mod(int64_t val) const;

  BuilderExpr floorDiv(const BuilderExpr& rhs) const;
  BuilderExpr floorDiv(int val) const;
  BuilderExpr floorDiv(int64_t val) const;

  BuilderExpr logicalAnd(const BuilderExpr& rhs) const;
  BuilderExpr logicalOr(const BuilderExpr& rhs) const;

  BuilderExpr eq(const BuilderExpr& rhs) const;
  BuilderExpr eq(int val) const;
  BuilderExpr eq(int64_t val) const;
  BuilderExpr eq(double val) const;
  BuilderExpr eq(const std::string& val) const;

  BuilderExpr ne(const BuilderExpr& rhs) const;
  BuilderExpr ne(int val) const;
  BuilderExpr ne(int64_t val) const;
  BuilderExpr ne(double val) const;
  BuilderExpr ne(const std::string& val) const;

  BuilderExpr lt(const BuilderExpr& rhs) const;
  BuilderExpr lt(int val) const;
  BuilderExpr lt(int64_t val) const;
  BuilderExpr lt(double val) const;
  BuilderExpr lt(const std::string& val) const;

  BuilderExpr le(const BuilderExpr& rhs) const;
  BuilderExpr le(int val) const;
  BuilderExpr le(int64_t val) const;
  BuilderExpr le(double val) const;
  BuilderExpr le(const std::string& val) const;

  BuilderExpr gt(const BuilderExpr& rhs) const;
  BuilderExpr gt(int val) const;
  BuilderExpr gt(int64_t val) const;
  BuilderExpr gt(double val) const;
  BuilderExpr gt(const std::string& val) const;

  BuilderExpr ge(const BuilderExpr& rhs) const;
  BuilderExpr ge(int val) const;
  BuilderExpr ge(int64_t val) const;
  BuilderExpr ge(double val) const;
  BuilderExpr ge(const std::string& val) const;

  // Registered function with this expression as the first argument.
  BuilderExpr call(const std::string& func_name,
                   const std::vector<BuilderExpr>& args = {}) const;

  BuilderExpr fillNull(const BuilderExpr& val) const;
  BuilderExpr isIn(const std::vector<BuilderExpr>& vals) const;

  BuilderExpr operator!() const;
  BuilderExpr operator-() const;

  const QueryBuilder& builder() const;

 protected:
  friend class QueryBuilder;
  friend class BuilderNode;

  BuilderExpr binOp(ir::OpType op, const BuilderExpr& rhs) const;
  BuilderExpr unaryOp(ir::OpType op) const;

  const QueryBuilder* builder_;
  ir::ExprId expr_;
};

class BuilderSortField {
 public:
  BuilderSortField(const char* col_name, bool descending = false, bool nulls_last = false);
  BuilderSortField(const char* col_name,
                   const char* dir,
                   const char* null_pos = "first");
  BuilderSortField(const std::string& col_name,
                   bool descending = false,
                   bool nulls_last = false);
  BuilderSortField(const std::string& col_name,
                   const std::string& dir,
                   const std::string& null_pos = "first");
  BuilderSortField(BuilderExpr expr, bool descending = false, bool nulls_last = false);
  BuilderSortField(BuilderExpr expr,
                   const std::string& dir,
                   const std::string& null_pos = "first");

  bool hasColName() const { return std::holds_alternative<std::string>(field_); }
  bool hasExpr() const { return std::holds_alternative<BuilderExpr>(field_); }

  const std::string& colName() const { return std::get<std::string>(field_); }
  const BuilderExpr& expr() const { return std::get<BuilderExpr>(field_); }
  bool descending() const { return descending_; }
  bool nullsLast() const { return nulls_last_; }

  static bool parseSortDirection(const std::string& val);
  static bool parseNullPosition(const std::string& val);

 protected:
  std::variant<std::string, BuilderExpr> field_;
  bool descending_;
  bool nulls_last_;
};

class BuilderNode {
 public:
  BuilderNode();

  BuilderExpr ref(int col_idx) const;
  BuilderExpr ref(const std::string& col_name) const;
  std::vector<BuilderExpr> ref(const std::vector<std::string>& col_names) const;

  BuilderExpr operator[](int col_idx) const { return ref(col_idx); }
  BuilderExpr operator[](const std::string& col_name) const { return ref(col_name); }

  // Select.
  BuilderNode proj(const std::vector<std::string>& col_names) const;
  BuilderNode proj(std::initializer_list<std::string> col_names) const;
  BuilderNode proj(const BuilderExpr& expr) const;
  BuilderNode proj(const std::vector<BuilderExpr>& exprs) const;
  // Keeps input columns, replaces the ones with the same names and appends the
  // rest.
  BuilderNode withColumns(const std::vector<BuilderExpr>& exprs) const;

  BuilderNode filter(const BuilderExpr& condition) const;

  // Group-by. Aggregate strings have the form <agg_name>(<col_name>), "len" and
  // "count" count rows.
  BuilderNode agg(const std::vector<std::string>& group_keys,
                  const std::vector<std::string>& aggs) const;
  BuilderNode agg(const std::vector<std::string>& group_keys,
                  const std::vector<BuilderExpr>& aggs) const;
  BuilderNode agg(const std::vector<BuilderExpr>& group_keys,
                  const std::vector<BuilderExpr>& aggs) const;
  BuilderNode agg(std::initializer_list<std::string> group_keys,
                  std::initializer_list<std::string> aggs) const;
  BuilderNode agg(std::initializer_list<std::string> group_keys,
                  const std::vector<BuilderExpr>& aggs) const;

  BuilderExpr parseAggString(const std::string& agg_str) const;
  BuilderExpr count() const;

  BuilderNode sort(const BuilderSortField& field) const;
  BuilderNode sort(const std::vector<BuilderSortField>& fields) const;

  // A negative offset counts from the end.
  BuilderNode slice(int64_t offset, size_t length) const;
  BuilderNode head(size_t n) const;
  BuilderNode tail(size_t n) const;

  BuilderNode join(const BuilderNode& rhs,
                   const std::vector<std::string>& col_names,
                   ir::JoinType join_type = ir::JoinType::kInner) const;
  BuilderNode join(const BuilderNode& rhs,
                   const std::vector<std::string>& lhs_col_names,
                   const std::vector<std::string>& rhs_col_names,
                   ir::JoinType join_type = ir::JoinType::kInner) const;
  BuilderNode join(const BuilderNode& rhs,
                   const std::vector<std::string>& lhs_col_names,
                   const std::vector<std::string>& rhs_col_names,
                   const std::string& join_type) const;
  BuilderNode join(const BuilderNode& rhs,
                   const std::vector<BuilderExpr>& lhs_keys,
                   const std::vector<BuilderExpr>& rhs_keys,
                   ir::JoinOptions options) const;
  BuilderNode crossJoin(const BuilderNode& rhs) const;
  BuilderNode joinAsOf(const BuilderNode& rhs,
                       const std::string& lhs_col_name,
                       const std::string& rhs_col_name,
                       ir::AsOfOptions options = {}) const;

  BuilderNode distinct(const std::vector<std::string>& subset = {},
                       ir::UniqueKeep keep = ir::UniqueKeep::kFirst,
                       bool maintain_order = true) const;
  BuilderNode explode(const std::vector<std::string>& col_names) const;
  // Empty value_vars selects all columns not in id_vars.
  BuilderNode melt(const std::vector<std::string>& id_vars,
                   const std::vector<std::string>& value_vars = {},
                   const std::string& variable_name = "variable",
                   const std::string& value_name = "value") const;
  // Fills time gaps of a sorted date or timestamp column at a regular interval
  // within each group of 'by'. Durations are strings like "1d", "3d12h", "15m" or
  // "1mo".
  BuilderNode upsample(const std::vector<std::string>& by,
                       const std::string& time_column,
                       const std::string& every,
                       const std::string& offset = "0d") const;

  // Independent copy of the plan rooted at this node.
  ir::QueryDagPtr finalize() const;

  ExecutionResult collect() const;
  ExecutionResult collect(const ExecutionOptions& opts) const;
  ResultStreamPtr collectStreaming() const;
  ResultStreamPtr collectStreaming(const ExecutionOptions& opts) const;
  std::string explain() const;

  ir::NodeId nodeId() const { return node_; }
  const ir::Node* node() const;
  const ir::Schema& schema() const;
  size_t size() const { return schema().size(); }

 protected:
  friend class QueryBuilder;

  BuilderNode(const QueryBuilder* builder, ir::NodeId node);

  std::vector<BuilderExpr> parseAggString(const std::vector<std::string>& aggs) const;
  ir::ExprIdList exprIds(const std::vector<BuilderExpr>& exprs) const;

  const QueryBuilder* builder_;
  ir::NodeId node_;
};

/**
 * Entry point of the fluent API. Nodes and expressions of all builder objects
 * created by one QueryBuilder live in a shared DAG; finalize() copies the part
 * reachable from a node into a separate QueryDag for execution.
 */
class QueryBuilder {
 public:
  QueryBuilder(SchemaMgrPtr schema_mgr, ConfigPtr config);

  BuilderNode scan(const std::string& table_name) const;
  BuilderNode scan(const std::string& table_name, DataProviderPtr provider) const;

  // Vertical concatenation of frames with identical schemas.
  BuilderNode concat(const std::vector<BuilderNode>& nodes) const;

  BuilderExpr len() const;

  BuilderExpr cst(int val) const;
  BuilderExpr cst(int64_t val) const;
  BuilderExpr cst(int64_t val, const ir::Type* type) const;
  BuilderExpr cst(double val) const;
  BuilderExpr cst(double val, const ir::Type* type) const;
  BuilderExpr cst(const std::string& val) const;
  BuilderExpr cst(const char* val) const;
  BuilderExpr trueCst() const;
  BuilderExpr falseCst() const;
  BuilderExpr nullCst() const;
  BuilderExpr nullCst(const ir::Type* type) const;
  BuilderExpr date(const std::string& val) const;
  BuilderExpr timestamp(const std::string& val) const;

  BuilderExpr func(const std::string& name, const std::vector<BuilderExpr>& args) const;
  BuilderExpr ifThenElse(const BuilderExpr& cond,
                         const BuilderExpr& if_val,
                         const BuilderExpr& else_val) const;
  BuilderExpr coalesce(const std::vector<BuilderExpr>& args) const;
  BuilderExpr concatStr(const std::vector<BuilderExpr>& args) const;

  // Type by name: bool, int8, int16, int32, int64, fp32, fp64, text, date,
  // timestamp.
  const ir::Type* parseType(const std::string& name) const;

  ir::Context& ctx() const { return ctx_; }
  const ConfigPtr& config() const { return config_; }
  const QueryExecutor& executor() const { return executor_; }

 protected:
  friend class BuilderExpr;
  friend class BuilderNode;

  ir::QueryDag& dag() const { return *dag_; }
  ir::ExprArena& arena() const { return dag_->exprs(); }

  ir::Context& ctx_;
  SchemaMgrPtr schema_mgr_;
  ConfigPtr config_;
  std::shared_ptr<ir::QueryDag> dag_;
  QueryExecutor executor_;
};

BuilderExpr operator+(const BuilderExpr& lhs, const BuilderExpr& rhs);
BuilderExpr operator+(const BuilderExpr& lhs, int rhs);
BuilderExpr operator+(const BuilderExpr& lhs, int64_t rhs);
BuilderExpr operator+(const BuilderExpr& lhs, double rhs);
BuilderExpr operator+(int lhs, const BuilderExpr& rhs);
BuilderExpr operator+(int64_t lhs, const BuilderExpr& rhs);
BuilderExpr operator+(double lhs, const BuilderExpr& rhs);

BuilderExpr operator-(const BuilderExpr& lhs, const BuilderExpr& rhs);
BuilderExpr operator-(const BuilderExpr& lhs, int rhs);
BuilderExpr operator-(const BuilderExpr& lhs, int64_t rhs);
BuilderExpr operator-(const BuilderExpr& lhs, double rhs);
BuilderExpr operator-(int lhs, const BuilderExpr& rhs);
BuilderExpr operator-(int64_t lhs, const BuilderExpr& rhs);
BuilderExpr operator-(double lhs, const BuilderExpr& rhs);

BuilderExpr operator*(const BuilderExpr& lhs, const BuilderExpr& rhs);
BuilderExpr operator*(const BuilderExpr& lhs, int rhs);
BuilderExpr operator*(const BuilderExpr& lhs, int64_t rhs);
BuilderExpr operator*(const BuilderExpr& lhs, double rhs);
BuilderExpr operator*(int lhs, const BuilderExpr& rhs);
BuilderExpr operator*(int64_t lhs, const BuilderExpr& rhs);
BuilderExpr operator*(double lhs, const BuilderExpr& rhs);

BuilderExpr operator/(const BuilderExpr& lhs, const BuilderExpr& rhs);
BuilderExpr operator/(const BuilderExpr& lhs, int rhs);
BuilderExpr operator/(const BuilderExpr& lhs, int64_t rhs);
BuilderExpr operator/(const BuilderExpr& lhs, double rhs);
BuilderExpr operator/(int lhs, const BuilderExpr& rhs);
BuilderExpr operator/(int64_t lhs, const BuilderExpr& rhs);
BuilderExpr operator/(double lhs, const BuilderExpr& rhs);

BuilderExpr operator%(const BuilderExpr& lhs, const BuilderExpr& rhs);
BuilderExpr operator%(const BuilderExpr& lhs, int rhs);
BuilderExpr operator%(const BuilderExpr& lhs, int64_t rhs);
BuilderExpr operator%(int lhs, const BuilderExpr& rhs);
BuilderExpr operator%(int64_t lhs, const BuilderExpr& rhs);

BuilderExpr operator&&(const BuilderExpr& lhs, const BuilderExpr& rhs);
BuilderExpr operator||(const BuilderExpr& lhs, const BuilderExpr& rhs);

BuilderExpr operator==(const BuilderExpr& lhs, const BuilderExpr& rhs);
BuilderExpr operator==(const BuilderExpr& lhs, int rhs);
BuilderExpr operator==(const BuilderExpr& lhs, int64_t rhs);
BuilderExpr operator==(const BuilderExpr& lhs, double rhs);
BuilderExpr operator==(const BuilderExpr& lhs, const std::string& rhs);

BuilderExpr operator!=(const BuilderExpr& lhs, const BuilderExpr& rhs);
BuilderExpr operator!=(const BuilderExpr& lhs, int rhs);
BuilderExpr operator!=(const BuilderExpr& lhs, int64_t rhs);
BuilderExpr operator!=(const BuilderExpr& lhs, double rhs);
BuilderExpr operator!=(const BuilderExpr& lhs, const std::string& rhs);

BuilderExpr operator<(const BuilderExpr& lhs, const BuilderExpr& rhs);
BuilderExpr operator<(const BuilderExpr& lhs, int rhs);
BuilderExpr operator<(const BuilderExpr& lhs, int64_t rhs);
BuilderExpr operator<(const BuilderExpr& lhs, double rhs);
BuilderExpr operator<(const BuilderExpr& lhs, const std::string& rhs);

BuilderExpr operator<=(const BuilderExpr& lhs, const BuilderExpr& rhs);
BuilderExpr operator<=(const BuilderExpr& lhs, int rhs);
BuilderExpr operator<=(const BuilderExpr& lhs, int64_t rhs);
BuilderExpr operator<=(const BuilderExpr& lhs, double rhs);
BuilderExpr operator<=(const BuilderExpr& lhs, const std::string& rhs);

BuilderExpr operator>(const BuilderExpr& lhs, const BuilderExpr& rhs);
BuilderExpr operator>(const BuilderExpr& lhs, int rhs);
BuilderExpr operator>(const BuilderExpr& lhs, int64_t rhs);
BuilderExpr operator>(const BuilderExpr& lhs, double rhs);
BuilderExpr operator>(const BuilderExpr& lhs, const std::string& rhs);

BuilderExpr operator>=(const BuilderExpr& lhs, const BuilderExpr& rhs);
BuilderExpr operator>=(const BuilderExpr& lhs, int rhs);
BuilderExpr operator>=(const BuilderExpr& lhs, int64_t rhs);
BuilderExpr operator>=(const BuilderExpr& lhs, double rhs);
BuilderExpr operator>=(const BuilderExpr& lhs, const std::string& rhs);

}  // namespace lqe
