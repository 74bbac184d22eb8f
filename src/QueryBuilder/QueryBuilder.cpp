/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "QueryBuilder.h"

#include "IR/DateTime.h"
#include "IR/Exception.h"
#include "IR/FunctionRegistry.h"
#include "IR/TypeUtils.h"

#include <boost/algorithm/string.hpp>

#include <unordered_map>
#include <unordered_set>

namespace lqe {

using namespace ir;

namespace {

void checkSameBuilder(const QueryBuilder* lhs, const QueryBuilder* rhs) {
  if (!lhs || !rhs) {
    throw InvalidOperationError("Uninitialized builder object is used in a query.");
  }
  if (lhs != rhs) {
    throw InvalidOperationError(
        "Cannot combine objects created by different query builders.");
  }
}

JoinType parseJoinType(const std::string& join_type) {
  static const std::unordered_map<std::string, JoinType> join_types = {
      {"inner", JoinType::kInner},
      {"left", JoinType::kLeft},
      {"outer", JoinType::kOuter},
      {"full", JoinType::kOuter},
      {"semi", JoinType::kSemi},
      {"anti", JoinType::kAnti},
      {"cross", JoinType::kCross},
      {"asof", JoinType::kAsOf}};
  auto it = join_types.find(boost::algorithm::to_lower_copy(join_type));
  if (it == join_types.end()) {
    throw InvalidOperationError() << "Unknown join type: " << join_type;
  }
  return it->second;
}

Duration parseDurationOrThrow(const std::string& str) {
  auto res = parseDuration(boost::trim_copy(str));
  if (!res) {
    throw InvalidOperationError() << "Cannot parse duration: '" << str << "'";
  }
  return *res;
}

}  // namespace

//
// BuilderExpr
//

BuilderExpr::BuilderExpr() : builder_(nullptr), expr_(kInvalidExprId) {}

BuilderExpr::BuilderExpr(const QueryBuilder* builder, ExprId expr)
    : builder_(builder), expr_(expr) {}

const QueryBuilder& BuilderExpr::builder() const {
  if (!builder_) {
    throw InvalidOperationError("Uninitialized expression is used in a query.");
  }
  return *builder_;
}

const Expr* BuilderExpr::expr() const {
  return builder().arena().get(expr_);
}

const Type* BuilderExpr::type() const {
  return expr()->type();
}

std::string BuilderExpr::name() const {
  return outputName(builder().arena(), expr_);
}

BuilderExpr BuilderExpr::rename(const std::string& name) const {
  auto& arena = builder().arena();
  auto operand = stripAlias(arena, expr_);
  return {builder_, arena.make<AliasExpr>(arena.type(operand), operand, name)};
}

BuilderExpr BuilderExpr::count() const {
  return agg(AggType::kCount);
}

BuilderExpr BuilderExpr::sum() const {
  return agg(AggType::kSum);
}

BuilderExpr BuilderExpr::mean() const {
  return agg(AggType::kMean);
}

BuilderExpr BuilderExpr::min() const {
  return agg(AggType::kMin);
}

BuilderExpr BuilderExpr::max() const {
  return agg(AggType::kMax);
}

BuilderExpr BuilderExpr::first() const {
  return agg(AggType::kFirst);
}

BuilderExpr BuilderExpr::last() const {
  return agg(AggType::kLast);
}

BuilderExpr BuilderExpr::nUnique() const {
  return agg(AggType::kNUnique);
}

BuilderExpr BuilderExpr::stdDev() const {
  return agg(AggType::kStd);
}

BuilderExpr BuilderExpr::var() const {
  return agg(AggType::kVar);
}

BuilderExpr BuilderExpr::median() const {
  return agg(AggType::kMedian);
}

BuilderExpr BuilderExpr::agg(AggType agg_kind) const {
  if (agg_kind == AggType::kLen) {
    return builder().len();
  }
  auto& arena = builder().arena();
  auto res_type = aggResultType(agg_kind, type());
  return {builder_, arena.make<AggExpr>(res_type, agg_kind, expr_)};
}

BuilderExpr BuilderExpr::agg(const std::string& agg_str) const {
  static const std::unordered_map<std::string, AggType> agg_names = {
      {"count", AggType::kCount},
      {"len", AggType::kLen},
      {"sum", AggType::kSum},
      {"mean", AggType::kMean},
      {"avg", AggType::kMean},
      {"min", AggType::kMin},
      {"max", AggType::kMax},
      {"first", AggType::kFirst},
      {"last", AggType::kLast},
      {"n_unique", AggType::kNUnique},
      {"nunique", AggType::kNUnique},
      {"std", AggType::kStd},
      {"stddev", AggType::kStd},
      {"var", AggType::kVar},
      {"median", AggType::kMedian}};
  auto agg_str_lower = boost::trim_copy(boost::algorithm::to_lower_copy(agg_str));
  auto it = agg_names.find(agg_str_lower);
  if (it == agg_names.end()) {
    throw InvalidOperationError() << "Unknown aggregate name: " << agg_str;
  }
  return agg(it->second);
}

BuilderExpr BuilderExpr::over(const std::vector<BuilderExpr>& partition_by) const {
  return over(partition_by, {});
}

BuilderExpr BuilderExpr::over(const std::vector<BuilderExpr>& partition_by,
                              const std::vector<BuilderExpr>& order_by) const {
  auto& arena = builder().arena();
  if (containsWindow(arena, expr_)) {
    throw InvalidOperationError() << "Nested window expressions are not supported: "
                                  << arena.toString(expr_);
  }
  ExprIdList part_keys;
  for (auto& key : partition_by) {
    checkSameBuilder(builder_, key.builder_);
    if (!isElementwise(arena, key.expr_)) {
      throw InvalidOperationError() << "Window partition keys must be element-wise: "
                                    << arena.toString(key.expr_);
    }
    part_keys.push_back(stripAlias(arena, key.expr_));
  }
  ExprIdList order_keys;
  for (auto& key : order_by) {
    checkSameBuilder(builder_, key.builder_);
    if (key.expr()->is<SortKey>()) {
      order_keys.push_back(key.expr_);
    } else {
      order_keys.push_back(key.sortKey().expr_);
    }
  }
  // The window keeps the output name of the function.
  auto func = stripAlias(arena, expr_);
  auto window = arena.make<WindowExpr>(
      arena.type(func), func, std::move(part_keys), std::move(order_keys));
  BuilderExpr res(builder_, window);
  if (expr_ != func) {
    return res.rename(name());
  }
  return res;
}

BuilderExpr BuilderExpr::cast(const Type* new_type, bool strict) const {
  auto& arena = builder().arena();
  if (!isCastSupported(type(), new_type)) {
    throw SchemaError() << "Cannot cast " << arena.toString(expr_) << " from "
                        << type()->toString() << " to " << new_type->toString();
  }
  if (type()->equal(*new_type)) {
    return *this;
  }
  return {builder_, arena.make<CastExpr>(new_type, expr_, strict)};
}

BuilderExpr BuilderExpr::cast(const std::string& new_type, bool strict) const {
  return cast(builder().parseType(new_type), strict);
}

BuilderExpr BuilderExpr::sortKey(bool descending, bool nulls_last) const {
  auto& arena = builder().arena();
  auto operand = stripAlias(arena, expr_);
  return {builder_,
          arena.make<SortKey>(arena.type(operand), operand, descending, nulls_last)};
}

BuilderExpr BuilderExpr::unaryOp(OpType op) const {
  auto& arena = builder().arena();
  auto res_type = unaryOperResultType(op, type());
  return {builder_, arena.make<UOper>(res_type, op, expr_)};
}

BuilderExpr BuilderExpr::binOp(OpType op, const BuilderExpr& rhs) const {
  checkSameBuilder(builder_, rhs.builder_);
  auto& arena = builder().arena();
  auto res_type = binOperResultType(op, type(), rhs.type());
  return {builder_, arena.make<BinOper>(res_type, op, expr_, rhs.expr_)};
}

BuilderExpr BuilderExpr::logicalNot() const {
  return unaryOp(OpType::kNot);
}

BuilderExpr BuilderExpr::uminus() const {
  return unaryOp(OpType::kUMinus);
}

BuilderExpr BuilderExpr::isNull() const {
  return unaryOp(OpType::kIsNull);
}

BuilderExpr BuilderExpr::isNotNull() const {
  return unaryOp(OpType::kIsNotNull);
}

#define DEFINE_NUMERIC_BINOP(NAME, OP)                   \
  BuilderExpr BuilderExpr::NAME(const BuilderExpr& rhs) const { \
    return binOp(OP, rhs);                               \
  }                                                      \
  BuilderExpr BuilderExpr::NAME(int val) const {         \
    return binOp(OP, builder().cst(val));                \
  }                                                      \
  BuilderExpr BuilderExpr::NAME(int64_t val) const {     \
    return binOp(OP, builder().cst(val));                \
  }                                                      \
  BuilderExpr BuilderExpr::NAME(double val) const {      \
    return binOp(OP, builder().cst(val));                \
  }

#define DEFINE_INTEGER_BINOP(NAME, OP)                   \
  BuilderExpr BuilderExpr::NAME(const BuilderExpr& rhs) const { \
    return binOp(OP, rhs);                               \
  }                                                      \
  BuilderExpr BuilderExpr::NAME(int val) const {         \
    return binOp(OP, builder().cst(val));                \
  }                                                      \
  BuilderExpr BuilderExpr::NAME(int64_t val) const {     \
    return binOp(OP, builder().cst(val));                \
  }

#define DEFINE_COMPARISON(NAME, OP)                          \
  DEFINE_NUMERIC_BINOP(NAME, OP)                             \
  BuilderExpr BuilderExpr::NAME(const std::string& val) const { \
    return binOp(OP, builder().cst(val));                    \
  }

DEFINE_NUMERIC_BINOP(add, OpType::kPlus)
DEFINE_NUMERIC_BINOP(sub, OpType::kMinus)
DEFINE_NUMERIC_BINOP(mul, OpType::kMul)
DEFINE_NUMERIC_BINOP(div, OpType::kDiv)
DEFINE_INTEGER_BINOP(mod, OpType::kMod)
DEFINE_INTEGER_BINOP(floorDiv, OpType::kFloorDiv)
DEFINE_COMPARISON(eq, OpType::kEq)
DEFINE_COMPARISON(ne, OpType::kNe)
DEFINE_COMPARISON(lt, OpType::kLt)
DEFINE_COMPARISON(le, OpType::kLe)
DEFINE_COMPARISON(gt, OpType::kGt)
DEFINE_COMPARISON(ge, OpType::kGe)

#undef DEFINE_COMPARISON
#undef DEFINE_INTEGER_BINOP
#undef DEFINE_NUMERIC_BINOP

BuilderExpr BuilderExpr::logicalAnd(const BuilderExpr& rhs) const {
  return binOp(OpType::kAnd, rhs);
}

BuilderExpr BuilderExpr::logicalOr(const BuilderExpr& rhs) const {
  return binOp(OpType::kOr, rhs);
}

BuilderExpr BuilderExpr::call(const std::string& func_name,
                              const std::vector<BuilderExpr>& args) const {
  std::vector<BuilderExpr> all_args;
  all_args.reserve(args.size() + 1);
  all_args.push_back(*this);
  all_args.insert(all_args.end(), args.begin(), args.end());
  return builder().func(func_name, all_args);
}

BuilderExpr BuilderExpr::fillNull(const BuilderExpr& val) const {
  return call("fill_null", {val});
}

BuilderExpr BuilderExpr::isIn(const std::vector<BuilderExpr>& vals) const {
  return call("is_in", vals);
}

BuilderExpr BuilderExpr::operator!() const {
  return logicalNot();
}

BuilderExpr BuilderExpr::operator-() const {
  return uminus();
}

//
// BuilderSortField
//

BuilderSortField::BuilderSortField(const char* col_name,
                                   bool descending,
                                   bool nulls_last)
    : BuilderSortField(std::string(col_name), descending, nulls_last) {}

BuilderSortField::BuilderSortField(const char* col_name,
                                   const char* dir,
                                   const char* null_pos)
    : BuilderSortField(std::string(col_name), std::string(dir), std::string(null_pos)) {}

BuilderSortField::BuilderSortField(const std::string& col_name,
                                   bool descending,
                                   bool nulls_last)
    : field_(col_name), descending_(descending), nulls_last_(nulls_last) {}

BuilderSortField::BuilderSortField(const std::string& col_name,
                                   const std::string& dir,
                                   const std::string& null_pos)
    : field_(col_name)
    , descending_(parseSortDirection(dir))
    , nulls_last_(parseNullPosition(null_pos)) {}

BuilderSortField::BuilderSortField(BuilderExpr expr, bool descending, bool nulls_last)
    : field_(std::move(expr)), descending_(descending), nulls_last_(nulls_last) {}

BuilderSortField::BuilderSortField(BuilderExpr expr,
                                   const std::string& dir,
                                   const std::string& null_pos)
    : field_(std::move(expr))
    , descending_(parseSortDirection(dir))
    , nulls_last_(parseNullPosition(null_pos)) {}

bool BuilderSortField::parseSortDirection(const std::string& val) {
  auto val_lower = boost::algorithm::to_lower_copy(val);
  if (val_lower == "asc" || val_lower == "ascending") {
    return false;
  }
  if (val_lower == "desc" || val_lower == "descending") {
    return true;
  }
  throw InvalidOperationError() << "Cannot parse sort direction (use 'asc' or 'desc'): '"
                                << val << "'";
}

bool BuilderSortField::parseNullPosition(const std::string& val) {
  auto val_lower = boost::algorithm::to_lower_copy(val);
  if (val_lower == "first") {
    return false;
  }
  if (val_lower == "last") {
    return true;
  }
  throw InvalidOperationError()
      << "Cannot parse nulls position (use 'first' or 'last'): '" << val << "'";
}

//
// BuilderNode
//

BuilderNode::BuilderNode() : builder_(nullptr), node_(kInvalidNodeId) {}

BuilderNode::BuilderNode(const QueryBuilder* builder, NodeId node)
    : builder_(builder), node_(node) {}

const Node* BuilderNode::node() const {
  if (!builder_) {
    throw InvalidOperationError("Uninitialized node is used in a query.");
  }
  return builder_->dag().node(node_);
}

const Schema& BuilderNode::schema() const {
  return node()->schema();
}

BuilderExpr BuilderNode::ref(int col_idx) const {
  auto& schema = this->schema();
  auto size = static_cast<int>(schema.size());
  // Negative indexes count from the end.
  auto idx = col_idx < 0 ? col_idx + size : col_idx;
  if (idx < 0 || idx >= size) {
    throw SchemaError() << "Column index " << col_idx << " is out of range for "
                        << schema.toString();
  }
  auto& field = schema[idx];
  return {builder_, builder_->arena().make<ColumnRef>(field.type, field.name)};
}

BuilderExpr BuilderNode::ref(const std::string& col_name) const {
  auto type = schema().typeOf(col_name);
  return {builder_, builder_->arena().make<ColumnRef>(type, col_name)};
}

std::vector<BuilderExpr> BuilderNode::ref(const std::vector<std::string>& col_names) const {
  std::vector<BuilderExpr> res;
  res.reserve(col_names.size());
  for (auto& name : col_names) {
    res.push_back(ref(name));
  }
  return res;
}

ExprIdList BuilderNode::exprIds(const std::vector<BuilderExpr>& exprs) const {
  ExprIdList res;
  res.reserve(exprs.size());
  for (auto& expr : exprs) {
    checkSameBuilder(builder_, expr.builder_);
    res.push_back(expr.id());
  }
  return res;
}

BuilderNode BuilderNode::proj(const std::vector<std::string>& col_names) const {
  return proj(ref(col_names));
}

BuilderNode BuilderNode::proj(std::initializer_list<std::string> col_names) const {
  return proj(std::vector<std::string>(col_names));
}

BuilderNode BuilderNode::proj(const BuilderExpr& expr) const {
  return proj(std::vector<BuilderExpr>({expr}));
}

BuilderNode BuilderNode::proj(const std::vector<BuilderExpr>& exprs) const {
  auto ids = exprIds(exprs);
  return {builder_, builder_->dag().makeNode<Project>(std::move(ids), node_)};
}

BuilderNode BuilderNode::withColumns(const std::vector<BuilderExpr>& exprs) const {
  std::unordered_map<std::string, BuilderExpr> new_cols;
  std::vector<BuilderExpr> appended;
  for (auto& expr : exprs) {
    auto name = expr.name();
    if (schema().contains(name)) {
      if (!new_cols.emplace(name, expr).second) {
        throw SchemaError() << "Duplicate column '" << name << "' in with_columns";
      }
    } else {
      appended.push_back(expr);
    }
  }
  std::vector<BuilderExpr> res;
  for (auto& field : schema()) {
    auto it = new_cols.find(field.name);
    res.push_back(it == new_cols.end() ? ref(field.name) : it->second);
  }
  res.insert(res.end(), appended.begin(), appended.end());
  return proj(res);
}

BuilderNode BuilderNode::filter(const BuilderExpr& condition) const {
  checkSameBuilder(builder_, condition.builder_);
  return {builder_, builder_->dag().makeNode<Filter>(condition.id(), node_)};
}

BuilderExpr BuilderNode::count() const {
  return builder_->len();
}

BuilderExpr BuilderNode::parseAggString(const std::string& agg_str) const {
  auto agg_str_lower = boost::trim_copy(boost::algorithm::to_lower_copy(agg_str));
  if (agg_str_lower == "count" || agg_str_lower == "len") {
    return count();
  }

  // Parse string like <agg_name>(<col_name>).
  auto pos = agg_str_lower.find('(');
  if (!agg_str_lower.empty() && agg_str_lower.back() == ')' && pos != std::string::npos) {
    auto agg_name = boost::trim_copy(agg_str_lower.substr(0, pos));
    // Column names are case sensitive.
    auto trimmed = boost::trim_copy(agg_str);
    auto col_name = boost::trim_copy(trimmed.substr(pos + 1, trimmed.size() - pos - 2));
    if ((agg_name == "count" || agg_name == "len") &&
        (col_name.empty() || col_name == "*" || col_name == "1")) {
      return count();
    }
    return ref(col_name).agg(agg_name);
  }

  throw InvalidOperationError() << "Cannot parse aggregate string: '" << agg_str << "'";
}

std::vector<BuilderExpr> BuilderNode::parseAggString(
    const std::vector<std::string>& aggs) const {
  std::vector<BuilderExpr> res;
  res.reserve(aggs.size());
  for (auto& agg_str : aggs) {
    res.emplace_back(parseAggString(agg_str));
  }
  return res;
}

BuilderNode BuilderNode::agg(const std::vector<std::string>& group_keys,
                             const std::vector<std::string>& aggs) const {
  return agg(ref(group_keys), parseAggString(aggs));
}

BuilderNode BuilderNode::agg(const std::vector<std::string>& group_keys,
                             const std::vector<BuilderExpr>& aggs) const {
  return agg(ref(group_keys), aggs);
}

BuilderNode BuilderNode::agg(const std::vector<BuilderExpr>& group_keys,
                             const std::vector<BuilderExpr>& aggs) const {
  auto keys = exprIds(group_keys);
  auto agg_ids = exprIds(aggs);
  if (keys.empty() && agg_ids.empty()) {
    throw InvalidOperationError("Aggregation requires group keys or aggregates.");
  }
  return {builder_,
          builder_->dag().makeNode<Aggregate>(std::move(keys), std::move(agg_ids), node_)};
}

BuilderNode BuilderNode::agg(std::initializer_list<std::string> group_keys,
                             std::initializer_list<std::string> aggs) const {
  return agg(std::vector<std::string>(group_keys), std::vector<std::string>(aggs));
}

BuilderNode BuilderNode::agg(std::initializer_list<std::string> group_keys,
                             const std::vector<BuilderExpr>& aggs) const {
  return agg(std::vector<std::string>(group_keys), aggs);
}

BuilderNode BuilderNode::sort(const BuilderSortField& field) const {
  return sort(std::vector<BuilderSortField>({field}));
}

BuilderNode BuilderNode::sort(const std::vector<BuilderSortField>& fields) const {
  std::vector<BuilderExpr> keys;
  for (auto& field : fields) {
    auto expr = field.hasColName() ? ref(field.colName()) : field.expr();
    checkSameBuilder(builder_, expr.builder_);
    keys.push_back(expr.sortKey(field.descending(), field.nullsLast()));
  }
  return {builder_, builder_->dag().makeNode<Sort>(exprIds(keys), node_)};
}

BuilderNode BuilderNode::slice(int64_t offset, size_t length) const {
  return {builder_, builder_->dag().makeNode<Slice>(offset, length, node_)};
}

BuilderNode BuilderNode::head(size_t n) const {
  return slice(0, n);
}

BuilderNode BuilderNode::tail(size_t n) const {
  return slice(-static_cast<int64_t>(n), n);
}

BuilderNode BuilderNode::join(const BuilderNode& rhs,
                              const std::vector<std::string>& col_names,
                              JoinType join_type) const {
  return join(rhs, col_names, col_names, join_type);
}

BuilderNode BuilderNode::join(const BuilderNode& rhs,
                              const std::vector<std::string>& lhs_col_names,
                              const std::vector<std::string>& rhs_col_names,
                              JoinType join_type) const {
  JoinOptions options;
  options.type = join_type;
  return join(rhs, ref(lhs_col_names), rhs.ref(rhs_col_names), std::move(options));
}

BuilderNode BuilderNode::join(const BuilderNode& rhs,
                              const std::vector<std::string>& lhs_col_names,
                              const std::vector<std::string>& rhs_col_names,
                              const std::string& join_type) const {
  return join(rhs, lhs_col_names, rhs_col_names, parseJoinType(join_type));
}

BuilderNode BuilderNode::join(const BuilderNode& rhs,
                              const std::vector<BuilderExpr>& lhs_keys,
                              const std::vector<BuilderExpr>& rhs_keys,
                              JoinOptions options) const {
  checkSameBuilder(builder_, rhs.builder_);
  auto join = builder_->dag().makeNode<Join>(
      node_, rhs.node_, exprIds(lhs_keys), exprIds(rhs_keys), std::move(options));
  return {builder_, join};
}

BuilderNode BuilderNode::crossJoin(const BuilderNode& rhs) const {
  JoinOptions options;
  options.type = JoinType::kCross;
  return join(rhs, std::vector<BuilderExpr>(), std::vector<BuilderExpr>(), options);
}

BuilderNode BuilderNode::joinAsOf(const BuilderNode& rhs,
                                  const std::string& lhs_col_name,
                                  const std::string& rhs_col_name,
                                  AsOfOptions asof_options) const {
  JoinOptions options;
  options.type = JoinType::kAsOf;
  options.asof = std::move(asof_options);
  return join(rhs, {ref(lhs_col_name)}, {rhs.ref(rhs_col_name)}, std::move(options));
}

BuilderNode BuilderNode::distinct(const std::vector<std::string>& subset,
                                  UniqueKeep keep,
                                  bool maintain_order) const {
  return {builder_,
          builder_->dag().makeNode<Distinct>(subset, keep, maintain_order, node_)};
}

BuilderNode BuilderNode::explode(const std::vector<std::string>& col_names) const {
  return {builder_, builder_->dag().makeNode<Explode>(col_names, node_)};
}

BuilderNode BuilderNode::melt(const std::vector<std::string>& id_vars,
                              const std::vector<std::string>& value_vars,
                              const std::string& variable_name,
                              const std::string& value_name) const {
  auto values = value_vars;
  if (values.empty()) {
    std::unordered_set<std::string> ids(id_vars.begin(), id_vars.end());
    for (auto& field : schema()) {
      if (!ids.count(field.name)) {
        values.push_back(field.name);
      }
    }
  }
  return {builder_,
          builder_->dag().makeNode<Melt>(
              id_vars, std::move(values), variable_name, value_name, node_)};
}

BuilderNode BuilderNode::upsample(const std::vector<std::string>& by,
                                  const std::string& time_column,
                                  const std::string& every,
                                  const std::string& offset) const {
  return {builder_,
          builder_->dag().makeNode<Upsample>(by,
                                             time_column,
                                             parseDurationOrThrow(every),
                                             parseDurationOrThrow(offset),
                                             node_)};
}

QueryDagPtr BuilderNode::finalize() const {
  node();
  auto res = std::make_unique<QueryDag>(builder_->config());
  res->setRoot(res->import(builder_->dag(), node_));
  return res;
}

ExecutionResult BuilderNode::collect() const {
  return builder_->executor().collect(*finalize());
}

ExecutionResult BuilderNode::collect(const ExecutionOptions& opts) const {
  return builder_->executor().collect(*finalize(), opts);
}

ResultStreamPtr BuilderNode::collectStreaming() const {
  return builder_->executor().collectStreaming(*finalize());
}

ResultStreamPtr BuilderNode::collectStreaming(const ExecutionOptions& opts) const {
  return builder_->executor().collectStreaming(*finalize(), opts);
}

std::string BuilderNode::explain() const {
  return builder_->executor().explain(*finalize());
}

//
// QueryBuilder
//

QueryBuilder::QueryBuilder(SchemaMgrPtr schema_mgr, ConfigPtr config)
    : ctx_(Context::defaultCtx())
    , schema_mgr_(std::move(schema_mgr))
    , config_(config ? std::move(config) : std::make_shared<Config>())
    , dag_(std::make_shared<QueryDag>(config_))
    , executor_(config_) {}

BuilderNode QueryBuilder::scan(const std::string& table_name) const {
  if (!schema_mgr_) {
    throw InvalidOperationError() << "Cannot scan table '" << table_name
                                  << "': no schema manager is provided";
  }
  return scan(table_name, schema_mgr_->getTable(table_name));
}

BuilderNode QueryBuilder::scan(const std::string& table_name,
                               DataProviderPtr provider) const {
  if (!provider) {
    throw InvalidOperationError() << "No data provider for table '" << table_name << "'";
  }
  return {this, dag_->makeNode<Scan>(table_name, std::move(provider))};
}

BuilderNode QueryBuilder::concat(const std::vector<BuilderNode>& nodes) const {
  if (nodes.empty()) {
    throw InvalidOperationError("Cannot concatenate an empty list of frames.");
  }
  if (nodes.size() == 1) {
    return nodes.front();
  }
  NodeIdList inputs;
  for (auto& node : nodes) {
    checkSameBuilder(this, node.builder_);
    inputs.push_back(node.node_);
  }
  return {this, dag_->makeNode<Union>(std::move(inputs))};
}

BuilderExpr QueryBuilder::len() const {
  return {this, arena().make<AggExpr>(ctx_.int64(), AggType::kLen, kInvalidExprId)};
}

BuilderExpr QueryBuilder::cst(int val) const {
  return cst(static_cast<int64_t>(val));
}

BuilderExpr QueryBuilder::cst(int64_t val) const {
  return cst(val, ctx_.int64());
}

BuilderExpr QueryBuilder::cst(int64_t val, const Type* type) const {
  if (type->isFloatingPoint()) {
    return cst(static_cast<double>(val), type);
  }
  if (!type->isIntegerStorage() || type->isNull()) {
    throw SchemaError() << "Cannot create a " << type->toString()
                        << " literal from an integer value";
  }
  return {this, arena().make<Literal>(type, Datum(val))};
}

BuilderExpr QueryBuilder::cst(double val) const {
  return cst(val, ctx_.fp64());
}

BuilderExpr QueryBuilder::cst(double val, const Type* type) const {
  if (type->isInteger()) {
    return cst(static_cast<int64_t>(val), type);
  }
  if (!type->isFloatingPoint()) {
    throw SchemaError() << "Cannot create a " << type->toString()
                        << " literal from a floating point value";
  }
  return {this, arena().make<Literal>(type, Datum(val))};
}

BuilderExpr QueryBuilder::cst(const std::string& val) const {
  return {this, arena().make<Literal>(ctx_.text(), Datum(val))};
}

BuilderExpr QueryBuilder::cst(const char* val) const {
  return cst(std::string(val));
}

BuilderExpr QueryBuilder::trueCst() const {
  return {this, arena().make<Literal>(ctx_.boolean(), Datum(int64_t(1)))};
}

BuilderExpr QueryBuilder::falseCst() const {
  return {this, arena().make<Literal>(ctx_.boolean(), Datum(int64_t(0)))};
}

BuilderExpr QueryBuilder::nullCst() const {
  return nullCst(ctx_.null());
}

BuilderExpr QueryBuilder::nullCst(const Type* type) const {
  return {this, arena().make<Literal>(type, Datum())};
}

BuilderExpr QueryBuilder::date(const std::string& val) const {
  auto days = parseDate(val);
  if (!days) {
    throw InvalidOperationError() << "Cannot parse date: '" << val << "'";
  }
  return {this, arena().make<Literal>(ctx_.date(), Datum(*days))};
}

BuilderExpr QueryBuilder::timestamp(const std::string& val) const {
  auto micros = parseTimestamp(val);
  if (!micros) {
    throw InvalidOperationError() << "Cannot parse timestamp: '" << val << "'";
  }
  return {this, arena().make<Literal>(ctx_.timestamp(), Datum(*micros))};
}

BuilderExpr QueryBuilder::func(const std::string& name,
                               const std::vector<BuilderExpr>& args) const {
  auto& desc = FunctionRegistry::instance().get(name);
  if (args.size() < desc.min_args || args.size() > desc.max_args) {
    throw SchemaError() << "Function '" << name << "' does not accept " << args.size()
                        << " arguments";
  }
  ExprIdList arg_ids;
  TypeList arg_types;
  for (auto& arg : args) {
    checkSameBuilder(this, arg.builder_);
    arg_ids.push_back(arg.id());
    arg_types.push_back(arg.type());
  }
  auto res_type = desc.result_type(arg_types);
  return {this, arena().make<FunctionOper>(res_type, &desc, std::move(arg_ids))};
}

BuilderExpr QueryBuilder::ifThenElse(const BuilderExpr& cond,
                                     const BuilderExpr& if_val,
                                     const BuilderExpr& else_val) const {
  return func("if_else", {cond, if_val, else_val});
}

BuilderExpr QueryBuilder::coalesce(const std::vector<BuilderExpr>& args) const {
  return func("coalesce", args);
}

BuilderExpr QueryBuilder::concatStr(const std::vector<BuilderExpr>& args) const {
  return func("concat_str", args);
}

const Type* QueryBuilder::parseType(const std::string& name) const {
  auto name_lower = boost::trim_copy(boost::algorithm::to_lower_copy(name));
  if (name_lower == "bool" || name_lower == "boolean") {
    return ctx_.boolean();
  }
  if (name_lower == "int8") {
    return ctx_.int8();
  }
  if (name_lower == "int16") {
    return ctx_.int16();
  }
  if (name_lower == "int32" || name_lower == "int") {
    return ctx_.int32();
  }
  if (name_lower == "int64" || name_lower == "bigint") {
    return ctx_.int64();
  }
  if (name_lower == "fp32" || name_lower == "float" || name_lower == "float32") {
    return ctx_.fp32();
  }
  if (name_lower == "fp64" || name_lower == "double" || name_lower == "float64") {
    return ctx_.fp64();
  }
  if (name_lower == "text" || name_lower == "str" || name_lower == "string") {
    return ctx_.text();
  }
  if (name_lower == "date") {
    return ctx_.date();
  }
  if (name_lower == "timestamp") {
    return ctx_.timestamp();
  }
  throw SchemaError() << "Unknown type name: '" << name << "'";
}

//
// Operators
//

BuilderExpr operator+(const BuilderExpr& lhs, const BuilderExpr& rhs) {
  return lhs.add(rhs);
}

BuilderExpr operator+(const BuilderExpr& lhs, int rhs) {
  return lhs.add(rhs);
}

BuilderExpr operator+(const BuilderExpr& lhs, int64_t rhs) {
  return lhs.add(rhs);
}

BuilderExpr operator+(const BuilderExpr& lhs, double rhs) {
  return lhs.add(rhs);
}

BuilderExpr operator+(int lhs, const BuilderExpr& rhs) {
  return rhs.builder().cst(lhs).add(rhs);
}

BuilderExpr operator+(int64_t lhs, const BuilderExpr& rhs) {
  return rhs.builder().cst(lhs).add(rhs);
}

BuilderExpr operator+(double lhs, const BuilderExpr& rhs) {
  return rhs.builder().cst(lhs).add(rhs);
}

BuilderExpr operator-(const BuilderExpr& lhs, const BuilderExpr& rhs) {
  return lhs.sub(rhs);
}

BuilderExpr operator-(const BuilderExpr& lhs, int rhs) {
  return lhs.sub(rhs);
}

BuilderExpr operator-(const BuilderExpr& lhs, int64_t rhs) {
  return lhs.sub(rhs);
}

BuilderExpr operator-(const BuilderExpr& lhs, double rhs) {
  return lhs.sub(rhs);
}

BuilderExpr operator-(int lhs, const BuilderExpr& rhs) {
  return rhs.builder().cst(lhs).sub(rhs);
}

BuilderExpr operator-(int64_t lhs, const BuilderExpr& rhs) {
  return rhs.builder().cst(lhs).sub(rhs);
}

BuilderExpr operator-(double lhs, const BuilderExpr& rhs) {
  return rhs.builder().cst(lhs).sub(rhs);
}

BuilderExpr operator*(const BuilderExpr& lhs, const BuilderExpr& rhs) {
  return lhs.mul(rhs);
}

BuilderExpr operator*(const BuilderExpr& lhs, int rhs) {
  return lhs.mul(rhs);
}

BuilderExpr operator*(const BuilderExpr& lhs, int64_t rhs) {
  return lhs.mul(rhs);
}

BuilderExpr operator*(const BuilderExpr& lhs, double rhs) {
  return lhs.mul(rhs);
}

BuilderExpr operator*(int lhs, const BuilderExpr& rhs) {
  return rhs.builder().cst(lhs).mul(rhs);
}

BuilderExpr operator*(int64_t lhs, const BuilderExpr& rhs) {
  return rhs.builder().cst(lhs).mul(rhs);
}

BuilderExpr operator*(double lhs, const BuilderExpr& rhs) {
  return rhs.builder().cst(lhs).mul(rhs);
}

BuilderExpr operator/(const BuilderExpr& lhs, const BuilderExpr& rhs) {
  return lhs.div(rhs);
}

BuilderExpr operator/(const BuilderExpr& lhs, int rhs) {
  return lhs.div(rhs);
}

BuilderExpr operator/(const BuilderExpr& lhs, int64_t rhs) {
  return lhs.div(rhs);
}

BuilderExpr operator/(const BuilderExpr& lhs, double rhs) {
  return lhs.div(rhs);
}

BuilderExpr operator/(int lhs, const BuilderExpr& rhs) {
  return rhs.builder().cst(lhs).div(rhs);
}

BuilderExpr operator/(int64_t lhs, const BuilderExpr& rhs) {
  return rhs.builder().cst(lhs).div(rhs);
}

BuilderExpr operator/(double lhs, const BuilderExpr& rhs) {
  return rhs.builder().cst(lhs).div(rhs);
}

BuilderExpr operator%(const BuilderExpr& lhs, const BuilderExpr& rhs) {
  return lhs.mod(rhs);
}

BuilderExpr operator%(const BuilderExpr& lhs, int rhs) {
  return lhs.mod(rhs);
}

BuilderExpr operator%(const BuilderExpr& lhs, int64_t rhs) {
  return lhs.mod(rhs);
}

BuilderExpr operator%(int lhs, const BuilderExpr& rhs) {
  return rhs.builder().cst(lhs).mod(rhs);
}

BuilderExpr operator%(int64_t lhs, const BuilderExpr& rhs) {
  return rhs.builder().cst(lhs).mod(rhs);
}

BuilderExpr operator&&(const BuilderExpr& lhs, const BuilderExpr& rhs) {
  return lhs.logicalAnd(rhs);
}

BuilderExpr operator||(const BuilderExpr& lhs, const BuilderExpr& rhs) {
  return lhs.logicalOr(rhs);
}

#define DEFINE_COMPARISON_OPERATOR(OP, NAME)                           \
  BuilderExpr operator OP(const BuilderExpr& lhs, const BuilderExpr& rhs) { \
    return lhs.NAME(rhs);                                              \
  }                                                                    \
  BuilderExpr operator OP(const BuilderExpr& lhs, int rhs) {           \
    return lhs.NAME(rhs);                                              \
  }                                                                    \
  BuilderExpr operator OP(const BuilderExpr& lhs, int64_t rhs) {       \
    return lhs.NAME(rhs);                                              \
  }                                                                    \
  BuilderExpr operator OP(const BuilderExpr& lhs, double rhs) {        \
    return lhs.NAME(rhs);                                              \
  }                                                                    \
  BuilderExpr operator OP(const BuilderExpr& lhs, const std::string& rhs) { \
    return lhs.NAME(rhs);                                              \
  }

DEFINE_COMPARISON_OPERATOR(==, eq)
DEFINE_COMPARISON_OPERATOR(!=, ne)
DEFINE_COMPARISON_OPERATOR(<, lt)
DEFINE_COMPARISON_OPERATOR(<=, le)
DEFINE_COMPARISON_OPERATOR(>, gt)
DEFINE_COMPARISON_OPERATOR(>=, ge)

#undef DEFINE_COMPARISON_OPERATOR

}  // namespace lqe
