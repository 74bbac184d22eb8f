/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "Node.h"
#include "Exception.h"
#include "TypeUtils.h"

#include "DataProvider/DataProvider.h"
#include "Logger/Logger.h"
#include "Shared/misc.h"

#include <algorithm>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace lqe::ir {

std::string toString(NodeKind kind) {
  switch (kind) {
    case NodeKind::kScan:
      return "Scan";
    case NodeKind::kFilter:
      return "Filter";
    case NodeKind::kProject:
      return "Project";
    case NodeKind::kAggregate:
      return "Aggregate";
    case NodeKind::kJoin:
      return "Join";
    case NodeKind::kSort:
      return "Sort";
    case NodeKind::kSlice:
      return "Slice";
    case NodeKind::kUnion:
      return "Union";
    case NodeKind::kDistinct:
      return "Distinct";
    case NodeKind::kExplode:
      return "Explode";
    case NodeKind::kMelt:
      return "Melt";
    case NodeKind::kUpsample:
      return "Upsample";
  }
  LOG(FATAL) << "Invalid node kind: " << (int)kind;
  return "";
}

std::string toString(BuildSide side) {
  switch (side) {
    case BuildSide::kAuto:
      return "auto";
    case BuildSide::kLeft:
      return "left";
    case BuildSide::kRight:
      return "right";
  }
  LOG(FATAL) << "Invalid build side: " << (int)side;
  return "";
}

namespace {

const Schema& inputSchema(const QueryDag& dag, NodeId id) {
  auto node = dag.node(id);
  return node->schema();
}

// Every column reference must resolve in the input schema with the same type.
void checkColumnRefs(const ExprArena& arena,
                     ExprId id,
                     const Schema& schema,
                     const std::string& node_name) {
  auto expr = arena.get(id);
  if (auto col_ref = expr->as<ColumnRef>()) {
    auto idx = schema.indexOf(col_ref->name());
    if (!idx) {
      throw SchemaError() << "Column '" << col_ref->name() << "' not found in "
                          << node_name << " input schema " << schema.toString();
    }
    if (!schema[*idx].type->equal(*col_ref->type())) {
      throw SchemaError() << "Column '" << col_ref->name() << "' type mismatch in "
                          << node_name << ": referenced as "
                          << col_ref->type()->toString() << ", input has "
                          << schema[*idx].type->toString();
    }
    return;
  }
  for (auto child : expr->children()) {
    checkColumnRefs(arena, child, schema, node_name);
  }
}

void checkColumnRefs(const ExprArena& arena,
                     const ExprIdList& ids,
                     const Schema& schema,
                     const std::string& node_name) {
  for (auto id : ids) {
    checkColumnRefs(arena, id, schema, node_name);
  }
}

void checkColumnNames(const std::vector<std::string>& names,
                      const Schema& schema,
                      const std::string& node_name) {
  for (auto& name : names) {
    if (!schema.contains(name)) {
      throw SchemaError() << "Column '" << name << "' not found in " << node_name
                          << " input schema " << schema.toString();
    }
  }
}

Schema projectionSchema(const ExprArena& arena, const ExprIdList& exprs) {
  std::vector<Field> fields;
  fields.reserve(exprs.size());
  for (auto id : exprs) {
    fields.push_back({outputName(arena, id), arena.type(id)});
  }
  return Schema(std::move(fields));
}

// Column references in aggregate expressions are allowed only under an aggregate.
void checkAggregated(const ExprArena& arena, ExprId id, bool under_agg) {
  auto expr = arena.get(id);
  switch (expr->kind()) {
    case ExprKind::kColumnRef:
      if (!under_agg) {
        throw SchemaError() << "Column '" << expr->as<ColumnRef>()->name()
                            << "' is used in aggregation without an aggregate "
                               "function and is not a group key";
      }
      return;
    case ExprKind::kAgg:
      if (under_agg) {
        throw SchemaError() << "Nested aggregates are not allowed: "
                            << arena.toString(id);
      }
      under_agg = true;
      break;
    case ExprKind::kWindow:
      throw InvalidOperationError()
          << "Window expressions are not allowed in aggregation: " << arena.toString(id);
    case ExprKind::kSortKey:
      throw InvalidOperationError()
          << "Sort keys are not allowed in aggregation: " << arena.toString(id);
    default:
      break;
  }
  for (auto child : expr->children()) {
    checkAggregated(arena, child, under_agg);
  }
}

ExprIdList mapExprs(const ExprIdList& ids, const ExprMapper& mapper) {
  ExprIdList res;
  res.reserve(ids.size());
  for (auto id : ids) {
    res.push_back(mapper(id));
  }
  return res;
}

ExprId identity(ExprId id) {
  return id;
}

std::string namesToString(const std::vector<std::string>& names) {
  return "[" + join(names, ", ") + "]";
}

}  // namespace

std::unique_ptr<Node> Node::withInputs(const QueryDag& dag, NodeIdList inputs) const {
  return rebuild(dag, std::move(inputs), identity);
}

//
// Scan
//

Scan::Scan(const QueryDag& dag,
           std::string table_name,
           std::shared_ptr<DataProvider> provider,
           ScanHints hints)
    : Node(NodeKind::kScan,
           {},
           hints.projection ? provider->schema().select(*hints.projection)
                            : provider->schema())
    , table_name_(std::move(table_name))
    , provider_(std::move(provider))
    , hints_(std::move(hints)) {
  if (hints_.predicate != kInvalidExprId) {
    if (!dag.exprs().type(hints_.predicate)->isBoolean()) {
      throw SchemaError() << "Scan predicate must be boolean: "
                          << dag.exprs().toString(hints_.predicate);
    }
    checkColumnRefs(dag.exprs(), hints_.predicate, tableSchema(), "Scan");
  }
}

const Schema& Scan::tableSchema() const {
  return provider_->schema();
}

ExprIdList Scan::exprs() const {
  if (hints_.predicate != kInvalidExprId) {
    return {hints_.predicate};
  }
  return {};
}

std::unique_ptr<Node> Scan::rebuild(const QueryDag& dag,
                                    NodeIdList inputs,
                                    const ExprMapper& mapper) const {
  CHECK(inputs.empty());
  auto hints = hints_;
  if (hints.predicate != kInvalidExprId) {
    hints.predicate = mapper(hints.predicate);
  }
  return std::make_unique<Scan>(dag, table_name_, provider_, std::move(hints));
}

std::unique_ptr<Scan> Scan::withHints(const QueryDag& dag, ScanHints hints) const {
  return std::make_unique<Scan>(dag, table_name_, provider_, std::move(hints));
}

std::string Scan::toString(const QueryDag& dag) const {
  std::stringstream ss;
  ss << label() << " " << table_name_;
  if (hints_.projection) {
    ss << " projection=" << namesToString(*hints_.projection);
  }
  if (hints_.predicate != kInvalidExprId) {
    ss << " predicate=" << dag.exprs().toString(hints_.predicate);
  }
  if (hints_.slice) {
    ss << " slice=(" << hints_.slice->first << ", " << hints_.slice->second << ")";
  }
  return ss.str();
}

//
// Filter
//

Filter::Filter(const QueryDag& dag, ExprId predicate, NodeId input)
    : Node(NodeKind::kFilter, {input}, inputSchema(dag, input)), predicate_(predicate) {
  auto type = dag.exprs().type(predicate_);
  if (!type->isBoolean() && !type->isNull()) {
    throw SchemaError() << "Filter predicate must be boolean, got " << type->toString()
                        << ": " << dag.exprs().toString(predicate_);
  }
  checkColumnRefs(dag.exprs(), predicate_, schema(), "Filter");
}

std::unique_ptr<Node> Filter::rebuild(const QueryDag& dag,
                                      NodeIdList inputs,
                                      const ExprMapper& mapper) const {
  CHECK_EQ(inputs.size(), (size_t)1);
  return std::make_unique<Filter>(dag, mapper(predicate_), inputs.front());
}

std::string Filter::toString(const QueryDag& dag) const {
  return label() + " " + dag.exprs().toString(predicate_);
}

//
// Project
//

Project::Project(const QueryDag& dag, ExprIdList exprs, NodeId input)
    : Node(NodeKind::kProject, {input}, projectionSchema(dag.exprs(), exprs))
    , exprs_(std::move(exprs)) {
  if (exprs_.empty()) {
    throw InvalidOperationError() << "Projection requires at least one expression";
  }
  checkColumnRefs(dag.exprs(), exprs_, inputSchema(dag, input), "Project");
}

bool Project::isSimple(const QueryDag& dag) const {
  for (auto id : exprs_) {
    auto col_ref = dag.exprs().get(id)->as<ColumnRef>();
    if (!col_ref) {
      return false;
    }
  }
  return true;
}

std::unique_ptr<Node> Project::rebuild(const QueryDag& dag,
                                       NodeIdList inputs,
                                       const ExprMapper& mapper) const {
  CHECK_EQ(inputs.size(), (size_t)1);
  return std::make_unique<Project>(dag, mapExprs(exprs_, mapper), inputs.front());
}

std::string Project::toString(const QueryDag& dag) const {
  return label() + " " + dag.exprs().toString(exprs_);
}

//
// Aggregate
//

Aggregate::Aggregate(const QueryDag& dag, ExprIdList keys, ExprIdList aggs, NodeId input)
    : Node(NodeKind::kAggregate, {input}, [&]() {
      auto exprs = keys;
      exprs.insert(exprs.end(), aggs.begin(), aggs.end());
      return projectionSchema(dag.exprs(), exprs);
    }())
    , keys_(std::move(keys))
    , aggs_(std::move(aggs)) {
  auto& arena = dag.exprs();
  for (auto key : keys_) {
    if (!isElementwise(arena, key)) {
      throw InvalidOperationError()
          << "Group keys must be element-wise expressions: " << arena.toString(key);
    }
    if (arena.type(key)->isList()) {
      throw SchemaError() << "List columns cannot be used as group keys: "
                          << arena.toString(key);
    }
  }
  for (auto agg : aggs_) {
    checkAggregated(arena, agg, false);
  }
  auto& input_schema = inputSchema(dag, input);
  checkColumnRefs(arena, keys_, input_schema, "Aggregate");
  checkColumnRefs(arena, aggs_, input_schema, "Aggregate");
}

ExprIdList Aggregate::exprs() const {
  auto res = keys_;
  res.insert(res.end(), aggs_.begin(), aggs_.end());
  return res;
}

std::unique_ptr<Node> Aggregate::rebuild(const QueryDag& dag,
                                         NodeIdList inputs,
                                         const ExprMapper& mapper) const {
  CHECK_EQ(inputs.size(), (size_t)1);
  return std::make_unique<Aggregate>(
      dag, mapExprs(keys_, mapper), mapExprs(aggs_, mapper), inputs.front());
}

std::string Aggregate::toString(const QueryDag& dag) const {
  return label() + " keys=" + dag.exprs().toString(keys_) +
         " aggs=" + dag.exprs().toString(aggs_);
}

//
// Join
//

Join::Join(const QueryDag& dag,
           NodeId lhs,
           NodeId rhs,
           ExprIdList left_keys,
           ExprIdList right_keys,
           JoinOptions options)
    : Node(NodeKind::kJoin, {lhs, rhs}, Schema())
    , left_keys_(std::move(left_keys))
    , right_keys_(std::move(right_keys))
    , options_(std::move(options)) {
  auto& arena = dag.exprs();
  auto& left_schema = inputSchema(dag, lhs);
  auto& right_schema = inputSchema(dag, rhs);
  auto type = options_.type;

  if (left_keys_.size() != right_keys_.size()) {
    throw InvalidOperationError() << "Join key count mismatch: " << left_keys_.size()
                                  << " left keys and " << right_keys_.size()
                                  << " right keys";
  }
  if (type == JoinType::kCross) {
    if (!left_keys_.empty()) {
      throw InvalidOperationError() << "Cross join does not accept join keys";
    }
  } else if (type == JoinType::kAsOf) {
    if (left_keys_.size() != 1) {
      throw InvalidOperationError()
          << "As-of join requires exactly one ordering key, got " << left_keys_.size();
    }
    auto key_type = arena.type(left_keys_.front());
    if (!key_type->isNumber() && !key_type->isDateTime()) {
      throw SchemaError() << "As-of join key must be numeric or temporal, got "
                          << key_type->toString();
    }
    auto& asof = options_.asof;
    if (asof.left_by.size() != asof.right_by.size()) {
      throw InvalidOperationError() << "As-of join 'by' column count mismatch";
    }
    checkColumnNames(asof.left_by, left_schema, "as-of join left");
    checkColumnNames(asof.right_by, right_schema, "as-of join right");
    for (size_t i = 0; i < asof.left_by.size(); ++i) {
      commonTypeOrThrow(left_schema.typeOf(asof.left_by[i]),
                        right_schema.typeOf(asof.right_by[i]),
                        "as-of join 'by' columns");
    }
    if (asof.tolerance && *asof.tolerance < 0) {
      throw InvalidOperationError() << "As-of join tolerance must be non-negative";
    }
  } else if (left_keys_.empty()) {
    throw InvalidOperationError() << ::toString(type) << " join requires join keys";
  }
  for (size_t i = 0; i < left_keys_.size(); ++i) {
    if (!isElementwise(arena, left_keys_[i]) || !isElementwise(arena, right_keys_[i])) {
      throw InvalidOperationError() << "Join keys must be element-wise expressions";
    }
    auto left_type = arena.type(left_keys_[i]);
    auto right_type = arena.type(right_keys_[i]);
    if (left_type->isList() || right_type->isList()) {
      throw SchemaError() << "List columns cannot be used as join keys";
    }
    commonTypeOrThrow(left_type, right_type, "join keys");
  }
  checkColumnRefs(arena, left_keys_, left_schema, "Join left");
  checkColumnRefs(arena, right_keys_, right_schema, "Join right");

  // Right columns dropped from the output.
  std::unordered_set<size_t> dropped;
  bool coalesce_keys = options_.coalesce &&
                       (type == JoinType::kInner || type == JoinType::kLeft ||
                        type == JoinType::kOuter || type == JoinType::kAsOf);
  if (coalesce_keys) {
    for (size_t i = 0; i < right_keys_.size(); ++i) {
      auto right_ref = arena.get(right_keys_[i])->as<ColumnRef>();
      if (!right_ref) {
        continue;
      }
      // Outer join merges key values, so both sides must be plain columns of
      // the same type.
      if (type == JoinType::kOuter) {
        auto left_ref = arena.get(left_keys_[i])->as<ColumnRef>();
        if (!left_ref || !left_ref->type()->equal(*right_ref->type())) {
          continue;
        }
      }
      dropped.insert(right_schema.indexOfOrThrow(right_ref->name()));
    }
    if (type == JoinType::kAsOf) {
      for (auto& name : options_.asof.right_by) {
        dropped.insert(right_schema.indexOfOrThrow(name));
      }
    }
  }

  std::vector<Field> fields;
  std::unordered_set<std::string> left_names;
  for (size_t i = 0; i < left_schema.size(); ++i) {
    fields.push_back(left_schema[i]);
    left_names.insert(left_schema[i].name);
    sources_.push_back({true, i});
  }
  if (type != JoinType::kSemi && type != JoinType::kAnti) {
    for (size_t i = 0; i < right_schema.size(); ++i) {
      if (dropped.count(i)) {
        dropped_right_.push_back(i);
        continue;
      }
      auto field = right_schema[i];
      if (left_names.count(field.name)) {
        field.name += options_.suffix;
      }
      fields.push_back(field);
      sources_.push_back({false, i});
    }
  }
  schema_ = Schema(std::move(fields));
}

ExprIdList Join::exprs() const {
  auto res = left_keys_;
  res.insert(res.end(), right_keys_.begin(), right_keys_.end());
  return res;
}

std::unique_ptr<Node> Join::rebuild(const QueryDag& dag,
                                    NodeIdList inputs,
                                    const ExprMapper& mapper) const {
  CHECK_EQ(inputs.size(), (size_t)2);
  return std::make_unique<Join>(dag,
                                inputs[0],
                                inputs[1],
                                mapExprs(left_keys_, mapper),
                                mapExprs(right_keys_, mapper),
                                options_);
}

std::unique_ptr<Join> Join::withOptions(const QueryDag& dag, JoinOptions options) const {
  return std::make_unique<Join>(
      dag, input(0), input(1), left_keys_, right_keys_, std::move(options));
}

std::string Join::toString(const QueryDag& dag) const {
  std::stringstream ss;
  ss << label() << " " << ::toString(options_.type);
  if (!left_keys_.empty()) {
    ss << " left_on=" << dag.exprs().toString(left_keys_)
       << " right_on=" << dag.exprs().toString(right_keys_);
  }
  if (options_.type == JoinType::kAsOf) {
    ss << " strategy=" << ::toString(options_.asof.strategy);
    if (options_.asof.tolerance) {
      ss << " tolerance=" << *options_.asof.tolerance;
    }
    if (!options_.asof.left_by.empty()) {
      ss << " by=" << namesToString(options_.asof.left_by) << "/"
         << namesToString(options_.asof.right_by);
    }
  }
  if (options_.build_side != BuildSide::kAuto) {
    ss << " build=" << ::lqe::ir::toString(options_.build_side);
  }
  return ss.str();
}

//
// Sort
//

Sort::Sort(const QueryDag& dag,
           ExprIdList keys,
           NodeId input,
           std::optional<size_t> limit,
           size_t offset)
    : Node(NodeKind::kSort, {input}, inputSchema(dag, input))
    , keys_(std::move(keys))
    , limit_(limit)
    , offset_(offset) {
  if (keys_.empty()) {
    throw InvalidOperationError() << "Sort requires at least one key";
  }
  for (auto key : keys_) {
    auto sort_key = dag.exprs().get(key)->as<SortKey>();
    if (!sort_key) {
      throw InvalidOperationError()
          << "Sort key expected, got " << dag.exprs().toString(key);
    }
    if (!isElementwise(dag.exprs(), sort_key->operand())) {
      throw InvalidOperationError()
          << "Sort keys must be element-wise expressions: " << dag.exprs().toString(key);
    }
    if (sort_key->type()->isList()) {
      throw SchemaError() << "List columns cannot be used as sort keys";
    }
  }
  checkColumnRefs(dag.exprs(), keys_, schema(), "Sort");
}

std::unique_ptr<Node> Sort::rebuild(const QueryDag& dag,
                                    NodeIdList inputs,
                                    const ExprMapper& mapper) const {
  CHECK_EQ(inputs.size(), (size_t)1);
  return std::make_unique<Sort>(
      dag, mapExprs(keys_, mapper), inputs.front(), limit_, offset_);
}

std::unique_ptr<Sort> Sort::withLimit(const QueryDag& dag,
                                      std::optional<size_t> limit,
                                      size_t offset) const {
  return std::make_unique<Sort>(dag, keys_, input(0), limit, offset);
}

std::string Sort::toString(const QueryDag& dag) const {
  auto res = label() + " " + dag.exprs().toString(keys_);
  if (limit_) {
    res += " limit=" + std::to_string(*limit_) + " offset=" + std::to_string(offset_);
  }
  return res;
}

//
// Slice
//

Slice::Slice(const QueryDag& dag, int64_t offset, size_t length, NodeId input)
    : Node(NodeKind::kSlice, {input}, inputSchema(dag, input))
    , offset_(offset)
    , length_(length) {}

std::unique_ptr<Node> Slice::rebuild(const QueryDag& dag,
                                     NodeIdList inputs,
                                     const ExprMapper&) const {
  CHECK_EQ(inputs.size(), (size_t)1);
  return std::make_unique<Slice>(dag, offset_, length_, inputs.front());
}

std::string Slice::toString(const QueryDag&) const {
  return label() + " offset=" + std::to_string(offset_) +
         " length=" + std::to_string(length_);
}

//
// Union
//

Union::Union(const QueryDag& dag, NodeIdList inputs)
    : Node(NodeKind::kUnion,
           inputs,
           inputs.empty() ? Schema() : inputSchema(dag, inputs.front())) {
  if (inputs.size() < 2) {
    throw InvalidOperationError() << "Union requires at least two inputs, got "
                                  << inputs.size();
  }
  for (size_t i = 1; i < inputs.size(); ++i) {
    auto& input_schema = inputSchema(dag, inputs[i]);
    if (input_schema != schema()) {
      throw SchemaError() << "Union input schemas differ: " << schema().toString()
                          << " and " << input_schema.toString();
    }
  }
}

std::unique_ptr<Node> Union::rebuild(const QueryDag& dag,
                                     NodeIdList inputs,
                                     const ExprMapper&) const {
  return std::make_unique<Union>(dag, std::move(inputs));
}

std::string Union::toString(const QueryDag&) const {
  return label();
}

//
// Distinct
//

Distinct::Distinct(const QueryDag& dag,
                   std::vector<std::string> subset,
                   UniqueKeep keep,
                   bool maintain_order,
                   NodeId input)
    : Node(NodeKind::kDistinct, {input}, inputSchema(dag, input))
    , subset_(std::move(subset))
    , keep_(keep)
    , maintain_order_(maintain_order) {
  checkColumnNames(subset_, schema(), "Distinct");
  for (auto& name : keyColumns()) {
    if (schema().typeOf(name)->isList()) {
      throw SchemaError() << "List column '" << name
                          << "' cannot be used as a distinct key";
    }
  }
}

std::vector<std::string> Distinct::keyColumns() const {
  return subset_.empty() ? schema().names() : subset_;
}

std::unique_ptr<Node> Distinct::rebuild(const QueryDag& dag,
                                        NodeIdList inputs,
                                        const ExprMapper&) const {
  CHECK_EQ(inputs.size(), (size_t)1);
  return std::make_unique<Distinct>(
      dag, subset_, keep_, maintain_order_, inputs.front());
}

std::string Distinct::toString(const QueryDag&) const {
  std::stringstream ss;
  ss << label();
  if (!subset_.empty()) {
    ss << " subset=" << namesToString(subset_);
  }
  ss << " keep=" << ::toString(keep_);
  if (maintain_order_) {
    ss << " maintain_order";
  }
  return ss.str();
}

//
// Explode
//

Explode::Explode(const QueryDag& dag, std::vector<std::string> columns, NodeId input)
    : Node(NodeKind::kExplode, {input}, [&]() {
      auto& input_schema = inputSchema(dag, input);
      checkColumnNames(columns, input_schema, "Explode");
      auto fields = input_schema.fields();
      for (auto& name : columns) {
        auto& field = fields[input_schema.indexOfOrThrow(name)];
        auto list_type = field.type->as<ListType>();
        if (!list_type) {
          throw SchemaError() << "Cannot explode non-list column '" << name
                              << "' of type " << field.type->toString();
        }
        field.type = list_type->elemType();
      }
      return Schema(std::move(fields));
    }())
    , columns_(std::move(columns)) {
  if (columns_.empty()) {
    throw InvalidOperationError() << "Explode requires at least one column";
  }
}

std::unique_ptr<Node> Explode::rebuild(const QueryDag& dag,
                                       NodeIdList inputs,
                                       const ExprMapper&) const {
  CHECK_EQ(inputs.size(), (size_t)1);
  return std::make_unique<Explode>(dag, columns_, inputs.front());
}

std::string Explode::toString(const QueryDag&) const {
  return label() + " " + namesToString(columns_);
}

//
// Melt
//

namespace {

std::vector<std::string> defaultValueVars(const Schema& schema,
                                          const std::vector<std::string>& id_vars,
                                          std::vector<std::string> value_vars) {
  if (!value_vars.empty()) {
    return value_vars;
  }
  std::unordered_set<std::string> ids(id_vars.begin(), id_vars.end());
  for (auto& field : schema) {
    if (!ids.count(field.name)) {
      value_vars.push_back(field.name);
    }
  }
  return value_vars;
}

}  // namespace

Melt::Melt(const QueryDag& dag,
           std::vector<std::string> id_vars,
           std::vector<std::string> value_vars,
           std::string variable_name,
           std::string value_name,
           NodeId input)
    : Node(NodeKind::kMelt, {input}, Schema())
    , id_vars_(std::move(id_vars))
    , value_vars_(defaultValueVars(inputSchema(dag, input), id_vars_, std::move(value_vars)))
    , variable_name_(std::move(variable_name))
    , value_name_(std::move(value_name)) {
  auto& input_schema = inputSchema(dag, input);
  checkColumnNames(id_vars_, input_schema, "Melt");
  checkColumnNames(value_vars_, input_schema, "Melt");
  if (value_vars_.empty()) {
    throw InvalidOperationError() << "Melt requires at least one value column";
  }

  const Type* value_type = input_schema.typeOf(value_vars_.front());
  for (size_t i = 1; i < value_vars_.size(); ++i) {
    value_type = commonTypeOrThrow(
        value_type, input_schema.typeOf(value_vars_[i]), "melt value columns");
  }

  std::vector<Field> fields;
  for (auto& name : id_vars_) {
    fields.push_back({name, input_schema.typeOf(name)});
  }
  fields.push_back({variable_name_, input_schema[0].type->ctx().text()});
  fields.push_back({value_name_, value_type});
  schema_ = Schema(std::move(fields));
}

std::unique_ptr<Node> Melt::rebuild(const QueryDag& dag,
                                    NodeIdList inputs,
                                    const ExprMapper&) const {
  CHECK_EQ(inputs.size(), (size_t)1);
  return std::make_unique<Melt>(
      dag, id_vars_, value_vars_, variable_name_, value_name_, inputs.front());
}

std::string Melt::toString(const QueryDag&) const {
  return label() + " id_vars=" + namesToString(id_vars_) +
         " value_vars=" + namesToString(value_vars_);
}

//
// Upsample
//

Upsample::Upsample(const QueryDag& dag,
                   std::vector<std::string> by,
                   std::string time_column,
                   Duration every,
                   Duration offset,
                   NodeId input)
    : Node(NodeKind::kUpsample, {input}, Schema())
    , by_(std::move(by))
    , time_column_(std::move(time_column))
    , every_(every)
    , offset_(offset) {
  auto& input_schema = inputSchema(dag, input);
  checkColumnNames(by_, input_schema, "Upsample");
  checkColumnNames({time_column_}, input_schema, "Upsample");
  auto time_type = input_schema.typeOf(time_column_);
  if (!time_type->isDateTime()) {
    throw SchemaError() << "Upsample requires a date or timestamp column, got '"
                        << time_column_ << "' of type " << time_type->toString();
  }
  if (std::find(by_.begin(), by_.end(), time_column_) != by_.end()) {
    throw InvalidOperationError() << "Upsample time column '" << time_column_
                                  << "' cannot be a group column";
  }
  if (every_.isZero() || every_.isNegative()) {
    throw InvalidOperationError() << "Upsample interval must be positive, got "
                                  << every_.toString();
  }

  std::vector<Field> fields{{time_column_, time_type}};
  for (auto& field : input_schema) {
    if (field.name != time_column_) {
      fields.push_back(field);
    }
  }
  schema_ = Schema(std::move(fields));
}

std::unique_ptr<Node> Upsample::rebuild(const QueryDag& dag,
                                        NodeIdList inputs,
                                        const ExprMapper&) const {
  CHECK_EQ(inputs.size(), (size_t)1);
  return std::make_unique<Upsample>(
      dag, by_, time_column_, every_, offset_, inputs.front());
}

std::string Upsample::toString(const QueryDag&) const {
  std::stringstream ss;
  ss << label();
  if (!by_.empty()) {
    ss << " by=" << namesToString(by_);
  }
  ss << " time=" << time_column_ << " every=" << every_.toString();
  if (!offset_.isZero()) {
    ss << " offset=" << offset_.toString();
  }
  return ss.str();
}

//
// QueryDag
//

QueryDag::QueryDag(ConfigPtr config) : config_(std::move(config)) {
  if (!config_) {
    config_ = std::make_shared<Config>();
  }
}

NodeId QueryDag::addNode(std::unique_ptr<Node> node) {
  CHECK(node);
  CHECK_EQ(node->id_, kInvalidNodeId);
  for (auto input : node->inputs()) {
    CHECK_LT(input, nodes_.size());
  }
  auto id = static_cast<NodeId>(nodes_.size());
  node->id_ = id;
  nodes_.push_back(std::move(node));
  return id;
}

const Node* QueryDag::node(NodeId id) const {
  CHECK_LT(id, nodes_.size());
  return nodes_[id].get();
}

void QueryDag::setRoot(NodeId root) {
  CHECK_LT(root, nodes_.size());
  root_ = root;
}

NodeId QueryDag::import(const QueryDag& other, NodeId id) {
  std::unordered_map<NodeId, NodeId> imported;
  std::function<NodeId(NodeId)> import_node = [&](NodeId src_id) -> NodeId {
    auto it = imported.find(src_id);
    if (it != imported.end()) {
      return it->second;
    }
    auto src = other.node(src_id);
    NodeIdList inputs;
    for (auto input : src->inputs()) {
      inputs.push_back(import_node(input));
    }
    auto res = addNode(src->rebuild(*this, std::move(inputs), [&](ExprId expr_id) {
      return exprs_.import(other.exprs(), expr_id);
    }));
    imported.emplace(src_id, res);
    return res;
  };
  return import_node(id);
}

NodeIdList QueryDag::topologicalOrder() const {
  NodeIdList res;
  if (root_ == kInvalidNodeId) {
    return res;
  }
  std::unordered_set<NodeId> visited;
  std::function<void(NodeId)> visit = [&](NodeId id) {
    if (!visited.insert(id).second) {
      return;
    }
    for (auto input : node(id)->inputs()) {
      visit(input);
    }
    res.push_back(id);
  };
  visit(root_);
  return res;
}

std::string QueryDag::toString() const {
  if (root_ == kInvalidNodeId) {
    return "<empty>";
  }
  return toString(root_);
}

std::string QueryDag::toString(NodeId id) const {
  std::string res;
  print(id, 0, res);
  return res;
}

void QueryDag::print(NodeId id, size_t indent, std::string& res) const {
  auto n = node(id);
  res += std::string(indent, ' ');
  res += n->toString(*this);
  res += "\n";
  for (auto input : n->inputs()) {
    print(input, indent + 2, res);
  }
}

}  // namespace lqe::ir
