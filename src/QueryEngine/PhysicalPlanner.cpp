/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "PhysicalPlanner.h"

#include "IR/ExprCollector.h"
#include "IR/FunctionRegistry.h"
#include "Logger/Logger.h"

#include <algorithm>
#include <unordered_set>

namespace lqe {

using namespace ir;

namespace {

// Distinct aggregates in order of the first occurrence.
class AggCollector : public ExprCollector<ExprIdList, AggCollector> {
 public:
  explicit AggCollector(const ExprArena& arena) : BaseClass(arena) {}

 protected:
  void visitAggExpr(const AggExpr* agg) override {
    if (std::find(result_.begin(), result_.end(), agg->id()) == result_.end()) {
      result_.push_back(agg->id());
    }
  }

  friend class ExprCollector<ExprIdList, AggCollector>;
};

std::vector<size_t> columnIndices(const Schema& schema, const std::vector<std::string>& names) {
  std::vector<size_t> res;
  res.reserve(names.size());
  for (auto& name : names) {
    res.push_back(schema.indexOfOrThrow(name));
  }
  return res;
}

bool allElementwise(const ExprArena& arena, const ExprIdList& exprs) {
  return std::all_of(
      exprs.begin(), exprs.end(), [&](ExprId id) { return isElementwise(arena, id); });
}

// Elementwise projection producing full columns, so row ranges can be processed
// independently.
bool isSplittableProjection(const ExprArena& arena, const ExprIdList& exprs) {
  if (!allElementwise(arena, exprs)) {
    return false;
  }
  return std::any_of(exprs.begin(), exprs.end(), [&](ExprId id) {
    return !referencedColumns(arena, id).empty();
  });
}

}  // namespace

bool PhysicalPlanner::isStreamingCapable(const QueryDag& dag, const Node* node) {
  auto& arena = dag.exprs();
  switch (node->kind()) {
    case NodeKind::kScan:
    case NodeKind::kExplode:
    case NodeKind::kMelt:
    case NodeKind::kSlice:
    case NodeKind::kUnion:
      return true;
    case NodeKind::kFilter:
      return isElementwise(arena, node->as<Filter>()->predicate());
    case NodeKind::kProject:
      return isSplittableProjection(arena, node->as<Project>()->projections());
    case NodeKind::kAggregate: {
      auto agg = node->as<Aggregate>();
      for (auto id : AggCollector::collect(arena, agg->aggs())) {
        auto agg_expr = arena.get(id)->as<AggExpr>();
        if (agg_expr->aggType() == AggType::kMedian) {
          return false;
        }
        if (agg_expr->hasArg() && !isElementwise(arena, agg_expr->arg())) {
          return false;
        }
      }
      return true;
    }
    case NodeKind::kJoin: {
      auto type = node->as<Join>()->joinType();
      return type == JoinType::kInner || type == JoinType::kLeft ||
             type == JoinType::kSemi || type == JoinType::kAnti ||
             type == JoinType::kCross;
    }
    case NodeKind::kSort:
    case NodeKind::kDistinct:
    case NodeKind::kUpsample:
      return false;
  }
  return false;
}

ExprCompiler PhysicalPlanner::compiler(const Schema& schema) const {
  return ExprCompiler(dag_.exprs(), schema, opts_.parallel);
}

const Schema& PhysicalPlanner::inputSchema(const Node* node, size_t idx) const {
  return dag_.node(node->input(idx))->schema();
}

PhysicalNodePtr PhysicalPlanner::plan(bool streaming_root) {
  CHECK_NE(dag_.root(), kInvalidNodeId);
  capable_.clear();
  auto root = lower(dag_.root());
  assignStrategies(*root);
  if (streaming_root && !root->isStreaming()) {
    root = std::make_unique<PhysicalBoundary>(PhysicalKind::kMemorySource, std::move(root));
  } else if (!streaming_root && root->isStreaming()) {
    root = std::make_unique<PhysicalBoundary>(PhysicalKind::kMaterialize, std::move(root));
  }
  VLOG(1) << "Physical plan:\n" << root->toString();
  return root;
}

PhysicalNodePtr PhysicalPlanner::lower(NodeId id) {
  auto node = dag_.node(id);
  auto res = lowerNode(node);
  auto sub_task_size = config_.exec.sub_task_size;
  if (res->kind() == PhysicalKind::kAggregate || res->kind() == PhysicalKind::kHashJoin) {
    res->setPartitioning(sub_task_size, config_.exec.hash_partitions);
  } else {
    res->setPartitioning(sub_task_size, 1);
  }
  for (auto input : node->inputs()) {
    res->addInput(lower(input));
  }
  capable_[res.get()] = opts_.streaming && isStreamingCapable(dag_, node);
  return res;
}

PhysicalNodePtr PhysicalPlanner::lowerNode(const Node* node) {
  auto& arena = dag_.exprs();
  auto label = node->label();
  switch (node->kind()) {
    case NodeKind::kScan:
      return lowerScan(node->as<Scan>());
    case NodeKind::kFilter: {
      auto filter = node->as<Filter>();
      auto res = std::make_unique<PhysicalFilter>(
          node->schema(), label, compiler(inputSchema(node)).compile(filter->predicate()));
      res->splittable = isElementwise(arena, filter->predicate());
      return res;
    }
    case NodeKind::kProject: {
      auto project = node->as<Project>();
      auto res = std::make_unique<PhysicalProject>(
          node->schema(), label, compiler(inputSchema(node)).compile(project->projections()));
      res->splittable = isSplittableProjection(arena, project->projections());
      return res;
    }
    case NodeKind::kAggregate:
      return lowerAggregate(node->as<Aggregate>());
    case NodeKind::kJoin:
      return lowerJoin(node->as<Join>());
    case NodeKind::kSort: {
      auto sort = node->as<Sort>();
      auto res = std::make_unique<PhysicalSort>(node->schema(), label);
      auto comp = compiler(inputSchema(node));
      for (auto key_id : sort->keys()) {
        auto key = arena.get(key_id)->as<SortKey>();
        CHECK(key);
        res->keys.push_back(comp.compile(key->operand()));
        res->order.push_back({key->isDescending(), key->nullsLast()});
      }
      res->limit = sort->limit();
      res->offset = sort->offset();
      return res;
    }
    case NodeKind::kSlice: {
      auto slice = node->as<Slice>();
      return std::make_unique<PhysicalSlice>(
          node->schema(), label, slice->offset(), slice->length());
    }
    case NodeKind::kUnion:
      return std::make_unique<PhysicalUnion>(node->schema(), label);
    case NodeKind::kDistinct: {
      auto distinct = node->as<Distinct>();
      auto res = std::make_unique<PhysicalDistinct>(node->schema(), label);
      res->key_columns = columnIndices(inputSchema(node), distinct->keyColumns());
      res->keep = distinct->keep();
      return res;
    }
    case NodeKind::kExplode: {
      auto explode = node->as<Explode>();
      return std::make_unique<PhysicalExplode>(
          node->schema(), label, columnIndices(inputSchema(node), explode->columns()));
    }
    case NodeKind::kMelt: {
      auto melt = node->as<Melt>();
      auto res = std::make_unique<PhysicalMelt>(node->schema(), label);
      res->id_columns = columnIndices(inputSchema(node), melt->idVars());
      res->value_columns = columnIndices(inputSchema(node), melt->valueVars());
      return res;
    }
    case NodeKind::kUpsample: {
      auto upsample = node->as<Upsample>();
      auto res = std::make_unique<PhysicalUpsample>(node->schema(), label);
      res->by_columns = columnIndices(inputSchema(node), upsample->by());
      res->time_column = inputSchema(node).indexOfOrThrow(upsample->timeColumn());
      res->every = upsample->every();
      res->offset = upsample->offset();
      return res;
    }
  }
  UNREACHABLE() << "Unsupported logical node " << label;
  return nullptr;
}

PhysicalNodePtr PhysicalPlanner::lowerScan(const Scan* scan) const {
  auto res = std::make_unique<PhysicalScan>(scan->schema(), scan->label());
  auto& hints = scan->hints();
  res->table_name = scan->tableName();
  res->provider = scan->provider();
  res->slice = hints.slice;

  std::unordered_set<std::string> required;
  for (auto& field : scan->schema()) {
    required.insert(field.name);
  }
  if (hints.predicate != kInvalidExprId) {
    res->predicate_columns = referencedColumns(dag_.exprs(), hints.predicate);
    required.insert(res->predicate_columns.begin(), res->predicate_columns.end());
  }
  std::vector<Field> read_fields;
  for (auto& field : scan->tableSchema()) {
    if (required.count(field.name)) {
      res->read_columns.push_back(field.name);
      read_fields.push_back(field);
    }
  }
  if (hints.predicate != kInvalidExprId) {
    res->predicate = compiler(Schema(read_fields)).compile(hints.predicate);
  }
  return res;
}

PhysicalNodePtr PhysicalPlanner::lowerAggregate(const Aggregate* agg) const {
  auto& arena = dag_.exprs();
  auto res = std::make_unique<PhysicalAggregate>(agg->schema(), agg->label());
  auto comp = compiler(inputSchema(agg));
  res->keys = comp.compile(agg->keys());
  for (auto& key : res->keys) {
    res->key_types.push_back(key.type());
  }
  res->agg_ids = AggCollector::collect(arena, agg->aggs());
  for (auto id : res->agg_ids) {
    auto agg_expr = arena.get(id)->as<AggExpr>();
    if (agg_expr->hasArg()) {
      res->agg_args.push_back(comp.compile(agg_expr->arg()));
    } else {
      res->agg_args.push_back(std::nullopt);
    }
    res->agg_specs.push_back(
        {agg_expr->aggType(),
         agg_expr->hasArg() ? arena.type(agg_expr->arg()) : nullptr,
         agg_expr->type()});
    if (agg_expr->aggType() == AggType::kMedian) {
      res->mergeable = false;
    }
  }
  res->outputs = comp.compile(agg->aggs());
  return res;
}

PhysicalNodePtr PhysicalPlanner::lowerJoin(const Join* join) const {
  auto& arena = dag_.exprs();
  auto& left_schema = inputSchema(join, 0);
  auto& right_schema = inputSchema(join, 1);
  JoinOutput output(*join, dag_);
  switch (join->joinType()) {
    case JoinType::kCross:
      return std::make_unique<PhysicalCrossJoin>(join->schema(), join->label(), output);
    case JoinType::kAsOf: {
      auto res =
          std::make_unique<PhysicalAsOfJoin>(join->schema(), join->label(), output);
      res->left_key = compiler(left_schema).compile(join->leftKeys().front());
      res->right_key = compiler(right_schema).compile(join->rightKeys().front());
      res->options = join->options().asof;
      res->left_by = columnIndices(left_schema, res->options.left_by);
      res->right_by = columnIndices(right_schema, res->options.right_by);
      return res;
    }
    default:
      break;
  }
  auto res = std::make_unique<PhysicalHashJoin>(join->schema(), join->label(), output);
  res->left_keys = compiler(left_schema).compile(join->leftKeys());
  res->right_keys = compiler(right_schema).compile(join->rightKeys());
  res->build_left = join->joinType() == JoinType::kInner &&
                    join->options().build_side == BuildSide::kLeft;
  VLOG(2) << join->label() << " keys " << arena.toString(join->leftKeys()) << " = "
          << arena.toString(join->rightKeys());
  return res;
}

void PhysicalPlanner::assignStrategies(PhysicalNode& node) const {
  for (auto& input : node.inputs()) {
    assignStrategies(*input);
  }
  if (!opts_.streaming) {
    return;
  }

  auto kind = node.kind();
  bool is_join = kind == PhysicalKind::kHashJoin || kind == PhysicalKind::kCrossJoin ||
                 kind == PhysicalKind::kAsOfJoin;
  bool streaming = false;
  auto it = capable_.find(&node);
  if (it != capable_.end() && it->second) {
    if (kind == PhysicalKind::kScan) {
      streaming = true;
    } else if (kind == PhysicalKind::kUnion) {
      streaming = std::any_of(node.inputs().begin(),
                              node.inputs().end(),
                              [](const PhysicalNodePtr& input) { return input->isStreaming(); });
    } else {
      streaming = node.input(0).isStreaming();
    }
  }
  node.setStrategy(streaming ? ExecutionStrategy::kStreaming : ExecutionStrategy::kInMemory);
  if (streaming && kind == PhysicalKind::kHashJoin) {
    // Morsels of the left input are probed against the right input.
    static_cast<PhysicalHashJoin&>(node).build_left = false;
  }

  for (size_t idx = 0; idx < node.inputCount(); ++idx) {
    bool streamed_input = streaming && !(is_join && idx > 0);
    auto& input = node.input(idx);
    PhysicalKind boundary;
    if (streamed_input && !input.isStreaming()) {
      boundary = PhysicalKind::kMemorySource;
    } else if (!streamed_input && input.isStreaming()) {
      boundary = PhysicalKind::kMaterialize;
    } else {
      continue;
    }
    VLOG(1) << "Inserting " << toString(boundary) << " between " << input.label() << " and "
            << node.label();
    node.setInput(idx,
                  std::make_unique<PhysicalBoundary>(boundary, node.releaseInput(idx)));
  }
}

}  // namespace lqe
