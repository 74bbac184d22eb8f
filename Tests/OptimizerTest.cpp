/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "TestHelpers.h"

#include "ConfigBuilder/ConfigBuilder.h"
#include "QueryBuilder/QueryBuilder.h"
#include "QueryEngine/ExprCompiler.h"
#include "QueryOptimizer/Optimizer.h"

#include <gtest/gtest.h>

#include <functional>

using namespace lqe;
using namespace lqe::ir;
using namespace TestHelpers;

namespace {

ConfigPtr config;
SchemaMgrPtr schema_mgr;

Context& ctx() {
  return Context::defaultCtx();
}

QueryDagPtr optimized(const BuilderNode& node,
                      OptimizerOptions opts = {},
                      const ConstantEvaluator& evaluate = evaluateConstant) {
  auto dag = node.finalize();
  Optimizer::optimize(*dag, opts, evaluate);
  return dag;
}

template <typename T>
std::vector<const T*> nodesOf(const QueryDag& dag) {
  std::vector<const T*> res;
  for (auto id : dag.topologicalOrder()) {
    if (auto node = dag.node(id)->as<T>()) {
      res.push_back(node);
    }
  }
  return res;
}

using OptionsSetter = std::function<void(ExecutionOptions&)>;

std::vector<std::pair<std::string, OptionsSetter>> optionVariants() {
  return {
      {"no_predicate_pushdown", [](ExecutionOptions& o) { o.predicate_pushdown = false; }},
      {"no_projection_pushdown", [](ExecutionOptions& o) { o.projection_pushdown = false; }},
      {"no_slice_pushdown", [](ExecutionOptions& o) { o.slice_pushdown = false; }},
      {"no_cse", [](ExecutionOptions& o) { o.cse = false; }},
      {"no_simplify", [](ExecutionOptions& o) { o.simplify_expr = false; }},
      {"no_join_reorder", [](ExecutionOptions& o) { o.join_reorder = false; }},
      {"no_passes",
       [](ExecutionOptions& o) {
         o.predicate_pushdown = false;
         o.projection_pushdown = false;
         o.slice_pushdown = false;
         o.cse = false;
         o.simplify_expr = false;
         o.join_reorder = false;
       }},
  };
}

// Results with all optimizations must match results with each pass disabled.
void checkPassEquivalence(const BuilderNode& query, bool ordered = true) {
  ExecutionOptions all;
  auto expected = query.collect(all);
  for (auto& [name, setter] : optionVariants()) {
    SCOPED_TRACE(name);
    ExecutionOptions opts;
    setter(opts);
    auto actual = query.collect(opts);
    compare_batches(expected.batch(), actual.batch(), ordered);
  }
}

}  // namespace

class OptimizerTest : public ::testing::Test {
 protected:
  static void SetUpTestSuite() {
    schema_mgr = std::make_shared<SchemaMgr>();
    createTable(*schema_mgr,
                "test1",
                {{"id", ctx().int64()},
                 {"x", ctx().int64()},
                 {"y", ctx().fp64()},
                 {"s", ctx().text()}},
                "1,10,1.5,a\n"
                "2,20,,b\n"
                "1,30,3.5,\n"
                "3,,4.5,c\n"
                "2,50,5.5,a\n"
                "4,60,6.5,d\n"
                "1,70,,e",
                3);
    createTable(*schema_mgr,
                "dim",
                {{"id", ctx().int64()}, {"label", ctx().text()}},
                "1,one\n"
                "2,two\n"
                "5,five");
    createTable(*schema_mgr,
                "lists",
                {{"k", ctx().int64()}, {"l", ctx().list(ctx().int64())}},
                "1,[1;2]\n"
                "2,[]\n"
                "3,\n"
                "4,[3;4;5]");
  }

  static void TearDownTestSuite() { schema_mgr.reset(); }

  void SetUp() override { builder_ = std::make_unique<QueryBuilder>(schema_mgr, config); }

  std::unique_ptr<QueryBuilder> builder_;
};

TEST_F(OptimizerTest, PredicateIntoScan) {
  auto scan = builder_->scan("test1");
  auto dag = optimized(scan.filter(scan["x"] > 15 && scan["s"] != "b").proj({"id"}));
  ASSERT_TRUE(nodesOf<Filter>(*dag).empty()) << dag->toString();
  auto scans = nodesOf<Scan>(*dag);
  ASSERT_EQ(scans.size(), (size_t)1);
  ASSERT_NE(scans.front()->hints().predicate, kInvalidExprId);
  ASSERT_EQ(splitConjunction(dag->exprs(), scans.front()->hints().predicate).size(),
            (size_t)2);
  ASSERT_EQ(*scans.front()->hints().projection, std::vector<std::string>({"id"}));
  ASSERT_EQ(dag->rootNode()->schema().names(), std::vector<std::string>({"id"}));

  OptimizerOptions opts;
  opts.predicate_pushdown = false;
  auto dag2 = optimized(scan.filter(scan["x"] > 15).proj({"id"}), opts);
  ASSERT_EQ(nodesOf<Filter>(*dag2).size(), (size_t)1);
  ASSERT_EQ(nodesOf<Scan>(*dag2).front()->hints().predicate, kInvalidExprId);
}

TEST_F(OptimizerTest, PredicateThroughAggregateKeys) {
  auto scan = builder_->scan("test1");
  auto agg = scan.agg({"id"}, {"sum(x)"});
  auto dag = optimized(agg.filter(agg["id"] < 3 && agg["x"] > 40));
  // The key predicate goes to the scan, the aggregate one stays above.
  auto filters = nodesOf<Filter>(*dag);
  ASSERT_EQ(filters.size(), (size_t)1);
  ASSERT_TRUE(dag->node(filters.front()->input(0))->is<Aggregate>());
  ASSERT_NE(nodesOf<Scan>(*dag).front()->hints().predicate, kInvalidExprId);
  compare_res_data(agg.filter(agg["id"] < 3 && agg["x"] > 80).collect(),
                   std::vector<int64_t>({1}),
                   std::vector<int64_t>({110}));
}

TEST_F(OptimizerTest, SliceIsPredicateBarrier) {
  auto scan = builder_->scan("test1");
  auto query = scan.head(3).filter(scan["x"] > 15);
  auto dag = optimized(query);
  auto scans = nodesOf<Scan>(*dag);
  ASSERT_EQ(scans.size(), (size_t)1);
  ASSERT_EQ(scans.front()->hints().predicate, kInvalidExprId);
  ASSERT_EQ(*scans.front()->hints().slice, std::make_pair(size_t(0), size_t(3)));
  ASSERT_EQ(nodesOf<Filter>(*dag).size(), (size_t)1);
  compare_res_data(query.proj({"x"}).collect(), std::vector<int64_t>({20, 30}));
}

TEST_F(OptimizerTest, LeftJoinPushdown) {
  auto scan = builder_->scan("test1");
  auto dim = builder_->scan("dim");
  auto join = scan.join(dim, {"id"}, JoinType::kLeft);
  auto query = join.filter(join["x"] > 15 && join["label"].isNull());
  auto dag = optimized(query);
  // Only the left side predicate moves below the join.
  auto filters = nodesOf<Filter>(*dag);
  ASSERT_EQ(filters.size(), (size_t)1);
  ASSERT_TRUE(dag->node(filters.front()->input(0))->is<Join>());
  for (auto scan_node : nodesOf<Scan>(*dag)) {
    if (scan_node->tableName() == "test1") {
      ASSERT_NE(scan_node->hints().predicate, kInvalidExprId);
    } else {
      ASSERT_EQ(scan_node->hints().predicate, kInvalidExprId);
    }
  }
  compare_res_data(query.proj({"x"}).collect(), std::vector<int64_t>({60}));
}

TEST_F(OptimizerTest, ProjectionPushdown) {
  auto scan = builder_->scan("test1");
  auto dim = builder_->scan("dim");
  auto query = scan.join(dim, {"id"}).agg({"label"}, {"sum(x)"});
  auto dag = optimized(query);
  for (auto scan_node : nodesOf<Scan>(*dag)) {
    if (scan_node->tableName() == "test1") {
      ASSERT_TRUE(scan_node->hints().projection);
      ASSERT_EQ(*scan_node->hints().projection, std::vector<std::string>({"id", "x"}));
    } else {
      ASSERT_TRUE(!scan_node->hints().projection ||
                  *scan_node->hints().projection ==
                      std::vector<std::string>({"id", "label"}));
    }
  }
  ASSERT_EQ(dag->rootNode()->schema().names(), std::vector<std::string>({"label", "x"}));
}

TEST_F(OptimizerTest, SlicePushdown) {
  auto scan = builder_->scan("test1");
  {
    auto dag = optimized(scan.proj({(scan["x"] + 1).rename("x1")}).slice(2, 3));
    ASSERT_TRUE(nodesOf<Slice>(*dag).empty()) << dag->toString();
    ASSERT_EQ(*nodesOf<Scan>(*dag).front()->hints().slice,
              std::make_pair(size_t(2), size_t(3)));
  }
  {
    auto dag = optimized(scan.sort(BuilderSortField("x", true, true)).slice(1, 2));
    auto sorts = nodesOf<Sort>(*dag);
    ASSERT_EQ(sorts.size(), (size_t)1);
    ASSERT_EQ(*sorts.front()->limit(), (size_t)2);
    ASSERT_EQ(sorts.front()->offset(), (size_t)1);
    ASSERT_TRUE(nodesOf<Slice>(*dag).empty());
    ASSERT_NE(dag->toString().find("limit=2"), std::string::npos);
  }
  {
    // Negative offsets depend on the input size.
    auto dag = optimized(scan.tail(2));
    ASSERT_EQ(nodesOf<Slice>(*dag).size(), (size_t)1);
    ASSERT_FALSE(nodesOf<Scan>(*dag).front()->hints().slice);
  }
  {
    // Filters stop slices.
    auto dag = optimized(scan.filter(scan["x"] > 15).head(2));
    ASSERT_EQ(nodesOf<Slice>(*dag).size(), (size_t)1);
    ASSERT_FALSE(nodesOf<Scan>(*dag).front()->hints().slice);
  }
  compare_res_data(scan.sort(BuilderSortField("x", true, true)).slice(1, 2).proj({"x"})
                       .collect(),
                   std::vector<int64_t>({60, 50}));
}

TEST_F(OptimizerTest, SimplifyExpressions) {
  auto scan = builder_->scan("test1");
  auto one_plus_two = builder_->cst(1) + builder_->cst(2);
  auto dag = optimized(
      scan.filter(builder_->trueCst() && scan["x"] > one_plus_two).proj({"id"}));
  auto pred = nodesOf<Scan>(*dag).front()->hints().predicate;
  ASSERT_NE(pred, kInvalidExprId);
  auto pred_str = dag->exprs().toString(pred);
  ASSERT_NE(pred_str.find("lit(3)"), std::string::npos) << pred_str;
  ASSERT_EQ(pred_str.find("lit(1)"), std::string::npos) << pred_str;
  ASSERT_EQ(pred_str.find("true"), std::string::npos) << pred_str;

  // Without an evaluator constant subtrees are kept as is.
  auto unfolded = optimized(
      scan.filter(builder_->trueCst() && scan["x"] > one_plus_two).proj({"id"}), {}, nullptr);
  auto unfolded_pred = nodesOf<Scan>(*unfolded).front()->hints().predicate;
  ASSERT_NE(unfolded_pred, kInvalidExprId);
  auto unfolded_str = unfolded->exprs().toString(unfolded_pred);
  ASSERT_EQ(unfolded_str.find("lit(3)"), std::string::npos) << unfolded_str;
  ASSERT_NE(unfolded_str.find("lit(2)"), std::string::npos) << unfolded_str;

  // Folding errors are left to the execution.
  auto div_zero = scan.proj({(scan["x"] + builder_->cst(1) % builder_->cst(0)).rename("v")});
  ASSERT_NO_THROW(optimized(div_zero));
  ASSERT_THROW(div_zero.collect(), ComputeError);

  auto dag2 = optimized(scan.filter(scan["x"] > 5 || builder_->trueCst()));
  ASSERT_TRUE(nodesOf<Filter>(*dag2).empty() ||
              dag2->exprs().toString(nodesOf<Filter>(*dag2).front()->predicate()) ==
                  "lit(true)");
  ASSERT_EQ(builder_->scan("test1")
                .filter(scan["x"] > 5 || builder_->trueCst())
                .collect()
                .numRows(),
            (size_t)7);

  // Absorbing literals keep the column length in projections.
  auto absorbed = scan.proj({(scan["x"] > 15 && builder_->falseCst()).rename("c"),
                             (builder_->trueCst() || scan["x"] > 15).rename("d")});
  compare_res_data(absorbed.collect(),
                   std::vector<int64_t>({0, 0, 0, 0, 0, 0, 0}),
                   std::vector<int64_t>({1, 1, 1, 1, 1, 1, 1}));
  ASSERT_EQ(scan.proj({(builder_->cst(1) > builder_->cst(2) && builder_->falseCst())
                           .rename("c")})
                .collect()
                .numRows(),
            (size_t)1);
  // Filter masks broadcast, so the predicate may become a literal.
  ASSERT_EQ(scan.filter(scan["x"] > 15 && builder_->falseCst()).collect().numRows(),
            (size_t)0);
}

TEST_F(OptimizerTest, CommonSubexpressions) {
  auto scan = builder_->scan("test1");
  auto common = (scan["x"] + scan["id"]) * 2;
  auto query = scan.proj({(common + 1).rename("a"), (common - 1).rename("b")});
  auto dag = optimized(query);
  ASSERT_NE(dag->toString().find("__cse_"), std::string::npos) << dag->toString();
  ASSERT_EQ(dag->rootNode()->schema().names(), std::vector<std::string>({"a", "b"}));
  compare_res_data(query.collect(),
                   std::vector<int64_t>({23, 45, 63, NULL_BIGINT, 105, 129, 143}),
                   std::vector<int64_t>({21, 43, 61, NULL_BIGINT, 103, 127, 141}));

  OptimizerOptions opts;
  opts.cse = false;
  auto dag2 = optimized(query, opts);
  ASSERT_EQ(dag2->toString().find("__cse_"), std::string::npos);

  auto agg_query = scan.agg({"id"},
                            {(scan["x"] * scan["y"]).sum().rename("s1"),
                             (scan["x"] * scan["y"]).max().rename("m1")});
  ASSERT_NE(optimized(agg_query)->toString().find("__cse_"), std::string::npos);
  checkPassEquivalence(agg_query);
}

TEST_F(OptimizerTest, CrossJoinToInner) {
  auto scan = builder_->scan("test1");
  auto dim = builder_->scan("dim");
  auto cross = scan.crossJoin(dim);
  auto query = cross.filter(cross["id"] == cross["id_right"] && cross["x"] > 15);
  auto dag = optimized(query);
  auto joins = nodesOf<Join>(*dag);
  ASSERT_EQ(joins.size(), (size_t)1);
  ASSERT_EQ(joins.front()->joinType(), JoinType::kInner) << dag->toString();
  ASSERT_EQ(joins.front()->leftKeys().size(), (size_t)1);
  ASSERT_NE(joins.front()->options().build_side, BuildSide::kAuto);
  ASSERT_EQ(dag->rootNode()->schema(), query.schema());

  OptimizerOptions opts;
  opts.join_reorder = false;
  auto dag2 = optimized(query, opts);
  ASSERT_EQ(nodesOf<Join>(*dag2).front()->joinType(), JoinType::kCross);

  auto res = query.sort("x").collect();
  compare_res_data(res,
                   std::vector<int64_t>({2, 1, 2, 1}),
                   std::vector<int64_t>({20, 30, 50, 70}),
                   std::vector<double>({NULL_DOUBLE, 3.5, 5.5, NULL_DOUBLE}),
                   std::vector<std::string>({"b", kNullStr, "a", "e"}),
                   std::vector<int64_t>({2, 1, 2, 1}),
                   std::vector<std::string>({"two", "one", "two", "one"}));
}

TEST_F(OptimizerTest, BuildSideSelection) {
  auto scan = builder_->scan("test1");
  auto dim = builder_->scan("dim");
  auto dag = optimized(scan.join(dim, {"id"}));
  auto joins = nodesOf<Join>(*dag);
  ASSERT_EQ(joins.size(), (size_t)1);
  ASSERT_EQ(joins.front()->options().build_side, BuildSide::kRight);
  auto dag2 = optimized(dim.join(scan, {"id"}));
  ASSERT_EQ(nodesOf<Join>(*dag2).front()->options().build_side, BuildSide::kLeft);
  ASSERT_NE(dag2->toString().find("build="), std::string::npos);
  // Build side does not change the output order.
  compare_batches(dim.join(scan, {"id"}).collect().batch(),
                  dim.join(scan, {"id"}).collect([]() {
                       ExecutionOptions opts;
                       opts.join_reorder = false;
                       return opts;
                     }())
                      .batch());
}

TEST_F(OptimizerTest, Validate) {
  auto scan = builder_->scan("test1");
  auto dag = optimized(scan.filter(scan["x"] > 1).agg({"id"}, {"count"}).sort("id"));
  ASSERT_NO_THROW(Optimizer::validate(*dag));
  auto text = dag->toString();
  ASSERT_NE(text.find("Aggregate"), std::string::npos);
  ASSERT_NE(text.find("Sort"), std::string::npos);
}

TEST_F(OptimizerTest, InputPlanIsNotModified) {
  auto scan = builder_->scan("test1");
  auto query = scan.filter(scan["x"] > 15).proj({"id"});
  auto dag = query.finalize();
  auto root = dag->root();
  auto before = dag->toString();
  Optimizer::optimize(*dag, {}, evaluateConstant);
  ASSERT_NE(dag->root(), root);
  ASSERT_EQ(dag->toString(root), before);
}

TEST_F(OptimizerTest, PassEquivalence) {
  auto scan = builder_->scan("test1");
  auto dim = builder_->scan("dim");
  auto lists = builder_->scan("lists");

  checkPassEquivalence(
      scan.filter(scan["x"] > 15 && scan["s"].isNotNull()).proj({"s", "x"}).sort("x"));

  auto agg = scan.agg({"id"}, {"sum(x)", "mean(y)", "count"});
  checkPassEquivalence(agg.filter(agg["id"] != 2 && agg["len"] > 1).sort("id"));

  auto join = scan.join(dim, {"id"});
  checkPassEquivalence(
      join.filter(join["label"] != "one" || join["x"] < 20).proj({"x", "label"}), false);

  auto left_join = scan.join(dim, {"id"}, JoinType::kLeft);
  checkPassEquivalence(left_join.filter(left_join["label"].isNull()).proj({"id", "x"}));

  auto outer = scan.join(dim, {"id"}, JoinType::kOuter);
  checkPassEquivalence(outer.filter(outer["x"].isNull()).proj({"id", "label"}), false);

  checkPassEquivalence(builder_->concat({scan, scan.filter(scan["id"] == 1)}).head(8));
  checkPassEquivalence(builder_->concat({scan.proj({"id"}), dim.proj({"id"})}).slice(2, 4));

  auto with_cols = scan.withColumns({(scan["x"] * 2 + scan["id"]).rename("z"),
                                     ((scan["x"] * 2 + scan["id"]) / 3).rename("w")});
  checkPassEquivalence(with_cols.filter(with_cols["z"] > 30).proj({"z", "w"}));

  checkPassEquivalence(scan.sort(BuilderSortField("y", true, true)).head(4).tail(2));
  checkPassEquivalence(scan.slice(-4, 3).filter(scan["x"] > 20));

  auto exploded = lists.explode({"l"});
  checkPassEquivalence(exploded.filter(exploded["k"] > 1 && exploded["l"] < 5));

  auto window = scan.proj({scan["id"], scan["x"].sum().over({scan["id"]}).rename("total")});
  checkPassEquivalence(window.filter(window["id"] == 1));

  checkPassEquivalence(scan.distinct({"id"}).filter(scan["id"] > 1).proj({"id", "x"}));
  checkPassEquivalence(scan.proj({"id", "x"}).melt({"id"}).filter(scan["id"] < 3));

  auto cross = scan.crossJoin(dim);
  checkPassEquivalence(
      cross.filter(cross["id"] == cross["id_right"]).proj({"x", "label"}), false);

  checkPassEquivalence(scan.proj({(scan["x"] > 15 && builder_->falseCst()).rename("c"),
                                  (scan["y"].isNull() || builder_->trueCst()).rename("d")}));
  checkPassEquivalence(scan.proj({(builder_->falseCst() && scan["x"] > 15).rename("c")}));
  checkPassEquivalence(scan.filter(scan["x"] > 15 && builder_->falseCst()).proj({"id"}));
  checkPassEquivalence(scan.filter(builder_->trueCst() || scan["x"] > 15).proj({"id"}));
}

int main(int argc, char* argv[]) {
  TestHelpers::init_logger_stderr_only(argc, argv);
  testing::InitGoogleTest(&argc, argv);

  try {
    ConfigBuilder builder;
    builder.parseCommandLineArgs(argc, argv, true);
    config = builder.config();
  } catch (const std::exception& e) {
    LOG(ERROR) << e.what();
    return -1;
  }

  int err{0};
  try {
    err = RUN_ALL_TESTS();
  } catch (const std::exception& e) {
    LOG(ERROR) << e.what();
    return -1;
  }
  return err;
}
