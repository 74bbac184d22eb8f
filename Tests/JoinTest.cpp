/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "TestHelpers.h"

#include "ConfigBuilder/ConfigBuilder.h"
#include "QueryBuilder/QueryBuilder.h"

#include <gtest/gtest.h>

using namespace lqe;
using namespace lqe::ir;
using namespace TestHelpers;

namespace {

ConfigPtr config;
SchemaMgrPtr schema_mgr;

Context& ctx() {
  return Context::defaultCtx();
}

}  // namespace

class JoinTest : public ::testing::Test {
 protected:
  static void SetUpTestSuite() {
    schema_mgr = std::make_shared<SchemaMgr>();
    createTable(*schema_mgr,
                "left",
                {{"id", ctx().int64()}, {"name", ctx().text()}},
                "1,a\n"
                "2,b");
    createTable(*schema_mgr,
                "right",
                {{"id", ctx().int64()}, {"val", ctx().int64()}},
                "1,10\n"
                "3,30");
    createTable(*schema_mgr,
                "right_dup",
                {{"id", ctx().int32()}, {"name", ctx().text()}},
                "1,x\n"
                "1,y\n"
                "2,z");
    createTable(*schema_mgr,
                "null_keys_l",
                {{"k", ctx().int64()}, {"a", ctx().int64()}},
                "1,1\n"
                ",2\n"
                "2,3");
    createTable(*schema_mgr,
                "null_keys_r",
                {{"k", ctx().int64()}, {"b", ctx().int64()}},
                ",10\n"
                "2,20");
    createTable(*schema_mgr,
                "trades",
                {{"t", ctx().int64()}, {"sym", ctx().text()}},
                "1,a\n"
                "5,b\n"
                "10,a");
    createTable(*schema_mgr,
                "quotes",
                {{"t", ctx().int64()}, {"sym", ctx().text()}, {"price", ctx().fp64()}},
                "0,a,1.0\n"
                "4,a,2.0\n"
                "4,b,2.5\n"
                "6,a,3.0");
    createTable(*schema_mgr,
                "unsorted",
                {{"t", ctx().int64()}, {"price", ctx().fp64()}},
                "5,1.0\n"
                "1,2.0");
  }

  static void TearDownTestSuite() { schema_mgr.reset(); }

  void SetUp() override { builder_ = std::make_unique<QueryBuilder>(schema_mgr, config); }

  std::unique_ptr<QueryBuilder> builder_;
};

TEST_F(JoinTest, Inner) {
  auto res = builder_->scan("left").join(builder_->scan("right"), {"id"}).collect();
  ASSERT_EQ(res.schema().toString(), "{id: INT64, name: TEXT, val: INT64}");
  compare_res_data(res,
                   std::vector<int64_t>({1}),
                   std::vector<std::string>({"a"}),
                   std::vector<int64_t>({10}));
}

TEST_F(JoinTest, Left) {
  auto res = builder_->scan("left")
                 .join(builder_->scan("right"), {"id"}, {"id"}, "left")
                 .collect();
  compare_res_data(res,
                   std::vector<int64_t>({1, 2}),
                   std::vector<std::string>({"a", "b"}),
                   std::vector<int64_t>({10, NULL_BIGINT}));
}

TEST_F(JoinTest, Outer) {
  auto res = builder_->scan("left")
                 .join(builder_->scan("right"), {"id"}, JoinType::kOuter)
                 .sort("id")
                 .collect();
  ASSERT_EQ(res.schema().toString(), "{id: INT64, name: TEXT, val: INT64}");
  compare_res_data(res,
                   std::vector<int64_t>({1, 2, 3}),
                   std::vector<std::string>({"a", "b", kNullStr}),
                   std::vector<int64_t>({10, NULL_BIGINT, 30}));
}

TEST_F(JoinTest, SemiAnti) {
  auto left = builder_->scan("left");
  auto right = builder_->scan("right");
  {
    auto res = left.join(right, {"id"}, JoinType::kSemi).collect();
    ASSERT_EQ(res.schema().toString(), "{id: INT64, name: TEXT}");
    compare_res_data(res, std::vector<int64_t>({1}), std::vector<std::string>({"a"}));
  }
  {
    auto res = left.join(right, {"id"}, JoinType::kAnti).collect();
    compare_res_data(res, std::vector<int64_t>({2}), std::vector<std::string>({"b"}));
  }
}

TEST_F(JoinTest, Cross) {
  auto res = builder_->scan("left").crossJoin(builder_->scan("right")).collect();
  ASSERT_EQ(res.schema().toString(),
            "{id: INT64, name: TEXT, id_right: INT64, val: INT64}");
  compare_res_data(res,
                   std::vector<int64_t>({1, 1, 2, 2}),
                   std::vector<std::string>({"a", "a", "b", "b"}),
                   std::vector<int64_t>({1, 3, 1, 3}),
                   std::vector<int64_t>({10, 30, 10, 30}));
}

TEST_F(JoinTest, DuplicateMatchesAndSuffix) {
  // Keys of different integer types are joined by value.
  auto res = builder_->scan("left")
                 .join(builder_->scan("right_dup"), {"id"})
                 .sort(std::vector<BuilderSortField>{"id", "name_right"})
                 .collect();
  ASSERT_EQ(res.schema().toString(), "{id: INT64, name: TEXT, name_right: TEXT}");
  compare_res_data(res,
                   std::vector<int64_t>({1, 1, 2}),
                   std::vector<std::string>({"a", "a", "b"}),
                   std::vector<std::string>({"x", "y", "z"}));

  JoinOptions options;
  options.suffix = "_r";
  options.coalesce = false;
  auto left = builder_->scan("left");
  auto right = builder_->scan("right_dup");
  auto res2 = left.join(right, {left["id"]}, {right["id"]}, options)
                  .sort(std::vector<BuilderSortField>{"id", "name_r"})
                  .collect();
  ASSERT_EQ(res2.schema().toString(), "{id: INT64, name: TEXT, id_r: INT32, name_r: TEXT}");
  ASSERT_EQ(res2.numRows(), (size_t)3);
}

TEST_F(JoinTest, NullKeysNeverMatch) {
  auto left = builder_->scan("null_keys_l");
  auto right = builder_->scan("null_keys_r");
  compare_res_data(left.join(right, {"k"}).collect(),
                   std::vector<int64_t>({2}),
                   std::vector<int64_t>({3}),
                   std::vector<int64_t>({20}));
  compare_res_data(left.join(right, {"k"}, JoinType::kLeft).collect(),
                   std::vector<int64_t>({1, NULL_BIGINT, 2}),
                   std::vector<int64_t>({1, 2, 3}),
                   std::vector<int64_t>({NULL_BIGINT, NULL_BIGINT, 20}));
  compare_res_data(left.join(right, {"k"}, JoinType::kAnti).collect(),
                   std::vector<int64_t>({1, NULL_BIGINT}),
                   std::vector<int64_t>({1, 2}));
  auto outer = left.join(right, {"k"}, JoinType::kOuter).collect();
  ASSERT_EQ(outer.numRows(), (size_t)4);
}

TEST_F(JoinTest, ExpressionKeys) {
  auto left = builder_->scan("left");
  auto right = builder_->scan("right");
  JoinOptions options;
  auto res = left.join(right, {left["id"] + 1}, {right["id"]}, options).collect();
  ASSERT_EQ(res.schema().toString(), "{id: INT64, name: TEXT, val: INT64}");
  compare_res_data(res,
                   std::vector<int64_t>({2}),
                   std::vector<std::string>({"b"}),
                   std::vector<int64_t>({30}));
}

TEST_F(JoinTest, AsOf) {
  auto trades = builder_->scan("trades");
  auto a_quotes = builder_->scan("quotes");
  a_quotes = a_quotes.filter(a_quotes["sym"] == "a").proj({"t", "price"});
  {
    auto res = trades.joinAsOf(a_quotes, "t", "t").collect();
    ASSERT_EQ(res.schema().toString(), "{t: INT64, sym: TEXT, price: FP64}");
    compare_res_data(res,
                     std::vector<int64_t>({1, 5, 10}),
                     std::vector<std::string>({"a", "b", "a"}),
                     std::vector<double>({1.0, 2.0, 3.0}));
  }
  {
    AsOfOptions options;
    options.strategy = AsOfStrategy::kForward;
    auto res = trades.joinAsOf(a_quotes, "t", "t", options).proj({"price"}).collect();
    compare_res_data(res, std::vector<double>({2.0, 3.0, NULL_DOUBLE}));
  }
  {
    // Ties go to the preceding row.
    AsOfOptions options;
    options.strategy = AsOfStrategy::kNearest;
    auto res = trades.joinAsOf(a_quotes, "t", "t", options).proj({"price"}).collect();
    compare_res_data(res, std::vector<double>({1.0, 2.0, 3.0}));
  }
  {
    AsOfOptions options;
    options.tolerance = 2;
    auto res = trades.joinAsOf(a_quotes, "t", "t", options).proj({"price"}).collect();
    compare_res_data(res, std::vector<double>({1.0, 2.0, NULL_DOUBLE}));
  }
  {
    AsOfOptions options;
    options.left_by = {"sym"};
    options.right_by = {"sym"};
    auto res = trades.joinAsOf(builder_->scan("quotes"), "t", "t", options).collect();
    ASSERT_EQ(res.schema().toString(), "{t: INT64, sym: TEXT, price: FP64}");
    compare_res_data(res,
                     std::vector<int64_t>({1, 5, 10}),
                     std::vector<std::string>({"a", "b", "a"}),
                     std::vector<double>({1.0, 2.5, 3.0}));
  }
  ASSERT_THROW(trades.joinAsOf(builder_->scan("unsorted"), "t", "t").collect(), ComputeError);
  ASSERT_THROW(trades.joinAsOf(a_quotes, "sym", "t"), SchemaError);
  {
    AsOfOptions options;
    options.tolerance = -1;
    ASSERT_THROW(trades.joinAsOf(a_quotes, "t", "t", options), InvalidOperationError);
  }
}

TEST_F(JoinTest, Errors) {
  auto left = builder_->scan("left");
  auto right = builder_->scan("right");
  ASSERT_THROW(left.join(right, {"id", "name"}, {"id"}), InvalidOperationError);
  ASSERT_THROW(left.join(right, {"name"}, {"id"}), SchemaError);
  ASSERT_THROW(left.join(right, {"missing"}), SchemaError);
  ASSERT_THROW(left.join(right, {}, {}, JoinType::kInner), InvalidOperationError);
  ASSERT_THROW(left.join(right, {"id"}, {"id"}, "sideways"), InvalidOperationError);
  JoinOptions options;
  options.type = JoinType::kCross;
  ASSERT_THROW(left.join(right, {left["id"]}, {right["id"]}, options),
               InvalidOperationError);
}

TEST_F(JoinTest, Watchdog) {
  auto wd_config = std::make_shared<Config>(*config);
  wd_config->exec.watchdog.enable = true;
  wd_config->exec.watchdog.max_join_rows = 3;
  wd_config->exec.watchdog.max_groups = 1;
  QueryBuilder builder(schema_mgr, wd_config);
  auto left = builder.scan("left");
  ASSERT_THROW(left.crossJoin(builder.scan("right")).collect(), ResourceExhaustedError);
  ASSERT_THROW(left.agg({"id"}, {"count"}).collect(), ResourceExhaustedError);
  ASSERT_EQ(left.join(builder.scan("right"), {"id"}).collect().numRows(), (size_t)1);
}

TEST_F(JoinTest, PartitionedBuild) {
  auto part_config = std::make_shared<Config>(*config);
  part_config->exec.hash_partitions = 7;
  part_config->exec.sub_task_size = 1;
  QueryBuilder builder(schema_mgr, part_config);
  auto res = builder.scan("null_keys_l")
                 .join(builder.scan("null_keys_r"), {"k"}, JoinType::kLeft)
                 .collect();
  compare_batches(builder_->scan("null_keys_l")
                      .join(builder_->scan("null_keys_r"), {"k"}, JoinType::kLeft)
                      .collect()
                      .batch(),
                  res.batch());
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
