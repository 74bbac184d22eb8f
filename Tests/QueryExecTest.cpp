/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "TestHelpers.h"

#include "ConfigBuilder/ConfigBuilder.h"
#include "QueryBuilder/QueryBuilder.h"

#include <gtest/gtest.h>

#include <limits>

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

class QueryExecTest : public ::testing::Test {
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
                "2,50,5.5,a");
    createTable(*schema_mgr,
                "kv",
                {{"k", ctx().int64()}, {"v", ctx().int64()}},
                "1,1\n"
                "2,2\n"
                "1,5\n"
                "2,3");
    createTable(*schema_mgr,
                "lists",
                {{"k", ctx().int64()}, {"l", ctx().list(ctx().int64())}},
                "1,[1;2]\n"
                "2,[]\n"
                "3,\n"
                "4,[3]");
    createTable(*schema_mgr,
                "wide",
                {{"id", ctx().int64()}, {"a", ctx().int64()}, {"b", ctx().fp64()}},
                "1,10,1.5\n"
                "2,20,2.5");
    createTable(*schema_mgr,
                "ticks",
                {{"t", ctx().timestamp()}, {"g", ctx().text()}, {"v", ctx().fp64()}},
                "2021-12-16 00:00:00,a,1.0\n"
                "2021-12-16 00:30:00,a,2.0\n"
                "2021-12-16 01:00:00,b,3.0\n"
                "2021-12-16 01:30:00,b,4.0\n"
                "2021-12-16 02:00:00,b,5.0");
    createTable(*schema_mgr,
                "daily",
                {{"v", ctx().int64()}, {"d", ctx().date()}},
                "1,2023-01-30\n"
                "2,2023-02-01\n"
                "3,2023-02-03");
    createTable(*schema_mgr,
                "monthly",
                {{"d", ctx().date()}, {"v", ctx().int64()}},
                "2023-01-31,1\n"
                "2023-04-30,4");
  }

  static void TearDownTestSuite() { schema_mgr.reset(); }

  void SetUp() override { builder_ = std::make_unique<QueryBuilder>(schema_mgr, config); }

  std::unique_ptr<QueryBuilder> builder_;
};

TEST_F(QueryExecTest, ScanAll) {
  auto res = builder_->scan("test1").collect();
  ASSERT_EQ(res.numRows(), (size_t)5);
  compare_res_data(res,
                   std::vector<int64_t>({1, 2, 1, 3, 2}),
                   std::vector<int64_t>({10, 20, 30, NULL_BIGINT, 50}),
                   std::vector<double>({1.5, NULL_DOUBLE, 3.5, 4.5, 5.5}),
                   std::vector<std::string>({"a", "b", kNullStr, "c", "a"}));
}

TEST_F(QueryExecTest, Filter) {
  auto scan = builder_->scan("test1");
  {
    // Rows with a null predicate are dropped.
    auto res = scan.filter(scan["x"] > 15).proj({"id", "x"}).collect();
    compare_res_data(res,
                     std::vector<int64_t>({2, 1, 2}),
                     std::vector<int64_t>({20, 30, 50}));
  }
  {
    auto res = scan.filter(scan["s"].isNull() || scan["id"] == 3).proj({"id"}).collect();
    compare_res_data(res, std::vector<int64_t>({1, 3}));
  }
  {
    auto res = scan.filter(scan["s"] == "a" && !(scan["y"] < 2.0)).proj({"x"}).collect();
    compare_res_data(res, std::vector<int64_t>({50}));
  }
  {
    auto res = scan.filter(builder_->falseCst()).collect();
    ASSERT_EQ(res.numRows(), (size_t)0);
    ASSERT_EQ(res.schema().size(), (size_t)4);
  }
}

TEST_F(QueryExecTest, Project) {
  auto scan = builder_->scan("test1");
  auto res = scan.proj({(scan["x"] * 2).rename("x2"),
                        (scan["x"] / 4).rename("q"),
                        (scan["x"] + scan["y"]).rename("sum"),
                        scan["s"]})
                 .collect();
  ASSERT_EQ(res.schema().toString(), "{x2: INT64, q: FP64, sum: FP64, s: TEXT}");
  compare_res_data(res,
                   std::vector<int64_t>({20, 40, 60, NULL_BIGINT, 100}),
                   std::vector<double>({2.5, 5, 7.5, NULL_DOUBLE, 12.5}),
                   std::vector<double>({11.5, NULL_DOUBLE, 33.5, NULL_DOUBLE, 55.5}),
                   std::vector<std::string>({"a", "b", kNullStr, "c", "a"}));
}

TEST_F(QueryExecTest, WithColumns) {
  auto scan = builder_->scan("test1");
  auto res = scan.withColumns({(scan["x"] + 1).rename("x"), builder_->cst(7).rename("c")})
                 .collect();
  ASSERT_EQ(res.schema().names(), std::vector<std::string>({"id", "x", "y", "s", "c"}));
  compare_batch_data(res.batch(),
                     std::vector<int64_t>({1, 2, 1, 3, 2}),
                     std::vector<int64_t>({11, 21, 31, NULL_BIGINT, 51}),
                     std::vector<double>({1.5, NULL_DOUBLE, 3.5, 4.5, 5.5}),
                     std::vector<std::string>({"a", "b", kNullStr, "c", "a"}),
                     std::vector<int64_t>({7, 7, 7, 7, 7}));
}

TEST_F(QueryExecTest, GroupBySum) {
  auto res = builder_->scan("kv").agg({"k"}, {"sum(v)"}).collect();
  compare_res_data(res, std::vector<int64_t>({1, 2}), std::vector<int64_t>({6, 5}));
}

TEST_F(QueryExecTest, ColumnNameLists) {
  auto kv = builder_->scan("kv");
  compare_res_data(kv.proj({"v", "k"}).head(2).collect(),
                   std::vector<int64_t>({1, 2}),
                   std::vector<int64_t>({1, 2}));
  compare_res_data(kv.agg({"k"}, {"sum(v)", "max(v)"}).sort("k").collect(),
                   std::vector<int64_t>({1, 2}),
                   std::vector<int64_t>({6, 5}),
                   std::vector<int64_t>({5, 3}));
  compare_res_data(kv.agg({"k"}, {kv["v"].min().rename("min"), builder_->len()})
                       .sort("k")
                       .collect(),
                   std::vector<int64_t>({1, 2}),
                   std::vector<int64_t>({1, 2}),
                   std::vector<int64_t>({2, 2}));
  compare_res_data(kv.agg({}, {"sum(v)", "count"}).collect(),
                   std::vector<int64_t>({11}),
                   std::vector<int64_t>({4}));

  auto wide = builder_->scan("wide");
  compare_res_data(wide.agg({"id", "a"}, {"sum(b)", "count"}).sort("id").collect(),
                   std::vector<int64_t>({1, 2}),
                   std::vector<int64_t>({10, 20}),
                   std::vector<double>({1.5, 2.5}),
                   std::vector<int64_t>({1, 1}));
}

TEST_F(QueryExecTest, GroupByAggregates) {
  auto scan = builder_->scan("test1");
  {
    auto res = scan.agg({"id"}, {"sum(x)", "mean(y)", "count"}).collect();
    ASSERT_EQ(res.schema().toString(), "{id: INT64, x: INT64, y: FP64, len: INT64}");
    compare_res_data(res,
                     std::vector<int64_t>({1, 2, 3}),
                     std::vector<int64_t>({40, 70, 0}),
                     std::vector<double>({2.5, 5.5, 4.5}),
                     std::vector<int64_t>({2, 2, 1}));
  }
  {
    auto res = scan.agg({scan["id"]},
                        {scan["x"].count().rename("cnt"),
                         scan["x"].min().rename("min"),
                         scan["x"].max().rename("max"),
                         scan["s"].first().rename("first"),
                         scan["s"].nUnique().rename("nu")})
                   .collect();
    compare_res_data(res,
                     std::vector<int64_t>({1, 2, 3}),
                     std::vector<int64_t>({2, 2, 0}),
                     std::vector<int64_t>({10, 20, NULL_BIGINT}),
                     std::vector<int64_t>({30, 50, NULL_BIGINT}),
                     std::vector<std::string>({"a", "b", "c"}),
                     std::vector<int64_t>({2, 2, 1}));
  }
  {
    auto res = scan.agg(std::vector<std::string>(),
                        {scan["x"].sum().rename("sum"),
                         scan["y"].median().rename("median"),
                         scan["x"].var().rename("var"),
                         builder_->len()})
                   .collect();
    // var of (10, 20, 30, 50) with ddof=1
    compare_res_data(res,
                     std::vector<int64_t>({110}),
                     std::vector<double>({4.0}),
                     std::vector<double>({291.6666666666667}),
                     std::vector<int64_t>({5}));
  }
}

TEST_F(QueryExecTest, AggregateEmptyInput) {
  auto scan = builder_->scan("test1");
  auto filtered = scan.filter(scan["id"] > 100);
  {
    auto res = filtered.agg({"id"}, {"sum(x)"}).collect();
    ASSERT_EQ(res.numRows(), (size_t)0);
  }
  {
    auto res = filtered.agg(std::vector<std::string>(), {"sum(x)", "mean(y)", "count"})
                   .collect();
    compare_res_data(res,
                     std::vector<int64_t>({0}),
                     std::vector<double>({NULL_DOUBLE}),
                     std::vector<int64_t>({0}));
  }
}

TEST_F(QueryExecTest, Sort) {
  auto scan = builder_->scan("test1");
  {
    auto res = scan.sort(BuilderSortField("x", true)).proj({"id"}).collect();
    compare_res_data(res, std::vector<int64_t>({3, 2, 1, 2, 1}));
  }
  {
    auto res = scan.sort(BuilderSortField("x", "desc", "last")).proj({"id"}).collect();
    compare_res_data(res, std::vector<int64_t>({2, 1, 2, 1, 3}));
  }
  {
    auto res = scan.sort(std::vector<BuilderSortField>{"id", BuilderSortField("x", true)})
                   .proj({"id", "x"})
                   .collect();
    compare_res_data(res,
                     std::vector<int64_t>({1, 1, 2, 2, 3}),
                     std::vector<int64_t>({30, 10, 50, 20, NULL_BIGINT}));
  }
  {
    auto res = scan.sort(BuilderSortField(scan["y"] * -1.0)).proj({"y"}).collect();
    compare_res_data(res, std::vector<double>({NULL_DOUBLE, 5.5, 4.5, 3.5, 1.5}));
  }
  {
    // x + y is null in rows 1 and 3. Descending sorts reverse the null rows.
    auto sum = scan["x"] + scan["y"];
    auto asc = scan.sort(BuilderSortField(sum)).proj({"id", "x"}).collect();
    compare_res_data(asc,
                     std::vector<int64_t>({2, 3, 1, 1, 2}),
                     std::vector<int64_t>({20, NULL_BIGINT, 10, 30, 50}));
    auto desc = scan.sort(BuilderSortField(sum, true)).proj({"id", "x"}).collect();
    compare_res_data(desc,
                     std::vector<int64_t>({3, 2, 2, 1, 1}),
                     std::vector<int64_t>({NULL_BIGINT, 20, 50, 30, 10}));
    auto desc_last = scan.sort(BuilderSortField(sum, true, true)).proj({"id", "x"}).collect();
    compare_res_data(desc_last,
                     std::vector<int64_t>({2, 1, 1, 3, 2}),
                     std::vector<int64_t>({50, 30, 10, NULL_BIGINT, 20}));
    auto top = scan.sort(BuilderSortField(sum, true)).head(1).proj({"id"}).collect();
    compare_res_data(top, std::vector<int64_t>({3}));
  }
  ASSERT_THROW(scan.sort(std::vector<BuilderSortField>()), InvalidOperationError);
  ASSERT_THROW(BuilderSortField("x", "up"), InvalidOperationError);
}

TEST_F(QueryExecTest, Slice) {
  auto scan = builder_->scan("test1");
  compare_res_data(scan.head(2).proj({"x"}).collect(), std::vector<int64_t>({10, 20}));
  compare_res_data(scan.slice(1, 2).proj({"x"}).collect(), std::vector<int64_t>({20, 30}));
  compare_res_data(scan.tail(2).proj({"x"}).collect(),
                   std::vector<int64_t>({NULL_BIGINT, 50}));
  compare_res_data(scan.slice(-3, 2).proj({"x"}).collect(),
                   std::vector<int64_t>({30, NULL_BIGINT}));
  ASSERT_EQ(scan.slice(10, 5).collect().numRows(), (size_t)0);
  ASSERT_EQ(scan.slice(-10, 2).collect().numRows(), (size_t)0);
  // The length counts from the start before it is clamped to the input.
  compare_res_data(scan.slice(-10, 7).proj({"x"}).collect(), std::vector<int64_t>({10, 20}));
  compare_res_data(scan.slice(-2, std::numeric_limits<size_t>::max()).proj({"x"}).collect(),
                   std::vector<int64_t>({NULL_BIGINT, 50}));
  compare_res_data(scan.slice(3, std::numeric_limits<size_t>::max()).proj({"x"}).collect(),
                   std::vector<int64_t>({NULL_BIGINT, 50}));
  compare_res_data(
      scan.sort(BuilderSortField("x", true, true)).head(2).proj({"x"}).collect(),
      std::vector<int64_t>({50, 30}));
}

TEST_F(QueryExecTest, Upsample) {
  auto ts = [](const std::string& str) { return *parseTimestamp(str); };
  auto day = [](const std::string& str) { return *parseDate(str); };
  {
    auto res = builder_->scan("ticks").upsample({"g"}, "t", "15m").collect();
    ASSERT_EQ(res.schema().names(), std::vector<std::string>({"t", "g", "v"}));
    compare_res_data(res,
                     std::vector<int64_t>({ts("2021-12-16 00:00:00"),
                                           ts("2021-12-16 00:15:00"),
                                           ts("2021-12-16 00:30:00"),
                                           ts("2021-12-16 01:00:00"),
                                           ts("2021-12-16 01:15:00"),
                                           ts("2021-12-16 01:30:00"),
                                           ts("2021-12-16 01:45:00"),
                                           ts("2021-12-16 02:00:00")}),
                     std::vector<std::string>({"a", "a", "a", "b", "b", "b", "b", "b"}),
                     std::vector<double>(
                         {1.0, NULL_DOUBLE, 2.0, 3.0, NULL_DOUBLE, 4.0, NULL_DOUBLE, 5.0}));
  }
  auto daily = builder_->scan("daily");
  {
    // The time column goes first.
    auto res = daily.upsample({}, "d", "1d").collect();
    ASSERT_EQ(res.schema().toString(), "{d: DATE, v: INT64}");
    compare_res_data(res,
                     std::vector<int64_t>({day("2023-01-30"),
                                           day("2023-01-31"),
                                           day("2023-02-01"),
                                           day("2023-02-02"),
                                           day("2023-02-03")}),
                     std::vector<int64_t>({1, NULL_BIGINT, 2, NULL_BIGINT, 3}));
  }
  {
    auto res = daily.upsample({}, "d", "1d", "1d").proj({"v"}).collect();
    compare_res_data(res, std::vector<int64_t>({NULL_BIGINT, 2, NULL_BIGINT, 3}));
  }
  {
    // Month steps keep the day of month clamped to the month length.
    auto res = builder_->scan("monthly").upsample({}, "d", "1mo").collect();
    compare_res_data(res,
                     std::vector<int64_t>({day("2023-01-31"),
                                           day("2023-02-28"),
                                           day("2023-03-31"),
                                           day("2023-04-30")}),
                     std::vector<int64_t>({1, NULL_BIGINT, NULL_BIGINT, 4}));
  }
  {
    ExecutionOptions opts;
    opts.streaming = true;
    auto query = daily.filter(daily["v"] > 1).upsample({}, "d", "1d");
    compare_batches(query.collect().batch(), query.collect(opts).batch());
  }

  ASSERT_THROW(daily.sort(BuilderSortField("d", true)).upsample({}, "d", "1d").collect(),
               ComputeError);
  ASSERT_THROW(daily.filter(builder_->falseCst()).upsample({}, "d", "1d").collect(),
               ComputeError);
  ASSERT_THROW(daily.upsample({}, "v", "1d"), SchemaError);
  ASSERT_THROW(daily.upsample({"missing"}, "d", "1d"), SchemaError);
  ASSERT_THROW(daily.upsample({"d"}, "d", "1d"), InvalidOperationError);
  ASSERT_THROW(daily.upsample({}, "d", "0d"), InvalidOperationError);
  ASSERT_THROW(daily.upsample({}, "d", "-1d"), InvalidOperationError);
  ASSERT_THROW(daily.upsample({}, "d", "1 fortnight"), InvalidOperationError);
}

TEST_F(QueryExecTest, WindowExpressions) {
  auto scan = builder_->scan("test1");
  {
    auto res =
        scan.proj({scan["id"], scan["x"].sum().over({scan["id"]}).rename("total")})
            .collect();
    compare_res_data(res,
                     std::vector<int64_t>({1, 2, 1, 3, 2}),
                     std::vector<int64_t>({40, 70, 40, 0, 70}));
  }
  {
    auto res = scan.proj({scan["x"].call("cum_sum")}).collect();
    compare_res_data(res, std::vector<int64_t>({10, 30, 60, NULL_BIGINT, 110}));
  }
  {
    auto res = scan.proj({scan["x"]
                              .call("cum_sum")
                              .over({scan["id"]}, {scan["x"]})
                              .rename("running")})
                   .collect();
    compare_res_data(res, std::vector<int64_t>({10, 20, 40, NULL_BIGINT, 70}));
  }
  {
    auto res = scan.proj({scan["x"].call("shift").rename("prev"),
                          scan["x"].call("diff").rename("diff"),
                          scan["y"].call("rank").rename("rank")})
                   .collect();
    compare_res_data(res,
                     std::vector<int64_t>({NULL_BIGINT, 10, 20, 30, NULL_BIGINT}),
                     std::vector<int64_t>({NULL_BIGINT, 10, 10, NULL_BIGINT, NULL_BIGINT}),
                     std::vector<int64_t>({1, NULL_BIGINT, 2, 3, 4}));
  }
  auto window = scan["x"].sum().over({scan["id"]});
  ASSERT_THROW(window.over({scan["id"]}), InvalidOperationError);
}

TEST_F(QueryExecTest, Functions) {
  auto scan = builder_->scan("test1");
  auto res = scan.proj({scan["s"].call("upper"),
                        scan["s"].call("str_len").rename("len"),
                        builder_
                            ->ifThenElse(scan["x"] > 15,
                                         builder_->cst("big"),
                                         builder_->cst("small"))
                            .rename("size"),
                        builder_->coalesce({scan["y"], builder_->cst(0.0)}).rename("y0"),
                        scan["id"].isIn({builder_->cst(1), builder_->cst(3)}).rename("in"),
                        builder_->concatStr({scan["s"], builder_->cst("!")}).rename("cat")})
                 .collect();
  compare_res_data(res,
                   std::vector<std::string>({"A", "B", kNullStr, "C", "A"}),
                   std::vector<int64_t>({1, 1, NULL_BIGINT, 1, 1}),
                   std::vector<std::string>({"small", "big", "big", "small", "big"}),
                   std::vector<double>({1.5, 0, 3.5, 4.5, 5.5}),
                   std::vector<int8_t>({1, 0, 1, 1, 0}),
                   std::vector<std::string>({"a!", "b!", kNullStr, "c!", "a!"}));
  ASSERT_THROW(builder_->func("no_such_function", {scan["x"]}), SchemaError);
  ASSERT_THROW(builder_->func("abs", {}), SchemaError);
}

TEST_F(QueryExecTest, DateFunctions) {
  auto scan = builder_->scan("test1");
  auto res = scan.head(1)
                 .proj({builder_->date("2023-03-15").call("year").rename("year"),
                        builder_->date("2023-03-15").call("month").rename("month"),
                        builder_->timestamp("2020-02-29 10:00:00").call("day").rename("day"),
                        scan["id"]})
                 .collect();
  compare_res_data(res,
                   std::vector<int32_t>({2023}),
                   std::vector<int32_t>({3}),
                   std::vector<int32_t>({29}),
                   std::vector<int64_t>({1}));
  ASSERT_THROW(builder_->date("2023-13-01"), InvalidOperationError);
}

TEST_F(QueryExecTest, Casts) {
  auto scan = builder_->scan("test1");
  {
    auto res = scan.proj({scan["y"].cast("int32"), scan["id"].cast("text")}).collect();
    compare_res_data(res,
                     std::vector<int32_t>({1, inline_null_value<int32_t>(), 3, 4, 5}),
                     std::vector<std::string>({"1", "2", "1", "3", "2"}));
  }
  {
    auto res = scan.proj({scan["s"].cast("int64", false)}).collect();
    compare_res_data(
        res,
        std::vector<int64_t>({NULL_BIGINT, NULL_BIGINT, NULL_BIGINT, NULL_BIGINT, NULL_BIGINT}));
  }
  ASSERT_THROW(scan.proj({scan["s"].cast("int64")}).collect(), ComputeError);
  ASSERT_THROW(scan["s"].cast(ctx().list(ctx().int8())), SchemaError);
}

TEST_F(QueryExecTest, Explode) {
  auto res = builder_->scan("lists").explode({"l"}).collect();
  ASSERT_EQ(res.schema().toString(), "{k: INT64, l: INT64}");
  compare_res_data(res,
                   std::vector<int64_t>({1, 1, 2, 3, 4}),
                   std::vector<int64_t>({1, 2, NULL_BIGINT, NULL_BIGINT, 3}));
  ASSERT_THROW(builder_->scan("lists").explode({"k"}), SchemaError);
}

TEST_F(QueryExecTest, Melt) {
  auto scan = builder_->scan("wide");
  {
    auto res = scan.melt({"id"}).collect();
    ASSERT_EQ(res.schema().toString(), "{id: INT64, variable: TEXT, value: FP64}");
    compare_res_data(res,
                     std::vector<int64_t>({1, 2, 1, 2}),
                     std::vector<std::string>({"a", "a", "b", "b"}),
                     std::vector<double>({10, 20, 1.5, 2.5}));
  }
  {
    auto res = scan.melt({"id"}, {"a"}, "var", "val").collect();
    ASSERT_EQ(res.schema().toString(), "{id: INT64, var: TEXT, val: INT64}");
    compare_res_data(res,
                     std::vector<int64_t>({1, 2}),
                     std::vector<std::string>({"a", "a"}),
                     std::vector<int64_t>({10, 20}));
  }
}

TEST_F(QueryExecTest, Distinct) {
  auto scan = builder_->scan("test1");
  compare_res_data(scan.distinct({"id"}).proj({"x"}).collect(),
                   std::vector<int64_t>({10, 20, NULL_BIGINT}));
  compare_res_data(scan.distinct({"id"}, UniqueKeep::kLast).proj({"x"}).collect(),
                   std::vector<int64_t>({30, NULL_BIGINT, 50}));
  compare_res_data(scan.distinct({"id"}, UniqueKeep::kNone).proj({"id"}).collect(),
                   std::vector<int64_t>({3}));
  compare_res_data(scan.proj({"s"}).distinct().collect(),
                   std::vector<std::string>({"a", "b", kNullStr, "c"}));
  ASSERT_THROW(scan.distinct({"missing"}), SchemaError);
}

TEST_F(QueryExecTest, Concat) {
  auto scan = builder_->scan("test1");
  auto res = builder_->concat({scan, scan.filter(scan["id"] == 3)}).proj({"id"}).collect();
  compare_res_data(res, std::vector<int64_t>({1, 2, 1, 3, 2, 3}));
  ASSERT_THROW(builder_->concat({scan, builder_->scan("kv")}), SchemaError);
  ASSERT_THROW(builder_->concat({}), InvalidOperationError);
}

TEST_F(QueryExecTest, SchemaErrors) {
  auto scan = builder_->scan("test1");
  ASSERT_THROW(builder_->scan("missing"), SchemaError);
  ASSERT_THROW(scan["missing"], SchemaError);
  ASSERT_THROW(scan.filter(scan["x"]), SchemaError);
  ASSERT_THROW(scan["x"] + scan["s"], SchemaError);
  ASSERT_THROW(scan.proj({scan["x"], scan["x"]}), SchemaError);
  ASSERT_THROW(scan.agg({"id"}, {scan["x"]}), SchemaError);
  ASSERT_THROW(scan.agg({"id"}, {"foo(x)"}), InvalidOperationError);
  ASSERT_THROW(scan.agg({"id"}, {"sum x"}), InvalidOperationError);
}

TEST_F(QueryExecTest, ComputeErrors) {
  auto scan = builder_->scan("test1");
  try {
    scan.proj({scan["x"] % 0}).collect();
    FAIL() << "Expected ComputeError";
  } catch (const ComputeError& e) {
    ASSERT_NE(std::string(e.what()).find("division by zero"), std::string::npos);
  }
  ASSERT_THROW(scan.proj({scan["x"].floorDiv(scan["id"] - 1)}).collect(), ComputeError);
  // Floating point division by zero is not an error.
  auto res = scan.head(1).proj({(scan["y"] / 0.0).rename("inf")}).collect();
  ASSERT_TRUE(std::isinf(res.batch().column(0)->numAt(0)));
}

TEST_F(QueryExecTest, ExplainAndResultInfo) {
  auto scan = builder_->scan("test1");
  auto query = scan.filter(scan["x"] > 15).proj({"id"});
  auto res = query.collect();
  ASSERT_NE(res.logicalPlan().find("Scan"), std::string::npos);
  ASSERT_FALSE(res.physicalPlan().empty());
  ASSERT_GE(res.executionTimeMs(), 0);
  auto plan = query.explain();
  ASSERT_NE(plan.find("Logical plan:"), std::string::npos);
  ASSERT_NE(plan.find("Physical plan:"), std::string::npos);
}

TEST_F(QueryExecTest, SequentialExecution) {
  auto scan = builder_->scan("test1");
  auto query = scan.agg({"id"}, {"sum(x)"}).sort("id");
  ExecutionOptions opts;
  opts.parallel = false;
  compare_batches(query.collect().batch(), query.collect(opts).batch());
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
