/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "TestHelpers.h"

#include "ArrowStorage/ArrowStorage.h"
#include "ArrowStorage/ArrowUtil.h"
#include "ConfigBuilder/ConfigBuilder.h"
#include "QueryBuilder/QueryBuilder.h"

#include <gtest/gtest.h>

#include <limits>

using namespace lqe;
using namespace lqe::ir;
using namespace TestHelpers;

namespace {

ConfigPtr config;

template <typename BuilderType, typename T>
std::shared_ptr<arrow::Array> makeArray(const std::vector<T>& vals,
                                        const std::vector<bool>& valid = {}) {
  BuilderType builder;
  for (size_t i = 0; i < vals.size(); ++i) {
    if (!valid.empty() && !valid[i]) {
      ARROW_THROW_NOT_OK(builder.AppendNull());
    } else {
      ARROW_THROW_NOT_OK(builder.Append(vals[i]));
    }
  }
  std::shared_ptr<arrow::Array> res;
  ARROW_THROW_NOT_OK(builder.Finish(&res));
  return res;
}

std::shared_ptr<arrow::Table> makeTestTable() {
  auto schema = arrow::schema({arrow::field("id", arrow::int32()),
                               arrow::field("x", arrow::int64()),
                               arrow::field("y", arrow::float64()),
                               arrow::field("s", arrow::utf8())});
  return arrow::Table::Make(
      schema,
      {makeArray<arrow::Int32Builder, int32_t>({1, 2, 1, 3, 2}),
       makeArray<arrow::Int64Builder, int64_t>({10, 20, 30, 40, 50},
                                               {true, true, true, false, true}),
       makeArray<arrow::DoubleBuilder, double>({1.5, 2.5, 3.5, 4.5, 5.5},
                                               {true, false, true, true, true}),
       makeArray<arrow::StringBuilder, std::string>({"a", "b", "", "c", "a"},
                                                    {true, true, false, true, true})});
}

}  // namespace

class ArrowStorageTest : public ::testing::Test {
 protected:
  void SetUp() override {
    schema_mgr_ = std::make_shared<SchemaMgr>();
    storage_ = std::make_unique<ArrowStorage>(schema_mgr_, config);
  }

  SchemaMgrPtr schema_mgr_;
  std::unique_ptr<ArrowStorage> storage_;
};

TEST_F(ArrowStorageTest, ImportTable) {
  auto table = storage_->importArrowTable(makeTestTable(), "test1", 2);
  ASSERT_EQ(table->fragmentCount(), (size_t)3);
  ASSERT_TRUE(schema_mgr_->hasTable("test1"));

  QueryBuilder builder(schema_mgr_, config);
  auto scan = builder.scan("test1");
  ASSERT_EQ(scan.schema().toString(), "{id: INT32, x: INT64, y: FP64, s: TEXT}");
  compare_res_data(scan.collect(),
                   std::vector<int32_t>({1, 2, 1, 3, 2}),
                   std::vector<int64_t>({10, 20, 30, NULL_BIGINT, 50}),
                   std::vector<double>({1.5, NULL_DOUBLE, 3.5, 4.5, 5.5}),
                   std::vector<std::string>({"a", "b", kNullStr, "c", "a"}));
  compare_res_data(scan.agg({"id"}, {"sum(x)"}).sort("id").collect(),
                   std::vector<int32_t>({1, 2, 3}),
                   std::vector<int64_t>({40, 70, 0}));
}

TEST_F(ArrowStorageTest, DuplicateAndDrop) {
  storage_->importArrowTable(makeTestTable(), "test1");
  ASSERT_THROW(storage_->importArrowTable(makeTestTable(), "test1"), InvalidOperationError);
  ASSERT_THROW(storage_->importArrowTable(nullptr, "test2"), InvalidOperationError);
  storage_->dropTable("test1");
  ASSERT_FALSE(schema_mgr_->hasTable("test1"));
  storage_->importArrowTable(makeTestTable(), "test1");
  ASSERT_TRUE(schema_mgr_->hasTable("test1"));
}

TEST_F(ArrowStorageTest, ExportResult) {
  storage_->importArrowTable(makeTestTable(), "test1");
  QueryBuilder builder(schema_mgr_, config);
  auto scan = builder.scan("test1");
  auto res = scan.filter(scan["id"] < 3).proj({"x", "s"}).collect();
  auto at = ArrowStorage::toArrow(res.batch());
  ASSERT_EQ(at->num_rows(), 4);
  ASSERT_EQ(at->num_columns(), 2);
  ASSERT_TRUE(at->schema()->field(0)->type()->Equals(arrow::int64()));
  ASSERT_TRUE(at->schema()->field(1)->type()->Equals(arrow::utf8()));
  ASSERT_EQ(at->column(1)->null_count(), 1);

  // Export followed by import restores the batch.
  compare_batches(res.batch(), storage_->fromArrow(*at));
}

TEST_F(ArrowStorageTest, TypeMapping) {
  auto& ctx = Context::defaultCtx();
  ASSERT_EQ(ArrowStorage::getTargetImportType(ctx, *arrow::uint8()), ctx.int16());
  ASSERT_EQ(ArrowStorage::getTargetImportType(ctx, *arrow::uint32()), ctx.int64());
  ASSERT_EQ(ArrowStorage::getTargetImportType(ctx, *arrow::large_utf8()), ctx.text());
  ASSERT_EQ(ArrowStorage::getTargetImportType(ctx, *arrow::date64()), ctx.date());
  ASSERT_EQ(ArrowStorage::getTargetImportType(ctx, *arrow::list(arrow::int64())),
            ctx.list(ctx.int64()));
  ASSERT_THROW(ArrowStorage::getTargetImportType(ctx, *arrow::decimal128(10, 2)),
               SchemaError);
  ASSERT_THROW(
      ArrowStorage::getTargetImportType(ctx, *arrow::dictionary(arrow::int32(), arrow::int64())),
      SchemaError);
}

TEST_F(ArrowStorageTest, UInt64Overflow) {
  auto schema = arrow::schema({arrow::field("u", arrow::uint64())});
  auto at = arrow::Table::Make(
      schema,
      {makeArray<arrow::UInt64Builder, uint64_t>({1, std::numeric_limits<uint64_t>::max()})});
  ASSERT_THROW(storage_->fromArrow(*at), ComputeError);
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
