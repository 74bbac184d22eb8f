/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ArrowStorage/ArrowStorage.h"
#include "ArrowStorage/ArrowUtil.h"
#include "ConfigBuilder/ConfigBuilder.h"
#include "Logger/Logger.h"
#include "QueryBuilder/QueryBuilder.h"

#include <arrow/api.h>

#include <iostream>

using namespace lqe;

namespace {

std::shared_ptr<arrow::Table> makeSalesTable() {
  auto schema = arrow::schema({arrow::field("store", arrow::int32()),
                               arrow::field("item", arrow::utf8()),
                               arrow::field("amount", arrow::float64())});

  std::shared_ptr<arrow::Array> store_array;
  arrow::Int32Builder store_builder;
  ARROW_THROW_NOT_OK(store_builder.AppendValues({1, 1, 2, 2, 2, 3, 3, 1, 2, 3}));
  ARROW_THROW_NOT_OK(store_builder.Finish(&store_array));

  std::shared_ptr<arrow::Array> item_array;
  arrow::StringBuilder item_builder;
  ARROW_THROW_NOT_OK(item_builder.AppendValues(
      {"apple", "pear", "apple", "plum", "pear", "apple", "plum", "plum", "apple", "pear"}));
  ARROW_THROW_NOT_OK(item_builder.Finish(&item_array));

  std::shared_ptr<arrow::Array> amount_array;
  arrow::DoubleBuilder amount_builder;
  ARROW_THROW_NOT_OK(amount_builder.AppendValues(
      {1.5, 2.0, 3.25, 0.75, 4.0, 2.5, 1.25, 3.0, 0.5, 6.0}));
  ARROW_THROW_NOT_OK(amount_builder.Finish(&amount_array));

  return arrow::Table::Make(schema, {store_array, item_array, amount_array});
}

std::shared_ptr<arrow::Table> makeStoresTable() {
  auto schema = arrow::schema(
      {arrow::field("store", arrow::int32()), arrow::field("city", arrow::utf8())});

  std::shared_ptr<arrow::Array> store_array;
  arrow::Int32Builder store_builder;
  ARROW_THROW_NOT_OK(store_builder.AppendValues({1, 2, 4}));
  ARROW_THROW_NOT_OK(store_builder.Finish(&store_array));

  std::shared_ptr<arrow::Array> city_array;
  arrow::StringBuilder city_builder;
  ARROW_THROW_NOT_OK(city_builder.AppendValues({"Lyon", "Oslo", "Riga"}));
  ARROW_THROW_NOT_OK(city_builder.Finish(&city_array));

  return arrow::Table::Make(schema, {store_array, city_array});
}

}  // namespace

int main(int argc, char* argv[]) {
  logger::LogOptions log_options(argv[0]);
  log_options.max_files_ = 0;
  log_options.parse_command_line(argc, argv);
  logger::init(log_options);

  ConfigBuilder config_builder;
  try {
    if (config_builder.parseCommandLineArgs(argc, argv)) {
      return 0;
    }
  } catch (const std::exception& e) {
    std::cerr << "Cannot parse command line: " << e.what() << std::endl;
    return 1;
  }
  auto config = config_builder.config();

  try {
    auto schema_mgr = std::make_shared<SchemaMgr>();
    ArrowStorage storage(schema_mgr, config);
    storage.importArrowTable(makeSalesTable(), "sales", 4);
    storage.importArrowTable(makeStoresTable(), "stores");

    QueryBuilder builder(schema_mgr, config);
    auto sales = builder.scan("sales");
    auto stores = builder.scan("stores");

    auto query = sales.filter(sales["amount"] > 1.0)
                     .join(stores, {"store"}, ir::JoinType::kLeft)
                     .agg({"store", "city"}, {"sum(amount)", "count"})
                     .sort("store");

    std::cout << query.explain() << std::endl;

    auto res = query.collect();
    std::cout << res.batch().toString() << std::endl;
    std::cout << "Executed in " << res.executionTimeMs() << "ms" << std::endl;

    auto stream = sales.withColumns({(sales["amount"] * 2).rename("double_amount")})
                      .head(5)
                      .collectStreaming();
    while (auto batch = stream->next()) {
      std::cout << batch->toString() << std::endl;
    }
  } catch (const std::exception& e) {
    LOG(ERROR) << e.what();
    return 1;
  }

  logger::shutdown();
  return 0;
}
