/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "TestHelpers.h"

#include "ConfigBuilder/ConfigBuilder.h"
#include "QueryEngine/ExecutionOptions.h"

#include <boost/program_options.hpp>

#include <gtest/gtest.h>

using namespace lqe;

TEST(ConfigBuilder, Defaults) {
  ConfigBuilder builder;
  ASSERT_FALSE(builder.parseCommandLineArgs("test", ""));
  auto config = builder.config();
  ASSERT_FALSE(config->exec.watchdog.enable);
  ASSERT_FALSE(config->exec.streaming.enable);
  ASSERT_EQ(config->exec.streaming.morsel_size, (size_t)65'536);
  ASSERT_TRUE(config->exec.parallel);
  ASSERT_TRUE(config->opts.predicate_pushdown);
  ASSERT_TRUE(config->opts.projection_pushdown);
  ASSERT_TRUE(config->opts.cse);
  ASSERT_EQ(config->storage.default_fragment_size, (size_t)1'000'000);
  ASSERT_FALSE(config->debug.log_plans);
}

TEST(ConfigBuilder, ParseOptions) {
  ConfigBuilder builder;
  ASSERT_FALSE(builder.parseCommandLineArgs(
      "test",
      "--enable-watchdog --watchdog-max-groups 10 --enable-streaming=1 "
      "--morsel-size 128 --enable-parallel=0 --num-threads 4 --sub-task-size 64 "
      "--hash-partitions 8 --enable-predicate-pushdown=0 --enable-cse=false "
      "--default-fragment-size 1000 --log-plans"));
  auto config = builder.config();
  ASSERT_TRUE(config->exec.watchdog.enable);
  ASSERT_EQ(config->exec.watchdog.max_groups, (size_t)10);
  ASSERT_TRUE(config->exec.streaming.enable);
  ASSERT_EQ(config->exec.streaming.morsel_size, (size_t)128);
  ASSERT_FALSE(config->exec.parallel);
  ASSERT_EQ(config->exec.num_threads, 4u);
  ASSERT_EQ(config->exec.sub_task_size, (size_t)64);
  ASSERT_EQ(config->exec.hash_partitions, (size_t)8);
  ASSERT_FALSE(config->opts.predicate_pushdown);
  ASSERT_FALSE(config->opts.cse);
  ASSERT_TRUE(config->opts.slice_pushdown);
  ASSERT_EQ(config->storage.default_fragment_size, (size_t)1000);
  ASSERT_TRUE(config->debug.log_plans);
}

TEST(ConfigBuilder, InvalidOptions) {
  {
    ConfigBuilder builder;
    ASSERT_THROW(builder.parseCommandLineArgs("test", "--morsel-size 0"),
                 boost::program_options::error);
  }
  {
    ConfigBuilder builder;
    ASSERT_THROW(builder.parseCommandLineArgs("test", "--no-such-option 1"),
                 boost::program_options::error);
  }
}

TEST(ConfigBuilder, ExistingConfig) {
  auto config = std::make_shared<Config>();
  config->exec.hash_partitions = 3;
  ConfigBuilder builder(config);
  builder.parseCommandLineArgs("test", "--enable-join-reorder=0");
  ASSERT_EQ(builder.config(), config);
  ASSERT_EQ(config->exec.hash_partitions, (size_t)3);
  ASSERT_FALSE(config->opts.join_reorder);
}

TEST(ConfigBuilder, ExecutionOptions) {
  Config config;
  config.exec.streaming.enable = true;
  config.exec.parallel = false;
  config.opts.slice_pushdown = false;
  auto opts = ExecutionOptions::fromConfig(config);
  ASSERT_TRUE(opts.streaming);
  ASSERT_FALSE(opts.parallel);
  ASSERT_FALSE(opts.slice_pushdown);
  ASSERT_TRUE(opts.predicate_pushdown);
  ASSERT_FALSE(opts.optimizerOptions().slice_pushdown);
  ASSERT_TRUE(opts.optimizerOptions().cse);

  config.exec.streaming.morsel_size = 10;
  auto ctx = ExecutionContext::make(config, opts);
  ASSERT_EQ(ctx.morsel_size, (size_t)10);
  ASSERT_FALSE(ctx.parallel);
  ASSERT_FALSE(ctx.isCancelled());
}

int main(int argc, char* argv[]) {
  TestHelpers::init_logger_stderr_only(argc, argv);
  testing::InitGoogleTest(&argc, argv);

  int err{0};
  try {
    err = RUN_ALL_TESTS();
  } catch (const std::exception& e) {
    LOG(ERROR) << e.what();
    return -1;
  }
  return err;
}
