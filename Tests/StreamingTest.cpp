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
#include <sstream>

using namespace lqe;
using namespace lqe::ir;
using namespace TestHelpers;

namespace {

ConfigPtr config;
SchemaMgrPtr schema_mgr;

Context& ctx() {
  return Context::defaultCtx();
}

ExecutionOptions streamingOpts() {
  ExecutionOptions opts;
  opts.streaming = true;
  return opts;
}

// Memory table that cancels a query when the given fragment is fetched.
class CancellingTable : public MemoryTable {
 public:
  CancellingTable(const MemoryTable& table, size_t cancel_at)
      : MemoryTable(table.schema(), table.fragments()), cancel_at_(cancel_at) {}

  void setToken(CancellationTokenPtr token) { token_ = std::move(token); }

  FragmentResult fetchFragment(size_t frag_idx,
                               const FragmentHints& hints) const override {
    if (token_ && frag_idx == cancel_at_) {
      token_->cancel();
    }
    return MemoryTable::fetchFragment(frag_idx, hints);
  }

 private:
  size_t cancel_at_;
  CancellationTokenPtr token_;
};

}  // namespace

class StreamingTest : public ::testing::Test {
 protected:
  static void SetUpTestSuite() {
    schema_mgr = std::make_shared<SchemaMgr>();
    createTable(*schema_mgr,
                "events",
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
                "1,70,,e\n"
                "5,80,8.5,a\n"
                "3,90,9.5,b\n"
                "2,100,10.5,c",
                4);
    createTable(*schema_mgr,
                "dim",
                {{"id", ctx().int64()}, {"label", ctx().text()}},
                "1,one\n"
                "2,two\n"
                "3,three");

    small_morsels = std::make_shared<Config>(*config);
    small_morsels->exec.streaming.morsel_size = 2;
  }

  static void TearDownTestSuite() {
    schema_mgr.reset();
    small_morsels.reset();
  }

  void SetUp() override {
    builder_ = std::make_unique<QueryBuilder>(schema_mgr, config);
    small_builder_ = std::make_unique<QueryBuilder>(schema_mgr, small_morsels);
  }

  // Streaming and in-memory execution must produce the same result.
  void checkStreamingMatches(const BuilderNode& query, bool ordered = true) {
    auto expected = query.collect();
    auto actual = query.collect(streamingOpts());
    compare_batches(expected.batch(), actual.batch(), ordered);
    auto stream = query.collectStreaming(streamingOpts());
    compare_batches(expected.batch(), stream->collectAll(), ordered);
  }

  static ConfigPtr small_morsels;
  std::unique_ptr<QueryBuilder> builder_;
  std::unique_ptr<QueryBuilder> small_builder_;
};

ConfigPtr StreamingTest::small_morsels;

TEST_F(StreamingTest, MatchesInMemory) {
  for (auto builder : {builder_.get(), small_builder_.get()}) {
    auto scan = builder->scan("events");
    checkStreamingMatches(scan);
    checkStreamingMatches(scan.filter(scan["x"] > 25).proj({"id", "s"}));
    checkStreamingMatches(scan.withColumns({(scan["x"] * 2).rename("x2")}));
    checkStreamingMatches(scan.agg({"id"}, {"sum(x)", "count", "mean(y)"}), false);
    checkStreamingMatches(scan.agg({}, {"sum(x)", "max(y)", "len"}));
    checkStreamingMatches(scan.head(5));
    checkStreamingMatches(scan.slice(3, 4));
    checkStreamingMatches(scan.slice(-12, 5));
    checkStreamingMatches(scan.slice(-3, std::numeric_limits<size_t>::max()));
    checkStreamingMatches(scan.slice(4, std::numeric_limits<size_t>::max()));
    checkStreamingMatches(scan.sort("x").head(3));
    checkStreamingMatches(scan.distinct({"id"}, UniqueKeep::kFirst, true));
    auto dim = builder->scan("dim");
    checkStreamingMatches(scan.join(dim, {"id"}), false);
    checkStreamingMatches(scan.join(dim, {"id"}, JoinType::kLeft), false);
    checkStreamingMatches(scan.join(dim, {"id"}, JoinType::kSemi), false);
    checkStreamingMatches(scan.join(dim, {"id"}, JoinType::kAnti), false);
    checkStreamingMatches(scan.join(dim, {"id"}, JoinType::kOuter), false);
  }
}

TEST_F(StreamingTest, StreamStates) {
  auto scan = builder_->scan("events");
  auto stream = scan.filter(scan["x"] > 25).proj({"x"}).collectStreaming(streamingOpts());
  ASSERT_EQ(stream->state(), PipelineState::kIdle);
  ASSERT_EQ(stream->schema().names(), std::vector<std::string>({"x"}));
  ASSERT_NE(stream->physicalPlan().find("streaming"), std::string::npos);

  auto first = stream->next();
  ASSERT_TRUE(first);
  ASSERT_EQ(stream->state(), PipelineState::kRunning);

  auto rest = stream->collectAll();
  ASSERT_EQ(stream->state(), PipelineState::kFinished);
  ASSERT_EQ(first->numRows() + rest.numRows(), (size_t)7);
  // A finished stream keeps returning end of input.
  ASSERT_FALSE(stream->next());
  ASSERT_EQ(stream->state(), PipelineState::kFinished);
}

TEST_F(StreamingTest, MorselSize) {
  auto scan = small_builder_->scan("events");
  auto stream = scan.collectStreaming(streamingOpts());
  size_t batches = 0;
  std::vector<int64_t> ids;
  while (auto batch = stream->next()) {
    ASSERT_LE(batch->numRows(), (size_t)2);
    ASSERT_GT(batch->numRows(), (size_t)0);
    for (size_t i = 0; i < batch->numRows(); ++i) {
      ids.push_back(batch->column(0)->intAt(i));
    }
    ++batches;
  }
  ASSERT_EQ(batches, (size_t)5);
  ASSERT_EQ(ids, std::vector<int64_t>({1, 2, 1, 3, 2, 4, 1, 5, 3, 2}));

  // A slice stops reading once enough rows were produced.
  auto head = scan.head(3).collectStreaming(streamingOpts())->collectAll();
  compare_batch_data(head.select({"id"}), std::vector<int64_t>({1, 2, 1}));
  auto from_end = scan.slice(-12, 5).collectStreaming(streamingOpts())->collectAll();
  compare_batch_data(from_end.select({"id"}), std::vector<int64_t>({1, 2, 1}));
}

TEST_F(StreamingTest, InMemoryRoot) {
  // Sort is not streaming capable and is computed on the first pull.
  auto scan = small_builder_->scan("events");
  auto stream =
      scan.sort(BuilderSortField("x", true, true)).proj({"x"}).collectStreaming(streamingOpts());
  auto res = stream->collectAll();
  compare_batch_data(
      res, std::vector<int64_t>({100, 90, 80, 70, 60, 50, 30, 20, 10, NULL_BIGINT}));
}

TEST_F(StreamingTest, CancelBeforeStart) {
  auto scan = builder_->scan("events");
  auto opts = streamingOpts();
  opts.cancellation = std::make_shared<CancellationToken>();
  auto stream = scan.proj({"x"}).collectStreaming(opts);
  opts.cancellation->cancel();
  ASSERT_THROW(stream->next(), CancelledError);
  ASSERT_EQ(stream->state(), PipelineState::kCancelled);
  ASSERT_THROW(stream->next(), CancelledError);

  // In-memory execution observes the token as well.
  ASSERT_THROW(scan.agg({"id"}, {"sum(x)"}).collect(opts), CancelledError);
}

TEST_F(StreamingTest, CancelWhileRunning) {
  auto scan = small_builder_->scan("events");
  auto opts = streamingOpts();
  opts.parallel = false;
  opts.cancellation = std::make_shared<CancellationToken>();
  auto stream = scan.collectStreaming(opts);
  ASSERT_TRUE(stream->next());
  opts.cancellation->cancel();
  ASSERT_THROW(
      {
        while (stream->next()) {
        }
      },
      CancelledError);
  ASSERT_EQ(stream->state(), PipelineState::kCancelled);
}

TEST_F(StreamingTest, CancelInMemoryExecution) {
  std::stringstream csv;
  for (int64_t i = 0; i < 64; ++i) {
    csv << (i % 4) << "," << i * 10 << "\n";
  }
  auto source = MemoryTable::fromBatch(
      makeBatch({{"id", ctx().int64()}, {"x", ctx().int64()}}, csv.str()), 8);
  auto table = std::make_shared<CancellingTable>(*source, 5);
  auto local_schema_mgr = std::make_shared<SchemaMgr>();
  local_schema_mgr->registerTable("cancelling", table);

  auto small_tasks = std::make_shared<Config>(*config);
  small_tasks->exec.sub_task_size = 2;
  QueryBuilder builder(local_schema_mgr, small_tasks);
  auto scan = builder.scan("cancelling");
  auto filtered = scan.filter(scan["x"] > 10);
  auto query = filtered.withColumns({(filtered["x"] * 2).rename("x2")})
                   .agg({"id"}, {"sum(x2)", "count"});

  ExecutionOptions opts;
  opts.parallel = true;
  opts.cancellation = std::make_shared<CancellationToken>();
  table->setToken(opts.cancellation);
  ASSERT_THROW(query.collect(opts), CancelledError);
  ASSERT_TRUE(opts.cancellation->isCancelled());

  // A fresh token lets the same query complete.
  table->setToken(nullptr);
  opts.cancellation = std::make_shared<CancellationToken>();
  auto res = query.sort("id").collect(opts);
  compare_res_data(res,
                   std::vector<int64_t>({0, 1, 2, 3}),
                   std::vector<int64_t>({9600, 9900, 10240, 10560}),
                   std::vector<int64_t>({15, 15, 16, 16}));
}

TEST_F(StreamingTest, Failure) {
  auto scan = builder_->scan("events");
  auto stream = scan.proj({scan["x"] % 0}).collectStreaming(streamingOpts());
  ASSERT_THROW(stream->next(), ComputeError);
  ASSERT_EQ(stream->state(), PipelineState::kFailed);
  ASSERT_THROW(stream->next(), InvalidOperationError);

  ASSERT_THROW(scan.proj({scan["x"] % 0}).collect(streamingOpts()), ComputeError);
}

TEST_F(StreamingTest, StreamingFromConfig) {
  auto streaming_config = std::make_shared<Config>(*config);
  streaming_config->exec.streaming.enable = true;
  QueryBuilder builder(schema_mgr, streaming_config);
  auto scan = builder.scan("events");
  auto query = scan.filter(scan["id"] == 1).proj({"x"});
  ASSERT_NE(query.explain().find("streaming"), std::string::npos);
  compare_res_data(query.collect(), std::vector<int64_t>({10, 30, 70}));
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
