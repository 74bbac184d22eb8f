/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "TestHelpers.h"

#include "ConfigBuilder/ConfigBuilder.h"
#include "IR/CardinalityEstimator.h"
#include "IR/Expr.h"
#include "IR/FunctionRegistry.h"
#include "IR/Node.h"
#include "IR/TypeUtils.h"
#include "QueryEngine/ColumnOps.h"

#include <gtest/gtest.h>

using namespace lqe;
using namespace lqe::ir;
using namespace TestHelpers;

namespace {

Context& ctx() {
  return Context::defaultCtx();
}

std::shared_ptr<MemoryTable> makeTable() {
  return MemoryTable::fromBatch(makeBatch({{"a", ctx().int32()},
                                           {"b", ctx().fp64()},
                                           {"c", ctx().text()},
                                           {"l", ctx().list(ctx().int64())}},
                                          "1,1.5,x,[1;2]\n"
                                          "2,2.5,y,[]\n"
                                          "3,,z,\n"
                                          "4,4.5,,[3]"),
                                2);
}

}  // namespace

class TypeTest : public ::testing::Test {};

TEST_F(TypeTest, Interning) {
  ASSERT_EQ(ctx().int32(), ctx().integer(4));
  ASSERT_EQ(ctx().fp32(), ctx().fp(FloatingPointType::kFloat));
  ASSERT_EQ(ctx().list(ctx().text()), ctx().list(ctx().text()));
  ASSERT_NE(ctx().list(ctx().text()), ctx().list(ctx().int8()));
  ASSERT_TRUE(ctx().list(ctx().int8())->equal(*ctx().list(ctx().int8())));
  ASSERT_FALSE(ctx().int8()->equal(*ctx().int16()));

  Context other;
  ASSERT_TRUE(other.int64()->equal(*ctx().int64()));
  ASSERT_EQ(other.copyType(ctx().list(ctx().date())), other.list(other.date()));
}

TEST_F(TypeTest, ToString) {
  ASSERT_EQ(ctx().null()->toString(), "NULLT");
  ASSERT_EQ(ctx().boolean()->toString(), "BOOL");
  ASSERT_EQ(ctx().int16()->toString(), "INT16");
  ASSERT_EQ(ctx().fp32()->toString(), "FP32");
  ASSERT_EQ(ctx().fp64()->toString(), "FP64");
  ASSERT_EQ(ctx().text()->toString(), "TEXT");
  ASSERT_EQ(ctx().date()->toString(), "DATE");
  ASSERT_EQ(ctx().timestamp()->toString(), "TIMESTAMP[us]");
  ASSERT_EQ(ctx().list(ctx().int32())->toString(), "LIST<INT32>");
}

TEST_F(TypeTest, CommonType) {
  ASSERT_EQ(commonType(ctx().int8(), ctx().int32()), ctx().int32());
  ASSERT_EQ(commonType(ctx().int64(), ctx().fp32()), ctx().fp64());
  ASSERT_EQ(commonType(ctx().int16(), ctx().fp32()), ctx().fp32());
  ASSERT_EQ(commonType(ctx().fp32(), ctx().fp64()), ctx().fp64());
  ASSERT_EQ(commonType(ctx().boolean(), ctx().int8()), ctx().int8());
  ASSERT_EQ(commonType(ctx().null(), ctx().text()), ctx().text());
  ASSERT_EQ(commonType(ctx().date(), ctx().timestamp()), ctx().timestamp());
  ASSERT_EQ(commonType(ctx().list(ctx().int8()), ctx().list(ctx().int32())),
            ctx().list(ctx().int32()));
  ASSERT_EQ(commonType(ctx().text(), ctx().int32()), nullptr);
  ASSERT_THROW(commonTypeOrThrow(ctx().text(), ctx().int32(), "test"), SchemaError);
}

TEST_F(TypeTest, OperationTypes) {
  ASSERT_EQ(binOperResultType(OpType::kDiv, ctx().int32(), ctx().int32()), ctx().fp64());
  ASSERT_EQ(binOperResultType(OpType::kFloorDiv, ctx().int32(), ctx().int8()),
            ctx().int32());
  ASSERT_EQ(binOperResultType(OpType::kPlus, ctx().boolean(), ctx().boolean()),
            ctx().int64());
  ASSERT_EQ(binOperResultType(OpType::kLt, ctx().int32(), ctx().fp64()), ctx().boolean());
  ASSERT_THROW(binOperResultType(OpType::kPlus, ctx().text(), ctx().text()), SchemaError);
  ASSERT_THROW(binOperResultType(OpType::kAnd, ctx().int32(), ctx().boolean()),
               SchemaError);
  ASSERT_THROW(binOperResultType(OpType::kEq, ctx().text(), ctx().int32()), SchemaError);
  ASSERT_THROW(unaryOperResultType(OpType::kNot, ctx().int32()), SchemaError);

  ASSERT_EQ(aggResultType(AggType::kSum, ctx().int8()), ctx().int64());
  ASSERT_EQ(aggResultType(AggType::kSum, ctx().fp32()), ctx().fp32());
  ASSERT_EQ(aggResultType(AggType::kMean, ctx().int32()), ctx().fp64());
  ASSERT_EQ(aggResultType(AggType::kMax, ctx().text()), ctx().text());
  ASSERT_EQ(aggResultType(AggType::kCount, ctx().text()), ctx().int64());
  ASSERT_THROW(aggResultType(AggType::kSum, ctx().text()), SchemaError);

  ASSERT_TRUE(isCastSupported(ctx().text(), ctx().date()));
  ASSERT_TRUE(isCastSupported(ctx().int32(), ctx().text()));
  ASSERT_FALSE(isCastSupported(ctx().list(ctx().int32()), ctx().int32()));
}

class SchemaTest : public ::testing::Test {};

TEST_F(SchemaTest, Lookup) {
  Schema schema({{"a", ctx().int32()}, {"b", ctx().text()}});
  ASSERT_EQ(schema.size(), (size_t)2);
  ASSERT_TRUE(schema.contains("b"));
  ASSERT_FALSE(schema.contains("c"));
  ASSERT_EQ(schema.indexOfOrThrow("b"), (size_t)1);
  ASSERT_EQ(schema.typeOf("a"), ctx().int32());
  ASSERT_THROW(schema.indexOfOrThrow("c"), SchemaError);
  ASSERT_EQ(schema.select({"b", "a"}).names(), (std::vector<std::string>{"b", "a"}));
  ASSERT_THROW(schema.select({"c"}), SchemaError);
}

TEST_F(SchemaTest, DuplicateNames) {
  ASSERT_THROW(Schema({{"a", ctx().int32()}, {"a", ctx().text()}}), SchemaError);
}

class ExprTest : public ::testing::Test {};

TEST_F(ExprTest, Interning) {
  ExprArena arena;
  auto a1 = arena.make<ColumnRef>(ctx().int32(), "a");
  auto a2 = arena.make<ColumnRef>(ctx().int32(), "a");
  auto b = arena.make<ColumnRef>(ctx().int32(), "b");
  ASSERT_EQ(a1, a2);
  ASSERT_NE(a1, b);

  auto sum1 = arena.make<BinOper>(ctx().int32(), OpType::kPlus, a1, b);
  auto sum2 = arena.make<BinOper>(ctx().int32(), OpType::kPlus, a2, b);
  auto sum3 = arena.make<BinOper>(ctx().int32(), OpType::kPlus, b, a1);
  ASSERT_EQ(sum1, sum2);
  ASSERT_NE(sum1, sum3);

  auto lit1 = arena.make<Literal>(ctx().int64(), Datum(int64_t(1)));
  auto lit2 = arena.make<Literal>(ctx().fp64(), Datum(1.0));
  ASSERT_NE(lit1, lit2);

  ExprArena other;
  auto imported = other.import(arena, sum3);
  ASSERT_EQ(other.toString(imported), arena.toString(sum3));
  ASSERT_EQ(other.size(), (size_t)3);
}

TEST_F(ExprTest, OutputNames) {
  ExprArena arena;
  auto a = arena.make<ColumnRef>(ctx().int32(), "a");
  auto b = arena.make<ColumnRef>(ctx().int32(), "b");
  auto lit = arena.make<Literal>(ctx().int64(), Datum(int64_t(2)));
  auto expr = arena.make<BinOper>(ctx().int64(), OpType::kMul, b, a);
  ASSERT_EQ(outputName(arena, a), "a");
  ASSERT_EQ(outputName(arena, expr), "b");
  ASSERT_EQ(outputName(arena, lit), "literal");
  auto alias = arena.make<AliasExpr>(ctx().int64(), expr, "prod");
  ASSERT_EQ(outputName(arena, alias), "prod");
  ASSERT_EQ(stripAlias(arena, alias), expr);
  auto len = arena.make<AggExpr>(ctx().int64(), AggType::kLen, kInvalidExprId);
  ASSERT_EQ(outputName(arena, len), "len");
  auto sum = arena.make<AggExpr>(ctx().int64(), AggType::kSum, a);
  ASSERT_EQ(outputName(arena, sum), "a");
  ASSERT_EQ(referencedColumns(arena, alias), (std::vector<std::string>{"b", "a"}));
}

TEST_F(ExprTest, Properties) {
  ExprArena arena;
  auto a = arena.make<ColumnRef>(ctx().int32(), "a");
  auto sum = arena.make<AggExpr>(ctx().int64(), AggType::kSum, a);
  auto key = arena.make<SortKey>(ctx().int32(), a, false, false);
  auto cum_sum = arena.make<FunctionOper>(
      ctx().int64(), &FunctionRegistry::instance().get("cum_sum"), ExprIdList{a});
  auto abs = arena.make<FunctionOper>(
      ctx().int32(), &FunctionRegistry::instance().get("abs"), ExprIdList{a});
  auto window = arena.make<WindowExpr>(ctx().int64(), sum, ExprIdList{abs}, ExprIdList{});

  ASSERT_TRUE(isElementwise(arena, abs));
  ASSERT_FALSE(isElementwise(arena, cum_sum));
  ASSERT_FALSE(isElementwise(arena, sum));
  ASSERT_FALSE(isElementwise(arena, key));
  ASSERT_TRUE(containsAgg(arena, sum));
  ASSERT_FALSE(containsAgg(arena, abs));
  ASSERT_TRUE(containsWindow(arena, window));
  ASSERT_FALSE(containsWindow(arena, sum));
}

TEST_F(ExprTest, Conjunctions) {
  ExprArena arena;
  auto p1 = arena.make<ColumnRef>(ctx().boolean(), "p1");
  auto p2 = arena.make<ColumnRef>(ctx().boolean(), "p2");
  auto p3 = arena.make<ColumnRef>(ctx().boolean(), "p3");
  auto and1 = arena.make<BinOper>(ctx().boolean(), OpType::kAnd, p1, p2);
  auto and2 = arena.make<BinOper>(ctx().boolean(), OpType::kAnd, and1, p3);
  ASSERT_EQ(splitConjunction(arena, and2), (ExprIdList{p1, p2, p3}));
  ASSERT_EQ(makeConjunction(arena, {p1, p2, p3}), and2);
  ASSERT_EQ(makeConjunction(arena, {p1}), p1);
  ASSERT_EQ(makeConjunction(arena, {}), kInvalidExprId);
}

class FunctionRegistryTest : public ::testing::Test {};

TEST_F(FunctionRegistryTest, Builtins) {
  auto& registry = FunctionRegistry::instance();
  for (auto name : {"abs",       "round",  "str_len", "upper",    "contains",
                    "if_else",   "is_in",  "year",    "list_len", "cum_sum",
                    "shift",     "diff",   "rank",    "coalesce", "fill_null"}) {
    ASSERT_NE(registry.find(name), nullptr) << name;
  }
  ASSERT_EQ(registry.find("no_such_function"), nullptr);
  ASSERT_THROW(registry.get("no_such_function"), SchemaError);

  auto& year = registry.get("year");
  ASSERT_EQ(year.result_type({ctx().date()}), ctx().int32());
  ASSERT_THROW(year.result_type({ctx().text()}), SchemaError);
  ASSERT_EQ(registry.get("str_len").result_type({ctx().text()}), ctx().int64());
  ASSERT_EQ(registry.get("rank").result_type({ctx().fp64()}), ctx().int64());
  ASSERT_EQ(registry.get("diff").result_type({ctx().int16()}), ctx().int64());
  ASSERT_FALSE(registry.get("shift").elementwise);
  ASSERT_TRUE(registry.get("upper").elementwise);
}

TEST_F(FunctionRegistryTest, Registration) {
  FunctionRegistry registry;
  registerBuiltinFunctions(registry);
  auto count = registry.size();

  FunctionDescriptor desc;
  desc.name = "twice";
  desc.min_args = 1;
  desc.max_args = 1;
  desc.result_type = [](const TypeList& types) { return types[0]; };
  desc.kernel = [](const std::vector<ColumnPtr>& args, size_t, const Type* type) {
    return binaryOp(OpType::kPlus, args[0], args[0], type);
  };
  registry.registerFunction(desc);
  ASSERT_EQ(registry.size(), count + 1);
  ASSERT_THROW(registry.registerFunction(desc), InvalidOperationError);

  FunctionDescriptor incomplete;
  incomplete.name = "broken";
  ASSERT_THROW(registry.registerFunction(incomplete), InvalidOperationError);
}

class DateTimeTest : public ::testing::Test {};

TEST_F(DateTimeTest, CivilConversions) {
  ASSERT_EQ(daysFromCivil(1970, 1, 1), 0);
  ASSERT_EQ(daysFromCivil(2000, 3, 1), 11017);
  ASSERT_EQ(daysFromCivil(1969, 12, 31), -1);
  auto date = civilFromDays(11017);
  ASSERT_EQ(date.year, 2000);
  ASSERT_EQ(date.month, 3u);
  ASSERT_EQ(date.day, 1u);
  ASSERT_EQ(timestampToDays(-1), -1);
  ASSERT_EQ(timestampToDays(kMicrosecsPerDay), 1);
}

TEST_F(DateTimeTest, ParseAndFormat) {
  ASSERT_EQ(parseDate("2000-03-01"), std::optional<int64_t>(11017));
  ASSERT_FALSE(parseDate("2000-13-01"));
  ASSERT_FALSE(parseDate("yesterday"));
  auto ts = parseTimestamp("2000-03-01 12:30:15.25");
  ASSERT_TRUE(ts);
  ASSERT_EQ(formatTimestamp(*ts), "2000-03-01 12:30:15.250000");
  ASSERT_EQ(parseTimestamp("2000-03-01T12:30:15"), parseTimestamp("2000-03-01 12:30:15"));
  ASSERT_EQ(formatTimestamp(*parseTimestamp("1969-12-31 23:59:59")),
            "1969-12-31 23:59:59");
  ASSERT_EQ(formatDate(-1), "1969-12-31");
}

TEST_F(DateTimeTest, Durations) {
  auto dur = parseDuration("3d12h");
  ASSERT_TRUE(dur);
  ASSERT_EQ(dur->days, 3);
  ASSERT_EQ(dur->micros, 12 * 3600 * kMicrosecsPerSec);
  ASSERT_EQ(parseDuration("1q")->months, 3);
  ASSERT_EQ(parseDuration("2w")->days, 14);
  ASSERT_TRUE(parseDuration("-15m")->isNegative());
  ASSERT_TRUE(parseDuration("0d")->isZero());
  ASSERT_FALSE(parseDuration(""));
  ASSERT_FALSE(parseDuration("d"));
  ASSERT_FALSE(parseDuration("5"));
  ASSERT_FALSE(parseDuration("1x"));
  ASSERT_FALSE(parseDuration("1234567890s"));

  auto ts = *parseTimestamp("2024-01-31 06:00:00");
  ASSERT_EQ(formatTimestamp(parseDuration("1mo")->addTo(ts)), "2024-02-29 06:00:00");
  ASSERT_EQ(formatTimestamp(parseDuration("1y1mo")->addTo(ts)), "2025-02-28 06:00:00");
  ASSERT_EQ(formatTimestamp(parseDuration("-2mo")->addTo(ts)), "2023-11-30 06:00:00");
  ASSERT_EQ(formatTimestamp(parseDuration("1d18h")->addTo(ts)), "2024-02-02 00:00:00");
  ASSERT_EQ(parseDuration("1mo2d90s")->toString(), "1mo2d90000000us");
}

class NodeTest : public ::testing::Test {};

TEST_F(NodeTest, ScanAndProject) {
  QueryDag dag;
  auto table = makeTable();
  auto scan = dag.makeNode<Scan>("t", table);
  ASSERT_EQ(dag.node(scan)->schema().names(),
            (std::vector<std::string>{"a", "b", "c", "l"}));

  auto& arena = dag.exprs();
  auto a = arena.make<ColumnRef>(ctx().int32(), "a");
  auto b = arena.make<ColumnRef>(ctx().fp64(), "b");
  auto proj = dag.makeNode<Project>(ExprIdList{b, a}, scan);
  ASSERT_EQ(dag.node(proj)->schema().names(), (std::vector<std::string>{"b", "a"}));

  auto missing = arena.make<ColumnRef>(ctx().int32(), "missing");
  ASSERT_THROW(dag.makeNode<Project>(ExprIdList{missing}, scan), SchemaError);
  auto wrong_type = arena.make<ColumnRef>(ctx().int64(), "a");
  ASSERT_THROW(dag.makeNode<Project>(ExprIdList{wrong_type}, scan), SchemaError);
  ASSERT_THROW(dag.makeNode<Project>(ExprIdList{a, a}, scan), SchemaError);
  ASSERT_THROW(dag.makeNode<Project>(ExprIdList{}, scan), InvalidOperationError);
}

TEST_F(NodeTest, FilterAndAggregate) {
  QueryDag dag;
  auto scan = dag.makeNode<Scan>("t", makeTable());
  auto& arena = dag.exprs();
  auto a = arena.make<ColumnRef>(ctx().int32(), "a");
  auto b = arena.make<ColumnRef>(ctx().fp64(), "b");
  auto l = arena.make<ColumnRef>(ctx().list(ctx().int64()), "l");
  ASSERT_THROW(dag.makeNode<Filter>(a, scan), SchemaError);

  auto sum = arena.make<AggExpr>(ctx().fp64(), AggType::kSum, b);
  auto agg = dag.makeNode<Aggregate>(ExprIdList{a}, ExprIdList{sum}, scan);
  ASSERT_EQ(dag.node(agg)->schema().names(), (std::vector<std::string>{"a", "b"}));

  // Plain column outside of an aggregate.
  ASSERT_THROW(dag.makeNode<Aggregate>(ExprIdList{a}, ExprIdList{b}, scan), SchemaError);
  auto nested = arena.make<AggExpr>(ctx().fp64(), AggType::kSum, sum);
  ASSERT_THROW(dag.makeNode<Aggregate>(ExprIdList{}, ExprIdList{nested}, scan),
               SchemaError);
  ASSERT_THROW(dag.makeNode<Aggregate>(ExprIdList{l}, ExprIdList{sum}, scan),
               SchemaError);
}

TEST_F(NodeTest, JoinSchema) {
  QueryDag dag;
  auto lhs = dag.makeNode<Scan>("t1", makeTable());
  auto rhs = dag.makeNode<Scan>("t2", makeTable());
  auto& arena = dag.exprs();
  auto a = arena.make<ColumnRef>(ctx().int32(), "a");

  JoinOptions inner;
  auto join = dag.makeNode<Join>(lhs, rhs, ExprIdList{a}, ExprIdList{a}, inner);
  ASSERT_EQ(dag.node(join)->schema().names(),
            (std::vector<std::string>{"a", "b", "c", "l", "b_right", "c_right", "l_right"}));

  JoinOptions semi;
  semi.type = JoinType::kSemi;
  auto semi_join = dag.makeNode<Join>(lhs, rhs, ExprIdList{a}, ExprIdList{a}, semi);
  ASSERT_EQ(dag.node(semi_join)->schema().names(),
            (std::vector<std::string>{"a", "b", "c", "l"}));

  JoinOptions cross;
  cross.type = JoinType::kCross;
  cross.suffix = "_r";
  auto cross_join = dag.makeNode<Join>(lhs, rhs, ExprIdList{}, ExprIdList{}, cross);
  ASSERT_EQ(dag.node(cross_join)->schema().size(), (size_t)8);
  ASSERT_EQ(dag.node(cross_join)->schema()[4].name, "a_r");

  ASSERT_THROW(dag.makeNode<Join>(lhs, rhs, ExprIdList{a}, ExprIdList{}, inner),
               InvalidOperationError);
  ASSERT_THROW(dag.makeNode<Join>(lhs, rhs, ExprIdList{}, ExprIdList{}, inner),
               InvalidOperationError);
  ASSERT_THROW(dag.makeNode<Join>(lhs, rhs, ExprIdList{a}, ExprIdList{a}, cross),
               InvalidOperationError);
}

TEST_F(NodeTest, ReshapeNodes) {
  QueryDag dag;
  auto scan = dag.makeNode<Scan>("t", makeTable());
  ASSERT_THROW(dag.makeNode<Union>(NodeIdList{scan}), InvalidOperationError);
  auto& arena = dag.exprs();
  auto a = arena.make<ColumnRef>(ctx().int32(), "a");
  auto proj = dag.makeNode<Project>(ExprIdList{a}, scan);
  ASSERT_THROW(dag.makeNode<Union>(NodeIdList{scan, proj}), SchemaError);

  auto explode = dag.makeNode<Explode>(std::vector<std::string>{"l"}, scan);
  ASSERT_EQ(dag.node(explode)->schema().typeOf("l"), ctx().int64());
  ASSERT_THROW(dag.makeNode<Explode>(std::vector<std::string>{"a"}, scan), SchemaError);

  ASSERT_THROW(dag.makeNode<Distinct>(
                   std::vector<std::string>{"l"}, UniqueKeep::kFirst, true, scan),
               SchemaError);

  auto melt = dag.makeNode<Melt>(std::vector<std::string>{"c"},
                                 std::vector<std::string>{"a", "b"},
                                 "variable",
                                 "value",
                                 scan);
  auto& melt_schema = dag.node(melt)->schema();
  ASSERT_EQ(melt_schema.names(), (std::vector<std::string>{"c", "variable", "value"}));
  ASSERT_EQ(melt_schema.typeOf("variable"), ctx().text());
  ASSERT_EQ(melt_schema.typeOf("value"), ctx().fp64());

  ASSERT_THROW(dag.makeNode<Sort>(ExprIdList{}, scan), InvalidOperationError);
}

TEST_F(NodeTest, ImportAndPrint) {
  QueryDag dag;
  auto scan = dag.makeNode<Scan>("t", makeTable());
  auto& arena = dag.exprs();
  auto a = arena.make<ColumnRef>(ctx().int32(), "a");
  auto lit = arena.make<Literal>(ctx().int32(), Datum(int64_t(2)));
  auto cond = arena.make<BinOper>(ctx().boolean(), OpType::kGt, a, lit);
  auto filter = dag.makeNode<Filter>(cond, scan);
  auto slice = dag.makeNode<Slice>(-2, 2, filter);
  dag.setRoot(slice);

  QueryDag copy;
  copy.setRoot(copy.import(dag, slice));
  ASSERT_EQ(copy.size(), (size_t)3);
  ASSERT_EQ(copy.toString(), dag.toString());
  ASSERT_EQ(copy.topologicalOrder().size(), (size_t)3);
  ASSERT_EQ(copy.rootNode()->kind(), NodeKind::kSlice);
}

TEST_F(NodeTest, CardinalityEstimation) {
  QueryDag dag;
  auto scan = dag.makeNode<Scan>("t", makeTable());
  ASSERT_EQ(estimateRows(dag, scan), std::optional<size_t>(4));

  auto& arena = dag.exprs();
  auto a = arena.make<ColumnRef>(ctx().int32(), "a");
  auto lit = arena.make<Literal>(ctx().int32(), Datum(int64_t(2)));
  auto cond = arena.make<BinOper>(ctx().boolean(), OpType::kGt, a, lit);
  auto filter = dag.makeNode<Filter>(cond, scan);
  ASSERT_EQ(estimateRows(dag, filter), std::optional<size_t>(2));

  auto len = arena.make<AggExpr>(ctx().int64(), AggType::kLen, kInvalidExprId);
  auto agg = dag.makeNode<Aggregate>(ExprIdList{}, ExprIdList{len}, scan);
  ASSERT_EQ(estimateRows(dag, agg), std::optional<size_t>(1));

  JoinOptions cross;
  cross.type = JoinType::kCross;
  auto other = dag.makeNode<Scan>("t2", makeTable());
  auto join = dag.makeNode<Join>(scan, other, ExprIdList{}, ExprIdList{}, cross);
  ASSERT_EQ(estimateRows(dag, join), std::optional<size_t>(16));

  auto slice = dag.makeNode<Slice>(3, 10, scan);
  ASSERT_EQ(estimateRows(dag, slice), std::optional<size_t>(1));
}

int main(int argc, char* argv[]) {
  TestHelpers::init_logger_stderr_only(argc, argv);
  testing::InitGoogleTest(&argc, argv);

  ConfigBuilder builder;
  builder.parseCommandLineArgs(argc, argv, true);

  int err{0};
  try {
    err = RUN_ALL_TESTS();
  } catch (const std::exception& e) {
    LOG(ERROR) << e.what();
    return -1;
  }
  return err;
}
