/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "TestHelpers.h"

#include "ConfigBuilder/ConfigBuilder.h"
#include "QueryEngine/ColumnOps.h"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

using namespace lqe;
using namespace TestHelpers;

namespace {

ir::Context& ctx() {
  return ir::Context::defaultCtx();
}

ColumnPtr makeColumn(const ir::Type* type, const std::string& vals) {
  ColumnBuilder builder(type);
  std::vector<std::string> items;
  boost::split(items, vals, boost::is_any_of(","));
  for (auto& item : items) {
    appendCsvValue(builder, item);
  }
  return builder.finish();
}

std::vector<std::string> toStrings(const Column& col) {
  std::vector<std::string> res;
  for (size_t i = 0; i < col.size(); ++i) {
    res.push_back(col.valueToString(i));
  }
  return res;
}

using Strings = std::vector<std::string>;

}  // namespace

class ColumnOpsTest : public ::testing::Test {};

TEST_F(ColumnOpsTest, Take) {
  auto col = makeColumn(ctx().int32(), "10,20,,40");
  auto res = take(col, {3, -1, 0, 2, 2});
  ASSERT_EQ(res->type(), ctx().int32());
  ASSERT_EQ(toStrings(*res), (Strings{"40", "null", "10", "null", "null"}));
}

TEST_F(ColumnOpsTest, MaskToIndices) {
  auto mask = makeColumn(ctx().boolean(), "true,,false,true");
  ASSERT_EQ(maskToIndices(*mask, 4), (std::vector<int64_t>{0, 3}));

  auto all = makeColumn(ctx().boolean(), "true");
  ASSERT_EQ(maskToIndices(*all, 3), (std::vector<int64_t>{0, 1, 2}));

  auto none = makeColumn(ctx().boolean(), "");
  ASSERT_TRUE(maskToIndices(*none, 3).empty());
}

TEST_F(ColumnOpsTest, ConcatAndBroadcast) {
  auto res = concat({makeColumn(ctx().text(), "a,b"), makeColumn(ctx().text(), ",c")});
  ASSERT_EQ(toStrings(*res), (Strings{"a", "b", "null", "c"}));

  auto bcast = broadcast(makeColumn(ctx().fp64(), "1.5"), 3);
  ASSERT_EQ(toStrings(*bcast), (Strings{"1.5", "1.5", "1.5"}));
}

TEST_F(ColumnOpsTest, KleeneLogic) {
  auto lhs = makeColumn(ctx().boolean(), "true,true,true,false,false,false,,,");
  auto rhs = makeColumn(ctx().boolean(), "true,false,,true,false,,true,false,");
  auto and_res = binaryOp(ir::OpType::kAnd, lhs, rhs, ctx().boolean());
  ASSERT_EQ(toStrings(*and_res),
            (Strings{
                "true", "false", "null", "false", "false", "false", "null", "false", "null"}));
  auto or_res = binaryOp(ir::OpType::kOr, lhs, rhs, ctx().boolean());
  ASSERT_EQ(toStrings(*or_res),
            (Strings{"true", "true", "true", "true", "false", "null", "true", "null", "null"}));
}

TEST_F(ColumnOpsTest, Comparison) {
  auto lhs = makeColumn(ctx().int64(), "1,2,,4");
  auto rhs = makeColumn(ctx().fp64(), "1.0,2.5,3.0,3.5");
  auto res = binaryOp(ir::OpType::kLt, lhs, rhs, ctx().boolean());
  ASSERT_EQ(toStrings(*res), (Strings{"false", "true", "null", "false"}));

  auto strs = makeColumn(ctx().text(), "abc,abd,b");
  auto pattern = makeColumn(ctx().text(), "abd");
  auto str_res = binaryOp(ir::OpType::kGe, strs, pattern, ctx().boolean());
  ASSERT_EQ(toStrings(*str_res), (Strings{"false", "true", "true"}));
}

TEST_F(ColumnOpsTest, IntegerArithmeticWraps) {
  auto lhs = makeColumn(ctx().int8(), "127,-128,100");
  auto rhs = makeColumn(ctx().int8(), "1,1,");
  auto add = binaryOp(ir::OpType::kPlus, lhs, rhs, ctx().int8());
  ASSERT_EQ(toStrings(*add), (Strings{"-128", "-127", "null"}));
  auto sub = binaryOp(ir::OpType::kMinus, lhs, rhs, ctx().int8());
  ASSERT_EQ(toStrings(*sub), (Strings{"126", "127", "null"}));

  auto neg = unaryOp(ir::OpType::kUMinus, makeColumn(ctx().int8(), "-128,5,"), ctx().int8());
  ASSERT_EQ(toStrings(*neg), (Strings{"-128", "-5", "null"}));
}

TEST_F(ColumnOpsTest, FloorDivAndModulo) {
  auto lhs = makeColumn(ctx().int64(), "7,-7,7,-7");
  auto rhs = makeColumn(ctx().int64(), "2,2,-2,-2");
  auto div = binaryOp(ir::OpType::kFloorDiv, lhs, rhs, ctx().int64());
  ASSERT_EQ(toStrings(*div), (Strings{"3", "-4", "-4", "3"}));
  auto mod = binaryOp(ir::OpType::kMod, lhs, rhs, ctx().int64());
  ASSERT_EQ(toStrings(*mod), (Strings{"1", "1", "-1", "-1"}));

  auto fp_mod = binaryOp(ir::OpType::kMod,
                         makeColumn(ctx().fp64(), "-7.5"),
                         makeColumn(ctx().fp64(), "2"),
                         ctx().fp64());
  ASSERT_EQ(toStrings(*fp_mod), (Strings{"0.5"}));
}

TEST_F(ColumnOpsTest, IntegerDivisionByZero) {
  auto lhs = makeColumn(ctx().int32(), "1,2");
  auto rhs = makeColumn(ctx().int32(), "1,0");
  ASSERT_THROW(binaryOp(ir::OpType::kMod, lhs, rhs, ctx().int32()), ir::ComputeError);
  ASSERT_THROW(binaryOp(ir::OpType::kFloorDiv, lhs, rhs, ctx().int32()),
               ir::ComputeError);

  // Null divisors produce nulls instead of errors.
  auto null_rhs = makeColumn(ctx().int32(), "1,");
  auto res = binaryOp(ir::OpType::kMod, lhs, null_rhs, ctx().int32());
  ASSERT_EQ(toStrings(*res), (Strings{"0", "null"}));

  // True division of integers produces floating point values.
  auto fp_res = binaryOp(ir::OpType::kDiv,
                         cast(lhs, ctx().fp64(), true),
                         cast(rhs, ctx().fp64(), true),
                         ctx().fp64());
  ASSERT_TRUE(std::isinf(fp_res->fpAt(1)));
}

TEST_F(ColumnOpsTest, IsNull) {
  auto col = makeColumn(ctx().text(), "a,,c");
  auto is_null = unaryOp(ir::OpType::kIsNull, col, ctx().boolean());
  ASSERT_EQ(toStrings(*is_null), (Strings{"false", "true", "false"}));
  auto not_null = unaryOp(ir::OpType::kIsNotNull, col, ctx().boolean());
  ASSERT_EQ(toStrings(*not_null), (Strings{"true", "false", "true"}));
  ASSERT_FALSE(not_null->hasNulls());
}

TEST_F(ColumnOpsTest, StrictCast) {
  auto col = makeColumn(ctx().text(), "1,x,");
  ASSERT_THROW(cast(col, ctx().int32(), true), ir::ComputeError);
  auto res = cast(col, ctx().int32(), false);
  ASSERT_EQ(toStrings(*res), (Strings{"1", "null", "null"}));

  auto big = makeColumn(ctx().int64(), "1,300");
  ASSERT_THROW(cast(big, ctx().int8(), true), ir::ComputeError);
  ASSERT_EQ(toStrings(*cast(big, ctx().int8(), false)), (Strings{"1", "null"}));
}

TEST_F(ColumnOpsTest, CastConversions) {
  auto fps = makeColumn(ctx().fp64(), "1.9,-1.9");
  ASSERT_EQ(toStrings(*cast(fps, ctx().int32(), true)), (Strings{"1", "-1"}));

  auto ints = makeColumn(ctx().int32(), "0,5");
  ASSERT_EQ(toStrings(*cast(ints, ctx().boolean(), true)), (Strings{"false", "true"}));
  ASSERT_EQ(toStrings(*cast(ints, ctx().text(), true)), (Strings{"0", "5"}));

  auto dates = makeColumn(ctx().text(), "2020-03-01");
  auto date_res = cast(dates, ctx().date(), true);
  ASSERT_EQ(date_res->intAt(0), ir::daysFromCivil(2020, 3, 1));
  auto ts_res = cast(date_res, ctx().timestamp(), true);
  ASSERT_EQ(ts_res->intAt(0), date_res->intAt(0) * ir::kMicrosecsPerDay);

  auto nan = makeColumn(ctx().fp64(), "nan");
  ASSERT_THROW(cast(nan, ctx().int64(), true), ir::ComputeError);
}

TEST_F(ColumnOpsTest, WrapInteger) {
  ASSERT_EQ(wrapInteger(128, 1), -128);
  ASSERT_EQ(wrapInteger(65536 + 7, 2), 7);
  ASSERT_EQ(wrapInteger(int64_t(1) << 31, 4), std::numeric_limits<int32_t>::min());
  ASSERT_EQ(wrapInteger(int64_t(1) << 40, 8), int64_t(1) << 40);
}

TEST_F(ColumnOpsTest, FloatingPointKeys) {
  auto col = makeColumn(ctx().fp64(), "nan,-nan,0.0,-0.0,1.0");
  ASSERT_TRUE(valuesEqual(*col, 0, *col, 1));
  ASSERT_EQ(hashValue(*col, 0), hashValue(*col, 1));
  ASSERT_TRUE(valuesEqual(*col, 2, *col, 3));
  ASSERT_EQ(hashValue(*col, 2), hashValue(*col, 3));
  ASSERT_GT(compareValues(*col, 0, *col, 4), 0);
  ASSERT_LT(compareValues(*col, 3, *col, 4), 0);
}

TEST_F(ColumnOpsTest, RowsEqual) {
  std::vector<ColumnPtr> cols{makeColumn(ctx().int32(), "1,1,"),
                              makeColumn(ctx().text(), "a,a,")};
  ASSERT_TRUE(rowsEqual(cols, 0, cols, 1, false));
  ASSERT_FALSE(rowsEqual(cols, 2, cols, 2, false));
  ASSERT_TRUE(rowsEqual(cols, 2, cols, 2, true));
  ASSERT_TRUE(rowHasNull(cols, 2));
  ASSERT_FALSE(rowHasNull(cols, 0));
}

TEST_F(ColumnOpsTest, CompareRows) {
  std::vector<ColumnPtr> cols{makeColumn(ctx().int32(), "1,,3")};
  std::vector<SortOrder> nulls_first{{false, false}};
  ASSERT_LT(compareRows(cols, nulls_first, 1, 0), 0);
  ASSERT_LT(compareRows(cols, nulls_first, 0, 2), 0);

  std::vector<SortOrder> desc_nulls_last{{true, true}};
  ASSERT_GT(compareRows(cols, desc_nulls_last, 1, 0), 0);
  ASSERT_GT(compareRows(cols, desc_nulls_last, 0, 2), 0);
}

TEST_F(ColumnOpsTest, ListColumns) {
  auto list_type = ctx().list(ctx().int32());
  auto col = makeColumn(list_type, "[1;2],[],,[;3]");
  ASSERT_EQ(col->size(), (size_t)4);
  ASSERT_EQ(toStrings(*col), (Strings{"[1, 2]", "[]", "null", "[null, 3]"}));
  ASSERT_EQ(col->listLength(0), (size_t)2);
  ASSERT_EQ(col->listLength(1), (size_t)0);

  auto taken = take(col, {3, 0});
  ASSERT_EQ(toStrings(*taken), (Strings{"[null, 3]", "[1, 2]"}));

  auto as_fp = cast(col, ctx().list(ctx().fp64()), true);
  ASSERT_EQ(toStrings(*as_fp), (Strings{"[1, 2]", "[]", "null", "[null, 3]"}));
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
