/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ColumnOps.h"

#include "IR/DateTime.h"
#include "IR/Exception.h"
#include "IR/OpType.h"
#include "Logger/Logger.h"

#include <boost/functional/hash.hpp>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <optional>

namespace lqe {

namespace {

constexpr size_t kNullHash = 0x9e3779b97f4a7c15ULL;

inline size_t rowIdx(const Column& col, size_t row) {
  return col.size() == 1 ? 0 : row;
}

size_t resultRows(const Column& lhs, const Column& rhs) {
  if (lhs.size() == 1) {
    return rhs.size();
  }
  if (rhs.size() == 1) {
    return lhs.size();
  }
  CHECK_EQ(lhs.size(), rhs.size());
  return lhs.size();
}

double canonicalFp(double val) {
  if (std::isnan(val)) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  return val == 0.0 ? 0.0 : val;
}

double roundToType(double val, const ir::Type* type) {
  return type->isFp32() ? static_cast<double>(static_cast<float>(val)) : val;
}

std::optional<int64_t> parseInteger(const std::string& str) {
  if (str.empty()) {
    return std::nullopt;
  }
  errno = 0;
  char* end = nullptr;
  auto res = std::strtoll(str.c_str(), &end, 10);
  if (errno == ERANGE || end != str.c_str() + str.size()) {
    return std::nullopt;
  }
  return static_cast<int64_t>(res);
}

std::optional<double> parseFp(const std::string& str) {
  if (str.empty()) {
    return std::nullopt;
  }
  char* end = nullptr;
  auto res = std::strtod(str.c_str(), &end);
  if (end != str.c_str() + str.size()) {
    return std::nullopt;
  }
  return res;
}

std::optional<Datum> checkIntRange(int64_t val, const ir::Type* type) {
  auto int_type = type->as<ir::IntegerType>();
  if (val < int_type->minValue() || val > int_type->maxValue()) {
    return std::nullopt;
  }
  return Datum(val);
}

std::optional<Datum> castIntValue(int64_t val, const ir::Type* from, const ir::Type* to) {
  if (to->isBoolean()) {
    return Datum(static_cast<int64_t>(val != 0));
  }
  if (to->isInteger()) {
    return checkIntRange(val, to);
  }
  if (to->isFloatingPoint()) {
    return Datum(roundToType(static_cast<double>(val), to));
  }
  if (to->isDate()) {
    return Datum(from->isTimestamp() ? ir::timestampToDays(val) : val);
  }
  if (to->isTimestamp()) {
    return Datum(from->isDate() ? val * ir::kMicrosecsPerDay : val);
  }
  return std::nullopt;
}

std::optional<Datum> castFpValue(double val, const ir::Type* to) {
  if (to->isBoolean()) {
    return Datum(static_cast<int64_t>(val != 0));
  }
  if (to->isInteger()) {
    auto int_type = to->as<ir::IntegerType>();
    if (!std::isfinite(val)) {
      return std::nullopt;
    }
    auto truncated = std::trunc(val);
    // 2^63 is exactly representable, int64 max is not.
    if (truncated < static_cast<double>(int_type->minValue()) ||
        truncated >= -static_cast<double>(int_type->minValue()) ||
        truncated > static_cast<double>(int_type->maxValue())) {
      return std::nullopt;
    }
    return Datum(static_cast<int64_t>(truncated));
  }
  if (to->isFloatingPoint()) {
    return Datum(roundToType(val, to));
  }
  return std::nullopt;
}

std::optional<Datum> castTextValue(const std::string& val, const ir::Type* to) {
  if (to->isBoolean()) {
    if (val == "true") {
      return Datum(int64_t(1));
    }
    if (val == "false") {
      return Datum(int64_t(0));
    }
    return std::nullopt;
  }
  if (to->isInteger()) {
    auto res = parseInteger(val);
    return res ? checkIntRange(*res, to) : std::nullopt;
  }
  if (to->isFloatingPoint()) {
    auto res = parseFp(val);
    return res ? std::optional<Datum>(roundToType(*res, to)) : std::nullopt;
  }
  if (to->isDate()) {
    auto res = ir::parseDate(val);
    return res ? std::optional<Datum>(*res) : std::nullopt;
  }
  if (to->isTimestamp()) {
    auto res = ir::parseTimestamp(val);
    return res ? std::optional<Datum>(*res) : std::nullopt;
  }
  return std::nullopt;
}

std::optional<Datum> castValue(const Column& col, size_t row, const ir::Type* to) {
  if (to->isText()) {
    return Datum(col.valueToString(row));
  }
  switch (col.storage()) {
    case Column::Storage::kInt:
      return castIntValue(col.intAt(row), col.type(), to);
    case Column::Storage::kFp:
      return castFpValue(col.fpAt(row), to);
    case Column::Storage::kStr:
      return castTextValue(col.strAt(row), to);
    case Column::Storage::kList:
      break;
  }
  return std::nullopt;
}

ColumnPtr compareOp(ir::OpType op, const Column& lhs, const Column& rhs, const ir::Type* type) {
  auto num_rows = resultRows(lhs, rhs);
  ColumnBuilder builder(type, num_rows);
  bool int_cmp =
      lhs.storage() == Column::Storage::kInt && rhs.storage() == Column::Storage::kInt;
  bool str_cmp =
      lhs.storage() == Column::Storage::kStr && rhs.storage() == Column::Storage::kStr;
  for (size_t row = 0; row < num_rows; ++row) {
    auto li = rowIdx(lhs, row);
    auto ri = rowIdx(rhs, row);
    if (lhs.isNull(li) || rhs.isNull(ri)) {
      builder.appendNull();
      continue;
    }
    bool res;
    if (str_cmp) {
      auto cmp = lhs.strAt(li).compare(rhs.strAt(ri));
      switch (op) {
        case ir::OpType::kEq:
          res = cmp == 0;
          break;
        case ir::OpType::kNe:
          res = cmp != 0;
          break;
        case ir::OpType::kLt:
          res = cmp < 0;
          break;
        case ir::OpType::kLe:
          res = cmp <= 0;
          break;
        case ir::OpType::kGt:
          res = cmp > 0;
          break;
        case ir::OpType::kGe:
          res = cmp >= 0;
          break;
        default:
          UNREACHABLE();
          res = false;
      }
    } else if (int_cmp) {
      auto a = lhs.intAt(li);
      auto b = rhs.intAt(ri);
      switch (op) {
        case ir::OpType::kEq:
          res = a == b;
          break;
        case ir::OpType::kNe:
          res = a != b;
          break;
        case ir::OpType::kLt:
          res = a < b;
          break;
        case ir::OpType::kLe:
          res = a <= b;
          break;
        case ir::OpType::kGt:
          res = a > b;
          break;
        case ir::OpType::kGe:
          res = a >= b;
          break;
        default:
          UNREACHABLE();
          res = false;
      }
    } else {
      CHECK(lhs.storage() != Column::Storage::kStr && rhs.storage() != Column::Storage::kStr)
          << "Cannot compare " << lhs.type()->toString() << " and "
          << rhs.type()->toString();
      auto a = lhs.numAt(li);
      auto b = rhs.numAt(ri);
      switch (op) {
        case ir::OpType::kEq:
          res = a == b;
          break;
        case ir::OpType::kNe:
          res = a != b;
          break;
        case ir::OpType::kLt:
          res = a < b;
          break;
        case ir::OpType::kLe:
          res = a <= b;
          break;
        case ir::OpType::kGt:
          res = a > b;
          break;
        case ir::OpType::kGe:
          res = a >= b;
          break;
        default:
          UNREACHABLE();
          res = false;
      }
    }
    builder.appendInt(res);
  }
  return builder.finish();
}

// Kleene logic: false AND null is false, true OR null is true.
ColumnPtr logicOp(ir::OpType op, const Column& lhs, const Column& rhs, const ir::Type* type) {
  auto num_rows = resultRows(lhs, rhs);
  ColumnBuilder builder(type, num_rows);
  bool dominant = op == ir::OpType::kOr;
  for (size_t row = 0; row < num_rows; ++row) {
    auto li = rowIdx(lhs, row);
    auto ri = rowIdx(rhs, row);
    bool lnull = lhs.isNull(li);
    bool rnull = rhs.isNull(ri);
    bool lval = !lnull && lhs.intAt(li);
    bool rval = !rnull && rhs.intAt(ri);
    if ((!lnull && lval == dominant) || (!rnull && rval == dominant)) {
      builder.appendInt(dominant);
    } else if (lnull || rnull) {
      builder.appendNull();
    } else {
      builder.appendInt(!dominant);
    }
  }
  return builder.finish();
}

double fpArith(ir::OpType op, double a, double b) {
  switch (op) {
    case ir::OpType::kPlus:
      return a + b;
    case ir::OpType::kMinus:
      return a - b;
    case ir::OpType::kMul:
      return a * b;
    case ir::OpType::kDiv:
      return a / b;
    case ir::OpType::kMod: {
      auto res = std::fmod(a, b);
      if (res != 0 && ((res < 0) != (b < 0))) {
        res += b;
      }
      return res;
    }
    case ir::OpType::kFloorDiv:
      return std::floor(a / b);
    default:
      break;
  }
  UNREACHABLE();
  return 0;
}

int64_t intArith(ir::OpType op, int64_t a, int64_t b, int size) {
  auto ua = static_cast<uint64_t>(a);
  auto ub = static_cast<uint64_t>(b);
  switch (op) {
    case ir::OpType::kPlus:
      return wrapInteger(static_cast<int64_t>(ua + ub), size);
    case ir::OpType::kMinus:
      return wrapInteger(static_cast<int64_t>(ua - ub), size);
    case ir::OpType::kMul:
      return wrapInteger(static_cast<int64_t>(ua * ub), size);
    case ir::OpType::kMod:
    case ir::OpType::kFloorDiv: {
      if (b == 0) {
        throw ir::ComputeError() << "Integer division by zero";
      }
      if (b == -1) {
        return op == ir::OpType::kMod ? 0
                                      : wrapInteger(static_cast<int64_t>(0 - ua), size);
      }
      auto quot = a / b;
      auto rem = a % b;
      if (rem != 0 && ((rem < 0) != (b < 0))) {
        quot -= 1;
        rem += b;
      }
      return wrapInteger(op == ir::OpType::kMod ? rem : quot, size);
    }
    default:
      break;
  }
  UNREACHABLE();
  return 0;
}

ColumnPtr arithmeticOp(ir::OpType op,
                       const Column& lhs,
                       const Column& rhs,
                       const ir::Type* type) {
  auto num_rows = resultRows(lhs, rhs);
  if (type->isNull()) {
    return Column::makeNull(type, num_rows);
  }
  ColumnBuilder builder(type, num_rows);
  if (type->isFloatingPoint()) {
    for (size_t row = 0; row < num_rows; ++row) {
      auto li = rowIdx(lhs, row);
      auto ri = rowIdx(rhs, row);
      if (lhs.isNull(li) || rhs.isNull(ri)) {
        builder.appendNull();
        continue;
      }
      builder.appendFp(roundToType(fpArith(op, lhs.numAt(li), rhs.numAt(ri)), type));
    }
    return builder.finish();
  }
  CHECK(type->isInteger()) << type->toString();
  CHECK(lhs.storage() == Column::Storage::kInt && rhs.storage() == Column::Storage::kInt);
  for (size_t row = 0; row < num_rows; ++row) {
    auto li = rowIdx(lhs, row);
    auto ri = rowIdx(rhs, row);
    if (lhs.isNull(li) || rhs.isNull(ri)) {
      builder.appendNull();
      continue;
    }
    builder.appendInt(intArith(op, lhs.intAt(li), rhs.intAt(ri), type->size()));
  }
  return builder.finish();
}

}  // namespace

ColumnPtr take(const ColumnPtr& col, const std::vector<int64_t>& indices) {
  ColumnBuilder builder(col->type(), indices.size());
  for (auto idx : indices) {
    if (idx < 0) {
      builder.appendNull();
    } else {
      builder.appendFrom(*col, static_cast<size_t>(idx));
    }
  }
  return builder.finish();
}

Batch take(const Batch& batch, const std::vector<int64_t>& indices) {
  std::vector<ColumnPtr> columns;
  columns.reserve(batch.numColumns());
  for (auto& col : batch.columns()) {
    columns.push_back(take(col, indices));
  }
  return Batch(batch.schema(), std::move(columns), indices.size());
}

std::vector<int64_t> maskToIndices(const Column& mask, size_t num_rows) {
  std::vector<int64_t> res;
  if (mask.size() == 1) {
    if (!mask.isNull(0) && mask.intAt(0)) {
      res.resize(num_rows);
      for (size_t i = 0; i < num_rows; ++i) {
        res[i] = static_cast<int64_t>(i);
      }
    }
    return res;
  }
  CHECK_EQ(mask.size(), num_rows);
  for (size_t i = 0; i < num_rows; ++i) {
    if (!mask.isNull(i) && mask.intAt(i)) {
      res.push_back(static_cast<int64_t>(i));
    }
  }
  return res;
}

Batch filter(const Batch& batch, const Column& mask) {
  auto indices = maskToIndices(mask, batch.numRows());
  if (indices.size() == batch.numRows()) {
    return batch;
  }
  return take(batch, indices);
}

ColumnPtr concat(const std::vector<ColumnPtr>& cols) {
  CHECK(!cols.empty());
  if (cols.size() == 1) {
    return cols.front();
  }
  size_t total = 0;
  for (auto& col : cols) {
    total += col->size();
  }
  ColumnBuilder builder(cols.front()->type(), total);
  for (auto& col : cols) {
    builder.appendRange(*col, 0, col->size());
  }
  return builder.finish();
}

Batch concat(const ir::Schema& schema, const BatchList& batches) {
  if (batches.empty()) {
    return Batch::makeEmpty(schema);
  }
  if (batches.size() == 1) {
    return batches.front();
  }
  size_t num_rows = 0;
  for (auto& batch : batches) {
    num_rows += batch.numRows();
  }
  std::vector<ColumnPtr> columns;
  columns.reserve(schema.size());
  for (size_t col_idx = 0; col_idx < schema.size(); ++col_idx) {
    std::vector<ColumnPtr> parts;
    parts.reserve(batches.size());
    for (auto& batch : batches) {
      parts.push_back(batch.column(col_idx));
    }
    columns.push_back(concat(parts));
  }
  return Batch(schema, std::move(columns), num_rows);
}

ColumnPtr broadcast(const ColumnPtr& col, size_t num_rows) {
  if (col->size() == num_rows) {
    return col;
  }
  CHECK_EQ(col->size(), (size_t)1);
  ColumnBuilder builder(col->type(), num_rows);
  for (size_t i = 0; i < num_rows; ++i) {
    builder.appendFrom(*col, 0);
  }
  return builder.finish();
}

ColumnPtr cast(const ColumnPtr& col, const ir::Type* type, bool strict) {
  auto from = col->type();
  if (from->equal(*type)) {
    return col;
  }
  if (from->isNull()) {
    return Column::makeNull(type, col->size());
  }
  if (type->isList()) {
    CHECK(from->isList());
    auto child = cast(col->child(), type->as<ir::ListType>()->elemType(), strict);
    return Column::makeList(type, col->offsets(), child, col->validity());
  }
  ColumnBuilder builder(type, col->size());
  for (size_t row = 0; row < col->size(); ++row) {
    if (col->isNull(row)) {
      builder.appendNull();
      continue;
    }
    auto val = castValue(*col, row, type);
    if (!val) {
      if (strict) {
        throw ir::ComputeError() << "Cannot cast value '" << col->valueToString(row)
                                 << "' from " << from->toString() << " to "
                                 << type->toString();
      }
      builder.appendNull();
      continue;
    }
    builder.appendDatum(*val);
  }
  return builder.finish();
}

ColumnPtr binaryOp(ir::OpType op,
                   const ColumnPtr& lhs,
                   const ColumnPtr& rhs,
                   const ir::Type* type) {
  if (ir::isLogic(op)) {
    return logicOp(op, *lhs, *rhs, type);
  }
  if (ir::isComparison(op)) {
    return compareOp(op, *lhs, *rhs, type);
  }
  if (ir::isArithmetic(op)) {
    return arithmeticOp(op, *lhs, *rhs, type);
  }
  throw ir::InvalidOperationError() << "Not a binary operation: " << op;
}

ColumnPtr unaryOp(ir::OpType op, const ColumnPtr& col, const ir::Type* type) {
  ColumnBuilder builder(type, col->size());
  switch (op) {
    case ir::OpType::kNot:
      for (size_t row = 0; row < col->size(); ++row) {
        if (col->isNull(row)) {
          builder.appendNull();
        } else {
          builder.appendInt(!col->intAt(row));
        }
      }
      break;
    case ir::OpType::kUMinus:
      for (size_t row = 0; row < col->size(); ++row) {
        if (col->isNull(row)) {
          builder.appendNull();
        } else if (type->isFloatingPoint()) {
          builder.appendFp(-col->numAt(row));
        } else {
          builder.appendInt(wrapInteger(
              static_cast<int64_t>(0 - static_cast<uint64_t>(col->intAt(row))),
              type->size()));
        }
      }
      break;
    case ir::OpType::kIsNull:
    case ir::OpType::kIsNotNull: {
      bool is_null_op = op == ir::OpType::kIsNull;
      for (size_t row = 0; row < col->size(); ++row) {
        builder.appendInt(col->isNull(row) == is_null_op);
      }
      break;
    }
    default:
      throw ir::InvalidOperationError() << "Not a unary operation: " << op;
  }
  return builder.finish();
}

int64_t wrapInteger(int64_t val, int size) {
  switch (size) {
    case 1:
      return static_cast<int8_t>(val);
    case 2:
      return static_cast<int16_t>(val);
    case 4:
      return static_cast<int32_t>(val);
    default:
      return val;
  }
}

size_t hashValue(const Column& col, size_t row) {
  if (col.isNull(row)) {
    return kNullHash;
  }
  switch (col.storage()) {
    case Column::Storage::kInt:
      return boost::hash_value(col.intAt(row));
    case Column::Storage::kFp:
      return boost::hash_value(canonicalFp(col.fpAt(row)));
    case Column::Storage::kStr:
      return boost::hash_value(col.strAt(row));
    case Column::Storage::kList: {
      size_t res = col.listLength(row);
      auto& child = *col.child();
      for (size_t i = col.listOffset(row); i < col.listOffset(row + 1); ++i) {
        boost::hash_combine(res, hashValue(child, i));
      }
      return res;
    }
  }
  UNREACHABLE();
  return 0;
}

void hashRows(const std::vector<ColumnPtr>& cols,
              size_t begin,
              size_t end,
              std::vector<size_t>& hashes) {
  hashes.assign(end - begin, 0);
  for (auto& col : cols) {
    for (size_t row = begin; row < end; ++row) {
      boost::hash_combine(hashes[row - begin], hashValue(*col, row));
    }
  }
}

bool valuesEqual(const Column& lhs, size_t lhs_row, const Column& rhs, size_t rhs_row) {
  if (lhs.storage() == Column::Storage::kInt && rhs.storage() == Column::Storage::kInt) {
    return lhs.intAt(lhs_row) == rhs.intAt(rhs_row);
  }
  if (lhs.storage() == Column::Storage::kStr) {
    return rhs.storage() == Column::Storage::kStr &&
           lhs.strAt(lhs_row) == rhs.strAt(rhs_row);
  }
  if (lhs.storage() == Column::Storage::kList) {
    if (rhs.storage() != Column::Storage::kList ||
        lhs.listLength(lhs_row) != rhs.listLength(rhs_row)) {
      return false;
    }
    auto& lchild = *lhs.child();
    auto& rchild = *rhs.child();
    for (size_t i = 0; i < lhs.listLength(lhs_row); ++i) {
      auto li = lhs.listOffset(lhs_row) + i;
      auto ri = rhs.listOffset(rhs_row) + i;
      if (lchild.isNull(li) || rchild.isNull(ri)) {
        if (lchild.isNull(li) != rchild.isNull(ri)) {
          return false;
        }
      } else if (!valuesEqual(lchild, li, rchild, ri)) {
        return false;
      }
    }
    return true;
  }
  auto a = lhs.numAt(lhs_row);
  auto b = rhs.numAt(rhs_row);
  if (std::isnan(a) || std::isnan(b)) {
    return std::isnan(a) && std::isnan(b);
  }
  return a == b;
}

int compareValues(const Column& lhs, size_t lhs_row, const Column& rhs, size_t rhs_row) {
  if (lhs.storage() == Column::Storage::kInt && rhs.storage() == Column::Storage::kInt) {
    auto a = lhs.intAt(lhs_row);
    auto b = rhs.intAt(rhs_row);
    return a < b ? -1 : (a > b ? 1 : 0);
  }
  if (lhs.storage() == Column::Storage::kStr) {
    CHECK(rhs.storage() == Column::Storage::kStr);
    auto cmp = lhs.strAt(lhs_row).compare(rhs.strAt(rhs_row));
    return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
  }
  CHECK(lhs.storage() != Column::Storage::kList && rhs.storage() != Column::Storage::kList);
  auto a = lhs.numAt(lhs_row);
  auto b = rhs.numAt(rhs_row);
  bool a_nan = std::isnan(a);
  bool b_nan = std::isnan(b);
  if (a_nan || b_nan) {
    return a_nan == b_nan ? 0 : (a_nan ? 1 : -1);
  }
  return a < b ? -1 : (a > b ? 1 : 0);
}

bool rowHasNull(const std::vector<ColumnPtr>& cols, size_t row) {
  for (auto& col : cols) {
    if (col->isNull(row)) {
      return true;
    }
  }
  return false;
}

bool rowsEqual(const std::vector<ColumnPtr>& lhs,
               size_t lhs_row,
               const std::vector<ColumnPtr>& rhs,
               size_t rhs_row,
               bool nulls_equal) {
  CHECK_EQ(lhs.size(), rhs.size());
  for (size_t i = 0; i < lhs.size(); ++i) {
    bool lnull = lhs[i]->isNull(lhs_row);
    bool rnull = rhs[i]->isNull(rhs_row);
    if (lnull || rnull) {
      if (!nulls_equal || lnull != rnull) {
        return false;
      }
      continue;
    }
    if (!valuesEqual(*lhs[i], lhs_row, *rhs[i], rhs_row)) {
      return false;
    }
  }
  return true;
}

int compareRows(const std::vector<ColumnPtr>& cols,
                const std::vector<SortOrder>& order,
                size_t lhs_row,
                size_t rhs_row) {
  for (size_t i = 0; i < cols.size(); ++i) {
    auto& col = *cols[i];
    bool lnull = col.isNull(lhs_row);
    bool rnull = col.isNull(rhs_row);
    if (lnull || rnull) {
      if (lnull && rnull) {
        continue;
      }
      bool lhs_first = lnull != order[i].nulls_last;
      return lhs_first ? -1 : 1;
    }
    auto cmp = compareValues(col, lhs_row, col, rhs_row);
    if (cmp) {
      return order[i].descending ? -cmp : cmp;
    }
  }
  return 0;
}

}  // namespace lqe
