/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "IR/Type.h"
#include "Shared/Datum.h"

#include <boost/dynamic_bitset.hpp>

#include <memory>
#include <string>
#include <vector>

namespace lqe {

class Column;
using ColumnPtr = std::shared_ptr<const Column>;
using ValidityBitmap = boost::dynamic_bitset<>;

/**
 * Immutable nullable column. Values are stored in one of the lanes chosen by
 * the type: booleans, integers, dates, timestamps and nulls use the int64 lane,
 * floating point types use the double lane, text uses the string lane and lists
 * use offsets into a child column. An empty validity bitmap means there are no
 * nulls. Values in null slots are unspecified.
 */
class Column {
 public:
  enum class Storage {
    kInt,
    kFp,
    kStr,
    kList,
  };

  static Storage storageFor(const ir::Type* type);

  static ColumnPtr makeInt(const ir::Type* type,
                           std::vector<int64_t> values,
                           ValidityBitmap validity = {});
  static ColumnPtr makeFp(const ir::Type* type,
                          std::vector<double> values,
                          ValidityBitmap validity = {});
  static ColumnPtr makeStr(const ir::Type* type,
                           std::vector<std::string> values,
                           ValidityBitmap validity = {});
  // Offsets have size + 1 elements.
  static ColumnPtr makeList(const ir::Type* type,
                            std::vector<size_t> offsets,
                            ColumnPtr child,
                            ValidityBitmap validity = {});
  static ColumnPtr makeNull(const ir::Type* type, size_t size);
  // Column of the given size with all values equal to the datum.
  static ColumnPtr makeConstant(const ir::Type* type, const Datum& value, size_t size);

  const ir::Type* type() const { return type_; }
  Storage storage() const { return storage_; }
  size_t size() const { return size_; }

  bool isNull(size_t idx) const { return !validity_.empty() && !validity_[idx]; }
  bool hasNulls() const;
  size_t nullCount() const;
  const ValidityBitmap& validity() const { return validity_; }

  int64_t intAt(size_t idx) const { return ints_[idx]; }
  double fpAt(size_t idx) const { return fps_[idx]; }
  const std::string& strAt(size_t idx) const { return strs_[idx]; }
  // Numeric value of int or fp storage.
  double numAt(size_t idx) const {
    return storage_ == Storage::kFp ? fps_[idx] : static_cast<double>(ints_[idx]);
  }

  size_t listOffset(size_t idx) const { return offsets_[idx]; }
  size_t listLength(size_t idx) const { return offsets_[idx + 1] - offsets_[idx]; }
  const ColumnPtr& child() const { return child_; }

  const std::vector<int64_t>& ints() const { return ints_; }
  const std::vector<double>& fps() const { return fps_; }
  const std::vector<std::string>& strs() const { return strs_; }
  const std::vector<size_t>& offsets() const { return offsets_; }

  // Scalar value. Lists are not representable and produce a null datum.
  Datum valueAt(size_t idx) const;
  std::string valueToString(size_t idx) const;

 private:
  friend class ColumnBuilder;

  Column(const ir::Type* type, size_t size);

  const ir::Type* type_;
  Storage storage_;
  size_t size_;
  ValidityBitmap validity_;
  std::vector<int64_t> ints_;
  std::vector<double> fps_;
  std::vector<std::string> strs_;
  std::vector<size_t> offsets_;
  ColumnPtr child_;
};

/**
 * Row by row column construction. The validity bitmap is allocated on the
 * first null.
 */
class ColumnBuilder {
 public:
  explicit ColumnBuilder(const ir::Type* type, size_t reserve = 0);

  const ir::Type* type() const { return type_; }
  size_t size() const { return size_; }

  void appendNull();
  void appendInt(int64_t val);
  void appendFp(double val);
  void appendStr(std::string val);
  // Appends a scalar value converted to the builder type storage.
  void appendDatum(const Datum& val);
  // Copies a row of a column with the same storage.
  void appendFrom(const Column& col, size_t idx);
  void appendRange(const Column& col, size_t begin, size_t end);

  // List elements are appended to the child builder, then the row is closed.
  ColumnBuilder& childBuilder();
  void finishListRow();

  ColumnPtr finish();

 private:
  void appendValid();

  const ir::Type* type_;
  Column::Storage storage_;
  size_t size_ = 0;
  ValidityBitmap validity_;
  std::vector<int64_t> ints_;
  std::vector<double> fps_;
  std::vector<std::string> strs_;
  std::vector<size_t> offsets_;
  std::unique_ptr<ColumnBuilder> child_;
};

}  // namespace lqe
