/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "Column.h"

#include "IR/DateTime.h"
#include "Logger/Logger.h"

#include <sstream>

namespace lqe {

Column::Storage Column::storageFor(const ir::Type* type) {
  if (type->isFloatingPoint()) {
    return Storage::kFp;
  }
  if (type->isText()) {
    return Storage::kStr;
  }
  if (type->isList()) {
    return Storage::kList;
  }
  CHECK(type->isIntegerStorage()) << type->toString();
  return Storage::kInt;
}

Column::Column(const ir::Type* type, size_t size)
    : type_(type), storage_(storageFor(type)), size_(size) {}

ColumnPtr Column::makeInt(const ir::Type* type,
                          std::vector<int64_t> values,
                          ValidityBitmap validity) {
  CHECK(storageFor(type) == Storage::kInt);
  CHECK(validity.empty() || validity.size() == values.size());
  std::shared_ptr<Column> res(new Column(type, values.size()));
  res->ints_ = std::move(values);
  res->validity_ = std::move(validity);
  return res;
}

ColumnPtr Column::makeFp(const ir::Type* type,
                         std::vector<double> values,
                         ValidityBitmap validity) {
  CHECK(storageFor(type) == Storage::kFp);
  CHECK(validity.empty() || validity.size() == values.size());
  std::shared_ptr<Column> res(new Column(type, values.size()));
  res->fps_ = std::move(values);
  res->validity_ = std::move(validity);
  return res;
}

ColumnPtr Column::makeStr(const ir::Type* type,
                          std::vector<std::string> values,
                          ValidityBitmap validity) {
  CHECK(storageFor(type) == Storage::kStr);
  CHECK(validity.empty() || validity.size() == values.size());
  std::shared_ptr<Column> res(new Column(type, values.size()));
  res->strs_ = std::move(values);
  res->validity_ = std::move(validity);
  return res;
}

ColumnPtr Column::makeList(const ir::Type* type,
                           std::vector<size_t> offsets,
                           ColumnPtr child,
                           ValidityBitmap validity) {
  CHECK(type->isList());
  CHECK(!offsets.empty());
  CHECK_EQ(offsets.back(), child->size());
  CHECK(validity.empty() || validity.size() + 1 == offsets.size());
  std::shared_ptr<Column> res(new Column(type, offsets.size() - 1));
  res->offsets_ = std::move(offsets);
  res->child_ = std::move(child);
  res->validity_ = std::move(validity);
  return res;
}

ColumnPtr Column::makeNull(const ir::Type* type, size_t size) {
  ColumnBuilder builder(type, size);
  for (size_t i = 0; i < size; ++i) {
    builder.appendNull();
  }
  return builder.finish();
}

ColumnPtr Column::makeConstant(const ir::Type* type, const Datum& value, size_t size) {
  if (lqe::isNull(value)) {
    return makeNull(type, size);
  }
  ColumnBuilder builder(type, size);
  for (size_t i = 0; i < size; ++i) {
    builder.appendDatum(value);
  }
  return builder.finish();
}

bool Column::hasNulls() const {
  return !validity_.empty() && !validity_.all();
}

size_t Column::nullCount() const {
  return validity_.empty() ? 0 : size_ - validity_.count();
}

Datum Column::valueAt(size_t idx) const {
  if (isNull(idx)) {
    return Datum();
  }
  switch (storage_) {
    case Storage::kInt:
      return ints_[idx];
    case Storage::kFp:
      return fps_[idx];
    case Storage::kStr:
      return strs_[idx];
    case Storage::kList:
      return Datum();
  }
  UNREACHABLE();
  return Datum();
}

std::string Column::valueToString(size_t idx) const {
  if (isNull(idx)) {
    return "null";
  }
  switch (storage_) {
    case Storage::kInt:
      if (type_->isBoolean()) {
        return ints_[idx] ? "true" : "false";
      }
      if (type_->isDate()) {
        return ir::formatDate(ints_[idx]);
      }
      if (type_->isTimestamp()) {
        return ir::formatTimestamp(ints_[idx]);
      }
      return std::to_string(ints_[idx]);
    case Storage::kFp: {
      std::ostringstream ss;
      ss << fps_[idx];
      return ss.str();
    }
    case Storage::kStr:
      return strs_[idx];
    case Storage::kList: {
      std::string res = "[";
      for (size_t i = offsets_[idx]; i < offsets_[idx + 1]; ++i) {
        if (i != offsets_[idx]) {
          res += ", ";
        }
        res += child_->valueToString(i);
      }
      return res + "]";
    }
  }
  UNREACHABLE();
  return "";
}

ColumnBuilder::ColumnBuilder(const ir::Type* type, size_t reserve)
    : type_(type), storage_(Column::storageFor(type)) {
  switch (storage_) {
    case Column::Storage::kInt:
      ints_.reserve(reserve);
      break;
    case Column::Storage::kFp:
      fps_.reserve(reserve);
      break;
    case Column::Storage::kStr:
      strs_.reserve(reserve);
      break;
    case Column::Storage::kList:
      offsets_.reserve(reserve + 1);
      offsets_.push_back(0);
      child_ = std::make_unique<ColumnBuilder>(type->as<ir::ListType>()->elemType());
      break;
  }
}

void ColumnBuilder::appendValid() {
  if (!validity_.empty()) {
    validity_.push_back(true);
  }
  ++size_;
}

void ColumnBuilder::appendNull() {
  if (validity_.empty()) {
    validity_.resize(size_, true);
  }
  validity_.push_back(false);
  ++size_;
  switch (storage_) {
    case Column::Storage::kInt:
      ints_.push_back(0);
      break;
    case Column::Storage::kFp:
      fps_.push_back(0);
      break;
    case Column::Storage::kStr:
      strs_.emplace_back();
      break;
    case Column::Storage::kList:
      offsets_.push_back(child_->size());
      break;
  }
}

void ColumnBuilder::appendInt(int64_t val) {
  CHECK(storage_ == Column::Storage::kInt);
  ints_.push_back(val);
  appendValid();
}

void ColumnBuilder::appendFp(double val) {
  CHECK(storage_ == Column::Storage::kFp);
  fps_.push_back(val);
  appendValid();
}

void ColumnBuilder::appendStr(std::string val) {
  CHECK(storage_ == Column::Storage::kStr);
  strs_.push_back(std::move(val));
  appendValid();
}

void ColumnBuilder::appendDatum(const Datum& val) {
  if (lqe::isNull(val)) {
    appendNull();
    return;
  }
  switch (storage_) {
    case Column::Storage::kInt:
      if (auto dval = std::get_if<double>(&val)) {
        appendInt(static_cast<int64_t>(*dval));
      } else {
        appendInt(std::get<int64_t>(val));
      }
      return;
    case Column::Storage::kFp:
      if (auto ival = std::get_if<int64_t>(&val)) {
        appendFp(static_cast<double>(*ival));
      } else {
        appendFp(std::get<double>(val));
      }
      return;
    case Column::Storage::kStr:
      appendStr(std::get<std::string>(val));
      return;
    case Column::Storage::kList:
      break;
  }
  LOG(FATAL) << "Cannot append a scalar value to " << type_->toString() << " column";
}

void ColumnBuilder::appendFrom(const Column& col, size_t idx) {
  if (col.isNull(idx)) {
    appendNull();
    return;
  }
  CHECK(col.storage() == storage_)
      << col.type()->toString() << " vs " << type_->toString();
  switch (storage_) {
    case Column::Storage::kInt:
      appendInt(col.intAt(idx));
      return;
    case Column::Storage::kFp:
      appendFp(col.fpAt(idx));
      return;
    case Column::Storage::kStr:
      appendStr(col.strAt(idx));
      return;
    case Column::Storage::kList:
      child_->appendRange(
          *col.child(), col.listOffset(idx), col.listOffset(idx) + col.listLength(idx));
      finishListRow();
      return;
  }
}

void ColumnBuilder::appendRange(const Column& col, size_t begin, size_t end) {
  for (size_t i = begin; i < end; ++i) {
    appendFrom(col, i);
  }
}

ColumnBuilder& ColumnBuilder::childBuilder() {
  CHECK(child_);
  return *child_;
}

void ColumnBuilder::finishListRow() {
  CHECK(storage_ == Column::Storage::kList);
  offsets_.push_back(child_->size());
  appendValid();
}

ColumnPtr ColumnBuilder::finish() {
  ColumnPtr res;
  switch (storage_) {
    case Column::Storage::kInt:
      res = Column::makeInt(type_, std::move(ints_), std::move(validity_));
      break;
    case Column::Storage::kFp:
      res = Column::makeFp(type_, std::move(fps_), std::move(validity_));
      break;
    case Column::Storage::kStr:
      res = Column::makeStr(type_, std::move(strs_), std::move(validity_));
      break;
    case Column::Storage::kList:
      res = Column::makeList(
          type_, std::move(offsets_), child_->finish(), std::move(validity_));
      child_ = std::make_unique<ColumnBuilder>(type_->as<ir::ListType>()->elemType());
      offsets_ = {0};
      break;
  }
  ints_.clear();
  fps_.clear();
  strs_.clear();
  validity_.clear();
  size_ = 0;
  return res;
}

}  // namespace lqe
