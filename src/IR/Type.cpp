/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "Type.h"
#include "Context.h"
#include "Exception.h"

#include <limits>

namespace lqe::ir {

Type::Type(Context& ctx, Id id, int size) : ctx_(ctx), id_(id), size_(size) {}

bool Type::equal(const Type& other) const {
  if (&ctx_ == &other.ctx_) {
    return this == &other;
  }
  return id_ == other.id_ && size_ == other.size_;
}

bool Type::operator==(const Type& other) const {
  return equal(other);
}

NullType::NullType(Context& ctx) : Type(ctx, kNull, 0) {}

const NullType* NullType::make(Context& ctx) {
  return ctx.null();
}

std::string NullType::toString() const {
  return "NULLT";
}

BooleanType::BooleanType(Context& ctx) : Type(ctx, kBoolean, 1) {}

const BooleanType* BooleanType::make(Context& ctx) {
  return ctx.boolean();
}

std::string BooleanType::toString() const {
  return "BOOL";
}

IntegerType::IntegerType(Context& ctx, int size) : Type(ctx, kInteger, size) {}

const IntegerType* IntegerType::make(Context& ctx, int size) {
  return ctx.integer(size);
}

std::string IntegerType::toString() const {
  return "INT" + std::to_string(size_ * 8);
}

int64_t IntegerType::minValue() const {
  switch (size_) {
    case 1:
      return std::numeric_limits<int8_t>::min();
    case 2:
      return std::numeric_limits<int16_t>::min();
    case 4:
      return std::numeric_limits<int32_t>::min();
    default:
      return std::numeric_limits<int64_t>::min();
  }
}

int64_t IntegerType::maxValue() const {
  switch (size_) {
    case 1:
      return std::numeric_limits<int8_t>::max();
    case 2:
      return std::numeric_limits<int16_t>::max();
    case 4:
      return std::numeric_limits<int32_t>::max();
    default:
      return std::numeric_limits<int64_t>::max();
  }
}

FloatingPointType::FloatingPointType(Context& ctx, Precision precision)
    : Type(ctx, kFloatingPoint, precisionToSize(precision)), precision_(precision) {}

int FloatingPointType::precisionToSize(Precision precision) {
  switch (precision) {
    case kFloat:
      return 4;
    case kDouble:
      return 8;
    default:
      throw SchemaError() << "Unexpected precision value: " << (int)precision;
  }
}

const FloatingPointType* FloatingPointType::make(Context& ctx, Precision precision) {
  return ctx.fp(precision);
}

std::string FloatingPointType::toString() const {
  return precision_ == kFloat ? "FP32" : "FP64";
}

TextType::TextType(Context& ctx) : Type(ctx, kText, 0) {}

const TextType* TextType::make(Context& ctx) {
  return ctx.text();
}

std::string TextType::toString() const {
  return "TEXT";
}

DateType::DateType(Context& ctx) : Type(ctx, kDate, 4) {}

const DateType* DateType::make(Context& ctx) {
  return ctx.date();
}

std::string DateType::toString() const {
  return "DATE";
}

TimestampType::TimestampType(Context& ctx) : Type(ctx, kTimestamp, 8) {}

const TimestampType* TimestampType::make(Context& ctx) {
  return ctx.timestamp();
}

std::string TimestampType::toString() const {
  return "TIMESTAMP[us]";
}

ListType::ListType(Context& ctx, const Type* elem_type)
    : Type(ctx, kList, 0), elem_type_(elem_type) {}

const ListType* ListType::make(Context& ctx, const Type* elem_type) {
  return ctx.list(elem_type);
}

bool ListType::equal(const Type& other) const {
  if (!Type::equal(other)) {
    return false;
  }
  if (&ctx_ == &other.ctx()) {
    return true;
  }
  return elem_type_->equal(*static_cast<const ListType&>(other).elemType());
}

std::string ListType::toString() const {
  return "LIST<" + elem_type_->toString() + ">";
}

std::ostream& operator<<(std::ostream& os, const Type* type) {
  if (!type) {
    return os << "<null type>";
  }
  return os << type->toString();
}

}  // namespace lqe::ir
