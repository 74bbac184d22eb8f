/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "Context.h"
#include "Exception.h"
#include "Type.h"

#include <map>
#include <mutex>
#include <unordered_map>

namespace lqe::ir {

class ContextImpl {
 public:
  ContextImpl(Context& ctx) : ctx_(ctx) {
    null_type_.reset(new NullType(ctx_));
    boolean_type_.reset(new BooleanType(ctx_));
    text_type_.reset(new TextType(ctx_));
    date_type_.reset(new DateType(ctx_));
    timestamp_type_.reset(new TimestampType(ctx_));
  }

  const NullType* null() { return null_type_.get(); }

  const BooleanType* boolean() { return boolean_type_.get(); }

  const IntegerType* integer(int size) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& res = integer_types_[size];
    if (!res) {
      if (size != 1 && size != 2 && size != 4 && size != 8) {
        throw SchemaError() << "Unsupported integer size (must be 1, 2, 4, 8): " << size;
      }
      res.reset(new IntegerType(ctx_, size));
    }
    return res.get();
  }

  const FloatingPointType* fp(FloatingPointType::Precision precision) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& res = floating_point_types_[precision];
    if (!res) {
      res.reset(new FloatingPointType(ctx_, precision));
    }
    return res.get();
  }

  const TextType* text() { return text_type_.get(); }

  const DateType* date() { return date_type_.get(); }

  const TimestampType* timestamp() { return timestamp_type_.get(); }

  const ListType* list(const Type* elem_type) {
    if (&elem_type->ctx() != &ctx_) {
      elem_type = copyType(elem_type);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto& res = list_types_[elem_type];
    if (!res) {
      res.reset(new ListType(ctx_, elem_type));
    }
    return res.get();
  }

  const Type* copyType(const Type* type) {
    if (&type->ctx() == &ctx_) {
      return type;
    }
    switch (type->id()) {
      case Type::kNull:
        return null();
      case Type::kBoolean:
        return boolean();
      case Type::kInteger:
        return integer(type->size());
      case Type::kFloatingPoint:
        return fp(static_cast<const FloatingPointType*>(type)->precision());
      case Type::kText:
        return text();
      case Type::kDate:
        return date();
      case Type::kTimestamp:
        return timestamp();
      case Type::kList:
        return list(copyType(static_cast<const ListType*>(type)->elemType()));
    }
    throw SchemaError() << "Cannot copy unknown type: " << type->toString();
  }

 private:
  Context& ctx_;
  std::mutex mutex_;
  std::unique_ptr<const NullType> null_type_;
  std::unique_ptr<const BooleanType> boolean_type_;
  std::unique_ptr<const TextType> text_type_;
  std::unique_ptr<const DateType> date_type_;
  std::unique_ptr<const TimestampType> timestamp_type_;
  std::map<int, std::unique_ptr<const IntegerType>> integer_types_;
  std::map<FloatingPointType::Precision, std::unique_ptr<const FloatingPointType>>
      floating_point_types_;
  std::unordered_map<const Type*, std::unique_ptr<const ListType>> list_types_;
};

Context::Context() : impl_(std::make_unique<ContextImpl>(*this)) {}

Context::~Context() {}

const NullType* Context::null() {
  return impl_->null();
}

const BooleanType* Context::boolean() {
  return impl_->boolean();
}

const IntegerType* Context::integer(int size) {
  return impl_->integer(size);
}

const IntegerType* Context::int8() {
  return impl_->integer(1);
}

const IntegerType* Context::int16() {
  return impl_->integer(2);
}

const IntegerType* Context::int32() {
  return impl_->integer(4);
}

const IntegerType* Context::int64() {
  return impl_->integer(8);
}

const FloatingPointType* Context::fp(FloatingPointType::Precision precision) {
  return impl_->fp(precision);
}

const FloatingPointType* Context::fp32() {
  return impl_->fp(FloatingPointType::kFloat);
}

const FloatingPointType* Context::fp64() {
  return impl_->fp(FloatingPointType::kDouble);
}

const TextType* Context::text() {
  return impl_->text();
}

const DateType* Context::date() {
  return impl_->date();
}

const TimestampType* Context::timestamp() {
  return impl_->timestamp();
}

const ListType* Context::list(const Type* elem_type) {
  return impl_->list(elem_type);
}

const Type* Context::copyType(const Type* type) {
  return impl_->copyType(type);
}

Context& Context::defaultCtx() {
  static Context default_context;
  return default_context;
}

}  // namespace lqe::ir
