/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "Type.h"

#include <memory>

namespace lqe::ir {

class ContextImpl;

// Owns and interns types. Safe to use from multiple threads.
class Context {
 public:
  Context();
  ~Context();

  const NullType* null();
  const BooleanType* boolean();
  const IntegerType* integer(int size);
  const IntegerType* int8();
  const IntegerType* int16();
  const IntegerType* int32();
  const IntegerType* int64();
  const FloatingPointType* fp(FloatingPointType::Precision precision);
  const FloatingPointType* fp32();
  const FloatingPointType* fp64();
  const TextType* text();
  const DateType* date();
  const TimestampType* timestamp();
  const ListType* list(const Type* elem_type);

  // Returns the type with the same meaning interned in this context.
  const Type* copyType(const Type* type);

  static Context& defaultCtx();

 private:
  std::unique_ptr<ContextImpl> impl_;
};

}  // namespace lqe::ir
