/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <iostream>
#include <string>

namespace lqe::ir {

class Context;

/**
 * Column and expression data type. Types are interned in a Context and compared
 * by address. All values of every type can be null.
 */
class Type {
 public:
  enum Id {
    kNull,
    kBoolean,
    kInteger,
    kFloatingPoint,
    kText,
    kDate,
    kTimestamp,
    kList,
  };

  virtual ~Type() = default;

  Context& ctx() const { return ctx_; }
  Id id() const { return id_; }
  int size() const { return size_; }

  bool isNull() const { return id_ == kNull; }
  bool isBoolean() const { return id_ == kBoolean; }
  bool isInteger() const { return id_ == kInteger; }
  bool isFloatingPoint() const { return id_ == kFloatingPoint; }
  bool isText() const { return id_ == kText; }
  bool isDate() const { return id_ == kDate; }
  bool isTimestamp() const { return id_ == kTimestamp; }
  bool isList() const { return id_ == kList; }

  bool isNumber() const { return isInteger() || isFloatingPoint(); }
  bool isDateTime() const { return isDate() || isTimestamp(); }
  bool isInt8() const { return isInteger() && size_ == 1; }
  bool isInt16() const { return isInteger() && size_ == 2; }
  bool isInt32() const { return isInteger() && size_ == 4; }
  bool isInt64() const { return isInteger() && size_ == 8; }
  bool isFp32() const { return isFloatingPoint() && size_ == 4; }
  bool isFp64() const { return isFloatingPoint() && size_ == 8; }

  // Values are stored in the 64-bit integer lane of a column.
  bool isIntegerStorage() const {
    return isBoolean() || isInteger() || isDateTime() || isNull();
  }

  virtual bool equal(const Type& other) const;
  bool operator==(const Type& other) const;
  bool operator!=(const Type& other) const { return !(*this == other); }

  virtual std::string toString() const = 0;

  template <typename T>
  const T* as() const {
    return dynamic_cast<const T*>(this);
  }

 protected:
  Type(Context& ctx, Id id, int size);

  Context& ctx_;
  Id id_;
  int size_;
};

using TypePtr = const Type*;

class NullType : public Type {
 public:
  static const NullType* make(Context& ctx);
  std::string toString() const override;

 protected:
  friend class ContextImpl;
  explicit NullType(Context& ctx);
};

class BooleanType : public Type {
 public:
  static const BooleanType* make(Context& ctx);
  std::string toString() const override;

 protected:
  friend class ContextImpl;
  explicit BooleanType(Context& ctx);
};

class IntegerType : public Type {
 public:
  static const IntegerType* make(Context& ctx, int size);
  std::string toString() const override;

  int64_t minValue() const;
  int64_t maxValue() const;

 protected:
  friend class ContextImpl;
  IntegerType(Context& ctx, int size);
};

class FloatingPointType : public Type {
 public:
  enum Precision {
    kFloat,
    kDouble,
  };

  static const FloatingPointType* make(Context& ctx, Precision precision);
  Precision precision() const { return precision_; }
  std::string toString() const override;

 protected:
  friend class ContextImpl;
  FloatingPointType(Context& ctx, Precision precision);

  static int precisionToSize(Precision precision);

  Precision precision_;
};

class TextType : public Type {
 public:
  static const TextType* make(Context& ctx);
  std::string toString() const override;

 protected:
  friend class ContextImpl;
  explicit TextType(Context& ctx);
};

// Days since the UNIX epoch.
class DateType : public Type {
 public:
  static const DateType* make(Context& ctx);
  std::string toString() const override;

 protected:
  friend class ContextImpl;
  explicit DateType(Context& ctx);
};

// Microseconds since the UNIX epoch.
class TimestampType : public Type {
 public:
  static const TimestampType* make(Context& ctx);
  std::string toString() const override;

 protected:
  friend class ContextImpl;
  explicit TimestampType(Context& ctx);
};

class ListType : public Type {
 public:
  static const ListType* make(Context& ctx, const Type* elem_type);
  const Type* elemType() const { return elem_type_; }
  bool equal(const Type& other) const override;
  std::string toString() const override;

 protected:
  friend class ContextImpl;
  ListType(Context& ctx, const Type* elem_type);

  const Type* elem_type_;
};

std::ostream& operator<<(std::ostream& os, const Type* type);

}  // namespace lqe::ir
