/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <exception>
#include <sstream>
#include <string>
#include <type_traits>

namespace lqe::ir {

class Error : public std::exception {
 public:
  Error() {}
  Error(std::string desc) : desc_(std::move(desc)) {}

  const char* what() const noexcept override { return desc_.c_str(); }

  void appendDesc(const std::string& str) const { desc_ += str; }

  // Operator which failed. Only the first (innermost) label is recorded.
  const std::string& operatorLabel() const { return label_; }
  void setOperatorLabel(const std::string& label) const {
    if (label_.empty()) {
      label_ = label;
      desc_ += " [" + label + "]";
    }
  }

 private:
  mutable std::string desc_;
  mutable std::string label_;
};

// Missing or duplicate column, type mismatch that cannot be resolved by coercion,
// unknown function.
class SchemaError : public Error {
 public:
  SchemaError() {}
  SchemaError(std::string desc) : Error(std::move(desc)) {}
};

// Operator used with parameters it does not support.
class InvalidOperationError : public Error {
 public:
  InvalidOperationError() {}
  InvalidOperationError(std::string desc) : Error(std::move(desc)) {}
};

// Runtime evaluation failure.
class ComputeError : public Error {
 public:
  ComputeError() {}
  ComputeError(std::string desc) : Error(std::move(desc)) {}
};

class ResourceExhaustedError : public Error {
 public:
  ResourceExhaustedError() {}
  ResourceExhaustedError(std::string desc) : Error(std::move(desc)) {}
};

class CancelledError : public Error {
 public:
  CancelledError() {}
  CancelledError(std::string desc) : Error(std::move(desc)) {}
};

template <typename ErrorType, typename T>
inline typename std::enable_if<std::is_base_of<lqe::ir::Error, ErrorType>::value,
                               const ErrorType&>::type
operator<<(const ErrorType& error, const T& v) {
  std::stringstream ss;
  ss << v;
  error.appendDesc(ss.str());
  return error;
}

}  // namespace lqe::ir
