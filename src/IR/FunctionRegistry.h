/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "Type.h"

#include <functional>
#include <limits>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace lqe {

class Column;
using ColumnPtr = std::shared_ptr<const Column>;

}  // namespace lqe

namespace lqe::ir {

using TypeList = std::vector<const Type*>;

struct FunctionDescriptor {
  static constexpr size_t kVariadic = std::numeric_limits<size_t>::max();

  std::string name;
  size_t min_args;
  size_t max_args;
  // Result type for the given argument types. Throws SchemaError for unsupported
  // arguments.
  std::function<const Type*(const TypeList&)> result_type;
  // Types arguments should be cast to before the call. nullptr entries keep the
  // argument type. May be empty when no coercion is needed.
  std::function<TypeList(const TypeList&)> arg_types;
  // Arguments have either num_rows or one (broadcast) element.
  std::function<ColumnPtr(const std::vector<ColumnPtr>&, size_t num_rows, const Type*)>
      kernel;
  // Row values depend only on the row itself. Such functions can be pushed below
  // filters, evaluated per morsel and deduplicated by CSE.
  bool elementwise = true;
};

/**
 * Name to function mapping. The process-wide instance is populated with the
 * built-in functions on first access and is read-only afterwards. It is defined
 * along with the kernels in QueryEngine.
 */
class FunctionRegistry {
 public:
  FunctionRegistry() = default;
  FunctionRegistry(FunctionRegistry&&) = default;

  static const FunctionRegistry& instance();

  // Throws InvalidOperationError if the name is already registered.
  void registerFunction(FunctionDescriptor desc);

  const FunctionDescriptor* find(const std::string& name) const;
  // Throws SchemaError for unknown names.
  const FunctionDescriptor& get(const std::string& name) const;

  std::vector<std::string> names() const;
  size_t size() const { return functions_.size(); }

 private:
  std::unordered_map<std::string, std::unique_ptr<FunctionDescriptor>> functions_;
};

// Defined in QueryEngine along with the kernels.
void registerBuiltinFunctions(FunctionRegistry& registry);

}  // namespace lqe::ir
