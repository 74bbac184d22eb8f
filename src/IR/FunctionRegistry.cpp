/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "FunctionRegistry.h"
#include "Exception.h"

#include <algorithm>

namespace lqe::ir {

void FunctionRegistry::registerFunction(FunctionDescriptor desc) {
  if (desc.name.empty() || !desc.result_type || !desc.kernel) {
    throw InvalidOperationError() << "Incomplete function descriptor: '" << desc.name
                                  << "'";
  }
  if (desc.min_args > desc.max_args) {
    throw InvalidOperationError() << "Invalid arity range for function '" << desc.name
                                  << "'";
  }
  auto name = desc.name;
  auto res = functions_.emplace(name, std::make_unique<FunctionDescriptor>(std::move(desc)));
  if (!res.second) {
    throw InvalidOperationError() << "Duplicate function registration: '" << name << "'";
  }
}

const FunctionDescriptor* FunctionRegistry::find(const std::string& name) const {
  auto it = functions_.find(name);
  return it == functions_.end() ? nullptr : it->second.get();
}

const FunctionDescriptor& FunctionRegistry::get(const std::string& name) const {
  auto res = find(name);
  if (!res) {
    throw SchemaError() << "Unknown function: '" << name << "'";
  }
  return *res;
}

std::vector<std::string> FunctionRegistry::names() const {
  std::vector<std::string> res;
  res.reserve(functions_.size());
  for (auto& pr : functions_) {
    res.push_back(pr.first);
  }
  std::sort(res.begin(), res.end());
  return res;
}

}  // namespace lqe::ir
