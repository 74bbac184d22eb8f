/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "SchemaMgr.h"

#include "IR/Exception.h"
#include "Logger/Logger.h"

#include <algorithm>

namespace lqe {

void SchemaMgr::registerTable(const std::string& name, DataProviderPtr provider) {
  CHECK(provider);
  std::lock_guard<std::mutex> lock(mutex_);
  if (!tables_.emplace(name, std::move(provider)).second) {
    throw ir::InvalidOperationError() << "Table '" << name << "' already exists";
  }
  VLOG(1) << "Registered table " << name;
}

void SchemaMgr::dropTable(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!tables_.erase(name)) {
    throw ir::SchemaError() << "Table '" << name << "' not found";
  }
}

bool SchemaMgr::hasTable(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tables_.count(name);
}

DataProviderPtr SchemaMgr::getTable(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tables_.find(name);
  if (it == tables_.end()) {
    throw ir::SchemaError() << "Table '" << name << "' not found";
  }
  return it->second;
}

std::vector<std::string> SchemaMgr::listTables() const {
  std::vector<std::string> res;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& pr : tables_) {
      res.push_back(pr.first);
    }
  }
  std::sort(res.begin(), res.end());
  return res;
}

}  // namespace lqe
