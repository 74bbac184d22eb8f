/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "DataProvider/DataProvider.h"

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace lqe {

// Catalog of named tables.
class SchemaMgr {
 public:
  SchemaMgr() = default;

  // Throws InvalidOperationError if the name is taken.
  void registerTable(const std::string& name, DataProviderPtr provider);
  // Throws SchemaError for unknown names.
  void dropTable(const std::string& name);

  bool hasTable(const std::string& name) const;
  // Throws SchemaError for unknown names.
  DataProviderPtr getTable(const std::string& name) const;
  std::vector<std::string> listTables() const;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, DataProviderPtr> tables_;
};

using SchemaMgrPtr = std::shared_ptr<SchemaMgr>;

}  // namespace lqe
