/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "DataMgr/Batch.h"
#include "DataProvider/MemoryTable.h"
#include "IR/Context.h"
#include "SchemaMgr/SchemaMgr.h"
#include "Shared/Config.h"

#include <arrow/api.h>

#include <memory>
#include <string>

namespace lqe {

/**
 * Adapter between Arrow tables and in-memory tables. Imported data is copied
 * into engine columns, so the Arrow table may be released after the import.
 */
class ArrowStorage {
 public:
  ArrowStorage(SchemaMgrPtr schema_mgr, ConfigPtr config);

  // Converts an Arrow table into a table of fragments with at most fragment_size
  // rows (zero selects the configured default) and registers it under the
  // given name when a schema manager is attached.
  std::shared_ptr<MemoryTable> importArrowTable(std::shared_ptr<arrow::Table> at,
                                                const std::string& table_name,
                                                size_t fragment_size = 0);

  void dropTable(const std::string& table_name);

  Batch fromArrow(const arrow::Table& at) const;
  static std::shared_ptr<arrow::Table> toArrow(const Batch& batch);

  // Throws SchemaError for Arrow types with no engine counterpart.
  static const ir::Type* getTargetImportType(ir::Context& ctx,
                                             const arrow::DataType& type);
  static std::shared_ptr<arrow::DataType> getArrowExportType(const ir::Type* type);

 private:
  ir::Context& ctx_;
  SchemaMgrPtr schema_mgr_;
  ConfigPtr config_;
};

}  // namespace lqe
