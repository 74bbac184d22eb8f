/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "MemoryTable.h"

#include "IR/Exception.h"
#include "Logger/Logger.h"

namespace lqe {

MemoryTable::MemoryTable(ir::Schema schema, BatchList fragments)
    : schema_(std::move(schema)), fragments_(std::move(fragments)) {
  for (auto& frag : fragments_) {
    if (frag.schema() != schema_) {
      throw ir::SchemaError() << "Fragment schema " << frag.schema().toString()
                              << " does not match table schema " << schema_.toString();
    }
    row_count_ += frag.numRows();
  }
}

std::shared_ptr<MemoryTable> MemoryTable::fromBatch(const Batch& batch,
                                                    size_t fragment_size) {
  if (!fragment_size) {
    throw ir::InvalidOperationError() << "Fragment size must be positive";
  }
  BatchList fragments;
  for (size_t offset = 0; offset < batch.numRows(); offset += fragment_size) {
    fragments.push_back(batch.slice(offset, fragment_size));
  }
  return std::make_shared<MemoryTable>(batch.schema(), std::move(fragments));
}

std::optional<size_t> MemoryTable::fragmentRowCount(size_t frag_idx) const {
  CHECK_LT(frag_idx, fragments_.size());
  return fragments_[frag_idx].numRows();
}

FragmentResult MemoryTable::fetchFragment(size_t frag_idx,
                                          const FragmentHints& hints) const {
  CHECK_LT(frag_idx, fragments_.size());
  FragmentResult res;
  res.batch = fragments_[frag_idx];
  if (hints.columns) {
    res.batch = res.batch.select(*hints.columns);
    res.projection_applied = true;
  }
  // Limit counts filtered rows, so it can only be applied without a predicate.
  if (hints.limit && !hints.predicate) {
    res.batch = res.batch.slice(0, *hints.limit);
    res.limit_applied = true;
  }
  return res;
}

}  // namespace lqe
