/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "DataProvider.h"

namespace lqe {

// Data provider over batches held in memory. Each batch is a fragment.
class MemoryTable : public DataProvider {
 public:
  MemoryTable(ir::Schema schema, BatchList fragments);

  // Splits a batch into fragments of at most fragment_size rows.
  static std::shared_ptr<MemoryTable> fromBatch(const Batch& batch,
                                                size_t fragment_size);

  const ir::Schema& schema() const override { return schema_; }
  size_t fragmentCount() const override { return fragments_.size(); }
  std::optional<size_t> rowCount() const override { return row_count_; }
  std::optional<size_t> fragmentRowCount(size_t frag_idx) const override;

  // Applies projection and limit. Predicates are left to the engine.
  FragmentResult fetchFragment(size_t frag_idx,
                               const FragmentHints& hints) const override;

  const BatchList& fragments() const { return fragments_; }

 private:
  ir::Schema schema_;
  BatchList fragments_;
  size_t row_count_ = 0;
};

}  // namespace lqe
