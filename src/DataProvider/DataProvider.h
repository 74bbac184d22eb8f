/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "DataMgr/Batch.h"
#include "IR/Schema.h"

#include <functional>
#include <memory>
#include <optional>

namespace lqe {

// Computes a boolean mask over a batch holding at least the predicate columns.
using RowPredicate = std::function<ColumnPtr(const Batch&)>;

/**
 * Work the engine asks a data provider to do while fetching a fragment. All
 * hints are optional to honor; the engine re-applies the ones a provider
 * reports as not applied.
 */
struct FragmentHints {
  // Columns to return. Always includes the predicate columns.
  std::optional<std::vector<std::string>> columns;
  RowPredicate predicate;
  std::vector<std::string> predicate_columns;
  // Maximum number of rows required from the fragment after filtering.
  std::optional<size_t> limit;
};

struct FragmentResult {
  Batch batch;
  bool projection_applied = false;
  bool predicate_applied = false;
  bool limit_applied = false;
};

/**
 * Scan collaborator. A table is a sequence of fragments fetched independently
 * and possibly concurrently, so implementations must be thread-safe.
 */
class DataProvider {
 public:
  virtual ~DataProvider() = default;

  virtual const ir::Schema& schema() const = 0;
  virtual size_t fragmentCount() const = 0;
  // Row count estimate, if known.
  virtual std::optional<size_t> rowCount() const = 0;
  virtual std::optional<size_t> fragmentRowCount(size_t frag_idx) const = 0;

  virtual FragmentResult fetchFragment(size_t frag_idx,
                                       const FragmentHints& hints) const = 0;
};

using DataProviderPtr = std::shared_ptr<DataProvider>;

}  // namespace lqe
