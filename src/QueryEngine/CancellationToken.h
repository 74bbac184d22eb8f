/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "IR/Exception.h"

#include <atomic>
#include <memory>

namespace lqe {

/**
 * Cooperative cancellation flag shared between a caller and a running query.
 * Executors check it between morsels and partition units.
 */
class CancellationToken {
 public:
  void cancel() { cancelled_.store(true, std::memory_order_relaxed); }
  bool isCancelled() const { return cancelled_.load(std::memory_order_relaxed); }

  void throwIfCancelled() const {
    if (isCancelled()) {
      throw ir::CancelledError("Query execution was cancelled.");
    }
  }

 private:
  std::atomic<bool> cancelled_{false};
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

}  // namespace lqe
