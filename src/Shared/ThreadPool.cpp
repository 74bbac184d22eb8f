/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ThreadPool.h"

#include "Logger/Logger.h"

#include <tbb/info.h>

namespace lqe::threading {

ThreadPool& ThreadPool::instance(unsigned num_threads) {
  static ThreadPool pool(num_threads);
  if (num_threads && num_threads != pool.size()) {
    LOG(WARNING) << "Worker pool is already running with " << pool.size()
                 << " threads, requested size " << num_threads << " is ignored.";
  }
  return pool;
}

ThreadPool::ThreadPool(unsigned num_threads) {
  size_ = num_threads ? num_threads
                      : static_cast<unsigned>(tbb::info::default_concurrency());
  arena_ = std::make_unique<tbb::task_arena>(static_cast<int>(size_));
  arena_->initialize();
  LOG(INFO) << "Started worker pool with " << size_ << " threads.";
}

}  // namespace lqe::threading
