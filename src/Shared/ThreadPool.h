/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

#include <algorithm>
#include <memory>

namespace lqe::threading {

/**
 * Process-wide fixed-size worker pool. Every parallel region of both executors
 * runs inside this arena. The size is taken from the first call to instance()
 * (zero selects the hardware concurrency) and never changes afterwards.
 */
class ThreadPool {
 public:
  static ThreadPool& instance(unsigned num_threads = 0);

  unsigned size() const { return size_; }

  template <typename F>
  void execute(F&& f) {
    arena_->execute(std::forward<F>(f));
  }

 private:
  explicit ThreadPool(unsigned num_threads);

  unsigned size_;
  std::unique_ptr<tbb::task_arena> arena_;
};

// Calls body(begin, end) for consecutive ranges of grain rows (the last one may
// be shorter) covering [0, n). Ranges run concurrently in the shared pool when
// parallel is set.
template <typename F>
void parallel_for_ranges(size_t n, size_t grain, bool parallel, F&& body) {
  if (!n) {
    return;
  }
  grain = grain ? grain : 1;
  if (!parallel || n <= grain) {
    for (size_t start = 0; start < n; start += grain) {
      body(start, std::min(n, start + grain));
    }
    return;
  }
  size_t num_chunks = (n + grain - 1) / grain;
  ThreadPool::instance().execute([&] {
    tbb::parallel_for(tbb::blocked_range<size_t>(0, num_chunks),
                      [&](const tbb::blocked_range<size_t>& r) {
                        for (size_t chunk = r.begin(); chunk != r.end(); ++chunk) {
                          body(chunk * grain, std::min(n, (chunk + 1) * grain));
                        }
                      });
  });
}

// Calls body(i) for every i in [0, n).
template <typename F>
void parallel_for_each(size_t n, bool parallel, F&& body) {
  if (!parallel || n < 2) {
    for (size_t i = 0; i < n; ++i) {
      body(i);
    }
    return;
  }
  ThreadPool::instance().execute([&] {
    tbb::parallel_for(size_t(0), n, [&](size_t i) { body(i); });
  });
}

}  // namespace lqe::threading
