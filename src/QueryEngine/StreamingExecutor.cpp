/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "StreamingExecutor.h"
#include "InMemoryExecutor.h"
#include "Operators.h"

#include "IR/Exception.h"
#include "Logger/Logger.h"
#include "Shared/ThreadPool.h"

#include <deque>
#include <limits>
#include <new>

namespace lqe {

using namespace ir;

std::string toString(PipelineState state) {
  switch (state) {
    case PipelineState::kIdle:
      return "Idle";
    case PipelineState::kRunning:
      return "Running";
    case PipelineState::kFinished:
      return "Finished";
    case PipelineState::kCancelled:
      return "Cancelled";
    case PipelineState::kFailed:
      return "Failed";
  }
  return "Unknown";
}

namespace {

// Splits a batch into morsels of at most morsel_size rows.
void splitMorsels(const Batch& batch, size_t morsel_size, std::deque<Batch>& out) {
  if (batch.numRows() <= morsel_size) {
    if (!batch.empty()) {
      out.push_back(batch);
    }
    return;
  }
  for (size_t offset = 0; offset < batch.numRows(); offset += morsel_size) {
    out.push_back(batch.slice(offset, morsel_size));
  }
}

class ScanSource : public MorselSource {
 public:
  ScanSource(const PhysicalScan& scan, const ExecutionContext& ctx)
      : scan_(scan), ctx_(ctx), frag_count_(scan.provider->fragmentCount()) {}

  std::optional<Batch> next() override {
    while (pending_.empty()) {
      if (frag_idx_ >= frag_count_ || sliceDone()) {
        return std::nullopt;
      }
      ctx_.checkCancelled();
      fetch();
    }
    auto res = std::move(pending_.front());
    pending_.pop_front();
    return res;
  }

  const Schema& schema() const override { return scan_.schema(); }

 private:
  bool sliceDone() const {
    return scan_.slice && produced_ >= scan_.slice->first + scan_.slice->second;
  }

  void fetch() {
    std::optional<size_t> limit;
    if (scan_.slice) {
      limit = scan_.slice->first + scan_.slice->second - produced_;
    }
    auto batch = scanFragment(scan_, frag_idx_++, limit);
    auto begin = produced_;
    produced_ += batch.numRows();
    if (scan_.slice) {
      // Rows of the fragment within [offset, offset + length).
      auto first = scan_.slice->first;
      auto last = first + scan_.slice->second;
      auto skip = begin < first ? std::min(first - begin, batch.numRows()) : 0;
      auto end = std::min(batch.numRows(), last > begin ? last - begin : 0);
      batch = end > skip ? batch.slice(skip, end - skip) : Batch::makeEmpty(scan_.schema());
    }
    splitMorsels(batch, ctx_.morsel_size, pending_);
  }

  const PhysicalScan& scan_;
  ExecutionContext ctx_;
  size_t frag_count_;
  size_t frag_idx_ = 0;
  size_t produced_ = 0;
  std::deque<Batch> pending_;
};

// Output of an in-memory subtree computed on the first pull.
class MemorySource : public MorselSource {
 public:
  MemorySource(const PhysicalNode& node, const ExecutionContext& ctx)
      : node_(node), ctx_(ctx) {}

  std::optional<Batch> next() override {
    if (!done_) {
      done_ = true;
      splitMorsels(InMemoryExecutor(ctx_).execute(node_), ctx_.morsel_size, pending_);
    }
    if (pending_.empty()) {
      return std::nullopt;
    }
    ctx_.checkCancelled();
    auto res = std::move(pending_.front());
    pending_.pop_front();
    return res;
  }

  const Schema& schema() const override { return node_.schema(); }

 private:
  const PhysicalNode& node_;
  ExecutionContext ctx_;
  bool done_ = false;
  std::deque<Batch> pending_;
};

class UnionSource : public MorselSource {
 public:
  UnionSource(const Schema& schema, std::vector<MorselSourcePtr> inputs)
      : schema_(schema), inputs_(std::move(inputs)) {}

  std::optional<Batch> next() override {
    while (current_ < inputs_.size()) {
      auto res = inputs_[current_]->next();
      if (res) {
        return Batch(schema_, res->columns(), res->numRows());
      }
      // Release the finished input.
      inputs_[current_++].reset();
    }
    return std::nullopt;
  }

  const Schema& schema() const override { return schema_; }

 private:
  const Schema& schema_;
  std::vector<MorselSourcePtr> inputs_;
  size_t current_ = 0;
};

/**
 * Operator applied to every morsel of a chain. prepare() is called once before
 * the first morsel is processed; process() may run concurrently.
 */
class MorselOperator {
 public:
  virtual ~MorselOperator() = default;

  virtual void prepare() {}
  virtual Batch process(const Batch& morsel) const = 0;
};

using MorselOperatorPtr = std::unique_ptr<MorselOperator>;

class StatelessOperator : public MorselOperator {
 public:
  StatelessOperator(const PhysicalNode& node, const ExecutionContext& ctx)
      : node_(node), ctx_(ctx) {
    // Morsels are already processed in parallel.
    ctx_.parallel = false;
  }

  Batch process(const Batch& morsel) const override {
    return processBatch(node_, morsel, ctx_);
  }

 private:
  const PhysicalNode& node_;
  ExecutionContext ctx_;
};

// Probes morsels of the left input against a hash table over the right input.
class HashProbeOperator : public MorselOperator {
 public:
  HashProbeOperator(const PhysicalHashJoin& join, const ExecutionContext& ctx)
      : join_(join), ctx_(ctx) {
    CHECK(!join.build_left);
    probe_ctx_ = ctx;
    probe_ctx_.parallel = false;
  }

  void prepare() override {
    build_ = InMemoryExecutor(ctx_).execute(join_.input(1));
    // Key types are unified with the declared probe key types, so every morsel
    // is cast the same way.
    std::vector<ColumnPtr> probe_proto;
    for (auto& key : join_.left_keys) {
      probe_proto.push_back(ColumnBuilder(key.type()).finish());
    }
    for (auto& key : join_.right_keys) {
      build_keys_.push_back(key.evalFull(build_));
    }
    unifyKeyTypes(probe_proto, build_keys_);
    for (auto& col : probe_proto) {
      key_types_.push_back(col->type());
    }
    table_ = buildHashTable(build_keys_, build_.numRows(), ctx_);
    VLOG(1) << join_.label() << " built hash table over " << build_.numRows() << " rows";
  }

  Batch process(const Batch& morsel) const override {
    std::vector<ColumnPtr> probe_keys;
    for (size_t i = 0; i < join_.left_keys.size(); ++i) {
      probe_keys.push_back(cast(join_.left_keys[i].evalFull(morsel), key_types_[i], true));
    }
    return probeHashJoin(join_, *table_, build_, probe_keys, morsel, probe_ctx_);
  }

 private:
  const PhysicalHashJoin& join_;
  ExecutionContext ctx_;
  ExecutionContext probe_ctx_;
  Batch build_;
  std::vector<ColumnPtr> build_keys_;
  std::vector<const Type*> key_types_;
  std::unique_ptr<HashJoinTable> table_;
};

class CrossJoinOperator : public MorselOperator {
 public:
  CrossJoinOperator(const PhysicalCrossJoin& join, const ExecutionContext& ctx)
      : join_(join), ctx_(ctx) {}

  void prepare() override { right_ = InMemoryExecutor(ctx_).execute(join_.input(1)); }

  Batch process(const Batch& morsel) const override {
    return crossJoin(join_, morsel, right_, ctx_);
  }

 private:
  const PhysicalCrossJoin& join_;
  ExecutionContext ctx_;
  Batch right_;
};

/**
 * Fused chain of per-morsel operators. Pulls up to the pool size morsels from
 * the input, processes them concurrently and emits results in input order.
 */
class ChainSource : public MorselSource {
 public:
  ChainSource(const Schema& schema,
              MorselSourcePtr input,
              std::vector<MorselOperatorPtr> ops,
              const ExecutionContext& ctx)
      : schema_(schema), input_(std::move(input)), ops_(std::move(ops)), ctx_(ctx) {}

  std::optional<Batch> next() override {
    while (ready_.empty()) {
      if (!input_) {
        return std::nullopt;
      }
      ctx_.checkCancelled();
      if (!prepared_) {
        for (auto& op : ops_) {
          op->prepare();
        }
        prepared_ = true;
      }
      pullAndProcess();
    }
    auto res = std::move(ready_.front());
    ready_.pop_front();
    return res;
  }

  const Schema& schema() const override { return schema_; }

 private:
  void pullAndProcess() {
    size_t max_morsels = ctx_.parallel ? threading::ThreadPool::instance().size() : 1;
    std::vector<Batch> morsels;
    while (morsels.size() < std::max<size_t>(max_morsels, 1)) {
      auto morsel = input_->next();
      if (!morsel) {
        input_.reset();
        break;
      }
      morsels.push_back(std::move(*morsel));
    }
    threading::parallel_for_each(morsels.size(), ctx_.parallel, [&](size_t idx) {
      ctx_.checkCancelled();
      for (auto& op : ops_) {
        morsels[idx] = op->process(morsels[idx]);
      }
    });
    ctx_.checkCancelled();
    for (auto& morsel : morsels) {
      if (!morsel.empty()) {
        ready_.push_back(std::move(morsel));
      }
    }
  }

  const Schema& schema_;
  MorselSourcePtr input_;
  std::vector<MorselOperatorPtr> ops_;
  ExecutionContext ctx_;
  bool prepared_ = false;
  std::deque<Batch> ready_;
};

// Stops pulling from the input once the slice is complete.
class SliceSource : public MorselSource {
 public:
  SliceSource(const PhysicalSlice& slice, MorselSourcePtr input)
      : slice_(slice), input_(std::move(input)) {}

  std::optional<Batch> next() override {
    if (slice_.offset < 0) {
      return nextFromEnd();
    }
    auto first = static_cast<size_t>(slice_.offset);
    auto last = slice_.length > std::numeric_limits<size_t>::max() - first
                    ? std::numeric_limits<size_t>::max()
                    : first + slice_.length;
    while (input_ && seen_ < last) {
      auto morsel = input_->next();
      if (!morsel) {
        break;
      }
      auto begin = seen_;
      seen_ += morsel->numRows();
      if (seen_ <= first) {
        continue;
      }
      auto skip = begin < first ? first - begin : 0;
      auto end = std::min(morsel->numRows(), last - begin);
      return morsel->slice(skip, end - skip);
    }
    input_.reset();
    return std::nullopt;
  }

  const Schema& schema() const override { return slice_.schema(); }

 private:
  // A negative offset requires the total row count.
  std::optional<Batch> nextFromEnd() {
    if (!input_) {
      return std::nullopt;
    }
    BatchList morsels;
    while (auto morsel = input_->next()) {
      morsels.push_back(std::move(*morsel));
    }
    input_.reset();
    auto all = concat(slice_.schema(), morsels);
    auto range = resolveSlice(slice_.offset, slice_.length, all.numRows());
    return all.slice(range.first, range.second);
  }

  const PhysicalSlice& slice_;
  MorselSourcePtr input_;
  size_t seen_ = 0;
};

// Aggregates morsels into partial states and emits the merged result at the end
// of input.
class AggregateSink : public MorselSource {
 public:
  AggregateSink(const PhysicalAggregate& agg,
                MorselSourcePtr input,
                const ExecutionContext& ctx)
      : agg_(agg), input_(std::move(input)), ctx_(ctx) {
    morsel_ctx_ = ctx;
    morsel_ctx_.parallel = false;
  }

  std::optional<Batch> next() override {
    if (!input_) {
      if (pending_.empty()) {
        return std::nullopt;
      }
      auto res = std::move(pending_.front());
      pending_.pop_front();
      return res;
    }

    std::vector<std::unique_ptr<GroupByState>> states;
    size_t max_morsels = ctx_.parallel ? threading::ThreadPool::instance().size() : 1;
    bool done = false;
    while (!done) {
      ctx_.checkCancelled();
      std::vector<Batch> morsels;
      while (morsels.size() < std::max<size_t>(max_morsels, 1)) {
        auto morsel = input_->next();
        if (!morsel) {
          done = true;
          break;
        }
        morsels.push_back(std::move(*morsel));
      }
      std::vector<std::unique_ptr<GroupByState>> partial(morsels.size());
      threading::parallel_for_each(morsels.size(), ctx_.parallel, [&](size_t idx) {
        ctx_.checkCancelled();
        auto res = aggregatePartial(agg_, morsels[idx], morsel_ctx_);
        CHECK_EQ(res.size(), (size_t)1);
        partial[idx] = std::move(res.front());
      });
      for (auto& state : partial) {
        states.push_back(std::move(state));
      }
    }
    input_.reset();
    ctx_.checkCancelled();

    if (states.empty()) {
      states.push_back(std::make_unique<GroupByState>(agg_.key_types, agg_.agg_specs));
    }
    auto num_partitions =
        agg_.partitionCount() > 1 ? agg_.partitionCount() : ctx_.hash_partitions;
    auto result = GroupByState::mergePartitioned(states, num_partitions, ctx_.parallel);
    states.clear();
    auto batch = finalizeAggregate(agg_, std::move(result), ctx_);
    if (batch.empty()) {
      return std::nullopt;
    }
    splitMorsels(batch, ctx_.morsel_size, pending_);
    return next();
  }

  const Schema& schema() const override { return agg_.schema(); }

 private:
  const PhysicalAggregate& agg_;
  MorselSourcePtr input_;
  ExecutionContext ctx_;
  ExecutionContext morsel_ctx_;
  std::deque<Batch> pending_;
};

class SourceBuilder {
 public:
  explicit SourceBuilder(const ExecutionContext& ctx) : ctx_(ctx) {}

  MorselSourcePtr build(const PhysicalNode& node) const {
    switch (node.kind()) {
      case PhysicalKind::kScan:
        return std::make_unique<ScanSource>(static_cast<const PhysicalScan&>(node), ctx_);
      case PhysicalKind::kMemorySource:
        return std::make_unique<MemorySource>(node.input(0), ctx_);
      case PhysicalKind::kUnion: {
        std::vector<MorselSourcePtr> inputs;
        for (auto& input : node.inputs()) {
          inputs.push_back(build(*input));
        }
        return std::make_unique<UnionSource>(node.schema(), std::move(inputs));
      }
      case PhysicalKind::kSlice:
        return std::make_unique<SliceSource>(static_cast<const PhysicalSlice&>(node),
                                             build(node.input(0)));
      case PhysicalKind::kAggregate:
        return std::make_unique<AggregateSink>(
            static_cast<const PhysicalAggregate&>(node), build(node.input(0)), ctx_);
      case PhysicalKind::kFilter:
      case PhysicalKind::kProject:
      case PhysicalKind::kExplode:
      case PhysicalKind::kMelt:
      case PhysicalKind::kHashJoin:
      case PhysicalKind::kCrossJoin:
        return buildChain(node);
      default:
        break;
    }
    throw InvalidOperationError() << node.label() << " cannot be executed in streaming mode";
  }

 private:
  static bool isChainOperator(const PhysicalNode& node) {
    return node.isStreaming() &&
           (isStatelessOperator(node.kind()) || node.kind() == PhysicalKind::kHashJoin ||
            node.kind() == PhysicalKind::kCrossJoin);
  }

  MorselOperatorPtr makeOperator(const PhysicalNode& node) const {
    if (node.kind() == PhysicalKind::kHashJoin) {
      return std::make_unique<HashProbeOperator>(static_cast<const PhysicalHashJoin&>(node),
                                                 ctx_);
    }
    if (node.kind() == PhysicalKind::kCrossJoin) {
      return std::make_unique<CrossJoinOperator>(static_cast<const PhysicalCrossJoin&>(node),
                                                 ctx_);
    }
    return std::make_unique<StatelessOperator>(node, ctx_);
  }

  // Collects consecutive chain operators top-down, then applies them bottom-up.
  MorselSourcePtr buildChain(const PhysicalNode& top) const {
    std::vector<const PhysicalNode*> nodes;
    auto cur = &top;
    while (isChainOperator(*cur)) {
      nodes.push_back(cur);
      cur = &cur->input(0);
    }
    CHECK(!nodes.empty()) << top.label();
    std::vector<MorselOperatorPtr> ops;
    for (auto it = nodes.rbegin(); it != nodes.rend(); ++it) {
      ops.push_back(makeOperator(**it));
    }
    VLOG(1) << "Fused streaming chain " << nodes.back()->label() << " .. " << top.label();
    return std::make_unique<ChainSource>(top.schema(), build(*cur), std::move(ops), ctx_);
  }

  ExecutionContext ctx_;
};

}  // namespace

Pipeline::Pipeline(std::string name, MorselSourcePtr source)
    : name_(std::move(name)), schema_(source->schema()), source_(std::move(source)) {}

void Pipeline::setState(PipelineState state) {
  VLOG(1) << "Pipeline " << name_ << ": " << toString(state_) << " -> " << toString(state);
  state_ = state;
}

std::optional<Batch> Pipeline::next() {
  if (state_ == PipelineState::kFinished) {
    return std::nullopt;
  }
  if (state_ == PipelineState::kCancelled) {
    throw CancelledError("Pipeline " + name_ + " was cancelled.");
  }
  if (state_ == PipelineState::kFailed) {
    throw InvalidOperationError("Pipeline " + name_ + " has failed.");
  }
  if (state_ == PipelineState::kIdle) {
    setState(PipelineState::kRunning);
  }
  try {
    auto res = source_->next();
    if (!res) {
      source_.reset();
      setState(PipelineState::kFinished);
    }
    return res;
  } catch (const CancelledError&) {
    source_.reset();
    setState(PipelineState::kCancelled);
    throw;
  } catch (const Error& e) {
    source_.reset();
    e.setOperatorLabel(name_);
    setState(PipelineState::kFailed);
    throw;
  } catch (const std::bad_alloc&) {
    source_.reset();
    setState(PipelineState::kFailed);
    ResourceExhaustedError err("Out of memory");
    err.setOperatorLabel(name_);
    throw err;
  } catch (const std::exception&) {
    source_.reset();
    setState(PipelineState::kFailed);
    throw;
  }
}

MorselSourcePtr StreamingExecutor::build(const PhysicalNode& node) const {
  return SourceBuilder(ctx_).build(node);
}

Batch StreamingExecutor::collect(const PhysicalNode& node) const {
  Pipeline pipeline(node.label(), build(node));
  BatchList batches;
  while (auto batch = pipeline.next()) {
    batches.push_back(std::move(*batch));
  }
  return concat(node.schema(), batches);
}

}  // namespace lqe
