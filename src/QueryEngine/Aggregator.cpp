/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "Aggregator.h"
#include "ColumnOps.h"

#include "IR/OpType.h"
#include "Logger/Logger.h"
#include "Shared/ThreadPool.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <unordered_set>

namespace lqe {

namespace {

class CountAccumulator : public Accumulator {
 public:
  CountAccumulator(const ir::Type* type, bool count_nulls)
      : type_(type), count_nulls_(count_nulls) {}

  void resize(size_t num_groups) override { counts_.resize(num_groups, 0); }

  void update(const ColumnPtr& arg, const GroupIds& group_ids) override {
    if (count_nulls_ || !arg) {
      for (auto group : group_ids) {
        ++counts_[group];
      }
      return;
    }
    CHECK_EQ(arg->size(), group_ids.size());
    for (size_t row = 0; row < group_ids.size(); ++row) {
      counts_[group_ids[row]] += !arg->isNull(row);
    }
  }

  void merge(const Accumulator& other, const GroupIds& group_map) override {
    auto& src = static_cast<const CountAccumulator&>(other);
    for (size_t i = 0; i < group_map.size(); ++i) {
      if (group_map[i] != kNoGroup) {
        counts_[group_map[i]] += src.counts_[i];
      }
    }
  }

  ColumnPtr finalize() const override { return Column::makeInt(type_, counts_); }

  AccumulatorPtr makeEmpty() const override {
    return std::make_unique<CountAccumulator>(type_, count_nulls_);
  }

 private:
  const ir::Type* type_;
  bool count_nulls_;
  std::vector<int64_t> counts_;
};

// Sum of an empty or all-null group is zero.
class SumAccumulator : public Accumulator {
 public:
  explicit SumAccumulator(const ir::Type* type)
      : type_(type), is_fp_(type->isFloatingPoint()) {}

  void resize(size_t num_groups) override {
    if (is_fp_) {
      fps_.resize(num_groups, 0);
    } else {
      ints_.resize(num_groups, 0);
    }
  }

  void update(const ColumnPtr& arg, const GroupIds& group_ids) override {
    CHECK_EQ(arg->size(), group_ids.size());
    for (size_t row = 0; row < group_ids.size(); ++row) {
      if (arg->isNull(row)) {
        continue;
      }
      if (is_fp_) {
        fps_[group_ids[row]] += arg->numAt(row);
      } else {
        add(ints_[group_ids[row]], arg->intAt(row));
      }
    }
  }

  void merge(const Accumulator& other, const GroupIds& group_map) override {
    auto& src = static_cast<const SumAccumulator&>(other);
    for (size_t i = 0; i < group_map.size(); ++i) {
      if (group_map[i] == kNoGroup) {
        continue;
      }
      if (is_fp_) {
        fps_[group_map[i]] += src.fps_[i];
      } else {
        add(ints_[group_map[i]], src.ints_[i]);
      }
    }
  }

  ColumnPtr finalize() const override {
    if (is_fp_) {
      if (type_->isFp32()) {
        std::vector<double> res(fps_.size());
        for (size_t i = 0; i < fps_.size(); ++i) {
          res[i] = static_cast<float>(fps_[i]);
        }
        return Column::makeFp(type_, std::move(res));
      }
      return Column::makeFp(type_, fps_);
    }
    return Column::makeInt(type_, ints_);
  }

  AccumulatorPtr makeEmpty() const override {
    return std::make_unique<SumAccumulator>(type_);
  }

 private:
  static void add(int64_t& acc, int64_t val) {
    acc = static_cast<int64_t>(static_cast<uint64_t>(acc) + static_cast<uint64_t>(val));
  }

  const ir::Type* type_;
  bool is_fp_;
  std::vector<int64_t> ints_;
  std::vector<double> fps_;
};

class MeanAccumulator : public Accumulator {
 public:
  explicit MeanAccumulator(const ir::Type* type) : type_(type) {}

  void resize(size_t num_groups) override {
    sums_.resize(num_groups, 0);
    counts_.resize(num_groups, 0);
  }

  void update(const ColumnPtr& arg, const GroupIds& group_ids) override {
    CHECK_EQ(arg->size(), group_ids.size());
    for (size_t row = 0; row < group_ids.size(); ++row) {
      if (!arg->isNull(row)) {
        sums_[group_ids[row]] += arg->numAt(row);
        ++counts_[group_ids[row]];
      }
    }
  }

  void merge(const Accumulator& other, const GroupIds& group_map) override {
    auto& src = static_cast<const MeanAccumulator&>(other);
    for (size_t i = 0; i < group_map.size(); ++i) {
      if (group_map[i] != kNoGroup) {
        sums_[group_map[i]] += src.sums_[i];
        counts_[group_map[i]] += src.counts_[i];
      }
    }
  }

  ColumnPtr finalize() const override {
    ColumnBuilder builder(type_, sums_.size());
    for (size_t i = 0; i < sums_.size(); ++i) {
      if (counts_[i]) {
        builder.appendFp(sums_[i] / counts_[i]);
      } else {
        builder.appendNull();
      }
    }
    return builder.finish();
  }

  AccumulatorPtr makeEmpty() const override {
    return std::make_unique<MeanAccumulator>(type_);
  }

 private:
  const ir::Type* type_;
  std::vector<double> sums_;
  std::vector<int64_t> counts_;
};

class MinMaxAccumulator : public Accumulator {
 public:
  MinMaxAccumulator(const ir::Type* type, bool is_max)
      : type_(type), storage_(Column::storageFor(type)), is_max_(is_max) {
    CHECK(storage_ != Column::Storage::kList);
  }

  void resize(size_t num_groups) override {
    has_.resize(num_groups, 0);
    switch (storage_) {
      case Column::Storage::kInt:
        ints_.resize(num_groups);
        break;
      case Column::Storage::kFp:
        fps_.resize(num_groups);
        break;
      case Column::Storage::kStr:
        strs_.resize(num_groups);
        break;
      case Column::Storage::kList:
        break;
    }
  }

  void update(const ColumnPtr& arg, const GroupIds& group_ids) override {
    CHECK_EQ(arg->size(), group_ids.size());
    for (size_t row = 0; row < group_ids.size(); ++row) {
      if (!arg->isNull(row)) {
        updateGroup(group_ids[row], *arg, row);
      }
    }
  }

  void merge(const Accumulator& other, const GroupIds& group_map) override {
    auto& src = static_cast<const MinMaxAccumulator&>(other);
    for (size_t i = 0; i < group_map.size(); ++i) {
      if (group_map[i] == kNoGroup || !src.has_[i]) {
        continue;
      }
      auto group = group_map[i];
      switch (storage_) {
        case Column::Storage::kInt:
          if (!has_[group] || better(src.ints_[i], ints_[group])) {
            ints_[group] = src.ints_[i];
          }
          break;
        case Column::Storage::kFp:
          if (!has_[group] || betterFp(src.fps_[i], fps_[group])) {
            fps_[group] = src.fps_[i];
          }
          break;
        case Column::Storage::kStr:
          if (!has_[group] || better(src.strs_[i], strs_[group])) {
            strs_[group] = src.strs_[i];
          }
          break;
        case Column::Storage::kList:
          break;
      }
      has_[group] = 1;
    }
  }

  ColumnPtr finalize() const override {
    ColumnBuilder builder(type_, has_.size());
    for (size_t i = 0; i < has_.size(); ++i) {
      if (!has_[i]) {
        builder.appendNull();
        continue;
      }
      switch (storage_) {
        case Column::Storage::kInt:
          builder.appendInt(ints_[i]);
          break;
        case Column::Storage::kFp:
          builder.appendFp(fps_[i]);
          break;
        case Column::Storage::kStr:
          builder.appendStr(strs_[i]);
          break;
        case Column::Storage::kList:
          break;
      }
    }
    return builder.finish();
  }

  AccumulatorPtr makeEmpty() const override {
    return std::make_unique<MinMaxAccumulator>(type_, is_max_);
  }

 private:
  template <typename T>
  bool better(const T& val, const T& cur) const {
    return is_max_ ? cur < val : val < cur;
  }

  // NaN is greater than any other value.
  bool betterFp(double val, double cur) const {
    if (std::isnan(val) || std::isnan(cur)) {
      return is_max_ ? (std::isnan(val) && !std::isnan(cur))
                     : (!std::isnan(val) && std::isnan(cur));
    }
    return better(val, cur);
  }

  void updateGroup(uint32_t group, const Column& arg, size_t row) {
    switch (storage_) {
      case Column::Storage::kInt:
        if (!has_[group] || better(arg.intAt(row), ints_[group])) {
          ints_[group] = arg.intAt(row);
        }
        break;
      case Column::Storage::kFp:
        if (!has_[group] || betterFp(arg.fpAt(row), fps_[group])) {
          fps_[group] = arg.fpAt(row);
        }
        break;
      case Column::Storage::kStr:
        if (!has_[group] || better(arg.strAt(row), strs_[group])) {
          strs_[group] = arg.strAt(row);
        }
        break;
      case Column::Storage::kList:
        break;
    }
    has_[group] = 1;
  }

  const ir::Type* type_;
  Column::Storage storage_;
  bool is_max_;
  std::vector<char> has_;
  std::vector<int64_t> ints_;
  std::vector<double> fps_;
  std::vector<std::string> strs_;
};

// Keeps references to the selected rows, so values of any type including nulls
// and lists are supported.
class FirstLastAccumulator : public Accumulator {
 public:
  FirstLastAccumulator(const ir::Type* type, bool is_last)
      : type_(type), is_last_(is_last) {}

  void resize(size_t num_groups) override { values_.resize(num_groups, kNotSet); }

  void update(const ColumnPtr& arg, const GroupIds& group_ids) override {
    CHECK_EQ(arg->size(), group_ids.size());
    if (group_ids.empty()) {
      return;
    }
    auto chunk = static_cast<uint32_t>(chunks_.size());
    chunks_.push_back(arg);
    for (size_t row = 0; row < group_ids.size(); ++row) {
      auto& val = values_[group_ids[row]];
      if (is_last_ || val == kNotSet) {
        val = {chunk, static_cast<uint32_t>(row)};
      }
    }
  }

  void merge(const Accumulator& other, const GroupIds& group_map) override {
    auto& src = static_cast<const FirstLastAccumulator&>(other);
    auto chunk_offset = static_cast<uint32_t>(chunks_.size());
    chunks_.insert(chunks_.end(), src.chunks_.begin(), src.chunks_.end());
    for (size_t i = 0; i < group_map.size(); ++i) {
      if (group_map[i] == kNoGroup || src.values_[i] == kNotSet) {
        continue;
      }
      auto& val = values_[group_map[i]];
      if (is_last_ || val == kNotSet) {
        val = {src.values_[i].first + chunk_offset, src.values_[i].second};
      }
    }
  }

  ColumnPtr finalize() const override {
    ColumnBuilder builder(type_, values_.size());
    for (auto& val : values_) {
      if (val == kNotSet) {
        builder.appendNull();
      } else {
        builder.appendFrom(*chunks_[val.first], val.second);
      }
    }
    return builder.finish();
  }

  AccumulatorPtr makeEmpty() const override {
    return std::make_unique<FirstLastAccumulator>(type_, is_last_);
  }

 private:
  using RowRef = std::pair<uint32_t, uint32_t>;
  static constexpr RowRef kNotSet{kNoGroup, kNoGroup};

  const ir::Type* type_;
  bool is_last_;
  std::vector<ColumnPtr> chunks_;
  std::vector<RowRef> values_;
};

// Null counts as a distinct value.
class NUniqueAccumulator : public Accumulator {
 public:
  NUniqueAccumulator(const ir::Type* type, const ir::Type* arg_type)
      : type_(type), storage_(Column::storageFor(arg_type)) {
    CHECK(storage_ != Column::Storage::kList);
  }

  void resize(size_t num_groups) override {
    has_null_.resize(num_groups, 0);
    if (storage_ == Column::Storage::kStr) {
      strs_.resize(num_groups);
    } else {
      ints_.resize(num_groups);
    }
  }

  void update(const ColumnPtr& arg, const GroupIds& group_ids) override {
    CHECK_EQ(arg->size(), group_ids.size());
    for (size_t row = 0; row < group_ids.size(); ++row) {
      auto group = group_ids[row];
      if (arg->isNull(row)) {
        has_null_[group] = 1;
      } else if (storage_ == Column::Storage::kStr) {
        strs_[group].insert(arg->strAt(row));
      } else if (storage_ == Column::Storage::kFp) {
        ints_[group].insert(fpBits(arg->fpAt(row)));
      } else {
        ints_[group].insert(arg->intAt(row));
      }
    }
  }

  void merge(const Accumulator& other, const GroupIds& group_map) override {
    auto& src = static_cast<const NUniqueAccumulator&>(other);
    for (size_t i = 0; i < group_map.size(); ++i) {
      auto group = group_map[i];
      if (group == kNoGroup) {
        continue;
      }
      has_null_[group] |= src.has_null_[i];
      if (storage_ == Column::Storage::kStr) {
        strs_[group].insert(src.strs_[i].begin(), src.strs_[i].end());
      } else {
        ints_[group].insert(src.ints_[i].begin(), src.ints_[i].end());
      }
    }
  }

  ColumnPtr finalize() const override {
    std::vector<int64_t> res(has_null_.size());
    for (size_t i = 0; i < res.size(); ++i) {
      auto distinct = storage_ == Column::Storage::kStr ? strs_[i].size() : ints_[i].size();
      res[i] = static_cast<int64_t>(distinct) + has_null_[i];
    }
    return Column::makeInt(type_, std::move(res));
  }

  AccumulatorPtr makeEmpty() const override {
    auto res = std::make_unique<NUniqueAccumulator>(*this);
    res->has_null_.clear();
    res->ints_.clear();
    res->strs_.clear();
    return res;
  }

 private:
  // All NaNs and both zeros map to the same value.
  static int64_t fpBits(double val) {
    if (std::isnan(val)) {
      val = std::numeric_limits<double>::quiet_NaN();
    } else if (val == 0.0) {
      val = 0.0;
    }
    int64_t res;
    std::memcpy(&res, &val, sizeof(res));
    return res;
  }

  const ir::Type* type_;
  Column::Storage storage_;
  std::vector<char> has_null_;
  std::vector<std::unordered_set<int64_t>> ints_;
  std::vector<std::unordered_set<std::string>> strs_;
};

// Welford's online algorithm, states are merged with Chan's formula. Uses
// ddof = 1.
class VarianceAccumulator : public Accumulator {
 public:
  VarianceAccumulator(const ir::Type* type, bool is_std) : type_(type), is_std_(is_std) {}

  void resize(size_t num_groups) override {
    counts_.resize(num_groups, 0);
    means_.resize(num_groups, 0);
    m2_.resize(num_groups, 0);
  }

  void update(const ColumnPtr& arg, const GroupIds& group_ids) override {
    CHECK_EQ(arg->size(), group_ids.size());
    for (size_t row = 0; row < group_ids.size(); ++row) {
      if (arg->isNull(row)) {
        continue;
      }
      auto group = group_ids[row];
      auto val = arg->numAt(row);
      ++counts_[group];
      auto delta = val - means_[group];
      means_[group] += delta / counts_[group];
      m2_[group] += delta * (val - means_[group]);
    }
  }

  void merge(const Accumulator& other, const GroupIds& group_map) override {
    auto& src = static_cast<const VarianceAccumulator&>(other);
    for (size_t i = 0; i < group_map.size(); ++i) {
      auto group = group_map[i];
      if (group == kNoGroup || !src.counts_[i]) {
        continue;
      }
      if (!counts_[group]) {
        counts_[group] = src.counts_[i];
        means_[group] = src.means_[i];
        m2_[group] = src.m2_[i];
        continue;
      }
      auto n_a = static_cast<double>(counts_[group]);
      auto n_b = static_cast<double>(src.counts_[i]);
      auto total = n_a + n_b;
      auto delta = src.means_[i] - means_[group];
      means_[group] += delta * n_b / total;
      m2_[group] += src.m2_[i] + delta * delta * n_a * n_b / total;
      counts_[group] += src.counts_[i];
    }
  }

  ColumnPtr finalize() const override {
    ColumnBuilder builder(type_, counts_.size());
    for (size_t i = 0; i < counts_.size(); ++i) {
      if (counts_[i] < 2) {
        builder.appendNull();
        continue;
      }
      auto var = m2_[i] / static_cast<double>(counts_[i] - 1);
      builder.appendFp(is_std_ ? std::sqrt(var) : var);
    }
    return builder.finish();
  }

  AccumulatorPtr makeEmpty() const override {
    return std::make_unique<VarianceAccumulator>(type_, is_std_);
  }

 private:
  const ir::Type* type_;
  bool is_std_;
  std::vector<int64_t> counts_;
  std::vector<double> means_;
  std::vector<double> m2_;
};

class MedianAccumulator : public Accumulator {
 public:
  explicit MedianAccumulator(const ir::Type* type) : type_(type) {}

  void resize(size_t num_groups) override { values_.resize(num_groups); }

  void update(const ColumnPtr& arg, const GroupIds& group_ids) override {
    CHECK_EQ(arg->size(), group_ids.size());
    for (size_t row = 0; row < group_ids.size(); ++row) {
      if (!arg->isNull(row)) {
        values_[group_ids[row]].push_back(arg->numAt(row));
      }
    }
  }

  void merge(const Accumulator& other, const GroupIds& group_map) override {
    auto& src = static_cast<const MedianAccumulator&>(other);
    for (size_t i = 0; i < group_map.size(); ++i) {
      if (group_map[i] != kNoGroup) {
        auto& dst = values_[group_map[i]];
        dst.insert(dst.end(), src.values_[i].begin(), src.values_[i].end());
      }
    }
  }

  ColumnPtr finalize() const override {
    ColumnBuilder builder(type_, values_.size());
    for (auto vals : values_) {
      if (vals.empty()) {
        builder.appendNull();
        continue;
      }
      auto mid = vals.size() / 2;
      std::nth_element(vals.begin(), vals.begin() + mid, vals.end());
      auto res = vals[mid];
      if (vals.size() % 2 == 0) {
        res = (res + *std::max_element(vals.begin(), vals.begin() + mid)) / 2;
      }
      builder.appendFp(res);
    }
    return builder.finish();
  }

  AccumulatorPtr makeEmpty() const override {
    return std::make_unique<MedianAccumulator>(type_);
  }

 private:
  const ir::Type* type_;
  std::vector<std::vector<double>> values_;
};

}  // namespace

AccumulatorPtr makeAccumulator(const AggSpec& spec) {
  switch (spec.agg) {
    case ir::AggType::kCount:
      return std::make_unique<CountAccumulator>(spec.result_type, false);
    case ir::AggType::kLen:
      return std::make_unique<CountAccumulator>(spec.result_type, true);
    case ir::AggType::kSum:
      return std::make_unique<SumAccumulator>(spec.result_type);
    case ir::AggType::kMean:
      return std::make_unique<MeanAccumulator>(spec.result_type);
    case ir::AggType::kMin:
      return std::make_unique<MinMaxAccumulator>(spec.result_type, false);
    case ir::AggType::kMax:
      return std::make_unique<MinMaxAccumulator>(spec.result_type, true);
    case ir::AggType::kFirst:
      return std::make_unique<FirstLastAccumulator>(spec.result_type, false);
    case ir::AggType::kLast:
      return std::make_unique<FirstLastAccumulator>(spec.result_type, true);
    case ir::AggType::kNUnique:
      return std::make_unique<NUniqueAccumulator>(spec.result_type, spec.arg_type);
    case ir::AggType::kStd:
      return std::make_unique<VarianceAccumulator>(spec.result_type, true);
    case ir::AggType::kVar:
      return std::make_unique<VarianceAccumulator>(spec.result_type, false);
    case ir::AggType::kMedian:
      return std::make_unique<MedianAccumulator>(spec.result_type);
  }
  LOG(FATAL) << "Unsupported aggregate: " << spec.agg;
  return nullptr;
}

//
// GroupTable
//

uint32_t GroupTable::addChunk(const std::vector<ColumnPtr>& keys) {
  if (chunks_.empty() || chunks_.back() != keys) {
    chunks_.push_back(keys);
  }
  return static_cast<uint32_t>(chunks_.size() - 1);
}

uint32_t GroupTable::findOrInsert(const std::vector<ColumnPtr>& keys,
                                  uint32_t chunk,
                                  size_t row,
                                  size_t hash) {
  auto range = index_.equal_range(hash);
  for (auto it = range.first; it != range.second; ++it) {
    auto& ref = groups_[it->second];
    if (rowsEqual(chunks_[ref.chunk], ref.row, keys, row, true)) {
      return it->second;
    }
  }
  auto id = static_cast<uint32_t>(groups_.size());
  groups_.push_back({chunk, static_cast<uint32_t>(row), hash});
  index_.emplace(hash, id);
  return id;
}

void GroupTable::insert(const std::vector<ColumnPtr>& keys,
                        size_t num_rows,
                        GroupIds& group_ids) {
  CHECK_EQ(keys.size(), num_keys_);
  group_ids.resize(num_rows);
  if (!num_rows) {
    return;
  }
  auto chunk = addChunk(keys);
  std::vector<size_t> hashes;
  hashRows(keys, 0, num_rows, hashes);
  for (size_t row = 0; row < num_rows; ++row) {
    group_ids[row] = findOrInsert(keys, chunk, row, hashes[row]);
  }
}

uint32_t GroupTable::insertGroupFrom(const GroupTable& other, uint32_t group) {
  auto& ref = other.groups_[group];
  auto& keys = other.chunks_[ref.chunk];
  auto chunk = addChunk(keys);
  return findOrInsert(keys, chunk, ref.row, ref.hash);
}

std::vector<ColumnPtr> GroupTable::keyColumns(
    const std::vector<const ir::Type*>& types) const {
  CHECK_EQ(types.size(), num_keys_);
  std::vector<ColumnPtr> res;
  for (size_t key = 0; key < num_keys_; ++key) {
    ColumnBuilder builder(types[key], groups_.size());
    for (auto& ref : groups_) {
      builder.appendFrom(*chunks_[ref.chunk][key], ref.row);
    }
    res.push_back(builder.finish());
  }
  return res;
}

//
// GroupByState
//

GroupByState::GroupByState(std::vector<const ir::Type*> key_types,
                           std::vector<AggSpec> aggs)
    : key_types_(std::move(key_types)), specs_(std::move(aggs)), table_(key_types_.size()) {
  for (auto& spec : specs_) {
    accs_.push_back(makeAccumulator(spec));
  }
}

std::unique_ptr<GroupByState> GroupByState::makeEmpty() const {
  return std::make_unique<GroupByState>(key_types_, specs_);
}

void GroupByState::update(const std::vector<ColumnPtr>& keys,
                          const std::vector<ColumnPtr>& args,
                          size_t num_rows) {
  CHECK_EQ(args.size(), accs_.size());
  GroupIds group_ids;
  table_.insert(keys, num_rows, group_ids);
  for (size_t i = 0; i < accs_.size(); ++i) {
    accs_[i]->resize(table_.size());
    accs_[i]->update(args[i], group_ids);
  }
}

void GroupByState::mergeGroups(const GroupByState& other, GroupIds& group_map) {
  for (size_t i = 0; i < accs_.size(); ++i) {
    accs_[i]->resize(table_.size());
    accs_[i]->merge(*other.accs_[i], group_map);
  }
}

void GroupByState::merge(const GroupByState& other) {
  GroupIds group_map(other.groupCount());
  for (uint32_t group = 0; group < other.groupCount(); ++group) {
    group_map[group] = table_.insertGroupFrom(other.table_, group);
  }
  mergeGroups(other, group_map);
}

GroupByState::Result GroupByState::finalize() const {
  Result res;
  if (key_types_.empty() && !table_.size()) {
    for (auto& spec : specs_) {
      auto acc = makeAccumulator(spec);
      acc->resize(1);
      res.aggs.push_back(acc->finalize());
    }
    res.num_groups = 1;
    return res;
  }
  res.keys = table_.keyColumns(key_types_);
  for (auto& acc : accs_) {
    acc->resize(table_.size());
    res.aggs.push_back(acc->finalize());
  }
  res.num_groups = table_.size();
  return res;
}

GroupByState::Result GroupByState::mergePartitioned(
    const std::vector<std::unique_ptr<GroupByState>>& states,
    size_t num_partitions,
    bool parallel) {
  CHECK(!states.empty());
  if (states.size() == 1) {
    return states.front()->finalize();
  }
  auto& proto = *states.front();
  if (proto.key_types_.empty()) {
    num_partitions = 1;
  }
  num_partitions = std::max<size_t>(num_partitions, 1);

  // Position of the first occurrence of each partition group: (state, group).
  using Origin = std::pair<uint32_t, uint32_t>;
  std::vector<std::unique_ptr<GroupByState>> parts(num_partitions);
  std::vector<std::vector<Origin>> origins(num_partitions);
  threading::parallel_for_each(num_partitions, parallel, [&](size_t part_idx) {
    auto part = proto.makeEmpty();
    for (uint32_t state_idx = 0; state_idx < states.size(); ++state_idx) {
      auto& state = *states[state_idx];
      GroupIds group_map(state.groupCount(), kNoGroup);
      for (uint32_t group = 0; group < state.groupCount(); ++group) {
        if (state.table_.groupHash(group) % num_partitions != part_idx) {
          continue;
        }
        auto new_group = static_cast<uint32_t>(part->table_.size());
        group_map[group] = part->table_.insertGroupFrom(state.table_, group);
        if (group_map[group] == new_group) {
          origins[part_idx].emplace_back(state_idx, group);
        }
      }
      part->mergeGroups(state, group_map);
    }
    parts[part_idx] = std::move(part);
  });

  if (num_partitions == 1) {
    return parts.front()->finalize();
  }

  struct Position {
    Origin origin;
    size_t part;
    size_t idx;
  };
  std::vector<Position> order;
  std::vector<size_t> offsets(num_partitions, 0);
  for (size_t part_idx = 0; part_idx < num_partitions; ++part_idx) {
    if (part_idx) {
      offsets[part_idx] = offsets[part_idx - 1] + origins[part_idx - 1].size();
    }
    for (size_t idx = 0; idx < origins[part_idx].size(); ++idx) {
      order.push_back({origins[part_idx][idx], part_idx, idx});
    }
  }
  std::sort(order.begin(), order.end(), [](const Position& lhs, const Position& rhs) {
    return lhs.origin < rhs.origin;
  });
  std::vector<int64_t> indices;
  indices.reserve(order.size());
  for (auto& pos : order) {
    indices.push_back(static_cast<int64_t>(offsets[pos.part] + pos.idx));
  }

  std::vector<Result> part_results;
  for (auto& part : parts) {
    part_results.push_back(part->finalize());
  }
  Result res;
  res.num_groups = indices.size();
  auto gather = [&](auto get_column, size_t count) {
    std::vector<ColumnPtr> cols;
    for (size_t col_idx = 0; col_idx < count; ++col_idx) {
      std::vector<ColumnPtr> pieces;
      for (auto& part_res : part_results) {
        pieces.push_back(get_column(part_res, col_idx));
      }
      cols.push_back(take(concat(pieces), indices));
    }
    return cols;
  };
  res.keys = gather([](const Result& r, size_t i) { return r.keys[i]; },
                    proto.key_types_.size());
  res.aggs = gather([](const Result& r, size_t i) { return r.aggs[i]; },
                    proto.specs_.size());
  return res;
}

}  // namespace lqe
