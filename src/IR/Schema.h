/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "Type.h"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lqe::ir {

struct Field {
  std::string name;
  const Type* type;
};

/**
 * Ordered column name to type mapping. Names are unique.
 */
class Schema {
 public:
  Schema() = default;
  explicit Schema(std::vector<Field> fields);

  size_t size() const { return fields_.size(); }
  bool empty() const { return fields_.empty(); }

  const Field& operator[](size_t idx) const { return fields_[idx]; }
  const std::vector<Field>& fields() const { return fields_; }
  std::vector<Field>::const_iterator begin() const { return fields_.begin(); }
  std::vector<Field>::const_iterator end() const { return fields_.end(); }

  bool contains(const std::string& name) const { return index_.count(name); }
  std::optional<size_t> indexOf(const std::string& name) const;
  // Throws SchemaError for unknown names.
  size_t indexOfOrThrow(const std::string& name) const;
  const Type* typeOf(const std::string& name) const;

  std::vector<std::string> names() const;

  // Schema with the given columns in the given order.
  Schema select(const std::vector<std::string>& names) const;

  bool operator==(const Schema& other) const;
  bool operator!=(const Schema& other) const { return !(*this == other); }

  std::string toString() const;

 private:
  std::vector<Field> fields_;
  std::unordered_map<std::string, size_t> index_;
};

}  // namespace lqe::ir
