/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "Schema.h"
#include "Exception.h"

namespace lqe::ir {

Schema::Schema(std::vector<Field> fields) : fields_(std::move(fields)) {
  index_.reserve(fields_.size());
  for (size_t i = 0; i < fields_.size(); ++i) {
    if (!index_.emplace(fields_[i].name, i).second) {
      throw SchemaError() << "Duplicate column name '" << fields_[i].name
                          << "' in schema " << toString();
    }
  }
}

std::optional<size_t> Schema::indexOf(const std::string& name) const {
  auto it = index_.find(name);
  if (it == index_.end()) {
    return std::nullopt;
  }
  return it->second;
}

size_t Schema::indexOfOrThrow(const std::string& name) const {
  auto it = index_.find(name);
  if (it == index_.end()) {
    throw SchemaError() << "Column '" << name << "' not found in schema " << toString();
  }
  return it->second;
}

const Type* Schema::typeOf(const std::string& name) const {
  return fields_[indexOfOrThrow(name)].type;
}

std::vector<std::string> Schema::names() const {
  std::vector<std::string> res;
  res.reserve(fields_.size());
  for (auto& field : fields_) {
    res.push_back(field.name);
  }
  return res;
}

Schema Schema::select(const std::vector<std::string>& names) const {
  std::vector<Field> fields;
  fields.reserve(names.size());
  for (auto& name : names) {
    fields.push_back(fields_[indexOfOrThrow(name)]);
  }
  return Schema(std::move(fields));
}

bool Schema::operator==(const Schema& other) const {
  if (fields_.size() != other.fields_.size()) {
    return false;
  }
  for (size_t i = 0; i < fields_.size(); ++i) {
    if (fields_[i].name != other.fields_[i].name ||
        !fields_[i].type->equal(*other.fields_[i].type)) {
      return false;
    }
  }
  return true;
}

std::string Schema::toString() const {
  std::string res = "{";
  for (size_t i = 0; i < fields_.size(); ++i) {
    if (i) {
      res += ", ";
    }
    res += fields_[i].name + ": " + fields_[i].type->toString();
  }
  return res + "}";
}

}  // namespace lqe::ir
