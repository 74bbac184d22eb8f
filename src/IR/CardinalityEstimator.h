/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "Node.h"

#include <optional>

namespace lqe::ir {

// Rough estimation of the number of rows produced by a node. Returns nullopt
// when a data provider cannot tell its table size.
std::optional<size_t> estimateRows(const QueryDag& dag, NodeId id);

}  // namespace lqe::ir
