/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "OpTypeEnums.h"
#include "Type.h"

namespace lqe::ir {

// Smallest type both arguments can be implicitly widened to. Returns nullptr if
// there is no such type.
const Type* commonType(const Type* lhs, const Type* rhs);

// Same as commonType but throws SchemaError with the given context.
const Type* commonTypeOrThrow(const Type* lhs, const Type* rhs, const std::string& ctx);

// Type both operands of a binary operation are coerced to.
const Type* binOperOperandType(OpType op, const Type* lhs, const Type* rhs);

const Type* binOperResultType(OpType op, const Type* lhs, const Type* rhs);

const Type* unaryOperResultType(OpType op, const Type* operand);

const Type* aggResultType(AggType agg, const Type* arg);

bool isCastSupported(const Type* from, const Type* to);

}  // namespace lqe::ir
