/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "IR/Exception.h"

#include <arrow/status.h>

#define ARROW_THROW_NOT_OK(s)                                           \
  do {                                                                  \
    ::arrow::Status _s = (s);                                           \
    if (!_s.ok()) {                                                     \
      throw ::lqe::ir::ComputeError() << "Arrow error: " << _s.ToString(); \
    }                                                                   \
  } while (0)
