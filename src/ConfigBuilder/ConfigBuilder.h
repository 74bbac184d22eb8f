/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "Shared/Config.h"

#include <string>

class ConfigBuilder {
 public:
  ConfigBuilder();
  explicit ConfigBuilder(ConfigPtr config);

  // Returns true if help was requested and printed.
  bool parseCommandLineArgs(int argc,
                            char const* const* argv,
                            bool allow_gtest_flags = false);
  bool parseCommandLineArgs(const std::string& app_name,
                            const std::string& cmd_args,
                            bool allow_gtest_flags = false);

  ConfigPtr config();

 private:
  ConfigPtr config_;
};
