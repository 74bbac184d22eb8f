/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ConfigBuilder.h"

#include "Logger/Logger.h"

#include <boost/program_options.hpp>

#include <iostream>

namespace po = boost::program_options;

namespace {

template <typename T>
auto get_range_checker(T min, T max, const char* opt) {
  return [min, max, opt](T val) {
    if (val < min || val > max) {
      throw po::validation_error(
          po::validation_error::invalid_option_value, opt, std::to_string(val));
    }
  };
}

}  // namespace

ConfigBuilder::ConfigBuilder() {
  config_ = std::make_shared<Config>();
}

ConfigBuilder::ConfigBuilder(ConfigPtr config) : config_(config) {}

bool ConfigBuilder::parseCommandLineArgs(int argc,
                                         char const* const* argv,
                                         bool allow_gtest_flags) {
  po::options_description opt_desc;

  opt_desc.add_options()("help,h", "Show available options.");

  // exec.watchdog
  opt_desc.add_options()("enable-watchdog",
                         po::value<bool>(&config_->exec.watchdog.enable)
                             ->default_value(config_->exec.watchdog.enable)
                             ->implicit_value(true),
                         "Enable watchdog.");
  opt_desc.add_options()("watchdog-max-groups",
                         po::value<size_t>(&config_->exec.watchdog.max_groups)
                             ->default_value(config_->exec.watchdog.max_groups),
                         "Watchdog limit for the number of aggregation groups.");
  opt_desc.add_options()("watchdog-max-join-rows",
                         po::value<size_t>(&config_->exec.watchdog.max_join_rows)
                             ->default_value(config_->exec.watchdog.max_join_rows),
                         "Watchdog limit for the number of rows produced by a join.");

  // exec.streaming
  opt_desc.add_options()("enable-streaming",
                         po::value<bool>(&config_->exec.streaming.enable)
                             ->default_value(config_->exec.streaming.enable)
                             ->implicit_value(true),
                         "Run streaming-capable plan subtrees through the morsel-driven "
                         "streaming executor.");
  opt_desc.add_options()(
      "morsel-size",
      po::value<size_t>(&config_->exec.streaming.morsel_size)
          ->default_value(config_->exec.streaming.morsel_size)
          ->notifier(get_range_checker<size_t>(1, size_t(1) << 32, "morsel-size")),
      "Number of rows in a streaming morsel.");

  // exec
  opt_desc.add_options()("enable-parallel",
                         po::value<bool>(&config_->exec.parallel)
                             ->default_value(config_->exec.parallel)
                             ->implicit_value(true),
                         "Enable intra-operator parallelism.");
  opt_desc.add_options()(
      "num-threads",
      po::value<unsigned>(&config_->exec.num_threads)
          ->default_value(config_->exec.num_threads)
          ->notifier(get_range_checker<unsigned>(0, 1024, "num-threads")),
      "Size of the worker pool. Zero means the number of hardware threads.");
  opt_desc.add_options()(
      "sub-task-size",
      po::value<size_t>(&config_->exec.sub_task_size)
          ->default_value(config_->exec.sub_task_size)
          ->notifier(get_range_checker<size_t>(1, size_t(1) << 32, "sub-task-size")),
      "Number of rows in a parallel sub-task of a filter or projection.");
  opt_desc.add_options()(
      "hash-partitions",
      po::value<size_t>(&config_->exec.hash_partitions)
          ->default_value(config_->exec.hash_partitions)
          ->notifier(get_range_checker<size_t>(1, 4096, "hash-partitions")),
      "Number of partitions used by parallel hash joins and aggregations.");

  // opts
  opt_desc.add_options()("enable-predicate-pushdown",
                         po::value<bool>(&config_->opts.predicate_pushdown)
                             ->default_value(config_->opts.predicate_pushdown)
                             ->implicit_value(true),
                         "Push filter predicates towards scans.");
  opt_desc.add_options()("enable-projection-pushdown",
                         po::value<bool>(&config_->opts.projection_pushdown)
                             ->default_value(config_->opts.projection_pushdown)
                             ->implicit_value(true),
                         "Prune columns that are not required by the query.");
  opt_desc.add_options()("enable-slice-pushdown",
                         po::value<bool>(&config_->opts.slice_pushdown)
                             ->default_value(config_->opts.slice_pushdown)
                             ->implicit_value(true),
                         "Push head/limit requirements towards scans and sorts.");
  opt_desc.add_options()("enable-cse",
                         po::value<bool>(&config_->opts.cse)
                             ->default_value(config_->opts.cse)
                             ->implicit_value(true),
                         "Enable common subexpression elimination.");
  opt_desc.add_options()("enable-simplify-expr",
                         po::value<bool>(&config_->opts.simplify_expr)
                             ->default_value(config_->opts.simplify_expr)
                             ->implicit_value(true),
                         "Enable constant folding and algebraic simplification.");
  opt_desc.add_options()("enable-join-reorder",
                         po::value<bool>(&config_->opts.join_reorder)
                             ->default_value(config_->opts.join_reorder)
                             ->implicit_value(true),
                         "Enable join simplification and build side selection.");

  // storage
  opt_desc.add_options()(
      "default-fragment-size",
      po::value<size_t>(&config_->storage.default_fragment_size)
          ->default_value(config_->storage.default_fragment_size)
          ->notifier(
              get_range_checker<size_t>(1, size_t(1) << 40, "default-fragment-size")),
      "Default number of rows in an imported table fragment.");

  // debug
  opt_desc.add_options()("log-plans",
                         po::value<bool>(&config_->debug.log_plans)
                             ->default_value(config_->debug.log_plans)
                             ->implicit_value(true),
                         "Log logical and physical plans of executed queries.");

  if (allow_gtest_flags) {
    opt_desc.add_options()("gtest_list_tests", "list all test");
    opt_desc.add_options()("gtest_filter", "filters tests, use --help for details");
  }

  // Logging is set up independently, logger options are only accepted here.
  logger::LogOptions log_opts("dummy_opts");
  log_opts.set_options();

  po::options_description all_opts;
  all_opts.add(opt_desc).add(log_opts.get_options());

  po::variables_map vm;
  po::store(po::command_line_parser(argc, argv).options(all_opts).run(), vm);
  po::notify(vm);

  if (vm.count("help")) {
    std::cout << all_opts << std::endl;
    return true;
  }

  return false;
}

bool ConfigBuilder::parseCommandLineArgs(const std::string& app_name,
                                         const std::string& cmd_args,
                                         bool allow_gtest_flags) {
  std::vector<std::string> args;
  if (!cmd_args.empty()) {
    args = po::split_unix(cmd_args);
  }

  std::vector<const char*> argv;
  argv.push_back(app_name.c_str());
  for (auto& arg : args) {
    argv.push_back(arg.c_str());
  }
  return parseCommandLineArgs(
      static_cast<int>(argv.size()), argv.data(), allow_gtest_flags);
}

ConfigPtr ConfigBuilder::config() {
  return config_;
}
