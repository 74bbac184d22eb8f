/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

/*
 * @file    Logger.h
 * @brief   Boost.Log backed logging and invariant checking.
 *
 * Severities are ordered from the most verbose (DEBUG4) to FATAL. LOG(FATAL) and
 * failed CHECKs write the message and then throw logger::CheckFailed.
 *
 *   LOG(INFO) << "Optimized plan " << dag->toString();
 *   VLOG(1) << "Streaming boundary above " << node->label();
 *   CHECK_LT(idx, columns.size());
 */

#pragma once

#include <boost/config.hpp>

#include <array>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

namespace boost::program_options {
class options_description;
}

namespace logger {

enum Severity {
  DEBUG4 = 0,
  DEBUG3,
  DEBUG2,
  DEBUG1,
  INFO,
  WARNING,
  ERROR,
  FATAL,
  _NSEVERITIES  // number of severity levels
};

// Must be kept in the same order as Severity.
constexpr std::array<char const*, 8> SeverityNames{
    {"DEBUG4", "DEBUG3", "DEBUG2", "DEBUG1", "INFO", "WARNING", "ERROR", "FATAL"}};

constexpr std::array<char, 8> SeveritySymbols{{'4', '3', '2', '1', 'I', 'W', 'E', 'F'}};

std::ostream& operator<<(std::ostream& os, Severity severity);
std::istream& operator>>(std::istream& is, Severity& severity);

class CheckFailed : public std::runtime_error {
 public:
  explicit CheckFailed(const std::string& msg) : std::runtime_error(msg) {}
};

// Filled by command line or set directly before logger::init().
class LogOptions {
 public:
  explicit LogOptions(char const* argv0);
  ~LogOptions();

  boost::program_options::options_description const& get_options() const;
  void parse_command_line(int argc, char const* const* argv);
  void set_options();

  std::string log_dir_{"lqe_log"};
  // file_name_pattern_ is prefixed by the program name.
  std::string file_name_pattern_{".%Y%m%d-%H%M%S.log"};
  Severity severity_{Severity::INFO};
  Severity severity_clog_{Severity::ERROR};
  bool auto_flush_{true};
  // Zero disables the file sink.
  size_t max_files_{100};
  size_t rotation_size_{10 * 1024 * 1024};

  const std::string& base_name() const { return base_name_; }

 private:
  std::string base_name_;
  std::unique_ptr<boost::program_options::options_description> options_;
};

void init(LogOptions const& log_opts);

void shutdown();

// True if a message of the given severity would reach at least one sink.
bool fast_logging_check(Severity severity);

class Logger {
 public:
  explicit Logger(Severity severity);
  Logger(Logger&&) = default;
  ~Logger() noexcept(false);

  explicit operator bool() const { return enabled_; }

  std::ostream& stream(char const* file, int line);

 private:
  Severity severity_;
  bool enabled_;
  std::unique_ptr<std::ostringstream> buffer_;
};

}  // namespace logger

#define LOG(tag)                                                  \
  if (auto _lqe_logger_ = logger::Logger(logger::Severity::tag)) \
  _lqe_logger_.stream(__FILE__, __LINE__)

#define VLOG(n) LOG(DEBUG##n)

#define CHECK(condition)            \
  if (BOOST_UNLIKELY(!(condition))) \
  LOG(FATAL) << "Check failed: " #condition " "

#define LQE_CHECK_OP(OP, x, y)                                                         \
  if (BOOST_UNLIKELY(!((x)OP(y))))                                                     \
  LOG(FATAL) << "Check failed: " #x " " #OP " " #y " (" << (x) << " " #OP " " << (y) \
             << ") "

#define CHECK_EQ(x, y) LQE_CHECK_OP(==, x, y)
#define CHECK_NE(x, y) LQE_CHECK_OP(!=, x, y)
#define CHECK_LT(x, y) LQE_CHECK_OP(<, x, y)
#define CHECK_LE(x, y) LQE_CHECK_OP(<=, x, y)
#define CHECK_GT(x, y) LQE_CHECK_OP(>, x, y)
#define CHECK_GE(x, y) LQE_CHECK_OP(>=, x, y)

#define UNREACHABLE() LOG(FATAL) << "UNREACHABLE "
