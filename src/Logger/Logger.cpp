/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "Logger.h"

#include <boost/algorithm/string.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/log/attributes/clock.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/program_options.hpp>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <iostream>

namespace logger {

namespace attr = boost::log::attributes;
namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;
namespace po = boost::program_options;
namespace sinks = boost::log::sinks;
namespace sources = boost::log::sources;

namespace {

using SeverityLogger = sources::severity_logger_mt<Severity>;

SeverityLogger& global_logger() {
  static SeverityLogger lg;
  return lg;
}

// Messages below this severity are dropped before a record is created. Until
// init() is called only warnings and above go to the console.
std::atomic<int> g_min_active_severity{Severity::WARNING};
std::atomic<bool> g_initialized{false};

std::string program_base_name(char const* argv0) {
  if (!argv0) {
    return "lqe";
  }
  return std::filesystem::path(argv0).filename().string();
}

auto make_formatter() {
  return expr::stream << expr::format_date_time<boost::posix_time::ptime>(
                             "TimeStamp", "%Y-%m-%dT%H:%M:%S.%f")
                      << ' ' << expr::attr<attr::current_thread_id::value_type>("ThreadID")
                      << ' ' << expr::attr<Severity>("Severity") << ' '
                      << expr::smessage;
}

void add_console_sink(Severity min_severity) {
  using ConsoleSink = sinks::synchronous_sink<sinks::text_ostream_backend>;
  auto backend = boost::make_shared<sinks::text_ostream_backend>();
  backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
  backend->auto_flush(true);
  auto sink = boost::make_shared<ConsoleSink>(backend);
  sink->set_filter(expr::attr<Severity>("Severity") >= min_severity);
  sink->set_formatter(make_formatter());
  boost::log::core::get()->add_sink(sink);
}

void add_file_sink(LogOptions const& log_opts) {
  using FileSink = sinks::synchronous_sink<sinks::text_file_backend>;
  std::filesystem::create_directories(log_opts.log_dir_);
  auto const file_name = std::filesystem::path(log_opts.log_dir_) /
                         (log_opts.base_name() + log_opts.file_name_pattern_);
  auto backend = boost::make_shared<sinks::text_file_backend>(
      keywords::file_name = file_name.string(),
      keywords::rotation_size = log_opts.rotation_size_,
      keywords::auto_flush = log_opts.auto_flush_);
  auto sink = boost::make_shared<FileSink>(backend);
  sink->locked_backend()->set_file_collector(sinks::file::make_collector(
      keywords::target = log_opts.log_dir_, keywords::max_files = log_opts.max_files_));
  sink->locked_backend()->scan_for_files();
  sink->set_filter(expr::attr<Severity>("Severity") >= log_opts.severity_);
  sink->set_formatter(make_formatter());
  boost::log::core::get()->add_sink(sink);
}

}  // namespace

std::ostream& operator<<(std::ostream& os, Severity severity) {
  if (severity >= 0 && severity < _NSEVERITIES) {
    return os << SeveritySymbols[severity];
  }
  return os << '?';
}

std::istream& operator>>(std::istream& is, Severity& severity) {
  std::string token;
  is >> token;
  boost::algorithm::to_upper(token);
  for (size_t i = 0; i < SeverityNames.size(); ++i) {
    if (token == SeverityNames[i]) {
      severity = static_cast<Severity>(i);
      return is;
    }
  }
  is.setstate(std::ios_base::failbit);
  return is;
}

LogOptions::LogOptions(char const* argv0) : base_name_(program_base_name(argv0)) {
  set_options();
}

LogOptions::~LogOptions() {}

po::options_description const& LogOptions::get_options() const {
  return *options_;
}

void LogOptions::set_options() {
  options_ = std::make_unique<po::options_description>("Logging");
  options_->add_options()("log-directory",
                          po::value<std::string>(&log_dir_)->default_value(log_dir_),
                          "Logging directory.");
  options_->add_options()(
      "log-severity",
      po::value<Severity>(&severity_)->default_value(severity_),
      "Log to file severity level: DEBUG4 DEBUG3 DEBUG2 DEBUG1 INFO WARNING ERROR FATAL");
  options_->add_options()(
      "log-severity-clog",
      po::value<Severity>(&severity_clog_)->default_value(severity_clog_),
      "Log to console severity level: DEBUG4 DEBUG3 DEBUG2 DEBUG1 INFO WARNING ERROR "
      "FATAL");
  options_->add_options()("log-auto-flush",
                          po::value<bool>(&auto_flush_)->default_value(auto_flush_),
                          "Flush logging buffer to file after each message.");
  options_->add_options()("log-max-files",
                          po::value<size_t>(&max_files_)->default_value(max_files_),
                          "Maximum number of log files to keep. Zero disables file logs.");
  options_->add_options()(
      "log-rotation-size",
      po::value<size_t>(&rotation_size_)->default_value(rotation_size_),
      "Maximum file size in bytes before new log files are started.");
}

void LogOptions::parse_command_line(int argc, char const* const* argv) {
  po::variables_map vm;
  po::store(po::command_line_parser(argc, argv).options(*options_).allow_unregistered().run(),
            vm);
  po::notify(vm);
}

void init(LogOptions const& log_opts) {
  auto core = boost::log::core::get();
  core->remove_all_sinks();
  core->add_global_attribute("TimeStamp", attr::local_clock());
  core->add_global_attribute("ThreadID", attr::current_thread_id());

  int min_severity = log_opts.severity_clog_;
  if (log_opts.max_files_ > 0) {
    add_file_sink(log_opts);
    min_severity = std::min<int>(min_severity, log_opts.severity_);
  }
  add_console_sink(log_opts.severity_clog_);
  g_min_active_severity = min_severity;
  g_initialized = true;
}

void shutdown() {
  boost::log::core::get()->remove_all_sinks();
  g_initialized = false;
}

bool fast_logging_check(Severity severity) {
  return severity >= g_min_active_severity.load(std::memory_order_relaxed);
}

Logger::Logger(Severity severity)
    : severity_(severity), enabled_(severity == FATAL || fast_logging_check(severity)) {
  if (enabled_) {
    buffer_ = std::make_unique<std::ostringstream>();
  }
}

Logger::~Logger() noexcept(false) {
  if (!buffer_) {
    return;
  }
  const auto msg = buffer_->str();
  if (g_initialized) {
    auto& lg = global_logger();
    if (auto rec = lg.open_record(keywords::severity = severity_)) {
      boost::log::record_ostream strm(rec);
      strm << msg;
      strm.flush();
      lg.push_record(std::move(rec));
    }
  } else if (fast_logging_check(severity_)) {
    std::clog << severity_ << ' ' << msg << std::endl;
  }
  if (severity_ == FATAL) {
    throw CheckFailed(msg);
  }
}

std::ostream& Logger::stream(char const* file, int line) {
  auto const base = std::filesystem::path(file).filename().string();
  return *buffer_ << base << ':' << line << ' ';
}

}  // namespace logger
