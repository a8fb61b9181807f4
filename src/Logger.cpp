#include "dataset-validator/Logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace dsvalidator {

namespace {

constexpr size_t kMaxLogFileSize = 10 * 1024 * 1024;
constexpr size_t kMaxLogFiles = 3;

} // namespace

// DLL-safe singleton implementation
ValidatorLogger &ValidatorLogger::instance() {
  static ValidatorLogger logger;
  return logger;
}

void ValidatorLogger::init(const std::string &log_file,
                           spdlog::level::level_enum level) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (logger_) {
    logger_->set_level(level);
    return;
  }

  std::vector<spdlog::sink_ptr> sinks;
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console_sink->set_level(spdlog::level::info);
  sinks.push_back(console_sink);

  if (!log_file.empty()) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          log_file, kMaxLogFileSize, kMaxLogFiles));
    } catch (const spdlog::spdlog_ex &ex) {
      // An unwritable log file must not stop validation
      fmt::print(stderr, "Cannot open log file {}: {}\n", log_file, ex.what());
    }
  }

  logger_ = std::make_shared<spdlog::logger>("dsvalidator", sinks.begin(),
                                             sinks.end());
  logger_->set_level(level);
  logger_->flush_on(spdlog::level::warn);
}

spdlog::level::level_enum ValidatorLogger::level() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return logger_ ? logger_->level() : spdlog::level::off;
}

spdlog::level::level_enum parse_log_level(const std::string &level) {
  if (level == "trace")
    return spdlog::level::trace;
  if (level == "debug")
    return spdlog::level::debug;
  if (level == "warn" || level == "warning")
    return spdlog::level::warn;
  if (level == "error")
    return spdlog::level::err;
  if (level == "off")
    return spdlog::level::off;
  return spdlog::level::info;
}

} // namespace dsvalidator
