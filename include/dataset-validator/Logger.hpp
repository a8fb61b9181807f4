#pragma once
#include "dataset-validator/export.h"

#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>
#include <string>

namespace dsvalidator {

/// Process wide logger. Every line is prefixed with the emitting component
/// and the run id, e.g. "[VALIDATOR] [run-1712] Chunk of 500 rows".
class DATASET_VALIDATOR_API ValidatorLogger {
public:
  static ValidatorLogger &instance();

  /// Attach a stderr sink and, unless log_file is empty, a rotating file
  /// sink. Once sinks exist a later call only changes the level.
  void init(const std::string &log_file, spdlog::level::level_enum level);

  spdlog::level::level_enum level() const;

  template <typename... Args>
  void trace(const std::string &component, const std::string &id,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::trace, component, id, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void debug(const std::string &component, const std::string &id,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::debug, component, id, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(const std::string &component, const std::string &id,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::info, component, id, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(const std::string &component, const std::string &id,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::warn, component, id, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(const std::string &component, const std::string &id,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::err, component, id, fmt_str,
        std::forward<Args>(args)...);
  }

private:
  ValidatorLogger() = default;

  template <typename... Args>
  void log(spdlog::level::level_enum level, const std::string &component,
           const std::string &id, const std::string &fmt_str,
           Args &&...args) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_ || !logger_->should_log(level))
      return;
    logger_->log(level, "[{}] [{}] {}", component, id,
                 fmt::format(fmt::runtime(fmt_str),
                             std::forward<Args>(args)...));
  }

  std::shared_ptr<spdlog::logger> logger_;
  mutable std::mutex mutex_;
};

/// Map a textual level ("trace".."error", "off") to spdlog, defaulting to info
DATASET_VALIDATOR_API spdlog::level::level_enum
parse_log_level(const std::string &level);

#define LOG_TRACE(component, id, ...)                                          \
  dsvalidator::ValidatorLogger::instance().trace(component, id, __VA_ARGS__)
#define LOG_DEBUG(component, id, ...)                                          \
  dsvalidator::ValidatorLogger::instance().debug(component, id, __VA_ARGS__)
#define LOG_INFO(component, id, ...)                                           \
  dsvalidator::ValidatorLogger::instance().info(component, id, __VA_ARGS__)
#define LOG_WARN(component, id, ...)                                           \
  dsvalidator::ValidatorLogger::instance().warn(component, id, __VA_ARGS__)
#define LOG_ERROR(component, id, ...)                                          \
  dsvalidator::ValidatorLogger::instance().error(component, id, __VA_ARGS__)

} // namespace dsvalidator
