/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>

namespace snet {

typedef spdlog::level::level_enum LogLevel;

// Accepts spdlog level names ("trace", "debug", "info", "warn", "error", "critical", "off").
LogLevel log_level_from_string(const std::string &name);

/**
 * @brief Colored console logger shared by graph construction and the example CLI.
 *
 * Lines are written as `[date time.ms] [name] [level] message` (kLogPattern in
 * logger.cpp). Messages use fmt syntax and are dropped below the current level.
 */
class Logger {
public:
  explicit Logger(const std::string &name, LogLevel level = LogLevel::info);

  void set_level(LogLevel level);

  template <typename... Args> void debug(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    logger_->debug(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args> void info(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    logger_->info(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args> void warn(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    logger_->warn(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args> void error(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    logger_->error(fmt, std::forward<Args>(args)...);
  }

  bool should_log(LogLevel level) const { return logger_->should_log(level); }

private:
  std::shared_ptr<spdlog::logger> logger_;
};

// Process-wide "snet" logger, info level until set_level() is called.
class GlobalLogger {
private:
  static Logger &instance() {
    static Logger global_logger("snet");
    return global_logger;
  }

public:
  static void set_level(LogLevel level) { instance().set_level(level); }
  static bool should_log(LogLevel level) { return instance().should_log(level); }

  template <typename... Args>
  static void debug(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    instance().debug(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void info(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    instance().info(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void warn(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    instance().warn(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void error(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    instance().error(fmt, std::forward<Args>(args)...);
  }
};

}  // namespace snet
