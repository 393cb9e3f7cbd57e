/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "logging/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include "common/errors.hpp"

namespace snet {

namespace {
constexpr const char *kLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";
}

LogLevel log_level_from_string(const std::string &name) {
  LogLevel level = spdlog::level::from_str(name);
  // spdlog maps unknown names to "off"
  if (level == spdlog::level::off && name != "off") {
    throw ConfigurationError("Unknown log level: '" + name + "'");
  }
  return level;
}

Logger::Logger(const std::string &name, LogLevel level) {
  logger_ = spdlog::get(name);
  if (!logger_) {
    logger_ = spdlog::stdout_color_mt(name);
  }
  logger_->set_pattern(kLogPattern);
  logger_->set_level(level);
}

void Logger::set_level(LogLevel level) { logger_->set_level(level); }

}  // namespace snet
