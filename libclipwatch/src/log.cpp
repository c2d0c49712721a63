/**
 * @file log.cpp
 * @brief Logging implementation
 */

#include "clipwatch/log.h"
#include <ctime>
#include <iostream>
#include <utility>

namespace clipwatch {

namespace {

LogLevel g_level = LogLevel::Info;
LogHandler g_handler;

void stderr_handler(LogLevel level, const std::string &component,
                    const std::string &message) {
  std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);

  std::cerr << "[" << stamp << "] [" << log_level_name(level) << "] "
            << component << ": " << message << std::endl;
}

} // namespace

const char *log_level_name(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "debug";
  case LogLevel::Info:
    return "info";
  case LogLevel::Warning:
    return "warning";
  case LogLevel::Error:
    return "error";
  default:
    return "unknown";
  }
}

void set_log_level(LogLevel level) { g_level = level; }

LogLevel get_log_level() { return g_level; }

void set_log_handler(LogHandler handler) { g_handler = std::move(handler); }

void log_message(LogLevel level, const std::string &component,
                 const std::string &message) {
  if (static_cast<int>(level) < static_cast<int>(g_level)) {
    return;
  }

  if (g_handler) {
    g_handler(level, component, message);
  } else {
    stderr_handler(level, component, message);
  }
}

} // namespace clipwatch
