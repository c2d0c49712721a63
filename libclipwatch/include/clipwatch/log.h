/**
 * @file log.h
 * @brief Levelled logging for ClipWatch
 *
 * Messages go to std::cerr by default. The handler can be replaced, which
 * the unit tests use to observe what a failed cycle reports.
 */

#ifndef CLIPWATCH_LOG_H
#define CLIPWATCH_LOG_H

#include "platform.h"
#include <cstdint>
#include <functional>
#include <sstream>
#include <string>

namespace clipwatch {

enum class LogLevel : uint8_t { Debug = 0, Info = 1, Warning = 2, Error = 3 };

CLIPWATCH_API const char *log_level_name(LogLevel level);

/// Messages below this level are dropped. Default: Info.
CLIPWATCH_API void set_log_level(LogLevel level);
CLIPWATCH_API LogLevel get_log_level();

using LogHandler = std::function<void(LogLevel level,
                                      const std::string &component,
                                      const std::string &message)>;

/**
 * @brief Replace the output handler
 * @param handler New handler; an empty function restores the stderr handler
 */
CLIPWATCH_API void set_log_handler(LogHandler handler);

CLIPWATCH_API void log_message(LogLevel level, const std::string &component,
                               const std::string &message);

} // namespace clipwatch

// ============================================================================
// Convenience Macros
// ============================================================================

#define CLIPWATCH_LOG(level, component, expr)                                  \
  do {                                                                         \
    if (static_cast<int>(level) >=                                             \
        static_cast<int>(::clipwatch::get_log_level())) {                      \
      std::ostringstream _clipwatch_log_oss;                                   \
      _clipwatch_log_oss << expr;                                              \
      ::clipwatch::log_message(level, component, _clipwatch_log_oss.str());    \
    }                                                                          \
  } while (0)

#define CLIPWATCH_LOG_DEBUG(component, expr)                                   \
  CLIPWATCH_LOG(::clipwatch::LogLevel::Debug, component, expr)
#define CLIPWATCH_LOG_INFO(component, expr)                                    \
  CLIPWATCH_LOG(::clipwatch::LogLevel::Info, component, expr)
#define CLIPWATCH_LOG_WARN(component, expr)                                    \
  CLIPWATCH_LOG(::clipwatch::LogLevel::Warning, component, expr)
#define CLIPWATCH_LOG_ERROR(component, expr)                                   \
  CLIPWATCH_LOG(::clipwatch::LogLevel::Error, component, expr)

#endif // CLIPWATCH_LOG_H
