/**
 * @file config.h
 * @brief Daemon configuration for ClipWatch
 */

#ifndef CLIPWATCH_CONFIG_H
#define CLIPWATCH_CONFIG_H

#include "error.h"
#include "log.h"
#include "platform.h"
#include <filesystem>
#include <string>
#include <vector>

namespace clipwatch {

// ============================================================================
// Watcher Configuration
// ============================================================================

/**
 * @brief Settings the daemon needs to run one watcher
 */
struct CLIPWATCH_API WatcherConfig {
  /// X display to connect to (empty = $DISPLAY)
  std::string display_name;

  /// History file the JSON sink appends to
  std::filesystem::path output_path;

  /// Targets to request, most preferred first
  std::vector<std::string> target_priority;

  /// Minimum level written to the log
  LogLevel log_level = LogLevel::Info;

  // ========================================================================
  // Methods
  // ========================================================================

  /// Reset every field to its default
  void load_defaults();

  /// Validate configuration
  Result<void> validate() const;

  /**
   * @brief Default data directory
   *
   * $XDG_DATA_HOME/clipwatch, else $HOME/.local/share/clipwatch, else
   * /tmp/clipwatch.
   */
  static std::filesystem::path get_default_data_dir();
};

/// File name of the history inside the data directory
constexpr const char *kDefaultOutputName = "clipboard.json";

} // namespace clipwatch

#endif // CLIPWATCH_CONFIG_H
