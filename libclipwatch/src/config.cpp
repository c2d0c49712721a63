/**
 * @file config.cpp
 * @brief Configuration defaults and validation
 */

#include <cstdlib>
#include <filesystem>
#include <string>

#include <pwd.h>
#include <unistd.h>

#include "clipwatch/config.h"
#include "clipwatch/targets.h"

namespace fs = ::std::filesystem;

namespace clipwatch {

void WatcherConfig::load_defaults() {
  display_name.clear();
  output_path = get_default_data_dir() / kDefaultOutputName;
  target_priority = default_target_priority();
  log_level = LogLevel::Info;
}

Result<void> WatcherConfig::validate() const {
  if (output_path.empty()) {
    return Error(ErrorCode::InvalidArgument, "Output path is empty");
  }

  std::error_code ec;
  if (fs::is_directory(output_path, ec)) {
    return Error(ErrorCode::InvalidArgument, "Output path is a directory",
                 output_path.string());
  }

  if (target_priority.empty()) {
    return Error(ErrorCode::InvalidArgument, "Target priority list is empty");
  }

  for (const auto &target : target_priority) {
    if (target.empty()) {
      return Error(ErrorCode::InvalidArgument,
                   "Target priority list contains an empty name");
    }
  }

  return Result<void>::ok();
}

fs::path WatcherConfig::get_default_data_dir() {
  const char *xdg_data = std::getenv("XDG_DATA_HOME");
  if (xdg_data && *xdg_data) {
    return fs::path(xdg_data) / "clipwatch";
  }

  const char *home = std::getenv("HOME");
  if (!home || !*home) {
    struct passwd *pw = getpwuid(getuid());
    if (pw) {
      home = pw->pw_dir;
    }
  }
  if (home && *home) {
    return fs::path(home) / ".local" / "share" / "clipwatch";
  }

  return fs::path("/tmp/clipwatch");
}

} // namespace clipwatch
