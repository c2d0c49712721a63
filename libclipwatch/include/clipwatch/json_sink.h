/**
 * @file json_sink.h
 * @brief JSON history file sink for ClipWatch
 *
 * The history is a single JSON array. Each record becomes
 *   {"type": "html"|"text",
 *    "data": {"content": ..., "owner": ..., "url": ..., "created_at": ...}}
 * where "url" only appears for html records and absent values are null.
 */

#ifndef CLIPWATCH_JSON_SINK_H
#define CLIPWATCH_JSON_SINK_H

#include "error.h"
#include "platform.h"
#include "record.h"
#include "types.h"
#include <filesystem>
#include <string>

namespace clipwatch {

/**
 * @brief Format a timestamp as RFC 3339 UTC with microseconds
 *
 * Example: 2024-03-01T12:30:05.000042Z
 */
CLIPWATCH_API std::string format_rfc3339(Timestamp timestamp);

/**
 * @brief Appends records to a JSON array file
 *
 * Every append reads the existing array, pushes the new element and rewrites
 * the whole file. A missing, unreadable or malformed file counts as an empty
 * history.
 */
class CLIPWATCH_API JsonFileSink {
public:
  explicit JsonFileSink(std::filesystem::path path);

  /**
   * @brief Persist one record
   * @return FileWriteError if the directory or file cannot be written
   */
  Result<void> append(const ClipboardRecord &record);

  /// Sink callable bound to this object
  ClipboardSink as_sink();

  const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

} // namespace clipwatch

#endif // CLIPWATCH_JSON_SINK_H
