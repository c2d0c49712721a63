/**
 * @file record.h
 * @brief Clipboard records handed to the sink
 */

#ifndef CLIPWATCH_RECORD_H
#define CLIPWATCH_RECORD_H

#include "error.h"
#include "platform.h"
#include "types.h"
#include <functional>
#include <optional>
#include <string>
#include <variant>

namespace clipwatch {

// ============================================================================
// Record Types
// ============================================================================

/**
 * @brief HTML fragment copied from the owner
 */
struct HtmlRecord {
  std::string content;

  /// Title of the owning window, absent if unknown
  std::optional<std::string> owner;

  /// Source page. Never known on X11; kept for the Windows record layout.
  std::optional<std::string> url;

  Timestamp created_at;
};

/**
 * @brief Plain Unicode text copied from the owner
 */
struct UnicodeTextRecord {
  std::string content;

  /// Title of the owning window, absent if unknown
  std::optional<std::string> owner;

  Timestamp created_at;
};

/// One captured clipboard content. Built once per successful cycle.
using ClipboardRecord = std::variant<HtmlRecord, UnicodeTextRecord>;

/**
 * @brief Receives records from the watcher
 *
 * A returned error is logged by the watcher; it never stops the loop.
 */
using ClipboardSink = std::function<Result<void>(const ClipboardRecord &)>;

// ============================================================================
// Helpers
// ============================================================================

/// "html" or "text"
CLIPWATCH_API const char *record_type_name(const ClipboardRecord &record);

CLIPWATCH_API const std::string &record_content(const ClipboardRecord &record);

CLIPWATCH_API const std::optional<std::string> &
record_owner(const ClipboardRecord &record);

CLIPWATCH_API Timestamp record_created_at(const ClipboardRecord &record);

/**
 * @brief Build the record for content fetched as `target`
 *
 * text/html produces an HtmlRecord; every other target produces a
 * UnicodeTextRecord. created_at is taken from the system clock.
 */
CLIPWATCH_API ClipboardRecord make_record(const std::string &target,
                                          std::string content,
                                          std::optional<std::string> owner);

} // namespace clipwatch

#endif // CLIPWATCH_RECORD_H
