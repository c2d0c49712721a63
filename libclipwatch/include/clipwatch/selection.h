/**
 * @file selection.h
 * @brief Transfer of selection content for one target
 */

#ifndef CLIPWATCH_SELECTION_H
#define CLIPWATCH_SELECTION_H

#include "atoms.h"
#include "connection.h"
#include "error.h"
#include "platform.h"
#include "types.h"
#include <optional>
#include <string>

namespace clipwatch {

/**
 * @brief Runs one request/notify/read exchange for a content target
 *
 * Replies that the owner announces as INCR (too large for a single property)
 * are reported as UnsupportedIncrementalTransfer without reading them; the
 * chunked hand-off is not implemented. Nothing is retried.
 */
class CLIPWATCH_API SelectionTransfer {
public:
  SelectionTransfer(ConnectionHandle &connection, AtomRegistry &atoms);

  /**
   * @brief Fetch the selection converted to `target` as UTF-8 text
   * @param selection Selection atom (normally CLIPBOARD)
   * @param target Target atom taken from a negotiated TargetSet
   * @return Text, or ConversionRefused / UnsupportedIncrementalTransfer /
   *         DecodeError
   */
  Result<std::string> fetch(AtomId selection, AtomId target);

  /**
   * @brief Title of the window currently owning `selection`
   * @return Title, std::nullopt if unowned or untitled, or an error
   */
  Result<std::optional<std::string>> owner_title(AtomId selection);

private:
  ConnectionHandle &connection_;
  AtomRegistry &atoms_;
};

} // namespace clipwatch

#endif // CLIPWATCH_SELECTION_H
