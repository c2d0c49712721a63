/**
 * @file connection.h
 * @brief Display connection and proxy window for ClipWatch
 */

#ifndef CLIPWATCH_CONNECTION_H
#define CLIPWATCH_CONNECTION_H

#include "error.h"
#include "platform.h"
#include "transport.h"
#include "types.h"
#include <memory>
#include <set>

namespace clipwatch {

/// Property on the proxy window that receives converted selection data
constexpr const char *kTransferPropertyName = "XSEL_DATA";

// ============================================================================
// Connection Handle
// ============================================================================

/**
 * @brief Owns one display connection and the invisible proxy window
 *
 * The proxy window takes part in the selection protocol as requestor and
 * holds the transfer property. Every protocol component borrows the handle
 * by reference; nothing about the connection lives in globals.
 *
 * Teardown (delete property, destroy window, close connection) runs exactly
 * once, from close() or from the destructor, whichever comes first.
 *
 * @code
 *   auto transport = connect_x11();
 *   if (!transport) return 1;
 *   auto conn = ConnectionHandle::open(std::move(transport).value());
 * @endcode
 */
class CLIPWATCH_API ConnectionHandle {
public:
  ~ConnectionHandle();

  // Non-copyable, non-movable: components hold references to it
  ConnectionHandle(const ConnectionHandle &) = delete;
  ConnectionHandle &operator=(const ConnectionHandle &) = delete;

  /**
   * @brief Create the proxy window and reserve the transfer property
   * @param transport Connected transport, owned by the handle from now on
   * @return Handle, or ConnectionError
   */
  static Result<std::unique_ptr<ConnectionHandle>>
  open(std::unique_ptr<DisplayTransport> transport);

  /// Tear down the server-side resources. Idempotent.
  void close();

  bool is_open() const { return open_; }

  DisplayTransport &transport() { return *transport_; }

  /// Proxy window used as requestor and event sink
  WindowId window() const { return window_; }

  /// Atom of the property the owner writes its replies to
  AtomId transfer_property() const { return transfer_property_; }

  /**
   * @brief Remember an ownership change that arrived mid-conversion
   *
   * Several changes of the same selection collapse into one.
   */
  void defer_owner_change(AtomId selection);

  /// Consume a deferred ownership change of `selection`, if any
  bool take_owner_change(AtomId selection);

private:
  ConnectionHandle(std::unique_ptr<DisplayTransport> transport,
                   WindowId window, AtomId transfer_property);

  std::unique_ptr<DisplayTransport> transport_;
  WindowId window_ = kNone;
  AtomId transfer_property_ = kNone;
  std::set<AtomId> deferred_owner_changes_;
  bool open_ = false;
};

} // namespace clipwatch

#endif // CLIPWATCH_CONNECTION_H
