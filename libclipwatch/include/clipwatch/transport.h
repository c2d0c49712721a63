/**
 * @file transport.h
 * @brief Capability interface over the windowing server
 *
 * The selection protocol code only ever talks to the display server through
 * DisplayTransport. The X11 implementation lives in the platform directory;
 * unit tests substitute a scripted fake.
 *
 * Every call is a blocking round-trip. There is no timeout: next_event()
 * waits until the server (or, for the daemon, a termination signal) has
 * something to report.
 */

#ifndef CLIPWATCH_TRANSPORT_H
#define CLIPWATCH_TRANSPORT_H

#include "error.h"
#include "platform.h"
#include "types.h"
#include <memory>
#include <string>

namespace clipwatch {

// ============================================================================
// Events
// ============================================================================

/**
 * @brief Kind of event delivered to the proxy window
 */
enum class EventKind : uint8_t {
  /// Reply to a conversion request (SelectionNotify)
  ConversionNotify = 0,

  /// Selection ownership changed (XFixesSetSelectionOwnerNotify)
  OwnerChanged = 1,

  /// Anything else; ignored by the protocol code
  Other = 255
};

CLIPWATCH_API const char *event_kind_name(EventKind kind);

/**
 * @brief Transport-neutral view of one server event
 */
struct DisplayEvent {
  EventKind kind = EventKind::Other;

  /// Selection the event refers to
  AtomId selection = kNone;

  /// Requested target (SelectionNotify)
  AtomId target = kNone;

  /// Property holding the reply, kNone if the owner refused (SelectionNotify)
  AtomId property = kNone;

  /// New owner window, kNone if the selection was cleared (OwnerChanged)
  WindowId owner = kNone;
};

// ============================================================================
// Properties
// ============================================================================

/**
 * @brief Result of a zero-length property read
 */
struct PropertyInfo {
  /// Property type, kNone if the property does not exist
  AtomId type = kNone;

  /// Element size in bits (8, 16 or 32)
  int format = 0;

  /// Total number of bytes stored in the property
  unsigned long size = 0;

  bool exists() const { return type != kNone; }
};

/**
 * @brief Owned contents of a full property read
 *
 * Format-32 items are stored as native unsigned long values, one per item,
 * the same layout Xlib hands back.
 */
struct PropertyData {
  AtomId type = kNone;
  int format = 0;
  unsigned long item_count = 0;
  Bytes data;
};

// ============================================================================
// Transport Interface
// ============================================================================

/**
 * @brief The operations the selection protocol needs from a display server
 */
class CLIPWATCH_API DisplayTransport {
public:
  virtual ~DisplayTransport() = default;

  /// Close the server connection. Called once by ConnectionHandle.
  virtual void close() = 0;

  // ========================================================================
  // Windows and Atoms
  // ========================================================================

  /// Create the 1x1 unmapped off-screen proxy window
  virtual Result<WindowId> create_window() = 0;

  virtual void destroy_window(WindowId window) = 0;

  virtual Result<AtomId> intern_atom(const std::string &name) = 0;

  virtual Result<std::string> atom_name(AtomId atom) = 0;

  // ========================================================================
  // Selection Conversion
  // ========================================================================

  /// Ask the server to deliver selection-notify replies to this window
  virtual void select_selection_notify(WindowId window) = 0;

  /**
   * @brief Ask the owner of `selection` to convert it to `target`
   *
   * The owner writes the reply to `property` on `requestor` and the server
   * then sends a SelectionNotify event.
   */
  virtual Result<void> convert_selection(AtomId selection, AtomId target,
                                         AtomId property,
                                         WindowId requestor) = 0;

  /// Zero-length read: type, format and total size of a property
  virtual Result<PropertyInfo> probe_property(WindowId window,
                                              AtomId property) = 0;

  /// Read exactly `size` bytes of a property
  virtual Result<PropertyData> read_property(WindowId window, AtomId property,
                                             unsigned long size) = 0;

  virtual void delete_property(WindowId window, AtomId property) = 0;

  // ========================================================================
  // Events
  // ========================================================================

  /// Block until the next event arrives
  virtual Result<DisplayEvent> next_event() = 0;

  // ========================================================================
  // Ownership Notifications
  // ========================================================================

  /// True if the server supports selection ownership notifications
  virtual bool query_fixes_extension() = 0;

  /// Subscribe `window` to ownership changes of `selection`
  virtual Result<void> select_owner_change_input(WindowId window,
                                                 AtomId selection) = 0;

  /// Current owner of `selection`, kNone if unowned
  virtual WindowId selection_owner(AtomId selection) = 0;

  /// Title of a top-level window
  virtual Result<std::string> window_title(WindowId window) = 0;
};

// ============================================================================
// X11 Backend
// ============================================================================

/**
 * @brief Options for the Xlib transport
 */
struct X11ConnectOptions {
  /// Display to open, empty means $DISPLAY
  std::string display_name;

  /// Optional readable fd (e.g. a signalfd). When it becomes readable,
  /// next_event() returns ErrorCode::Terminated.
  int termination_fd = -1;
};

/**
 * @brief Connect to an X server through Xlib
 * @return Transport, or ConnectionError if the server is unreachable
 */
CLIPWATCH_API Result<std::unique_ptr<DisplayTransport>>
connect_x11(const X11ConnectOptions &options = {});

} // namespace clipwatch

#endif // CLIPWATCH_TRANSPORT_H
