/**
 * @file x11_transport.cpp
 * @brief Xlib/XFixes transport implementation
 *
 * A thin mapping of DisplayTransport onto Xlib calls. The proxy window is
 * created unmapped at (-10,-10) so it never shows up on screen, and the
 * ownership notifications come from the XFixes extension.
 */

#include "x11_transport.h"
#include "clipwatch/log.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <poll.h>

namespace clipwatch {
namespace platform {

namespace {

constexpr const char *kComponent = "x11";

// Xlib's error handler receives no user data, so the last error lives here.
// The handler is process-wide (installed once by connect_x11) and there is
// one display connection per process. Only ErrorTrap reads the value: it
// syncs and clears it on entry, so errors raised outside a trap are logged
// and then discarded by the next trap. The watcher is single-threaded.
int g_last_x_error = 0;

int on_x_error(Display *display, XErrorEvent *event) {
  char text[128] = {0};
  XGetErrorText(display, event->error_code, text, sizeof(text));
  CLIPWATCH_LOG_DEBUG(kComponent, "X error: " << text << " (request "
                                              << int(event->request_code)
                                              << ")");
  g_last_x_error = event->error_code;
  return 0;
}

/**
 * @brief Collects X errors raised by the requests issued in its scope
 */
class ErrorTrap {
public:
  explicit ErrorTrap(Display *display) : display_(display) {
    XSync(display_, False);
    g_last_x_error = 0;
  }

  /// Wait for the server and return the first error code, 0 if none
  int finish() {
    XSync(display_, False);
    int code = g_last_x_error;
    g_last_x_error = 0;
    return code;
  }

private:
  Display *display_;
};

struct XFreeDeleter {
  void operator()(void *ptr) const {
    if (ptr) {
      XFree(ptr);
    }
  }
};

template <typename T> using XPtr = std::unique_ptr<T, XFreeDeleter>;

size_t element_size(int format) {
  switch (format) {
  case 8:
    return 1;
  case 16:
    return sizeof(short);
  case 32:
    return sizeof(long);
  default:
    return 0;
  }
}

} // namespace

void install_x_error_handler() { XSetErrorHandler(on_x_error); }

// ============================================================================
// Lifetime
// ============================================================================

X11Transport::X11Transport(Display *display, int termination_fd)
    : display_(display), termination_fd_(termination_fd) {}

X11Transport::~X11Transport() { close(); }

void X11Transport::close() {
  if (display_) {
    XCloseDisplay(display_);
    display_ = nullptr;
  }
}

// ============================================================================
// Windows and Atoms
// ============================================================================

Result<WindowId> X11Transport::create_window() {
  Window window = XCreateSimpleWindow(display_, DefaultRootWindow(display_),
                                      -10, -10, 1, 1, 0, 0, 0);
  if (window == None) {
    return Error(ErrorCode::ConnectionError, "XCreateSimpleWindow failed");
  }
  return static_cast<WindowId>(window);
}

void X11Transport::destroy_window(WindowId window) {
  XDestroyWindow(display_, window);
}

Result<AtomId> X11Transport::intern_atom(const std::string &name) {
  Atom atom = XInternAtom(display_, name.c_str(), False);
  if (atom == None) {
    return Error(ErrorCode::AtomInternFailed, "XInternAtom failed", name);
  }
  return static_cast<AtomId>(atom);
}

Result<std::string> X11Transport::atom_name(AtomId atom) {
  ErrorTrap trap(display_);
  XPtr<char> name(XGetAtomName(display_, atom));
  if (trap.finish() != 0 || !name) {
    return Error(ErrorCode::DecodeError, "Unknown atom",
                 std::to_string(atom));
  }
  return std::string(name.get());
}

// ============================================================================
// Selection Conversion
// ============================================================================

void X11Transport::select_selection_notify(WindowId window) {
  // SelectionNotify cannot be masked; the proxy selects no core input
  XSelectInput(display_, window, NoEventMask);
}

Result<void> X11Transport::convert_selection(AtomId selection, AtomId target,
                                             AtomId property,
                                             WindowId requestor) {
  XConvertSelection(display_, selection, target, property, requestor,
                    CurrentTime);
  XFlush(display_);
  return Result<void>::ok();
}

Result<PropertyInfo> X11Transport::probe_property(WindowId window,
                                                  AtomId property) {
  Atom type = None;
  int format = 0;
  unsigned long items = 0;
  unsigned long bytes_after = 0;
  unsigned char *raw = nullptr;

  int status = XGetWindowProperty(display_, window, property, 0, 0, False,
                                  AnyPropertyType, &type, &format, &items,
                                  &bytes_after, &raw);
  XPtr<unsigned char> data(raw);
  if (status != Success) {
    return Error(ErrorCode::DecodeError, "XGetWindowProperty probe failed");
  }

  PropertyInfo info;
  info.type = type;
  info.format = format;
  info.size = bytes_after;
  return info;
}

Result<PropertyData> X11Transport::read_property(WindowId window,
                                                 AtomId property,
                                                 unsigned long size) {
  Atom type = None;
  int format = 0;
  unsigned long items = 0;
  unsigned long bytes_after = 0;
  unsigned char *raw = nullptr;

  // Length is counted in 32-bit units
  const long length = static_cast<long>((size + 3) / 4);
  int status = XGetWindowProperty(display_, window, property, 0, length,
                                  False, AnyPropertyType, &type, &format,
                                  &items, &bytes_after, &raw);
  XPtr<unsigned char> data(raw);
  if (status != Success) {
    return Error(ErrorCode::DecodeError, "XGetWindowProperty read failed");
  }
  if (bytes_after != 0) {
    return Error(ErrorCode::DecodeError, "Property grew after the probe",
                 std::to_string(bytes_after) + " bytes left");
  }

  PropertyData result;
  result.type = type;
  result.format = format;
  result.item_count = items;
  if (raw && items > 0) {
    result.data.assign(raw, raw + items * element_size(format));
  }
  return result;
}

void X11Transport::delete_property(WindowId window, AtomId property) {
  XDeleteProperty(display_, window, property);
}

// ============================================================================
// Events
// ============================================================================

Result<DisplayEvent> X11Transport::next_event() {
  if (!display_) {
    return Error(ErrorCode::ConnectionLost, "Display is closed");
  }

  // XPending flushes queued requests before we block
  while (XPending(display_) == 0) {
    auto ready = wait_readable();
    if (ready.is_error()) {
      return ready.error();
    }
  }

  XEvent event;
  XNextEvent(display_, &event);
  return translate(event);
}

Result<void> X11Transport::wait_readable() {
  pollfd fds[2];
  fds[0].fd = ConnectionNumber(display_);
  fds[0].events = POLLIN;
  fds[0].revents = 0;
  nfds_t count = 1;

  if (termination_fd_ >= 0) {
    fds[1].fd = termination_fd_;
    fds[1].events = POLLIN;
    fds[1].revents = 0;
    count = 2;
  }

  for (;;) {
    if (::poll(fds, count, -1) >= 0) {
      break;
    }
    if (errno != EINTR) {
      return Error(ErrorCode::ConnectionLost, "poll failed",
                   std::strerror(errno));
    }
  }

  if (count == 2 && (fds[1].revents & POLLIN)) {
    return Error(ErrorCode::Terminated, "Termination signal received");
  }
  if (fds[0].revents & (POLLERR | POLLHUP | POLLNVAL)) {
    return Error(ErrorCode::ConnectionLost, "X server closed the connection");
  }
  return Result<void>::ok();
}

DisplayEvent X11Transport::translate(const XEvent &event) const {
  DisplayEvent out;

  if (event.type == SelectionNotify) {
    out.kind = EventKind::ConversionNotify;
    out.selection = event.xselection.selection;
    out.target = event.xselection.target;
    out.property = event.xselection.property;
  } else if (fixes_available_ &&
             event.type == fixes_event_base_ + XFixesSelectionNotify) {
    const auto *fixes =
        reinterpret_cast<const XFixesSelectionNotifyEvent *>(&event);
    out.kind = EventKind::OwnerChanged;
    out.selection = fixes->selection;
    out.owner = fixes->owner;
  }

  return out;
}

// ============================================================================
// Ownership Notifications
// ============================================================================

bool X11Transport::query_fixes_extension() {
  fixes_available_ =
      XFixesQueryExtension(display_, &fixes_event_base_, &fixes_error_base_) !=
      0;
  if (fixes_available_) {
    int major = 0;
    int minor = 0;
    XFixesQueryVersion(display_, &major, &minor);
    CLIPWATCH_LOG_DEBUG(kComponent,
                        "XFixes " << major << "." << minor << ", event base "
                                  << fixes_event_base_);
  }
  return fixes_available_;
}

Result<void> X11Transport::select_owner_change_input(WindowId window,
                                                     AtomId selection) {
  if (!fixes_available_) {
    return Error(ErrorCode::ExtensionUnavailable,
                 "XFixes has not been queried or is missing");
  }
  XFixesSelectSelectionInput(display_, window, selection,
                             XFixesSetSelectionOwnerNotifyMask);
  XFlush(display_);
  return Result<void>::ok();
}

WindowId X11Transport::selection_owner(AtomId selection) {
  return XGetSelectionOwner(display_, selection);
}

Result<std::string> X11Transport::window_title(WindowId window) {
  auto net_name = read_net_wm_name(window);
  if (net_name.is_error() || !net_name.value().empty()) {
    return net_name;
  }

  char *raw = nullptr;
  ErrorTrap trap(display_);
  Status fetched = XFetchName(display_, window, &raw);
  XPtr<char> name(raw);
  if (trap.finish() != 0) {
    return Error(ErrorCode::InvalidArgument, "Owner window vanished");
  }
  if (!fetched || !name) {
    return std::string();
  }
  return std::string(name.get());
}

Result<std::string> X11Transport::read_net_wm_name(Window window) {
  Atom net_wm_name = XInternAtom(display_, "_NET_WM_NAME", False);
  Atom utf8 = XInternAtom(display_, "UTF8_STRING", False);

  Atom type = None;
  int format = 0;
  unsigned long items = 0;
  unsigned long bytes_after = 0;
  unsigned char *raw = nullptr;

  ErrorTrap trap(display_);
  int status = XGetWindowProperty(display_, window, net_wm_name, 0, 1024,
                                  False, utf8, &type, &format, &items,
                                  &bytes_after, &raw);
  XPtr<unsigned char> data(raw);
  if (trap.finish() != 0 || status != Success) {
    return Error(ErrorCode::InvalidArgument, "Owner window vanished");
  }
  if (type != utf8 || format != 8 || !raw) {
    return std::string();
  }
  return std::string(reinterpret_cast<const char *>(raw), items);
}

} // namespace platform

// ============================================================================
// Factory
// ============================================================================

Result<std::unique_ptr<DisplayTransport>>
connect_x11(const X11ConnectOptions &options) {
  const char *name =
      options.display_name.empty() ? nullptr : options.display_name.c_str();

  Display *display = XOpenDisplay(name);
  if (!display) {
    return Error(ErrorCode::ConnectionError, "Could not connect to X server",
                 XDisplayName(name));
  }

  platform::install_x_error_handler();
  CLIPWATCH_LOG_DEBUG("x11", "connected to " << DisplayString(display));

  return std::unique_ptr<DisplayTransport>(
      new platform::X11Transport(display, options.termination_fd));
}

} // namespace clipwatch
