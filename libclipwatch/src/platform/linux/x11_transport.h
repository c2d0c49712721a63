/**
 * @file x11_transport.h
 * @brief Xlib/XFixes implementation of DisplayTransport
 *
 * Internal to the library; callers obtain it through connect_x11().
 */

#ifndef CLIPWATCH_PLATFORM_LINUX_X11_TRANSPORT_H
#define CLIPWATCH_PLATFORM_LINUX_X11_TRANSPORT_H

// Project headers before Xlib: Xlib defines Success and None as macros
#include "clipwatch/transport.h"

#include <X11/Xatom.h>
#include <X11/Xlib.h>
#include <X11/extensions/Xfixes.h>

namespace clipwatch {
namespace platform {

class X11Transport : public DisplayTransport {
public:
  X11Transport(Display *display, int termination_fd);
  ~X11Transport() override;

  X11Transport(const X11Transport &) = delete;
  X11Transport &operator=(const X11Transport &) = delete;

  void close() override;

  Result<WindowId> create_window() override;
  void destroy_window(WindowId window) override;
  Result<AtomId> intern_atom(const std::string &name) override;
  Result<std::string> atom_name(AtomId atom) override;

  void select_selection_notify(WindowId window) override;
  Result<void> convert_selection(AtomId selection, AtomId target,
                                 AtomId property, WindowId requestor) override;
  Result<PropertyInfo> probe_property(WindowId window,
                                      AtomId property) override;
  Result<PropertyData> read_property(WindowId window, AtomId property,
                                     unsigned long size) override;
  void delete_property(WindowId window, AtomId property) override;

  Result<DisplayEvent> next_event() override;

  bool query_fixes_extension() override;
  Result<void> select_owner_change_input(WindowId window,
                                         AtomId selection) override;
  WindowId selection_owner(AtomId selection) override;
  Result<std::string> window_title(WindowId window) override;

private:
  DisplayEvent translate(const XEvent &event) const;
  Result<void> wait_readable();
  Result<std::string> read_net_wm_name(Window window);

  Display *display_ = nullptr;
  int termination_fd_ = -1;

  bool fixes_available_ = false;
  int fixes_event_base_ = 0;
  int fixes_error_base_ = 0;
};

/// Route Xlib protocol errors to the log instead of exiting the process
void install_x_error_handler();

} // namespace platform
} // namespace clipwatch

#endif // CLIPWATCH_PLATFORM_LINUX_X11_TRANSPORT_H
