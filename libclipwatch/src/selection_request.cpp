/**
 * @file selection_request.cpp
 * @brief Conversion request and reply read
 */

#include "selection_request.h"
#include "clipwatch/log.h"

namespace clipwatch {
namespace detail {

namespace {
constexpr const char *kComponent = "selection";
}

Result<DisplayEvent> request_conversion(ConnectionHandle &connection,
                                        AtomId selection, AtomId target) {
  auto &transport = connection.transport();

  transport.delete_property(connection.window(),
                            connection.transfer_property());

  CLIPWATCH_TRY(transport.convert_selection(selection, target,
                                            connection.transfer_property(),
                                            connection.window()));

  for (;;) {
    auto event = transport.next_event();
    if (event.is_error()) {
      return event.error();
    }

    const DisplayEvent &ev = event.value();
    if (ev.kind == EventKind::ConversionNotify && ev.selection == selection) {
      return ev;
    }

    // The owner may change while its predecessor is still answering
    if (ev.kind == EventKind::OwnerChanged) {
      CLIPWATCH_LOG_DEBUG(kComponent,
                          "deferring ownership change until the cycle ends");
      connection.defer_owner_change(ev.selection);
      continue;
    }

    CLIPWATCH_LOG_DEBUG(kComponent, "dropping " << event_kind_name(ev.kind)
                                                << " while waiting for reply");
  }
}

Result<PropertyData> read_reply(ConnectionHandle &connection,
                                const PropertyInfo &info) {
  auto data = connection.transport().read_property(
      connection.window(), connection.transfer_property(), info.size);
  if (data.is_error()) {
    return data.error();
  }

  if (data.value().type != info.type) {
    return Error(ErrorCode::DecodeError,
                 "Property changed between probe and read");
  }
  return data;
}

} // namespace detail
} // namespace clipwatch
