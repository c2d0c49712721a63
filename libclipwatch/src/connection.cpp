/**
 * @file connection.cpp
 * @brief Display connection implementation
 */

#include "clipwatch/connection.h"
#include "clipwatch/log.h"

namespace clipwatch {

namespace {
constexpr const char *kComponent = "connection";
}

ConnectionHandle::ConnectionHandle(std::unique_ptr<DisplayTransport> transport,
                                   WindowId window, AtomId transfer_property)
    : transport_(std::move(transport)), window_(window),
      transfer_property_(transfer_property), open_(true) {}

ConnectionHandle::~ConnectionHandle() { close(); }

Result<std::unique_ptr<ConnectionHandle>>
ConnectionHandle::open(std::unique_ptr<DisplayTransport> transport) {
  if (!transport) {
    return Error(ErrorCode::ConnectionError, "No display transport");
  }

  auto window = transport->create_window();
  if (window.is_error()) {
    transport->close();
    Error err(ErrorCode::ConnectionError, "Could not create proxy window",
              window.error().to_string());
    return err;
  }

  auto property = transport->intern_atom(kTransferPropertyName);
  if (property.is_error()) {
    transport->destroy_window(window.value());
    transport->close();
    Error err(ErrorCode::ConnectionError,
              "Could not reserve the transfer property",
              property.error().to_string());
    return err;
  }

  CLIPWATCH_LOG_DEBUG(kComponent, "proxy window 0x" << std::hex
                                                    << window.value());

  return std::unique_ptr<ConnectionHandle>(new ConnectionHandle(
      std::move(transport), window.value(), property.value()));
}

void ConnectionHandle::defer_owner_change(AtomId selection) {
  deferred_owner_changes_.insert(selection);
}

bool ConnectionHandle::take_owner_change(AtomId selection) {
  return deferred_owner_changes_.erase(selection) > 0;
}

void ConnectionHandle::close() {
  if (!open_) {
    return;
  }
  open_ = false;

  transport_->delete_property(window_, transfer_property_);
  transport_->destroy_window(window_);
  transport_->close();

  CLIPWATCH_LOG_DEBUG(kComponent, "display connection closed");
}

} // namespace clipwatch
