/**
 * @file selection.cpp
 * @brief Selection transfer implementation
 */

#include "clipwatch/selection.h"
#include "clipwatch/log.h"
#include "clipwatch/property.h"
#include "selection_request.h"

namespace clipwatch {

namespace {
constexpr const char *kComponent = "selection";
}

SelectionTransfer::SelectionTransfer(ConnectionHandle &connection,
                                     AtomRegistry &atoms)
    : connection_(connection), atoms_(atoms) {}

Result<std::string> SelectionTransfer::fetch(AtomId selection, AtomId target) {
  auto incr = atoms_.intern(atom_names::kIncr);
  if (incr.is_error()) {
    return incr.error();
  }
  auto string_type = atoms_.intern(atom_names::kString);
  if (string_type.is_error()) {
    return string_type.error();
  }

  auto notify = detail::request_conversion(connection_, selection, target);
  if (notify.is_error()) {
    return notify.error();
  }
  if (notify.value().property == kNone) {
    return Error(ErrorCode::ConversionRefused,
                 "Owner could not convert the selection to the target");
  }

  auto &transport = connection_.transport();
  auto info = transport.probe_property(connection_.window(),
                                       connection_.transfer_property());
  if (info.is_error()) {
    return info.error();
  }
  if (!info.value().exists()) {
    return Error(ErrorCode::ConversionRefused,
                 "Owner did not write the selection property");
  }

  // The owner wants to hand the data over in chunks
  if (info.value().type == incr.value()) {
    CLIPWATCH_LOG_DEBUG(kComponent, "owner requested INCR transfer");
    return Error(ErrorCode::UnsupportedIncrementalTransfer,
                 "Selection is too large for a single property");
  }

  auto data = detail::read_reply(connection_, info.value());
  if (data.is_error()) {
    return data.error();
  }

  transport.delete_property(connection_.window(),
                            connection_.transfer_property());

  return decode_text(data.value(), data.value().type == string_type.value());
}

Result<std::optional<std::string>>
SelectionTransfer::owner_title(AtomId selection) {
  auto &transport = connection_.transport();

  WindowId owner = transport.selection_owner(selection);
  if (owner == kNone) {
    return std::optional<std::string>();
  }

  auto title = transport.window_title(owner);
  if (title.is_error()) {
    return title.error();
  }
  if (title.value().empty()) {
    return std::optional<std::string>();
  }
  return std::optional<std::string>(std::move(title).value());
}

} // namespace clipwatch
