/**
 * @file transport.cpp
 * @brief Transport-neutral helpers
 */

#include "clipwatch/transport.h"

namespace clipwatch {

const char *event_kind_name(EventKind kind) {
  switch (kind) {
  case EventKind::ConversionNotify:
    return "ConversionNotify";
  case EventKind::OwnerChanged:
    return "OwnerChanged";
  case EventKind::Other:
    return "Other";
  default:
    return "Invalid";
  }
}

} // namespace clipwatch
