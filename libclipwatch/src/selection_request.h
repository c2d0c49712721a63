/**
 * @file selection_request.h
 * @brief Request/notify step shared by target negotiation and transfer
 */

#ifndef CLIPWATCH_SELECTION_REQUEST_H
#define CLIPWATCH_SELECTION_REQUEST_H

#include "clipwatch/connection.h"
#include "clipwatch/error.h"
#include "clipwatch/transport.h"

namespace clipwatch {
namespace detail {

/**
 * @brief Ask the selection owner for `target` and wait for its answer
 *
 * The transfer property is deleted before the request so a stale reply from
 * an earlier cycle can never be read back. Ownership changes are deferred
 * on the connection; other events besides the matching SelectionNotify are
 * dropped. Blocks without deadline.
 *
 * @return The SelectionNotify event; its property is kNone if the owner
 *         refused the conversion
 */
Result<DisplayEvent> request_conversion(ConnectionHandle &connection,
                                        AtomId selection, AtomId target);

/**
 * @brief Zero-length probe followed by a read sized to the probe
 */
Result<PropertyData> read_reply(ConnectionHandle &connection,
                                const PropertyInfo &info);

} // namespace detail
} // namespace clipwatch

#endif // CLIPWATCH_SELECTION_REQUEST_H
