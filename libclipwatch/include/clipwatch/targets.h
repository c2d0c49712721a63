/**
 * @file targets.h
 * @brief Target negotiation with the selection owner
 */

#ifndef CLIPWATCH_TARGETS_H
#define CLIPWATCH_TARGETS_H

#include "atoms.h"
#include "connection.h"
#include "error.h"
#include "platform.h"
#include "types.h"
#include <optional>
#include <string>
#include <vector>

namespace clipwatch {

/**
 * @brief Asks the current selection owner which targets it can convert to
 *
 * One negotiation is a full TARGETS round-trip:
 * request, wait for SelectionNotify, probe the property size, then read
 * exactly that many bytes and resolve every atom to its name.
 *
 * @code
 *   TargetNegotiator negotiator(conn, atoms);
 *   auto targets = negotiator.negotiate(clipboard_atom);
 *   if (targets && targets.value().count("UTF8_STRING")) { ... }
 * @endcode
 */
class CLIPWATCH_API TargetNegotiator {
public:
  TargetNegotiator(ConnectionHandle &connection, AtomRegistry &atoms);

  /**
   * @brief Run one TARGETS negotiation
   * @param selection Selection atom (normally CLIPBOARD)
   * @return Target name -> atom, or NoTargetsAvailable / DecodeError
   */
  Result<TargetSet> negotiate(AtomId selection);

private:
  ConnectionHandle &connection_;
  AtomRegistry &atoms_;
  bool subscribed_ = false;
};

/**
 * @brief Pick the first name of `priority` that the owner offers
 * @return Chosen target name, std::nullopt if none matches
 */
CLIPWATCH_API std::optional<std::string>
select_target(const TargetSet &targets,
              const std::vector<std::string> &priority);

/// Default priority: text/html, UTF8_STRING, TEXT
CLIPWATCH_API const std::vector<std::string> &default_target_priority();

} // namespace clipwatch

#endif // CLIPWATCH_TARGETS_H
