/**
 * @file state_machine.h
 * @brief Watcher state machine for ClipWatch
 *
 * Manages watcher states with validated transitions and callbacks.
 */

#ifndef CLIPWATCH_STATE_MACHINE_H
#define CLIPWATCH_STATE_MACHINE_H

#include "error.h"
#include "platform.h"
#include <cstdint>
#include <functional>
#include <map>
#include <set>

namespace clipwatch {

// ============================================================================
// Watcher States
// ============================================================================

enum class WatcherState : uint8_t {
  /// Waiting for an ownership change
  Idle = 0,

  /// Asking the new owner for its targets
  Negotiating = 1,

  /// Fetching content for the chosen target
  Transferring = 2,

  /// Handing the record to the sink
  Emitting = 3,

  /// Ownership notifications unavailable; the watcher cannot run
  Fatal = 4
};

CLIPWATCH_API const char *watcher_state_name(WatcherState state);

// ============================================================================
// Watcher State Machine
// ============================================================================

/**
 * @brief Enforces the cycle Idle -> Negotiating -> Transferring -> Emitting
 *
 * Negotiating and Transferring may fall back to Idle when a cycle is
 * abandoned. Fatal is terminal and only reachable from Idle (startup).
 * Single-threaded, like the watcher that owns it.
 *
 * @code
 *   WatcherStateMachine sm;
 *
 *   sm.on_state_changed([](WatcherState from, WatcherState to) {
 *       std::cout << watcher_state_name(from) << " -> "
 *                 << watcher_state_name(to) << std::endl;
 *   });
 *
 *   sm.transition(WatcherState::Negotiating);
 * @endcode
 */
class CLIPWATCH_API WatcherStateMachine {
public:
  WatcherStateMachine();
  explicit WatcherStateMachine(WatcherState initial);

  WatcherState current() const { return state_; }

  /**
   * @brief Attempt to transition to a new state
   * @param to Target state
   * @return Success or InvalidState if the transition is not allowed
   */
  Result<void> transition(WatcherState to);

  bool can_transition(WatcherState to) const;

  bool is_terminal() const { return state_ == WatcherState::Fatal; }

  /// True while a notification cycle is in progress
  bool is_busy() const;

  /// Reset to Idle
  void reset();

  using StateChangedCallback =
      std::function<void(WatcherState from, WatcherState to)>;

  /**
   * @brief Register callback for state changes
   * @param callback Called after each successful transition
   */
  void on_state_changed(StateChangedCallback callback);

private:
  WatcherState state_;
  StateChangedCallback state_changed_cb_;

  static const std::map<WatcherState, std::set<WatcherState>>
      valid_transitions_;
};

} // namespace clipwatch

#endif // CLIPWATCH_STATE_MACHINE_H
