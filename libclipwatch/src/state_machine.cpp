/**
 * @file state_machine.cpp
 * @brief Watcher state machine implementation
 */

#include "clipwatch/state_machine.h"
#include <string>

namespace clipwatch {

const char *watcher_state_name(WatcherState state) {
  switch (state) {
  case WatcherState::Idle:
    return "Idle";
  case WatcherState::Negotiating:
    return "Negotiating";
  case WatcherState::Transferring:
    return "Transferring";
  case WatcherState::Emitting:
    return "Emitting";
  case WatcherState::Fatal:
    return "Fatal";
  default:
    return "Invalid";
  }
}

// Define valid state transitions
const std::map<WatcherState, std::set<WatcherState>>
    WatcherStateMachine::valid_transitions_ = {
        // Idle -> Negotiating (ownership changed), Fatal (startup failed)
        {WatcherState::Idle, {WatcherState::Negotiating, WatcherState::Fatal}},

        // Negotiating -> Transferring, Idle (no usable target)
        {WatcherState::Negotiating,
         {WatcherState::Transferring, WatcherState::Idle}},

        // Transferring -> Emitting, Idle (transfer failed)
        {WatcherState::Transferring,
         {WatcherState::Emitting, WatcherState::Idle}},

        // Emitting -> Idle, whatever the sink reports
        {WatcherState::Emitting, {WatcherState::Idle}},

        // Terminal
        {WatcherState::Fatal, {}}};

WatcherStateMachine::WatcherStateMachine() : state_(WatcherState::Idle) {}

WatcherStateMachine::WatcherStateMachine(WatcherState initial)
    : state_(initial) {}

Result<void> WatcherStateMachine::transition(WatcherState to) {
  if (!can_transition(to)) {
    return Error(ErrorCode::InvalidState, std::string("Invalid transition: ") +
                                              watcher_state_name(state_) +
                                              " -> " + watcher_state_name(to));
  }

  WatcherState from = state_;
  state_ = to;

  if (state_changed_cb_) {
    state_changed_cb_(from, to);
  }

  return Result<void>::ok();
}

bool WatcherStateMachine::can_transition(WatcherState to) const {
  auto it = valid_transitions_.find(state_);
  if (it == valid_transitions_.end()) {
    return false;
  }
  return it->second.find(to) != it->second.end();
}

bool WatcherStateMachine::is_busy() const {
  return state_ == WatcherState::Negotiating ||
         state_ == WatcherState::Transferring ||
         state_ == WatcherState::Emitting;
}

void WatcherStateMachine::reset() {
  WatcherState from = state_;
  state_ = WatcherState::Idle;

  if (state_changed_cb_ && from != WatcherState::Idle) {
    state_changed_cb_(from, WatcherState::Idle);
  }
}

void WatcherStateMachine::on_state_changed(StateChangedCallback callback) {
  state_changed_cb_ = std::move(callback);
}

} // namespace clipwatch
