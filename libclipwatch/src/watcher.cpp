/**
 * @file watcher.cpp
 * @brief Clipboard watcher implementation
 */

#include "clipwatch/watcher.h"
#include "clipwatch/log.h"
#include <exception>

namespace clipwatch {

namespace {
constexpr const char *kComponent = "watcher";
}

const char *cycle_outcome_name(CycleOutcome outcome) {
  switch (outcome) {
  case CycleOutcome::Emitted:
    return "Emitted";
  case CycleOutcome::NoTargets:
    return "NoTargets";
  case CycleOutcome::NoTextTarget:
    return "NoTextTarget";
  case CycleOutcome::TransferFailed:
    return "TransferFailed";
  case CycleOutcome::SinkFailed:
    return "SinkFailed";
  default:
    return "Invalid";
  }
}

ClipboardWatcher::ClipboardWatcher(ConnectionHandle &connection,
                                   ClipboardSink sink, WatcherOptions options)
    : connection_(connection), sink_(std::move(sink)),
      options_(std::move(options)), atoms_(connection),
      negotiator_(connection, atoms_), transfer_(connection, atoms_) {}

void ClipboardWatcher::on_state_changed(
    WatcherStateMachine::StateChangedCallback callback) {
  state_machine_.on_state_changed(std::move(callback));
}

// ============================================================================
// Startup
// ============================================================================

Result<void> ClipboardWatcher::start() {
  if (started_) {
    return Result<void>::ok();
  }
  if (state_machine_.is_terminal()) {
    return Error(ErrorCode::InvalidState, "Watcher already failed to start");
  }

  auto clipboard = atoms_.intern(atom_names::kClipboard);
  if (clipboard.is_error()) {
    return fail_startup(clipboard.error());
  }
  clipboard_ = clipboard.value();

  std::vector<std::string> vocabulary = {atom_names::kTargets,
                                         atom_names::kIncr, atom_names::kString};
  vocabulary.insert(vocabulary.end(), options_.target_priority.begin(),
                    options_.target_priority.end());
  for (const auto &name : vocabulary) {
    auto atom = atoms_.intern(name);
    if (atom.is_error()) {
      return fail_startup(atom.error());
    }
  }

  auto &transport = connection_.transport();
  if (!transport.query_fixes_extension()) {
    return fail_startup(
        Error(ErrorCode::ExtensionUnavailable,
              "The X server does not support XFixes selection events"));
  }

  auto subscribed =
      transport.select_owner_change_input(connection_.window(), clipboard_);
  if (subscribed.is_error()) {
    return fail_startup(subscribed.error());
  }

  started_ = true;
  CLIPWATCH_LOG_INFO(kComponent, "watching " << atom_names::kClipboard
                                             << " for ownership changes");
  return Result<void>::ok();
}

Result<void> ClipboardWatcher::fail_startup(const Error &error) {
  CLIPWATCH_LOG_ERROR(kComponent, "cannot start: " << error.to_string());
  enter(WatcherState::Fatal);
  return error;
}

// ============================================================================
// Event Loop
// ============================================================================

Result<void> ClipboardWatcher::run() {
  CLIPWATCH_TRY(start());

  auto &transport = connection_.transport();
  for (;;) {
    // Changes seen during the last cycle are served before new events
    if (connection_.take_owner_change(clipboard_)) {
      CLIPWATCH_LOG_DEBUG(kComponent, "replaying deferred ownership change");
    } else {
      auto event = transport.next_event();
      if (event.is_error()) {
        CLIPWATCH_LOG_INFO(kComponent,
                           "event loop ended: " << event.error().to_string());
        return event.error();
      }

      const DisplayEvent &ev = event.value();
      if (ev.kind != EventKind::OwnerChanged || ev.selection != clipboard_) {
        continue;
      }
    }

    auto outcome = process_notification();
    if (outcome.is_error()) {
      CLIPWATCH_LOG_INFO(kComponent,
                         "event loop ended: " << outcome.error().to_string());
      return outcome.error();
    }
  }
}

// ============================================================================
// Notification Cycle
// ============================================================================

Result<CycleOutcome> ClipboardWatcher::process_notification() {
  if (!started_) {
    return Error(ErrorCode::InvalidState, "Watcher not started");
  }
  if (state_machine_.is_busy()) {
    return Error(ErrorCode::InvalidState, "A notification cycle is running",
                 watcher_state_name(state_machine_.current()));
  }

  ++stats_.notifications;
  enter(WatcherState::Negotiating);

  auto targets = negotiator_.negotiate(clipboard_);
  if (targets.is_error()) {
    return abandon(CycleOutcome::NoTargets, targets.error());
  }

  auto chosen = select_target(targets.value(), options_.target_priority);
  if (!chosen) {
    return abandon(CycleOutcome::NoTextTarget,
                   Error(ErrorCode::NoTargetsAvailable,
                         "Owner offers no text target",
                         std::to_string(targets.value().size()) +
                             " targets offered"));
  }

  enter(WatcherState::Transferring);

  const AtomId target = targets.value().at(*chosen);
  auto content = transfer_.fetch(clipboard_, target);
  if (content.is_error()) {
    return abandon(CycleOutcome::TransferFailed, content.error());
  }

  std::optional<std::string> owner;
  auto title = transfer_.owner_title(clipboard_);
  if (title.is_ok()) {
    owner = std::move(title).value();
  } else {
    CLIPWATCH_LOG_DEBUG(kComponent,
                        "owner title unavailable: " << title.error().to_string());
  }

  ClipboardRecord record =
      make_record(*chosen, std::move(content).value(), std::move(owner));

  enter(WatcherState::Emitting);
  auto emitted = emit(record);
  enter(WatcherState::Idle);

  if (emitted.is_error()) {
    ++stats_.sink_failures;
    CLIPWATCH_LOG_ERROR(kComponent,
                        "sink rejected record: " << emitted.error().to_string());
    return CycleOutcome::SinkFailed;
  }

  ++stats_.records_emitted;
  CLIPWATCH_LOG_INFO(kComponent, "captured "
                                     << record_content(record).size()
                                     << " bytes as " << *chosen << " from "
                                     << record_owner(record).value_or(
                                            "unknown owner"));
  return CycleOutcome::Emitted;
}

void ClipboardWatcher::enter(WatcherState state) {
  auto moved = state_machine_.transition(state);
  if (moved.is_error()) {
    CLIPWATCH_LOG_ERROR(kComponent, moved.error().to_string());
    state_machine_.reset();
  }
}

Result<CycleOutcome> ClipboardWatcher::abandon(CycleOutcome outcome,
                                               const Error &error) {
  state_machine_.reset();

  if (!is_recoverable(error.code)) {
    return error;
  }

  ++stats_.cycles_abandoned;
  CLIPWATCH_LOG_WARN(kComponent, "cycle abandoned ("
                                     << cycle_outcome_name(outcome)
                                     << "): " << error.to_string());
  return outcome;
}

Result<void> ClipboardWatcher::emit(const ClipboardRecord &record) {
  if (!sink_) {
    return Error(ErrorCode::SinkError, "No sink configured");
  }

  try {
    return sink_(record);
  } catch (const std::exception &e) {
    return Error(ErrorCode::SinkError, "Sink threw an exception", e.what());
  }
}

} // namespace clipwatch
