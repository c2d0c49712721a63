/**
 * @file watcher.h
 * @brief Clipboard ownership watcher for ClipWatch
 *
 * The watcher subscribes to XFixes ownership notifications for CLIPBOARD and,
 * for every notification, negotiates a text target with the new owner,
 * transfers the content and hands one ClipboardRecord to the sink.
 */

#ifndef CLIPWATCH_WATCHER_H
#define CLIPWATCH_WATCHER_H

#include "atoms.h"
#include "connection.h"
#include "error.h"
#include "platform.h"
#include "record.h"
#include "selection.h"
#include "state_machine.h"
#include "targets.h"
#include "types.h"
#include <cstdint>
#include <string>
#include <vector>

namespace clipwatch {

// ============================================================================
// Cycle Outcome
// ============================================================================

/**
 * @brief How one ownership-change notification ended
 */
enum class CycleOutcome : uint8_t {
  /// A record was built and accepted by the sink
  Emitted = 0,

  /// The owner offered no targets (or there is no owner)
  NoTargets = 1,

  /// The owner offered targets, none of them text
  NoTextTarget = 2,

  /// Conversion refused, INCR, or undecodable content
  TransferFailed = 3,

  /// A record was built but the sink reported an error
  SinkFailed = 4
};

CLIPWATCH_API const char *cycle_outcome_name(CycleOutcome outcome);

// ============================================================================
// Options and Statistics
// ============================================================================

/**
 * @brief Watcher tuning
 */
struct WatcherOptions {
  /// Targets to request, most preferred first
  std::vector<std::string> target_priority = default_target_priority();
};

/**
 * @brief Counters since start()
 */
struct WatcherStats {
  uint64_t notifications = 0;
  uint64_t records_emitted = 0;
  uint64_t cycles_abandoned = 0;
  uint64_t sink_failures = 0;
};

// ============================================================================
// Clipboard Watcher
// ============================================================================

/**
 * @brief Drives the selection protocol from ownership notifications
 *
 * Single-threaded and fully blocking. run() only returns when the transport
 * stops delivering events (connection lost or termination requested); the
 * caller's ConnectionHandle then tears the connection down.
 *
 * @code
 *   auto conn = ConnectionHandle::open(std::move(transport));
 *   ClipboardWatcher watcher(*conn.value(), [](const ClipboardRecord &r) {
 *       std::cout << record_content(r) << std::endl;
 *       return Result<void>::ok();
 *   });
 *   auto result = watcher.run();
 * @endcode
 */
class CLIPWATCH_API ClipboardWatcher {
public:
  ClipboardWatcher(ConnectionHandle &connection, ClipboardSink sink,
                   WatcherOptions options = {});

  // Non-copyable
  ClipboardWatcher(const ClipboardWatcher &) = delete;
  ClipboardWatcher &operator=(const ClipboardWatcher &) = delete;

  /**
   * @brief Intern the vocabulary and subscribe to ownership changes
   * @return Success, or ExtensionUnavailable / AtomInternFailed (the
   *         watcher is then Fatal)
   */
  Result<void> start();

  /**
   * @brief Wait for notifications and process them, forever
   *
   * Calls start() first if needed.
   *
   * @return The error that ended the loop (ConnectionLost, Terminated, or
   *         a startup error). Never returns success.
   */
  Result<void> run();

  /**
   * @brief Run one full negotiation/transfer/emit cycle now
   *
   * Recoverable failures are logged and reported as the outcome. Only
   * errors that end the watcher (connection lost, termination) are
   * returned as errors.
   */
  Result<CycleOutcome> process_notification();

  WatcherState state() const { return state_machine_.current(); }

  const WatcherStats &stats() const { return stats_; }

  /// Forwarded to the internal state machine
  void on_state_changed(WatcherStateMachine::StateChangedCallback callback);

private:
  void enter(WatcherState state);
  Result<CycleOutcome> abandon(CycleOutcome outcome, const Error &error);
  Result<void> fail_startup(const Error &error);
  Result<void> emit(const ClipboardRecord &record);

  ConnectionHandle &connection_;
  ClipboardSink sink_;
  WatcherOptions options_;

  AtomRegistry atoms_;
  TargetNegotiator negotiator_;
  SelectionTransfer transfer_;
  WatcherStateMachine state_machine_;
  WatcherStats stats_;

  AtomId clipboard_ = kNone;
  bool started_ = false;
};

} // namespace clipwatch

#endif // CLIPWATCH_WATCHER_H
