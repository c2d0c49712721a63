/**
 * @file clipwatch.h
 * @brief Main ClipWatch API Header
 *
 * ClipWatch - X11 clipboard history watcher
 *
 * Watches the CLIPBOARD selection through XFixes ownership notifications,
 * fetches the new content as text/html or UTF-8 text and hands each capture
 * to a sink.
 *
 * Quick Start:
 * @code
 *   #include <clipwatch/clipwatch.h>
 *
 *   auto transport = clipwatch::connect_x11();
 *   auto conn = clipwatch::ConnectionHandle::open(std::move(transport).value());
 *   clipwatch::JsonFileSink history("clipboard.json");
 *   clipwatch::ClipboardWatcher watcher(*conn.value(), history.as_sink());
 *   watcher.run();
 * @endcode
 */

#ifndef CLIPWATCH_CLIPWATCH_H
#define CLIPWATCH_CLIPWATCH_H

// Core headers (in dependency order)
#include "error.h"
#include "platform.h"
#include "types.h"
#include "log.h"

// Feature modules (in dependency order)
#include "transport.h"
#include "connection.h"
#include "atoms.h"
#include "property.h"
#include "targets.h"
#include "selection.h"
#include "record.h"
#include "state_machine.h"
#include "watcher.h"
#include "json_sink.h"
#include "config.h"

#endif // CLIPWATCH_CLIPWATCH_H
