/**
 * @file types.h
 * @brief Core type definitions for ClipWatch
 */

#ifndef CLIPWATCH_TYPES_H
#define CLIPWATCH_TYPES_H

#include "platform.h"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace clipwatch {

// ============================================================================
// Basic Types
// ============================================================================

using Byte = uint8_t;
using Bytes = std::vector<Byte>;

using Timestamp = std::chrono::system_clock::time_point;

// ============================================================================
// Protocol Identifiers
// ============================================================================

/// Server-side atom. Same width as an Xlib Atom, valid for one connection.
using AtomId = unsigned long;

/// Server-side window identifier. Same width as an Xlib Window.
using WindowId = unsigned long;

/// The X11 "None" value for atoms and windows
constexpr unsigned long kNone = 0;

/// Target name -> atom, as offered by the current selection owner
using TargetSet = std::map<std::string, AtomId>;

} // namespace clipwatch

#endif // CLIPWATCH_TYPES_H
