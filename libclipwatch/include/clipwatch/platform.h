/**
 * @file platform.h
 * @brief Platform detection and abstraction macros for ClipWatch
 *
 * ClipWatch talks to an X11 server and only builds on Linux.
 */

#ifndef CLIPWATCH_PLATFORM_H
#define CLIPWATCH_PLATFORM_H

// ============================================================================
// Platform Detection (Linux only)
// ============================================================================

#if !defined(__linux__)
#error "Unsupported platform. ClipWatch only supports Linux (X11)."
#endif

// ============================================================================
// Export/Import Macros
// ============================================================================

#ifdef CLIPWATCH_BUILDING_SHARED
#define CLIPWATCH_API __attribute__((visibility("default")))
#else
#define CLIPWATCH_API
#endif

// ============================================================================
// Version
// ============================================================================

// Set from project(VERSION) by the build
#ifndef CLIPWATCH_VERSION_STRING
#error "CLIPWATCH_VERSION_STRING must be defined by the build system"
#endif

#endif // CLIPWATCH_PLATFORM_H
