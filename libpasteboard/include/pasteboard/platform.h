/**
 * @file platform.h
 * @brief Platform detection and abstraction macros for libpasteboard
 *
 * Compile-time platform detection plus the export and utility macros used
 * throughout the library. The pasteboard server and its D-Bus transport
 * target Linux only.
 */

#ifndef PASTEBOARD_PLATFORM_H
#define PASTEBOARD_PLATFORM_H

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define PASTEBOARD_PLATFORM_LINUX 1
#define PASTEBOARD_PLATFORM_NAME "Linux"
#else
#error "Unsupported platform. libpasteboard only supports Linux."
#endif

// ============================================================================
// Compiler Detection (GCC and Clang only)
// ============================================================================

#if defined(__clang__)
#define PASTEBOARD_COMPILER_CLANG 1
#define PASTEBOARD_COMPILER_NAME "Clang"
#elif defined(__GNUC__)
#define PASTEBOARD_COMPILER_GCC 1
#define PASTEBOARD_COMPILER_NAME "GCC"
#else
#define PASTEBOARD_COMPILER_UNKNOWN 1
#define PASTEBOARD_COMPILER_NAME "Unknown"
#endif

// ============================================================================
// Export Macros
// ============================================================================

#define PASTEBOARD_API __attribute__((visibility("default")))

// ============================================================================
// Utility Macros
// ============================================================================

#define PASTEBOARD_UNUSED(x) (void)(x)

// ============================================================================
// Feature Detection
// ============================================================================

// D-Bus transport to pasteboardd (set by the build when dbus-1 is found)
#ifdef HAS_DBUS
#define PASTEBOARD_HAS_DBUS 1
#endif

#endif // PASTEBOARD_PLATFORM_H
