/**
 * @file dbus_protocol.h
 * @brief Method names and error names of the pasteboardd bus interface
 *
 * Interface org.pasteboard.Server1:
 *   Retain(s name)
 *   RetainUnique() -> s
 *   Release(s name)
 *   SetString(s name, s type, ay value)
 *   WriteObjects(s name, s type, aay items)
 *   ReadObjects(s name, as types) -> aay
 *   StringForType(s name, s type) -> (b present, ay value)
 *   ClearContents(s name) -> t
 *   ReleaseGlobally(s name)
 *   ChangeCount(s name) -> t
 *   Types(s name) -> as
 *
 * Names and type identifiers are strings. Payload values are byte arrays
 * and are passed through unchanged.
 */

#ifndef PASTEBOARD_PLATFORM_LINUX_DBUS_PROTOCOL_H
#define PASTEBOARD_PLATFORM_LINUX_DBUS_PROTOCOL_H

namespace pasteboard {
namespace platform {
namespace protocol {

constexpr const char *INTERFACE = "org.pasteboard.Server1";

constexpr const char *METHOD_RETAIN = "Retain";
constexpr const char *METHOD_RETAIN_UNIQUE = "RetainUnique";
constexpr const char *METHOD_RELEASE = "Release";
constexpr const char *METHOD_SET_STRING = "SetString";
constexpr const char *METHOD_WRITE_OBJECTS = "WriteObjects";
constexpr const char *METHOD_READ_OBJECTS = "ReadObjects";
constexpr const char *METHOD_STRING_FOR_TYPE = "StringForType";
constexpr const char *METHOD_CLEAR_CONTENTS = "ClearContents";
constexpr const char *METHOD_RELEASE_GLOBALLY = "ReleaseGlobally";
constexpr const char *METHOD_CHANGE_COUNT = "ChangeCount";
constexpr const char *METHOD_TYPES = "Types";

/// Error name sent back for a failed server-side operation
constexpr const char *ERROR_FAILED = "org.pasteboard.Server1.Error.Failed";

} // namespace protocol
} // namespace platform
} // namespace pasteboard

#endif // PASTEBOARD_PLATFORM_LINUX_DBUS_PROTOCOL_H
