/**
 * @file dbus_helpers.h
 * @brief D-Bus utility functions for the pasteboard transport
 *
 * RAII wrappers and marshalling helpers shared by the client service and
 * the server adaptor.
 */

#ifndef PASTEBOARD_PLATFORM_LINUX_DBUS_HELPERS_H
#define PASTEBOARD_PLATFORM_LINUX_DBUS_HELPERS_H

#include "pasteboard/error.h"
#include <dbus/dbus.h>
#include <string>
#include <vector>

namespace pasteboard {
namespace platform {

// ============================================================================
// D-Bus Connection RAII Wrapper
// ============================================================================

/**
 * @brief RAII wrapper for DBusConnection
 */
class DBusConnectionWrapper {
public:
  DBusConnectionWrapper() = default;

  explicit DBusConnectionWrapper(DBusConnection *conn, bool add_ref = false)
      : conn_(conn) {
    if (conn_ && add_ref) {
      dbus_connection_ref(conn_);
    }
  }

  ~DBusConnectionWrapper() { reset(); }

  // Move-only
  DBusConnectionWrapper(DBusConnectionWrapper &&other) noexcept
      : conn_(other.conn_) {
    other.conn_ = nullptr;
  }

  DBusConnectionWrapper &operator=(DBusConnectionWrapper &&other) noexcept {
    if (this != &other) {
      reset();
      conn_ = other.conn_;
      other.conn_ = nullptr;
    }
    return *this;
  }

  DBusConnectionWrapper(const DBusConnectionWrapper &) = delete;
  DBusConnectionWrapper &operator=(const DBusConnectionWrapper &) = delete;

  void reset() {
    if (conn_) {
      dbus_connection_unref(conn_);
      conn_ = nullptr;
    }
  }

  DBusConnection *get() const { return conn_; }
  explicit operator bool() const { return conn_ != nullptr; }

private:
  DBusConnection *conn_ = nullptr;
};

// ============================================================================
// D-Bus Message RAII Wrapper
// ============================================================================

/**
 * @brief RAII wrapper for DBusMessage
 */
class DBusMessageWrapper {
public:
  DBusMessageWrapper() = default;

  explicit DBusMessageWrapper(DBusMessage *msg) : msg_(msg) {}

  ~DBusMessageWrapper() {
    if (msg_) {
      dbus_message_unref(msg_);
    }
  }

  // Move-only
  DBusMessageWrapper(DBusMessageWrapper &&other) noexcept : msg_(other.msg_) {
    other.msg_ = nullptr;
  }

  DBusMessageWrapper &operator=(DBusMessageWrapper &&other) noexcept {
    if (this != &other) {
      if (msg_) {
        dbus_message_unref(msg_);
      }
      msg_ = other.msg_;
      other.msg_ = nullptr;
    }
    return *this;
  }

  DBusMessageWrapper(const DBusMessageWrapper &) = delete;
  DBusMessageWrapper &operator=(const DBusMessageWrapper &) = delete;

  DBusMessage *get() const { return msg_; }
  DBusMessage *release() {
    DBusMessage *tmp = msg_;
    msg_ = nullptr;
    return tmp;
  }
  explicit operator bool() const { return msg_ != nullptr; }

private:
  DBusMessage *msg_ = nullptr;
};

// ============================================================================
// D-Bus Error Helper
// ============================================================================

/**
 * @brief Convert DBusError to a pasteboard Error
 */
inline Error dbus_error_to_pasteboard(const DBusError &err) {
  if (!dbus_error_is_set(&err)) {
    return Error();
  }

  std::string message = err.name ? std::string(err.name) : "D-Bus error";
  if (err.message) {
    message += ": ";
    message += err.message;
  }

  ErrorCode code = ErrorCode::PlatformError;
  if (err.name && (dbus_error_has_name(&err, DBUS_ERROR_NO_REPLY) ||
                   dbus_error_has_name(&err, DBUS_ERROR_TIMEOUT))) {
    code = ErrorCode::Timeout;
  } else if (err.name &&
             (dbus_error_has_name(&err, DBUS_ERROR_SERVICE_UNKNOWN) ||
              dbus_error_has_name(&err, DBUS_ERROR_NAME_HAS_NO_OWNER) ||
              dbus_error_has_name(&err, DBUS_ERROR_NO_SERVER) ||
              dbus_error_has_name(&err, DBUS_ERROR_DISCONNECTED))) {
    code = ErrorCode::ServiceUnavailable;
  }

  return Error(code, message);
}

/**
 * @brief RAII wrapper for DBusError
 */
class DBusErrorWrapper {
public:
  DBusErrorWrapper() { dbus_error_init(&err_); }
  ~DBusErrorWrapper() { dbus_error_free(&err_); }

  DBusErrorWrapper(const DBusErrorWrapper &) = delete;
  DBusErrorWrapper &operator=(const DBusErrorWrapper &) = delete;

  DBusError *get() { return &err_; }
  bool is_set() const { return dbus_error_is_set(&err_); }
  Error to_error() const { return dbus_error_to_pasteboard(err_); }

  const char *name() const { return err_.name; }
  const char *message() const { return err_.message; }

private:
  DBusError err_;
};

// ============================================================================
// D-Bus Helper Functions
// ============================================================================

/**
 * @brief Get the shared session bus connection
 *
 * The connection does not terminate the process when the bus goes away.
 * @return Connection wrapper or error
 */
inline Result<DBusConnectionWrapper> get_session_bus() {
  DBusErrorWrapper error;
  DBusConnection *conn = dbus_bus_get(DBUS_BUS_SESSION, error.get());

  if (!conn || error.is_set()) {
    if (conn) {
      dbus_connection_unref(conn);
    }
    return error.is_set() ? error.to_error()
                          : Error(ErrorCode::ServiceUnavailable,
                                  "No session bus connection");
  }

  dbus_connection_set_exit_on_disconnect(conn, FALSE);
  return DBusConnectionWrapper(conn);
}

/**
 * @brief Append a string argument
 * @return false on out-of-memory
 */
inline bool append_string(DBusMessageIter *iter, const std::string &value) {
  const char *data = value.c_str();
  return dbus_message_iter_append_basic(iter, DBUS_TYPE_STRING, &data);
}

/**
 * @brief Append an "as" argument
 * @return false on out-of-memory
 */
inline bool append_string_array(DBusMessageIter *iter,
                                const std::vector<std::string> &values) {
  DBusMessageIter array_iter;
  if (!dbus_message_iter_open_container(iter, DBUS_TYPE_ARRAY,
                                        DBUS_TYPE_STRING_AS_STRING,
                                        &array_iter)) {
    return false;
  }

  for (const auto &value : values) {
    if (!append_string(&array_iter, value)) {
      dbus_message_iter_abandon_container(iter, &array_iter);
      return false;
    }
  }

  return dbus_message_iter_close_container(iter, &array_iter);
}

/**
 * @brief Read a string argument and advance the iterator
 */
inline Result<std::string> read_string(DBusMessageIter *iter) {
  if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_STRING) {
    return Error(ErrorCode::MalformedReply, "Expected string argument");
  }

  const char *value = nullptr;
  dbus_message_iter_get_basic(iter, &value);
  dbus_message_iter_next(iter);
  return std::string(value ? value : "");
}

/**
 * @brief Read an "as" argument and advance the iterator
 */
inline Result<std::vector<std::string>> read_string_array(DBusMessageIter *iter) {
  if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_ARRAY ||
      dbus_message_iter_get_element_type(iter) != DBUS_TYPE_STRING) {
    return Error(ErrorCode::MalformedReply, "Expected string array argument");
  }

  std::vector<std::string> values;
  DBusMessageIter array_iter;
  dbus_message_iter_recurse(iter, &array_iter);

  while (dbus_message_iter_get_arg_type(&array_iter) == DBUS_TYPE_STRING) {
    const char *value = nullptr;
    dbus_message_iter_get_basic(&array_iter, &value);
    values.emplace_back(value ? value : "");
    dbus_message_iter_next(&array_iter);
  }

  dbus_message_iter_next(iter);
  return values;
}

/**
 * @brief Append an "ay" argument
 *
 * Payload values travel as byte arrays so embedded NULs and bytes that
 * are not valid UTF-8 survive the bus.
 * @return false on out-of-memory
 */
inline bool append_bytes(DBusMessageIter *iter, const std::string &value) {
  DBusMessageIter array_iter;
  if (!dbus_message_iter_open_container(iter, DBUS_TYPE_ARRAY,
                                        DBUS_TYPE_BYTE_AS_STRING,
                                        &array_iter)) {
    return false;
  }

  const unsigned char *data =
      reinterpret_cast<const unsigned char *>(value.data());
  if (!dbus_message_iter_append_fixed_array(&array_iter, DBUS_TYPE_BYTE, &data,
                                            static_cast<int>(value.size()))) {
    dbus_message_iter_abandon_container(iter, &array_iter);
    return false;
  }

  return dbus_message_iter_close_container(iter, &array_iter);
}

/**
 * @brief Append an "aay" argument
 * @return false on out-of-memory
 */
inline bool append_bytes_array(DBusMessageIter *iter,
                               const std::vector<std::string> &values) {
  DBusMessageIter array_iter;
  if (!dbus_message_iter_open_container(
          iter, DBUS_TYPE_ARRAY,
          DBUS_TYPE_ARRAY_AS_STRING DBUS_TYPE_BYTE_AS_STRING, &array_iter)) {
    return false;
  }

  for (const auto &value : values) {
    if (!append_bytes(&array_iter, value)) {
      dbus_message_iter_abandon_container(iter, &array_iter);
      return false;
    }
  }

  return dbus_message_iter_close_container(iter, &array_iter);
}

/**
 * @brief Read an "ay" argument and advance the iterator
 */
inline Result<std::string> read_bytes(DBusMessageIter *iter) {
  if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_ARRAY ||
      dbus_message_iter_get_element_type(iter) != DBUS_TYPE_BYTE) {
    return Error(ErrorCode::MalformedReply, "Expected byte array argument");
  }

  DBusMessageIter array_iter;
  dbus_message_iter_recurse(iter, &array_iter);

  const unsigned char *data = nullptr;
  int length = 0;
  // An empty array has no element to point at
  if (dbus_message_iter_get_arg_type(&array_iter) == DBUS_TYPE_BYTE) {
    dbus_message_iter_get_fixed_array(&array_iter, &data, &length);
  }

  dbus_message_iter_next(iter);
  if (!data || length <= 0) {
    return std::string();
  }
  return std::string(reinterpret_cast<const char *>(data),
                     static_cast<size_t>(length));
}

/**
 * @brief Read an "aay" argument and advance the iterator
 */
inline Result<std::vector<std::string>> read_bytes_array(DBusMessageIter *iter) {
  if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_ARRAY ||
      dbus_message_iter_get_element_type(iter) != DBUS_TYPE_ARRAY) {
    return Error(ErrorCode::MalformedReply,
                 "Expected array of byte arrays argument");
  }

  std::vector<std::string> values;
  DBusMessageIter array_iter;
  dbus_message_iter_recurse(iter, &array_iter);

  while (dbus_message_iter_get_arg_type(&array_iter) == DBUS_TYPE_ARRAY) {
    auto value = read_bytes(&array_iter);
    if (value.is_error()) {
      return value.error();
    }
    values.push_back(std::move(value).value());
  }

  dbus_message_iter_next(iter);
  return values;
}

/**
 * @brief Read a uint64 argument and advance the iterator
 */
inline Result<uint64_t> read_uint64(DBusMessageIter *iter) {
  if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_UINT64) {
    return Error(ErrorCode::MalformedReply, "Expected uint64 argument");
  }

  dbus_uint64_t value = 0;
  dbus_message_iter_get_basic(iter, &value);
  dbus_message_iter_next(iter);
  return static_cast<uint64_t>(value);
}

/**
 * @brief Read a boolean argument and advance the iterator
 */
inline Result<bool> read_bool(DBusMessageIter *iter) {
  if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_BOOLEAN) {
    return Error(ErrorCode::MalformedReply, "Expected boolean argument");
  }

  dbus_bool_t value = FALSE;
  dbus_message_iter_get_basic(iter, &value);
  dbus_message_iter_next(iter);
  return value != FALSE;
}

} // namespace platform
} // namespace pasteboard

#endif // PASTEBOARD_PLATFORM_LINUX_DBUS_HELPERS_H
