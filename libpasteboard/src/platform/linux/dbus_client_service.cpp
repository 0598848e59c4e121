/**
 * @file dbus_client_service.cpp
 * @brief D-Bus client for pasteboardd
 */

#include "dbus_client_service.h"
#include "dbus_protocol.h"
#include "pasteboard/log.h"
#include "pasteboard/server.h"

namespace pasteboard {
namespace platform {

// ============================================================================
// Reply Parsing
// ============================================================================

namespace {

Result<DBusMessageIter> first_argument(DBusMessage *reply) {
  DBusMessageIter iter;
  if (!reply || !dbus_message_iter_init(reply, &iter)) {
    return Error(ErrorCode::MalformedReply, "Reply has no arguments");
  }
  return iter;
}

} // namespace

Result<std::vector<std::string>> parse_string_list_reply(DBusMessage *reply) {
  auto iter = first_argument(reply);
  if (iter.is_error()) {
    return iter.error();
  }
  return read_string_array(&iter.value());
}

Result<std::vector<std::string>> parse_items_reply(DBusMessage *reply) {
  auto iter = first_argument(reply);
  if (iter.is_error()) {
    return iter.error();
  }
  return read_bytes_array(&iter.value());
}

Result<std::optional<std::string>>
parse_optional_string_reply(DBusMessage *reply) {
  auto iter = first_argument(reply);
  if (iter.is_error()) {
    return iter.error();
  }

  auto present = read_bool(&iter.value());
  if (present.is_error()) {
    return present.error();
  }

  auto value = read_bytes(&iter.value());
  if (value.is_error()) {
    return value.error();
  }

  if (!present.value()) {
    return std::optional<std::string>();
  }
  return std::optional<std::string>(std::move(value).value());
}

Result<ChangeCount> parse_change_count_reply(DBusMessage *reply) {
  auto iter = first_argument(reply);
  if (iter.is_error()) {
    return iter.error();
  }
  return read_uint64(&iter.value());
}

Result<std::string> parse_name_reply(DBusMessage *reply) {
  auto iter = first_argument(reply);
  if (iter.is_error()) {
    return iter.error();
  }
  return read_string(&iter.value());
}

// ============================================================================
// DBusClipboardService
// ============================================================================

DBusClipboardService::DBusClipboardService(PasteboardConfig config)
    : config_(std::move(config)) {
  // The service is shared between threads
  if (!dbus_threads_init_default()) {
    logging::get()->error("Failed to initialize D-Bus thread support");
  }
}

DBusClipboardService::~DBusClipboardService() = default;

Result<DBusConnectionWrapper> DBusClipboardService::connection() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (conn_ && !dbus_connection_get_is_connected(conn_.get())) {
    logging::get()->info("Session bus connection lost, reconnecting");
    conn_.reset();
  }

  if (!conn_) {
    auto bus = get_session_bus();
    if (bus.is_error()) {
      return bus.error();
    }
    conn_ = std::move(bus).value();
  }

  return DBusConnectionWrapper(conn_.get(), true);
}

Result<DBusMessageWrapper>
DBusClipboardService::call(const char *method, const Marshaller &append) {
  auto conn = connection();
  if (conn.is_error()) {
    return conn.error();
  }

  DBusMessageWrapper msg(dbus_message_new_method_call(
      config_.bus_name.c_str(), config_.object_path.c_str(),
      protocol::INTERFACE, method));
  if (!msg) {
    return Error(ErrorCode::PlatformError, "Failed to create D-Bus message");
  }

  DBusMessageIter iter;
  dbus_message_iter_init_append(msg.get(), &iter);
  if (append && !append(&iter)) {
    return Error(ErrorCode::PlatformError,
                 "Out of memory while marshalling arguments");
  }

  DBusErrorWrapper error;
  DBusMessage *reply = dbus_connection_send_with_reply_and_block(
      conn.value().get(), msg.get(), config_.call_timeout_ms, error.get());

  if (!reply || error.is_set()) {
    if (reply) {
      dbus_message_unref(reply);
    }
    Error err = error.is_set() ? error.to_error()
                               : Error(ErrorCode::ServerError, "No reply");
    err.location = method;
    return err;
  }

  return DBusMessageWrapper(reply);
}

void DBusClipboardService::call_and_log(const char *method,
                                        const std::string &name,
                                        const Marshaller &append) {
  auto reply = call(method, append);
  if (reply.is_error()) {
    logging::get()->warn("Pasteboard '{}': {} dropped: {}", name, method,
                         reply.error().to_string());
  }
}

void DBusClipboardService::retain(const std::string &name) {
  call_and_log(protocol::METHOD_RETAIN, name, [&](DBusMessageIter *iter) {
    return append_string(iter, name);
  });
}

std::string DBusClipboardService::retain_unique() {
  auto reply = call(protocol::METHOD_RETAIN_UNIQUE, nullptr);
  if (reply.is_ok()) {
    auto name = parse_name_reply(reply.value().get());
    if (name.is_ok()) {
      return std::move(name).value();
    }
    reply = name.error();
  }

  // The handle still needs a name; every later call on it will fail the
  // same way until the server is reachable.
  std::string name = PasteboardServer::generate_unique_name();
  logging::get()->warn("RetainUnique failed ({}), using unbound name '{}'",
                       reply.error().to_string(), name);
  return name;
}

void DBusClipboardService::release(const std::string &name) {
  call_and_log(protocol::METHOD_RELEASE, name, [&](DBusMessageIter *iter) {
    return append_string(iter, name);
  });
}

void DBusClipboardService::set_string(const std::string &name,
                                      const std::string &type_id,
                                      const std::string &value) {
  call_and_log(protocol::METHOD_SET_STRING, name, [&](DBusMessageIter *iter) {
    return append_string(iter, name) && append_string(iter, type_id) &&
           append_bytes(iter, value);
  });
}

void DBusClipboardService::write_objects(
    const std::string &name, const std::string &type_id,
    const std::vector<std::string> &items) {
  call_and_log(protocol::METHOD_WRITE_OBJECTS, name,
               [&](DBusMessageIter *iter) {
                 return append_string(iter, name) &&
                        append_string(iter, type_id) &&
                        append_bytes_array(iter, items);
               });
}

ChangeCount DBusClipboardService::clear_contents(const std::string &name) {
  auto reply = call(protocol::METHOD_CLEAR_CONTENTS,
                    [&](DBusMessageIter *iter) {
                      return append_string(iter, name);
                    });
  if (reply.is_ok()) {
    auto count = parse_change_count_reply(reply.value().get());
    if (count.is_ok()) {
      return count.value();
    }
    reply = count.error();
  }

  logging::get()->warn("Pasteboard '{}': ClearContents dropped: {}", name,
                       reply.error().to_string());
  return 0;
}

void DBusClipboardService::release_globally(const std::string &name) {
  call_and_log(protocol::METHOD_RELEASE_GLOBALLY, name,
               [&](DBusMessageIter *iter) {
                 return append_string(iter, name);
               });
}

std::optional<std::vector<std::string>>
DBusClipboardService::read_objects(const std::string &name,
                                   const std::vector<std::string> &type_ids) {
  auto reply = call(protocol::METHOD_READ_OBJECTS, [&](DBusMessageIter *iter) {
    return append_string(iter, name) && append_string_array(iter, type_ids);
  });
  if (reply.is_error()) {
    logging::get()->warn("Pasteboard '{}': ReadObjects failed: {}", name,
                         reply.error().to_string());
    return std::nullopt;
  }

  auto items = parse_items_reply(reply.value().get());
  if (items.is_error()) {
    logging::get()->warn("Pasteboard '{}': ReadObjects failed: {}", name,
                         items.error().to_string());
    return std::nullopt;
  }

  return std::move(items).value();
}

std::optional<std::string>
DBusClipboardService::string_for_type(const std::string &name,
                                      const std::string &type_id) {
  auto reply = call(protocol::METHOD_STRING_FOR_TYPE,
                    [&](DBusMessageIter *iter) {
                      return append_string(iter, name) &&
                             append_string(iter, type_id);
                    });
  if (reply.is_error()) {
    logging::get()->warn("Pasteboard '{}': StringForType failed: {}", name,
                         reply.error().to_string());
    return std::nullopt;
  }

  auto value = parse_optional_string_reply(reply.value().get());
  if (value.is_error()) {
    logging::get()->warn("Pasteboard '{}': StringForType failed: {}", name,
                         value.error().to_string());
    return std::nullopt;
  }

  return std::move(value).value();
}

ChangeCount DBusClipboardService::change_count(const std::string &name) {
  auto reply = call(protocol::METHOD_CHANGE_COUNT, [&](DBusMessageIter *iter) {
    return append_string(iter, name);
  });
  if (reply.is_error()) {
    logging::get()->warn("Pasteboard '{}': ChangeCount failed: {}", name,
                         reply.error().to_string());
    return 0;
  }

  return parse_change_count_reply(reply.value().get()).value_or(0);
}

std::vector<std::string>
DBusClipboardService::types(const std::string &name) {
  auto reply = call(protocol::METHOD_TYPES, [&](DBusMessageIter *iter) {
    return append_string(iter, name);
  });
  if (reply.is_error()) {
    logging::get()->warn("Pasteboard '{}': Types failed: {}", name,
                         reply.error().to_string());
    return {};
  }

  return parse_string_list_reply(reply.value().get())
      .value_or(std::vector<std::string>());
}

} // namespace platform
} // namespace pasteboard
