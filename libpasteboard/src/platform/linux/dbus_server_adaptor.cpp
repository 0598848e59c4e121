/**
 * @file dbus_server_adaptor.cpp
 * @brief Session bus export of the pasteboard server
 */

#include "dbus_server_adaptor.h"
#include "dbus_protocol.h"
#include "pasteboard/log.h"
#include <cstring>
#include <vector>

namespace pasteboard {
namespace platform {

namespace {

constexpr const char *NAME_OWNER_CHANGED_RULE =
    "type='signal',sender='" DBUS_SERVICE_DBUS "',interface='" DBUS_INTERFACE_DBUS
    "',member='NameOwnerChanged'";

/// Read `count` leading string arguments
Result<std::vector<std::string>> read_strings(DBusMessageIter *iter,
                                              size_t count) {
  std::vector<std::string> values;
  values.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    auto value = read_string(iter);
    if (value.is_error()) {
      return value.error();
    }
    values.push_back(std::move(value).value());
  }
  return values;
}

DBusMessageWrapper error_reply(DBusMessage *call, const char *name,
                               const std::string &message) {
  return DBusMessageWrapper(
      dbus_message_new_error(call, name, message.c_str()));
}

} // namespace

DBusPasteboardAdaptor::DBusPasteboardAdaptor(
    std::shared_ptr<PasteboardServer> server, PasteboardConfig config)
    : server_(std::move(server)), config_(std::move(config)) {}

DBusPasteboardAdaptor::~DBusPasteboardAdaptor() {
  if (!conn_) {
    return;
  }

  if (registered_) {
    dbus_connection_remove_filter(conn_.get(), &filter_function, this);
    dbus_connection_unregister_object_path(conn_.get(),
                                           config_.object_path.c_str());

    DBusErrorWrapper error;
    dbus_bus_release_name(conn_.get(), config_.bus_name.c_str(), error.get());
    if (error.is_set()) {
      logging::get()->warn("Failed to release bus name {}: {}",
                           config_.bus_name, error.to_error().to_string());
    }
  }
}

// ============================================================================
// Bus Setup
// ============================================================================

Result<void> DBusPasteboardAdaptor::start() {
  if (registered_) {
    return Error(ErrorCode::InvalidState, "Adaptor already started");
  }

  auto bus = get_session_bus();
  if (bus.is_error()) {
    return bus.error();
  }
  conn_ = std::move(bus).value();

  DBusErrorWrapper error;
  int owner = dbus_bus_request_name(conn_.get(), config_.bus_name.c_str(),
                                    DBUS_NAME_FLAG_DO_NOT_QUEUE, error.get());
  if (error.is_set()) {
    return error.to_error();
  }
  if (owner != DBUS_REQUEST_NAME_REPLY_PRIMARY_OWNER &&
      owner != DBUS_REQUEST_NAME_REPLY_ALREADY_OWNER) {
    return Error(ErrorCode::InvalidState,
                 "Bus name " + config_.bus_name + " is owned by another process");
  }

  static DBusObjectPathVTable vtable = [] {
    DBusObjectPathVTable table;
    std::memset(&table, 0, sizeof(table));
    table.message_function = &DBusPasteboardAdaptor::message_function;
    return table;
  }();

  if (!dbus_connection_try_register_object_path(
          conn_.get(), config_.object_path.c_str(), &vtable, this,
          error.get())) {
    return error.is_set() ? error.to_error()
                          : Error(ErrorCode::PlatformError,
                                  "Failed to register object path");
  }

  if (!dbus_connection_add_filter(conn_.get(), &filter_function, this,
                                  nullptr)) {
    dbus_connection_unregister_object_path(conn_.get(),
                                           config_.object_path.c_str());
    return Error(ErrorCode::PlatformError, "Failed to add message filter");
  }
  registered_ = true;

  dbus_bus_add_match(conn_.get(), NAME_OWNER_CHANGED_RULE, error.get());
  if (error.is_set()) {
    // Retains of crashed clients will then only go away with the daemon
    logging::get()->warn("Cannot watch for departing clients: {}",
                         error.to_error().to_string());
  }

  logging::get()->info("Serving {} at {} on the session bus",
                       config_.bus_name, config_.object_path);
  return Result<void>::ok();
}

Result<void> DBusPasteboardAdaptor::run(const std::atomic<bool> &stop_requested) {
  if (!registered_) {
    return Error(ErrorCode::InvalidState, "Adaptor not started");
  }

  while (!stop_requested.load()) {
    if (!dbus_connection_read_write_dispatch(conn_.get(), 200)) {
      return Error(ErrorCode::ServiceUnavailable,
                   "Disconnected from the session bus");
    }
  }

  return Result<void>::ok();
}

// ============================================================================
// Message Handling
// ============================================================================

DBusHandlerResult DBusPasteboardAdaptor::message_function(DBusConnection *conn,
                                                          DBusMessage *message,
                                                          void *user_data) {
  auto *self = static_cast<DBusPasteboardAdaptor *>(user_data);

  if (dbus_message_get_type(message) != DBUS_MESSAGE_TYPE_METHOD_CALL) {
    return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
  }

  const char *iface = dbus_message_get_interface(message);
  if (iface && std::strcmp(iface, protocol::INTERFACE) != 0) {
    return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
  }

  DBusMessageWrapper reply = self->dispatch(message);
  if (!reply) {
    return DBUS_HANDLER_RESULT_NEED_MEMORY;
  }

  if (!dbus_message_get_no_reply(message) &&
      !dbus_connection_send(conn, reply.get(), nullptr)) {
    return DBUS_HANDLER_RESULT_NEED_MEMORY;
  }

  return DBUS_HANDLER_RESULT_HANDLED;
}

DBusHandlerResult DBusPasteboardAdaptor::filter_function(DBusConnection *conn,
                                                         DBusMessage *message,
                                                         void *user_data) {
  PASTEBOARD_UNUSED(conn);
  auto *self = static_cast<DBusPasteboardAdaptor *>(user_data);

  if (!dbus_message_is_signal(message, DBUS_INTERFACE_DBUS,
                              "NameOwnerChanged")) {
    return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
  }

  DBusMessageIter iter;
  if (!dbus_message_iter_init(message, &iter)) {
    return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
  }

  auto args = read_strings(&iter, 3);
  if (args.is_ok()) {
    const auto &name = args.value()[0];
    const auto &new_owner = args.value()[2];
    if (new_owner.empty() && !name.empty() && name[0] == ':') {
      self->client_vanished(name);
    }
  }

  return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
}

DBusMessageWrapper DBusPasteboardAdaptor::dispatch(DBusMessage *call) {
  const char *member = dbus_message_get_member(call);
  const char *sender_raw = dbus_message_get_sender(call);
  const std::string method = member ? member : "";
  const std::string sender = sender_raw ? sender_raw : "";

  DBusMessageIter args;
  dbus_message_iter_init(call, &args);

  DBusMessageWrapper reply(dbus_message_new_method_return(call));
  if (!reply) {
    return reply;
  }
  DBusMessageIter out;
  dbus_message_iter_init_append(reply.get(), &out);

  auto bad_args = [&](const Error &err) {
    logging::get()->debug("Rejecting {} from '{}': {}", method, sender,
                          err.message);
    return error_reply(call, DBUS_ERROR_INVALID_ARGS, err.message);
  };
  auto oom = [&]() { return DBusMessageWrapper(); };

  if (method == protocol::METHOD_RETAIN) {
    auto in = read_strings(&args, 1);
    if (in.is_error())
      return bad_args(in.error());
    server_->retain(in.value()[0]);
    record_retain(sender, in.value()[0]);

  } else if (method == protocol::METHOD_RETAIN_UNIQUE) {
    std::string name = server_->retain_unique();
    record_retain(sender, name);
    if (!append_string(&out, name))
      return oom();

  } else if (method == protocol::METHOD_RELEASE) {
    auto in = read_strings(&args, 1);
    if (in.is_error())
      return bad_args(in.error());
    if (record_release(sender, in.value()[0])) {
      server_->release(in.value()[0]);
    } else {
      logging::get()->warn("'{}' released pasteboard '{}' it never retained",
                           sender, in.value()[0]);
    }

  } else if (method == protocol::METHOD_SET_STRING) {
    auto in = read_strings(&args, 2);
    if (in.is_error())
      return bad_args(in.error());
    auto value = read_bytes(&args);
    if (value.is_error())
      return bad_args(value.error());
    server_->set_string(in.value()[0], in.value()[1], value.value());

  } else if (method == protocol::METHOD_WRITE_OBJECTS) {
    auto in = read_strings(&args, 2);
    if (in.is_error())
      return bad_args(in.error());
    auto items = read_bytes_array(&args);
    if (items.is_error())
      return bad_args(items.error());
    server_->write_objects(in.value()[0], in.value()[1], items.value());

  } else if (method == protocol::METHOD_READ_OBJECTS) {
    auto in = read_strings(&args, 1);
    if (in.is_error())
      return bad_args(in.error());
    auto type_ids = read_string_array(&args);
    if (type_ids.is_error())
      return bad_args(type_ids.error());
    auto items = server_->read_objects(in.value()[0], type_ids.value());
    if (!items) {
      return error_reply(call, protocol::ERROR_FAILED,
                         "Pasteboard server returned no data.");
    }
    if (!append_bytes_array(&out, *items))
      return oom();

  } else if (method == protocol::METHOD_STRING_FOR_TYPE) {
    auto in = read_strings(&args, 2);
    if (in.is_error())
      return bad_args(in.error());
    auto value = server_->string_for_type(in.value()[0], in.value()[1]);
    dbus_bool_t present = value.has_value() ? TRUE : FALSE;
    if (!dbus_message_iter_append_basic(&out, DBUS_TYPE_BOOLEAN, &present) ||
        !append_bytes(&out, value.value_or("")))
      return oom();

  } else if (method == protocol::METHOD_CLEAR_CONTENTS ||
             method == protocol::METHOD_CHANGE_COUNT) {
    auto in = read_strings(&args, 1);
    if (in.is_error())
      return bad_args(in.error());
    dbus_uint64_t count = method == protocol::METHOD_CLEAR_CONTENTS
                              ? server_->clear_contents(in.value()[0])
                              : server_->change_count(in.value()[0]);
    if (!dbus_message_iter_append_basic(&out, DBUS_TYPE_UINT64, &count))
      return oom();

  } else if (method == protocol::METHOD_RELEASE_GLOBALLY) {
    auto in = read_strings(&args, 1);
    if (in.is_error())
      return bad_args(in.error());
    server_->release_globally(in.value()[0]);

  } else if (method == protocol::METHOD_TYPES) {
    auto in = read_strings(&args, 1);
    if (in.is_error())
      return bad_args(in.error());
    if (!append_string_array(&out, server_->types(in.value()[0])))
      return oom();

  } else {
    return error_reply(call, DBUS_ERROR_UNKNOWN_METHOD,
                       "Unknown method '" + method + "'");
  }

  return reply;
}

// ============================================================================
// Client Retains
// ============================================================================

void DBusPasteboardAdaptor::record_retain(const std::string &sender,
                                          const std::string &name) {
  std::lock_guard<std::mutex> lock(retains_mutex_);
  ++retains_[sender][name];
}

bool DBusPasteboardAdaptor::record_release(const std::string &sender,
                                           const std::string &name) {
  std::lock_guard<std::mutex> lock(retains_mutex_);

  auto client = retains_.find(sender);
  if (client == retains_.end()) {
    return false;
  }

  auto entry = client->second.find(name);
  if (entry == client->second.end()) {
    return false;
  }

  if (--entry->second == 0) {
    client->second.erase(entry);
    if (client->second.empty()) {
      retains_.erase(client);
    }
  }
  return true;
}

void DBusPasteboardAdaptor::client_vanished(const std::string &sender) {
  std::map<std::string, size_t> held;
  {
    std::lock_guard<std::mutex> lock(retains_mutex_);
    auto client = retains_.find(sender);
    if (client == retains_.end()) {
      return;
    }
    held = std::move(client->second);
    retains_.erase(client);
  }

  for (const auto &entry : held) {
    for (size_t i = 0; i < entry.second; ++i) {
      server_->release(entry.first);
    }
  }

  logging::get()->debug("Client {} left the bus, dropped {} binding(s)",
                        sender, held.size());
}

size_t DBusPasteboardAdaptor::client_retains(const std::string &sender,
                                             const std::string &name) const {
  std::lock_guard<std::mutex> lock(retains_mutex_);

  auto client = retains_.find(sender);
  if (client == retains_.end()) {
    return 0;
  }
  auto entry = client->second.find(name);
  return entry == client->second.end() ? 0 : entry->second;
}

} // namespace platform
} // namespace pasteboard
