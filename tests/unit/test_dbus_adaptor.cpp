/**
 * @file test_dbus_adaptor.cpp
 * @brief Unit tests for the D-Bus marshalling, run without a bus
 *
 * Method calls are built in memory and handed straight to
 * DBusPasteboardAdaptor::dispatch(); replies are decoded with the same
 * parsers the client service uses.
 */

#include <gtest/gtest.h>
#include <pasteboard/pasteboard.h>

#include "platform/linux/dbus_client_service.h"
#include "platform/linux/dbus_protocol.h"
#include "platform/linux/dbus_server_adaptor.h"

#include <cstdlib>
#include <cstring>

using namespace pasteboard;
using namespace pasteboard::platform;

namespace {

const std::string TEXT = type_identifier(PasteboardType::String);
const std::string FILES = type_identifier(PasteboardType::FileUrl);

} // namespace

class DBusAdaptorTest : public ::testing::Test {
protected:
  std::shared_ptr<PasteboardServer> server;
  std::unique_ptr<DBusPasteboardAdaptor> adaptor;
  dbus_uint32_t next_serial = 1;

  void SetUp() override {
    server = std::make_shared<PasteboardServer>();
    adaptor = std::make_unique<DBusPasteboardAdaptor>(server,
                                                      PasteboardConfig());
  }

  /// Build a call; replies need a serial to refer to
  DBusMessageWrapper make_call(const char *method,
                               const char *sender = ":1.10") {
    PasteboardConfig config;
    DBusMessageWrapper msg(dbus_message_new_method_call(
        config.bus_name.c_str(), config.object_path.c_str(),
        protocol::INTERFACE, method));
    dbus_message_set_serial(msg.get(), next_serial++);
    if (sender) {
      dbus_message_set_sender(msg.get(), sender);
    }
    return msg;
  }

  DBusMessageWrapper call(const char *method,
                          const std::vector<std::string> &strings = {},
                          const char *sender = ":1.10") {
    auto msg = make_call(method, sender);
    DBusMessageIter iter;
    dbus_message_iter_init_append(msg.get(), &iter);
    for (const auto &s : strings) {
      EXPECT_TRUE(append_string(&iter, s));
    }
    return adaptor->dispatch(msg.get());
  }

  /// SetString(s, s, ay)
  DBusMessageWrapper set_string(const std::string &name,
                                const std::string &type_id,
                                const std::string &value) {
    auto msg = make_call(protocol::METHOD_SET_STRING);
    DBusMessageIter iter;
    dbus_message_iter_init_append(msg.get(), &iter);
    EXPECT_TRUE(append_string(&iter, name) && append_string(&iter, type_id) &&
                append_bytes(&iter, value));
    return adaptor->dispatch(msg.get());
  }

  /// WriteObjects(s, s, aay)
  DBusMessageWrapper write_objects(const std::string &name,
                                   const std::string &type_id,
                                   const std::vector<std::string> &items) {
    auto msg = make_call(protocol::METHOD_WRITE_OBJECTS);
    DBusMessageIter iter;
    dbus_message_iter_init_append(msg.get(), &iter);
    EXPECT_TRUE(append_string(&iter, name) && append_string(&iter, type_id) &&
                append_bytes_array(&iter, items));
    return adaptor->dispatch(msg.get());
  }

  /// ReadObjects(s, as) -> aay
  DBusMessageWrapper read_objects(const std::string &name,
                                  const std::vector<std::string> &type_ids) {
    auto msg = make_call(protocol::METHOD_READ_OBJECTS);
    DBusMessageIter iter;
    dbus_message_iter_init_append(msg.get(), &iter);
    EXPECT_TRUE(append_string(&iter, name) &&
                append_string_array(&iter, type_ids));
    return adaptor->dispatch(msg.get());
  }

  static bool is_error(const DBusMessageWrapper &reply, const char *name) {
    return reply &&
           dbus_message_get_type(reply.get()) == DBUS_MESSAGE_TYPE_ERROR &&
           std::strcmp(dbus_message_get_error_name(reply.get()), name) == 0;
  }
};

// ============================================================================
// Writes and Reads
// ============================================================================

TEST_F(DBusAdaptorTest, SetStringThenStringForType) {
  auto set = set_string("general", TEXT, "hello");
  ASSERT_TRUE(set);
  EXPECT_EQ(dbus_message_get_type(set.get()), DBUS_MESSAGE_TYPE_METHOD_RETURN);

  auto reply = call(protocol::METHOD_STRING_FOR_TYPE, {"general", TEXT});
  ASSERT_TRUE(reply);

  auto value = parse_optional_string_reply(reply.get());
  ASSERT_TRUE(value.is_ok());
  EXPECT_EQ(value.value(), std::optional<std::string>("hello"));
}

TEST_F(DBusAdaptorTest, StringForTypeAbsent) {
  auto reply = call(protocol::METHOD_STRING_FOR_TYPE, {"general", TEXT});
  auto value = parse_optional_string_reply(reply.get());
  ASSERT_TRUE(value.is_ok());
  EXPECT_FALSE(value.value().has_value());
}

TEST_F(DBusAdaptorTest, EmptyStringIsPresent) {
  set_string("general", TEXT, "");

  auto reply = call(protocol::METHOD_STRING_FOR_TYPE, {"general", TEXT});
  auto value = parse_optional_string_reply(reply.get());
  ASSERT_TRUE(value.is_ok());
  EXPECT_EQ(value.value(), std::optional<std::string>(""));
}

TEST_F(DBusAdaptorTest, WriteObjectsThenReadObjects) {
  ASSERT_TRUE(write_objects("drag", FILES, {"file:///a", "file:///b"}));

  auto reply = read_objects("drag", {FILES});
  auto items = parse_items_reply(reply.get());
  ASSERT_TRUE(items.is_ok());
  EXPECT_EQ(items.value(),
            (std::vector<std::string>{"file:///a", "file:///b"}));
}

// ============================================================================
// Binary Payloads
// ============================================================================

TEST_F(DBusAdaptorTest, StringValueKeepsEmbeddedNull) {
  const std::string value("before\0after", 12);
  ASSERT_EQ(dbus_message_get_type(set_string("general", TEXT, value).get()),
            DBUS_MESSAGE_TYPE_METHOD_RETURN);
  EXPECT_EQ(server->string_for_type("general", TEXT),
            std::optional<std::string>(value));

  auto reply = call(protocol::METHOD_STRING_FOR_TYPE, {"general", TEXT});
  auto read = parse_optional_string_reply(reply.get());
  ASSERT_TRUE(read.is_ok());
  ASSERT_TRUE(read.value().has_value());
  EXPECT_EQ(read.value()->size(), 12u);
  EXPECT_EQ(*read.value(), value);
}

TEST_F(DBusAdaptorTest, StringValueKeepsMultiByteText) {
  const std::string value = "caf\xc3\xa9 \xe6\x97\xa5\xe6\x9c\xac \xf0\x9f\x93\x8b";
  set_string("general", TEXT, value);

  auto reply = call(protocol::METHOD_STRING_FOR_TYPE, {"general", TEXT});
  auto read = parse_optional_string_reply(reply.get());
  ASSERT_TRUE(read.is_ok());
  EXPECT_EQ(read.value(), std::optional<std::string>(value));
}

TEST_F(DBusAdaptorTest, StringValueKeepsInvalidUtf8) {
  const std::string value("\xff\x00\x89PNG", 5);
  ASSERT_EQ(dbus_message_get_type(set_string("general", TEXT, value).get()),
            DBUS_MESSAGE_TYPE_METHOD_RETURN);

  auto reply = call(protocol::METHOD_STRING_FOR_TYPE, {"general", TEXT});
  auto read = parse_optional_string_reply(reply.get());
  ASSERT_TRUE(read.is_ok());
  EXPECT_EQ(read.value(), std::optional<std::string>(value));
}

TEST_F(DBusAdaptorTest, ObjectItemsKeepArbitraryBytes) {
  const std::vector<std::string> items = {
      std::string("a\0b", 3),
      "\xe2\x9c\x93 done",
      std::string("\xff\x00\x89PNG", 5),
      "",
  };
  ASSERT_EQ(dbus_message_get_type(write_objects("drag", TEXT, items).get()),
            DBUS_MESSAGE_TYPE_METHOD_RETURN);

  auto reply = read_objects("drag", {TEXT});
  auto read = parse_items_reply(reply.get());
  ASSERT_TRUE(read.is_ok());
  EXPECT_EQ(read.value(), items);
}

TEST_F(DBusAdaptorTest, ClearContentsAndChangeCount) {
  auto cleared = call(protocol::METHOD_CLEAR_CONTENTS, {"general"});
  auto count = parse_change_count_reply(cleared.get());
  ASSERT_TRUE(count.is_ok());
  EXPECT_EQ(count.value(), 1u);

  auto current = call(protocol::METHOD_CHANGE_COUNT, {"general"});
  EXPECT_EQ(parse_change_count_reply(current.get()).value_or(0), 1u);
}

TEST_F(DBusAdaptorTest, Types) {
  server->set_string("font", TEXT, "Helvetica");

  auto reply = call(protocol::METHOD_TYPES, {"font"});
  auto types = parse_string_list_reply(reply.get());
  ASSERT_TRUE(types.is_ok());
  EXPECT_EQ(types.value(), std::vector<std::string>{TEXT});
}

// ============================================================================
// Bindings
// ============================================================================

TEST_F(DBusAdaptorTest, RetainUniqueRecordsSender) {
  auto reply = call(protocol::METHOD_RETAIN_UNIQUE, {}, ":1.20");
  auto name = parse_name_reply(reply.get());
  ASSERT_TRUE(name.is_ok());

  EXPECT_EQ(name.value().rfind("unique-", 0), 0u);
  EXPECT_EQ(server->retain_count(name.value()), 1u);
  EXPECT_EQ(adaptor->client_retains(":1.20", name.value()), 1u);
}

TEST_F(DBusAdaptorTest, ReleaseOnlyDropsOwnRetains) {
  call(protocol::METHOD_RETAIN, {"shared"}, ":1.1");
  call(protocol::METHOD_RETAIN, {"shared"}, ":1.2");
  EXPECT_EQ(server->retain_count("shared"), 2u);

  // :1.3 never retained it
  auto reply = call(protocol::METHOD_RELEASE, {"shared"}, ":1.3");
  EXPECT_EQ(dbus_message_get_type(reply.get()),
            DBUS_MESSAGE_TYPE_METHOD_RETURN);
  EXPECT_EQ(server->retain_count("shared"), 2u);

  call(protocol::METHOD_RELEASE, {"shared"}, ":1.1");
  EXPECT_EQ(server->retain_count("shared"), 1u);
  EXPECT_EQ(adaptor->client_retains(":1.1", "shared"), 0u);
  EXPECT_EQ(adaptor->client_retains(":1.2", "shared"), 1u);
}

TEST_F(DBusAdaptorTest, VanishedClientReleasesEverything) {
  call(protocol::METHOD_RETAIN, {"temp"}, ":1.5");
  call(protocol::METHOD_RETAIN, {"temp"}, ":1.5");
  call(protocol::METHOD_RELEASE_GLOBALLY, {"temp"}, ":1.5");
  EXPECT_TRUE(server->contains("temp"));

  adaptor->client_vanished(":1.5");

  EXPECT_FALSE(server->contains("temp"));
  EXPECT_EQ(adaptor->client_retains(":1.5", "temp"), 0u);

  // A second notification is harmless
  adaptor->client_vanished(":1.5");
}

TEST_F(DBusAdaptorTest, CallWithoutSender) {
  call(protocol::METHOD_RETAIN, {"anon"}, nullptr);
  EXPECT_EQ(adaptor->client_retains("", "anon"), 1u);
}

// ============================================================================
// Malformed Calls
// ============================================================================

TEST_F(DBusAdaptorTest, MissingArgumentsAreRejected) {
  auto reply = call(protocol::METHOD_SET_STRING, {"general", TEXT});
  EXPECT_TRUE(is_error(reply, DBUS_ERROR_INVALID_ARGS));
  EXPECT_FALSE(server->string_for_type("general", TEXT).has_value());
}

TEST_F(DBusAdaptorTest, WrongArgumentTypeIsRejected) {
  auto msg = make_call(protocol::METHOD_READ_OBJECTS);
  DBusMessageIter iter;
  dbus_message_iter_init_append(msg.get(), &iter);
  ASSERT_TRUE(append_string(&iter, "general"));
  ASSERT_TRUE(append_string(&iter, FILES));

  auto reply = adaptor->dispatch(msg.get());
  EXPECT_TRUE(is_error(reply, DBUS_ERROR_INVALID_ARGS));
}

TEST_F(DBusAdaptorTest, TextValueIsRejected) {
  auto reply = call(protocol::METHOD_SET_STRING, {"general", TEXT, "hello"});
  EXPECT_TRUE(is_error(reply, DBUS_ERROR_INVALID_ARGS));
  EXPECT_FALSE(server->string_for_type("general", TEXT).has_value());
}

TEST_F(DBusAdaptorTest, UnknownMethod) {
  auto reply = call("Paste", {"general"});
  EXPECT_TRUE(is_error(reply, DBUS_ERROR_UNKNOWN_METHOD));
}

// ============================================================================
// Reply Parsing
// ============================================================================

TEST(DBusReplyTest, ParsersRejectWrongShapes) {
  DBusMessageWrapper empty(dbus_message_new(DBUS_MESSAGE_TYPE_METHOD_RETURN));
  EXPECT_EQ(parse_string_list_reply(empty.get()).error().code,
            ErrorCode::MalformedReply);
  EXPECT_TRUE(parse_change_count_reply(empty.get()).is_error());
  EXPECT_TRUE(parse_name_reply(nullptr).is_error());

  DBusMessageWrapper text(dbus_message_new(DBUS_MESSAGE_TYPE_METHOD_RETURN));
  DBusMessageIter iter;
  dbus_message_iter_init_append(text.get(), &iter);
  ASSERT_TRUE(append_string(&iter, "not a count"));

  EXPECT_TRUE(parse_change_count_reply(text.get()).is_error());
  EXPECT_TRUE(parse_optional_string_reply(text.get()).is_error());
  EXPECT_TRUE(parse_string_list_reply(text.get()).is_error());
  EXPECT_TRUE(parse_items_reply(text.get()).is_error());
  EXPECT_EQ(parse_name_reply(text.get()).value_or(""), "not a count");
}

TEST(DBusReplyTest, PayloadsMustBeByteArrays) {
  // (bs) where (bay) is expected
  DBusMessageWrapper as_text(
      dbus_message_new(DBUS_MESSAGE_TYPE_METHOD_RETURN));
  DBusMessageIter iter;
  dbus_message_iter_init_append(as_text.get(), &iter);
  dbus_bool_t present = TRUE;
  ASSERT_TRUE(dbus_message_iter_append_basic(&iter, DBUS_TYPE_BOOLEAN, &present));
  ASSERT_TRUE(append_string(&iter, "hello"));
  EXPECT_EQ(parse_optional_string_reply(as_text.get()).error().code,
            ErrorCode::MalformedReply);

  // (as) where (aay) is expected
  DBusMessageWrapper list(dbus_message_new(DBUS_MESSAGE_TYPE_METHOD_RETURN));
  dbus_message_iter_init_append(list.get(), &iter);
  ASSERT_TRUE(append_string_array(&iter, {"file:///a"}));
  EXPECT_EQ(parse_items_reply(list.get()).error().code,
            ErrorCode::MalformedReply);
  EXPECT_TRUE(parse_string_list_reply(list.get()).is_ok());
}

TEST(DBusReplyTest, ErrorMapping) {
  DBusErrorWrapper timeout;
  dbus_set_error_const(timeout.get(), DBUS_ERROR_NO_REPLY, "late");
  EXPECT_EQ(timeout.to_error().code, ErrorCode::Timeout);

  DBusErrorWrapper missing;
  dbus_set_error_const(missing.get(), DBUS_ERROR_SERVICE_UNKNOWN, "gone");
  EXPECT_EQ(missing.to_error().code, ErrorCode::ServiceUnavailable);

  DBusErrorWrapper other;
  dbus_set_error_const(other.get(), DBUS_ERROR_FAILED, "boom");
  Error err = other.to_error();
  EXPECT_EQ(err.code, ErrorCode::PlatformError);
  EXPECT_NE(err.message.find("boom"), std::string::npos);
}

// ============================================================================
// Client Without a Server
// ============================================================================

class DBusClientOfflineTest : public ::testing::Test {
protected:
  std::string saved_address;
  bool had_address = false;

  void SetUp() override {
    const char *address = std::getenv("DBUS_SESSION_BUS_ADDRESS");
    had_address = address != nullptr;
    saved_address = address ? address : "";
    setenv("DBUS_SESSION_BUS_ADDRESS",
           "unix:path=/nonexistent/pasteboard-test-bus", 1);
  }

  void TearDown() override {
    if (had_address) {
      setenv("DBUS_SESSION_BUS_ADDRESS", saved_address.c_str(), 1);
    } else {
      unsetenv("DBUS_SESSION_BUS_ADDRESS");
    }
  }
};

TEST_F(DBusClientOfflineTest, ReadsReportNoData) {
  PasteboardConfig config;
  config.call_timeout_ms = 200;
  auto service = std::make_shared<DBusClipboardService>(config);

  EXPECT_FALSE(service->read_objects("general", {FILES}).has_value());
  EXPECT_FALSE(service->string_for_type("general", TEXT).has_value());
  EXPECT_EQ(service->change_count("general"), 0u);
  EXPECT_TRUE(service->types("general").empty());
}

TEST_F(DBusClientOfflineTest, HandleSurfacesServerError) {
  PasteboardConfig config;
  config.call_timeout_ms = 200;
  auto service = std::make_shared<DBusClipboardService>(config);

  auto pb = Pasteboard::general(service);
  pb.copy_files({"/tmp/a.txt"});

  auto urls = pb.get_file_urls();
  ASSERT_TRUE(urls.is_error());
  EXPECT_EQ(urls.error().code, ErrorCode::ServerNoData);

  auto unique = Pasteboard::unique(service);
  EXPECT_EQ(unique.name().rfind("unique-", 0), 0u);
}
