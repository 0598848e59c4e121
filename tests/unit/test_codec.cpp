/**
 * @file test_codec.cpp
 * @brief Unit tests for the file URL codec
 */

#include <gtest/gtest.h>
#include <pasteboard/pasteboard.h>

using namespace pasteboard;

// ============================================================================
// Percent Encoding
// ============================================================================

TEST(CodecTest, PlainPathIsUnchanged) {
  EXPECT_EQ(codec::percent_encode_path("/tmp/a.txt"), "/tmp/a.txt");
  EXPECT_EQ(codec::percent_encode_path("/home/user/My_File-1~.tar.gz"),
            "/home/user/My_File-1~.tar.gz");
}

TEST(CodecTest, ReservedCharactersAreEscaped) {
  EXPECT_EQ(codec::percent_encode_path("/a b"), "/a%20b");
  EXPECT_EQ(codec::percent_encode_path("/100%"), "/100%25");
  EXPECT_EQ(codec::percent_encode_path("/q?x#y"), "/q%3Fx%23y");
}

TEST(CodecTest, MultiByteIsEscapedPerByte) {
  EXPECT_EQ(codec::percent_encode_path("/caf\xC3\xA9"), "/caf%C3%A9");
}

TEST(CodecTest, PercentDecode) {
  EXPECT_EQ(codec::percent_decode("/a%20b").value_or(""), "/a b");
  EXPECT_EQ(codec::percent_decode("%c3%a9").value_or(""), "\xC3\xA9");
  EXPECT_EQ(codec::percent_decode("plain").value_or(""), "plain");
}

TEST(CodecTest, PercentDecodeRejectsBadEscapes) {
  EXPECT_FALSE(codec::percent_decode("%").has_value());
  EXPECT_FALSE(codec::percent_decode("abc%2").has_value());
  EXPECT_FALSE(codec::percent_decode("%zz").has_value());
}

// ============================================================================
// File URLs
// ============================================================================

TEST(CodecTest, EncodeFileUrl) {
  EXPECT_EQ(codec::encode_file_url("/tmp/a.txt"), "file:///tmp/a.txt");
  EXPECT_EQ(codec::encode_file_url("/tmp/my file.txt"),
            "file:///tmp/my%20file.txt");
}

TEST(CodecTest, EncodeFileUrlsKeepsOrder) {
  auto urls = codec::encode_file_urls({"/b", "/a"});
  EXPECT_EQ(urls, (std::vector<std::string>{"file:///b", "file:///a"}));
  EXPECT_TRUE(codec::encode_file_urls({}).empty());
}

TEST(CodecTest, DecodeFileUrl) {
  EXPECT_EQ(codec::decode_file_url("file:///tmp/a%20b.txt").value_or(""),
            "/tmp/a b.txt");
  EXPECT_EQ(codec::decode_file_url("FILE:///tmp/x").value_or(""), "/tmp/x");
  EXPECT_EQ(codec::decode_file_url("file://localhost/etc/hosts").value_or(""),
            "/etc/hosts");
  EXPECT_EQ(codec::decode_file_url("file:///tmp/x?query#frag").value_or(""),
            "/tmp/x");
}

TEST(CodecTest, DecodeFileUrlRejectsOthers) {
  EXPECT_FALSE(codec::decode_file_url("https://example.com/a").has_value());
  EXPECT_FALSE(codec::decode_file_url("file://remote-host/a").has_value());
  EXPECT_FALSE(codec::decode_file_url("file://").has_value());
  EXPECT_FALSE(codec::decode_file_url("file:").has_value());
}

TEST(CodecTest, DecodeUrlsSkipsInvalidItems) {
  auto urls = codec::decode_urls(
      {"file:///a", "not a url", "https://example.com", ":nothing"});

  ASSERT_EQ(urls.size(), 2u);
  EXPECT_EQ(urls[0].spec(), "file:///a");
  EXPECT_EQ(urls[1].scheme(), "https");
}

// ============================================================================
// Url
// ============================================================================

TEST(UrlTest, ParseLowercasesScheme) {
  auto url = Url::parse("HTTPS://Example.com/Path");
  ASSERT_TRUE(url.has_value());
  EXPECT_EQ(url->scheme(), "https");
  EXPECT_EQ(url->spec(), "HTTPS://Example.com/Path");
  EXPECT_FALSE(url->is_file());
}

TEST(UrlTest, ParseRejectsInvalidSchemes) {
  EXPECT_FALSE(Url::parse("").has_value());
  EXPECT_FALSE(Url::parse("/tmp/a.txt").has_value());
  EXPECT_FALSE(Url::parse("1abc:x").has_value());
  EXPECT_FALSE(Url::parse("bad scheme:x").has_value());
}

TEST(UrlTest, FromFilePath) {
  auto url = Url::from_file_path("/tmp/with space");
  EXPECT_TRUE(url.is_file());
  EXPECT_EQ(url.spec(), "file:///tmp/with%20space");
  EXPECT_EQ(url.to_file_path().value_or(""), "/tmp/with space");
  EXPECT_EQ(url, *Url::parse("file:///tmp/with%20space"));
}

TEST(UrlTest, PathComponent) {
  EXPECT_EQ(Url::parse("file:///tmp/a%20b.txt")->path(), "/tmp/a%20b.txt");
  EXPECT_EQ(Url::parse("https://example.com/docs/x?lang=en#top")->path(),
            "/docs/x");
  EXPECT_EQ(Url::parse("https://example.com")->path(), "");
  EXPECT_EQ(Url::parse("https://example.com?q=1")->path(), "");
  EXPECT_EQ(Url::parse("mailto:someone@example.com")->path(),
            "someone@example.com");
  EXPECT_EQ(Url::from_file_path("/tmp/with space").path(),
            "/tmp/with%20space");
}

TEST(UrlTest, NonFileUrlHasNoPath) {
  auto url = Url::parse("https://example.com/a");
  ASSERT_TRUE(url.has_value());
  EXPECT_FALSE(url->to_file_path().has_value());
}
