/**
 * @file codec.cpp
 * @brief Payload codec implementation
 */

#include "pasteboard/codec.h"
#include "pasteboard/log.h"
#include <cctype>

namespace pasteboard {
namespace codec {

namespace {

constexpr char HEX_DIGITS[] = "0123456789ABCDEF";

bool is_unreserved(unsigned char c) {
  return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
}

int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

} // namespace

std::string percent_encode_path(const std::string &path) {
  std::string out;
  out.reserve(path.size());

  for (char ch : path) {
    unsigned char c = static_cast<unsigned char>(ch);
    if (is_unreserved(c) || c == '/') {
      out += ch;
    } else {
      out += '%';
      out += HEX_DIGITS[c >> 4];
      out += HEX_DIGITS[c & 0x0F];
    }
  }

  return out;
}

std::optional<std::string> percent_decode(const std::string &text) {
  std::string out;
  out.reserve(text.size());

  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] != '%') {
      out += text[i];
      continue;
    }

    if (i + 2 >= text.size()) {
      return std::nullopt;
    }

    int hi = hex_value(text[i + 1]);
    int lo = hex_value(text[i + 2]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }

    out += static_cast<char>((hi << 4) | lo);
    i += 2;
  }

  return out;
}

std::string encode_file_url(const std::string &path) {
  return std::string(FILE_URL_PREFIX) + percent_encode_path(path);
}

std::optional<std::string> decode_file_url(const std::string &url) {
  const std::string prefix = FILE_URL_PREFIX;
  if (url.size() < prefix.size()) {
    return std::nullopt;
  }

  // Scheme comparison is case-insensitive
  for (size_t i = 0; i < prefix.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(url[i])) != prefix[i]) {
      return std::nullopt;
    }
  }

  std::string rest = url.substr(prefix.size());
  auto slash = rest.find('/');
  std::string host =
      slash == std::string::npos ? rest : rest.substr(0, slash);

  if (!host.empty() && host != "localhost") {
    return std::nullopt;
  }
  if (slash == std::string::npos) {
    return std::nullopt;
  }

  // Drop any query or fragment
  std::string path = rest.substr(slash);
  auto cut = path.find_first_of("?#");
  if (cut != std::string::npos) {
    path.erase(cut);
  }

  return percent_decode(path);
}

std::vector<std::string> encode_file_urls(const std::vector<std::string> &paths) {
  std::vector<std::string> urls;
  urls.reserve(paths.size());
  for (const auto &path : paths) {
    urls.push_back(encode_file_url(path));
  }
  return urls;
}

std::vector<Url> decode_urls(const std::vector<std::string> &items) {
  std::vector<Url> urls;
  urls.reserve(items.size());

  for (const auto &item : items) {
    auto url = Url::parse(item);
    if (!url) {
      logging::get()->debug("Skipping pasteboard item that is not a URL: '{}'",
                            item);
      continue;
    }
    urls.push_back(std::move(*url));
  }

  return urls;
}

} // namespace codec
} // namespace pasteboard
