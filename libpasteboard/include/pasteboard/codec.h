/**
 * @file codec.h
 * @brief Payload codec between logical values and service primitives
 *
 * The pasteboard server only stores strings and string lists keyed by type
 * identifier. The codec converts file paths to file:// URL strings and
 * back, and turns raw item lists read from the server into URL values.
 */

#ifndef PASTEBOARD_CODEC_H
#define PASTEBOARD_CODEC_H

#include "platform.h"
#include "types.h"
#include <optional>
#include <string>
#include <vector>

namespace pasteboard {
namespace codec {

/// Scheme prefix written in front of every encoded path
constexpr const char *FILE_URL_PREFIX = "file://";

/**
 * @brief Percent-encode a filesystem path for use in a URL
 *
 * Bytes outside the RFC 3986 unreserved set are escaped, except '/'.
 */
PASTEBOARD_API std::string percent_encode_path(const std::string &path);

/**
 * @brief Decode %XX escapes
 * @return Decoded string, or nullopt if an escape is truncated or not hex
 */
PASTEBOARD_API std::optional<std::string>
percent_decode(const std::string &text);

/// "file://" followed by the percent-encoded path
PASTEBOARD_API std::string encode_file_url(const std::string &path);

/**
 * @brief Recover the filesystem path from a file:// URL string
 *
 * Accepts "file:///path" and "file://localhost/path". Returns nullopt for
 * other schemes, remote hosts or malformed escapes.
 */
PASTEBOARD_API std::optional<std::string>
decode_file_url(const std::string &url);

/// Encode every path, preserving order
PASTEBOARD_API std::vector<std::string>
encode_file_urls(const std::vector<std::string> &paths);

/**
 * @brief Parse raw items into URLs, preserving order
 *
 * Items that are not valid URLs are skipped.
 */
PASTEBOARD_API std::vector<Url>
decode_urls(const std::vector<std::string> &items);

} // namespace codec
} // namespace pasteboard

#endif // PASTEBOARD_CODEC_H
