/**
 * @file types.h
 * @brief Core type definitions for libpasteboard
 *
 * Holds the type registry (logical content kinds and their canonical
 * service-level identifiers), pasteboard names and the URL snapshot value
 * returned from reads.
 */

#ifndef PASTEBOARD_TYPES_H
#define PASTEBOARD_TYPES_H

#include "platform.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pasteboard {

// ============================================================================
// Basic Types
// ============================================================================

/// Per-pasteboard counter advanced by every clear_contents()
using ChangeCount = uint64_t;

// ============================================================================
// Pasteboard Types
// ============================================================================

/**
 * @brief Logical content kinds understood by the pasteboard server
 *
 * Closed set. Each value resolves to exactly one identifier string via
 * type_identifier().
 */
enum class PasteboardType : uint8_t {
  /// UTF-8 plain text
  String = 0,

  /// List of file:// URLs
  FileUrl = 1,

  /// Generic URL
  Url = 2,

  /// HTML markup
  Html = 3,

  /// Rich Text Format
  Rtf = 4,

  /// RTF with attachments (flattened)
  Rtfd = 5,

  /// PDF document
  Pdf = 6,

  /// PNG image
  Png = 7,

  /// TIFF image
  Tiff = 8,

  /// Tab-separated text
  TabularText = 9,

  /// Serialized color
  Color = 10,

  /// Font style run
  Font = 11,

  /// Paragraph formatting
  Ruler = 12,

  /// Audio clip
  Sound = 13,

  /// Multiple discontiguous text selections
  MultipleTextSelection = 14,

  /// Find panel options
  TextFinderOptions = 15
};

/// Every PasteboardType, in declaration order
PASTEBOARD_API const std::vector<PasteboardType> &all_pasteboard_types();

/// Canonical service type identifier (e.g. "public.utf8-plain-text")
PASTEBOARD_API const char *type_identifier(PasteboardType type);

/// Reverse lookup used to classify identifiers during reads
PASTEBOARD_API std::optional<PasteboardType>
type_from_identifier(const std::string &identifier);

/// Human-readable name for a type
PASTEBOARD_API const char *pasteboard_type_name(PasteboardType type);

// ============================================================================
// Pasteboard Names
// ============================================================================

/**
 * @brief Name addressing one server-side pasteboard store
 *
 * Any string is a valid name; the well-known names below are always
 * present on the server. Distinct names address distinct stores.
 */
class PASTEBOARD_API PasteboardName {
public:
  PasteboardName() = default;
  explicit PasteboardName(std::string value) : value_(std::move(value)) {}

  /// The general (copy/paste) pasteboard
  static PasteboardName general();

  /// Drag-and-drop pasteboard
  static PasteboardName drag();

  /// Find panel pasteboard
  static PasteboardName find();

  /// Font pasteboard
  static PasteboardName font();

  /// Ruler pasteboard
  static PasteboardName ruler();

  const std::string &value() const { return value_; }

  /// True for the names the server guarantees to exist
  bool is_standard() const;

  bool operator==(const PasteboardName &other) const {
    return value_ == other.value_;
  }
  bool operator!=(const PasteboardName &other) const {
    return value_ != other.value_;
  }
  bool operator<(const PasteboardName &other) const {
    return value_ < other.value_;
  }

private:
  std::string value_;
};

/// Names of all standard pasteboards
PASTEBOARD_API const std::vector<std::string> &standard_pasteboard_names();

// ============================================================================
// URL Snapshot
// ============================================================================

/**
 * @brief Read-only URL value produced from pasteboard contents
 *
 * A snapshot: it carries no binding back to the pasteboard it was read
 * from.
 */
class PASTEBOARD_API Url {
public:
  /// Parse a URL string; requires a valid "scheme:" prefix
  static std::optional<Url> parse(const std::string &spec);

  /// Build a file:// URL for a filesystem path
  static Url from_file_path(const std::string &path);

  /// Full URL string
  const std::string &spec() const { return spec_; }

  /// Lower-cased scheme, without the colon
  const std::string &scheme() const { return scheme_; }

  /**
   * @brief Path component, still percent-encoded
   *
   * For "scheme://authority/path?query#fragment" this is "/path"; for
   * URLs without an authority it is everything after the colon up to any
   * query or fragment.
   */
  std::string path() const;

  bool is_file() const { return scheme_ == "file"; }

  /// Decoded filesystem path, for file URLs only
  std::optional<std::string> to_file_path() const;

  bool operator==(const Url &other) const { return spec_ == other.spec_; }
  bool operator!=(const Url &other) const { return spec_ != other.spec_; }

private:
  Url(std::string spec, std::string scheme)
      : spec_(std::move(spec)), scheme_(std::move(scheme)) {}

  std::string spec_;
  std::string scheme_;
};

} // namespace pasteboard

#endif // PASTEBOARD_TYPES_H
