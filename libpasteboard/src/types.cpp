/**
 * @file types.cpp
 * @brief Type registry, pasteboard names and URL snapshots
 */

#include "pasteboard/types.h"
#include "pasteboard/codec.h"
#include <algorithm>
#include <cctype>

namespace pasteboard {

// ============================================================================
// Type Registry
// ============================================================================

const std::vector<PasteboardType> &all_pasteboard_types() {
  static const std::vector<PasteboardType> types = {
      PasteboardType::String,      PasteboardType::FileUrl,
      PasteboardType::Url,         PasteboardType::Html,
      PasteboardType::Rtf,         PasteboardType::Rtfd,
      PasteboardType::Pdf,         PasteboardType::Png,
      PasteboardType::Tiff,        PasteboardType::TabularText,
      PasteboardType::Color,       PasteboardType::Font,
      PasteboardType::Ruler,       PasteboardType::Sound,
      PasteboardType::MultipleTextSelection,
      PasteboardType::TextFinderOptions};
  return types;
}

const char *type_identifier(PasteboardType type) {
  switch (type) {
  case PasteboardType::String:
    return "public.utf8-plain-text";
  case PasteboardType::FileUrl:
    return "public.file-url";
  case PasteboardType::Url:
    return "public.url";
  case PasteboardType::Html:
    return "public.html";
  case PasteboardType::Rtf:
    return "public.rtf";
  case PasteboardType::Rtfd:
    return "com.apple.flat-rtfd";
  case PasteboardType::Pdf:
    return "com.adobe.pdf";
  case PasteboardType::Png:
    return "public.png";
  case PasteboardType::Tiff:
    return "public.tiff";
  case PasteboardType::TabularText:
    return "public.utf8-tab-separated-values-text";
  case PasteboardType::Color:
    return "com.apple.cocoa.pasteboard.color";
  case PasteboardType::Font:
    return "com.apple.cocoa.pasteboard.character-formatting";
  case PasteboardType::Ruler:
    return "com.apple.cocoa.pasteboard.paragraph-formatting";
  case PasteboardType::Sound:
    return "com.apple.cocoa.pasteboard.sound";
  case PasteboardType::MultipleTextSelection:
    return "com.apple.cocoa.pasteboard.multiple-text-selection";
  case PasteboardType::TextFinderOptions:
    return "com.apple.cocoa.pasteboard.find-panel-search-options";
  }
  return "";
}

std::optional<PasteboardType>
type_from_identifier(const std::string &identifier) {
  for (PasteboardType type : all_pasteboard_types()) {
    if (identifier == type_identifier(type)) {
      return type;
    }
  }
  return std::nullopt;
}

const char *pasteboard_type_name(PasteboardType type) {
  switch (type) {
  case PasteboardType::String:
    return "String";
  case PasteboardType::FileUrl:
    return "File URL";
  case PasteboardType::Url:
    return "URL";
  case PasteboardType::Html:
    return "HTML";
  case PasteboardType::Rtf:
    return "RTF";
  case PasteboardType::Rtfd:
    return "RTFD";
  case PasteboardType::Pdf:
    return "PDF";
  case PasteboardType::Png:
    return "PNG";
  case PasteboardType::Tiff:
    return "TIFF";
  case PasteboardType::TabularText:
    return "Tabular Text";
  case PasteboardType::Color:
    return "Color";
  case PasteboardType::Font:
    return "Font";
  case PasteboardType::Ruler:
    return "Ruler";
  case PasteboardType::Sound:
    return "Sound";
  case PasteboardType::MultipleTextSelection:
    return "Multiple Text Selection";
  case PasteboardType::TextFinderOptions:
    return "Text Finder Options";
  default:
    return "Invalid";
  }
}

// ============================================================================
// PasteboardName
// ============================================================================

PasteboardName PasteboardName::general() { return PasteboardName("general"); }

PasteboardName PasteboardName::drag() { return PasteboardName("drag"); }

PasteboardName PasteboardName::find() { return PasteboardName("find"); }

PasteboardName PasteboardName::font() { return PasteboardName("font"); }

PasteboardName PasteboardName::ruler() { return PasteboardName("ruler"); }

bool PasteboardName::is_standard() const {
  const auto &names = standard_pasteboard_names();
  return std::find(names.begin(), names.end(), value_) != names.end();
}

const std::vector<std::string> &standard_pasteboard_names() {
  static const std::vector<std::string> names = {"general", "drag", "find",
                                                 "font", "ruler"};
  return names;
}

// ============================================================================
// Url
// ============================================================================

std::optional<Url> Url::parse(const std::string &spec) {
  auto colon = spec.find(':');
  if (colon == std::string::npos || colon == 0) {
    return std::nullopt;
  }

  // scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
  if (!std::isalpha(static_cast<unsigned char>(spec[0]))) {
    return std::nullopt;
  }

  std::string scheme;
  scheme.reserve(colon);
  for (size_t i = 0; i < colon; ++i) {
    unsigned char c = static_cast<unsigned char>(spec[i]);
    if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') {
      return std::nullopt;
    }
    scheme += static_cast<char>(std::tolower(c));
  }

  return Url(spec, std::move(scheme));
}

Url Url::from_file_path(const std::string &path) {
  return Url(codec::encode_file_url(path), "file");
}

std::string Url::path() const {
  std::string rest = spec_.substr(scheme_.size() + 1);

  if (rest.compare(0, 2, "//") == 0) {
    auto slash = rest.find_first_of("/?#", 2);
    rest = slash == std::string::npos ? std::string() : rest.substr(slash);
  }

  auto cut = rest.find_first_of("?#");
  if (cut != std::string::npos) {
    rest.erase(cut);
  }
  return rest;
}

std::optional<std::string> Url::to_file_path() const {
  if (!is_file()) {
    return std::nullopt;
  }
  return codec::decode_file_url(spec_);
}

} // namespace pasteboard
