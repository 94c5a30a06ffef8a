#pragma once

#include <ostream>
#include <string>
#include <string_view>

namespace xpull {

  inline void
  escape_text(std::ostream& os, std::string_view text) {
    for (char c : text) {
      switch (c) {
        case '<':
          os << "&lt;";
          break;
        case '>':
          os << "&gt;";
          break;
        case '&':
          os << "&amp;";
          break;
        default:
          os << c;
          break;
      }
    }
  }

  inline void
  escape_attribute(std::ostream& os, std::string_view text) {
    for (char c : text) {
      switch (c) {
        case '<':
          os << "&lt;";
          break;
        case '&':
          os << "&amp;";
          break;
        case '"':
          os << "&quot;";
          break;
        case '\t':
          os << "&#9;";
          break;
        case '\n':
          os << "&#10;";
          break;
        default:
          os << c;
          break;
      }
    }
  }

  // Replace all five predefined-entity characters
  std::string
  escape(std::string_view text);

  bool
  is_valid_utf8(std::string_view bytes);

  // Copy of bytes after UTF-8 validation; no entity processing
  std::string
  decode_utf8(std::string_view bytes);

  // Resolve predefined entities and character references exactly once.
  // Throws xml_error: invalid_utf8, unknown_entity or invalid_char_ref.
  std::string
  unescape(std::string_view raw);

} // namespace xpull
