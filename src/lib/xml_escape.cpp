#include <xpull/xml_escape.hpp>

#include <xpull/error.hpp>

#include <cstdint>

namespace xpull {

  namespace {

    bool
    is_continuation(unsigned char c) {
      return (c & 0xC0) == 0x80;
    }

    bool
    is_xml_char(std::uint32_t cp) {
      return cp == 0x9 || cp == 0xA || cp == 0xD ||
             (cp >= 0x20 && cp <= 0xD7FF) || (cp >= 0xE000 && cp <= 0xFFFD) ||
             (cp >= 0x10000 && cp <= 0x10FFFF);
    }

    void
    append_utf8(std::string& out, std::uint32_t cp) {
      if (cp < 0x80) {
        out += static_cast<char>(cp);
      } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
      } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
      } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
      }
    }

    // &#NN; or &#xHH; with ref = "#NN" / "#xHH"
    std::uint32_t
    parse_char_ref(std::string_view ref) {
      bool hex = ref.size() > 1 && ref[1] == 'x';
      std::string_view digits = ref.substr(hex ? 2 : 1);
      if (digits.empty()) {
        throw xml_error(error_kind::invalid_char_ref,
                        "unescape: empty character reference");
      }

      std::uint32_t cp = 0;
      for (char c : digits) {
        std::uint32_t d;
        if (c >= '0' && c <= '9') {
          d = static_cast<std::uint32_t>(c - '0');
        } else if (hex && c >= 'a' && c <= 'f') {
          d = static_cast<std::uint32_t>(c - 'a' + 10);
        } else if (hex && c >= 'A' && c <= 'F') {
          d = static_cast<std::uint32_t>(c - 'A' + 10);
        } else {
          throw xml_error(error_kind::invalid_char_ref,
                          "unescape: bad digit in '&" + std::string(ref) +
                              ";'");
        }
        cp = cp * (hex ? 16 : 10) + d;
        if (cp > 0x10FFFF) break;
      }

      if (!is_xml_char(cp)) {
        throw xml_error(error_kind::invalid_char_ref,
                        "unescape: '&" + std::string(ref) +
                            ";' is not a valid XML character");
      }
      return cp;
    }

    char
    predefined_entity(std::string_view name) {
      if (name == "amp") return '&';
      if (name == "lt") return '<';
      if (name == "gt") return '>';
      if (name == "apos") return '\'';
      if (name == "quot") return '"';
      return 0;
    }

  } // namespace

  std::string
  escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
      switch (c) {
        case '&':
          out += "&amp;";
          break;
        case '<':
          out += "&lt;";
          break;
        case '>':
          out += "&gt;";
          break;
        case '\'':
          out += "&apos;";
          break;
        case '"':
          out += "&quot;";
          break;
        default:
          out += c;
          break;
      }
    }
    return out;
  }

  bool
  is_valid_utf8(std::string_view bytes) {
    std::size_t i = 0;
    while (i < bytes.size()) {
      auto c = static_cast<unsigned char>(bytes[i]);
      if (c < 0x80) {
        ++i;
        continue;
      }

      std::size_t len;
      std::uint32_t cp;
      if ((c & 0xE0) == 0xC0) {
        len = 2;
        cp = c & 0x1F;
      } else if ((c & 0xF0) == 0xE0) {
        len = 3;
        cp = c & 0x0F;
      } else if ((c & 0xF8) == 0xF0) {
        len = 4;
        cp = c & 0x07;
      } else {
        return false;
      }
      if (i + len > bytes.size()) return false;

      for (std::size_t k = 1; k < len; ++k) {
        auto cc = static_cast<unsigned char>(bytes[i + k]);
        if (!is_continuation(cc)) return false;
        cp = (cp << 6) | (cc & 0x3F);
      }

      // Overlong forms, surrogates and values past U+10FFFF
      if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
          (len == 4 && cp < 0x10000) || cp > 0x10FFFF ||
          (cp >= 0xD800 && cp <= 0xDFFF))
        return false;

      i += len;
    }
    return true;
  }

  std::string
  decode_utf8(std::string_view bytes) {
    if (!is_valid_utf8(bytes)) {
      throw xml_error(error_kind::invalid_utf8,
                      "decode_utf8: input is not valid UTF-8");
    }
    return std::string(bytes);
  }

  std::string
  unescape(std::string_view raw) {
    if (!is_valid_utf8(raw)) {
      throw xml_error(error_kind::invalid_utf8,
                      "unescape: input is not valid UTF-8");
    }

    std::size_t amp = raw.find('&');
    if (amp == std::string_view::npos) return std::string(raw);

    std::string out;
    out.reserve(raw.size());
    std::size_t pos = 0;
    while (amp != std::string_view::npos) {
      out.append(raw.substr(pos, amp - pos));

      std::size_t semi = raw.find(';', amp + 1);
      if (semi == std::string_view::npos) {
        throw xml_error(error_kind::unknown_entity,
                        "unescape: unterminated entity reference");
      }
      std::string_view ref = raw.substr(amp + 1, semi - amp - 1);

      if (!ref.empty() && ref.front() == '#') {
        append_utf8(out, parse_char_ref(ref));
      } else if (char c = predefined_entity(ref); c != 0) {
        out += c;
      } else {
        throw xml_error(error_kind::unknown_entity,
                        "unescape: unknown entity '&" + std::string(ref) +
                            ";'");
      }

      pos = semi + 1;
      amp = raw.find('&', pos);
    }
    out.append(raw.substr(pos));
    return out;
  }

} // namespace xpull
