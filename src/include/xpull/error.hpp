#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace xpull {

  enum class error_kind {
    io_error,
    unexpected_eof,
    malformed_markup,
    mismatched_end_tag,
    unclosed_element,
    duplicate_attribute,
    malformed_attribute,
    unbound_prefix,
    invalid_utf8,
    unknown_entity,
    invalid_char_ref,
    malformed_declaration,
  };

  std::string_view
  to_string(error_kind kind);

  // Decode-time kinds never poison a reader
  bool
  is_decode_error(error_kind kind);

  class xml_error : public std::runtime_error {
    error_kind kind_;
    std::size_t position_;

  public:
    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    xml_error(error_kind kind, const std::string& message,
              std::size_t position = npos);

    error_kind
    kind() const noexcept {
      return kind_;
    }

    std::size_t
    position() const noexcept {
      return position_;
    }
  };

} // namespace xpull
