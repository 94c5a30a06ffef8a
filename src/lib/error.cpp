#include <xpull/error.hpp>

namespace xpull {

  namespace {

    std::string
    with_position(const std::string& message, std::size_t position) {
      if (position == xml_error::npos) return message;
      return message + " (at byte " + std::to_string(position) + ")";
    }

  } // namespace

  std::string_view
  to_string(error_kind kind) {
    switch (kind) {
      case error_kind::io_error:
        return "io_error";
      case error_kind::unexpected_eof:
        return "unexpected_eof";
      case error_kind::malformed_markup:
        return "malformed_markup";
      case error_kind::mismatched_end_tag:
        return "mismatched_end_tag";
      case error_kind::unclosed_element:
        return "unclosed_element";
      case error_kind::duplicate_attribute:
        return "duplicate_attribute";
      case error_kind::malformed_attribute:
        return "malformed_attribute";
      case error_kind::unbound_prefix:
        return "unbound_prefix";
      case error_kind::invalid_utf8:
        return "invalid_utf8";
      case error_kind::unknown_entity:
        return "unknown_entity";
      case error_kind::invalid_char_ref:
        return "invalid_char_ref";
      case error_kind::malformed_declaration:
        return "malformed_declaration";
    }
    return "unknown";
  }

  bool
  is_decode_error(error_kind kind) {
    return kind == error_kind::invalid_utf8 ||
           kind == error_kind::unknown_entity ||
           kind == error_kind::invalid_char_ref;
  }

  xml_error::xml_error(error_kind kind, const std::string& message,
                       std::size_t position)
      : std::runtime_error(with_position(message, position)), kind_(kind),
        position_(position) {}

} // namespace xpull
