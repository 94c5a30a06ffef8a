#include <xpull/attribute.hpp>

#include <xpull/error.hpp>
#include <xpull/xml_escape.hpp>

#include "xml_chars.hpp"

#include <algorithm>
#include <string>

namespace xpull {

  std::optional<std::string_view>
  attribute::prefix() const {
    auto sep = detail::prefix_separator(key);
    if (sep == std::string_view::npos) return std::nullopt;
    return key.substr(0, sep);
  }

  std::string_view
  attribute::local_name() const {
    auto sep = detail::prefix_separator(key);
    if (sep == std::string_view::npos) return key;
    return key.substr(sep + 1);
  }

  std::string
  attribute::decode_value() const {
    return unescape(value);
  }

  std::optional<attribute>
  attribute_cursor::next() {
    std::size_t pos = detail::skip_whitespace(bytes_, pos_);
    if (pos >= bytes_.size()) {
      pos_ = pos;
      return std::nullopt;
    }

    std::size_t key_start = pos;
    while (pos < bytes_.size() && bytes_[pos] != '=' &&
           !detail::is_whitespace(bytes_[pos]))
      ++pos;
    std::string_view key = bytes_.substr(key_start, pos - key_start);
    if (key.empty() || key.front() == '"' || key.front() == '\'') {
      throw xml_error(error_kind::malformed_attribute,
                      "attribute_cursor: missing attribute name");
    }

    pos = detail::skip_whitespace(bytes_, pos);
    if (pos >= bytes_.size() || bytes_[pos] != '=') {
      throw xml_error(error_kind::malformed_attribute,
                      "attribute_cursor: attribute '" + std::string(key) +
                          "' has no value");
    }
    pos = detail::skip_whitespace(bytes_, pos + 1);

    if (pos >= bytes_.size() || (bytes_[pos] != '"' && bytes_[pos] != '\'')) {
      throw xml_error(error_kind::malformed_attribute,
                      "attribute_cursor: value of '" + std::string(key) +
                          "' is not quoted");
    }
    char quote = bytes_[pos];
    std::size_t close = bytes_.find(quote, pos + 1);
    if (close == std::string_view::npos) {
      throw xml_error(error_kind::malformed_attribute,
                      "attribute_cursor: value of '" + std::string(key) +
                          "' has no closing quote");
    }
    std::string_view value = bytes_.substr(pos + 1, close - pos - 1);

    std::size_t after = close + 1;
    if (after < bytes_.size() && !detail::is_whitespace(bytes_[after])) {
      throw xml_error(error_kind::malformed_attribute,
                      "attribute_cursor: missing whitespace after '" +
                          std::string(key) + "'");
    }

    if (check_duplicates_) {
      if (std::find(seen_.begin(), seen_.end(), key) != seen_.end()) {
        throw xml_error(error_kind::duplicate_attribute,
                        "attribute_cursor: duplicate attribute '" +
                            std::string(key) + "'");
      }
      seen_.push_back(key);
    }

    pos_ = after;
    return attribute{key, value, quote};
  }

  void
  attribute_cursor::reset() {
    pos_ = 0;
    seen_.clear();
  }

} // namespace xpull
