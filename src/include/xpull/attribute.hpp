#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xpull {

  // Raw key and value of one attribute. value excludes the quotes and is
  // still escaped; both view the reader's buffer.
  struct attribute {
    std::string_view key;
    std::string_view value;
    char quote = '"';

    std::optional<std::string_view>
    prefix() const;

    std::string_view
    local_name() const;

    // Entity-decoded, UTF-8 validated copy of value
    std::string
    decode_value() const;
  };

  // Lazy left-to-right walk over the attribute bytes of one tag. A failed
  // step does not advance, so calling next() again reports the same error.
  class attribute_cursor {
    std::string_view bytes_;
    std::size_t pos_ = 0;
    bool check_duplicates_ = true;
    std::vector<std::string_view> seen_;

  public:
    attribute_cursor() = default;

    explicit attribute_cursor(std::string_view bytes,
                              bool check_duplicates = true)
        : bytes_(bytes), check_duplicates_(check_duplicates) {}

    std::optional<attribute>
    next();

    void
    reset();

    std::string_view
    bytes() const {
      return bytes_;
    }
  };

} // namespace xpull
