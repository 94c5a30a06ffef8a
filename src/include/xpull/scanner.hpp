#pragma once

#include <xpull/byte_source.hpp>

#include <cstddef>
#include <string_view>
#include <vector>

namespace xpull {

  enum class span_kind {
    text,
    tag, // <a ...>, <a .../>, </a>
    comment,
    cdata,
    processing_instruction,
    doctype,
    end_of_input,
  };

  // One delimited unit, delimiters included. bytes points into the scanner's
  // buffer and is invalidated by the next call to next_span().
  struct raw_span {
    span_kind kind = span_kind::end_of_input;
    std::string_view bytes;
    std::size_t position = 0;
  };

  class scanner {
    byte_source* source_;
    std::vector<char> buffer_;
    std::size_t begin_ = 0;
    std::size_t end_ = 0;
    std::size_t discarded_ = 0;
    std::size_t chunk_size_;
    bool eof_ = false;

  public:
    static constexpr std::size_t default_chunk_size = 8192;

    explicit scanner(byte_source& source,
                     std::size_t chunk_size = default_chunk_size);

    raw_span
    next_span();

    // Absolute offset of the first unconsumed byte
    std::size_t
    position() const {
      return discarded_ + begin_;
    }

    std::size_t
    buffer_capacity() const {
      return buffer_.size();
    }

  private:
    void
    compact();

    bool
    fill();

    bool
    available(std::size_t index, std::size_t count);

    bool
    matches(std::size_t index, std::string_view literal,
            bool ignore_case = false) const;

    std::size_t
    find(std::string_view terminator, std::size_t from);

    std::size_t
    find_markup_end(std::size_t prefix_length, std::string_view terminator,
                    const char* what);

    std::size_t
    scan_text();

    std::size_t
    scan_bang();

    std::size_t
    scan_doctype();

    std::size_t
    scan_tag();

    raw_span
    take(span_kind kind, std::size_t stop);

    [[noreturn]] void
    fail_eof(const char* what) const;
  };

} // namespace xpull
