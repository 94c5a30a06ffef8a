#include <xpull/scanner.hpp>

#include <xpull/error.hpp>

#include <algorithm>
#include <cstring>
#include <string>

namespace xpull {

  namespace {

    constexpr std::size_t not_found = static_cast<std::size_t>(-1);

    constexpr std::string_view comment_open = "<!--";
    constexpr std::string_view cdata_open = "<![CDATA[";
    constexpr std::string_view doctype_open = "<!DOCTYPE";

    char
    ascii_upper(char c) {
      return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
    }

  } // namespace

  scanner::scanner(byte_source& source, std::size_t chunk_size)
      : source_(&source), chunk_size_(std::max<std::size_t>(chunk_size, 16)) {
    buffer_.resize(chunk_size_);
  }

  raw_span
  scanner::next_span() {
    compact();

    if (!available(begin_, 1)) {
      return {span_kind::end_of_input, {}, position()};
    }

    if (buffer_[begin_] != '<') return take(span_kind::text, scan_text());

    if (!available(begin_, 2)) fail_eof("markup");

    switch (buffer_[begin_ + 1]) {
      case '!': {
        std::size_t stop = scan_bang();
        if (matches(begin_, comment_open)) return take(span_kind::comment, stop);
        if (matches(begin_, cdata_open)) return take(span_kind::cdata, stop);
        return take(span_kind::doctype, stop);
      }
      case '?':
        return take(span_kind::processing_instruction,
                    find_markup_end(2, "?>", "processing instruction"));
      default:
        return take(span_kind::tag, scan_tag());
    }
  }

  // Drop consumed bytes; every view handed out so far dies here.
  void
  scanner::compact() {
    if (begin_ == 0) return;
    std::size_t live = end_ - begin_;
    if (live > 0) std::memmove(buffer_.data(), buffer_.data() + begin_, live);
    discarded_ += begin_;
    begin_ = 0;
    end_ = live;
  }

  bool
  scanner::fill() {
    if (eof_) return false;
    if (buffer_.size() - end_ < chunk_size_) {
      buffer_.resize(std::max(buffer_.size() * 2, end_ + chunk_size_));
    }
    std::size_t n = source_->read(buffer_.data() + end_, chunk_size_);
    if (n == 0) {
      eof_ = true;
      return false;
    }
    end_ += n;
    return true;
  }

  bool
  scanner::available(std::size_t index, std::size_t count) {
    while (end_ < index + count) {
      if (!fill()) return false;
    }
    return true;
  }

  bool
  scanner::matches(std::size_t index, std::string_view literal,
                   bool ignore_case) const {
    if (end_ < index + literal.size()) return false;
    for (std::size_t i = 0; i < literal.size(); ++i) {
      char c = buffer_[index + i];
      if (ignore_case) c = ascii_upper(c);
      if (c != literal[i]) return false;
    }
    return true;
  }

  // Index one past the terminator, or not_found at end of input.
  std::size_t
  scanner::find(std::string_view terminator, std::size_t from) {
    for (;;) {
      if (end_ >= from + terminator.size()) {
        auto first = buffer_.begin() + static_cast<std::ptrdiff_t>(from);
        auto last = buffer_.begin() + static_cast<std::ptrdiff_t>(end_);
        auto it = std::search(first, last, terminator.begin(), terminator.end());
        if (it != last) {
          return static_cast<std::size_t>(it - buffer_.begin()) +
                 terminator.size();
        }
        // Keep a partial terminator at the tail in the next search window
        from = end_ - (terminator.size() - 1);
      }
      if (!fill()) return not_found;
    }
  }

  std::size_t
  scanner::find_markup_end(std::size_t prefix_length,
                           std::string_view terminator, const char* what) {
    std::size_t stop = find(terminator, begin_ + prefix_length);
    if (stop == not_found) fail_eof(what);
    return stop;
  }

  std::size_t
  scanner::scan_text() {
    std::size_t stop = find("<", begin_);
    if (stop == not_found) return end_;
    return stop - 1;
  }

  std::size_t
  scanner::scan_bang() {
    bool complete = available(begin_, cdata_open.size());
    if (matches(begin_, comment_open)) {
      return find_markup_end(comment_open.size(), "-->", "comment");
    }
    if (matches(begin_, cdata_open)) {
      return find_markup_end(cdata_open.size(), "]]>", "CDATA section");
    }
    if (matches(begin_, doctype_open, true)) return scan_doctype();

    if (!complete) {
      // Input ended inside a prefix of a known "<!" construct
      std::string_view head(buffer_.data() + begin_, end_ - begin_);
      auto is_prefix_of = [&head](std::string_view literal, bool ignore_case) {
        if (head.size() > literal.size()) return false;
        for (std::size_t i = 0; i < head.size(); ++i) {
          char c = ignore_case ? ascii_upper(head[i]) : head[i];
          if (c != literal[i]) return false;
        }
        return true;
      };
      if (is_prefix_of(comment_open, false) || is_prefix_of(cdata_open, false) ||
          is_prefix_of(doctype_open, true)) {
        fail_eof("markup");
      }
    }

    throw xml_error(error_kind::malformed_markup,
                    "scanner: unrecognized markup after '<!'", position());
  }

  // The closing '>' is the first one outside quotes and outside the
  // bracketed internal subset. Comments inside the subset are skipped whole.
  std::size_t
  scanner::scan_doctype() {
    std::size_t i = begin_ + doctype_open.size();
    std::size_t depth = 0;
    char quote = 0;

    for (;; ++i) {
      if (!available(i, 1)) fail_eof("DOCTYPE declaration");
      char c = buffer_[i];

      if (quote != 0) {
        if (c == quote) quote = 0;
        continue;
      }

      switch (c) {
        case '"':
        case '\'':
          quote = c;
          break;
        case '[':
          ++depth;
          break;
        case ']':
          if (depth == 0) {
            throw xml_error(error_kind::malformed_markup,
                            "scanner: unbalanced ']' in DOCTYPE", position());
          }
          --depth;
          break;
        case '<':
          if (depth > 0 && available(i, comment_open.size()) &&
              matches(i, comment_open)) {
            std::size_t stop = find("-->", i + comment_open.size());
            if (stop == not_found) fail_eof("comment in DOCTYPE");
            i = stop - 1;
          }
          break;
        case '>':
          if (depth == 0) return i + 1;
          break;
        default:
          break;
      }
    }
  }

  // The first '>' outside a quoted attribute value closes the tag.
  std::size_t
  scanner::scan_tag() {
    char quote = 0;

    for (std::size_t i = begin_ + 1;; ++i) {
      if (!available(i, 1)) fail_eof("tag");
      char c = buffer_[i];

      if (quote != 0) {
        if (c == quote) {
          quote = 0;
        } else if (c == '<') {
          throw xml_error(error_kind::malformed_markup,
                          "scanner: '<' inside attribute value", position());
        }
        continue;
      }

      if (c == '"' || c == '\'') {
        quote = c;
      } else if (c == '>') {
        return i + 1;
      } else if (c == '<') {
        throw xml_error(error_kind::malformed_markup,
                        "scanner: '<' inside tag", position());
      }
    }
  }

  raw_span
  scanner::take(span_kind kind, std::size_t stop) {
    raw_span span{kind, std::string_view(buffer_.data() + begin_, stop - begin_),
                  position()};
    begin_ = stop;
    return span;
  }

  void
  scanner::fail_eof(const char* what) const {
    throw xml_error(error_kind::unexpected_eof,
                    std::string("scanner: unterminated ") + what, position());
  }

} // namespace xpull
